//===-- BuiltinActions.cpp ------------------------------------------------===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2014 - 2015 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#include "memobuild/Commands/BuiltinActions.h"

#include "memobuild/Basic/FileSystem.h"
#include "memobuild/Core/Action.h"
#include "memobuild/Core/Value.h"

#include "llvm/ADT/Optional.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Program.h"
#include "llvm/Support/raw_ostream.h"

using namespace memobuild;
using namespace memobuild::commands;
using namespace memobuild::core;

namespace {

llvm::Error makeUsageError(StringRef action, StringRef usage) {
  return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                 "invalid arguments to '%s', expected %s",
                                 action.str().c_str(), usage.str().c_str());
}

/// Get the path of an argument which must be a file.
const Value* getFileArg(const ActionContext& context, size_t index) {
  const Value* arg = context.getArg(index);
  if (!arg || !arg->isFile())
    return nullptr;
  return arg;
}

llvm::Error writeFile(StringRef path, StringRef contents) {
  auto fs = basic::createLocalFileSystem();
  std::string error;
  if (!fs->writeFileContents(path.str(), contents, &error)) {
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   error.c_str());
  }
  return llvm::Error::success();
}

llvm::Expected<std::unique_ptr<llvm::MemoryBuffer>>
readFile(StringRef path) {
  auto buffer = llvm::MemoryBuffer::getFile(path, /*IsText=*/false,
                                            /*RequiresNullTerminator=*/false);
  if (!buffer) {
    return llvm::createStringError(buffer.getError(),
                                   "unable to read '%s': %s",
                                   path.str().c_str(),
                                   buffer.getError().message().c_str());
  }
  return std::move(*buffer);
}

llvm::Error runWrite(const ActionContext& context) {
  const Value* output = getFileArg(context, 0);
  const Value* text = context.getArg(1);
  if (!output || !text || context.getArgs().getElements().size() != 2 ||
      !(text->isString() || text->isBytes()))
    return makeUsageError("write", "(output file, text)");

  return writeFile(output->getFile().path, text->getString());
}

llvm::Error runConcat(const ActionContext& context) {
  const Value* output = getFileArg(context, 0);
  if (!output)
    return makeUsageError("concat", "(output file, parts...)");

  std::string contents;
  const auto& args = context.getArgs().getElements();
  for (size_t i = 1, e = args.size(); i != e; ++i) {
    if (!args[i].isFile()) {
      contents += getValueText(args[i]);
      continue;
    }
    auto buffer = readFile(args[i].getFile().path);
    if (!buffer)
      return buffer.takeError();
    contents += (*buffer)->getBuffer().str();
  }

  return writeFile(output->getFile().path, contents);
}

llvm::Error runCopy(const ActionContext& context) {
  const Value* input = getFileArg(context, 0);
  const Value* output = getFileArg(context, 1);
  if (!input || !output || context.getArgs().getElements().size() != 2)
    return makeUsageError("copy", "(input file, output file)");

  auto buffer = readFile(input->getFile().path);
  if (!buffer)
    return buffer.takeError();
  return writeFile(output->getFile().path, (*buffer)->getBuffer());
}

llvm::Error runShell(const ActionContext& context) {
  const Value* command = context.getArg(0);
  if (!command || context.getArgs().getElements().size() != 1 ||
      !command->isString())
    return makeUsageError("shell", "(command)");

  auto shell = llvm::sys::findProgramByName("sh");
  if (!shell) {
    return llvm::createStringError(shell.getError(),
                                   "unable to find 'sh' in PATH");
  }

  StringRef commandLine = command->getString();
  StringRef args[] = { "sh", "-c", commandLine };
  std::string errorMessage;
  int result = llvm::sys::ExecuteAndWait(*shell, args, llvm::None, {}, 0, 0,
                                         &errorMessage);
  if (result < 0) {
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   "unable to run '%s': %s",
                                   commandLine.str().c_str(),
                                   errorMessage.c_str());
  }
  if (result != 0) {
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   "command '%s' exited with status %d",
                                   commandLine.str().c_str(), result);
  }
  return llvm::Error::success();
}

}

std::string commands::getValueText(const Value& value) {
  if (value.isString() || value.isBytes() || value.isPath())
    return value.getString().str();
  if (value.isFile())
    return value.getFile().path;

  std::string result;
  llvm::raw_string_ostream os(result);
  value.dump(os);
  return os.str();
}

void commands::registerBuiltinActions(ActionRegistry& registry) {
  registry.registerAction("write", runWrite);
  registry.registerAction("concat", runConcat);
  registry.registerAction("copy", runCopy);
  registry.registerAction("shell", runShell);
}
