//===-- Rule.cpp ----------------------------------------------------------===//
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

#include "memobuild/Core/Rule.h"

#include "memobuild/Basic/FileSystem.h"
#include "memobuild/Core/ContentHashCache.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/Path.h"

using namespace memobuild;
using namespace memobuild::core;
using namespace memobuild::basic;

std::string Rule::getMetadataPath() const {
  StringRef first = outputs.front().path;
  llvm::SmallString<256> result(llvm::sys::path::parent_path(first));
  llvm::sys::path::append(result, ".metadata",
                          llvm::sys::path::filename(first));
  return result.str().str();
}

ActionContext
Rule::makeActionContext(const std::atomic<bool>* cancelled) const {
  std::vector<FileRef> inputFiles;
  for (const auto& input: inputs)
    inputFiles.push_back(input.file);
  return ActionContext(args, kwargs, outputs, std::move(inputFiles),
                       cancelled);
}

llvm::Expected<CheckUpdateResult>
Rule::checkUpdate(bool dependencyWasUpdated, bool dryRun,
                  const RuleEnvironment& env) const {
  FileSystem& fs = env.fileSystem;

  // Check the inputs. In a dry run, an input produced by another rule may
  // legitimately not exist yet.
  std::vector<FileInfo> inputInfos;
  bool hasInvalidInput = false;
  for (const auto& input: inputs) {
    FileInfo info = fs.getFileInfo(input.file.path);
    inputInfos.push_back(info);

    if (info.isMissing()) {
      if (!dryRun || input.isOriginal)
        return CheckUpdateResult::makeInfeasible(
            "input file '" + input.file.path + "' is missing");
      hasInvalidInput = true;
    } else if (info.modTime.isEpoch()) {
      if (!dryRun || input.isOriginal)
        return CheckUpdateResult::makeInfeasible(
            "input file '" + input.file.path + "' has a modification time of "
            "zero, which marks it as invalid");
      hasInvalidInput = true;
    }
  }

  // Check the outputs exist, and find the oldest.
  FileTimestamp oldestOutput = { 0, 0 };
  for (unsigned i = 0, e = outputs.size(); i != e; ++i) {
    FileInfo info = fs.getFileInfo(outputs[i].path);
    if (info.isMissing() || info.modTime.isEpoch())
      return CheckUpdateResult::makeNecessary();
    if (i == 0 || info.modTime < oldestOutput)
      oldestOutput = info.modTime;
  }

  if (hasInvalidInput)
    return CheckUpdateResult::makePossiblyNecessary();

  if (dryRun && dependencyWasUpdated)
    return CheckUpdateResult::makePossiblyNecessary();

  // Value files are judged by their contents, below.
  for (unsigned i = 0, e = inputs.size(); i != e; ++i) {
    if (inputs[i].file.isValueFile())
      continue;
    if (inputInfos[i].modTime > oldestOutput)
      return CheckUpdateResult::makeNecessary();
  }

  auto matches = memo->compareToSaved(fs, env.hashCache, getMetadataPath());
  if (!matches)
    return matches.takeError();
  if (!*matches)
    return CheckUpdateResult::makeNecessary();

  return CheckUpdateResult::makeUpToDate();
}

llvm::Error Rule::preprocess(FileSystem& fs) const {
  for (const auto& output: outputs) {
    std::string parent = llvm::sys::path::parent_path(output.path).str();
    if (parent.empty())
      continue;

    FileInfo info = fs.getFileInfo(parent);
    if (!info.isMissing() && !info.isDirectory()) {
      return llvm::createStringError(
          llvm::inconvertibleErrorCode(),
          "unable to create directory for output '%s': '%s' is not a "
          "directory", output.path.c_str(), parent.c_str());
    }

    // Failures surface when the action writes the output.
    (void)fs.createDirectories(parent);
  }
  return llvm::Error::success();
}

llvm::Error Rule::postprocess(bool succeeded,
                              const RuleEnvironment& env) const {
  FileSystem& fs = env.fileSystem;

  if (!succeeded) {
    // Invalidate whatever the action left behind, so neither this rule nor
    // its dependents consider it up-to-date.
    for (const auto& output: outputs) {
      if (fs.getFileInfo(output.path).isMissing())
        continue;
      std::string error;
      (void)fs.setFileTimestamp(output.path, FileTimestamp{ 0, 0 }, &error);
    }
    (void)fs.remove(getMetadataPath());
    return llvm::Error::success();
  }

  for (const auto& output: outputs) {
    FileInfo info = fs.getFileInfo(output.path);
    if (info.isMissing()) {
      return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                     "output file '%s' was not created",
                                     output.path.c_str());
    }
    if (!info.isRegularFile()) {
      return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                     "output '%s' is not a regular file",
                                     output.path.c_str());
    }
  }

  return memo->save(fs, env.hashCache, getMetadataPath());
}

llvm::Error Rule::touch(const RuleEnvironment& env, bool createMissing,
                        bool updateMemo,
                        llvm::Optional<FileTimestamp> timestamp) const {
  FileSystem& fs = env.fileSystem;
  FileTimestamp time = timestamp.hasValue() ? *timestamp : FileTimestamp::now();

  for (const auto& output: outputs) {
    if (fs.getFileInfo(output.path).isMissing()) {
      if (!createMissing)
        continue;

      std::string parent = llvm::sys::path::parent_path(output.path).str();
      if (!parent.empty() && !fs.createDirectories(parent)) {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "unable to create directory '%s'",
                                       parent.c_str());
      }
      std::string error;
      if (!fs.writeFileContents(output.path, "", &error))
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       error.c_str());
    }

    std::string error;
    if (!fs.setFileTimestamp(output.path, time, &error))
      return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                     error.c_str());
  }

  if (updateMemo)
    return memo->save(fs, env.hashCache, getMetadataPath());
  return llvm::Error::success();
}

llvm::Error Rule::clean(FileSystem& fs) const {
  llvm::Error result = llvm::Error::success();

  auto removeFile = [&](const std::string& path) {
    if (fs.getLinkInfo(path).isMissing())
      return;
    if (!fs.remove(path)) {
      result = llvm::joinErrors(
          std::move(result),
          llvm::createStringError(llvm::inconvertibleErrorCode(),
                                  "unable to remove '%s'", path.c_str()));
    }
  };

  for (const auto& output: outputs)
    removeFile(output.path);
  removeFile(getMetadataPath());

  return result;
}
