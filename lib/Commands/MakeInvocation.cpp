//===-- MakeInvocation.cpp ------------------------------------------------===//
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

#include "memobuild/Commands/MakeInvocation.h"

#include "llvm/ADT/Twine.h"
#include "llvm/Support/Format.h"
#include "llvm/Support/SourceMgr.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdlib>

using namespace memobuild;
using namespace memobuild::commands;

void MakeInvocation::getUsage(Command command, int optionWidth,
                              raw_ostream& os) {
  const struct Options {
    llvm::StringRef option, helpText;
    bool make, clean, touch;
  } options[] = {
    { "--help", "show this help message and exit", true, true, true },
    { "--version", "show the tool version", true, true, true },
    { "-C <PATH>, --chdir <PATH>", "change directory to PATH first",
      true, true, true },
    { "-f <PATH>", "load the rule manifest at PATH", true, true, true },
    { "-j, --jobs <JOBS>", "set how many concurrent jobs (lanes) to run",
      true, false, false },
    { "-k, --keep-going", "continue with independent rules after a failure",
      true, false, false },
    { "-n, --dry-run", "only report the rules which would run",
      true, false, false },
    { "-v, --verbose", "show verbose status information", true, true, true },
    { "--memo <ENCODING>", "memoization encoding ('str-hash' or "
      "'authenticated')", true, false, true },
    { "--memo-key <HEX>", "key of the authenticated encoding [default: "
      "$MEMOBUILD_MEMO_KEY]", true, false, true },
    { "--no-memo", "do not save memoization records", false, false, true },
    { "--no-create", "do not create missing outputs", false, false, true },
  };

  for (const auto& entry: options) {
    bool accepted = (command == Command::Make && entry.make) ||
      (command == Command::Clean && entry.clean) ||
      (command == Command::Touch && entry.touch);
    if (!accepted)
      continue;
    os << "  " << llvm::format("%-*s", optionWidth, entry.option.str().c_str())
       << " " << entry.helpText << "\n";
  }
}

void MakeInvocation::parse(ArrayRef<std::string> args,
                           llvm::SourceMgr& sourceMgr) {
  auto error = [&](const Twine &message) {
    sourceMgr.PrintMessage(llvm::SMLoc{}, llvm::SourceMgr::DK_Error, message);
    hadErrors = true;
  };

  bool isMake = command == Command::Make;
  bool isTouch = command == Command::Touch;

  while (!args.empty()) {
    const auto& option = args.front();
    args = args.slice(1);

    if (option == "-") {
      for (const auto& arg: args) {
        positionalArgs.push_back(arg);
      }
      break;
    }

    if (!option.empty() && option[0] != '-') {
      positionalArgs.push_back(option);
      continue;
    }

    if (option == "--help") {
      showUsage = true;
      break;
    } else if (option == "--version") {
      showVersion = true;
      break;
    } else if (option == "-C" || option == "--chdir") {
      if (args.empty()) {
        error("missing argument to '" + option + "'");
        break;
      }
      chdirPath = args[0];
      args = args.slice(1);
    } else if (option == "-f") {
      if (args.empty()) {
        error("missing argument to '" + option + "'");
        break;
      }
      manifestPath = args[0];
      args = args.slice(1);
    } else if (option == "-v" || option == "--verbose") {
      showVerboseStatus = true;
    } else if (isMake && (option == "-j" || option == "--jobs")) {
      if (args.empty()) {
        error("missing argument to '" + option + "'");
        break;
      }
      char *end;
      long value = ::strtol(args[0].c_str(), &end, 10);
      if (*end != '\0' || value < 1) {
        error("invalid argument '" + args[0] + "' to '" + option + "'");
      } else {
        jobs = value;
      }
      args = args.slice(1);
    } else if (isMake && StringRef(option).startswith("-j")) {
      char *end;
      long value = ::strtol(&option[2], &end, 10);
      if (*end != '\0' || value < 1) {
        error("invalid argument to '-j'");
      } else {
        jobs = value;
      }
    } else if (isMake && (option == "-k" || option == "--keep-going")) {
      keepGoing = true;
    } else if (isMake && (option == "-n" || option == "--dry-run")) {
      dryRun = true;
    } else if ((isMake || isTouch) && option == "--memo") {
      if (args.empty()) {
        error("missing argument to '" + option + "'");
        break;
      }
      auto encoding = args[0];
      if (encoding == "str-hash") {
        memoKind = core::MemoKind::StringHash;
      } else if (encoding == "authenticated") {
        memoKind = core::MemoKind::Authenticated;
      } else {
        error("unknown memoization encoding '" + encoding + "'");
        break;
      }
      args = args.slice(1);
    } else if ((isMake || isTouch) && option == "--memo-key") {
      if (args.empty()) {
        error("missing argument to '" + option + "'");
        break;
      }
      memoKey = args[0];
      args = args.slice(1);
    } else if (isTouch && option == "--no-memo") {
      updateMemo = false;
    } else if (isTouch && option == "--no-create") {
      createMissing = false;
    } else {
      error("invalid option '" + option + "'");
      break;
    }
  }
}

void MakeInvocation::applyEnvironment(const char* memoKeyEnv) {
  if (memoKey.empty() && memoKeyEnv)
    memoKey = memoKeyEnv;
}

llvm::Expected<core::MemoFactory> MakeInvocation::createMemoFactory() const {
  if (memoKind == core::MemoKind::StringHash)
    return core::MemoFactory::create(memoKind);
  return core::MemoFactory::createWithHexKey(memoKind, memoKey);
}
