//===- MakeInvocation.h -----------------------------------------*- C++ -*-===//
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

#ifndef MEMOBUILD_COMMANDS_MAKEINVOCATION_H
#define MEMOBUILD_COMMANDS_MAKEINVOCATION_H

#include "memobuild/Basic/LLVM.h"
#include "memobuild/Core/Memo.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>
#include <vector>

namespace llvm {
class SourceMgr;
}

namespace memobuild {
namespace commands {

/// This class wraps the options of the memobuild subcommands.
class MakeInvocation {
public:
  /// The subcommands, which accept different options.
  enum class Command {
    Make,
    Clean,
    Touch,
  };

  /// The subcommand being parsed.
  Command command = Command::Make;

  /// Whether the command usage should be printed.
  bool showUsage = false;

  /// Whether the command version should be printed.
  bool showVersion = false;

  /// Whether to show verbose output.
  bool showVerboseStatus = false;

  /// Whether to only report what would be run.
  bool dryRun = false;

  /// Whether to continue past failed rules.
  bool keepGoing = false;

  /// The number of concurrent jobs (lanes) to run.
  unsigned jobs = 1;

  /// Whether touch should save the memoization records.
  bool updateMemo = true;

  /// Whether touch should create missing outputs.
  bool createMissing = true;

  /// The path of a directory to change into before anything else, if any.
  std::string chdirPath = "";

  /// The path of the manifest to load.
  std::string manifestPath = "memobuild.json";

  /// The memoization encoding.
  core::MemoKind memoKind = core::MemoKind::StringHash;

  /// The hexadecimal memoization key, if given.
  std::string memoKey = "";

  /// The positional arguments, i.e. the targets.
  std::vector<std::string> positionalArgs;

  /// Whether there were any parsing errors.
  bool hadErrors = false;

public:
  explicit MakeInvocation(Command command = Command::Make)
      : command(command) {}

  /// Get the appropriate "usage" text to use for the options of \arg command.
  static void getUsage(Command command, int optionWidth, raw_ostream& os);

  /// Parse the invocation parameters from the given arguments.
  ///
  /// \param sourceMgr The source manager to use for diagnostics.
  void parse(ArrayRef<std::string> args, llvm::SourceMgr& sourceMgr);

  /// Apply the environment to the parsed options.
  ///
  /// \param memoKeyEnv The value of the MEMOBUILD_MEMO_KEY variable, or null.
  void applyEnvironment(const char* memoKeyEnv);

  /// Create the memoization factory the options select.
  llvm::Expected<core::MemoFactory> createMemoFactory() const;
};

}
}

#endif
