//===-- MakeCommand.cpp ---------------------------------------------------===//
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

#include "memobuild/Commands/Commands.h"

#include "memobuild/Basic/FileSystem.h"
#include "memobuild/Basic/InterruptSignalAwaiter.h"
#include "memobuild/Basic/Version.h"
#include "memobuild/Commands/MakeInvocation.h"
#include "memobuild/Commands/Manifest.h"
#include "memobuild/Core/ContentHashCache.h"
#include "memobuild/Core/Graph.h"
#include "memobuild/Core/MakeEngine.h"
#include "memobuild/Core/Rule.h"

#include "ConsoleMakeDelegate.h"

#include "llvm/ADT/Twine.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/SourceMgr.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <cassert>
#include <cstdio>
#include <cstdlib>

using namespace memobuild;
using namespace memobuild::commands;
using namespace memobuild::core;

static std::string programName;

void commands::setProgramName(StringRef name) {
  assert(programName.empty());
  programName = name.str();
}

const char* commands::getProgramName() {
  if (programName.empty())
    return "memobuild";

  return programName.c_str();
}

static const char* getCommandName(MakeInvocation::Command command) {
  switch (command) {
  case MakeInvocation::Command::Make: return "make";
  case MakeInvocation::Command::Clean: return "clean";
  case MakeInvocation::Command::Touch: return "touch";
  }
  return "<unknown>";
}

static void usage(MakeInvocation::Command command, int exitCode) {
  int optionWidth = 26;
  fprintf(stderr, "Usage: %s %s [options] [<target>...]\n",
          getProgramName(), getCommandName(command));
  fprintf(stderr, "\nOptions:\n");
  MakeInvocation::getUsage(command, optionWidth, llvm::errs());
  fprintf(stderr, "\nTargets are group names, rule names or output paths; "
          "with none, every rule is\nselected.\n");
  ::exit(exitCode);
}

namespace {

/// The state shared by the commands: the parsed invocation and its manifest.
class CommandContext {
public:
  llvm::SourceMgr sourceMgr;
  MakeInvocation invocation;
  std::unique_ptr<Manifest> manifest;

  explicit CommandContext(MakeInvocation::Command command)
      : invocation(command) {}

  void error(const Twine& message) {
    sourceMgr.PrintMessage(llvm::SMLoc{}, llvm::SourceMgr::DK_Error, message);
  }

  /// Parse the arguments and load the manifest.
  ///
  /// \returns False if the command should exit, with \arg exitCode_out.
  bool setup(const std::vector<std::string>& args, int* exitCode_out) {
    invocation.parse(args, sourceMgr);

    // Handle invocation actions.
    if (invocation.showUsage) {
      usage(invocation.command, 0);
    } else if (invocation.hadErrors) {
      usage(invocation.command, 1);
    }

    if (invocation.showVersion) {
      printf("%s\n", getMemobuildFullVersion().c_str());
      *exitCode_out = 0;
      return false;
    }

    *exitCode_out = 1;
    if (!invocation.chdirPath.empty()) {
      if (auto ec = llvm::sys::fs::set_current_path(invocation.chdirPath)) {
        error("unable to change directory to '" + invocation.chdirPath +
              "': " + ec.message());
        return false;
      }
    }

    invocation.applyEnvironment(::getenv("MEMOBUILD_MEMO_KEY"));
    auto memoFactory = invocation.createMemoFactory();
    if (!memoFactory) {
      error(llvm::toString(memoFactory.takeError()));
      return false;
    }

    auto loaded = loadManifestFile(invocation.manifestPath,
                                   std::move(*memoFactory));
    if (!loaded) {
      error(llvm::toString(loaded.takeError()));
      return false;
    }
    manifest = std::move(*loaded);
    return true;
  }

  /// Resolve the positional arguments into the selected rules.
  bool resolveTargets(std::vector<RuleID>* targets_out) {
    auto targets = manifest->resolveTargets(invocation.positionalArgs);
    if (!targets) {
      error(llvm::toString(targets.takeError()));
      return false;
    }
    *targets_out = std::move(*targets);
    return true;
  }
};

}

#pragma mark - Make Command

int commands::executeMakeCommand(const std::vector<std::string>& args) {
  CommandContext context(MakeInvocation::Command::Make);
  int exitCode;
  if (!context.setup(args, &exitCode))
    return exitCode;

  std::vector<RuleID> targets;
  if (!context.resolveTargets(&targets))
    return 1;

  const RuleStore& store = context.manifest->getStore();
  auto closure = topologicalSort(store, targets);
  if (!closure) {
    context.error(llvm::toString(closure.takeError()));
    return 1;
  }

  const MakeInvocation& invocation = context.invocation;
  ConsoleMakeDelegate delegate(llvm::outs(), closure->size(),
                               invocation.showVerboseStatus);
  MakeEngine engine(store, delegate);

  MakeOptions options;
  options.dryRun = invocation.dryRun;
  options.keepGoing = invocation.keepGoing;
  options.jobs = invocation.jobs;

  // Cancel the build on an interrupt. The awaiter is destroyed before the
  // engine.
  basic::InterruptSignalAwaiter signalAwaiter;
  signalAwaiter.setInterruptHandler([&engine] { engine.cancel(); });
  auto summary = engine.make(targets, options);
  signalAwaiter.resetInterruptHandler();
  delegate.finish();

  if (!summary) {
    context.error(llvm::toString(summary.takeError()));
    return 1;
  }

  if (invocation.showVerboseStatus) {
    llvm::outs() << "total: " << summary->total
                 << ", update: " << summary->update
                 << ", skip: " << summary->skip
                 << ", fail: " << summary->fail
                 << ", discard: " << summary->discard << "\n";
  }

  if (summary->wasCancelled) {
    context.error("build cancelled");
    return 1;
  }
  if (!summary->succeeded()) {
    context.error("build had " + Twine(delegate.getNumFailed()) +
                  " failed rules");
    return 1;
  }

  return 0;
}

#pragma mark - Clean Command

int commands::executeCleanCommand(const std::vector<std::string>& args) {
  CommandContext context(MakeInvocation::Command::Clean);
  int exitCode;
  if (!context.setup(args, &exitCode))
    return exitCode;

  std::vector<RuleID> targets;
  if (!context.resolveTargets(&targets))
    return 1;

  auto fs = basic::createLocalFileSystem();
  const RuleStore& store = context.manifest->getStore();
  bool hadErrors = false;
  for (RuleID id: targets) {
    const Rule& rule = store.getRule(id);
    if (auto error = rule.clean(*fs)) {
      context.error("unable to clean '" + rule.getName() + "': " +
                    llvm::toString(std::move(error)));
      hadErrors = true;
      continue;
    }
    if (context.invocation.showVerboseStatus)
      llvm::outs() << "cleaned '" << rule.getName() << "'\n";
  }

  return hadErrors ? 1 : 0;
}

#pragma mark - Touch Command

int commands::executeTouchCommand(const std::vector<std::string>& args) {
  CommandContext context(MakeInvocation::Command::Touch);
  int exitCode;
  if (!context.setup(args, &exitCode))
    return exitCode;

  std::vector<RuleID> targets;
  if (!context.resolveTargets(&targets))
    return 1;

  auto fs = basic::createLocalFileSystem();
  ContentHashCache hashCache;
  RuleEnvironment env{ *fs, hashCache };

  // Touch in registration order, so no output is older than an output it was
  // made from.
  std::sort(targets.begin(), targets.end());

  const MakeInvocation& invocation = context.invocation;
  const RuleStore& store = context.manifest->getStore();
  bool hadErrors = false;
  for (RuleID id: targets) {
    const Rule& rule = store.getRule(id);
    if (auto error = rule.touch(env, invocation.createMissing,
                                invocation.updateMemo, llvm::None)) {
      context.error("unable to touch '" + rule.getName() + "': " +
                    llvm::toString(std::move(error)));
      hadErrors = true;
      continue;
    }
    if (invocation.showVerboseStatus)
      llvm::outs() << "touched '" << rule.getName() << "'\n";
  }

  return hadErrors ? 1 : 0;
}
