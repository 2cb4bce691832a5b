//===- MakeEngine.h ---------------------------------------------*- C++ -*-===//
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
//
// This file defines the MakeEngine, which brings a set of rules up-to-date.
//
//===----------------------------------------------------------------------===//

#ifndef MEMOBUILD_CORE_MAKEENGINE_H
#define MEMOBUILD_CORE_MAKEENGINE_H

#include "memobuild/Basic/Compiler.h"
#include "memobuild/Basic/LLVM.h"
#include "memobuild/Core/Rule.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <map>

namespace memobuild {
namespace basic {
class FileSystem;
}

namespace core {

class ContentHashCache;
class RuleStore;

/// Delegate interface for reporting the progress of a make request.
///
/// Every rule the engine dispatches receives exactly one of the terminal
/// events (\see ruleSkipped, \see ruleFinished, \see ruleDryRun, \see
/// ruleUpdateInfeasible, \see rulePreprocessFailed, \see ruleExecutionFailed,
/// \see rulePostprocessFailed or \see fatalError); rules which are discarded
/// receive none.
///
/// With more than one job, events are delivered concurrently from the lanes
/// and implementations must be thread safe.
class MakeDelegate {
public:
  virtual ~MakeDelegate();

  /// Called when a rule is up-to-date.
  ///
  /// \param isDirectTarget Whether the rule was named by the request, rather
  /// than being a dependency of a named rule.
  virtual void ruleSkipped(const Rule& rule, bool isDirectTarget) = 0;

  /// Called before a rule's action is invoked.
  virtual void ruleStarted(const Rule& rule) = 0;

  /// Called when a rule was successfully brought up-to-date.
  virtual void ruleFinished(const Rule& rule) = 0;

  /// Called in a dry run for a rule which would be run.
  virtual void ruleDryRun(const Rule& rule) = 0;

  /// Called when a rule cannot be run, e.g. because an input is missing.
  virtual void ruleUpdateInfeasible(const Rule& rule, StringRef reason) = 0;

  /// Called when the output directories of a rule could not be prepared.
  virtual void rulePreprocessFailed(const Rule& rule, StringRef error) = 0;

  /// Called when a rule's action failed.
  virtual void ruleExecutionFailed(const Rule& rule, StringRef error) = 0;

  /// Called when a rule's action succeeded, but its outputs could not be
  /// verified or its memoization record could not be saved.
  virtual void rulePostprocessFailed(const Rule& rule, StringRef error) = 0;

  /// Called for a failure which stops the build regardless of the failure
  /// policy.
  virtual void fatalError(const Rule& rule, StringRef error) = 0;

  /// Called once when the build stops because of a failed rule.
  virtual void stoppedOnFailure() = 0;

  /// Called once placement is decided, when rules may run in worker processes.
  ///
  /// \param numInProcess The number of rules which run in this process.
  /// \param numRules The number of rules considered.
  virtual void placementDecided(unsigned numInProcess, unsigned numRules);
};

/// The outcome of a rule in a make request.
enum class RuleOutcome : uint8_t {
  /// The rule ran (or, in a dry run, would have run).
  Update = 0,

  /// The rule was up-to-date.
  Skip,

  /// The rule failed.
  Fail,

  /// The rule was not considered, because a dependency failed or the build
  /// stopped.
  Discard,
};

/// The result of a make request.
struct MakeSummary {
  /// The number of rules in the closure of the targets.
  unsigned total = 0;

  unsigned update = 0;
  unsigned skip = 0;
  unsigned fail = 0;
  unsigned discard = 0;

  /// The outcome of every rule of the closure.
  std::map<RuleID, RuleOutcome> detail;

  /// Whether the build stopped because of a fatal error.
  bool hadFatalError = false;

  /// Whether the build was cancelled.
  bool wasCancelled = false;

  /// Check if every rule of the closure is up-to-date.
  bool succeeded() const {
    return fail == 0 && discard == 0 && !hadFatalError && !wasCancelled;
  }

  /// Get the name of an outcome, for use in diagnostics.
  static StringRef getOutcomeName(RuleOutcome outcome);
};

/// The parameters of a make request.
struct MakeOptions {
  /// Only report what would be run.
  bool dryRun = false;

  /// Continue with the rules which do not depend on a failed rule.
  bool keepGoing = false;

  /// The number of lanes; with more than one, rules run in parallel.
  unsigned jobs = 1;

  /// Run registered actions in worker processes, when running in parallel.
  bool useWorkerProcesses = true;

  /// The content hash cache to use, or null for one private to the request.
  ContentHashCache* hashCache = nullptr;
};

/// Brings the rules of a store up-to-date.
class MakeEngine {
  void* impl;

  MakeEngine(const MakeEngine&) MEMOBUILD_DELETED_FUNCTION;
  void operator=(const MakeEngine&) MEMOBUILD_DELETED_FUNCTION;

public:
  /// Create an engine for the rules of \arg store.
  ///
  /// \param fileSystem The file system to use, or null for the local one.
  MakeEngine(const RuleStore& store, MakeDelegate& delegate,
             basic::FileSystem* fileSystem = nullptr);
  ~MakeEngine();

  MakeDelegate& getDelegate();

  /// Bring \arg targets and their dependencies up-to-date.
  ///
  /// \returns The summary of the build, which reports failed rules, or a
  /// \see GraphError if the targets are invalid or their closure is cyclic.
  llvm::Expected<MakeSummary> make(ArrayRef<RuleID> targets,
                                   const MakeOptions& options = MakeOptions());

  /// Cancel the current (and any later) make request.
  ///
  /// No further rules are started, worker processes are interrupted, and the
  /// rules whose actions were running are invalidated. This method is thread
  /// safe.
  void cancel();

  /// Check if the engine was cancelled.
  bool isCancelled() const;
};

}
}

#endif
