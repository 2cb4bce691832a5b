//===- Rule.h ---------------------------------------------------*- C++ -*-===//
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

#ifndef MEMOBUILD_CORE_RULE_H
#define MEMOBUILD_CORE_RULE_H

#include "memobuild/Basic/Compiler.h"
#include "memobuild/Basic/FileInfo.h"
#include "memobuild/Basic/LLVM.h"
#include "memobuild/Core/Action.h"
#include "memobuild/Core/Memo.h"
#include "memobuild/Core/Value.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/Optional.h"
#include "llvm/Support/Error.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace memobuild {
namespace basic {
class FileSystem;
}

namespace core {

class ContentHashCache;

/// The index of a rule in its \see RuleStore.
typedef uint32_t RuleID;

/// An input file of a rule.
struct RuleInput {
  FileRef file;

  /// Whether the file is produced by no rule of the store.
  bool isOriginal = true;
};

/// The result of a rule's staleness check.
struct CheckUpdateResult {
  enum class Kind {
    /// The outputs are up-to-date.
    UpToDate,

    /// The rule must run.
    Necessary,

    /// In a dry run, the rule would run if the rules before it changed their
    /// outputs.
    PossiblyNecessary,

    /// The rule cannot run, see \see reason.
    Infeasible,
  };

  Kind kind = Kind::UpToDate;

  /// The reason an update is infeasible.
  std::string reason;

  static CheckUpdateResult makeUpToDate() { return { Kind::UpToDate, {} }; }
  static CheckUpdateResult makeNecessary() { return { Kind::Necessary, {} }; }
  static CheckUpdateResult makePossiblyNecessary() {
    return { Kind::PossiblyNecessary, {} };
  }
  static CheckUpdateResult makeInfeasible(std::string reason) {
    return { Kind::Infeasible, std::move(reason) };
  }

  bool needsUpdate() const {
    return kind == Kind::Necessary || kind == Kind::PossiblyNecessary;
  }
};

/// The services rules use to inspect and update the file system.
struct RuleEnvironment {
  basic::FileSystem& fileSystem;
  ContentHashCache& hashCache;
};

/// A node of the build graph.
class Rule {
  RuleID id;
  std::string name;
  std::vector<FileRef> outputs;
  std::vector<RuleInput> inputs;
  std::vector<RuleID> dependencies;
  Action action;

  /// The resolved positional (a tuple) and keyword (a dictionary) arguments.
  Value args;
  Value kwargs;

  std::unique_ptr<Memo> memo;

  Rule(const Rule&) MEMOBUILD_DELETED_FUNCTION;
  void operator=(const Rule&) MEMOBUILD_DELETED_FUNCTION;

public:
  Rule(RuleID id, std::string name, std::vector<FileRef> outputs,
       std::vector<RuleInput> inputs, std::vector<RuleID> dependencies,
       Action action, Value args, Value kwargs, std::unique_ptr<Memo> memo)
      : id(id), name(std::move(name)), outputs(std::move(outputs)),
        inputs(std::move(inputs)), dependencies(std::move(dependencies)),
        action(std::move(action)), args(std::move(args)),
        kwargs(std::move(kwargs)), memo(std::move(memo)) {}

  RuleID getID() const { return id; }
  const std::string& getName() const { return name; }
  ArrayRef<FileRef> getOutputs() const { return outputs; }
  ArrayRef<RuleInput> getInputs() const { return inputs; }

  /// Get the rules producing this rule's inputs, in ascending order.
  ArrayRef<RuleID> getDependencies() const { return dependencies; }

  const Action& getAction() const { return action; }
  const Value& getArgs() const { return args; }
  const Value& getKeywordArgs() const { return kwargs; }
  const Memo& getMemo() const { return *memo; }

  /// Get the path of the rule's saved memoization record, which is kept in a
  /// ".metadata" directory beside the first output.
  std::string getMetadataPath() const;

  /// Create the context to invoke the action with.
  ActionContext
  makeActionContext(const std::atomic<bool>* cancelled = nullptr) const;

  /// Decide whether the rule must run.
  ///
  /// \param dependencyWasUpdated Whether a dependency of the rule was (or, in
  /// a dry run, would have been) updated in this build.
  ///
  /// \returns The decision, or an error if the saved memoization record fails
  /// authentication or has the wrong encoding.
  llvm::Expected<CheckUpdateResult>
  checkUpdate(bool dependencyWasUpdated, bool dryRun,
              const RuleEnvironment& env) const;

  /// Prepare to run the action by creating the output directories.
  ///
  /// \returns An error only if an output's parent exists and is not a
  /// directory.
  llvm::Error preprocess(basic::FileSystem& fs) const;

  /// Finish running the action.
  ///
  /// On success, checks that every output was produced and saves the
  /// memoization record. On failure, invalidates the existing outputs (by
  /// stamping them with the epoch) and removes the saved record; this never
  /// fails.
  llvm::Error postprocess(bool succeeded, const RuleEnvironment& env) const;

  /// Mark the outputs as up-to-date.
  ///
  /// \param createMissing Create missing outputs as empty files.
  /// \param updateMemo Save the current memoization record.
  /// \param timestamp The modification time to set, or none for now.
  llvm::Error touch(const RuleEnvironment& env, bool createMissing,
                    bool updateMemo,
                    llvm::Optional<basic::FileTimestamp> timestamp) const;

  /// Remove the outputs and the saved memoization record.
  ///
  /// Every file is attempted; the returned error describes each failure.
  llvm::Error clean(basic::FileSystem& fs) const;
};

}
}

#endif
