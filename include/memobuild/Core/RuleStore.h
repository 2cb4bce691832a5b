//===- RuleStore.h ----------------------------------------------*- C++ -*-===//
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
// This file defines the RuleStore, which owns the registered rules of a build,
// and the selections of rules which make requests are expressed with.
//
//===----------------------------------------------------------------------===//

#ifndef MEMOBUILD_CORE_RULESTORE_H
#define MEMOBUILD_CORE_RULESTORE_H

#include "memobuild/Basic/Compiler.h"
#include "memobuild/Basic/LLVM.h"
#include "memobuild/Core/Action.h"
#include "memobuild/Core/Graph.h"
#include "memobuild/Core/Memo.h"
#include "memobuild/Core/Rule.h"
#include "memobuild/Core/Value.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/Support/Error.h"

#include <memory>
#include <string>
#include <vector>

namespace memobuild {
namespace core {

/// The description of a rule to register.
struct RuleDescription {
  std::string name;

  /// The files the action produces.
  std::vector<FileRef> outputs;

  Action action;

  /// The positional arguments, as a tuple.
  Value args = Value::makeTuple();

  /// The keyword arguments, as a dictionary with string keys.
  Value kwargs = Value::makeDict();
};

/// The registered rules of a build.
///
/// Rules are identified by their index. Since a rule may only consume the
/// outputs of rules registered before it, ids are always a valid build order.
class RuleStore : public RuleGraph {
  MemoFactory memoFactory;

  ActionRegistry actions;

  std::vector<std::unique_ptr<Rule>> rules;

  /// The rule producing each output path.
  llvm::StringMap<RuleID> producers;

  /// The first rule consuming each original input path.
  llvm::StringMap<RuleID> originalConsumers;

  /// The kind each path has been used with.
  llvm::StringMap<FileKind> fileKinds;

  RuleStore(const RuleStore&) MEMOBUILD_DELETED_FUNCTION;
  void operator=(const RuleStore&) MEMOBUILD_DELETED_FUNCTION;

public:
  explicit RuleStore(MemoFactory memoFactory = MemoFactory());
  ~RuleStore();

  const MemoFactory& getMemoFactory() const { return memoFactory; }

  /// Get the actions which can be referred to by name.
  ActionRegistry& getActionRegistry() { return actions; }
  const ActionRegistry& getActionRegistry() const { return actions; }

  /// Register a rule.
  ///
  /// Output paths and the paths of files in the arguments are made absolute
  /// and free of "." and ".." components. The inputs of the rule are the files
  /// of the arguments which are not its outputs, in order of first appearance;
  /// files within atoms are not inputs.
  ///
  /// \returns The id of the new rule, or a \see GraphError if the rule has no
  /// outputs, conflicts with the registered rules, uses a path with
  /// inconsistent kinds, or has arguments which cannot be memoized.
  llvm::Expected<RuleID> addRule(RuleDescription description);

  size_t size() const { return rules.size(); }

  const Rule& getRule(RuleID id) const { return *rules[id]; }

  /// Find the rule producing \arg path, which must be normalized.
  llvm::Optional<RuleID> getProducer(StringRef path) const;

  /// Normalize a path the way registration does.
  static std::string normalizePath(StringRef path);

  /// @name RuleGraph
  /// @{

  virtual size_t getNumRules() const override { return rules.size(); }
  virtual ArrayRef<RuleID> getDependencies(RuleID id) const override;
  virtual StringRef getRuleName(RuleID id) const override;

  /// @}
};

/// A set of rules of one store, which a make request can name.
class RuleSelection {
public:
  virtual ~RuleSelection();

  virtual const RuleStore& getStore() const = 0;

  /// Get the selected rules, in order.
  virtual ArrayRef<RuleID> getRuleIDs() const = 0;
};

/// A named selection of rules and other groups.
class RuleGroup : public RuleSelection {
  const RuleStore& store;
  std::string name;
  std::vector<RuleID> ids;

public:
  RuleGroup(const RuleStore& store, StringRef name)
      : store(store), name(name.str()) {}

  const std::string& getName() const { return name; }

  virtual const RuleStore& getStore() const override { return store; }
  virtual ArrayRef<RuleID> getRuleIDs() const override { return ids; }

  /// Add a rule to the group.
  ///
  /// \returns A \see GraphError if the id is not a rule of the group's store.
  llvm::Error addRule(RuleID id);

  /// Add every rule of another selection to the group.
  ///
  /// \returns A \see GraphError if the selection is of a different store.
  llvm::Error addSelection(const RuleSelection& selection);
};

/// Flatten the given selections into the list of targets of a make request.
///
/// \param store_out If given, receives the store of the selections, or null if
/// there are none.
///
/// \returns The de-duplicated rule ids in order of first appearance, or a
/// \see GraphError if the selections span more than one store.
llvm::Expected<std::vector<RuleID>>
collectTargets(ArrayRef<const RuleSelection*> selections,
               const RuleStore** store_out = nullptr);

}
}

#endif
