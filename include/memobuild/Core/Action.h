//===- Action.h -------------------------------------------------*- C++ -*-===//
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

#ifndef MEMOBUILD_CORE_ACTION_H
#define MEMOBUILD_CORE_ACTION_H

#include "memobuild/Basic/Compiler.h"
#include "memobuild/Basic/LLVM.h"
#include "memobuild/Core/Value.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <atomic>
#include <functional>
#include <string>
#include <vector>

namespace memobuild {
namespace core {

/// The arguments and files an action is invoked with.
class ActionContext {
  Value args;
  Value kwargs;
  std::vector<FileRef> outputs;
  std::vector<FileRef> inputs;
  const std::atomic<bool>* cancelled;

public:
  ActionContext(Value args, Value kwargs, std::vector<FileRef> outputs,
                std::vector<FileRef> inputs,
                const std::atomic<bool>* cancelled = nullptr)
      : args(std::move(args)), kwargs(std::move(kwargs)),
        outputs(std::move(outputs)), inputs(std::move(inputs)),
        cancelled(cancelled) {}

  /// Get the positional arguments, as a tuple.
  const Value& getArgs() const { return args; }

  /// Get the keyword arguments, as a dictionary with string keys.
  const Value& getKeywordArgs() const { return kwargs; }

  /// Get the positional argument at \arg index, or null if there is none.
  const Value* getArg(size_t index) const {
    const auto& elements = args.getElements();
    return index < elements.size() ? &elements[index] : nullptr;
  }

  /// Get the keyword argument named \arg name, or null if there is none.
  const Value* getKeywordArg(StringRef name) const {
    return kwargs.lookup(name);
  }

  ArrayRef<FileRef> getOutputs() const { return outputs; }
  ArrayRef<FileRef> getInputs() const { return inputs; }

  /// Check if the build was cancelled while the action was running.
  ///
  /// Long running actions should poll this and return an error.
  bool isCancelled() const { return cancelled && cancelled->load(); }
};

/// The signature of action bodies. Failures are reported through the returned
/// error.
typedef std::function<llvm::Error(const ActionContext&)> ActionFn;

/// The procedure a rule runs to produce its outputs.
///
/// An action is either registered by name in an \see ActionRegistry, which
/// makes it possible to run it in a worker process, or a closure, which is
/// only ever run in the orchestrating process.
class Action {
  std::string name;
  ActionFn body;
  bool registered = false;

  Action(StringRef name, ActionFn body, bool registered)
      : name(name.str()), body(std::move(body)), registered(registered) {}

  friend class ActionRegistry;

public:
  Action() {}

  /// Create an action from a closure.
  static Action makeClosure(StringRef name, ActionFn body) {
    return Action(name, std::move(body), /*registered=*/false);
  }

  /// Get the name of the action, which is only meaningful for diagnostics
  /// unless the action is registered.
  const std::string& getName() const { return name; }

  bool isRegistered() const { return registered; }

  bool isValid() const { return bool(body); }

  /// Run the action.
  ///
  /// An exception escaping the body is reported as the action's error.
  llvm::Error invoke(const ActionContext& context) const;
};

/// A table of named actions.
///
/// Worker processes inherit the table of the process which forked them, and
/// resolve the actions they run by name.
class ActionRegistry {
  llvm::StringMap<ActionFn> actions;

public:
  ActionRegistry() {}

  /// Register \arg body under \arg name, replacing any existing entry.
  void registerAction(StringRef name, ActionFn body);

  /// Look up a registered action.
  llvm::Optional<Action> lookup(StringRef name) const;
};

/// Resolve the atoms of an argument tree to their real values.
///
/// Atoms whose real value is an opaque object are kept as they are.
///
/// \returns The resolved tree, or an error if it contains a reference cycle.
llvm::Expected<Value> resolveActionArguments(const Value& value);

/// Encode an invocation of the registered action \arg name, for running it in
/// a worker process.
///
/// \returns An error if the context cannot be encoded, e.g. because it binds an
/// opaque atom.
llvm::Expected<std::string> encodeActionPayload(StringRef name,
                                                const ActionContext& context);

/// Decode an invocation written by \see encodeActionPayload.
llvm::Expected<ActionContext> decodeActionPayload(StringRef payload,
                                                  std::string& name_out);

}
}

#endif
