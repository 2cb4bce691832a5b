//===- Graph.h --------------------------------------------------*- C++ -*-===//
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

#ifndef MEMOBUILD_CORE_GRAPH_H
#define MEMOBUILD_CORE_GRAPH_H

#include "memobuild/Basic/LLVM.h"
#include "memobuild/Core/Rule.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>
#include <vector>

namespace memobuild {
namespace core {

/// Error for an invalid rule graph or rule registration.
class GraphError : public llvm::ErrorInfo<GraphError> {
  std::string message;

public:
  static char ID;

  GraphError(const Twine& message) : message(message.str()) {}

  const std::string& getMessage() const { return message; }

  void log(raw_ostream& os) const override;
  std::error_code convertToErrorCode() const override {
    return llvm::inconvertibleErrorCode();
  }
};

/// The dependency structure of a set of rules.
class RuleGraph {
public:
  virtual ~RuleGraph();

  /// Get the number of rules; valid ids are below this.
  virtual size_t getNumRules() const = 0;

  /// Get the rules \arg id directly depends on.
  virtual ArrayRef<RuleID> getDependencies(RuleID id) const = 0;

  /// Get the name of a rule, for diagnostics.
  virtual StringRef getRuleName(RuleID id) const = 0;
};

/// Order the closure of \arg targets so every rule comes after its
/// dependencies.
///
/// Rules are ordered by a post-order traversal of the targets in the given
/// order, and of the dependencies of each rule in ascending order.
///
/// \returns The ordered closure, or a \see GraphError for an invalid id or a
/// dependency cycle.
llvm::Expected<std::vector<RuleID>> topologicalSort(const RuleGraph& graph,
                                                    ArrayRef<RuleID> targets);

}
}

#endif
