//===-- Graph.cpp ---------------------------------------------------------===//
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

#include "memobuild/Core/Graph.h"

#include "llvm/ADT/Twine.h"
#include "llvm/Support/raw_ostream.h"

#include <utility>

using namespace memobuild;
using namespace memobuild::core;

char GraphError::ID = 0;

void GraphError::log(raw_ostream& os) const {
  os << message;
}

RuleGraph::~RuleGraph() {}

namespace {

enum class VisitState : uint8_t {
  Unvisited,
  Visiting,
  Visited,
};

llvm::Error makeCycleError(const RuleGraph& graph,
                           ArrayRef<std::pair<RuleID, unsigned>> stack,
                           RuleID repeated) {
  std::string description;
  llvm::raw_string_ostream os(description);
  bool inCycle = false;
  for (const auto& entry: stack) {
    if (entry.first == repeated)
      inCycle = true;
    if (inCycle)
      os << "'" << graph.getRuleName(entry.first) << "' -> ";
  }
  os << "'" << graph.getRuleName(repeated) << "'";
  return llvm::make_error<GraphError>("dependency cycle detected: " +
                                      os.str());
}

}

llvm::Expected<std::vector<RuleID>>
core::topologicalSort(const RuleGraph& graph, ArrayRef<RuleID> targets) {
  size_t numRules = graph.getNumRules();
  std::vector<VisitState> states(numRules, VisitState::Unvisited);
  std::vector<RuleID> result;

  // The path being visited, with the index of the next dependency to visit
  // for each rule on it.
  std::vector<std::pair<RuleID, unsigned>> stack;

  for (RuleID target: targets) {
    if (target >= numRules) {
      return llvm::make_error<GraphError>("invalid rule id " +
                                          Twine(target));
    }
    if (states[target] != VisitState::Unvisited)
      continue;

    states[target] = VisitState::Visiting;
    stack.emplace_back(target, 0);
    while (!stack.empty()) {
      RuleID id = stack.back().first;
      ArrayRef<RuleID> dependencies = graph.getDependencies(id);

      // If every dependency is done, this rule is too.
      if (stack.back().second == dependencies.size()) {
        states[id] = VisitState::Visited;
        result.push_back(id);
        stack.pop_back();
        continue;
      }

      RuleID dependency = dependencies[stack.back().second++];
      if (dependency >= numRules) {
        return llvm::make_error<GraphError>(
            "rule '" + graph.getRuleName(id) +
            "' depends on invalid rule id " + Twine(dependency));
      }
      switch (states[dependency]) {
      case VisitState::Visited:
        break;
      case VisitState::Visiting:
        return makeCycleError(graph, stack, dependency);
      case VisitState::Unvisited:
        states[dependency] = VisitState::Visiting;
        stack.emplace_back(dependency, 0);
        break;
      }
    }
  }

  return std::move(result);
}
