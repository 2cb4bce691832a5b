//===- unittests/Core/GraphTest.cpp ---------------------------------------===//
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

#include "gtest/gtest.h"

#include <string>
#include <vector>

using namespace memobuild;
using namespace memobuild::core;

namespace {

/// A graph of rules named "r<id>" with explicit edges.
class SimpleGraph : public RuleGraph {
  std::vector<std::vector<RuleID>> dependencies;
  std::vector<std::string> names;

public:
  explicit SimpleGraph(std::vector<std::vector<RuleID>> dependencies)
      : dependencies(std::move(dependencies)) {
    for (unsigned i = 0, e = this->dependencies.size(); i != e; ++i)
      names.push_back("r" + std::to_string(i));
  }

  virtual size_t getNumRules() const override { return dependencies.size(); }

  virtual ArrayRef<RuleID> getDependencies(RuleID id) const override {
    return dependencies[id];
  }

  virtual StringRef getRuleName(RuleID id) const override {
    return names[id];
  }
};

std::vector<RuleID> sortRules(const RuleGraph& graph,
                              ArrayRef<RuleID> targets) {
  auto result = topologicalSort(graph, targets);
  EXPECT_TRUE(bool(result)) << llvm::toString(result.takeError());
  return result ? *result : std::vector<RuleID>();
}

std::string sortError(const RuleGraph& graph, ArrayRef<RuleID> targets) {
  auto result = topologicalSort(graph, targets);
  if (result) {
    ADD_FAILURE() << "unexpected success";
    return "";
  }
  auto error = result.takeError();
  EXPECT_TRUE(error.isA<GraphError>());
  return llvm::toString(std::move(error));
}

TEST(GraphTest, basic) {
  // r3 -> { r1, r2 }, r2 -> r0, r1 -> r0
  SimpleGraph graph({ {}, { 0 }, { 0 }, { 1, 2 }, {} });

  EXPECT_EQ(sortRules(graph, { 3 }), std::vector<RuleID>({ 0, 1, 2, 3 }));
  EXPECT_EQ(sortRules(graph, { 2 }), std::vector<RuleID>({ 0, 2 }));

  // Targets are visited in order, and shared rules appear once.
  EXPECT_EQ(sortRules(graph, { 4, 2, 3 }),
            std::vector<RuleID>({ 4, 0, 2, 1, 3 }));
  EXPECT_EQ(sortRules(graph, { 2, 2 }), std::vector<RuleID>({ 0, 2 }));

  EXPECT_TRUE(sortRules(graph, {}).empty());
}

TEST(GraphTest, deepChain) {
  // Long chains must not exhaust the stack.
  const unsigned numRules = 100000;
  std::vector<std::vector<RuleID>> dependencies(numRules);
  for (unsigned i = 1; i != numRules; ++i)
    dependencies[i].push_back(i - 1);
  SimpleGraph graph(std::move(dependencies));

  auto order = sortRules(graph, { numRules - 1 });
  ASSERT_EQ(order.size(), numRules);
  for (unsigned i = 0; i != numRules; ++i)
    EXPECT_EQ(order[i], i);
}

TEST(GraphTest, cycles) {
  SimpleGraph selfCycle(std::vector<std::vector<RuleID>>{ { 0 } });
  EXPECT_EQ(sortError(selfCycle, { 0 }),
            "dependency cycle detected: 'r0' -> 'r0'");

  // r0 -> r1 -> r2 -> r1
  SimpleGraph graph({ { 1 }, { 2 }, { 1 } });
  EXPECT_EQ(sortError(graph, { 0 }),
            "dependency cycle detected: 'r1' -> 'r2' -> 'r1'");
}

TEST(GraphTest, invalidIDs) {
  SimpleGraph graph({ {}, { 5 } });
  EXPECT_EQ(sortError(graph, { 2 }), "invalid rule id 2");
  EXPECT_EQ(sortError(graph, { 1 }),
            "rule 'r1' depends on invalid rule id 5");
}

}
