//===- unittests/Core/RuleStoreTest.cpp -----------------------------------===//
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

#include "memobuild/Core/RuleStore.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"

#include "gtest/gtest.h"

#include <cmath>

using namespace memobuild;
using namespace memobuild::core;

namespace {

Action makeNoopAction() {
  return Action::makeClosure("noop", [](const ActionContext&) {
      return llvm::Error::success();
    });
}

RuleDescription makeRule(StringRef name, std::vector<FileRef> outputs,
                         Value::ElementList args = {}) {
  RuleDescription description;
  description.name = name.str();
  description.outputs = std::move(outputs);
  description.action = makeNoopAction();
  description.args = Value::makeTuple(std::move(args));
  return description;
}

RuleID addRule(RuleStore& store, RuleDescription description) {
  auto id = store.addRule(std::move(description));
  EXPECT_TRUE(bool(id)) << llvm::toString(id.takeError());
  return id ? *id : RuleID(~0U);
}

/// Add a rule which must be rejected, and return the message.
std::string addRuleError(RuleStore& store, RuleDescription description) {
  auto id = store.addRule(std::move(description));
  if (id) {
    ADD_FAILURE() << "unexpected success";
    return "";
  }
  return llvm::toString(id.takeError());
}

TEST(RuleStoreTest, inputsAndDependencies) {
  RuleStore store;
  RuleID a = addRule(store, makeRule("a", { { "/w/a.txt" } },
                                     { Value::makeFile("/w/src.txt") }));
  RuleID b = addRule(store, makeRule("b", { { "/w/b.txt" } }));
  RuleID c = addRule(store, makeRule("c", { { "/w/c.txt" } }, {
        Value::makeFile("/w/b.txt"),
        Value::makeList({ Value::makeFile("/w/a.txt"),
                          Value::makeFile("/w/b.txt") }),
        Value::makeFile("/w/c.txt"),
        Value::makeFile("/w/other.txt") }));
  EXPECT_EQ(a, 0U);
  EXPECT_EQ(b, 1U);
  EXPECT_EQ(c, 2U);
  ASSERT_EQ(store.size(), 3U);

  // Inputs are in order of first appearance, without the rule's own outputs.
  const Rule& rule = store.getRule(c);
  ASSERT_EQ(rule.getInputs().size(), 3U);
  EXPECT_EQ(rule.getInputs()[0].file.path, "/w/b.txt");
  EXPECT_FALSE(rule.getInputs()[0].isOriginal);
  EXPECT_EQ(rule.getInputs()[1].file.path, "/w/a.txt");
  EXPECT_FALSE(rule.getInputs()[1].isOriginal);
  EXPECT_EQ(rule.getInputs()[2].file.path, "/w/other.txt");
  EXPECT_TRUE(rule.getInputs()[2].isOriginal);

  // Dependencies are sorted.
  ASSERT_EQ(rule.getDependencies().size(), 2U);
  EXPECT_EQ(rule.getDependencies()[0], a);
  EXPECT_EQ(rule.getDependencies()[1], b);
  EXPECT_EQ(store.getDependencies(c).size(), 2U);
  EXPECT_EQ(store.getRuleName(c), "c");

  ASSERT_TRUE(store.getProducer("/w/b.txt").hasValue());
  EXPECT_EQ(*store.getProducer("/w/b.txt"), b);
  EXPECT_FALSE(store.getProducer("/w/src.txt").hasValue());
}

TEST(RuleStoreTest, keywordArgumentFiles) {
  RuleStore store;
  RuleID a = addRule(store, makeRule("a", { { "/w/a.txt" } }));
  auto description = makeRule("b", { { "/w/b.txt" } });
  description.kwargs = Value::makeDict({
      { Value::makeString("src"), Value::makeFile("/w/a.txt") } });
  RuleID b = addRule(store, std::move(description));

  const Rule& rule = store.getRule(b);
  ASSERT_EQ(rule.getDependencies().size(), 1U);
  EXPECT_EQ(rule.getDependencies()[0], a);
  EXPECT_TRUE(rule.getKeywordArgs().lookup("src") != nullptr);
}

TEST(RuleStoreTest, atomsAreNotInputs) {
  RuleStore store;
  RuleID a = addRule(store, makeRule("a", { { "/w/a.txt" } }));
  RuleID b = addRule(store, makeRule("b", { { "/w/b.txt" } }, {
        Value::makeAtom(Value::makeFile("/w/a.txt"),
                        Value::makeString("a")) }));
  (void)a;

  const Rule& rule = store.getRule(b);
  EXPECT_TRUE(rule.getInputs().empty());
  EXPECT_TRUE(rule.getDependencies().empty());

  // The action sees the real value of the atom.
  ASSERT_EQ(rule.getArgs().getElements().size(), 1U);
  EXPECT_TRUE(rule.getArgs().getElements()[0].isFile());
}

TEST(RuleStoreTest, defaultNameAndNormalization) {
  llvm::SmallString<256> cwd;
  ASSERT_FALSE(llvm::sys::fs::current_path(cwd));

  RuleStore store;
  RuleID id = addRule(store, makeRule("", { { "out/./x/../a.txt" } }));

  llvm::SmallString<256> expected(cwd);
  llvm::sys::path::append(expected, "out", "a.txt");

  const Rule& rule = store.getRule(id);
  EXPECT_EQ(rule.getOutputs()[0].path, expected.str().str());
  EXPECT_EQ(rule.getName(), expected.str().str());
  EXPECT_EQ(RuleStore::normalizePath("/w/./a/../b"), "/w/b");
  EXPECT_TRUE(store.getProducer(expected).hasValue());
}

TEST(RuleStoreTest, metadataPath) {
  RuleStore store;
  RuleID id = addRule(store, makeRule("a", { { "/w/out/a.txt" },
                                             { "/w/b.txt" } }));
  EXPECT_EQ(store.getRule(id).getMetadataPath(), "/w/out/.metadata/a.txt");
}

TEST(RuleStoreTest, registrationErrors) {
  RuleStore store;
  addRule(store, makeRule("a", { { "/w/a.txt" } },
                          { Value::makeFile("/w/src.txt") }));

  EXPECT_EQ(addRuleError(store, makeRule("none", {})),
            "rule 'none' has no outputs");

  auto noAction = makeRule("x", { { "/w/x.txt" } });
  noAction.action = Action();
  EXPECT_EQ(addRuleError(store, std::move(noAction)),
            "rule 'x' has no action");

  EXPECT_EQ(addRuleError(store, makeRule("twice", { { "/w/t.txt" },
                                                    { "/w/./t.txt" } })),
            "rule 'twice' declares output '/w/t.txt' twice");

  EXPECT_EQ(addRuleError(store, makeRule("again", { { "/w/a.txt" } })),
            "output '/w/a.txt' of rule 'again' is already produced by rule "
            "'a'");

  EXPECT_EQ(addRuleError(store, makeRule("late", { { "/w/src.txt" } })),
            "output '/w/src.txt' of rule 'late' is already an original input "
            "of rule 'a'");

  auto badKwargs = makeRule("kw", { { "/w/kw.txt" } });
  badKwargs.kwargs = Value::makeDict({
      { Value::makeInt(1), Value::makeNone() } });
  EXPECT_EQ(addRuleError(store, std::move(badKwargs)),
            "rule 'kw' has a keyword argument with a non-string key");

  // Rejected rules leave no trace.
  EXPECT_EQ(store.size(), 1U);
  EXPECT_FALSE(store.getProducer("/w/x.txt").hasValue());
  addRule(store, makeRule("x", { { "/w/x.txt" } }));
}

TEST(RuleStoreTest, fileKindConflicts) {
  RuleStore store;
  addRule(store, makeRule("a", { { "/w/a.txt", FileKind::Value } }));

  EXPECT_EQ(addRuleError(store, makeRule("b", { { "/w/b.txt" } },
                                         { Value::makeFile("/w/a.txt") })),
            "rule 'b' uses '/w/a.txt' as a plain file, but it is used "
            "elsewhere as a value file");

  EXPECT_EQ(addRuleError(store, makeRule("c", { { "/w/c.txt" } }, {
          Value::makeFile("/w/src.txt"),
          Value::makeFile("/w/src.txt", FileKind::Value) })),
            "rule 'c' uses '/w/src.txt' as a value file, but it is used "
            "elsewhere as a plain file");

  RuleID d = addRule(store, makeRule("d", { { "/w/d.txt" } }, {
        Value::makeFile("/w/a.txt", FileKind::Value) }));
  EXPECT_TRUE(store.getRule(d).getInputs()[0].file.isValueFile());
}

TEST(RuleStoreTest, unmemoizableArguments) {
  RuleStore store;
  auto list = Value::makeList();
  list.append(list);
  auto message = addRuleError(store, makeRule("a", { { "/w/a.txt" } },
                                              { list }));
  EXPECT_EQ(message, "rule 'a': arguments contain a reference cycle");

  // Files in dictionary keys are neither inputs nor memoizable.
  message = addRuleError(store, makeRule("c", { { "/w/c.txt" } }, {
        Value::makeDict({
            { Value::makeFile("/w/x.txt", FileKind::Value),
              Value::makeInt(1) },
            { Value::makeFile("/w/y.txt", FileKind::Value),
              Value::makeInt(2) } }) }));
  EXPECT_EQ(message,
            "unable to memoize the arguments of rule 'c': memoized arguments "
            "have a file or an atom in a dictionary key at '$[0][0]'");
  EXPECT_EQ(store.size(), 0U);

  // Authenticated records can not hold a NaN.
  auto factory = MemoFactory::createWithHexKey(MemoKind::Authenticated,
                                               "00112233445566778899aabb");
  ASSERT_TRUE(bool(factory)) << llvm::toString(factory.takeError());
  RuleStore authenticatedStore(std::move(*factory));
  message = addRuleError(authenticatedStore, makeRule("b", { { "/w/b.txt" } },
                                         { Value::makeFloat(NAN) }));
  EXPECT_EQ(message.find("unable to memoize the arguments of rule 'b'"), 0U)
    << message;
}

TEST(RuleStoreTest, groups) {
  RuleStore store;
  RuleID a = addRule(store, makeRule("a", { { "/w/a.txt" } }));
  RuleID b = addRule(store, makeRule("b", { { "/w/b.txt" } }));
  RuleID c = addRule(store, makeRule("c", { { "/w/c.txt" } }));

  RuleGroup inner(store, "inner");
  EXPECT_FALSE(bool(inner.addRule(b)));
  EXPECT_FALSE(bool(inner.addRule(a)));

  RuleGroup outer(store, "outer");
  EXPECT_FALSE(bool(outer.addRule(c)));
  EXPECT_FALSE(bool(outer.addSelection(inner)));
  EXPECT_EQ(outer.getRuleIDs().size(), 3U);

  auto error = outer.addRule(7);
  EXPECT_EQ(llvm::toString(std::move(error)),
            "invalid rule id 7 in group 'outer'");

  // Overlapping selections are flattened without duplicates, in order.
  const RuleSelection* selections[] = { &inner, &outer };
  const RuleStore* selectedStore = nullptr;
  auto targets = collectTargets(selections, &selectedStore);
  ASSERT_TRUE(bool(targets)) << llvm::toString(targets.takeError());
  EXPECT_EQ(*targets, std::vector<RuleID>({ b, a, c }));
  EXPECT_EQ(selectedStore, &store);
}

TEST(RuleStoreTest, selectionsOfDifferentStores) {
  RuleStore first, second;
  RuleID a = addRule(first, makeRule("a", { { "/w/a.txt" } }));
  RuleID b = addRule(second, makeRule("b", { { "/w/b.txt" } }));

  RuleGroup firstGroup(first, "first");
  EXPECT_FALSE(bool(firstGroup.addRule(a)));
  RuleGroup secondGroup(second, "second");
  EXPECT_FALSE(bool(secondGroup.addRule(b)));

  auto error = firstGroup.addSelection(secondGroup);
  EXPECT_EQ(llvm::toString(std::move(error)),
            "group 'first' cannot contain rules of another rule store");

  const RuleSelection* selections[] = { &firstGroup, &secondGroup };
  auto targets = collectTargets(selections);
  ASSERT_FALSE(bool(targets));
  auto message = llvm::toString(targets.takeError());
  EXPECT_EQ(message, "the selected rules belong to more than one rule store");
}

}
