//===- unittests/Commands/ManifestTest.cpp --------------------------------===//
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

#include "../Support/TempDir.h"

#include "memobuild/Commands/Manifest.h"

#include "gtest/gtest.h"

#include <string>
#include <vector>

using namespace memobuild;
using namespace memobuild::commands;
using namespace memobuild::core;

namespace {

std::unique_ptr<Manifest> load(StringRef contents) {
  auto manifest = loadManifest(contents, "test.json", MemoFactory());
  EXPECT_TRUE(bool(manifest)) << llvm::toString(manifest.takeError());
  if (!manifest)
    return nullptr;
  return std::move(*manifest);
}

std::string loadError(StringRef contents) {
  auto manifest = loadManifest(contents, "test.json", MemoFactory());
  if (manifest)
    return "<loaded>";
  return llvm::toString(manifest.takeError());
}

std::vector<RuleID> resolve(const Manifest& manifest,
                            std::vector<std::string> names) {
  auto targets = manifest.resolveTargets(names);
  EXPECT_TRUE(bool(targets)) << llvm::toString(targets.takeError());
  if (!targets)
    return {};
  return *targets;
}

TEST(ManifestTest, basic) {
  auto manifest = load(R"({
    "rules": [
      { "name": "hello", "outputs": ["/w/hello.txt"], "action": "write",
        "args": [{"output": 0}, "Hello"] },
      { "outputs": ["/w/out/copy.txt"], "action": "copy",
        "args": [{"file": "/w/hello.txt"}, {"output": 0}] }
    ],
    "groups": { "all": ["hello", "/w/out/copy.txt"] }
  })");
  ASSERT_TRUE(manifest != nullptr);

  const auto& store = manifest->getStore();
  ASSERT_EQ(store.size(), 2U);

  auto hello = manifest->lookupRule("hello");
  ASSERT_TRUE(hello.hasValue());
  EXPECT_EQ(*hello, 0U);
  const Rule& helloRule = store.getRule(*hello);
  EXPECT_EQ(helloRule.getAction().getName(), "write");
  EXPECT_TRUE(helloRule.getArgs() ==
              Value::makeTuple({ Value::makeFile("/w/hello.txt"),
                                 Value::makeString("Hello") }));
  EXPECT_TRUE(helloRule.getInputs().empty());

  // Unnamed rules are named after their first output.
  auto copy = manifest->lookupRule("/w/out/copy.txt");
  ASSERT_TRUE(copy.hasValue());
  const Rule& copyRule = store.getRule(*copy);
  ASSERT_EQ(copyRule.getInputs().size(), 1U);
  EXPECT_EQ(copyRule.getInputs()[0].file.path, "/w/hello.txt");
  EXPECT_FALSE(copyRule.getInputs()[0].isOriginal);
  EXPECT_EQ(copyRule.getDependencies(), ArrayRef<RuleID>({ 0 }));

  const RuleGroup* all = manifest->lookupGroup("all");
  ASSERT_TRUE(all != nullptr);
  EXPECT_EQ(all->getRuleIDs(), ArrayRef<RuleID>({ 0, 1 }));
  EXPECT_TRUE(manifest->lookupGroup("hello") == nullptr);
}

TEST(ManifestTest, argumentKinds) {
  auto manifest = load(R"({
    "rules": [
      { "name": "r", "outputs": ["/w/r.txt", {"vfile": "/w/r.json"}],
        "action": "write",
        "args": [null, true, 3, 1.5, "s", [1, "x"],
                 {"tuple": [1]}, {"set": [2, 1]}, {"path": "/p"},
                 {"bytes": "00ff"}, {"vfile": "/w/v.json"},
                 {"output": 1}, {"k": 1, "j": 2}, {"bogus": 1}],
        "kwargs": { "mode": {"file": "/w/mode.txt"} } }
    ]
  })");
  ASSERT_TRUE(manifest != nullptr);

  const Rule& rule = manifest->getStore().getRule(0);
  ASSERT_EQ(rule.getOutputs().size(), 2U);
  EXPECT_FALSE(rule.getOutputs()[0].isValueFile());
  EXPECT_TRUE(rule.getOutputs()[1].isValueFile());

  const auto& args = rule.getArgs().getElements();
  ASSERT_EQ(args.size(), 14U);
  EXPECT_TRUE(args[0].isNone());
  EXPECT_TRUE(args[1] == Value::makeBool(true));
  EXPECT_TRUE(args[2] == Value::makeInt(3));
  EXPECT_TRUE(args[3] == Value::makeFloat(1.5));
  EXPECT_TRUE(args[4] == Value::makeString("s"));
  EXPECT_TRUE(args[5] == Value::makeList({ Value::makeInt(1),
                                           Value::makeString("x") }));
  EXPECT_TRUE(args[6] == Value::makeTuple({ Value::makeInt(1) }));
  EXPECT_TRUE(args[7] == Value::makeSet({ Value::makeInt(1),
                                          Value::makeInt(2) }));
  EXPECT_TRUE(args[8] == Value::makePath("/p"));
  EXPECT_TRUE(args[9] == Value::makeBytes(StringRef("\x00\xff", 2)));
  EXPECT_TRUE(args[10] == Value::makeFile("/w/v.json", FileKind::Value));
  EXPECT_TRUE(args[11] == Value::makeFile("/w/r.json", FileKind::Value));
  EXPECT_TRUE(args[12] == Value::makeDict({
        { Value::makeString("j"), Value::makeInt(2) },
        { Value::makeString("k"), Value::makeInt(1) } }));

  // A single key which is not a tag is an ordinary dictionary.
  EXPECT_TRUE(args[13] == Value::makeDict({
        { Value::makeString("bogus"), Value::makeInt(1) } }));

  // Files in keyword arguments are inputs too.
  ASSERT_EQ(rule.getInputs().size(), 2U);
  EXPECT_EQ(rule.getInputs()[0].file.path, "/w/v.json");
  EXPECT_EQ(rule.getInputs()[1].file.path, "/w/mode.txt");
}

TEST(ManifestTest, errors) {
  EXPECT_EQ(loadError("[]"), "test.json: <root>: expected an object");
  EXPECT_EQ(loadError(R"({"rules": [], "extra": 1})"),
            "test.json: <root>: unexpected key 'extra'");
  EXPECT_EQ(loadError(R"({"rules": {}})"),
            "test.json: rules: expected an array");
  EXPECT_EQ(loadError(R"({"groups": []})"),
            "test.json: groups: expected an object");
  EXPECT_EQ(loadError(R"({"rules": [1]})"),
            "test.json: rules[0]: expected an object");
  EXPECT_EQ(loadError(R"({"rules": [{"outputs": ["/w/a"], "action": "write",
                                     "color": "red"}]})"),
            "test.json: rules[0]: unexpected key 'color'");
  EXPECT_EQ(loadError(R"({"rules": [{"name": 1, "outputs": ["/w/a"],
                                     "action": "write"}]})"),
            "test.json: rules[0].name: expected a string");
  EXPECT_EQ(loadError(R"({"rules": [{"action": "write"}]})"),
            "test.json: rules[0].outputs: expected an array");
  EXPECT_EQ(loadError(R"({"rules": [{"outputs": [1], "action": "write"}]})"),
            "test.json: rules[0].outputs[0]: "
            "expected a path or a {\"vfile\": path}");
  EXPECT_EQ(loadError(R"({"rules": [{"outputs": ["/w/a"]}]})"),
            "test.json: rules[0].action: expected a string");
  EXPECT_EQ(loadError(R"({"rules": [{"outputs": ["/w/a"],
                                     "action": "compile"}]})"),
            "test.json: rules[0].action: unknown action 'compile'");
  EXPECT_EQ(loadError(R"({"rules": [{"outputs": ["/w/a"], "action": "write",
                                     "args": {}}]})"),
            "test.json: rules[0].args: expected an array");
  EXPECT_EQ(loadError(R"({"rules": [{"outputs": ["/w/a"], "action": "write",
                                     "kwargs": []}]})"),
            "test.json: rules[0].kwargs: expected an object");
  EXPECT_EQ(loadError(R"({"rules": [{"outputs": ["/w/a"], "action": "write",
                                     "args": [{"output": 1}]}]})"),
            "test.json: rules[0].args[0].output: "
            "expected the index of an output");
  EXPECT_EQ(loadError(R"({"rules": [{"outputs": ["/w/a"], "action": "write",
                                     "args": [[{"file": 1}]]}]})"),
            "test.json: rules[0].args[0][0].file: expected a string");
  EXPECT_EQ(loadError(R"({"rules": [{"outputs": ["/w/a"], "action": "write",
                                     "args": [{"bytes": "xyz"}]}]})"),
            "test.json: rules[0].args[0].bytes: "
            "expected a hexadecimal string");
  EXPECT_EQ(loadError(R"({"rules": [{"outputs": ["/w/a"], "action": "write",
                                     "kwargs": {"k": {"set": 1}}}]})"),
            "test.json: rules[0].kwargs.k.set: expected an array");

  // Errors of the rule store carry the rule context.
  EXPECT_EQ(loadError(R"({"rules": [
      {"name": "a", "outputs": ["/w/a"], "action": "write"},
      {"name": "b", "outputs": ["/w/a"], "action": "write"}]})"),
            "test.json: rules[1]: output '/w/a' of rule 'b' is already "
            "produced by rule 'a'");
  EXPECT_EQ(loadError(R"({"rules": [
      {"name": "a", "outputs": ["/w/a"], "action": "write"},
      {"name": "a", "outputs": ["/w/b"], "action": "write"}]})"),
            "test.json: rules[1]: duplicate rule name 'a'");

  // Malformed JSON.
  std::string error = loadError("{");
  EXPECT_EQ(error.find("test.json: <root>: "), 0U) << error;
}

TEST(ManifestTest, groups) {
  auto manifest = load(R"({
    "rules": [
      { "name": "a", "outputs": ["/w/a"], "action": "write" },
      { "name": "b", "outputs": ["/w/b"], "action": "write" },
      { "name": "c", "outputs": ["/w/c"], "action": "write" }
    ],
    "groups": {
      "outer": ["c", "inner", "a"],
      "inner": ["b", "a"]
    }
  })");
  ASSERT_TRUE(manifest != nullptr);

  const RuleGroup* inner = manifest->lookupGroup("inner");
  ASSERT_TRUE(inner != nullptr);
  EXPECT_EQ(inner->getRuleIDs(), ArrayRef<RuleID>({ 1, 0 }));

  // Nested groups contribute their rules; targets are selected once.
  const RuleGroup* outer = manifest->lookupGroup("outer");
  ASSERT_TRUE(outer != nullptr);
  EXPECT_EQ(outer->getRuleIDs(), ArrayRef<RuleID>({ 2, 1, 0, 0 }));
  EXPECT_EQ(resolve(*manifest, { "outer" }),
            std::vector<RuleID>({ 2, 1, 0 }));
}

TEST(ManifestTest, groupErrors) {
  const char* rules = R"("rules": [
      { "name": "a", "outputs": ["/w/a"], "action": "write" } ])";

  EXPECT_EQ(loadError(std::string("{") + rules +
                      R"(, "groups": {"g": ["g"]}})"),
            "test.json: groups.g: group contains itself");
  EXPECT_EQ(loadError(std::string("{") + rules +
                      R"(, "groups": {"g": ["x"]}})"),
            "test.json: groups.g[0]: unknown rule or group 'x'");
  EXPECT_EQ(loadError(std::string("{") + rules +
                      R"(, "groups": {"g": [1]}})"),
            "test.json: groups.g[0]: expected a string");
  EXPECT_EQ(loadError(std::string("{") + rules +
                      R"(, "groups": {"g": "a"}})"),
            "test.json: groups.g: expected an array");
  EXPECT_EQ(loadError(std::string("{") + rules +
                      R"(, "groups": {"a": ["a"]}})"),
            "test.json: groups.a: a rule is already named 'a'");
}

TEST(ManifestTest, resolveTargets) {
  auto manifest = load(R"({
    "rules": [
      { "name": "a", "outputs": ["/w/a"], "action": "write" },
      { "name": "b", "outputs": ["/w/out/b"], "action": "write" },
      { "name": "c", "outputs": ["/w/c"], "action": "write" }
    ],
    "groups": { "bc": ["b", "c"] }
  })");
  ASSERT_TRUE(manifest != nullptr);

  EXPECT_EQ(resolve(*manifest, {}), std::vector<RuleID>({ 0, 1, 2 }));
  EXPECT_EQ(resolve(*manifest, { "bc" }), std::vector<RuleID>({ 1, 2 }));
  EXPECT_EQ(resolve(*manifest, { "c", "a" }), std::vector<RuleID>({ 2, 0 }));

  // Outputs name their producers.
  EXPECT_EQ(resolve(*manifest, { "/w/./out/../out/b", "bc" }),
            std::vector<RuleID>({ 1, 2 }));

  auto unknown = manifest->resolveTargets({ "a", "zzz" });
  ASSERT_FALSE(bool(unknown));
  EXPECT_EQ(llvm::toString(unknown.takeError()), "unknown target 'zzz'");
}

TEST(ManifestTest, loadManifestFile) {
  TmpDir tempDir("ManifestTest");
  std::string path = tempDir.path("memobuild.json");
  writeTestFile(path, R"({"rules": [
      { "name": "a", "outputs": ["/w/a"], "action": "shell",
        "args": ["true"] } ]})");

  auto manifest = loadManifestFile(path, MemoFactory());
  ASSERT_TRUE(bool(manifest)) << llvm::toString(manifest.takeError());
  EXPECT_EQ((*manifest)->getStore().size(), 1U);

  auto missing = loadManifestFile(tempDir.path("missing.json"),
                                  MemoFactory());
  ASSERT_FALSE(bool(missing));
  std::string error = llvm::toString(missing.takeError());
  EXPECT_EQ(error.find("unable to read manifest '" +
                       tempDir.path("missing.json") + "': "), 0U) << error;

  // Diagnostics name the file.
  writeTestFile(path, "[]");
  auto invalid = loadManifestFile(path, MemoFactory());
  ASSERT_FALSE(bool(invalid));
  EXPECT_EQ(llvm::toString(invalid.takeError()),
            path + ": <root>: expected an object");
}

}
