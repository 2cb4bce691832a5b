//===- unittests/Core/RuleTest.cpp ----------------------------------------===//
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

#include "memobuild/Basic/FileSystem.h"
#include "memobuild/Core/ContentHashCache.h"
#include "memobuild/Core/RuleStore.h"

#include "gtest/gtest.h"

using namespace memobuild;
using namespace memobuild::basic;
using namespace memobuild::core;

namespace {

typedef CheckUpdateResult::Kind UpdateKind;

class RuleTest : public ::testing::Test {
protected:
  TmpDir tempDir{ "RuleTest" };
  std::unique_ptr<FileSystem> fs = createLocalFileSystem();
  ContentHashCache hashCache;
  RuleEnvironment env{ *fs, hashCache };
  RuleStore store;

  const Rule& addRule(StringRef name, std::vector<FileRef> outputs,
                      Value::ElementList args) {
    RuleDescription description;
    description.name = name.str();
    description.outputs = std::move(outputs);
    description.action = Action::makeClosure("noop", [](const ActionContext&) {
        return llvm::Error::success();
      });
    description.args = Value::makeTuple(std::move(args));
    auto id = store.addRule(std::move(description));
    EXPECT_TRUE(bool(id)) << llvm::toString(id.takeError());
    return store.getRule(id ? *id : 0);
  }

  void setTime(const std::string& path, uint64_t seconds) {
    std::string error;
    EXPECT_TRUE(fs->setFileTimestamp(path, FileTimestamp{ seconds, 0 },
                                     &error)) << error;
  }

  FileTimestamp getTime(const std::string& path) {
    return fs->getFileInfo(path).modTime;
  }

  CheckUpdateResult check(const Rule& rule, bool dependencyWasUpdated = false,
                          bool dryRun = false) {
    auto result = rule.checkUpdate(dependencyWasUpdated, dryRun, env);
    if (!result) {
      ADD_FAILURE() << llvm::toString(result.takeError());
      return CheckUpdateResult::makeInfeasible("error");
    }
    return *result;
  }

  void postprocess(const Rule& rule, bool succeeded) {
    auto error = rule.postprocess(succeeded, env);
    EXPECT_FALSE(bool(error)) << llvm::toString(std::move(error));
  }
};

TEST_F(RuleTest, checkUpdate) {
  std::string src = tempDir.path("src.txt");
  std::string out = tempDir.path("out.txt");
  const Rule& rule = addRule("a", { { out } }, { Value::makeFile(src) });

  auto result = check(rule);
  EXPECT_EQ(result.kind, UpdateKind::Infeasible);
  EXPECT_EQ(result.reason, "input file '" + src + "' is missing");

  writeTestFile(src, "source");
  setTime(src, 100);
  EXPECT_EQ(check(rule).kind, UpdateKind::Necessary);

  // An output without a saved record is not trusted.
  writeTestFile(out, "output");
  setTime(out, 200);
  EXPECT_EQ(check(rule).kind, UpdateKind::Necessary);

  postprocess(rule, true);
  EXPECT_TRUE(fs->getFileInfo(rule.getMetadataPath()).isRegularFile());
  result = check(rule);
  EXPECT_EQ(result.kind, UpdateKind::UpToDate);
  EXPECT_FALSE(result.needsUpdate());

  // An input newer than the oldest output.
  setTime(src, 300);
  EXPECT_EQ(check(rule).kind, UpdateKind::Necessary);
  setTime(src, 200);
  EXPECT_EQ(check(rule).kind, UpdateKind::UpToDate);

  // Invalidated outputs.
  setTime(out, 0);
  EXPECT_EQ(check(rule).kind, UpdateKind::Necessary);
  setTime(out, 200);

  // Invalidated inputs.
  setTime(src, 0);
  result = check(rule);
  EXPECT_EQ(result.kind, UpdateKind::Infeasible);
  EXPECT_EQ(result.reason, "input file '" + src + "' has a modification time "
            "of zero, which marks it as invalid");
}

TEST_F(RuleTest, checkUpdateDryRun) {
  std::string src = tempDir.path("src.txt");
  std::string mid = tempDir.path("mid.txt");
  std::string out = tempDir.path("out.txt");
  const Rule& first = addRule("first", { { mid } }, { Value::makeFile(src) });
  const Rule& second = addRule("second", { { out } },
                               { Value::makeFile(mid) });

  writeTestFile(src, "source");
  writeTestFile(out, "output");
  setTime(src, 100);
  setTime(out, 200);

  // The output of another rule may be missing in a dry run.
  auto result = check(second, /*dependencyWasUpdated=*/true, /*dryRun=*/true);
  EXPECT_EQ(result.kind, UpdateKind::PossiblyNecessary);
  EXPECT_TRUE(result.needsUpdate());
  EXPECT_EQ(check(second).kind, UpdateKind::Infeasible);

  // An original input may not.
  EXPECT_EQ(check(first, false, true).kind, UpdateKind::Necessary);
  ASSERT_TRUE(fs->remove(src));
  EXPECT_EQ(check(first, false, true).kind, UpdateKind::Infeasible);

  // A dependency which would be updated.
  writeTestFile(mid, "middle");
  setTime(mid, 150);
  postprocess(second, true);
  EXPECT_EQ(check(second, false, true).kind, UpdateKind::UpToDate);
  EXPECT_EQ(check(second, true, true).kind, UpdateKind::PossiblyNecessary);
  EXPECT_EQ(check(second, true, false).kind, UpdateKind::UpToDate);
}

TEST_F(RuleTest, valueFileInputs) {
  std::string src = tempDir.path("src.txt");
  std::string out = tempDir.path("out.txt");
  const Rule& rule = addRule("a", { { out } },
                             { Value::makeFile(src, FileKind::Value) });

  writeTestFile(src, "source");
  writeTestFile(out, "output");
  setTime(src, 100);
  setTime(out, 200);
  postprocess(rule, true);
  EXPECT_EQ(check(rule).kind, UpdateKind::UpToDate);

  // Touching a value file does not make the rule stale.
  setTime(src, 300);
  EXPECT_EQ(check(rule).kind, UpdateKind::UpToDate);

  writeTestFile(src, "changed");
  setTime(src, 400);
  EXPECT_EQ(check(rule).kind, UpdateKind::Necessary);
}

TEST_F(RuleTest, changedArguments) {
  std::string out = tempDir.path("out.txt");
  const Rule& first = addRule("a", { { out } }, { Value::makeInt(1) });
  writeTestFile(out, "output");
  postprocess(first, true);
  EXPECT_EQ(check(first).kind, UpdateKind::UpToDate);

  // A rule of another store with other arguments, sharing the output.
  RuleStore otherStore;
  RuleDescription description;
  description.outputs = { { out } };
  description.action = first.getAction();
  description.args = Value::makeTuple({ Value::makeInt(2) });
  auto id = otherStore.addRule(std::move(description));
  ASSERT_TRUE(bool(id)) << llvm::toString(id.takeError());
  EXPECT_EQ(check(otherStore.getRule(*id)).kind, UpdateKind::Necessary);
}

TEST_F(RuleTest, preprocess) {
  std::string out = tempDir.path("sub/dir/out.txt");
  const Rule& rule = addRule("a", { { out } }, {});
  auto error = rule.preprocess(*fs);
  EXPECT_FALSE(bool(error)) << llvm::toString(std::move(error));
  EXPECT_TRUE(fs->getFileInfo(tempDir.path("sub/dir")).isDirectory());

  std::string blocked = tempDir.path("file/out.txt");
  writeTestFile(tempDir.path("file"), "not a directory");
  const Rule& blockedRule = addRule("b", { { blocked } }, {});
  error = blockedRule.preprocess(*fs);
  ASSERT_TRUE(bool(error));
  EXPECT_EQ(llvm::toString(std::move(error)),
            "unable to create directory for output '" + blocked + "': '" +
            tempDir.path("file") + "' is not a directory");
}

TEST_F(RuleTest, postprocess) {
  std::string out1 = tempDir.path("out1.txt");
  std::string out2 = tempDir.path("out2.txt");
  const Rule& rule = addRule("a", { { out1 }, { out2 } }, {});

  writeTestFile(out1, "output");
  auto error = rule.postprocess(true, env);
  ASSERT_TRUE(bool(error));
  EXPECT_EQ(llvm::toString(std::move(error)),
            "output file '" + out2 + "' was not created");
  EXPECT_TRUE(fs->getFileInfo(rule.getMetadataPath()).isMissing());

  writeTestFile(out2, "output");
  postprocess(rule, true);
  EXPECT_FALSE(fs->getFileInfo(rule.getMetadataPath()).isMissing());

  // A failure invalidates the outputs and forgets the record.
  postprocess(rule, false);
  EXPECT_TRUE(getTime(out1).isEpoch());
  EXPECT_TRUE(getTime(out2).isEpoch());
  EXPECT_EQ(readTestFile(out1), "output");
  EXPECT_TRUE(fs->getFileInfo(rule.getMetadataPath()).isMissing());
  EXPECT_EQ(check(rule).kind, UpdateKind::Necessary);

  // A failure with missing outputs leaves them missing.
  ASSERT_TRUE(fs->remove(out2));
  postprocess(rule, false);
  EXPECT_TRUE(fs->getFileInfo(out2).isMissing());
}

TEST_F(RuleTest, postprocessNonRegularOutput) {
  std::string out = tempDir.path("out");
  const Rule& rule = addRule("a", { { out } }, {});
  ASSERT_TRUE(fs->createDirectory(out));
  auto error = rule.postprocess(true, env);
  ASSERT_TRUE(bool(error));
  EXPECT_EQ(llvm::toString(std::move(error)),
            "output '" + out + "' is not a regular file");
}

TEST_F(RuleTest, touch) {
  std::string src = tempDir.path("src.txt");
  std::string out1 = tempDir.path("out1.txt");
  std::string out2 = tempDir.path("sub/out2.txt");
  const Rule& rule = addRule("a", { { out1 }, { out2 } },
                             { Value::makeFile(src) });
  writeTestFile(src, "source");
  setTime(src, 100);
  writeTestFile(out1, "output");

  // Without creating missing outputs.
  auto error = rule.touch(env, false, false, FileTimestamp{ 200, 0 });
  EXPECT_FALSE(bool(error)) << llvm::toString(std::move(error));
  EXPECT_EQ(getTime(out1), (FileTimestamp{ 200, 0 }));
  EXPECT_TRUE(fs->getFileInfo(out2).isMissing());
  EXPECT_TRUE(fs->getFileInfo(rule.getMetadataPath()).isMissing());

  error = rule.touch(env, true, true, FileTimestamp{ 300, 0 });
  EXPECT_FALSE(bool(error)) << llvm::toString(std::move(error));
  EXPECT_EQ(readTestFile(out2), "");
  EXPECT_EQ(readTestFile(out1), "output");
  EXPECT_EQ(getTime(out2), (FileTimestamp{ 300, 0 }));
  EXPECT_EQ(check(rule).kind, UpdateKind::UpToDate);

  // Touching now makes the outputs newer than any input.
  setTime(src, 400);
  EXPECT_EQ(check(rule).kind, UpdateKind::Necessary);
  error = rule.touch(env, false, false, llvm::None);
  EXPECT_FALSE(bool(error)) << llvm::toString(std::move(error));
  EXPECT_EQ(check(rule).kind, UpdateKind::UpToDate);
}

TEST_F(RuleTest, clean) {
  std::string out1 = tempDir.path("out1.txt");
  std::string out2 = tempDir.path("out2.txt");
  const Rule& rule = addRule("a", { { out1 }, { out2 } }, {});

  // Nothing to remove.
  auto error = rule.clean(*fs);
  EXPECT_FALSE(bool(error)) << llvm::toString(std::move(error));

  writeTestFile(out1, "output");
  writeTestFile(out2, "output");
  postprocess(rule, true);
  error = rule.clean(*fs);
  EXPECT_FALSE(bool(error)) << llvm::toString(std::move(error));
  EXPECT_TRUE(fs->getLinkInfo(out1).isMissing());
  EXPECT_TRUE(fs->getLinkInfo(out2).isMissing());
  EXPECT_TRUE(fs->getLinkInfo(rule.getMetadataPath()).isMissing());
}

TEST_F(RuleTest, actionContext) {
  std::string src = tempDir.path("src.txt");
  std::string out = tempDir.path("out.txt");
  const Rule& rule = addRule("a", { { out } }, {
      Value::makeFile(src), Value::makeString("text") });

  std::atomic<bool> cancelled{ false };
  ActionContext context = rule.makeActionContext(&cancelled);
  ASSERT_EQ(context.getOutputs().size(), 1U);
  EXPECT_EQ(context.getOutputs()[0].path, out);
  ASSERT_EQ(context.getInputs().size(), 1U);
  EXPECT_EQ(context.getInputs()[0].path, src);
  ASSERT_TRUE(context.getArg(1) != nullptr);
  EXPECT_EQ(context.getArg(1)->getString(), "text");
  EXPECT_TRUE(context.getArg(2) == nullptr);
  EXPECT_FALSE(context.isCancelled());
  cancelled = true;
  EXPECT_TRUE(context.isCancelled());
}

TEST(ContentHashCacheTest, basic) {
  TmpDir tempDir{ "ContentHashCacheTest" };
  auto fs = createLocalFileSystem();
  ContentHashCache cache;

  std::string a = tempDir.path("a.txt");
  std::string b = tempDir.path("b.txt");
  writeTestFile(a, "contents");
  writeTestFile(b, "contents");

  std::string digestA, digestB;
  ASSERT_TRUE(cache.getContentHash(*fs, a, digestA));
  ASSERT_TRUE(cache.getContentHash(*fs, b, digestB));
  EXPECT_EQ(digestA, digestB);
  EXPECT_EQ(digestA, FileChecksum::getChecksumForData("contents").asHex());
  EXPECT_EQ(cache.getNumComputed(), 2U);
  EXPECT_EQ(cache.size(), 2U);

  // Served from the cache while the timestamp is unchanged.
  std::string digest;
  ASSERT_TRUE(cache.getContentHash(*fs, a, digest));
  EXPECT_EQ(digest, digestA);
  EXPECT_EQ(cache.getNumComputed(), 2U);

  writeTestFile(a, "changed");
  std::string error;
  ASSERT_TRUE(fs->setFileTimestamp(a, FileTimestamp{ 100, 0 }, &error))
    << error;
  ASSERT_TRUE(cache.getContentHash(*fs, a, digest));
  EXPECT_NE(digest, digestB);
  EXPECT_EQ(cache.getNumComputed(), 3U);

  EXPECT_FALSE(cache.getContentHash(*fs, tempDir.path("missing"), digest));
  EXPECT_FALSE(cache.getContentHash(*fs, tempDir.str(), digest));

  cache.clear();
  EXPECT_EQ(cache.size(), 0U);
}

}
