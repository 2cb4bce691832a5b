//===- MockMakeDelegate.h ---------------------------------------*- C++ -*-===//
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

#ifndef MEMOBUILD_UNITTESTS_MOCKMAKEDELEGATE_H
#define MEMOBUILD_UNITTESTS_MOCKMAKEDELEGATE_H

#include "memobuild/Basic/FileSystem.h"
#include "memobuild/Core/MakeEngine.h"
#include "memobuild/Core/RuleStore.h"

#include "llvm/Support/MemoryBuffer.h"

#include "gtest/gtest.h"

#include <algorithm>
#include <mutex>
#include <string>
#include <vector>

namespace memobuild {
namespace unittests {

/// Make delegate which records the events it receives as messages.
class MockMakeDelegate : public core::MakeDelegate {
  std::vector<std::string> messages;
  std::mutex messagesMutex;

  void add(const std::string& message) {
    std::unique_lock<std::mutex> lock(messagesMutex);
    messages.push_back(message);
  }

public:
  std::vector<std::string> getMessages() {
    std::unique_lock<std::mutex> lock(messagesMutex);
    return messages;
  }

  /// Get the messages in sorted order, for builds with more than one lane.
  std::vector<std::string> getSortedMessages() {
    auto result = getMessages();
    std::sort(result.begin(), result.end());
    return result;
  }

  void clear() {
    std::unique_lock<std::mutex> lock(messagesMutex);
    messages.clear();
  }

  virtual void ruleSkipped(const core::Rule& rule,
                           bool isDirectTarget) override {
    add("ruleSkipped(" + rule.getName() +
        (isDirectTarget ? ", target)" : ")"));
  }

  virtual void ruleStarted(const core::Rule& rule) override {
    add("ruleStarted(" + rule.getName() + ")");
  }

  virtual void ruleFinished(const core::Rule& rule) override {
    add("ruleFinished(" + rule.getName() + ")");
  }

  virtual void ruleDryRun(const core::Rule& rule) override {
    add("ruleDryRun(" + rule.getName() + ")");
  }

  virtual void ruleUpdateInfeasible(const core::Rule& rule,
                                    StringRef reason) override {
    add("ruleUpdateInfeasible(" + rule.getName() + ") " + reason.str());
  }

  virtual void rulePreprocessFailed(const core::Rule& rule,
                                    StringRef error) override {
    add("rulePreprocessFailed(" + rule.getName() + ") " + error.str());
  }

  virtual void ruleExecutionFailed(const core::Rule& rule,
                                   StringRef error) override {
    add("ruleExecutionFailed(" + rule.getName() + ") " + error.str());
  }

  virtual void rulePostprocessFailed(const core::Rule& rule,
                                     StringRef error) override {
    add("rulePostprocessFailed(" + rule.getName() + ") " + error.str());
  }

  virtual void fatalError(const core::Rule& rule, StringRef error) override {
    add("fatalError(" + rule.getName() + ") " + error.str());
  }

  virtual void stoppedOnFailure() override {
    add("stoppedOnFailure");
  }

  virtual void placementDecided(unsigned numInProcess,
                                unsigned numRules) override {
    add("placementDecided(" + std::to_string(numInProcess) + "/" +
        std::to_string(numRules) + ")");
  }
};

/// Write the second argument (a string) to the first (an output file).
inline llvm::Error runTestWrite(const core::ActionContext& context) {
  const core::Value* output = context.getArg(0);
  const core::Value* text = context.getArg(1);
  if (!output || !output->isFile() || !text || !text->isString())
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   "usage: write(output file, text)");
  auto fs = basic::createLocalFileSystem();
  std::string error;
  if (!fs->writeFileContents(output->getFile().path, text->getString(),
                             &error))
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   error.c_str());
  return llvm::Error::success();
}

/// Write the concatenation of the remaining arguments (files or strings) to
/// the first (an output file).
inline llvm::Error runTestConcat(const core::ActionContext& context) {
  const auto& args = context.getArgs().getElements();
  if (args.empty() || !args[0].isFile())
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   "usage: concat(output file, parts...)");
  std::string contents;
  for (size_t i = 1, e = args.size(); i != e; ++i) {
    if (!args[i].isFile()) {
      contents += args[i].getString().str();
      continue;
    }
    auto buffer = llvm::MemoryBuffer::getFile(args[i].getFile().path);
    if (!buffer)
      return llvm::createStringError(buffer.getError(), "unable to read '%s'",
                                     args[i].getFile().path.c_str());
    contents += (*buffer)->getBuffer().str();
  }

  auto fs = basic::createLocalFileSystem();
  std::string error;
  if (!fs->writeFileContents(args[0].getFile().path, contents, &error))
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   error.c_str());
  return llvm::Error::success();
}

inline llvm::Error runTestFail(const core::ActionContext&) {
  return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                 "failed on purpose");
}

/// Register the test actions ("write", "concat" and "fail").
inline void registerTestActions(core::ActionRegistry& registry) {
  registry.registerAction("write", runTestWrite);
  registry.registerAction("concat", runTestConcat);
  registry.registerAction("fail", runTestFail);
}

/// Register a rule with a registered action, which must succeed.
inline core::RuleID addTestRule(core::RuleStore& store, StringRef name,
                                std::vector<core::FileRef> outputs,
                                StringRef action,
                                core::Value::ElementList args) {
  core::RuleDescription description;
  description.name = name.str();
  description.outputs = std::move(outputs);
  auto registered = store.getActionRegistry().lookup(action);
  EXPECT_TRUE(registered.hasValue()) << "no action " << action.str();
  if (registered)
    description.action = *registered;
  description.args = core::Value::makeTuple(std::move(args));
  auto id = store.addRule(std::move(description));
  EXPECT_TRUE(bool(id)) << llvm::toString(id.takeError());
  return id ? *id : 0;
}

/// Run a make request, which must not be rejected.
inline core::MakeSummary make(core::MakeEngine& engine,
                              ArrayRef<core::RuleID> targets,
                              const core::MakeOptions& options) {
  auto summary = engine.make(targets, options);
  EXPECT_TRUE(bool(summary)) << llvm::toString(summary.takeError());
  return summary ? *summary : core::MakeSummary();
}

/// Check the counts of a summary: total, update, skip, fail and discard.
inline void expectSummary(const core::MakeSummary& summary,
                          std::vector<unsigned> counts) {
  std::vector<unsigned> actual = { summary.total, summary.update,
                                   summary.skip, summary.fail,
                                   summary.discard };
  EXPECT_EQ(actual, counts);
}

}
}

#endif
