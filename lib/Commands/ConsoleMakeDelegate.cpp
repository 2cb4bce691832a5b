//===-- ConsoleMakeDelegate.cpp -------------------------------------------===//
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

#include "ConsoleMakeDelegate.h"

#include "memobuild/Commands/Commands.h"
#include "memobuild/Core/Rule.h"

#include "llvm/ADT/Twine.h"
#include "llvm/Support/Process.h"
#include "llvm/Support/WithColor.h"

#include <algorithm>
#include <cstdlib>

using namespace memobuild;
using namespace memobuild::commands;
using namespace memobuild::core;

ConsoleMakeDelegate::ConsoleMakeDelegate(llvm::raw_ostream& os,
                                         unsigned numRules, bool verbose)
    : os(os), verbose(verbose), numRules(numRules),
      canUpdateCurrentLine(false) {
  // We assume the terminal honors '\r' if it is either not-"dumb", or it is
  // "dumb" and we are inside Emacs (comint-mode reports as "dumb").
  if (os.is_displayed()) {
    const char* term = ::getenv("TERM");
    canUpdateCurrentLine = (term && StringRef(term) != "dumb") ||
      ::getenv("INSIDE_EMACS") != nullptr;
  }
}

ConsoleMakeDelegate::~ConsoleMakeDelegate() {
  finish();
}

void ConsoleMakeDelegate::finish() {
  std::lock_guard<std::mutex> guard(outputMutex);
  finishLine();
}

void ConsoleMakeDelegate::setCurrentLine(const std::string& text) {
  if (!canUpdateCurrentLine) {
    writeLine(text);
    return;
  }

  // Clear the line before writing, this tends to produce better results than
  // clearing the unwritten tail of the line written below.
  if (currentLineLength) {
    os << '\r' << std::string(currentLineLength, ' ') << '\r';
  }

  // Elide the middle of text which does not fit in the terminal.
  std::string line = text;
  int columns = llvm::sys::Process::StandardOutColumns();
  if (columns > 3 && (int)line.size() > columns) {
    int midpoint = columns / 2;
    line = line.substr(0, std::max(0, midpoint - 2)) + "..." +
      line.substr(line.size() - (columns - (midpoint + 1)));
  }

  os << line;
  os.flush();
  currentLineLength = line.size();
}

void ConsoleMakeDelegate::finishLine() {
  if (currentLineLength) {
    os << '\n';
    os.flush();
    currentLineLength = 0;
  }
}

void ConsoleMakeDelegate::writeLine(const std::string& text) {
  finishLine();
  os << text << '\n';
  os.flush();
}

void ConsoleMakeDelegate::reportError(const Rule& rule, const Twine& message,
                                      StringRef detail) {
  finishLine();
  llvm::WithColor::error(os, getProgramName())
    << "unable to make '" << rule.getName() << "': " << message << "\n";
  if (!detail.empty()) {
    llvm::WithColor::note(os, getProgramName()) << detail << "\n";
  }
  os.flush();
}

#pragma mark - MakeDelegate implementation

void ConsoleMakeDelegate::ruleSkipped(const Rule& rule, bool isDirectTarget) {
  if (!verbose && !isDirectTarget)
    return;

  std::lock_guard<std::mutex> guard(outputMutex);
  writeLine("'" + rule.getName() + "' is up-to-date");
}

void ConsoleMakeDelegate::ruleStarted(const Rule& rule) {
  std::lock_guard<std::mutex> guard(outputMutex);
  ++numStarted;
  std::string status = "[" + std::to_string(numStarted) + "/" +
    std::to_string(numRules) + "] building " + rule.getName();
  if (!verbose) {
    setCurrentLine(status);
    return;
  }

  // Show the invocation.
  std::string invocation;
  llvm::raw_string_ostream invocationOS(invocation);
  invocationOS << "  " << rule.getAction().getName();
  rule.getArgs().dump(invocationOS);
  if (!rule.getKeywordArgs().getEntries().empty()) {
    invocationOS << " ";
    rule.getKeywordArgs().dump(invocationOS);
  }
  writeLine(status);
  writeLine(invocationOS.str());
}

void ConsoleMakeDelegate::ruleFinished(const Rule& rule) {
  if (!verbose)
    return;

  std::lock_guard<std::mutex> guard(outputMutex);
  writeLine("finished '" + rule.getName() + "'");
}

void ConsoleMakeDelegate::ruleDryRun(const Rule& rule) {
  std::lock_guard<std::mutex> guard(outputMutex);
  writeLine("would build '" + rule.getName() + "'");
}

void ConsoleMakeDelegate::ruleUpdateInfeasible(const Rule& rule,
                                               StringRef reason) {
  std::lock_guard<std::mutex> guard(outputMutex);
  ++numFailed;
  reportError(rule, reason, "");
}

void ConsoleMakeDelegate::rulePreprocessFailed(const Rule& rule,
                                               StringRef error) {
  std::lock_guard<std::mutex> guard(outputMutex);
  ++numFailed;
  reportError(rule, "unable to prepare the output directories", error);
}

void ConsoleMakeDelegate::ruleExecutionFailed(const Rule& rule,
                                              StringRef error) {
  std::lock_guard<std::mutex> guard(outputMutex);
  ++numFailed;
  reportError(rule, "action '" + rule.getAction().getName() + "' failed",
              error);
}

void ConsoleMakeDelegate::rulePostprocessFailed(const Rule& rule,
                                                StringRef error) {
  std::lock_guard<std::mutex> guard(outputMutex);
  ++numFailed;
  reportError(rule, "unable to record the outputs (remove any stale outputs "
              "by hand)", error);
}

void ConsoleMakeDelegate::fatalError(const Rule& rule, StringRef error) {
  std::lock_guard<std::mutex> guard(outputMutex);
  ++numFailed;
  reportError(rule, "fatal error", error);
}

void ConsoleMakeDelegate::stoppedOnFailure() {
  std::lock_guard<std::mutex> guard(outputMutex);
  finishLine();
  llvm::WithColor::warning(os, getProgramName())
    << "stopping the build after a failure (use -k to keep going)\n";
  os.flush();
}

void ConsoleMakeDelegate::placementDecided(unsigned numInProcess,
                                           unsigned numRules) {
  if (!verbose || numInProcess == 0)
    return;

  std::lock_guard<std::mutex> guard(outputMutex);
  finishLine();
  llvm::WithColor::note(os, getProgramName())
    << numInProcess << " of " << numRules
    << " rules cannot run in a worker process and run in-process\n";
  os.flush();
}
