//===- ConsoleMakeDelegate.h ------------------------------------*- C++ -*-===//
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

#ifndef MEMOBUILD_COMMANDS_CONSOLEMAKEDELEGATE_H
#define MEMOBUILD_COMMANDS_CONSOLEMAKEDELEGATE_H

#include "memobuild/Core/MakeEngine.h"

#include "llvm/Support/raw_ostream.h"

#include <mutex>
#include <string>

namespace memobuild {
namespace commands {

/// Make delegate which reports progress on a terminal.
///
/// When the stream is a terminal, the "[n/N] building" status is rewritten in
/// place; otherwise every status is written on a line of its own.
class ConsoleMakeDelegate : public core::MakeDelegate {
  llvm::raw_ostream& os;
  bool verbose;
  unsigned numRules;
  bool canUpdateCurrentLine;

  std::mutex outputMutex;

  unsigned numStarted = 0;
  unsigned numFailed = 0;

  /// The number of characters of the current (rewritable) line.
  size_t currentLineLength = 0;

  void setCurrentLine(const std::string& text);
  void finishLine();
  void writeLine(const std::string& text);
  void reportError(const core::Rule& rule, const Twine& message,
                   StringRef detail);

public:
  ConsoleMakeDelegate(llvm::raw_ostream& os, unsigned numRules, bool verbose);
  ~ConsoleMakeDelegate();

  unsigned getNumFailed() const { return numFailed; }

  /// Finish any status line before other output is written.
  void finish();

  virtual void ruleSkipped(const core::Rule& rule,
                           bool isDirectTarget) override;
  virtual void ruleStarted(const core::Rule& rule) override;
  virtual void ruleFinished(const core::Rule& rule) override;
  virtual void ruleDryRun(const core::Rule& rule) override;
  virtual void ruleUpdateInfeasible(const core::Rule& rule,
                                    StringRef reason) override;
  virtual void rulePreprocessFailed(const core::Rule& rule,
                                    StringRef error) override;
  virtual void ruleExecutionFailed(const core::Rule& rule,
                                   StringRef error) override;
  virtual void rulePostprocessFailed(const core::Rule& rule,
                                     StringRef error) override;
  virtual void fatalError(const core::Rule& rule, StringRef error) override;
  virtual void stoppedOnFailure() override;
  virtual void placementDecided(unsigned numInProcess,
                                unsigned numRules) override;
};

}
}

#endif
