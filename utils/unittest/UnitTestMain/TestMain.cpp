//===--- utils/unittest/UnitTestMain/TestMain.cpp -------------------------===//
//
// Copyright (c) 2014 Apple Inc. All rights reserved.
//
//===----------------------------------------------------------------------===//

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Signals.h"

#include "gtest/gtest.h"

#include <csignal>

int main(int argc, char **argv) {
  llvm::sys::PrintStackTraceOnErrorSignal(argv[0]);
  testing::InitGoogleTest(&argc, argv);

  // Tests write to pipes of worker processes which may have exited.
  ::signal(SIGPIPE, SIG_IGN);

  return RUN_ALL_TESTS();
}
