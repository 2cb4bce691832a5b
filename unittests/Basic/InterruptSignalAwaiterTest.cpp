//===- unittests/Basic/InterruptSignalAwaiterTest.cpp ---------------------===//
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

#include "memobuild/Basic/InterruptSignalAwaiter.h"

#include "gtest/gtest.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>

using namespace memobuild;
using namespace memobuild::basic;

namespace {

/// Wait a bit for the awaiter thread to process a raised signal.
void waitForHandler(const std::atomic<bool>& called) {
  for (int i = 0; i != 100 && !called; ++i)
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
}

/// Check that we call the interrupt handler when raising a SIGINT signal.
TEST(InterruptSignalAwaiterTest, setInterruptHandler) {
  InterruptSignalAwaiter awaiter;
  std::atomic<bool> calledInterruptHandler{false};
  awaiter.setInterruptHandler([&] { calledInterruptHandler = true; });

  std::raise(SIGINT);
  waitForHandler(calledInterruptHandler);
  EXPECT_TRUE(calledInterruptHandler);
}

/// Check that we don't call the interrupt handler when reset.
TEST(InterruptSignalAwaiterTest, resetInterruptHandler) {
  InterruptSignalAwaiter awaiter;
  std::atomic<bool> calledInterruptHandler{false};
  awaiter.setInterruptHandler([&] { calledInterruptHandler = true; });
  awaiter.resetInterruptHandler();

  std::raise(SIGINT);
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  EXPECT_FALSE(calledInterruptHandler);
}

}
