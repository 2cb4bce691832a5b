//===- InterruptSignalAwaiter.h ---------------------------------*- C++ -*-===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2014 - 2017 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#ifndef MEMOBUILD_BASIC_INTERRUPTSIGNALAWAITER_H
#define MEMOBUILD_BASIC_INTERRUPTSIGNALAWAITER_H

#include "memobuild/Basic/Compiler.h"

#include <atomic>
#include <functional>
#include <mutex>
#include <thread>

namespace memobuild {
namespace basic {

/// Calls a user provided function when a SIGINT signal is received by the
/// program.
///
/// The handler runs on a dedicated thread, not in signal context, so it may
/// take locks and call into the make engine. Only one awaiter may be alive at
/// a time, since the signal disposition is process wide.
class InterruptSignalAwaiter {
  InterruptSignalAwaiter(const InterruptSignalAwaiter&)
    MEMOBUILD_DELETED_FUNCTION;
  void operator=(const InterruptSignalAwaiter&) MEMOBUILD_DELETED_FUNCTION;

  void(*previousSignalHandler)(int);
  static int signalWatchingPipe[2];
  static std::atomic<bool> wasInterrupted;
  std::thread handlerThread;
  std::mutex handlerMutex;
  std::function<void()> interruptHandler;

  /// Called when a SIGINT is received then sends a message to the
  /// signalWatchingPipe so this class can handle the received signal.
  static void sigintHandler(int);

  /// Blocking function that waits for indications that signals have arrived
  /// and process them.
  void waitForSignal();

public:
  /// Register the signal handler, create the pipe and start the thread on which
  /// to listen for signals.
  InterruptSignalAwaiter();

  /// Stops listening for and handling SIGINT signals.
  ~InterruptSignalAwaiter();

  /// Sets a function to be called whenever the program receives a SIGINT
  /// signal.
  void setInterruptHandler(std::function<void()> interruptHandler) {
    std::lock_guard<std::mutex> lock(handlerMutex);
    this->interruptHandler = interruptHandler;
  }

  /// Clears the handler for an interrupt signal.
  void resetInterruptHandler() { setInterruptHandler([] {}); }

  /// Sets the SIGINT handler to the default (SIG_DFL).
  ///
  /// Worker processes call this after fork, so an interrupt delivered to their
  /// process group terminates them.
  static void resetProgramSignalHandler();
};

}
}

#endif  // MEMOBUILD_BASIC_INTERRUPTSIGNALAWAITER_H
