//===-- InterruptSignalAwaiter.cpp ----------------------------------------===//
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

#include "memobuild/Basic/InterruptSignalAwaiter.h"

#include "memobuild/Basic/PlatformUtility.h"

#include "llvm/Support/WithColor.h"
#include "llvm/Support/raw_ostream.h"

#include <cerrno>
#include <csignal>

using namespace memobuild;
using namespace memobuild::basic;

int InterruptSignalAwaiter::signalWatchingPipe[2]{-1, -1};
std::atomic<bool> InterruptSignalAwaiter::wasInterrupted{false};

void InterruptSignalAwaiter::sigintHandler(int) {
  // Set the atomic interrupt flag.
  wasInterrupted = true;

  // Write to wake up the signal monitoring thread.
  char byte{};
  sys::write(signalWatchingPipe[1], &byte, 1);
}

InterruptSignalAwaiter::InterruptSignalAwaiter()
    : interruptHandler([] {}) {
  if (sys::pipe(signalWatchingPipe) < 0) {
    llvm::WithColor::warning(llvm::errs())
      << "unable to create interrupt pipe: " << sys::strerror(errno) << "\n";
  }

  previousSignalHandler = std::signal(SIGINT, &sigintHandler);

  handlerThread = std::thread(&InterruptSignalAwaiter::waitForSignal, this);
}

void InterruptSignalAwaiter::waitForSignal() {
  // Wait for signal arrival indications.
  while (true) {
    char byte;
    int res = sys::read(signalWatchingPipe[0], &byte, 1);
    if (res < 0 && errno == EINTR)
      continue;

    // If nothing was read, the pipe has been closed and we should shut down.
    if (res <= 0) break;

    // Otherwise, check if we were awoke because of an interrupt.
    // Save and clear the interrupt flag, atomically.
    bool wasInterrupted =
        InterruptSignalAwaiter::wasInterrupted.exchange(false);

    // Process the interrupt flag, if present.
    if (wasInterrupted) {
      std::function<void()> handler;
      {
        std::lock_guard<std::mutex> lock(handlerMutex);
        handler = interruptHandler;
      }
      handler();
    }
  }
}

void InterruptSignalAwaiter::resetProgramSignalHandler() {
  std::signal(SIGINT, SIG_DFL);
}

InterruptSignalAwaiter::~InterruptSignalAwaiter() {
  // Deregister the signal handler.
  std::signal(SIGINT, previousSignalHandler);

  // Close the signal watching pipe.
  sys::close(signalWatchingPipe[1]);
  signalWatchingPipe[1] = -1;

  // Wait for the handler thread to finish execution
  handlerThread.join();

  sys::close(signalWatchingPipe[0]);
  signalWatchingPipe[0] = -1;
}
