//===- Subprocess.h ---------------------------------------------*- C++ -*-===//
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
//
// This file contains the support for running work in short-lived worker
// processes, isolated from the orchestrating process.
//
//===----------------------------------------------------------------------===//

#ifndef MEMOBUILD_BASIC_SUBPROCESS_H
#define MEMOBUILD_BASIC_SUBPROCESS_H

#include "memobuild/Basic/Compiler.h"
#include "memobuild/Basic/LLVM.h"

#include "llvm/ADT/STLExtras.h"

#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_set>

#include <sys/types.h>

namespace memobuild {
namespace basic {

/// The set of worker processes spawned by a single client.
///
/// Every worker is started in its own process group, so signalling the group
/// also reaches any processes the worker itself spawned.
class ProcessGroup {
  ProcessGroup(const ProcessGroup&) MEMOBUILD_DELETED_FUNCTION;
  void operator=(const ProcessGroup&) MEMOBUILD_DELETED_FUNCTION;
  ProcessGroup& operator=(ProcessGroup&&) MEMOBUILD_DELETED_FUNCTION;

  std::unordered_set<pid_t> processes;
  std::condition_variable processesCondition;
  bool closed = false;

public:
  ProcessGroup() {}
  ~ProcessGroup();

  std::mutex mutex;

  /// Prevent new processes from being spawned into the group.
  ///
  /// The caller must hold \see mutex.
  void close() { closed = true; }
  bool isClosed() const { return closed; }

  void add(std::lock_guard<std::mutex>&&, pid_t pid) {
    processes.insert(pid);
  }

  void remove(pid_t pid) {
    {
      std::lock_guard<std::mutex> lock(mutex);
      processes.erase(pid);
    }
    processesCondition.notify_all();
  }

  /// Send \arg signal to every live process group.
  void signalAll(int signal);
};

// MARK: Process Execution

/// Status of a process execution.
enum class ProcessStatus {
  Succeeded = 0,
  Failed,
  Cancelled,
  Skipped,
};

/// Result of a process execution.
struct ProcessResult {
  /// The final status of the process.
  ProcessStatus status;

  /// The process exit code, if it exited normally.
  int exitCode;

  /// The terminating signal, if the process was killed by one.
  int signal;

  /// Process identifier (can be -1 for failure reasons)
  pid_t pid;

  ProcessResult(ProcessStatus status, int exitCode = -1, int signal = 0,
                pid_t pid = (pid_t)-1)
      : status(status), exitCode(exitCode), signal(signal), pid(pid) {}

  static ProcessResult makeFailed(int exitCode = -1) {
    return ProcessResult(ProcessStatus::Failed, exitCode);
  }

  static ProcessResult makeCancelled(int exitCode = -1) {
    return ProcessResult(ProcessStatus::Cancelled, exitCode);
  }
};

/// The body of a worker process.
///
/// The body receives a descriptor on which it may write a reply for the parent,
/// and returns the worker's exit code.
typedef llvm::function_ref<int(int replyFD)> WorkerBodyFn;

/// Run \arg body in a new worker process forked from the current one.
///
/// The call blocks until the worker exits. The worker is started in its own
/// process group, registered with \arg pgrp for the duration of its lifetime,
/// and runs with the default SIGINT disposition. It never returns into the
/// caller's stack; it terminates with \see _exit once the body returns, so no
/// atexit handlers or static destructors run in the worker.
///
/// \param reply_out [out] Everything the worker wrote to its reply descriptor.
/// \param error_out [out] On failure to spawn the worker, a description of the
/// problem.
/// \returns The result of the worker, or a Skipped result if the group was
/// closed, or a Failed result with pid -1 if the worker could not be spawned.
ProcessResult runWorkerProcess(ProcessGroup& pgrp, WorkerBodyFn body,
                               std::string& reply_out, std::string* error_out);

/// Describe how a worker process terminated, for use in diagnostics.
std::string describeProcessResult(const ProcessResult& result);

}
}

#endif
