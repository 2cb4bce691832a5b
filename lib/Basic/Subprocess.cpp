//===-- Subprocess.cpp ----------------------------------------------------===//
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

#include "memobuild/Basic/Subprocess.h"

#include "memobuild/Basic/InterruptSignalAwaiter.h"
#include "memobuild/Basic/PlatformUtility.h"

#include <cerrno>
#include <csignal>
#include <cstring>

#include <sys/wait.h>
#include <unistd.h>

using namespace memobuild;
using namespace memobuild::basic;

ProcessGroup::~ProcessGroup() {
  // Wait for all processes in the process group to terminate
  std::unique_lock<std::mutex> lock(mutex);
  while (!processes.empty()) {
    processesCondition.wait(lock);
  }
}

void ProcessGroup::signalAll(int signal) {
  std::lock_guard<std::mutex> lock(mutex);

  for (pid_t pid: processes) {
    // We are killing the whole process group here, this depends on us
    // spawning each process in its own group earlier.
    ::kill(-pid, signal);
  }
}

ProcessResult basic::runWorkerProcess(ProcessGroup& pgrp, WorkerBodyFn body,
                                      std::string& reply_out,
                                      std::string* error_out) {
  int replyPipe[2];
  pid_t pid;
  {
    // The pipe is created, and its write end closed again in this process,
    // under the group lock. Otherwise a concurrently forked worker could
    // inherit the write end and delay the end of file on the reply.
    std::lock_guard<std::mutex> lock(pgrp.mutex);
    if (pgrp.isClosed()) {
      return ProcessResult(ProcessStatus::Skipped);
    }

    if (sys::pipe(replyPipe) < 0) {
      *error_out = "unable to create pipe: " + sys::strerror(errno);
      return ProcessResult::makeFailed();
    }

    pid = ::fork();
    if (pid == 0) {
      // In the worker.
      sys::close(replyPipe[0]);
      ::setpgid(0, 0);
      InterruptSignalAwaiter::resetProgramSignalHandler();
      int exitCode = body(replyPipe[1]);
      ::_exit(exitCode);
    }

    if (pid < 0) {
      int forkErrno = errno;
      sys::close(replyPipe[0]);
      sys::close(replyPipe[1]);
      *error_out = "unable to fork worker process: " + sys::strerror(forkErrno);
      return ProcessResult::makeFailed();
    }

    // Also set the group from the parent, so a signal sent before the worker
    // gets to run still reaches it through the group.
    ::setpgid(pid, pid);
    sys::close(replyPipe[1]);
    pgrp.add(std::move(lock), pid);
  }

  if (!sys::readAll(replyPipe[0], reply_out)) {
    reply_out.clear();
  }
  sys::close(replyPipe[0]);

  // Wait for the worker to complete.
  int status = 0;
  pid_t result = ::waitpid(pid, &status, 0);
  while (result == -1 && errno == EINTR)
    result = ::waitpid(pid, &status, 0);

  // Update the set of spawned processes.
  pgrp.remove(pid);

  if (result == -1) {
    *error_out = "unable to wait for worker process: " + sys::strerror(errno);
    return ProcessResult(ProcessStatus::Failed, -1, 0, pid);
  }

  if (WIFSIGNALED(status)) {
    int signal = WTERMSIG(status);
    bool cancelled = signal == SIGINT || signal == SIGKILL;
    return ProcessResult(cancelled ? ProcessStatus::Cancelled :
                         ProcessStatus::Failed, -1, signal, pid);
  }

  int exitCode = WEXITSTATUS(status);
  return ProcessResult(exitCode == 0 ? ProcessStatus::Succeeded :
                       ProcessStatus::Failed, exitCode, 0, pid);
}

std::string basic::describeProcessResult(const ProcessResult& result) {
  if (result.signal != 0) {
    return "worker process terminated by signal " +
      std::to_string(result.signal) + " (" + ::strsignal(result.signal) + ")";
  }
  return "worker process exited with status " +
    std::to_string(result.exitCode);
}
