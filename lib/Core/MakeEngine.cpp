//===-- MakeEngine.cpp ----------------------------------------------------===//
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

#include "memobuild/Core/MakeEngine.h"

#include "memobuild/Basic/FileSystem.h"
#include "memobuild/Basic/PlatformUtility.h"
#include "memobuild/Basic/Subprocess.h"
#include "memobuild/Core/Action.h"
#include "memobuild/Core/ContentHashCache.h"
#include "memobuild/Core/Graph.h"
#include "memobuild/Core/RuleStore.h"

#include "llvm/ADT/DenseMap.h"
#include "llvm/ADT/DenseSet.h"
#include "llvm/ADT/Twine.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <pthread.h>
#include <signal.h>

using namespace memobuild;
using namespace memobuild::core;
using namespace memobuild::basic;

MakeDelegate::~MakeDelegate() {}

void MakeDelegate::placementDecided(unsigned, unsigned) {}

StringRef MakeSummary::getOutcomeName(RuleOutcome outcome) {
  switch (outcome) {
  case RuleOutcome::Update:
    return "update";
  case RuleOutcome::Skip:
    return "skip";
  case RuleOutcome::Fail:
    return "fail";
  case RuleOutcome::Discard:
    return "discard";
  }
  llvm_unreachable("unexpected rule outcome");
}

namespace {

/// Exit codes of worker processes.
enum WorkerExitCode {
  WorkerSucceeded = 0,
  WorkerActionFailed = 1,
  WorkerSetupFailed = 2,
};

/// The result of a rule's pipeline.
enum class PipelineResult {
  Update,
  Skip,
  Fail,
  Fatal,

  /// The build was cancelled before the rule started.
  NotStarted,
};

/// The result of invoking a rule's action.
enum class ActionStatus {
  Succeeded,
  Failed,
  Cancelled,

  /// The action could not be started, e.g. because a worker process could not
  /// be spawned.
  Unavailable,
};

/// The body of a worker process running a registered action.
int runActionInWorker(const ActionRegistry& registry, StringRef payload,
                      int replyFD) {
  auto reply = [&](const std::string& message, int exitCode) {
    // The parent reports a truncated message as it is.
    (void)sys::writeAll(replyFD, message.data(), message.size());
    return exitCode;
  };

  std::string name;
  auto context = decodeActionPayload(payload, name);
  if (!context)
    return reply(llvm::toString(context.takeError()), WorkerSetupFailed);

  auto action = registry.lookup(name);
  if (!action)
    return reply("unknown action '" + name + "'", WorkerSetupFailed);

  if (auto error = action->invoke(*context))
    return reply(llvm::toString(std::move(error)), WorkerActionFailed);
  return WorkerSucceeded;
}

/// The body of the worker process which checks that actions can be decoded and
/// resolved outside the orchestrating process.
int runPlacementProbe(const ActionRegistry& registry,
                      ArrayRef<const std::string*> payloads, int replyFD) {
  std::string result;
  for (const auto* payload: payloads) {
    std::string name;
    auto context = decodeActionPayload(*payload, name);
    if (!context) {
      llvm::consumeError(context.takeError());
      result += '0';
      continue;
    }
    result += registry.lookup(name).hasValue() ? '1' : '0';
  }
  if (!sys::writeAll(replyFD, result.data(), result.size()))
    return WorkerSetupFailed;
  return WorkerSucceeded;
}

/// The state of one make request.
struct MakeRun {
  const MakeOptions& options;
  RuleEnvironment env;

  /// The closure of the targets, in build order.
  std::vector<RuleID> order;

  /// The targets named by the request.
  llvm::DenseSet<RuleID> directTargets;

  /// The encoded invocations of the rules which run in worker processes.
  llvm::DenseMap<RuleID, std::string> workerPayloads;

  ProcessGroup processGroup;

  /// The lock protecting the scheduler state below.
  std::mutex mutex;
  std::condition_variable condition;
  bool stop = false;
  llvm::DenseSet<RuleID> updated;
  llvm::DenseSet<RuleID> failed;
  MakeSummary summary;

  MakeRun(const MakeOptions& options, FileSystem& fs,
          ContentHashCache& hashCache)
      : options(options), env{ fs, hashCache } {}

  void cancel() {
    {
      std::lock_guard<std::mutex> lock(processGroup.mutex);
      processGroup.close();
    }
    processGroup.signalAll(SIGINT);

    {
      std::lock_guard<std::mutex> lock(mutex);
      stop = true;
    }
    condition.notify_all();
  }

  /// Record the outcome of a rule; the caller must hold \see mutex.
  void record(RuleID id, RuleOutcome outcome) {
    summary.detail[id] = outcome;
    if (outcome == RuleOutcome::Update)
      updated.insert(id);
    else if (outcome == RuleOutcome::Fail)
      failed.insert(id);
  }

  /// Check if any dependency of \arg rule is in \arg set; the caller must
  /// hold \see mutex.
  static bool anyDependencyIn(const Rule& rule,
                              const llvm::DenseSet<RuleID>& set) {
    for (RuleID dependency: rule.getDependencies()) {
      if (set.count(dependency))
        return true;
    }
    return false;
  }
};

class MakeEngineImpl {
  const RuleStore& store;
  MakeDelegate& delegate;

  std::unique_ptr<FileSystem> ownedFileSystem;
  FileSystem& fileSystem;

  std::atomic<bool> cancelled{ false };

  /// The active request, if any.
  std::mutex activeRunMutex;
  MakeRun* activeRun = nullptr;

  /// @name Rule Pipeline
  /// @{

  ActionStatus runActionInProcess(const Rule& rule, std::string& error_out) {
    auto context = rule.makeActionContext(&cancelled);
    if (auto error = rule.getAction().invoke(context)) {
      error_out = llvm::toString(std::move(error));
      return cancelled ? ActionStatus::Cancelled : ActionStatus::Failed;
    }
    return cancelled ? ActionStatus::Cancelled : ActionStatus::Succeeded;
  }

  ActionStatus runActionInWorkerProcess(MakeRun& run, StringRef payload,
                                        std::string& error_out) {
    const ActionRegistry& registry = store.getActionRegistry();
    std::string reply;
    std::string spawnError;
    auto result = runWorkerProcess(
        run.processGroup,
        [&](int replyFD) {
          return runActionInWorker(registry, payload, replyFD);
        },
        reply, &spawnError);

    switch (result.status) {
    case ProcessStatus::Succeeded:
      return cancelled ? ActionStatus::Cancelled : ActionStatus::Succeeded;
    case ProcessStatus::Cancelled:
    case ProcessStatus::Skipped:
      return ActionStatus::Cancelled;
    case ProcessStatus::Failed:
      break;
    }

    if (result.pid == -1) {
      error_out = "unable to spawn worker process: " + spawnError;
      return ActionStatus::Unavailable;
    }
    if (cancelled)
      return ActionStatus::Cancelled;
    if (!reply.empty() && result.signal == 0)
      error_out = reply;
    else
      error_out = describeProcessResult(result);
    return ActionStatus::Failed;
  }

  /// Run the pipeline of one rule: check, prepare, invoke, finish.
  PipelineResult processRule(MakeRun& run, const Rule& rule,
                             bool dependencyWasUpdated, bool isDirectTarget) {
    const MakeOptions& options = run.options;

    auto check = rule.checkUpdate(dependencyWasUpdated, options.dryRun,
                                  run.env);
    if (!check) {
      delegate.fatalError(rule, llvm::toString(check.takeError()));
      return PipelineResult::Fatal;
    }

    if (check->kind == CheckUpdateResult::Kind::Infeasible) {
      delegate.ruleUpdateInfeasible(rule, check->reason);
      return PipelineResult::Fail;
    }
    if (!check->needsUpdate()) {
      delegate.ruleSkipped(rule, isDirectTarget);
      return PipelineResult::Skip;
    }
    if (options.dryRun) {
      delegate.ruleDryRun(rule);
      return PipelineResult::Update;
    }

    if (cancelled)
      return PipelineResult::NotStarted;

    delegate.ruleStarted(rule);

    if (auto error = rule.preprocess(fileSystem)) {
      delegate.rulePreprocessFailed(rule, llvm::toString(std::move(error)));
      return PipelineResult::Fail;
    }

    std::string message;
    ActionStatus status;
    auto payload = run.workerPayloads.find(rule.getID());
    if (payload != run.workerPayloads.end()) {
      status = runActionInWorkerProcess(run, payload->second, message);
    } else {
      status = runActionInProcess(rule, message);
    }

    bool succeeded = status == ActionStatus::Succeeded;
    if (status == ActionStatus::Failed)
      delegate.ruleExecutionFailed(rule, message);

    if (auto error = rule.postprocess(succeeded, run.env)) {
      delegate.rulePostprocessFailed(rule, llvm::toString(std::move(error)));
      return PipelineResult::Fail;
    }

    switch (status) {
    case ActionStatus::Succeeded:
      delegate.ruleFinished(rule);
      return PipelineResult::Update;
    case ActionStatus::Failed:
      return PipelineResult::Fail;
    case ActionStatus::Cancelled:
      delegate.fatalError(rule, "interrupted");
      return PipelineResult::Fatal;
    case ActionStatus::Unavailable:
      delegate.fatalError(rule, message);
      return PipelineResult::Fatal;
    }
    llvm_unreachable("unexpected action status");
  }

  /// @}

  /// @name Placement
  /// @{

  /// Decide which rules of the closure run in worker processes.
  ///
  /// A rule runs in a worker process if its action is registered and its
  /// invocation can be encoded here, and decoded and resolved in a worker.
  void decidePlacement(MakeRun& run) {
    std::vector<RuleID> candidates;
    std::vector<std::string> payloads;
    for (RuleID id: run.order) {
      const Rule& rule = store.getRule(id);
      if (!rule.getAction().isRegistered())
        continue;
      auto payload = encodeActionPayload(rule.getAction().getName(),
                                         rule.makeActionContext());
      if (!payload) {
        llvm::consumeError(payload.takeError());
        continue;
      }
      candidates.push_back(id);
      payloads.push_back(std::move(*payload));
    }

    if (!candidates.empty()) {
      std::vector<const std::string*> probed;
      for (const auto& payload: payloads)
        probed.push_back(&payload);

      const ActionRegistry& registry = store.getActionRegistry();
      std::string reply;
      std::string spawnError;
      auto result = runWorkerProcess(
          run.processGroup,
          [&](int replyFD) {
            return runPlacementProbe(registry, probed, replyFD);
          },
          reply, &spawnError);

      // If the probe itself fails, every rule runs in this process.
      if (result.status == ProcessStatus::Succeeded &&
          reply.size() == candidates.size()) {
        for (unsigned i = 0, e = candidates.size(); i != e; ++i) {
          if (reply[i] == '1')
            run.workerPayloads[candidates[i]] = std::move(payloads[i]);
        }
      }
    }

    delegate.placementDecided(run.order.size() - run.workerPayloads.size(),
                              run.order.size());
  }

  /// @}

  /// @name Schedulers
  /// @{

  void makeSerial(MakeRun& run) {
    for (RuleID id: run.order) {
      if (cancelled)
        break;

      const Rule& rule = store.getRule(id);

      // Rules depending on a failed rule are discarded.
      if (MakeRun::anyDependencyIn(rule, run.failed)) {
        run.failed.insert(id);
        continue;
      }

      bool dependencyWasUpdated = MakeRun::anyDependencyIn(rule, run.updated);
      auto result = processRule(run, rule, dependencyWasUpdated,
                                run.directTargets.count(id));

      std::lock_guard<std::mutex> lock(run.mutex);
      if (!handleResult(run, id, result))
        break;
    }
  }

  /// Record the result of a rule; the caller must hold the run's lock.
  ///
  /// \returns False if the build must stop.
  bool handleResult(MakeRun& run, RuleID id, PipelineResult result) {
    switch (result) {
    case PipelineResult::Update:
      run.record(id, RuleOutcome::Update);
      return true;
    case PipelineResult::Skip:
      run.record(id, RuleOutcome::Skip);
      return true;
    case PipelineResult::Fail:
      run.record(id, RuleOutcome::Fail);
      if (run.options.keepGoing)
        return true;
      if (!run.stop) {
        run.stop = true;
        delegate.stoppedOnFailure();
      }
      return false;
    case PipelineResult::Fatal:
      run.record(id, RuleOutcome::Fail);
      run.summary.hadFatalError = true;
      run.stop = true;
      return false;
    case PipelineResult::NotStarted:
      return false;
    }
    llvm_unreachable("unexpected pipeline result");
  }

  /// The state shared by the lanes of a parallel build.
  struct ParallelState {
    /// The rules which are ready to run, in the order they became ready.
    std::deque<RuleID> ready;

    /// The number of dependencies of each rule which have not completed.
    llvm::DenseMap<RuleID, unsigned> pendingDependencies;

    /// The rules depending on each rule, within the closure.
    llvm::DenseMap<RuleID, std::vector<RuleID>> dependents;

    unsigned numLanes = 0;
    unsigned numIdle = 0;
  };

  void executeLane(MakeRun& run, ParallelState& state, unsigned laneNumber) {
#if defined(__linux__)
    pthread_setname_np(
        pthread_self(),
        ("mbuild Lane-" + llvm::Twine(laneNumber)).str().c_str());
#endif

    while (true) {
      // Take a rule from the ready queue.
      RuleID id;
      bool dependencyWasUpdated;
      {
        std::unique_lock<std::mutex> lock(run.mutex);
        ++state.numIdle;

        // Wait until there is work, or until no lane can produce more work.
        while (!run.stop && state.ready.empty() &&
               state.numIdle != state.numLanes) {
          run.condition.wait(lock);
        }
        if (run.stop || state.ready.empty()) {
          run.condition.notify_all();
          return;
        }

        --state.numIdle;
        id = state.ready.front();
        state.ready.pop_front();
        dependencyWasUpdated = MakeRun::anyDependencyIn(store.getRule(id),
                                                        run.updated);
      }

      auto result = processRule(run, store.getRule(id), dependencyWasUpdated,
                                run.directTargets.count(id));

      {
        std::lock_guard<std::mutex> lock(run.mutex);
        handleResult(run, id, result);

        // Release the dependents of a rule which is up-to-date.
        if (result == PipelineResult::Update ||
            result == PipelineResult::Skip) {
          for (RuleID dependent: state.dependents[id]) {
            if (--state.pendingDependencies[dependent] == 0)
              state.ready.push_back(dependent);
          }
        }
      }
      run.condition.notify_all();
    }
  }

  void makeParallel(MakeRun& run) {
    ParallelState state;

    llvm::DenseSet<RuleID> closure(run.order.begin(), run.order.end());
    for (RuleID id: run.order) {
      const Rule& rule = store.getRule(id);
      unsigned count = 0;
      for (RuleID dependency: rule.getDependencies()) {
        if (!closure.count(dependency))
          continue;
        state.dependents[dependency].push_back(id);
        ++count;
      }
      state.pendingDependencies[id] = count;
      if (count == 0)
        state.ready.push_back(id);
    }

    if (!run.options.dryRun && run.options.useWorkerProcesses)
      decidePlacement(run);

    state.numLanes = std::max(
        1u, std::min<unsigned>(run.options.jobs, run.order.size()));

    std::vector<std::unique_ptr<std::thread>> lanes;
    for (unsigned i = 0; i != state.numLanes; ++i) {
      lanes.push_back(std::unique_ptr<std::thread>(
                          new std::thread(
                              &MakeEngineImpl::executeLane, this,
                              std::ref(run), std::ref(state), i)));
    }
    for (auto& lane: lanes)
      lane->join();
  }

  /// @}

public:
  MakeEngineImpl(const RuleStore& store, MakeDelegate& delegate,
                 FileSystem* fs)
      : store(store), delegate(delegate),
        ownedFileSystem(fs ? nullptr : createLocalFileSystem()),
        fileSystem(fs ? *fs : *ownedFileSystem) {}

  MakeDelegate& getDelegate() { return delegate; }

  llvm::Expected<MakeSummary> make(ArrayRef<RuleID> targets,
                                   const MakeOptions& options) {
    auto order = topologicalSort(store, targets);
    if (!order)
      return order.takeError();

    ContentHashCache privateHashCache;
    ContentHashCache& hashCache =
      options.hashCache ? *options.hashCache : privateHashCache;

    MakeRun run(options, fileSystem, hashCache);
    run.order = std::move(*order);
    run.directTargets.insert(targets.begin(), targets.end());

    {
      std::lock_guard<std::mutex> lock(activeRunMutex);
      activeRun = &run;
    }
    if (cancelled)
      run.cancel();

    if (options.jobs <= 1 || run.order.size() <= 1)
      makeSerial(run);
    else
      makeParallel(run);

    {
      std::lock_guard<std::mutex> lock(activeRunMutex);
      activeRun = nullptr;
    }

    MakeSummary& summary = run.summary;
    for (RuleID id: run.order) {
      // Rules which were never reached are discarded.
      auto outcome = summary.detail.emplace(id, RuleOutcome::Discard);
      switch (outcome.first->second) {
      case RuleOutcome::Update: ++summary.update; break;
      case RuleOutcome::Skip: ++summary.skip; break;
      case RuleOutcome::Fail: ++summary.fail; break;
      case RuleOutcome::Discard: ++summary.discard; break;
      }
    }
    summary.total = run.order.size();
    summary.wasCancelled = cancelled;
    return std::move(summary);
  }

  void cancel() {
    cancelled = true;

    std::lock_guard<std::mutex> lock(activeRunMutex);
    if (activeRun)
      activeRun->cancel();
  }

  bool isCancelled() const { return cancelled; }
};

}

#pragma mark - MakeEngine

MakeEngine::MakeEngine(const RuleStore& store, MakeDelegate& delegate,
                       FileSystem* fileSystem)
    : impl(new MakeEngineImpl(store, delegate, fileSystem)) {}

MakeEngine::~MakeEngine() {
  delete static_cast<MakeEngineImpl*>(impl);
}

MakeDelegate& MakeEngine::getDelegate() {
  return static_cast<MakeEngineImpl*>(impl)->getDelegate();
}

llvm::Expected<MakeSummary> MakeEngine::make(ArrayRef<RuleID> targets,
                                             const MakeOptions& options) {
  return static_cast<MakeEngineImpl*>(impl)->make(targets, options);
}

void MakeEngine::cancel() {
  static_cast<MakeEngineImpl*>(impl)->cancel();
}

bool MakeEngine::isCancelled() const {
  return static_cast<MakeEngineImpl*>(impl)->isCancelled();
}
