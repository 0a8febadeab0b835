#pragma once

#include "core/concurrency_limiter.h"
#include "core/dependency_resolver.h"
#include "core/execution_queue.h"
#include "core/executor.h"
#include "core/scheduler.h"
#include "core/status_store.h"
#include "core/task_registry.h"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace tw::core {

class ILogger;

/// Fixed set of worker threads pulling execution ids from the queue.
///
/// Per id: lookup -> cancellation check -> dependency/backoff check
/// (requeue and wait on unmet) -> limiter admission -> executor call under
/// timeout -> retry decision -> release. The pool never owns records; all
/// state lives in the StatusStore.
class WorkerPool {
public:
  using ExecutorLookup =
      std::function<std::shared_ptr<IExecutor>(const std::string &)>;
  /// Receives a snapshot after every visible transition.
  using TransitionSink = std::function<void(const TaskExecution &)>;

  WorkerPool(const SchedulerConfig &config, ExecutionQueue &queue,
             StatusStore &store, ConcurrencyLimiter &limiter,
             const DependencyResolver &resolver,
             std::shared_ptr<ITaskRegistry> registry,
             ExecutorLookup executor_lookup, TransitionSink sink,
             std::shared_ptr<ILogger> logger);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  void start();

  /// Close the queue and limiter, abandon in-flight attempts and join the
  /// workers. Idempotent.
  void stop();

  /// Wait for abandoned executor calls to return. False if some are still
  /// running when `grace` expires.
  bool wait_for_abandoned(std::chrono::milliseconds grace);

  [[nodiscard]] size_t live_attempts() const;

private:
  struct AttemptOutcome;
  struct AttemptTracker;

  void worker_loop();
  void process(const std::string &execution_id);
  AttemptOutcome run_attempt(const TaskExecution &record);
  void publish(const TaskExecution &snapshot);
  void note_dependency_wait(const TaskExecution &record,
                            const Dependency &unmet);
  void log_outcome(const TaskExecution &snapshot);
  void log_evictions();

  void log_info(const std::string &trace_id, const std::string &event,
                const std::string &msg) const;
  void log_warn(const std::string &trace_id, const std::string &event,
                const std::string &msg) const;

  const SchedulerConfig config_;
  ExecutionQueue &queue_;
  StatusStore &store_;
  ConcurrencyLimiter &limiter_;
  const DependencyResolver &resolver_;
  std::shared_ptr<ITaskRegistry> registry_;
  ExecutorLookup executor_lookup_;
  TransitionSink sink_;
  std::shared_ptr<ILogger> logger_;

  std::shared_ptr<AttemptTracker> tracker_;

  std::mutex waits_mutex_;
  std::unordered_set<std::string> logged_waits_;

  std::mutex lifecycle_mutex_;
  bool started_ = false;
  bool stopped_ = false;
  std::vector<std::thread> workers_;
};

} // namespace tw::core
