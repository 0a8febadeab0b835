#pragma once

#include "core/dependency_resolver.h"
#include "core/executor.h"
#include "core/result.h"
#include "core/scheduler_error.h"
#include "core/task_execution.h"
#include "core/task_registry.h"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tw::core {

class ILogger;

/// Exponential delay between a failed attempt and its retry.
struct RetryBackoff {
  std::chrono::milliseconds initial{1000};
  double multiplier = 2.0;
  std::chrono::milliseconds max{30000};

  /// Delay before retry number `retry` (1-based). Zero initial disables.
  [[nodiscard]] std::chrono::milliseconds delay_for(int retry) const;
};

/// Scheduler runtime configuration.
struct SchedulerConfig {
  int worker_count = 0;          // 0 = auto: clamp(hw_threads - 1, 2, 8)
  int max_concurrent_tasks = 10; // Limiter capacity M; 0 = worker_count
  int default_max_retries = 3;   // Used when a request leaves it unset
  bool retry_failed_tasks = true;
  std::chrono::milliseconds default_timeout{300000};
  std::chrono::milliseconds dependency_poll_interval{100};
  RetryBackoff retry_backoff{};
  size_t completed_retention = 0; // 0 = keep every finished record
  std::chrono::milliseconds shutdown_grace{2000};
};

/// Input of schedule(). task_id and executor_id are required.
struct ScheduleRequest {
  std::string task_id;
  std::string executor_id;
  ExecutionMode execution_mode = ExecutionMode::Sync;
  std::vector<Dependency> dependencies;
  int priority = 0;
  std::chrono::milliseconds timeout{0}; // 0 = config default
  std::optional<int> max_retries;       // unset = config default
};

struct BatchRejection {
  size_t index = 0; // Position in the submitted batch
  SchedulerError error;
};

struct BatchScheduleResult {
  std::vector<std::string> execution_ids; // Accepted entries, input order
  std::vector<BatchRejection> rejected;
};

struct SchedulerStats {
  size_t pending = 0;
  size_t running = 0;
  size_t completed = 0; // Finished records retained (all terminal states)
  size_t succeeded = 0;
  size_t failed = 0;
  size_t cancelled = 0;
  size_t queued = 0; // Ids currently in the execution queue
  int limiter_capacity = 0;
  int limiter_available = 0;
};

/// Dependency-aware concurrent task scheduler.
///
/// schedule() never blocks: records wait in the queue until their
/// dependencies hold, then a worker takes a limiter unit and runs the
/// executor under the record's timeout. Failures are retried up to
/// max_retries. Cancellation is cooperative: a record inside an executor
/// call finishes that call before it becomes cancelled.
///
/// Callers observe outcomes only through get_status() and state callbacks;
/// nothing is thrown for valid input.
class IScheduler {
public:
  virtual ~IScheduler() = default;

  /// Create a pending execution and enqueue it. Returns its id, or a
  /// Validation error for malformed input.
  virtual Result<std::string, SchedulerError>
  schedule(ScheduleRequest request) = 0;

  /// schedule() for each entry. Invalid entries are skipped and reported
  /// in `rejected`.
  virtual BatchScheduleResult
  schedule_batch(std::vector<ScheduleRequest> requests) = 0;

  /// Flag a pending or running execution for cancellation. False for
  /// unknown ids, finished executions, and repeated calls.
  virtual bool cancel(const std::string &execution_id) = 0;

  /// Snapshot of an execution, nullopt for unknown (or evicted) ids.
  [[nodiscard]] virtual std::optional<TaskExecution>
  get_status(const std::string &execution_id) const = 0;

  /// Bind an executor to an id. Replacing a binding affects later attempts.
  virtual void register_executor(const std::string &executor_id,
                                 std::shared_ptr<IExecutor> executor) = 0;

  /// Install the availability predicate for RESOURCE dependencies.
  virtual void set_resource_predicate(ResourcePredicate predicate) = 0;

  /// Parameters: execution_id, new status. Invoked on worker threads after
  /// the store lock is released. Callbacks for one execution arrive in
  /// transition order; callbacks for different executions are unordered
  /// relative to each other and to the store timestamps.
  using StateCallback = std::function<void(const std::string &execution_id,
                                           ExecutionStatus status)>;
  virtual void on_state_change(StateCallback cb) = 0;

  [[nodiscard]] virtual SchedulerStats stats() const = 0;

  /// True while any execution is pending or running.
  [[nodiscard]] virtual bool has_pending_tasks() const = 0;

  /// Block until nothing is pending or running, or the timeout elapses.
  virtual bool wait_idle(std::chrono::milliseconds timeout) const = 0;

  /// Stop the workers and cancel everything not yet finished. Idempotent.
  virtual void shutdown() = 0;
};

/// Normalize a config: resolve auto values and clamp invalid ones.
SchedulerConfig normalize_config(SchedulerConfig config);

std::unique_ptr<IScheduler>
create_scheduler(const SchedulerConfig &config,
                 std::shared_ptr<ITaskRegistry> registry,
                 std::shared_ptr<ILogger> logger);

} // namespace tw::core
