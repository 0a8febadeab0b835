#pragma once

#include "core/result.h"
#include "core/scheduler_error.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace tw::core {

// ---- Enums ----

/// Advisory hint for workflow composition. The worker dispatch path is the
/// same for every mode.
enum class ExecutionMode { Sync, Async, Parallel, Concurrent };

const char *to_string(ExecutionMode mode);

enum class DependencyType {
  Completion, // Dependency reached `completed`
  Start,      // Dependency is running or finished
  Output,     // Dependency stored a result (optionally equal to a value)
  Resource    // External availability predicate keyed by resource
};

const char *to_string(DependencyType type);

enum class ExecutionStatus {
  Pending,   // Waiting in the queue (dependencies, admission, or backoff)
  Running,   // Holding a limiter unit, executor call in flight
  Completed, // Executor returned a result (terminal)
  Failed,    // Retry budget exhausted (terminal)
  Cancelled  // Cancelled before or between attempts (terminal)
};

const char *to_string(ExecutionStatus status);

bool is_terminal(ExecutionStatus status);

// ---- Dependency ----

struct Dependency {
  std::string dependency_id;
  DependencyType type = DependencyType::Completion;
  std::optional<std::string> expected_value; // Output only
  std::string resource;                      // Resource only

  static Dependency completion(std::string id) {
    return {std::move(id), DependencyType::Completion, std::nullopt, {}};
  }
  static Dependency start(std::string id) {
    return {std::move(id), DependencyType::Start, std::nullopt, {}};
  }
  static Dependency output(std::string id,
                           std::optional<std::string> expected = std::nullopt) {
    return {std::move(id), DependencyType::Output, std::move(expected), {}};
  }
  static Dependency on_resource(std::string resource_key) {
    return {{}, DependencyType::Resource, std::nullopt,
            std::move(resource_key)};
  }
};

// ---- TaskExecution ----

/// Scheduling record for one attempt-series of a task.
/// Owned by the status store; callers only ever see copies.
struct TaskExecution {
  using Clock = std::chrono::system_clock;
  using TimePoint = Clock::time_point;

  std::string id;
  std::string task_id;
  std::string executor_id;
  ExecutionMode execution_mode = ExecutionMode::Sync;
  std::vector<Dependency> dependencies;

  int max_retries = 0;
  int retry_count = 0;
  int attempts = 0; // Executor invocations made so far
  std::chrono::milliseconds timeout{0};
  int priority = 0;

  TimePoint created_at = Clock::now();
  std::optional<TimePoint> started_at;
  std::optional<TimePoint> completed_at;

  ExecutionStatus status = ExecutionStatus::Pending;
  std::optional<std::string> result;
  std::optional<std::string> error;
  /// RetriesExhausted on failed, Canceled on cancelled.
  std::optional<ErrorCategory> error_category;
  bool cancellation_requested = false;

  /// Earliest moment the next attempt may start (retry backoff).
  std::optional<std::chrono::steady_clock::time_point> next_attempt_at;

  // ---- State machine ----

  /// Apply a transition, rejecting illegal ones.
  /// Legal transitions:
  ///   Pending -> Running, Cancelled
  ///   Running -> Completed, Failed, Cancelled, Pending (retry)
  /// Terminal states accept nothing.
  Result<void, SchedulerError> transition_to(ExecutionStatus next);

  [[nodiscard]] bool is_finished() const noexcept {
    return is_terminal(status);
  }
};

} // namespace tw::core
