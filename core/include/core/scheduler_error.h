#pragma once

#include <map>
#include <string>

namespace tw::core {

/// Error categories of the scheduler. Callers branch on the category, never
/// on the message text.
enum class ErrorCategory {
  Validation,           // Malformed schedule input, reported synchronously
  DependencyUnresolved, // Dependencies not yet satisfied (requeue only)
  Timeout,              // Attempt exceeded its wall-clock budget
  Executor,             // Executor reported a failure or threw
  RetriesExhausted,     // Last attempt failed with no retry budget left
  Canceled,             // Cancellation requested by the caller
  ShuttingDown,         // Scheduler no longer accepts work
  Internal              // Invariant violation
};

const char *to_string(ErrorCategory category);

/// Structured error value carried in Result<T, SchedulerError>.
struct SchedulerError {
  ErrorCategory category = ErrorCategory::Internal;
  int code = 0;        // Stable numeric code for aggregation
  std::string message; // Human-readable detail
  bool retryable = false; // Transport hint; every failure counts against the retry budget
  std::map<std::string, std::string> details;

  SchedulerError() = default;

  SchedulerError(ErrorCategory cat, int c, std::string msg,
                 bool retry = false,
                 std::map<std::string, std::string> dets = {})
      : category(cat), code(c), message(std::move(msg)), retryable(retry),
        details(std::move(dets)) {}

  static SchedulerError Validation(std::string msg) {
    return {ErrorCategory::Validation, 1001, std::move(msg)};
  }
  static SchedulerError Timeout(std::string msg = "execution timed out") {
    return {ErrorCategory::Timeout, 2001, std::move(msg), true};
  }
  static SchedulerError Executor(std::string msg, bool retryable = true) {
    return {ErrorCategory::Executor, 2002, std::move(msg), retryable};
  }
  static SchedulerError RetriesExhausted(std::string last_msg) {
    return {ErrorCategory::RetriesExhausted, 2003, std::move(last_msg)};
  }
  static SchedulerError Canceled(std::string msg = "execution cancelled") {
    return {ErrorCategory::Canceled, 3001, std::move(msg)};
  }
  static SchedulerError ShuttingDown() {
    return {ErrorCategory::ShuttingDown, 3002, "scheduler is shutting down"};
  }
  static SchedulerError Internal(std::string msg) {
    return {ErrorCategory::Internal, 4001, std::move(msg)};
  }
};

} // namespace tw::core
