#include "core/task_execution.h"

namespace tw::core {

const char *to_string(ExecutionMode mode) {
  switch (mode) {
  case ExecutionMode::Sync:
    return "SYNC";
  case ExecutionMode::Async:
    return "ASYNC";
  case ExecutionMode::Parallel:
    return "PARALLEL";
  case ExecutionMode::Concurrent:
    return "CONCURRENT";
  }
  return "UNKNOWN";
}

const char *to_string(DependencyType type) {
  switch (type) {
  case DependencyType::Completion:
    return "COMPLETION";
  case DependencyType::Start:
    return "START";
  case DependencyType::Output:
    return "OUTPUT";
  case DependencyType::Resource:
    return "RESOURCE";
  }
  return "UNKNOWN";
}

const char *to_string(ExecutionStatus status) {
  switch (status) {
  case ExecutionStatus::Pending:
    return "pending";
  case ExecutionStatus::Running:
    return "running";
  case ExecutionStatus::Completed:
    return "completed";
  case ExecutionStatus::Failed:
    return "failed";
  case ExecutionStatus::Cancelled:
    return "cancelled";
  }
  return "unknown";
}

bool is_terminal(ExecutionStatus status) {
  switch (status) {
  case ExecutionStatus::Completed:
  case ExecutionStatus::Failed:
  case ExecutionStatus::Cancelled:
    return true;
  default:
    return false;
  }
}

Result<void, SchedulerError>
TaskExecution::transition_to(ExecutionStatus next) {
  bool legal = false;

  switch (status) {
  case ExecutionStatus::Pending:
    legal = (next == ExecutionStatus::Running ||
             next == ExecutionStatus::Cancelled);
    break;
  case ExecutionStatus::Running:
    legal = (next == ExecutionStatus::Completed ||
             next == ExecutionStatus::Failed ||
             next == ExecutionStatus::Cancelled ||
             next == ExecutionStatus::Pending);
    break;
  case ExecutionStatus::Completed:
  case ExecutionStatus::Failed:
  case ExecutionStatus::Cancelled:
    legal = false;
    break;
  }

  if (!legal) {
    return Result<void, SchedulerError>::Err(SchedulerError::Internal(
        std::string("Illegal status transition: ") + to_string(status) +
        " -> " + to_string(next) + " (execution_id=" + id + ")"));
  }

  status = next;

  if (next == ExecutionStatus::Running && !started_at.has_value()) {
    started_at = Clock::now();
  }
  if (is_terminal(next)) {
    completed_at = Clock::now();
  }
  if (next == ExecutionStatus::Pending) {
    // Retry: the failed attempt's message only survives into a terminal
    // state, never onto a pending record.
    error.reset();
    error_category.reset();
  }

  return Result<void, SchedulerError>::Ok();
}

} // namespace tw::core
