#include "core/status_store.h"

#include <initializer_list>
#include <unordered_set>
#include <utility>

namespace tw::core {

namespace {

const char *const kCancelledMessage = "execution cancelled";

} // namespace

StatusStore::StatusStore(size_t completed_retention)
    : completed_retention_(completed_retention) {}

Result<void, SchedulerError> StatusStore::insert_pending(TaskExecution execution) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::string id = execution.id;
  if (pending_.count(id) || running_.count(id) || completed_.count(id)) {
    return Result<void, SchedulerError>::Err(
        SchedulerError::Internal("Duplicate execution id: " + id));
  }
  execution.status = ExecutionStatus::Pending;
  pending_.emplace(id, std::move(execution));
  changed_locked();
  return Result<void, SchedulerError>::Ok();
}

std::optional<TaskExecution> StatusStore::get(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto *map : {&pending_, &running_, &completed_}) {
    auto it = map->find(id);
    if (it != map->end()) {
      return it->second;
    }
  }
  return std::nullopt;
}

std::optional<TaskExecution>
StatusStore::get_pending(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = pending_.find(id);
  if (it == pending_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool StatusStore::request_cancel(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  TaskExecution *record = nullptr;
  if (auto it = pending_.find(id); it != pending_.end()) {
    record = &it->second;
  } else if (auto rit = running_.find(id); rit != running_.end()) {
    record = &rit->second;
  }
  if (!record || record->cancellation_requested) {
    return false;
  }
  record->cancellation_requested = true;
  changed_locked();
  return true;
}

std::optional<TaskExecution>
StatusStore::finalize_cancelled(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = pending_.find(id);
  if (it == pending_.end()) {
    return std::nullopt;
  }
  TaskExecution record = std::move(it->second);
  pending_.erase(it);

  if (record.transition_to(ExecutionStatus::Cancelled).is_err()) {
    pending_.emplace(id, std::move(record));
    return std::nullopt;
  }
  record.error = kCancelledMessage;
  record.error_category = ErrorCategory::Canceled;
  TaskExecution snapshot = record;
  move_to_completed_locked(std::move(record));
  changed_locked();
  return snapshot;
}

std::optional<TaskExecution> StatusStore::begin_attempt(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = pending_.find(id);
  if (it == pending_.end()) {
    return std::nullopt;
  }
  TaskExecution record = std::move(it->second);
  pending_.erase(it);

  const ExecutionStatus target = record.cancellation_requested
                                     ? ExecutionStatus::Cancelled
                                     : ExecutionStatus::Running;
  if (record.transition_to(target).is_err()) {
    pending_.emplace(id, std::move(record));
    return std::nullopt;
  }

  TaskExecution snapshot;
  if (target == ExecutionStatus::Cancelled) {
    record.error = kCancelledMessage;
    record.error_category = ErrorCategory::Canceled;
    snapshot = record;
    move_to_completed_locked(std::move(record));
  } else {
    record.attempts++;
    record.next_attempt_at.reset();
    snapshot = record;
    running_.emplace(id, std::move(record));
  }
  changed_locked();
  return snapshot;
}

std::optional<TaskExecution> StatusStore::finish_attempt(
    const std::string &id, const Result<std::string, SchedulerError> &outcome,
    bool retries_enabled, std::chrono::milliseconds backoff) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = running_.find(id);
  if (it == running_.end()) {
    return std::nullopt;
  }
  TaskExecution record = std::move(it->second);
  running_.erase(it);

  ExecutionStatus target = ExecutionStatus::Failed;
  if (record.cancellation_requested) {
    target = ExecutionStatus::Cancelled;
  } else if (outcome.is_ok()) {
    target = ExecutionStatus::Completed;
  } else if (retries_enabled && record.retry_count < record.max_retries) {
    target = ExecutionStatus::Pending;
  }

  if (record.transition_to(target).is_err()) {
    running_.emplace(id, std::move(record));
    return std::nullopt;
  }

  TaskExecution snapshot;
  switch (target) {
  case ExecutionStatus::Cancelled:
    record.result.reset();
    record.error = kCancelledMessage;
    record.error_category = ErrorCategory::Canceled;
    snapshot = record;
    move_to_completed_locked(std::move(record));
    break;
  case ExecutionStatus::Completed:
    record.result = outcome.value();
    record.error.reset();
    record.error_category.reset();
    results_[id] = outcome.value();
    snapshot = record;
    move_to_completed_locked(std::move(record));
    break;
  case ExecutionStatus::Pending:
    record.retry_count++;
    if (backoff.count() > 0) {
      record.next_attempt_at = std::chrono::steady_clock::now() + backoff;
    }
    snapshot = record;
    pending_.emplace(id, std::move(record));
    break;
  default: {
    const auto exhausted =
        SchedulerError::RetriesExhausted(outcome.error().message);
    record.error = exhausted.message;
    record.error_category = exhausted.category;
    snapshot = record;
    move_to_completed_locked(std::move(record));
    break;
  }
  }
  changed_locked();
  return snapshot;
}

std::vector<TaskExecution> StatusStore::cancel_all(const std::string &reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<TaskExecution> finalized;

  for (auto *map : {&pending_, &running_}) {
    for (auto it = map->begin(); it != map->end();) {
      TaskExecution &record = it->second;
      record.cancellation_requested = true;
      if (record.transition_to(ExecutionStatus::Cancelled).is_err()) {
        ++it;
        continue;
      }
      record.result.reset();
      record.error = reason;
      record.error_category = ErrorCategory::Canceled;
      finalized.push_back(record);
      TaskExecution moved = std::move(record);
      it = map->erase(it);
      move_to_completed_locked(std::move(moved));
    }
  }

  if (!finalized.empty()) {
    changed_locked();
  }
  return finalized;
}

std::unordered_map<std::string, std::string>
StatusStore::results_for(const std::vector<Dependency> &dependencies) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::unordered_map<std::string, std::string> out;
  for (const auto &dep : dependencies) {
    if (dep.dependency_id.empty()) {
      continue;
    }
    auto it = results_.find(dep.dependency_id);
    if (it != results_.end()) {
      out.emplace(it->first, it->second);
    }
  }
  return out;
}

std::optional<ExecutionStatus>
StatusStore::status_of(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (pending_.count(id)) {
    return ExecutionStatus::Pending;
  }
  if (running_.count(id)) {
    return ExecutionStatus::Running;
  }
  auto it = completed_.find(id);
  if (it != completed_.end()) {
    return it->second.status;
  }
  return std::nullopt;
}

std::optional<std::string> StatusStore::result_of(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = results_.find(id);
  if (it == results_.end()) {
    return std::nullopt;
  }
  return it->second;
}

StoreCounts StatusStore::counts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  StoreCounts c;
  c.pending = pending_.size();
  c.running = running_.size();
  c.completed = completed_.size();
  for (const auto &[_, record] : completed_) {
    switch (record.status) {
    case ExecutionStatus::Completed:
      c.succeeded++;
      break;
    case ExecutionStatus::Failed:
      c.failed++;
      break;
    case ExecutionStatus::Cancelled:
      c.cancelled++;
      break;
    default:
      break;
    }
  }
  return c;
}

bool StatusStore::has_non_terminal() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return !pending_.empty() || !running_.empty();
}

std::vector<std::string> StatusStore::drain_evicted() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> out;
  out.swap(evicted_);
  return out;
}

uint64_t StatusStore::generation() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return generation_;
}

bool StatusStore::wait_for_change(uint64_t seen,
                                  std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return changed_cv_.wait_for(lock, timeout,
                              [&]() { return generation_ != seen; });
}

bool StatusStore::wait_idle(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return changed_cv_.wait_for(lock, timeout, [this]() {
    return pending_.empty() && running_.empty();
  });
}

void StatusStore::wake_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  changed_locked();
}

void StatusStore::move_to_completed_locked(TaskExecution execution) {
  const std::string id = execution.id;
  completed_[id] = std::move(execution);
  completion_order_.push_back(id);

  if (completed_retention_ == 0 ||
      completed_.size() <= completed_retention_) {
    return;
  }

  // A finalized record that a live record still depends on stays until that
  // dependent finishes. Unpinned records are evicted oldest first; the bound
  // is exceeded only while every finalized record is pinned.
  std::unordered_set<std::string> pinned;
  for (const auto *map : {&pending_, &running_}) {
    for (const auto &[_, record] : *map) {
      for (const auto &dep : record.dependencies) {
        if (!dep.dependency_id.empty()) {
          pinned.insert(dep.dependency_id);
        }
      }
    }
  }

  for (auto it = completion_order_.begin();
       completed_.size() > completed_retention_ &&
       it != completion_order_.end();) {
    if (pinned.count(*it)) {
      ++it;
      continue;
    }
    if (completed_.erase(*it) > 0) {
      results_.erase(*it);
      evicted_.push_back(*it);
    }
    it = completion_order_.erase(it);
  }
}

void StatusStore::changed_locked() {
  ++generation_;
  changed_cv_.notify_all();
}

} // namespace tw::core
