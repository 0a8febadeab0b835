#pragma once

#include "core/dependency_resolver.h"
#include "core/result.h"
#include "core/scheduler_error.h"
#include "core/task_execution.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tw::core {

struct StoreCounts {
  size_t pending = 0;
  size_t running = 0;
  size_t completed = 0; // Size of the completed map (all terminal records)
  size_t succeeded = 0;
  size_t failed = 0;
  size_t cancelled = 0;
};

/// Owner of every TaskExecution record.
///
/// Records live in exactly one of three maps (pending, running, completed)
/// and results of successful executions live in a separate map for OUTPUT
/// dependencies. A single mutex serializes all of it, so each move between
/// maps is atomic and two workers can never finalize the same id.
///
/// Every transition bumps a generation counter and wakes waiters, which is
/// what workers sleep on while dependencies are unmet.
class StatusStore : public IDependencyView {
public:
  /// `completed_retention` bounds the completed map (0 = unbounded); the
  /// oldest finalized record and its result are evicted first. Records named
  /// as a dependency by a pending or running record are never evicted.
  explicit StatusStore(size_t completed_retention = 0);

  StatusStore(const StatusStore &) = delete;
  StatusStore &operator=(const StatusStore &) = delete;

  /// Insert a new pending record. Fails on a duplicate id.
  Result<void, SchedulerError> insert_pending(TaskExecution execution);

  /// Snapshot from whichever map holds the id.
  [[nodiscard]] std::optional<TaskExecution> get(const std::string &id) const;

  /// Snapshot only if the record is pending.
  [[nodiscard]] std::optional<TaskExecution>
  get_pending(const std::string &id) const;

  /// Flag a pending or running record for cancellation. Returns false for
  /// unknown ids, terminal records, and records already flagged.
  bool request_cancel(const std::string &id);

  /// Finalize a flagged pending record as cancelled.
  std::optional<TaskExecution> finalize_cancelled(const std::string &id);

  /// Move pending -> running for an attempt. A record flagged for
  /// cancellation is finalized as cancelled instead; check the snapshot's
  /// status. nullopt if the id is not pending.
  std::optional<TaskExecution> begin_attempt(const std::string &id);

  /// Record the outcome of an attempt on a running record.
  ///
  ///   flagged for cancellation   -> cancelled (outcome discarded)
  ///   success                    -> completed, result stored
  ///   failure, budget left       -> pending, retry_count + 1, next attempt
  ///                                 not before now + backoff
  ///   failure, no budget         -> failed, error = last message,
  ///                                 category RetriesExhausted
  ///
  /// Returns the updated snapshot; status Pending means the caller must
  /// re-enqueue the id.
  std::optional<TaskExecution>
  finish_attempt(const std::string &id,
                 const Result<std::string, SchedulerError> &outcome,
                 bool retries_enabled, std::chrono::milliseconds backoff);

  /// Cancel every non-terminal record with the given reason. Used on
  /// shutdown. Returns the finalized snapshots.
  std::vector<TaskExecution> cancel_all(const std::string &reason);

  /// Stored results of the given dependencies that have one.
  [[nodiscard]] std::unordered_map<std::string, std::string>
  results_for(const std::vector<Dependency> &dependencies) const;

  // IDependencyView
  [[nodiscard]] std::optional<ExecutionStatus>
  status_of(const std::string &id) const override;
  [[nodiscard]] std::optional<std::string>
  result_of(const std::string &id) const override;

  [[nodiscard]] StoreCounts counts() const;
  [[nodiscard]] bool has_non_terminal() const;

  /// Ids evicted by the retention bound since the last call.
  std::vector<std::string> drain_evicted();

  // ---- Change notification ----

  [[nodiscard]] uint64_t generation() const;

  /// Wait until the generation moves past `seen` or `timeout` elapses.
  /// Returns true if a change was observed.
  bool wait_for_change(uint64_t seen, std::chrono::milliseconds timeout) const;

  /// Wait until no record is pending or running.
  bool wait_idle(std::chrono::milliseconds timeout) const;

  /// Bump the generation and wake all waiters without a transition.
  void wake_all();

private:
  void move_to_completed_locked(TaskExecution execution);
  void changed_locked();

  const size_t completed_retention_;

  mutable std::mutex mutex_;
  mutable std::condition_variable changed_cv_;
  uint64_t generation_ = 0;

  std::unordered_map<std::string, TaskExecution> pending_;
  std::unordered_map<std::string, TaskExecution> running_;
  std::unordered_map<std::string, TaskExecution> completed_;
  std::unordered_map<std::string, std::string> results_;

  std::deque<std::string> completion_order_;
  std::vector<std::string> evicted_;
};

} // namespace tw::core
