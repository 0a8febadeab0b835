#include "core/worker_pool.h"

#include "core/logger.h"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <optional>
#include <system_error>
#include <utility>

namespace tw::core {
namespace {

using Clock = std::chrono::steady_clock;
using ExecResult = Result<std::string, SchedulerError>;

const char *const kComponent = "worker_pool";

/// Shared between a worker and the detached thread running the executor.
/// Whoever outlives the other keeps it alive.
struct AttemptState {
  std::mutex mutex;
  std::condition_variable cv;
  bool done = false;
  bool abandoned = false;
  std::optional<ExecResult> outcome;
  std::shared_ptr<CancelToken> token;
};

ExecResult invoke_executor(IExecutor &executor, const TaskDescriptor &task,
                           ExecutionContext &ctx) {
  try {
    return executor.run(task, ctx);
  } catch (const std::exception &e) {
    return ExecResult::Err(SchedulerError::Executor(
        "executor " + executor.name() + " threw: " + e.what()));
  } catch (...) {
    return ExecResult::Err(SchedulerError::Executor(
        "executor " + executor.name() + " threw a non-standard exception"));
  }
}

std::string describe(const Dependency &dep) {
  std::string out = to_string(dep.type);
  out += " ";
  out += dep.type == DependencyType::Resource ? dep.resource : dep.dependency_id;
  return out;
}

} // namespace

struct WorkerPool::AttemptOutcome {
  ExecResult result;
  bool abandoned = false; // Cut short by stop()
  bool timed_out = false;
};

/// Tracks executor threads. Outlives the pool when an abandoned call is
/// still running at destruction.
struct WorkerPool::AttemptTracker {
  std::mutex mutex;
  std::condition_variable cv;
  size_t live_threads = 0;
  bool stopping = false;
  std::vector<std::shared_ptr<AttemptState>> in_flight;

  void thread_finished() {
    {
      std::lock_guard<std::mutex> lock(mutex);
      if (live_threads > 0) {
        live_threads--;
      }
    }
    cv.notify_all();
  }

  void forget(const std::shared_ptr<AttemptState> &state) {
    std::lock_guard<std::mutex> lock(mutex);
    in_flight.erase(std::remove(in_flight.begin(), in_flight.end(), state),
                    in_flight.end());
  }
};

WorkerPool::WorkerPool(const SchedulerConfig &config, ExecutionQueue &queue,
                       StatusStore &store, ConcurrencyLimiter &limiter,
                       const DependencyResolver &resolver,
                       std::shared_ptr<ITaskRegistry> registry,
                       ExecutorLookup executor_lookup, TransitionSink sink,
                       std::shared_ptr<ILogger> logger)
    : config_(config), queue_(queue), store_(store), limiter_(limiter),
      resolver_(resolver), registry_(std::move(registry)),
      executor_lookup_(std::move(executor_lookup)), sink_(std::move(sink)),
      logger_(std::move(logger)),
      tracker_(std::make_shared<AttemptTracker>()) {}

WorkerPool::~WorkerPool() { stop(); }

void WorkerPool::start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (started_ || stopped_) {
    return;
  }
  started_ = true;
  const int count = std::max(1, config_.worker_count);
  workers_.reserve(static_cast<size_t>(count));
  for (int i = 0; i < count; ++i) {
    workers_.emplace_back([this]() { worker_loop(); });
  }
}

void WorkerPool::stop() {
  std::vector<std::thread> workers;
  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (stopped_) {
      return;
    }
    stopped_ = true;
    workers.swap(workers_);
  }

  queue_.close();
  limiter_.close();

  std::vector<std::shared_ptr<AttemptState>> in_flight;
  {
    std::lock_guard<std::mutex> lock(tracker_->mutex);
    tracker_->stopping = true;
    in_flight = tracker_->in_flight;
  }
  for (const auto &state : in_flight) {
    {
      std::lock_guard<std::mutex> lock(state->mutex);
      state->abandoned = true;
    }
    state->cv.notify_all();
    if (state->token) {
      state->token->request_cancel();
    }
  }

  store_.wake_all();

  for (auto &w : workers) {
    if (w.joinable()) {
      w.join();
    }
  }
}

bool WorkerPool::wait_for_abandoned(std::chrono::milliseconds grace) {
  std::unique_lock<std::mutex> lock(tracker_->mutex);
  return tracker_->cv.wait_for(lock, grace,
                               [this]() { return tracker_->live_threads == 0; });
}

size_t WorkerPool::live_attempts() const {
  std::lock_guard<std::mutex> lock(tracker_->mutex);
  return tracker_->live_threads;
}

void WorkerPool::worker_loop() {
  while (auto id = queue_.pop()) {
    process(*id);
  }
}

void WorkerPool::process(const std::string &execution_id) {
  auto record = store_.get_pending(execution_id);
  if (!record.has_value()) {
    // Finalized elsewhere (shutdown) or a stale duplicate.
    return;
  }

  if (record->cancellation_requested) {
    if (auto cancelled = store_.finalize_cancelled(execution_id)) {
      log_info(execution_id, "cancelled", "cancelled before start");
      publish(*cancelled);
    }
    return;
  }

  const uint64_t seen = store_.generation();
  auto wait = config_.dependency_poll_interval;
  bool ready = true;

  if (record->next_attempt_at.has_value()) {
    const auto now = Clock::now();
    if (now < *record->next_attempt_at) {
      ready = false;
      const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          *record->next_attempt_at - now);
      wait = std::min(wait, std::max(remaining, std::chrono::milliseconds(1)));
    }
  }

  if (ready) {
    if (auto unmet = resolver_.first_unmet(*record)) {
      ready = false;
      note_dependency_wait(*record, *unmet);
    }
  }

  if (!ready) {
    if (!queue_.push(execution_id)) {
      return;
    }
    store_.wait_for_change(seen, wait);
    return;
  }

  if (!limiter_.acquire()) {
    // Closed by stop(); the record is cancelled by shutdown.
    return;
  }
  LimiterPermit permit(limiter_);

  auto started = store_.begin_attempt(execution_id);
  if (!started.has_value()) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(waits_mutex_);
    logged_waits_.erase(execution_id);
  }
  publish(*started);
  if (started->status == ExecutionStatus::Cancelled) {
    log_info(execution_id, "cancelled", "cancelled before start");
    log_evictions();
    return;
  }

  log_info(execution_id, "attempt_started",
           "attempt=" + std::to_string(started->attempts) +
               " task=" + started->task_id +
               " executor=" + started->executor_id);

  AttemptOutcome outcome = run_attempt(*started);

  if (outcome.abandoned) {
    store_.request_cancel(execution_id);
  } else if (outcome.timed_out) {
    log_warn(execution_id, "attempt_timed_out",
             "attempt=" + std::to_string(started->attempts) +
                 " timeout_ms=" + std::to_string(started->timeout.count()));
  } else if (outcome.result.is_err()) {
    log_warn(execution_id, "attempt_failed",
             "attempt=" + std::to_string(started->attempts) +
                 " category=" + to_string(outcome.result.error().category) +
                 " error=" + outcome.result.error().message);
  }

  const auto backoff = config_.retry_backoff.delay_for(started->retry_count + 1);
  auto finished = store_.finish_attempt(
      execution_id, outcome.result, config_.retry_failed_tasks, backoff);
  permit.reset();

  if (!finished.has_value()) {
    return;
  }
  publish(*finished);
  log_outcome(*finished);
  log_evictions();

  if (finished->status == ExecutionStatus::Pending &&
      !queue_.push(execution_id)) {
    // Queue closed by shutdown; cancel_all() finalizes the record.
    log_info(execution_id, "retry_dropped", "queue closed");
  }
}

WorkerPool::AttemptOutcome
WorkerPool::run_attempt(const TaskExecution &record) {
  std::optional<TaskDescriptor> descriptor;
  if (registry_) {
    descriptor = registry_->resolve(record.task_id);
  }
  if (!descriptor.has_value()) {
    return {ExecResult::Err(SchedulerError::Executor(
                "task not found in registry: " + record.task_id)),
            false, false};
  }

  std::shared_ptr<IExecutor> executor;
  if (executor_lookup_) {
    executor = executor_lookup_(record.executor_id);
  }
  if (!executor) {
    return {ExecResult::Err(SchedulerError::Executor(
                "no executor registered for id: " + record.executor_id)),
            false, false};
  }

  log_info(record.id, "executor_resolved",
           record.executor_id + " -> " + executor->name());

  auto ctx = std::make_shared<ExecutionContext>();
  ctx->execution_id = record.id;
  ctx->task_id = record.task_id;
  ctx->attempt = record.attempts;
  ctx->timeout = record.timeout;
  ctx->cancel_token = CancelToken::create();
  ctx->dependency_results = store_.results_for(record.dependencies);

  auto state = std::make_shared<AttemptState>();
  state->token = ctx->cancel_token;

  auto tracker = tracker_;
  {
    std::lock_guard<std::mutex> lock(tracker->mutex);
    if (tracker->stopping) {
      return {ExecResult::Err(SchedulerError::Canceled()), true, false};
    }
    tracker->live_threads++;
    tracker->in_flight.push_back(state);
  }

  try {
    std::thread([state, tracker, executor, task = std::move(*descriptor),
                 ctx]() {
      auto result = invoke_executor(*executor, task, *ctx);
      {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->outcome.emplace(std::move(result));
        state->done = true;
      }
      state->cv.notify_all();
      tracker->thread_finished();
    }).detach();
  } catch (const std::system_error &e) {
    tracker->forget(state);
    tracker->thread_finished();
    return {ExecResult::Err(SchedulerError::Executor(
                std::string("failed to start attempt thread: ") + e.what())),
            false, false};
  }

  bool abandoned = false;
  std::optional<ExecResult> result;
  {
    std::unique_lock<std::mutex> lock(state->mutex);
    state->cv.wait_for(lock, record.timeout,
                       [&]() { return state->done || state->abandoned; });
    if (state->done) {
      result = std::move(state->outcome);
    } else {
      abandoned = state->abandoned;
    }
  }
  tracker->forget(state);

  if (result.has_value()) {
    return {std::move(*result), false, false};
  }

  // Timed out or abandoned by stop(). The executor call keeps running on its
  // own thread; it is only signalled.
  state->token->request_cancel();
  if (abandoned) {
    return {ExecResult::Err(SchedulerError::Canceled("scheduler shut down")),
            true, false};
  }
  return {ExecResult::Err(SchedulerError::Timeout(
              "execution timed out after " +
              std::to_string(record.timeout.count()) + "ms")),
          false, true};
}

void WorkerPool::publish(const TaskExecution &snapshot) {
  if (sink_) {
    sink_(snapshot);
  }
}

void WorkerPool::note_dependency_wait(const TaskExecution &record,
                                      const Dependency &unmet) {
  {
    std::lock_guard<std::mutex> lock(waits_mutex_);
    if (!logged_waits_.insert(record.id).second) {
      return;
    }
  }
  log_info(record.id, "dependency_wait", "waiting on " + describe(unmet));
}

void WorkerPool::log_outcome(const TaskExecution &snapshot) {
  switch (snapshot.status) {
  case ExecutionStatus::Completed:
    log_info(snapshot.id, "completed",
             "attempts=" + std::to_string(snapshot.attempts));
    break;
  case ExecutionStatus::Failed:
    if (logger_) {
      logger_->error(snapshot.id, kComponent, "failed",
                     "attempts=" + std::to_string(snapshot.attempts) +
                         " error=" + snapshot.error.value_or(""));
    }
    break;
  case ExecutionStatus::Cancelled:
    log_info(snapshot.id, "cancelled", snapshot.error.value_or(""));
    break;
  case ExecutionStatus::Pending:
    log_info(snapshot.id, "retry_scheduled",
             "retry=" + std::to_string(snapshot.retry_count) + "/" +
                 std::to_string(snapshot.max_retries));
    break;
  case ExecutionStatus::Running:
    break;
  }
}

void WorkerPool::log_evictions() {
  for (const auto &id : store_.drain_evicted()) {
    log_info(id, "evicted", "dropped by retention bound");
  }
}

void WorkerPool::log_info(const std::string &trace_id, const std::string &event,
                          const std::string &msg) const {
  if (logger_) {
    logger_->info(trace_id, kComponent, event, msg);
  }
}

void WorkerPool::log_warn(const std::string &trace_id, const std::string &event,
                          const std::string &msg) const {
  if (logger_) {
    logger_->warn(trace_id, kComponent, event, msg);
  }
}

} // namespace tw::core
