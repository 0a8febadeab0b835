#include "core/scheduler.h"

#include "core/concurrency_limiter.h"
#include "core/execution_queue.h"
#include "core/logger.h"
#include "core/status_store.h"
#include "core/worker_pool.h"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <mutex>
#include <random>
#include <sstream>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tw::core {
namespace {

const char *const kComponent = "scheduler";
const char *const kSchedulerTrace = "scheduler";
const char *const kShutdownReason = "scheduler shut down";

int clamp_auto_workers() {
  const auto hw = static_cast<int>(std::thread::hardware_concurrency());
  if (hw <= 0) {
    return 4;
  }
  return std::clamp(hw - 1, 2, 8);
}

std::optional<SchedulerError> validate(const ScheduleRequest &request) {
  if (request.task_id.empty()) {
    return SchedulerError::Validation("task_id must not be empty");
  }
  if (request.executor_id.empty()) {
    return SchedulerError::Validation("executor_id must not be empty");
  }
  if (request.max_retries.has_value() && *request.max_retries < 0) {
    return SchedulerError::Validation("max_retries must not be negative");
  }
  if (request.timeout.count() < 0) {
    return SchedulerError::Validation("timeout must not be negative");
  }
  for (const auto &dep : request.dependencies) {
    if (dep.type == DependencyType::Resource) {
      if (dep.resource.empty()) {
        return SchedulerError::Validation(
            "RESOURCE dependency requires a resource key");
      }
    } else if (dep.dependency_id.empty()) {
      return SchedulerError::Validation(
          std::string(to_string(dep.type)) +
          " dependency requires a dependency_id");
    }
  }
  return std::nullopt;
}

class TaskScheduler final : public IScheduler {
public:
  TaskScheduler(SchedulerConfig config, std::shared_ptr<ITaskRegistry> registry,
                std::shared_ptr<ILogger> logger)
      : config_(normalize_config(std::move(config))),
        registry_(std::move(registry)), logger_(std::move(logger)),
        store_(config_.completed_retention),
        limiter_(config_.max_concurrent_tasks), resolver_(store_) {
    pool_ = std::make_unique<WorkerPool>(
        config_, queue_, store_, limiter_, resolver_, registry_,
        [this](const std::string &id) { return find_executor(id); },
        [this](const TaskExecution &snapshot) { dispatch(snapshot); },
        logger_);
    pool_->start();

    log_info(kSchedulerTrace, "started",
             "workers=" + std::to_string(config_.worker_count) +
                 " max_concurrent=" +
                 std::to_string(config_.max_concurrent_tasks));
  }

  ~TaskScheduler() override { shutdown(); }

  Result<std::string, SchedulerError>
  schedule(ScheduleRequest request) override {
    using R = Result<std::string, SchedulerError>;

    if (auto invalid = validate(request)) {
      log_warn(request.task_id.empty() ? kSchedulerTrace : request.task_id,
               "schedule_rejected", invalid->message);
      return R::Err(std::move(*invalid));
    }
    if (!accepting_.load()) {
      return R::Err(SchedulerError::ShuttingDown());
    }

    TaskExecution execution;
    execution.id = next_execution_id();
    execution.task_id = std::move(request.task_id);
    execution.executor_id = std::move(request.executor_id);
    execution.execution_mode = request.execution_mode;
    execution.dependencies = std::move(request.dependencies);
    execution.priority = request.priority;
    execution.max_retries =
        request.max_retries.value_or(config_.default_max_retries);
    execution.timeout = request.timeout.count() > 0 ? request.timeout
                                                     : config_.default_timeout;

    const std::string id = execution.id;
    const std::string summary =
        "task=" + execution.task_id + " executor=" + execution.executor_id +
        " deps=" + std::to_string(execution.dependencies.size()) +
        " mode=" + to_string(execution.execution_mode);

    auto inserted = store_.insert_pending(std::move(execution));
    if (inserted.is_err()) {
      return R::Err(inserted.error());
    }

    if (!queue_.push(id)) {
      // Lost the race with shutdown().
      store_.request_cancel(id);
      if (auto cancelled = store_.finalize_cancelled(id)) {
        dispatch(*cancelled);
      }
      return R::Err(SchedulerError::ShuttingDown());
    }

    log_info(id, "scheduled", summary);
    return R::Ok(id);
  }

  BatchScheduleResult
  schedule_batch(std::vector<ScheduleRequest> requests) override {
    BatchScheduleResult out;
    out.execution_ids.reserve(requests.size());
    for (size_t i = 0; i < requests.size(); ++i) {
      auto result = schedule(std::move(requests[i]));
      if (result.is_ok()) {
        out.execution_ids.push_back(std::move(result).value());
      } else {
        out.rejected.push_back({i, result.error()});
      }
    }
    return out;
  }

  bool cancel(const std::string &execution_id) override {
    const bool flagged = store_.request_cancel(execution_id);
    if (flagged) {
      log_info(execution_id, "cancel_requested", "");
    }
    return flagged;
  }

  [[nodiscard]] std::optional<TaskExecution>
  get_status(const std::string &execution_id) const override {
    return store_.get(execution_id);
  }

  void register_executor(const std::string &executor_id,
                         std::shared_ptr<IExecutor> executor) override {
    std::lock_guard<std::mutex> lock(executors_mutex_);
    if (executor) {
      executors_[executor_id] = std::move(executor);
    } else {
      executors_.erase(executor_id);
    }
  }

  void set_resource_predicate(ResourcePredicate predicate) override {
    resolver_.set_resource_predicate(std::move(predicate));
    // Re-evaluate waiting records now rather than at the next poll.
    store_.wake_all();
  }

  void on_state_change(StateCallback cb) override {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    callbacks_.push_back(std::move(cb));
  }

  [[nodiscard]] SchedulerStats stats() const override {
    const auto counts = store_.counts();
    SchedulerStats s;
    s.pending = counts.pending;
    s.running = counts.running;
    s.completed = counts.completed;
    s.succeeded = counts.succeeded;
    s.failed = counts.failed;
    s.cancelled = counts.cancelled;
    s.queued = queue_.size();
    s.limiter_capacity = limiter_.capacity();
    s.limiter_available = limiter_.available();
    return s;
  }

  [[nodiscard]] bool has_pending_tasks() const override {
    return store_.has_non_terminal();
  }

  bool wait_idle(std::chrono::milliseconds timeout) const override {
    return store_.wait_idle(timeout);
  }

  void shutdown() override {
    {
      std::lock_guard<std::mutex> lock(shutdown_mutex_);
      if (shut_down_) {
        return;
      }
      shut_down_ = true;
    }
    accepting_.store(false);
    log_info(kSchedulerTrace, "shutdown", "stopping workers");

    pool_->stop();

    const auto cancelled = store_.cancel_all(kShutdownReason);
    for (const auto &snapshot : cancelled) {
      log_info(snapshot.id, "cancelled", kShutdownReason);
      dispatch(snapshot);
    }

    if (!pool_->wait_for_abandoned(config_.shutdown_grace)) {
      log_warn(kSchedulerTrace, "shutdown",
               std::to_string(pool_->live_attempts()) +
                   " abandoned attempt(s) still running after grace period");
    }
  }

private:
  std::shared_ptr<IExecutor> find_executor(const std::string &executor_id) {
    std::lock_guard<std::mutex> lock(executors_mutex_);
    auto it = executors_.find(executor_id);
    if (it == executors_.end()) {
      return nullptr;
    }
    return it->second;
  }

  void dispatch(const TaskExecution &snapshot) {
    std::vector<StateCallback> callbacks;
    {
      std::lock_guard<std::mutex> lock(callbacks_mutex_);
      callbacks = callbacks_;
    }
    for (const auto &cb : callbacks) {
      if (cb) {
        cb(snapshot.id, snapshot.status);
      }
    }
  }

  std::string next_execution_id() {
    std::lock_guard<std::mutex> lock(id_mutex_);
    std::stringstream ss;
    ss << "exec-" << ++id_counter_ << "-" << std::hex << (id_dist_(id_gen_) & 0xFFFFFF);
    return ss.str();
  }

  void log_info(const std::string &trace_id, const std::string &event,
                const std::string &msg) const {
    if (logger_) {
      logger_->info(trace_id, kComponent, event, msg);
    }
  }

  void log_warn(const std::string &trace_id, const std::string &event,
                const std::string &msg) const {
    if (logger_) {
      logger_->warn(trace_id, kComponent, event, msg);
    }
  }

  const SchedulerConfig config_;
  std::shared_ptr<ITaskRegistry> registry_;
  std::shared_ptr<ILogger> logger_;

  StatusStore store_;
  ExecutionQueue queue_;
  ConcurrencyLimiter limiter_;
  DependencyResolver resolver_;

  std::mutex executors_mutex_;
  std::unordered_map<std::string, std::shared_ptr<IExecutor>> executors_;

  std::mutex callbacks_mutex_;
  std::vector<StateCallback> callbacks_;

  std::mutex id_mutex_;
  uint64_t id_counter_ = 0;
  std::mt19937 id_gen_{std::random_device{}()};
  std::uniform_int_distribution<uint32_t> id_dist_;

  std::atomic<bool> accepting_{true};
  std::mutex shutdown_mutex_;
  bool shut_down_ = false;

  // Declared last: destroyed first, before the primitives it references.
  std::unique_ptr<WorkerPool> pool_;
};

} // namespace

std::chrono::milliseconds RetryBackoff::delay_for(int retry) const {
  if (initial.count() <= 0 || retry <= 0) {
    return std::chrono::milliseconds(0);
  }
  const double factor = std::pow(std::max(1.0, multiplier), retry - 1);
  const double raw = static_cast<double>(initial.count()) * factor;
  const double cap = max.count() > 0 ? static_cast<double>(max.count()) : raw;
  return std::chrono::milliseconds(
      static_cast<long long>(std::min(raw, cap)));
}

SchedulerConfig normalize_config(SchedulerConfig config) {
  if (config.worker_count <= 0) {
    config.worker_count = clamp_auto_workers();
  }
  if (config.max_concurrent_tasks <= 0) {
    config.max_concurrent_tasks = config.worker_count;
  }
  config.default_max_retries = std::max(0, config.default_max_retries);
  if (config.default_timeout.count() <= 0) {
    config.default_timeout = std::chrono::milliseconds(300000);
  }
  if (config.dependency_poll_interval.count() <= 0) {
    config.dependency_poll_interval = std::chrono::milliseconds(100);
  }
  if (config.retry_backoff.initial.count() < 0) {
    config.retry_backoff.initial = std::chrono::milliseconds(0);
  }
  if (config.retry_backoff.multiplier < 1.0) {
    config.retry_backoff.multiplier = 1.0;
  }
  if (config.shutdown_grace.count() < 0) {
    config.shutdown_grace = std::chrono::milliseconds(0);
  }
  return config;
}

std::unique_ptr<IScheduler>
create_scheduler(const SchedulerConfig &config,
                 std::shared_ptr<ITaskRegistry> registry,
                 std::shared_ptr<ILogger> logger) {
  return std::make_unique<TaskScheduler>(config, std::move(registry),
                                         std::move(logger));
}

} // namespace tw::core
