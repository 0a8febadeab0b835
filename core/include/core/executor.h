#pragma once

#include "core/cancel_token.h"
#include "core/result.h"
#include "core/scheduler_error.h"
#include "core/task_registry.h"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

namespace tw::core {

/// Context handed to an executor for one attempt.
struct ExecutionContext {
  std::string execution_id;
  std::string task_id;
  int attempt = 1; // 1-based
  std::chrono::milliseconds timeout{0};

  /// Signalled when the scheduler abandons this attempt (timeout or
  /// shutdown). Never signalled by cancel() on a running execution.
  std::shared_ptr<CancelToken> cancel_token;

  /// Stored results of this execution's dependencies, keyed by their
  /// execution id. Only dependencies that already have a result appear.
  std::unordered_map<std::string, std::string> dependency_results;

  [[nodiscard]] bool is_canceled() const noexcept {
    return cancel_token && cancel_token->is_canceled();
  }
};

/// Executor capability: performs the work of one task.
///
/// run() may block. The scheduler imposes the timeout from outside by
/// running the call on its own thread; on timeout it stops waiting and
/// signals ctx.cancel_token, so implementations must stay safe when the
/// caller is gone (hold no references into the caller's stack).
class IExecutor {
public:
  virtual ~IExecutor() = default;

  /// Name for logging.
  [[nodiscard]] virtual std::string name() const = 0;

  virtual Result<std::string, SchedulerError>
  run(const TaskDescriptor &task, ExecutionContext &ctx) = 0;
};

/// Adapts a callable into an executor.
class FunctionExecutor : public IExecutor {
public:
  using Fn = std::function<Result<std::string, SchedulerError>(
      const TaskDescriptor &, ExecutionContext &)>;

  explicit FunctionExecutor(Fn fn, std::string name = "FunctionExecutor")
      : fn_(std::move(fn)), name_(std::move(name)) {}

  std::string name() const override { return name_; }

  Result<std::string, SchedulerError> run(const TaskDescriptor &task,
                                          ExecutionContext &ctx) override {
    if (!fn_) {
      return Result<std::string, SchedulerError>::Err(
          SchedulerError::Executor("FunctionExecutor has no callable", false));
    }
    return fn_(task, ctx);
  }

private:
  Fn fn_;
  std::string name_;
};

} // namespace tw::core
