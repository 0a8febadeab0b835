#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace tw::core {

/// Cooperative cancellation signal for one executor attempt.
///
/// The scheduler signals it when it abandons an attempt (timeout) or shuts
/// down. Executors poll is_canceled() or register an on_cancel() hook; the
/// scheduler never interrupts a running call.
class CancelToken {
public:
  CancelToken() = default;

  /// Signal cancellation. Thread-safe, idempotent; hooks run once, on the
  /// calling thread.
  void request_cancel() noexcept;

  [[nodiscard]] bool is_canceled() const noexcept;

  /// Register a hook. Runs immediately if the token is already signalled.
  using Callback = std::function<void()>;
  void on_cancel(Callback cb);

  static std::shared_ptr<CancelToken> create();

private:
  std::atomic<bool> canceled_{false};
  std::mutex cb_mutex_;
  std::vector<Callback> callbacks_;
};

} // namespace tw::core
