#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace tw::core {

/// FIFO channel of execution ids awaiting a worker.
///
/// Ids whose dependencies are unmet go back to the tail, so the effective
/// order is dependency-driven rather than submission order.
class ExecutionQueue {
public:
  ExecutionQueue() = default;

  ExecutionQueue(const ExecutionQueue &) = delete;
  ExecutionQueue &operator=(const ExecutionQueue &) = delete;

  /// Append an id. Returns false once the queue is closed.
  bool push(std::string execution_id);

  /// Block until an id is available. nullopt means closed.
  std::optional<std::string> pop();

  /// Like pop(), giving up after `timeout` (nullopt on timeout or close).
  std::optional<std::string> pop_for(std::chrono::milliseconds timeout);

  /// Reject further pushes and wake every waiting consumer. Ids still
  /// queued are dropped.
  void close();

  [[nodiscard]] size_t size() const;
  [[nodiscard]] bool empty() const;
  [[nodiscard]] bool closed() const;

private:
  std::optional<std::string> take_front_locked();

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::string> items_;
  bool closed_ = false;
};

} // namespace tw::core
