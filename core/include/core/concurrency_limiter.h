#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace tw::core {

/// Counting admission gate bounding how many task bodies run at once,
/// independent of the number of workers pulling from the queue.
class ConcurrencyLimiter {
public:
  explicit ConcurrencyLimiter(int capacity);

  ConcurrencyLimiter(const ConcurrencyLimiter &) = delete;
  ConcurrencyLimiter &operator=(const ConcurrencyLimiter &) = delete;

  /// Block until a unit is available. Returns false if the limiter was
  /// closed while waiting (no unit taken).
  bool acquire();

  /// Like acquire(), giving up after `timeout`.
  bool try_acquire_for(std::chrono::milliseconds timeout);

  /// Return one unit. Never raises available() above capacity().
  void release();

  /// Wake every waiter and make further acquisitions fail.
  void close();

  [[nodiscard]] int capacity() const noexcept { return capacity_; }
  [[nodiscard]] int available() const;
  [[nodiscard]] int in_use() const;
  [[nodiscard]] bool closed() const;

private:
  const int capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  int available_;
  bool closed_ = false;
};

/// RAII holder of one limiter unit.
class LimiterPermit {
public:
  LimiterPermit() = default;
  explicit LimiterPermit(ConcurrencyLimiter &limiter) : limiter_(&limiter) {}
  ~LimiterPermit() { reset(); }

  LimiterPermit(const LimiterPermit &) = delete;
  LimiterPermit &operator=(const LimiterPermit &) = delete;

  LimiterPermit(LimiterPermit &&other) noexcept : limiter_(other.limiter_) {
    other.limiter_ = nullptr;
  }
  LimiterPermit &operator=(LimiterPermit &&other) noexcept {
    if (this != &other) {
      reset();
      limiter_ = other.limiter_;
      other.limiter_ = nullptr;
    }
    return *this;
  }

  /// Release the unit now instead of at scope exit.
  void reset() {
    if (limiter_) {
      limiter_->release();
      limiter_ = nullptr;
    }
  }

  [[nodiscard]] bool held() const noexcept { return limiter_ != nullptr; }

private:
  ConcurrencyLimiter *limiter_ = nullptr;
};

} // namespace tw::core
