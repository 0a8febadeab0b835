#include "core/concurrency_limiter.h"

#include <algorithm>

namespace tw::core {

ConcurrencyLimiter::ConcurrencyLimiter(int capacity)
    : capacity_(std::max(1, capacity)), available_(capacity_) {}

bool ConcurrencyLimiter::acquire() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this]() { return closed_ || available_ > 0; });
  if (closed_) {
    return false;
  }
  --available_;
  return true;
}

bool ConcurrencyLimiter::try_acquire_for(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  const bool ready = cv_.wait_for(
      lock, timeout, [this]() { return closed_ || available_ > 0; });
  if (!ready || closed_) {
    return false;
  }
  --available_;
  return true;
}

void ConcurrencyLimiter::release() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    available_ = std::min(capacity_, available_ + 1);
  }
  cv_.notify_one();
}

void ConcurrencyLimiter::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

int ConcurrencyLimiter::available() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return available_;
}

int ConcurrencyLimiter::in_use() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return capacity_ - available_;
}

bool ConcurrencyLimiter::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

} // namespace tw::core
