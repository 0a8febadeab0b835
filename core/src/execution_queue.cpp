#include "core/execution_queue.h"

#include <utility>

namespace tw::core {

bool ExecutionQueue::push(std::string execution_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return false;
    }
    items_.push_back(std::move(execution_id));
  }
  cv_.notify_one();
  return true;
}

std::optional<std::string> ExecutionQueue::pop() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this]() { return closed_ || !items_.empty(); });
  return take_front_locked();
}

std::optional<std::string>
ExecutionQueue::pop_for(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this]() { return closed_ || !items_.empty(); });
  return take_front_locked();
}

std::optional<std::string> ExecutionQueue::take_front_locked() {
  if (closed_ || items_.empty()) {
    return std::nullopt;
  }
  std::string id = std::move(items_.front());
  items_.pop_front();
  return id;
}

void ExecutionQueue::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    items_.clear();
  }
  cv_.notify_all();
}

size_t ExecutionQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return items_.size();
}

bool ExecutionQueue::empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return items_.empty();
}

bool ExecutionQueue::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

} // namespace tw::core
