#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace tw::core {

/// Description of the work behind a task_id. Owned by the registry; the
/// scheduler stores only the id and resolves the descriptor per attempt.
struct TaskDescriptor {
  std::string task_id;
  std::string description;
  std::string expected_output;
};

/// Task Registry capability consumed by the scheduler.
class ITaskRegistry {
public:
  virtual ~ITaskRegistry() = default;

  /// Resolve a descriptor, or nullopt when the task is unknown.
  [[nodiscard]] virtual std::optional<TaskDescriptor>
  resolve(const std::string &task_id) const = 0;
};

/// Thread-safe map-backed registry.
class InMemoryTaskRegistry : public ITaskRegistry {
public:
  /// Insert or replace a descriptor.
  void put(TaskDescriptor descriptor);

  [[nodiscard]] std::optional<TaskDescriptor>
  resolve(const std::string &task_id) const override;

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, TaskDescriptor> tasks_;
};

} // namespace tw::core
