#include "core/task_registry.h"

#include <utility>

namespace tw::core {

void InMemoryTaskRegistry::put(TaskDescriptor descriptor) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::string key = descriptor.task_id;
  tasks_[key] = std::move(descriptor);
}

std::optional<TaskDescriptor>
InMemoryTaskRegistry::resolve(const std::string &task_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tasks_.find(task_id);
  if (it == tasks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace tw::core
