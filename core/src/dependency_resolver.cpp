#include "core/dependency_resolver.h"

#include <utility>

namespace tw::core {

void DependencyResolver::set_resource_predicate(ResourcePredicate predicate) {
  std::lock_guard<std::mutex> lock(predicate_mutex_);
  resource_predicate_ = std::move(predicate);
}

bool DependencyResolver::is_satisfied(const Dependency &dependency) const {
  switch (dependency.type) {
  case DependencyType::Completion: {
    const auto status = view_.status_of(dependency.dependency_id);
    return status.has_value() && *status == ExecutionStatus::Completed;
  }
  case DependencyType::Start: {
    const auto status = view_.status_of(dependency.dependency_id);
    return status.has_value() && *status != ExecutionStatus::Pending;
  }
  case DependencyType::Output: {
    const auto stored = view_.result_of(dependency.dependency_id);
    if (!stored.has_value()) {
      return false;
    }
    return !dependency.expected_value.has_value() ||
           *stored == *dependency.expected_value;
  }
  case DependencyType::Resource: {
    ResourcePredicate predicate;
    {
      std::lock_guard<std::mutex> lock(predicate_mutex_);
      predicate = resource_predicate_;
    }
    return !predicate || predicate(dependency.resource);
  }
  }
  return false;
}

bool DependencyResolver::is_satisfied(const TaskExecution &execution) const {
  return !first_unmet(execution).has_value();
}

std::optional<Dependency>
DependencyResolver::first_unmet(const TaskExecution &execution) const {
  for (const auto &dep : execution.dependencies) {
    if (!is_satisfied(dep)) {
      return dep;
    }
  }
  return std::nullopt;
}

} // namespace tw::core
