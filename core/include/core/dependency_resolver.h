#pragma once

#include "core/task_execution.h"

#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace tw::core {

/// Read-only view of execution state the resolver evaluates against.
/// StatusStore implements it; tests can supply a fake.
class IDependencyView {
public:
  virtual ~IDependencyView() = default;

  /// Status of a known execution, nullopt if the id is absent everywhere.
  [[nodiscard]] virtual std::optional<ExecutionStatus>
  status_of(const std::string &execution_id) const = 0;

  /// Stored result of a successfully completed execution.
  [[nodiscard]] virtual std::optional<std::string>
  result_of(const std::string &execution_id) const = 0;
};

/// Availability predicate for RESOURCE dependencies, keyed by resource.
using ResourcePredicate = std::function<bool(const std::string &resource)>;

/// Decides whether an execution's dependencies currently hold (logical AND).
///
///   COMPLETION  dependency finished with status completed; failed or
///               cancelled never satisfy it, so the dependent waits until
///               it is cancelled itself.
///   START       dependency is running or finished.
///   OUTPUT      dependency has a stored result, equal to expected_value
///               when one is given.
///   RESOURCE    installed predicate for dependency.resource; true when no
///               predicate is installed.
///
/// An id unknown to the view never satisfies anything.
class DependencyResolver {
public:
  explicit DependencyResolver(const IDependencyView &view) : view_(view) {}

  void set_resource_predicate(ResourcePredicate predicate);

  [[nodiscard]] bool is_satisfied(const Dependency &dependency) const;
  [[nodiscard]] bool is_satisfied(const TaskExecution &execution) const;

  /// First dependency that does not hold, for diagnostics.
  [[nodiscard]] std::optional<Dependency>
  first_unmet(const TaskExecution &execution) const;

private:
  const IDependencyView &view_;
  mutable std::mutex predicate_mutex_;
  ResourcePredicate resource_predicate_;
};

} // namespace tw::core
