#include <gtest/gtest.h>

#include "core/dependency_resolver.h"

#include <optional>
#include <string>
#include <unordered_map>

using namespace tw::core;

namespace {

class FakeView : public IDependencyView {
public:
  std::unordered_map<std::string, ExecutionStatus> statuses;
  std::unordered_map<std::string, std::string> results;

  std::optional<ExecutionStatus>
  status_of(const std::string &id) const override {
    auto it = statuses.find(id);
    if (it == statuses.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::optional<std::string> result_of(const std::string &id) const override {
    auto it = results.find(id);
    if (it == results.end()) {
      return std::nullopt;
    }
    return it->second;
  }
};

TaskExecution with_deps(std::vector<Dependency> deps) {
  TaskExecution e;
  e.id = "dependent";
  e.dependencies = std::move(deps);
  return e;
}

} // namespace

TEST(DependencyResolver, CompletionRequiresCompleted) {
  FakeView view;
  DependencyResolver resolver(view);
  const auto dep = Dependency::completion("a");

  EXPECT_FALSE(resolver.is_satisfied(dep)); // unknown id

  for (auto s : {ExecutionStatus::Pending, ExecutionStatus::Running,
                 ExecutionStatus::Failed, ExecutionStatus::Cancelled}) {
    view.statuses["a"] = s;
    EXPECT_FALSE(resolver.is_satisfied(dep)) << to_string(s);
  }

  view.statuses["a"] = ExecutionStatus::Completed;
  EXPECT_TRUE(resolver.is_satisfied(dep));
}

TEST(DependencyResolver, StartAcceptsRunningOrFinished) {
  FakeView view;
  DependencyResolver resolver(view);
  const auto dep = Dependency::start("a");

  EXPECT_FALSE(resolver.is_satisfied(dep));
  view.statuses["a"] = ExecutionStatus::Pending;
  EXPECT_FALSE(resolver.is_satisfied(dep));

  for (auto s : {ExecutionStatus::Running, ExecutionStatus::Completed,
                 ExecutionStatus::Failed, ExecutionStatus::Cancelled}) {
    view.statuses["a"] = s;
    EXPECT_TRUE(resolver.is_satisfied(dep)) << to_string(s);
  }
}

TEST(DependencyResolver, OutputWithoutExpectedValue) {
  FakeView view;
  DependencyResolver resolver(view);
  const auto dep = Dependency::output("a");

  view.statuses["a"] = ExecutionStatus::Completed;
  EXPECT_FALSE(resolver.is_satisfied(dep)); // no stored result

  view.results["a"] = "";
  EXPECT_TRUE(resolver.is_satisfied(dep));
}

TEST(DependencyResolver, OutputWithExpectedValueMustMatchExactly) {
  FakeView view;
  DependencyResolver resolver(view);
  view.statuses["a"] = ExecutionStatus::Completed;
  view.results["a"] = "42";

  EXPECT_TRUE(resolver.is_satisfied(Dependency::output("a", std::string("42"))));
  EXPECT_FALSE(resolver.is_satisfied(Dependency::output("a", std::string("43"))));
  EXPECT_FALSE(resolver.is_satisfied(Dependency::output("a", std::string("42 "))));
}

TEST(DependencyResolver, ResourceDefaultsToAvailable) {
  FakeView view;
  DependencyResolver resolver(view);
  EXPECT_TRUE(resolver.is_satisfied(Dependency::on_resource("gpu")));
}

TEST(DependencyResolver, ResourcePredicateIsConsulted) {
  FakeView view;
  DependencyResolver resolver(view);
  resolver.set_resource_predicate(
      [](const std::string &resource) { return resource == "cpu"; });

  EXPECT_TRUE(resolver.is_satisfied(Dependency::on_resource("cpu")));
  EXPECT_FALSE(resolver.is_satisfied(Dependency::on_resource("gpu")));

  resolver.set_resource_predicate(nullptr);
  EXPECT_TRUE(resolver.is_satisfied(Dependency::on_resource("gpu")));
}

TEST(DependencyResolver, AllDependenciesMustHold) {
  FakeView view;
  DependencyResolver resolver(view);
  view.statuses["a"] = ExecutionStatus::Completed;
  view.statuses["b"] = ExecutionStatus::Running;

  auto e = with_deps({Dependency::completion("a"), Dependency::completion("b")});
  EXPECT_FALSE(resolver.is_satisfied(e));

  auto unmet = resolver.first_unmet(e);
  ASSERT_TRUE(unmet.has_value());
  EXPECT_EQ(unmet->dependency_id, "b");

  view.statuses["b"] = ExecutionStatus::Completed;
  EXPECT_TRUE(resolver.is_satisfied(e));
  EXPECT_FALSE(resolver.first_unmet(e).has_value());
}

TEST(DependencyResolver, NoDependenciesIsSatisfied) {
  FakeView view;
  DependencyResolver resolver(view);
  EXPECT_TRUE(resolver.is_satisfied(with_deps({})));
}
