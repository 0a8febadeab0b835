#include "core/executor.h"
#include "core/logger.h"
#include "core/scheduler.h"
#include "core/task_registry.h"
#include "infra/config.h"
#include "infra/curl_http_client.h"
#include "infra/http_executor.h"
#include "infra/logger.h"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using tw::core::Dependency;
using tw::core::ExecutionStatus;
using tw::core::ScheduleRequest;

constexpr auto kDemoDeadline = std::chrono::seconds(60);

/// Executor used when no remote endpoint is configured: concatenates the
/// task description with the results of its dependencies.
std::shared_ptr<tw::core::IExecutor> make_echo_executor() {
  return std::make_shared<tw::core::FunctionExecutor>(
      [](const tw::core::TaskDescriptor &task, tw::core::ExecutionContext &ctx) {
        std::string out = task.description;
        for (const auto &[id, result] : ctx.dependency_results) {
          out += " <" + result + ">";
        }
        return tw::core::Result<std::string, tw::core::SchedulerError>::Ok(
            std::move(out));
      },
      "echo");
}

void register_demo_tasks(tw::core::InMemoryTaskRegistry &registry) {
  registry.put({"fetch", "fetch", ""});
  registry.put({"parse", "parse", ""});
  registry.put({"index", "index", ""});
  registry.put({"report", "report", ""});
}

} // namespace

int main() {
  auto bootstrap = std::shared_ptr<tw::core::ILogger>(
      tw::infra::create_console_logger());
  const auto settings = tw::infra::Settings::from_environment(bootstrap);

  std::shared_ptr<tw::core::ILogger> logger =
      tw::infra::create_console_logger(settings.log_level);

  auto registry = std::make_shared<tw::core::InMemoryTaskRegistry>();
  register_demo_tasks(*registry);

  auto scheduler =
      tw::core::create_scheduler(settings.scheduler, registry, logger);

  std::string executor_id = "echo";
  scheduler->register_executor("echo", make_echo_executor());
  if (!settings.executor_url.empty()) {
    try {
      auto http_client = std::make_shared<tw::infra::CurlHttpClient>();
      scheduler->register_executor(
          "http", std::make_shared<tw::infra::HttpExecutor>(
                      http_client, settings.executor_url, logger));
      executor_id = "http";
    } catch (const std::runtime_error &e) {
      logger->error("startup", "app", "http_executor_unavailable", e.what());
      return EXIT_FAILURE;
    }
  }

  scheduler->on_state_change(
      [logger](const std::string &execution_id, ExecutionStatus status) {
        logger->info(execution_id, "app", "state", tw::core::to_string(status));
      });

  // fetch -> {parse, index} -> report
  auto fetch = scheduler->schedule({"fetch", executor_id});
  if (fetch.is_err()) {
    logger->error("startup", "app", "schedule_failed", fetch.error().message);
    return EXIT_FAILURE;
  }
  const std::string fetch_id = fetch.value();

  ScheduleRequest parse{"parse", executor_id};
  parse.dependencies = {Dependency::completion(fetch_id)};
  ScheduleRequest index{"index", executor_id};
  index.dependencies = {Dependency::output(fetch_id)};
  auto middle = scheduler->schedule_batch({parse, index});
  if (!middle.rejected.empty() || middle.execution_ids.size() != 2) {
    logger->error("startup", "app", "schedule_failed",
                  "rejected " + std::to_string(middle.rejected.size()) +
                      " request(s)");
    return EXIT_FAILURE;
  }

  ScheduleRequest report{"report", executor_id};
  report.dependencies = {Dependency::completion(middle.execution_ids[0]),
                         Dependency::completion(middle.execution_ids[1])};
  auto report_id = scheduler->schedule(report);
  if (report_id.is_err()) {
    logger->error("startup", "app", "schedule_failed",
                  report_id.error().message);
    return EXIT_FAILURE;
  }

  if (!scheduler->wait_idle(kDemoDeadline)) {
    logger->error("app", "app", "deadline",
                  "executions still pending after deadline");
    scheduler->shutdown();
    return EXIT_FAILURE;
  }

  std::vector<std::string> ids = {fetch_id, middle.execution_ids[0],
                                  middle.execution_ids[1], report_id.value()};
  bool all_completed = true;
  for (const auto &id : ids) {
    const auto status = scheduler->get_status(id);
    if (!status.has_value()) {
      all_completed = false;
      continue;
    }
    std::cout << id << " " << status->task_id << " "
              << tw::core::to_string(status->status) << " "
              << status->result.value_or(status->error.value_or("")) << "\n";
    all_completed = all_completed && status->status == ExecutionStatus::Completed;
  }

  const auto stats = scheduler->stats();
  logger->info("app", "app", "summary",
               "succeeded=" + std::to_string(stats.succeeded) +
                   " failed=" + std::to_string(stats.failed) +
                   " cancelled=" + std::to_string(stats.cancelled));

  scheduler->shutdown();
  return all_completed ? EXIT_SUCCESS : EXIT_FAILURE;
}
