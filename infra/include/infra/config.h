#pragma once

#include "core/logger.h"
#include "core/scheduler.h"

#include <memory>
#include <string>

namespace tw::infra {

/// Process settings, read from TW_* environment variables.
///
///   TW_SCHED_WORKERS         worker_count (0 = auto)
///   TW_SCHED_MAX_CONCURRENT  max_concurrent_tasks (0 = worker_count)
///   TW_SCHED_MAX_RETRIES     default_max_retries
///   TW_SCHED_RETRY_FAILED    retry_failed_tasks (0/1)
///   TW_SCHED_TIMEOUT_MS      default_timeout
///   TW_SCHED_POLL_MS         dependency_poll_interval
///   TW_SCHED_BACKOFF_MS      retry_backoff.initial (0 disables backoff)
///   TW_SCHED_BACKOFF_MAX_MS  retry_backoff.max
///   TW_SCHED_RETENTION       completed_retention (0 = unbounded)
///   TW_EXECUTOR_URL          endpoint of the HTTP executor
///   TW_LOG_LEVEL             spdlog level name
///
/// Invalid values are reported through `logger` and replaced by the
/// default.
struct Settings {
    tw::core::SchedulerConfig scheduler;
    std::string executor_url;
    std::string log_level = "info";

    static Settings
    from_environment(const std::shared_ptr<tw::core::ILogger> &logger = nullptr);
};

} // namespace tw::infra
