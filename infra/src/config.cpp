#include "infra/config.h"

#include "infra/logger.h"

#include <cstdlib>
#include <limits>

namespace tw::infra {

namespace {

void warn_invalid(const std::shared_ptr<tw::core::ILogger> &logger,
                  const char *name, const char *raw,
                  const std::string &fallback) {
    if (logger) {
        logger->warn("startup", "config", "config_invalid",
                     std::string("Invalid value for ") + name + "=" + raw +
                         ", fallback=" + fallback);
    }
}

int parse_env_int(const char *name, int fallback, bool allow_zero,
                  const std::shared_ptr<tw::core::ILogger> &logger) {
    const char *raw = std::getenv(name);
    if (!raw || raw[0] == 0) {
        return fallback;
    }

    char *end = nullptr;
    const long value = std::strtol(raw, &end, 10);
    const bool valid = end && *end == 0 &&
                       (allow_zero ? value >= 0 : value > 0) &&
                       value <= std::numeric_limits<int>::max();
    if (!valid) {
        warn_invalid(logger, name, raw, std::to_string(fallback));
        return fallback;
    }
    return static_cast<int>(value);
}

bool parse_env_bool(const char *name, bool fallback,
                    const std::shared_ptr<tw::core::ILogger> &logger) {
    const char *raw = std::getenv(name);
    if (!raw || raw[0] == 0) {
        return fallback;
    }
    const std::string value(raw);
    if (value == "1" || value == "true") {
        return true;
    }
    if (value == "0" || value == "false") {
        return false;
    }
    warn_invalid(logger, name, raw, fallback ? "1" : "0");
    return fallback;
}

} // namespace

Settings Settings::from_environment(
    const std::shared_ptr<tw::core::ILogger> &logger) {
    using std::chrono::milliseconds;

    Settings settings;
    auto &cfg = settings.scheduler;

    cfg.worker_count =
        parse_env_int("TW_SCHED_WORKERS", cfg.worker_count, true, logger);
    cfg.max_concurrent_tasks = parse_env_int(
        "TW_SCHED_MAX_CONCURRENT", cfg.max_concurrent_tasks, true, logger);
    cfg.default_max_retries = parse_env_int(
        "TW_SCHED_MAX_RETRIES", cfg.default_max_retries, true, logger);
    cfg.retry_failed_tasks =
        parse_env_bool("TW_SCHED_RETRY_FAILED", cfg.retry_failed_tasks, logger);
    cfg.default_timeout = milliseconds(parse_env_int(
        "TW_SCHED_TIMEOUT_MS", static_cast<int>(cfg.default_timeout.count()),
        false, logger));
    cfg.dependency_poll_interval = milliseconds(parse_env_int(
        "TW_SCHED_POLL_MS",
        static_cast<int>(cfg.dependency_poll_interval.count()), false, logger));
    cfg.retry_backoff.initial = milliseconds(parse_env_int(
        "TW_SCHED_BACKOFF_MS",
        static_cast<int>(cfg.retry_backoff.initial.count()), true, logger));
    cfg.retry_backoff.max = milliseconds(parse_env_int(
        "TW_SCHED_BACKOFF_MAX_MS",
        static_cast<int>(cfg.retry_backoff.max.count()), false, logger));
    cfg.completed_retention = static_cast<size_t>(parse_env_int(
        "TW_SCHED_RETENTION", static_cast<int>(cfg.completed_retention), true,
        logger));

    if (const char *url = std::getenv("TW_EXECUTOR_URL"); url && url[0] != 0) {
        settings.executor_url = url;
    }

    if (const char *level = std::getenv("TW_LOG_LEVEL");
        level && level[0] != 0) {
        if (is_valid_log_level(level)) {
            settings.log_level = level;
        } else {
            warn_invalid(logger, "TW_LOG_LEVEL", level, settings.log_level);
        }
    }

    return settings;
}

} // namespace tw::infra
