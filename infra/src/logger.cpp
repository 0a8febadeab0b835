#include "infra/logger.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace tw::infra {

namespace {

const char *const kLoggerName = "taskweave";

/// ConsoleLogger: spdlog-based structured logger.
class ConsoleLogger : public tw::core::ILogger {
public:
  explicit ConsoleLogger(spdlog::level::level_enum level) {
    logger_ = spdlog::get(kLoggerName);
    if (!logger_) {
      logger_ = spdlog::stdout_color_mt(kLoggerName);
    }
    logger_->set_pattern("[%Y-%m-%dT%H:%M:%S.%e%z] [%^%l%$] %v");
    logger_->set_level(level);
  }

  void info(const std::string &trace_id, const std::string &component,
            const std::string &event, const std::string &msg) override {
    logger_->info("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

  void warn(const std::string &trace_id, const std::string &component,
            const std::string &event, const std::string &msg) override {
    logger_->warn("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

  void error(const std::string &trace_id, const std::string &component,
             const std::string &event, const std::string &msg) override {
    logger_->error("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

private:
  std::shared_ptr<spdlog::logger> logger_;
};

} // namespace

bool is_valid_log_level(const std::string &level) {
  // from_str maps unknown names to off, so "off" itself must be matched.
  return level == "off" ||
         spdlog::level::from_str(level) != spdlog::level::off;
}

std::unique_ptr<tw::core::ILogger>
create_console_logger(const std::string &level) {
  const auto parsed = is_valid_log_level(level) ? spdlog::level::from_str(level)
                                                : spdlog::level::info;
  return std::make_unique<ConsoleLogger>(parsed);
}

} // namespace tw::infra
