#pragma once

#include <string>

namespace tw::core {

/// Structured logger used by the scheduler. The trace id is the execution
/// id (or a fixed tag for scheduler-wide events). Concrete backends live in
/// infra; a null logger pointer disables logging.
class ILogger {
public:
  virtual ~ILogger() = default;

  virtual void info(const std::string &trace_id, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void warn(const std::string &trace_id, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void error(const std::string &trace_id, const std::string &component,
                     const std::string &event, const std::string &msg) = 0;
};

} // namespace tw::core
