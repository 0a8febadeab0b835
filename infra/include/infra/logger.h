#pragma once

#include "core/logger.h"

#include <memory>
#include <string>

namespace tw::infra {

/// spdlog-backed console logger.
/// Format: [ts] [level] [trace_id] [component] event: msg
///
/// `level` is an spdlog level name (trace, debug, info, warn, error,
/// critical, off); unknown names fall back to info.
std::unique_ptr<tw::core::ILogger>
create_console_logger(const std::string &level = "info");

/// True if `level` is a level name spdlog understands.
bool is_valid_log_level(const std::string &level);

} // namespace tw::infra
