#include "core/scheduler_error.h"

namespace tw::core {

const char *to_string(ErrorCategory category) {
  switch (category) {
  case ErrorCategory::Validation:
    return "Validation";
  case ErrorCategory::DependencyUnresolved:
    return "DependencyUnresolved";
  case ErrorCategory::Timeout:
    return "Timeout";
  case ErrorCategory::Executor:
    return "Executor";
  case ErrorCategory::RetriesExhausted:
    return "RetriesExhausted";
  case ErrorCategory::Canceled:
    return "Canceled";
  case ErrorCategory::ShuttingDown:
    return "ShuttingDown";
  case ErrorCategory::Internal:
    return "Internal";
  }
  return "Unknown";
}

} // namespace tw::core
