#include "infra/http_client.h"

#include <charconv>
#include <system_error>

namespace tw::infra {

const char *to_string(HttpErrorCode code) {
    switch (code) {
    case HttpErrorCode::NETWORK_ERROR:
        return "NETWORK_ERROR";
    case HttpErrorCode::TIMEOUT:
        return "TIMEOUT";
    case HttpErrorCode::CANCELED:
        return "CANCELED";
    case HttpErrorCode::SERVER_ERROR:
        return "SERVER_ERROR";
    case HttpErrorCode::CLIENT_ERROR:
        return "CLIENT_ERROR";
    case HttpErrorCode::RATE_LIMIT:
        return "RATE_LIMIT";
    case HttpErrorCode::PARSE_ERROR:
        return "PARSE_ERROR";
    case HttpErrorCode::UNKNOWN:
        return "UNKNOWN";
    }
    return "UNKNOWN";
}

tw::core::SchedulerError make_http_error(HttpErrorCode code,
                                         const std::string &message,
                                         bool retryable) {
    tw::core::SchedulerError error;
    switch (code) {
    case HttpErrorCode::TIMEOUT:
        error = tw::core::SchedulerError::Timeout(message);
        break;
    case HttpErrorCode::CANCELED:
        error = tw::core::SchedulerError::Canceled(message);
        break;
    default:
        error = tw::core::SchedulerError::Executor(message);
        break;
    }
    error.retryable = retryable;
    error.details["http_error_code"] = std::to_string(static_cast<int>(code));
    error.details["http_error"] = to_string(code);
    return error;
}

HttpErrorCode http_error_code(const tw::core::SchedulerError &error) {
    const auto it = error.details.find("http_error_code");
    if (it == error.details.end()) {
        return HttpErrorCode::UNKNOWN;
    }

    int parsed = 0;
    const std::string &value = it->second;
    auto [ptr, ec] =
        std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        return HttpErrorCode::UNKNOWN;
    }
    return static_cast<HttpErrorCode>(parsed);
}

} // namespace tw::infra
