#pragma once
#include "core/cancel_token.h"
#include "core/result.h"
#include "core/scheduler_error.h"
#include <chrono>
#include <map>
#include <memory>
#include <string>

namespace tw::infra {

enum class HttpMethod {
    GET,
    POST
};

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    std::string trace_id;    // Execution id of the calling attempt
    std::string request_id;  // Key for cancel(); may be empty
    std::chrono::milliseconds timeout{30000};
};

struct HttpResponse {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::string body;
    std::chrono::milliseconds elapsed_ms{0};
};

/// Transport-level failure classes, kept in SchedulerError::details
/// under "http_error_code".
enum class HttpErrorCode {
    NETWORK_ERROR = 1001,  // DNS failure, connection refused, send/recv error
    TIMEOUT = 1002,
    CANCELED = 1003,       // Attempt token signalled
    SERVER_ERROR = 1004,   // 5xx
    CLIENT_ERROR = 1005,   // 4xx except 429
    RATE_LIMIT = 1006,     // 429
    PARSE_ERROR = 1007,
    UNKNOWN = 1999
};

const char *to_string(HttpErrorCode code);

/// Map an HTTP failure onto a scheduler error. Timeouts become Timeout,
/// cancellation Canceled, everything else Executor.
tw::core::SchedulerError make_http_error(HttpErrorCode code,
                                         const std::string &message,
                                         bool retryable);

/// HttpErrorCode recorded in an error built by make_http_error, UNKNOWN
/// otherwise.
HttpErrorCode http_error_code(const tw::core::SchedulerError &error);

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual tw::core::Result<HttpResponse, tw::core::SchedulerError> get(
        const HttpRequest &request,
        std::shared_ptr<tw::core::CancelToken> cancel_token = nullptr) {
        HttpRequest req = request;
        req.method = HttpMethod::GET;
        return execute(req, std::move(cancel_token));
    }

    virtual tw::core::Result<HttpResponse, tw::core::SchedulerError> post(
        const HttpRequest &request,
        std::shared_ptr<tw::core::CancelToken> cancel_token = nullptr) {
        HttpRequest req = request;
        req.method = HttpMethod::POST;
        return execute(req, std::move(cancel_token));
    }

    /// Abort an in-flight request by request_id. False if none matched.
    virtual bool cancel(const std::string &request_id) = 0;

    /// Blocking call. Non-2xx statuses are reported as errors.
    virtual tw::core::Result<HttpResponse, tw::core::SchedulerError> execute(
        const HttpRequest &request,
        std::shared_ptr<tw::core::CancelToken> cancel_token = nullptr) = 0;
};

} // namespace tw::infra
