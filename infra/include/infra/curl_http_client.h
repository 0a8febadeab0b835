#pragma once

#include "infra/http_client.h"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace tw::infra {

/// libcurl-backed HTTP client.
/// Each request gets its own easy handle, so one client may be shared by
/// every worker. Cancellation goes through the transfer progress callback.
class CurlHttpClient : public IHttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient &) = delete;
    CurlHttpClient &operator=(const CurlHttpClient &) = delete;

    tw::core::Result<HttpResponse, tw::core::SchedulerError> execute(
        const HttpRequest &request,
        std::shared_ptr<tw::core::CancelToken> cancel_token = nullptr) override;

    bool cancel(const std::string &request_id) override;

private:
    static HttpErrorCode classify_curl_error(int curl_code);

    std::mutex in_flight_mutex_;
    std::unordered_map<std::string, std::weak_ptr<tw::core::CancelToken>>
        in_flight_requests_;
};

} // namespace tw::infra
