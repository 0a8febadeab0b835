#include "infra/curl_http_client.h"
#include <curl/curl.h>
#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace tw::infra {

namespace {
    // One-time global libcurl initialization.
    struct CurlGlobalInit {
        CurlGlobalInit() { curl_global_init(CURL_GLOBAL_ALL); }
        ~CurlGlobalInit() { curl_global_cleanup(); }
    };
    CurlGlobalInit g_curl_init;

    struct EasyDeleter {
        void operator()(CURL *handle) const { curl_easy_cleanup(handle); }
    };
    struct SlistDeleter {
        void operator()(curl_slist *list) const { curl_slist_free_all(list); }
    };

    /// Tokens polled by the progress callback: the caller's attempt token
    /// and the one cancel(request_id) signals.
    struct Transfer {
        std::shared_ptr<tw::core::CancelToken> caller;
        std::shared_ptr<tw::core::CancelToken> local;

        bool canceled() const {
            return (caller && caller->is_canceled()) ||
                   (local && local->is_canceled());
        }
    };

    size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
        auto *buffer = static_cast<std::string *>(userdata);
        const size_t total_size = size * nmemb;
        buffer->append(ptr, total_size);
        return total_size;
    }

    // Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
    int progress_callback(void *clientp, curl_off_t, curl_off_t, curl_off_t,
                          curl_off_t) {
        auto *transfer = static_cast<Transfer *>(clientp);
        return transfer && transfer->canceled() ? 1 : 0;
    }
}

CurlHttpClient::CurlHttpClient() {
    // A broken libcurl install fails at construction.
    std::unique_ptr<CURL, EasyDeleter> handle(curl_easy_init());
    if (!handle) {
        throw std::runtime_error("Failed to initialize CURL");
    }
}

CurlHttpClient::~CurlHttpClient() = default;

HttpErrorCode CurlHttpClient::classify_curl_error(int curl_code) {
    switch (curl_code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
            return HttpErrorCode::NETWORK_ERROR;

        case CURLE_OPERATION_TIMEDOUT:
            return HttpErrorCode::TIMEOUT;

        case CURLE_ABORTED_BY_CALLBACK:
            return HttpErrorCode::CANCELED;

        default:
            return HttpErrorCode::UNKNOWN;
    }
}

tw::core::Result<HttpResponse, tw::core::SchedulerError> CurlHttpClient::execute(
    const HttpRequest &request,
    std::shared_ptr<tw::core::CancelToken> cancel_token) {
    using Result = tw::core::Result<HttpResponse, tw::core::SchedulerError>;

    if (request.url.empty()) {
        return Result::Err(make_http_error(HttpErrorCode::CLIENT_ERROR,
                                           "HTTP request has no URL", false));
    }
    if (cancel_token && cancel_token->is_canceled()) {
        return Result::Err(make_http_error(
            HttpErrorCode::CANCELED, "Cancellation requested before HTTP call",
            false));
    }

    std::unique_ptr<CURL, EasyDeleter> curl(curl_easy_init());
    if (!curl) {
        return Result::Err(make_http_error(HttpErrorCode::UNKNOWN,
                                           "curl_easy_init failed", true));
    }

    Transfer transfer;
    transfer.caller = std::move(cancel_token);
    if (!request.request_id.empty()) {
        transfer.local = tw::core::CancelToken::create();
        std::lock_guard<std::mutex> lock(in_flight_mutex_);
        in_flight_requests_[request.request_id] = transfer.local;
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    const long timeout_ms = static_cast<long>(request.timeout.count());
    if (timeout_ms > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
        // Connect timeout is half the total budget.
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS,
                         std::max(1L, timeout_ms / 2));
    }

    if (request.method == HttpMethod::POST) {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE,
                         static_cast<long>(request.body.size()));
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    }

    curl_slist *raw_headers = nullptr;
    for (const auto &[key, value] : request.headers) {
        const std::string header = key + ": " + value;
        raw_headers = curl_slist_append(raw_headers, header.c_str());
    }
    std::unique_ptr<curl_slist, SlistDeleter> headers(raw_headers);
    if (headers) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }

    std::string response_buffer;
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION,
                     &write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_buffer);

    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION,
                     &progress_callback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &transfer);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);

    const auto start_time = std::chrono::steady_clock::now();
    const CURLcode res = curl_easy_perform(curl.get());
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    if (!request.request_id.empty()) {
        std::lock_guard<std::mutex> lock(in_flight_mutex_);
        in_flight_requests_.erase(request.request_id);
    }

    if (res != CURLE_OK) {
        const HttpErrorCode error_code = classify_curl_error(res);
        const std::string message = std::string("CURL error: ") +
                                    curl_easy_strerror(res) + " (code: " +
                                    std::to_string(res) + ")";
        auto error = make_http_error(error_code, message,
                                     error_code != HttpErrorCode::CANCELED);
        error.details["url"] = request.url;
        return Result::Err(std::move(error));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);

    if (http_code >= 500) {
        return Result::Err(make_http_error(
            HttpErrorCode::SERVER_ERROR,
            "HTTP " + std::to_string(http_code) + " response", true));
    }
    if (http_code == 429) {
        return Result::Err(make_http_error(HttpErrorCode::RATE_LIMIT,
                                           "HTTP 429 Rate Limit", true));
    }
    if (http_code >= 400) {
        return Result::Err(make_http_error(
            HttpErrorCode::CLIENT_ERROR,
            "HTTP " + std::to_string(http_code) + " response", false));
    }

    HttpResponse response;
    response.status_code = static_cast<int>(http_code);
    response.body = std::move(response_buffer);
    response.elapsed_ms = elapsed;
    return Result::Ok(std::move(response));
}

bool CurlHttpClient::cancel(const std::string &request_id) {
    std::shared_ptr<tw::core::CancelToken> token;
    {
        std::lock_guard<std::mutex> lock(in_flight_mutex_);
        auto it = in_flight_requests_.find(request_id);
        if (it == in_flight_requests_.end()) {
            return false;
        }
        token = it->second.lock();
    }
    if (!token || token->is_canceled()) {
        return false;
    }
    token->request_cancel();
    return true;
}

} // namespace tw::infra
