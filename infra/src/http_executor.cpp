#include "infra/http_executor.h"

#include <cstdio>
#include <map>
#include <regex>
#include <sstream>

namespace tw::infra {

namespace {

std::string json_escape(const std::string &in) {
    std::string out;
    out.reserve(in.size() + 2);
    for (const char c : in) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                out += buf;
            } else {
                out += c;
            }
            break;
        }
    }
    return out;
}

// Four hex digits at in[pos], or -1.
long parse_hex4(const std::string &in, size_t pos) {
    if (pos + 4 > in.size()) {
        return -1;
    }
    long value = 0;
    for (size_t i = pos; i < pos + 4; ++i) {
        const char c = in[i];
        value <<= 4;
        if (c >= '0' && c <= '9') {
            value |= c - '0';
        } else if (c >= 'a' && c <= 'f') {
            value |= c - 'a' + 10;
        } else if (c >= 'A' && c <= 'F') {
            value |= c - 'A' + 10;
        } else {
            return -1;
        }
    }
    return value;
}

void append_utf8(std::string &out, unsigned long cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string json_unescape(const std::string &in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] != '\\' || i + 1 == in.size()) {
            out += in[i];
            continue;
        }
        const char next = in[++i];
        switch (next) {
        case 'n':
            out += '\n';
            break;
        case 'r':
            out += '\r';
            break;
        case 't':
            out += '\t';
            break;
        case 'b':
            out += '\b';
            break;
        case 'f':
            out += '\f';
            break;
        case 'u': {
            const long unit = parse_hex4(in, i + 1);
            if (unit < 0) {
                // Malformed escape, keep the raw text.
                out += "\\u";
                break;
            }
            i += 4;
            unsigned long cp = static_cast<unsigned long>(unit);
            if (cp >= 0xD800 && cp <= 0xDBFF && i + 2 < in.size() &&
                in[i + 1] == '\\' && in[i + 2] == 'u') {
                const long low = parse_hex4(in, i + 3);
                if (low >= 0xDC00 && low <= 0xDFFF) {
                    cp = 0x10000 + ((cp - 0xD800) << 10) +
                         (static_cast<unsigned long>(low) - 0xDC00);
                    i += 6;
                }
            }
            if (cp >= 0xD800 && cp <= 0xDFFF) {
                cp = 0xFFFD; // unpaired surrogate
            }
            append_utf8(out, cp);
            break;
        }
        default:
            // \" \\ \/ and unknown escapes
            out += next;
            break;
        }
    }
    return out;
}

} // namespace

HttpExecutor::HttpExecutor(std::shared_ptr<IHttpClient> http_client,
                           std::string endpoint_url,
                           std::shared_ptr<tw::core::ILogger> logger)
    : http_client_(std::move(http_client)),
      endpoint_url_(std::move(endpoint_url)), logger_(std::move(logger)) {}

std::string HttpExecutor::build_request_body(
    const tw::core::TaskDescriptor &task, const tw::core::ExecutionContext &ctx) {
    // Sorted so the document is stable across runs.
    const std::map<std::string, std::string> deps(ctx.dependency_results.begin(),
                                                  ctx.dependency_results.end());

    std::ostringstream body;
    body << "{"
         << "\"execution_id\":\"" << json_escape(ctx.execution_id) << "\","
         << "\"task_id\":\"" << json_escape(task.task_id) << "\","
         << "\"attempt\":" << ctx.attempt << ","
         << "\"description\":\"" << json_escape(task.description) << "\","
         << "\"expected_output\":\"" << json_escape(task.expected_output)
         << "\","
         << "\"dependency_results\":{";
    bool first = true;
    for (const auto &[id, result] : deps) {
        if (!first) {
            body << ",";
        }
        first = false;
        body << "\"" << json_escape(id) << "\":\"" << json_escape(result)
             << "\"";
    }
    body << "}}";
    return body.str();
}

std::string HttpExecutor::extract_result(const std::string &body) {
    static const std::regex pattern(
        "\"result\"\\s*:\\s*\"((?:[^\"\\\\]|\\\\.)*)\"");
    std::smatch match;
    if (std::regex_search(body, match, pattern) && match.size() > 1) {
        return json_unescape(match[1].str());
    }
    return body;
}

tw::core::Result<std::string, tw::core::SchedulerError>
HttpExecutor::run(const tw::core::TaskDescriptor &task,
                  tw::core::ExecutionContext &ctx) {
    using Result = tw::core::Result<std::string, tw::core::SchedulerError>;

    if (!http_client_) {
        return Result::Err(tw::core::SchedulerError::Executor(
            "HttpExecutor has no HTTP client", false));
    }
    if (endpoint_url_.empty()) {
        return Result::Err(tw::core::SchedulerError::Executor(
            "HttpExecutor has no endpoint URL", false));
    }

    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = endpoint_url_;
    request.trace_id = ctx.execution_id;
    request.request_id =
        ctx.execution_id + "#" + std::to_string(ctx.attempt);
    request.headers["Content-Type"] = "application/json";
    request.headers["X-Trace-Id"] = ctx.execution_id;
    if (ctx.timeout.count() > 0) {
        request.timeout = ctx.timeout;
    }
    request.body = build_request_body(task, ctx);

    auto response = http_client_->execute(request, ctx.cancel_token);
    if (response.is_err()) {
        auto error = response.error();
        error.details["task_id"] = task.task_id;
        if (logger_) {
            logger_->warn(ctx.execution_id, "http_executor", "request_failed",
                          "url=" + endpoint_url_ + " error=" + error.message);
        }
        return Result::Err(std::move(error));
    }

    const auto &reply = response.value();
    if (logger_) {
        logger_->info(ctx.execution_id, "http_executor", "request_completed",
                      "status=" + std::to_string(reply.status_code) +
                          " elapsed_ms=" +
                          std::to_string(reply.elapsed_ms.count()));
    }
    return Result::Ok(extract_result(reply.body));
}

} // namespace tw::infra
