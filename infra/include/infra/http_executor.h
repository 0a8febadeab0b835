#pragma once

#include "core/executor.h"
#include "core/logger.h"
#include "infra/http_client.h"

#include <memory>
#include <string>

namespace tw::infra {

/// Executor that delegates a task to a remote worker over HTTP.
///
/// POSTs a JSON document describing the attempt:
///   {"execution_id", "task_id", "attempt", "description",
///    "expected_output", "dependency_results": {id: result}}
/// and returns the string "result" field of the reply, or the whole body
/// when the reply has no such field. The request timeout is the attempt
/// timeout and the attempt token aborts the transfer.
class HttpExecutor : public tw::core::IExecutor {
public:
    HttpExecutor(std::shared_ptr<IHttpClient> http_client,
                 std::string endpoint_url,
                 std::shared_ptr<tw::core::ILogger> logger = nullptr);

    std::string name() const override { return "HttpExecutor"; }

    tw::core::Result<std::string, tw::core::SchedulerError>
    run(const tw::core::TaskDescriptor &task,
        tw::core::ExecutionContext &ctx) override;

    /// Request body for one attempt.
    static std::string build_request_body(const tw::core::TaskDescriptor &task,
                                          const tw::core::ExecutionContext &ctx);

    /// Value of the top-level "result" string field, body itself otherwise.
    static std::string extract_result(const std::string &body);

private:
    std::shared_ptr<IHttpClient> http_client_;
    std::string endpoint_url_;
    std::shared_ptr<tw::core::ILogger> logger_;
};

} // namespace tw::infra
