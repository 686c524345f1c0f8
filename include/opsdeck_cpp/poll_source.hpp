/**
 * @file poll_source.hpp
 * @brief Request/response access to the job status endpoints
 */

#pragma once

#include <opsdeck_cpp/error.hpp>
#include <opsdeck_cpp/scheduler.hpp>
#include <opsdeck_cpp/types.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace opsdeck {

/**
 * @brief Asynchronous source of full job snapshots
 *
 * Callbacks run on the event loop. After cancel(), callbacks of requests
 * already in flight are dropped.
 */
class PollSource {
public:
    using JobsCallback = std::function<void(Result<std::vector<Job>>)>;
    using WorkflowCallback = std::function<void(Result<WorkflowState>)>;

    virtual ~PollSource() = default;

    /// GET the full job set
    virtual void fetch_jobs(JobsCallback done) = 0;

    /// GET server-side workflow state for one issue
    virtual void fetch_workflow_state(const std::string& repo, int issue_num,
                                      WorkflowCallback done) = 0;

    virtual void cancel() = 0;
};

struct HttpPollOptions {
    std::chrono::milliseconds request_timeout{30000};
    int max_retries = 2;
    std::chrono::milliseconds retry_delay{500};   // multiplied by the attempt number
};

/**
 * @brief PollSource over HTTP/1.1 using Boost.Beast
 *
 * Endpoints: GET /api/status and GET /issues/<repo>/<num>/workflow.
 * Each request is bounded by request_timeout (reported as TIMEOUT).
 * Connection failures, timeouts and 5xx answers are retried up to
 * max_retries times, waiting retry_delay * attempt in between.
 *
 * Status mapping: 404 NotFound, 409 AlreadyExists, 401 Unauthenticated,
 * 403 PermissionDenied, other 4xx InvalidArgument, 5xx SERVER_ERROR,
 * unparseable body INVALID_MESSAGE.
 */
class HttpPollSource : public PollSource {
public:
    HttpPollSource(boost::asio::io_context& io, Scheduler& scheduler,
                   std::string base_url, HttpPollOptions options = {});
    ~HttpPollSource() override;

    void fetch_jobs(JobsCallback done) override;
    void fetch_workflow_state(const std::string& repo, int issue_num,
                              WorkflowCallback done) override;
    void cancel() override;

private:
    using BodyCallback = std::function<void(Result<std::string>)>;

    void get(const std::string& target, BodyCallback done);
    void attempt(const std::string& target, int attempt, BodyCallback done);

    boost::asio::io_context& io_;
    Scheduler& scheduler_;
    std::string base_url_;
    HttpPollOptions options_;

    // Replaced on cancel(); in-flight requests hold the old one
    std::shared_ptr<bool> alive_;
};

}  // namespace opsdeck
