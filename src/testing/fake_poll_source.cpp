/**
 * @file fake_poll_source.cpp
 * @brief Queued PollSource implementation
 */

#include <opsdeck_cpp/testing/fake_poll_source.hpp>

namespace opsdeck {
namespace testing {

void FakePollSource::fetch_jobs(JobsCallback done) {
    ++fetch_count_;
    jobs_requests_.push_back(std::move(done));
}

void FakePollSource::fetch_workflow_state(const std::string& repo, int issue_num,
                                          WorkflowCallback done) {
    workflow_targets_.emplace_back(repo, issue_num);
    workflow_requests_.push_back(std::move(done));
}

void FakePollSource::cancel() {
    ++cancel_count_;
    jobs_requests_.clear();
    workflow_requests_.clear();
}

bool FakePollSource::complete_jobs(Result<std::vector<Job>> result) {
    if (jobs_requests_.empty()) {
        return false;
    }
    auto done = std::move(jobs_requests_.front());
    jobs_requests_.pop_front();
    done(std::move(result));
    return true;
}

bool FakePollSource::complete_workflow(Result<WorkflowState> result) {
    if (workflow_requests_.empty()) {
        return false;
    }
    auto done = std::move(workflow_requests_.front());
    workflow_requests_.pop_front();
    done(std::move(result));
    return true;
}

} // namespace testing
} // namespace opsdeck
