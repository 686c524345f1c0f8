/**
 * @file test_job_codec.cpp
 * @brief Unit tests for job record parsing, workflow state and push merging
 */

#include <gtest/gtest.h>
#include <glog/logging.h>
#include <opsdeck_cpp/job_codec.hpp>

using namespace opsdeck;

class JobCodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!google::IsGoogleLoggingInitialized()) {
            google::InitGoogleLogging("test");
            FLAGS_logtostderr = 1;
        }
    }
};

TEST_F(JobCodecTest, ParsesObjectKeyedById) {
    auto jobs = parse_status_body(R"({
        "org-app-42": {"status":"running","command":"plan-headless","start_time":1700000000,
                       "repo":"org/app","issue_title":"Fix login","issue_num":42},
        "org-app-43": {"status":"completed","command":"implement-headless",
                       "start_time":1700000100.5,"repo":"org/app","issue_num":43,
                       "completed_time":1700000200,
                       "cost":{"total_usd":1.5,"input_tokens":1000,"model":"m1"}},
        "broken": "not an object"
    })");
    ASSERT_TRUE(jobs.ok()) << jobs.status();
    ASSERT_EQ(jobs->size(), 2u);

    const Job& first = (*jobs)[0];
    EXPECT_EQ(first.issue_id, "org-app-42");
    EXPECT_EQ(first.status, JobStatus::RUNNING);
    EXPECT_EQ(first.command, "plan-headless");
    EXPECT_DOUBLE_EQ(first.start_time, 1700000000.0);
    EXPECT_EQ(first.repo, "org/app");
    EXPECT_EQ(first.issue_title, "Fix login");
    EXPECT_EQ(first.issue_num, 42);
    EXPECT_FALSE(first.cost.has_value());

    const Job& second = (*jobs)[1];
    EXPECT_DOUBLE_EQ(second.start_time, 1700000100.5);
    EXPECT_EQ(second.completed_time, 1700000200.0);
    ASSERT_TRUE(second.cost.has_value());
    EXPECT_DOUBLE_EQ(second.cost->total_usd, 1.5);
    EXPECT_EQ(second.cost->input_tokens, 1000);
    EXPECT_EQ(second.cost->output_tokens, 0);
    EXPECT_EQ(second.cost->model, "m1");
}

TEST_F(JobCodecTest, ParsesArrayWithEitherIdSpelling) {
    auto jobs = parse_status_body(R"([
        {"issue_id":"a","status":"failed","error":"boom"},
        {"issueId":"b","status":"waitingApproval"},
        {"status":"running"},
        {"issue_id":"","status":"running"},
        42
    ])");
    ASSERT_TRUE(jobs.ok());
    ASSERT_EQ(jobs->size(), 2u);
    EXPECT_EQ((*jobs)[0].issue_id, "a");
    EXPECT_EQ((*jobs)[0].error, "boom");
    EXPECT_EQ((*jobs)[1].issue_id, "b");
    EXPECT_EQ((*jobs)[1].status, JobStatus::WAITING_APPROVAL);
}

TEST_F(JobCodecTest, MissingFieldsTakeDefaults) {
    auto jobs = parse_status_body(R"({"x": {}})");
    ASSERT_TRUE(jobs.ok());
    ASSERT_EQ(jobs->size(), 1u);

    const Job& job = (*jobs)[0];
    EXPECT_EQ(job.status, JobStatus::UNKNOWN);
    EXPECT_EQ(job.command, "unknown");
    EXPECT_EQ(job.repo, "unknown");
    EXPECT_EQ(job.issue_title, "");
    EXPECT_EQ(job.issue_num, 0);
    EXPECT_DOUBLE_EQ(job.start_time, 0.0);
    EXPECT_FALSE(job.error.has_value());
    EXPECT_FALSE(job.completed_time.has_value());
}

TEST_F(JobCodecTest, WrongTypedFieldsAreIgnored) {
    auto jobs = parse_status_body(R"({"x": {"status": 3, "issue_num": "seven", "repo": null}})");
    ASSERT_TRUE(jobs.ok());
    ASSERT_EQ(jobs->size(), 1u);
    EXPECT_EQ((*jobs)[0].status, JobStatus::UNKNOWN);
    EXPECT_EQ((*jobs)[0].issue_num, 0);
    EXPECT_EQ((*jobs)[0].repo, "unknown");
}

TEST_F(JobCodecTest, OutOfRangeNumbersTakeDefaults) {
    auto jobs = parse_status_body(R"({
        "org-app-1": {"status":"running","repo":"org/app","issue_num":4294967297,
                      "cost":{"input_tokens":18446744073709551615,"output_tokens":1e30}},
        "org-app-2": {"status":"running","repo":"org/app","issue_num":1e30}
    })");
    ASSERT_TRUE(jobs.ok()) << jobs.status();
    ASSERT_EQ(jobs->size(), 2u);

    // No wrap-around onto a small issue number
    EXPECT_EQ((*jobs)[0].issue_num, 0);
    EXPECT_EQ((*jobs)[1].issue_num, 0);
    ASSERT_TRUE((*jobs)[0].cost.has_value());
    EXPECT_EQ((*jobs)[0].cost->input_tokens, 0);
    EXPECT_EQ((*jobs)[0].cost->output_tokens, 0);

    auto state = parse_workflow_state(R"({"revision_count":99999999999})");
    ASSERT_TRUE(state.ok());
    EXPECT_EQ(state->revision_count, 0);
}

TEST_F(JobCodecTest, DeeplyNestedBodyIsInvalidMessage) {
    std::string body = std::string(5000, '[') + std::string(5000, ']');
    auto jobs = parse_status_body(body);
    ASSERT_FALSE(jobs.ok());
    EXPECT_EQ(error_kind(jobs.status()), ErrorKind::INVALID_MESSAGE);

    auto state = parse_workflow_state(body);
    ASSERT_FALSE(state.ok());
    EXPECT_EQ(error_kind(state.status()), ErrorKind::INVALID_MESSAGE);
}

TEST_F(JobCodecTest, ScalarBodyYieldsNoJobs) {
    auto jobs = parse_status_body("17");
    ASSERT_TRUE(jobs.ok());
    EXPECT_TRUE(jobs->empty());
}

TEST_F(JobCodecTest, InvalidBodyIsInvalidMessage) {
    auto jobs = parse_status_body("<html>502 Bad Gateway</html>");
    ASSERT_FALSE(jobs.ok());
    EXPECT_EQ(error_kind(jobs.status()), ErrorKind::INVALID_MESSAGE);
}

TEST_F(JobCodecTest, JobHelpers) {
    Job job;
    job.command = "implement-headless";
    EXPECT_EQ(short_command(job), "implement");
    job.command = "merge";
    EXPECT_EQ(short_command(job), "merge");

    job.status = JobStatus::BLOCKED;
    EXPECT_TRUE(needs_attention(job));
    EXPECT_FALSE(is_active(job));
    job.status = JobStatus::PENDING;
    EXPECT_FALSE(needs_attention(job));
    EXPECT_TRUE(is_active(job));
}

// ============================================================================
// Workflow state
// ============================================================================

TEST_F(JobCodecTest, ParsesWorkflowState) {
    auto state = parse_workflow_state(R"({
        "current_phase":"implementing",
        "completed_phases":["plan", 7, "implement"],
        "pr_url":"https://example.com/pr/9",
        "can_merge":true,
        "revision_count":2
    })");
    ASSERT_TRUE(state.ok()) << state.status();
    EXPECT_EQ(state->current_phase, WorkflowPhase::IMPLEMENTING);
    ASSERT_TRUE(state->completed_phases.has_value());
    EXPECT_EQ(*state->completed_phases, (std::set<std::string>{"plan", "implement"}));
    EXPECT_EQ(state->pr_url, "https://example.com/pr/9");
    EXPECT_TRUE(state->can_merge);
    EXPECT_FALSE(state->can_revise);
    EXPECT_FALSE(state->issue_closed);
    EXPECT_EQ(state->revision_count, 2);
}

TEST_F(JobCodecTest, EmptyWorkflowStateOverridesNothing) {
    auto state = parse_workflow_state("{}");
    ASSERT_TRUE(state.ok());
    EXPECT_FALSE(state->current_phase.has_value());
    EXPECT_FALSE(state->completed_phases.has_value());
    EXPECT_FALSE(state->pr_url.has_value());

    EXPECT_FALSE(parse_workflow_state("[]").ok());
}

TEST_F(JobCodecTest, UnknownWorkflowPhaseIsNew) {
    EXPECT_EQ(parse_workflow_phase("plan_complete"), WorkflowPhase::PLAN_COMPLETE);
    EXPECT_EQ(parse_workflow_phase("review"), WorkflowPhase::REVIEW);
    EXPECT_EQ(parse_workflow_phase("sideways"), WorkflowPhase::NEW);
}

// ============================================================================
// Push events
// ============================================================================

TEST_F(JobCodecTest, EventForNewJobUsesReceiveTime) {
    JobEventMessage event;
    event.event = JobEventType::CREATED;
    event.job_id = "org-app-7";
    event.repo = "org/app";
    event.issue_num = 7;
    event.command = "plan-headless";
    event.status = JobStatus::RUNNING;

    Job job = apply_job_event(std::nullopt, event, 1700000500.0);
    EXPECT_EQ(job.issue_id, "org-app-7");
    EXPECT_EQ(job.repo, "org/app");
    EXPECT_EQ(job.issue_num, 7);
    EXPECT_EQ(job.status, JobStatus::RUNNING);
    EXPECT_DOUBLE_EQ(job.start_time, 1700000500.0);
    EXPECT_FALSE(job.completed_time.has_value());
}

TEST_F(JobCodecTest, EventKeepsFieldsItDoesNotCarry) {
    Job previous;
    previous.issue_id = "org-app-7";
    previous.repo = "org/app";
    previous.issue_num = 7;
    previous.issue_title = "Add export";
    previous.command = "implement-headless";
    previous.status = JobStatus::RUNNING;
    previous.start_time = 1700000000.0;

    JobEventMessage event;
    event.event = JobEventType::COMPLETED;
    event.job_id = "org-app-7";

    Job job = apply_job_event(previous, event, 1700000900.0);
    EXPECT_EQ(job.status, JobStatus::COMPLETED);
    EXPECT_EQ(job.completed_time, 1700000900.0);
    EXPECT_EQ(job.issue_title, "Add export");
    EXPECT_EQ(job.command, "implement-headless");
    EXPECT_DOUBLE_EQ(job.start_time, 1700000000.0);
}

TEST_F(JobCodecTest, ExplicitStatusWinsOverEventType) {
    Job previous;
    previous.issue_id = "j";
    previous.status = JobStatus::RUNNING;

    JobEventMessage event;
    event.event = JobEventType::FAILED;
    event.job_id = "j";
    event.status = JobStatus::BLOCKED;
    event.error = "needs input";

    Job job = apply_job_event(previous, event, 0.0);
    EXPECT_EQ(job.status, JobStatus::BLOCKED);
    EXPECT_EQ(job.error, "needs input");
}
