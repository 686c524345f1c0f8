/**
 * @file test_aggregation.cpp
 * @brief Unit tests for issue aggregation and phase/status derivation
 */

#include <gtest/gtest.h>
#include <glog/logging.h>
#include <opsdeck_cpp/aggregation.hpp>
#include <opsdeck_cpp/presentation.hpp>

using namespace opsdeck;

namespace {

Job make_job(const std::string& id, const std::string& repo, int num,
             const std::string& command, JobStatus status, double start = 0.0) {
    Job job;
    job.issue_id = id;
    job.repo = repo;
    job.issue_num = num;
    job.command = command;
    job.status = status;
    job.start_time = start;
    return job;
}

}  // namespace

class AggregationTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!google::IsGoogleLoggingInitialized()) {
            google::InitGoogleLogging("test");
            FLAGS_logtostderr = 1;
        }
    }
};

// ============================================================================
// End-to-end scenarios
// ============================================================================

TEST_F(AggregationTest, PlanCompletedWhileImplementRunning) {
    auto issues = aggregate({
        make_job("1", "org/app", 42, "plan-headless", JobStatus::COMPLETED),
        make_job("2", "org/app", 42, "implement-headless", JobStatus::RUNNING),
    });

    ASSERT_EQ(issues.size(), 1u);
    const Issue& issue = issues.at("app-42");
    EXPECT_EQ(issue.key, "app-42");
    EXPECT_EQ(issue.completed_phases, (std::set<std::string>{"plan"}));
    // Completed phases win over the running implement job
    EXPECT_EQ(issue.current_phase, WorkflowPhase::PLAN_COMPLETE);
    EXPECT_EQ(derive_status(issue), IssueStatus::RUNNING);
}

TEST_F(AggregationTest, SingleFailedJobIsFailed) {
    for (const char* command : {"plan-headless", "implement-headless", "retrospective-headless", "x"}) {
        auto issues = aggregate({make_job("1", "org/app", 5, command, JobStatus::FAILED)});
        ASSERT_EQ(issues.size(), 1u);
        EXPECT_EQ(derive_status(issues.at("app-5")), IssueStatus::FAILED) << command;
    }
}

TEST_F(AggregationTest, AllPhasesCompletedIsDone) {
    auto issues = aggregate({
        make_job("1", "org/app", 9, "plan-headless", JobStatus::COMPLETED, 10),
        make_job("2", "org/app", 9, "implement-headless", JobStatus::COMPLETED, 20),
        make_job("3", "org/app", 9, "retrospective-headless", JobStatus::COMPLETED, 30),
    });

    const Issue& issue = issues.at("app-9");
    EXPECT_EQ(issue.completed_phases,
              (std::set<std::string>{"plan", "implement", "retrospective"}));
    EXPECT_EQ(issue.current_phase, WorkflowPhase::COMPLETE);
    EXPECT_EQ(derive_status(issue), IssueStatus::DONE);
}

// ============================================================================
// Phase priority
// ============================================================================

TEST_F(AggregationTest, PhasePriorityTable) {
    struct Case {
        std::vector<Job> jobs;
        WorkflowPhase expected;
    };
    std::vector<Case> cases = {
        {{}, WorkflowPhase::NEW},
        {{make_job("a", "r", 1, "plan-headless", JobStatus::PENDING)}, WorkflowPhase::PLANNING},
        {{make_job("a", "r", 1, "plan-headless", JobStatus::RUNNING)}, WorkflowPhase::PLANNING},
        {{make_job("a", "r", 1, "plan-headless", JobStatus::FAILED)}, WorkflowPhase::NEW},
        {{make_job("a", "r", 1, "implement-headless", JobStatus::RUNNING)}, WorkflowPhase::NEW},
        {{make_job("a", "r", 1, "plan-headless", JobStatus::COMPLETED),
          make_job("b", "r", 1, "plan-headless", JobStatus::RUNNING)}, WorkflowPhase::PLAN_COMPLETE},
        {{make_job("a", "r", 1, "implement-headless", JobStatus::COMPLETED)}, WorkflowPhase::REVIEW},
        {{make_job("a", "r", 1, "retrospective-headless", JobStatus::COMPLETED),
          make_job("b", "r", 1, "plan-headless", JobStatus::RUNNING)}, WorkflowPhase::COMPLETE},
        {{make_job("a", "r", 1, "merge", JobStatus::COMPLETED)}, WorkflowPhase::NEW},
    };

    for (size_t i = 0; i < cases.size(); ++i) {
        const auto& c = cases[i];
        auto completed = derive_completed_phases(c.jobs);
        EXPECT_EQ(derive_phase(c.jobs, completed), c.expected)
            << "case " << i << " got " << workflow_phase_name(derive_phase(c.jobs, completed));
    }
}

TEST_F(AggregationTest, CompletedPhasesAreDeduplicated) {
    auto phases = derive_completed_phases({
        make_job("a", "r", 1, "plan-headless", JobStatus::COMPLETED),
        make_job("b", "r", 1, "plan-headless", JobStatus::COMPLETED),
        make_job("c", "r", 1, "implement-headless", JobStatus::FAILED),
    });
    EXPECT_EQ(phases, (std::set<std::string>{"plan"}));
}

// ============================================================================
// Status priority
// ============================================================================

TEST_F(AggregationTest, StatusPriorityTable) {
    struct Case {
        std::vector<JobStatus> statuses;
        WorkflowPhase phase;
        IssueStatus expected;
    };
    std::vector<Case> cases = {
        {{JobStatus::RUNNING, JobStatus::FAILED}, WorkflowPhase::NEW, IssueStatus::RUNNING},
        {{JobStatus::FAILED, JobStatus::PENDING}, WorkflowPhase::NEW, IssueStatus::RUNNING},
        {{JobStatus::FAILED, JobStatus::BLOCKED}, WorkflowPhase::NEW, IssueStatus::FAILED},
        {{JobStatus::BLOCKED, JobStatus::COMPLETED}, WorkflowPhase::COMPLETE, IssueStatus::NEEDS_ACTION},
        {{JobStatus::WAITING_APPROVAL}, WorkflowPhase::COMPLETE, IssueStatus::NEEDS_ACTION},
        {{JobStatus::COMPLETED}, WorkflowPhase::COMPLETE, IssueStatus::DONE},
        {{JobStatus::COMPLETED}, WorkflowPhase::REVIEW, IssueStatus::NEEDS_ACTION},
        {{JobStatus::REJECTED, JobStatus::INTERRUPTED}, WorkflowPhase::NEW, IssueStatus::NEEDS_ACTION},
        {{JobStatus::UNKNOWN}, WorkflowPhase::COMPLETE, IssueStatus::DONE},
    };

    for (size_t i = 0; i < cases.size(); ++i) {
        std::vector<Job> jobs;
        for (auto status : cases[i].statuses) {
            jobs.push_back(make_job(std::to_string(jobs.size()), "r", 1, "x", status));
        }
        EXPECT_EQ(derive_status(jobs, cases[i].phase), cases[i].expected)
            << "case " << i;
    }
}

TEST_F(AggregationTest, DerivationIsDeterministic) {
    std::vector<Job> jobs = {
        make_job("1", "org/app", 1, "plan-headless", JobStatus::COMPLETED, 5),
        make_job("2", "org/app", 1, "implement-headless", JobStatus::FAILED, 6),
        make_job("3", "org/lib", 2, "plan-headless", JobStatus::RUNNING, 7),
    };
    auto first = aggregate(jobs);
    auto second = aggregate(jobs);

    ASSERT_EQ(first.size(), second.size());
    for (const auto& [key, issue] : first) {
        EXPECT_EQ(issue.current_phase, second.at(key).current_phase);
        EXPECT_EQ(derive_status(issue), derive_status(second.at(key)));
        EXPECT_FALSE(has_material_change(first, second));
    }
}

// ============================================================================
// Grouping
// ============================================================================

TEST_F(AggregationTest, GroupsByRepoSlugAndIssueNumber) {
    auto issues = aggregate({
        make_job("1", "org/app", 1, "plan-headless", JobStatus::RUNNING),
        make_job("2", "org/app", 11, "plan-headless", JobStatus::RUNNING),
        make_job("3", "org/app-1", 1, "plan-headless", JobStatus::RUNNING),
        make_job("4", "lib", 1, "plan-headless", JobStatus::RUNNING),
        make_job("5", "org/app", 1, "implement-headless", JobStatus::PENDING),
    });

    ASSERT_EQ(issues.size(), 4u);
    EXPECT_EQ(issues.at("app-1").jobs.size(), 2u);
    EXPECT_EQ(issues.at("app-11").jobs.size(), 1u);
    EXPECT_EQ(issues.at("app-1-1").repo_slug, "app-1");
    EXPECT_EQ(issues.at("lib-1").repo, "lib");

    for (const auto& [key, issue] : issues) {
        EXPECT_EQ(key, issue.key);
        EXPECT_FALSE(issue.jobs.empty());
    }
}

TEST_F(AggregationTest, MissingFieldsStillAggregate) {
    Job bare;
    bare.issue_id = "x";
    auto issues = aggregate({bare});

    ASSERT_EQ(issues.size(), 1u);
    const Issue& issue = issues.at("unknown-0");
    EXPECT_EQ(issue.title, "");
    EXPECT_EQ(issue.current_phase, WorkflowPhase::NEW);
    EXPECT_EQ(derive_status(issue), IssueStatus::NEEDS_ACTION);
}

TEST_F(AggregationTest, TitleComesFromFirstJob) {
    auto a = make_job("1", "org/app", 3, "plan-headless", JobStatus::COMPLETED);
    a.issue_title = "First";
    auto b = make_job("2", "org/app", 3, "implement-headless", JobStatus::RUNNING);
    b.issue_title = "Second";

    EXPECT_EQ(aggregate({a, b}).at("app-3").title, "First");
}

TEST_F(AggregationTest, RepoSlug) {
    EXPECT_EQ(repo_slug_of("org/app"), "app");
    EXPECT_EQ(repo_slug_of("host/org/app"), "app");
    EXPECT_EQ(repo_slug_of("app"), "app");
    EXPECT_EQ(issue_key("org/app", 42), "app-42");
}

// ============================================================================
// Accessors
// ============================================================================

TEST_F(AggregationTest, RecencySortIsStable) {
    Issue issue;
    issue.jobs = {
        make_job("old", "r", 1, "x", JobStatus::COMPLETED, 100),
        make_job("tie-a", "r", 1, "x", JobStatus::FAILED, 200),
        make_job("tie-b", "r", 1, "x", JobStatus::FAILED, 200),
        make_job("new", "r", 1, "x", JobStatus::BLOCKED, 300),
    };

    auto sorted = jobs_by_recency(issue);
    ASSERT_EQ(sorted.size(), 4u);
    EXPECT_EQ(sorted[0].issue_id, "new");
    EXPECT_EQ(sorted[1].issue_id, "tie-a");
    EXPECT_EQ(sorted[2].issue_id, "tie-b");
    EXPECT_EQ(sorted[3].issue_id, "old");

    EXPECT_EQ(latest_job(issue)->issue_id, "new");
    EXPECT_EQ(failed_job(issue)->issue_id, "tie-a");
    EXPECT_EQ(blocked_job(issue)->issue_id, "new");
    EXPECT_FALSE(running_job(issue).has_value());
    EXPECT_DOUBLE_EQ(last_activity(issue), 300.0);
}

TEST_F(AggregationTest, PendingJobCountsAsRunning) {
    auto issues = aggregate({
        make_job("1", "org/app", 9, "plan-headless", JobStatus::COMPLETED, 100),
        make_job("2", "org/app", 9, "implement-headless", JobStatus::PENDING, 200),
    });
    const Issue& issue = issues.at("app-9");

    ASSERT_EQ(derive_status(issue), IssueStatus::RUNNING);
    auto running = running_job(issue);
    ASSERT_TRUE(running.has_value());
    EXPECT_EQ(running->issue_id, "2");
}

TEST_F(AggregationTest, WorkflowStateOverridesDerivedPhase) {
    auto issues = aggregate({
        make_job("1", "org/app", 4, "plan-headless", JobStatus::COMPLETED),
        make_job("2", "org/app", 4, "implement-headless", JobStatus::RUNNING),
    });
    Issue& issue = issues.at("app-4");

    WorkflowState state;
    state.current_phase = WorkflowPhase::IMPLEMENTING;
    state.pr_url = "https://example.com/pr/4";
    state.can_merge = true;
    state.revision_count = 1;
    apply_workflow_state(issue, state);

    EXPECT_EQ(issue.current_phase, WorkflowPhase::IMPLEMENTING);
    EXPECT_EQ(issue.completed_phases, (std::set<std::string>{"plan"}));
    EXPECT_EQ(issue.pr_url, "https://example.com/pr/4");
    EXPECT_TRUE(issue.can_merge);
    EXPECT_EQ(issue.revision_count, 1);
}

// ============================================================================
// Change detection and board helpers
// ============================================================================

TEST_F(AggregationTest, MaterialChangeDetection) {
    std::vector<Job> jobs = {
        make_job("1", "org/app", 1, "plan-headless", JobStatus::RUNNING, 10),
        make_job("2", "org/lib", 2, "plan-headless", JobStatus::COMPLETED, 20),
    };
    auto before = aggregate(jobs);

    // Title and start time are not material
    auto cosmetic = jobs;
    cosmetic[0].issue_title = "renamed";
    cosmetic[0].start_time = 99;
    EXPECT_FALSE(has_material_change(before, aggregate(cosmetic)));

    auto status = jobs;
    status[0].status = JobStatus::FAILED;
    EXPECT_TRUE(has_material_change(before, aggregate(status)));

    auto error = jobs;
    error[1].error = "disk full";
    EXPECT_TRUE(has_material_change(before, aggregate(error)));

    auto added = jobs;
    added.push_back(make_job("3", "org/lib", 2, "implement-headless", JobStatus::PENDING));
    EXPECT_TRUE(has_material_change(before, aggregate(added)));

    auto removed = jobs;
    removed.pop_back();
    EXPECT_TRUE(has_material_change(before, aggregate(removed)));

    auto moved = jobs;
    moved[1].issue_num = 3;
    EXPECT_TRUE(has_material_change(before, aggregate(moved)));
}

TEST_F(AggregationTest, BoardColumns) {
    auto issues = aggregate({
        make_job("1", "org/app", 1, "plan-headless", JobStatus::RUNNING, 100),
        make_job("2", "org/app", 2, "plan-headless", JobStatus::RUNNING, 300),
        make_job("3", "org/lib", 3, "plan-headless", JobStatus::RUNNING, 200),
        make_job("4", "org/lib", 4, "plan-headless", JobStatus::FAILED, 400),
    });

    auto running = issues_for_status(issues, IssueStatus::RUNNING);
    ASSERT_EQ(running.size(), 3u);
    EXPECT_EQ(running[0].key, "app-2");
    EXPECT_EQ(running[1].key, "lib-3");
    EXPECT_EQ(running[2].key, "app-1");

    auto app_only = issues_for_status(issues, IssueStatus::RUNNING, std::string("app"));
    ASSERT_EQ(app_only.size(), 2u);
    EXPECT_EQ(app_only[0].key, "app-2");

    EXPECT_EQ(issues_for_status(issues, IssueStatus::FAILED).size(), 1u);
    EXPECT_TRUE(issues_for_status(issues, IssueStatus::DONE).empty());
    EXPECT_EQ(available_repos(issues), (std::vector<std::string>{"app", "lib"}));
}

TEST_F(AggregationTest, HiddenIssuesLeaveEveryColumn) {
    auto issues = aggregate({
        make_job("1", "org/app", 1, "plan-headless", JobStatus::RUNNING, 100),
        make_job("2", "org/app", 2, "plan-headless", JobStatus::RUNNING, 200),
        make_job("3", "org/app", 3, "plan-headless", JobStatus::FAILED, 300),
    });
    const std::set<std::string> hidden{"app-2", "app-3"};

    auto running = issues_for_status(issues, IssueStatus::RUNNING, std::nullopt, hidden);
    ASSERT_EQ(running.size(), 1u);
    EXPECT_EQ(running[0].key, "app-1");
    EXPECT_TRUE(issues_for_status(issues, IssueStatus::FAILED, std::nullopt, hidden).empty());
    EXPECT_TRUE(issues_for_status(issues, IssueStatus::RUNNING, std::string("app"),
                                  {"app-1", "app-2"}).empty());

    // Hiding filters columns only; the aggregation keeps the issue
    EXPECT_EQ(issues.count("app-2"), 1u);
}

TEST_F(AggregationTest, PresentationLabels) {
    EXPECT_EQ(display_info(WorkflowPhase::PLAN_COMPLETE).label, "Plan Ready");
    EXPECT_EQ(display_info(IssueStatus::NEEDS_ACTION).label, "NEEDS ACTION");
    EXPECT_NE(display_info(IssueStatus::FAILED).argb, display_info(IssueStatus::DONE).argb);
}
