/**
 * @file aggregation.cpp
 * @brief Issue aggregation, phase and status derivation
 */

#include <opsdeck_cpp/aggregation.hpp>

#include <absl/strings/str_cat.h>
#include <algorithm>
#include <functional>
#include <unordered_map>

namespace opsdeck {

namespace {

const std::map<std::string, std::string>& phase_commands() {
    static const std::map<std::string, std::string> kPhaseCommands = {
        {"plan-headless", "plan"},
        {"implement-headless", "implement"},
        {"retrospective-headless", "retrospective"},
    };
    return kPhaseCommands;
}

bool any_job(const std::vector<Job>& jobs, const std::function<bool(const Job&)>& pred) {
    return std::any_of(jobs.begin(), jobs.end(), pred);
}

std::optional<Job> first_by_recency(const Issue& issue,
                                    const std::function<bool(const Job&)>& pred) {
    for (auto& job : jobs_by_recency(issue)) {
        if (pred(job)) {
            return job;
        }
    }
    return std::nullopt;
}

}  // namespace

std::string repo_slug_of(const std::string& repo) {
    auto pos = repo.rfind('/');
    if (pos == std::string::npos) {
        return repo;
    }
    return repo.substr(pos + 1);
}

std::string issue_key(const std::string& repo, int issue_num) {
    return absl::StrCat(repo_slug_of(repo), "-", issue_num);
}

std::set<std::string> derive_completed_phases(const std::vector<Job>& jobs) {
    std::set<std::string> phases;
    for (const auto& job : jobs) {
        if (job.status != JobStatus::COMPLETED) {
            continue;
        }
        auto it = phase_commands().find(job.command);
        if (it != phase_commands().end()) {
            phases.insert(it->second);
        }
    }
    return phases;
}

WorkflowPhase derive_phase(const std::vector<Job>& jobs,
                           const std::set<std::string>& completed_phases) {
    if (completed_phases.count("retrospective") > 0) {
        return WorkflowPhase::COMPLETE;
    }
    if (completed_phases.count("implement") > 0) {
        return WorkflowPhase::REVIEW;
    }
    if (completed_phases.count("plan") > 0) {
        return WorkflowPhase::PLAN_COMPLETE;
    }
    if (any_job(jobs, [](const Job& j) { return j.command == "plan-headless" && is_active(j); })) {
        return WorkflowPhase::PLANNING;
    }
    return WorkflowPhase::NEW;
}

IssueStatus derive_status(const std::vector<Job>& jobs, WorkflowPhase phase) {
    if (any_job(jobs, [](const Job& j) { return is_active(j); })) {
        return IssueStatus::RUNNING;
    }
    if (any_job(jobs, [](const Job& j) { return j.status == JobStatus::FAILED; })) {
        return IssueStatus::FAILED;
    }
    if (any_job(jobs, [](const Job& j) { return j.status == JobStatus::BLOCKED; })) {
        return IssueStatus::NEEDS_ACTION;
    }
    if (any_job(jobs, [](const Job& j) { return j.status == JobStatus::WAITING_APPROVAL; })) {
        return IssueStatus::NEEDS_ACTION;
    }
    if (phase == WorkflowPhase::COMPLETE) {
        return IssueStatus::DONE;
    }
    return IssueStatus::NEEDS_ACTION;
}

IssueStatus derive_status(const Issue& issue) {
    return derive_status(issue.jobs, issue.current_phase);
}

IssueMap aggregate(const std::vector<Job>& jobs) {
    IssueMap issues;

    for (const auto& job : jobs) {
        auto key = issue_key(job.repo, job.issue_num);
        auto [it, inserted] = issues.try_emplace(key);
        Issue& issue = it->second;
        if (inserted) {
            issue.key = key;
            issue.repo = job.repo;
            issue.repo_slug = repo_slug_of(job.repo);
            issue.issue_num = job.issue_num;
            issue.title = job.issue_title;
        }
        issue.jobs.push_back(job);
    }

    for (auto& [key, issue] : issues) {
        issue.completed_phases = derive_completed_phases(issue.jobs);
        issue.current_phase = derive_phase(issue.jobs, issue.completed_phases);
    }
    return issues;
}

std::vector<Job> jobs_by_recency(const Issue& issue) {
    std::vector<Job> sorted = issue.jobs;
    std::stable_sort(sorted.begin(), sorted.end(), [](const Job& a, const Job& b) {
        return a.start_time > b.start_time;
    });
    return sorted;
}

std::optional<Job> latest_job(const Issue& issue) {
    return first_by_recency(issue, [](const Job&) { return true; });
}

std::optional<Job> running_job(const Issue& issue) {
    return first_by_recency(issue, [](const Job& j) { return is_active(j); });
}

std::optional<Job> failed_job(const Issue& issue) {
    return first_by_recency(issue, [](const Job& j) { return j.status == JobStatus::FAILED; });
}

std::optional<Job> blocked_job(const Issue& issue) {
    return first_by_recency(issue, [](const Job& j) { return j.status == JobStatus::BLOCKED; });
}

double last_activity(const Issue& issue) {
    double latest = 0.0;
    for (const auto& job : issue.jobs) {
        latest = std::max(latest, job.start_time);
    }
    return latest;
}

void apply_workflow_state(Issue& issue, const WorkflowState& state) {
    if (state.current_phase) {
        issue.current_phase = *state.current_phase;
    }
    if (state.completed_phases) {
        issue.completed_phases = *state.completed_phases;
    }
    issue.pr_url = state.pr_url;
    issue.can_revise = state.can_revise;
    issue.can_merge = state.can_merge;
    issue.issue_closed = state.issue_closed;
    issue.revision_count = state.revision_count;
}

bool has_material_change(const IssueMap& before, const IssueMap& after) {
    if (before.size() != after.size()) {
        return true;
    }

    for (const auto& [key, next] : after) {
        auto it = before.find(key);
        if (it == before.end()) {
            return true;
        }
        const Issue& prev = it->second;
        if (prev.current_phase != next.current_phase ||
            derive_status(prev) != derive_status(next) ||
            prev.jobs.size() != next.jobs.size()) {
            return true;
        }

        std::unordered_map<std::string, const Job*> prev_jobs;
        for (const auto& job : prev.jobs) {
            prev_jobs[job.issue_id] = &job;
        }
        for (const auto& job : next.jobs) {
            auto pj = prev_jobs.find(job.issue_id);
            if (pj == prev_jobs.end()) {
                return true;
            }
            if (pj->second->status != job.status || pj->second->error != job.error) {
                return true;
            }
        }
    }
    return false;
}

std::vector<Issue> issues_for_status(const IssueMap& issues,
                                     IssueStatus status,
                                     const std::optional<std::string>& repo_filter,
                                     const std::set<std::string>& hidden) {
    std::vector<Issue> column;
    for (const auto& [key, issue] : issues) {
        if (repo_filter && issue.repo_slug != *repo_filter) {
            continue;
        }
        if (hidden.count(key) > 0) {
            continue;
        }
        if (derive_status(issue) == status) {
            column.push_back(issue);
        }
    }
    std::stable_sort(column.begin(), column.end(), [](const Issue& a, const Issue& b) {
        return last_activity(a) > last_activity(b);
    });
    return column;
}

std::vector<std::string> available_repos(const IssueMap& issues) {
    std::set<std::string> slugs;
    for (const auto& [key, issue] : issues) {
        slugs.insert(issue.repo_slug);
    }
    return std::vector<std::string>(slugs.begin(), slugs.end());
}

}  // namespace opsdeck
