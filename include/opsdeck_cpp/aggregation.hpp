/**
 * @file aggregation.hpp
 * @brief Pure derivation of issue-level state from job records
 *
 * Every function here is total and deterministic: the same jobs always
 * produce the same issues, and malformed or partially populated records
 * never cause a failure.
 *
 * Phase priority (first match wins):
 *   1. completed phases contain "retrospective"     -> COMPLETE
 *   2. completed phases contain "implement"         -> REVIEW
 *   3. completed phases contain "plan"              -> PLAN_COMPLETE
 *   4. a plan-headless job is running or pending    -> PLANNING
 *   5. otherwise                                    -> NEW
 *
 * Board status priority (first match wins, independent of phase):
 *   1. any job running or pending   -> RUNNING
 *   2. any job failed               -> FAILED
 *   3. any job blocked              -> NEEDS_ACTION
 *   4. any job waiting for approval -> NEEDS_ACTION
 *   5. phase is COMPLETE            -> DONE
 *   6. otherwise                    -> NEEDS_ACTION
 *
 * Completed phases are checked before running jobs, so an issue whose plan
 * completed and whose implement job is running reports PLAN_COMPLETE, not
 * IMPLEMENTING (its board status is still RUNNING).
 */

#pragma once

#include <opsdeck_cpp/types.hpp>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace opsdeck {

/// Issues by key, ordered by key
using IssueMap = std::map<std::string, Issue>;

/**
 * @brief Last "/"-separated segment of a repo name ("org/app" -> "app")
 */
std::string repo_slug_of(const std::string& repo);

/**
 * @brief Grouping key "<repoSlug>-<issueNum>"
 */
std::string issue_key(const std::string& repo, int issue_num);

/**
 * @brief Phase names contributed by completed jobs
 *
 * plan-headless -> "plan", implement-headless -> "implement",
 * retrospective-headless -> "retrospective". Other commands contribute nothing.
 */
std::set<std::string> derive_completed_phases(const std::vector<Job>& jobs);

WorkflowPhase derive_phase(const std::vector<Job>& jobs,
                           const std::set<std::string>& completed_phases);

IssueStatus derive_status(const std::vector<Job>& jobs, WorkflowPhase phase);

/**
 * @brief Board column of an issue
 */
IssueStatus derive_status(const Issue& issue);

/**
 * @brief Group jobs into issues and derive their state
 *
 * Issues are built from scratch on every call. Within an issue, jobs keep
 * their input order and the title is taken from the first job.
 */
IssueMap aggregate(const std::vector<Job>& jobs);

// =============================================================================
// Derived accessors
// =============================================================================

/**
 * @brief Jobs sorted by start time, newest first
 *
 * Stable: jobs with equal start times keep their relative order.
 */
std::vector<Job> jobs_by_recency(const Issue& issue);

std::optional<Job> latest_job(const Issue& issue);
/// Newest running or pending job, matching the RUNNING column
std::optional<Job> running_job(const Issue& issue);
std::optional<Job> failed_job(const Issue& issue);
std::optional<Job> blocked_job(const Issue& issue);

/// Latest start time among the issue's jobs (epoch seconds)
double last_activity(const Issue& issue);

/**
 * @brief Overlay server-side workflow state onto an aggregated issue
 */
void apply_workflow_state(Issue& issue, const WorkflowState& state);

// =============================================================================
// Change detection and board helpers
// =============================================================================

/**
 * @brief Whether two aggregation results differ in a way observers care about
 *
 * Compares issue count and keys, per-issue status, phase and job count, and
 * per-job status and error.
 */
bool has_material_change(const IssueMap& before, const IssueMap& after);

/**
 * @brief Issues in one board column, most recently active first
 *
 * @param repo_filter When set, only issues whose repo slug matches
 * @param hidden Issue keys left out of every column
 */
std::vector<Issue> issues_for_status(const IssueMap& issues,
                                     IssueStatus status,
                                     const std::optional<std::string>& repo_filter = std::nullopt,
                                     const std::set<std::string>& hidden = {});

/// Distinct repo slugs, sorted
std::vector<std::string> available_repos(const IssueMap& issues);

}  // namespace opsdeck
