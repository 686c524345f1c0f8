/**
 * @file types.hpp
 * @brief Domain types for the job/issue sync core
 *
 * All records are plain values. A Job is never mutated once received; a
 * re-fetch produces a new Job that supersedes the old one. Issues are
 * rebuilt from their jobs on every aggregation pass.
 *
 * Display names and colors live in presentation.hpp, not here.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace opsdeck {

// =============================================================================
// Jobs
// =============================================================================

/**
 * @brief Lifecycle status of a single automation job
 */
enum class JobStatus {
    RUNNING,
    PENDING,
    COMPLETED,
    FAILED,
    WAITING_APPROVAL,
    REJECTED,
    BLOCKED,
    INTERRUPTED,
    APPROVED_RESUME,
    UNKNOWN
};

/**
 * @brief Wire name of a job status (as sent by the server)
 */
inline std::string job_status_name(JobStatus status) {
    switch (status) {
        case JobStatus::RUNNING:          return "running";
        case JobStatus::PENDING:          return "pending";
        case JobStatus::COMPLETED:        return "completed";
        case JobStatus::FAILED:           return "failed";
        case JobStatus::WAITING_APPROVAL: return "waiting_approval";
        case JobStatus::REJECTED:         return "rejected";
        case JobStatus::BLOCKED:          return "blocked";
        case JobStatus::INTERRUPTED:      return "interrupted";
        case JobStatus::APPROVED_RESUME:  return "approved_resume";
        case JobStatus::UNKNOWN:          return "unknown";
        default:                          return "unknown";
    }
}

/**
 * @brief Token and cost accounting reported for a job
 */
struct JobCost {
    double total_usd = 0.0;
    int64_t input_tokens = 0;
    int64_t output_tokens = 0;
    int64_t cache_read_tokens = 0;
    int64_t cache_creation_tokens = 0;
    std::string model;
};

/**
 * @brief One automation run tied to an issue and a workflow command
 *
 * Every field has a default so that partially populated server records
 * can always be aggregated.
 */
struct Job {
    std::string issue_id;
    JobStatus status = JobStatus::UNKNOWN;
    std::string command = "unknown";     // e.g. "plan-headless"
    double start_time = 0.0;             // epoch seconds
    std::optional<double> completed_time;
    std::optional<std::string> error;
    std::string repo = "unknown";        // "owner/name" or bare name
    std::string issue_title;
    int issue_num = 0;

    std::optional<std::string> log_path;
    std::optional<std::string> local_path;
    std::optional<std::string> full_command;
    std::optional<JobCost> cost;
};

/// Failed, blocked or waiting for approval
inline bool needs_attention(const Job& job) {
    return job.status == JobStatus::FAILED ||
           job.status == JobStatus::WAITING_APPROVAL ||
           job.status == JobStatus::BLOCKED;
}

/// Running or pending
inline bool is_active(const Job& job) {
    return job.status == JobStatus::RUNNING || job.status == JobStatus::PENDING;
}

/**
 * @brief Command name without the "-headless" suffix ("plan-headless" -> "plan")
 */
inline std::string short_command(const Job& job) {
    static const std::string suffix = "-headless";
    const auto& cmd = job.command;
    if (cmd.size() >= suffix.size() &&
        cmd.compare(cmd.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return cmd.substr(0, cmd.size() - suffix.size());
    }
    return cmd;
}

// =============================================================================
// Issues
// =============================================================================

/**
 * @brief Position of an issue in the plan -> implement -> review -> retro pipeline
 */
enum class WorkflowPhase {
    NEW,
    PLANNING,
    PLAN_COMPLETE,
    IMPLEMENTING,
    REVIEW,
    COMPLETE
};

inline std::string workflow_phase_name(WorkflowPhase phase) {
    switch (phase) {
        case WorkflowPhase::NEW:           return "new";
        case WorkflowPhase::PLANNING:      return "planning";
        case WorkflowPhase::PLAN_COMPLETE: return "plan_complete";
        case WorkflowPhase::IMPLEMENTING:  return "implementing";
        case WorkflowPhase::REVIEW:        return "review";
        case WorkflowPhase::COMPLETE:      return "complete";
        default:                           return "new";
    }
}

/**
 * @brief Board column of an issue (derived, never stored)
 */
enum class IssueStatus {
    NEEDS_ACTION,
    RUNNING,
    FAILED,
    DONE
};

inline std::string issue_status_name(IssueStatus status) {
    switch (status) {
        case IssueStatus::NEEDS_ACTION: return "needs_action";
        case IssueStatus::RUNNING:      return "running";
        case IssueStatus::FAILED:       return "failed";
        case IssueStatus::DONE:         return "done";
        default:                        return "needs_action";
    }
}

/**
 * @brief Aggregation of all jobs sharing a repo slug and issue number
 *
 * key is "<repoSlug>-<issueNum>". jobs is never empty and keeps the order in
 * which the jobs were handed to the aggregation pass.
 */
struct Issue {
    std::string key;
    std::string repo;
    std::string repo_slug;
    std::string title;
    int issue_num = 0;
    std::vector<Job> jobs;

    WorkflowPhase current_phase = WorkflowPhase::NEW;
    std::set<std::string> completed_phases;

    // Filled in from server-side workflow state when available
    std::optional<std::string> pr_url;
    bool can_revise = false;
    bool can_merge = false;
    bool issue_closed = false;
    int revision_count = 0;
};

/**
 * @brief Issue the user removed from the board
 *
 * reason is free text, "user" for a manual hide and "closed" when the issue
 * was closed from the board.
 */
struct HiddenIssue {
    std::string issue_key;
    std::string repo;
    int issue_num = 0;
    std::string issue_title;
    std::string reason = "user";
    int64_t hidden_at_ms = 0;
};

/**
 * @brief Server-side workflow state of one issue
 *
 * Unset fields leave the aggregated values untouched.
 */
struct WorkflowState {
    std::optional<WorkflowPhase> current_phase;
    std::optional<std::set<std::string>> completed_phases;
    std::optional<std::string> pr_url;
    bool can_revise = false;
    bool can_merge = false;
    bool issue_closed = false;
    int revision_count = 0;
};

// =============================================================================
// Sessions (interactive chat-style runs)
// =============================================================================

enum class SessionStatus {
    IDLE,
    RUNNING,
    FAILED,
    EXPIRED
};

inline std::string session_status_name(SessionStatus status) {
    switch (status) {
        case SessionStatus::IDLE:    return "idle";
        case SessionStatus::RUNNING: return "running";
        case SessionStatus::FAILED:  return "failed";
        case SessionStatus::EXPIRED: return "expired";
        default:                     return "idle";
    }
}

inline SessionStatus parse_session_status(const std::string& name) {
    if (name == "running") return SessionStatus::RUNNING;
    if (name == "failed") return SessionStatus::FAILED;
    if (name == "expired") return SessionStatus::EXPIRED;
    return SessionStatus::IDLE;
}

/**
 * @brief Cached parent record for an interactive session
 *
 * repo is the partition key used by the eviction sweep.
 */
struct Session {
    std::string id;
    std::string repo;
    SessionStatus status = SessionStatus::IDLE;
    std::optional<std::string> worktree_path;
    std::optional<std::string> agent_session_id;
    int64_t created_at_ms = 0;
    int64_t last_activity_ms = 0;
    int message_count = 0;
    double total_cost_usd = 0.0;
};

enum class MessageRole {
    USER,
    ASSISTANT,
    SYSTEM,
    TOOL
};

inline std::string message_role_name(MessageRole role) {
    switch (role) {
        case MessageRole::USER:      return "user";
        case MessageRole::ASSISTANT: return "assistant";
        case MessageRole::SYSTEM:    return "system";
        case MessageRole::TOOL:      return "tool";
        default:                     return "system";
    }
}

inline MessageRole parse_message_role(const std::string& name) {
    if (name == "user") return MessageRole::USER;
    if (name == "assistant") return MessageRole::ASSISTANT;
    if (name == "tool" || name == "tool_result") return MessageRole::TOOL;
    return MessageRole::SYSTEM;
}

/**
 * @brief Child record of a Session, deleted together with its parent
 */
struct SessionMessage {
    std::string id;
    std::string session_id;
    MessageRole role = MessageRole::SYSTEM;
    std::string content;
    int64_t timestamp_ms = 0;
    std::optional<double> cost_usd;
    std::optional<std::string> tool_name;
    std::optional<std::string> tool_input;
};

}  // namespace opsdeck
