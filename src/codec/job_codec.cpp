/**
 * @file job_codec.cpp
 * @brief Job record parsing and push-event merging
 */

#include <opsdeck_cpp/job_codec.hpp>
#include "json_util.hpp"

#include <glog/logging.h>

namespace opsdeck {

Job parse_job(const std::string& issue_id, const Json::Value& record) {
    Job job;
    job.issue_id = issue_id;
    if (!record.isObject()) {
        return job;
    }

    job.status = parse_job_status(json::get_string(record, {"status"}).value_or(""));
    job.command = json::get_string(record, {"command"}).value_or("unknown");
    job.start_time = json::get_double(record, {"start_time", "startTime"}).value_or(0.0);
    job.completed_time = json::get_double(record, {"completed_time", "completedTime"});
    job.error = json::get_string(record, {"error"});
    job.repo = json::get_string(record, {"repo"}).value_or("unknown");
    job.issue_title = json::get_string(record, {"issue_title", "issueTitle"}).value_or("");
    job.issue_num = json::get_int32(record, {"issue_num", "issueNum"}).value_or(0);
    job.log_path = json::get_string(record, {"log_path", "logPath"});
    job.local_path = json::get_string(record, {"local_path", "localPath"});
    job.full_command = json::get_string(record, {"full_command", "fullCommand"});

    if (const Json::Value* cost = json::find(record, {"cost"}); cost != nullptr && cost->isObject()) {
        JobCost c;
        c.total_usd = json::get_double(*cost, {"total_usd", "totalUsd"}).value_or(0.0);
        c.input_tokens = json::get_int(*cost, {"input_tokens", "inputTokens"}).value_or(0);
        c.output_tokens = json::get_int(*cost, {"output_tokens", "outputTokens"}).value_or(0);
        c.cache_read_tokens =
            json::get_int(*cost, {"cache_read_tokens", "cacheReadTokens"}).value_or(0);
        c.cache_creation_tokens =
            json::get_int(*cost, {"cache_creation_tokens", "cacheCreationTokens"}).value_or(0);
        c.model = json::get_string(*cost, {"model"}).value_or("");
        job.cost = c;
    }
    return job;
}

std::vector<Job> parse_status_response(const Json::Value& root) {
    std::vector<Job> jobs;

    if (root.isArray()) {
        for (const auto& entry : root) {
            if (!entry.isObject()) {
                continue;
            }
            auto id = json::get_string(entry, {"issue_id", "issueId"});
            if (!id || id->empty()) {
                VLOG(1) << "Skipping job record without id";
                continue;
            }
            jobs.push_back(parse_job(*id, entry));
        }
        return jobs;
    }

    if (root.isObject()) {
        for (auto it = root.begin(); it != root.end(); ++it) {
            if (!it->isObject()) {
                continue;
            }
            jobs.push_back(parse_job(it.name(), *it));
        }
    }
    return jobs;
}

Result<std::vector<Job>> parse_status_body(std::string_view body) {
    auto root = json::parse(body);
    if (!root.ok()) {
        return root.status();
    }
    return parse_status_response(*root);
}

WorkflowPhase parse_workflow_phase(std::string_view phase) {
    if (phase == "planning") return WorkflowPhase::PLANNING;
    if (phase == "plan_complete") return WorkflowPhase::PLAN_COMPLETE;
    if (phase == "implementing") return WorkflowPhase::IMPLEMENTING;
    if (phase == "review") return WorkflowPhase::REVIEW;
    if (phase == "complete") return WorkflowPhase::COMPLETE;
    return WorkflowPhase::NEW;
}

Result<WorkflowState> parse_workflow_state(std::string_view body) {
    auto root = json::parse(body);
    if (!root.ok()) {
        return root.status();
    }
    if (!root->isObject()) {
        return SyncError::InvalidMessage("workflow state is not a JSON object");
    }

    WorkflowState state;
    if (auto phase = json::get_string(*root, {"current_phase"})) {
        state.current_phase = parse_workflow_phase(*phase);
    }
    if (const Json::Value* phases = json::find(*root, {"completed_phases"});
        phases != nullptr && phases->isArray()) {
        std::set<std::string> completed;
        for (const auto& p : *phases) {
            if (p.isString()) {
                completed.insert(p.asString());
            }
        }
        state.completed_phases = std::move(completed);
    }
    state.pr_url = json::get_string(*root, {"pr_url"});
    state.can_revise = json::get_bool(*root, {"can_revise"}).value_or(false);
    state.can_merge = json::get_bool(*root, {"can_merge"}).value_or(false);
    state.issue_closed = json::get_bool(*root, {"issue_closed"}).value_or(false);
    state.revision_count = json::get_int32(*root, {"revision_count"}).value_or(0);
    return state;
}

Job apply_job_event(const std::optional<Job>& previous,
                    const JobEventMessage& event,
                    double received_at) {
    Job job = previous.value_or(Job{});
    job.issue_id = event.job_id;
    if (!previous) {
        job.start_time = received_at;
    }

    if (event.repo && !event.repo->empty()) job.repo = *event.repo;
    if (event.issue_num) job.issue_num = *event.issue_num;
    if (event.issue_title) job.issue_title = *event.issue_title;
    if (event.command && !event.command->empty()) job.command = *event.command;
    if (event.start_time) job.start_time = *event.start_time;
    if (event.error) job.error = *event.error;
    if (event.cost) job.cost = *event.cost;

    if (event.status) {
        job.status = *event.status;
    } else if (event.event == JobEventType::COMPLETED) {
        job.status = JobStatus::COMPLETED;
    } else if (event.event == JobEventType::FAILED) {
        job.status = JobStatus::FAILED;
    }

    if (job.status == JobStatus::COMPLETED && !job.completed_time) {
        job.completed_time = received_at;
    }
    return job;
}

}  // namespace opsdeck
