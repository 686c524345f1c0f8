/**
 * @file job_codec.hpp
 * @brief Parsing of poll responses into Job records
 *
 * The status endpoint returns either an object keyed by job id:
 * @code
 * { "app-42": { "repo": "org/app", "issue_num": 42, "status": "running", ... } }
 * @endcode
 * or an array of job objects carrying their id in "issue_id" / "issueId".
 * Every field is optional; missing values fall back to the Job defaults.
 */

#pragma once

#include <opsdeck_cpp/error.hpp>
#include <opsdeck_cpp/message_codec.hpp>
#include <opsdeck_cpp/types.hpp>
#include <json/value.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace opsdeck {

/**
 * @brief Build a Job from one server record
 *
 * Never fails: non-object input yields a Job with only issue_id set.
 */
Job parse_job(const std::string& issue_id, const Json::Value& record);

/**
 * @brief Parse a decoded status response (object keyed by id, or array)
 *
 * Non-object entries and array entries without an id are skipped.
 */
std::vector<Job> parse_status_response(const Json::Value& root);

/**
 * @brief Parse a raw status response body
 * @return Jobs, or INVALID_MESSAGE if the body is not JSON
 */
Result<std::vector<Job>> parse_status_body(std::string_view body);

/**
 * @brief Parse the workflow endpoint body for one issue
 */
Result<WorkflowState> parse_workflow_state(std::string_view body);

WorkflowPhase parse_workflow_phase(std::string_view phase);

/**
 * @brief Produce the job that supersedes previous after a push event
 *
 * Fields the event carries win; the rest are taken from previous. A job seen
 * for the first time without a start time is stamped with received_at.
 *
 * @param previous Job currently known under event.job_id, if any
 * @param event Decoded push event
 * @param received_at Epoch seconds at which the event was received
 */
Job apply_job_event(const std::optional<Job>& previous,
                    const JobEventMessage& event,
                    double received_at);

}  // namespace opsdeck
