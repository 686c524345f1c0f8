/**
 * @file message_codec.cpp
 * @brief Stream frame decoding, encoders and text coalescing
 */

#include <opsdeck_cpp/message_codec.hpp>
#include "json_util.hpp"

#include <absl/strings/ascii.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>
#include <glog/logging.h>

#include <cmath>

namespace opsdeck {

namespace {

std::chrono::system_clock::time_point parse_timestamp(const Json::Value& root) {
    const Json::Value* ts = json::find(root, {"timestamp"});
    if (ts == nullptr) {
        return std::chrono::system_clock::now();
    }

    // Epoch seconds, possibly fractional; values the clock cannot hold fall
    // back to the receive time
    if (auto seconds = json::get_double(root, {"timestamp"})) {
        using Clock = std::chrono::system_clock;
        const double limit =
            std::chrono::duration<double>(Clock::duration::max()).count();
        if (std::abs(*seconds) < limit * 0.99) {
            return Clock::time_point(std::chrono::duration_cast<Clock::duration>(
                std::chrono::duration<double>(*seconds)));
        }
        VLOG(1) << "Timestamp out of range: " << *seconds;
        return Clock::now();
    }

    if (ts->isString()) {
        absl::Time parsed;
        std::string err;
        const std::string text = ts->asString();
        if (absl::ParseTime(absl::RFC3339_full, text, &parsed, &err) ||
            absl::ParseTime("%Y-%m-%d%ET%H:%M:%E*S", text, &parsed, &err)) {
            return absl::ToChronoTime(parsed);
        }
        VLOG(1) << "Unparseable timestamp '" << text << "': " << err;
    }
    return std::chrono::system_clock::now();
}

/// Frame text lives in "content", older servers nest it in data
std::string text_of(const Json::Value& root, const Json::Value& data,
                    std::initializer_list<const char*> data_keys) {
    if (auto content = json::get_string(root, {"content"})) {
        return *content;
    }
    if (auto nested = json::get_string(data, data_keys)) {
        return *nested;
    }
    return "";
}

std::optional<JobEventType> job_event_type(const std::string& type) {
    if (type == "jobCreated" || type == "job_created") return JobEventType::CREATED;
    if (type == "jobStatusChanged" || type == "job_status_changed") return JobEventType::STATUS_CHANGED;
    if (type == "jobCompleted" || type == "job_completed") return JobEventType::COMPLETED;
    if (type == "jobFailed" || type == "job_failed") return JobEventType::FAILED;
    return std::nullopt;
}

JobCost decode_cost(const Json::Value& cost) {
    JobCost out;
    out.total_usd = json::get_double(cost, {"totalUsd", "total_usd"}).value_or(0.0);
    out.input_tokens = json::get_int(cost, {"inputTokens", "input_tokens"}).value_or(0);
    out.output_tokens = json::get_int(cost, {"outputTokens", "output_tokens"}).value_or(0);
    out.cache_read_tokens = json::get_int(cost, {"cacheReadTokens", "cache_read_tokens"}).value_or(0);
    out.cache_creation_tokens =
        json::get_int(cost, {"cacheCreationTokens", "cache_creation_tokens"}).value_or(0);
    out.model = json::get_string(cost, {"model"}).value_or("");
    return out;
}

MessagePayload decode_job_event(JobEventType event, const Json::Value& root) {
    const Json::Value* job = json::find(root, {"job"});
    if (job == nullptr || !job->isObject()) {
        return UnknownMessage{"job_event", "job event without job object"};
    }

    JobEventMessage msg;
    msg.event = event;
    msg.job_id = json::get_string(*job, {"id", "issue_id", "issueId"}).value_or("");
    if (msg.job_id.empty()) {
        return UnknownMessage{"job_event", "job event without id"};
    }

    msg.repo = json::get_string(*job, {"repo"});
    msg.issue_num = json::get_int32(*job, {"issueNum", "issue_num"});
    msg.issue_title = json::get_string(*job, {"issueTitle", "issue_title"});
    msg.command = json::get_string(*job, {"command"});
    if (auto status = json::get_string(*job, {"status"})) {
        msg.status = parse_job_status(*status);
    }
    msg.start_time = json::get_double(*job, {"startTime", "start_time"});
    msg.error = json::get_string(*job, {"error"});
    if (const Json::Value* cost = json::find(*job, {"cost"}); cost != nullptr && cost->isObject()) {
        msg.cost = decode_cost(*cost);
    }
    return msg;
}

MessagePayload decode_payload(const std::string& type, const Json::Value& root) {
    static const Json::Value kEmpty(Json::objectValue);
    const Json::Value* data_ptr = json::find(root, {"data"});
    const Json::Value& data = (data_ptr != nullptr && data_ptr->isObject()) ? *data_ptr : kEmpty;

    if (type == "connected") {
        return ConnectedMessage{json::get_string(data, {"sessionId", "session_id"})};
    }
    if (type == "pong") {
        return PongMessage{};
    }
    if (type == "status_change" || type == "statusChange") {
        if (auto status = json::get_string(data, {"status"})) {
            return StatusChangeMessage{*status};
        }
        return StatusChangeMessage{text_of(root, data, {"content"})};
    }
    if (type == "assistant_text" || type == "assistantText") {
        return AssistantTextMessage{text_of(root, data, {"content", "text"})};
    }
    if (type == "tool_use" || type == "toolUse") {
        ToolUseMessage msg;
        msg.tool_name = json::get_string(data, {"toolName", "tool_name"}).value_or("unknown");
        if (const Json::Value* input = json::find(data, {"input"})) {
            msg.input = input->isString() ? input->asString() : json::to_compact_string(*input);
        }
        return msg;
    }
    if (type == "tool_result" || type == "toolResult") {
        return ToolResultMessage{
            json::get_string(data, {"toolName", "tool_name"}).value_or("unknown")};
    }
    if (type == "result") {
        ResultMessage msg;
        msg.session_id = json::get_string(data, {"sessionId", "session_id"});
        msg.total_cost_usd = json::get_double(data, {"totalCostUsd", "total_cost_usd"});
        msg.input_tokens = json::get_int(data, {"inputTokens", "input_tokens"});
        msg.output_tokens = json::get_int(data, {"outputTokens", "output_tokens"});
        msg.cache_read_tokens = json::get_int(data, {"cacheReadTokens", "cache_read_tokens"});
        msg.cache_creation_tokens =
            json::get_int(data, {"cacheCreationTokens", "cache_creation_tokens"});
        msg.duration_seconds = json::get_double(data, {"duration"});
        return msg;
    }
    if (type == "error") {
        return ErrorMessage{text_of(root, data, {"message", "error"})};
    }
    if (type == "user_input" || type == "userInput") {
        return UserInputMessage{text_of(root, data, {"content"})};
    }
    if (auto event = job_event_type(type)) {
        return decode_job_event(*event, root);
    }
    return UnknownMessage{type, "unrecognized message type"};
}

}  // namespace

std::string message_kind_name(MessageKind kind) {
    switch (kind) {
        case MessageKind::CONNECTED:      return "connected";
        case MessageKind::STATUS_CHANGE:  return "status_change";
        case MessageKind::ASSISTANT_TEXT: return "assistant_text";
        case MessageKind::TOOL_USE:       return "tool_use";
        case MessageKind::TOOL_RESULT:    return "tool_result";
        case MessageKind::RESULT:         return "result";
        case MessageKind::ERROR:          return "error";
        case MessageKind::USER_INPUT:     return "user_input";
        case MessageKind::PONG:           return "pong";
        case MessageKind::JOB_EVENT:      return "job_event";
        case MessageKind::UNKNOWN:        return "unknown";
        default:                          return "unknown";
    }
}

JobStatus parse_job_status(std::string_view status) {
    const std::string s = absl::AsciiStrToLower(status);
    if (s == "running") return JobStatus::RUNNING;
    if (s == "pending") return JobStatus::PENDING;
    if (s == "completed") return JobStatus::COMPLETED;
    if (s == "failed") return JobStatus::FAILED;
    if (s == "waiting_approval" || s == "waitingapproval") return JobStatus::WAITING_APPROVAL;
    if (s == "rejected") return JobStatus::REJECTED;
    if (s == "blocked") return JobStatus::BLOCKED;
    if (s == "interrupted") return JobStatus::INTERRUPTED;
    if (s == "approved_resume" || s == "approvedresume") return JobStatus::APPROVED_RESUME;
    return JobStatus::UNKNOWN;
}

Result<StreamMessage> decode_frame(std::string_view frame) {
    auto root = json::parse(frame);
    if (!root.ok()) {
        return root.status();
    }
    if (!root->isObject()) {
        return SyncError::InvalidMessage("frame is not a JSON object");
    }

    StreamMessage message;
    message.timestamp = parse_timestamp(*root);

    auto type = json::get_string(*root, {"type"});
    if (!type) {
        message.payload = UnknownMessage{"", "missing type"};
        return message;
    }
    message.payload = decode_payload(*type, *root);
    return message;
}

StreamMessage decode(std::string_view frame) {
    auto decoded = decode_frame(frame);
    if (decoded.ok()) {
        return *std::move(decoded);
    }
    VLOG(1) << "Dropping malformed frame: " << decoded.status();

    StreamMessage message;
    message.payload = UnknownMessage{"", std::string(decoded.status().message())};
    message.timestamp = std::chrono::system_clock::now();
    return message;
}

std::string encode_user_input(const std::string& content) {
    Json::Value root(Json::objectValue);
    root["type"] = "user_input";
    root["content"] = content;
    return json::to_compact_string(root);
}

std::string encode_ping() {
    Json::Value root(Json::objectValue);
    root["type"] = "ping";
    return json::to_compact_string(root);
}

// =============================================================================
// CoalescedView
// =============================================================================

CoalescedView::iterator::iterator(const std::vector<StreamMessage>* source, size_t position)
    : source_(source)
    , next_(position)
    , at_end_(false) {
    fetch();
}

void CoalescedView::iterator::fetch() {
    const auto& messages = *source_;

    std::string paragraph;
    while (next_ < messages.size()) {
        const auto* text = messages[next_].get_if<AssistantTextMessage>();
        if (text == nullptr) {
            break;
        }
        paragraph += text->content;
        ++next_;
    }

    if (!paragraph.empty()) {
        current_ = DisplayItem{DisplayItem::Kind::PARAGRAPH, std::move(paragraph), nullptr};
        return;
    }

    if (next_ < messages.size()) {
        current_ = DisplayItem{DisplayItem::Kind::OTHER, "", &messages[next_]};
        ++next_;
        return;
    }

    at_end_ = true;
    current_ = DisplayItem{};
}

CoalescedView::iterator& CoalescedView::iterator::operator++() {
    if (!at_end_) {
        fetch();
    }
    return *this;
}

CoalescedView::iterator CoalescedView::iterator::operator++(int) {
    iterator previous = *this;
    ++(*this);
    return previous;
}

bool CoalescedView::iterator::operator==(const iterator& other) const {
    if (at_end_ || other.at_end_) {
        return at_end_ == other.at_end_;
    }
    return source_ == other.source_ && next_ == other.next_;
}

std::vector<DisplayItem> coalesce(const std::vector<StreamMessage>& messages) {
    CoalescedView view(messages);
    return std::vector<DisplayItem>(view.begin(), view.end());
}

}  // namespace opsdeck
