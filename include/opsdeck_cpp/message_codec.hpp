/**
 * @file message_codec.hpp
 * @brief Typed decoding of stream frames and text coalescing
 *
 * Inbound frames are JSON objects:
 * @code
 * { "type": "assistant_text", "content": "Hel", "timestamp": 1718000000.5 }
 * { "type": "tool_use", "data": { "toolName": "Bash", "input": "ls" } }
 * { "type": "jobStatusChanged", "job": { "id": "app-42", "status": "failed" } }
 * @endcode
 *
 * The codec is pure and stateless. Frames with an unknown type decode to
 * UnknownMessage; frames that are not JSON objects are rejected with an
 * INVALID_MESSAGE status by decode_frame() and become UnknownMessage in decode().
 */

#pragma once

#include <opsdeck_cpp/error.hpp>
#include <opsdeck_cpp/types.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace opsdeck {

// =============================================================================
// Message payloads
// =============================================================================

struct ConnectedMessage {
    std::optional<std::string> session_id;
};

struct StatusChangeMessage {
    std::string status;
};

/// Incremental chunk of assistant output
struct AssistantTextMessage {
    std::string content;
};

struct ToolUseMessage {
    std::string tool_name;
    std::string input;      // raw string, or compact JSON if the server sent an object
};

struct ToolResultMessage {
    std::string tool_name;
};

struct ResultMessage {
    std::optional<std::string> session_id;
    std::optional<double> total_cost_usd;
    std::optional<int64_t> input_tokens;
    std::optional<int64_t> output_tokens;
    std::optional<int64_t> cache_read_tokens;
    std::optional<int64_t> cache_creation_tokens;
    std::optional<double> duration_seconds;
};

struct ErrorMessage {
    std::string message;
};

struct UserInputMessage {
    std::string content;
};

/// Heartbeat answer, consumed by the stream client
struct PongMessage {};

enum class JobEventType {
    CREATED,
    STATUS_CHANGED,
    COMPLETED,
    FAILED
};

/**
 * @brief Job update pushed on the process-wide event stream
 *
 * Only the fields the server actually sent are set.
 */
struct JobEventMessage {
    JobEventType event = JobEventType::STATUS_CHANGED;
    std::string job_id;
    std::optional<std::string> repo;
    std::optional<int> issue_num;
    std::optional<std::string> issue_title;
    std::optional<std::string> command;
    std::optional<JobStatus> status;
    std::optional<double> start_time;
    std::optional<std::string> error;
    std::optional<JobCost> cost;
};

struct UnknownMessage {
    std::string type;
    std::string reason;
};

using MessagePayload = std::variant<
    ConnectedMessage,
    StatusChangeMessage,
    AssistantTextMessage,
    ToolUseMessage,
    ToolResultMessage,
    ResultMessage,
    ErrorMessage,
    UserInputMessage,
    PongMessage,
    JobEventMessage,
    UnknownMessage
>;

/**
 * @brief Discriminator of a decoded message, in MessagePayload order
 */
enum class MessageKind {
    CONNECTED,
    STATUS_CHANGE,
    ASSISTANT_TEXT,
    TOOL_USE,
    TOOL_RESULT,
    RESULT,
    ERROR,
    USER_INPUT,
    PONG,
    JOB_EVENT,
    UNKNOWN
};

std::string message_kind_name(MessageKind kind);

/**
 * @brief A decoded stream frame
 */
struct StreamMessage {
    MessagePayload payload;
    std::chrono::system_clock::time_point timestamp;

    MessageKind kind() const {
        return static_cast<MessageKind>(payload.index());
    }

    template<typename T>
    const T* get_if() const {
        return std::get_if<T>(&payload);
    }
};

// =============================================================================
// Codec
// =============================================================================

/**
 * @brief Decode one raw text frame
 *
 * @param frame Raw frame text
 * @return Decoded message (UnknownMessage for unrecognized types), or an
 *         INVALID_MESSAGE status when the frame is not a JSON object
 */
Result<StreamMessage> decode_frame(std::string_view frame);

/**
 * @brief Total variant of decode_frame()
 *
 * Malformed frames become UnknownMessage with the parse failure as reason.
 */
StreamMessage decode(std::string_view frame);

JobStatus parse_job_status(std::string_view status);

/// {"type":"user_input","content":...}
std::string encode_user_input(const std::string& content);

/// {"type":"ping"}
std::string encode_ping();

// =============================================================================
// Text coalescing
// =============================================================================

/**
 * @brief One display item produced by coalescing
 *
 * PARAGRAPH carries the concatenated text of consecutive assistant chunks.
 * OTHER points at the non-text message in the source sequence.
 */
struct DisplayItem {
    enum class Kind { PARAGRAPH, OTHER };

    Kind kind = Kind::PARAGRAPH;
    std::string text;
    const StreamMessage* message = nullptr;
};

/**
 * @brief Lazy view that merges consecutive AssistantTextMessage items
 *
 * Items are computed while iterating. Each begin() starts a fresh pass over
 * the source, so the view can be traversed any number of times. The source
 * vector must outlive the view and must not be modified during iteration.
 *
 * @code
 * for (const auto& item : CoalescedView(messages)) {
 *     if (item.kind == DisplayItem::Kind::PARAGRAPH) {
 *         render_text(item.text);
 *     } else {
 *         render_message(*item.message);
 *     }
 * }
 * @endcode
 */
class CoalescedView {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = DisplayItem;
        using difference_type = std::ptrdiff_t;
        using pointer = const DisplayItem*;
        using reference = const DisplayItem&;

        iterator() = default;
        iterator(const std::vector<StreamMessage>* source, size_t position);

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }

        iterator& operator++();
        iterator operator++(int);

        bool operator==(const iterator& other) const;
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        void fetch();

        const std::vector<StreamMessage>* source_ = nullptr;
        size_t next_ = 0;
        bool at_end_ = true;
        DisplayItem current_;
    };

    explicit CoalescedView(const std::vector<StreamMessage>& messages)
        : messages_(&messages) {}

    iterator begin() const { return iterator(messages_, 0); }
    iterator end() const { return iterator(); }

private:
    const std::vector<StreamMessage>* messages_;
};

/**
 * @brief Eager convenience wrapper around CoalescedView
 */
std::vector<DisplayItem> coalesce(const std::vector<StreamMessage>& messages);

}  // namespace opsdeck
