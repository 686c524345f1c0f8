/**
 * @file error.hpp
 * @brief Error handling types for opsdeck-sync
 *
 * Error Handling Convention:
 * -------------------------
 * This library uses Status and Result<T> for all error handling.
 *
 * **Convention**:
 * - Methods that return a value: use Result<T>
 * - Methods that return void: use Status
 *
 * **Examples**:
 * @code
 * Result<std::unique_ptr<LocalCache>> LocalCache::open(path, policy);  // Factory
 * Result<std::optional<Job>> LocalCache::get_job(id);                  // Value or error
 * Status LocalCache::upsert_job(job);                                  // Void operation
 * Status StreamClient::connect(resource_id);                           // Void operation
 * @endcode
 *
 * Errors raised by the sync core carry an ErrorKind tag (see SyncError) so that
 * the kind survives propagation through layers that only see a Status.
 */

#pragma once

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/cord.h>
#include <absl/strings/str_format.h>
#include <string>

namespace opsdeck {

/**
 * @brief Status type for operations that don't return values
 *
 * Alias for absl::Status to provide consistent namespace and hide implementation.
 *
 * Example:
 * @code
 * Status status = cache->upsert_job(job);
 * if (!status.ok()) {
 *     LOG(ERROR) << "Write-through failed: " << status;
 *     return;
 * }
 * @endcode
 */
using Status = absl::Status;

/**
 * @brief Result type for operations that return values
 *
 * Alias for absl::StatusOr to provide consistent namespace and hide implementation.
 *
 * Example:
 * @code
 * Result<SyncConfig> config = load_config("opsdeck.yaml");
 * if (!config.ok()) {
 *     LOG(ERROR) << "Failed: " << config.status();
 *     return;
 * }
 * @endcode
 */
template<typename T>
using Result = absl::StatusOr<T>;

/**
 * @brief Error taxonomy of the sync core
 */
enum class ErrorKind {
    CONNECTION_FAILED,   // Could not establish a connection
    CONNECTION_LOST,     // Established connection dropped
    TIMEOUT,             // Network operation exceeded its deadline
    INVALID_MESSAGE,     // Payload could not be decoded (non-fatal)
    SERVER_ERROR,        // Server answered with an error
    UNKNOWN
};

inline std::string error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CONNECTION_FAILED: return "CONNECTION_FAILED";
        case ErrorKind::CONNECTION_LOST:   return "CONNECTION_LOST";
        case ErrorKind::TIMEOUT:           return "TIMEOUT";
        case ErrorKind::INVALID_MESSAGE:   return "INVALID_MESSAGE";
        case ErrorKind::SERVER_ERROR:      return "SERVER_ERROR";
        case ErrorKind::UNKNOWN:           return "UNKNOWN";
        default:                           return "UNKNOWN";
    }
}

/// Payload type URL under which the ErrorKind name is attached to a Status
constexpr char kErrorKindPayload[] = "type.opsdeck/ErrorKind";

/**
 * @brief Helper functions for creating sync core errors
 *
 * The status message is the internal detail (for logs); user_message()
 * gives the short text suitable for display.
 */
class SyncError {
public:
    /**
     * @brief Connection could not be established
     */
    static Status ConnectionFailed(const std::string& target,
                                   const std::string& reason = "") {
        if (reason.empty()) {
            return Make(ErrorKind::CONNECTION_FAILED, absl::StatusCode::kUnavailable,
                        absl::StrFormat("Failed to connect to %s", target));
        }
        return Make(ErrorKind::CONNECTION_FAILED, absl::StatusCode::kUnavailable,
                    absl::StrFormat("Failed to connect to %s: %s", target, reason));
    }

    /**
     * @brief Established connection was closed or errored
     */
    static Status ConnectionLost(const std::string& target,
                                 const std::string& reason = "") {
        if (reason.empty()) {
            return Make(ErrorKind::CONNECTION_LOST, absl::StatusCode::kUnavailable,
                        absl::StrFormat("Connection to %s lost", target));
        }
        return Make(ErrorKind::CONNECTION_LOST, absl::StatusCode::kUnavailable,
                    absl::StrFormat("Connection to %s lost: %s", target, reason));
    }

    /**
     * @brief Operation timeout
     */
    static Status Timeout(const std::string& operation) {
        return Make(ErrorKind::TIMEOUT, absl::StatusCode::kDeadlineExceeded,
                    absl::StrFormat("Operation timed out: %s", operation));
    }

    /**
     * @brief Payload could not be decoded
     */
    static Status InvalidMessage(const std::string& detail) {
        return Make(ErrorKind::INVALID_MESSAGE, absl::StatusCode::kDataLoss,
                    absl::StrFormat("Invalid message: %s", detail));
    }

    /**
     * @brief Server reported a failure
     */
    static Status ServerError(const std::string& detail) {
        return Make(ErrorKind::SERVER_ERROR, absl::StatusCode::kInternal,
                    absl::StrFormat("Server error: %s", detail));
    }

    static Status Unknown(const std::string& detail) {
        return Make(ErrorKind::UNKNOWN, absl::StatusCode::kUnknown, detail);
    }

    /**
     * @brief Build a status with an explicit kind tag
     */
    static Status Make(ErrorKind kind, absl::StatusCode code, const std::string& message) {
        Status status(code, message);
        status.SetPayload(kErrorKindPayload, absl::Cord(error_kind_name(kind)));
        return status;
    }
};

/**
 * @brief Recover the ErrorKind of a status
 *
 * Uses the attached tag when present, otherwise infers the kind from the code.
 * An OK status yields UNKNOWN.
 */
inline ErrorKind error_kind(const Status& status) {
    auto payload = status.GetPayload(kErrorKindPayload);
    if (payload.has_value()) {
        std::string name(*payload);
        for (auto kind : {ErrorKind::CONNECTION_FAILED, ErrorKind::CONNECTION_LOST,
                          ErrorKind::TIMEOUT, ErrorKind::INVALID_MESSAGE,
                          ErrorKind::SERVER_ERROR}) {
            if (name == error_kind_name(kind)) {
                return kind;
            }
        }
        return ErrorKind::UNKNOWN;
    }

    switch (status.code()) {
        case absl::StatusCode::kUnavailable:      return ErrorKind::CONNECTION_FAILED;
        case absl::StatusCode::kDeadlineExceeded: return ErrorKind::TIMEOUT;
        case absl::StatusCode::kDataLoss:         return ErrorKind::INVALID_MESSAGE;
        case absl::StatusCode::kInternal:         return ErrorKind::SERVER_ERROR;
        default:                                  return ErrorKind::UNKNOWN;
    }
}

/**
 * @brief Short user-facing message for an error kind
 */
inline std::string user_message(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CONNECTION_FAILED: return "Unable to connect to server";
        case ErrorKind::CONNECTION_LOST:   return "Connection to server lost";
        case ErrorKind::TIMEOUT:           return "Connection timed out";
        case ErrorKind::INVALID_MESSAGE:   return "Received invalid data from server";
        case ErrorKind::SERVER_ERROR:      return "Server error occurred";
        default:                           return "An unexpected error occurred";
    }
}

inline std::string user_message(const Status& status) {
    return user_message(error_kind(status));
}

}  // namespace opsdeck
