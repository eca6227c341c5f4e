#pragma once

#include "codestorage/commit/types.hpp"

#include <optional>
#include <string>

namespace codestorage::commit {

enum class CommitErrorKind {
    Validation,  // Malformed caller input, raised before any network activity
    Transport,   // Network, token provider or byte source failure
    RefUpdate,   // The service answered but the ref was not updated
    Schema       // Success response whose body is not a commit-pack ack
};

enum class RefUpdateReason {
    PreconditionFailed,
    Conflict,
    NotFound,
    Invalid,
    Timeout,
    Unauthorized,
    Forbidden,
    Unavailable,
    Internal,
    Failed,
    Unknown
};

const char* to_string(CommitErrorKind kind);
const char* to_string(RefUpdateReason reason);

/**
 * @brief Map a status label to a reason; unrecognised labels (and "ok")
 *        yield Unknown
 */
RefUpdateReason infer_ref_update_reason(const std::string& status);

/**
 * @brief Status label implied by an HTTP status code, "failed" when the
 *        code has no specific meaning for ref updates
 */
std::string default_status_label(int http_status);

struct CommitError {
    CommitErrorKind kind = CommitErrorKind::Validation;
    std::string message;

    // Populated for RefUpdate errors
    std::string status;
    RefUpdateReason reason = RefUpdateReason::Unknown;
    std::optional<PartialRefUpdate> ref_update;

    static CommitError validation(std::string message);
    static CommitError transport(std::string message);
    static CommitError schema(std::string message);
    static CommitError ref_update_failure(std::string message,
                                          std::string status,
                                          std::optional<PartialRefUpdate> ref_update);

    bool is_ref_update_error() const { return kind == CommitErrorKind::RefUpdate; }
};

} // namespace codestorage::commit
