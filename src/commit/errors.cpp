#include "codestorage/commit/errors.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace codestorage::commit {
namespace {

std::string normalize_label(const std::string& status) {
    const auto first = status.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = status.find_last_not_of(" \t\r\n");
    std::string label = status.substr(first, last - first + 1);
    std::transform(label.begin(), label.end(), label.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return label;
}

} // namespace

const char* to_string(CommitErrorKind kind) {
    switch (kind) {
        case CommitErrorKind::Validation: return "validation";
        case CommitErrorKind::Transport: return "transport";
        case CommitErrorKind::RefUpdate: return "ref_update";
        case CommitErrorKind::Schema: return "schema";
    }
    return "unknown";
}

const char* to_string(RefUpdateReason reason) {
    switch (reason) {
        case RefUpdateReason::PreconditionFailed: return "precondition_failed";
        case RefUpdateReason::Conflict: return "conflict";
        case RefUpdateReason::NotFound: return "not_found";
        case RefUpdateReason::Invalid: return "invalid";
        case RefUpdateReason::Timeout: return "timeout";
        case RefUpdateReason::Unauthorized: return "unauthorized";
        case RefUpdateReason::Forbidden: return "forbidden";
        case RefUpdateReason::Unavailable: return "unavailable";
        case RefUpdateReason::Internal: return "internal";
        case RefUpdateReason::Failed: return "failed";
        case RefUpdateReason::Unknown: return "unknown";
    }
    return "unknown";
}

RefUpdateReason infer_ref_update_reason(const std::string& status) {
    static const std::unordered_map<std::string, RefUpdateReason> reasons {
        {"precondition_failed", RefUpdateReason::PreconditionFailed},
        {"conflict", RefUpdateReason::Conflict},
        {"not_found", RefUpdateReason::NotFound},
        {"invalid", RefUpdateReason::Invalid},
        {"timeout", RefUpdateReason::Timeout},
        {"unauthorized", RefUpdateReason::Unauthorized},
        {"forbidden", RefUpdateReason::Forbidden},
        {"unavailable", RefUpdateReason::Unavailable},
        {"internal", RefUpdateReason::Internal},
        {"failed", RefUpdateReason::Failed},
        {"ok", RefUpdateReason::Unknown},
    };

    const auto it = reasons.find(normalize_label(status));
    return it == reasons.end() ? RefUpdateReason::Unknown : it->second;
}

std::string default_status_label(int http_status) {
    switch (http_status) {
        case 400:
        case 422: return to_string(RefUpdateReason::Invalid);
        case 401: return to_string(RefUpdateReason::Unauthorized);
        case 403: return to_string(RefUpdateReason::Forbidden);
        case 404: return to_string(RefUpdateReason::NotFound);
        case 408:
        case 504: return to_string(RefUpdateReason::Timeout);
        case 409: return to_string(RefUpdateReason::Conflict);
        case 412: return to_string(RefUpdateReason::PreconditionFailed);
        case 500: return to_string(RefUpdateReason::Internal);
        case 502:
        case 503: return to_string(RefUpdateReason::Unavailable);
        default: return to_string(RefUpdateReason::Failed);
    }
}

CommitError CommitError::validation(std::string message) {
    CommitError error;
    error.kind = CommitErrorKind::Validation;
    error.message = std::move(message);
    return error;
}

CommitError CommitError::transport(std::string message) {
    CommitError error;
    error.kind = CommitErrorKind::Transport;
    error.message = std::move(message);
    return error;
}

CommitError CommitError::schema(std::string message) {
    CommitError error;
    error.kind = CommitErrorKind::Schema;
    error.message = std::move(message);
    return error;
}

CommitError CommitError::ref_update_failure(std::string message,
                                            std::string status,
                                            std::optional<PartialRefUpdate> ref_update) {
    CommitError error;
    error.kind = CommitErrorKind::RefUpdate;
    error.message = std::move(message);
    error.reason = infer_ref_update_reason(status);
    error.status = std::move(status);
    error.ref_update = std::move(ref_update);
    return error;
}

} // namespace codestorage::commit
