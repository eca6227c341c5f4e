#pragma once

#include "codestorage/commit/errors.hpp"
#include "codestorage/commit/types.hpp"
#include "codestorage/core/result.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace codestorage::commit {

/**
 * @brief Strictly parse a success body against the ack schema
 *
 * Any deviation (invalid JSON, missing or mistyped field) is a Schema error.
 */
Result<CommitPackAck, CommitError> parse_commit_pack_ack(const std::string& body);

/**
 * @brief Turn an ack into a result; success:false becomes a RefUpdate error
 *        that still carries the full ref state
 */
Result<CommitResult, CommitError> build_commit_result(const CommitPackAck& ack);

RefUpdate to_ref_update(const CommitPackAck::ResultRecord& result);

/**
 * @brief What could be recovered from a failed commit-pack response
 */
struct CommitPackFailure {
    std::string message;
    std::string status_label;
    std::optional<PartialRefUpdate> ref_update;
};

/**
 * @brief Fields extracted by the typed response parser; each one present
 *        only when non-blank after trimming
 */
struct CommitPackResponseFields {
    std::optional<std::string> status;
    std::optional<std::string> message;
    std::optional<PartialRefUpdate> ref_update;
};

// Individual steps of the error-body chain. Each is pure and returns
// std::nullopt when it does not apply.
std::optional<CommitPackResponseFields> parse_commit_pack_response(const nlohmann::json& body);
std::optional<std::string> parse_error_envelope(const nlohmann::json& body);
std::optional<std::string> parse_json_string_body(const nlohmann::json& body);
std::optional<std::string> parse_text_body(const std::string& body);

/**
 * @brief Best-effort interpretation of a non-2xx commit-pack response
 *
 * Tries, in order: the typed response shape, an {"error": "..."} envelope,
 * a bare JSON string, and the raw text (only when the body is not JSON).
 * fallback_message is used when none of them yields a message. The status
 * label defaults to default_status_label(http_status).
 */
CommitPackFailure parse_commit_pack_error(int http_status,
                                          const std::string& body,
                                          const std::string& fallback_message);

} // namespace codestorage::commit
