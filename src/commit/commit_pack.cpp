#include "codestorage/commit/commit_pack.hpp"

namespace codestorage::commit {

using json = nlohmann::json;

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n\f\v");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n\f\v");
    return value.substr(first, last - first + 1);
}

std::optional<std::string> non_blank_string(const json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    std::string value = trim(it->get<std::string>());
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

// Field readers for the strict schema. They append the offending path to
// `problem` and return false when the field is missing or mistyped.
bool read_string(const json& object, const char* key, std::string& out, std::string& problem) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        problem = std::string("expected string at ") + key;
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool read_count(const json& object, const char* key, std::uint64_t& out, std::string& problem) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_number()) {
        problem = std::string("expected number at ") + key;
        return false;
    }
    if (it->is_number_unsigned()) {
        out = it->get<std::uint64_t>();
    } else if (it->is_number_integer() && it->get<std::int64_t>() >= 0) {
        out = static_cast<std::uint64_t>(it->get<std::int64_t>());
    } else if (it->is_number_float() && it->get<double>() >= 0) {
        out = static_cast<std::uint64_t>(it->get<double>());
    } else {
        problem = std::string("expected non-negative number at ") + key;
        return false;
    }
    return true;
}

bool read_bool(const json& object, const char* key, bool& out, std::string& problem) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_boolean()) {
        problem = std::string("expected boolean at ") + key;
        return false;
    }
    out = it->get<bool>();
    return true;
}

} // namespace

Result<CommitPackAck, CommitError> parse_commit_pack_ack(const std::string& body) {
    const json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        return Err<CommitPackAck>(CommitError::schema("commit-pack response is not valid JSON"));
    }
    if (!parsed.is_object()) {
        return Err<CommitPackAck>(CommitError::schema("commit-pack response is not a JSON object"));
    }

    const auto commit = parsed.find("commit");
    const auto result = parsed.find("result");
    if (commit == parsed.end() || !commit->is_object()) {
        return Err<CommitPackAck>(CommitError::schema("commit-pack response is missing commit"));
    }
    if (result == parsed.end() || !result->is_object()) {
        return Err<CommitPackAck>(CommitError::schema("commit-pack response is missing result"));
    }

    CommitPackAck ack;
    std::string problem;
    const bool commit_ok =
        read_string(*commit, "commit_sha", ack.commit.commit_sha, problem) &&
        read_string(*commit, "tree_sha", ack.commit.tree_sha, problem) &&
        read_string(*commit, "target_branch", ack.commit.target_branch, problem) &&
        read_count(*commit, "pack_bytes", ack.commit.pack_bytes, problem) &&
        read_count(*commit, "blob_count", ack.commit.blob_count, problem);
    if (!commit_ok) {
        return Err<CommitPackAck>(CommitError::schema("commit-pack response commit: " + problem));
    }

    const bool result_ok =
        read_string(*result, "branch", ack.result.branch, problem) &&
        read_string(*result, "old_sha", ack.result.old_sha, problem) &&
        read_string(*result, "new_sha", ack.result.new_sha, problem) &&
        read_bool(*result, "success", ack.result.success, problem) &&
        read_string(*result, "status", ack.result.status, problem);
    if (!result_ok) {
        return Err<CommitPackAck>(CommitError::schema("commit-pack response result: " + problem));
    }

    const auto message = result->find("message");
    if (message != result->end()) {
        if (!message->is_string()) {
            return Err<CommitPackAck>(CommitError::schema("commit-pack response result: expected string at message"));
        }
        ack.result.message = message->get<std::string>();
    }

    return Ok<CommitPackAck, CommitError>(std::move(ack));
}

RefUpdate to_ref_update(const CommitPackAck::ResultRecord& result) {
    return RefUpdate{result.branch, result.old_sha, result.new_sha};
}

Result<CommitResult, CommitError> build_commit_result(const CommitPackAck& ack) {
    const RefUpdate ref_update = to_ref_update(ack.result);

    if (!ack.result.success) {
        std::string message;
        if (ack.result.message && !trim(*ack.result.message).empty()) {
            message = *ack.result.message;
        } else {
            message = "Commit failed with status " + ack.result.status;
        }
        PartialRefUpdate partial{ref_update.branch, ref_update.old_sha, ref_update.new_sha};
        return Err<CommitResult>(CommitError::ref_update_failure(std::move(message), ack.result.status, partial));
    }

    CommitResult result;
    result.commit_sha = ack.commit.commit_sha;
    result.tree_sha = ack.commit.tree_sha;
    result.target_branch = ack.commit.target_branch;
    result.pack_bytes = ack.commit.pack_bytes;
    result.blob_count = ack.commit.blob_count;
    result.ref_update = ref_update;
    return Ok<CommitResult, CommitError>(std::move(result));
}

std::optional<CommitPackResponseFields> parse_commit_pack_response(const json& body) {
    if (!body.is_object()) {
        return std::nullopt;
    }
    const auto result = body.find("result");
    if (result == body.end() || !result->is_object()) {
        return std::nullopt;
    }
    // The loose shape still requires a string status.
    const auto status = result->find("status");
    if (status == result->end() || !status->is_string()) {
        return std::nullopt;
    }
    for (const char* key : {"branch", "old_sha", "new_sha", "message"}) {
        const auto field = result->find(key);
        if (field != result->end() && !field->is_string()) {
            return std::nullopt;
        }
    }
    const auto success = result->find("success");
    if (success != result->end() && !success->is_boolean()) {
        return std::nullopt;
    }
    const auto commit = body.find("commit");
    if (commit != body.end() && !commit->is_object() && !commit->is_null()) {
        return std::nullopt;
    }
    if (commit != body.end() && commit->is_object()) {
        // Commit fields are optional here, but a present field must be typed.
        for (const char* key : {"commit_sha", "tree_sha", "target_branch"}) {
            const auto field = commit->find(key);
            if (field != commit->end() && !field->is_string()) {
                return std::nullopt;
            }
        }
        for (const char* key : {"pack_bytes", "blob_count"}) {
            const auto field = commit->find(key);
            if (field != commit->end() && !field->is_number()) {
                return std::nullopt;
            }
        }
    }

    CommitPackResponseFields fields;
    fields.status = non_blank_string(*result, "status");
    fields.message = non_blank_string(*result, "message");

    PartialRefUpdate partial;
    partial.branch = non_blank_string(*result, "branch");
    partial.old_sha = non_blank_string(*result, "old_sha");
    partial.new_sha = non_blank_string(*result, "new_sha");
    if (partial.branch || partial.old_sha || partial.new_sha) {
        fields.ref_update = std::move(partial);
    }
    return fields;
}

std::optional<std::string> parse_error_envelope(const json& body) {
    if (!body.is_object()) {
        return std::nullopt;
    }
    return non_blank_string(body, "error");
}

std::optional<std::string> parse_json_string_body(const json& body) {
    if (!body.is_string()) {
        return std::nullopt;
    }
    std::string value = trim(body.get<std::string>());
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::string> parse_text_body(const std::string& body) {
    std::string value = trim(body);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

CommitPackFailure parse_commit_pack_error(int http_status,
                                          const std::string& body,
                                          const std::string& fallback_message) {
    CommitPackFailure failure;
    failure.status_label = default_status_label(http_status);

    std::optional<std::string> message;
    const json parsed = json::parse(body, nullptr, false);

    if (!parsed.is_discarded()) {
        if (auto fields = parse_commit_pack_response(parsed)) {
            if (fields->status) {
                failure.status_label = *fields->status;
            }
            failure.ref_update = fields->ref_update;
            message = fields->message;
        }
        if (!message) {
            message = parse_error_envelope(parsed);
        }
        if (!message) {
            message = parse_json_string_body(parsed);
        }
    } else {
        message = parse_text_body(body);
    }

    failure.message = message ? *message : fallback_message;
    return failure;
}

} // namespace codestorage::commit
