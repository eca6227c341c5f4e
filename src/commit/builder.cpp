#include "codestorage/commit/builder.hpp"

#include "codestorage/commit/commit_pack.hpp"

#include <spdlog/spdlog.h>

namespace codestorage::commit {
namespace {

constexpr std::string_view kHeadsPrefix = "refs/heads/";
constexpr std::string_view kRefsPrefix = "refs/";

std::string trim(std::string_view value) {
    const auto first = value.find_first_not_of(" \t\r\n\f\v");
    if (first == std::string_view::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n\f\v");
    return std::string(value.substr(first, last - first + 1));
}

bool starts_with(std::string_view value, std::string_view prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

Result<std::string, CommitError> normalize_branch_name(const std::string& value) {
    const std::string trimmed = trim(value);
    if (trimmed.empty()) {
        return Err<std::string>(CommitError::validation("createCommit targetBranch is required"));
    }
    if (starts_with(trimmed, kHeadsPrefix)) {
        std::string branch = trim(std::string_view(trimmed).substr(kHeadsPrefix.size()));
        if (branch.empty()) {
            return Err<std::string>(CommitError::validation("createCommit targetBranch is required"));
        }
        return Ok<std::string, CommitError>(std::move(branch));
    }
    if (starts_with(trimmed, kRefsPrefix)) {
        return Err<std::string>(
            CommitError::validation("createCommit targetBranch must not include refs/ prefix"));
    }
    return Ok<std::string, CommitError>(trimmed);
}

Result<std::string, CommitError> normalize_legacy_target_ref(const std::string& ref) {
    const std::string trimmed = trim(ref);
    if (trimmed.empty()) {
        return Err<std::string>(CommitError::validation("createCommit targetRef is required"));
    }
    if (!starts_with(trimmed, kHeadsPrefix)) {
        return Err<std::string>(
            CommitError::validation("createCommit targetRef must start with refs/heads/"));
    }
    std::string branch = trim(std::string_view(trimmed).substr(kHeadsPrefix.size()));
    if (branch.empty()) {
        return Err<std::string>(
            CommitError::validation("createCommit targetRef must include a branch name"));
    }
    return Ok<std::string, CommitError>(std::move(branch));
}

} // namespace

std::uint32_t resolve_commit_ttl_seconds(const std::optional<std::uint32_t>& ttl_seconds) {
    if (ttl_seconds && *ttl_seconds > 0) {
        return *ttl_seconds;
    }
    return kDefaultCommitTtlSeconds;
}

Result<std::string, CommitError> resolve_target_branch(const CommitOptions& options) {
    if (!trim(options.target_branch).empty()) {
        return normalize_branch_name(options.target_branch);
    }
    if (options.target_ref) {
        return normalize_legacy_target_ref(*options.target_ref);
    }
    return Err<std::string>(CommitError::validation("createCommit targetBranch is required"));
}

CommitBuilder::CommitBuilder(CommitOptions options, BuilderDeps deps)
    : options_(std::move(options)), deps_(std::move(deps)) {
    if (!deps_.content_id_generator) {
        deps_.content_id_generator = default_content_id_generator();
    }
    if (!deps_.text_encoder) {
        deps_.text_encoder = default_text_encoder();
    }
}

Result<void, CommitError> CommitBuilder::ensure_not_sent() const {
    if (state_ == State::Sent) {
        return Err<void>(CommitError::validation("createCommit builder cannot be reused after send()"));
    }
    return Ok<CommitError>();
}

Result<std::string, CommitError> CommitBuilder::normalize_path(const std::string& path) const {
    if (trim(path).empty()) {
        return Err<std::string>(CommitError::validation("File path must be a non-empty string"));
    }
    std::string normalized = path;
    if (normalized.front() == '/') {
        normalized.erase(0, 1);
    }
    if (normalized.empty()) {
        return Err<std::string>(CommitError::validation("File path must be a non-empty string"));
    }
    return Ok<std::string, CommitError>(std::move(normalized));
}

Result<void, CommitError> CommitBuilder::register_operation(const std::string& path,
                                                            FileOperationKind kind,
                                                            std::optional<ByteSource> source,
                                                            std::optional<std::string> mode) {
    auto not_sent = ensure_not_sent();
    if (not_sent.is_error()) {
        return not_sent;
    }

    auto normalized = normalize_path(path);
    if (normalized.is_error()) {
        return Err<void>(normalized.error());
    }
    if (paths_.count(normalized.value()) > 0) {
        return Err<void>(CommitError::validation(
            "createCommit already has an operation for path " + normalized.value()));
    }

    std::string content_id = deps_.content_id_generator();
    if (content_id.empty() || content_ids_.count(content_id) > 0) {
        return Err<void>(CommitError::validation(
            "createCommit content id generator returned an empty or duplicate id"));
    }

    FileOperation operation;
    operation.entry.path = normalized.value();
    operation.entry.content_id = content_id;
    operation.entry.operation = kind;
    if (kind == FileOperationKind::Upsert) {
        operation.entry.mode = mode.value_or(kDefaultFileMode);
        operation.source = std::move(source);
    }

    paths_.insert(normalized.value());
    content_ids_.insert(std::move(content_id));
    operations_.push_back(std::move(operation));
    return Ok<CommitError>();
}

Result<void, CommitError> CommitBuilder::add_file(const std::string& path,
                                                  ByteSource source,
                                                  FileOptions options) {
    return register_operation(path, FileOperationKind::Upsert, std::move(source), std::move(options.mode));
}

Result<void, CommitError> CommitBuilder::add_file_from_string(const std::string& path,
                                                              std::string_view text,
                                                              TextFileOptions options) {
    auto not_sent = ensure_not_sent();
    if (not_sent.is_error()) {
        return not_sent;
    }

    Bytes data;
    if (is_utf8_encoding_name(options.encoding)) {
        data = to_bytes(text);
    } else {
        auto encoded = deps_.text_encoder->encode(text, options.encoding);
        if (encoded.is_error()) {
            return Err<void>(CommitError::validation(encoded.error().message));
        }
        data = std::move(encoded.value());
    }

    FileOptions file_options;
    file_options.mode = std::move(options.mode);
    return add_file(path, ByteSource::from_bytes(std::move(data)), std::move(file_options));
}

Result<void, CommitError> CommitBuilder::delete_path(const std::string& path) {
    return register_operation(path, FileOperationKind::Delete, std::nullopt, std::nullopt);
}

Result<CommitMetadata, CommitError> CommitBuilder::build_metadata() const {
    CommitMetadata metadata;

    metadata.commit_message = trim(options_.commit_message);
    if (metadata.commit_message.empty()) {
        return Err<CommitMetadata>(CommitError::validation("createCommit commitMessage is required"));
    }

    metadata.author.name = trim(options_.author.name);
    metadata.author.email = trim(options_.author.email);
    if (metadata.author.name.empty() || metadata.author.email.empty()) {
        return Err<CommitMetadata>(CommitError::validation("createCommit author name and email are required"));
    }

    if (options_.base_branch) {
        std::string base = trim(*options_.base_branch);
        if (starts_with(base, kRefsPrefix)) {
            return Err<CommitMetadata>(
                CommitError::validation("createCommit baseBranch must not include refs/ prefix"));
        }
        if (!base.empty()) {
            metadata.base_branch = std::move(base);
        }
    }

    if (options_.ephemeral_base && !metadata.base_branch) {
        return Err<CommitMetadata>(CommitError::validation("createCommit ephemeralBase requires baseBranch"));
    }

    auto target = resolve_target_branch(options_);
    if (target.is_error()) {
        return Err<CommitMetadata>(target.error());
    }
    metadata.target_branch = std::move(target.value());

    if (options_.expected_head_sha) {
        std::string sha = trim(*options_.expected_head_sha);
        if (!sha.empty()) {
            metadata.expected_head_sha = std::move(sha);
        }
    }
    if (options_.committer) {
        metadata.committer = options_.committer;
    }
    metadata.ephemeral = options_.ephemeral;
    metadata.ephemeral_base = options_.ephemeral_base;

    metadata.files.reserve(operations_.size());
    for (const auto& operation : operations_) {
        metadata.files.push_back(operation.entry);
    }
    return Ok<CommitMetadata, CommitError>(std::move(metadata));
}

Result<CommitResult, CommitError> CommitBuilder::send() {
    auto not_sent = ensure_not_sent();
    if (not_sent.is_error()) {
        return Err<CommitResult>(not_sent.error());
    }

    auto metadata = build_metadata();
    if (metadata.is_error()) {
        return Err<CommitResult>(metadata.error());
    }
    if (!deps_.token_provider || !deps_.transport) {
        return Err<CommitResult>(
            CommitError::validation("createCommit requires a token provider and a transport"));
    }

    state_ = State::Sent;
    spdlog::debug("Sending commit to {} with {} operations",
                  metadata.value().target_branch, operations_.size());

    CommitTransportRequest request;
    request.cancellation = options_.cancellation;
    request.metadata = std::move(metadata.value());
    for (auto& operation : operations_) {
        if (operation.entry.operation == FileOperationKind::Upsert && operation.source) {
            request.blobs.push_back(BlobSource{operation.entry.content_id, std::move(*operation.source)});
        }
    }

    auto token = deps_.token_provider(resolve_commit_ttl_seconds(options_.ttl_seconds))
        .map_error([](std::string message) {
            return CommitError::transport("Failed to obtain auth token: " + message);
        });
    if (token.is_error()) {
        return Err<CommitResult>(token.error());
    }
    request.authorization = std::move(token.value());

    auto ack = deps_.transport->send(std::move(request));
    if (ack.is_error()) {
        spdlog::debug("Commit failed ({}): {}", to_string(ack.error().kind), ack.error().message);
        return Err<CommitResult>(ack.error());
    }
    return build_commit_result(ack.value());
}

} // namespace codestorage::commit
