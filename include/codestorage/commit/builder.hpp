#pragma once

#include "codestorage/commit/byte_source.hpp"
#include "codestorage/commit/errors.hpp"
#include "codestorage/commit/transport.hpp"
#include "codestorage/commit/types.hpp"
#include "codestorage/core/content_id.hpp"
#include "codestorage/core/encoding.hpp"
#include "codestorage/core/result.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace codestorage::commit {

/**
 * @brief Mints the bearer credential for one commit
 *
 * Receives the resolved TTL in seconds. An error aborts send() before any
 * network activity.
 */
using AuthTokenProvider = std::function<Result<std::string>(std::uint32_t ttl_seconds)>;

struct BuilderDeps {
    AuthTokenProvider token_provider;
    std::shared_ptr<CommitTransport> transport;
    ContentIdGenerator content_id_generator;           // Defaults to random_content_id()
    std::shared_ptr<const TextEncoder> text_encoder;   // Defaults to default_text_encoder()
};

struct FileOptions {
    std::optional<std::string> mode;   // Defaults to 100644
};

struct TextFileOptions {
    std::string encoding = "utf-8";
    std::optional<std::string> mode;
};

/// A positive TTL wins; anything else falls back to kDefaultCommitTtlSeconds.
std::uint32_t resolve_commit_ttl_seconds(const std::optional<std::uint32_t>& ttl_seconds);

/**
 * @brief Bare branch name for a commit target
 *
 * target_branch is preferred: trimmed, refs/heads/ stripped, any other refs/
 * prefix rejected. Without it the legacy target_ref must be a full
 * refs/heads/<branch> ref.
 */
Result<std::string, CommitError> resolve_target_branch(const CommitOptions& options);

/**
 * @brief One-shot accumulator of file operations for a single commit
 *
 * State machine: Created -> Sent. Once send() has passed validation every
 * further call (including send()) fails with a validation error and never
 * reaches the transport.
 *
 * Usage:
 * ```cpp
 * CommitBuilder builder(options, deps);
 * builder.add_file_from_string("README.md", "# Hello\n");
 * builder.add_file("logo.png", ByteSource::from_file("assets/logo.png"));
 * builder.delete_path("old.txt");
 * auto result = builder.send();
 * if (result.is_error() && result.error().is_ref_update_error()) {
 *     // inspect result.error().reason / ref_update
 * }
 * ```
 *
 * Not thread-safe; independent builders may be used concurrently.
 */
class CommitBuilder {
public:
    enum class State {
        Created,
        Sent
    };

    CommitBuilder(CommitOptions options, BuilderDeps deps);

    /**
     * @brief Register an upsert
     *
     * One leading '/' is stripped from the path. Deferred sources are
     * opened during send(), so changes made to them before then are
     * observed.
     */
    Result<void, CommitError> add_file(const std::string& path,
                                       ByteSource source,
                                       FileOptions options = {});

    /// Encode text (UTF-8 unless options.encoding says otherwise) and upsert it.
    Result<void, CommitError> add_file_from_string(const std::string& path,
                                                   std::string_view text,
                                                   TextFileOptions options = {});

    Result<void, CommitError> delete_path(const std::string& path);

    /**
     * @brief Validate, stream and commit
     *
     * Validation failures leave the builder in Created. After validation the
     * builder is Sent regardless of the outcome.
     */
    Result<CommitResult, CommitError> send();

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] std::size_t operation_count() const { return operations_.size(); }

    /// Metadata payload for the current operations (target branch resolved).
    Result<CommitMetadata, CommitError> build_metadata() const;

private:
    struct FileOperation {
        CommitFileEntry entry;
        std::optional<ByteSource> source;   // Upserts only
    };

    Result<void, CommitError> ensure_not_sent() const;
    Result<std::string, CommitError> normalize_path(const std::string& path) const;
    Result<void, CommitError> register_operation(const std::string& path,
                                                 FileOperationKind kind,
                                                 std::optional<ByteSource> source,
                                                 std::optional<std::string> mode);

    CommitOptions options_;
    BuilderDeps deps_;
    State state_ = State::Created;

    std::vector<FileOperation> operations_;
    std::unordered_set<std::string> paths_;
    std::unordered_set<std::string> content_ids_;
};

} // namespace codestorage::commit
