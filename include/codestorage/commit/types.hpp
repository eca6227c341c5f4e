#pragma once

#include "codestorage/core/encoding.hpp"
#include "codestorage/network/cancellation.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace codestorage::commit {

/// Largest blob_chunk payload before base64 encoding (4 MiB).
constexpr std::size_t kMaxChunkBytes = 4 * 1024 * 1024;

constexpr std::uint32_t kDefaultCommitTtlSeconds = 60 * 60;

constexpr const char* kDefaultFileMode = "100644";

struct CommitSignature {
    std::string name;
    std::string email;
};

/**
 * @brief Caller-supplied description of a commit
 *
 * target_branch is preferred; target_ref is the legacy full-ref form and
 * must start with refs/heads/. Both are normalised to a bare branch name.
 */
struct CommitOptions {
    std::string target_branch;
    std::optional<std::string> target_ref;
    std::string commit_message;
    CommitSignature author;
    std::optional<CommitSignature> committer;
    std::optional<std::string> expected_head_sha;
    std::optional<std::string> base_branch;
    bool ephemeral = false;
    bool ephemeral_base = false;
    std::shared_ptr<network::CancellationToken> cancellation;
    std::optional<std::uint32_t> ttl_seconds; ///< Only forwarded to the token provider
};

enum class FileOperationKind {
    Upsert,
    Delete
};

inline const char* to_string(FileOperationKind kind) {
    return kind == FileOperationKind::Upsert ? "upsert" : "delete";
}

struct CommitFileEntry {
    std::string path;
    std::string content_id;
    FileOperationKind operation = FileOperationKind::Upsert;
    std::optional<std::string> mode;
};

/**
 * @brief Body of the leading {"metadata": ...} frame
 *
 * Optional members are emitted only when set; ephemeral flags only when true.
 */
struct CommitMetadata {
    std::string target_branch;
    std::string commit_message;
    CommitSignature author;
    std::vector<CommitFileEntry> files;
    std::optional<std::string> expected_head_sha;
    std::optional<std::string> base_branch;
    std::optional<CommitSignature> committer;
    bool ephemeral = false;
    bool ephemeral_base = false;
};

/**
 * @brief One slice of a blob; exactly the last slice carries eof
 */
struct ChunkSegment {
    Bytes data;
    bool eof = false;
};

struct RefUpdate {
    std::string branch;
    std::string old_sha;
    std::string new_sha;

    bool operator==(const RefUpdate& other) const {
        return branch == other.branch && old_sha == other.old_sha && new_sha == other.new_sha;
    }
};

/**
 * @brief Ref state recovered from a failure body; any field may be missing
 */
struct PartialRefUpdate {
    std::optional<std::string> branch;
    std::optional<std::string> old_sha;
    std::optional<std::string> new_sha;
};

/**
 * @brief Acknowledgement returned by the commit-pack endpoint
 */
struct CommitPackAck {
    struct Commit {
        std::string commit_sha;
        std::string tree_sha;
        std::string target_branch;
        std::uint64_t pack_bytes = 0;
        std::uint64_t blob_count = 0;
    };

    struct ResultRecord {
        std::string branch;
        std::string old_sha;
        std::string new_sha;
        bool success = false;
        std::string status;
        std::optional<std::string> message;
    };

    Commit commit;
    ResultRecord result;
};

struct CommitResult {
    std::string commit_sha;
    std::string tree_sha;
    std::string target_branch;
    std::uint64_t pack_bytes = 0;
    std::uint64_t blob_count = 0;
    RefUpdate ref_update;
};

} // namespace codestorage::commit
