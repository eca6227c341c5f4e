#pragma once

#include "codestorage/commit/byte_source.hpp"
#include "codestorage/commit/chunker.hpp"
#include "codestorage/commit/types.hpp"
#include "codestorage/core/result.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace codestorage::commit {

/**
 * @brief Upserted blob awaiting serialisation
 */
struct BlobSource {
    std::string content_id;
    ByteSource source;
};

nlohmann::json metadata_to_json(const CommitMetadata& metadata);

/// {"metadata": {...}}\n
std::string encode_metadata_frame(const CommitMetadata& metadata);

/// {"blob_chunk": {"content_id": ..., "data": <base64>, "eof": ...}}\n
std::string encode_blob_chunk_frame(const std::string& content_id, const ChunkSegment& segment);

/**
 * @brief Lazy NDJSON body of a commit-pack request
 *
 * The metadata frame comes first, then every chunk of blob 0, then every
 * chunk of blob 1, and so on. A blob's source is opened only after the
 * previous blob is drained, so one source is live at a time and memory stays
 * proportional to the chunk size.
 */
class FrameEncoder {
public:
    FrameEncoder(CommitMetadata metadata,
                 std::vector<BlobSource> blobs,
                 std::size_t max_chunk_bytes = kMaxChunkBytes);

    /// Next newline-terminated line, or std::nullopt when the body is complete.
    Result<std::optional<std::string>> next();

    [[nodiscard]] std::size_t frames_emitted() const noexcept { return frames_emitted_; }

private:
    enum class Stage {
        Metadata,
        Blobs,
        Done
    };

    CommitMetadata metadata_;
    std::vector<BlobSource> blobs_;
    std::size_t max_chunk_bytes_;

    Stage stage_ = Stage::Metadata;
    std::size_t blob_index_ = 0;
    std::optional<Chunker> current_;
    std::size_t frames_emitted_ = 0;
};

} // namespace codestorage::commit
