#include "codestorage/commit/frame_encoder.hpp"

namespace codestorage::commit {

using json = nlohmann::json;

namespace {

json signature_to_json(const CommitSignature& signature) {
    return json{{"name", signature.name}, {"email", signature.email}};
}

std::string dump_line(const json& value) {
    // Replace invalid UTF-8 rather than throwing on caller-provided strings.
    return value.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

} // namespace

json metadata_to_json(const CommitMetadata& metadata) {
    json files = json::array();
    for (const auto& file : metadata.files) {
        json entry{
            {"path", file.path},
            {"content_id", file.content_id},
            {"operation", to_string(file.operation)},
        };
        if (file.mode) {
            entry["mode"] = *file.mode;
        }
        files.push_back(std::move(entry));
    }

    json payload{
        {"target_branch", metadata.target_branch},
        {"commit_message", metadata.commit_message},
        {"author", signature_to_json(metadata.author)},
        {"files", std::move(files)},
    };

    if (metadata.expected_head_sha) {
        payload["expected_head_sha"] = *metadata.expected_head_sha;
    }
    if (metadata.base_branch) {
        payload["base_branch"] = *metadata.base_branch;
    }
    if (metadata.committer) {
        payload["committer"] = signature_to_json(*metadata.committer);
    }
    if (metadata.ephemeral) {
        payload["ephemeral"] = true;
    }
    if (metadata.ephemeral_base) {
        payload["ephemeral_base"] = true;
    }
    return payload;
}

std::string encode_metadata_frame(const CommitMetadata& metadata) {
    return dump_line(json{{"metadata", metadata_to_json(metadata)}});
}

std::string encode_blob_chunk_frame(const std::string& content_id, const ChunkSegment& segment) {
    return dump_line(json{{"blob_chunk", {
        {"content_id", content_id},
        {"data", base64_encode(segment.data)},
        {"eof", segment.eof},
    }}});
}

FrameEncoder::FrameEncoder(CommitMetadata metadata,
                           std::vector<BlobSource> blobs,
                           std::size_t max_chunk_bytes)
    : metadata_(std::move(metadata)),
      blobs_(std::move(blobs)),
      max_chunk_bytes_(max_chunk_bytes) {
}

Result<std::optional<std::string>> FrameEncoder::next() {
    if (stage_ == Stage::Metadata) {
        stage_ = Stage::Blobs;
        ++frames_emitted_;
        return Ok(std::optional<std::string>{encode_metadata_frame(metadata_)});
    }

    while (stage_ == Stage::Blobs) {
        if (!current_) {
            if (blob_index_ >= blobs_.size()) {
                stage_ = Stage::Done;
                break;
            }
            auto reader = blobs_[blob_index_].source.open();
            if (reader.is_error()) {
                stage_ = Stage::Done;
                return Err<std::optional<std::string>>(
                    "Failed to open content for " + blobs_[blob_index_].content_id + ": " + reader.error());
            }
            current_.emplace(std::move(reader.value()), max_chunk_bytes_);
        }

        auto segment = current_->next();
        if (segment.is_error()) {
            stage_ = Stage::Done;
            return Err<std::optional<std::string>>(
                "Failed to read content for " + blobs_[blob_index_].content_id + ": " + segment.error());
        }

        if (!segment.value()) {
            // Drained: release the source before touching the next blob.
            current_.reset();
            ++blob_index_;
            continue;
        }

        ++frames_emitted_;
        return Ok(std::optional<std::string>{
            encode_blob_chunk_frame(blobs_[blob_index_].content_id, *segment.value())});
    }

    return Ok(std::optional<std::string>{});
}

} // namespace codestorage::commit
