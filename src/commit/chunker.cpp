#include "codestorage/commit/chunker.hpp"

namespace codestorage::commit {

Chunker::Chunker(std::unique_ptr<ByteReader> reader, std::size_t max_chunk_bytes)
    : reader_(std::move(reader)), max_chunk_bytes_(max_chunk_bytes) {
}

Result<std::optional<ChunkSegment>> Chunker::next() {
    if (done_) {
        return Ok(std::optional<ChunkSegment>{});
    }
    if (max_chunk_bytes_ == 0) {
        return Err<std::optional<ChunkSegment>>(std::string("max_chunk_bytes must be > 0"));
    }
    if (!reader_) {
        return Err<std::optional<ChunkSegment>>(std::string("Chunker has no byte reader"));
    }

    while (true) {
        const std::size_t available = pending_.size() - head_;

        // A full chunk is only known to be non-final once a byte beyond it exists.
        if (available > max_chunk_bytes_) {
            const auto first = pending_.begin() + static_cast<std::ptrdiff_t>(head_);
            ChunkSegment segment;
            segment.data.assign(first, first + static_cast<std::ptrdiff_t>(max_chunk_bytes_));
            segment.eof = false;
            head_ += max_chunk_bytes_;
            return Ok(std::optional<ChunkSegment>{std::move(segment)});
        }

        if (exhausted_) {
            ChunkSegment segment;
            segment.data.assign(pending_.begin() + static_cast<std::ptrdiff_t>(head_), pending_.end());
            segment.eof = true;
            pending_.clear();
            head_ = 0;
            done_ = true;
            return Ok(std::optional<ChunkSegment>{std::move(segment)});
        }

        auto block = reader_->next();
        if (block.is_error()) {
            return Err<std::optional<ChunkSegment>>(block.error());
        }
        if (!block.value()) {
            exhausted_ = true;
            continue;
        }
        append(std::move(*block.value()));
    }
}

void Chunker::append(Bytes&& block) {
    if (block.empty()) {
        return;
    }
    if (head_ > 0) {
        pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(head_));
        head_ = 0;
    }
    if (pending_.empty()) {
        pending_ = std::move(block);
        return;
    }
    pending_.insert(pending_.end(), block.begin(), block.end());
}

} // namespace codestorage::commit
