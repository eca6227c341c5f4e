#pragma once

#include "codestorage/commit/byte_source.hpp"
#include "codestorage/commit/types.hpp"
#include "codestorage/core/result.hpp"

#include <memory>
#include <optional>

namespace codestorage::commit {

/**
 * @brief Splits a byte reader into bounded ChunkSegments
 *
 * Every segment but the last is exactly max_chunk_bytes long; the last holds
 * 0..max_chunk_bytes bytes and has eof set. An empty source yields a single
 * zero-length eof segment. Single pass: the reader is consumed as segments
 * are requested and at most one segment plus one input block is buffered.
 */
class Chunker {
public:
    explicit Chunker(std::unique_ptr<ByteReader> reader,
                     std::size_t max_chunk_bytes = kMaxChunkBytes);

    /// Next segment, or std::nullopt after the eof segment was returned.
    Result<std::optional<ChunkSegment>> next();

    [[nodiscard]] bool done() const noexcept { return done_; }

private:
    void append(Bytes&& block);

    std::unique_ptr<ByteReader> reader_;
    std::size_t max_chunk_bytes_;
    Bytes pending_;
    std::size_t head_ = 0;       // Offset of the first unsent byte in pending_
    bool exhausted_ = false;
    bool done_ = false;
};

} // namespace codestorage::commit
