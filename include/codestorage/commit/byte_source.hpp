#pragma once

#include "codestorage/core/encoding.hpp"
#include "codestorage/core/result.hpp"

#include <filesystem>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace codestorage::commit {

/**
 * @brief Minimal "produces bytes incrementally" capability
 *
 * next() returns the next block (possibly empty), std::nullopt once the
 * source is exhausted, or an error. Readers are single-pass.
 */
class ByteReader {
public:
    virtual ~ByteReader() = default;

    virtual Result<std::optional<Bytes>> next() = 0;
};

/**
 * @brief Content of an upserted file
 *
 * A closed set of representations:
 * - Bytes:  an in-memory buffer, taken over at registration
 * - Chunks: an already chunked sequence of buffers
 *
 * In-memory representations are immutable and shared by every reader, which
 * hands out copies of at most kStreamReadBytes (Bytes) or one chunk (Chunks)
 * at a time.
 * - Opener: a deferred reader factory for streams, files and other
 *           external sources
 *
 * open() materialises a reader. For Opener sources that is the moment the
 * factory runs, so the commit builder calls it exactly once, at send time.
 */
class ByteSource {
public:
    using Chunks = std::vector<Bytes>;
    using Opener = std::function<std::unique_ptr<ByteReader>()>;

    static constexpr std::size_t kStreamReadBytes = 64 * 1024;

    static ByteSource from_bytes(Bytes bytes);
    static ByteSource from_string(std::string_view text);
    static ByteSource from_chunks(Chunks chunks);
    static ByteSource from_opener(Opener opener);

    /// File-like blob: opened and read when the source is opened.
    static ByteSource from_file(std::filesystem::path path);

    /// Readable stream: consumed in kStreamReadBytes blocks.
    static ByteSource from_stream(std::shared_ptr<std::istream> stream);

    Result<std::unique_ptr<ByteReader>> open() const;

    bool is_deferred() const { return std::holds_alternative<Opener>(data_); }

private:
    using SharedBytes = std::shared_ptr<const Bytes>;
    using SharedChunks = std::shared_ptr<const Chunks>;

    explicit ByteSource(std::variant<SharedBytes, SharedChunks, Opener> data) : data_(std::move(data)) {}

    std::variant<SharedBytes, SharedChunks, Opener> data_;
};

} // namespace codestorage::commit
