#include "codestorage/commit/byte_source.hpp"

#include <algorithm>
#include <fstream>

namespace codestorage::commit {
namespace fs = std::filesystem;

namespace {

// Hands out slices of a shared buffer so the source is never duplicated whole.
class BufferReader : public ByteReader {
public:
    explicit BufferReader(std::shared_ptr<const Bytes> bytes) : bytes_(std::move(bytes)) {}

    Result<std::optional<Bytes>> next() override {
        if (offset_ >= bytes_->size()) {
            return Ok(std::optional<Bytes>{});
        }
        const std::size_t count = std::min(ByteSource::kStreamReadBytes, bytes_->size() - offset_);
        const auto first = bytes_->begin() + static_cast<std::ptrdiff_t>(offset_);
        offset_ += count;
        return Ok(std::optional<Bytes>{Bytes(first, first + static_cast<std::ptrdiff_t>(count))});
    }

private:
    std::shared_ptr<const Bytes> bytes_;
    std::size_t offset_ = 0;
};

class ChunkListReader : public ByteReader {
public:
    explicit ChunkListReader(std::shared_ptr<const ByteSource::Chunks> chunks) : chunks_(std::move(chunks)) {}

    Result<std::optional<Bytes>> next() override {
        if (index_ >= chunks_->size()) {
            return Ok(std::optional<Bytes>{});
        }
        return Ok(std::optional<Bytes>{(*chunks_)[index_++]});
    }

private:
    std::shared_ptr<const ByteSource::Chunks> chunks_;
    std::size_t index_ = 0;
};

class FailedReader : public ByteReader {
public:
    explicit FailedReader(std::string message) : message_(std::move(message)) {}

    Result<std::optional<Bytes>> next() override {
        return Err<std::optional<Bytes>>(message_);
    }

private:
    std::string message_;
};

class StreamReader : public ByteReader {
public:
    StreamReader(std::shared_ptr<std::istream> stream, std::string description)
        : stream_(std::move(stream)), description_(std::move(description)) {}

    Result<std::optional<Bytes>> next() override {
        if (!stream_) {
            return Err<std::optional<Bytes>>(std::string("No stream to read for ") + description_);
        }
        if (stream_->eof()) {
            return Ok(std::optional<Bytes>{});
        }
        if (stream_->fail()) {
            return Err<std::optional<Bytes>>(std::string("Failed to read ") + description_);
        }

        Bytes buffer(ByteSource::kStreamReadBytes);
        stream_->read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        const auto bytes_read = static_cast<std::size_t>(stream_->gcount());

        if (stream_->bad()) {
            return Err<std::optional<Bytes>>(std::string("Failed to read ") + description_);
        }
        if (bytes_read == 0) {
            return Ok(std::optional<Bytes>{});
        }

        buffer.resize(bytes_read);
        return Ok(std::optional<Bytes>{std::move(buffer)});
    }

private:
    std::shared_ptr<std::istream> stream_;
    std::string description_;
};

} // namespace

ByteSource ByteSource::from_bytes(Bytes bytes) {
    return ByteSource(std::make_shared<const Bytes>(std::move(bytes)));
}

ByteSource ByteSource::from_string(std::string_view text) {
    return ByteSource(std::make_shared<const Bytes>(to_bytes(text)));
}

ByteSource ByteSource::from_chunks(Chunks chunks) {
    return ByteSource(std::make_shared<const Chunks>(std::move(chunks)));
}

ByteSource ByteSource::from_opener(Opener opener) {
    return ByteSource(std::move(opener));
}

ByteSource ByteSource::from_file(fs::path path) {
    return from_opener([path = std::move(path)]() -> std::unique_ptr<ByteReader> {
        auto input = std::make_shared<std::ifstream>(path, std::ios::binary);
        if (!*input) {
            return std::make_unique<FailedReader>("Failed to open source file: " + path.string());
        }
        return std::make_unique<StreamReader>(std::move(input), "file " + path.string());
    });
}

ByteSource ByteSource::from_stream(std::shared_ptr<std::istream> stream) {
    return from_opener([stream = std::move(stream)]() -> std::unique_ptr<ByteReader> {
        return std::make_unique<StreamReader>(stream, "stream");
    });
}

Result<std::unique_ptr<ByteReader>> ByteSource::open() const {
    if (const auto* bytes = std::get_if<SharedBytes>(&data_)) {
        return Ok(std::unique_ptr<ByteReader>(std::make_unique<BufferReader>(*bytes)));
    }
    if (const auto* chunks = std::get_if<SharedChunks>(&data_)) {
        return Ok(std::unique_ptr<ByteReader>(std::make_unique<ChunkListReader>(*chunks)));
    }

    const auto& opener = std::get<Opener>(data_);
    if (!opener) {
        return Err<std::unique_ptr<ByteReader>>(std::string("Byte source has no opener"));
    }
    auto reader = opener();
    if (!reader) {
        return Err<std::unique_ptr<ByteReader>>(std::string("Byte source could not be opened"));
    }
    return Ok(std::move(reader));
}

} // namespace codestorage::commit
