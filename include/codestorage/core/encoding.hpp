#pragma once

#include "codestorage/core/result.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace codestorage {

using Bytes = std::vector<std::uint8_t>;

inline Bytes to_bytes(std::string_view text) {
    return Bytes(text.begin(), text.end());
}

inline std::string to_string(const Bytes& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

std::string base64_encode(const std::uint8_t* data, std::size_t len);

inline std::string base64_encode(const Bytes& bytes) {
    return base64_encode(bytes.data(), bytes.size());
}

/// Lowercase hex rendering, two characters per byte.
std::string hex_encode(const std::uint8_t* data, std::size_t len);

/**
 * @brief Failure reported by a TextEncoder
 *
 * Unsupported means the environment has no converter for the requested
 * encoding. InvalidInput means the converter exists but rejected the text.
 */
struct TextEncodingError {
    enum class Kind {
        Unsupported,
        InvalidInput
    };

    Kind kind = Kind::Unsupported;
    std::string message;
};

/**
 * @brief Capability that turns UTF-8 text into bytes of a named encoding
 *
 * Resolved once and injected where text is accepted, so callers see a typed
 * Unsupported outcome instead of probing the environment themselves.
 */
class TextEncoder {
public:
    virtual ~TextEncoder() = default;

    virtual Result<Bytes, TextEncodingError> encode(std::string_view text,
                                                    const std::string& encoding) const = 0;
};

/// Accepts "utf8" / "utf-8" only.
class Utf8TextEncoder : public TextEncoder {
public:
    Result<Bytes, TextEncodingError> encode(std::string_view text,
                                            const std::string& encoding) const override;
};

/// Converts through iconv; UTF-8 targets are passed through untouched.
class IconvTextEncoder : public TextEncoder {
public:
    Result<Bytes, TextEncodingError> encode(std::string_view text,
                                            const std::string& encoding) const override;
};

std::shared_ptr<const TextEncoder> default_text_encoder();

bool is_utf8_encoding_name(const std::string& encoding);

} // namespace codestorage
