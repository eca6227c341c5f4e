#include "codestorage/core/encoding.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <iconv.h>

namespace codestorage {
namespace {

// Input block for EVP_EncodeBlock; a multiple of 3 so blocks concatenate
// without padding in between.
constexpr std::size_t kBase64BlockBytes = 3 * 256 * 1024;

struct IconvCloser {
    void operator()(void* handle) const {
        iconv_close(static_cast<iconv_t>(handle));
    }
};

using IconvHandle = std::unique_ptr<void, IconvCloser>;

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

TextEncodingError unsupported(const std::string& encoding) {
    return TextEncodingError{
        TextEncodingError::Kind::Unsupported,
        "Unsupported encoding \"" + encoding +
            "\" in this environment. Non-UTF-8 encodings require a text encoding capability."};
}

} // namespace

std::string base64_encode(const std::uint8_t* data, std::size_t len) {
    std::string out;
    out.reserve(((len + 2) / 3) * 4);

    std::vector<unsigned char> buffer;
    std::size_t offset = 0;
    while (offset < len) {
        const std::size_t block = std::min(kBase64BlockBytes, len - offset);
        buffer.resize(((block + 2) / 3) * 4 + 1);
        const int written = EVP_EncodeBlock(buffer.data(), data + offset, static_cast<int>(block));
        out.append(reinterpret_cast<const char*>(buffer.data()), static_cast<std::size_t>(written));
        offset += block;
    }
    return out;
}

std::string hex_encode(const std::uint8_t* data, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        out[2 * i] = kHex[(data[i] >> 4) & 0x0F];
        out[2 * i + 1] = kHex[data[i] & 0x0F];
    }
    return out;
}

bool is_utf8_encoding_name(const std::string& encoding) {
    const auto name = lowercase(encoding);
    return name == "utf8" || name == "utf-8";
}

Result<Bytes, TextEncodingError> Utf8TextEncoder::encode(std::string_view text,
                                                         const std::string& encoding) const {
    if (!is_utf8_encoding_name(encoding)) {
        return Err<Bytes>(unsupported(encoding));
    }
    return Ok<Bytes, TextEncodingError>(to_bytes(text));
}

Result<Bytes, TextEncodingError> IconvTextEncoder::encode(std::string_view text,
                                                          const std::string& encoding) const {
    if (is_utf8_encoding_name(encoding)) {
        return Ok<Bytes, TextEncodingError>(to_bytes(text));
    }

    iconv_t raw = iconv_open(encoding.c_str(), "UTF-8");
    if (raw == reinterpret_cast<iconv_t>(-1)) {
        return Err<Bytes>(unsupported(encoding));
    }
    IconvHandle handle(raw);

    std::string input(text);
    char* in_ptr = input.data();
    std::size_t in_left = input.size();

    Bytes output(input.size() * 2 + 16);
    std::size_t produced = 0;

    auto grow = [&](char*& out_ptr, std::size_t& out_left) {
        produced = output.size() - out_left;
        output.resize(output.size() * 2);
        out_ptr = reinterpret_cast<char*>(output.data()) + produced;
        out_left = output.size() - produced;
    };

    char* out_ptr = reinterpret_cast<char*>(output.data());
    std::size_t out_left = output.size();

    while (in_left > 0) {
        const std::size_t rc = iconv(raw, &in_ptr, &in_left, &out_ptr, &out_left);
        if (rc != static_cast<std::size_t>(-1)) {
            continue;
        }
        if (errno == E2BIG) {
            grow(out_ptr, out_left);
            continue;
        }
        return Err<Bytes>(TextEncodingError{
            TextEncodingError::Kind::InvalidInput,
            "Text cannot be represented in encoding \"" + encoding + "\""});
    }

    // Emit any shift sequence a stateful encoding still owes.
    while (iconv(raw, nullptr, nullptr, &out_ptr, &out_left) == static_cast<std::size_t>(-1)) {
        if (errno != E2BIG) {
            return Err<Bytes>(TextEncodingError{
                TextEncodingError::Kind::InvalidInput,
                "Failed to finish conversion to encoding \"" + encoding + "\""});
        }
        grow(out_ptr, out_left);
    }

    output.resize(output.size() - out_left);
    return Ok<Bytes, TextEncodingError>(std::move(output));
}

std::shared_ptr<const TextEncoder> default_text_encoder() {
    static const auto encoder = std::make_shared<const IconvTextEncoder>();
    return encoder;
}

} // namespace codestorage
