#pragma once

#include "codestorage/core/result.hpp"
#include "codestorage/network/http_types.hpp"

#include <cctype>
#include <cstdint>
#include <string>

namespace codestorage {
namespace network {

/**
 * @brief State machine states for HTTP response parsing
 *
 * HTTP Response Format:
 * VERSION SP STATUS SP REASON CRLF  <- Status line
 * Header-Name: Header-Value CRLF    <- Headers (multiple)
 * CRLF                              <- Empty line
 * [Body]                            <- Content-Length, chunked, or until close
 */
enum class ResponseParseState {
    VERSION,          // Parsing HTTP version
    STATUS_CODE,      // Parsing 3-digit status code
    REASON,           // Parsing reason phrase
    HEADER_NAME,      // Parsing header field name
    HEADER_VALUE,     // Parsing header field value
    BODY,             // Content-Length delimited body
    CHUNK_SIZE,       // Chunk size line (hex, optional extensions)
    CHUNK_DATA,       // Chunk payload
    CHUNK_DATA_END,   // CRLF after chunk payload
    TRAILER,          // Trailer fields after the last chunk
    BODY_UNTIL_CLOSE, // Body delimited by connection close
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP/1.x response parser
 *
 * Feed bytes as they arrive from the socket. When the peer closes the
 * connection call finish(), which completes close-delimited bodies.
 *
 * Usage example:
 * ```cpp
 * HttpResponseParser parser;
 * auto result = parser.parse(buffer.data(), n);
 * if (result.is_ok() && result.value()) {
 *     HttpResponse response = parser.get_response();
 * }
 * ```
 */
class HttpResponseParser {
public:
    HttpResponseParser() { reset(); }

    /**
     * @return true once a complete response was parsed, false if more data
     *         is needed, or an error for malformed input
     */
    Result<bool> parse(const char* data, size_t len) {
        for (size_t i = 0; i < len; ++i) {
            char c = data[i];

            if (c == '\n') {
                line_++;
            }

            bool ok = true;
            switch (state_) {
                case ResponseParseState::VERSION:
                    ok = parse_version(c);
                    break;
                case ResponseParseState::STATUS_CODE:
                    ok = parse_status_code(c);
                    break;
                case ResponseParseState::REASON:
                    ok = parse_reason(c);
                    break;
                case ResponseParseState::HEADER_NAME:
                    ok = parse_header_name(c);
                    break;
                case ResponseParseState::HEADER_VALUE:
                    ok = parse_header_value(c);
                    break;
                case ResponseParseState::BODY:
                    parse_body(c);
                    break;
                case ResponseParseState::CHUNK_SIZE:
                    ok = parse_chunk_size(c);
                    break;
                case ResponseParseState::CHUNK_DATA:
                    parse_chunk_data(c);
                    break;
                case ResponseParseState::CHUNK_DATA_END:
                    ok = parse_chunk_data_end(c);
                    break;
                case ResponseParseState::TRAILER:
                    parse_trailer(c);
                    break;
                case ResponseParseState::BODY_UNTIL_CLOSE:
                    response_.body.push_back(static_cast<uint8_t>(c));
                    break;
                case ResponseParseState::COMPLETE:
                    return Ok(true);
                case ResponseParseState::PARSE_ERROR:
                    return Err<bool, std::string>("Parser in error state");
            }

            if (!ok) {
                state_ = ResponseParseState::PARSE_ERROR;
                return Err<bool, std::string>("Malformed HTTP response at line " +
                                              std::to_string(line_));
            }

            if (state_ == ResponseParseState::COMPLETE) {
                return Ok(true);
            }
        }

        return Ok(false);
    }

    /**
     * @brief Signal that the peer closed the connection
     */
    Result<bool> finish() {
        if (state_ == ResponseParseState::BODY_UNTIL_CLOSE) {
            state_ = ResponseParseState::COMPLETE;
        }
        if (state_ == ResponseParseState::COMPLETE) {
            return Ok(true);
        }
        return Err<bool, std::string>("Connection closed before the response was complete");
    }

    HttpResponse get_response() const {
        return response_;
    }

    bool is_complete() const {
        return state_ == ResponseParseState::COMPLETE;
    }

    void reset() {
        state_ = ResponseParseState::VERSION;
        response_ = HttpResponse();
        buffer_.clear();
        current_header_name_.clear();
        remaining_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
        chunk_size_seen_ = false;
        chunk_extension_ = false;
    }

private:
    ResponseParseState state_;
    HttpResponse response_;
    std::string buffer_;
    std::string current_header_name_;
    uint64_t remaining_;              // Bytes left in Content-Length body or current chunk
    size_t line_;
    bool last_char_was_cr_;
    bool chunk_size_seen_;
    bool chunk_extension_;

    static bool parse_decimal(const std::string& text, uint64_t& out) {
        if (text.empty() || text.size() > 19) {
            return false;
        }
        uint64_t value = 0;
        for (char c : text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return false;
            }
            value = value * 10 + static_cast<uint64_t>(c - '0');
        }
        out = value;
        return true;
    }

    static int hex_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
        if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
        return -1;
    }

    static std::string trim(const std::string& value) {
        const auto first = value.find_first_not_of(" \t");
        if (first == std::string::npos) {
            return "";
        }
        const auto last = value.find_last_not_of(" \t");
        return value.substr(first, last - first + 1);
    }

    // "HTTP/1.1 200 OK"
    //  ^-- we're here
    bool parse_version(char c) {
        if (c == ' ') {
            if (buffer_ == "HTTP/1.1") {
                response_.version = HttpVersion::HTTP_1_1;
            } else if (buffer_ == "HTTP/1.0") {
                response_.version = HttpVersion::HTTP_1_0;
            } else {
                return false;
            }
            buffer_.clear();
            state_ = ResponseParseState::STATUS_CODE;
            return true;
        }
        if (buffer_.size() >= 8) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    // "HTTP/1.1 200 OK"
    //           ^-- we're here
    bool parse_status_code(char c) {
        if (c == ' ' || c == '\r') {
            if (buffer_.size() != 3) {
                return false;
            }
            response_.status_code = std::stoi(buffer_);
            buffer_.clear();
            last_char_was_cr_ = (c == '\r');
            state_ = ResponseParseState::REASON;
            return true;
        }
        if (!std::isdigit(static_cast<unsigned char>(c)) || buffer_.size() >= 3) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_reason(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            response_.reason_phrase = buffer_;
            buffer_.clear();
            last_char_was_cr_ = false;
            state_ = ResponseParseState::HEADER_NAME;
            return true;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool parse_header_name(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            if (!buffer_.empty()) {
                return false; // Header line without a colon
            }
            return begin_body();
        }

        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return false;
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ResponseParseState::HEADER_VALUE;
            return true;
        }

        // Header names are tokens: visible ASCII without separators we care about
        if (!std::isgraph(static_cast<unsigned char>(c))) {
            return false;
        }

        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && (c == ' ' || c == '\t')) {
            return true;
        }

        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            response_.add_header(current_header_name_, trim(buffer_));
            buffer_.clear();
            current_header_name_.clear();
            last_char_was_cr_ = false;
            state_ = ResponseParseState::HEADER_NAME;
            return true;
        }

        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    /**
     * @brief Decide how the body is delimited once headers are complete
     */
    bool begin_body() {
        const int status = response_.status_code;

        // Interim responses are followed by the real one
        if (status >= 100 && status < 200) {
            state_ = ResponseParseState::VERSION;
            response_ = HttpResponse();
            return true;
        }

        if (status == 204 || status == 304) {
            state_ = ResponseParseState::COMPLETE;
            return true;
        }

        const std::string transfer_encoding = response_.get_header("Transfer-Encoding");
        if (transfer_encoding.find("chunked") != std::string::npos) {
            chunk_size_seen_ = false;
            chunk_extension_ = false;
            state_ = ResponseParseState::CHUNK_SIZE;
            return true;
        }

        const std::string content_length = response_.get_header("Content-Length");
        if (!content_length.empty()) {
            uint64_t length = 0;
            if (!parse_decimal(content_length, length)) {
                return false;
            }
            if (length == 0) {
                state_ = ResponseParseState::COMPLETE;
                return true;
            }
            remaining_ = length;
            state_ = ResponseParseState::BODY;
            return true;
        }

        state_ = ResponseParseState::BODY_UNTIL_CLOSE;
        return true;
    }

    void parse_body(char c) {
        response_.body.push_back(static_cast<uint8_t>(c));
        if (--remaining_ == 0) {
            state_ = ResponseParseState::COMPLETE;
        }
    }

    // "1a;ext=1\r\n"
    bool parse_chunk_size(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            if (!chunk_size_seen_) {
                return false;
            }
            chunk_size_seen_ = false;
            chunk_extension_ = false;
            if (remaining_ == 0) {
                state_ = ResponseParseState::TRAILER;
            } else {
                state_ = ResponseParseState::CHUNK_DATA;
            }
            return true;
        }
        last_char_was_cr_ = false;

        if (chunk_extension_) {
            return true;
        }
        if (c == ';') {
            chunk_extension_ = true;
            return chunk_size_seen_;
        }

        const int digit = hex_value(c);
        if (digit < 0) {
            return false;
        }
        if (!chunk_size_seen_) {
            remaining_ = 0;
        }
        if (remaining_ > (UINT64_MAX >> 4)) {
            return false;
        }
        remaining_ = (remaining_ << 4) | static_cast<uint64_t>(digit);
        chunk_size_seen_ = true;
        return true;
    }

    void parse_chunk_data(char c) {
        response_.body.push_back(static_cast<uint8_t>(c));
        if (--remaining_ == 0) {
            state_ = ResponseParseState::CHUNK_DATA_END;
        }
    }

    bool parse_chunk_data_end(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            state_ = ResponseParseState::CHUNK_SIZE;
            return true;
        }
        return false;
    }

    // Trailer fields are skipped; an empty line ends the message.
    void parse_trailer(char c) {
        if (c == '\r') {
            return;
        }
        if (c == '\n') {
            if (buffer_.empty()) {
                state_ = ResponseParseState::COMPLETE;
            }
            buffer_.clear();
            return;
        }
        buffer_ += c;
    }
};

} // namespace network
} // namespace codestorage
