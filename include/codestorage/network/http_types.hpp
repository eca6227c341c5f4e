#pragma once

#include <strings.h>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace codestorage {
namespace network {

enum class HttpVersion {
    HTTP_1_0,
    HTTP_1_1
};

/// Header names compare case-insensitively (RFC 7230).
inline bool header_name_equals(const std::string& a, const std::string& b) {
    return strcasecmp(a.c_str(), b.c_str()) == 0;
}

/**
 * @brief Ordered header list; names may repeat
 *
 * Outbound requests and inbound webhook deliveries both need to preserve
 * duplicates, which a map would silently merge.
 */
using HeaderList = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Headers and raw body of an inbound delivery, as handed over by the
 * embedding server
 */
struct HttpRequest {
    HeaderList headers;
    std::vector<uint8_t> body;

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }
};

/**
 * @brief A response received from the service
 *
 * Repeated header fields are folded into one comma-separated value.
 */
struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 0;
    std::string reason_phrase;                            // e.g., "OK", "Conflict"
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    bool is_success() const {
        return status_code >= 200 && status_code < 300;
    }

    std::string get_header(const std::string& name) const {
        for (const auto& [key, value] : headers) {
            if (header_name_equals(key, name)) {
                return value;
            }
        }
        return "";
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }

    void add_header(const std::string& name, const std::string& value) {
        for (auto& [key, existing] : headers) {
            if (header_name_equals(key, name)) {
                existing += ", " + value;
                return;
            }
        }
        headers.emplace(name, value);
    }
};

} // namespace network
} // namespace codestorage
