#include "codestorage/webhook/validator.hpp"

#include "codestorage/core/encoding.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace codestorage::webhook {

using json = nlohmann::json;

namespace {

std::string_view trim(std::string_view value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.remove_suffix(1);
    }
    return value;
}

std::optional<std::int64_t> parse_integer(std::string_view text) {
    std::int64_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || text.empty()) {
        return std::nullopt;
    }
    return value;
}

std::int64_t current_unix_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// Distance between two timestamps without signed overflow.
std::uint64_t distance(std::int64_t from, std::int64_t to) {
    return static_cast<std::uint64_t>(to) - static_cast<std::uint64_t>(from);
}

bool is_string_field(const json& object, const char* key) {
    const auto it = object.find(key);
    return it != object.end() && it->is_string();
}

SignatureValidation rejected(std::string error, std::optional<std::int64_t> timestamp = std::nullopt) {
    spdlog::debug("Webhook rejected: {}", error);
    SignatureValidation result;
    result.error = std::move(error);
    result.timestamp = timestamp;
    return result;
}

WebhookValidation rejected_webhook(std::string error, std::optional<std::int64_t> timestamp = std::nullopt) {
    spdlog::debug("Webhook rejected: {}", error);
    WebhookValidation result;
    result.error = std::move(error);
    result.timestamp = timestamp;
    return result;
}

// Value of the single header called `name`; nullopt when missing, empty or
// repeated.
std::optional<std::string> single_header(const network::HeaderList& headers, const std::string& name) {
    std::optional<std::string> found;
    for (const auto& [key, value] : headers) {
        if (!network::header_name_equals(key, name)) {
            continue;
        }
        if (found) {
            return std::nullopt;
        }
        found = value;
    }
    if (found && found->empty()) {
        return std::nullopt;
    }
    return found;
}

} // namespace

// ──────────────────────────────────────────────────────────
// Event decoding
// ──────────────────────────────────────────────────────────

std::optional<std::chrono::system_clock::time_point> parse_iso8601(const std::string& text) {
    std::tm tm{};
    std::istringstream input(text);
    input >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (input.fail()) {
        return std::nullopt;
    }

    std::string rest;
    std::getline(input, rest);
    std::size_t pos = 0;

    std::chrono::nanoseconds fraction{0};
    if (pos < rest.size() && rest[pos] == '.') {
        ++pos;
        std::int64_t scale = 100000000;
        const std::size_t digits_start = pos;
        while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos]))) {
            fraction += std::chrono::nanoseconds((rest[pos] - '0') * scale);
            scale /= 10;
            ++pos;
        }
        if (pos == digits_start) {
            return std::nullopt;
        }
    }

    std::int64_t offset_seconds = 0;
    if (pos < rest.size() && (rest[pos] == 'Z' || rest[pos] == 'z')) {
        ++pos;
    } else if (pos < rest.size() && (rest[pos] == '+' || rest[pos] == '-')) {
        const int sign = rest[pos] == '-' ? -1 : 1;
        std::string zone = rest.substr(pos + 1);
        zone.erase(std::remove(zone.begin(), zone.end(), ':'), zone.end());
        if (zone.size() != 4) {
            return std::nullopt;
        }
        const auto hours = parse_integer(std::string_view(zone).substr(0, 2));
        const auto minutes = parse_integer(std::string_view(zone).substr(2, 2));
        if (!hours || !minutes || *hours > 23 || *minutes > 59) {
            return std::nullopt;
        }
        offset_seconds = sign * (*hours * 3600 + *minutes * 60);
        pos = rest.size();
    } else {
        return std::nullopt;
    }
    if (pos != rest.size()) {
        return std::nullopt;
    }

    const std::time_t utc = timegm(&tm);
    auto point = std::chrono::system_clock::from_time_t(utc) - std::chrono::seconds(offset_seconds);
    return point + std::chrono::duration_cast<std::chrono::system_clock::duration>(fraction);
}

Result<WebhookEventPayload> decode_push_event(const json& raw) {
    if (!raw.is_object()) {
        return Err<WebhookEventPayload>(std::string("Invalid push payload"));
    }
    const auto repository = raw.find("repository");
    if (repository == raw.end() || !repository->is_object() ||
        !is_string_field(*repository, "id") || !is_string_field(*repository, "url")) {
        return Err<WebhookEventPayload>(std::string("Invalid push payload"));
    }
    for (const char* key : {"ref", "before", "after", "customer_id", "pushed_at"}) {
        if (!is_string_field(raw, key)) {
            return Err<WebhookEventPayload>(std::string("Invalid push payload"));
        }
    }

    PushEvent event;
    event.repository.id = (*repository)["id"].get<std::string>();
    event.repository.url = (*repository)["url"].get<std::string>();
    event.ref = raw["ref"].get<std::string>();
    event.before = raw["before"].get<std::string>();
    event.after = raw["after"].get<std::string>();
    event.customer_id = raw["customer_id"].get<std::string>();
    event.raw_pushed_at = raw["pushed_at"].get<std::string>();
    event.pushed_at = parse_iso8601(event.raw_pushed_at);
    return Ok(WebhookEventPayload(std::move(event)));
}

WebhookEventRegistry WebhookEventRegistry::with_defaults() {
    WebhookEventRegistry registry;
    registry.register_decoder("push", decode_push_event);
    return registry;
}

void WebhookEventRegistry::register_decoder(const std::string& event_type, Decoder decoder) {
    decoders_[event_type] = std::move(decoder);
}

bool WebhookEventRegistry::has_decoder(const std::string& event_type) const {
    return decoders_.count(event_type) > 0;
}

Result<WebhookEventPayload> WebhookEventRegistry::decode(const std::string& event_type,
                                                         const json& raw) const {
    const auto it = decoders_.find(event_type);
    if (it == decoders_.end()) {
        return Ok(WebhookEventPayload(RawEvent{event_type, raw}));
    }
    return it->second(raw);
}

// ──────────────────────────────────────────────────────────
// Signatures
// ──────────────────────────────────────────────────────────

std::optional<ParsedSignature> parse_signature_header(std::string_view header) {
    ParsedSignature parsed;

    while (!header.empty()) {
        const auto comma = header.find(',');
        const std::string_view element = trim(header.substr(0, comma));
        header = comma == std::string_view::npos ? std::string_view() : header.substr(comma + 1);

        const auto equals = element.find('=');
        if (equals == std::string_view::npos) {
            continue;
        }
        const std::string_view key = element.substr(0, equals);
        std::string_view value = element.substr(equals + 1);
        // Only the text up to a second '=' belongs to the value.
        value = value.substr(0, value.find('='));

        if (key == "t") {
            parsed.timestamp = std::string(value);
        } else if (key == "sha256") {
            parsed.signature = std::string(value);
        }
    }

    if (parsed.timestamp.empty() || parsed.signature.empty()) {
        return std::nullopt;
    }
    return parsed;
}

Result<std::string> compute_webhook_signature(std::string_view timestamp,
                                              std::string_view payload,
                                              std::string_view secret) {
    std::string message;
    message.reserve(timestamp.size() + 1 + payload.size());
    message.append(timestamp);
    message.push_back('.');
    message.append(payload);

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    const unsigned char* mac = HMAC(EVP_sha256(),
                                    secret.data(), static_cast<int>(secret.size()),
                                    reinterpret_cast<const unsigned char*>(message.data()), message.size(),
                                    digest, &digest_len);
    if (mac == nullptr) {
        return Err<std::string>(std::string("HMAC-SHA256 computation failed"));
    }
    return Ok(hex_encode(digest, digest_len));
}

SignatureValidation validate_webhook_signature(std::string_view payload,
                                               std::string_view signature_header,
                                               std::string_view secret,
                                               const WebhookValidationOptions& options) {
    if (secret.empty()) {
        return rejected("Empty secret is not allowed");
    }

    const auto parsed = parse_signature_header(signature_header);
    if (!parsed) {
        return rejected("Invalid signature header format");
    }

    const auto timestamp = parse_integer(parsed->timestamp);
    if (!timestamp) {
        return rejected("Invalid timestamp in signature");
    }

    if (options.max_age_seconds > 0) {
        const std::int64_t now = options.now_seconds.value_or(current_unix_seconds());
        if (*timestamp < now &&
            distance(*timestamp, now) > static_cast<std::uint64_t>(options.max_age_seconds)) {
            return rejected("Webhook timestamp too old (" + std::to_string(distance(*timestamp, now)) + " seconds)",
                            timestamp);
        }
        if (*timestamp > now &&
            distance(now, *timestamp) > static_cast<std::uint64_t>(kMaxFutureSkewSeconds)) {
            return rejected("Webhook timestamp is in the future", timestamp);
        }
    }

    const auto expected = compute_webhook_signature(parsed->timestamp, payload, secret);
    if (expected.is_error()) {
        return rejected(expected.error(), timestamp);
    }

    const std::string& expected_hex = expected.value();
    if (expected_hex.size() != parsed->signature.size() ||
        CRYPTO_memcmp(expected_hex.data(), parsed->signature.data(), expected_hex.size()) != 0) {
        return rejected("Invalid signature", timestamp);
    }

    SignatureValidation result;
    result.valid = true;
    result.timestamp = timestamp;
    return result;
}

WebhookValidation validate_webhook(std::string_view payload,
                                   const network::HeaderList& headers,
                                   std::string_view secret,
                                   const WebhookValidationOptions& options,
                                   const WebhookEventRegistry* registry) {
    const auto signature_header = single_header(headers, kSignatureHeader);
    if (!signature_header) {
        return rejected_webhook("Missing or invalid X-Pierre-Signature header");
    }
    const auto event_type = single_header(headers, kEventHeader);
    if (!event_type) {
        return rejected_webhook("Missing or invalid X-Pierre-Event header");
    }

    const SignatureValidation signature = validate_webhook_signature(payload, *signature_header, secret, options);
    if (!signature.valid) {
        WebhookValidation result;
        result.error = signature.error;
        result.timestamp = signature.timestamp;
        return result;
    }

    const json parsed = json::parse(payload.begin(), payload.end(), nullptr, false);
    if (parsed.is_discarded()) {
        return rejected_webhook("Invalid JSON payload", signature.timestamp);
    }

    static const WebhookEventRegistry default_registry = WebhookEventRegistry::with_defaults();
    const WebhookEventRegistry& events = registry ? *registry : default_registry;

    auto decoded = events.decode(*event_type, parsed);
    if (decoded.is_error()) {
        return rejected_webhook(decoded.error(), signature.timestamp);
    }

    WebhookValidation result;
    result.valid = true;
    result.timestamp = signature.timestamp;
    result.event_type = *event_type;
    result.payload = std::move(decoded.value());
    return result;
}

WebhookValidation validate_webhook(const network::HttpRequest& request,
                                   std::string_view secret,
                                   const WebhookValidationOptions& options,
                                   const WebhookEventRegistry* registry) {
    const std::string body = request.body_as_string();
    return validate_webhook(body, request.headers, secret, options, registry);
}

} // namespace codestorage::webhook
