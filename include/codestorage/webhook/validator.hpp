#pragma once

#include "codestorage/core/result.hpp"
#include "codestorage/network/http_types.hpp"
#include "codestorage/webhook/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace codestorage::webhook {

/**
 * @brief Maps event types to payload decoders
 *
 * The set is open: register() adds or replaces a decoder. Types without a
 * decoder decode to RawEvent{type, raw}.
 */
class WebhookEventRegistry {
public:
    using Decoder = std::function<Result<WebhookEventPayload>(const nlohmann::json& raw)>;

    /// Registry that knows "push".
    static WebhookEventRegistry with_defaults();

    void register_decoder(const std::string& event_type, Decoder decoder);
    bool has_decoder(const std::string& event_type) const;

    Result<WebhookEventPayload> decode(const std::string& event_type, const nlohmann::json& raw) const;

private:
    std::unordered_map<std::string, Decoder> decoders_;
};

/// Strict decoder for push events ("Invalid push payload" on shape mismatch).
Result<WebhookEventPayload> decode_push_event(const nlohmann::json& raw);

/// ISO-8601 / RFC 3339 date-time with Z or +-HH:MM offset and optional fraction.
std::optional<std::chrono::system_clock::time_point> parse_iso8601(const std::string& text);

/**
 * @brief Parse "t=<seconds>,sha256=<hex>"
 *
 * Elements are comma separated, order independent, and unknown keys are
 * ignored. std::nullopt when t or sha256 is missing or empty.
 */
std::optional<ParsedSignature> parse_signature_header(std::string_view header);

/// Lowercase hex HMAC-SHA256 of "<timestamp>.<payload>" keyed by secret.
Result<std::string> compute_webhook_signature(std::string_view timestamp,
                                              std::string_view payload,
                                              std::string_view secret);

/**
 * @brief Check the signature header against the raw payload
 *
 * Rejects an empty secret, a malformed header, a non-integer timestamp, a
 * timestamp older than max_age_seconds or more than 60 s in the future,
 * and any digest mismatch. Digest comparison is length-checked and constant
 * time; a length mismatch reports the same "Invalid signature" error.
 */
SignatureValidation validate_webhook_signature(std::string_view payload,
                                               std::string_view signature_header,
                                               std::string_view secret,
                                               const WebhookValidationOptions& options = {});

/**
 * @brief Full inbound webhook check: headers, signature, JSON and payload type
 *
 * Exactly one X-Pierre-Signature and one X-Pierre-Event header (names are
 * case-insensitive) must be present. The registry defaults to
 * WebhookEventRegistry::with_defaults().
 */
WebhookValidation validate_webhook(std::string_view payload,
                                   const network::HeaderList& headers,
                                   std::string_view secret,
                                   const WebhookValidationOptions& options = {},
                                   const WebhookEventRegistry* registry = nullptr);

WebhookValidation validate_webhook(const network::HttpRequest& request,
                                   std::string_view secret,
                                   const WebhookValidationOptions& options = {},
                                   const WebhookEventRegistry* registry = nullptr);

} // namespace codestorage::webhook
