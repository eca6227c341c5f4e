#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace codestorage::webhook {

constexpr std::int64_t kDefaultMaxAgeSeconds = 300;
constexpr std::int64_t kMaxFutureSkewSeconds = 60;

constexpr const char* kSignatureHeader = "X-Pierre-Signature";
constexpr const char* kEventHeader = "X-Pierre-Event";

/**
 * @brief Elements of "t=<seconds>,sha256=<hex>"
 */
struct ParsedSignature {
    std::string timestamp;
    std::string signature;
};

struct PushRepository {
    std::string id;
    std::string url;
};

struct PushEvent {
    PushRepository repository;
    std::string ref;
    std::string before;
    std::string after;
    std::string customer_id;
    std::optional<std::chrono::system_clock::time_point> pushed_at;  // Empty when unparseable
    std::string raw_pushed_at;
};

/**
 * @brief Event without a typed decoder, passed through unchecked
 */
struct RawEvent {
    std::string type;
    nlohmann::json raw;
};

using WebhookEventPayload = std::variant<PushEvent, RawEvent>;

struct WebhookValidationOptions {
    /// Replay window; zero or negative disables both age checks.
    std::int64_t max_age_seconds = kDefaultMaxAgeSeconds;

    /// Current unix time; the system clock is used when unset.
    std::optional<std::int64_t> now_seconds;
};

/**
 * @brief Outcome of a signature check; never an exception
 */
struct SignatureValidation {
    bool valid = false;
    std::string error;
    std::optional<std::int64_t> timestamp;
};

struct WebhookValidation {
    bool valid = false;
    std::string error;
    std::optional<std::int64_t> timestamp;
    std::string event_type;
    std::optional<WebhookEventPayload> payload;
};

} // namespace codestorage::webhook
