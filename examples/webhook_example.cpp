/**
 * @file webhook_example.cpp
 * @brief Verifies a signed webhook delivery
 *
 * Usage: webhook_example <secret> [payload-json]
 *
 * Signs the payload the way the service does, validates it, and then shows
 * that a modified body is rejected. Replace the signing step with the
 * headers of a real delivery to check one.
 */

#include "codestorage/webhook/validator.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <iostream>
#include <string>
#include <variant>

using namespace codestorage;

namespace {

void report(const webhook::WebhookValidation& result) {
    if (!result.valid) {
        spdlog::warn("Rejected: {}", result.error);
        return;
    }
    spdlog::info("Accepted {} event (t={})", result.event_type, result.timestamp.value_or(0));
    if (const auto* push = std::get_if<webhook::PushEvent>(&*result.payload)) {
        spdlog::info("  {} {} -> {} on {}", push->repository.url, push->before, push->after, push->ref);
    } else if (const auto* raw = std::get_if<webhook::RawEvent>(&*result.payload)) {
        spdlog::info("  raw payload: {}", raw->raw.dump());
    }
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::debug);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <secret> [payload-json]\n";
        return 1;
    }

    const std::string secret = argv[1];
    const std::string payload = argc > 2 ? argv[2] : R"({"repository":{"id":"repo-1","url":"https://git.example.com/acme/app"},)"
                                                     R"("ref":"refs/heads/main","before":"0000000","after":"1111111",)"
                                                     R"("customer_id":"acme","pushed_at":"2024-01-01T00:00:00Z"})";

    const auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    const std::string timestamp = std::to_string(now);

    auto digest = webhook::compute_webhook_signature(timestamp, payload, secret);
    if (digest.is_error()) {
        spdlog::error("{}", digest.error());
        return 1;
    }

    network::HeaderList headers{
        {webhook::kSignatureHeader, "t=" + timestamp + ",sha256=" + digest.value()},
        {webhook::kEventHeader, "push"},
    };

    report(webhook::validate_webhook(payload, headers, secret));
    report(webhook::validate_webhook(payload + " ", headers, secret));
    return 0;
}
