#include "codestorage/core/content_id.hpp"
#include "codestorage/core/encoding.hpp"

#include <openssl/rand.h>
#include <spdlog/spdlog.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <random>

namespace codestorage {
namespace {

std::string to_base36(std::uint64_t value) {
    static constexpr char kDigits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    if (value == 0) {
        return "0";
    }
    std::string out;
    while (value > 0) {
        out.insert(out.begin(), kDigits[value % 36]);
        value /= 36;
    }
    return out;
}

} // namespace

std::string random_content_id() {
    std::array<std::uint8_t, 16> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        spdlog::warn("RAND_bytes failed, using non-cryptographic content id");
        return fallback_content_id();
    }

    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40); // version 4
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80); // RFC 4122 variant

    const std::string hex = hex_encode(bytes.data(), bytes.size());
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

std::string fallback_content_id() {
    thread_local std::mt19937_64 engine{std::random_device{}()};

    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "cid-" + to_base36(static_cast<std::uint64_t>(millis)) + "-" + to_base36(engine());
}

ContentIdGenerator default_content_id_generator() {
    return [] { return random_content_id(); };
}

} // namespace codestorage
