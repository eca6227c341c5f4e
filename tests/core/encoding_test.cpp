#include "codestorage/core/content_id.hpp"
#include "codestorage/core/encoding.hpp"
#include "codestorage/core/version.hpp"

#include <gtest/gtest.h>

#include <regex>
#include <set>
#include <string>

using codestorage::Bytes;
using codestorage::IconvTextEncoder;
using codestorage::TextEncodingError;
using codestorage::Utf8TextEncoder;

TEST(EncodingTest, Base64MatchesKnownVectors) {
    EXPECT_EQ(codestorage::base64_encode(codestorage::to_bytes("")), "");
    EXPECT_EQ(codestorage::base64_encode(codestorage::to_bytes("f")), "Zg==");
    EXPECT_EQ(codestorage::base64_encode(codestorage::to_bytes("fo")), "Zm8=");
    EXPECT_EQ(codestorage::base64_encode(codestorage::to_bytes("foo")), "Zm9v");
    EXPECT_EQ(codestorage::base64_encode(codestorage::to_bytes("hi")), "aGk=");
}

TEST(EncodingTest, Base64SpansInternalBlocks) {
    // Larger than one encoder block; output must have no embedded padding.
    Bytes data(3 * 256 * 1024 + 1, 0xFF);
    const std::string encoded = codestorage::base64_encode(data);

    EXPECT_EQ(encoded.size(), ((data.size() + 2) / 3) * 4);
    EXPECT_EQ(encoded.find('='), encoded.size() - 2);
}

TEST(EncodingTest, HexIsLowercase) {
    const Bytes data{0x00, 0xAB, 0x7F, 0xFF};
    EXPECT_EQ(codestorage::hex_encode(data.data(), data.size()), "00ab7fff");
}

TEST(EncodingTest, Utf8EncoderRejectsOtherEncodings) {
    Utf8TextEncoder encoder;

    auto ok = encoder.encode("héllo", "UTF-8");
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(codestorage::to_string(ok.value()), "héllo");

    auto rejected = encoder.encode("hello", "latin1");
    ASSERT_TRUE(rejected.is_error());
    EXPECT_EQ(rejected.error().kind, TextEncodingError::Kind::Unsupported);
    EXPECT_NE(rejected.error().message.find("latin1"), std::string::npos);
}

TEST(EncodingTest, IconvEncoderConvertsToLatin1) {
    IconvTextEncoder encoder;

    auto result = encoder.encode("h\xC3\xA9", "ISO-8859-1");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), (Bytes{'h', 0xE9}));
}

TEST(EncodingTest, IconvEncoderReportsUnknownEncoding) {
    IconvTextEncoder encoder;

    auto result = encoder.encode("text", "NOT-A-REAL-ENCODING");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, TextEncodingError::Kind::Unsupported);
}

TEST(EncodingTest, IconvEncoderRejectsUnrepresentableText) {
    IconvTextEncoder encoder;

    // U+20AC EURO SIGN has no Latin-1 code point.
    auto result = encoder.encode("\xE2\x82\xAC", "ISO-8859-1");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, TextEncodingError::Kind::InvalidInput);
}

TEST(ContentIdTest, RandomIdsAreVersion4Uuids) {
    const std::regex uuid("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    std::set<std::string> seen;
    for (int i = 0; i < 64; ++i) {
        const std::string id = codestorage::random_content_id();
        EXPECT_TRUE(std::regex_match(id, uuid)) << id;
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 64u);
}

TEST(ContentIdTest, FallbackIdsHaveTimeAndRandomParts) {
    const std::regex shape("^cid-[0-9a-z]+-[0-9a-z]+$");
    const std::string first = codestorage::fallback_content_id();
    const std::string second = codestorage::fallback_content_id();

    EXPECT_TRUE(std::regex_match(first, shape)) << first;
    EXPECT_NE(first, second);
}

TEST(VersionTest, UserAgentCarriesPackageAndVersion) {
    EXPECT_EQ(codestorage::user_agent(), std::string("code-storage-cpp/") + CODESTORAGE_VERSION);
}
