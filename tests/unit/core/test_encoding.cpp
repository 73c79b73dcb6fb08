/**
 * @file test_encoding.cpp
 * @brief Codec, decimal-scaling and private-key decoding tests
 */

#include <gtest/gtest.h>
#include "core/auth/key_decoder.h"
#include "core/errors.h"
#include "core/net/http_client.h"
#include "core/util/encoding.h"
#include "core/util/num_string.h"

using namespace tradegate;

// ============================================================================
// TESTS: CODECS
// ============================================================================

TEST(Encoding, HexAcceptsPrefixAndRejectsGarbage) {
    const auto bytes = util::hex_decode("0xDEadBEef");
    ASSERT_TRUE(bytes);
    EXPECT_EQ(util::hex_encode(*bytes), "deadbeef");
    EXPECT_EQ(util::hex_encode(*bytes, true), "0xdeadbeef");
    EXPECT_FALSE(util::hex_decode("abc"));
    EXPECT_FALSE(util::hex_decode("zz"));
}

TEST(Encoding, QueryValuesArePercentEncoded) {
    EXPECT_EQ(nethttp::build_query({{"a", "x y&z"}, {"b", "1/2"}, {"c", "A-z_0.9~"}}),
              "a=x%20y%26z&b=1%2F2&c=A-z_0.9~");
    EXPECT_EQ(nethttp::build_query({}), "");
}

TEST(Encoding, Base58KnownValues) {
    const std::string text = "Hello World!";
    const util::Bytes bytes(text.begin(), text.end());
    EXPECT_EQ(util::base58_encode(bytes), "2NEpo7TZRRrLZSi2U");
    EXPECT_EQ(util::base58_encode(util::Bytes{0, 0, 1}), "112");

    const auto decoded = util::base58_decode("2NEpo7TZRRrLZSi2U");
    ASSERT_TRUE(decoded);
    EXPECT_EQ(*decoded, bytes);
    EXPECT_FALSE(util::base58_decode("0OIl"));
}

TEST(Encoding, Base64KnownValues) {
    EXPECT_EQ(util::base64_encode(util::Bytes{'f', 'o', 'o', 'b', 'a', 'r'}), "Zm9vYmFy");
    EXPECT_EQ(util::base64_encode(util::Bytes{'f', 'o'}), "Zm8=");

    const auto padded = util::base64_decode("Zm8=");
    ASSERT_TRUE(padded);
    EXPECT_EQ(*padded, (util::Bytes{'f', 'o'}));
    EXPECT_FALSE(util::base64_decode("not base64!"));
}

// ============================================================================
// TESTS: DECIMAL SCALING
// ============================================================================

TEST(NumString, ToBaseUnitsTruncatesExtraDigits) {
    EXPECT_EQ(util::to_base_units("1.25", 6).value(), 1250000u);
    EXPECT_EQ(util::to_base_units("0.1", 9).value(), 100000000u);
    EXPECT_EQ(util::to_base_units("10", 0).value(), 10u);
    EXPECT_EQ(util::to_base_units("0.1234567", 6).value(), 123456u);
    EXPECT_EQ(util::to_base_units(".5", 1).value(), 5u);
}

TEST(NumString, ToBaseUnitsRejectsInvalid) {
    EXPECT_FALSE(util::to_base_units("", 6));
    EXPECT_FALSE(util::to_base_units("-1", 6));
    EXPECT_FALSE(util::to_base_units("1e3", 6));
    EXPECT_FALSE(util::to_base_units("1.2.3", 6));
    EXPECT_FALSE(util::to_base_units("99999999999999999999", 0));
    EXPECT_FALSE(util::to_base_units("100000000000", 9));
}

TEST(NumString, FormatDecimalTrimsZeros) {
    EXPECT_EQ(util::format_decimal(1.5), "1.5");
    EXPECT_EQ(util::format_decimal(2.0), "2");
    EXPECT_EQ(util::format_decimal(0.000123), "0.000123");
}

// ============================================================================
// TESTS: PRIVATE KEY DECODING
// ============================================================================

namespace {

const auto accept_32 = [](const util::Bytes& b) { return b.size() == 32; };

util::Bytes sequential_key() {
    util::Bytes key(32);
    for (std::size_t i = 0; i < key.size(); ++i) key[i] = static_cast<std::uint8_t>(i + 1);
    return key;
}

} // namespace

TEST(KeyDecoder, AcceptsHexBase58AndJsonArray) {
    const auto key = sequential_key();

    EXPECT_EQ(auth::decode_private_key(util::hex_encode(key, true), accept_32), key);
    EXPECT_EQ(auth::decode_private_key(util::hex_encode(key), accept_32), key);
    EXPECT_EQ(auth::decode_private_key(util::base58_encode(key), accept_32), key);

    std::string json = "[";
    for (std::size_t i = 0; i < key.size(); ++i) {
        if (i) json += ", ";
        json += std::to_string(key[i]);
    }
    json += "]";
    EXPECT_EQ(auth::decode_private_key("  " + json + "\n", accept_32), key);
}

TEST(KeyDecoder, InvalidTextFailsWithInvalidKeyFormat) {
    try {
        auth::decode_private_key("definitely-not-a-key!", accept_32);
        FAIL() << "expected InputError";
    } catch (const InputError& e) {
        EXPECT_STREQ(e.what(), "invalid key format");
    }
}

TEST(KeyDecoder, AcceptorRejectionFallsThrough) {
    // 16 hex-decodable bytes are refused, and nothing else decodes to 32 bytes
    EXPECT_THROW(auth::decode_private_key("00112233445566778899aabbccddeeff", accept_32), InputError);
}

TEST(KeyDecoder, JsonArrayRejectsOutOfRangeBytes) {
    EXPECT_FALSE(auth::decode_json_array_key("[1, 2, 256]"));
    EXPECT_FALSE(auth::decode_json_array_key("[1, -2]"));
    EXPECT_FALSE(auth::decode_json_array_key("{\"a\": 1}"));
}
