#include <gtest/gtest.h>
#include "encoding.hpp"

using namespace namesys;

TEST(EncodingTest, HexRoundTrip) {
    Bytes data{0x00, 0x01, 0xab, 0xff};
    EXPECT_EQ(encoding::to_hex(data), "0001abff");

    auto decoded = encoding::from_hex("0001ABff");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, data);
}

TEST(EncodingTest, HexRejectsGarbage) {
    EXPECT_FALSE(encoding::from_hex("abc").has_value());
    EXPECT_FALSE(encoding::from_hex("zz").has_value());
    EXPECT_TRUE(encoding::from_hex("")->empty());
}

TEST(EncodingTest, Base58KnownVector) {
    EXPECT_EQ(encoding::base58_encode(encoding::to_bytes("hello world")), "StV1DL6CwTryKyV");

    auto decoded = encoding::base58_decode("StV1DL6CwTryKyV");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(encoding::to_string(*decoded), "hello world");
}

TEST(EncodingTest, Base58LeadingZeros) {
    Bytes data{0x00, 0x00, 0x01};
    std::string text = encoding::base58_encode(data);
    EXPECT_EQ(text, "112");
    EXPECT_EQ(*encoding::base58_decode(text), data);
}

TEST(EncodingTest, Base58RejectsInvalidAlphabet) {
    // '0', 'O', 'I' and 'l' are excluded from the bitcoin alphabet
    EXPECT_FALSE(encoding::base58_decode("0abc").has_value());
    EXPECT_FALSE(encoding::base58_decode("QmOl").has_value());
}

TEST(EncodingTest, Base64Standard) {
    EXPECT_EQ(encoding::base64_encode(encoding::to_bytes("foobar")), "Zm9vYmFy");
    EXPECT_EQ(encoding::base64_encode(encoding::to_bytes("fo")), "Zm8=");

    auto decoded = encoding::base64_decode("Zm8=");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(encoding::to_string(*decoded), "fo");
}

TEST(EncodingTest, Base64RejectsMalformed) {
    EXPECT_FALSE(encoding::base64_decode("Zm8").has_value());
    EXPECT_FALSE(encoding::base64_decode("Zm8!").has_value());
    EXPECT_FALSE(encoding::base64_decode("Z===").has_value());
}

TEST(EncodingTest, Base64UrlHasNoPadding) {
    Bytes data{0xfb, 0xff, 0xfe};
    EXPECT_EQ(encoding::base64_encode(data), "+//+");
    EXPECT_EQ(encoding::base64url_encode(data), "-__-");
    EXPECT_EQ(encoding::base64url_encode(encoding::to_bytes("fo")), "Zm8");
}
