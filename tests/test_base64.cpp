// =============================================================================
// Base64 Tests
// =============================================================================

#include <gtest/gtest.h>
#include "common/base64.hpp"
#include "tests/fakes.hpp"
#include <stdexcept>

TEST(Base64Test, KnownVectors) {
    EXPECT_EQ(base64::encode(bytes_of("")), "");
    EXPECT_EQ(base64::encode(bytes_of("f")), "Zg==");
    EXPECT_EQ(base64::encode(bytes_of("fo")), "Zm8=");
    EXPECT_EQ(base64::encode(bytes_of("foo")), "Zm9v");
    EXPECT_EQ(base64::encode(bytes_of("foobar")), "Zm9vYmFy");
}

TEST(Base64Test, BinaryRoundTrip) {
    std::vector<u8> data;
    for (int i = 0; i < 256; ++i) data.push_back((u8)i);
    data.push_back(0x00);
    data.push_back(0xFF);

    std::string text = base64::encode(data);
    EXPECT_EQ(text.size(), base64::encoded_length(data.size()));
    EXPECT_EQ(base64::decode(text), data);
}

TEST(Base64Test, EncodedLength) {
    EXPECT_EQ(base64::encoded_length(0), 0u);
    EXPECT_EQ(base64::encoded_length(1), 4u);
    EXPECT_EQ(base64::encoded_length(3), 4u);
    EXPECT_EQ(base64::encoded_length(4), 8u);
}

TEST(Base64Test, RejectsMalformedText) {
    EXPECT_THROW(base64::decode("abc"), std::invalid_argument);
    EXPECT_THROW(base64::decode("ab!d"), std::invalid_argument);
    EXPECT_THROW(base64::decode("a=bc"), std::invalid_argument);
}
