// ==============================================================================
// test_codec_gtest.cpp - Тесты base64 / hex / UTF-8
// ==============================================================================

#include "chatx/codec.hpp"

#include <gtest/gtest.h>
#include <string>

namespace chatx::codec::test {

TEST(CodecTest, Base64_Rfc4648Vectors) {
    EXPECT_EQ(base64_encode(std::string_view("")), "");
    EXPECT_EQ(base64_encode(std::string_view("f")), "Zg==");
    EXPECT_EQ(base64_encode(std::string_view("fo")), "Zm8=");
    EXPECT_EQ(base64_encode(std::string_view("foobar")), "Zm9vYmFy");

    auto decoded = base64_decode("Zm9vYg==");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(std::string(decoded->begin(), decoded->end()), "foob");
}

TEST(CodecTest, Base64_RejectsMalformed) {
    EXPECT_FALSE(base64_decode("Zm9").has_value());
    EXPECT_FALSE(base64_decode("Zm9v!A==").has_value());
    EXPECT_FALSE(base64_decode("Z=9v").has_value());
}

TEST(CodecTest, Hex_RoundTripAndRejects) {
    Bytes data{0x00, 0xAB, 0x7F};
    EXPECT_EQ(hex_encode(data), "00ab7f");
    EXPECT_EQ(hex_decode("00AB7f").value_or(Bytes{}), data);
    EXPECT_FALSE(hex_decode("abc").has_value());
    EXPECT_FALSE(hex_decode("zz").has_value());
}

TEST(CodecTest, Utf8_Validation) {
    EXPECT_TRUE(is_valid_utf8("plain"));
    EXPECT_TRUE(is_valid_utf8("привет \xF0\x9F\x98\x82"));
    EXPECT_FALSE(is_valid_utf8("\xC0\xAF"));          // overlong '/'
    EXPECT_FALSE(is_valid_utf8("\xED\xA0\x80"));      // суррогат
    EXPECT_FALSE(is_valid_utf8("\xE2\x82"));          // обрыв
}

TEST(CodecTest, SanitizeUtf8_ReplacesBadBytes) {
    EXPECT_EQ(sanitize_utf8("ok\xFFok"), "ok\xEF\xBF\xBDok");
    EXPECT_EQ(sanitize_utf8("clean"), "clean");
}

TEST(CodecTest, StripObjectReplacement_RemovesPlaceholderAndTrims) {
    EXPECT_EQ(strip_object_replacement("\xEF\xBF\xBC look at this \n"), "look at this");
    EXPECT_EQ(strip_object_replacement("\xEF\xBF\xBC"), "");
}

TEST(CodecTest, ReadIntegers_Endianness) {
    const std::uint8_t buf[] = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08};
    EXPECT_EQ(read_le16(buf), 0x0201u);
    EXPECT_EQ(read_le32(buf), 0x04030201u);
    EXPECT_EQ(read_le64(buf), 0x0807060504030201ULL);
    EXPECT_EQ(read_be(buf, 3), 0x010203u);
}

}  // namespace chatx::codec::test
