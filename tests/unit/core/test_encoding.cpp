/**
 * @file test_encoding.cpp
 * @brief Unit tests for encoding, hashing and time helpers
 */

#include <gtest/gtest.h>

#include <kcenon/blob_transfer/core/encoding.h>

#include <chrono>
#include <span>
#include <string>
#include <vector>

namespace kcenon::blob_transfer::test {

namespace {

auto as_bytes(const std::string& text) -> std::span<const std::byte> {
    return std::as_bytes(std::span<const char>(text.data(), text.size()));
}

}  // namespace

TEST(EncodingTest, Base64KnownValues) {
    EXPECT_EQ(encoding::base64_encode(std::string("")), "");
    EXPECT_EQ(encoding::base64_encode(std::string("f")), "Zg==");
    EXPECT_EQ(encoding::base64_encode(std::string("fo")), "Zm8=");
    EXPECT_EQ(encoding::base64_encode(std::string("hello")), "aGVsbG8=");

    auto decoded = encoding::base64_decode("aGVsbG8=");
    EXPECT_EQ(std::string(decoded.begin(), decoded.end()), "hello");
}

TEST(EncodingTest, UrlEncode) {
    EXPECT_EQ(encoding::url_encode("a b&c"), "a%20b%26c");
    EXPECT_EQ(encoding::url_encode("dir/file.txt"), "dir%2Ffile.txt");
    EXPECT_EQ(encoding::url_encode("dir/file.txt", false), "dir/file.txt");
    EXPECT_EQ(encoding::url_encode("AQ=="), "AQ%3D%3D");
}

TEST(EncodingTest, Md5KnownValues) {
    EXPECT_EQ(encoding::bytes_to_hex(encoding::md5(as_bytes(""))),
              "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(encoding::bytes_to_hex(encoding::md5(as_bytes("abc"))),
              "900150983cd24fb0d6963f7d28e17f72");
}

TEST(EncodingTest, HmacSha256KnownValue) {
    const std::string key = "Jefe";
    auto mac = encoding::hmac_sha256(std::vector<uint8_t>(key.begin(), key.end()),
                                     "what do ya want for nothing?");

    EXPECT_EQ(encoding::bytes_to_hex(mac),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(EncodingTest, Rfc1123FormatAndParse) {
    std::chrono::system_clock::time_point when(std::chrono::seconds(784111777));

    auto text = encoding::format_rfc1123(when);
    EXPECT_EQ(text, "Sun, 06 Nov 1994 08:49:37 GMT");

    auto parsed = encoding::parse_rfc1123(text);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, when);

    EXPECT_FALSE(encoding::parse_rfc1123("yesterday").has_value());
}

TEST(EncodingTest, RandomHexLength) {
    auto a = encoding::generate_random_hex(8);
    auto b = encoding::generate_random_hex(8);

    EXPECT_EQ(a.size(), 16u);
    EXPECT_NE(a, b);
}

TEST(EncodingTest, ExtractXmlElement) {
    const std::string xml =
        "<?xml version=\"1.0\"?><Error><Code>ConditionNotMet</Code>"
        "<Message>The condition specified was not met.</Message></Error>";

    EXPECT_EQ(encoding::extract_xml_element(xml, "Code"), "ConditionNotMet");
    EXPECT_EQ(encoding::extract_xml_element(xml, "Message"),
              "The condition specified was not met.");
    EXPECT_FALSE(encoding::extract_xml_element(xml, "RequestId").has_value());
}

}  // namespace kcenon::blob_transfer::test
