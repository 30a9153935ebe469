#ifndef PROMPTGUARD_TEST_UNIT_TEST_JSON_CODEC_HPP
#define PROMPTGUARD_TEST_UNIT_TEST_JSON_CODEC_HPP

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include "service/json_codec.hpp"

/**
 * @file test_json_codec.hpp
 * @brief JSON escaping and top-level string field extraction.
 */

namespace promptguard {
namespace test {
namespace json_codec_tests {

using promptguard::service::escapeJson;
using promptguard::service::extractStringField;

TEST(JsonCodecTest, EscapesQuotesControlsAndBackslashes) {
    EXPECT_EQ(escapeJson("say \"hi\"\n"), "say \\\"hi\\\"\\n");
    EXPECT_EQ(escapeJson("C:\\temp\t"), "C:\\\\temp\\t");
    EXPECT_EQ(escapeJson(std::string("\x01", 1)), "\\u0001");
    EXPECT_EQ(escapeJson("caf\xC3\xA9"), "caf\xC3\xA9");
}

TEST(JsonCodecTest, ExtractsTopLevelStringMember) {
    auto msg = extractStringField(R"({"message":"Hello there"})", "message");
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(*msg, "Hello there");
}

TEST(JsonCodecTest, DecodesEscapes) {
    auto msg = extractStringField(R"({ "message" : "a \"quoted\" word\nnext \u00e9 \ud83d\ude00" })", "message");
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(*msg, "a \"quoted\" word\nnext \xC3\xA9 \xF0\x9F\x98\x80");
}

TEST(JsonCodecTest, SkipsOtherMembersAndNestedValues) {
    const std::string body =
        R"({"meta":{"message":"nested"},"tags":["a","}"],"n":3,"ok":true,"message":"top"})";
    auto msg = extractStringField(body, "message");
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(*msg, "top");
}

TEST(JsonCodecTest, MissingOrNonStringMemberIsEmpty) {
    EXPECT_FALSE(extractStringField(R"({"other":"x"})", "message").has_value());
    EXPECT_FALSE(extractStringField(R"({"message":42})", "message").has_value());
    EXPECT_FALSE(extractStringField(R"({"message":null})", "message").has_value());
    EXPECT_FALSE(extractStringField("{}", "message").has_value());
}

TEST(JsonCodecTest, MalformedInputThrows) {
    EXPECT_THROW(extractStringField("", "message"), std::runtime_error);
    EXPECT_THROW(extractStringField("[1,2]", "message"), std::runtime_error);
    EXPECT_THROW(extractStringField(R"({"message":"unterminated)", "message"), std::runtime_error);
    EXPECT_THROW(extractStringField(R"({"message" "x"})", "message"), std::runtime_error);
    EXPECT_THROW(extractStringField(R"({"message":"x")", "message"), std::runtime_error);
    EXPECT_THROW(extractStringField(R"({"message":"\q"})", "message"), std::runtime_error);
}

TEST(JsonCodecTest, EscapedTextSurvivesExtraction) {
    const std::string original = "line1\n\"two\"\\three";
    const std::string body = "{\"response\":\"" + escapeJson(original) + "\"}";
    auto back = extractStringField(body, "response");
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, original);
}

} // namespace json_codec_tests
} // namespace test
} // namespace promptguard

#endif // PROMPTGUARD_TEST_UNIT_TEST_JSON_CODEC_HPP
