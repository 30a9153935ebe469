#ifndef PROMPTGUARD_TEST_UNIT_TEST_LLAMA_SERVER_GENERATOR_HPP
#define PROMPTGUARD_TEST_UNIT_TEST_LLAMA_SERVER_GENERATOR_HPP

#include <gtest/gtest.h>
#include <string>
#include "core/errors.hpp"
#include "generator/llama_server_generator.hpp"
#include "service/json_codec.hpp"

/**
 * @file test_llama_server_generator.hpp
 * @brief Request building and reply parsing for the llama.cpp server generator.
 */

namespace promptguard {
namespace test {
namespace llama_server_generator_tests {

using promptguard::core::ConfigurationError;
using promptguard::core::GenerationError;
using promptguard::generator::LlamaServerGenerator;
using promptguard::service::extractStringField;

TEST(LlamaServerGeneratorTest, RequestBodyCarriesPromptAndSampling) {
    const std::string prompt = "[INST] say \"hi\"\nplease [/INST]";
    const std::string body = LlamaServerGenerator::buildRequestBody(prompt, 256, 0.7);
    auto decoded = extractStringField(body, "prompt");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, prompt);
    EXPECT_NE(body.find("\"n_predict\":256"), std::string::npos);
    EXPECT_NE(body.find("\"temperature\":0.7"), std::string::npos);
    EXPECT_NE(body.find("\"stop\":[\"[INST]\",\"</s>\",\"<s>\"]"), std::string::npos);
    EXPECT_NE(body.find("\"stream\":false"), std::string::npos);
}

TEST(LlamaServerGeneratorTest, CompletionIsTrimmedAndEchoRemoved) {
    const std::string formatted = "[INST] capital of France? [/INST]";
    const std::string reply =
        R"({"content":"  [INST] capital of France? [/INST]  Paris is the capital of France.\n","stop":true})";
    EXPECT_EQ(LlamaServerGenerator::parseCompletion(reply, formatted), "Paris is the capital of France.");
    EXPECT_EQ(LlamaServerGenerator::parseCompletion(R"({"content":"Plain answer"})", formatted), "Plain answer");
}

TEST(LlamaServerGeneratorTest, ReplyWithoutContentIsAGenerationError) {
    EXPECT_THROW(LlamaServerGenerator::parseCompletion(R"({"error":"busy"})", "p"), GenerationError);
    EXPECT_THROW(LlamaServerGenerator::parseCompletion("<html>502</html>", "p"), GenerationError);
}

TEST(LlamaServerGeneratorTest, EndpointIsNormalised) {
    LlamaServerGenerator gen("http://127.0.0.1:8080//", 30);
    EXPECT_EQ(gen.endpoint(), "http://127.0.0.1:8080");
    EXPECT_THROW(LlamaServerGenerator("", 30), ConfigurationError);
    EXPECT_THROW(LlamaServerGenerator("/", 30), ConfigurationError);
}

TEST(LlamaServerGeneratorTest, UnreachableServerIsAGenerationError) {
    LlamaServerGenerator gen("http://127.0.0.1:1", 2);
    EXPECT_THROW(gen.generate("hello", 16, 0.7), GenerationError);
    EXPECT_FALSE(gen.ready());
}

} // namespace llama_server_generator_tests
} // namespace test
} // namespace promptguard

#endif // PROMPTGUARD_TEST_UNIT_TEST_LLAMA_SERVER_GENERATOR_HPP
