#ifndef PROMPTGUARD_TEST_UNIT_TEST_CONFIG_PARSER_HPP
#define PROMPTGUARD_TEST_UNIT_TEST_CONFIG_PARSER_HPP

#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <string>
#include "core/errors.hpp"
#include "gateway_config.hpp"
#include "util/config_parser.hpp"

/**
 * @file test_config_parser.hpp
 * @brief key=value parsing and validation of GatewayConfig.
 */

namespace promptguard {
namespace test {
namespace config_parser_tests {

using promptguard::config::GatewayConfig;
using promptguard::core::ConfigurationError;
using promptguard::core::ScanMode;
using promptguard::util::ConfigParser;

TEST(ConfigParserTest, DefaultsMatchTheReferenceDeployment) {
    GatewayConfig cfg;
    EXPECT_EQ(cfg.port, 5000);
    EXPECT_EQ(cfg.tokenLimit, 2048u);
    EXPECT_DOUBLE_EQ(cfg.promptInjectionThreshold, 0.9);
    EXPECT_DOUBLE_EQ(cfg.toxicityThreshold, 0.5);
    EXPECT_DOUBLE_EQ(cfg.relevanceThreshold, 0.5);
    ASSERT_EQ(cfg.inputScanners.size(), 6u);
    EXPECT_EQ(cfg.inputScanners.front(), "Anonymize");
    ASSERT_EQ(cfg.outputScanners.size(), 6u);
    EXPECT_EQ(cfg.outputScanners.front(), "Deanonymize");
    EXPECT_EQ(cfg.banSubstringsMode, ScanMode::Monitor);
    EXPECT_EQ(cfg.codeMode, ScanMode::Monitor);
    EXPECT_TRUE(cfg.allowUnprotected);
    EXPECT_NO_THROW(promptguard::config::validate(cfg));
}

TEST(ConfigParserTest, ParsesScalarsListsAndModes) {
    GatewayConfig cfg;
    ConfigParser parser(cfg);
    parser.loadFromString(
        "# gateway settings\n"
        "port = 8088\n"
        "\n"
        "inputScanners = Anonymize, PromptInjection ,TokenLimit\n"
        "tokenLimit=512\n"
        "promptInjectionThreshold=0.75\n"
        "banSubstrings=secret,  token\n"
        "banSubstringsMode=Block\n"
        "banSubstringsCaseSensitive=yes\n"
        "sensitiveRedact=on\n"
        "allowUnprotected=false\n"
        "auditDatabase=/tmp/decisions.db\n");

    EXPECT_EQ(cfg.port, 8088);
    ASSERT_EQ(cfg.inputScanners.size(), 3u);
    EXPECT_EQ(cfg.inputScanners[1], "PromptInjection");
    EXPECT_EQ(cfg.tokenLimit, 512u);
    EXPECT_DOUBLE_EQ(cfg.promptInjectionThreshold, 0.75);
    ASSERT_EQ(cfg.banSubstrings.size(), 2u);
    EXPECT_EQ(cfg.banSubstrings[1], "token");
    EXPECT_EQ(cfg.banSubstringsMode, ScanMode::Block);
    EXPECT_TRUE(cfg.banSubstringsCaseSensitive);
    EXPECT_TRUE(cfg.sensitiveRedact);
    EXPECT_FALSE(cfg.allowUnprotected);
    EXPECT_EQ(cfg.auditDatabase, "/tmp/decisions.db");
}

TEST(ConfigParserTest, TopicsWithoutThresholdUseLaterDefault) {
    GatewayConfig cfg;
    ConfigParser parser(cfg);
    parser.loadFromString("banTopics=violence:0.6, gambling\nbanTopicsThreshold=0.7\n");
    ASSERT_EQ(cfg.banTopics.size(), 2u);
    EXPECT_EQ(cfg.banTopics[0].topic, "violence");
    EXPECT_DOUBLE_EQ(cfg.banTopics[0].threshold, 0.6);
    EXPECT_EQ(cfg.banTopics[1].topic, "gambling");
    EXPECT_DOUBLE_EQ(cfg.banTopics[1].threshold, 0.7);
}

TEST(ConfigParserTest, UnknownKeysAreIgnored) {
    GatewayConfig cfg;
    ConfigParser parser(cfg);
    EXPECT_NO_THROW(parser.loadFromString("favouriteColour=blue\n"));
    EXPECT_EQ(cfg.port, 5000);
}

TEST(ConfigParserTest, MalformedContentThrows) {
    GatewayConfig cfg;
    ConfigParser parser(cfg);
    EXPECT_THROW(parser.loadFromString("just some words\n"), ConfigurationError);
    EXPECT_THROW(parser.loadFromString("tokenLimit=-5\n"), ConfigurationError);
    EXPECT_THROW(parser.loadFromString("tokenLimit=12abc\n"), ConfigurationError);
    EXPECT_THROW(parser.loadFromString("port=70000\n"), ConfigurationError);
    EXPECT_THROW(parser.loadFromString("toxicityThreshold=high\n"), ConfigurationError);
    EXPECT_THROW(parser.loadFromString("codeMode=sometimes\n"), ConfigurationError);
    EXPECT_THROW(parser.loadFromString("sensitiveRedact=maybe\n"), ConfigurationError);
    EXPECT_THROW(parser.loadFromString("logLevel=LOUD\n"), ConfigurationError);
}

TEST(ConfigParserTest, IntegersBeyondTheFieldRangeAreRejected) {
    GatewayConfig cfg;
    ConfigParser parser(cfg);
    EXPECT_THROW(parser.loadFromString("maxNewTokens=4294967301\n"), ConfigurationError);
    EXPECT_THROW(parser.loadFromString("maxNewTokens=2147483648\n"), ConfigurationError);
    EXPECT_THROW(parser.loadFromString("generatorTimeoutSeconds=4294967296\n"), ConfigurationError);
    EXPECT_EQ(cfg.maxNewTokens, 256);
    parser.loadFromString("maxNewTokens=2147483647\n");
    EXPECT_EQ(cfg.maxNewTokens, 2147483647);
}

TEST(ConfigParserTest, SessionAndRedactionKeys) {
    GatewayConfig cfg;
    ConfigParser parser(cfg);
    parser.loadFromString("sensitiveMode=monitor\nvaultMaxEntries=50\nmaxSessions=8\nsessionIdleSeconds=60\n");
    EXPECT_EQ(cfg.sensitiveMode, ScanMode::Monitor);
    EXPECT_EQ(cfg.vaultMaxEntries, 50u);
    EXPECT_EQ(cfg.maxSessions, 8u);
    EXPECT_EQ(cfg.sessionIdleSeconds, 60u);
    EXPECT_THROW(parser.loadFromString("sensitiveMode=quietly\n"), ConfigurationError);

    GatewayConfig zeroVault;
    zeroVault.vaultMaxEntries = 0;
    EXPECT_THROW(promptguard::config::validate(zeroVault), ConfigurationError);
    GatewayConfig zeroSessions;
    zeroSessions.maxSessions = 0;
    EXPECT_THROW(promptguard::config::validate(zeroSessions), ConfigurationError);
}

TEST(ConfigParserTest, MissingFileKeepsDefaults) {
    GatewayConfig cfg;
    ConfigParser parser(cfg);
    EXPECT_FALSE(parser.loadFromFile("/nonexistent/promptguard.conf"));
    EXPECT_EQ(cfg.tokenLimit, 2048u);
}

TEST(ConfigParserTest, LoadsFromFile) {
    const std::string path = ::testing::TempDir() + "promptguard_test.conf";
    {
        std::ofstream out(path);
        out << "relevanceThreshold=0.3\ncodeLanguages=Python,Rust\n";
    }
    GatewayConfig cfg;
    ConfigParser parser(cfg);
    EXPECT_TRUE(parser.loadFromFile(path));
    EXPECT_DOUBLE_EQ(cfg.relevanceThreshold, 0.3);
    ASSERT_EQ(cfg.codeLanguages.size(), 2u);
    EXPECT_EQ(cfg.codeLanguages[1], "Rust");
    std::remove(path.c_str());
}

TEST(GatewayConfigTest, ValidateRejectsOutOfRangeValues) {
    GatewayConfig cfg;
    cfg.toxicityThreshold = 1.2;
    EXPECT_THROW(promptguard::config::validate(cfg), ConfigurationError);

    GatewayConfig zeroLimit;
    zeroLimit.tokenLimit = 0;
    EXPECT_THROW(promptguard::config::validate(zeroLimit), ConfigurationError);

    GatewayConfig badTopic;
    badTopic.banTopics.push_back({"weapons", -0.1});
    EXPECT_THROW(promptguard::config::validate(badTopic), ConfigurationError);

    GatewayConfig emptyTerm;
    emptyTerm.banSubstrings.push_back("");
    EXPECT_THROW(promptguard::config::validate(emptyTerm), ConfigurationError);
}

} // namespace config_parser_tests
} // namespace test
} // namespace promptguard

#endif // PROMPTGUARD_TEST_UNIT_TEST_CONFIG_PARSER_HPP
