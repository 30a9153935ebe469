#ifndef PROMPTGUARD_CONFIG_GATEWAY_CONFIG_HPP
#define PROMPTGUARD_CONFIG_GATEWAY_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "core/errors.hpp"
#include "core/scan_mode.hpp"

/**
 * @file gateway_config.hpp
 * @brief Configuration for one PromptGuard gateway instance.
 *
 * USAGE:
 *   - Populate manually, or through util/config_parser.hpp from a key=value file.
 *   - Defaults reproduce the scanner setup of the original chat application.
 *   - validate() is called by the Gateway constructor; callers may call it earlier.
 */

namespace promptguard {
namespace config {

/**
 * @struct TopicRule
 * @brief One banned topic and the classifier confidence at which it fires.
 */
struct TopicRule
{
    std::string topic;
    double threshold;
};

/**
 * @struct GatewayConfig
 * @brief Every recognised option. Key names in the config file match the field names.
 */
struct GatewayConfig
{
    GatewayConfig()
        : port(5000),
          workerThreads(4),
          logLevel("INFO"),
          generatorEndpoint("http://127.0.0.1:8080"),
          generatorTimeoutSeconds(120),
          maxNewTokens(256),
          temperature(0.7),
          inputScanners({"Anonymize", "PromptInjection", "TokenLimit", "Toxicity",
                         "BanSubstrings", "BanTopics"}),
          outputScanners({"Deanonymize", "NoRefusal", "Relevance", "Sensitive",
                          "Code", "BanSubstrings"}),
          tokenLimit(2048),
          promptInjectionThreshold(0.9),
          toxicityThreshold(0.5),
          banSubstrings({"password", "admin", "root", "sudo"}),
          outputBanSubstrings({"password", "admin", "root", "sudo"}),
          banSubstringsCaseSensitive(false),
          banSubstringsMode(core::ScanMode::Monitor),
          outputBanSubstringsMode(core::ScanMode::Monitor),
          banTopics({{"violence", 0.8}, {"illegal_activities", 0.8}}),
          banTopicsThreshold(0.8),
          relevanceThreshold(0.5),
          codeLanguages({"Python", "JavaScript", "PHP"}),
          codeMode(core::ScanMode::Monitor),
          noRefusalThreshold(0.75),
          noRefusalMode(core::ScanMode::Block),
          sensitiveRedact(false),
          sensitiveMode(core::ScanMode::Block),
          vaultMaxEntries(10000),
          maxSessions(1024),
          sessionIdleSeconds(1800),
          allowUnprotected(true)
    {
    }

    // --- service ---------------------------------------------------------
    uint16_t port;
    size_t workerThreads;
    std::string logLevel;
    std::string logFile;                 ///< empty = console only

    // --- generator -------------------------------------------------------
    std::string generatorEndpoint;       ///< base URL of the completion server
    unsigned generatorTimeoutSeconds;    ///< 0 = no timeout
    int maxNewTokens;
    double temperature;

    // --- scanner sets (ordered by name) ----------------------------------
    std::vector<std::string> inputScanners;
    std::vector<std::string> outputScanners;

    // --- scanner parameters ----------------------------------------------
    size_t tokenLimit;
    double promptInjectionThreshold;
    double toxicityThreshold;
    std::string toxicityLexiconFile;     ///< empty = built-in lexicon
    std::vector<std::string> banSubstrings;
    std::vector<std::string> outputBanSubstrings;
    bool banSubstringsCaseSensitive;
    core::ScanMode banSubstringsMode;
    core::ScanMode outputBanSubstringsMode;
    std::vector<TopicRule> banTopics;
    double banTopicsThreshold;           ///< used for topics listed without an explicit threshold
    double relevanceThreshold;
    std::vector<std::string> codeLanguages;
    core::ScanMode codeMode;
    double noRefusalThreshold;
    core::ScanMode noRefusalMode;
    bool sensitiveRedact;
    core::ScanMode sensitiveMode;        ///< monitor delivers the redacted text

    // --- vault -----------------------------------------------------------
    size_t vaultMaxEntries;              ///< oldest placeholders are evicted beyond this
    size_t maxSessions;                  ///< least recently used session is dropped beyond this
    unsigned sessionIdleSeconds;         ///< a session unused this long is forgotten

    // --- resilience / audit ----------------------------------------------
    bool allowUnprotected;               ///< start unprotected if providers fail to load
    std::string auditDatabase;           ///< SQLite path, empty = no ledger
};

inline void requireUnitInterval(const std::string &key, double value)
{
    if (!(value >= 0.0 && value <= 1.0)) {
        throw core::ConfigurationError(key + " must be within [0,1], got " + std::to_string(value));
    }
}

/**
 * @brief Range checks that do not depend on which scanners are enabled.
 * @throw core::ConfigurationError on the first violation.
 */
inline void validate(const GatewayConfig &cfg)
{
    if (cfg.tokenLimit == 0) {
        throw core::ConfigurationError("tokenLimit must be positive");
    }
    if (cfg.maxNewTokens <= 0) {
        throw core::ConfigurationError("maxNewTokens must be positive");
    }
    if (cfg.temperature < 0.0) {
        throw core::ConfigurationError("temperature must not be negative");
    }
    if (cfg.workerThreads == 0) {
        throw core::ConfigurationError("workerThreads must be positive");
    }
    if (cfg.vaultMaxEntries == 0) {
        throw core::ConfigurationError("vaultMaxEntries must be positive");
    }
    if (cfg.maxSessions == 0) {
        throw core::ConfigurationError("maxSessions must be positive");
    }
    requireUnitInterval("promptInjectionThreshold", cfg.promptInjectionThreshold);
    requireUnitInterval("toxicityThreshold", cfg.toxicityThreshold);
    requireUnitInterval("banTopicsThreshold", cfg.banTopicsThreshold);
    requireUnitInterval("relevanceThreshold", cfg.relevanceThreshold);
    requireUnitInterval("noRefusalThreshold", cfg.noRefusalThreshold);
    for (const auto &rule : cfg.banTopics) {
        if (rule.topic.empty()) {
            throw core::ConfigurationError("banTopics contains an empty topic name");
        }
        requireUnitInterval("banTopics[" + rule.topic + "]", rule.threshold);
    }
    for (const auto &s : cfg.banSubstrings) {
        if (s.empty()) {
            throw core::ConfigurationError("banSubstrings contains an empty entry");
        }
    }
    for (const auto &s : cfg.outputBanSubstrings) {
        if (s.empty()) {
            throw core::ConfigurationError("outputBanSubstrings contains an empty entry");
        }
    }
}

} // namespace config
} // namespace promptguard

#endif // PROMPTGUARD_CONFIG_GATEWAY_CONFIG_HPP
