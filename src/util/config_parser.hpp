#ifndef PROMPTGUARD_UTIL_CONFIG_PARSER_HPP
#define PROMPTGUARD_UTIL_CONFIG_PARSER_HPP

#include <cstdint>
#include <fstream>
#include <limits>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>
#include "gateway_config.hpp"
#include "logger.hpp"
#include "text_utils.hpp"
#include "../core/errors.hpp"
#include "../core/scan_mode.hpp"

/**
 * @file config_parser.hpp
 * @brief Reads a plain key=value file into config::GatewayConfig.
 *
 * FORMAT:
 *   - One key=value per line; '#' starts a comment line; blank lines ignored.
 *   - Lists are comma separated: banSubstrings=password,admin,root
 *   - banTopics entries may carry a threshold: banTopics=violence:0.8,weapons
 *     (entries without one use banTopicsThreshold, whatever line order).
 *   - Booleans: true/false, yes/no, on/off, 1/0.
 *
 * USAGE:
 *   @code
 *   promptguard::config::GatewayConfig cfg;
 *   promptguard::util::ConfigParser parser(cfg);
 *   parser.loadFromFile("promptguard.conf");
 *   @endcode
 *
 * A missing file keeps the defaults (logged as a warning). A malformed line or
 * value throws core::ConfigurationError.
 */

namespace promptguard {
namespace util {

class ConfigParser
{
public:
    explicit ConfigParser(config::GatewayConfig &cfg)
        : cfg_(cfg)
    {
    }

    /**
     * @return false if the file does not exist (defaults kept), true once parsed.
     * @throw core::ConfigurationError on malformed content.
     */
    inline bool loadFromFile(const std::string &filepath)
    {
        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            logger::warn("ConfigParser: File not found: " + filepath + ", using defaults");
            return false;
        }
        logger::info("ConfigParser: Loading config from " + filepath);
        std::stringstream buffer;
        buffer << inFile.rdbuf();
        loadFromString(buffer.str());
        logger::info("ConfigParser: Config loaded.");
        return true;
    }

    /**
     * @brief Parse configuration text directly (used by loadFromFile and tests).
     */
    inline void loadFromString(const std::string &content)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pendingTopics_.clear();
        topicsSeen_ = false;

        std::istringstream in(content);
        std::string line;
        size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            text::trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }
            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw core::ConfigurationError("ConfigParser: line " + std::to_string(lineNo)
                                               + " has no '=': " + line);
            }
            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            text::trim(key);
            text::trim(val);
            applyKeyValue(key, val);
        }

        // Topics without an explicit threshold take banTopicsThreshold, which may
        // appear after the banTopics line.
        if (topicsSeen_) {
            cfg_.banTopics.clear();
            for (const auto &entry : pendingTopics_) {
                cfg_.banTopics.push_back({entry.first,
                    entry.second < 0.0 ? cfg_.banTopicsThreshold : entry.second});
            }
        }
    }

private:
    config::GatewayConfig &cfg_;
    std::mutex mutex_;
    std::vector<std::pair<std::string, double>> pendingTopics_;
    bool topicsSeen_ = false;

    inline void applyKeyValue(const std::string &key, const std::string &val)
    {
        if (key == "port") {
            uint64_t port = parseUInt(key, val);
            if (port == 0 || port > std::numeric_limits<uint16_t>::max()) {
                throw core::ConfigurationError("ConfigParser: port out of range: " + val);
            }
            cfg_.port = static_cast<uint16_t>(port);
        }
        else if (key == "workerThreads") {
            cfg_.workerThreads = static_cast<size_t>(parseUInt(key, val));
        }
        else if (key == "logLevel") {
            logger::LogLevel level;
            if (!logger::parseLogLevel(val, level)) {
                throw core::ConfigurationError("ConfigParser: unknown logLevel '" + val + "'");
            }
            cfg_.logLevel = val;
        }
        else if (key == "logFile") {
            cfg_.logFile = val;
        }
        else if (key == "generatorEndpoint") {
            cfg_.generatorEndpoint = val;
        }
        else if (key == "generatorTimeoutSeconds") {
            cfg_.generatorTimeoutSeconds = static_cast<unsigned>(
                parseBounded(key, val, std::numeric_limits<unsigned>::max()));
        }
        else if (key == "maxNewTokens") {
            cfg_.maxNewTokens = static_cast<int>(parseBounded(key, val, std::numeric_limits<int>::max()));
        }
        else if (key == "temperature") {
            cfg_.temperature = parseDouble(key, val);
        }
        else if (key == "inputScanners") {
            cfg_.inputScanners = text::splitList(val);
        }
        else if (key == "outputScanners") {
            cfg_.outputScanners = text::splitList(val);
        }
        else if (key == "tokenLimit") {
            cfg_.tokenLimit = static_cast<size_t>(parseUInt(key, val));
        }
        else if (key == "promptInjectionThreshold") {
            cfg_.promptInjectionThreshold = parseDouble(key, val);
        }
        else if (key == "toxicityThreshold") {
            cfg_.toxicityThreshold = parseDouble(key, val);
        }
        else if (key == "toxicityLexiconFile") {
            cfg_.toxicityLexiconFile = val;
        }
        else if (key == "banSubstrings") {
            cfg_.banSubstrings = text::splitList(val);
        }
        else if (key == "outputBanSubstrings") {
            cfg_.outputBanSubstrings = text::splitList(val);
        }
        else if (key == "banSubstringsCaseSensitive") {
            cfg_.banSubstringsCaseSensitive = parseBool(key, val);
        }
        else if (key == "banSubstringsMode") {
            cfg_.banSubstringsMode = core::parseScanMode(val);
        }
        else if (key == "outputBanSubstringsMode") {
            cfg_.outputBanSubstringsMode = core::parseScanMode(val);
        }
        else if (key == "banTopics") {
            parseTopics(val);
        }
        else if (key == "banTopicsThreshold") {
            cfg_.banTopicsThreshold = parseDouble(key, val);
        }
        else if (key == "relevanceThreshold") {
            cfg_.relevanceThreshold = parseDouble(key, val);
        }
        else if (key == "codeLanguages") {
            cfg_.codeLanguages = text::splitList(val);
        }
        else if (key == "codeMode") {
            cfg_.codeMode = core::parseScanMode(val);
        }
        else if (key == "noRefusalThreshold") {
            cfg_.noRefusalThreshold = parseDouble(key, val);
        }
        else if (key == "noRefusalMode") {
            cfg_.noRefusalMode = core::parseScanMode(val);
        }
        else if (key == "sensitiveRedact") {
            cfg_.sensitiveRedact = parseBool(key, val);
        }
        else if (key == "sensitiveMode") {
            cfg_.sensitiveMode = core::parseScanMode(val);
        }
        else if (key == "vaultMaxEntries") {
            cfg_.vaultMaxEntries = static_cast<size_t>(parseUInt(key, val));
        }
        else if (key == "maxSessions") {
            cfg_.maxSessions = static_cast<size_t>(parseUInt(key, val));
        }
        else if (key == "sessionIdleSeconds") {
            cfg_.sessionIdleSeconds = static_cast<unsigned>(
                parseBounded(key, val, std::numeric_limits<unsigned>::max()));
        }
        else if (key == "allowUnprotected") {
            cfg_.allowUnprotected = parseBool(key, val);
        }
        else if (key == "auditDatabase") {
            cfg_.auditDatabase = val;
        }
        else {
            logger::warn("ConfigParser: Unrecognized key '" + key + "' with value '" + val + "'");
            return;
        }
        logger::debug("ConfigParser: " + key + " set to " + val);
    }

    inline void parseTopics(const std::string &val)
    {
        topicsSeen_ = true;
        pendingTopics_.clear();
        for (const auto &entry : text::splitList(val)) {
            auto colon = entry.find(':');
            if (colon == std::string::npos) {
                pendingTopics_.emplace_back(entry, -1.0);
                continue;
            }
            std::string topic = entry.substr(0, colon);
            std::string threshold = entry.substr(colon + 1);
            text::trim(topic);
            text::trim(threshold);
            pendingTopics_.emplace_back(topic, parseDouble("banTopics[" + topic + "]", threshold));
        }
    }

    inline uint64_t parseUInt(const std::string &key, const std::string &val) const
    {
        try {
            size_t idx = 0;
            if (!val.empty() && val[0] == '-') {
                throw std::invalid_argument("negative");
            }
            uint64_t n = std::stoull(val, &idx, 10);
            if (idx != val.size()) {
                throw std::invalid_argument("non-numeric suffix");
            }
            return n;
        }
        catch (const std::exception &ex) {
            throw core::ConfigurationError("ConfigParser: " + key + " expects an unsigned integer, got '"
                                           + val + "' (" + ex.what() + ")");
        }
    }

    inline uint64_t parseBounded(const std::string &key, const std::string &val, uint64_t maxValue) const
    {
        uint64_t n = parseUInt(key, val);
        if (n > maxValue) {
            throw core::ConfigurationError("ConfigParser: " + key + " out of range: " + val);
        }
        return n;
    }

    inline double parseDouble(const std::string &key, const std::string &val) const
    {
        try {
            size_t idx = 0;
            double d = std::stod(val, &idx);
            if (idx != val.size()) {
                throw std::invalid_argument("non-numeric suffix");
            }
            return d;
        }
        catch (const std::exception &ex) {
            throw core::ConfigurationError("ConfigParser: " + key + " expects a number, got '"
                                           + val + "' (" + ex.what() + ")");
        }
    }

    inline bool parseBool(const std::string &key, const std::string &val) const
    {
        std::string lower = text::toLower(val);
        if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
            return true;
        }
        if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
            return false;
        }
        throw core::ConfigurationError("ConfigParser: " + key + " expects a boolean, got '" + val + "'");
    }
};

} // namespace util
} // namespace promptguard

#endif // PROMPTGUARD_UTIL_CONFIG_PARSER_HPP
