#ifndef PROMPTGUARD_SCANNERS_CLASSIFIER_SCANNERS_HPP
#define PROMPTGUARD_SCANNERS_CLASSIFIER_SCANNERS_HPP

#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "scanner.hpp"
#include "../classifiers/providers.hpp"
#include "gateway_config.hpp"
#include "../core/errors.hpp"
#include "../util/text_utils.hpp"

/**
 * @file classifier_scanners.hpp
 * @brief Inbound scanners that delegate to a classification provider and
 *        compare its confidence against a threshold: PromptInjection,
 *        Toxicity and BanTopics. None of them modify the text.
 */

namespace promptguard {
namespace scanners {

inline std::string formatScore(double v)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << v;
    return oss.str();
}

/**
 * @class ThresholdScanner
 * @brief valid=false when classifier->score(text) >= threshold; the score is the confidence.
 */
class ThresholdScanner : public Scanner
{
public:
    ThresholdScanner(std::string name,
                     std::shared_ptr<classifiers::TextClassifier> classifier,
                     double threshold,
                     ScanMode mode = ScanMode::Block)
        : Scanner(std::move(name), mode), classifier_(std::move(classifier)), threshold_(threshold)
    {
        if (!classifier_) {
            throw std::invalid_argument(this->name() + " requires a classifier");
        }
        if (threshold_ < 0.0 || threshold_ > 1.0) {
            throw core::ConfigurationError(this->name() + " threshold must be within [0,1]");
        }
    }

    bool supports(Direction direction) const override
    {
        return direction == Direction::Inbound;
    }

    ScanOutput scan(const std::string &text,
                    const std::optional<std::string> &) const override
    {
        const double confidence = clampScore(classifier_->score(text));
        const std::string details = classifier_->name() + " confidence " + formatScore(confidence)
                                    + " (threshold " + formatScore(threshold_) + ")";
        if (confidence >= threshold_) {
            return ScanOutput::fail(text, confidence, details);
        }
        return ScanOutput::pass(text, confidence, details);
    }

    double threshold() const { return threshold_; }

private:
    std::shared_ptr<classifiers::TextClassifier> classifier_;
    double threshold_;
};

class PromptInjection : public ThresholdScanner
{
public:
    PromptInjection(std::shared_ptr<classifiers::TextClassifier> classifier, double threshold)
        : ThresholdScanner("PromptInjection", std::move(classifier), threshold)
    {
    }
};

class Toxicity : public ThresholdScanner
{
public:
    Toxicity(std::shared_ptr<classifiers::TextClassifier> classifier, double threshold)
        : ThresholdScanner("Toxicity", std::move(classifier), threshold)
    {
    }
};

/**
 * @class BanTopics
 * @brief Fires when any banned topic's confidence reaches its own threshold.
 *        The score is the highest topic confidence seen.
 */
class BanTopics : public Scanner
{
public:
    BanTopics(std::shared_ptr<classifiers::TopicClassifier> classifier,
              std::vector<config::TopicRule> rules)
        : Scanner("BanTopics"), classifier_(std::move(classifier)), rules_(std::move(rules))
    {
        if (!classifier_) {
            throw std::invalid_argument("BanTopics requires a topic classifier");
        }
        if (rules_.empty()) {
            throw core::ConfigurationError("BanTopics needs at least one topic");
        }
        for (const auto &rule : rules_) {
            if (!classifier_->supports(rule.topic)) {
                throw core::ConfigurationError("BanTopics: unknown topic '" + rule.topic + "'");
            }
            if (rule.threshold < 0.0 || rule.threshold > 1.0) {
                throw core::ConfigurationError("BanTopics: threshold for '" + rule.topic
                                               + "' must be within [0,1]");
            }
        }
    }

    bool supports(Direction direction) const override
    {
        return direction == Direction::Inbound;
    }

    ScanOutput scan(const std::string &text,
                    const std::optional<std::string> &) const override
    {
        double highest = 0.0;
        std::vector<std::string> hits;
        for (const auto &rule : rules_) {
            const double confidence = clampScore(classifier_->score(text, rule.topic));
            highest = std::max(highest, confidence);
            if (confidence >= rule.threshold) {
                hits.push_back(rule.topic + "=" + formatScore(confidence));
            }
        }
        if (!hits.empty()) {
            return ScanOutput::fail(text, highest, "banned topics: " + util::text::join(hits, ", "));
        }
        return ScanOutput::pass(text, highest);
    }

private:
    std::shared_ptr<classifiers::TopicClassifier> classifier_;
    std::vector<config::TopicRule> rules_;
};

} // namespace scanners
} // namespace promptguard

#endif // PROMPTGUARD_SCANNERS_CLASSIFIER_SCANNERS_HPP
