#ifndef PROMPTGUARD_SCANNERS_OUTPUT_CHECKS_HPP
#define PROMPTGUARD_SCANNERS_OUTPUT_CHECKS_HPP

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "scanner.hpp"
#include "classifier_scanners.hpp"
#include "../classifiers/pii_catalogue.hpp"
#include "../classifiers/providers.hpp"
#include "../core/errors.hpp"
#include "../util/text_utils.hpp"

/**
 * @file output_checks.hpp
 * @brief Outbound-only checks that judge the de-anonymized response, some of
 *        them against the user's original prompt (priorText):
 *        NoRefusal, Relevance and Sensitive.
 */

namespace promptguard {
namespace scanners {

/**
 * @class NoRefusal
 * @brief Quality gate: flags canned refusals and non-answers.
 */
class NoRefusal : public Scanner
{
public:
    NoRefusal(std::shared_ptr<classifiers::TextClassifier> classifier,
              double threshold,
              ScanMode mode = ScanMode::Block)
        : Scanner("NoRefusal", mode), classifier_(std::move(classifier)), threshold_(threshold)
    {
        if (!classifier_) {
            throw std::invalid_argument("NoRefusal requires a classifier");
        }
        if (threshold_ < 0.0 || threshold_ > 1.0) {
            throw core::ConfigurationError("NoRefusal threshold must be within [0,1]");
        }
    }

    bool supports(Direction direction) const override
    {
        return direction == Direction::Outbound;
    }

    ScanOutput scan(const std::string &text,
                    const std::optional<std::string> &) const override
    {
        const double confidence = clampScore(classifier_->score(text));
        if (confidence >= threshold_) {
            return ScanOutput::fail(text, confidence, "refusal confidence " + formatScore(confidence));
        }
        return ScanOutput::pass(text, confidence);
    }

private:
    std::shared_ptr<classifiers::TextClassifier> classifier_;
    double threshold_;
};

/**
 * @class Relevance
 * @brief valid=false when similarity(response, original prompt) < threshold.
 *        The risk score is 1 - similarity. Without a prior text there is
 *        nothing to compare against and the response passes.
 */
class Relevance : public Scanner
{
public:
    Relevance(std::shared_ptr<classifiers::SimilarityScorer> scorer, double threshold)
        : Scanner("Relevance"), scorer_(std::move(scorer)), threshold_(threshold)
    {
        if (!scorer_) {
            throw std::invalid_argument("Relevance requires a similarity scorer");
        }
        if (threshold_ < 0.0 || threshold_ > 1.0) {
            throw core::ConfigurationError("Relevance threshold must be within [0,1]");
        }
    }

    bool supports(Direction direction) const override
    {
        return direction == Direction::Outbound;
    }

    ScanOutput scan(const std::string &text,
                    const std::optional<std::string> &priorText) const override
    {
        if (!priorText) {
            return ScanOutput::pass(text, 0.0, "no prompt to compare against");
        }
        const double similarity = clampScore(scorer_->similarity(*priorText, text));
        const std::string details = "similarity " + formatScore(similarity)
                                    + " (threshold " + formatScore(threshold_) + ")";
        if (similarity < threshold_) {
            return ScanOutput::fail(text, 1.0 - similarity, details);
        }
        return ScanOutput::pass(text, 1.0 - similarity, details);
    }

private:
    std::shared_ptr<classifiers::SimilarityScorer> scorer_;
    double threshold_;
};

/**
 * @class Sensitive
 * @brief Flags catalogued entities in the response that the user did not
 *        supply themselves. With redact enabled the leaked values are
 *        replaced by "[REDACTED]" and the verdict stays invalid; run it in
 *        monitor mode to deliver the masked response instead of blocking it.
 */
class Sensitive : public Scanner
{
public:
    explicit Sensitive(bool redact = false, ScanMode mode = ScanMode::Block)
        : Scanner("Sensitive", mode), redact_(redact)
    {
    }

    bool transformsText() const override { return redact_; }

    bool supports(Direction direction) const override
    {
        return direction == Direction::Outbound;
    }

    ScanOutput scan(const std::string &text,
                    const std::optional<std::string> &priorText) const override
    {
        std::vector<classifiers::EntityMatch> leaked;
        for (auto &entity : classifiers::findEntities(text)) {
            if (priorText && priorText->find(entity.value) != std::string::npos) {
                continue;
            }
            leaked.push_back(std::move(entity));
        }
        if (leaked.empty()) {
            return ScanOutput::pass(text);
        }

        std::vector<std::string> categories;
        for (const auto &entity : leaked) {
            if (std::find(categories.begin(), categories.end(), entity.category) == categories.end()) {
                categories.push_back(entity.category);
            }
        }
        const std::string details = "leaked " + std::to_string(leaked.size()) + ": "
                                    + util::text::join(categories, ",");
        if (!redact_) {
            return ScanOutput::fail(text, 1.0, details);
        }

        std::string out;
        size_t cursor = 0;
        for (const auto &entity : leaked) {
            out.append(text, cursor, entity.begin - cursor);
            out += "[REDACTED]";
            cursor = entity.begin + entity.length;
        }
        out.append(text, cursor, std::string::npos);
        return ScanOutput::fail(std::move(out), 1.0, details);
    }

private:
    bool redact_;
};

} // namespace scanners
} // namespace promptguard

#endif // PROMPTGUARD_SCANNERS_OUTPUT_CHECKS_HPP
