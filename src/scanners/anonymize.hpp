#ifndef PROMPTGUARD_SCANNERS_ANONYMIZE_HPP
#define PROMPTGUARD_SCANNERS_ANONYMIZE_HPP

#include <memory>
#include <regex>
#include <stdexcept>
#include <string>
#include "scanner.hpp"
#include "../classifiers/pii_catalogue.hpp"
#include "../core/vault.hpp"
#include "../util/logger.hpp"

/**
 * @file anonymize.hpp
 * @brief The reversible redaction pair: Anonymize (inbound) writes the Vault,
 *        Deanonymize (outbound) reads it.
 *
 * USAGE:
 *   @code
 *   auto vault = std::make_shared<promptguard::core::Vault>();
 *   Anonymize anon(vault);
 *   auto in = anon.scan("My email is a@b.com", std::nullopt);
 *   // in.text == "My email is [REDACTED_EMAIL_1]"
 *   Deanonymize deanon(vault);
 *   auto out = deanon.scan("Sent to [REDACTED_EMAIL_1].", std::nullopt);
 *   // out.text == "Sent to a@b.com."
 *   @endcode
 */

namespace promptguard {
namespace scanners {

/**
 * @class Anonymize
 * @brief Replaces every catalogued sensitive entity with a vault placeholder.
 *        Always valid; the score is the fraction of input bytes redacted.
 */
class Anonymize : public Scanner
{
public:
    explicit Anonymize(std::shared_ptr<core::Vault> vault)
        : Scanner("Anonymize"), vault_(std::move(vault))
    {
        if (!vault_) {
            throw std::invalid_argument("Anonymize requires a vault");
        }
    }

    bool transformsText() const override { return true; }

    bool supports(Direction direction) const override
    {
        return direction == Direction::Inbound;
    }

    ScanOutput scan(const std::string &text,
                    const std::optional<std::string> &) const override
    {
        const auto entities = classifiers::findEntities(text);
        if (entities.empty()) {
            return ScanOutput::pass(text);
        }

        std::string out;
        out.reserve(text.size());
        size_t cursor = 0;
        size_t redacted = 0;
        std::string categories;
        for (const auto &entity : entities) {
            out.append(text, cursor, entity.begin - cursor);
            out += vault_->reserve(entity.value, entity.category, text);
            cursor = entity.begin + entity.length;
            redacted += entity.length;
            if (categories.find(entity.category) == std::string::npos) {
                categories += (categories.empty() ? "" : ",") + entity.category;
            }
        }
        out.append(text, cursor, std::string::npos);

        util::logger::debug("[Anonymize] redacted " + std::to_string(entities.size())
                            + " entities (" + categories + ")");
        return ScanOutput::pass(std::move(out),
                                clampScore(static_cast<double>(redacted) / static_cast<double>(text.size())),
                                "redacted " + std::to_string(entities.size()) + ": " + categories);
    }

private:
    std::shared_ptr<core::Vault> vault_;
};

/**
 * @class Deanonymize
 * @brief Restores every placeholder found in the text. Unknown placeholders are
 *        left verbatim and reported as VaultMiss warnings. Always valid.
 */
class Deanonymize : public Scanner
{
public:
    explicit Deanonymize(std::shared_ptr<core::Vault> vault)
        : Scanner("Deanonymize"), vault_(std::move(vault))
    {
        if (!vault_) {
            throw std::invalid_argument("Deanonymize requires a vault");
        }
    }

    bool transformsText() const override { return true; }

    bool supports(Direction direction) const override
    {
        return direction == Direction::Outbound;
    }

    ScanOutput scan(const std::string &text,
                    const std::optional<std::string> &) const override
    {
        static const std::regex placeholderRegex(R"(\[REDACTED_[A-Z0-9_]+_\d+\])");

        ScanOutput result;
        result.valid = true;
        result.score = 0.0;
        result.text.reserve(text.size());

        size_t restored = 0;
        size_t cursor = 0;
        auto begin = std::sregex_iterator(text.begin(), text.end(), placeholderRegex);
        for (auto it = begin; it != std::sregex_iterator(); ++it) {
            const size_t pos = static_cast<size_t>(it->position(0));
            const std::string placeholder = it->str(0);
            result.text.append(text, cursor, pos - cursor);
            auto original = vault_->resolve(placeholder);
            if (original) {
                result.text += *original;
                ++restored;
            } else {
                result.text += placeholder;
                result.warnings.push_back("VaultMiss: " + placeholder + " is not in the vault");
                util::logger::warn("[Deanonymize] VaultMiss for " + placeholder + ", left verbatim");
            }
            cursor = pos + placeholder.size();
        }
        result.text.append(text, cursor, std::string::npos);

        if (restored > 0 || !result.warnings.empty()) {
            result.details = "restored " + std::to_string(restored) + ", missed "
                             + std::to_string(result.warnings.size());
        }
        return result;
    }

private:
    std::shared_ptr<core::Vault> vault_;
};

} // namespace scanners
} // namespace promptguard

#endif // PROMPTGUARD_SCANNERS_ANONYMIZE_HPP
