#ifndef PROMPTGUARD_SCANNERS_BAN_SUBSTRINGS_HPP
#define PROMPTGUARD_SCANNERS_BAN_SUBSTRINGS_HPP

#include <string>
#include <vector>
#include "scanner.hpp"
#include "../core/errors.hpp"
#include "../util/text_utils.hpp"

namespace promptguard {
namespace scanners {

/**
 * @class BanSubstrings
 * @brief Containment check against a banned-term list, usable in both directions.
 *
 * - Any banned term found makes the verdict invalid (score 1.0); the text is untouched.
 * - Case-insensitive unless configured otherwise.
 * - MatchType::Word requires the term to stand as a whole word ("root" does not hit "rooted").
 * - Usually deployed in monitor mode: findings are reported but do not block.
 */
class BanSubstrings : public Scanner
{
public:
    enum class MatchType {
        Substring,
        Word
    };

    BanSubstrings(std::vector<std::string> substrings,
                  bool caseSensitive,
                  ScanMode mode,
                  MatchType matchType = MatchType::Substring)
        : Scanner("BanSubstrings", mode),
          caseSensitive_(caseSensitive),
          matchType_(matchType)
    {
        if (substrings.empty()) {
            throw core::ConfigurationError("BanSubstrings needs at least one substring");
        }
        for (auto &s : substrings) {
            if (s.empty()) {
                throw core::ConfigurationError("BanSubstrings: empty substring");
            }
            terms_.push_back(caseSensitive_ ? s : util::text::toLower(s));
            display_.push_back(s);
        }
    }

    bool supports(Direction) const override { return true; }

    ScanOutput scan(const std::string &text,
                    const std::optional<std::string> &) const override
    {
        const std::string haystack = caseSensitive_ ? text : util::text::toLower(text);
        std::vector<std::string> found;
        for (size_t i = 0; i < terms_.size(); ++i) {
            bool hit = (matchType_ == MatchType::Word)
                ? util::text::containsWholeWord(haystack, terms_[i])
                : haystack.find(terms_[i]) != std::string::npos;
            if (hit) {
                found.push_back(display_[i]);
            }
        }
        if (found.empty()) {
            return ScanOutput::pass(text);
        }
        return ScanOutput::fail(text, 1.0, "banned substrings: " + util::text::join(found, ", "));
    }

private:
    std::vector<std::string> terms_;
    std::vector<std::string> display_;
    bool caseSensitive_;
    MatchType matchType_;
};

} // namespace scanners
} // namespace promptguard

#endif // PROMPTGUARD_SCANNERS_BAN_SUBSTRINGS_HPP
