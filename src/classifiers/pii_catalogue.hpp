#ifndef PROMPTGUARD_CLASSIFIERS_PII_CATALOGUE_HPP
#define PROMPTGUARD_CLASSIFIERS_PII_CATALOGUE_HPP

#include <algorithm>
#include <cctype>
#include <regex>
#include <string>
#include <vector>
#include "../util/text_utils.hpp"

/**
 * @file pii_catalogue.hpp
 * @brief Regex catalogue of sensitive entities, shared by the Anonymize and
 *        Sensitive scanners.
 *
 * DESIGN:
 *   - Categories are tried in priority order (EMAIL, CREDIT_CARD, SSN, PHONE,
 *     IP_ADDRESS, PERSON); a span claimed by an earlier category is not
 *     reported again by a later one (an SSN is never also a phone number).
 *   - CREDIT_CARD candidates must pass the Luhn check.
 *   - PERSON is a heuristic: a capitalised name after "my name is", "call me"
 *     or a title (Mr, Mrs, Ms, Dr, Prof). Only the name itself is reported.
 *   - Every repetition is bounded and the text is searched in windows of
 *     util::text::kRegexWindowBytes, so arbitrarily long input cannot exhaust
 *     the stack of the backtracking matcher.
 *
 * USAGE:
 *   @code
 *   using namespace promptguard::classifiers;
 *   for (const auto &m : findEntities("My email is a@b.com")) {
 *       // m.category == "EMAIL", m.value == "a@b.com"
 *   }
 *   @endcode
 */

namespace promptguard {
namespace classifiers {

struct EntityMatch
{
    std::string category;
    size_t begin;   ///< byte offset of the first character
    size_t length;
    std::string value;
};

namespace detail {

struct EntityPattern
{
    const char *category;
    std::regex regex;
    int group;      ///< capture group holding the entity (0 = whole match)
    const char *trigger;  ///< a window without any of these bytes is skipped; empty = always search
};

inline bool passesLuhn(const std::string &candidate)
{
    std::string digits;
    for (char c : candidate) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits.push_back(c);
        }
    }
    if (digits.size() < 13 || digits.size() > 19) {
        return false;
    }
    int sum = 0;
    bool doubleIt = false;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        int d = *it - '0';
        if (doubleIt) {
            d *= 2;
            if (d > 9) {
                d -= 9;
            }
        }
        sum += d;
        doubleIt = !doubleIt;
    }
    return sum % 10 == 0;
}

inline const std::vector<EntityPattern> &patterns()
{
    static const std::vector<EntityPattern> table = {
        {"EMAIL",
         std::regex(R"([A-Za-z0-9._%+\-]{1,64}@[A-Za-z0-9\-]{1,63}(\.[A-Za-z0-9\-]{1,63}){0,8}\.[A-Za-z]{2,24})"), 0,
         "@"},
        {"CREDIT_CARD",
         std::regex(R"(\b\d(?:[ \-]?\d){12,18}\b)"), 0, "0123456789"},
        {"SSN",
         std::regex(R"(\b\d{3}-\d{2}-\d{4}\b)"), 0, "0123456789"},
        {"PHONE",
         std::regex(R"((?:\+?1[ .\-]?)?(?:\(\d{3}\)\s?|\b\d{3}[ .\-])\d{3}[ .\-]\d{4}\b)"), 0, "0123456789"},
        {"IP_ADDRESS",
         std::regex(R"(\b(?:(?:25[0-5]|2[0-4]\d|1\d\d|[1-9]?\d)\.){3}(?:25[0-5]|2[0-4]\d|1\d\d|[1-9]?\d)\b)"), 0,
         "."},
        {"PERSON",
         std::regex(R"((?:[Mm]y name is|[Cc]all me|\b(?:Mr|Mrs|Ms|Dr|Prof)\.?)\s{1,8}([A-Z][a-z]{1,40}(?:\s{1,8}[A-Z][a-z]{1,40})?))"), 1,
         ""},
    };
    return table;
}

inline bool overlapsAny(const std::vector<EntityMatch> &taken, size_t begin, size_t length)
{
    for (const auto &m : taken) {
        if (begin < m.begin + m.length && m.begin < begin + length) {
            return true;
        }
    }
    return false;
}

} // namespace detail

/**
 * @brief Every non-overlapping sensitive entity in @p text, ordered by position.
 */
inline std::vector<EntityMatch> findEntities(const std::string &text)
{
    std::vector<EntityMatch> found;
    const auto windows = util::text::regexWindows(text);
    for (const auto &pattern : detail::patterns()) {
        for (const auto &window : windows) {
            const std::string slice = text.substr(window.offset, window.length);
            if (*pattern.trigger != '\0' && slice.find_first_of(pattern.trigger) == std::string::npos) {
                continue;
            }
            auto begin = std::sregex_iterator(slice.begin(), slice.end(), pattern.regex);
            for (auto it = begin; it != std::sregex_iterator(); ++it) {
                const std::smatch &m = *it;
                if (!m[pattern.group].matched) {
                    continue;
                }
                size_t pos = window.offset + static_cast<size_t>(m.position(pattern.group));
                size_t len = static_cast<size_t>(m.length(pattern.group));
                std::string value = m.str(pattern.group);
                if (std::string(pattern.category) == "CREDIT_CARD" && !detail::passesLuhn(value)) {
                    continue;
                }
                if (detail::overlapsAny(found, pos, len)) {
                    continue;
                }
                found.push_back({pattern.category, pos, len, value});
            }
        }
    }
    std::sort(found.begin(), found.end(),
              [](const EntityMatch &a, const EntityMatch &b) { return a.begin < b.begin; });
    return found;
}

/**
 * @brief Category names the catalogue can report.
 */
inline std::vector<std::string> entityCategories()
{
    std::vector<std::string> out;
    for (const auto &pattern : detail::patterns()) {
        out.emplace_back(pattern.category);
    }
    return out;
}

} // namespace classifiers
} // namespace promptguard

#endif // PROMPTGUARD_CLASSIFIERS_PII_CATALOGUE_HPP
