#ifndef PROMPTGUARD_UTIL_TEXT_UTILS_HPP
#define PROMPTGUARD_UTIL_TEXT_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

/**
 * @file text_utils.hpp
 * @brief Small string helpers shared by the config parser and the scanners.
 *        ASCII-only case folding; bytes >= 0x80 are kept as word characters.
 */

namespace promptguard {
namespace util {
namespace text {

inline std::string toLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/**
 * @brief Trim leading/trailing whitespace in place.
 */
inline void trim(std::string &s)
{
    static const char *whitespace = " \t\r\n";
    auto pos = s.find_first_not_of(whitespace);
    if (pos == std::string::npos) {
        s.clear();
        return;
    }
    s.erase(0, pos);
    s.erase(s.find_last_not_of(whitespace) + 1);
}

/**
 * @brief Split on @p delimiter, trimming each piece and dropping empty ones.
 */
inline std::vector<std::string> splitList(const std::string &input, char delimiter = ',')
{
    std::vector<std::string> tokens;
    size_t start = 0;
    while (start <= input.size()) {
        size_t pos = input.find(delimiter, start);
        if (pos == std::string::npos) {
            pos = input.size();
        }
        std::string piece = input.substr(start, pos - start);
        trim(piece);
        if (!piece.empty()) {
            tokens.push_back(piece);
        }
        start = pos + 1;
    }
    return tokens;
}

inline bool isWordChar(unsigned char c)
{
    return std::isalnum(c) || c == '_' || c == '\'' || c >= 0x80;
}

/**
 * @brief Lower-cased words of @p s (runs of alphanumerics, '_' and apostrophes).
 */
inline std::vector<std::string> words(const std::string &s)
{
    std::vector<std::string> out;
    std::string current;
    for (unsigned char c : s) {
        if (isWordChar(c)) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else if (!current.empty()) {
            out.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        out.push_back(current);
    }
    return out;
}

inline bool startsWith(const std::string &s, const std::string &prefix)
{
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

/**
 * @brief True if @p needle occurs in @p haystack delimited by non-word characters.
 */
inline bool containsWholeWord(const std::string &haystack, const std::string &needle)
{
    if (needle.empty()) {
        return false;
    }
    size_t pos = haystack.find(needle);
    while (pos != std::string::npos) {
        bool leftOk = pos == 0 || !isWordChar(static_cast<unsigned char>(haystack[pos - 1]));
        size_t end = pos + needle.size();
        bool rightOk = end >= haystack.size() || !isWordChar(static_cast<unsigned char>(haystack[end]));
        if (leftOk && rightOk) {
            return true;
        }
        pos = haystack.find(needle, pos + 1);
    }
    return false;
}

/// Longest slice of text handed to a single std::regex search.
constexpr size_t kRegexWindowBytes = 4096;

/**
 * @struct Window
 * @brief Byte range [offset, offset + length) of a larger text.
 */
struct Window
{
    size_t offset;
    size_t length;
};

/**
 * @brief Cover @p s with consecutive windows of at most @p maxLen bytes.
 *
 * std::regex backtracks recursively, one stack frame per character consumed,
 * so a search over an unbounded run of text can exhaust the stack. Windows end
 * after the last newline in the second half of the slice, else after the last
 * blank, else at the hard limit. A match spanning two windows is not found;
 * texts that need more than one window are far above any sane token limit.
 */
inline std::vector<Window> regexWindows(const std::string &s, size_t maxLen = kRegexWindowBytes)
{
    std::vector<Window> out;
    if (maxLen == 0) {
        maxLen = kRegexWindowBytes;
    }
    size_t offset = 0;
    while (offset < s.size()) {
        size_t length = std::min(maxLen, s.size() - offset);
        if (offset + length < s.size()) {
            const size_t half = offset + length / 2;
            size_t cut = s.find_last_of('\n', offset + length - 1);
            if (cut == std::string::npos || cut < half) {
                cut = s.find_last_of(" \t\r\n", offset + length - 1);
            }
            if (cut != std::string::npos && cut >= offset) {
                length = cut - offset + 1;
            }
        }
        out.push_back({offset, length});
        offset += length;
    }
    return out;
}

inline std::string join(const std::vector<std::string> &parts, const std::string &sep)
{
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += sep;
        }
        out += parts[i];
    }
    return out;
}

} // namespace text
} // namespace util
} // namespace promptguard

#endif // PROMPTGUARD_UTIL_TEXT_UTILS_HPP
