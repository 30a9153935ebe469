#ifndef PROMPTGUARD_SCANNERS_CODE_HPP
#define PROMPTGUARD_SCANNERS_CODE_HPP

#include <algorithm>
#include <regex>
#include <set>
#include <string>
#include <vector>
#include "scanner.hpp"
#include "../core/errors.hpp"
#include "../util/text_utils.hpp"

/**
 * @file code.hpp
 * @brief Detects source code of configured languages in a prompt or response.
 *
 * DETECTION:
 *   - A fenced block whose info string names a language (```py, ```cpp ...)
 *     counts for that language.
 *   - Independently, per-language signature regexes are run over the whole
 *     text, so unfenced snippets are also caught.
 *   - Only languages listed at construction make the verdict invalid; code in
 *     other languages is ignored.
 *
 * Both passes search the text in bounded windows (util::text::regexWindows).
 * The scanner never changes the text. It is normally deployed in monitor mode.
 */

namespace promptguard {
namespace scanners {

namespace detail {

struct LanguageSignature
{
    std::string name;                  ///< canonical display name
    std::vector<std::string> aliases;  ///< lower-case names accepted in config and fences
    std::vector<std::regex> signatures;
};

inline const std::vector<LanguageSignature> &languageTable()
{
    using std::regex;
    static const std::vector<LanguageSignature> table = {
        {"Python", {"python", "py", "python3"}, {
            regex(R"((^|\n)\s*def\s+\w+\s*\([^)]*\)\s*(->\s*[\w\[\], .]+)?:)"),
            regex(R"((^|\n)\s*import\s+[\w.]+(\s+as\s+\w+)?\s*(\n|$))"),
            regex(R"((^|\n)\s*from\s+[\w.]+\s+import\s+[\w*])"),
            regex(R"(if\s+__name__\s*==\s*['"]__main__['"])"),
            regex(R"((^|\n)\s*(elif\s+.+|except(\s+\w+)?(\s+as\s+\w+)?)\s*:)"),
        }},
        {"JavaScript", {"javascript", "js", "node", "jsx", "nodejs"}, {
            regex(R"(\bfunction\s+\w+\s*\([^)]*\)\s*\{)"),
            regex(R"(\bconsole\.(log|error|warn)\s*\()"),
            regex(R"(\b(const|let|var)\s+\w+\s*=\s*(\(|function|require|async|new|\[|\{))"),
            regex(R"(\)\s*=>\s*\{)"),
            regex(R"(\bdocument\.(getElementById|querySelector|createElement)\s*\()"),
        }},
        {"PHP", {"php"}, {
            regex(R"(<\?php)"),
            regex(R"(\$\w{1,64}\s{0,8}=\s{0,8}[^=;\n][^;\n]{0,200};)"),
            regex(R"(\becho\s+\$\w+)"),
            regex(R"(\bfunction\s+\w+\s*\(\s*\$\w+)"),
        }},
        {"C", {"c", "h"}, {
            regex(R"(#include\s*<\w+\.h>)"),
            regex(R"(\bint\s+main\s*\(\s*(void|int\s+argc)?)"),
            regex(R"(\b(printf|scanf|malloc|free)\s*\()"),
        }},
        {"C++", {"c++", "cpp", "cxx", "cc", "hpp"}, {
            regex(R"(#include\s*<(iostream|vector|string|memory|map|algorithm)>)"),
            regex(R"(\bstd::\w+)"),
            regex(R"(\b(cout|cerr)\s*<<)"),
            regex(R"(\btemplate\s*<\s*(typename|class)\b)"),
        }},
        {"Java", {"java"}, {
            regex(R"(\bpublic\s+(static\s+)?(final\s+)?(class|interface|void)\s+\w+)"),
            regex(R"(\bSystem\.out\.print(ln)?\s*\()"),
            regex(R"((^|\n)\s*import\s+java(x)?\.)"),
        }},
        {"Go", {"go", "golang"}, {
            regex(R"((^|\n)\s*package\s+\w+\s*(\n|$))"),
            regex(R"(\bfunc\s+(\(\w+\s+\*?\w+\)\s*)?\w+\s*\([^)]*\)\s*[\w\[\]*]*\s*\{)"),
            regex(R"(\bfmt\.(Print|Sprint|Fprint)\w*\s*\()"),
        }},
        {"Rust", {"rust", "rs"}, {
            regex(R"(\bfn\s+\w+\s*(<[^>]*>)?\s*\([^)]*\)\s*(->\s*[\w<>&]+\s*)?\{)"),
            regex(R"(\blet\s+mut\s+\w+)"),
            regex(R"(\bprintln!\s*\()"),
            regex(R"(\bimpl(\s*<[^>]*>)?\s+\w+)"),
        }},
        {"Bash", {"bash", "sh", "shell", "zsh"}, {
            regex(R"((^|\n)#!\s*/(usr/)?bin/(env\s+)?(ba|z)?sh)"),
            regex(R"((^|\n)\s*(sudo|apt-get|yum|chmod|chown|wget|curl)\s+-{0,2}\w)"),
            regex(R"((^|\n)\s*for\s+\w+\s+in\s+.+;\s*do\b)"),
            regex(R"((^|\n)\s*if\s+\[\[?\s+.+\]\]?\s*;\s*then\b)"),
        }},
        {"SQL", {"sql", "mysql", "postgresql", "postgres", "sqlite"}, {
            regex(R"(\bSELECT\s+[\w*,. ]+\s+FROM\s+\w+)"),
            regex(R"(\bINSERT\s+INTO\s+\w+)"),
            regex(R"(\bUPDATE\s+\w+\s+SET\s+\w+)"),
            regex(R"(\bDELETE\s+FROM\s+\w+)"),
            regex(R"(\b(CREATE|DROP|ALTER)\s+TABLE\s+\w+)"),
        }},
    };
    return table;
}

/**
 * @return index into languageTable(), or -1 if @p name is not a known language or alias.
 */
inline int findLanguage(const std::string &name)
{
    std::string key = util::text::toLower(name);
    util::text::trim(key);
    const auto &table = languageTable();
    for (size_t i = 0; i < table.size(); ++i) {
        if (util::text::toLower(table[i].name) == key
            || std::find(table[i].aliases.begin(), table[i].aliases.end(), key) != table[i].aliases.end()) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

} // namespace detail

class Code : public Scanner
{
public:
    /**
     * @throw core::ConfigurationError if @p languages is empty or names an unknown language.
     */
    Code(const std::vector<std::string> &languages, ScanMode mode = ScanMode::Monitor)
        : Scanner("Code", mode)
    {
        if (languages.empty()) {
            throw core::ConfigurationError("Code needs at least one language");
        }
        for (const auto &lang : languages) {
            int idx = detail::findLanguage(lang);
            if (idx < 0) {
                throw core::ConfigurationError("Code: unknown language '" + lang + "'");
            }
            watched_.insert(idx);
        }
    }

    bool supports(Direction) const override { return true; }

    ScanOutput scan(const std::string &text,
                    const std::optional<std::string> &) const override
    {
        std::set<int> detected = detect(text);
        std::vector<std::string> hits;
        for (int idx : detected) {
            if (watched_.count(idx) > 0) {
                hits.push_back(detail::languageTable()[static_cast<size_t>(idx)].name);
            }
        }
        if (hits.empty()) {
            return ScanOutput::pass(text);
        }
        return ScanOutput::fail(text, 1.0, "code detected: " + util::text::join(hits, ", "));
    }

    /**
     * @brief Canonical names of every language found in @p text, configured or not.
     */
    static std::vector<std::string> languagesIn(const std::string &text)
    {
        std::vector<std::string> out;
        for (int idx : detect(text)) {
            out.push_back(detail::languageTable()[static_cast<size_t>(idx)].name);
        }
        return out;
    }

private:
    std::set<int> watched_;

    static std::set<int> detect(const std::string &text)
    {
        static const std::regex fence(R"(```[ \t]{0,8}([A-Za-z0-9+#_\-]{0,32})[^\n]{0,200}\n)");
        std::set<int> detected;
        const auto &table = detail::languageTable();

        for (const auto &window : util::text::regexWindows(text)) {
            const std::string slice = text.substr(window.offset, window.length);
            auto begin = std::sregex_iterator(slice.begin(), slice.end(), fence);
            for (auto it = begin; it != std::sregex_iterator(); ++it) {
                const std::string tag = (*it)[1].str();
                if (tag.empty()) {
                    continue;
                }
                int idx = detail::findLanguage(tag);
                if (idx >= 0) {
                    detected.insert(idx);
                }
            }

            for (size_t i = 0; i < table.size(); ++i) {
                if (detected.count(static_cast<int>(i)) > 0) {
                    continue;
                }
                for (const auto &sig : table[i].signatures) {
                    if (std::regex_search(slice, sig)) {
                        detected.insert(static_cast<int>(i));
                        break;
                    }
                }
            }
        }
        return detected;
    }
};

} // namespace scanners
} // namespace promptguard

#endif // PROMPTGUARD_SCANNERS_CODE_HPP
