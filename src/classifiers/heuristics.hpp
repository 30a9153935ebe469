#ifndef PROMPTGUARD_CLASSIFIERS_HEURISTICS_HPP
#define PROMPTGUARD_CLASSIFIERS_HEURISTICS_HPP

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <fstream>
#include <map>
#include <memory>
#include <regex>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include "providers.hpp"
#include "../core/errors.hpp"
#include "../util/logger.hpp"
#include "../util/text_utils.hpp"

/**
 * @file heuristics.hpp
 * @brief Built-in capability providers: token counting, weighted pattern and
 *        lexicon classifiers, topic lexicons and bag-of-words similarity.
 *
 * Scores from several hits are combined as a noisy-OR, 1 - prod(1 - w_i),
 * so independent weak signals add up without ever exceeding 1.
 */

namespace promptguard {
namespace classifiers {

inline double noisyOr(const std::vector<double> &weights)
{
    double keep = 1.0;
    for (double w : weights) {
        keep *= (1.0 - std::min(1.0, std::max(0.0, w)));
    }
    return 1.0 - keep;
}

/**
 * @class HeuristicTokenCounter
 * @brief Approximates a BPE tokenizer: each word costs one token per four
 *        characters (rounded up), each punctuation character one token.
 *        Whitespace is free.
 */
class HeuristicTokenCounter : public TokenCounter
{
public:
    size_t count(const std::string &text) const override
    {
        size_t tokens = 0;
        size_t run = 0;
        for (unsigned char c : text) {
            if (util::text::isWordChar(c)) {
                ++run;
                continue;
            }
            tokens += (run + 3) / 4;
            run = 0;
            if (!std::isspace(c)) {
                ++tokens;
            }
        }
        tokens += (run + 3) / 4;
        return tokens;
    }
};

/**
 * @class WeightedPatternClassifier
 * @brief Case-insensitive regex catalogue; every matching pattern contributes its weight.
 *        Long texts are searched window by window (see util::text::regexWindows).
 */
class WeightedPatternClassifier : public TextClassifier
{
public:
    struct Pattern
    {
        std::string label;
        std::regex regex;
        double weight;
    };

    WeightedPatternClassifier(std::string name, std::vector<Pattern> patterns)
        : name_(std::move(name)), patterns_(std::move(patterns))
    {
    }

    double score(const std::string &text) const override
    {
        std::vector<double> hits;
        const auto windows = util::text::regexWindows(text);
        for (const auto &p : patterns_) {
            if (matchesAnyWindow(text, windows, p.regex)) {
                hits.push_back(p.weight);
            }
        }
        return noisyOr(hits);
    }

    std::string name() const override { return name_; }

    /**
     * @brief Labels of the patterns that match @p text, for diagnostics.
     */
    std::vector<std::string> matchedLabels(const std::string &text) const
    {
        std::vector<std::string> out;
        const auto windows = util::text::regexWindows(text);
        for (const auto &p : patterns_) {
            if (matchesAnyWindow(text, windows, p.regex)) {
                out.push_back(p.label);
            }
        }
        return out;
    }

    static bool matchesAnyWindow(const std::string &text,
                                 const std::vector<util::text::Window> &windows,
                                 const std::regex &regex)
    {
        for (const auto &w : windows) {
            auto first = text.begin() + static_cast<std::ptrdiff_t>(w.offset);
            if (std::regex_search(first, first + static_cast<std::ptrdiff_t>(w.length), regex)) {
                return true;
            }
        }
        return false;
    }

private:
    std::string name_;
    std::vector<Pattern> patterns_;
};

/**
 * @brief Instruction-override / jailbreak catalogue used by the PromptInjection scanner.
 */
inline std::shared_ptr<WeightedPatternClassifier> makeInjectionClassifier()
{
    const auto icase = std::regex::icase | std::regex::ECMAScript;
    using P = WeightedPatternClassifier::Pattern;
    std::vector<P> patterns = {
        {"ignore previous instructions",
         std::regex(R"(ignore\s+(all\s+)?(the\s+|your\s+|any\s+)?(previous|prior|above|earlier|preceding)\s+(instructions?|prompts?|rules|directions))", icase), 0.95},
        {"disregard previous",
         std::regex(R"(disregard\s+(all\s+)?(the\s+|your\s+)?(previous|prior|above|earlier|system))", icase), 0.9},
        {"forget instructions",
         std::regex(R"(forget\s+(everything|all|your)(\s+(previous|prior))?\s*(instructions?|rules|guidelines|training)?)", icase), 0.75},
        {"system prompt extraction",
         std::regex(R"((reveal|show|print|repeat|output|display|leak|tell\s+me)\s+(me\s+)?(your\s+|the\s+)?(system|hidden|initial|original|secret)\s+(prompt|instructions?|message))", icase), 0.9},
        {"role reassignment",
         std::regex(R"(you\s+are\s+now\s+(a|an|in|the|my)\b)", icase), 0.6},
        {"new instructions",
         std::regex(R"(new\s+instructions?\s*:)", icase), 0.7},
        {"mode switch",
         std::regex(R"(\b(developer|god|dan|jailbreak|jailbroken|unrestricted)\s+mode\b)", icase), 0.8},
        {"do anything now",
         std::regex(R"(do\s+anything\s+now)", icase), 0.85},
        {"pretend unrestricted",
         std::regex(R"(pretend\s+(that\s+)?(you\s+)?(are|have)\s+(no\s+|an?\s+)?(restrictions|limits|rules|unrestricted|unfiltered))", icase), 0.75},
        {"bypass safeguards",
         std::regex(R"((bypass|override|circumvent|disable)\s+(your\s+|the\s+|all\s+|any\s+)?(safety|content|security)?\s*(filters?|restrictions|guidelines|guardrails|policies))", icase), 0.8},
        {"act unfiltered",
         std::regex(R"(act\s+as\s+(an?\s+)?(unfiltered|unrestricted|evil|jailbroken|uncensored))", icase), 0.8},
        {"system tag",
         std::regex(R"(<\/?system>)", icase), 0.85},
        {"chat template marker",
         std::regex(R"(\[\/?INST\]|<<\/?SYS>>|<\/?s>)", icase), 0.85},
        {"role boundary",
         std::regex(R"((^|\n)\s*(system|assistant)\s*:)", icase), 0.6},
    };
    return std::make_shared<WeightedPatternClassifier>("PromptInjectionHeuristic", std::move(patterns));
}

/**
 * @brief Refusal phrasing used by the NoRefusal scanner on model output.
 */
inline std::shared_ptr<WeightedPatternClassifier> makeRefusalClassifier()
{
    const auto icase = std::regex::icase | std::regex::ECMAScript;
    using P = WeightedPatternClassifier::Pattern;
    std::vector<P> patterns = {
        {"apology",
         std::regex(R"(\bi(\s+a|')m\s+(sorry|afraid)\b)", icase), 0.5},
        {"cannot help",
         std::regex(R"(\bi\s+(cannot|can't|can not|won't|will not|am unable to|'m unable to)\s+(help|assist|provide|comply|do that|fulfill|answer|share|support))", icase), 0.8},
        {"as an ai",
         std::regex(R"(\bas\s+an\s+ai(\s+language\s+model|\s+assistant)?\b)", icase), 0.6},
        {"decline",
         std::regex(R"(\b(must|have to|need to)\s+(decline|refuse)\b)", icase), 0.9},
        {"not allowed",
         std::regex(R"(\b(not|isn't)\s+(allowed|permitted)\s+to\b)", icase), 0.6},
        {"not appropriate",
         std::regex(R"(\b(not|isn't|wouldn't be)\s+appropriate\b)", icase), 0.6},
        {"against guidelines",
         std::regex(R"(\bagainst\s+(my|the|our)\s+(guidelines|programming|policy|policies|principles))", icase), 0.85},
    };
    return std::make_shared<WeightedPatternClassifier>("RefusalHeuristic", std::move(patterns));
}

/**
 * @class LexiconClassifier
 * @brief Weighted term list. A term ending in '*' matches any word starting with
 *        the stem; other terms (single words or phrases) must match whole words.
 */
class LexiconClassifier : public TextClassifier
{
public:
    LexiconClassifier(std::string name, std::map<std::string, double> lexicon)
        : name_(std::move(name))
    {
        for (const auto &kv : lexicon) {
            addTerm(kv.first, kv.second);
        }
    }

    /**
     * @brief Load "term=weight" lines ('#' comments allowed).
     * @throw core::DependencyError if the file cannot be read.
     * @throw core::ConfigurationError if a line is malformed.
     */
    static std::shared_ptr<LexiconClassifier> loadFromFile(const std::string &name,
                                                           const std::string &path)
    {
        std::ifstream in(path);
        if (!in.is_open()) {
            throw core::DependencyError("lexicon file not readable: " + path);
        }
        std::map<std::string, double> lexicon;
        std::string line;
        size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            util::text::trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }
            auto eq = line.rfind('=');
            if (eq == std::string::npos) {
                throw core::ConfigurationError(path + ":" + std::to_string(lineNo) + ": expected term=weight");
            }
            std::string term = line.substr(0, eq);
            std::string weight = line.substr(eq + 1);
            util::text::trim(term);
            util::text::trim(weight);
            try {
                lexicon[util::text::toLower(term)] = std::stod(weight);
            }
            catch (const std::exception &) {
                throw core::ConfigurationError(path + ":" + std::to_string(lineNo) + ": bad weight '" + weight + "'");
            }
        }
        if (lexicon.empty()) {
            throw core::DependencyError("lexicon file is empty: " + path);
        }
        util::logger::info("[Lexicon] loaded " + std::to_string(lexicon.size()) + " terms for "
                           + name + " from " + path);
        return std::make_shared<LexiconClassifier>(name, lexicon);
    }

    double score(const std::string &text) const override
    {
        return noisyOr(hitWeights(text));
    }

    std::string name() const override { return name_; }

    size_t size() const { return stems_.size() + terms_.size(); }

private:
    std::vector<double> hitWeights(const std::string &text) const
    {
        std::vector<double> hits;
        if (!stems_.empty()) {
            const auto tokens = util::text::words(text);
            for (const auto &stem : stems_) {
                for (const auto &w : tokens) {
                    if (util::text::startsWith(w, stem.first)) {
                        hits.push_back(stem.second);
                        break;
                    }
                }
            }
        }
        const std::string lower = util::text::toLower(text);
        for (const auto &term : terms_) {
            if (util::text::containsWholeWord(lower, term.first)) {
                hits.push_back(term.second);
            }
        }
        return hits;
    }

    void addTerm(const std::string &term, double weight)
    {
        if (term.empty()) {
            return;
        }
        if (term.back() == '*') {
            stems_.emplace_back(term.substr(0, term.size() - 1), weight);
        } else {
            terms_.emplace_back(term, weight);
        }
    }

    std::string name_;
    std::vector<std::pair<std::string, double>> stems_;
    std::vector<std::pair<std::string, double>> terms_;
};

/**
 * @brief Built-in insult/abuse lexicon used by the Toxicity scanner.
 */
inline std::shared_ptr<LexiconClassifier> makeToxicityClassifier()
{
    return std::make_shared<LexiconClassifier>("ToxicityLexicon", std::map<std::string, double>{
        {"hate you", 0.8}, {"i hate", 0.45}, {"terrible", 0.35}, {"stupid", 0.5},
        {"idiot*", 0.7}, {"moron*", 0.7}, {"dumb", 0.4}, {"shut up", 0.5},
        {"kill yourself", 0.99}, {"kys", 0.9}, {"worthless", 0.55}, {"pathetic", 0.5},
        {"disgusting", 0.45}, {"loser", 0.5}, {"fuck*", 0.8}, {"shit*", 0.6},
        {"bitch*", 0.85}, {"bastard*", 0.75}, {"asshole*", 0.85}, {"go to hell", 0.7},
        {"useless", 0.35}, {"trash", 0.35}, {"scum", 0.7}, {"retard*", 0.9},
    });
}

/**
 * @class LexiconTopicClassifier
 * @brief One LexiconClassifier per topic.
 */
class LexiconTopicClassifier : public TopicClassifier
{
public:
    void addTopic(const std::string &topic, std::shared_ptr<LexiconClassifier> lexicon)
    {
        topics_[topic] = std::move(lexicon);
    }

    double score(const std::string &text, const std::string &topic) const override
    {
        auto it = topics_.find(topic);
        if (it == topics_.end()) {
            throw std::invalid_argument("unknown topic: " + topic);
        }
        return it->second->score(text);
    }

    bool supports(const std::string &topic) const override
    {
        return topics_.count(topic) > 0;
    }

    std::vector<std::string> topics() const override
    {
        std::vector<std::string> out;
        for (const auto &kv : topics_) {
            out.push_back(kv.first);
        }
        return out;
    }

private:
    std::map<std::string, std::shared_ptr<LexiconClassifier>> topics_;
};

inline std::shared_ptr<LexiconTopicClassifier> makeTopicClassifier()
{
    auto classifier = std::make_shared<LexiconTopicClassifier>();
    classifier->addTopic("violence", std::make_shared<LexiconClassifier>("violence", std::map<std::string, double>{
        {"kill*", 0.6}, {"murder*", 0.7}, {"explosive*", 0.7}, {"bomb*", 0.7}, {"weapon*", 0.6},
        {"shoot*", 0.5}, {"stab*", 0.6}, {"assault*", 0.6}, {"torture*", 0.7}, {"massacre*", 0.8},
        {"blow up", 0.6}, {"beat up", 0.6}, {"attack*", 0.4},
    }));
    classifier->addTopic("illegal_activities", std::make_shared<LexiconClassifier>("illegal_activities", std::map<std::string, double>{
        {"steal*", 0.6}, {"launder*", 0.7}, {"fraud*", 0.6}, {"counterfeit*", 0.7}, {"smuggl*", 0.7},
        {"traffick*", 0.8}, {"burglar*", 0.7}, {"shoplift*", 0.7}, {"cocaine", 0.6}, {"heroin", 0.6},
        {"meth", 0.5}, {"drugs", 0.4}, {"piracy", 0.5}, {"break into", 0.6},
        {"without getting caught", 0.7}, {"hack into", 0.6}, {"illegal*", 0.5},
    }));
    classifier->addTopic("self_harm", std::make_shared<LexiconClassifier>("self_harm", std::map<std::string, double>{
        {"suicid*", 0.7}, {"kill myself", 0.9}, {"hurt myself", 0.8}, {"self harm", 0.8},
        {"cut myself", 0.8}, {"overdose", 0.6}, {"end my life", 0.9},
    }));
    classifier->addTopic("weapons", std::make_shared<LexiconClassifier>("weapons", std::map<std::string, double>{
        {"gun", 0.5}, {"guns", 0.5}, {"rifle*", 0.6}, {"pistol*", 0.6}, {"ammunition", 0.6},
        {"grenade*", 0.8}, {"firearm*", 0.7}, {"explosive*", 0.7}, {"silencer*", 0.6},
    }));
    classifier->addTopic("hate_speech", std::make_shared<LexiconClassifier>("hate_speech", std::map<std::string, double>{
        {"inferior race", 0.9}, {"supremac*", 0.8}, {"ethnic cleansing", 0.9}, {"genocide", 0.6},
        {"subhuman", 0.8}, {"go back to your country", 0.8},
    }));
    return classifier;
}

/**
 * @class BagOfWordsSimilarity
 * @brief Cosine similarity of content-word counts (stop words removed).
 *        If either side has no content words the texts cannot be compared and
 *        the result is 1.0.
 */
class BagOfWordsSimilarity : public SimilarityScorer
{
public:
    double similarity(const std::string &a, const std::string &b) const override
    {
        auto va = vectorize(a);
        auto vb = vectorize(b);
        if (va.empty() || vb.empty()) {
            return 1.0;
        }
        double dot = 0.0;
        double na = 0.0;
        double nb = 0.0;
        for (const auto &kv : va) {
            na += kv.second * kv.second;
            auto it = vb.find(kv.first);
            if (it != vb.end()) {
                dot += kv.second * it->second;
            }
        }
        for (const auto &kv : vb) {
            nb += kv.second * kv.second;
        }
        return dot / (std::sqrt(na) * std::sqrt(nb));
    }

private:
    static const std::set<std::string> &stopWords()
    {
        static const std::set<std::string> words = {
            "a", "an", "the", "is", "are", "was", "were", "be", "been", "am", "of", "to", "in",
            "on", "for", "and", "or", "but", "it", "its", "this", "that", "these", "those", "with",
            "as", "at", "by", "from", "what", "which", "who", "whom", "how", "why", "when", "where",
            "do", "does", "did", "i", "you", "he", "she", "we", "they", "me", "my", "your", "our",
            "their", "can", "could", "would", "should", "will", "please", "tell", "about", "so",
            "if", "then", "there", "here", "some", "any", "all", "not", "no", "yes", "s", "let",
        };
        return words;
    }

    // crude plural folding so "capitals" and "capital" meet
    static std::string fold(const std::string &w)
    {
        if (w.size() > 4 && w.back() == 's' && w[w.size() - 2] != 's') {
            return w.substr(0, w.size() - 1);
        }
        return w;
    }

    static std::unordered_map<std::string, double> vectorize(const std::string &text)
    {
        std::unordered_map<std::string, double> counts;
        for (const auto &w : util::text::words(text)) {
            if (stopWords().count(w) > 0) {
                continue;
            }
            counts[fold(w)] += 1.0;
        }
        return counts;
    }
};

} // namespace classifiers
} // namespace promptguard

#endif // PROMPTGUARD_CLASSIFIERS_HEURISTICS_HPP
