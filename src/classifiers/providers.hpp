#ifndef PROMPTGUARD_CLASSIFIERS_PROVIDERS_HPP
#define PROMPTGUARD_CLASSIFIERS_PROVIDERS_HPP

#include <string>
#include <vector>

/**
 * @file providers.hpp
 * @brief Contracts for the detection capabilities the scanners depend on.
 *
 * Scanners only see these interfaces. The built-in implementations in
 * heuristics.hpp are lightweight keyword/pattern models; a deployment can
 * plug in model-backed providers without touching the scanners.
 *
 * All providers must be safe to call concurrently from several requests.
 */

namespace promptguard {
namespace classifiers {

/**
 * @brief Counts tokens the way the target model would.
 */
class TokenCounter
{
public:
    virtual ~TokenCounter() = default;
    virtual size_t count(const std::string &text) const = 0;
};

/**
 * @brief Scores text for one property (injection attempt, toxicity...) in [0,1].
 */
class TextClassifier
{
public:
    virtual ~TextClassifier() = default;
    virtual double score(const std::string &text) const = 0;
    virtual std::string name() const = 0;
};

/**
 * @brief Confidence that text is about a given topic, in [0,1].
 */
class TopicClassifier
{
public:
    virtual ~TopicClassifier() = default;
    virtual double score(const std::string &text, const std::string &topic) const = 0;
    virtual bool supports(const std::string &topic) const = 0;
    virtual std::vector<std::string> topics() const = 0;
};

/**
 * @brief Semantic similarity of two texts, in [0,1].
 */
class SimilarityScorer
{
public:
    virtual ~SimilarityScorer() = default;
    virtual double similarity(const std::string &a, const std::string &b) const = 0;
};

} // namespace classifiers
} // namespace promptguard

#endif // PROMPTGUARD_CLASSIFIERS_PROVIDERS_HPP
