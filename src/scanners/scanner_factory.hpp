#ifndef PROMPTGUARD_SCANNERS_SCANNER_FACTORY_HPP
#define PROMPTGUARD_SCANNERS_SCANNER_FACTORY_HPP

#include <memory>
#include <string>
#include <vector>
#include "scanner.hpp"
#include "gateway_config.hpp"
#include "../classifiers/providers.hpp"
#include "../core/vault.hpp"
#include "../pipeline/scanner_set.hpp"

/**
 * @file scanner_factory.hpp
 * @brief Builds scanner sets by name from a GatewayConfig.
 *
 * Known names: Anonymize, PromptInjection, TokenLimit, Toxicity, BanSubstrings,
 * BanTopics (inbound); Deanonymize, NoRefusal, Relevance, Sensitive, Code,
 * BanSubstrings (outbound). Code and BanSubstrings may be placed in either set.
 *
 * USAGE:
 *   @code
 *   auto providers = ProviderSet::fromConfig(cfg);    // may throw DependencyError
 *   auto vault = std::make_shared<core::Vault>();
 *   auto in  = ScannerFactory::build(Direction::Inbound,  cfg.inputScanners,  cfg, providers, vault);
 *   auto out = ScannerFactory::build(Direction::Outbound, cfg.outputScanners, cfg, providers, vault);
 *   @endcode
 */

namespace promptguard {
namespace scanners {

/**
 * @struct ProviderSet
 * @brief The capability providers the built-in scanners delegate to.
 */
struct ProviderSet
{
    std::shared_ptr<classifiers::TokenCounter> tokenCounter;
    std::shared_ptr<classifiers::TextClassifier> injection;
    std::shared_ptr<classifiers::TextClassifier> toxicity;
    std::shared_ptr<classifiers::TextClassifier> refusal;
    std::shared_ptr<classifiers::TopicClassifier> topics;
    std::shared_ptr<classifiers::SimilarityScorer> similarity;

    /**
     * @brief The built-in heuristic providers, with the toxicity lexicon read
     *        from cfg.toxicityLexiconFile when one is configured.
     * @throw core::DependencyError if an external resource cannot be loaded.
     */
    static ProviderSet fromConfig(const config::GatewayConfig &cfg);
};

class ScannerFactory
{
public:
    /**
     * @brief Reject names that are unknown or not allowed in @p direction,
     *        before any provider is loaded.
     * @throw core::ConfigurationError
     */
    static void checkNames(Direction direction, const std::vector<std::string> &names);

    /**
     * @brief Instantiate @p names in order and validate the resulting set.
     * @throw core::ConfigurationError for unknown names, bad parameters or bad ordering.
     */
    static pipeline::ScannerSet build(Direction direction,
                                      const std::vector<std::string> &names,
                                      const config::GatewayConfig &cfg,
                                      const ProviderSet &providers,
                                      const std::shared_ptr<core::Vault> &vault);

    static std::shared_ptr<Scanner> create(Direction direction,
                                           const std::string &name,
                                           const config::GatewayConfig &cfg,
                                           const ProviderSet &providers,
                                           const std::shared_ptr<core::Vault> &vault);
};

} // namespace scanners
} // namespace promptguard

#endif // PROMPTGUARD_SCANNERS_SCANNER_FACTORY_HPP
