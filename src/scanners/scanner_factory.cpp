#include "scanner_factory.hpp"

#include <set>
#include "anonymize.hpp"
#include "ban_substrings.hpp"
#include "classifier_scanners.hpp"
#include "code.hpp"
#include "output_checks.hpp"
#include "token_limit.hpp"
#include "../classifiers/heuristics.hpp"
#include "../core/errors.hpp"
#include "../util/logger.hpp"

namespace promptguard {
namespace scanners {

namespace {

const std::set<std::string> &inboundNames()
{
    static const std::set<std::string> names = {
        "Anonymize", "PromptInjection", "TokenLimit", "Toxicity", "BanSubstrings", "BanTopics", "Code"};
    return names;
}

const std::set<std::string> &outboundNames()
{
    static const std::set<std::string> names = {
        "Deanonymize", "NoRefusal", "Relevance", "Sensitive", "Code", "BanSubstrings"};
    return names;
}

void requireVault(const std::string &name, const std::shared_ptr<core::Vault> &vault)
{
    if (!vault) {
        throw core::ConfigurationError(name + " needs a vault but none was supplied");
    }
}

} // namespace

ProviderSet ProviderSet::fromConfig(const config::GatewayConfig &cfg)
{
    ProviderSet providers;
    providers.tokenCounter = std::make_shared<classifiers::HeuristicTokenCounter>();
    providers.injection = classifiers::makeInjectionClassifier();
    providers.refusal = classifiers::makeRefusalClassifier();
    providers.topics = classifiers::makeTopicClassifier();
    providers.similarity = std::make_shared<classifiers::BagOfWordsSimilarity>();

    if (cfg.toxicityLexiconFile.empty()) {
        providers.toxicity = classifiers::makeToxicityClassifier();
    } else {
        providers.toxicity = classifiers::LexiconClassifier::loadFromFile("ToxicityLexicon",
                                                                          cfg.toxicityLexiconFile);
    }
    return providers;
}

void ScannerFactory::checkNames(Direction direction, const std::vector<std::string> &names)
{
    const auto &allowed = direction == Direction::Inbound ? inboundNames() : outboundNames();
    for (const auto &name : names) {
        if (allowed.count(name) > 0) {
            continue;
        }
        const auto &other = direction == Direction::Inbound ? outboundNames() : inboundNames();
        if (other.count(name) > 0) {
            throw core::ConfigurationError("scanner '" + name + "' cannot run in the "
                                           + core::toString(direction) + " direction");
        }
        throw core::ConfigurationError("unknown scanner '" + name + "'");
    }
}

std::shared_ptr<Scanner> ScannerFactory::create(Direction direction,
                                                const std::string &name,
                                                const config::GatewayConfig &cfg,
                                                const ProviderSet &providers,
                                                const std::shared_ptr<core::Vault> &vault)
{
    if (name == "Anonymize") {
        requireVault(name, vault);
        return std::make_shared<Anonymize>(vault);
    }
    if (name == "Deanonymize") {
        requireVault(name, vault);
        return std::make_shared<Deanonymize>(vault);
    }
    if (name == "PromptInjection") {
        return std::make_shared<PromptInjection>(providers.injection, cfg.promptInjectionThreshold);
    }
    if (name == "TokenLimit") {
        return std::make_shared<TokenLimit>(providers.tokenCounter, cfg.tokenLimit);
    }
    if (name == "Toxicity") {
        return std::make_shared<Toxicity>(providers.toxicity, cfg.toxicityThreshold);
    }
    if (name == "BanSubstrings") {
        if (direction == Direction::Inbound) {
            return std::make_shared<BanSubstrings>(cfg.banSubstrings, cfg.banSubstringsCaseSensitive,
                                                   cfg.banSubstringsMode);
        }
        return std::make_shared<BanSubstrings>(cfg.outputBanSubstrings, cfg.banSubstringsCaseSensitive,
                                               cfg.outputBanSubstringsMode);
    }
    if (name == "BanTopics") {
        return std::make_shared<BanTopics>(providers.topics, cfg.banTopics);
    }
    if (name == "NoRefusal") {
        return std::make_shared<NoRefusal>(providers.refusal, cfg.noRefusalThreshold, cfg.noRefusalMode);
    }
    if (name == "Relevance") {
        return std::make_shared<Relevance>(providers.similarity, cfg.relevanceThreshold);
    }
    if (name == "Sensitive") {
        return std::make_shared<Sensitive>(cfg.sensitiveRedact, cfg.sensitiveMode);
    }
    if (name == "Code") {
        return std::make_shared<Code>(cfg.codeLanguages, cfg.codeMode);
    }
    throw core::ConfigurationError("unknown scanner '" + name + "'");
}

pipeline::ScannerSet ScannerFactory::build(Direction direction,
                                           const std::vector<std::string> &names,
                                           const config::GatewayConfig &cfg,
                                           const ProviderSet &providers,
                                           const std::shared_ptr<core::Vault> &vault)
{
    checkNames(direction, names);
    pipeline::ScannerSet set(direction);
    for (const auto &name : names) {
        set.add(create(direction, name, cfg, providers, vault));
    }
    set.validate();
    util::logger::debug("ScannerFactory: " + core::toString(direction) + " scanners: "
                       + util::text::join(set.names(), ", "));
    return set;
}

} // namespace scanners
} // namespace promptguard
