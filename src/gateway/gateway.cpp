#include "gateway.hpp"

#include <stdexcept>
#include "../core/errors.hpp"
#include "../scanners/scanner_factory.hpp"
#include "../util/hashing.hpp"
#include "../util/logger.hpp"
#include "../util/text_utils.hpp"

namespace promptguard {
namespace gateway {

namespace {

std::unique_ptr<pipeline::PipelineRunner> buildRunner(const config::GatewayConfig &cfg,
                                                      const scanners::ProviderSet &providers,
                                                      const std::shared_ptr<core::Vault> &vault)
{
    auto inbound = scanners::ScannerFactory::build(core::Direction::Inbound, cfg.inputScanners,
                                                   cfg, providers, vault);
    auto outbound = scanners::ScannerFactory::build(core::Direction::Outbound, cfg.outputScanners,
                                                    cfg, providers, vault);
    return std::make_unique<pipeline::PipelineRunner>(std::move(inbound), std::move(outbound));
}

} // namespace

const char *toString(RequestState state)
{
    switch (state) {
        case RequestState::Received:        return "Received";
        case RequestState::InboundScanned:  return "InboundScanned";
        case RequestState::Generating:      return "Generating";
        case RequestState::OutboundScanned: return "OutboundScanned";
        case RequestState::Blocked:         return "Blocked";
        case RequestState::Delivered:       return "Delivered";
        case RequestState::Failed:          return "Failed";
    }
    return "Unknown";
}

Gateway::Gateway(const config::GatewayConfig &cfg,
                 std::shared_ptr<generator::Generator> generator,
                 std::shared_ptr<core::Vault> vault)
    : vault_(vault ? std::move(vault) : std::make_shared<core::Vault>(cfg.vaultMaxEntries)),
      generator_(std::move(generator))
{
    if (!generator_) {
        throw std::invalid_argument("Gateway requires a generator");
    }
    config::validate(cfg);
    options_.maxNewTokens = cfg.maxNewTokens;
    options_.temperature = cfg.temperature;
    options_.maxSessions = cfg.maxSessions;
    options_.sessionIdle = std::chrono::seconds(cfg.sessionIdleSeconds);
    options_.vaultMaxEntries = cfg.vaultMaxEntries;

    // Name errors are configuration errors and must not be hidden by a
    // dependency failure further down.
    scanners::ScannerFactory::checkNames(core::Direction::Inbound, cfg.inputScanners);
    scanners::ScannerFactory::checkNames(core::Direction::Outbound, cfg.outputScanners);

    std::optional<scanners::ProviderSet> providers;
    try {
        providers = scanners::ProviderSet::fromConfig(cfg);
    }
    catch (const core::DependencyError &ex) {
        if (!cfg.allowUnprotected) {
            util::logger::error("[Gateway] scanner dependency failed: " + std::string(ex.what()));
            throw;
        }
        enterUnprotectedMode(ex.what());
    }

    if (providers) {
        runner_ = buildRunner(cfg, *providers, vault_);
        options_.runnerFactory = [cfg, set = *providers](const std::shared_ptr<core::Vault> &v) {
            return buildRunner(cfg, set, v);
        };
        openSessions();
        util::logger::info("[Gateway] protection active, vault session " + vault_->sessionId()
                           + ", inbound: " + util::text::join(cfg.inputScanners, ",")
                           + ", outbound: " + util::text::join(cfg.outputScanners, ","));
    }

    if (!cfg.auditDatabase.empty()) {
        openLedger(cfg.auditDatabase);
    }
}

Gateway::Gateway(std::unique_ptr<pipeline::PipelineRunner> runner,
                 std::shared_ptr<core::Vault> vault,
                 std::shared_ptr<generator::Generator> generator,
                 GatewayOptions options)
    : runner_(std::move(runner)),
      vault_(vault ? std::move(vault) : std::make_shared<core::Vault>()),
      generator_(std::move(generator)),
      options_(std::move(options))
{
    if (!generator_) {
        throw std::invalid_argument("Gateway requires a generator");
    }
    if (!runner_) {
        enterUnprotectedMode("no scanner pipeline supplied");
        return;
    }
    openSessions();
}

void Gateway::openSessions()
{
    if (!options_.runnerFactory) {
        return;
    }
    sessions_ = std::make_unique<SessionTable>(options_.runnerFactory, options_.maxSessions,
                                               options_.sessionIdle, options_.vaultMaxEntries);
}

void Gateway::enterUnprotectedMode(const std::string &reason)
{
    runner_.reset();
    sessions_.reset();
    util::logger::critical("[Gateway] RUNNING UNPROTECTED: " + reason
                           + ". Messages reach the model without any scanning.");
}

void Gateway::openLedger(const std::string &path)
{
    try {
        options_.ledger = std::make_shared<DecisionLedger>(path);
    }
    catch (const core::DependencyError &ex) {
        util::logger::error("[Gateway] decision ledger disabled: " + std::string(ex.what()));
        options_.ledger.reset();
    }
}

void Gateway::moveTo(GatewayOutcome &outcome, RequestState state)
{
    outcome.state = state;
    outcome.transitions.push_back(state);
}

std::string Gateway::blockMessage(core::Direction direction, const std::vector<std::string> &triggered)
{
    std::string prefix = direction == core::Direction::Inbound ? "Input" : "Response";
    return prefix + " blocked for security reasons. Detected issues: " + util::text::join(triggered, ", ");
}

GatewayReply Gateway::handleMessage(const std::string &text, const std::string &sessionId)
{
    GatewayReply reply;
    reply.response = process(text, sessionId).response;
    return reply;
}

GatewayOutcome Gateway::process(const std::string &text, const std::string &sessionId)
{
    GatewayOutcome outcome;
    outcome.unprotected = !runner_;
    moveTo(outcome, RequestState::Received);

    std::string trimmed = text;
    util::text::trim(trimmed);
    if (trimmed.empty()) {
        outcome.response = kEmptyMessageReply;
        return outcome;
    }

    util::logger::info("[Gateway] received: " + util::logger::preview(text));
    if (!runner_) {
        util::logger::warn("[Gateway] unprotected: forwarding message without scanning");
    }

    // Held for the whole request so an eviction cannot free the runner under us.
    std::shared_ptr<Session> session;
    pipeline::PipelineRunner *runner = runner_.get();
    if (runner && !sessionId.empty() && sessions_) {
        try {
            session = sessions_->acquire(sessionId);
            runner = session->runner.get();
        }
        catch (const std::exception &ex) {
            util::logger::error("[Gateway] cannot open session " + sessionId + ": " + ex.what());
            outcome.response = kSessionFailedReply;
            outcome.stage = "session";
            moveTo(outcome, RequestState::Failed);
            recordDecision(text, outcome);
            return outcome;
        }
    }

    std::string prompt = text;
    if (runner) {
        pipeline::ScanResult inbound = runner->run(core::Direction::Inbound, text);
        moveTo(outcome, RequestState::InboundScanned);
        util::logger::info("[Gateway] inbound " + std::string(pipeline::toString(inbound.verdict))
                           + " [" + inbound.scoresSummary() + "]");
        if (inbound.blocked()) {
            outcome.response = blockMessage(core::Direction::Inbound, inbound.triggered);
            outcome.stage = "inbound";
            outcome.inbound = std::move(inbound);
            moveTo(outcome, RequestState::Blocked);
            recordDecision(text, outcome);
            return outcome;
        }
        prompt = inbound.text;
        outcome.inbound = std::move(inbound);
    }

    moveTo(outcome, RequestState::Generating);
    outcome.generatorCalled = true;
    std::string completion;
    try {
        completion = generator_->generate(prompt, options_.maxNewTokens, options_.temperature);
    }
    catch (const core::GenerationError &ex) {
        util::logger::error("[Gateway] generation failed: " + std::string(ex.what()));
        outcome.response = kGenerationFailedReply;
        outcome.stage = "generation";
        moveTo(outcome, RequestState::Failed);
        recordDecision(text, outcome);
        return outcome;
    }
    catch (const std::exception &ex) {
        util::logger::error("[Gateway] generator raised an unexpected error: " + std::string(ex.what()));
        outcome.response = kGenerationFailedReply;
        outcome.stage = "generation";
        moveTo(outcome, RequestState::Failed);
        recordDecision(text, outcome);
        return outcome;
    }

    if (!runner) {
        outcome.response = completion;
        moveTo(outcome, RequestState::Delivered);
        recordDecision(text, outcome);
        return outcome;
    }

    pipeline::ScanResult outbound = runner->run(core::Direction::Outbound, completion, text);
    moveTo(outcome, RequestState::OutboundScanned);
    util::logger::info("[Gateway] outbound " + std::string(pipeline::toString(outbound.verdict))
                       + " [" + outbound.scoresSummary() + "]");
    if (outbound.blocked()) {
        outcome.response = blockMessage(core::Direction::Outbound, outbound.triggered);
        outcome.stage = "outbound";
        moveTo(outcome, RequestState::Blocked);
    } else {
        outcome.response = outbound.text;
        outcome.stage = "outbound";
        moveTo(outcome, RequestState::Delivered);
    }
    outcome.outbound = std::move(outbound);
    recordDecision(text, outcome);
    return outcome;
}

void Gateway::recordDecision(const std::string &text, const GatewayOutcome &outcome)
{
    if (!options_.ledger) {
        return;
    }
    std::vector<std::string> triggered;
    if (outcome.inbound) {
        triggered.insert(triggered.end(), outcome.inbound->triggered.begin(), outcome.inbound->triggered.end());
    }
    if (outcome.outbound) {
        triggered.insert(triggered.end(), outcome.outbound->triggered.begin(), outcome.outbound->triggered.end());
    }
    DecisionEntry entry;
    entry.timestampMs = 0;
    entry.state = toString(outcome.state);
    entry.stage = outcome.stage;
    entry.triggered = util::text::join(triggered, ",");
    try {
        entry.fingerprint = util::hashing::sha256(text);
    }
    catch (const std::runtime_error &ex) {
        util::logger::error("[Gateway] cannot fingerprint message for the ledger: " + std::string(ex.what()));
        return;
    }
    if (!options_.ledger->record(entry)) {
        util::logger::warn("[Gateway] decision not recorded");
    }
}

GatewayStatus Gateway::status() const
{
    GatewayStatus s;
    s.protectedMode = static_cast<bool>(runner_);
    s.ready = generator_->ready();
    s.sessionId = vault_->sessionId();
    s.activeSessions = sessions_ ? sessions_->size() : 0;
    return s;
}

void Gateway::endSession()
{
    util::logger::info("[Gateway] session " + vault_->sessionId() + " ended");
    vault_->clear();
    if (sessions_) {
        sessions_->clear();
    }
}

bool Gateway::endSession(const std::string &sessionId)
{
    if (!sessions_) {
        return false;
    }
    return sessions_->end(sessionId);
}

} // namespace gateway
} // namespace promptguard
