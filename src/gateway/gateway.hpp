#ifndef PROMPTGUARD_GATEWAY_GATEWAY_HPP
#define PROMPTGUARD_GATEWAY_GATEWAY_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "decision_ledger.hpp"
#include "gateway_config.hpp"
#include "session_table.hpp"
#include "../core/vault.hpp"
#include "../generator/generator.hpp"
#include "../pipeline/pipeline_runner.hpp"

/**
 * @file gateway.hpp
 * @brief Orchestrates inbound scan, generation and outbound scan for one message.
 *
 * STATE MACHINE (per request):
 *   Received -> InboundScanned -> (Blocked | Generating)
 *   Generating -> OutboundScanned -> (Blocked | Delivered)
 *   Generating -> Failed               (the Generator raised GenerationError)
 *
 * DESIGN GOALS:
 *   - Messages sent without a session id use the Gateway's own Vault and
 *     PipelineRunner, shared by every such request.
 *   - Messages sent with a session id use that session's Vault and runner
 *     (see session_table.hpp). Placeholders never resolve across sessions.
 *     Sessions need a runner factory, which the config constructor always has;
 *     a Gateway assembled from a ready-made runner gets one through GatewayOptions.
 *   - The Gateway itself holds no lock; the Generator call blocks only its own request.
 *   - Blocks are never silent: the reply names the stage and the scanners that fired.
 *     Raw exception text never reaches the caller.
 *   - Unprotected mode: when a scanner dependency cannot be loaded and
 *     allowUnprotected is set, messages go straight to the Generator. The state is
 *     logged as CRITICAL at startup and reported by status().
 *
 * USAGE EXAMPLE:
 *   @code
 *   config::GatewayConfig cfg;
 *   auto gen = std::make_shared<generator::LlamaServerGenerator>(cfg.generatorEndpoint,
 *                                                                cfg.generatorTimeoutSeconds);
 *   gateway::Gateway gw(cfg, gen);
 *   std::string reply = gw.handleMessage("What is the capital of France?").response;
 *   gw.endSession();
 *   @endcode
 */

namespace promptguard {
namespace gateway {

enum class RequestState {
    Received,
    InboundScanned,
    Generating,
    OutboundScanned,
    Blocked,
    Delivered,
    Failed
};

const char *toString(RequestState state);

/// The only thing a chat client sees.
struct GatewayReply
{
    std::string response;
};

/**
 * @struct GatewayOutcome
 * @brief Full record of one request, for diagnostics and tests.
 */
struct GatewayOutcome
{
    RequestState state = RequestState::Received;
    std::vector<RequestState> transitions;       ///< every state visited, in order
    std::string response;
    std::string stage = "none";                  ///< where the request ended: inbound, generation, outbound
    std::optional<pipeline::ScanResult> inbound;
    std::optional<pipeline::ScanResult> outbound;
    bool generatorCalled = false;
    bool unprotected = false;
};

struct GatewayStatus
{
    bool protectedMode;
    bool ready;
    std::string sessionId;               ///< id of the default vault session
    size_t activeSessions = 0;           ///< named sessions currently open
};

struct GatewayOptions
{
    int maxNewTokens = 256;
    double temperature = 0.7;
    std::shared_ptr<DecisionLedger> ledger;
    SessionTable::RunnerFactory runnerFactory;   ///< empty = named sessions share the default vault
    size_t maxSessions = 1024;
    std::chrono::seconds sessionIdle = std::chrono::seconds(1800);
    size_t vaultMaxEntries = core::Vault::kDefaultMaxEntries;
};

class Gateway
{
public:
    static constexpr const char *kEmptyMessageReply = "Please provide a message.";
    static constexpr const char *kGenerationFailedReply = "Error: the model could not generate a response.";
    static constexpr const char *kSessionFailedReply = "Error: the session could not be opened.";

    /**
     * @brief Build both scanner sets from @p cfg.
     * @param vault shared vault; a fresh one is created when null.
     * @throw core::ConfigurationError for any invalid configuration.
     * @throw core::DependencyError if a provider fails to load and cfg.allowUnprotected is false.
     */
    Gateway(const config::GatewayConfig &cfg,
            std::shared_ptr<generator::Generator> generator,
            std::shared_ptr<core::Vault> vault = nullptr);

    /**
     * @brief Assemble a Gateway from ready-made parts. A null @p runner means
     *        unprotected mode.
     */
    Gateway(std::unique_ptr<pipeline::PipelineRunner> runner,
            std::shared_ptr<core::Vault> vault,
            std::shared_ptr<generator::Generator> generator,
            GatewayOptions options = GatewayOptions());

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    GatewayReply handleMessage(const std::string &text, const std::string &sessionId = std::string());

    /**
     * @param sessionId conversation the message belongs to; empty = the default session.
     */
    GatewayOutcome process(const std::string &text, const std::string &sessionId = std::string());

    GatewayStatus status() const;

    /**
     * @brief Global session boundary: forget every placeholder issued so far in
     *        the default session and close every named session.
     */
    void endSession();

    /**
     * @brief Close the named session and drop its vault.
     * @return false if it was not open.
     */
    bool endSession(const std::string &sessionId);

    bool supportsSessions() const { return static_cast<bool>(sessions_); }

    bool isProtected() const { return static_cast<bool>(runner_); }

    const std::shared_ptr<core::Vault> &vault() const { return vault_; }

    const pipeline::PipelineRunner *runner() const { return runner_.get(); }

    static std::string blockMessage(core::Direction direction, const std::vector<std::string> &triggered);

private:
    std::unique_ptr<pipeline::PipelineRunner> runner_;
    std::shared_ptr<core::Vault> vault_;
    std::shared_ptr<generator::Generator> generator_;
    GatewayOptions options_;
    std::unique_ptr<SessionTable> sessions_;

    void openSessions();
    void enterUnprotectedMode(const std::string &reason);
    void openLedger(const std::string &path);
    void recordDecision(const std::string &text, const GatewayOutcome &outcome);
    static void moveTo(GatewayOutcome &outcome, RequestState state);
};

} // namespace gateway
} // namespace promptguard

#endif // PROMPTGUARD_GATEWAY_GATEWAY_HPP
