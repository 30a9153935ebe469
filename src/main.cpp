#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <string>
#include <thread>

#include "gateway/gateway.hpp"
#include "generator/llama_server_generator.hpp"
#include "network/http_gateway_server.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

namespace {

std::atomic_bool g_stopRequested(false);

void onSignal(int) {
    g_stopRequested = true;
}

} // namespace

int main(int argc, char** argv) {
    using namespace promptguard;

    util::logger::setLogLevel(util::logger::LogLevel::INFO);
    util::logger::info("[main] PromptGuard gateway starting...");

    // 1. Parse configuration
    config::GatewayConfig cfg;
    std::string configPath = "promptguard.conf";
    if (argc > 1) {
        configPath = argv[1];
    }
    try {
        util::ConfigParser configParser(cfg);
        configParser.loadFromFile(configPath);
    }
    catch (const core::ConfigurationError& ex) {
        util::logger::critical("[main] Invalid configuration: " + std::string(ex.what()));
        return 1;
    }

    util::logger::LogLevel level;
    if (util::logger::parseLogLevel(cfg.logLevel, level)) {
        util::logger::setLogLevel(level);
    }
    if (!cfg.logFile.empty() && !util::logger::enableFileOutput(cfg.logFile)) {
        util::logger::warn("[main] Continuing with console logging only");
    }

    // 2. Generator and gateway
    std::unique_ptr<gateway::Gateway> gw;
    try {
        auto generator = std::make_shared<generator::LlamaServerGenerator>(cfg.generatorEndpoint,
                                                                           cfg.generatorTimeoutSeconds);
        gw = std::make_unique<gateway::Gateway>(cfg, generator);
    }
    catch (const core::GuardError& ex) {
        util::logger::critical("[main] Failed to initialize gateway: " + std::string(ex.what()));
        return 1;
    }

    gateway::GatewayStatus status = gw->status();
    util::logger::info(std::string("[main] protected=") + (status.protectedMode ? "true" : "false")
                       + " generator ready=" + (status.ready ? "true" : "false")
                       + " sessions<=" + std::to_string(cfg.maxSessions)
                       + " idle=" + std::to_string(cfg.sessionIdleSeconds) + "s");

    // 3. Serve until SIGINT/SIGTERM
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    network::HttpGatewayServer server(*gw, cfg.port, cfg.workerThreads);
    if (!server.Start()) {
        util::logger::critical("[main] Failed to start HTTP server on port " + std::to_string(cfg.port));
        return 1;
    }

    while (!g_stopRequested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    // 4. Shut down
    util::logger::info("[main] Shutdown requested, stopping server.");
    server.Stop();
    gw->endSession();

    util::logger::info("[main] PromptGuard gateway exiting.");
    return 0;
}
