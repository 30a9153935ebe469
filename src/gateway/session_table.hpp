#ifndef PROMPTGUARD_GATEWAY_SESSION_TABLE_HPP
#define PROMPTGUARD_GATEWAY_SESSION_TABLE_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include "../core/vault.hpp"
#include "../pipeline/pipeline_runner.hpp"
#include "../util/logger.hpp"

/**
 * @file session_table.hpp
 * @brief Per-conversation Vault and PipelineRunner pairs, keyed by a client session id.
 *
 * DESIGN:
 *   - A placeholder issued in one session can only be resolved by the scanners
 *     of that same session. Each session owns its own Vault and its own runner
 *     built around that Vault.
 *   - Sessions idle for longer than the idle timeout are dropped on the next
 *     acquire(). When the table is full the least recently used session goes.
 *   - acquire() hands out shared_ptrs, so a session evicted while a request is
 *     still using it stays alive until that request finishes.
 *
 * USAGE:
 *   @code
 *   SessionTable table(factory, 1024, std::chrono::minutes(30), 10000);
 *   auto session = table.acquire("conversation-42");
 *   session->runner->run(core::Direction::Inbound, "My email is a@b.com");
 *   table.end("conversation-42");
 *   @endcode
 */

namespace promptguard {
namespace gateway {

struct Session
{
    std::string id;
    std::shared_ptr<core::Vault> vault;
    std::unique_ptr<pipeline::PipelineRunner> runner;
    std::chrono::steady_clock::time_point lastUsed;
};

class SessionTable
{
public:
    using Clock = std::chrono::steady_clock;
    using RunnerFactory =
        std::function<std::unique_ptr<pipeline::PipelineRunner>(const std::shared_ptr<core::Vault>&)>;

    SessionTable(RunnerFactory factory,
                 size_t maxSessions,
                 std::chrono::seconds idleTimeout,
                 size_t vaultMaxEntries = core::Vault::kDefaultMaxEntries)
        : factory_(std::move(factory)),
          maxSessions_(maxSessions == 0 ? 1 : maxSessions),
          idleTimeout_(idleTimeout),
          vaultMaxEntries_(vaultMaxEntries)
    {
    }

    SessionTable(const SessionTable&) = delete;
    SessionTable& operator=(const SessionTable&) = delete;

    /**
     * @brief The session named @p id, created on first use.
     * @throw whatever the runner factory throws; no session is stored then.
     */
    std::shared_ptr<Session> acquire(const std::string &id)
    {
        const auto now = Clock::now();
        std::lock_guard<std::mutex> lock(mutex_);
        expireIdleLocked(now);

        auto it = sessions_.find(id);
        if (it != sessions_.end()) {
            it->second->lastUsed = now;
            return it->second;
        }

        if (sessions_.size() >= maxSessions_) {
            evictLeastRecentLocked();
        }
        auto session = std::make_shared<Session>();
        session->id = id;
        session->vault = std::make_shared<core::Vault>(vaultMaxEntries_);
        session->runner = factory_(session->vault);
        session->lastUsed = now;
        sessions_[id] = session;
        util::logger::debug("[SessionTable] opened session " + id + " (vault "
                            + session->vault->sessionId() + ")");
        return session;
    }

    /**
     * @brief Forget session @p id and every placeholder it issued.
     * @return false if no such session was open.
     */
    bool end(const std::string &id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            return false;
        }
        it->second->vault->clear();
        sessions_.erase(it);
        util::logger::debug("[SessionTable] closed session " + id);
        return true;
    }

    /**
     * @brief Drop every session last used before @p now minus the idle timeout.
     * @return number of sessions dropped.
     */
    size_t expireIdle(Clock::time_point now)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return expireIdleLocked(now);
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &kv : sessions_) {
            kv.second->vault->clear();
        }
        sessions_.clear();
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return sessions_.size();
    }

    bool contains(const std::string &id) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return sessions_.count(id) > 0;
    }

private:
    RunnerFactory factory_;
    const size_t maxSessions_;
    const std::chrono::seconds idleTimeout_;
    const size_t vaultMaxEntries_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Session>> sessions_;

    size_t expireIdleLocked(Clock::time_point now)
    {
        size_t dropped = 0;
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (now - it->second->lastUsed > idleTimeout_) {
                util::logger::info("[SessionTable] session " + it->first + " expired after inactivity");
                it = sessions_.erase(it);
                ++dropped;
            } else {
                ++it;
            }
        }
        return dropped;
    }

    void evictLeastRecentLocked()
    {
        auto oldest = sessions_.begin();
        for (auto it = sessions_.begin(); it != sessions_.end(); ++it) {
            if (it->second->lastUsed < oldest->second->lastUsed) {
                oldest = it;
            }
        }
        if (oldest == sessions_.end()) {
            return;
        }
        util::logger::warn("[SessionTable] session limit reached, evicting " + oldest->first);
        sessions_.erase(oldest);
    }
};

} // namespace gateway
} // namespace promptguard

#endif // PROMPTGUARD_GATEWAY_SESSION_TABLE_HPP
