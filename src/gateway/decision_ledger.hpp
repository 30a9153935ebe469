#ifndef PROMPTGUARD_GATEWAY_DECISION_LEDGER_HPP
#define PROMPTGUARD_GATEWAY_DECISION_LEDGER_HPP

#include <sqlite3.h>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include "../core/errors.hpp"
#include "../util/logger.hpp"

/**
 * @file decision_ledger.hpp
 * @brief Optional SQLite audit trail: one row per handled message.
 *
 * DESIGN GOALS:
 *   - Record what was decided (final state, stage, triggered scanners), never
 *     the message itself. The user text is stored only as a SHA-256 fingerprint.
 *   - The database is opened once and kept for the ledger's lifetime; every
 *     operation takes the ledger mutex.
 *   - Opening or creating the schema fails with core::DependencyError; a failed
 *     insert is logged and reported as false, it never fails the request.
 *
 * USAGE EXAMPLE:
 *   @code
 *   DecisionLedger ledger("promptguard_audit.db");
 *   ledger.record({0, "Blocked", "inbound", "PromptInjection", util::hashing::sha256(text)});
 *   @endcode
 */

namespace promptguard {
namespace gateway {

struct DecisionEntry
{
    int64_t timestampMs;       ///< 0 = stamp at insert time
    std::string state;         ///< final gateway state, e.g. "Delivered"
    std::string stage;         ///< "inbound", "generation", "outbound" or "none"
    std::string triggered;     ///< comma separated scanner names, may be empty
    std::string fingerprint;   ///< hex SHA-256 of the user text
};

class DecisionLedger
{
public:
    /**
     * @param dbFilePath SQLite file, created if missing (":memory:" works for tests).
     * @throw core::DependencyError if the database cannot be opened or initialised.
     */
    explicit DecisionLedger(const std::string &dbFilePath)
        : m_dbFilePath(dbFilePath)
    {
        int rc = sqlite3_open(m_dbFilePath.c_str(), &m_db);
        if (rc != SQLITE_OK || m_db == nullptr) {
            std::string msg = m_db ? sqlite3_errmsg(m_db) : "out of memory";
            sqlite3_close(m_db);
            m_db = nullptr;
            throw core::DependencyError("DecisionLedger: cannot open " + m_dbFilePath + ": " + msg);
        }
        if (!initDatabaseSchema()) {
            sqlite3_close(m_db);
            m_db = nullptr;
            throw core::DependencyError("DecisionLedger: cannot create schema in " + m_dbFilePath);
        }
        util::logger::info("[DecisionLedger] recording decisions in " + m_dbFilePath);
    }

    ~DecisionLedger()
    {
        if (m_db) {
            sqlite3_close(m_db);
        }
    }

    DecisionLedger(const DecisionLedger&) = delete;
    DecisionLedger& operator=(const DecisionLedger&) = delete;

    /**
     * @return true if the row was written.
     */
    bool record(const DecisionEntry &entry)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const char *sql = "INSERT INTO decisions (timestamp_ms, state, stage, triggered, fingerprint)"
                          " VALUES (?, ?, ?, ?, ?);";
        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK || !stmt) {
            logSqlError("prepare insert");
            return false;
        }

        const int64_t ts = entry.timestampMs != 0 ? entry.timestampMs : nowMs();
        bool ok = sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(ts)) == SQLITE_OK
               && sqlite3_bind_text(stmt, 2, entry.state.c_str(), -1, SQLITE_TRANSIENT) == SQLITE_OK
               && sqlite3_bind_text(stmt, 3, entry.stage.c_str(), -1, SQLITE_TRANSIENT) == SQLITE_OK
               && sqlite3_bind_text(stmt, 4, entry.triggered.c_str(), -1, SQLITE_TRANSIENT) == SQLITE_OK
               && sqlite3_bind_text(stmt, 5, entry.fingerprint.c_str(), -1, SQLITE_TRANSIENT) == SQLITE_OK;
        if (!ok) {
            logSqlError("bind");
            sqlite3_finalize(stmt);
            return false;
        }

        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            logSqlError("insert");
            return false;
        }
        return true;
    }

    size_t count()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, "SELECT COUNT(*) FROM decisions;", -1, &stmt, nullptr) != SQLITE_OK) {
            logSqlError("prepare count");
            return 0;
        }
        size_t n = 0;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            n = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
        }
        sqlite3_finalize(stmt);
        return n;
    }

    /**
     * @brief The newest @p limit entries, newest first.
     */
    std::vector<DecisionEntry> recent(size_t limit)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<DecisionEntry> out;
        const char *sql = "SELECT timestamp_ms, state, stage, triggered, fingerprint FROM decisions"
                          " ORDER BY id DESC LIMIT ?;";
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            logSqlError("prepare recent");
            return out;
        }
        sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(limit));
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            DecisionEntry e;
            e.timestampMs = static_cast<int64_t>(sqlite3_column_int64(stmt, 0));
            e.state = columnText(stmt, 1);
            e.stage = columnText(stmt, 2);
            e.triggered = columnText(stmt, 3);
            e.fingerprint = columnText(stmt, 4);
            out.push_back(std::move(e));
        }
        sqlite3_finalize(stmt);
        return out;
    }

private:
    std::string m_dbFilePath;
    sqlite3 *m_db = nullptr;
    std::mutex m_mutex;

    bool initDatabaseSchema()
    {
        const char *ddl = "CREATE TABLE IF NOT EXISTS decisions ("
                          " id INTEGER PRIMARY KEY AUTOINCREMENT,"
                          " timestamp_ms INTEGER NOT NULL,"
                          " state TEXT NOT NULL,"
                          " stage TEXT NOT NULL,"
                          " triggered TEXT,"
                          " fingerprint TEXT NOT NULL"
                          ");";
        char *errMsg = nullptr;
        int rc = sqlite3_exec(m_db, ddl, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            if (errMsg) {
                util::logger::error("[DecisionLedger] initDatabaseSchema error: " + std::string(errMsg));
                sqlite3_free(errMsg);
            }
            return false;
        }
        return true;
    }

    void logSqlError(const std::string &what) const
    {
        util::logger::error("[DecisionLedger] " + what + " failed: " + std::string(sqlite3_errmsg(m_db)));
    }

    static std::string columnText(sqlite3_stmt *stmt, int col)
    {
        const unsigned char *txt = sqlite3_column_text(stmt, col);
        return txt ? std::string(reinterpret_cast<const char*>(txt)) : std::string();
    }

    static int64_t nowMs()
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
};

} // namespace gateway
} // namespace promptguard

#endif // PROMPTGUARD_GATEWAY_DECISION_LEDGER_HPP
