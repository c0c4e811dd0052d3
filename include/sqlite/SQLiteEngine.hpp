#pragma once

/**
 * @file SQLiteEngine.hpp
 * @brief Engine handle: the primary SQLite database a pool's sessions share.
 *
 * The engine is opened once per pool (or per standalone connection) and
 * released exactly once, after every session opened against it is closed.
 */

#include <sqlite3.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace sqlkit {

/**
 * @struct EngineConfig
 * @brief Options applied when the engine and its sessions are opened.
 */
struct EngineConfig {
    bool readOnly = false;                        ///< Open with SQLITE_OPEN_READONLY
    std::chrono::milliseconds busyTimeout{5000};  ///< sqlite3_busy_timeout for every session
    std::string journalMode = "WAL";              ///< File databases only; empty keeps the default
    bool foreignKeys = true;                      ///< PRAGMA foreign_keys per session
};

/**
 * @struct EngineMetrics
 * @brief Shared counters describing native handle activity.
 *
 * Supplied by the caller so several engines (or an engine and its restarts)
 * can report into the same place.
 */
struct EngineMetrics {
    std::atomic<uint64_t> opens{0};        ///< Successful engine opens
    std::atomic<uint64_t> releases{0};     ///< Engine releases (second release not counted)
    std::atomic<uint64_t> connects{0};     ///< Sessions opened
    std::atomic<uint64_t> disconnects{0};  ///< Sessions closed
    std::atomic<uint64_t> prepares{0};     ///< Statements prepared
};

/**
 * @class SQLiteEngine
 * @brief Owns the primary sqlite3 handle for one database location.
 *
 * Location handling:
 * - ":memory:" opens a process-unique shared in-memory database through the
 *   memdb VFS, so every session opened on sessionUri() sees the same data.
 *   The engine's own handle keeps that database alive until release().
 * - Any other location is a file path (or an SQLite "file:" URI). The file
 *   is validated by reading the schema once, which surfaces corrupt files and
 *   lock contention at open time.
 *
 * Usage:
 * @code
 *   auto engine = SQLiteEngine::open(":memory:");
 *   auto conn = SQLiteConnection::connect(*engine);
 *   // ...
 *   conn.reset();
 *   engine->release();
 * @endcode
 *
 * Thread Safety:
 * - release() and ping() are serialized internally.
 * - Sessions must be closed before release(); the pool guarantees this.
 */
class SQLiteEngine {
public:
    /// Reserved location for a private in-memory database
    static constexpr const char* kMemoryLocation = ":memory:";

    /**
     * @brief Open the engine on a location.
     * @param location File path, "file:" URI or ":memory:".
     * @param config Open options.
     * @param metrics Optional shared counters; a private set is used if null.
     * @return Opened engine.
     * @throws EngineOpenError on bad path, lock contention or corrupt file.
     */
    static std::shared_ptr<SQLiteEngine> open(const std::string& location,
                                              const EngineConfig& config = {},
                                              std::shared_ptr<EngineMetrics> metrics = nullptr);

    /**
     * @brief Destructor - releases the handle if release() was not called.
     */
    ~SQLiteEngine();

    // Non-copyable, non-movable (sessions refer to the engine by address)
    SQLiteEngine(const SQLiteEngine&) = delete;
    SQLiteEngine& operator=(const SQLiteEngine&) = delete;

    /**
     * @brief Close the primary handle.
     *
     * Idempotent: a second call does nothing and is not counted.
     */
    void release();

    /**
     * @brief Check whether release() has run.
     */
    bool isReleased() const;

    /**
     * @brief Run a trivial query on the primary handle.
     * @return true if the engine answers.
     */
    bool ping();

    /**
     * @brief Open a new native session against the same database.
     * @return Session handle owned by the caller (close with sqlite3_close_v2).
     * @throws EngineOpenError if the engine is released or the open fails.
     */
    sqlite3* openSession();

    const std::string& location() const { return m_location; }

    /**
     * @brief URI sessions open to reach this engine's database.
     */
    const std::string& sessionUri() const { return m_uri; }

    bool isMemory() const { return m_memory; }

    const EngineConfig& config() const { return m_config; }

    EngineMetrics& metrics() const { return *m_metrics; }

private:
    SQLiteEngine(std::string location, const EngineConfig& config,
                 std::shared_ptr<EngineMetrics> metrics);

    /// Flags used for the primary handle and every session
    int openFlags() const;

    std::string m_location;                   ///< Location as given by the caller
    std::string m_uri;                        ///< URI opened by sessions
    bool m_memory = false;                    ///< Backed by the memdb VFS
    EngineConfig m_config;                    ///< Open options
    std::shared_ptr<EngineMetrics> m_metrics; ///< Shared counters
    sqlite3* m_db = nullptr;                  ///< Primary handle (owned)
    mutable std::mutex m_mutex;               ///< Serializes release/ping
};

/**
 * @brief Apply per-session settings (busy timeout, foreign keys).
 * @param db Open session or primary handle.
 * @param config Engine options.
 * @return SQLITE_OK or the failing result code.
 */
int applySessionSettings(sqlite3* db, const EngineConfig& config);

}  // namespace sqlkit
