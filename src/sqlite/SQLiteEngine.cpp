/**
 * @file SQLiteEngine.cpp
 * @brief Implementation of the SQLite engine handle.
 *
 * Opens the primary sqlite3 handle, validates the database file and hands
 * out sessions on the same database. In-memory locations are mapped to a
 * named memdb database so that every session of a pool shares one copy.
 */

#include "SQLiteEngine.hpp"
#include "Errors.hpp"
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>

namespace sqlkit {

namespace {

std::atomic<uint64_t> s_memoryCounter{0};

std::string memoryUri() {
    return "file:/sqlkit-mem-" + std::to_string(::getpid()) + "-" +
           std::to_string(++s_memoryCounter) + "?vfs=memdb";
}

bool isValidJournalMode(std::string mode) {
    std::transform(mode.begin(), mode.end(), mode.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return mode == "DELETE" || mode == "TRUNCATE" || mode == "PERSIST" ||
           mode == "MEMORY" || mode == "WAL" || mode == "OFF";
}

std::string lastError(sqlite3* db, int rc) {
    return db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
}

}  // namespace

int applySessionSettings(sqlite3* db, const EngineConfig& config) {
    int rc = sqlite3_busy_timeout(db, static_cast<int>(config.busyTimeout.count()));
    if (rc == SQLITE_OK && config.foreignKeys) {
        rc = sqlite3_exec(db, "PRAGMA foreign_keys = ON", nullptr, nullptr, nullptr);
    }
    return rc;
}

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteEngine::SQLiteEngine(std::string location, const EngineConfig& config,
                           std::shared_ptr<EngineMetrics> metrics)
    : m_location(std::move(location)), m_config(config), m_metrics(std::move(metrics)) {
    m_memory = (m_location == kMemoryLocation);
    m_uri = m_memory ? memoryUri() : m_location;
}

SQLiteEngine::~SQLiteEngine() {
    release();
}

std::shared_ptr<SQLiteEngine> SQLiteEngine::open(const std::string& location,
                                                 const EngineConfig& config,
                                                 std::shared_ptr<EngineMetrics> metrics) {
    if (location.empty()) {
        throw EngineOpenError(location, "database location is empty");
    }
    if (!config.journalMode.empty() && !isValidJournalMode(config.journalMode)) {
        throw EngineOpenError(location, "invalid journal mode '" + config.journalMode + "'");
    }
    if (!metrics) {
        metrics = std::make_shared<EngineMetrics>();
    }

    std::shared_ptr<SQLiteEngine> engine(new SQLiteEngine(location, config, std::move(metrics)));

    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(engine->m_uri.c_str(), &db, engine->openFlags(), nullptr);
    if (rc == SQLITE_OK) {
        rc = applySessionSettings(db, config);
    }

    // Reading the schema forces SQLite to touch the file, which reports
    // SQLITE_NOTADB for corrupt files and SQLITE_BUSY under lock contention.
    if (rc == SQLITE_OK) {
        rc = sqlite3_exec(db, "SELECT count(*) FROM sqlite_master", nullptr, nullptr, nullptr);
    }

    if (rc == SQLITE_OK && !engine->m_memory && !config.readOnly && !config.journalMode.empty()) {
        std::string pragma = "PRAGMA journal_mode = " + config.journalMode;
        rc = sqlite3_exec(db, pragma.c_str(), nullptr, nullptr, nullptr);
    }

    if (rc != SQLITE_OK) {
        std::string cause = lastError(db, rc);
        sqlite3_close_v2(db);
        spdlog::error("Failed to open SQLite database '{}': {}", location, cause);
        throw EngineOpenError(location, cause);
    }

    engine->m_db = db;
    engine->m_metrics->opens++;
    spdlog::info("Opened SQLite database '{}'", location);
    return engine;
}

// ============================================================================
// Handle Management
// ============================================================================

int SQLiteEngine::openFlags() const {
    int flags = SQLITE_OPEN_URI | SQLITE_OPEN_FULLMUTEX;
    if (m_config.readOnly && !m_memory) {
        flags |= SQLITE_OPEN_READONLY;
    } else {
        flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    }
    return flags;
}

void SQLiteEngine::release() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_db) return;

    sqlite3_close_v2(m_db);
    m_db = nullptr;
    m_metrics->releases++;
    spdlog::info("Released SQLite database '{}'", m_location);
}

bool SQLiteEngine::isReleased() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_db == nullptr;
}

bool SQLiteEngine::ping() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_db) return false;
    return sqlite3_exec(m_db, "SELECT 1", nullptr, nullptr, nullptr) == SQLITE_OK;
}

sqlite3* SQLiteEngine::openSession() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_db) {
        throw EngineOpenError(m_location, "engine has been released");
    }

    sqlite3* session = nullptr;
    int rc = sqlite3_open_v2(m_uri.c_str(), &session, openFlags(), nullptr);
    if (rc == SQLITE_OK) {
        rc = applySessionSettings(session, m_config);
    }
    if (rc != SQLITE_OK) {
        std::string cause = lastError(session, rc);
        sqlite3_close_v2(session);
        throw EngineOpenError(m_location, cause);
    }

    m_metrics->connects++;
    return session;
}

}  // namespace sqlkit
