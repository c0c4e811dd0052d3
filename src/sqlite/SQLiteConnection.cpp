/**
 * @file SQLiteConnection.cpp
 * @brief Implementation of the SQLite session wrapper.
 *
 * Implements the SQLiteConnection class which owns one session on an engine,
 * runs cached, uncached and chunked queries, and finalizes its statement
 * cache before the session is closed.
 */

#include "SQLiteConnection.hpp"
#include "Errors.hpp"
#include <spdlog/spdlog.h>

namespace sqlkit {

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteConnection::SQLiteConnection(SQLiteEngine& engine, sqlite3* db)
    : m_engine(&engine), m_db(db) {
}

SQLiteConnection::~SQLiteConnection() {
    // Statements must be finalized before their session goes away
    m_cache.clear();
    if (m_db) {
        sqlite3_close_v2(m_db);
        m_db = nullptr;
        m_engine->metrics().disconnects++;
        spdlog::debug("Closed SQLite session on '{}'", m_engine->location());
    }
}

std::unique_ptr<SQLiteConnection> SQLiteConnection::connect(SQLiteEngine& engine) {
    sqlite3* db = engine.openSession();
    spdlog::debug("Opened SQLite session on '{}'", engine.location());
    return std::unique_ptr<SQLiteConnection>(new SQLiteConnection(engine, db));
}

std::unique_ptr<SQLiteConnection> SQLiteConnection::open(const std::string& location,
                                                         const EngineConfig& config,
                                                         std::shared_ptr<EngineMetrics> metrics) {
    std::shared_ptr<SQLiteEngine> engine = SQLiteEngine::open(location, config, std::move(metrics));
    std::unique_ptr<SQLiteConnection> conn = connect(*engine);
    conn->m_ownedEngine = std::move(engine);
    return conn;
}

// ============================================================================
// Statement Preparation
// ============================================================================

SQLiteStatement SQLiteConnection::prepareFirst(const std::string& sql, const char* begin,
                                               const char* end, const char** tail) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(m_db, begin, static_cast<int>(end - begin), &stmt, tail);
    if (rc != SQLITE_OK) {
        throw QueryExecutionError(sql, sqlite3_errmsg(m_db));
    }
    if (stmt) {
        ++m_prepareCount;
        m_engine->metrics().prepares++;
    }
    return SQLiteStatement(stmt);
}

SQLiteStatement SQLiteConnection::prepare(const std::string& sql) {
    const char* begin = sql.c_str();
    const char* end = begin + sql.size();
    const char* tail = end;

    SQLiteStatement stmt = prepareFirst(sql, begin, end, &tail);
    if (!stmt) {
        throw QueryExecutionError(sql, "no SQL statement to prepare");
    }

    // Anything after the first statement must be whitespace or comments
    const char* rest = tail;
    while (rest && rest < end) {
        sqlite3_stmt* extra = nullptr;
        const char* next = nullptr;
        int rc = sqlite3_prepare_v2(m_db, rest, static_cast<int>(end - rest), &extra, &next);
        if (extra) {
            sqlite3_finalize(extra);
        }
        if (rc != SQLITE_OK || extra) {
            throw QueryExecutionError(sql, "SQL contains more than one statement");
        }
        if (next == rest) break;
        rest = next;
    }

    return stmt;
}

// ============================================================================
// Query Execution
// ============================================================================

QueryResult SQLiteConnection::run(SQLiteStatement& stmt) {
    QueryResult result;
    result.columns = stmt.columnNames();
    while (stmt.step()) {
        result.rows.push_back(stmt.readRow());
    }
    normalizeWideIntegers(result.rows);
    return result;
}

QueryResult SQLiteConnection::execute(const std::string& sql, const std::vector<Value>& params) {
    const char* begin = sql.c_str();
    const char* end = begin + sql.size();

    QueryResult result;
    bool paramsUsed = false;

    while (begin < end) {
        const char* tail = end;
        SQLiteStatement stmt = prepareFirst(sql, begin, end, &tail);
        if (!tail || tail == begin) break;
        begin = tail;

        if (!stmt) continue;  // trailing whitespace or comment

        if (sqlite3_bind_parameter_count(stmt.get()) > 0) {
            stmt.bind(params);
            paramsUsed = true;
        }
        result = run(stmt);
    }

    if (!params.empty() && !paramsUsed) {
        throw QueryExecutionError(sql, "expected 0 parameters but got " +
                                           std::to_string(params.size()));
    }

    return result;
}

QueryResult SQLiteConnection::executeCached(const std::string& sql,
                                            const std::vector<Value>& params) {
    SQLiteStatement& stmt = m_cache.lookupOrPrepare(*this, sql);
    try {
        stmt.bind(params);
        QueryResult result = run(stmt);
        stmt.reset();
        return result;
    } catch (const std::exception&) {
        // Leave the cached statement ready for the next caller
        stmt.reset();
        throw;
    }
}

ChunkStream SQLiteConnection::executeChunked(const std::string& sql,
                                             const std::vector<Value>& params,
                                             size_t chunkSize) {
    SQLiteStatement stmt = prepare(sql);
    stmt.bind(params);
    return ChunkStream(std::move(stmt), chunkSize);
}

// ============================================================================
// Status Information
// ============================================================================

int64_t SQLiteConnection::lastInsertRowId() const {
    return m_db ? sqlite3_last_insert_rowid(m_db) : 0;
}

int SQLiteConnection::changes() const {
    return m_db ? sqlite3_changes(m_db) : 0;
}

}  // namespace sqlkit
