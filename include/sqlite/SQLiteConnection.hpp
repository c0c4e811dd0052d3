#pragma once

/**
 * @file SQLiteConnection.hpp
 * @brief One SQLite session against an engine, with its statement cache.
 *
 * A connection is what the pool hands out: a native session opened on the
 * engine's database plus a private prepared-statement cache. It never owns
 * the engine, except in the standalone form created by open().
 */

#include "ChunkStream.hpp"
#include "QueryOptions.hpp"
#include "SQLiteEngine.hpp"
#include "SQLiteStatement.hpp"
#include "StatementCache.hpp"
#include "Value.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sqlkit {

/**
 * @class SQLiteConnection
 * @brief RAII wrapper for an SQLite session opened on an engine.
 *
 * Execution forms:
 * - execute(): uncached; a script of several statements runs statement by
 *   statement and the last statement's result is returned
 * - executeCached(): through the statement cache, one statement only
 * - executeChunked(): lazy chunked stream over one statement
 *
 * A failing query throws QueryExecutionError and leaves the connection
 * usable.
 *
 * Usage:
 * @code
 *   auto conn = SQLiteConnection::open("app.db");
 *   conn->execute("CREATE TABLE IF NOT EXISTS users (id INTEGER, name TEXT)");
 *   QueryResult r = conn->executeCached("SELECT * FROM users WHERE id = $1", {Value(1)});
 * @endcode
 *
 * Thread Safety:
 * - One thread at a time. The pool guarantees exclusive use per checkout.
 */
class SQLiteConnection {
public:
    /**
     * @brief Open a session on an engine owned elsewhere.
     * @param engine Engine that must outlive the connection.
     * @throws EngineOpenError if the session cannot be opened.
     */
    static std::unique_ptr<SQLiteConnection> connect(SQLiteEngine& engine);

    /**
     * @brief Open a standalone connection that owns its own engine.
     * @param location File path, "file:" URI or ":memory:".
     * @param config Engine options.
     * @param metrics Optional shared counters.
     * @throws EngineOpenError if the engine or session cannot be opened.
     *
     * The engine is released when the connection is destroyed.
     */
    static std::unique_ptr<SQLiteConnection> open(const std::string& location,
                                                  const EngineConfig& config = {},
                                                  std::shared_ptr<EngineMetrics> metrics = nullptr);

    /**
     * @brief Destructor - finalizes cached statements and closes the session.
     */
    ~SQLiteConnection();

    // Non-copyable, non-movable (cached statements belong to this session)
    SQLiteConnection(const SQLiteConnection&) = delete;
    SQLiteConnection& operator=(const SQLiteConnection&) = delete;

    /**
     * @brief Get the underlying sqlite3 session handle.
     */
    sqlite3* get() const { return m_db; }

    SQLiteEngine& engine() const { return *m_engine; }

    /**
     * @brief Execute SQL without the statement cache.
     * @param sql One statement or a script of several.
     * @param params Parameters bound to each statement that declares any.
     * @return Columns and rows of the last statement.
     * @throws QueryExecutionError on prepare, bind or step failure.
     */
    QueryResult execute(const std::string& sql, const std::vector<Value>& params = {});

    /**
     * @brief Execute a single statement through the statement cache.
     * @throws QueryExecutionError on failure or if sql holds several statements.
     */
    QueryResult executeCached(const std::string& sql, const std::vector<Value>& params = {});

    /**
     * @brief Start chunked execution of a single statement.
     * @return Stream yielding up to chunkSize rows per chunk.
     * @throws QueryExecutionError if preparation or binding fails.
     */
    ChunkStream executeChunked(const std::string& sql, const std::vector<Value>& params = {},
                               size_t chunkSize = kDefaultChunkSize);

    /**
     * @brief Prepare exactly one statement.
     * @throws QueryExecutionError on failure or if sql holds several statements.
     */
    SQLiteStatement prepare(const std::string& sql);

    StatementCache& statementCache() { return m_cache; }

    /**
     * @brief Number of statements this connection has prepared.
     */
    uint64_t prepareCount() const { return m_prepareCount; }

    int64_t lastInsertRowId() const;

    int changes() const;

private:
    SQLiteConnection(SQLiteEngine& engine, sqlite3* db);

    /**
     * @brief Prepare the first statement of sql.
     * @param tail Receives the unparsed remainder.
     * @return Statement, possibly empty for whitespace or comments.
     */
    SQLiteStatement prepareFirst(const std::string& sql, const char* begin, const char* end,
                                 const char** tail);

    QueryResult run(SQLiteStatement& stmt);

    std::shared_ptr<SQLiteEngine> m_ownedEngine;  ///< Standalone form only; destroyed last
    SQLiteEngine* m_engine;                       ///< Engine the session belongs to
    sqlite3* m_db = nullptr;                      ///< Session handle (owned)
    StatementCache m_cache;                       ///< Finalized before the session closes
    uint64_t m_prepareCount = 0;
};

}  // namespace sqlkit
