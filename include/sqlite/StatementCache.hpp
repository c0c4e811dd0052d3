#pragma once

/**
 * @file StatementCache.hpp
 * @brief Per-connection cache of prepared SQLite statements.
 */

#include "SQLiteStatement.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>

namespace sqlkit {

class SQLiteConnection;

/**
 * @class StatementCache
 * @brief Maps verbatim SQL text to a statement prepared on one connection.
 *
 * The cache is unbounded and never evicts; it dies with its connection.
 * Keys are compared byte for byte, so "SELECT 1" and "select 1" are two
 * entries.
 *
 * Thread Safety:
 * - Not thread-safe. Only the operation holding the connection's checkout
 *   touches the cache.
 */
class StatementCache {
public:
    StatementCache() = default;

    // Non-copyable (statements are bound to one session)
    StatementCache(const StatementCache&) = delete;
    StatementCache& operator=(const StatementCache&) = delete;

    /**
     * @brief Return the cached statement for sql, preparing it on a miss.
     * @param connection Connection whose session prepares the statement.
     * @param sql Verbatim SQL text (a single statement).
     * @return Statement with cleared bindings, owned by the cache.
     * @throws QueryExecutionError if preparation fails or sql holds more
     *         than one statement.
     */
    SQLiteStatement& lookupOrPrepare(SQLiteConnection& connection, const std::string& sql);

    bool contains(const std::string& sql) const;

    size_t size() const { return m_statements.size(); }

    /**
     * @brief Finalize every cached statement.
     */
    void clear();

private:
    std::unordered_map<std::string, std::unique_ptr<SQLiteStatement>> m_statements;
};

}  // namespace sqlkit
