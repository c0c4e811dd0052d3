#pragma once

/**
 * @file Backend.hpp
 * @brief Routes queries to a standalone connection, a pool or a SQL server.
 *
 * Every retrieval function has a throwing form and a try-form that returns
 * the same Error inside a Result instead.
 *
 * Usage:
 * @code
 *   PoolHandle pool = PoolHandle::start("app", "app.db");
 *   QueryOptions opts;
 *   opts.materialize.knownColumns = {"id", "name"};
 *   std::vector<Record> users = queryAll(pool, "SELECT id, name FROM users", {}, opts);
 *
 *   Result<Record> one = tryQueryOne(pool, "SELECT id, name FROM users WHERE id = $1",
 *                                    {Value(7)}, opts);
 * @endcode
 */

#include "Errors.hpp"
#include "Pool.hpp"
#include "QueryOptions.hpp"
#include "Record.hpp"
#include "SQLiteConnection.hpp"
#include "ServerBackend.hpp"
#include "Value.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sqlkit {

/**
 * @class BackendRef
 * @brief Non-owning reference to one of the three query targets.
 *
 * The referenced connection or server must outlive the BackendRef; a pool is
 * held through its (shared) handle.
 */
class BackendRef {
public:
    BackendRef(SQLiteConnection& conn) : m_target(&conn) {}
    BackendRef(const PoolHandle& pool) : m_target(pool) {}
    BackendRef(ServerBackend& server) : m_target(&server) {}

    /**
     * @brief Short description for logs ("pool app", "server postgresql://...").
     */
    std::string describe() const;

    const std::variant<SQLiteConnection*, PoolHandle, ServerBackend*>& target() const {
        return m_target;
    }

private:
    std::variant<SQLiteConnection*, PoolHandle, ServerBackend*> m_target;
};

/**
 * @brief Label used in one-row retrieval errors.
 * @return opts.label if set, otherwise sql cut to 49 characters plus "..."
 *         when it is longer than 50 characters.
 */
std::string queryLabel(const std::string& sql, const QueryOptions& opts = {});

/**
 * @brief Run a query on any backend and return its columns and rows.
 * @throws QueryExecutionError, CheckoutTimeoutError, PoolClosedError,
 *         UnsupportedResultError
 */
QueryResult execute(const BackendRef& backend, const std::string& sql,
                    const std::vector<Value>& params = {}, const QueryOptions& opts = {});

/**
 * @brief All rows as generic records, columns checked against opts.materialize.
 * @throws UnknownColumnNameError plus everything execute() throws.
 */
std::vector<Record> queryAll(const BackendRef& backend, const std::string& sql,
                             const std::vector<Value>& params = {}, const QueryOptions& opts = {});

/**
 * @brief Exactly one row.
 * @throws NoResultsError, MultipleResultsError plus everything queryAll() throws.
 */
Record queryOne(const BackendRef& backend, const std::string& sql,
                const std::vector<Value>& params = {}, const QueryOptions& opts = {});

/**
 * @brief At most one row; empty when the query returns none.
 * @throws MultipleResultsError plus everything queryAll() throws.
 */
std::optional<Record> queryOneOrNone(const BackendRef& backend, const std::string& sql,
                                     const std::vector<Value>& params = {},
                                     const QueryOptions& opts = {});

// ----- Typed retrieval -----

template <typename T>
std::vector<T> queryAllAs(const BackendRef& backend, const RecordType<T>& type,
                          const std::string& sql, const std::vector<Value>& params = {},
                          const QueryOptions& opts = {}) {
    return materialize(execute(backend, sql, params, opts), type);
}

template <typename T>
std::optional<T> queryOneOrNoneAs(const BackendRef& backend, const RecordType<T>& type,
                                  const std::string& sql, const std::vector<Value>& params = {},
                                  const QueryOptions& opts = {}) {
    std::vector<T> records = queryAllAs(backend, type, sql, params, opts);
    if (records.size() > 1) {
        throw MultipleResultsError(queryLabel(sql, opts), records.size());
    }
    if (records.empty()) return std::nullopt;
    return std::move(records.front());
}

template <typename T>
T queryOneAs(const BackendRef& backend, const RecordType<T>& type, const std::string& sql,
             const std::vector<Value>& params = {}, const QueryOptions& opts = {}) {
    std::optional<T> record = queryOneOrNoneAs(backend, type, sql, params, opts);
    if (!record) {
        throw NoResultsError(queryLabel(sql, opts));
    }
    return std::move(*record);
}

// ----- Result-returning forms -----

Result<QueryResult> tryExecute(const BackendRef& backend, const std::string& sql,
                               const std::vector<Value>& params = {},
                               const QueryOptions& opts = {});

Result<std::vector<Record>> tryQueryAll(const BackendRef& backend, const std::string& sql,
                                        const std::vector<Value>& params = {},
                                        const QueryOptions& opts = {});

Result<Record> tryQueryOne(const BackendRef& backend, const std::string& sql,
                           const std::vector<Value>& params = {}, const QueryOptions& opts = {});

Result<std::optional<Record>> tryQueryOneOrNone(const BackendRef& backend, const std::string& sql,
                                                const std::vector<Value>& params = {},
                                                const QueryOptions& opts = {});

template <typename T>
Result<std::vector<T>> tryQueryAllAs(const BackendRef& backend, const RecordType<T>& type,
                                     const std::string& sql,
                                     const std::vector<Value>& params = {},
                                     const QueryOptions& opts = {}) {
    return capture([&] { return queryAllAs(backend, type, sql, params, opts); });
}

template <typename T>
Result<T> tryQueryOneAs(const BackendRef& backend, const RecordType<T>& type,
                        const std::string& sql, const std::vector<Value>& params = {},
                        const QueryOptions& opts = {}) {
    return capture([&] { return queryOneAs(backend, type, sql, params, opts); });
}

template <typename T>
Result<std::optional<T>> tryQueryOneOrNoneAs(const BackendRef& backend,
                                             const RecordType<T>& type, const std::string& sql,
                                             const std::vector<Value>& params = {},
                                             const QueryOptions& opts = {}) {
    return capture([&] { return queryOneOrNoneAs(backend, type, sql, params, opts); });
}

}  // namespace sqlkit
