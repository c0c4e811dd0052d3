#pragma once

/**
 * @file PostgreSQLConnection.hpp
 * @brief Owned libpq session plus the parameter text encoding it uses.
 *
 * A PostgreSQLConnection closes its PGconn when destroyed. The pool keeps
 * idle connections and hands them out wrapped in a PostgreSQLLease.
 */

#include "PostgreSQLResultSet.hpp"
#include "Value.hpp"
#include <libpq-fe.h>
#include <memory>
#include <string>
#include <vector>

namespace sqlkit {

/**
 * @class PostgreSQLConnection
 * @brief One libpq session.
 *
 * libpq calls used:
 * - PQconnectdb() with a conninfo string built from ServerConfig
 * - PQexec() for parameterless SQL, which may hold several statements;
 *   the result of the last one is returned
 * - PQexecParams() for $N parameters, every Value sent in text format
 *
 * Thread Safety:
 * - Not thread-safe; a connection is used by one lease holder at a time.
 */
class PostgreSQLConnection {
public:
    /**
     * @brief Open a session.
     * @param conninfo libpq connection string.
     * @throws EngineOpenError if the server cannot be reached or rejects the login.
     */
    static std::unique_ptr<PostgreSQLConnection> connect(const std::string& conninfo);

    explicit PostgreSQLConnection(PGconn* conn);

    /**
     * @brief Destructor - closes the session.
     */
    ~PostgreSQLConnection();

    // Non-copyable, non-movable (pooled by pointer)
    PostgreSQLConnection(const PostgreSQLConnection&) = delete;
    PostgreSQLConnection& operator=(const PostgreSQLConnection&) = delete;

    PGconn* get() const { return m_conn; }

    /**
     * @brief True while libpq reports CONNECTION_OK.
     */
    bool isOpen() const;

    /**
     * @brief Round-trip a trivial query.
     */
    bool ping();

    /**
     * @brief Run SQL and return its result.
     * @param params Sent with PQexecParams when not empty.
     * @throws QueryExecutionError if the server reports an error or a
     *         parameter has no text encoding.
     */
    PostgreSQLResultSet run(const std::string& sql, const std::vector<Value>& params);

    /**
     * @brief Last session-level error message, without the trailing newline.
     */
    std::string lastError() const;

private:
    PGconn* m_conn;  ///< Session handle (owned)
};

/**
 * @brief Text encoding of a parameter as PostgreSQL expects it.
 * @return Encoded text; the Value must not be null.
 * @throws QueryExecutionError for lists, tuples and structs.
 */
std::string encodeTextParam(const std::string& sql, const Value& value);

}  // namespace sqlkit
