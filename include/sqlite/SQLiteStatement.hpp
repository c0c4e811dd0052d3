#pragma once

/**
 * @file SQLiteStatement.hpp
 * @brief RAII wrapper for SQLite prepared statements.
 *
 * Handles automatic cleanup of sqlite3_stmt resources, parameter binding
 * from Value lists and decoding of column values into Values.
 */

#include "Value.hpp"
#include <sqlite3.h>
#include <string>
#include <vector>

namespace sqlkit {

/**
 * @class SQLiteStatement
 * @brief RAII wrapper for an SQLite prepared statement.
 *
 * SQLite uses step() to both execute and fetch rows. Each call to step()
 * advances to the next row (or completes the statement for DML).
 *
 * Parameter binding:
 * - "$N" and "?N" placeholders bind params[N-1]
 * - anonymous "?" and other named placeholders bind in order of appearance
 * - the number of params must match the highest index used
 * - a WideInt outside the int64 range binds as its decimal TEXT, so SQL
 *   compares it as a string rather than a number
 * - an empty Blob binds a zero-length blob, not NULL
 *
 * Usage:
 * @code
 *   SQLiteStatement stmt = conn.prepare("SELECT id, name FROM users WHERE age > $1");
 *   stmt.bind({Value(26)});
 *   while (stmt.step()) {
 *       Row row = stmt.readRow();
 *   }
 * @endcode
 *
 * Thread Safety:
 * - Not thread-safe; a statement belongs to the connection that prepared it.
 */
class SQLiteStatement {
public:
    /**
     * @brief Construct a statement wrapper.
     * @param stmt sqlite3_stmt handle to manage (takes ownership), or nullptr.
     */
    explicit SQLiteStatement(sqlite3_stmt* stmt = nullptr);

    /**
     * @brief Destructor - finalizes the statement if still owned.
     */
    ~SQLiteStatement();

    // Non-copyable
    SQLiteStatement(const SQLiteStatement&) = delete;
    SQLiteStatement& operator=(const SQLiteStatement&) = delete;

    // Movable
    SQLiteStatement(SQLiteStatement&& other) noexcept;
    SQLiteStatement& operator=(SQLiteStatement&& other) noexcept;

    /**
     * @brief Get the underlying sqlite3_stmt handle.
     * @return Raw sqlite3_stmt* pointer (still owned by this object).
     */
    sqlite3_stmt* get() const { return m_stmt; }

    /**
     * @brief Boolean conversion - true if statement is valid.
     */
    explicit operator bool() const { return m_stmt != nullptr; }

    /**
     * @brief SQL text the statement was prepared from.
     */
    std::string sql() const;

    /**
     * @brief Bind parameters, replacing any previous bindings.
     * @param params Ordered parameter values.
     * @throws QueryExecutionError on a count mismatch or unbindable value.
     */
    void bind(const std::vector<Value>& params);

    /**
     * @brief Step to the next row.
     * @return true if a row is available, false when the statement is done.
     * @throws QueryExecutionError if SQLite reports an error.
     */
    bool step();

    /**
     * @brief Get the number of columns in the result.
     */
    int columnCount() const;

    /**
     * @brief Get a column name by index.
     * @param index Zero-based column index.
     */
    std::string columnName(int index) const;

    /**
     * @brief Get all column names in result order.
     */
    std::vector<std::string> columnNames() const;

    /**
     * @brief Decode a column of the current row.
     * @param index Zero-based column index.
     *
     * INTEGER columns declared BOOLEAN/BOOL decode as bool.
     */
    Value columnValue(int index) const;

    /**
     * @brief Decode every column of the current row.
     */
    Row readRow() const;

    /**
     * @brief Reset the statement for re-execution and clear its bindings.
     */
    void reset();

    /**
     * @brief Finalize the statement and release resources.
     *
     * After calling finalize(), the statement cannot be used.
     * This is called automatically by the destructor.
     */
    void finalize();

private:
    sqlite3_stmt* m_stmt;  ///< SQLite prepared statement handle (owned)
};

}  // namespace sqlkit
