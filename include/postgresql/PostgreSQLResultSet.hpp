#pragma once

/**
 * @file PostgreSQLResultSet.hpp
 * @brief Owned PGresult exposed as a ServerResult.
 */

#include "ServerBackend.hpp"
#include "Value.hpp"
#include <libpq-fe.h>
#include <optional>
#include <string>
#include <vector>

namespace sqlkit {

/**
 * @class PostgreSQLResultSet
 * @brief Decodes a fully buffered PGresult into Values.
 *
 * Extractable shapes:
 * - PGRES_TUPLES_OK, PGRES_SINGLE_TUPLE: columns and rows
 * - PGRES_COMMAND_OK: no columns and no rows
 *
 * Any other status (COPY, pipeline, empty query) yields no columnsAndRows(),
 * which the dispatcher reports as UnsupportedResultError.
 *
 * Cells are text-format and decoded by column type OID:
 * - int2, int4, int8, oid: integer
 * - float4, float8: double
 * - bool: boolean
 * - bytea: Blob
 * - everything else, numeric included: text
 */
class PostgreSQLResultSet : public ServerResult {
public:
    /**
     * @param res Result to own, or nullptr.
     */
    explicit PostgreSQLResultSet(PGresult* res = nullptr);

    ~PostgreSQLResultSet() override;

    PostgreSQLResultSet(const PostgreSQLResultSet&) = delete;
    PostgreSQLResultSet& operator=(const PostgreSQLResultSet&) = delete;

    PostgreSQLResultSet(PostgreSQLResultSet&& other) noexcept;
    PostgreSQLResultSet& operator=(PostgreSQLResultSet&& other) noexcept;

    PGresult* get() const { return m_res; }

    /**
     * @brief Result status; PGRES_FATAL_ERROR when empty.
     */
    ExecStatusType status() const;

    /**
     * @brief Status name such as "PGRES_TUPLES_OK".
     */
    const char* statusMessage() const;

    const char* errorMessage() const;

    int numFields() const;
    int numRows() const;

    bool isNull(int row, int col) const;

    /**
     * @brief Decode one cell.
     * @return NULL cells and out-of-range positions decode to a null Value.
     */
    Value valueAt(int row, int col) const;

    const char* fieldName(int col) const;
    Oid fieldType(int col) const;
    std::vector<std::string> columnNames() const;

    // ----- ServerResult interface implementation -----

    std::string shape() const override;

    std::optional<QueryResult> columnsAndRows() const override;

private:
    bool inRange(int row, int col) const;

    PGresult* m_res;  ///< Owned result handle
};

}  // namespace sqlkit
