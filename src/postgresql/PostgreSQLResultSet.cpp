#include "PostgreSQLResultSet.hpp"
#include <cstdlib>
#include <utility>

namespace sqlkit {

namespace {

// Built-in type OIDs (catalog/pg_type.h is a server header)
constexpr Oid kBoolOid = 16;
constexpr Oid kByteaOid = 17;
constexpr Oid kInt8Oid = 20;
constexpr Oid kInt2Oid = 21;
constexpr Oid kInt4Oid = 23;
constexpr Oid kOidOid = 26;
constexpr Oid kFloat4Oid = 700;
constexpr Oid kFloat8Oid = 701;

Value decodeBytea(const char* text) {
    size_t length = 0;
    unsigned char* bytes = PQunescapeBytea(reinterpret_cast<const unsigned char*>(text), &length);
    if (!bytes) {
        return Value(std::string(text));
    }
    Blob blob(bytes, bytes + length);
    PQfreemem(bytes);
    return Value(std::move(blob));
}

}  // namespace

PostgreSQLResultSet::PostgreSQLResultSet(PGresult* res) : m_res(res) {}

PostgreSQLResultSet::~PostgreSQLResultSet() {
    if (m_res) PQclear(m_res);
}

PostgreSQLResultSet::PostgreSQLResultSet(PostgreSQLResultSet&& other) noexcept
    : m_res(std::exchange(other.m_res, nullptr)) {
}

PostgreSQLResultSet& PostgreSQLResultSet::operator=(PostgreSQLResultSet&& other) noexcept {
    if (this != &other) {
        if (m_res) PQclear(m_res);
        m_res = std::exchange(other.m_res, nullptr);
    }
    return *this;
}

// ============================================================================
// Status
// ============================================================================

ExecStatusType PostgreSQLResultSet::status() const {
    return m_res ? PQresultStatus(m_res) : PGRES_FATAL_ERROR;
}

const char* PostgreSQLResultSet::statusMessage() const {
    return PQresStatus(status());
}

const char* PostgreSQLResultSet::errorMessage() const {
    return m_res ? PQresultErrorMessage(m_res) : "no result";
}

std::string PostgreSQLResultSet::shape() const {
    return statusMessage();
}

// ============================================================================
// Cell Access
// ============================================================================

int PostgreSQLResultSet::numFields() const {
    return m_res ? PQnfields(m_res) : 0;
}

int PostgreSQLResultSet::numRows() const {
    return m_res ? PQntuples(m_res) : 0;
}

bool PostgreSQLResultSet::inRange(int row, int col) const {
    return row >= 0 && row < numRows() && col >= 0 && col < numFields();
}

bool PostgreSQLResultSet::isNull(int row, int col) const {
    return !inRange(row, col) || PQgetisnull(m_res, row, col) != 0;
}

Value PostgreSQLResultSet::valueAt(int row, int col) const {
    if (isNull(row, col)) return Value();

    const char* text = PQgetvalue(m_res, row, col);
    switch (PQftype(m_res, col)) {
        case kBoolOid:
            return Value(text[0] == 't');
        case kInt2Oid:
        case kInt4Oid:
        case kInt8Oid:
        case kOidOid:
            return Value(static_cast<int64_t>(std::strtoll(text, nullptr, 10)));
        case kFloat4Oid:
        case kFloat8Oid:
            return Value(std::strtod(text, nullptr));
        case kByteaOid:
            return decodeBytea(text);
        default:
            return Value(std::string(text, static_cast<size_t>(PQgetlength(m_res, row, col))));
    }
}

const char* PostgreSQLResultSet::fieldName(int col) const {
    if (!m_res || col < 0 || col >= numFields()) return nullptr;
    return PQfname(m_res, col);
}

Oid PostgreSQLResultSet::fieldType(int col) const {
    if (!m_res || col < 0 || col >= numFields()) return InvalidOid;
    return PQftype(m_res, col);
}

std::vector<std::string> PostgreSQLResultSet::columnNames() const {
    std::vector<std::string> names;
    int count = numFields();
    names.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        names.emplace_back(PQfname(m_res, i));
    }
    return names;
}

// ============================================================================
// Extraction
// ============================================================================

std::optional<QueryResult> PostgreSQLResultSet::columnsAndRows() const {
    ExecStatusType st = status();
    if (st == PGRES_COMMAND_OK) {
        return QueryResult{};
    }
    if (st != PGRES_TUPLES_OK && st != PGRES_SINGLE_TUPLE) {
        return std::nullopt;
    }

    QueryResult result;
    result.columns = columnNames();

    int rows = numRows();
    int fields = numFields();
    result.rows.reserve(static_cast<size_t>(rows));
    for (int r = 0; r < rows; ++r) {
        Row row;
        row.reserve(static_cast<size_t>(fields));
        for (int c = 0; c < fields; ++c) {
            row.push_back(valueAt(r, c));
        }
        result.rows.push_back(std::move(row));
    }
    return result;
}

}  // namespace sqlkit
