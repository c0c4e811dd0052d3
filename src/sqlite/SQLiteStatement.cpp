/**
 * @file SQLiteStatement.cpp
 * @brief Implementation of RAII SQLite prepared statement wrapper.
 *
 * Implements the SQLiteStatement class which wraps sqlite3_stmt handles with
 * automatic finalization, Value parameter binding and column decoding.
 */

#include "SQLiteStatement.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <strings.h>

namespace sqlkit {

namespace {

bool isAllDigits(const char* text) {
    if (!text || !*text) return false;
    for (const char* p = text; *p; ++p) {
        if (!std::isdigit(static_cast<unsigned char>(*p))) return false;
    }
    return true;
}

// Binds a single value; returns the SQLite result code
struct BindVisitor {
    sqlite3_stmt* stmt;
    int slot;

    int operator()(const std::monostate&) const { return sqlite3_bind_null(stmt, slot); }
    int operator()(bool v) const { return sqlite3_bind_int(stmt, slot, v ? 1 : 0); }
    int operator()(int64_t v) const { return sqlite3_bind_int64(stmt, slot, v); }

    int operator()(WideInt v) const {
        if (fitsInInt64(v)) {
            return sqlite3_bind_int64(stmt, slot, static_cast<int64_t>(v));
        }
        std::string text = wideIntToString(v);
        return sqlite3_bind_text(stmt, slot, text.c_str(), static_cast<int>(text.size()),
                                 SQLITE_TRANSIENT);
    }

    int operator()(double v) const { return sqlite3_bind_double(stmt, slot, v); }

    int operator()(const std::string& v) const {
        return sqlite3_bind_text(stmt, slot, v.c_str(), static_cast<int>(v.size()),
                                 SQLITE_TRANSIENT);
    }

    int operator()(const Blob& v) const {
        // A null data pointer would bind SQL NULL
        if (v.empty()) {
            return sqlite3_bind_zeroblob(stmt, slot, 0);
        }
        return sqlite3_bind_blob(stmt, slot, v.data(), static_cast<int>(v.size()),
                                 SQLITE_TRANSIENT);
    }

    int operator()(const ValueList&) const { return SQLITE_MISMATCH; }
    int operator()(const ValueTuple&) const { return SQLITE_MISMATCH; }
    int operator()(const ValueStruct&) const { return SQLITE_MISMATCH; }
};

}  // namespace

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteStatement::SQLiteStatement(sqlite3_stmt* stmt) : m_stmt(stmt) {}

SQLiteStatement::~SQLiteStatement() {
    finalize();
}

// ============================================================================
// Move Operations
// ============================================================================

SQLiteStatement::SQLiteStatement(SQLiteStatement&& other) noexcept
    : m_stmt(other.m_stmt) {
    other.m_stmt = nullptr;
}

SQLiteStatement& SQLiteStatement::operator=(SQLiteStatement&& other) noexcept {
    if (this != &other) {
        finalize();
        m_stmt = other.m_stmt;
        other.m_stmt = nullptr;
    }
    return *this;
}

std::string SQLiteStatement::sql() const {
    if (!m_stmt) return "";
    const char* text = sqlite3_sql(m_stmt);
    return text ? text : "";
}

// ============================================================================
// Parameter Binding
// ============================================================================

void SQLiteStatement::bind(const std::vector<Value>& params) {
    if (!m_stmt) return;

    sqlite3_clear_bindings(m_stmt);

    int slots = sqlite3_bind_parameter_count(m_stmt);
    std::vector<size_t> targets(static_cast<size_t>(slots));
    size_t positional = 0;
    size_t required = 0;

    for (int slot = 1; slot <= slots; ++slot) {
        const char* name = sqlite3_bind_parameter_name(m_stmt, slot);
        size_t index;
        if (name && (name[0] == '$' || name[0] == '?') && isAllDigits(name + 1)) {
            index = std::strtoul(name + 1, nullptr, 10);
            if (index == 0) {
                throw QueryExecutionError(sql(), std::string("invalid parameter ") + name);
            }
        } else {
            index = ++positional;
        }
        targets[static_cast<size_t>(slot - 1)] = index;
        required = std::max(required, index);
    }

    if (params.size() != required) {
        throw QueryExecutionError(sql(), "expected " + std::to_string(required) +
                                             " parameters but got " +
                                             std::to_string(params.size()));
    }

    for (int slot = 1; slot <= slots; ++slot) {
        const Value& value = params[targets[static_cast<size_t>(slot - 1)] - 1];
        int rc = std::visit(BindVisitor{m_stmt, slot}, value.storage());
        if (rc == SQLITE_MISMATCH) {
            throw QueryExecutionError(sql(), std::string("cannot bind a ") + value.typeName() +
                                                 " parameter");
        }
        if (rc != SQLITE_OK) {
            throw QueryExecutionError(sql(), sqlite3_errstr(rc));
        }
    }
}

// ============================================================================
// Row Iteration
// ============================================================================

bool SQLiteStatement::step() {
    if (!m_stmt) return false;

    int rc = sqlite3_step(m_stmt);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;

    throw QueryExecutionError(sql(), sqlite3_errmsg(sqlite3_db_handle(m_stmt)));
}

// ============================================================================
// Column Access
// ============================================================================

int SQLiteStatement::columnCount() const {
    return m_stmt ? sqlite3_column_count(m_stmt) : 0;
}

std::string SQLiteStatement::columnName(int index) const {
    if (!m_stmt) return "";
    const char* name = sqlite3_column_name(m_stmt, index);
    return name ? name : "";
}

std::vector<std::string> SQLiteStatement::columnNames() const {
    std::vector<std::string> names;
    int count = columnCount();
    names.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        names.push_back(columnName(i));
    }
    return names;
}

Value SQLiteStatement::columnValue(int index) const {
    if (!m_stmt) return Value();

    switch (sqlite3_column_type(m_stmt, index)) {
        case SQLITE_INTEGER: {
            int64_t v = sqlite3_column_int64(m_stmt, index);
            const char* declared = sqlite3_column_decltype(m_stmt, index);
            if (declared && (strcasecmp(declared, "BOOLEAN") == 0 ||
                             strcasecmp(declared, "BOOL") == 0)) {
                return Value(v != 0);
            }
            return Value(v);
        }
        case SQLITE_FLOAT:
            return Value(sqlite3_column_double(m_stmt, index));
        case SQLITE_TEXT: {
            const unsigned char* text = sqlite3_column_text(m_stmt, index);
            int size = sqlite3_column_bytes(m_stmt, index);
            if (!text) return Value(std::string());
            return Value(std::string(reinterpret_cast<const char*>(text),
                                     static_cast<size_t>(size)));
        }
        case SQLITE_BLOB: {
            const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(m_stmt, index));
            int size = sqlite3_column_bytes(m_stmt, index);
            return Value(data ? Blob(data, data + size) : Blob());
        }
        default:
            return Value();
    }
}

Row SQLiteStatement::readRow() const {
    Row row;
    int count = columnCount();
    row.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        row.push_back(columnValue(i));
    }
    return row;
}

// ============================================================================
// Statement Management
// ============================================================================

void SQLiteStatement::reset() {
    if (m_stmt) {
        sqlite3_reset(m_stmt);
        sqlite3_clear_bindings(m_stmt);
    }
}

void SQLiteStatement::finalize() {
    if (m_stmt) {
        sqlite3_finalize(m_stmt);
        m_stmt = nullptr;
    }
}

}  // namespace sqlkit
