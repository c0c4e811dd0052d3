#include "PostgreSQLConnection.hpp"
#include "Errors.hpp"
#include <spdlog/spdlog.h>
#include <iomanip>
#include <limits>
#include <sstream>

namespace sqlkit {

namespace {

struct TextParamVisitor {
    const std::string& sql;

    std::string operator()(const std::monostate&) const { return ""; }
    std::string operator()(bool v) const { return v ? "true" : "false"; }
    std::string operator()(int64_t v) const { return std::to_string(v); }
    std::string operator()(WideInt v) const { return wideIntToString(v); }

    std::string operator()(double v) const {
        std::ostringstream out;
        out << std::setprecision(std::numeric_limits<double>::max_digits10) << v;
        return out.str();
    }

    std::string operator()(const std::string& v) const { return v; }

    // bytea hex input format
    std::string operator()(const Blob& v) const { return Value(v).toString(); }

    std::string operator()(const ValueList&) const { return unsupported("list"); }
    std::string operator()(const ValueTuple&) const { return unsupported("tuple"); }
    std::string operator()(const ValueStruct&) const { return unsupported("struct"); }

    std::string unsupported(const char* kind) const {
        throw QueryExecutionError(sql, std::string("cannot bind a ") + kind + " parameter");
    }
};

std::string trimTrailing(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == ' ')) {
        text.pop_back();
    }
    return text;
}

}  // namespace

std::string encodeTextParam(const std::string& sql, const Value& value) {
    return std::visit(TextParamVisitor{sql}, value.storage());
}

// ============================================================================
// Session
// ============================================================================

std::unique_ptr<PostgreSQLConnection> PostgreSQLConnection::connect(const std::string& conninfo) {
    PGconn* conn = PQconnectdb(conninfo.c_str());
    if (!conn) {
        throw EngineOpenError("postgresql", "out of memory allocating a connection");
    }

    auto connection = std::make_unique<PostgreSQLConnection>(conn);
    if (!connection->isOpen()) {
        throw EngineOpenError("postgresql", connection->lastError());
    }

    PQsetClientEncoding(conn, "UTF8");
    return connection;
}

PostgreSQLConnection::PostgreSQLConnection(PGconn* conn) : m_conn(conn) {}

PostgreSQLConnection::~PostgreSQLConnection() {
    if (m_conn) {
        PQfinish(m_conn);
    }
}

bool PostgreSQLConnection::isOpen() const {
    return m_conn && PQstatus(m_conn) == CONNECTION_OK;
}

bool PostgreSQLConnection::ping() {
    if (!isOpen()) return false;
    PostgreSQLResultSet res(PQexec(m_conn, "SELECT 1"));
    return res.status() == PGRES_TUPLES_OK;
}

std::string PostgreSQLConnection::lastError() const {
    if (!m_conn) return "no connection";
    return trimTrailing(PQerrorMessage(m_conn));
}

// ============================================================================
// Query Execution
// ============================================================================

PostgreSQLResultSet PostgreSQLConnection::run(const std::string& sql,
                                              const std::vector<Value>& params) {
    if (!isOpen()) {
        throw QueryExecutionError(sql, lastError());
    }

    PGresult* raw = nullptr;
    if (params.empty()) {
        raw = PQexec(m_conn, sql.c_str());
    } else {
        // Encoded texts must stay alive until PQexecParams returns
        std::vector<std::string> texts;
        std::vector<const char*> values;
        texts.reserve(params.size());
        values.reserve(params.size());

        for (const Value& param : params) {
            if (param.isNull()) {
                texts.emplace_back();
                values.push_back(nullptr);
            } else {
                texts.push_back(encodeTextParam(sql, param));
                values.push_back(texts.back().c_str());
            }
        }

        raw = PQexecParams(m_conn, sql.c_str(), static_cast<int>(values.size()), nullptr,
                           values.data(), nullptr, nullptr, 0);
    }

    if (!raw) {
        throw QueryExecutionError(sql, lastError());
    }

    PostgreSQLResultSet result(raw);
    ExecStatusType status = result.status();
    if (status == PGRES_FATAL_ERROR || status == PGRES_BAD_RESPONSE) {
        throw QueryExecutionError(sql, trimTrailing(result.errorMessage()));
    }

    spdlog::debug("PostgreSQL query returned {}", result.statusMessage());
    return result;
}

}  // namespace sqlkit
