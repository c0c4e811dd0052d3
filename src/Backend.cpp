#include "Backend.hpp"
#include <spdlog/spdlog.h>

namespace sqlkit {

namespace {

constexpr size_t kMaxLabelLength = 50;

struct ExecuteVisitor {
    const std::string& sql;
    const std::vector<Value>& params;
    const QueryOptions& opts;

    QueryResult operator()(SQLiteConnection* conn) const {
        return query(*conn, sql, params, opts);
    }

    QueryResult operator()(const PoolHandle& pool) const {
        return query(pool, sql, params, opts);
    }

    QueryResult operator()(ServerBackend* server) const {
        std::unique_ptr<ServerResult> native = server->run(sql, params, opts);
        return extractResult(*native);
    }
};

// Byte offset of the first n UTF-8 code points
size_t codePointPrefix(const std::string& text, size_t n) {
    size_t seen = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
            if (seen == n) return i;
            ++seen;
        }
    }
    return text.size();
}

size_t codePointCount(const std::string& text) {
    size_t count = 0;
    for (char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) ++count;
    }
    return count;
}

}  // namespace

// ============================================================================
// BackendRef
// ============================================================================

std::string BackendRef::describe() const {
    struct Describe {
        std::string operator()(SQLiteConnection* conn) const {
            return "connection " + conn->engine().location();
        }
        std::string operator()(const PoolHandle& pool) const { return "pool " + pool.name(); }
        std::string operator()(ServerBackend* server) const { return "server " + server->name(); }
    };
    return std::visit(Describe{}, m_target);
}

// ============================================================================
// Dispatch
// ============================================================================

std::string queryLabel(const std::string& sql, const QueryOptions& opts) {
    if (opts.label) return *opts.label;
    if (codePointCount(sql) <= kMaxLabelLength) return sql;
    return sql.substr(0, codePointPrefix(sql, kMaxLabelLength - 1)) + "...";
}

QueryResult execute(const BackendRef& backend, const std::string& sql,
                    const std::vector<Value>& params, const QueryOptions& opts) {
    spdlog::debug("Executing on {}: {}", backend.describe(), queryLabel(sql));
    return std::visit(ExecuteVisitor{sql, params, opts}, backend.target());
}

// ============================================================================
// Retrieval
// ============================================================================

std::vector<Record> queryAll(const BackendRef& backend, const std::string& sql,
                             const std::vector<Value>& params, const QueryOptions& opts) {
    return materialize(execute(backend, sql, params, opts), opts.materialize);
}

std::optional<Record> queryOneOrNone(const BackendRef& backend, const std::string& sql,
                                     const std::vector<Value>& params,
                                     const QueryOptions& opts) {
    std::vector<Record> records = queryAll(backend, sql, params, opts);
    if (records.size() > 1) {
        throw MultipleResultsError(queryLabel(sql, opts), records.size());
    }
    if (records.empty()) return std::nullopt;
    return std::move(records.front());
}

Record queryOne(const BackendRef& backend, const std::string& sql,
                const std::vector<Value>& params, const QueryOptions& opts) {
    std::optional<Record> record = queryOneOrNone(backend, sql, params, opts);
    if (!record) {
        throw NoResultsError(queryLabel(sql, opts));
    }
    return std::move(*record);
}

// ============================================================================
// Result-returning forms
// ============================================================================

Result<QueryResult> tryExecute(const BackendRef& backend, const std::string& sql,
                               const std::vector<Value>& params, const QueryOptions& opts) {
    return capture([&] { return execute(backend, sql, params, opts); });
}

Result<std::vector<Record>> tryQueryAll(const BackendRef& backend, const std::string& sql,
                                        const std::vector<Value>& params,
                                        const QueryOptions& opts) {
    return capture([&] { return queryAll(backend, sql, params, opts); });
}

Result<Record> tryQueryOne(const BackendRef& backend, const std::string& sql,
                           const std::vector<Value>& params, const QueryOptions& opts) {
    return capture([&] { return queryOne(backend, sql, params, opts); });
}

Result<std::optional<Record>> tryQueryOneOrNone(const BackendRef& backend, const std::string& sql,
                                                const std::vector<Value>& params,
                                                const QueryOptions& opts) {
    return capture([&] { return queryOneOrNone(backend, sql, params, opts); });
}

}  // namespace sqlkit
