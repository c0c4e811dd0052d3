#include "StatementCache.hpp"
#include "SQLiteConnection.hpp"
#include <spdlog/spdlog.h>

namespace sqlkit {

SQLiteStatement& StatementCache::lookupOrPrepare(SQLiteConnection& connection,
                                                 const std::string& sql) {
    auto it = m_statements.find(sql);
    if (it != m_statements.end()) {
        it->second->reset();
        return *it->second;
    }

    spdlog::debug("Statement cache miss ({} cached): {}", m_statements.size(), sql);
    auto stmt = std::make_unique<SQLiteStatement>(connection.prepare(sql));
    SQLiteStatement& ref = *stmt;
    m_statements.emplace(sql, std::move(stmt));
    return ref;
}

bool StatementCache::contains(const std::string& sql) const {
    return m_statements.count(sql) > 0;
}

void StatementCache::clear() {
    m_statements.clear();
}

}  // namespace sqlkit
