#include "SqlFileStore.hpp"
#include <spdlog/spdlog.h>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace sqlkit {

LoadMode parseLoadMode(const std::string& text) {
    if (text == "compiled") return LoadMode::Compiled;
    if (text == "dynamic") return LoadMode::Dynamic;
    throw std::invalid_argument("unknown SQL load mode '" + text + "'");
}

// ============================================================================
// Construction
// ============================================================================

SqlFileStore::SqlFileStore(const std::filesystem::path& rootDir, const std::string& dirname,
                           const std::vector<std::string>& files, LoadMode mode)
    : m_directory(rootDir / dirname), m_mode(mode) {
    for (const auto& filename : files) {
        std::string key = fileKey(filename);
        m_files[key] = filename;
        if (m_mode == LoadMode::Compiled) {
            m_sql[key] = readFile(m_directory / filename, filename);
        }
    }

    spdlog::debug("SQL file store {} ready with {} files ({})", m_directory.string(),
                  m_files.size(), m_mode == LoadMode::Compiled ? "compiled" : "dynamic");
}

std::string SqlFileStore::fileKey(const std::string& filename) {
    std::string key = filename;
    for (char& c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            c = '_';
        }
    }
    return key;
}

// ============================================================================
// Loading
// ============================================================================

std::string SqlFileStore::readFile(const std::filesystem::path& path,
                                   const std::string& filename) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw SqlFileError(filename, "cannot read " + path.string());
    }
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

bool SqlFileStore::contains(const std::string& filename) const {
    return m_files.count(fileKey(filename)) > 0;
}

std::string SqlFileStore::load(const std::string& filename) const {
    std::string key = fileKey(filename);
    auto it = m_files.find(key);
    if (it == m_files.end()) {
        throw SqlFileError(filename, "not registered in " + m_directory.string());
    }

    if (m_mode == LoadMode::Compiled) {
        return m_sql.at(key);
    }
    return readFile(m_directory / it->second, filename);
}

Result<std::string> SqlFileStore::tryLoad(const std::string& filename) const {
    return capture([&] { return load(filename); });
}

// ============================================================================
// Queries
// ============================================================================

QueryOptions SqlFileStore::labelled(const std::string& filename, const QueryOptions& opts) {
    QueryOptions result = opts;
    if (!result.label) {
        result.label = filename;
    }
    return result;
}

std::vector<Record> SqlFileStore::queryAll(const BackendRef& backend, const std::string& filename,
                                           const std::vector<Value>& params,
                                           const QueryOptions& opts) const {
    return sqlkit::queryAll(backend, load(filename), params, labelled(filename, opts));
}

Record SqlFileStore::queryOne(const BackendRef& backend, const std::string& filename,
                              const std::vector<Value>& params, const QueryOptions& opts) const {
    return sqlkit::queryOne(backend, load(filename), params, labelled(filename, opts));
}

std::optional<Record> SqlFileStore::queryOneOrNone(const BackendRef& backend,
                                                   const std::string& filename,
                                                   const std::vector<Value>& params,
                                                   const QueryOptions& opts) const {
    return sqlkit::queryOneOrNone(backend, load(filename), params, labelled(filename, opts));
}

Result<std::vector<Record>> SqlFileStore::tryQueryAll(const BackendRef& backend,
                                                      const std::string& filename,
                                                      const std::vector<Value>& params,
                                                      const QueryOptions& opts) const {
    return capture([&] { return queryAll(backend, filename, params, opts); });
}

Result<Record> SqlFileStore::tryQueryOne(const BackendRef& backend, const std::string& filename,
                                         const std::vector<Value>& params,
                                         const QueryOptions& opts) const {
    return capture([&] { return queryOne(backend, filename, params, opts); });
}

Result<std::optional<Record>> SqlFileStore::tryQueryOneOrNone(const BackendRef& backend,
                                                              const std::string& filename,
                                                              const std::vector<Value>& params,
                                                              const QueryOptions& opts) const {
    return capture([&] { return queryOneOrNone(backend, filename, params, opts); });
}

// ============================================================================
// Streaming
// ============================================================================

PooledChunkStream SqlFileStore::queryChunked(const PoolHandle& pool, const std::string& filename,
                                             const std::vector<Value>& params,
                                             const QueryOptions& opts) const {
    std::string sql = load(filename);
    ErrorContext context("sql file " + filename);
    return sqlkit::queryChunked(pool, sql, params, opts);
}

}  // namespace sqlkit
