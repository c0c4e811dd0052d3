#pragma once

#include "Backend.hpp"
#include "Errors.hpp"
#include "Pool.hpp"
#include "QueryOptions.hpp"
#include "Record.hpp"
#include "Value.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sqlkit {

enum class LoadMode {
    Compiled,  // read once at construction
    Dynamic    // re-read from disk on every load
};

// Parses "compiled" or "dynamic"; throws std::invalid_argument otherwise
LoadMode parseLoadMode(const std::string& text);

/**
 * @class SqlFileStore
 * @brief Named SQL files kept in one directory under a root.
 *
 * Only the files registered at construction can be loaded. Queries run
 * through a store use the file name as their label, so one-row retrieval
 * errors name the file.
 *
 * Usage:
 * @code
 *   SqlFileStore reports("sql", "reports", {"stats.sql", "activity.sql"});
 *   Record stats = reports.queryOne(pool, "stats.sql", {Value(42)}, opts);
 *
 *   reports.withStream(pool, "activity.sql", {}, [](ChunkStream& stream) {
 *       while (auto chunk = stream.next()) {
 *           // ...
 *       }
 *   });
 * @endcode
 */
class SqlFileStore {
public:
    /**
     * @throws SqlFileError in Compiled mode if a listed file cannot be read.
     */
    SqlFileStore(const std::filesystem::path& rootDir, const std::string& dirname,
                 const std::vector<std::string>& files, LoadMode mode = LoadMode::Compiled);

    /**
     * @brief SQL text of a registered file.
     * @throws SqlFileError if the file is not registered or cannot be read.
     */
    std::string load(const std::string& filename) const;

    Result<std::string> tryLoad(const std::string& filename) const;

    bool contains(const std::string& filename) const;

    // Key a filename is registered under: non [A-Za-z0-9_] characters become '_'
    static std::string fileKey(const std::string& filename);

    const std::filesystem::path& directory() const { return m_directory; }
    LoadMode mode() const { return m_mode; }

    // ----- Queries by file name -----

    std::vector<Record> queryAll(const BackendRef& backend, const std::string& filename,
                                 const std::vector<Value>& params = {},
                                 const QueryOptions& opts = {}) const;

    Record queryOne(const BackendRef& backend, const std::string& filename,
                    const std::vector<Value>& params = {}, const QueryOptions& opts = {}) const;

    std::optional<Record> queryOneOrNone(const BackendRef& backend, const std::string& filename,
                                         const std::vector<Value>& params = {},
                                         const QueryOptions& opts = {}) const;

    template <typename T>
    std::vector<T> queryAllAs(const BackendRef& backend, const RecordType<T>& type,
                              const std::string& filename, const std::vector<Value>& params = {},
                              const QueryOptions& opts = {}) const {
        return sqlkit::queryAllAs(backend, type, load(filename), params, labelled(filename, opts));
    }

    template <typename T>
    T queryOneAs(const BackendRef& backend, const RecordType<T>& type, const std::string& filename,
                 const std::vector<Value>& params = {}, const QueryOptions& opts = {}) const {
        return sqlkit::queryOneAs(backend, type, load(filename), params, labelled(filename, opts));
    }

    template <typename T>
    std::optional<T> queryOneOrNoneAs(const BackendRef& backend, const RecordType<T>& type,
                                      const std::string& filename,
                                      const std::vector<Value>& params = {},
                                      const QueryOptions& opts = {}) const {
        return sqlkit::queryOneOrNoneAs(backend, type, load(filename), params,
                                        labelled(filename, opts));
    }

    // ----- Result-returning forms -----

    Result<std::vector<Record>> tryQueryAll(const BackendRef& backend,
                                            const std::string& filename,
                                            const std::vector<Value>& params = {},
                                            const QueryOptions& opts = {}) const;

    Result<Record> tryQueryOne(const BackendRef& backend, const std::string& filename,
                               const std::vector<Value>& params = {},
                               const QueryOptions& opts = {}) const;

    Result<std::optional<Record>> tryQueryOneOrNone(const BackendRef& backend,
                                                    const std::string& filename,
                                                    const std::vector<Value>& params = {},
                                                    const QueryOptions& opts = {}) const;

    template <typename T>
    Result<std::vector<T>> tryQueryAllAs(const BackendRef& backend, const RecordType<T>& type,
                                         const std::string& filename,
                                         const std::vector<Value>& params = {},
                                         const QueryOptions& opts = {}) const {
        return capture([&] { return queryAllAs(backend, type, filename, params, opts); });
    }

    template <typename T>
    Result<T> tryQueryOneAs(const BackendRef& backend, const RecordType<T>& type,
                            const std::string& filename, const std::vector<Value>& params = {},
                            const QueryOptions& opts = {}) const {
        return capture([&] { return queryOneAs(backend, type, filename, params, opts); });
    }

    template <typename T>
    Result<std::optional<T>> tryQueryOneOrNoneAs(const BackendRef& backend,
                                                 const RecordType<T>& type,
                                                 const std::string& filename,
                                                 const std::vector<Value>& params = {},
                                                 const QueryOptions& opts = {}) const {
        return capture([&] { return queryOneOrNoneAs(backend, type, filename, params, opts); });
    }

    // ----- Streaming by file name -----

    /**
     * @brief Stream a file's rows in chunks to fn on a pooled connection.
     *
     * Errors raised while the stream is open carry "sql file <filename>" as
     * context. The stream's columns() are available before the first chunk.
     */
    template <typename Fn>
    auto withStream(const PoolHandle& pool, const std::string& filename,
                    const std::vector<Value>& params, Fn&& fn,
                    const QueryOptions& opts = {}) const {
        std::string sql = load(filename);
        ErrorContext context("sql file " + filename);
        return sqlkit::withStream(pool, sql, params, std::forward<Fn>(fn), opts);
    }

    /**
     * @brief Start a chunked query from a file; the stream owns its checkout.
     */
    PooledChunkStream queryChunked(const PoolHandle& pool, const std::string& filename,
                                   const std::vector<Value>& params = {},
                                   const QueryOptions& opts = {}) const;

private:
    static std::string readFile(const std::filesystem::path& path, const std::string& filename);

    static QueryOptions labelled(const std::string& filename, const QueryOptions& opts);

    std::filesystem::path m_directory;
    LoadMode m_mode;
    std::unordered_map<std::string, std::string> m_files;  ///< key -> filename
    std::unordered_map<std::string, std::string> m_sql;    ///< key -> text (Compiled)
};

}  // namespace sqlkit
