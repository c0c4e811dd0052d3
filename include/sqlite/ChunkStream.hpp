#pragma once

/**
 * @file ChunkStream.hpp
 * @brief Lazy, chunked iteration over an SQLite result set.
 */

#include "QueryOptions.hpp"
#include "SQLiteStatement.hpp"
#include "Value.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace sqlkit {

/**
 * @class ChunkStream
 * @brief Single-pass stream of row chunks from one executing statement.
 *
 * Rows are fetched on demand, at most chunkSize per call to next(). Once
 * the cursor is exhausted the statement is finalized and next() keeps
 * returning an empty optional. The stream is not restartable.
 *
 * A ChunkStream must not outlive the connection that started it.
 *
 * Usage:
 * @code
 *   ChunkStream stream = conn.executeChunked("SELECT * FROM events");
 *   while (auto chunk = stream.next()) {
 *       for (const Row& row : *chunk) {
 *           // ...
 *       }
 *   }
 * @endcode
 */
class ChunkStream {
public:
    /**
     * @brief Wrap a bound, not yet stepped statement.
     * @param stmt Statement to drain (takes ownership).
     * @param chunkSize Maximum rows per chunk (0 is treated as 1).
     */
    ChunkStream(SQLiteStatement stmt, size_t chunkSize = kDefaultChunkSize);

    // Non-copyable, movable
    ChunkStream(const ChunkStream&) = delete;
    ChunkStream& operator=(const ChunkStream&) = delete;
    ChunkStream(ChunkStream&&) = default;
    ChunkStream& operator=(ChunkStream&&) = default;

    /**
     * @brief Column names of the result, available before the first chunk.
     */
    const std::vector<std::string>& columns() const { return m_columns; }

    /**
     * @brief Fetch the next chunk of rows.
     * @return Up to chunkSize rows, or an empty optional when exhausted.
     * @throws QueryExecutionError if stepping fails; the stream is then exhausted.
     */
    std::optional<std::vector<Row>> next();

    bool exhausted() const { return m_exhausted; }

    size_t chunkSize() const { return m_chunkSize; }

    /**
     * @brief Stop early and finalize the statement.
     */
    void close();

private:
    SQLiteStatement m_stmt;
    std::vector<std::string> m_columns;
    size_t m_chunkSize;
    bool m_exhausted = false;
};

}  // namespace sqlkit
