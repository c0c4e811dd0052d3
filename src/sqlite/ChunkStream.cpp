#include "ChunkStream.hpp"
#include <spdlog/spdlog.h>

namespace sqlkit {

ChunkStream::ChunkStream(SQLiteStatement stmt, size_t chunkSize)
    : m_stmt(std::move(stmt)), m_chunkSize(chunkSize == 0 ? 1 : chunkSize) {
    m_columns = m_stmt.columnNames();
    if (!m_stmt) {
        m_exhausted = true;
    }
}

std::optional<std::vector<Row>> ChunkStream::next() {
    if (m_exhausted) {
        return std::nullopt;
    }

    std::vector<Row> chunk;
    try {
        while (chunk.size() < m_chunkSize) {
            if (!m_stmt.step()) {
                close();
                break;
            }
            chunk.push_back(m_stmt.readRow());
        }
    } catch (const std::exception& e) {
        spdlog::debug("Chunked query failed: {}", e.what());
        close();
        throw;
    }

    if (chunk.empty()) {
        return std::nullopt;
    }

    normalizeWideIntegers(chunk);
    return chunk;
}

void ChunkStream::close() {
    m_stmt.finalize();
    m_exhausted = true;
}

}  // namespace sqlkit
