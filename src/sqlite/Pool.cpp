#include "Pool.hpp"
#include "Errors.hpp"
#include <spdlog/spdlog.h>

namespace sqlkit {

// ============================================================================
// Pool Handle
// ============================================================================

PoolHandle PoolHandle::start(const std::string& name, const std::string& location,
                             size_t poolSize, const EngineConfig& config,
                             std::shared_ptr<EngineMetrics> metrics) {
    auto supervisor = std::make_shared<PoolSupervisor>(name, location, poolSize, config,
                                                       std::move(metrics));
    supervisor->start();
    return PoolHandle(std::move(supervisor));
}

PoolHandle::PoolHandle(std::shared_ptr<PoolSupervisor> supervisor)
    : m_supervisor(std::move(supervisor)) {
}

void PoolHandle::stop() const {
    m_supervisor->stop();
}

bool PoolHandle::running() const {
    return m_supervisor->state() == PoolState::ConnectionsReady;
}

PooledConnection PoolHandle::acquire(std::chrono::milliseconds timeout) const {
    return m_supervisor->checkout(timeout);
}

// ============================================================================
// Queries
// ============================================================================

QueryResult query(SQLiteConnection& conn, const std::string& sql,
                  const std::vector<Value>& params, const QueryOptions& opts) {
    return opts.cache ? conn.executeCached(sql, params) : conn.execute(sql, params);
}

QueryResult query(const PoolHandle& pool, const std::string& sql,
                  const std::vector<Value>& params, const QueryOptions& opts) {
    ErrorContext context("pool " + pool.name());
    PooledConnection lease = pool.acquire(opts.timeout);
    return query(*lease, sql, params, opts);
}

Result<QueryResult> tryQuery(const PoolHandle& pool, const std::string& sql,
                             const std::vector<Value>& params, const QueryOptions& opts) {
    return capture([&] { return query(pool, sql, params, opts); });
}

ChunkStream queryChunked(SQLiteConnection& conn, const std::string& sql,
                         const std::vector<Value>& params, const QueryOptions& opts) {
    return conn.executeChunked(sql, params, opts.chunkSize);
}

PooledChunkStream queryChunked(const PoolHandle& pool, const std::string& sql,
                               const std::vector<Value>& params, const QueryOptions& opts) {
    ErrorContext context("pool " + pool.name());
    PooledConnection lease = pool.acquire(opts.timeout);
    ChunkStream stream = lease->executeChunked(sql, params, opts.chunkSize);
    return PooledChunkStream(pool, std::move(lease), std::move(stream));
}

// ============================================================================
// Pooled Chunk Stream
// ============================================================================

PooledChunkStream::PooledChunkStream(PoolHandle pool, PooledConnection lease, ChunkStream stream)
    : m_pool(std::move(pool))
    , m_lease(std::move(lease))
    , m_stream(std::move(stream)) {
    m_columns = m_stream->columns();
}

std::optional<std::vector<Row>> PooledChunkStream::next() {
    if (!m_stream) {
        return std::nullopt;
    }

    std::optional<std::vector<Row>> chunk;
    try {
        chunk = m_stream->next();
    } catch (const SqlKitError&) {
        close();
        throw;
    }

    if (!chunk) {
        close();
    }
    return chunk;
}

void PooledChunkStream::close() {
    // Finalize the statement before the connection goes back to the pool
    m_stream.reset();
    m_lease.release(Checkin::Keep);
}

}  // namespace sqlkit
