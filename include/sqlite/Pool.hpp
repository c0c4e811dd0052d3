#pragma once

/**
 * @file Pool.hpp
 * @brief Client API over a pooled SQLite engine.
 *
 * A PoolHandle is created once with PoolHandle::start() and passed to the
 * code that needs it. Every function here checks a connection out, runs the
 * work and checks the connection back in, healthy unless the caller says
 * otherwise.
 */

#include "ChunkStream.hpp"
#include "Errors.hpp"
#include "PoolSupervisor.hpp"
#include "QueryOptions.hpp"
#include "SQLiteConnection.hpp"
#include "Value.hpp"
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace sqlkit {

/**
 * @class PoolHandle
 * @brief Cheap, copyable reference to a running pool.
 *
 * Using a handle after its pool stopped fails with PoolClosedError.
 */
class PoolHandle {
public:
    static constexpr size_t kDefaultPoolSize = 4;

    /**
     * @brief Start a pool and return its handle.
     * @param name Pool name used in logs and errors.
     * @param location File path, "file:" URI or ":memory:".
     * @param poolSize Maximum number of connections.
     * @param config Engine options.
     * @param metrics Optional shared counters.
     * @throws EngineOpenError if the engine cannot be opened.
     * @throws std::invalid_argument if poolSize is 0.
     */
    static PoolHandle start(const std::string& name, const std::string& location,
                            size_t poolSize = kDefaultPoolSize, const EngineConfig& config = {},
                            std::shared_ptr<EngineMetrics> metrics = nullptr);

    explicit PoolHandle(std::shared_ptr<PoolSupervisor> supervisor);

    /**
     * @brief Stop the pool; every copy of the handle sees it stopped.
     */
    void stop() const;

    bool running() const;

    const std::string& name() const { return m_supervisor->name(); }

    PoolSupervisor& supervisor() const { return *m_supervisor; }

    /**
     * @brief Check out a connection for the caller to manage.
     * @throws CheckoutTimeoutError, PoolClosedError
     */
    PooledConnection acquire(std::chrono::milliseconds timeout = kDefaultCheckoutTimeout) const;

private:
    std::shared_ptr<PoolSupervisor> m_supervisor;
};

/// Value returned from a checkout() body together with the connection's health
template <typename T>
struct Checkout {
    T value;
    Checkin action = Checkin::Keep;
};

/**
 * @brief Run a query on a pooled connection.
 *
 * Uses the statement cache unless opts.cache is false. The connection is
 * checked in healthy whether the query succeeds or fails.
 */
QueryResult query(const PoolHandle& pool, const std::string& sql,
                  const std::vector<Value>& params = {}, const QueryOptions& opts = {});

/**
 * @brief query() returning its error instead of throwing.
 */
Result<QueryResult> tryQuery(const PoolHandle& pool, const std::string& sql,
                             const std::vector<Value>& params = {},
                             const QueryOptions& opts = {});

/**
 * @brief Run a query on a standalone connection.
 */
QueryResult query(SQLiteConnection& conn, const std::string& sql,
                  const std::vector<Value>& params = {}, const QueryOptions& opts = {});

/**
 * @brief Run fn with a checked-out connection and return its result.
 *
 * Exceptions from fn propagate; the connection is kept either way.
 */
template <typename Fn>
auto withConnection(const PoolHandle& pool, Fn&& fn, const QueryOptions& opts = {}) {
    PooledConnection lease = pool.acquire(opts.timeout);
    return std::forward<Fn>(fn)(*lease);
}

/**
 * @brief Run fn with a checked-out connection; fn decides the checkin action.
 *
 * fn returns Checkout<T>{value, Checkin}. A throwing fn checks in with Keep.
 */
template <typename Fn>
auto checkout(const PoolHandle& pool, Fn&& fn, const QueryOptions& opts = {}) {
    PooledConnection lease = pool.acquire(opts.timeout);
    auto outcome = std::forward<Fn>(fn)(*lease);
    lease.release(outcome.action);
    return std::move(outcome.value);
}

/**
 * @brief Stream a query's rows in chunks to fn.
 *
 * The connection stays checked out until fn returns, and the statement is
 * finalized before checkin.
 */
template <typename Fn>
auto withStream(const PoolHandle& pool, const std::string& sql, const std::vector<Value>& params,
                Fn&& fn, const QueryOptions& opts = {}) {
    PooledConnection lease = pool.acquire(opts.timeout);
    ChunkStream stream = lease->executeChunked(sql, params, opts.chunkSize);
    return std::forward<Fn>(fn)(stream);
}

/**
 * @class PooledChunkStream
 * @brief Chunk stream that owns its connection checkout.
 *
 * The connection is checked in as soon as the stream is exhausted or
 * closed, or when the stream is destroyed.
 */
class PooledChunkStream {
public:
    PooledChunkStream(PoolHandle pool, PooledConnection lease, ChunkStream stream);

    // Move-constructible only; reassigning would check in before finalizing
    PooledChunkStream(const PooledChunkStream&) = delete;
    PooledChunkStream& operator=(const PooledChunkStream&) = delete;
    PooledChunkStream(PooledChunkStream&&) = default;
    PooledChunkStream& operator=(PooledChunkStream&&) = delete;

    const std::vector<std::string>& columns() const { return m_columns; }

    /**
     * @brief Fetch the next chunk; checks the connection in once exhausted.
     */
    std::optional<std::vector<Row>> next();

    bool exhausted() const { return !m_stream; }

    void close();

private:
    PoolHandle m_pool;                  ///< Keeps the supervisor alive
    PooledConnection m_lease;           ///< Released after the stream
    std::optional<ChunkStream> m_stream;
    std::vector<std::string> m_columns;
};

/**
 * @brief Start a chunked query whose stream owns the checkout.
 */
PooledChunkStream queryChunked(const PoolHandle& pool, const std::string& sql,
                               const std::vector<Value>& params = {},
                               const QueryOptions& opts = {});

/**
 * @brief Start a chunked query on a standalone connection.
 */
ChunkStream queryChunked(SQLiteConnection& conn, const std::string& sql,
                         const std::vector<Value>& params = {}, const QueryOptions& opts = {});

}  // namespace sqlkit
