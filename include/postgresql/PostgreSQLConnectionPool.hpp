#pragma once

/**
 * @file PostgreSQLConnectionPool.hpp
 * @brief Pool of PostgreSQL sessions that serves as a ServerBackend.
 *
 * The dispatcher routes server queries to run(), which leases a session,
 * executes and returns the native result.
 */

#include "Config.hpp"
#include "ConnectionPool.hpp"
#include "PoolSupervisor.hpp"
#include "PostgreSQLConnection.hpp"
#include "QueryOptions.hpp"
#include "ServerBackend.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

namespace sqlkit {

class PostgreSQLConnectionPool;

/**
 * @class PostgreSQLLease
 * @brief Exclusive use of one pooled session.
 *
 * Checked in with Checkin::Keep on destruction unless release() was called.
 */
class PostgreSQLLease {
public:
    PostgreSQLLease(PostgreSQLConnectionPool* pool, std::unique_ptr<PostgreSQLConnection> conn);
    ~PostgreSQLLease();

    PostgreSQLLease(const PostgreSQLLease&) = delete;
    PostgreSQLLease& operator=(const PostgreSQLLease&) = delete;
    PostgreSQLLease(PostgreSQLLease&& other) noexcept;
    PostgreSQLLease& operator=(PostgreSQLLease&&) = delete;

    PostgreSQLConnection& operator*() const { return *m_conn; }
    PostgreSQLConnection* operator->() const { return m_conn.get(); }

    void release(Checkin action = Checkin::Keep);

private:
    PostgreSQLConnectionPool* m_pool;
    std::unique_ptr<PostgreSQLConnection> m_conn;
};

/**
 * @class PostgreSQLConnectionPool
 * @brief Bounded pool of PostgreSQL sessions.
 *
 * Pool Behavior:
 * - sessions are opened on demand, outside the pool lock, up to pool_size
 * - acquire() waits for a returned session until the timeout expires
 * - an idle session that fails its ping is closed and its slot reopened
 * - a session whose link dropped during a query is discarded on checkin
 *
 * Thread Safety:
 * - All public methods are thread-safe.
 */
class PostgreSQLConnectionPool : public ConnectionPool, public ServerBackend {
public:
    /**
     * @brief Create an empty pool; no session is opened yet.
     * @param config Server address, credentials and pool size.
     */
    explicit PostgreSQLConnectionPool(const ServerConfig& config);

    /**
     * @brief Destructor - closes idle sessions.
     */
    ~PostgreSQLConnectionPool() override;

    /**
     * @brief Lease a session.
     * @throws CheckoutTimeoutError on timeout.
     * @throws PoolClosedError once the pool has been closed.
     * @throws EngineOpenError if a new session cannot be opened.
     */
    PostgreSQLLease acquire(std::chrono::milliseconds timeout = kDefaultCheckoutTimeout);

    // ----- ServerBackend interface implementation -----

    std::string name() const override;

    /**
     * @brief Run one query on a leased session.
     * @throws QueryExecutionError if the server reports an error.
     */
    std::unique_ptr<ServerResult> run(const std::string& sql, const std::vector<Value>& params,
                                      const QueryOptions& opts) override;

    // ----- ConnectionPool interface implementation -----

    size_t availableCount() const override;
    size_t totalCount() const override;
    size_t inUseCount() const override;
    size_t waitingCount() const override;

    bool healthCheck() override;

    /**
     * @brief Close idle sessions; their slots are reopened on demand.
     */
    void drain() override;

    /**
     * @brief Close idle sessions and refuse further leases.
     *
     * Leased sessions are closed when they come back. Leases must be
     * returned before the pool is destroyed.
     */
    void close();

    /**
     * @brief libpq conninfo string for a configuration.
     *
     * Values containing spaces, quotes or backslashes are single-quoted.
     */
    static std::string connectionString(const ServerConfig& config);

private:
    friend class PostgreSQLLease;

    void checkin(std::unique_ptr<PostgreSQLConnection> conn, Checkin action);

    ServerConfig m_config;
    std::string m_conninfo;
    size_t m_poolSize;

    std::deque<std::unique_ptr<PostgreSQLConnection>> m_idle;
    size_t m_created = 0;   ///< Idle + leased + being opened
    size_t m_inUse = 0;     ///< Leased or being opened
    size_t m_waiting = 0;   ///< Callers blocked in acquire()
    bool m_closed = false;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
};

}  // namespace sqlkit
