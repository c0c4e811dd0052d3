#pragma once

/**
 * @file PoolSupervisor.hpp
 * @brief Supervised pool of SQLite connections sharing one engine.
 *
 * The supervisor owns the engine handle (stage 1) and the connection slots
 * (stage 2). Connections are created lazily on first checkout and are
 * always destroyed before the engine is released.
 */

#include "ConnectionPool.hpp"
#include "SQLiteConnection.hpp"
#include "SQLiteEngine.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

namespace sqlkit {

enum class PoolState {
    Stopped,           ///< No engine
    HandleHeld,        ///< Engine open, connection slots not ready yet
    ConnectionsReady,  ///< Serving checkouts
    Restarting,        ///< Engine restart in progress, checkouts wait
    Stopping           ///< Shutting down, checkouts fail
};

const char* poolStateName(PoolState state);

/// Health signal given when a connection is returned
enum class Checkin {
    Keep,    ///< Return to the idle set
    Discard  ///< Destroy; the slot is recreated on demand
};

class PoolSupervisor;

/**
 * @class PooledConnection
 * @brief Exclusive lease on one pooled connection.
 *
 * The connection is checked in with Checkin::Keep when the lease is
 * destroyed, unless release() was called first. The lease shares ownership
 * of its supervisor, so it stays valid after the last PoolHandle is gone.
 */
class PooledConnection {
public:
    PooledConnection(std::shared_ptr<PoolSupervisor> pool,
                     std::unique_ptr<SQLiteConnection> conn, uint64_t generation);
    ~PooledConnection();

    // Non-copyable
    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    // Movable
    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    SQLiteConnection& operator*() const { return *m_conn; }
    SQLiteConnection* operator->() const { return m_conn.get(); }
    SQLiteConnection* get() const { return m_conn.get(); }

    explicit operator bool() const { return m_conn != nullptr; }

    /**
     * @brief Check the connection in now.
     * @param action Keep it for reuse or discard it.
     */
    void release(Checkin action = Checkin::Keep);

private:
    std::shared_ptr<PoolSupervisor> m_pool;
    std::unique_ptr<SQLiteConnection> m_conn;
    uint64_t m_generation;
};

/**
 * @class PoolSupervisor
 * @brief Two-stage supervisor: engine handle, then connection slots.
 *
 * State machine:
 * - start(): Stopped -> HandleHeld -> ConnectionsReady
 * - restartConnections(): discards idle connections and marks checked-out
 *   ones stale; the engine is untouched
 * - restartEngine(): ConnectionsReady -> Restarting -> ConnectionsReady,
 *   waiting for every checkout to come back before the engine is released
 * - stop(): -> Stopping -> Stopped, releasing the engine exactly once
 *
 * Checkout:
 * - an idle connection is handed out if there is one
 * - otherwise, if a slot is free, the slot is reserved under the lock and
 *   the connection is opened on the calling thread outside the lock
 * - otherwise the caller waits until the timeout expires
 *
 * A supervisor hands out connections only while owned by a std::shared_ptr;
 * each lease keeps it alive until the connection is checked in.
 *
 * Thread Safety:
 * - All public methods are thread-safe.
 */
class PoolSupervisor : public ConnectionPool,
                       public std::enable_shared_from_this<PoolSupervisor> {
public:
    /**
     * @brief Create a stopped supervisor.
     * @param name Pool name used in logs and errors.
     * @param location Database location passed to SQLiteEngine::open().
     * @param poolSize Maximum number of connections (at least 1).
     * @param config Engine options.
     * @param metrics Optional shared counters.
     * @throws std::invalid_argument if poolSize is 0.
     */
    PoolSupervisor(std::string name, std::string location, size_t poolSize,
                   EngineConfig config = {}, std::shared_ptr<EngineMetrics> metrics = nullptr);

    /**
     * @brief Destructor - stops the pool.
     */
    ~PoolSupervisor() override;

    /**
     * @brief Open the engine and ready the connection slots.
     * @throws EngineOpenError if the engine cannot be opened.
     */
    void start();

    /**
     * @brief Shut down: fail waiters, wait for checkouts, release the engine.
     *
     * Idempotent. Concurrent callers all return once the pool is stopped.
     */
    void stop();

    /**
     * @brief Recreate connections without touching the engine.
     */
    void restartConnections();

    /**
     * @brief Release and reopen the engine once every checkout is back.
     * @throws EngineOpenError if the engine cannot be reopened (pool is then stopped).
     * @throws PoolClosedError if the pool is not running.
     */
    void restartEngine();

    /**
     * @brief Check out a connection.
     * @param timeout Maximum time to wait for a free connection.
     * @throws CheckoutTimeoutError if the timeout expires.
     * @throws PoolClosedError if the pool is stopped or stopping.
     * @throws EngineOpenError if a new session cannot be opened.
     * @throws std::bad_weak_ptr if the supervisor is not owned by a shared_ptr.
     */
    PooledConnection checkout(std::chrono::milliseconds timeout = kDefaultCheckoutTimeout);

    PoolState state() const;

    const std::string& name() const { return m_name; }

    const std::string& location() const { return m_location; }

    size_t poolSize() const { return m_poolSize; }

    EngineMetrics& metrics() const { return *m_metrics; }

    // ----- ConnectionPool interface implementation -----

    size_t availableCount() const override;
    size_t totalCount() const override;
    size_t inUseCount() const override;
    size_t waitingCount() const override;

    /**
     * @brief Ping the engine, restarting it on failure.
     * @return true if the pool is serving after the check.
     */
    bool healthCheck() override;

    /**
     * @brief Close idle connections; their slots are recreated on demand.
     */
    void drain() override;

private:
    friend class PooledConnection;

    void checkin(std::unique_ptr<SQLiteConnection> conn, uint64_t generation, Checkin action);

    void destroyIdleLocked();

    std::string m_name;
    std::string m_location;
    size_t m_poolSize;
    EngineConfig m_config;
    std::shared_ptr<EngineMetrics> m_metrics;

    std::shared_ptr<SQLiteEngine> m_engine;                  ///< Stage 1
    std::deque<std::unique_ptr<SQLiteConnection>> m_idle;    ///< Stage 2, ready for checkout
    size_t m_created = 0;      ///< Slots in use: idle + checked out + being opened
    size_t m_inUse = 0;        ///< Checked out or being opened
    size_t m_waiting = 0;      ///< Callers blocked in checkout()
    uint64_t m_generation = 0; ///< Bumped by restarts; older connections are stale
    PoolState m_state = PoolState::Stopped;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
};

}  // namespace sqlkit
