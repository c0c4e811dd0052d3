/**
 * @file PoolSupervisor.cpp
 * @brief Implementation of the two-stage SQLite pool supervisor.
 *
 * Uses one mutex and condition variable for every state change. Native
 * connects happen outside the lock with the slot reserved beforehand, so a
 * slow open never blocks other callers.
 */

#include "PoolSupervisor.hpp"
#include "Errors.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace sqlkit {

const char* poolStateName(PoolState state) {
    switch (state) {
        case PoolState::Stopped:          return "stopped";
        case PoolState::HandleHeld:       return "handle-held";
        case PoolState::ConnectionsReady: return "ready";
        case PoolState::Restarting:       return "restarting";
        case PoolState::Stopping:         return "stopping";
    }
    return "unknown";
}

// ============================================================================
// Pooled Connection Lease
// ============================================================================

PooledConnection::PooledConnection(std::shared_ptr<PoolSupervisor> pool,
                                   std::unique_ptr<SQLiteConnection> conn, uint64_t generation)
    : m_pool(std::move(pool)), m_conn(std::move(conn)), m_generation(generation) {
}

PooledConnection::~PooledConnection() {
    release(Checkin::Keep);
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : m_pool(std::move(other.m_pool))
    , m_conn(std::move(other.m_conn))
    , m_generation(other.m_generation) {
}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        release(Checkin::Keep);
        m_pool = std::move(other.m_pool);
        m_conn = std::move(other.m_conn);
        m_generation = other.m_generation;
    }
    return *this;
}

void PooledConnection::release(Checkin action) {
    if (m_pool && m_conn) {
        m_pool->checkin(std::move(m_conn), m_generation, action);
    }
    // May destroy the supervisor when this was the last owner
    m_pool.reset();
}

// ============================================================================
// Construction and Destruction
// ============================================================================

PoolSupervisor::PoolSupervisor(std::string name, std::string location, size_t poolSize,
                               EngineConfig config, std::shared_ptr<EngineMetrics> metrics)
    : m_name(std::move(name))
    , m_location(std::move(location))
    , m_poolSize(poolSize)
    , m_config(std::move(config))
    , m_metrics(metrics ? std::move(metrics) : std::make_shared<EngineMetrics>()) {
    if (m_poolSize == 0) {
        throw std::invalid_argument("pool size must be at least 1");
    }
}

PoolSupervisor::~PoolSupervisor() {
    stop();
}

// ============================================================================
// Lifecycle
// ============================================================================

void PoolSupervisor::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state != PoolState::Stopped) {
        spdlog::warn("Pool '{}' is already {}", m_name, poolStateName(m_state));
        return;
    }

    m_engine = SQLiteEngine::open(m_location, m_config, m_metrics);
    m_state = PoolState::HandleHeld;

    ++m_generation;
    m_state = PoolState::ConnectionsReady;
    m_cv.notify_all();

    spdlog::info("Pool '{}' started on '{}' with {} connection slots",
                 m_name, m_location, m_poolSize);
}

void PoolSupervisor::stop() {
    std::unique_lock<std::mutex> lock(m_mutex);

    if (m_state == PoolState::Stopped) {
        return;
    }
    if (m_state == PoolState::Stopping) {
        m_cv.wait(lock, [this] { return m_state == PoolState::Stopped; });
        return;
    }

    m_state = PoolState::Stopping;
    m_cv.notify_all();

    // In-flight operations finish; their connections are destroyed on checkin
    m_cv.wait(lock, [this] { return m_inUse == 0; });

    destroyIdleLocked();
    if (m_engine) {
        m_engine->release();
        m_engine.reset();
    }

    m_state = PoolState::Stopped;
    m_cv.notify_all();
    spdlog::info("Pool '{}' stopped", m_name);
}

void PoolSupervisor::restartConnections() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state != PoolState::ConnectionsReady) {
        throw PoolClosedError(m_name);
    }

    ++m_generation;
    destroyIdleLocked();
    m_cv.notify_all();
    spdlog::info("Pool '{}' restarted its connections", m_name);
}

void PoolSupervisor::restartEngine() {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_state != PoolState::ConnectionsReady) {
        throw PoolClosedError(m_name);
    }

    m_state = PoolState::Restarting;
    ++m_generation;
    destroyIdleLocked();

    m_cv.wait(lock, [this] { return m_inUse == 0; });
    if (m_state != PoolState::Restarting) {
        // stop() took over while we waited
        return;
    }

    destroyIdleLocked();
    m_engine->release();
    m_engine.reset();
    m_state = PoolState::Stopped;

    try {
        m_engine = SQLiteEngine::open(m_location, m_config, m_metrics);
    } catch (const EngineOpenError& e) {
        spdlog::error("Pool '{}' could not reopen its database: {}", m_name, e.what());
        m_cv.notify_all();
        throw;
    }

    m_state = PoolState::HandleHeld;
    ++m_generation;
    m_state = PoolState::ConnectionsReady;
    m_cv.notify_all();
    spdlog::info("Pool '{}' restarted its database", m_name);
}

// ============================================================================
// Checkout and Checkin
// ============================================================================

PooledConnection PoolSupervisor::checkout(std::chrono::milliseconds timeout) {
    std::shared_ptr<PoolSupervisor> self = shared_from_this();
    std::optional<std::chrono::steady_clock::time_point> deadline = checkoutDeadline(timeout);
    std::unique_lock<std::mutex> lock(m_mutex);

    ++m_waiting;
    for (;;) {
        if (m_state == PoolState::Stopped || m_state == PoolState::Stopping) {
            --m_waiting;
            throw PoolClosedError(m_name);
        }

        if (m_state == PoolState::ConnectionsReady) {
            if (!m_idle.empty()) {
                std::unique_ptr<SQLiteConnection> conn = std::move(m_idle.front());
                m_idle.pop_front();
                --m_waiting;
                ++m_inUse;
                return PooledConnection(std::move(self), std::move(conn), m_generation);
            }

            if (m_created < m_poolSize) {
                // Reserve the slot, then open the session without holding the lock
                ++m_created;
                ++m_inUse;
                --m_waiting;
                uint64_t generation = m_generation;
                std::shared_ptr<SQLiteEngine> engine = m_engine;
                lock.unlock();

                try {
                    std::unique_ptr<SQLiteConnection> conn = SQLiteConnection::connect(*engine);
                    spdlog::debug("Pool '{}' opened a connection", m_name);
                    return PooledConnection(std::move(self), std::move(conn), generation);
                } catch (const std::exception& e) {
                    spdlog::error("Pool '{}' failed to open a connection: {}", m_name, e.what());
                    lock.lock();
                    --m_created;
                    --m_inUse;
                    m_cv.notify_all();
                    throw;
                }
            }
        }

        if (!deadline) {
            m_cv.wait(lock);
        } else if (m_cv.wait_until(lock, *deadline) == std::cv_status::timeout) {
            --m_waiting;
            spdlog::warn("Pool '{}' checkout timed out after {}ms", m_name, timeout.count());
            throw CheckoutTimeoutError(m_name, timeout);
        }
    }
}

void PoolSupervisor::checkin(std::unique_ptr<SQLiteConnection> conn, uint64_t generation,
                             Checkin action) {
    std::lock_guard<std::mutex> lock(m_mutex);
    --m_inUse;

    bool keep = action == Checkin::Keep &&
                generation == m_generation &&
                m_state == PoolState::ConnectionsReady;

    if (keep) {
        m_idle.push_back(std::move(conn));
    } else {
        // Closed under the lock so the engine is never released first
        conn.reset();
        --m_created;
        spdlog::debug("Pool '{}' discarded a connection", m_name);
    }

    m_cv.notify_all();
}

void PoolSupervisor::destroyIdleLocked() {
    m_created -= m_idle.size();
    m_idle.clear();
}

// ============================================================================
// Pool Statistics and Management
// ============================================================================

PoolState PoolSupervisor::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

size_t PoolSupervisor::availableCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_idle.size();
}

size_t PoolSupervisor::totalCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_created;
}

size_t PoolSupervisor::inUseCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_inUse;
}

size_t PoolSupervisor::waitingCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_waiting;
}

bool PoolSupervisor::healthCheck() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state != PoolState::ConnectionsReady) {
            return false;
        }
        if (m_engine->ping()) {
            return true;
        }
    }

    spdlog::warn("Pool '{}' failed its health check, restarting the database", m_name);
    try {
        restartEngine();
    } catch (const SqlKitError& e) {
        spdlog::error("Pool '{}' restart failed: {}", m_name, e.what());
        return false;
    }
    return state() == PoolState::ConnectionsReady;
}

void PoolSupervisor::drain() {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t closed = m_idle.size();
    destroyIdleLocked();
    m_cv.notify_all();
    spdlog::info("Pool '{}' drained {} idle connections", m_name, closed);
}

}  // namespace sqlkit
