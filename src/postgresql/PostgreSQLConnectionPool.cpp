/**
 * @file PostgreSQLConnectionPool.cpp
 * @brief Implementation of the PostgreSQL session pool.
 *
 * Follows the same slot accounting as the SQLite pool supervisor: a slot is
 * reserved under the lock and the session is opened outside it.
 */

#include "PostgreSQLConnectionPool.hpp"
#include "Errors.hpp"
#include <spdlog/spdlog.h>
#include <sstream>

namespace sqlkit {

namespace {

// Quotes a conninfo value when libpq would otherwise misread it
std::string conninfoValue(const std::string& value) {
    bool plain = !value.empty() &&
                 value.find_first_of(" '\\\t") == std::string::npos;
    if (plain) return value;

    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') quoted += '\\';
        quoted += c;
    }
    quoted += "'";
    return quoted;
}

}  // namespace

// ============================================================================
// Lease
// ============================================================================

PostgreSQLLease::PostgreSQLLease(PostgreSQLConnectionPool* pool,
                                 std::unique_ptr<PostgreSQLConnection> conn)
    : m_pool(pool), m_conn(std::move(conn)) {
}

PostgreSQLLease::~PostgreSQLLease() {
    release(Checkin::Keep);
}

PostgreSQLLease::PostgreSQLLease(PostgreSQLLease&& other) noexcept
    : m_pool(other.m_pool), m_conn(std::move(other.m_conn)) {
    other.m_pool = nullptr;
}

void PostgreSQLLease::release(Checkin action) {
    if (m_pool && m_conn) {
        m_pool->checkin(std::move(m_conn), action);
    }
    m_pool = nullptr;
}

// ============================================================================
// Construction and Destruction
// ============================================================================

PostgreSQLConnectionPool::PostgreSQLConnectionPool(const ServerConfig& config)
    : m_config(config)
    , m_conninfo(connectionString(config))
    , m_poolSize(config.pool_size == 0 ? 1 : config.pool_size) {
    spdlog::info("PostgreSQL pool {} ready ({} sessions max)", name(), m_poolSize);
}

PostgreSQLConnectionPool::~PostgreSQLConnectionPool() {
    close();
}

std::string PostgreSQLConnectionPool::connectionString(const ServerConfig& config) {
    std::ostringstream out;
    auto add = [&out](const char* key, const std::string& value) {
        if (value.empty()) return;
        if (out.tellp() > 0) out << ' ';
        out << key << '=' << conninfoValue(value);
    };

    add("host", config.host);
    add("port", std::to_string(config.port));
    add("user", config.user);
    add("password", config.password);
    add("dbname", config.database);

    // libpq takes whole seconds; 0 would mean wait forever
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(config.connect_timeout);
    add("connect_timeout", std::to_string(seconds.count() > 0 ? seconds.count() : 1));

    if (config.use_ssl) {
        add("sslmode", "require");
        add("sslrootcert", config.ssl_ca);
        add("sslcert", config.ssl_cert);
        add("sslkey", config.ssl_key);
    } else {
        add("sslmode", "prefer");
    }

    add("application_name", "sqlkit");
    return out.str();
}

std::string PostgreSQLConnectionPool::name() const {
    return "postgresql://" + m_config.host + ":" + std::to_string(m_config.port) + "/" +
           m_config.database;
}

// ============================================================================
// Lease and Return
// ============================================================================

PostgreSQLLease PostgreSQLConnectionPool::acquire(std::chrono::milliseconds timeout) {
    std::optional<std::chrono::steady_clock::time_point> deadline = checkoutDeadline(timeout);
    std::unique_lock<std::mutex> lock(m_mutex);

    ++m_waiting;
    for (;;) {
        if (m_closed) {
            --m_waiting;
            throw PoolClosedError(name());
        }

        while (!m_idle.empty()) {
            std::unique_ptr<PostgreSQLConnection> conn = std::move(m_idle.front());
            m_idle.pop_front();
            if (conn->isOpen()) {
                --m_waiting;
                ++m_inUse;
                return PostgreSQLLease(this, std::move(conn));
            }
            --m_created;
            spdlog::debug("Closed a dropped PostgreSQL session");
        }

        if (m_created < m_poolSize) {
            ++m_created;
            ++m_inUse;
            --m_waiting;
            lock.unlock();

            try {
                std::unique_ptr<PostgreSQLConnection> conn =
                    PostgreSQLConnection::connect(m_conninfo);
                spdlog::debug("Opened a PostgreSQL session on {}", name());
                return PostgreSQLLease(this, std::move(conn));
            } catch (const SqlKitError& e) {
                spdlog::error("Failed to open a PostgreSQL session: {}", e.what());
                lock.lock();
                --m_created;
                --m_inUse;
                m_cv.notify_all();
                throw;
            }
        }

        if (!deadline) {
            m_cv.wait(lock);
        } else if (m_cv.wait_until(lock, *deadline) == std::cv_status::timeout) {
            --m_waiting;
            throw CheckoutTimeoutError(name(), timeout);
        }
    }
}

void PostgreSQLConnectionPool::checkin(std::unique_ptr<PostgreSQLConnection> conn,
                                       Checkin action) {
    std::lock_guard<std::mutex> lock(m_mutex);
    --m_inUse;

    if (action == Checkin::Keep && !m_closed && conn->isOpen()) {
        m_idle.push_back(std::move(conn));
    } else {
        conn.reset();
        --m_created;
    }
    m_cv.notify_all();
}

// ============================================================================
// Query Execution
// ============================================================================

std::unique_ptr<ServerResult> PostgreSQLConnectionPool::run(const std::string& sql,
                                                           const std::vector<Value>& params,
                                                           const QueryOptions& opts) {
    ErrorContext context("server " + name());
    PostgreSQLLease lease = acquire(opts.timeout);
    return std::make_unique<PostgreSQLResultSet>(lease->run(sql, params));
}

// ============================================================================
// Pool Statistics and Management
// ============================================================================

size_t PostgreSQLConnectionPool::availableCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_idle.size();
}

size_t PostgreSQLConnectionPool::totalCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_created;
}

size_t PostgreSQLConnectionPool::inUseCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_inUse;
}

size_t PostgreSQLConnectionPool::waitingCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_waiting;
}

bool PostgreSQLConnectionPool::healthCheck() {
    try {
        PostgreSQLLease lease = acquire(std::chrono::milliseconds(1000));
        if (lease->ping()) {
            return true;
        }
        lease.release(Checkin::Discard);
    } catch (const SqlKitError& e) {
        spdlog::warn("PostgreSQL health check failed: {}", e.what());
    }
    return false;
}

void PostgreSQLConnectionPool::drain() {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t closed = m_idle.size();
    m_created -= closed;
    m_idle.clear();
    m_cv.notify_all();
    spdlog::info("PostgreSQL pool {} drained {} idle sessions", name(), closed);
}

void PostgreSQLConnectionPool::close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed) return;
    m_closed = true;
    m_created -= m_idle.size();
    m_idle.clear();
    m_cv.notify_all();
    spdlog::info("PostgreSQL pool {} closed", name());
}

}  // namespace sqlkit
