#pragma once

#include <chrono>
#include <cstddef>
#include <optional>

namespace sqlkit {

// Deadline for a checkout wait; empty when now + timeout would overflow
inline std::optional<std::chrono::steady_clock::time_point> checkoutDeadline(
    std::chrono::milliseconds timeout) {
    auto now = std::chrono::steady_clock::now();
    auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::time_point::max() - now);
    if (timeout >= headroom) {
        return std::nullopt;
    }
    return now + timeout;
}

// Statistics and maintenance shared by the SQLite and PostgreSQL pools
class ConnectionPool {
public:
    virtual ~ConnectionPool() = default;

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // Idle connections ready for checkout
    virtual size_t availableCount() const = 0;
    // Occupied slots: idle, checked out or being opened
    virtual size_t totalCount() const = 0;
    virtual size_t inUseCount() const = 0;
    virtual size_t waitingCount() const = 0;

    // True if the pool can serve a query after the check
    virtual bool healthCheck() = 0;

    // Close idle connections; the pool keeps serving and reopens on demand
    virtual void drain() = 0;

protected:
    ConnectionPool() = default;
};

}  // namespace sqlkit
