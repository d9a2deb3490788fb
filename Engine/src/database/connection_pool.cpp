/**
 * @file connection_pool.cpp
 */

#include <database/connection_pool.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>

namespace Reef {

PostgresConnectionPool::Lease::Lease(PostgresConnectionPool& pool, std::unique_ptr<PostgresConnection> conn)
    : pool_(&pool), conn_(std::move(conn)) {}

PostgresConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), conn_(std::move(other.conn_)) {
    other.pool_ = nullptr;
}

PostgresConnectionPool::Lease::~Lease() {
    if (pool_ && conn_) pool_->release(std::move(conn_));
}

PostgresConnectionPool::PostgresConnectionPool(size_t max_connections, std::string conninfo)
    : max_(max_connections), conninfo_(std::move(conninfo)) {
    if (max_ == 0) {
        throw ConfigError("Connection pool needs at least one connection");
    }
    idle_.push_back(open());
    open_ = 1;
}

std::unique_ptr<PostgresConnection> PostgresConnectionPool::open() const {
    if (conninfo_.empty()) return std::make_unique<PostgresConnection>();
    return std::make_unique<PostgresConnection>(conninfo_);
}

PostgresConnectionPool::Lease PostgresConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    available_.wait(lock, [this] { return !idle_.empty() || open_ < max_; });

    if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Lease(*this, std::move(conn));
    }

    // Reserve the slot, then connect without holding the lock
    ++open_;
    lock.unlock();
    try {
        return Lease(*this, open());
    } catch (...) {
        lock.lock();
        --open_;
        available_.notify_one();
        throw;
    }
}

void PostgresConnectionPool::release(std::unique_ptr<PostgresConnection> conn) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (conn->is_connected()) {
        idle_.push_back(std::move(conn));
    } else {
        Logger::warn("Dropping broken PostgreSQL connection: " + conn->last_error());
        --open_;
    }
    available_.notify_one();
}

size_t PostgresConnectionPool::open_connections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

size_t PostgresConnectionPool::idle_connections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

} // namespace Reef
