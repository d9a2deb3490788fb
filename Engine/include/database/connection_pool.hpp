/**
 * @file connection_pool.hpp
 * @brief Bounded pool of PostgreSQL connections
 */

#pragma once

#include <export.hpp>
#include <database/postgres_connection.hpp>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Reef {

/**
 * @brief Hands out one private connection per concurrent caller
 *
 * Connections are opened lazily up to the limit; a caller that finds every
 * connection leased waits for one to come back. A connection that reports
 * itself broken is dropped on return and reopened on demand.
 */
class REEF_API PostgresConnectionPool {
public:
    /**
     * @brief Exclusive use of one connection until destroyed
     */
    class REEF_API Lease {
    public:
        Lease(PostgresConnectionPool& pool, std::unique_ptr<PostgresConnection> conn);
        ~Lease();

        Lease(Lease&& other) noexcept;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease& operator=(Lease&&) = delete;

        PostgresConnection& operator*() { return *conn_; }
        PostgresConnection* operator->() { return conn_.get(); }

    private:
        PostgresConnectionPool* pool_;
        std::unique_ptr<PostgresConnection> conn_;
    };

    /**
     * @param max_connections Upper bound on open connections
     * @param conninfo libpq connection string; empty uses the PG* environment
     * @throws StorageError if the first connection cannot be opened
     * @throws ConfigError if max_connections is 0
     */
    explicit PostgresConnectionPool(size_t max_connections = 4, std::string conninfo = "");

    PostgresConnectionPool(const PostgresConnectionPool&) = delete;
    PostgresConnectionPool& operator=(const PostgresConnectionPool&) = delete;

    /**
     * @throws StorageError if a new connection is needed and cannot be opened
     */
    Lease acquire();

    size_t max_connections() const { return max_; }
    size_t open_connections() const;
    size_t idle_connections() const;

private:
    std::unique_ptr<PostgresConnection> open() const;
    void release(std::unique_ptr<PostgresConnection> conn);

    const size_t max_;
    const std::string conninfo_;

    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::vector<std::unique_ptr<PostgresConnection>> idle_;
    size_t open_ = 0;
};

} // namespace Reef
