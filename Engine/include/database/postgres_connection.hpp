/**
 * @file postgres_connection.hpp
 * @brief PostgreSQL connection and query interface
 */

#pragma once

#include <export.hpp>
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <libpq-fe.h>

namespace Reef {

/**
 * @brief PostgreSQL connection wrapper
 *
 * All failures surface as StorageError. Not thread-safe: callers that share a
 * connection serialize access themselves.
 */
class REEF_API PostgresConnection {
public:
    using Row = std::vector<std::optional<std::string>>;

    /**
     * @brief Connect using environment variables
     *
     * Uses: PGHOST, PGPORT, PGDATABASE, PGUSER, PGPASSWORD
     * Defaults: localhost, 5432, reef, postgres, (no password)
     */
    PostgresConnection();

    explicit PostgresConnection(const std::string& conninfo);

    ~PostgresConnection();

    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;

    PostgresConnection(PostgresConnection&& other) noexcept;
    PostgresConnection& operator=(PostgresConnection&& other) noexcept;

    bool is_connected() const;

    void execute(const std::string& sql);

    /**
     * @brief Execute a parameterized statement
     * @return Number of rows affected
     */
    size_t execute(const std::string& sql, const std::vector<std::optional<std::string>>& params);

    std::optional<std::string> query_single(const std::string& sql,
                                            const std::vector<std::optional<std::string>>& params = {});

    /**
     * @brief Execute query and iterate rows
     *
     * SQL NULL arrives as std::nullopt.
     */
    void query(const std::string& sql, const std::vector<std::optional<std::string>>& params,
               const std::function<void(const Row&)>& callback);

    void begin();
    void commit();
    void rollback();

    /**
     * @brief RAII transaction guard, rolls back unless committed
     */
    class REEF_API Transaction {
    public:
        explicit Transaction(PostgresConnection& conn);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();
        void rollback();

    private:
        PostgresConnection& conn_;
        bool done_ = false;
    };

    std::string last_error() const;

private:
    void connect(const std::string& conninfo);
    void disconnect();
    PGresult* exec(const std::string& sql, const std::vector<std::optional<std::string>>& params);
    void check_result(PGresult* result);

    PGconn* conn_ = nullptr;
    std::string last_error_;
};

} // namespace Reef
