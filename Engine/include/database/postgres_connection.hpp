/**
 * @file postgres_connection.hpp
 * @brief PostgreSQL connection and query interface
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <libpq-fe.h>

namespace Lexigraph {

/**
 * @brief PostgreSQL connection wrapper
 *
 * Every failure surfaces as LedgerError.
 */
class PostgresConnection {
public:
    /**
     * @brief Connect with explicit connection string
     * @throws LedgerError if the connection cannot be established
     */
    explicit PostgresConnection(const std::string& conninfo);

    ~PostgresConnection();

    // No copy
    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;

    bool is_connected() const;

    /**
     * @brief Execute statement (no results expected)
     */
    void execute(const std::string& sql);

    /**
     * @brief Execute statement with text parameters ($1, $2, ...)
     */
    void execute(const std::string& sql, const std::vector<std::string>& params);

    /**
     * @brief First column of the first row, if any
     */
    std::optional<std::string> query_single(const std::string& sql, const std::vector<std::string>& params = {});

    void begin();
    void commit();
    void rollback();

    /**
     * @brief RAII transaction guard; rolls back unless committed
     */
    class Transaction {
    public:
        explicit Transaction(PostgresConnection& conn);
        ~Transaction();

        void commit();

    private:
        PostgresConnection& conn_;
        bool done_ = false;
    };

private:
    void connect(const std::string& conninfo);
    void disconnect();
    void ensure_connected() const;
    PGresult* exec_params(const std::string& sql, const std::vector<std::string>& params);
    void check_result(PGresult* result);

    PGconn* conn_ = nullptr;
};

} // namespace Lexigraph
