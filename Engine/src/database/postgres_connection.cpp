/**
 * @file postgres_connection.cpp
 * @brief PostgreSQL connection implementation
 */

#include <database/postgres_connection.hpp>
#include <errors.hpp>
#include <utils/logger.hpp>

namespace Lexigraph {

PostgresConnection::PostgresConnection(const std::string& conninfo) {
    connect(conninfo);
}

PostgresConnection::~PostgresConnection() {
    disconnect();
}

void PostgresConnection::connect(const std::string& conninfo) {
    conn_ = PQconnectdb(conninfo.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        const std::string error = PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        throw LedgerError("PostgreSQL connection failed: " + error);
    }
}

void PostgresConnection::disconnect() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

bool PostgresConnection::is_connected() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

void PostgresConnection::ensure_connected() const {
    if (!is_connected()) throw LedgerError("Not connected to database");
}

void PostgresConnection::check_result(PGresult* result) {
    ExecStatusType status = PQresultStatus(result);

    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
        const std::string error = PQerrorMessage(conn_);
        PQclear(result);
        throw LedgerError("PostgreSQL query failed: " + error);
    }
}

PGresult* PostgresConnection::exec_params(const std::string& sql, const std::vector<std::string>& params) {
    ensure_connected();

    std::vector<const char*> param_values;
    param_values.reserve(params.size());
    for (const auto& p : params) {
        param_values.push_back(p.c_str());
    }

    PGresult* result = PQexecParams(
        conn_,
        sql.c_str(),
        static_cast<int>(params.size()),
        nullptr,
        param_values.empty() ? nullptr : param_values.data(),
        nullptr,
        nullptr,
        0  // Text format
    );

    check_result(result);
    return result;
}

void PostgresConnection::execute(const std::string& sql) {
    ensure_connected();
    PGresult* result = PQexec(conn_, sql.c_str());
    check_result(result);
    PQclear(result);
}

void PostgresConnection::execute(const std::string& sql, const std::vector<std::string>& params) {
    PQclear(exec_params(sql, params));
}

std::optional<std::string> PostgresConnection::query_single(const std::string& sql, const std::vector<std::string>& params) {
    PGresult* result = exec_params(sql, params);

    std::optional<std::string> value;
    if (PQntuples(result) > 0 && PQnfields(result) > 0 && !PQgetisnull(result, 0, 0)) {
        value = PQgetvalue(result, 0, 0);
    }

    PQclear(result);
    return value;
}

void PostgresConnection::begin() {
    execute("BEGIN");
}

void PostgresConnection::commit() {
    execute("COMMIT");
}

void PostgresConnection::rollback() {
    execute("ROLLBACK");
}

// Transaction RAII
PostgresConnection::Transaction::Transaction(PostgresConnection& conn) : conn_(conn) {
    conn_.begin();
}

PostgresConnection::Transaction::~Transaction() {
    if (done_) return;
    try {
        conn_.rollback();
    } catch (const LedgerError& e) {
        Logger::warn(std::string("Rollback failed: ") + e.what());
    }
}

void PostgresConnection::Transaction::commit() {
    conn_.commit();
    done_ = true;
}

} // namespace Lexigraph
