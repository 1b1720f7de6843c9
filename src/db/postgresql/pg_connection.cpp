#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"
#include <cerrno>
#include <cstring>
#include <format>
#include <poll.h>

namespace readrouter {

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

std::chrono::milliseconds PgConnection::client_deadline(uint32_t statement_timeout_ms) {
    if (statement_timeout_ms == 0) {
        return std::chrono::milliseconds{0};
    }
    return std::chrono::milliseconds{statement_timeout_ms} + kDeadlineGrace;
}

PGresult* PgConnection::exec_with_deadline(
    const std::string& sql, const std::vector<std::string>& params,
    std::chrono::milliseconds limit, std::string& error) {

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p.c_str());
    }

    if (PQsendQueryParams(
            conn_, sql.c_str(),
            static_cast<int>(values.size()),
            nullptr,                                   // infer parameter types
            values.empty() ? nullptr : values.data(),
            nullptr, nullptr,                          // text format
            0) == 0) {                                 // text results
        error = utils::trim(PQerrorMessage(conn_));
        return nullptr;
    }

    const auto give_up_at = std::chrono::steady_clock::now() + limit;
    while (true) {
        if (PQconsumeInput(conn_) == 0) {
            error = utils::trim(PQerrorMessage(conn_));
            return nullptr;
        }
        if (PQisBusy(conn_) == 0) {
            break;
        }

        int wait_ms = -1;
        if (limit.count() > 0) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                give_up_at - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                // The server cancels on its own statement_timeout; the socket is not reused
                error = std::format("No response from server within {}ms, connection abandoned",
                    limit.count());
                close();
                return nullptr;
            }
            wait_ms = static_cast<int>(remaining.count());
        }

        pollfd pfd{};
        pfd.fd = PQsocket(conn_);
        pfd.events = POLLIN;
        if (::poll(&pfd, 1, wait_ms) < 0 && errno != EINTR) {
            error = std::format("poll() failed: {}", std::strerror(errno));
            close();
            return nullptr;
        }
    }

    PGresult* result = PQgetResult(conn_);
    // Single statement; drain anything trailing so the connection is idle again
    while (PGresult* extra = PQgetResult(conn_)) {
        PQclear(extra);
    }
    if (!result) {
        error = utils::trim(PQerrorMessage(conn_));
    }
    return result;
}

DbResultSet PgConnection::execute(const std::string& sql, const std::vector<std::string>& params) {
    if (!conn_) {
        return failure("Connection is closed");
    }

    std::string error;
    PGresult* res = exec_with_deadline(sql, params, client_deadline(current_timeout_ms_), error);
    if (!res) {
        return failure(std::move(error));
    }

    const ExecStatusType status = PQresultStatus(res);

    if (status == PGRES_TUPLES_OK) {
        auto result = process_tuples_result(res);
        PQclear(res);
        return result;
    }

    if (status == PGRES_COMMAND_OK) {
        auto result = process_command_result(res);
        PQclear(res);
        return result;
    }

    std::string message = utils::trim(PQresultErrorMessage(res));
    PQclear(res);
    return failure(std::move(message));
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
        return false;
    }

    std::string error;
    PGresult* res = exec_with_deadline(health_check_query, {}, kControlTimeout, error);
    if (!res) {
        utils::log::debug(std::format("Health check failed: {}", error));
        return false;
    }

    const ExecStatusType status = PQresultStatus(res);
    PQclear(res);

    return (status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK);
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!conn_) {
        return false;
    }
    if (timeout_ms == current_timeout_ms_) {
        return true;
    }

    const std::string timeout_sql = std::format("SET statement_timeout = {}", timeout_ms);

    std::string error;
    PGresult* res = exec_with_deadline(timeout_sql, {}, kControlTimeout, error);
    if (!res) {
        utils::log::warn(std::format("Failed to set statement_timeout: {}", error));
        return false;
    }

    const bool success = (PQresultStatus(res) == PGRES_COMMAND_OK);
    PQclear(res);
    if (success) {
        current_timeout_ms_ = timeout_ms;
    }
    return success;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::failure(std::string message) {
    DbResultSet result;
    result.success = false;
    result.error_message = std::move(message);
    result.connection_lost = !is_connected();
    return result;
}

DbResultSet PgConnection::process_tuples_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const int ncols = PQnfields(res);
    for (int i = 0; i < ncols; i++) {
        result.column_names.emplace_back(PQfname(res, i));
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(nrows);
    result.null_mask.reserve(nrows);

    for (int i = 0; i < nrows; i++) {
        std::vector<std::string> row;
        std::vector<bool> nulls;
        row.reserve(ncols);
        nulls.reserve(ncols);
        for (int j = 0; j < ncols; j++) {
            const bool is_null = PQgetisnull(res, i, j) != 0;
            nulls.push_back(is_null);
            row.emplace_back(is_null ? "" : PQgetvalue(res, i, j));
        }
        result.rows.push_back(std::move(row));
        result.null_mask.push_back(std::move(nulls));
    }

    return result;
}

DbResultSet PgConnection::process_command_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = false;

    const char* affected = PQcmdTuples(res);
    if (affected && std::strlen(affected) > 0) {
        result.affected_rows = utils::try_parse_int<uint64_t>(affected).value_or(0);
    }

    return result;
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> PgConnectionFactory::create(
    const std::string& connection_string) {

    PGconn* conn = PQconnectdb(connection_string.c_str());

    if (!conn) {
        utils::log::error("Failed to allocate PGconn");
        return nullptr;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        utils::log::error(std::format("Failed to connect: {}", utils::trim(PQerrorMessage(conn))));
        PQfinish(conn);
        return nullptr;
    }

    return std::make_unique<PgConnection>(conn);
}

} // namespace readrouter
