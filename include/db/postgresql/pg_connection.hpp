#pragma once

#include "db/iconnection_factory.hpp"
#include "db/idb_connection.hpp"
#include <libpq-fe.h>
#include <chrono>
#include <string>
#include <vector>

namespace readrouter {

/**
 * @brief PostgreSQL connection implementing IDbConnection
 *
 * Wraps PGconn*. All libpq calls are encapsulated here; statements are sent
 * with PQsendQueryParams so payloads and session ids are never spliced into SQL.
 *
 * Every round trip has a client-side deadline on top of the server's
 * statement_timeout, so a peer that stops answering (partition, frozen
 * backend) cannot block the caller forever. A connection that misses its
 * deadline is closed and reported as lost.
 */
class PgConnection : public IDbConnection {
public:
    /**
     * @brief Construct from existing PGconn* (takes ownership)
     */
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql, const std::vector<std::string>& params) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    bool set_query_timeout(uint32_t timeout_ms) override;
    void close() override;

    /// Client wait limit for a statement under `statement_timeout_ms` (0 = unbounded)
    [[nodiscard]] static std::chrono::milliseconds client_deadline(uint32_t statement_timeout_ms);

    /// Extra time the server gets to report its own statement timeout
    static constexpr std::chrono::milliseconds kDeadlineGrace{1000};

    /// Limit for SET and health-check round trips
    static constexpr std::chrono::milliseconds kControlTimeout{5000};

private:
    /// Send and wait; nullptr with `error` set on failure or missed deadline
    PGresult* exec_with_deadline(const std::string& sql, const std::vector<std::string>& params,
                                 std::chrono::milliseconds limit, std::string& error);

    DbResultSet process_tuples_result(PGresult* res);
    DbResultSet process_command_result(PGresult* res);
    DbResultSet failure(std::string message);

    PGconn* conn_;
    uint32_t current_timeout_ms_ = 0;
};

/**
 * @brief PostgreSQL connection factory
 *
 * Creates PgConnection instances using PQconnectdb. Connect timeouts come
 * from the connect_timeout keyword in the connection string.
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override;
};

} // namespace readrouter
