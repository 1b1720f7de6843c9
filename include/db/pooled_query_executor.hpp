#pragma once

#include "db/iconnection_pool.hpp"
#include "db/iquery_executor.hpp"
#include <chrono>
#include <cstdint>
#include <memory>

namespace readrouter {

/**
 * @brief Query executor backed by one endpoint's connection pool
 *
 * Acquires a connection with a bounded wait, applies the statement timeout,
 * runs the statement and classifies failures:
 * - pool exhausted / endpoint unreachable / connection dropped → CONNECTION_ERROR
 * - statement rejected or cancelled by statement_timeout → QUERY_ERROR
 */
class PooledQueryExecutor : public IQueryExecutor {
public:
    struct Config {
        std::chrono::milliseconds acquire_timeout{2000};
        std::chrono::milliseconds query_timeout{5000};
        uint32_t max_result_rows = 10000;
    };

    PooledQueryExecutor(std::shared_ptr<IConnectionPool> pool, const Config& config);

    explicit PooledQueryExecutor(std::shared_ptr<IConnectionPool> pool)
        : PooledQueryExecutor(std::move(pool), Config{}) {}

    ~PooledQueryExecutor() override = default;

    QueryResult execute(const Statement& stmt) override;

private:
    std::shared_ptr<IConnectionPool> pool_;
    Config config_;
};

} // namespace readrouter
