#include "db/pooled_query_executor.hpp"
#include "db/pooled_connection.hpp"
#include "core/utils.hpp"
#include <format>

namespace readrouter {

PooledQueryExecutor::PooledQueryExecutor(
    std::shared_ptr<IConnectionPool> pool,
    const Config& config)
    : pool_(std::move(pool)),
      config_(config) {}

QueryResult PooledQueryExecutor::execute(const Statement& stmt) {
    utils::Timer timer;
    QueryResult result;

    auto conn_handle = pool_->acquire(config_.acquire_timeout);
    if (!conn_handle || !conn_handle->is_valid()) {
        result.success = false;
        result.error_code = ErrorCode::CONNECTION_ERROR;
        result.error_message = std::format("No usable connection to endpoint '{}'", pool_->name());
        result.execution_time = timer.elapsed_us();
        return result;
    }

    auto* conn = conn_handle->get();

    const auto timeout = stmt.timeout.value_or(config_.query_timeout);
    if (!conn->set_query_timeout(static_cast<uint32_t>(timeout.count()))) {
        conn_handle->discard();
        result.success = false;
        result.error_code = ErrorCode::CONNECTION_ERROR;
        result.error_message = std::format("Failed to apply statement timeout on endpoint '{}'", pool_->name());
        result.execution_time = timer.elapsed_us();
        return result;
    }

    try {
        auto db_result = conn->execute(stmt.sql, stmt.params);
        result.execution_time = timer.elapsed_us();

        if (!db_result.success) {
            if (db_result.connection_lost) {
                conn_handle->discard();
            }
            result.success = false;
            result.error_code = db_result.connection_lost
                ? ErrorCode::CONNECTION_ERROR : ErrorCode::QUERY_ERROR;
            result.error_message = std::move(db_result.error_message);
            return result;
        }

        if (config_.max_result_rows > 0 && db_result.rows.size() > config_.max_result_rows) {
            result.success = false;
            result.error_code = ErrorCode::QUERY_ERROR;
            result.error_message = std::format("Result set exceeds max_result_rows limit ({} rows)",
                config_.max_result_rows);
            return result;
        }

        result.success = true;
        result.column_names = std::move(db_result.column_names);
        result.rows = std::move(db_result.rows);
        result.null_mask = std::move(db_result.null_mask);
        result.affected_rows = db_result.affected_rows;

    } catch (const std::exception& e) {
        conn_handle->discard();
        result.success = false;
        result.error_code = ErrorCode::INTERNAL_ERROR;
        result.error_message = std::format("Endpoint '{}' execution failed: {}", pool_->name(), e.what());
        result.execution_time = timer.elapsed_us();
    }

    return result;
}

} // namespace readrouter
