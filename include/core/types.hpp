#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace readrouter {

// ============================================================================
// Basic Enums
// ============================================================================

enum class StatementType {
    UNKNOWN,
    SELECT,
    INSERT,
    UTILITY     // Position reports, replication status, bulk loads
};

enum class ErrorCode {
    NONE,
    CONNECTION_ERROR,       // Endpoint unreachable, auth failure, pool exhausted
    QUERY_ERROR,            // Rejected or timed-out statement
    CONFIGURATION_ERROR,
    POSITION_UNAVAILABLE,   // Replay/write position could not be obtained
    INTERNAL_ERROR
};

// ============================================================================
// Query Execution Types
// ============================================================================

/**
 * @brief Parameterized statement sent to one endpoint
 *
 * Parameters are bound as text ($1, $2, ...); they are never spliced into
 * the SQL string.
 */
struct Statement {
    std::string sql;
    std::vector<std::string> params;
    StatementType type = StatementType::UNKNOWN;

    // Overrides the executor's statement timeout when set
    std::optional<std::chrono::milliseconds> timeout;
};

struct QueryResult {
    bool success;
    ErrorCode error_code;
    std::string error_message;

    // For SELECT / RETURNING
    std::vector<std::string> column_names;
    std::vector<std::vector<std::string>> rows;
    std::vector<std::vector<bool>> null_mask;   // Parallel to rows; true = SQL NULL

    // For DML
    uint64_t affected_rows;

    // Performance metrics
    std::chrono::microseconds execution_time;

    QueryResult()
        : success(false),
          error_code(ErrorCode::NONE),
          affected_rows(0),
          execution_time(0) {}

    [[nodiscard]] bool is_null(size_t row, size_t col) const {
        return row < null_mask.size() && col < null_mask[row].size() && null_mask[row][col];
    }
};

// ============================================================================
// Utility Functions
// ============================================================================

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "NONE";
        case ErrorCode::CONNECTION_ERROR: return "CONNECTION_ERROR";
        case ErrorCode::QUERY_ERROR: return "QUERY_ERROR";
        case ErrorCode::CONFIGURATION_ERROR: return "CONFIGURATION_ERROR";
        case ErrorCode::POSITION_UNAVAILABLE: return "POSITION_UNAVAILABLE";
        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

} // namespace readrouter
