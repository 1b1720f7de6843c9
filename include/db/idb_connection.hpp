#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace readrouter {

/**
 * @brief Rows or command status copied out of one driver result
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;
    bool connection_lost = false;   // Socket or server went away, not a statement error

    std::vector<std::string> column_names;
    std::vector<std::vector<std::string>> rows;     // Text format, as libpq returns it
    std::vector<std::vector<bool>> null_mask;

    uint64_t affected_rows = 0;
    bool has_rows = false;
};

/**
 * @brief One session with one node
 *
 * Not thread-safe. The endpoint pool hands each connection to a single
 * caller at a time.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /// Run `sql` with $1..$n bound to `params` as text
    [[nodiscard]] virtual DbResultSet execute(
        const std::string& sql, const std::vector<std::string>& params) = 0;

    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Server-side statement timeout for the statements that follow
     * @param timeout_ms 0 disables the timeout
     * @return false if the setting could not be applied
     */
    virtual bool set_query_timeout(uint32_t timeout_ms) = 0;

    virtual void close() = 0;
};

} // namespace readrouter
