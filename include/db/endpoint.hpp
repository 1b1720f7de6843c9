#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace readrouter {

/**
 * @brief Where and how to reach one PostgreSQL node
 */
struct EndpointConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string database = "testdb";
    std::string user = "postgres";
    std::string password;
    std::chrono::seconds connect_timeout{5};
    std::string application_name = "read_router";

    // TCP keepalive probing lets the kernel detect a peer that went silent
    // mid-query. keepalives_idle = 0 leaves keepalives to libpq and the OS.
    std::chrono::seconds keepalives_idle{10};
    std::chrono::seconds keepalives_interval{5};
    uint32_t keepalives_count = 3;
    std::chrono::milliseconds tcp_user_timeout{10000};  // 0 = OS default

    /// libpq keyword/value string, values quoted and escaped
    [[nodiscard]] std::string to_connection_string() const;

    /// "host:port/database" for logs (never includes credentials)
    [[nodiscard]] std::string describe() const;
};

} // namespace readrouter
