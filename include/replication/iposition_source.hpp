#pragma once

#include "core/error.hpp"
#include "replication/log_position.hpp"

#include <chrono>

namespace readrouter {

/**
 * @brief Reports a node's log position
 *
 * On the primary this is the current write position; on a replica it is the
 * last position replayed (i.e. visible to queries). Failures, timeouts and
 * nodes that cannot report come back as POSITION_UNAVAILABLE.
 */
class IPositionSource {
public:
    virtual ~IPositionSource() = default;

    [[nodiscard]] virtual Result<LogPosition> current_position(std::chrono::milliseconds timeout) = 0;
};

} // namespace readrouter
