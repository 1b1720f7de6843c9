#pragma once

#include "core/types.hpp"

namespace readrouter {

/**
 * @brief Executes statements against one endpoint
 *
 * Every primary and replica node in the registry is reached through one of
 * these; routers never touch connections directly.
 */
class IQueryExecutor {
public:
    virtual ~IQueryExecutor() = default;

    /**
     * @brief Execute a parameterized statement
     * @return Query result; failures carry CONNECTION_ERROR or QUERY_ERROR
     */
    [[nodiscard]] virtual QueryResult execute(const Statement& stmt) = 0;
};

} // namespace readrouter
