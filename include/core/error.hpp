#pragma once

#include "core/types.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace readrouter {

/**
 * @brief Raised when the routing topology or configuration cannot work
 *
 * Examples: hashing over an empty replica set, a preferred replica id that
 * is not registered, a registry without a primary. Thrown at construction or
 * selection time, before any hashing or query is attempted.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCode code, std::string message) {
        Result r;
        r.success_ = false;
        r.error_code_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCode error_code() const { return error_code_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCode error_code_ = ErrorCode::NONE;
    std::string error_message_;
};

} // namespace readrouter
