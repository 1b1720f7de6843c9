#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace readrouter {

/**
 * @brief A point in the primary's write-ahead log
 *
 * PostgreSQL reports positions (pg_lsn) as "XXXXXXXX/YYYYYYYY": the high and
 * low 32-bit halves of a 64-bit byte offset, hex, without zero padding. The
 * text form is NOT byte-sortable ("0/A0" > "0/100" as text), so ordering is
 * always done on the decoded 64-bit value through compare().
 */
class LogPosition {
public:
    constexpr LogPosition() = default;
    constexpr explicit LogPosition(uint64_t value) : value_(value) {}

    /// Decode "hi/lo"; nullopt for anything that is not a valid pg_lsn
    [[nodiscard]] static std::optional<LogPosition> parse(std::string_view text);

    /// Native total order of the log
    [[nodiscard]] constexpr std::strong_ordering compare(const LogPosition& other) const noexcept {
        return value_ <=> other.value_;
    }

    /// True when this position is at or past `target`
    [[nodiscard]] constexpr bool reached(const LogPosition& target) const noexcept {
        return compare(target) != std::strong_ordering::less;
    }

    [[nodiscard]] constexpr uint64_t value() const noexcept { return value_; }

    /// Canonical "hi/lo" form, uppercase hex as PostgreSQL prints it
    [[nodiscard]] std::string to_string() const;

    friend constexpr bool operator==(const LogPosition& a, const LogPosition& b) noexcept {
        return a.compare(b) == std::strong_ordering::equal;
    }
    friend constexpr std::strong_ordering operator<=>(const LogPosition& a, const LogPosition& b) noexcept {
        return a.compare(b);
    }

private:
    uint64_t value_ = 0;
};

} // namespace readrouter
