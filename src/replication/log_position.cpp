#include "replication/log_position.hpp"
#include "core/utils.hpp"

#include <format>

namespace readrouter {

std::optional<LogPosition> LogPosition::parse(std::string_view text) {
    const auto slash = text.find('/');
    if (slash == std::string_view::npos || slash == 0 || slash + 1 == text.size()) {
        return std::nullopt;
    }

    const auto hi_text = text.substr(0, slash);
    const auto lo_text = text.substr(slash + 1);
    if (hi_text.size() > 8 || lo_text.size() > 8) {
        return std::nullopt;
    }

    const auto hi = utils::try_parse_int<uint32_t>(hi_text, 16);
    const auto lo = utils::try_parse_int<uint32_t>(lo_text, 16);
    if (!hi || !lo) {
        return std::nullopt;
    }

    return LogPosition((static_cast<uint64_t>(*hi) << 32) | *lo);
}

std::string LogPosition::to_string() const {
    return std::format("{:X}/{:X}",
        static_cast<uint32_t>(value_ >> 32),
        static_cast<uint32_t>(value_ & 0xFFFFFFFFu));
}

} // namespace readrouter
