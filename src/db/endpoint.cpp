#include "db/endpoint.hpp"

#include <format>

namespace readrouter {

namespace {

// libpq conninfo: single-quote the value, backslash-escape ' and \.
std::string quote_conninfo_value(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    out += '\'';
    for (const char c : value) {
        if (c == '\'' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += '\'';
    return out;
}

} // anonymous namespace

std::string EndpointConfig::to_connection_string() const {
    std::string conninfo = std::format("host={} port={} dbname={} user={}",
        quote_conninfo_value(host), port,
        quote_conninfo_value(database), quote_conninfo_value(user));

    if (!password.empty()) {
        conninfo += " password=" + quote_conninfo_value(password);
    }
    if (connect_timeout.count() > 0) {
        conninfo += std::format(" connect_timeout={}", connect_timeout.count());
    }
    if (keepalives_idle.count() > 0) {
        conninfo += std::format(" keepalives=1 keepalives_idle={} keepalives_interval={} keepalives_count={}",
            keepalives_idle.count(), keepalives_interval.count(), keepalives_count);
    }
    if (tcp_user_timeout.count() > 0) {
        conninfo += std::format(" tcp_user_timeout={}", tcp_user_timeout.count());
    }
    if (!application_name.empty()) {
        conninfo += " application_name=" + quote_conninfo_value(application_name);
    }
    return conninfo;
}

std::string EndpointConfig::describe() const {
    return std::format("{}:{}/{}", host, port, database);
}

} // namespace readrouter
