#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "routing/routing_strategy.hpp"
#include "routing/sticky_hash_router.hpp"

#include <cstdlib>
#include <format>
#include <limits>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace readrouter {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 *
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_node(toml::node& node);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        expand_env_vars_in_node(val);
    }
}

void expand_env_vars_in_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        auto expanded = expand_env_vars(s->get());
        if (expanded != s->get()) {
            *s = std::move(expanded);
        }
    } else if (auto* tbl = node.as_table()) {
        expand_env_vars_recursive(*tbl);
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) {
            expand_env_vars_in_node(elem);
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

/// Non-negative integer that must fit T; throws naming the key otherwise
template<typename T>
T toml_unsigned(const toml::table& tbl, std::string_view key, T default_value) {
    const int64_t raw = tbl[key].value_or(static_cast<int64_t>(default_value));
    if (raw < 0 || static_cast<uint64_t>(raw) > std::numeric_limits<T>::max()) {
        throw std::runtime_error(std::format("{} must be between 0 and {}, got {}",
            key, std::numeric_limits<T>::max(), raw));
    }
    return static_cast<T>(raw);
}

std::chrono::milliseconds toml_millis(const toml::table& tbl, std::string_view key, int64_t default_ms) {
    return std::chrono::milliseconds(tbl[key].value_or(default_ms));
}

const toml::table& table_or_empty(const toml::table& root, std::string_view key) {
    static const toml::table empty;
    const auto* tbl = root[key].as_table();
    return tbl ? *tbl : empty;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto& l = table_or_empty(root, "logging");
    cfg.level = l["level"].value_or("info"s);
    return cfg;
}

RoutingConfig ConfigLoader::extract_routing(const toml::table& root) {
    RoutingConfig cfg;
    const auto& r = table_or_empty(root, "routing");

    cfg.strategy = r["strategy"].value_or("time"s);
    cfg.preferred_replica = r["preferred_replica"].value_or(""s);

    const auto& tb = table_or_empty(r, "time_based");
    cfg.time_based.threshold = toml_millis(tb, "threshold_ms", 5000);

    const auto& lp = table_or_empty(r, "log_position");
    cfg.log_position.position_timeout = toml_millis(lp, "position_timeout_ms", 1000);

    const auto& sh = table_or_empty(r, "sticky_hash");
    cfg.sticky_hash.assignment = sh["assignment"].value_or("modulo"s);
    cfg.sticky_hash.virtual_nodes = toml_unsigned<uint32_t>(sh, "virtual_nodes", 160);
    cfg.sticky_hash.hash_key = sh["hash_key"].value_or(""s);
    return cfg;
}

PoolSettings ConfigLoader::extract_pool(const toml::table& root) {
    PoolSettings cfg;
    const auto& p = table_or_empty(root, "pool");

    cfg.min_connections = toml_unsigned<size_t>(p, "min_connections", 1);
    cfg.max_connections = toml_unsigned<size_t>(p, "max_connections", 4);
    cfg.acquire_timeout = toml_millis(p, "acquire_timeout_ms", 2000);
    cfg.idle_timeout = toml_millis(p, "idle_timeout_ms", 300000);
    cfg.max_lifetime = std::chrono::seconds(p["max_lifetime_seconds"].value_or(int64_t{3600}));
    cfg.query_timeout = toml_millis(p, "query_timeout_ms", 5000);
    cfg.max_result_rows = toml_unsigned<uint32_t>(p, "max_result_rows", 10000);
    cfg.health_check_query = p["health_check_query"].value_or("SELECT 1"s);
    return cfg;
}

SchemaConfig ConfigLoader::extract_schema(const toml::table& root) {
    SchemaConfig cfg;
    const auto& s = table_or_empty(root, "schema");
    cfg.table = s["table"].value_or("replication_test"s);
    cfg.read_limit = toml_unsigned<uint32_t>(s, "read_limit", 5);
    return cfg;
}

NodeConfig ConfigLoader::extract_node(const toml::table& tbl, const std::string& default_id) {
    NodeConfig cfg;
    cfg.id = tbl["id"].value_or(default_id);

    auto& ep = cfg.endpoint;
    ep.host = tbl["host"].value_or("localhost"s);
    ep.port = toml_unsigned<uint16_t>(tbl, "port", 5432);
    ep.database = tbl["database"].value_or("testdb"s);
    ep.user = tbl["user"].value_or("postgres"s);
    ep.password = tbl["password"].value_or(""s);
    ep.connect_timeout = std::chrono::seconds(tbl["connect_timeout_seconds"].value_or(int64_t{5}));
    ep.application_name = tbl["application_name"].value_or("read_router"s);
    ep.keepalives_idle = std::chrono::seconds(tbl["keepalives_idle_seconds"].value_or(int64_t{10}));
    ep.keepalives_interval = std::chrono::seconds(tbl["keepalives_interval_seconds"].value_or(int64_t{5}));
    ep.keepalives_count = toml_unsigned<uint32_t>(tbl, "keepalives_count", 3);
    ep.tcp_user_timeout = toml_millis(tbl, "tcp_user_timeout_ms", 10000);
    return cfg;
}

std::vector<NodeConfig> ConfigLoader::extract_replicas(const toml::table& root) {
    std::vector<NodeConfig> result;
    const auto* arr = root["replicas"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (size_t i = 0; i < arr->size(); ++i) {
        const auto* r = arr->get(i)->as_table();
        if (!r) {
            throw std::runtime_error(std::format("replicas[{}] must be a table", i));
        }
        result.emplace_back(extract_node(*r, std::format("replica{}", i + 1)));
    }
    return result;
}

RouterConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    RouterConfig config;
    config.logging = extract_logging(root);
    config.routing = extract_routing(root);
    config.pool = extract_pool(root);
    config.schema = extract_schema(root);
    config.primary = extract_node(table_or_empty(root, "primary"), "primary");
    config.replicas = extract_replicas(root);
    return config;
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::validate_and_return(RouterConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Validation
// ============================================================================

namespace {

void validate_node(const NodeConfig& node, const std::string& where, std::vector<std::string>& errors) {
    if (node.id.empty()) {
        errors.push_back(std::format("{}.id must not be empty", where));
    }
    if (node.endpoint.host.empty()) {
        errors.push_back(std::format("{}.host must not be empty", where));
    }
    if (node.endpoint.port == 0) {
        errors.push_back(std::format("{}.port must be 1-65535", where));
    }
    if (node.endpoint.database.empty()) {
        errors.push_back(std::format("{}.database must not be empty", where));
    }
    if (node.endpoint.connect_timeout.count() <= 0) {
        errors.push_back(std::format("{}.connect_timeout_seconds must be > 0", where));
    }
    if (node.endpoint.keepalives_idle.count() < 0) {
        errors.push_back(std::format("{}.keepalives_idle_seconds must be >= 0", where));
    }
    if (node.endpoint.keepalives_idle.count() > 0 &&
        (node.endpoint.keepalives_interval.count() <= 0 || node.endpoint.keepalives_count == 0)) {
        errors.push_back(std::format("{}.keepalives_interval_seconds and keepalives_count must be > 0 "
            "when keepalives are enabled", where));
    }
    if (node.endpoint.tcp_user_timeout.count() < 0 ||
        node.endpoint.tcp_user_timeout.count() > std::numeric_limits<int32_t>::max()) {
        errors.push_back(std::format("{}.tcp_user_timeout_ms must be between 0 and {}",
            where, std::numeric_limits<int32_t>::max()));
    }
}

} // anonymous namespace

std::vector<std::string> ConfigLoader::validate_config(const RouterConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level '{}' is not one of debug, info, warn, error",
            config.logging.level));
    }

    // ---- routing ----
    const auto& routing = config.routing;
    if (!parse_strategy_kind(routing.strategy)) {
        errors.push_back(std::format("routing.strategy '{}' is not one of time, position, sticky",
            routing.strategy));
    }
    if (routing.time_based.threshold.count() <= 0) {
        errors.push_back("routing.time_based.threshold_ms must be > 0");
    }
    if (routing.log_position.position_timeout.count() <= 0) {
        errors.push_back("routing.log_position.position_timeout_ms must be > 0");
    }
    const auto assignment = parse_hash_assignment(routing.sticky_hash.assignment);
    if (!assignment) {
        errors.push_back(std::format("routing.sticky_hash.assignment '{}' is not one of modulo, ring",
            routing.sticky_hash.assignment));
    } else if (*assignment == HashAssignment::RING && routing.sticky_hash.virtual_nodes == 0) {
        errors.push_back("routing.sticky_hash.virtual_nodes must be > 0 for ring assignment");
    }

    // ---- nodes ----
    validate_node(config.primary, "primary", errors);

    // Every strategy reads from a replica
    if (config.replicas.empty()) {
        errors.push_back(std::format("replicas must not be empty (routing.strategy = '{}')",
            routing.strategy));
    }

    std::unordered_set<std::string> ids{config.primary.id};
    bool preferred_found = routing.preferred_replica.empty();
    for (size_t i = 0; i < config.replicas.size(); ++i) {
        const auto& replica = config.replicas[i];
        validate_node(replica, std::format("replicas[{}]", i), errors);
        if (!replica.id.empty() && !ids.insert(replica.id).second) {
            errors.push_back(std::format("replicas[{}].id '{}' is already used", i, replica.id));
        }
        if (replica.id == routing.preferred_replica) {
            preferred_found = true;
        }
    }
    if (!preferred_found) {
        errors.push_back(std::format("routing.preferred_replica '{}' is not a configured replica",
            routing.preferred_replica));
    }

    // ---- pool ----
    const auto& pool = config.pool;
    if (pool.max_connections == 0) {
        errors.push_back("pool.max_connections must be > 0");
    }
    if (pool.min_connections > pool.max_connections) {
        errors.push_back(std::format("pool.min_connections ({}) > max_connections ({})",
            pool.min_connections, pool.max_connections));
    }
    if (pool.acquire_timeout.count() <= 0) {
        errors.push_back("pool.acquire_timeout_ms must be > 0");
    }
    // statement_timeout is an int on the server
    if (pool.query_timeout.count() <= 0 ||
        pool.query_timeout.count() > std::numeric_limits<int32_t>::max()) {
        errors.push_back(std::format("pool.query_timeout_ms must be between 1 and {}",
            std::numeric_limits<int32_t>::max()));
    }
    if (pool.max_lifetime.count() < 0) {
        errors.push_back("pool.max_lifetime_seconds must be >= 0");
    }

    // ---- schema ----
    if (!utils::is_sql_identifier(config.schema.table)) {
        errors.push_back(std::format("schema.table '{}' is not a valid SQL identifier", config.schema.table));
    }
    if (config.schema.read_limit == 0) {
        errors.push_back("schema.read_limit must be > 0");
    }

    return errors;
}

} // namespace readrouter
