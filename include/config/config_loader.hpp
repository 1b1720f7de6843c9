#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace readrouter {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        RouterConfig config;

        static LoadResult ok(RouterConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to read_router.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Every problem found, one message each; empty when the config is usable
    [[nodiscard]] static std::vector<std::string> validate_config(const RouterConfig& config);

private:
    static LoggingConfig extract_logging(const toml::table& root);
    static RoutingConfig extract_routing(const toml::table& root);
    static PoolSettings extract_pool(const toml::table& root);
    static SchemaConfig extract_schema(const toml::table& root);
    static NodeConfig extract_node(const toml::table& tbl, const std::string& default_id);
    static std::vector<NodeConfig> extract_replicas(const toml::table& root);

    static RouterConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(RouterConfig config);
};

} // namespace readrouter
