#include "core/error.hpp"
#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "demo/scenario_runner.hpp"
#include "routing/router_builder.hpp"

#include <cstdlib>
#include <format>
#include <memory>
#include <string>

using namespace readrouter;

namespace {

void print_usage(const char* program) {
    utils::log::error(std::format(
        "Usage: {} <config.toml> <command>\n"
        "  time           time-based routing scenario\n"
        "  position       log-position routing scenario\n"
        "  sticky         sticky hash routing scenario\n"
        "  run <session> [payload]  write and read once through routing.strategy\n"
        "  lag [rows]     bulk insert on the primary (default {} rows), then status\n"
        "  status         replication status and replay positions",
        program, ScenarioRunner::kDefaultLagRows));
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    const std::string config_file = argv[1];
    const std::string command = argv[2];

    try {
        utils::log::info(std::format("[1/3] Loading configuration from {}", config_file));
        auto load = ConfigLoader::load_from_file(config_file);
        if (!load.success) {
            utils::log::error(load.error_message);
            return EXIT_FAILURE;
        }
        const RouterConfig& config = load.config;

        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        utils::log::info(std::format("[2/3] Connecting to primary '{}' and {} replica(s)",
            config.primary.id, config.replicas.size()));
        auto registry = RouterBuilder::connect(config, std::make_shared<PgConnectionFactory>());

        utils::log::info(std::format("[3/3] Running '{}'", command));
        ScenarioRunner runner(config, registry);

        int rc = EXIT_FAILURE;
        if (command == "time") {
            rc = runner.run_time_based();
        } else if (command == "position") {
            rc = runner.run_log_position();
        } else if (command == "sticky") {
            rc = runner.run_sticky();
        } else if (command == "run") {
            if (argc < 4) {
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
            rc = runner.run_configured(argv[3], argc > 4 ? argv[4] : "Hello World");
        } else if (command == "lag") {
            uint64_t rows = ScenarioRunner::kDefaultLagRows;
            if (argc > 3) {
                const auto parsed = utils::try_parse_int<uint64_t>(argv[3]);
                if (!parsed || *parsed == 0) {
                    utils::log::error(std::format("Invalid row count '{}'", argv[3]));
                    return EXIT_FAILURE;
                }
                rows = *parsed;
            }
            rc = runner.run_lag(rows);
        } else if (command == "status") {
            rc = runner.print_status();
        } else {
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }

        registry->drain();
        return rc;

    } catch (const ConfigurationError& e) {
        utils::log::error(std::format("Configuration error: {}", e.what()));
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return EXIT_FAILURE;
    }
}
