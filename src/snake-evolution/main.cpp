#include "logging.h"
#include "simulation_config.h"
#include "simulation_driver.h"
#include <spdlog/spdlog.h>
#include <atomic>
#include <csignal>

using namespace snake_evolution;

namespace {

std::atomic<bool> g_stop_requested{false};

void handle_signal(int) {
    g_stop_requested.store(true);
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        CommandLine cli = parse_command_line(argc, argv);
        if (cli.show_help) {
            print_usage(argv[0]);
            return 0;
        }

        const SimulationConfig& config = cli.config;
        config.validate();

        initialize_logging("snake_evolution", config.log_level, config.log_file);

        spdlog::info("Snake Evolution - Neuroevolution of Snake players");
        log_config(config);

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        SimulationDriver driver(config);
        driver.run(g_stop_requested);

        if (g_stop_requested.load()) {
            spdlog::info("Stop requested, exiting");
        }
        spdlog::shutdown();
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Error: {}", e.what());
        return 1;
    }
}
