#include "logging.h"
#include "simulation_config.h"
#include "snake_viewer.h"
#include <spdlog/spdlog.h>
#include <atomic>
#include <csignal>

using namespace snake_evolution;

namespace {

std::atomic<bool> g_interrupted{false};

void handle_signal(int) {
    g_interrupted.store(true);
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        CommandLine cli = parse_command_line(argc, argv);
        if (cli.show_help) {
            print_usage(argv[0]);
            return 0;
        }

        SimulationConfig config = cli.config;
        config.validate();
        if (config.log_file == SimulationConfig().log_file) {
            config.log_file = "snake_viewer.log";
        }

        initialize_logging("snake_viewer", config.log_level, config.log_file);
        log_config(config);

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        snake_viewer::SnakeViewer viewer(config);
        if (!viewer.initialize()) {
            spdlog::error("Failed to initialize viewer");
            return 1;
        }
        viewer.run(g_interrupted);

        spdlog::shutdown();
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Error: {}", e.what());
        return 1;
    }
}
