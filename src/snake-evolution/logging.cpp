#include "logging.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <memory>
#include <vector>

namespace snake_evolution {

void initialize_logging(const std::string& logger_name, const std::string& level,
                        const std::string& log_file) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);

        if (!log_file.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>(logger_name, sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::from_str(level));
        logger->flush_on(spdlog::level::warn);

        spdlog::set_default_logger(logger);

        spdlog::debug("Logging initialized at level {}", level);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

} // namespace snake_evolution
