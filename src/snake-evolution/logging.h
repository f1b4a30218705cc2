#ifndef SNAKE_EVOLUTION_LOGGING_H
#define SNAKE_EVOLUTION_LOGGING_H

#include <string>

namespace snake_evolution {

// Console and file sinks on a default logger named logger_name.
// An empty log_file disables the file sink.
void initialize_logging(const std::string& logger_name, const std::string& level,
                        const std::string& log_file);

} // namespace snake_evolution

#endif // SNAKE_EVOLUTION_LOGGING_H
