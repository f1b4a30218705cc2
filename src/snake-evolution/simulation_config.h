#ifndef SNAKE_EVOLUTION_SIMULATION_CONFIG_H
#define SNAKE_EVOLUTION_SIMULATION_CONFIG_H

#include "neural_network.h"
#include "snake_game.h"
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace snake_evolution {

struct SimulationConfig {
    // Game
    int board_size;
    uint32_t starvation_threshold;
    bool starvation_scaling;

    // Population / network
    uint32_t population_size;
    std::vector<size_t> topology;
    snakenet::ActivationKind activation;

    // Genetic algorithm
    uint32_t elite_count;
    double mutation_rate;
    double mutation_magnitude;
    snakenet::CrossoverMode crossover;
    double tournament_fraction;
    uint32_t tournament_size;
    double random_fraction;
    bool adaptive_mutation;

    // Fitness
    double score_weight;
    double step_weight;

    // Run
    uint32_t num_threads;
    uint32_t random_seed;
    uint32_t max_generations;  // 0 runs until stopped
    std::string save_file;
    std::string load_file;
    bool low_detail;
    std::string log_level;
    std::string log_file;

    SimulationConfig()
        : board_size(15), starvation_threshold(0), starvation_scaling(false),
          population_size(500), topology{snakegame::VISION_SIZE, 16, 8, snakegame::NUM_ACTIONS},
          activation(snakenet::ActivationKind::RELU),
          elite_count(2), mutation_rate(0.1), mutation_magnitude(0.5),
          crossover(snakenet::CrossoverMode::PER_WEIGHT),
          tournament_fraction(0.0), tournament_size(5), random_fraction(0.0),
          adaptive_mutation(false),
          score_weight(1000.0), step_weight(1.0),
          num_threads(4), random_seed(12345), max_generations(0),
          low_detail(false), log_level("info"), log_file("snake_evolution.log") {}

    snakegame::GameConfig game_config() const;
    snakegame::FitnessParameters fitness_parameters() const;

    // Throws std::invalid_argument naming the offending key.
    void validate() const;
};

// Applies one "key = value" setting. Throws std::invalid_argument on unknown
// keys or unparsable values.
void apply_setting(SimulationConfig& config, const std::string& key, const std::string& value);

void load_config_stream(std::istream& in, SimulationConfig& config);
void load_config_file(const std::string& filename, SimulationConfig& config);
void save_config_file(const std::string& filename, const SimulationConfig& config);

std::vector<size_t> parse_topology(const std::string& text);
std::string format_topology(const std::vector<size_t>& topology);

struct CommandLine {
    SimulationConfig config;
    bool show_help;

    CommandLine() : show_help(false) {}
};

// --config is applied before the other flags, so flags always override the file.
CommandLine parse_command_line(int argc, const char* const argv[]);
void print_usage(const char* program_name);

void log_config(const SimulationConfig& config);

} // namespace snake_evolution

#endif // SNAKE_EVOLUTION_SIMULATION_CONFIG_H
