#include "simulation_config.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace snake_evolution {

namespace {

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

uint32_t parse_unsigned(const std::string& key, const std::string& value) {
    std::string v = trim(value);
    if (v.empty() || !std::all_of(v.begin(), v.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw std::invalid_argument("Invalid value for " + key + ": '" + value + "'");
    }
    unsigned long parsed = 0;
    try {
        parsed = std::stoul(v);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + key + ": '" + value + "'");
    }
    if (parsed > 0xFFFFFFFFUL) {
        throw std::invalid_argument("Value for " + key + " is out of range: " + value);
    }
    return static_cast<uint32_t>(parsed);
}

double parse_double(const std::string& key, const std::string& value) {
    std::string v = trim(value);
    size_t consumed = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(v, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + key + ": '" + value + "'");
    }
    if (consumed != v.size() || !std::isfinite(parsed)) {
        throw std::invalid_argument("Invalid value for " + key + ": '" + value + "'");
    }
    return parsed;
}

bool parse_bool(const std::string& key, const std::string& value) {
    std::string v = trim(value);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    throw std::invalid_argument("Invalid boolean for " + key + ": '" + value + "'");
}

struct FlagMapping {
    const char* flag;
    const char* key;
    bool takes_value;
};

constexpr FlagMapping FLAG_MAPPINGS[] = {
    {"--board-size", "board_size", true},
    {"--starvation", "starvation_threshold", true},
    {"--starvation-scaling", "starvation_scaling", false},
    {"--population", "population_size", true},
    {"--topology", "topology", true},
    {"--activation", "activation", true},
    {"--elite", "elite_count", true},
    {"--mutation", "mutation_rate", true},
    {"--magnitude", "mutation_magnitude", true},
    {"--crossover", "crossover", true},
    {"--tournament-fraction", "tournament_fraction", true},
    {"--tournament-size", "tournament_size", true},
    {"--random-fraction", "random_fraction", true},
    {"--adaptive-mutation", "adaptive_mutation", false},
    {"--score-weight", "score_weight", true},
    {"--step-weight", "step_weight", true},
    {"--threads", "num_threads", true},
    {"--seed", "random_seed", true},
    {"--generations", "max_generations", true},
    {"--save", "save_file", true},
    {"--load", "load_file", true},
    {"--low-detail", "low_detail", false},
    {"--log-level", "log_level", true},
    {"--log-file", "log_file", true},
};

} // namespace

snakegame::GameConfig SimulationConfig::game_config() const {
    return snakegame::GameConfig(board_size, starvation_threshold, starvation_scaling);
}

snakegame::FitnessParameters SimulationConfig::fitness_parameters() const {
    return snakegame::FitnessParameters(score_weight, step_weight);
}

void SimulationConfig::validate() const {
    if (board_size < static_cast<int>(snakegame::INITIAL_SNAKE_LENGTH) + 2) {
        throw std::invalid_argument("board_size must be at least " +
                                    std::to_string(snakegame::INITIAL_SNAKE_LENGTH + 2));
    }
    if (board_size > 1000) {
        throw std::invalid_argument("board_size must not exceed 1000");
    }
    if (starvation_scaling && starvation_threshold > std::numeric_limits<uint32_t>::max() / 6) {
        throw std::invalid_argument("starvation_threshold is too large for starvation_scaling");
    }
    if (population_size == 0) {
        throw std::invalid_argument("population_size must be greater than 0");
    }
    if (elite_count > population_size) {
        throw std::invalid_argument("elite_count must not exceed population_size");
    }
    if (topology.size() < 2) {
        throw std::invalid_argument("topology needs at least an input and an output layer");
    }
    if (std::find(topology.begin(), topology.end(), 0U) != topology.end()) {
        throw std::invalid_argument("topology must not contain empty layers");
    }
    if (topology.front() != snakegame::VISION_SIZE) {
        throw std::invalid_argument("topology input layer must be " +
                                    std::to_string(snakegame::VISION_SIZE));
    }
    if (topology.back() != snakegame::NUM_ACTIONS) {
        throw std::invalid_argument("topology output layer must be " +
                                    std::to_string(snakegame::NUM_ACTIONS));
    }
    if (mutation_rate < 0.0 || mutation_rate > 1.0) {
        throw std::invalid_argument("mutation_rate must be between 0.0 and 1.0");
    }
    if (mutation_magnitude < 0.0) {
        throw std::invalid_argument("mutation_magnitude must not be negative");
    }
    if (tournament_fraction < 0.0 || tournament_fraction > 1.0) {
        throw std::invalid_argument("tournament_fraction must be between 0.0 and 1.0");
    }
    if (random_fraction < 0.0 || random_fraction > 1.0) {
        throw std::invalid_argument("random_fraction must be between 0.0 and 1.0");
    }
    if (tournament_fraction + random_fraction > 1.0) {
        throw std::invalid_argument("tournament_fraction + random_fraction must not exceed 1.0");
    }
    if (tournament_size == 0) {
        throw std::invalid_argument("tournament_size must be greater than 0");
    }
    if (score_weight <= 0.0) {
        throw std::invalid_argument("score_weight must be greater than 0");
    }
    if (step_weight < 0.0 || step_weight > score_weight) {
        throw std::invalid_argument("step_weight must be between 0 and score_weight");
    }
    if (num_threads == 0) {
        throw std::invalid_argument("num_threads must be greater than 0");
    }
    if (log_level != "trace" && log_level != "debug" && log_level != "info" &&
        log_level != "warn" && log_level != "error" && log_level != "off") {
        throw std::invalid_argument("log_level must be one of trace, debug, info, warn, error, off");
    }
}

std::vector<size_t> parse_topology(const std::string& text) {
    std::vector<size_t> result;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        result.push_back(parse_unsigned("topology", item));
    }
    if (result.empty()) {
        throw std::invalid_argument("Invalid value for topology: '" + text + "'");
    }
    return result;
}

std::string format_topology(const std::vector<size_t>& topology) {
    std::ostringstream ss;
    for (size_t i = 0; i < topology.size(); ++i) {
        if (i > 0) ss << ',';
        ss << topology[i];
    }
    return ss.str();
}

void apply_setting(SimulationConfig& config, const std::string& key, const std::string& value) {
    if (key == "board_size") {
        config.board_size = static_cast<int>(parse_unsigned(key, value));
    } else if (key == "starvation_threshold") {
        config.starvation_threshold = parse_unsigned(key, value);
    } else if (key == "starvation_scaling") {
        config.starvation_scaling = parse_bool(key, value);
    } else if (key == "population_size") {
        config.population_size = parse_unsigned(key, value);
    } else if (key == "topology") {
        config.topology = parse_topology(value);
    } else if (key == "activation") {
        config.activation = snakenet::parse_activation(trim(value));
    } else if (key == "elite_count") {
        config.elite_count = parse_unsigned(key, value);
    } else if (key == "mutation_rate") {
        config.mutation_rate = parse_double(key, value);
    } else if (key == "mutation_magnitude") {
        config.mutation_magnitude = parse_double(key, value);
    } else if (key == "crossover") {
        config.crossover = snakenet::parse_crossover(trim(value));
    } else if (key == "tournament_fraction") {
        config.tournament_fraction = parse_double(key, value);
    } else if (key == "tournament_size") {
        config.tournament_size = parse_unsigned(key, value);
    } else if (key == "random_fraction") {
        config.random_fraction = parse_double(key, value);
    } else if (key == "adaptive_mutation") {
        config.adaptive_mutation = parse_bool(key, value);
    } else if (key == "score_weight") {
        config.score_weight = parse_double(key, value);
    } else if (key == "step_weight") {
        config.step_weight = parse_double(key, value);
    } else if (key == "num_threads") {
        config.num_threads = parse_unsigned(key, value);
    } else if (key == "random_seed") {
        config.random_seed = parse_unsigned(key, value);
    } else if (key == "max_generations") {
        config.max_generations = parse_unsigned(key, value);
    } else if (key == "save_file") {
        config.save_file = trim(value);
    } else if (key == "load_file") {
        config.load_file = trim(value);
    } else if (key == "low_detail") {
        config.low_detail = parse_bool(key, value);
    } else if (key == "log_level") {
        config.log_level = trim(value);
    } else if (key == "log_file") {
        config.log_file = trim(value);
    } else {
        throw std::invalid_argument("Unknown configuration key: " + key);
    }
}

void load_config_stream(std::istream& in, SimulationConfig& config) {
    std::string line;
    size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        size_t comment = line.find('#');
        if (comment != std::string::npos) {
            line.erase(comment);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            throw std::invalid_argument("Config line " + std::to_string(line_number) +
                                        " is not a 'key = value' pair");
        }
        apply_setting(config, trim(line.substr(0, eq)), trim(line.substr(eq + 1)));
    }
}

void load_config_file(const std::string& filename, SimulationConfig& config) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::invalid_argument("Cannot open config file: " + filename);
    }
    load_config_stream(file, config);
    spdlog::info("Loaded configuration from {}", filename);
}

void save_config_file(const std::string& filename, const SimulationConfig& config) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to save configuration to " + filename);
    }
    file << std::setprecision(std::numeric_limits<double>::max_digits10);

    file << "board_size = " << config.board_size << "\n";
    file << "starvation_threshold = " << config.starvation_threshold << "\n";
    file << "starvation_scaling = " << (config.starvation_scaling ? "true" : "false") << "\n";
    file << "population_size = " << config.population_size << "\n";
    file << "topology = " << format_topology(config.topology) << "\n";
    file << "activation = " << snakenet::activation_name(config.activation) << "\n";
    file << "elite_count = " << config.elite_count << "\n";
    file << "mutation_rate = " << config.mutation_rate << "\n";
    file << "mutation_magnitude = " << config.mutation_magnitude << "\n";
    file << "crossover = " << snakenet::crossover_name(config.crossover) << "\n";
    file << "tournament_fraction = " << config.tournament_fraction << "\n";
    file << "tournament_size = " << config.tournament_size << "\n";
    file << "random_fraction = " << config.random_fraction << "\n";
    file << "adaptive_mutation = " << (config.adaptive_mutation ? "true" : "false") << "\n";
    file << "score_weight = " << config.score_weight << "\n";
    file << "step_weight = " << config.step_weight << "\n";
    file << "num_threads = " << config.num_threads << "\n";
    file << "random_seed = " << config.random_seed << "\n";
    file << "max_generations = " << config.max_generations << "\n";
    if (!config.save_file.empty()) file << "save_file = " << config.save_file << "\n";
    if (!config.load_file.empty()) file << "load_file = " << config.load_file << "\n";
    file << "low_detail = " << (config.low_detail ? "true" : "false") << "\n";
    file << "log_level = " << config.log_level << "\n";
    file << "log_file = " << config.log_file << "\n";
}

CommandLine parse_command_line(int argc, const char* const argv[]) {
    CommandLine result;

    // First pass: the config file provides the base values
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                throw std::invalid_argument("--config needs a file name");
            }
            load_config_file(argv[++i], result.config);
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            result.show_help = true;
            continue;
        }
        if (arg == "--config") {
            ++i;
            continue;
        }

        const FlagMapping* mapping = nullptr;
        for (const auto& m : FLAG_MAPPINGS) {
            if (arg == m.flag) {
                mapping = &m;
                break;
            }
        }
        if (!mapping) {
            throw std::invalid_argument("Unknown argument: " + arg);
        }

        if (!mapping->takes_value) {
            apply_setting(result.config, mapping->key, "true");
            continue;
        }
        if (i + 1 >= argc) {
            throw std::invalid_argument(arg + " needs a value");
        }
        apply_setting(result.config, mapping->key, argv[++i]);
    }

    return result;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>              Load settings from a 'key = value' file\n";
    std::cout << "  --board-size <N>             Board side length (default: 15)\n";
    std::cout << "  --starvation <N>             Steps without food before starving (default: board area)\n";
    std::cout << "  --starvation-scaling         Allow longer snakes more steps without food\n";
    std::cout << "  --population <N>             Population size (default: 500)\n";
    std::cout << "  --topology <a,b,...>         Layer sizes (default: 24,16,8,3)\n";
    std::cout << "  --activation <name>          relu, sigmoid or tanh (default: relu)\n";
    std::cout << "  --elite <N>                  Networks copied unchanged (default: 2)\n";
    std::cout << "  --mutation <rate>            Per-gene mutation probability (default: 0.1)\n";
    std::cout << "  --magnitude <value>          Maximum mutation delta (default: 0.5)\n";
    std::cout << "  --crossover <mode>           per_weight or per_layer (default: per_weight)\n";
    std::cout << "  --tournament-fraction <f>    Share of children from tournaments (default: 0)\n";
    std::cout << "  --tournament-size <N>        Tournament contestants (default: 5)\n";
    std::cout << "  --random-fraction <f>        Share of fresh random networks (default: 0)\n";
    std::cout << "  --adaptive-mutation          Scale mutation with the best score\n";
    std::cout << "  --score-weight <w>           Fitness weight per food (default: 1000)\n";
    std::cout << "  --step-weight <w>            Fitness weight for survival (default: 1)\n";
    std::cout << "  --threads <N>                Simulation worker threads (default: 4)\n";
    std::cout << "  --seed <N>                   Random seed (default: 12345)\n";
    std::cout << "  --generations <N>            Stop after N generations (default: run until stopped)\n";
    std::cout << "  --save <file>                Save the best network when the best score improves\n";
    std::cout << "  --load <file>                Seed the first generation from a saved network\n";
    std::cout << "  --low-detail                 Text output instead of graphics\n";
    std::cout << "  --log-level <level>          trace, debug, info, warn, error, off (default: info)\n";
    std::cout << "  --log-file <file>            Log file (default: snake_evolution.log)\n";
    std::cout << "  --help                       Show this help message\n";
}

void log_config(const SimulationConfig& config) {
    spdlog::info("Simulation configuration:");
    spdlog::info("  Board size: {} (starvation after {} steps{})", config.board_size,
                 config.game_config().effective_starvation_threshold(),
                 config.starvation_scaling ? ", scaled with score" : "");
    spdlog::info("  Population size: {}", config.population_size);
    spdlog::info("  Topology: {} ({})", format_topology(config.topology),
                 snakenet::activation_name(config.activation));
    spdlog::info("  Elite count: {}", config.elite_count);
    spdlog::info("  Mutation: rate {} magnitude {}{}", config.mutation_rate,
                 config.mutation_magnitude, config.adaptive_mutation ? " (adaptive)" : "");
    spdlog::info("  Crossover: {}", snakenet::crossover_name(config.crossover));
    spdlog::info("  Tournament fraction: {} (size {}), random fraction: {}",
                 config.tournament_fraction, config.tournament_size, config.random_fraction);
    spdlog::info("  Fitness weights: score {} step {}", config.score_weight, config.step_weight);
    spdlog::info("  Threads: {}, seed: {}", config.num_threads, config.random_seed);
}

} // namespace snake_evolution
