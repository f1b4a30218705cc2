#ifndef SNAKE_EVOLUTION_SIMULATION_DRIVER_H
#define SNAKE_EVOLUTION_SIMULATION_DRIVER_H

#include "genetic_algorithm.h"
#include "population.h"
#include "simulation_config.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <utility>
#include <vector>

namespace snake_evolution {

// What a renderer needs to draw one frame of the leading genome.
struct RenderSnapshot {
    int board_size;
    std::vector<snakegame::Point> body;  // head first
    snakegame::Point food;
    uint32_t score;
    uint32_t steps_since_food;
    uint32_t starvation_limit;
    bool alive;
    uint32_t generation;
    double best_fitness;
    uint32_t best_score;
    size_t alive_count;
};

struct GenerationSummary {
    uint32_t generation;
    double elapsed_seconds;
    uint32_t generation_best_score;
    uint32_t best_score_so_far;
    double best_fitness;
    double mean_fitness;
    double mutation_rate;
    double mutation_magnitude;
};

using GenerationCallback =
    std::function<void(const GenerationSummary&, const snakenet::NeuralNetwork& best_network)>;

class SimulationDriver {
public:
    explicit SimulationDriver(const SimulationConfig& config);

    // One step of every live genome. Finishes the generation when the last
    // genome dies and returns true in that case.
    bool tick();

    // Runs until stop_requested is set or max_generations is reached. The flag
    // is only looked at between generations.
    void run(const std::atomic<bool>& stop_requested);

    void run_generations(uint32_t count);

    RenderSnapshot snapshot() const;

    void set_generation_callback(GenerationCallback callback) { callback_ = std::move(callback); }

    uint32_t get_generation() const { return generation_; }
    double get_best_fitness() const { return best_fitness_; }
    uint32_t get_best_score() const { return best_score_; }
    const std::optional<GenerationSummary>& get_last_summary() const { return last_summary_; }

    // Best network of the most recently finished generation.
    const std::optional<snakenet::NeuralNetwork>& get_generation_best_network() const {
        return generation_best_network_;
    }

    const Population& get_population() const { return *population_; }
    const GeneticAlgorithm& get_genetic_algorithm() const { return ga_; }
    const SimulationConfig& get_config() const { return config_; }

private:
    std::vector<snakenet::NeuralNetwork> initial_networks();
    void start_generation(std::vector<snakenet::NeuralNetwork> networks);
    void finish_generation();

    SimulationConfig config_;
    std::mt19937 master_rng_;
    GeneticAlgorithm ga_;
    std::unique_ptr<Population> population_;

    uint32_t generation_;
    double best_fitness_;
    uint32_t best_score_;
    std::optional<snakenet::NeuralNetwork> generation_best_network_;
    std::optional<GenerationSummary> last_summary_;
    std::chrono::steady_clock::time_point generation_start_;
    GenerationCallback callback_;
};

} // namespace snake_evolution

#endif // SNAKE_EVOLUTION_SIMULATION_DRIVER_H
