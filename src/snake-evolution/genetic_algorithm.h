#ifndef SNAKE_EVOLUTION_GENETIC_ALGORITHM_H
#define SNAKE_EVOLUTION_GENETIC_ALGORITHM_H

#include "neural_network.h"
#include "population.h"
#include "simulation_config.h"
#include <cstdint>
#include <random>
#include <vector>

namespace snake_evolution {

struct GAParameters {
    uint32_t population_size;
    uint32_t elite_count;
    double mutation_rate;
    double mutation_magnitude;
    snakenet::CrossoverMode crossover;
    double tournament_fraction;
    uint32_t tournament_size;
    double random_fraction;
    bool adaptive_mutation;
    std::vector<size_t> topology;
    snakenet::ActivationKind activation;
    int board_size;

    GAParameters()
        : population_size(20), elite_count(2), mutation_rate(0.1), mutation_magnitude(0.5),
          crossover(snakenet::CrossoverMode::PER_WEIGHT),
          tournament_fraction(0.0), tournament_size(5), random_fraction(0.0),
          adaptive_mutation(false),
          topology{snakegame::VISION_SIZE, 16, 8, snakegame::NUM_ACTIONS},
          activation(snakenet::ActivationKind::RELU), board_size(15) {}

    static GAParameters from_config(const SimulationConfig& config);
};

// Fitness-proportionate selection over a fixed set of weights.
class RouletteWheel {
public:
    explicit RouletteWheel(const std::vector<double>& fitness);

    size_t select(std::mt19937& rng) const;

    // True when every weight is zero and selection falls back to uniform.
    bool is_degenerate() const { return total_ <= 0.0; }
    double get_total() const { return total_; }

private:
    std::vector<double> cumulative_;
    double total_;
};

class GeneticAlgorithm {
public:
    GeneticAlgorithm(const GAParameters& params, uint32_t seed);
    ~GeneticAlgorithm() = default;

    std::vector<snakenet::NeuralNetwork> random_population();

    // Index 0 keeps the given network, the others get mutated copies.
    std::vector<snakenet::NeuralNetwork> seeded_population(const snakenet::NeuralNetwork& seed_network);

    // Next generation from the finished one. Always returns population_size networks.
    std::vector<snakenet::NeuralNetwork> evolve(const std::vector<ScoredNetwork>& scored);

    // Indices sorted by descending fitness; equal fitness keeps input order.
    static std::vector<size_t> rank(const std::vector<ScoredNetwork>& scored);

    size_t tournament_select(const std::vector<double>& fitness, uint32_t tournament_size);

    double get_mutation_rate() const { return current_mutation_rate_; }
    double get_mutation_magnitude() const { return current_mutation_magnitude_; }
    const GAParameters& get_parameters() const { return params_; }

private:
    void update_mutation_parameters(uint32_t generation_best_score);
    snakenet::BreedParameters breed_parameters() const;

    GAParameters params_;
    std::mt19937 rng_;
    double current_mutation_rate_;
    double current_mutation_magnitude_;
};

} // namespace snake_evolution

#endif // SNAKE_EVOLUTION_GENETIC_ALGORITHM_H
