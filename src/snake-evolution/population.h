#ifndef SNAKE_EVOLUTION_POPULATION_H
#define SNAKE_EVOLUTION_POPULATION_H

#include "genome.h"
#include <cstdint>
#include <random>
#include <utility>
#include <vector>

namespace snake_evolution {

struct ScoredNetwork {
    double fitness;
    uint32_t score;
    snakenet::NeuralNetwork network;

    ScoredNetwork() : fitness(0.0), score(0) {}
    ScoredNetwork(double f, uint32_t s, snakenet::NeuralNetwork net)
        : fitness(f), score(s), network(std::move(net)) {}
};

class Population {
public:
    // One genome per network; each game is seeded from seed_source in order.
    Population(std::vector<snakenet::NeuralNetwork> networks,
               const snakegame::GameConfig& game_config,
               const snakegame::FitnessParameters& fitness_params,
               std::mt19937& seed_source,
               uint32_t num_threads = 1);

    // Advances every live genome by one step. Returns whether any is still alive.
    bool step_all();

    bool is_finished() const { return alive_count_ == 0; }
    size_t size() const { return genomes_.size(); }
    size_t get_alive_count() const { return alive_count_; }
    uint32_t get_steps() const { return steps_; }

    std::vector<ScoredNetwork> results() const;
    double fitness_of(size_t index) const;

    // Highest fitness, lowest index on ties.
    size_t best_index() const;
    // Best live genome, or best_index() when all are dead.
    size_t leader_index() const;
    uint32_t best_score() const;
    double mean_fitness() const;

    const std::vector<Genome>& get_genomes() const { return genomes_; }
    const Genome& get_genome(size_t index) const { return genomes_.at(index); }

private:
    void step_range(size_t begin, size_t end);
    size_t count_alive() const;

    std::vector<Genome> genomes_;
    snakegame::FitnessParameters fitness_params_;
    uint32_t num_threads_;
    size_t alive_count_;
    uint32_t steps_;
};

} // namespace snake_evolution

#endif // SNAKE_EVOLUTION_POPULATION_H
