#include "genetic_algorithm.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <iterator>
#include <numeric>
#include <stdexcept>

namespace snake_evolution {

GAParameters GAParameters::from_config(const SimulationConfig& config) {
    GAParameters params;
    params.population_size = config.population_size;
    params.elite_count = config.elite_count;
    params.mutation_rate = config.mutation_rate;
    params.mutation_magnitude = config.mutation_magnitude;
    params.crossover = config.crossover;
    params.tournament_fraction = config.tournament_fraction;
    params.tournament_size = config.tournament_size;
    params.random_fraction = config.random_fraction;
    params.adaptive_mutation = config.adaptive_mutation;
    params.topology = config.topology;
    params.activation = config.activation;
    params.board_size = config.board_size;
    return params;
}

RouletteWheel::RouletteWheel(const std::vector<double>& fitness) : total_(0.0) {
    cumulative_.reserve(fitness.size());
    for (double f : fitness) {
        // Non-finite and negative fitness get no share of the wheel
        if (std::isfinite(f) && f > 0.0) {
            total_ += f;
        }
        cumulative_.push_back(total_);
    }
}

size_t RouletteWheel::select(std::mt19937& rng) const {
    if (cumulative_.empty()) {
        throw std::logic_error("Cannot select from an empty roulette wheel");
    }

    if (is_degenerate()) {
        std::uniform_int_distribution<size_t> uniform(0, cumulative_.size() - 1);
        return uniform(rng);
    }

    std::uniform_real_distribution<double> spin(0.0, total_);
    double point = spin(rng);
    auto it = std::upper_bound(cumulative_.begin(), cumulative_.end(), point);
    size_t index = static_cast<size_t>(std::distance(cumulative_.begin(), it));

    // Rounding can land exactly on the total
    if (index >= cumulative_.size()) {
        index = cumulative_.size() - 1;
        while (index > 0 && cumulative_[index] == cumulative_[index - 1]) {
            --index;
        }
    }
    return index;
}

GeneticAlgorithm::GeneticAlgorithm(const GAParameters& params, uint32_t seed)
    : params_(params), rng_(seed),
      current_mutation_rate_(params.mutation_rate),
      current_mutation_magnitude_(params.mutation_magnitude) {
    snakenet::validate_topology(params_.topology);
    if (params_.population_size == 0) {
        throw std::invalid_argument("population_size must be positive");
    }
    if (params_.elite_count > params_.population_size) {
        throw std::logic_error("elite_count cannot exceed population_size");
    }
}

snakenet::BreedParameters GeneticAlgorithm::breed_parameters() const {
    snakenet::BreedParameters breed;
    breed.crossover = params_.crossover;
    breed.mutation_rate = current_mutation_rate_;
    breed.mutation_magnitude = current_mutation_magnitude_;
    return breed;
}

std::vector<snakenet::NeuralNetwork> GeneticAlgorithm::random_population() {
    std::vector<snakenet::NeuralNetwork> networks;
    networks.reserve(params_.population_size);
    for (uint32_t i = 0; i < params_.population_size; ++i) {
        networks.push_back(snakenet::NeuralNetwork::random(params_.topology, rng_, params_.activation));
    }
    spdlog::debug("Generated {} random networks with topology {}",
                  networks.size(), format_topology(params_.topology));
    return networks;
}

std::vector<snakenet::NeuralNetwork> GeneticAlgorithm::seeded_population(
    const snakenet::NeuralNetwork& seed_network) {
    if (seed_network.topology() != params_.topology) {
        throw snakenet::ShapeMismatch("Loaded network topology " + format_topology(seed_network.topology()) +
                                      " does not match configured topology " +
                                      format_topology(params_.topology));
    }

    std::vector<snakenet::NeuralNetwork> networks;
    networks.reserve(params_.population_size);
    networks.push_back(seed_network);
    while (networks.size() < params_.population_size) {
        snakenet::NeuralNetwork copy = seed_network;
        copy.mutate(rng_, params_.mutation_rate, params_.mutation_magnitude);
        networks.push_back(std::move(copy));
    }
    return networks;
}

std::vector<size_t> GeneticAlgorithm::rank(const std::vector<ScoredNetwork>& scored) {
    std::vector<size_t> order(scored.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&scored](size_t a, size_t b) {
        return scored[a].fitness > scored[b].fitness;
    });
    return order;
}

size_t GeneticAlgorithm::tournament_select(const std::vector<double>& fitness, uint32_t tournament_size) {
    if (fitness.empty()) {
        throw std::logic_error("Cannot run a tournament on an empty population");
    }

    std::uniform_int_distribution<size_t> idx_dist(0, fitness.size() - 1);
    size_t best = idx_dist(rng_);
    for (uint32_t j = 1; j < tournament_size; ++j) {
        size_t idx = idx_dist(rng_);
        if (fitness[idx] > fitness[best]) {
            best = idx;
        }
    }
    return best;
}

void GeneticAlgorithm::update_mutation_parameters(uint32_t generation_best_score) {
    if (!params_.adaptive_mutation) {
        return;
    }

    const double capacity = static_cast<double>(params_.board_size) * params_.board_size -
                            snakegame::INITIAL_SNAKE_LENGTH;
    const double progress = capacity > 0.0 ? generation_best_score / capacity : 0.0;

    double rate = params_.mutation_rate;
    double magnitude = params_.mutation_magnitude;
    if (progress > 0.75) {
        rate = 0.15;
        magnitude = 0.1;
    } else if (progress > 0.5) {
        rate = 0.25;
        magnitude = 0.1;
    }

    if (rate != current_mutation_rate_ || magnitude != current_mutation_magnitude_) {
        spdlog::info("Mutation adjusted to rate {} magnitude {} (best score {})",
                     rate, magnitude, generation_best_score);
    }
    current_mutation_rate_ = rate;
    current_mutation_magnitude_ = magnitude;
}

std::vector<snakenet::NeuralNetwork> GeneticAlgorithm::evolve(const std::vector<ScoredNetwork>& scored) {
    if (scored.empty()) {
        throw std::logic_error("Cannot evolve an empty generation");
    }

    const size_t target = params_.population_size;
    const size_t elite = params_.elite_count;
    if (elite > scored.size()) {
        throw std::logic_error("elite_count " + std::to_string(elite) +
                               " exceeds generation size " + std::to_string(scored.size()));
    }

    uint32_t generation_best = 0;
    std::vector<double> fitness;
    fitness.reserve(scored.size());
    for (const auto& s : scored) {
        fitness.push_back(s.fitness);
        generation_best = std::max(generation_best, s.score);
    }
    update_mutation_parameters(generation_best);

    const size_t remaining = target > elite ? target - elite : 0;
    const size_t random_count = std::min(remaining,
        static_cast<size_t>(std::floor(params_.random_fraction * static_cast<double>(target))));
    const size_t tournament_count = std::min(remaining - random_count,
        static_cast<size_t>(std::floor(params_.tournament_fraction * static_cast<double>(target))));
    const size_t roulette_count = remaining - random_count - tournament_count;

    std::vector<snakenet::NeuralNetwork> next;
    next.reserve(target);

    // Elites carry over unchanged
    std::vector<size_t> order = rank(scored);
    for (size_t i = 0; i < elite && next.size() < target; ++i) {
        next.push_back(scored[order[i]].network);
    }

    const snakenet::BreedParameters breed = breed_parameters();

    RouletteWheel wheel(fitness);
    if (roulette_count > 0 && wheel.is_degenerate()) {
        SPDLOG_DEBUG("All fitness values are zero, selecting parents uniformly");
    }
    for (size_t i = 0; i < roulette_count; ++i) {
        const auto& parent_a = scored[wheel.select(rng_)].network;
        const auto& parent_b = scored[wheel.select(rng_)].network;
        next.push_back(snakenet::NeuralNetwork::breed(parent_a, parent_b, rng_, breed));
    }

    for (size_t i = 0; i < tournament_count; ++i) {
        snakenet::NeuralNetwork child = scored[tournament_select(fitness, params_.tournament_size)].network;
        child.mutate(rng_, breed.mutation_rate, breed.mutation_magnitude);
        next.push_back(std::move(child));
    }

    for (size_t i = 0; i < random_count; ++i) {
        next.push_back(snakenet::NeuralNetwork::random(params_.topology, rng_, params_.activation));
    }

    SPDLOG_DEBUG("Next generation: {} elite, {} roulette, {} tournament, {} random",
                 std::min(elite, target), roulette_count, tournament_count, random_count);
    return next;
}

} // namespace snake_evolution
