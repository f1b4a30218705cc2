#include "population.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace snake_evolution {

namespace {

void join_all(std::vector<std::thread>& threads) {
    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

} // namespace

Population::Population(std::vector<snakenet::NeuralNetwork> networks,
                       const snakegame::GameConfig& game_config,
                       const snakegame::FitnessParameters& fitness_params,
                       std::mt19937& seed_source,
                       uint32_t num_threads)
    : fitness_params_(fitness_params), num_threads_(std::max<uint32_t>(1, num_threads)),
      alive_count_(0), steps_(0) {
    if (networks.empty()) {
        throw std::logic_error("Population needs at least one network");
    }

    genomes_.reserve(networks.size());
    for (auto& network : networks) {
        uint32_t seed = static_cast<uint32_t>(seed_source());
        genomes_.emplace_back(std::move(network), game_config, seed);
    }
    alive_count_ = count_alive();
}

void Population::step_range(size_t begin, size_t end) {
    for (size_t i = begin; i < end; ++i) {
        genomes_[i].update();
    }
}

size_t Population::count_alive() const {
    return static_cast<size_t>(std::count_if(genomes_.begin(), genomes_.end(),
        [](const Genome& g) { return g.is_alive(); }));
}

bool Population::step_all() {
    if (alive_count_ == 0) {
        return false;
    }

    const size_t count = genomes_.size();
    const size_t workers = std::min<size_t>(num_threads_, count);

    if (workers <= 1) {
        step_range(0, count);
    } else {
        // Genomes share nothing, so contiguous ranges can run without locking
        std::vector<std::thread> threads;
        std::vector<std::exception_ptr> errors(workers);
        threads.reserve(workers);

        const size_t chunk = (count + workers - 1) / workers;
        try {
            for (size_t w = 0; w < workers; ++w) {
                size_t begin = w * chunk;
                size_t end = std::min(count, begin + chunk);
                threads.emplace_back([this, begin, end, w, &errors]() {
                    try {
                        step_range(begin, end);
                    } catch (...) {
                        errors[w] = std::current_exception();
                    }
                });
            }
        } catch (const std::system_error& e) {
            // Workers already running still reference this population
            spdlog::error("Failed to start simulation thread: {}", e.what());
            join_all(threads);
            throw;
        }
        join_all(threads);
        for (const auto& error : errors) {
            if (error) {
                std::rethrow_exception(error);
            }
        }
    }

    steps_++;
    alive_count_ = count_alive();
    return alive_count_ > 0;
}

std::vector<ScoredNetwork> Population::results() const {
    std::vector<ScoredNetwork> scored;
    scored.reserve(genomes_.size());
    for (const auto& genome : genomes_) {
        scored.emplace_back(genome.fitness(fitness_params_), genome.get_game().get_score(),
                            genome.get_network());
    }
    return scored;
}

double Population::fitness_of(size_t index) const {
    return genomes_.at(index).fitness(fitness_params_);
}

size_t Population::best_index() const {
    size_t best = 0;
    double best_fitness = fitness_of(0);
    for (size_t i = 1; i < genomes_.size(); ++i) {
        double f = fitness_of(i);
        if (f > best_fitness) {
            best = i;
            best_fitness = f;
        }
    }
    return best;
}

size_t Population::leader_index() const {
    bool found = false;
    size_t leader = 0;
    double leader_fitness = 0.0;
    for (size_t i = 0; i < genomes_.size(); ++i) {
        if (!genomes_[i].is_alive()) continue;
        double f = fitness_of(i);
        if (!found || f > leader_fitness) {
            found = true;
            leader = i;
            leader_fitness = f;
        }
    }
    return found ? leader : best_index();
}

uint32_t Population::best_score() const {
    uint32_t best = 0;
    for (const auto& genome : genomes_) {
        best = std::max(best, genome.get_game().get_score());
    }
    return best;
}

double Population::mean_fitness() const {
    double total = 0.0;
    for (size_t i = 0; i < genomes_.size(); ++i) {
        total += fitness_of(i);
    }
    return total / static_cast<double>(genomes_.size());
}

} // namespace snake_evolution
