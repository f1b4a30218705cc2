#include "simulation_driver.h"
#include "network_io.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

namespace snake_evolution {

namespace {

const SimulationConfig& validated(const SimulationConfig& config) {
    config.validate();
    return config;
}

} // namespace

SimulationDriver::SimulationDriver(const SimulationConfig& config)
    : config_(validated(config)),
      master_rng_(config.random_seed),
      ga_(GAParameters::from_config(config), static_cast<uint32_t>(master_rng_())),
      generation_(0), best_fitness_(0.0), best_score_(0) {
    start_generation(initial_networks());
}

std::vector<snakenet::NeuralNetwork> SimulationDriver::initial_networks() {
    if (config_.load_file.empty()) {
        return ga_.random_population();
    }

    spdlog::info("Seeding first generation from {}", config_.load_file);
    snakenet::NeuralNetwork loaded = snakenet::load_network_file(config_.load_file);
    return ga_.seeded_population(loaded);
}

void SimulationDriver::start_generation(std::vector<snakenet::NeuralNetwork> networks) {
    population_ = std::make_unique<Population>(std::move(networks), config_.game_config(),
                                               config_.fitness_parameters(), master_rng_,
                                               config_.num_threads);
    generation_start_ = std::chrono::steady_clock::now();
}

bool SimulationDriver::tick() {
    if (population_->step_all()) {
        return false;
    }
    finish_generation();
    return true;
}

void SimulationDriver::finish_generation() {
    std::vector<ScoredNetwork> scored = population_->results();
    const size_t best = population_->best_index();
    const uint32_t generation_best_score = population_->best_score();

    GenerationSummary summary;
    summary.generation = generation_;
    summary.elapsed_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - generation_start_).count();
    summary.generation_best_score = generation_best_score;
    summary.best_fitness = scored[best].fitness;
    summary.mean_fitness = population_->mean_fitness();

    best_fitness_ = std::max(best_fitness_, scored[best].fitness);
    generation_best_network_ = scored[best].network;

    if (generation_best_score > best_score_) {
        best_score_ = generation_best_score;
        if (!config_.save_file.empty()) {
            snakenet::save_network_file(config_.save_file, scored[best].network);
        }
    }
    summary.best_score_so_far = best_score_;

    std::vector<snakenet::NeuralNetwork> next = ga_.evolve(scored);
    summary.mutation_rate = ga_.get_mutation_rate();
    summary.mutation_magnitude = ga_.get_mutation_magnitude();

    spdlog::info("Generation {}: best score {} (run best {}), best fitness {:.2f}, "
                 "mean fitness {:.2f}, {:.2f}s, mutation {}/{}",
                 summary.generation, summary.generation_best_score, summary.best_score_so_far,
                 summary.best_fitness, summary.mean_fitness, summary.elapsed_seconds,
                 summary.mutation_rate, summary.mutation_magnitude);

    last_summary_ = summary;
    if (callback_) {
        callback_(summary, *generation_best_network_);
    }

    generation_++;
    start_generation(std::move(next));
}

void SimulationDriver::run(const std::atomic<bool>& stop_requested) {
    spdlog::info("Starting evolution with {} genomes on a {}x{} board",
                 config_.population_size, config_.board_size, config_.board_size);

    while (!stop_requested.load()) {
        if (config_.max_generations > 0 && generation_ >= config_.max_generations) {
            break;
        }
        while (!tick()) {
        }
    }

    spdlog::info("Evolution stopped after {} generations, best score {}", generation_, best_score_);
}

void SimulationDriver::run_generations(uint32_t count) {
    for (uint32_t i = 0; i < count; ++i) {
        while (!tick()) {
        }
    }
}

RenderSnapshot SimulationDriver::snapshot() const {
    const Genome& leader = population_->get_genome(population_->leader_index());
    const snakegame::SnakeGame& game = leader.get_game();

    RenderSnapshot snap;
    snap.board_size = game.get_board().size;
    snap.body.assign(game.get_body().begin(), game.get_body().end());
    snap.food = game.get_food();
    snap.score = game.get_score();
    snap.steps_since_food = game.get_steps_since_food();
    snap.starvation_limit = game.get_starvation_threshold();
    snap.alive = game.is_running();
    snap.generation = generation_;
    snap.best_fitness = best_fitness_;
    snap.best_score = best_score_;
    snap.alive_count = population_->get_alive_count();
    return snap;
}

} // namespace snake_evolution
