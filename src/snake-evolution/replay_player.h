#ifndef SNAKE_EVOLUTION_REPLAY_PLAYER_H
#define SNAKE_EVOLUTION_REPLAY_PLAYER_H

#include "neural_network.h"
#include "simulation_driver.h"
#include "snake_game.h"
#include <cstdint>
#include <optional>

namespace snake_evolution {

// Replays the best network of the latest finished generation in a game of its
// own. A newly offered network takes over when the current game ends.
class ReplayPlayer {
public:
    ReplayPlayer(const snakegame::GameConfig& game_config, uint32_t seed);

    void offer(const GenerationSummary& summary, const snakenet::NeuralNetwork& network);

    // Advances the replay by one move. A finished game restarts, with the
    // newest offered network if there is one. Returns false until a network
    // has been offered.
    bool step();

    bool has_network() const { return network_.has_value(); }
    const snakegame::SnakeGame& get_game() const { return game_; }

    // Summary of the generation the current network came from.
    const std::optional<GenerationSummary>& get_summary() const { return summary_; }
    uint32_t get_games_played() const { return games_played_; }

private:
    bool take_pending();

    snakegame::SnakeGame game_;
    std::optional<snakenet::NeuralNetwork> network_;
    std::optional<GenerationSummary> summary_;
    uint32_t games_played_;

    std::optional<snakenet::NeuralNetwork> pending_network_;
    std::optional<GenerationSummary> pending_summary_;
};

} // namespace snake_evolution

#endif // SNAKE_EVOLUTION_REPLAY_PLAYER_H
