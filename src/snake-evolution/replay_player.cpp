#include "replay_player.h"
#include <spdlog/spdlog.h>
#include <utility>

namespace snake_evolution {

ReplayPlayer::ReplayPlayer(const snakegame::GameConfig& game_config, uint32_t seed)
    : game_(game_config, seed), games_played_(0) {}

void ReplayPlayer::offer(const GenerationSummary& summary, const snakenet::NeuralNetwork& network) {
    pending_network_ = network;
    pending_summary_ = summary;
}

bool ReplayPlayer::take_pending() {
    if (!pending_network_) {
        return false;
    }
    network_ = std::move(pending_network_);
    summary_ = std::move(pending_summary_);
    pending_network_.reset();
    pending_summary_.reset();
    return true;
}

bool ReplayPlayer::step() {
    if (!network_) {
        if (!take_pending()) {
            return false;
        }
        game_.reset();
        SPDLOG_DEBUG("Replaying best network of generation {}", summary_->generation);
    }

    if (!game_.is_running()) {
        games_played_++;
        if (take_pending()) {
            SPDLOG_DEBUG("Replaying best network of generation {}", summary_->generation);
        }
        game_.reset();
    }

    game_.step(snakegame::action_from_index(network_->decide(game_.vision())));
    return true;
}

} // namespace snake_evolution
