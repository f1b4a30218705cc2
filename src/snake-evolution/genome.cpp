#include "genome.h"
#include <utility>

namespace snake_evolution {

Genome::Genome(snakenet::NeuralNetwork network, const snakegame::GameConfig& game_config, uint32_t seed)
    : network_(std::move(network)), game_(game_config, seed) {
    if (network_.input_size() != snakegame::VISION_SIZE) {
        throw snakenet::ShapeMismatch("Network input size " + std::to_string(network_.input_size()) +
                                      " does not match vision size " +
                                      std::to_string(snakegame::VISION_SIZE));
    }
    if (network_.output_size() != snakegame::NUM_ACTIONS) {
        throw snakenet::ShapeMismatch("Network output size " + std::to_string(network_.output_size()) +
                                      " does not match the number of actions");
    }
}

snakegame::Action Genome::choose_action() const {
    return snakegame::action_from_index(network_.decide(game_.vision()));
}

bool Genome::update() {
    if (!game_.is_running()) {
        return false;
    }
    game_.step(choose_action());
    return true;
}

void Genome::reset() {
    game_.reset();
}

} // namespace snake_evolution
