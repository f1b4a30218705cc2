#ifndef SNAKE_EVOLUTION_GENOME_H
#define SNAKE_EVOLUTION_GENOME_H

#include "neural_network.h"
#include "snake_game.h"
#include <cstdint>

namespace snake_evolution {

// One network playing its own game instance.
class Genome {
public:
    Genome(snakenet::NeuralNetwork network, const snakegame::GameConfig& game_config, uint32_t seed);

    // Returns false once the game is over; dead genomes are left untouched.
    bool update();

    // Fresh game with the same network.
    void reset();

    bool is_alive() const { return game_.is_running(); }
    double fitness(const snakegame::FitnessParameters& params) const { return game_.fitness(params); }

    snakegame::Action choose_action() const;

    const snakenet::NeuralNetwork& get_network() const { return network_; }
    const snakegame::SnakeGame& get_game() const { return game_; }
    snakegame::SnakeGame& get_game() { return game_; }

private:
    snakenet::NeuralNetwork network_;
    snakegame::SnakeGame game_;
};

} // namespace snake_evolution

#endif // SNAKE_EVOLUTION_GENOME_H
