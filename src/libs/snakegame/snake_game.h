#ifndef SNAKEGAME_SNAKE_GAME_H
#define SNAKEGAME_SNAKE_GAME_H

#include "game_types.h"
#include <cstdint>
#include <deque>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace snakegame {

constexpr size_t NUM_VISION_RAYS = 8;
constexpr size_t VALUES_PER_RAY = 3;  // wall distance, food seen, body distance
constexpr size_t VISION_SIZE = NUM_VISION_RAYS * VALUES_PER_RAY;
constexpr size_t INITIAL_SNAKE_LENGTH = 3;

struct GameConfig {
    int board_size;
    uint32_t starvation_threshold;  // 0 selects board area
    bool starvation_scaling;        // longer snakes may go longer without food

    GameConfig() : board_size(15), starvation_threshold(0), starvation_scaling(false) {}
    GameConfig(int size, uint32_t threshold, bool scaling = false)
        : board_size(size), starvation_threshold(threshold), starvation_scaling(scaling) {}

    uint32_t effective_starvation_threshold() const {
        return starvation_threshold > 0 ? starvation_threshold
                                        : static_cast<uint32_t>(board_size * board_size);
    }

    // Steps without food allowed at the given score. Scaling multiplies the
    // effective threshold once the score passes 5, 20 and 30.
    uint32_t starvation_limit(uint32_t score) const;
};

struct FitnessParameters {
    double score_weight;
    double step_weight;

    FitnessParameters() : score_weight(1000.0), step_weight(1.0) {}
    FitnessParameters(double score_w, double step_w) : score_weight(score_w), step_weight(step_w) {}
};

// Score dominates as long as step_weight <= score_weight: the step term is
// always below step_weight.
double compute_fitness(uint32_t score, uint32_t total_steps, const FitnessParameters& params);

class SnakeGame {
public:
    SnakeGame(const GameConfig& config, uint32_t seed);
    ~SnakeGame() = default;

    void reset();
    void step(Action action);

    // 8 rays relative to the heading, starting forward and going clockwise.
    std::vector<double> vision() const;

    // Moves the food to a specific free cell.
    void place_food(const Point& position);

    bool is_running() const { return std::holds_alternative<Running>(state_); }
    const GameState& get_state() const { return state_; }
    std::optional<DeathReason> get_death_reason() const;

    const Board& get_board() const { return board_; }
    const std::deque<Point>& get_body() const { return body_; }
    const Point& get_head() const { return body_.front(); }
    const Point& get_food() const { return food_; }
    Direction get_heading() const { return heading_; }
    uint32_t get_score() const { return score_; }
    uint32_t get_steps_since_food() const { return steps_since_food_; }
    uint32_t get_total_steps() const { return total_steps_; }
    uint32_t get_starvation_threshold() const { return config_.starvation_limit(score_); }
    size_t get_length() const { return body_.size(); }

    bool is_body(const Point& p) const;
    double fitness(const FitnessParameters& params) const;

private:
    bool relocate_food();
    void set_occupied(const Point& p, bool occupied);
    void kill(DeathReason reason);

    GameConfig config_;
    Board board_;

    std::deque<Point> body_;
    std::vector<uint8_t> occupied_;
    Point food_;
    Direction heading_;
    GameState state_;

    uint32_t score_;
    uint32_t steps_since_food_;
    uint32_t total_steps_;

    std::mt19937 rng_;
};

// One line per row: 'H' head, 'o' body, '*' food, '.' empty.
std::string board_to_text(const SnakeGame& game);

} // namespace snakegame

#endif // SNAKEGAME_SNAKE_GAME_H
