#include "snake_game.h"
#include <spdlog/spdlog.h>
#include <array>
#include <stdexcept>
#include <string>

namespace snakegame {

namespace {

// Clockwise from straight up; rays are read starting at the heading's slot
constexpr std::array<std::array<int, 2>, NUM_VISION_RAYS> RAY_OFFSETS = {{
    {0, -1}, {1, -1}, {1, 0}, {1, 1}, {0, 1}, {-1, 1}, {-1, 0}, {-1, -1}
}};

size_t ray_start_index(Direction heading) {
    switch (heading) {
        case Direction::UP:
            return 0;
        case Direction::RIGHT:
            return 2;
        case Direction::DOWN:
            return 4;
        case Direction::LEFT:
            return 6;
    }
    return 0;
}

} // namespace

uint32_t GameConfig::starvation_limit(uint32_t score) const {
    const uint32_t base = effective_starvation_threshold();
    if (!starvation_scaling) {
        return base;
    }
    if (score > 30) {
        return base * 6;
    }
    if (score > 20) {
        return base * 3;
    }
    if (score > 5) {
        return base * 2;
    }
    return base;
}

double compute_fitness(uint32_t score, uint32_t total_steps, const FitnessParameters& params) {
    double steps = static_cast<double>(total_steps);
    return params.score_weight * static_cast<double>(score) +
           params.step_weight * steps / (steps + 1.0);
}

SnakeGame::SnakeGame(const GameConfig& config, uint32_t seed)
    : config_(config), board_(config.board_size),
      food_(), heading_(Direction::RIGHT), state_(Running{}),
      score_(0), steps_since_food_(0), total_steps_(0), rng_(seed) {
    if (config_.board_size < static_cast<int>(INITIAL_SNAKE_LENGTH) + 1) {
        throw std::invalid_argument("Board size " + std::to_string(config_.board_size) +
                                    " is too small for the initial snake");
    }
    reset();
}

void SnakeGame::reset() {
    body_.clear();
    occupied_.assign(static_cast<size_t>(board_.area()), 0);

    const Point head(board_.size / 2, board_.size / 2);
    for (size_t i = 0; i < INITIAL_SNAKE_LENGTH; ++i) {
        Point segment(head.x - static_cast<int>(i), head.y);
        body_.push_back(segment);
        set_occupied(segment, true);
    }

    heading_ = Direction::RIGHT;
    state_ = Running{};
    score_ = 0;
    steps_since_food_ = 0;
    total_steps_ = 0;

    relocate_food();
}

void SnakeGame::set_occupied(const Point& p, bool occupied) {
    occupied_[static_cast<size_t>(p.y * board_.size + p.x)] = occupied ? 1 : 0;
}

bool SnakeGame::is_body(const Point& p) const {
    if (!board_.contains(p)) {
        return false;
    }
    return occupied_[static_cast<size_t>(p.y * board_.size + p.x)] != 0;
}

std::optional<DeathReason> SnakeGame::get_death_reason() const {
    if (const Dead* dead = std::get_if<Dead>(&state_)) {
        return dead->reason;
    }
    return std::nullopt;
}

void SnakeGame::kill(DeathReason reason) {
    state_ = Dead{reason};
    SPDLOG_TRACE("Snake died ({}) after {} steps with score {}",
                 death_reason_name(reason), total_steps_, score_);
}

bool SnakeGame::relocate_food() {
    std::vector<Point> free_cells;
    free_cells.reserve(static_cast<size_t>(board_.area()) - body_.size());

    for (int y = 0; y < board_.size; ++y) {
        for (int x = 0; x < board_.size; ++x) {
            Point p(x, y);
            if (!is_body(p)) {
                free_cells.push_back(p);
            }
        }
    }

    if (free_cells.empty()) {
        return false;
    }

    std::uniform_int_distribution<size_t> pick(0, free_cells.size() - 1);
    food_ = free_cells[pick(rng_)];
    return true;
}

void SnakeGame::place_food(const Point& position) {
    if (!board_.contains(position)) {
        throw std::invalid_argument("Food position outside the board");
    }
    if (is_body(position)) {
        throw std::invalid_argument("Food position overlaps the snake");
    }
    food_ = position;
}

void SnakeGame::step(Action action) {
    if (!is_running()) {
        return;
    }

    total_steps_++;
    heading_ = apply_action(heading_, action);

    const Point new_head = get_head() + direction_offset(heading_);
    const Point tail = body_.back();

    // The tail cell is vacated this step, so moving onto it is legal
    if (!board_.contains(new_head) || (is_body(new_head) && !(new_head == tail))) {
        kill(DeathReason::COLLISION);
        return;
    }

    if (new_head == food_) {
        body_.push_front(new_head);
        set_occupied(new_head, true);
        score_++;
        steps_since_food_ = 0;

        if (!relocate_food()) {
            kill(DeathReason::BOARD_FILLED);
        }
        return;
    }

    body_.pop_back();
    set_occupied(tail, false);
    body_.push_front(new_head);
    set_occupied(new_head, true);
    steps_since_food_++;

    if (steps_since_food_ >= get_starvation_threshold()) {
        kill(DeathReason::STARVATION);
    }
}

std::vector<double> SnakeGame::vision() const {
    std::vector<double> result;
    result.reserve(VISION_SIZE);

    const Point head = get_head();
    const size_t start = ray_start_index(heading_);

    for (size_t r = 0; r < NUM_VISION_RAYS; ++r) {
        const auto& offset = RAY_OFFSETS[(start + r) % NUM_VISION_RAYS];
        const Point delta(offset[0], offset[1]);

        bool food_seen = false;
        int body_distance = 0;
        int distance = 1;
        Point cursor = head + delta;

        while (board_.contains(cursor)) {
            if (body_distance == 0 && is_body(cursor)) {
                body_distance = distance;
            }
            if (body_distance == 0 && cursor == food_) {
                food_seen = true;
            }
            cursor = cursor + delta;
            distance++;
        }

        result.push_back(1.0 / static_cast<double>(distance));
        result.push_back(food_seen ? 1.0 : 0.0);
        result.push_back(body_distance > 0 ? 1.0 / static_cast<double>(body_distance) : 0.0);
    }

    return result;
}

double SnakeGame::fitness(const FitnessParameters& params) const {
    return compute_fitness(score_, total_steps_, params);
}

std::string board_to_text(const SnakeGame& game) {
    const int size = game.get_board().size;
    std::string text;
    text.reserve(static_cast<size_t>(size) * (size + 1));

    for (int y = 0; y < size; ++y) {
        for (int x = 0; x < size; ++x) {
            const Point p(x, y);
            if (p == game.get_head()) {
                text += 'H';
            } else if (game.is_body(p)) {
                text += 'o';
            } else if (p == game.get_food()) {
                text += '*';
            } else {
                text += '.';
            }
        }
        text += '\n';
    }
    return text;
}

} // namespace snakegame
