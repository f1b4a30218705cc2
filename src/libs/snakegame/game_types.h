#ifndef SNAKEGAME_GAME_TYPES_H
#define SNAKEGAME_GAME_TYPES_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace snakegame {

struct Point {
    int x, y;

    Point() : x(0), y(0) {}
    Point(int x_val, int y_val) : x(x_val), y(y_val) {}

    Point operator+(const Point& other) const {
        return Point(x + other.x, y + other.y);
    }

    bool operator==(const Point& other) const = default;
};

// Screen coordinates: y grows downwards
enum class Direction {
    UP,
    RIGHT,
    DOWN,
    LEFT
};

Point direction_offset(Direction dir);
Direction turn_left(Direction dir);
Direction turn_right(Direction dir);

// Relative to the current heading. Matches the network's output order.
enum class Action {
    TURN_LEFT = 0,
    STRAIGHT = 1,
    TURN_RIGHT = 2
};

constexpr size_t NUM_ACTIONS = 3;

Action action_from_index(size_t index);
Direction apply_action(Direction heading, Action action);

enum class DeathReason {
    COLLISION,
    STARVATION,
    BOARD_FILLED
};

std::string death_reason_name(DeathReason reason);

struct Running {};

struct Dead {
    DeathReason reason;
};

using GameState = std::variant<Running, Dead>;

struct Board {
    int size;

    Board() : size(0) {}
    explicit Board(int board_size) : size(board_size) {}

    bool contains(const Point& p) const {
        return p.x >= 0 && p.y >= 0 && p.x < size && p.y < size;
    }

    int area() const { return size * size; }
};

} // namespace snakegame

#endif // SNAKEGAME_GAME_TYPES_H
