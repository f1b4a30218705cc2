#include "game_types.h"
#include <stdexcept>

namespace snakegame {

Point direction_offset(Direction dir) {
    switch (dir) {
        case Direction::UP:
            return Point(0, -1);
        case Direction::RIGHT:
            return Point(1, 0);
        case Direction::DOWN:
            return Point(0, 1);
        case Direction::LEFT:
            return Point(-1, 0);
    }
    return Point(0, 0);
}

Direction turn_left(Direction dir) {
    switch (dir) {
        case Direction::UP:
            return Direction::LEFT;
        case Direction::LEFT:
            return Direction::DOWN;
        case Direction::DOWN:
            return Direction::RIGHT;
        case Direction::RIGHT:
            return Direction::UP;
    }
    return dir;
}

Direction turn_right(Direction dir) {
    switch (dir) {
        case Direction::UP:
            return Direction::RIGHT;
        case Direction::RIGHT:
            return Direction::DOWN;
        case Direction::DOWN:
            return Direction::LEFT;
        case Direction::LEFT:
            return Direction::UP;
    }
    return dir;
}

Action action_from_index(size_t index) {
    switch (index) {
        case 0:
            return Action::TURN_LEFT;
        case 1:
            return Action::STRAIGHT;
        case 2:
            return Action::TURN_RIGHT;
        default:
            throw std::out_of_range("Action index out of range: " + std::to_string(index));
    }
}

Direction apply_action(Direction heading, Action action) {
    switch (action) {
        case Action::TURN_LEFT:
            return turn_left(heading);
        case Action::TURN_RIGHT:
            return turn_right(heading);
        case Action::STRAIGHT:
            return heading;
    }
    return heading;
}

std::string death_reason_name(DeathReason reason) {
    switch (reason) {
        case DeathReason::COLLISION:
            return "collision";
        case DeathReason::STARVATION:
            return "starvation";
        case DeathReason::BOARD_FILLED:
            return "board filled";
    }
    return "unknown";
}

} // namespace snakegame
