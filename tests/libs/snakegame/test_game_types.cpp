#include <gtest/gtest.h>
#include "game_types.h"

using namespace snakegame;

TEST(GameTypesTest, TurnsAreRelativeToHeading) {
    EXPECT_EQ(turn_left(Direction::UP), Direction::LEFT);
    EXPECT_EQ(turn_right(Direction::UP), Direction::RIGHT);
    EXPECT_EQ(turn_left(Direction::RIGHT), Direction::UP);
    EXPECT_EQ(turn_right(Direction::LEFT), Direction::UP);

    for (Direction d : {Direction::UP, Direction::RIGHT, Direction::DOWN, Direction::LEFT}) {
        EXPECT_EQ(turn_left(turn_right(d)), d);
        EXPECT_EQ(apply_action(d, Action::STRAIGHT), d);
    }
}

TEST(GameTypesTest, OffsetsUseScreenCoordinates) {
    EXPECT_EQ(direction_offset(Direction::UP), Point(0, -1));
    EXPECT_EQ(direction_offset(Direction::DOWN), Point(0, 1));
    EXPECT_EQ(direction_offset(Direction::RIGHT), Point(1, 0));
    EXPECT_EQ(direction_offset(Direction::LEFT), Point(-1, 0));
}

TEST(GameTypesTest, ActionIndexMatchesNetworkOutputs) {
    EXPECT_EQ(action_from_index(0), Action::TURN_LEFT);
    EXPECT_EQ(action_from_index(1), Action::STRAIGHT);
    EXPECT_EQ(action_from_index(2), Action::TURN_RIGHT);
    EXPECT_THROW(action_from_index(NUM_ACTIONS), std::out_of_range);
}

TEST(GameTypesTest, BoardContains) {
    Board board(5);
    EXPECT_TRUE(board.contains(Point(0, 0)));
    EXPECT_TRUE(board.contains(Point(4, 4)));
    EXPECT_FALSE(board.contains(Point(5, 0)));
    EXPECT_FALSE(board.contains(Point(0, -1)));
    EXPECT_EQ(board.area(), 25);
}
