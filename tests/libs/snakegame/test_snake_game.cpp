#include <gtest/gtest.h>
#include "snake_game.h"
#include <set>
#include <utility>
#include <vector>

using namespace snakegame;

class SnakeGameTest : public ::testing::Test {
protected:
    // 10x10 board: head starts at (5,5) facing right, body (4,5) and (3,5)
    SnakeGame make_game(uint32_t threshold = 100, uint32_t seed = 1) {
        return SnakeGame(GameConfig(10, threshold), seed);
    }

    bool body_is_valid(const SnakeGame& game) {
        std::set<std::pair<int, int>> cells;
        for (const auto& p : game.get_body()) {
            if (!game.get_board().contains(p)) {
                return false;
            }
            if (!cells.insert({p.x, p.y}).second) {
                return false;
            }
        }
        return true;
    }

    // Relative action that moves the head onto an adjacent target cell.
    Action action_towards(const SnakeGame& game, const Point& target) {
        for (size_t i = 0; i < NUM_ACTIONS; ++i) {
            Action action = action_from_index(i);
            if (game.get_head() + direction_offset(apply_action(game.get_heading(), action)) == target) {
                return action;
            }
        }
        ADD_FAILURE() << "target is not reachable in one step";
        return Action::STRAIGHT;
    }

    // Eats its way along the path, placing the food one cell ahead each step.
    void eat_along(SnakeGame& game, const std::vector<Point>& path) {
        for (const auto& cell : path) {
            game.place_food(cell);
            game.step(action_towards(game, cell));
        }
    }
};

TEST_F(SnakeGameTest, InitialState) {
    SnakeGame game = make_game();

    EXPECT_TRUE(game.is_running());
    EXPECT_EQ(game.get_head(), Point(5, 5));
    EXPECT_EQ(game.get_length(), INITIAL_SNAKE_LENGTH);
    EXPECT_EQ(game.get_heading(), Direction::RIGHT);
    EXPECT_EQ(game.get_score(), 0u);
    EXPECT_EQ(game.get_total_steps(), 0u);
    EXPECT_FALSE(game.is_body(game.get_food()));
    EXPECT_TRUE(game.get_board().contains(game.get_food()));
    EXPECT_FALSE(game.get_death_reason().has_value());
}

TEST_F(SnakeGameTest, EatingFoodOneCellAhead) {
    SnakeGame game = make_game(100);
    game.place_food(Point(6, 5));

    game.step(Action::STRAIGHT);

    EXPECT_TRUE(game.is_running());
    EXPECT_EQ(game.get_score(), 1u);
    EXPECT_EQ(game.get_length(), 4u);
    EXPECT_EQ(game.get_steps_since_food(), 0u);
    EXPECT_EQ(game.get_head(), Point(6, 5));
    EXPECT_FALSE(game.is_body(game.get_food()));
}

TEST_F(SnakeGameTest, MovingWithoutFoodKeepsLength) {
    SnakeGame game = make_game(100);
    game.place_food(Point(0, 0));

    game.step(Action::TURN_LEFT);

    EXPECT_EQ(game.get_heading(), Direction::UP);
    EXPECT_EQ(game.get_head(), Point(5, 4));
    EXPECT_EQ(game.get_length(), 3u);
    EXPECT_EQ(game.get_steps_since_food(), 1u);
    EXPECT_EQ(game.get_total_steps(), 1u);
    EXPECT_FALSE(game.is_body(Point(3, 5)));
}

TEST_F(SnakeGameTest, StarvesAfterExactlyThresholdSteps) {
    SnakeGame game = make_game(8);
    game.place_food(Point(0, 0));

    // Turning right every step circles a 2x2 square forever
    for (int i = 0; i < 7; ++i) {
        game.step(Action::TURN_RIGHT);
        ASSERT_TRUE(game.is_running()) << "died early at step " << i + 1;
    }

    game.step(Action::TURN_RIGHT);
    EXPECT_FALSE(game.is_running());
    EXPECT_EQ(game.get_death_reason(), DeathReason::STARVATION);
    EXPECT_EQ(game.get_steps_since_food(), 8u);
}

TEST_F(SnakeGameTest, ZeroThresholdMeansBoardArea) {
    SnakeGame game = make_game(0);
    EXPECT_EQ(game.get_starvation_threshold(), 100u);
}

TEST_F(SnakeGameTest, StarvationLimitScalesWithScore) {
    GameConfig fixed(10, 8);
    EXPECT_EQ(fixed.starvation_limit(0), 8u);
    EXPECT_EQ(fixed.starvation_limit(40), 8u);

    GameConfig scaled(10, 8, true);
    EXPECT_EQ(scaled.starvation_limit(5), 8u);
    EXPECT_EQ(scaled.starvation_limit(6), 16u);
    EXPECT_EQ(scaled.starvation_limit(20), 16u);
    EXPECT_EQ(scaled.starvation_limit(21), 24u);
    EXPECT_EQ(scaled.starvation_limit(30), 24u);
    EXPECT_EQ(scaled.starvation_limit(31), 48u);
    EXPECT_EQ(GameConfig(10, 0, true).starvation_limit(6), 200u);
}

TEST_F(SnakeGameTest, LongerSnakeStarvesLater) {
    SnakeGame game(GameConfig(10, 8, true), 1);
    eat_along(game, {Point(6, 5), Point(7, 5), Point(8, 5), Point(8, 6), Point(8, 7), Point(8, 8)});
    ASSERT_TRUE(game.is_running());
    ASSERT_EQ(game.get_score(), 6u);
    EXPECT_EQ(game.get_starvation_threshold(), 16u);

    // Down to the bottom edge, left along it, then up the left edge
    std::vector<Point> path = {Point(8, 9)};
    for (int x = 7; x >= 0; --x) {
        path.push_back(Point(x, 9));
    }
    for (int y = 8; y >= 2; --y) {
        path.push_back(Point(0, y));
    }
    ASSERT_EQ(path.size(), 16u);

    game.place_food(Point(9, 0));
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        game.step(action_towards(game, path[i]));
        ASSERT_TRUE(game.is_running()) << "died early at step " << i + 1;
    }

    game.step(action_towards(game, path.back()));
    EXPECT_FALSE(game.is_running());
    EXPECT_EQ(game.get_death_reason(), DeathReason::STARVATION);
    EXPECT_EQ(game.get_steps_since_food(), 16u);
}

TEST_F(SnakeGameTest, FillingTheBoardEndsTheGame) {
    // 4x4 board: head (2,2) facing right, body (1,2) and (0,2)
    SnakeGame game(GameConfig(4, 0), 1);
    std::vector<Point> path = {
        Point(2, 1), Point(1, 1), Point(0, 1), Point(0, 0), Point(1, 0), Point(2, 0), Point(3, 0),
        Point(3, 1), Point(3, 2), Point(3, 3), Point(2, 3), Point(1, 3), Point(0, 3)
    };

    eat_along(game, std::vector<Point>(path.begin(), path.end() - 1));
    ASSERT_TRUE(game.is_running());
    ASSERT_EQ(game.get_score(), 12u);

    eat_along(game, {path.back()});
    EXPECT_FALSE(game.is_running());
    EXPECT_EQ(game.get_death_reason(), DeathReason::BOARD_FILLED);
    EXPECT_EQ(game.get_score(), 13u);
    EXPECT_EQ(game.get_length(), 16u);
    EXPECT_TRUE(body_is_valid(game));
}

TEST_F(SnakeGameTest, WallCollision) {
    SnakeGame game = make_game(100);
    game.place_food(Point(0, 0));

    for (int i = 0; i < 4; ++i) {
        game.step(Action::STRAIGHT);
        ASSERT_TRUE(game.is_running());
    }
    EXPECT_EQ(game.get_head(), Point(9, 5));

    game.step(Action::STRAIGHT);
    EXPECT_FALSE(game.is_running());
    EXPECT_EQ(game.get_death_reason(), DeathReason::COLLISION);
    EXPECT_EQ(game.get_total_steps(), 5u);
}

TEST_F(SnakeGameTest, MovingIntoVacatedTailIsLegal) {
    SnakeGame game = make_game(100);
    game.place_food(Point(6, 5));
    game.step(Action::STRAIGHT);
    ASSERT_EQ(game.get_length(), 4u);
    game.place_food(Point(0, 0));

    // Body (6,5) (5,5) (4,5) (3,5); three right turns end on the old tail cell
    game.step(Action::TURN_RIGHT);
    game.step(Action::TURN_RIGHT);
    ASSERT_EQ(game.get_body().back(), Point(5, 5));
    game.step(Action::TURN_RIGHT);

    EXPECT_TRUE(game.is_running());
    EXPECT_EQ(game.get_head(), Point(5, 5));
    EXPECT_TRUE(body_is_valid(game));
}

TEST_F(SnakeGameTest, BodyCollision) {
    SnakeGame game = make_game(100);
    game.place_food(Point(6, 5));
    game.step(Action::STRAIGHT);
    game.place_food(Point(7, 5));
    game.step(Action::STRAIGHT);
    ASSERT_EQ(game.get_length(), 5u);
    game.place_food(Point(0, 0));

    game.step(Action::TURN_RIGHT);
    game.step(Action::TURN_RIGHT);
    ASSERT_TRUE(game.is_running());

    // Heading up into (6,5), which is not the tail
    game.step(Action::TURN_RIGHT);
    EXPECT_FALSE(game.is_running());
    EXPECT_EQ(game.get_death_reason(), DeathReason::COLLISION);
}

TEST_F(SnakeGameTest, DeadGameIgnoresFurtherSteps) {
    SnakeGame game = make_game(1);
    game.place_food(Point(0, 0));
    game.step(Action::STRAIGHT);
    ASSERT_FALSE(game.is_running());

    Point head = game.get_head();
    game.step(Action::STRAIGHT);
    EXPECT_EQ(game.get_head(), head);
    EXPECT_EQ(game.get_total_steps(), 1u);
}

TEST_F(SnakeGameTest, BodyStaysDistinctAndInBounds) {
    for (uint32_t seed = 1; seed <= 20; ++seed) {
        SnakeGame game(GameConfig(6, 0), seed);
        std::mt19937 rng(seed);
        std::uniform_int_distribution<size_t> pick(0, NUM_ACTIONS - 1);

        while (game.is_running()) {
            game.step(action_from_index(pick(rng)));
            ASSERT_TRUE(body_is_valid(game));
            ASSERT_EQ(game.get_length(), INITIAL_SNAKE_LENGTH + game.get_score());
        }
    }
}

TEST_F(SnakeGameTest, PlaceFoodRejectsInvalidCells) {
    SnakeGame game = make_game();
    EXPECT_THROW(game.place_food(Point(10, 0)), std::invalid_argument);
    EXPECT_THROW(game.place_food(Point(4, 5)), std::invalid_argument);
}

TEST_F(SnakeGameTest, RejectsTinyBoard) {
    EXPECT_THROW(SnakeGame(GameConfig(3, 0), 1), std::invalid_argument);
}

TEST_F(SnakeGameTest, VisionEncoding) {
    SnakeGame game = make_game();
    game.place_food(Point(8, 5));

    std::vector<double> vision = game.vision();
    ASSERT_EQ(vision.size(), VISION_SIZE);

    // Forward ray: four free cells before the wall, food in sight, no body
    EXPECT_DOUBLE_EQ(vision[0], 1.0 / 5.0);
    EXPECT_DOUBLE_EQ(vision[1], 1.0);
    EXPECT_DOUBLE_EQ(vision[2], 0.0);

    // Backward ray (fifth, clockwise from forward) hits the body right away
    EXPECT_DOUBLE_EQ(vision[4 * VALUES_PER_RAY + 2], 1.0);
    EXPECT_DOUBLE_EQ(vision[4 * VALUES_PER_RAY + 1], 0.0);

    for (double v : vision) {
        EXPECT_GE(v, 0.0);
        EXPECT_LE(v, 1.0);
    }
}

TEST_F(SnakeGameTest, VisionFollowsHeading) {
    SnakeGame game = make_game();
    game.place_food(Point(5, 1));

    game.step(Action::TURN_LEFT);
    ASSERT_EQ(game.get_heading(), Direction::UP);

    // Facing up from (5,4): food is straight ahead
    std::vector<double> vision = game.vision();
    EXPECT_DOUBLE_EQ(vision[1], 1.0);
    EXPECT_DOUBLE_EQ(vision[0], 1.0 / 5.0);
}

TEST_F(SnakeGameTest, BodyBlocksFoodInRay) {
    SnakeGame game = make_game();
    game.place_food(Point(1, 5));

    // Looking backwards the body at (4,5) hides the food at (1,5)
    std::vector<double> vision = game.vision();
    EXPECT_DOUBLE_EQ(vision[4 * VALUES_PER_RAY + 1], 0.0);
}

TEST_F(SnakeGameTest, ResetRestoresInitialState) {
    SnakeGame game = make_game(1);
    game.place_food(Point(0, 0));
    game.step(Action::STRAIGHT);
    ASSERT_FALSE(game.is_running());

    game.reset();
    EXPECT_TRUE(game.is_running());
    EXPECT_EQ(game.get_head(), Point(5, 5));
    EXPECT_EQ(game.get_total_steps(), 0u);
    EXPECT_EQ(game.get_steps_since_food(), 0u);
}

TEST_F(SnakeGameTest, FitnessRanksScoreAboveSurvival) {
    FitnessParameters params;
    EXPECT_GT(compute_fitness(1, 1, params), compute_fitness(0, 1000000, params));
    EXPECT_GT(compute_fitness(0, 20, params), compute_fitness(0, 10, params));
    EXPECT_DOUBLE_EQ(compute_fitness(2, 0, params), 2000.0);
}

TEST_F(SnakeGameTest, BoardText) {
    SnakeGame game(GameConfig(5, 0), 3);
    game.place_food(Point(0, 0));

    std::string text = board_to_text(game);
    EXPECT_EQ(text,
              "*....\n"
              ".....\n"
              "ooH..\n"
              ".....\n"
              ".....\n");
}
