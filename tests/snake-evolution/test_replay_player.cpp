#include <gtest/gtest.h>
#include "replay_player.h"
#include <random>

using namespace snake_evolution;

class ReplayPlayerTest : public ::testing::Test {
protected:
    void SetUp() override {
        rng.seed(31);
        summary.generation = 4;
        summary.elapsed_seconds = 0.1;
        summary.generation_best_score = 2;
        summary.best_score_so_far = 3;
        summary.best_fitness = 2000.5;
        summary.mean_fitness = 10.0;
        summary.mutation_rate = 0.1;
        summary.mutation_magnitude = 0.5;
    }

    std::mt19937 rng;
    GenerationSummary summary;
    snakegame::GameConfig game_config{8, 10};
};

TEST_F(ReplayPlayerTest, WaitsForANetwork) {
    ReplayPlayer replay(game_config, 1);
    EXPECT_FALSE(replay.step());
    EXPECT_FALSE(replay.has_network());
    EXPECT_EQ(replay.get_game().get_total_steps(), 0u);
}

TEST_F(ReplayPlayerTest, PlaysOfferedNetwork) {
    ReplayPlayer replay(game_config, 1);
    replay.offer(summary, snakenet::NeuralNetwork::random({24, 6, 3}, rng));

    EXPECT_TRUE(replay.step());
    EXPECT_TRUE(replay.has_network());
    EXPECT_EQ(replay.get_game().get_total_steps(), 1u);
    ASSERT_TRUE(replay.get_summary().has_value());
    EXPECT_EQ(replay.get_summary()->generation, 4u);
}

TEST_F(ReplayPlayerTest, RestartsAfterDeathWithNewestNetwork) {
    ReplayPlayer replay(game_config, 1);
    replay.offer(summary, snakenet::NeuralNetwork::random({24, 6, 3}, rng));

    while (replay.step() && replay.get_game().is_running()) {
    }
    ASSERT_FALSE(replay.get_game().is_running());
    EXPECT_EQ(replay.get_games_played(), 0u);

    summary.generation = 5;
    replay.offer(summary, snakenet::NeuralNetwork::random({24, 6, 3}, rng));

    EXPECT_TRUE(replay.step());
    EXPECT_EQ(replay.get_games_played(), 1u);
    EXPECT_EQ(replay.get_summary()->generation, 5u);
    EXPECT_EQ(replay.get_game().get_total_steps(), 1u);
}

TEST_F(ReplayPlayerTest, NewNetworkWaitsForCurrentGame) {
    ReplayPlayer replay(game_config, 1);
    replay.offer(summary, snakenet::NeuralNetwork::random({24, 6, 3}, rng));
    ASSERT_TRUE(replay.step());

    if (replay.get_game().is_running()) {
        summary.generation = 9;
        replay.offer(summary, snakenet::NeuralNetwork::random({24, 6, 3}, rng));
        replay.step();
        EXPECT_EQ(replay.get_summary()->generation, 4u);
    }
}
