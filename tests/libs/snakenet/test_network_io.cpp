#include <gtest/gtest.h>
#include "network_io.h"
#include <filesystem>
#include <random>

using namespace snakenet;

class NetworkIoTest : public ::testing::Test {
protected:
    void SetUp() override {
        rng.seed(7);
        network = NeuralNetwork::random({24, 16, 8, 3}, rng, ActivationKind::TANH);
        temp_dir = std::filesystem::temp_directory_path() / "snakenet_io_test";
        std::filesystem::remove_all(temp_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir);
    }

    std::vector<double> sample_input(double scale) {
        std::vector<double> input(24);
        for (size_t i = 0; i < input.size(); ++i) {
            input[i] = scale * static_cast<double>(i % 5) / 5.0;
        }
        return input;
    }

    std::mt19937 rng;
    NeuralNetwork network;
    std::filesystem::path temp_dir;
};

TEST_F(NetworkIoTest, SavedNetworkLoadsWithIdenticalOutputs) {
    NeuralNetwork loaded = load_network(save_network(network));

    EXPECT_EQ(loaded, network);
    EXPECT_EQ(loaded.get_activation(), ActivationKind::TANH);
    for (double scale : {0.0, 0.3, 1.0, -2.5}) {
        std::vector<double> input = sample_input(scale);
        EXPECT_EQ(loaded.forward(input), network.forward(input));
    }
}

TEST_F(NetworkIoTest, HeaderLines) {
    std::string text = save_network(network);
    EXPECT_EQ(text.rfind("snakenet-network 1\nactivation tanh\nlayers 3\nlayer 24 16\n", 0), 0u);
}

TEST_F(NetworkIoTest, FileRoundTripCreatesDirectories) {
    std::string path = (temp_dir / "nested" / "best.net").string();
    save_network_file(path, network);

    ASSERT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(load_network_file(path), network);
}

TEST_F(NetworkIoTest, MissingFileThrows) {
    EXPECT_THROW(load_network_file((temp_dir / "missing.net").string()), SerializationError);
}

TEST_F(NetworkIoTest, RejectsMalformedData) {
    EXPECT_THROW(load_network(""), SerializationError);
    EXPECT_THROW(load_network("not-a-network 1"), SerializationError);
    EXPECT_THROW(load_network("snakenet-network 2\nactivation relu\nlayers 1\n"), SerializationError);
    EXPECT_THROW(load_network("snakenet-network 1\nactivation swish\nlayers 1\n"), SerializationError);
    EXPECT_THROW(load_network("snakenet-network 1\nactivation relu\nlayers 0\n"), SerializationError);
    EXPECT_THROW(load_network("snakenet-network 1\nactivation relu\nlayers 1\nlayer 2 1\n"
                              "weights 1.0\nbiases 0.0\n"),
                 SerializationError);
    EXPECT_THROW(load_network("snakenet-network 1\nactivation relu\nlayers 1\nlayer 2 1\n"
                              "weights 1.0 abc\nbiases 0.0\n"),
                 SerializationError);
    EXPECT_THROW(load_network("snakenet-network 1\nactivation relu\nlayers 1\nlayer 2 1\n"
                              "weights 1.0 nan\nbiases 0.0\n"),
                 SerializationError);
    EXPECT_THROW(load_network("snakenet-network 1\nactivation relu\nlayers 1\nlayer -2 1\n"),
                 SerializationError);
}

TEST_F(NetworkIoTest, RejectsTrailingData) {
    std::string text = save_network(network) + "extra\n";
    EXPECT_THROW(load_network(text), SerializationError);
}

TEST_F(NetworkIoTest, RejectsOversizedLayer) {
    // Both widths are individually allowed, their product is not
    EXPECT_THROW(load_network("snakenet-network 1\nactivation relu\nlayers 1\n"
                              "layer 65536 65536\nweights 1\n"),
                 SerializationError);
    EXPECT_THROW(load_network("snakenet-network 1\nactivation relu\nlayers 1\n"
                              "layer 2048 1024\nweights 1\n"),
                 SerializationError);
}

TEST_F(NetworkIoTest, RejectsInconsistentLayerChain) {
    std::string text =
        "snakenet-network 1\nactivation relu\nlayers 2\n"
        "layer 2 2\nweights 1 0 0 1\nbiases 0 0\n"
        "layer 3 1\nweights 1 1 1\nbiases 0\n";
    EXPECT_THROW(load_network(text), SerializationError);
}

TEST_F(NetworkIoTest, ParsesHandWrittenNetwork) {
    std::string text =
        "snakenet-network 1\nactivation relu\nlayers 1\n"
        "layer 2 1\nweights 0.5 -1.5\nbiases 0.25\n";
    NeuralNetwork net = load_network(text);

    ASSERT_EQ(net.topology(), (std::vector<size_t>{2, 1}));
    EXPECT_DOUBLE_EQ(net.forward({2.0, 1.0})[0], 0.5 * 2.0 - 1.5 + 0.25);
}
