#ifndef SNAKENET_NEURAL_NETWORK_H
#define SNAKENET_NEURAL_NETWORK_H

#include <cstddef>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace snakenet {

class ShapeMismatch : public std::runtime_error {
public:
    explicit ShapeMismatch(const std::string& what) : std::runtime_error(what) {}
};

enum class ActivationKind {
    RELU,
    SIGMOID,
    TANH
};

std::string activation_name(ActivationKind kind);
ActivationKind parse_activation(const std::string& name);

enum class CrossoverMode {
    PER_WEIGHT,  // coin flip for every weight and bias
    PER_LAYER    // whole layer taken from one parent
};

std::string crossover_name(CrossoverMode mode);
CrossoverMode parse_crossover(const std::string& name);

struct BreedParameters {
    CrossoverMode crossover;
    double mutation_rate;
    double mutation_magnitude;

    BreedParameters()
        : crossover(CrossoverMode::PER_WEIGHT), mutation_rate(0.1), mutation_magnitude(0.5) {}
};

// Dense layer, weights stored row-major: weights[out * inputs + in]
struct Layer {
    size_t inputs;
    size_t outputs;
    std::vector<double> weights;
    std::vector<double> biases;

    Layer() : inputs(0), outputs(0) {}
    Layer(size_t in, size_t out)
        : inputs(in), outputs(out), weights(in * out, 0.0), biases(out, 0.0) {}

    double& weight(size_t out, size_t in) { return weights[out * inputs + in]; }
    double weight(size_t out, size_t in) const { return weights[out * inputs + in]; }

    bool operator==(const Layer& other) const = default;
};

class NeuralNetwork {
public:
    NeuralNetwork() : activation_(ActivationKind::RELU) {}
    NeuralNetwork(std::vector<Layer> layers, ActivationKind activation);

    static NeuralNetwork random(const std::vector<size_t>& topology, std::mt19937& rng,
                                ActivationKind activation = ActivationKind::RELU,
                                double init_range = 1.0);

    // Crossover of two parents with identical topology, then mutation.
    static NeuralNetwork breed(const NeuralNetwork& parent_a, const NeuralNetwork& parent_b,
                               std::mt19937& rng, const BreedParameters& params);

    static NeuralNetwork crossover(const NeuralNetwork& parent_a, const NeuralNetwork& parent_b,
                                   std::mt19937& rng, CrossoverMode mode);

    void mutate(std::mt19937& rng, double rate, double magnitude);

    std::vector<double> forward(const std::vector<double>& input) const;

    // Index of the largest output; ties go to the lowest index.
    size_t decide(const std::vector<double>& input) const;

    static size_t argmax(const std::vector<double>& values);

    size_t input_size() const;
    size_t output_size() const;
    std::vector<size_t> topology() const;
    size_t parameter_count() const;

    const std::vector<Layer>& get_layers() const { return layers_; }
    ActivationKind get_activation() const { return activation_; }

    bool operator==(const NeuralNetwork& other) const = default;

private:
    double activate(double value) const;

    std::vector<Layer> layers_;
    ActivationKind activation_;
};

void validate_topology(const std::vector<size_t>& topology);

} // namespace snakenet

#endif // SNAKENET_NEURAL_NETWORK_H
