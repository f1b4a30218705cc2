#include "neural_network.h"
#include <utility>
#include <algorithm>
#include <cmath>
#include <sstream>

namespace snakenet {

std::string activation_name(ActivationKind kind) {
    switch (kind) {
        case ActivationKind::RELU:
            return "relu";
        case ActivationKind::SIGMOID:
            return "sigmoid";
        case ActivationKind::TANH:
            return "tanh";
    }
    return "relu";
}

ActivationKind parse_activation(const std::string& name) {
    if (name == "relu") return ActivationKind::RELU;
    if (name == "sigmoid") return ActivationKind::SIGMOID;
    if (name == "tanh") return ActivationKind::TANH;
    throw std::invalid_argument("Unknown activation: " + name);
}

std::string crossover_name(CrossoverMode mode) {
    switch (mode) {
        case CrossoverMode::PER_WEIGHT:
            return "per_weight";
        case CrossoverMode::PER_LAYER:
            return "per_layer";
    }
    return "per_weight";
}

CrossoverMode parse_crossover(const std::string& name) {
    if (name == "per_weight") return CrossoverMode::PER_WEIGHT;
    if (name == "per_layer") return CrossoverMode::PER_LAYER;
    throw std::invalid_argument("Unknown crossover mode: " + name);
}

void validate_topology(const std::vector<size_t>& topology) {
    if (topology.size() < 2) {
        throw ShapeMismatch("Topology needs at least an input and an output layer");
    }
    for (size_t size : topology) {
        if (size == 0) {
            throw ShapeMismatch("Topology contains an empty layer");
        }
    }
}

NeuralNetwork::NeuralNetwork(std::vector<Layer> layers, ActivationKind activation)
    : layers_(std::move(layers)), activation_(activation) {
    if (layers_.empty()) {
        throw ShapeMismatch("Network needs at least one layer");
    }
    for (size_t i = 0; i < layers_.size(); ++i) {
        const Layer& layer = layers_[i];
        if (layer.inputs == 0 || layer.outputs == 0 ||
            layer.weights.size() != layer.inputs * layer.outputs ||
            layer.biases.size() != layer.outputs) {
            std::ostringstream ss;
            ss << "Layer " << i << " has inconsistent weight/bias sizes";
            throw ShapeMismatch(ss.str());
        }
        if (i > 0 && layers_[i - 1].outputs != layer.inputs) {
            std::ostringstream ss;
            ss << "Layer " << i << " expects " << layer.inputs << " inputs but layer "
               << (i - 1) << " produces " << layers_[i - 1].outputs;
            throw ShapeMismatch(ss.str());
        }
    }
}

NeuralNetwork NeuralNetwork::random(const std::vector<size_t>& topology, std::mt19937& rng,
                                    ActivationKind activation, double init_range) {
    validate_topology(topology);

    std::uniform_real_distribution<double> dist(-init_range, init_range);
    std::vector<Layer> layers;
    layers.reserve(topology.size() - 1);

    for (size_t i = 1; i < topology.size(); ++i) {
        Layer layer(topology[i - 1], topology[i]);
        for (auto& w : layer.weights) {
            w = dist(rng);
        }
        for (auto& b : layer.biases) {
            b = dist(rng);
        }
        layers.push_back(std::move(layer));
    }

    return NeuralNetwork(std::move(layers), activation);
}

NeuralNetwork NeuralNetwork::crossover(const NeuralNetwork& parent_a, const NeuralNetwork& parent_b,
                                       std::mt19937& rng, CrossoverMode mode) {
    if (parent_a.topology() != parent_b.topology()) {
        throw ShapeMismatch("Cannot cross networks with different topologies");
    }

    std::bernoulli_distribution coin(0.5);
    std::vector<Layer> layers;
    layers.reserve(parent_a.layers_.size());

    for (size_t l = 0; l < parent_a.layers_.size(); ++l) {
        const Layer& la = parent_a.layers_[l];
        const Layer& lb = parent_b.layers_[l];

        if (mode == CrossoverMode::PER_LAYER) {
            layers.push_back(coin(rng) ? la : lb);
            continue;
        }

        Layer child(la.inputs, la.outputs);
        for (size_t i = 0; i < child.weights.size(); ++i) {
            child.weights[i] = coin(rng) ? la.weights[i] : lb.weights[i];
        }
        for (size_t i = 0; i < child.biases.size(); ++i) {
            child.biases[i] = coin(rng) ? la.biases[i] : lb.biases[i];
        }
        layers.push_back(std::move(child));
    }

    return NeuralNetwork(std::move(layers), parent_a.activation_);
}

NeuralNetwork NeuralNetwork::breed(const NeuralNetwork& parent_a, const NeuralNetwork& parent_b,
                                   std::mt19937& rng, const BreedParameters& params) {
    NeuralNetwork child = crossover(parent_a, parent_b, rng, params.crossover);
    child.mutate(rng, params.mutation_rate, params.mutation_magnitude);
    return child;
}

void NeuralNetwork::mutate(std::mt19937& rng, double rate, double magnitude) {
    if (rate <= 0.0 || magnitude <= 0.0) {
        return;
    }

    std::uniform_real_distribution<double> chance(0.0, 1.0);
    std::uniform_real_distribution<double> delta(-magnitude, magnitude);

    for (auto& layer : layers_) {
        for (auto& w : layer.weights) {
            if (chance(rng) < rate) {
                w += delta(rng);
            }
        }
        for (auto& b : layer.biases) {
            if (chance(rng) < rate) {
                b += delta(rng);
            }
        }
    }
}

double NeuralNetwork::activate(double value) const {
    switch (activation_) {
        case ActivationKind::RELU:
            return std::max(0.0, value);
        case ActivationKind::SIGMOID:
            return 1.0 / (1.0 + std::exp(-value));
        case ActivationKind::TANH:
            return std::tanh(value);
    }
    return value;
}

std::vector<double> NeuralNetwork::forward(const std::vector<double>& input) const {
    if (input.size() != input_size()) {
        std::ostringstream ss;
        ss << "Bad input size, expected " << input_size() << " but got " << input.size();
        throw ShapeMismatch(ss.str());
    }

    std::vector<double> current = input;
    std::vector<double> next;

    for (size_t l = 0; l < layers_.size(); ++l) {
        const Layer& layer = layers_[l];
        const bool is_output = (l + 1 == layers_.size());
        next.assign(layer.outputs, 0.0);

        for (size_t o = 0; o < layer.outputs; ++o) {
            double sum = layer.biases[o];
            const double* row = &layer.weights[o * layer.inputs];
            for (size_t i = 0; i < layer.inputs; ++i) {
                sum += row[i] * current[i];
            }
            // Output layer stays linear
            next[o] = is_output ? sum : activate(sum);
        }
        current.swap(next);
    }

    return current;
}

size_t NeuralNetwork::argmax(const std::vector<double>& values) {
    if (values.empty()) {
        throw ShapeMismatch("argmax of an empty output vector");
    }
    size_t best = 0;
    for (size_t i = 1; i < values.size(); ++i) {
        if (values[i] > values[best]) {
            best = i;
        }
    }
    return best;
}

size_t NeuralNetwork::decide(const std::vector<double>& input) const {
    return argmax(forward(input));
}

size_t NeuralNetwork::input_size() const {
    return layers_.empty() ? 0 : layers_.front().inputs;
}

size_t NeuralNetwork::output_size() const {
    return layers_.empty() ? 0 : layers_.back().outputs;
}

std::vector<size_t> NeuralNetwork::topology() const {
    std::vector<size_t> result;
    if (layers_.empty()) {
        return result;
    }
    result.push_back(layers_.front().inputs);
    for (const auto& layer : layers_) {
        result.push_back(layer.outputs);
    }
    return result;
}

size_t NeuralNetwork::parameter_count() const {
    size_t count = 0;
    for (const auto& layer : layers_) {
        count += layer.weights.size() + layer.biases.size();
    }
    return count;
}

} // namespace snakenet
