#include "network_io.h"
#include <spdlog/spdlog.h>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

namespace snakenet {

namespace {

// Bounds on the header so that a corrupt file cannot trigger a huge allocation
constexpr size_t MAX_LAYER_WIDTH = 1U << 16;
constexpr size_t MAX_LAYER_PARAMETERS = 1U << 20;
constexpr size_t MAX_LAYER_COUNT = 64;

void expect_keyword(std::istream& in, const std::string& keyword) {
    std::string token;
    if (!(in >> token)) {
        throw SerializationError("Unexpected end of data, expected '" + keyword + "'");
    }
    if (token != keyword) {
        throw SerializationError("Expected '" + keyword + "' but found '" + token + "'");
    }
}

size_t read_size(std::istream& in, const std::string& what, size_t max_value) {
    long long value = 0;
    if (!(in >> value)) {
        throw SerializationError("Could not read " + what);
    }
    if (value <= 0 || static_cast<unsigned long long>(value) > max_value) {
        throw SerializationError("Invalid " + what + ": " + std::to_string(value));
    }
    return static_cast<size_t>(value);
}

void read_values(std::istream& in, std::vector<double>& values, const std::string& what) {
    for (size_t i = 0; i < values.size(); ++i) {
        if (!(in >> values[i])) {
            throw SerializationError("Could not read " + what + " value " + std::to_string(i));
        }
        if (!std::isfinite(values[i])) {
            throw SerializationError("Non-finite " + what + " value " + std::to_string(i));
        }
    }
}

void write_values(std::ostream& out, const char* keyword, const std::vector<double>& values) {
    out << keyword;
    for (double v : values) {
        out << ' ' << v;
    }
    out << '\n';
}

} // namespace

std::string save_network(const NeuralNetwork& network) {
    std::ostringstream out;
    out << std::setprecision(std::numeric_limits<double>::max_digits10);

    out << NETWORK_FORMAT_TAG << ' ' << NETWORK_FORMAT_VERSION << '\n';
    out << "activation " << activation_name(network.get_activation()) << '\n';
    out << "layers " << network.get_layers().size() << '\n';

    for (const auto& layer : network.get_layers()) {
        out << "layer " << layer.inputs << ' ' << layer.outputs << '\n';
        write_values(out, "weights", layer.weights);
        write_values(out, "biases", layer.biases);
    }

    return out.str();
}

NeuralNetwork load_network(const std::string& text) {
    std::istringstream in(text);

    expect_keyword(in, NETWORK_FORMAT_TAG);
    int version = 0;
    if (!(in >> version) || version != NETWORK_FORMAT_VERSION) {
        throw SerializationError("Unsupported network format version");
    }

    expect_keyword(in, "activation");
    std::string activation_token;
    if (!(in >> activation_token)) {
        throw SerializationError("Missing activation name");
    }
    ActivationKind activation;
    try {
        activation = parse_activation(activation_token);
    } catch (const std::invalid_argument& e) {
        throw SerializationError(e.what());
    }

    expect_keyword(in, "layers");
    size_t layer_count = read_size(in, "layer count", MAX_LAYER_COUNT);

    std::vector<Layer> layers;
    layers.reserve(layer_count);
    for (size_t l = 0; l < layer_count; ++l) {
        expect_keyword(in, "layer");
        size_t inputs = read_size(in, "layer input size", MAX_LAYER_WIDTH);
        size_t outputs = read_size(in, "layer output size", MAX_LAYER_WIDTH);
        if (inputs * outputs > MAX_LAYER_PARAMETERS) {
            throw SerializationError("Layer " + std::to_string(l) + " has too many weights: " +
                                     std::to_string(inputs) + "x" + std::to_string(outputs));
        }

        Layer layer(inputs, outputs);
        expect_keyword(in, "weights");
        read_values(in, layer.weights, "weight");
        expect_keyword(in, "biases");
        read_values(in, layer.biases, "bias");
        layers.push_back(std::move(layer));
    }

    std::string trailing;
    if (in >> trailing) {
        throw SerializationError("Unexpected trailing data: '" + trailing + "'");
    }

    try {
        return NeuralNetwork(std::move(layers), activation);
    } catch (const ShapeMismatch& e) {
        throw SerializationError(std::string("Inconsistent network shape: ") + e.what());
    }
}

void save_network_file(const std::string& path, const NeuralNetwork& network) {
    std::filesystem::path file_path(path);
    if (file_path.has_parent_path()) {
        std::filesystem::create_directories(file_path.parent_path());
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        throw SerializationError("Failed to open " + path + " for writing");
    }
    file << save_network(network);
    if (!file) {
        throw SerializationError("Failed to write network to " + path);
    }

    spdlog::info("Network saved to {}", path);
}

NeuralNetwork load_network_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw SerializationError("Failed to open network file " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    NeuralNetwork network = load_network(buffer.str());
    spdlog::info("Network loaded from {} ({} layers, {} parameters)",
                 path, network.get_layers().size(), network.parameter_count());
    return network;
}

} // namespace snakenet
