#ifndef SNAKENET_NETWORK_IO_H
#define SNAKENET_NETWORK_IO_H

#include "neural_network.h"
#include <stdexcept>
#include <string>

namespace snakenet {

class SerializationError : public std::runtime_error {
public:
    explicit SerializationError(const std::string& what) : std::runtime_error(what) {}
};

constexpr const char* NETWORK_FORMAT_TAG = "snakenet-network";
constexpr int NETWORK_FORMAT_VERSION = 1;

// Line-oriented text format:
//   snakenet-network 1
//   activation relu
//   layers <count>
//   layer <inputs> <outputs>
//   weights <inputs*outputs values, row-major>
//   biases <outputs values>
std::string save_network(const NeuralNetwork& network);
NeuralNetwork load_network(const std::string& text);

void save_network_file(const std::string& path, const NeuralNetwork& network);
NeuralNetwork load_network_file(const std::string& path);

} // namespace snakenet

#endif // SNAKENET_NETWORK_IO_H
