#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace SimPool {

enum class Activation : uint8_t { Linear = 0, Relu, Tanh };

const char* toString(Activation activation);

/**
 * Fully connected network stored as one flat parameter vector.
 *
 * Layout per layer, in order: weights [in * out] indexed as i * out + o, then
 * biases [out]. Hidden layers share one activation; the output layer has its own.
 */
class Mlp {
public:
    // Per-layer inputs and pre-activations recorded by forward() for backward().
    struct Trace {
        std::vector<std::vector<double>> inputs;
        std::vector<std::vector<double>> preActivations;
        std::vector<double> output;
    };

    Mlp() = default;
    Mlp(std::vector<int> layerSizes, Activation hidden, Activation output);

    static size_t parameterCount(const std::vector<int>& layerSizes);

    // True for every parameter index that holds a bias.
    static std::vector<bool> biasMask(const std::vector<int>& layerSizes);

    // Xavier-normal weights, zero biases.
    void initialize(std::mt19937& rng);

    /**
     * Input must have exactly inputSize() values; throws std::invalid_argument otherwise.
     */
    std::vector<double> forward(const std::vector<double>& input) const;
    std::vector<double> forward(const std::vector<double>& input, Trace& trace) const;

    /**
     * @brief Backpropagate dLoss/dOutput through a recorded forward pass.
     *
     * Parameter gradients are added into gradient, which must have
     * parameterCount() values. Returns dLoss/dInput.
     */
    std::vector<double> backward(
        const Trace& trace,
        const std::vector<double>& outputGradient,
        std::vector<double>& gradient) const;

    bool allFinite() const;

    std::vector<double>& parameters() { return parameters_; }
    const std::vector<double>& parameters() const { return parameters_; }

    /**
     * Throws std::invalid_argument if the count does not match the layer sizes.
     */
    void setParameters(std::vector<double> parameters);

    const std::vector<int>& layerSizes() const { return layerSizes_; }
    Activation hiddenActivation() const { return hidden_; }
    Activation outputActivation() const { return output_; }
    size_t inputSize() const;
    size_t outputSize() const;
    size_t layerCount() const { return layerSizes_.empty() ? 0 : layerSizes_.size() - 1; }

private:
    size_t layerOffset(size_t layer) const { return offsets_[layer]; }

    std::vector<int> layerSizes_;
    Activation hidden_ = Activation::Relu;
    Activation output_ = Activation::Linear;
    std::vector<size_t> offsets_;
    std::vector<double> parameters_;
};

} // namespace SimPool
