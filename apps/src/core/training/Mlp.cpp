#include "Mlp.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace SimPool {

namespace {

double activate(Activation activation, double x)
{
    switch (activation) {
        case Activation::Relu:
            return std::max(0.0, x);
        case Activation::Tanh:
            return std::tanh(x);
        case Activation::Linear:
            break;
    }
    return x;
}

// Derivative expressed through the pre-activation value.
double derivative(Activation activation, double pre)
{
    switch (activation) {
        case Activation::Relu:
            return pre > 0.0 ? 1.0 : 0.0;
        case Activation::Tanh: {
            const double t = std::tanh(pre);
            return 1.0 - t * t;
        }
        case Activation::Linear:
            break;
    }
    return 1.0;
}

} // namespace

const char* toString(Activation activation)
{
    switch (activation) {
        case Activation::Linear:
            return "linear";
        case Activation::Relu:
            return "relu";
        case Activation::Tanh:
            return "tanh";
    }
    return "unknown";
}

Mlp::Mlp(std::vector<int> layerSizes, Activation hidden, Activation output)
    : layerSizes_(std::move(layerSizes)), hidden_(hidden), output_(output)
{
    if (layerSizes_.size() < 2) {
        throw std::invalid_argument("Mlp needs at least an input and an output layer");
    }
    for (int size : layerSizes_) {
        if (size <= 0) {
            throw std::invalid_argument("Mlp layer sizes must be positive");
        }
    }

    size_t offset = 0;
    for (size_t l = 0; l + 1 < layerSizes_.size(); ++l) {
        offsets_.push_back(offset);
        offset += static_cast<size_t>(layerSizes_[l]) * layerSizes_[l + 1] + layerSizes_[l + 1];
    }
    parameters_.assign(offset, 0.0);
}

size_t Mlp::parameterCount(const std::vector<int>& layerSizes)
{
    size_t count = 0;
    for (size_t l = 0; l + 1 < layerSizes.size(); ++l) {
        count += static_cast<size_t>(layerSizes[l]) * layerSizes[l + 1] + layerSizes[l + 1];
    }
    return count;
}

std::vector<bool> Mlp::biasMask(const std::vector<int>& layerSizes)
{
    std::vector<bool> mask;
    mask.reserve(parameterCount(layerSizes));
    for (size_t l = 0; l + 1 < layerSizes.size(); ++l) {
        mask.insert(mask.end(), static_cast<size_t>(layerSizes[l]) * layerSizes[l + 1], false);
        mask.insert(mask.end(), static_cast<size_t>(layerSizes[l + 1]), true);
    }
    return mask;
}

void Mlp::initialize(std::mt19937& rng)
{
    for (size_t l = 0; l < layerCount(); ++l) {
        const int in = layerSizes_[l];
        const int out = layerSizes_[l + 1];

        // Xavier initialization: stddev = sqrt(2 / (fan_in + fan_out)).
        std::normal_distribution<double> dist(0.0, std::sqrt(2.0 / (in + out)));

        size_t idx = layerOffset(l);
        for (int i = 0; i < in * out; ++i) {
            parameters_[idx++] = dist(rng);
        }
        for (int o = 0; o < out; ++o) {
            parameters_[idx++] = 0.0;
        }
    }
}

std::vector<double> Mlp::forward(const std::vector<double>& input) const
{
    Trace trace;
    return forward(input, trace);
}

std::vector<double> Mlp::forward(const std::vector<double>& input, Trace& trace) const
{
    if (input.size() != inputSize()) {
        throw std::invalid_argument(
            "Mlp expected " + std::to_string(inputSize()) + " inputs, got "
            + std::to_string(input.size()));
    }

    trace.inputs.clear();
    trace.preActivations.clear();

    std::vector<double> current = input;
    for (size_t l = 0; l < layerCount(); ++l) {
        const int in = layerSizes_[l];
        const int out = layerSizes_[l + 1];
        const double* w = parameters_.data() + layerOffset(l);
        const double* b = w + static_cast<size_t>(in) * out;
        const Activation activation = (l + 1 == layerCount()) ? output_ : hidden_;

        std::vector<double> pre(out);
        for (int o = 0; o < out; ++o) {
            pre[o] = b[o];
        }
        for (int i = 0; i < in; ++i) {
            const double x = current[i];
            if (x == 0.0) {
                continue;
            }
            const double* row = w + static_cast<size_t>(i) * out;
            for (int o = 0; o < out; ++o) {
                pre[o] += x * row[o];
            }
        }

        std::vector<double> next(out);
        for (int o = 0; o < out; ++o) {
            next[o] = activate(activation, pre[o]);
        }

        trace.inputs.push_back(std::move(current));
        trace.preActivations.push_back(std::move(pre));
        current = std::move(next);
    }

    trace.output = current;
    return current;
}

std::vector<double> Mlp::backward(
    const Trace& trace, const std::vector<double>& outputGradient, std::vector<double>& gradient) const
{
    if (gradient.size() != parameters_.size()) {
        throw std::invalid_argument("Gradient buffer does not match parameter count");
    }
    if (outputGradient.size() != outputSize() || trace.inputs.size() != layerCount()) {
        throw std::invalid_argument("Trace does not match this network");
    }

    std::vector<double> upstream = outputGradient;
    for (size_t l = layerCount(); l-- > 0;) {
        const int in = layerSizes_[l];
        const int out = layerSizes_[l + 1];
        const size_t offset = layerOffset(l);
        const double* w = parameters_.data() + offset;
        double* gw = gradient.data() + offset;
        double* gb = gw + static_cast<size_t>(in) * out;
        const Activation activation = (l + 1 == layerCount()) ? output_ : hidden_;
        const auto& x = trace.inputs[l];
        const auto& pre = trace.preActivations[l];

        std::vector<double> delta(out);
        for (int o = 0; o < out; ++o) {
            delta[o] = upstream[o] * derivative(activation, pre[o]);
            gb[o] += delta[o];
        }

        std::vector<double> downstream(in, 0.0);
        for (int i = 0; i < in; ++i) {
            const double* row = w + static_cast<size_t>(i) * out;
            double* growRow = gw + static_cast<size_t>(i) * out;
            double sum = 0.0;
            for (int o = 0; o < out; ++o) {
                growRow[o] += x[i] * delta[o];
                sum += row[o] * delta[o];
            }
            downstream[i] = sum;
        }
        upstream = std::move(downstream);
    }
    return upstream;
}

bool Mlp::allFinite() const
{
    return std::all_of(
        parameters_.begin(), parameters_.end(), [](double v) { return std::isfinite(v); });
}

void Mlp::setParameters(std::vector<double> parameters)
{
    if (parameters.size() != parameters_.size()) {
        throw std::invalid_argument(
            "Expected " + std::to_string(parameters_.size()) + " parameters, got "
            + std::to_string(parameters.size()));
    }
    parameters_ = std::move(parameters);
}

size_t Mlp::inputSize() const
{
    return layerSizes_.empty() ? 0 : static_cast<size_t>(layerSizes_.front());
}

size_t Mlp::outputSize() const
{
    return layerSizes_.empty() ? 0 : static_cast<size_t>(layerSizes_.back());
}

} // namespace SimPool
