#pragma once

#include <vector>

namespace SimPool {

/**
 * Adam over one flat parameter vector. Moment estimates are sized on the first
 * step and cleared by reset().
 */
class AdamOptimizer {
public:
    explicit AdamOptimizer(
        double learningRate = 3e-4, double beta1 = 0.9, double beta2 = 0.999, double epsilon = 1e-8);

    // Throws std::invalid_argument if the sizes differ.
    void step(std::vector<double>& parameters, const std::vector<double>& gradient);

    void reset();

    int stepCount() const { return t_; }
    double learningRate() const { return learningRate_; }
    void setLearningRate(double learningRate) { learningRate_ = learningRate; }

private:
    double learningRate_;
    double beta1_;
    double beta2_;
    double epsilon_;
    int t_ = 0;
    std::vector<double> m_;
    std::vector<double> v_;
};

} // namespace SimPool
