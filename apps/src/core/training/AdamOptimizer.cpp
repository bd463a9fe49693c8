#include "AdamOptimizer.h"

#include <cmath>
#include <stdexcept>

namespace SimPool {

AdamOptimizer::AdamOptimizer(double learningRate, double beta1, double beta2, double epsilon)
    : learningRate_(learningRate), beta1_(beta1), beta2_(beta2), epsilon_(epsilon)
{}

void AdamOptimizer::step(std::vector<double>& parameters, const std::vector<double>& gradient)
{
    if (parameters.size() != gradient.size()) {
        throw std::invalid_argument("Adam step: gradient size does not match parameters");
    }
    if (m_.size() != parameters.size()) {
        m_.assign(parameters.size(), 0.0);
        v_.assign(parameters.size(), 0.0);
        t_ = 0;
    }

    t_++;
    const double correction1 = 1.0 - std::pow(beta1_, t_);
    const double correction2 = 1.0 - std::pow(beta2_, t_);

    for (size_t i = 0; i < parameters.size(); ++i) {
        const double g = gradient[i];
        m_[i] = beta1_ * m_[i] + (1.0 - beta1_) * g;
        v_[i] = beta2_ * v_[i] + (1.0 - beta2_) * g * g;
        const double mHat = m_[i] / correction1;
        const double vHat = v_[i] / correction2;
        parameters[i] -= learningRate_ * mHat / (std::sqrt(vHat) + epsilon_);
    }
}

void AdamOptimizer::reset()
{
    m_.clear();
    v_.clear();
    t_ = 0;
}

} // namespace SimPool
