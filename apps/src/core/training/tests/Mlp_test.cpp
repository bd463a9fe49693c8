#include "core/training/Mlp.h"

#include <cmath>
#include <gtest/gtest.h>
#include <stdexcept>

using namespace SimPool;

class MlpTest : public ::testing::Test {
protected:
    std::mt19937 rng{ 42 };
};

TEST_F(MlpTest, ParameterCountIncludesBiases)
{
    // 72*64+64 + 64*32+32 + 32*21+21.
    EXPECT_EQ(Mlp::parameterCount({ 72, 64, 32, 21 }), 4672u + 2080u + 693u);
    EXPECT_EQ(Mlp::parameterCount({ 3, 2 }), 8u);
}

TEST_F(MlpTest, BiasMaskMarksTrailingEntriesOfEachLayer)
{
    const auto mask = Mlp::biasMask({ 2, 2, 1 });

    // Layer 0: 4 weights, 2 biases. Layer 1: 2 weights, 1 bias.
    const std::vector<bool> expected{
        false, false, false, false, true, true, false, false, true,
    };
    EXPECT_EQ(mask, expected);
}

TEST_F(MlpTest, ForwardUsesWeightLayout)
{
    Mlp net({ 2, 1 }, Activation::Relu, Activation::Linear);
    // w[i * out + o]: w0 = 2, w1 = -1, bias = 0.5.
    net.setParameters({ 2.0, -1.0, 0.5 });

    const auto out = net.forward({ 3.0, 4.0 });

    ASSERT_EQ(out.size(), 1u);
    EXPECT_DOUBLE_EQ(out[0], 2.0 * 3.0 - 4.0 + 0.5);
}

TEST_F(MlpTest, TanhOutputIsBounded)
{
    Mlp net({ 4, 8, 3 }, Activation::Tanh, Activation::Tanh);
    net.initialize(rng);
    for (double& p : net.parameters()) {
        p *= 50.0;
    }

    const auto out = net.forward({ 1.0, -2.0, 3.0, -4.0 });

    for (double v : out) {
        EXPECT_LE(std::abs(v), 1.0);
    }
}

TEST_F(MlpTest, WrongInputSizeThrows)
{
    Mlp net({ 3, 2 }, Activation::Relu, Activation::Linear);

    EXPECT_THROW(net.forward({ 1.0, 2.0 }), std::invalid_argument);
    EXPECT_THROW(net.setParameters({ 1.0 }), std::invalid_argument);
}

TEST_F(MlpTest, InitializeZeroesBiases)
{
    Mlp net({ 5, 4, 2 }, Activation::Tanh, Activation::Linear);
    net.initialize(rng);

    const auto mask = Mlp::biasMask(net.layerSizes());
    int nonZeroWeights = 0;
    for (size_t i = 0; i < mask.size(); i++) {
        if (mask[i]) {
            EXPECT_DOUBLE_EQ(net.parameters()[i], 0.0);
        }
        else if (net.parameters()[i] != 0.0) {
            nonZeroWeights++;
        }
    }
    EXPECT_GT(nonZeroWeights, 0);
    EXPECT_TRUE(net.allFinite());
}

TEST_F(MlpTest, BackwardMatchesFiniteDifferences)
{
    Mlp net({ 3, 5, 2 }, Activation::Tanh, Activation::Linear);
    net.initialize(rng);
    const std::vector<double> input{ 0.3, -0.7, 0.2 };
    const std::vector<double> target{ 0.5, -0.5 };

    // Loss = 0.5 * |out - target|^2.
    auto loss = [&](const Mlp& m) {
        const auto out = m.forward(input);
        double sum = 0.0;
        for (size_t k = 0; k < out.size(); k++) {
            sum += 0.5 * (out[k] - target[k]) * (out[k] - target[k]);
        }
        return sum;
    };

    Mlp::Trace trace;
    const auto out = net.forward(input, trace);
    std::vector<double> outGrad{ out[0] - target[0], out[1] - target[1] };
    std::vector<double> gradient(net.parameters().size(), 0.0);
    net.backward(trace, outGrad, gradient);

    const double h = 1e-6;
    for (size_t i = 0; i < net.parameters().size(); i++) {
        Mlp plus = net;
        Mlp minus = net;
        plus.parameters()[i] += h;
        minus.parameters()[i] -= h;
        const double numeric = (loss(plus) - loss(minus)) / (2.0 * h);
        EXPECT_NEAR(gradient[i], numeric, 1e-6) << "parameter " << i;
    }
}

TEST_F(MlpTest, BackwardAccumulatesIntoGradient)
{
    Mlp net({ 2, 1 }, Activation::Relu, Activation::Linear);
    net.setParameters({ 1.0, 1.0, 0.0 });

    Mlp::Trace trace;
    net.forward({ 2.0, 3.0 }, trace);
    std::vector<double> gradient(3, 0.0);
    net.backward(trace, { 1.0 }, gradient);
    const auto dInput = net.backward(trace, { 1.0 }, gradient);

    EXPECT_DOUBLE_EQ(gradient[0], 4.0);
    EXPECT_DOUBLE_EQ(gradient[1], 6.0);
    EXPECT_DOUBLE_EQ(gradient[2], 2.0);
    EXPECT_EQ(dInput, (std::vector<double>{ 1.0, 1.0 }));
}
