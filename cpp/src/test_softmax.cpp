#include "Softmax.hpp"
#include "InferenceEngine.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <limits>

/**
 * Test numerical stability of softmax
 *
 * Critical: softmax(large numbers) should not overflow
 */
TEST(SoftmaxTest, NumericalStability) {
    // Extreme values that would overflow naive implementation
    std::vector<float> logits{1000.0f, 1001.0f, 999.0f};

    auto probs = Softmax::compute(logits);

    ASSERT_EQ(probs.size(), 3u);

    // Check sum = 1
    float sum = probs[0] + probs[1] + probs[2];
    EXPECT_NEAR(sum, 1.0f, 1e-5f);

    EXPECT_EQ(Softmax::argMax(probs), 1);  // 1001 is largest

    // Check no NaN or Inf
    for (float p : probs) {
        EXPECT_FALSE(std::isnan(p));
        EXPECT_FALSE(std::isinf(p));
    }
}

/**
 * Test softmax properties
 */
TEST(SoftmaxTest, MathematicalProperties) {
    std::vector<float> logits{1.0f, 2.0f, 3.0f};

    auto probs = Softmax::compute(logits);

    // All probabilities in [0, 1]
    for (float p : probs) {
        EXPECT_GE(p, 0.0f);
        EXPECT_LE(p, 1.0f);
    }

    // Monotonic: higher logit → higher prob
    EXPECT_GT(probs[2], probs[1]);
    EXPECT_GT(probs[1], probs[0]);
}

TEST(SoftmaxTest, EmptyInput) {
    EXPECT_TRUE(Softmax::compute({}).empty());
    EXPECT_EQ(Softmax::argMax({}), -1);
    EXPECT_EQ(SoftmaxUtils::logSumExp({}), -std::numeric_limits<double>::infinity());
}

TEST(SoftmaxTest, LogSumExpMatchesDirectFormula) {
    std::vector<float> scores{0.5f, -1.0f, 2.0f};
    double direct = std::log(std::exp(0.5) + std::exp(-1.0) + std::exp(2.0));
    EXPECT_NEAR(SoftmaxUtils::logSumExp(scores), direct, 1e-6);

    // Shifted by a huge constant, still finite
    EXPECT_NEAR(SoftmaxUtils::logSumExp({1000.5f, 999.0f, 1002.0f}), direct + 1000.0, 1e-3);
}

TEST(SoftmaxTest, ArgMaxPicksFirstOfTies) {
    EXPECT_EQ(Softmax::argMax({0.2f, 0.4f, 0.4f}), 1);
}

TEST(SoftmaxTest, TopKOrdersByScore) {
    auto top = Softmax::topK({0.1f, 0.5f, 0.15f, 0.25f}, 3);
    ASSERT_EQ(top.size(), 3u);
    EXPECT_EQ(top[0], 1);
    EXPECT_EQ(top[1], 3);
    EXPECT_EQ(top[2], 2);

    // k larger than the input is clamped
    EXPECT_EQ(Softmax::topK({0.3f, 0.7f}, 5).size(), 2u);
}

/**
 * Test ONNX engine initialization
 */
TEST(InferenceEngineTest, Initialization) {
    InferenceEngine engine;

    // Should fail with invalid path
    bool result = engine.initialize("nonexistent.onnx");
    EXPECT_FALSE(result);
    EXPECT_FALSE(engine.isInitialized());
    EXPECT_EQ(engine.getFeatureLength(), 0);
}

TEST(InferenceEngineTest, ExtractBeforeInitializeThrows) {
    InferenceEngine engine;
    std::vector<float> pixels(224 * 224 * 3, 0.0f);
    EXPECT_THROW(engine.extract(pixels), std::runtime_error);
}
