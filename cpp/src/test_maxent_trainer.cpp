#include "MaxEntTrainer.hpp"
#include "Softmax.hpp"
#include "Errors.hpp"
#include <gtest/gtest.h>
#include <numeric>

namespace {

/** Two well-separated clusters per class along the first feature */
void separableData(std::vector<std::vector<float>>& x, std::vector<int>& y) {
    x = {{0.9f, 0.1f}, {0.8f, 0.3f}, {1.0f, 0.2f},
         {0.1f, 0.9f}, {0.2f, 0.7f}, {0.0f, 1.0f}};
    y = {0, 0, 0, 1, 1, 1};
}

} // namespace

TEST(MaxEntTrainerTest, SeparatesSeparableData) {
    std::vector<std::vector<float>> x;
    std::vector<int> y;
    separableData(x, y);

    TrainerOptions options;
    options.l2Regularization = 0.01f;
    MaxEntTrainer trainer(options);
    MaxEntModel model = trainer.train(x, y, 2);

    EXPECT_EQ(model.numClasses(), 2);
    EXPECT_EQ(model.numFeatures(), 2);
    for (size_t i = 0; i < x.size(); ++i) {
        auto probs = model.predictProbabilities(x[i]);
        EXPECT_EQ(Softmax::argMax(probs), y[i]) << "example " << i;
    }
    EXPECT_GT(trainer.lastEvaluationCount(), 0);
}

TEST(MaxEntTrainerTest, ProbabilitiesSumToOne) {
    std::vector<std::vector<float>> x;
    std::vector<int> y;
    separableData(x, y);

    MaxEntModel model = MaxEntTrainer().train(x, y, 3);   // class 2 never seen
    auto probs = model.predictProbabilities({0.5f, 0.5f});

    ASSERT_EQ(probs.size(), 3u);
    EXPECT_NEAR(std::accumulate(probs.begin(), probs.end(), 0.0f), 1.0f, 1e-5f);
    EXPECT_LT(probs[2], probs[0]);
    EXPECT_LT(probs[2], probs[1]);
}

TEST(MaxEntTrainerTest, IsDeterministic) {
    std::vector<std::vector<float>> x;
    std::vector<int> y;
    separableData(x, y);

    MaxEntModel a = MaxEntTrainer().train(x, y, 2);
    MaxEntModel b = MaxEntTrainer().train(x, y, 2);

    EXPECT_EQ(a.weights(), b.weights());
    EXPECT_EQ(a.biases(), b.biases());
}

TEST(MaxEntTrainerTest, StrongerRegularizationShrinksWeights) {
    std::vector<std::vector<float>> x;
    std::vector<int> y;
    separableData(x, y);

    TrainerOptions weak;
    weak.l2Regularization = 0.1f;
    TrainerOptions strong;
    strong.l2Regularization = 10.0f;

    auto norm = [](const std::vector<float>& w) {
        return std::inner_product(w.begin(), w.end(), w.begin(), 0.0);
    };

    EXPECT_GT(norm(MaxEntTrainer(weak).train(x, y, 2).weights()),
              norm(MaxEntTrainer(strong).train(x, y, 2).weights()));
}

TEST(MaxEntTrainerTest, RejectsBadInput) {
    MaxEntTrainer trainer;

    EXPECT_THROW(trainer.train({}, {}, 2), EmptyDatasetError);
    EXPECT_THROW(trainer.train({{1.0f}, {2.0f}}, {0}, 2), std::invalid_argument);
    EXPECT_THROW(trainer.train({{1.0f}, {2.0f, 3.0f}}, {0, 1}, 2), std::invalid_argument);
    EXPECT_THROW(trainer.train({{1.0f}}, {2}, 2), std::invalid_argument);
}

TEST(MaxEntModelTest, RejectsWrongFeatureCount) {
    MaxEntModel model(2, 3, std::vector<float>(6, 0.0f), std::vector<float>(2, 0.0f));
    EXPECT_THROW(model.predictProbabilities({1.0f, 2.0f}), std::invalid_argument);
}

TEST(MaxEntModelTest, ZeroModelIsUniform) {
    MaxEntModel model(4, 2, std::vector<float>(8, 0.0f), std::vector<float>(4, 0.0f));
    for (float p : model.predictProbabilities({3.0f, -1.0f})) {
        EXPECT_NEAR(p, 0.25f, 1e-6f);
    }
}
