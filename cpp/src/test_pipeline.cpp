/**
 * Training, prediction, evaluation and persistence on synthetic images.
 *
 * Red images are "toaster", blue images are "not-toaster"; the
 * ColorMeanExtractor replaces the network so these tests need no assets.
 */

#include "ModelBuilder.hpp"
#include "PredictionEngine.hpp"
#include "Evaluator.hpp"
#include "Reporting.hpp"
#include "Softmax.hpp"
#include "Errors.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

class PipelineTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();

        writeImage("toaster1.png", kRed);
        writeImage("toaster2.png", cv::Scalar(20, 10, 230));
        writeImage("broccoli.png", kBlue);
        writeImage("pot.png", cv::Scalar(230, 30, 10));
        writeImage("toaster3.png", cv::Scalar(10, 20, 240));

        training = {
            {path("toaster1.png"), "toaster"},
            {path("broccoli.png"), "not-toaster"},
            {path("toaster2.png"), "toaster"},
            {path("pot.png"), "not-toaster"},
        };
    }

    std::shared_ptr<const TrainedModel> fit() const {
        return ModelBuilder().fit(training, extractor);
    }

    std::shared_ptr<const ColorMeanExtractor> extractor = std::make_shared<ColorMeanExtractor>();
    std::vector<ImageData> training;
};

TEST_F(PipelineTest, PredictsHeldOutToaster) {
    auto model = fit();
    PredictionEngine engine(model);

    ImagePrediction prediction = engine.predict({path("toaster3.png"), ""});

    EXPECT_EQ(prediction.predictedLabelValue, "toaster");
    ASSERT_EQ(prediction.score.size(), 2u);
    EXPECT_GT(prediction.score[0], 0.5f);
}

TEST_F(PipelineTest, EngineIsReusableAcrossPredictions) {
    PredictionEngine engine(fit());

    ImagePrediction first = engine.predict({path("toaster3.png"), ""});
    ImagePrediction other = engine.predict({path("broccoli.png"), ""});
    ImagePrediction again = engine.predict({path("toaster3.png"), ""});

    EXPECT_EQ(other.predictedLabelValue, "not-toaster");
    EXPECT_EQ(again.predictedLabelValue, first.predictedLabelValue);
    EXPECT_EQ(again.score, first.score);
}

TEST_F(PipelineTest, LabelsKeyedInOrderOfAppearance) {
    auto model = fit();

    EXPECT_EQ(model->labelMap().labels(), (std::vector<std::string>{"toaster", "not-toaster"}));
}

TEST_F(PipelineTest, PredictionIsArgMaxOfScore) {
    auto model = fit();

    for (const auto& prediction : model->transform(training)) {
        const auto& labels = model->labelMap().labels();
        EXPECT_NE(std::find(labels.begin(), labels.end(), prediction.predictedLabelValue), labels.end());
        EXPECT_EQ(prediction.predictedLabelValue, model->labelMap().valueOf(Softmax::argMax(prediction.score)));
        EXPECT_EQ(prediction.predictedLabelValue, prediction.label);
    }
}

TEST_F(PipelineTest, EvaluateTrainingSet) {
    auto model = fit();

    MulticlassMetrics metrics = MulticlassEvaluator().evaluate(*model, training);

    EXPECT_DOUBLE_EQ(metrics.microAccuracy, 1.0);
    EXPECT_LT(metrics.logLoss, std::log(2.0));
    EXPECT_GT(metrics.logLossReduction, 0.0);

    std::ostringstream out;
    Reporting::displayMetrics(metrics, out);
    EXPECT_NE(out.str().find("LogLoss is: "), std::string::npos);
    EXPECT_NE(out.str().find("PerClassLogLoss is: "), std::string::npos);
}

TEST_F(PipelineTest, EvaluateUnseenLabelFailsBeforeScoring) {
    auto model = fit();

    // The image does not exist: reaching the extractor would throw ImageLoadError
    std::vector<ImageData> test{{path("missing.png"), "broccoli"}};

    EXPECT_THROW(MulticlassEvaluator().evaluate(*model, test), UnseenLabelError);
}

TEST_F(PipelineTest, EmptyTrainingSetThrows) {
    EXPECT_THROW(ModelBuilder().fit({}, extractor), EmptyDatasetError);
    EXPECT_THROW(ModelBuilder().fit({}, path("missing.onnx")), EmptyDatasetError);
}

TEST_F(PipelineTest, MissingNetworkThrows) {
    EXPECT_THROW(ModelBuilder().fit(training, path("missing.onnx")), ModelLoadError);
}

TEST_F(PipelineTest, MissingTrainingImageThrows) {
    training.push_back({path("missing.png"), "toaster"});
    EXPECT_THROW(fit(), ImageLoadError);
}

TEST_F(PipelineTest, SaveLoadPreservesPredictions) {
    auto model = fit();
    model->save(path("model.yml"));

    auto restored = TrainedModel::load(path("model.yml"), extractor);

    EXPECT_EQ(restored->labelMap().labels(), model->labelMap().labels());
    EXPECT_EQ(restored->networkSettings().inputName, model->networkSettings().inputName);
    EXPECT_EQ(restored->networkSettings().outputName, model->networkSettings().outputName);

    ImageData probe{path("toaster3.png"), ""};
    ImagePrediction before = model->transform(probe);
    ImagePrediction after = restored->transform(probe);

    EXPECT_EQ(after.predictedLabelValue, before.predictedLabelValue);
    ASSERT_EQ(after.score.size(), before.score.size());
    for (size_t k = 0; k < before.score.size(); ++k) {
        EXPECT_NEAR(after.score[k], before.score[k], 1e-6f);
    }
}

TEST_F(PipelineTest, LoadInvalidModelFileThrows) {
    EXPECT_THROW(TrainedModel::load(path("missing.yml"), extractor), ModelLoadError);

    writeText("other.yml", "%YAML:1.0\n---\nformat: \"something else\"\n");
    EXPECT_THROW(TrainedModel::load(path("other.yml"), extractor), ModelLoadError);
}

TEST_F(PipelineTest, LoadRejectsMismatchedExtractor) {
    fit()->save(path("model.yml"));

    // Trained on 8x8 inputs
    EXPECT_THROW(TrainedModel::load(path("model.yml"), std::make_shared<ColorMeanExtractor>(16)),
                 ModelLoadError);

    // Two features instead of three
    class RedGreenExtractor : public ColorMeanExtractor {
    public:
        std::vector<float> extract(const std::vector<float>& pixels) const override {
            std::vector<float> features = ColorMeanExtractor::extract(pixels);
            features.pop_back();
            return features;
        }
        int getFeatureLength() const override { return 2; }
    };
    EXPECT_THROW(TrainedModel::load(path("model.yml"), std::make_shared<RedGreenExtractor>()),
                 ModelLoadError);

    EXPECT_THROW(TrainedModel::load(path("model.yml"), nullptr), std::invalid_argument);
}

TEST_F(PipelineTest, LoadRejectsUnknownResizingMode) {
    fit()->save(path("model.yml"));

    std::string text = readText("model.yml");
    const std::string key = "resizing: ";
    size_t at = text.find(key);
    ASSERT_NE(at, std::string::npos);
    text.replace(at + key.size(), 1, "7");
    writeText("model.yml", text);

    EXPECT_THROW(TrainedModel::load(path("model.yml"), extractor), ModelLoadError);
}

TEST_F(PipelineTest, FormatPrediction) {
    ImagePrediction prediction;
    prediction.imagePath = path("toaster3.png");
    prediction.predictedLabelValue = "toaster";
    prediction.score = {0.75f, 0.25f};

    EXPECT_EQ(Reporting::formatPrediction(prediction),
              "Image: toaster3.png predicted as: toaster with score: 0.75");
}

TEST(PredictionEngineTest, NullModelThrows) {
    EXPECT_THROW(PredictionEngine(nullptr), std::invalid_argument);
}
