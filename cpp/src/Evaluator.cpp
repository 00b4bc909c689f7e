/**
 * =============================================================================
 * Evaluator.cpp - Multiclass Metrics on a Held-Out Set
 * =============================================================================
 *
 * @file Evaluator.cpp
 * @author Multi-Language AI System
 * @version 1.0.0
 */

#include "Evaluator.hpp"
#include "Softmax.hpp"
#include "Errors.hpp"

#include <algorithm>   // std::max, std::find
#include <cmath>       // std::log
#include <limits>      // quiet_NaN
#include <stdexcept>   // std::invalid_argument, std::runtime_error

namespace {

const double kMinProbability = 1e-15;

} // namespace

void MulticlassEvaluator::checkLabels(const LabelMap& labels, const std::vector<ImageData>& records) {
    for (const auto& record : records) {
        if (!labels.contains(record.label)) {
            throw UnseenLabelError(record.label);
        }
    }
}

MulticlassEvaluator::MulticlassEvaluator(int topK) : topK(topK) {
    if (topK < 1) {
        throw std::invalid_argument("topK must be at least 1");
    }
}

MulticlassMetrics MulticlassEvaluator::evaluate(const TrainedModel& model,
                                                const std::vector<ImageData>& testData) const {
    if (testData.empty()) {
        throw EmptyDatasetError("Test set is empty");
    }
    checkLabels(model.labelMap(), testData);

    return evaluate(model.labelMap(), model.transform(testData));
}

MulticlassMetrics MulticlassEvaluator::evaluate(const LabelMap& labels,
                                                const std::vector<ImagePrediction>& predictions) const {
    if (predictions.empty()) {
        throw EmptyDatasetError("Test set is empty");
    }

    const int numClasses = labels.size();
    const double nan = std::numeric_limits<double>::quiet_NaN();

    // Resolve keys first: nothing is accumulated if a label is unknown
    std::vector<int> truth;
    truth.reserve(predictions.size());
    for (const auto& prediction : predictions) {
        if (static_cast<int>(prediction.score.size()) != numClasses) {
            throw std::runtime_error("Prediction for " + prediction.imagePath + " has "
                + std::to_string(prediction.score.size()) + " scores, expected "
                + std::to_string(numClasses));
        }
        truth.push_back(labels.keyOf(prediction.label));
    }

    MulticlassMetrics metrics;
    metrics.topK = topK;
    metrics.confusionMatrix.assign(numClasses, std::vector<int>(numClasses, 0));

    std::vector<double> lossPerClass(numClasses, 0.0);
    std::vector<int> countPerClass(numClasses, 0);
    double totalLoss = 0.0;
    int correct = 0;
    int correctTopK = 0;

    for (size_t i = 0; i < predictions.size(); ++i) {
        const std::vector<float>& score = predictions[i].score;
        const int key = truth[i];

        double p = std::max(static_cast<double>(score[key]), kMinProbability);
        double loss = -std::log(p);

        totalLoss += loss;
        lossPerClass[key] += loss;
        countPerClass[key]++;

        int predicted = Softmax::argMax(score);
        metrics.confusionMatrix[key][predicted]++;
        if (predicted == key) {
            correct++;
        }

        std::vector<int> best = Softmax::topK(score, topK);
        if (std::find(best.begin(), best.end(), key) != best.end()) {
            correctTopK++;
        }
    }

    const double n = static_cast<double>(predictions.size());

    metrics.logLoss = totalLoss / n;
    metrics.microAccuracy = correct / n;
    metrics.topKAccuracy = correctTopK / n;

    // ========================================================================
    // PER-CLASS: LOG-LOSS, RECALL, PRIOR ENTROPY
    // ========================================================================

    metrics.perClassLogLoss.assign(numClasses, nan);
    double recallSum = 0.0;
    int classesPresent = 0;
    double priorLogLoss = 0.0;

    for (int k = 0; k < numClasses; ++k) {
        if (countPerClass[k] == 0) {
            continue;
        }
        metrics.perClassLogLoss[k] = lossPerClass[k] / countPerClass[k];

        recallSum += static_cast<double>(metrics.confusionMatrix[k][k]) / countPerClass[k];
        classesPresent++;

        double frequency = countPerClass[k] / n;
        priorLogLoss -= frequency * std::log(frequency);
    }

    metrics.macroAccuracy = recallSum / classesPresent;
    metrics.logLossReduction = priorLogLoss > 0.0
        ? (priorLogLoss - metrics.logLoss) / priorLogLoss
        : nan;

    return metrics;
}
