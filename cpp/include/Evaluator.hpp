/**
 * =============================================================================
 * Evaluator.hpp - Multiclass Metrics on a Held-Out Set
 * =============================================================================
 *
 * LOG-LOSS:
 * For each record, the loss is -ln(P(true class)). A perfect, confident
 * classifier scores 0; a classifier that puts all its mass on the wrong
 * class scores +inf, so probabilities are clamped to 1e-15 first:
 *
 *   LogLoss = (1/N) * sum_i -ln(max(p_i,true, 1e-15))
 *
 * PerClassLogLoss is the same mean restricted to the records of one class.
 *
 * LOG-LOSS REDUCTION:
 * How much better the model is than always predicting the class frequencies
 * of the held-out set (whose log-loss is the entropy of those frequencies):
 *
 *   LogLossReduction = (prior - LogLoss) / prior
 *
 * 1 is perfect, 0 is no better than the prior, negative is worse.
 *
 * @file Evaluator.hpp
 * @author Multi-Language AI System
 * @version 1.0.0
 */

#ifndef EVALUATOR_HPP
#define EVALUATOR_HPP

#include "ImageData.hpp"
#include "LabelMap.hpp"
#include "TrainedModel.hpp"

#include <vector>

struct MulticlassMetrics {
    double logLoss = 0.0;

    /** Indexed by class key; NaN for a class with no held-out records */
    std::vector<double> perClassLogLoss;

    /** NaN when the held-out set has a single class (zero prior entropy) */
    double logLossReduction = 0.0;

    /** Fraction of records predicted correctly */
    double microAccuracy = 0.0;

    /** Mean per-class recall over the classes present in the held-out set */
    double macroAccuracy = 0.0;

    /** Fraction of records whose true class is among the topK best scores */
    double topKAccuracy = 0.0;
    int topK = 1;

    /** confusionMatrix[truth][predicted], counts, indexed by class key */
    std::vector<std::vector<int>> confusionMatrix;
};

class MulticlassEvaluator {
public:
    /**
     * @param topK K used for topKAccuracy
     * @throws std::invalid_argument if topK < 1
     */
    explicit MulticlassEvaluator(int topK = 1);

    /**
     * Score a held-out set with the model and compute metrics.
     *
     * Every label is checked before any image is scored, so an unseen
     * label fails without running the network.
     *
     * @throws EmptyDatasetError if testData is empty
     * @throws UnseenLabelError if a label was not seen during training
     */
    MulticlassMetrics evaluate(const TrainedModel& model, const std::vector<ImageData>& testData) const;

    /**
     * Compute metrics from predictions the caller already has (for example
     * to display them first).
     *
     * @param labels      The model's label map
     * @param predictions Output of TrainedModel::transform()
     */
    MulticlassMetrics evaluate(const LabelMap& labels, const std::vector<ImagePrediction>& predictions) const;

    /**
     * @throws UnseenLabelError for the first record whose label is not in
     *         the map
     */
    static void checkLabels(const LabelMap& labels, const std::vector<ImageData>& records);

private:
    int topK;
};

#endif // EVALUATOR_HPP
