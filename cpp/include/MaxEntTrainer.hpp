/**
 * =============================================================================
 * MaxEntTrainer.hpp - Multiclass Maximum Entropy Classifier (dlib L-BFGS)
 * =============================================================================
 *
 * This is the only part of the pipeline that actually LEARNS. Everything
 * before it (resize, pixels, Inception) is fixed; the classifier on top
 * learns which combinations of Inception features mean "toaster".
 *
 * MAXIMUM ENTROPY = MULTINOMIAL LOGISTIC REGRESSION:
 * --------------------------------------------------
 * For K classes and a D-dimensional feature vector x:
 *
 *   z_k    = w_k . x + b_k                  (one logit per class)
 *   P(k|x) = softmax(z)_k
 *
 * Training minimizes the negative log-likelihood plus an L2 penalty:
 *
 *   f(W, b) = sum_i [ log(sum_k exp(z_ik)) - z_i,y_i ]  +  (l2 / 2) * ||W||^2
 *
 * with gradient
 *
 *   df/dw_k = sum_i (P(k|x_i) - [k == y_i]) * x_i  +  l2 * w_k
 *   df/db_k = sum_i (P(k|x_i) - [k == y_i])
 *
 * f is convex, so any local minimum is THE minimum.
 *
 * L-BFGS:
 * -------
 * Limited-memory BFGS approximates Newton's method using only the last
 * 'historySize' steps s = x_new - x and gradient changes y = g_new - g.
 * It converges in far fewer iterations than plain gradient descent and
 * needs no learning rate. The optimizer is dlib::find_min() with
 * lbfgs_search_strategy; it stops when one iteration lowers f by less than
 * optimizationTolerance or after maximumIterations. Starting from all-zero
 * weights the result is deterministic for identical inputs.
 *
 * @file MaxEntTrainer.hpp
 * @author Multi-Language AI System
 * @version 1.0.0
 */

#ifndef MAX_ENT_TRAINER_HPP
#define MAX_ENT_TRAINER_HPP

#include "Settings.hpp"

#include <vector>

/**
 * A fitted linear softmax classifier.
 * Immutable once constructed.
 */
class MaxEntModel {
public:
    MaxEntModel() = default;

    /**
     * @param numClasses  K
     * @param numFeatures D
     * @param weights     K x D, row-major (row k = weights of class k)
     * @param biases      K
     *
     * @throws std::invalid_argument if the sizes do not match
     */
    MaxEntModel(int numClasses, int numFeatures,
                std::vector<float> weights, std::vector<float> biases);

    /**
     * Per-class probabilities for one feature vector.
     *
     * @param features D values
     * @return K probabilities summing to 1.0, indexed by class key
     * @throws std::invalid_argument if features.size() != D
     */
    std::vector<float> predictProbabilities(const std::vector<float>& features) const;

    /** Raw logits z = W x + b */
    std::vector<float> logits(const std::vector<float>& features) const;

    int numClasses() const { return classes; }
    int numFeatures() const { return featureCount; }
    const std::vector<float>& weights() const { return weightData; }
    const std::vector<float>& biases() const { return biasData; }

private:
    int classes = 0;
    int featureCount = 0;
    std::vector<float> weightData;
    std::vector<float> biasData;
};

/**
 * Fits a MaxEntModel with L-BFGS.
 *
 * USAGE EXAMPLE:
 * ```cpp
 * MaxEntTrainer trainer;                    // default options
 * std::vector<std::vector<float>> x = {{0.9f, 0.1f}, {0.1f, 0.8f}};
 * std::vector<int> y = {0, 1};
 * MaxEntModel model = trainer.train(x, y, 2);
 * auto probs = model.predictProbabilities({0.85f, 0.2f});   // probs[0] > 0.5
 * ```
 */
class MaxEntTrainer {
public:
    explicit MaxEntTrainer(const TrainerOptions& options = TrainerOptions{});

    /**
     * @param features   N feature vectors, all of the same length D
     * @param keys       N class keys in [0, numClasses)
     * @param numClasses K, the number of distinct classes
     *
     * @throws EmptyDatasetError if there are no examples
     * @throws std::invalid_argument on inconsistent sizes or keys
     */
    MaxEntModel train(const std::vector<std::vector<float>>& features,
                      const std::vector<int>& keys,
                      int numClasses) const;

    /** Number of objective/gradient evaluations made by the last train() call */
    int lastEvaluationCount() const { return evaluations; }

private:
    TrainerOptions opts;

    // Diagnostics of the last run; train() is logically const
    mutable int evaluations = 0;
};

#endif // MAX_ENT_TRAINER_HPP
