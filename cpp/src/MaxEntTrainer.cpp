/**
 * =============================================================================
 * MaxEntTrainer.cpp - Maximum Entropy Classifier trained with dlib L-BFGS
 * =============================================================================
 *
 * PARAMETER LAYOUT:
 * All trainable values live in one flat vector theta of size K*D + K:
 *
 *   theta = [ w_0 (D values) | w_1 | ... | w_K-1 | b_0 b_1 ... b_K-1 ]
 *
 * so weight (k, d) is theta[k * D + d] and bias k is theta[K * D + k].
 * dlib::find_min only sees theta; it does not know it is training a
 * classifier.
 *
 * @file MaxEntTrainer.cpp
 * @author Multi-Language AI System
 * @version 1.0.0
 */

#include "MaxEntTrainer.hpp"
#include "Softmax.hpp"
#include "Errors.hpp"

#include <iostream>    // std::cout for the training summary
#include <limits>      // lower bound passed to find_min
#include <stdexcept>   // std::invalid_argument
#include <utility>     // std::move

/**
 * dlib's unconstrained optimizers: find_min() with a search strategy
 * (lbfgs_search_strategy) and a stop strategy (objective_delta_stop_strategy).
 */
#include <dlib/optimization.h>

// ============================================================================
// MAXENT MODEL
// ============================================================================

MaxEntModel::MaxEntModel(int numClasses, int numFeatures,
                         std::vector<float> weights, std::vector<float> biases)
    : classes(numClasses)
    , featureCount(numFeatures)
    , weightData(std::move(weights))
    , biasData(std::move(biases))
{
    if (numClasses <= 0 || numFeatures <= 0) {
        throw std::invalid_argument("MaxEntModel needs at least one class and one feature");
    }
    if (weightData.size() != static_cast<std::size_t>(numClasses) * numFeatures
        || biasData.size() != static_cast<std::size_t>(numClasses)) {
        throw std::invalid_argument("MaxEntModel weight/bias sizes do not match "
            + std::to_string(numClasses) + " classes x " + std::to_string(numFeatures) + " features");
    }
}

std::vector<float> MaxEntModel::logits(const std::vector<float>& features) const {
    if (features.size() != static_cast<std::size_t>(featureCount)) {
        throw std::invalid_argument("Feature vector has " + std::to_string(features.size())
            + " values, classifier expects " + std::to_string(featureCount));
    }

    std::vector<float> z(classes);
    for (int k = 0; k < classes; ++k) {
        const float* w = weightData.data() + static_cast<std::size_t>(k) * featureCount;

        double acc = biasData[k];
        for (int d = 0; d < featureCount; ++d) {
            acc += static_cast<double>(w[d]) * features[d];
        }
        z[k] = static_cast<float>(acc);
    }
    return z;
}

std::vector<float> MaxEntModel::predictProbabilities(const std::vector<float>& features) const {
    return Softmax::compute(logits(features));
}

// ============================================================================
// OBJECTIVE FUNCTION
// ============================================================================

namespace {

/** dlib's dense column vector; the optimizer works in double precision */
typedef dlib::matrix<double, 0, 1> column_vector;

/** Everything the objective needs besides theta */
struct Problem {
    const std::vector<std::vector<float>>& x;
    const std::vector<int>& y;
    int numClasses;
    int numFeatures;
    double l2;
};

/**
 * Computes f(theta) and writes df/dtheta into grad.
 *
 * Per example: loss = logSumExp(z) - z_y, and the gradient w.r.t. z is
 * softmax(z) - onehot(y). The chain rule through z = W x + b gives the
 * weight and bias gradients.
 */
double evaluate(const Problem& p, const column_vector& theta, column_vector& grad) {
    const long K = p.numClasses;
    const long D = p.numFeatures;
    const long biasOffset = K * D;

    grad.set_size(theta.size());
    grad = 0;

    double loss = 0.0;
    std::vector<float> z(K);

    for (std::size_t i = 0; i < p.x.size(); ++i) {
        const std::vector<float>& xi = p.x[i];
        const int yi = p.y[i];

        // Forward: logits
        for (long k = 0; k < K; ++k) {
            double acc = theta(biasOffset + k);
            for (long d = 0; d < D; ++d) {
                acc += theta(k * D + d) * xi[d];
            }
            z[k] = static_cast<float>(acc);
        }

        loss += SoftmaxUtils::logSumExp(z) - z[yi];

        // Backward: (P(k|x) - [k == y]) spread over the inputs
        std::vector<float> probs = Softmax::compute(z);
        for (long k = 0; k < K; ++k) {
            double delta = probs[k] - (k == yi ? 1.0 : 0.0);
            grad(biasOffset + k) += delta;

            for (long d = 0; d < D; ++d) {
                grad(k * D + d) += delta * xi[d];
            }
        }
    }

    // L2 penalty on weights only
    for (long j = 0; j < biasOffset; ++j) {
        loss += 0.5 * p.l2 * theta(j) * theta(j);
        grad(j) += p.l2 * theta(j);
    }

    return loss;
}

} // namespace

// ============================================================================
// TRAINER
// ============================================================================

MaxEntTrainer::MaxEntTrainer(const TrainerOptions& options) : opts(options) {
    if (opts.historySize < 1) {
        throw std::invalid_argument("L-BFGS history size must be at least 1");
    }
    if (opts.l2Regularization < 0.0f) {
        throw std::invalid_argument("L2 regularization must not be negative");
    }
    if (opts.maximumIterations < 1) {
        throw std::invalid_argument("Maximum iterations must be at least 1");
    }
}

MaxEntModel MaxEntTrainer::train(const std::vector<std::vector<float>>& features,
                                 const std::vector<int>& keys,
                                 int numClasses) const {
    // ========================================================================
    // INPUT VALIDATION
    // ========================================================================

    if (features.empty()) {
        throw EmptyDatasetError("Cannot train a classifier on an empty training set");
    }
    if (keys.size() != features.size()) {
        throw std::invalid_argument("Number of labels does not match number of feature vectors");
    }
    if (numClasses < 1) {
        throw std::invalid_argument("Number of classes must be at least 1");
    }

    const int D = static_cast<int>(features[0].size());
    if (D == 0) {
        throw std::invalid_argument("Feature vectors are empty");
    }
    for (std::size_t i = 0; i < features.size(); ++i) {
        if (features[i].size() != static_cast<std::size_t>(D)) {
            throw std::invalid_argument("Feature vector " + std::to_string(i) + " has "
                + std::to_string(features[i].size()) + " values, expected " + std::to_string(D));
        }
        if (keys[i] < 0 || keys[i] >= numClasses) {
            throw std::invalid_argument("Class key " + std::to_string(keys[i]) + " out of range");
        }
    }

    const int K = numClasses;
    const Problem problem{features, keys, K, D, static_cast<double>(opts.l2Regularization)};
    const long n = static_cast<long>(K) * D + K;

    // ========================================================================
    // L-BFGS (dlib::find_min)
    // ========================================================================

    // Start from all-zero weights: uniform P(k|x), deterministic result
    column_vector theta(n);
    theta = 0;

    /**
     * find_min() asks for f(x) and df(x) through two separate callbacks,
     * almost always at the same point. One pass of evaluate() produces
     * both, so the last point and its results are cached.
     */
    column_vector cachedPoint;
    column_vector cachedGradient;
    double cachedLoss = 0.0;
    evaluations = 0;

    auto refresh = [&](const column_vector& at) {
        if (cachedPoint.size() != at.size() || cachedPoint != at) {
            cachedLoss = evaluate(problem, at, cachedGradient);
            cachedPoint = at;
            ++evaluations;
        }
    };
    auto objective = [&](const column_vector& at) {
        refresh(at);
        return cachedLoss;
    };
    auto gradient = [&](const column_vector& at) -> column_vector {
        refresh(at);
        return cachedGradient;
    };

    const double loss = dlib::find_min(
        dlib::lbfgs_search_strategy(static_cast<unsigned long>(opts.historySize)),
        dlib::objective_delta_stop_strategy(opts.optimizationTolerance,
                                            static_cast<unsigned long>(opts.maximumIterations)),
        objective, gradient, theta,
        -std::numeric_limits<double>::infinity());

    std::cout << "MaxEnt trainer: " << features.size() << " examples, " << D << " features, "
              << K << " classes; " << evaluations << " objective evaluations, loss = " << loss << std::endl;

    // ========================================================================
    // PACK THE RESULT
    // ========================================================================

    const long biasOffset = static_cast<long>(K) * D;
    std::vector<float> weights(static_cast<std::size_t>(biasOffset));
    std::vector<float> biases(static_cast<std::size_t>(K));
    for (long j = 0; j < biasOffset; ++j) {
        weights[j] = static_cast<float>(theta(j));
    }
    for (long k = 0; k < K; ++k) {
        biases[k] = static_cast<float>(theta(biasOffset + k));
    }

    return MaxEntModel(K, D, std::move(weights), std::move(biases));
}
