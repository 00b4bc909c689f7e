/**
 * =============================================================================
 * Softmax.hpp - Classifier Output Normalization Utilities
 * =============================================================================
 *
 * This file provides functions to convert classifier outputs (logits)
 * into probabilities using the softmax function, plus the index helpers
 * used to read a prediction back out of a probability vector.
 *
 * SOFTMAX FUNCTION EXPLAINED:
 * ---------------------------
 * The maximum entropy classifier computes one "logit" per class:
 *   z_k = w_k . x + b_k
 * Example: for 3 classes it might output [2.5, -1.0, 0.5].
 *
 * We need to convert these to probabilities that:
 * 1. Are all positive
 * 2. Sum to 1.0
 * 3. Preserve the relative ordering (highest logit -> highest probability)
 *
 * Softmax achieves this:
 *
 *   P(class_i) = exp(logit_i) / sum_j exp(logit_j)
 *
 * NUMERICAL EXAMPLE:
 * Logits: [2.5, -1.0, 0.5]
 * After exp: [12.18, 0.37, 1.65]
 * Sum: 14.2
 * After normalization: [0.86, 0.026, 0.116]
 *
 * @file Softmax.hpp
 * @author Multi-Language AI System
 * @version 1.0.0
 */

#ifndef SOFTMAX_HPP
#define SOFTMAX_HPP

#include <vector>

namespace SoftmaxUtils {

    /**
     * Apply softmax normalization to convert logits to probabilities.
     *
     * ALGORITHM:
     * 1. Find max(logits) for numerical stability
     * 2. Compute exp(logit - max) for each logit
     * 3. Divide by sum of exponentials
     *
     * @param scores Input logits
     * @return Probabilities (all positive, sum to 1.0); empty for empty input
     */
    std::vector<float> softmax(const std::vector<float>& scores);

    /**
     * log(sum_j exp(scores_j)), computed without overflow.
     *
     * The trainer's loss for one example is logSumExp(z) - z_true, which
     * stays accurate even when P(true class) underflows to 0 in float.
     */
    double logSumExp(const std::vector<float>& scores);

    /**
     * Index of the largest score. Ties resolve to the lowest index.
     * @return -1 for empty input
     */
    int argmax(const std::vector<float>& scores);

    /**
     * Get indices of top-k highest scoring elements.
     *
     * Uses std::partial_sort which is O(n log k).
     *
     * @param scores Array of scores (typically probabilities)
     * @param k Number of top indices to return
     * @return Vector of indices, sorted by score (highest first)
     *
     * @example
     * std::vector<float> probs = {0.1, 0.3, 0.05, 0.5, 0.05};
     * auto top3 = SoftmaxUtils::topk(probs, 3);
     * // top3 = [3, 1, 0]
     */
    std::vector<int> topk(const std::vector<float>& scores, int k);
}

/**
 * Convenience namespace with simpler function names.
 * Example: Softmax::compute() instead of SoftmaxUtils::softmax()
 */
namespace Softmax {
    inline std::vector<float> compute(const std::vector<float>& logits) {
        return SoftmaxUtils::softmax(logits);
    }

    inline int argMax(const std::vector<float>& scores) {
        return SoftmaxUtils::argmax(scores);
    }

    inline std::vector<int> topK(const std::vector<float>& scores, int k) {
        return SoftmaxUtils::topk(scores, k);
    }
}

#endif // SOFTMAX_HPP
