/**
 * =============================================================================
 * Softmax.cpp - Implementation of Softmax, Argmax and Top-K Functions
 * =============================================================================
 *
 * @file Softmax.cpp
 * @author Multi-Language AI System
 * @version 1.0.0
 */

#include "Softmax.hpp"

#include <cmath>         // std::exp, std::log
#include <algorithm>     // std::max_element, std::partial_sort
#include <numeric>       // std::iota
#include <limits>        // std::numeric_limits

namespace SoftmaxUtils {

/**
 * Softmax implementation with numerical stability.
 *
 * NUMERICAL STABILITY TRICK:
 * Computing exp(1000) overflows to infinity.
 * Solution: Subtract max before exponentiating.
 *
 *   softmax(x_i) = exp(x_i - max) / sum_j exp(x_j - max)
 *
 * This is mathematically equivalent (the max cancels out in the division)
 * but the largest exponential is now exp(0) = 1.
 */
std::vector<float> softmax(const std::vector<float>& scores) {
    if (scores.empty()) {
        return {};
    }

    float maxScore = *std::max_element(scores.begin(), scores.end());

    std::vector<float> probabilities;
    probabilities.reserve(scores.size());

    // Accumulate in double: with many classes the float sum loses digits
    double sum = 0.0;
    for (float score : scores) {
        float exp_val = std::exp(score - maxScore);
        probabilities.push_back(exp_val);
        sum += exp_val;
    }

    for (auto& prob : probabilities) {
        prob = static_cast<float>(prob / sum);
    }

    return probabilities;
}

double logSumExp(const std::vector<float>& scores) {
    if (scores.empty()) {
        return -std::numeric_limits<double>::infinity();
    }

    // Same max-shift as softmax(): log(sum exp(x)) = max + log(sum exp(x - max))
    double maxScore = *std::max_element(scores.begin(), scores.end());

    double sum = 0.0;
    for (float score : scores) {
        sum += std::exp(score - maxScore);
    }

    return maxScore + std::log(sum);
}

int argmax(const std::vector<float>& scores) {
    if (scores.empty()) {
        return -1;
    }
    // max_element returns the FIRST maximum, which gives the lowest-index tie rule
    return static_cast<int>(std::max_element(scores.begin(), scores.end()) - scores.begin());
}

std::vector<int> topk(const std::vector<float>& scores, int k) {
    std::vector<int> indices(scores.size());
    std::iota(indices.begin(), indices.end(), 0);  // Fill with 0, 1, 2, ...

    int count = std::max(0, std::min(k, static_cast<int>(scores.size())));

    /**
     * std::partial_sort puts the 'count' largest elements, sorted, at the
     * front. Equal scores are ordered by index so that topk(scores, 1)
     * always agrees with argmax(scores).
     */
    std::partial_sort(
        indices.begin(),
        indices.begin() + count,
        indices.end(),
        [&scores](int a, int b) {
            if (scores[a] != scores[b]) {
                return scores[a] > scores[b];
            }
            return a < b;
        }
    );

    indices.resize(count);
    return indices;
}

} // namespace SoftmaxUtils
