/**
 * =============================================================================
 * Reporting.hpp - Console Output for Predictions and Metrics
 * =============================================================================
 *
 * @file Reporting.hpp
 * @author Multi-Language AI System
 * @version 1.0.0
 */

#pragma once

#include "Evaluator.hpp"
#include "ImageData.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace Reporting {

    /** Last path component: "assets/images/toaster.jpg" -> "toaster.jpg" */
    std::string fileName(const std::string& imagePath);

    /**
     * "Image: <file name> predicted as: <label> with score: <max score>"
     */
    std::string formatPrediction(const ImagePrediction& prediction);

    void displayPrediction(const ImagePrediction& prediction, std::ostream& out);

    void displayResults(const std::vector<ImagePrediction>& predictions, std::ostream& out);

    /**
     * Prints "LogLoss is: <x>" and "PerClassLogLoss is: <a , b , ...>",
     * followed by the accuracy figures.
     */
    void displayMetrics(const MulticlassMetrics& metrics, std::ostream& out);
}
