/**
 * @file Reporting.cpp
 * @author Multi-Language AI System
 * @version 1.0.0
 */

#include "Reporting.hpp"

#include <algorithm>   // std::max_element
#include <filesystem>
#include <sstream>

namespace Reporting {

std::string fileName(const std::string& imagePath) {
    return std::filesystem::path(imagePath).filename().string();
}

std::string formatPrediction(const ImagePrediction& prediction) {
    float maxScore = prediction.score.empty()
        ? 0.0f
        : *std::max_element(prediction.score.begin(), prediction.score.end());

    std::ostringstream line;
    line << "Image: " << fileName(prediction.imagePath)
         << " predicted as: " << prediction.predictedLabelValue
         << " with score: " << maxScore;
    return line.str();
}

void displayPrediction(const ImagePrediction& prediction, std::ostream& out) {
    out << formatPrediction(prediction) << std::endl;
}

void displayResults(const std::vector<ImagePrediction>& predictions, std::ostream& out) {
    for (const auto& prediction : predictions) {
        displayPrediction(prediction, out);
    }
}

void displayMetrics(const MulticlassMetrics& metrics, std::ostream& out) {
    out << "LogLoss is: " << metrics.logLoss << std::endl;

    out << "PerClassLogLoss is: ";
    for (size_t k = 0; k < metrics.perClassLogLoss.size(); ++k) {
        if (k > 0) {
            out << " , ";
        }
        out << metrics.perClassLogLoss[k];
    }
    out << std::endl;

    out << "LogLossReduction is: " << metrics.logLossReduction << std::endl;
    out << "MicroAccuracy is: " << metrics.microAccuracy << std::endl;
    out << "MacroAccuracy is: " << metrics.macroAccuracy << std::endl;
    out << "Top-" << metrics.topK << " accuracy is: " << metrics.topKAccuracy << std::endl;
}

} // namespace Reporting
