/**
 * @file PredictionEngine.cpp
 * @author Multi-Language AI System
 * @version 1.0.0
 */

#include "PredictionEngine.hpp"

#include <stdexcept>
#include <utility>

PredictionEngine::PredictionEngine(std::shared_ptr<const TrainedModel> model)
    : trainedModel(std::move(model))
{
    if (!trainedModel) {
        throw std::invalid_argument("PredictionEngine needs a trained model");
    }
}

ImagePrediction PredictionEngine::predict(const ImageData& input) {
    return trainedModel->transform(input, pixelBuffer);
}
