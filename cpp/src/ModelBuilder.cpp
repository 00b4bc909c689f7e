/**
 * =============================================================================
 * ModelBuilder.cpp - Training the Transfer Learning Chain
 * =============================================================================
 *
 * @file ModelBuilder.cpp
 * @author Multi-Language AI System
 * @version 1.0.0
 */

#include "ModelBuilder.hpp"
#include "InferenceEngine.hpp"
#include "LabelMap.hpp"
#include "MaxEntTrainer.hpp"
#include "Errors.hpp"

#include <iostream>    // std::cout for progress
#include <stdexcept>   // std::runtime_error
#include <utility>     // std::move

ModelBuilder::ModelBuilder(const TrainerOptions& options) : trainerOptions(options) {}

std::shared_ptr<const TrainedModel> ModelBuilder::fit(const std::vector<ImageData>& trainingData,
                                                      const std::string& networkPath,
                                                      const NetworkSettings& network,
                                                      const ImageSettings& image) const {
    // Checked before loading the network: that can take seconds
    if (trainingData.empty()) {
        throw EmptyDatasetError("Training set is empty");
    }

    auto engine = std::make_shared<InferenceEngine>();
    if (!engine->initialize(networkPath, network, image)) {
        throw ModelLoadError("Could not load pretrained network: " + networkPath);
    }

    return fit(trainingData, std::move(engine), network);
}

std::shared_ptr<const TrainedModel> ModelBuilder::fit(const std::vector<ImageData>& trainingData,
                                                      std::shared_ptr<const FeatureExtractor> extractor,
                                                      const NetworkSettings& network) const {
    if (trainingData.empty()) {
        throw EmptyDatasetError("Training set is empty");
    }
    if (!extractor) {
        throw std::invalid_argument("ModelBuilder::fit needs a feature extractor");
    }

    // ========================================================================
    // STEPS (a)-(d): IMAGES -> FEATURE VECTORS
    // ========================================================================

    std::cout << "Extracting features from " << trainingData.size() << " training images..." << std::endl;

    std::vector<std::vector<float>> features;
    features.reserve(trainingData.size());

    std::vector<float> pixelBuffer;
    for (const auto& record : trainingData) {
        features.push_back(extractor->extractFromFile(record.imagePath, pixelBuffer));

        if (features.back().size() != features.front().size()) {
            throw std::runtime_error("Feature extractor returned " + std::to_string(features.back().size())
                + " values for " + record.imagePath + ", expected " + std::to_string(features.front().size()));
        }
    }

    // ========================================================================
    // STEP (e): LABELS -> CLASS KEYS
    // ========================================================================

    LabelMap labels;
    std::vector<int> keys;
    keys.reserve(trainingData.size());
    for (const auto& record : trainingData) {
        keys.push_back(labels.add(record.label));
    }

    std::cout << "Classes:";
    for (const auto& label : labels.labels()) {
        std::cout << " " << label;
    }
    std::cout << std::endl;

    // ========================================================================
    // STEP (f): FIT THE CLASSIFIER
    // ========================================================================

    MaxEntTrainer trainer(trainerOptions);
    MaxEntModel classifier = trainer.train(features, keys, labels.size());

    // ========================================================================
    // STEP (g): DECODING IS PART OF THE MODEL
    // ========================================================================

    return std::make_shared<const TrainedModel>(std::move(extractor), network,
                                                std::move(labels), std::move(classifier));
}
