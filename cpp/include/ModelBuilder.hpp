/**
 * =============================================================================
 * ModelBuilder.hpp - Training the Transfer Learning Chain
 * =============================================================================
 *
 * ModelBuilder runs the fixed sequence of steps that turns a labeled image
 * set into a TrainedModel:
 *
 *   (a) load image            cv::imread
 *   (b) resize                224x224, iso-crop
 *   (c) extract pixels        RGB, (pixel - 117) * 1, interleaved
 *   (d) score the network     Inception up to softmax2_pre_activation
 *   (e) encode labels         "toaster" -> 0, ...
 *   (f) fit the classifier    MaxEnt / L-BFGS
 *   (g) attach decoding       0 -> "toaster"
 *
 * Steps (a)-(d) run once per training image; the resulting feature vectors
 * are kept in memory for the whole optimization, so the network is never
 * run twice on the same image.
 *
 * @file ModelBuilder.hpp
 * @author Multi-Language AI System
 * @version 1.0.0
 */

#ifndef MODEL_BUILDER_HPP
#define MODEL_BUILDER_HPP

#include "FeatureExtractor.hpp"
#include "ImageData.hpp"
#include "Settings.hpp"
#include "TrainedModel.hpp"

#include <memory>
#include <string>
#include <vector>

class ModelBuilder {
public:
    explicit ModelBuilder(const TrainerOptions& options = TrainerOptions{});

    /**
     * Train on a dataset using the pretrained network at networkPath.
     *
     * @param trainingData Labeled records
     * @param networkPath  Path to the ONNX network
     * @param network      Tensor names / session options
     * @param image        Geometry and normalization for the network
     * @return The immutable trained model
     *
     * @throws EmptyDatasetError if trainingData is empty
     * @throws ModelLoadError if the network cannot be loaded
     * @throws ImageLoadError if a training image cannot be loaded
     */
    std::shared_ptr<const TrainedModel> fit(const std::vector<ImageData>& trainingData,
                                            const std::string& networkPath,
                                            const NetworkSettings& network = NetworkSettings{},
                                            const ImageSettings& image = ImageSettings{}) const;

    /**
     * Train on a dataset using an already constructed feature extractor.
     */
    std::shared_ptr<const TrainedModel> fit(const std::vector<ImageData>& trainingData,
                                            std::shared_ptr<const FeatureExtractor> extractor,
                                            const NetworkSettings& network = NetworkSettings{}) const;

private:
    TrainerOptions trainerOptions;
};

#endif // MODEL_BUILDER_HPP
