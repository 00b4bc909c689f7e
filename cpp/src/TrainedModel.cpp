/**
 * =============================================================================
 * TrainedModel.cpp - Applying and Persisting the Fitted Chain
 * =============================================================================
 *
 * SAVED MODEL LAYOUT (YAML shown, JSON/XML are equivalent):
 *
 *   format: "TransferLearning.TrainedModel"
 *   version: 1
 *   network:
 *     path: "assets/inception/tensorflow_inception_graph.onnx"
 *     inputName: "input"
 *     outputName: "softmax2_pre_activation"
 *   image:
 *     height: 224
 *     width: 224
 *     mean: 117.
 *     scale: 1.
 *     channelsLast: 1
 *     resizing: 1
 *   labels: [ "toaster", "not-toaster" ]
 *   classifier:
 *     weights: !!opencv-matrix   (K x D, float)
 *     biases: !!opencv-matrix    (1 x K, float)
 *
 * @file TrainedModel.cpp
 * @author Multi-Language AI System
 * @version 1.0.0
 */

#include "TrainedModel.hpp"
#include "InferenceEngine.hpp"
#include "Softmax.hpp"
#include "Errors.hpp"

#include <iostream>    // std::cout for progress
#include <stdexcept>   // std::invalid_argument
#include <utility>     // std::move

#include <opencv2/core.hpp>  // cv::FileStorage, cv::Mat

namespace {

const char* const kFormatName = "TransferLearning.TrainedModel";
const int kFormatVersion = 1;

} // namespace

// ============================================================================
// CONSTRUCTION
// ============================================================================

TrainedModel::TrainedModel(std::shared_ptr<const FeatureExtractor> extractor,
                           NetworkSettings network,
                           LabelMap labels,
                           MaxEntModel classifier)
    : extractor(std::move(extractor))
    , network(std::move(network))
    , labels(std::move(labels))
    , model(std::move(classifier))
{
    if (!this->extractor) {
        throw std::invalid_argument("TrainedModel needs a feature extractor");
    }
    if (this->labels.size() != model.numClasses()) {
        throw std::invalid_argument("Classifier has " + std::to_string(model.numClasses())
            + " classes but the label map has " + std::to_string(this->labels.size()));
    }
}

// ============================================================================
// TRANSFORM
// ============================================================================

ImagePrediction TrainedModel::transform(const ImageData& input) const {
    std::vector<float> pixelBuffer;
    return transform(input, pixelBuffer);
}

ImagePrediction TrainedModel::transform(const ImageData& input, std::vector<float>& pixelBuffer) const {
    std::vector<float> features = extractor->extractFromFile(input.imagePath, pixelBuffer);

    ImagePrediction prediction;
    prediction.imagePath = input.imagePath;
    prediction.label = input.label;
    prediction.score = model.predictProbabilities(features);

    // The decoded label is, by construction, the one at argmax(score)
    prediction.predictedLabelValue = labels.valueOf(Softmax::argMax(prediction.score));

    return prediction;
}

std::vector<ImagePrediction> TrainedModel::transform(const std::vector<ImageData>& inputs) const {
    std::vector<ImagePrediction> predictions;
    predictions.reserve(inputs.size());

    std::vector<float> pixelBuffer;
    for (const auto& input : inputs) {
        predictions.push_back(transform(input, pixelBuffer));
    }

    return predictions;
}

// ============================================================================
// SAVE
// ============================================================================

void TrainedModel::save(const std::string& path) const {
    cv::FileStorage fs(path, cv::FileStorage::WRITE);
    if (!fs.isOpened()) {
        throw IoError("Could not open model file for writing: " + path);
    }

    const ImageSettings& image = imageSettings();

    fs << "format" << kFormatName;
    fs << "version" << kFormatVersion;

    fs << "network" << "{"
       << "path" << extractor->source()
       << "inputName" << network.inputName
       << "outputName" << network.outputName
       << "}";

    fs << "image" << "{"
       << "height" << image.imageHeight
       << "width" << image.imageWidth
       << "mean" << image.mean
       << "scale" << image.scale
       << "channelsLast" << (image.channelsLast ? 1 : 0)
       << "resizing" << static_cast<int>(image.resizing)
       << "}";

    fs << "labels" << labels.labels();

    /**
     * cv::Mat header over the classifier's own memory - no copy.
     * The const_cast is safe: FileStorage only reads from it.
     */
    cv::Mat weights(model.numClasses(), model.numFeatures(), CV_32F,
                    const_cast<float*>(model.weights().data()));
    cv::Mat biases(1, model.numClasses(), CV_32F,
                   const_cast<float*>(model.biases().data()));

    fs << "classifier" << "{"
       << "weights" << weights
       << "biases" << biases
       << "}";

    fs.release();
    std::cout << "Model saved to " << path << std::endl;
}

// ============================================================================
// LOAD
// ============================================================================

namespace {

/** Everything read from a saved model file except the network itself */
struct SavedModel {
    std::string networkPath;
    NetworkSettings network;
    ImageSettings image;
    LabelMap labels;
    MaxEntModel classifier;
};

SavedModel readSavedModel(const std::string& path) {
    try {
        cv::FileStorage fs(path, cv::FileStorage::READ);
        if (!fs.isOpened()) {
            throw ModelLoadError("Could not open model file: " + path);
        }

        if (static_cast<std::string>(fs["format"]) != kFormatName) {
            throw ModelLoadError("Not a saved TransferLearning model: " + path);
        }
        if (static_cast<int>(fs["version"]) != kFormatVersion) {
            throw ModelLoadError("Unsupported model file version in " + path);
        }

        SavedModel saved;

        cv::FileNode networkNode = fs["network"];
        saved.networkPath = static_cast<std::string>(networkNode["path"]);
        saved.network.inputName = static_cast<std::string>(networkNode["inputName"]);
        saved.network.outputName = static_cast<std::string>(networkNode["outputName"]);

        cv::FileNode imageNode = fs["image"];
        saved.image.imageHeight = static_cast<int>(imageNode["height"]);
        saved.image.imageWidth = static_cast<int>(imageNode["width"]);
        saved.image.mean = static_cast<float>(imageNode["mean"]);
        saved.image.scale = static_cast<float>(imageNode["scale"]);
        saved.image.channelsLast = static_cast<int>(imageNode["channelsLast"]) != 0;

        const int resizing = static_cast<int>(imageNode["resizing"]);
        if (resizing < static_cast<int>(ResizingKind::Fill) || resizing > static_cast<int>(ResizingKind::IsoPad)) {
            throw ModelLoadError("Unknown resizing mode " + std::to_string(resizing) + " in " + path);
        }
        saved.image.resizing = static_cast<ResizingKind>(resizing);

        std::vector<std::string> labelValues;
        fs["labels"] >> labelValues;
        saved.labels = LabelMap::fromLabels(labelValues);

        cv::Mat weights;
        cv::Mat biases;
        fs["classifier"]["weights"] >> weights;
        fs["classifier"]["biases"] >> biases;

        if (weights.empty() || biases.empty()
            || weights.type() != CV_32F || biases.type() != CV_32F
            || weights.rows != saved.labels.size() || static_cast<int>(biases.total()) != weights.rows) {
            throw ModelLoadError("Classifier section of " + path + " is missing or inconsistent");
        }

        // FileStorage returns continuous matrices, so row-major data is contiguous
        std::vector<float> weightData(weights.ptr<float>(), weights.ptr<float>() + weights.total());
        std::vector<float> biasData(biases.ptr<float>(), biases.ptr<float>() + biases.total());

        saved.classifier = MaxEntModel(weights.rows, weights.cols,
                                       std::move(weightData), std::move(biasData));
        return saved;

    } catch (const cv::Exception& e) {
        // Malformed YAML/JSON/XML surfaces as a cv::Exception
        throw ModelLoadError("Could not parse model file " + path + ": " + e.what());
    }
}

/**
 * The extractor must see images exactly as the one the classifier was
 * trained on, and produce as many features as the classifier has inputs.
 */
void checkExtractor(const SavedModel& saved, const FeatureExtractor& extractor, const std::string& path) {
    const ImageSettings& image = extractor.imageSettings();
    if (image.imageHeight != saved.image.imageHeight || image.imageWidth != saved.image.imageWidth
        || image.mean != saved.image.mean || image.scale != saved.image.scale
        || image.channelsLast != saved.image.channelsLast || image.resizing != saved.image.resizing) {
        throw ModelLoadError("Image settings in " + path + " do not match the feature extractor");
    }

    const int length = extractor.getFeatureLength();
    if (length > 0 && length != saved.classifier.numFeatures()) {
        throw ModelLoadError("Feature extractor produces " + std::to_string(length)
            + " features but the saved classifier expects "
            + std::to_string(saved.classifier.numFeatures()));
    }
}

} // namespace

std::shared_ptr<const TrainedModel> TrainedModel::load(const std::string& path) {
    SavedModel saved = readSavedModel(path);

    auto engine = std::make_shared<InferenceEngine>();
    if (!engine->initialize(saved.networkPath, saved.network, saved.image)) {
        throw ModelLoadError("Could not load pretrained network: " + saved.networkPath);
    }
    checkExtractor(saved, *engine, path);

    return std::make_shared<const TrainedModel>(std::move(engine), saved.network,
                                                std::move(saved.labels), std::move(saved.classifier));
}

std::shared_ptr<const TrainedModel> TrainedModel::load(const std::string& path,
                                                       std::shared_ptr<const FeatureExtractor> extractor) {
    if (!extractor) {
        throw std::invalid_argument("TrainedModel::load needs a feature extractor");
    }

    SavedModel saved = readSavedModel(path);
    checkExtractor(saved, *extractor, path);

    return std::make_shared<const TrainedModel>(std::move(extractor), saved.network,
                                                std::move(saved.labels), std::move(saved.classifier));
}
