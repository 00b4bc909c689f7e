/**
 * =============================================================================
 * TrainedModel.hpp - The Fitted Preprocessing + Classification Chain
 * =============================================================================
 *
 * A TrainedModel is what training produces and what every later step uses:
 *
 *   image path --load/resize/pixels--> pretrained network --features-->
 *   MaxEnt classifier --probabilities--> argmax --> label string
 *
 * IMMUTABILITY:
 * Once built, a TrainedModel never changes. It is handed around as
 * std::shared_ptr<const TrainedModel>, so the evaluator, any number of
 * PredictionEngines, and the caller can all hold the same instance.
 *
 * @file TrainedModel.hpp
 * @author Multi-Language AI System
 * @version 1.0.0
 */

#ifndef TRAINED_MODEL_HPP
#define TRAINED_MODEL_HPP

#include "FeatureExtractor.hpp"
#include "ImageData.hpp"
#include "LabelMap.hpp"
#include "MaxEntTrainer.hpp"
#include "Settings.hpp"

#include <memory>
#include <string>
#include <vector>

class TrainedModel {
public:
    /**
     * @param extractor  Pretrained network (shared, read-only)
     * @param network    Network settings, recorded for save()
     * @param labels     Class key <-> label encoding from training
     * @param classifier Fitted classifier, one class per label
     *
     * @throws std::invalid_argument if the pieces do not fit together
     */
    TrainedModel(std::shared_ptr<const FeatureExtractor> extractor,
                 NetworkSettings network,
                 LabelMap labels,
                 MaxEntModel classifier);

    /**
     * Apply the whole chain to one record.
     *
     * @return The record with score (one probability per class, by key)
     *         and predictedLabelValue (label of the highest score)
     * @throws ImageLoadError if the image cannot be loaded
     */
    ImagePrediction transform(const ImageData& input) const;

    /**
     * Same as transform(input), reusing the caller's pixel buffer.
     */
    ImagePrediction transform(const ImageData& input, std::vector<float>& pixelBuffer) const;

    /** Apply the chain to every record, in order */
    std::vector<ImagePrediction> transform(const std::vector<ImageData>& inputs) const;

    const LabelMap& labelMap() const { return labels; }
    const ImageSettings& imageSettings() const { return extractor->imageSettings(); }
    const NetworkSettings& networkSettings() const { return network; }

    // ========================================================================
    // PERSISTENCE
    // ========================================================================

    /**
     * Write the model with cv::FileStorage.
     *
     * The format follows the extension: ".yml"/".yaml" -> YAML,
     * ".json" -> JSON, ".xml" -> XML. The pretrained network itself is not
     * copied, only its path.
     *
     * @throws IoError if the file cannot be written
     */
    void save(const std::string& path) const;

    /**
     * Read a model written by save() and reopen the network file it
     * refers to.
     *
     * @throws ModelLoadError if the file is missing or invalid, or the
     *         network cannot be loaded
     */
    static std::shared_ptr<const TrainedModel> load(const std::string& path);

    /**
     * Read a model written by save(), using an already loaded extractor
     * instead of the recorded network path.
     *
     * @throws ModelLoadError if the file is missing or invalid, or the
     *         extractor's image settings or feature length differ from
     *         the saved ones
     */
    static std::shared_ptr<const TrainedModel> load(const std::string& path,
                                                    std::shared_ptr<const FeatureExtractor> extractor);

private:
    std::shared_ptr<const FeatureExtractor> extractor;
    NetworkSettings network;
    LabelMap labels;
    MaxEntModel model;
};

#endif // TRAINED_MODEL_HPP
