/**
 * =============================================================================
 * PredictionEngine.hpp - Single-Image Predictions over a Trained Model
 * =============================================================================
 *
 * A PredictionEngine is a small stateful view over a shared, immutable
 * TrainedModel. It keeps scratch memory between calls, so predicting many
 * images one at a time does not reallocate the 224x224x3 pixel buffer.
 *
 * THREAD SAFETY:
 * A PredictionEngine is NOT safe to use from several threads at once (the
 * scratch buffer is shared between calls). Create one engine per thread;
 * all of them may share the same TrainedModel.
 *
 * ```cpp
 * std::shared_ptr<const TrainedModel> model = builder.fit(...);
 *
 * // thread 1                          // thread 2
 * PredictionEngine a(model);           PredictionEngine b(model);
 * a.predict(img1);                     b.predict(img2);
 * ```
 *
 * @file PredictionEngine.hpp
 * @author Multi-Language AI System
 * @version 1.0.0
 */

#pragma once

#include "ImageData.hpp"
#include "TrainedModel.hpp"

#include <memory>
#include <vector>

class PredictionEngine {
public:
    /**
     * @throws std::invalid_argument if model is null
     */
    explicit PredictionEngine(std::shared_ptr<const TrainedModel> model);

    /**
     * Score one image.
     *
     * @param input Record to classify; its label is copied through but not
     *              used, so it may be empty
     * @return Per-class scores and the decoded predicted label
     * @throws ImageLoadError if the image cannot be loaded
     */
    ImagePrediction predict(const ImageData& input);

private:
    std::shared_ptr<const TrainedModel> trainedModel;

    /** Reused between predict() calls */
    std::vector<float> pixelBuffer;
};
