/**
 * =============================================================================
 * FeatureExtractor.hpp - Pixels -> Feature Vector Interface
 * =============================================================================
 *
 * The pipeline only needs one thing from the pretrained network: turn a
 * preprocessed pixel vector into a fixed-length feature vector. This
 * interface captures exactly that, so the pipeline does not depend on ONNX
 * Runtime directly (InferenceEngine is the production implementation).
 *
 * @file FeatureExtractor.hpp
 * @author Multi-Language AI System
 * @version 1.0.0
 */

#ifndef FEATURE_EXTRACTOR_HPP
#define FEATURE_EXTRACTOR_HPP

#include "Settings.hpp"

#include <string>
#include <vector>

class FeatureExtractor {
public:
    virtual ~FeatureExtractor() = default;

    /**
     * Score one preprocessed image.
     *
     * @param pixels Output of ImageUtils::extractPixels() for imageSettings()
     * @return Feature vector, always the same length for a given extractor
     */
    virtual std::vector<float> extract(const std::vector<float>& pixels) const = 0;

    /** Geometry and normalization the extractor expects its input in */
    virtual const ImageSettings& imageSettings() const = 0;

    /**
     * Where the extractor came from (the network file path), stored with a
     * saved model so it can be reopened. Empty if not file-backed.
     */
    virtual std::string source() const = 0;

    /**
     * Length of the vectors extract() returns, or 0 while unknown (for
     * example a network output with dynamic dimensions).
     */
    virtual int getFeatureLength() const = 0;

    /**
     * The whole image branch of the pipeline for one file:
     * load -> resize -> extract pixels -> extract().
     *
     * @param imagePath        Image to score
     * @param[out] pixelBuffer Scratch vector for the pixels; reusing it
     *                         between calls avoids one allocation per image
     * @return Feature vector
     *
     * @throws ImageLoadError if the image cannot be loaded
     */
    std::vector<float> extractFromFile(const std::string& imagePath,
                                       std::vector<float>& pixelBuffer) const;
};

#endif // FEATURE_EXTRACTOR_HPP
