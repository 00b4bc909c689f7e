/**
 * =============================================================================
 * InferenceEngine.hpp - Pretrained Network Feature Extractor (ONNX Runtime)
 * =============================================================================
 *
 * This is a HEADER FILE - it declares the interface (what the class looks like)
 * without providing the implementation (how it works).
 *
 * InferenceEngine loads the pretrained Inception network and runs it up to
 * the penultimate layer. The output of that layer is not a classification;
 * it is a 1008-value summary of "what is in the picture" that a small
 * classifier can learn from. This is TRANSFER LEARNING: the expensive
 * network is reused as-is, only the last step is trained.
 *
 * @file InferenceEngine.hpp
 * @author Multi-Language AI System
 * @version 1.0.0
 */

#ifndef INFERENCE_ENGINE_HPP
#define INFERENCE_ENGINE_HPP

#include "FeatureExtractor.hpp"
#include "Settings.hpp"

#include <string>   // std::string for file paths
#include <vector>   // std::vector for tensors
#include <memory>   // std::unique_ptr for PIMPL pattern

/**
 * InferenceEngine - ONNX Runtime session scoring the pretrained network.
 *
 * DESIGN PATTERN: PIMPL (Pointer to Implementation)
 * -------------------------------------------------
 * Notice there's no ONNX Runtime include in this header.
 * All ONNX-specific code is hidden in the "Impl" struct (defined in .cpp),
 * so code that only builds or uses a TrainedModel never needs ONNX headers.
 *
 * THREAD SAFETY:
 * extract() is const and keeps no per-call state in the engine, and ONNX
 * Runtime allows concurrent Run() calls on one session.
 *
 * USAGE EXAMPLE:
 * ```cpp
 * InferenceEngine engine;
 * if (!engine.initialize("assets/inception/tensorflow_inception_graph.onnx")) {
 *     return 1;
 * }
 * auto pixels = ImageUtils::loadAndPreprocessImage("toaster.jpg", engine.imageSettings());
 * std::vector<float> features = engine.extract(pixels);   // 1008 values
 * ```
 */
class InferenceEngine : public FeatureExtractor {
public:
    /**
     * Creates an uninitialized engine. Call initialize() before extract().
     */
    InferenceEngine();

    /**
     * Declared here, defined in .cpp because unique_ptr<Impl> needs the
     * complete type of Impl to destroy it.
     */
    ~InferenceEngine() override;

    InferenceEngine(const InferenceEngine&) = delete;
    InferenceEngine& operator=(const InferenceEngine&) = delete;

    /**
     * Load the pretrained network.
     *
     * This:
     * 1. Checks that the model file exists
     * 2. Creates the ONNX Runtime session (CPU execution provider)
     * 3. Finds the input and the feature output by name
     * 4. Checks the input shape against the image settings
     *
     * @param modelPath Path to the .onnx file
     * @param network   Tensor names and session options
     * @param image     Geometry/normalization the network was trained with
     * @return true on success; on failure the reason is written to stderr
     *
     * @note The feature layer must be a graph OUTPUT of the ONNX file.
     *       ONNX Runtime cannot read intermediate tensors otherwise.
     */
    bool initialize(const std::string& modelPath,
                    const NetworkSettings& network = NetworkSettings{},
                    const ImageSettings& image = ImageSettings{});

    bool isInitialized() const;

    /**
     * Run the network on one preprocessed image.
     *
     * @param pixels imageHeight * imageWidth * 3 values from extractPixels()
     * @return Values of the configured output layer, batch dimension removed
     *
     * @throws std::runtime_error if not initialized, the input has the
     *         wrong size, or ONNX Runtime fails
     */
    std::vector<float> extract(const std::vector<float>& pixels) const override;

    const ImageSettings& imageSettings() const override;

    /** @return The model path passed to initialize() */
    std::string source() const override;

    /**
     * Length of the feature vector.
     * 0 while unknown: the output has dynamic dimensions and extract() has
     * not been called yet.
     */
    int getFeatureLength() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

#endif // INFERENCE_ENGINE_HPP
