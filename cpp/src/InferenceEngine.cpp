/**
 * =============================================================================
 * InferenceEngine.cpp - ONNX-Based Pretrained Network Feature Extractor
 * =============================================================================
 *
 * This is the C++ implementation that runs the pretrained Inception network
 * using ONNX Runtime.
 *
 * ONNX RUNTIME OVERVIEW:
 * ----------------------
 * ONNX (Open Neural Network Exchange) is a standard format for ML models.
 * ONNX Runtime is a high-performance inference engine that can run ONNX models
 * on various hardware (CPU, GPU via CUDA/TensorRT, etc.).
 *
 * KEY CONCEPTS:
 * - Session: A loaded model ready for inference
 * - Tensor: Multi-dimensional array (the data structure neural networks use)
 * - ExecutionProvider: Backend that runs the computations (CPU, CUDA, etc.)
 *
 * FEATURE EXTRACTION PIPELINE:
 * 1. Receive preprocessed pixels (already resized and normalized)
 * 2. Wrap them in a tensor, adding a batch dimension: [1, 224, 224, 3]
 * 3. Run the network, asking only for "softmax2_pre_activation"
 * 4. Return that layer's values as the feature vector
 *
 * @file InferenceEngine.cpp
 * @author Multi-Language AI System
 * @version 1.0.0
 */

#include "InferenceEngine.hpp"

#include <iostream>    // std::cout, std::cerr for console output
#include <fstream>     // std::ifstream to check the model file exists
#include <sstream>     // std::ostringstream for shape strings
#include <stdexcept>   // std::runtime_error for exception handling

/**
 * ONNX Runtime C++ API header.
 * This provides C++ wrapper classes for the C API, making it safer and easier to use.
 */
#include <onnxruntime_cxx_api.h>

namespace {

std::string shapeToString(const std::vector<int64_t>& shape) {
    std::ostringstream out;
    out << "[";
    for (std::size_t i = 0; i < shape.size(); ++i) {
        out << shape[i];
        if (i + 1 < shape.size()) out << ", ";
    }
    out << "]";
    return out.str();
}

} // namespace

// ============================================================================
// PIMPL IMPLEMENTATION CLASS
// ============================================================================

/**
 * Private implementation structure for InferenceEngine.
 *
 * It's only visible in this .cpp file, not in the header, so users of
 * InferenceEngine never see (or need) the ONNX Runtime headers.
 */
struct InferenceEngine::Impl {
    // ========================================================================
    // CONFIGURATION STATE
    // ========================================================================

    /** Path to the loaded ONNX model file */
    std::string modelPath;

    /** Whether the engine is ready for inference */
    bool initialized = false;

    NetworkSettings network;
    ImageSettings image;

    /**
     * Shape of the input tensor we create for every image.
     * [1, H, W, 3] (channels last) or [1, 3, H, W]; without the leading 1
     * when the model has no batch dimension.
     */
    std::vector<int64_t> inputShape;

    /** Values per feature vector, 0 if the model leaves it dynamic */
    int featureLength = 0;

    // ========================================================================
    // ONNX RUNTIME OBJECTS
    // ========================================================================

    /**
     * ONNX Runtime Environment.
     *
     * The Env object holds global state for ONNX Runtime:
     * - Logging configuration
     * - Thread pools
     * - Memory allocators
     *
     * We initialize it with WARNING level logging to reduce noise.
     */
    Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "TransferLearning"};

    /**
     * ONNX Runtime Session - the loaded, optimized network.
     * Creating it is expensive, which is why we do it once and reuse.
     */
    std::unique_ptr<Ort::Session> session;

    /**
     * Memory information for creating input tensors.
     * Our pixel vectors live in plain CPU memory.
     */
    Ort::MemoryInfo memoryInfo = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

    // ========================================================================
    // HELPER METHODS
    // ========================================================================

    /**
     * Finds a graph input or output by name.
     *
     * @param names Names as reported by the session
     * @param wanted Name we are looking for
     * @return Index into names, or -1
     */
    static int indexOf(const std::vector<std::string>& names, const std::string& wanted) {
        for (std::size_t i = 0; i < names.size(); ++i) {
            if (names[i] == wanted) {
                return static_cast<int>(i);
            }
        }
        return -1;
    }

    std::vector<std::string> inputNames() const {
        Ort::AllocatorWithDefaultOptions allocator;
        std::vector<std::string> names;
        for (std::size_t i = 0; i < session->GetInputCount(); ++i) {
            names.emplace_back(session->GetInputNameAllocated(i, allocator).get());
        }
        return names;
    }

    std::vector<std::string> outputNames() const {
        Ort::AllocatorWithDefaultOptions allocator;
        std::vector<std::string> names;
        for (std::size_t i = 0; i < session->GetOutputCount(); ++i) {
            names.emplace_back(session->GetOutputNameAllocated(i, allocator).get());
        }
        return names;
    }

    /**
     * Builds inputShape from the model's declared input shape and checks it
     * against the image settings.
     *
     * Dimensions reported as -1 are dynamic and accept any size.
     *
     * @throws std::runtime_error if a fixed dimension disagrees
     */
    void resolveInputShape(const std::vector<int64_t>& modelShape) {
        const int64_t h = image.imageHeight;
        const int64_t w = image.imageWidth;
        const int64_t c = 3;

        std::vector<int64_t> imageShape = image.channelsLast
            ? std::vector<int64_t>{h, w, c}
            : std::vector<int64_t>{c, h, w};

        // Rank 4 means the model expects a batch dimension in front
        if (modelShape.size() == 4) {
            inputShape = {1};
            inputShape.insert(inputShape.end(), imageShape.begin(), imageShape.end());
        } else if (modelShape.size() == 3) {
            inputShape = imageShape;
        } else {
            throw std::runtime_error("Unsupported input rank " + std::to_string(modelShape.size())
                + " for input '" + network.inputName + "'");
        }

        for (std::size_t i = 0; i < modelShape.size(); ++i) {
            if (modelShape[i] > 0 && modelShape[i] != inputShape[i]) {
                throw std::runtime_error("Input '" + network.inputName + "' has shape "
                    + shapeToString(modelShape) + " but images are prepared as "
                    + shapeToString(inputShape));
            }
        }
    }
};

// ============================================================================
// CONSTRUCTOR & DESTRUCTOR
// ============================================================================

InferenceEngine::InferenceEngine() : pImpl(std::make_unique<Impl>()) {}

InferenceEngine::~InferenceEngine() = default;

// ============================================================================
// INITIALIZATION
// ============================================================================

bool InferenceEngine::initialize(const std::string& modelPath,
                                 const NetworkSettings& network,
                                 const ImageSettings& image) {
    try {
        pImpl->modelPath = modelPath;
        pImpl->network = network;
        pImpl->image = image;
        pImpl->initialized = false;

        /**
         * ONNX Runtime would fail on a missing file too, but with a much
         * less readable message.
         */
        std::ifstream modelFile(modelPath, std::ios::binary);
        if (!modelFile.good()) {
            std::cerr << "Pretrained network not found: " << modelPath << std::endl;
            return false;
        }
        modelFile.close();

        // ====================================================================
        // CREATE ONNX RUNTIME SESSION
        // ====================================================================

        Ort::SessionOptions sessionOptions;

        sessionOptions.SetIntraOpNumThreads(network.intraOpThreads);
        sessionOptions.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
        sessionOptions.SetExecutionMode(ExecutionMode::ORT_SEQUENTIAL);

        /**
         * Create the session - this loads and compiles the model.
         * This is the slow part - can take seconds for large models.
         */
        pImpl->session = std::make_unique<Ort::Session>(
            pImpl->env,
            modelPath.c_str(),
            sessionOptions
        );

        // ====================================================================
        // LOCATE INPUT AND FEATURE OUTPUT
        // ====================================================================

        std::vector<std::string> inputs = pImpl->inputNames();
        int inputIndex = Impl::indexOf(inputs, network.inputName);
        if (inputIndex < 0) {
            std::cerr << "Network has no input named '" << network.inputName << "'" << std::endl;
            return false;
        }

        std::vector<std::string> outputs = pImpl->outputNames();
        int outputIndex = Impl::indexOf(outputs, network.outputName);
        if (outputIndex < 0) {
            std::cerr << "Network has no output named '" << network.outputName << "'. Available outputs:";
            for (const auto& name : outputs) {
                std::cerr << " " << name;
            }
            std::cerr << std::endl;
            return false;
        }

        // ====================================================================
        // READ MODEL METADATA
        // ====================================================================

        auto inputInfo = pImpl->session->GetInputTypeInfo(inputIndex);
        pImpl->resolveInputShape(inputInfo.GetTensorTypeAndShapeInfo().GetShape());

        /**
         * Feature length = product of the output dimensions after the batch
         * dimension. Example: [1, 1008] -> 1008.
         */
        auto outputInfo = pImpl->session->GetOutputTypeInfo(outputIndex);
        auto outputShape = outputInfo.GetTensorTypeAndShapeInfo().GetShape();

        int64_t length = 1;
        for (std::size_t i = 1; i < outputShape.size(); ++i) {
            if (outputShape[i] <= 0) {
                length = 0;  // dynamic
                break;
            }
            length *= outputShape[i];
        }
        pImpl->featureLength = outputShape.size() >= 2 ? static_cast<int>(length) : 0;

        pImpl->initialized = true;

        std::cout << "Pretrained network loaded: " << modelPath << std::endl;
        std::cout << "Input '" << network.inputName << "': " << shapeToString(pImpl->inputShape) << std::endl;
        std::cout << "Feature layer '" << network.outputName << "': "
                  << shapeToString(outputShape) << std::endl;

        return true;

    } catch (const std::exception& e) {
        // Ort::Exception derives from std::exception
        std::cerr << "Failed to initialize engine: " << e.what() << std::endl;
        return false;
    }
}

bool InferenceEngine::isInitialized() const {
    return pImpl->initialized;
}

// ============================================================================
// FEATURE EXTRACTION
// ============================================================================

std::vector<float> InferenceEngine::extract(const std::vector<float>& pixels) const {
    if (!pImpl->initialized) {
        throw std::runtime_error("Engine not initialized. Call initialize() first.");
    }

    const std::size_t expected = static_cast<std::size_t>(pImpl->image.imageHeight)
                               * pImpl->image.imageWidth * 3;
    if (pixels.size() != expected) {
        throw std::runtime_error("Pixel vector has " + std::to_string(pixels.size())
            + " values, network expects " + std::to_string(expected));
    }

    // Make a mutable copy (CreateTensor needs a non-const pointer)
    std::vector<float> inputData = pixels;

    /**
     * IMPORTANT: CreateTensor doesn't copy the data! The tensor references
     * inputData, which must stay alive until after Run() completes.
     */
    Ort::Value inputOrt = Ort::Value::CreateTensor<float>(
        pImpl->memoryInfo,
        inputData.data(),
        inputData.size(),
        pImpl->inputShape.data(),
        pImpl->inputShape.size()
    );

    const char* inputNames[] = {pImpl->network.inputName.c_str()};
    const char* outputNames[] = {pImpl->network.outputName.c_str()};

    try {
        /**
         * Only the requested output is computed: layers after
         * softmax2_pre_activation (the original 1000-way softmax) are skipped.
         */
        auto outputTensors = pImpl->session->Run(
            Ort::RunOptions{nullptr},
            inputNames, &inputOrt, 1,
            outputNames, 1
        );

        const float* outputData = outputTensors[0].GetTensorData<float>();
        std::size_t outputSize = outputTensors[0].GetTensorTypeAndShapeInfo().GetElementCount();

        return std::vector<float>(outputData, outputData + outputSize);

    } catch (const Ort::Exception& e) {
        throw std::runtime_error(std::string("Feature extraction failed: ") + e.what());
    }
}

// ============================================================================
// ACCESSOR METHODS
// ============================================================================

const ImageSettings& InferenceEngine::imageSettings() const {
    return pImpl->image;
}

std::string InferenceEngine::source() const {
    return pImpl->modelPath;
}

int InferenceEngine::getFeatureLength() const {
    return pImpl->featureLength;
}
