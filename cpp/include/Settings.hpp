/**
 * =============================================================================
 * Settings.hpp - Fixed Configuration of the Transfer Learning Sample
 * =============================================================================
 *
 * The pretrained Inception network was trained on images of a specific size
 * and with a specific pixel normalization. We must feed it the same format,
 * so these values are configuration, not data: set once, read-only.
 *
 * INCEPTION INPUT FORMAT:
 * - 224 x 224 pixels
 * - RGB, interleaved (HWC / "channels last"): [R0,G0,B0, R1,G1,B1, ...]
 * - Each value is (pixel - 117) * 1, i.e. roughly centered on zero
 * - A batch dimension in front: [1, 224, 224, 3]
 *
 * @file Settings.hpp
 * @author Multi-Language AI System
 * @version 1.0.0
 */

#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <string>

/**
 * How an image is brought to the network's fixed geometry.
 *
 * - Fill:    stretch to width x height (aspect ratio is lost)
 * - IsoCrop: scale uniformly until the image covers the target, then crop
 *            the overflow around the center (default)
 * - IsoPad:  scale uniformly until the image fits inside the target, then
 *            pad the border with black
 */
enum class ResizingKind {
    Fill,
    IsoCrop,
    IsoPad
};

/**
 * Image geometry and pixel normalization expected by the network.
 */
struct ImageSettings {
    int imageHeight = 224;
    int imageWidth = 224;

    /** Offset subtracted from every 0-255 channel value */
    float mean = 117.0f;

    /** Multiplier applied after the offset */
    float scale = 1.0f;

    /**
     * true  -> interleaved HWC layout (TensorFlow models)
     * false -> planar CHW layout (PyTorch models)
     */
    bool channelsLast = true;

    ResizingKind resizing = ResizingKind::IsoCrop;
};

/**
 * Names of the tensors we read from / write to in the ONNX graph.
 *
 * The output is NOT the final softmax of the network: we stop one layer
 * earlier and use the pre-activation values as a generic feature vector.
 * The ONNX export must list this layer among the graph outputs.
 */
struct NetworkSettings {
    std::string inputName = "input";
    std::string outputName = "softmax2_pre_activation";

    int intraOpThreads = 4;
};

/**
 * Options of the maximum entropy (multinomial logistic regression) trainer.
 */
struct TrainerOptions {
    /** Weight of the 0.5 * ||W||^2 penalty (biases are not penalized) */
    float l2Regularization = 1.0f;

    /** Stop when one L-BFGS iteration lowers the loss by less than this value */
    float optimizationTolerance = 1e-7f;

    /** Number of (s, y) correction pairs kept by L-BFGS */
    int historySize = 20;

    int maximumIterations = 1000;
};

/**
 * Fixed layout of the sample's asset folder.
 *
 *   <root>/images/                 image files
 *   <root>/images/tags.tsv         training set
 *   <root>/images/test-tags.tsv    held-out set
 *   <root>/images/toaster3.jpg     single image to classify
 *   <root>/inception/...onnx       pretrained network
 */
struct AssetPaths {
    std::string assetsRoot;
    std::string imagesFolder;
    std::string trainTagsTsv;
    std::string testTagsTsv;
    std::string predictSingleImage;
    std::string inceptionModel;

    static AssetPaths fromRoot(const std::string& root);
};

#endif // SETTINGS_HPP
