/**
 * =============================================================================
 * ImageData.hpp - Input and Output Records of the Classification Pipeline
 * =============================================================================
 *
 * Two flat records flow through the pipeline:
 *
 *   ImageData        one line of a tags file: where the image is, what it is
 *   ImagePrediction  the same record after the trained model has scored it
 *
 * They are plain data holders. No behavior, no invariants enforced here -
 * the TrainedModel is responsible for producing consistent predictions.
 *
 * @file ImageData.hpp
 * @author Multi-Language AI System
 * @version 1.0.0
 */

#ifndef IMAGE_DATA_HPP
#define IMAGE_DATA_HPP

#include <string>   // std::string for paths and labels
#include <vector>   // std::vector for per-class scores

/**
 * One labeled (or unlabeled) image.
 */
struct ImageData {
    /** Full path of the image file (base folder joined with the file name) */
    std::string imagePath;

    /**
     * Class label, e.g. "toaster".
     * Empty for records read from unlabeled files.
     */
    std::string label;
};

/**
 * An ImageData after it went through the trained model.
 *
 * INHERITANCE:
 * ImagePrediction "is an" ImageData with two extra fields, so the original
 * path and label travel along with the prediction for display/evaluation.
 */
struct ImagePrediction : ImageData {
    /**
     * Confidence per known class, indexed by class key.
     * The order matches the label encoding built during training and the
     * values sum to 1.0 (softmax output).
     */
    std::vector<float> score;

    /** Label of the class with the highest score, decoded back to a string */
    std::string predictedLabelValue;
};

#endif // IMAGE_DATA_HPP
