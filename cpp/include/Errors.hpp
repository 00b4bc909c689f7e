/**
 * =============================================================================
 * Errors.hpp - Exception Types Raised by the Transfer Learning Pipeline
 * =============================================================================
 *
 * Every failure in the pipeline is fatal for the run: nothing is retried and
 * no record is skipped. The exception type tells the caller which stage
 * failed:
 *
 *   IoError              a file could not be opened or read
 *     ImageLoadError     an image file is missing or not decodable
 *   MalformedInputError  a tags file line does not have the expected fields
 *   ModelLoadError       the pretrained network (or a saved model) is unusable
 *   EmptyDatasetError    there is nothing to train on / evaluate
 *   UnseenLabelError     a label that was never seen during training
 *
 * All derive from std::runtime_error, so `catch (const std::exception&)`
 * in main() still reports them with e.what().
 *
 * @file Errors.hpp
 * @author Multi-Language AI System
 * @version 1.0.0
 */

#pragma once

#include <cstddef>    // std::size_t
#include <stdexcept>  // std::runtime_error
#include <string>

class IoError : public std::runtime_error {
public:
    explicit IoError(const std::string& message) : std::runtime_error(message) {}
};

class ImageLoadError : public IoError {
public:
    explicit ImageLoadError(const std::string& imagePath)
        : IoError("Failed to load image: " + imagePath), imagePath(imagePath) {}

    /** The path that could not be decoded */
    std::string imagePath;
};

/**
 * A tags file line with too few tab-separated fields.
 * Carries the file and the 1-based line number for the diagnostic.
 */
class MalformedInputError : public std::runtime_error {
public:
    MalformedInputError(const std::string& file, std::size_t line, const std::string& reason)
        : std::runtime_error(file + ":" + std::to_string(line) + ": " + reason)
        , file(file)
        , line(line) {}

    std::string file;
    std::size_t line;
};

class ModelLoadError : public std::runtime_error {
public:
    explicit ModelLoadError(const std::string& message) : std::runtime_error(message) {}
};

class EmptyDatasetError : public std::runtime_error {
public:
    explicit EmptyDatasetError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * A held-out record whose label has no class key.
 * The classifier can only score the classes it was trained on, so such a
 * record cannot be evaluated.
 */
class UnseenLabelError : public std::runtime_error {
public:
    explicit UnseenLabelError(const std::string& label)
        : std::runtime_error("Label was not seen during training: \"" + label + "\"")
        , label(label) {}

    std::string label;
};
