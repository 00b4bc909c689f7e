/**
 * =============================================================================
 * ImageUtils.hpp - Image Loading and Preprocessing Utilities
 * =============================================================================
 *
 * This file provides the first three steps of the classification pipeline:
 * loading an image from disk, bringing it to the network's fixed size, and
 * turning it into the numeric vector the network consumes.
 *
 * IMAGE PREPROCESSING FOR NEURAL NETWORKS:
 * ----------------------------------------
 * Neural networks expect input in a very specific format:
 *
 * 1. SIZE: Images must be a fixed size (224x224 for Inception)
 *    - The network's weights were learned for that size
 *    - By default we scale uniformly and crop the center ("iso-crop"),
 *      so objects are not stretched
 *
 * 2. NORMALIZATION: Pixel values must be shifted/scaled
 *    - Raw pixels are 0-255 (uint8)
 *    - Inception expects (pixel - 117) * 1 as float32
 *
 * 3. FORMAT: Specific tensor layout
 *    - TensorFlow networks expect HWC ("channels last", interleaved)
 *    - PyTorch networks expect CHW (planar)
 *    - ImageSettings::channelsLast selects the layout
 *
 * COLOR CHANNEL ORDER:
 * - OpenCV loads images as BGR (Blue, Green, Red) - for historical reasons
 * - Neural networks expect RGB (Red, Green, Blue)
 * - extractPixels() swaps channels while copying
 *
 * @file ImageUtils.hpp
 * @author Multi-Language AI System
 * @version 1.0.0
 */

#pragma once

#include "Settings.hpp"

#include <string>
#include <vector>

#include <opencv2/core.hpp>  // cv::Mat - OpenCV's image container

/**
 * Namespace for image processing utilities.
 */
namespace ImageUtils {

/**
 * Load an image file as an 8-bit, 3-channel BGR matrix.
 *
 * Grayscale files are expanded to 3 channels and alpha channels are dropped,
 * so every image that loads has the same pixel type.
 *
 * @param imagePath Path to the image file (JPEG, PNG, BMP, ...)
 * @return BGR image (CV_8UC3)
 *
 * @throws ImageLoadError if the file is missing or cannot be decoded
 */
cv::Mat loadImage(const std::string& imagePath);

/**
 * Resize an image to exactly targetWidth x targetHeight.
 *
 * @param image        Source image
 * @param targetWidth  Output width in pixels
 * @param targetHeight Output height in pixels
 * @param kind         Fill, IsoCrop (default) or IsoPad - see ResizingKind
 * @return Resized image, same type as the input
 *
 * @example
 * // 400x200 image, IsoCrop to 224x224:
 * //   scale = max(224/400, 224/200) = 1.12  -> 448x224
 * //   crop the central 224x224 window
 */
cv::Mat resizeImage(const cv::Mat& image,
                    int targetWidth,
                    int targetHeight,
                    ResizingKind kind = ResizingKind::IsoCrop);

/**
 * Convert a BGR image into the network's input vector.
 *
 * Each output value is (channel_value - settings.mean) * settings.scale,
 * channels in R, G, B order, laid out HWC or CHW per settings.channelsLast.
 *
 * @param image         BGR image (CV_8UC3) already at the target size
 * @param settings      Geometry and normalization
 * @param[out] tensor   Resized to height * width * 3 and filled
 *                      (passing the same vector again reuses its memory)
 *
 * @throws std::runtime_error if the image type or size does not match
 */
void extractPixels(const cv::Mat& image,
                   const ImageSettings& settings,
                   std::vector<float>& tensor);

/**
 * Load an image and preprocess it for the network.
 *
 * This function combines the three steps into one call:
 * 1. Load image from file
 * 2. Resize to settings.imageWidth x settings.imageHeight
 * 3. Extract normalized RGB pixels
 *
 * @param imagePath Path to the image file
 * @param settings  Geometry and normalization
 * @return Preprocessed tensor as flat vector of floats
 *         Size: imageWidth x imageHeight x 3
 *
 * @throws ImageLoadError if image cannot be loaded
 *
 * @example
 * auto tensor = ImageUtils::loadAndPreprocessImage("toaster.jpg", ImageSettings{});
 * // tensor.size() == 224 * 224 * 3 == 150528
 */
std::vector<float> loadAndPreprocessImage(const std::string& imagePath,
                                          const ImageSettings& settings);

} // namespace ImageUtils
