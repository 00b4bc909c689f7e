/**
 * =============================================================================
 * ImageUtils.cpp - Image Loading and Preprocessing Implementation
 * =============================================================================
 *
 * This file implements image loading and preprocessing with OpenCV.
 *
 * OPENCV OVERVIEW:
 * ----------------
 * OpenCV (Open Source Computer Vision Library) is the most widely used
 * library for image processing. It provides:
 * - Image I/O (JPEG, PNG, BMP, etc.)
 * - Image transformations (resize, crop, border padding)
 * - Color space conversions (BGR<->RGB, etc.)
 *
 * OPENCV QUIRK - BGR vs RGB:
 * For historical reasons (Windows bitmap format), OpenCV stores images
 * in BGR format (Blue, Green, Red) instead of the more common RGB.
 * Neural networks expect RGB, so we must convert.
 *
 * @file ImageUtils.cpp
 * @author Multi-Language AI System
 * @version 1.0.0
 */

#include "ImageUtils.hpp"    // Our header file
#include "Errors.hpp"        // ImageLoadError

#include <algorithm>         // std::max, std::min
#include <cmath>             // std::ceil, std::floor
#include <stdexcept>         // std::runtime_error

#include <opencv2/imgcodecs.hpp>  // cv::imread
#include <opencv2/imgproc.hpp>    // cv::resize, cv::copyMakeBorder

namespace ImageUtils {

cv::Mat loadImage(const std::string& imagePath) {
    /**
     * cv::imread loads an image from file into a cv::Mat.
     *
     * IMREAD_COLOR always yields 3 channels (BGR), whatever the file holds.
     * If loading fails (missing file, unknown format), imread returns an
     * empty Mat instead of throwing.
     */
    cv::Mat img = cv::imread(imagePath, cv::IMREAD_COLOR);

    if (img.empty()) {
        throw ImageLoadError(imagePath);
    }

    return img;
}

cv::Mat resizeImage(const cv::Mat& image, int targetWidth, int targetHeight, ResizingKind kind) {
    if (targetWidth <= 0 || targetHeight <= 0) {
        throw std::runtime_error("Invalid target size for resize");
    }

    cv::Mat resized;

    // -------------------------------------------------------------------------
    // FILL: stretch both axes independently
    // -------------------------------------------------------------------------
    if (kind == ResizingKind::Fill) {
        /**
         * INTERPOLATION METHODS:
         * - INTER_NEAREST: Fastest, lowest quality (blocky)
         * - INTER_LINEAR: Good balance of speed and quality (bilinear)
         * - INTER_CUBIC: Higher quality, slower
         *
         * We use INTER_LINEAR as a good trade-off.
         */
        cv::resize(image, resized, cv::Size(targetWidth, targetHeight), 0, 0, cv::INTER_LINEAR);
        return resized;
    }

    const double scaleX = static_cast<double>(targetWidth) / image.cols;
    const double scaleY = static_cast<double>(targetHeight) / image.rows;

    // -------------------------------------------------------------------------
    // ISO-CROP: cover the target, then cut the center window
    // -------------------------------------------------------------------------
    if (kind == ResizingKind::IsoCrop) {
        const double scale = std::max(scaleX, scaleY);

        // ceil() so rounding never leaves us a pixel short of the target
        int scaledWidth = std::max(targetWidth, static_cast<int>(std::ceil(image.cols * scale)));
        int scaledHeight = std::max(targetHeight, static_cast<int>(std::ceil(image.rows * scale)));

        cv::resize(image, resized, cv::Size(scaledWidth, scaledHeight), 0, 0, cv::INTER_LINEAR);

        int x = (scaledWidth - targetWidth) / 2;
        int y = (scaledHeight - targetHeight) / 2;

        // ROI shares memory with 'resized'; clone() gives a compact copy
        return resized(cv::Rect(x, y, targetWidth, targetHeight)).clone();
    }

    // -------------------------------------------------------------------------
    // ISO-PAD: fit inside the target, then pad with black
    // -------------------------------------------------------------------------
    const double scale = std::min(scaleX, scaleY);

    int scaledWidth = std::min(targetWidth, std::max(1, static_cast<int>(std::floor(image.cols * scale))));
    int scaledHeight = std::min(targetHeight, std::max(1, static_cast<int>(std::floor(image.rows * scale))));

    cv::resize(image, resized, cv::Size(scaledWidth, scaledHeight), 0, 0, cv::INTER_LINEAR);

    int left = (targetWidth - scaledWidth) / 2;
    int top = (targetHeight - scaledHeight) / 2;

    cv::Mat padded;
    cv::copyMakeBorder(resized, padded,
                       top, targetHeight - scaledHeight - top,
                       left, targetWidth - scaledWidth - left,
                       cv::BORDER_CONSTANT, cv::Scalar(0, 0, 0));
    return padded;
}

void extractPixels(const cv::Mat& image, const ImageSettings& settings, std::vector<float>& tensor) {
    if (image.type() != CV_8UC3) {
        throw std::runtime_error("extractPixels expects an 8-bit 3-channel image");
    }
    if (image.cols != settings.imageWidth || image.rows != settings.imageHeight) {
        throw std::runtime_error("extractPixels: image is "
            + std::to_string(image.cols) + "x" + std::to_string(image.rows)
            + ", expected " + std::to_string(settings.imageWidth) + "x"
            + std::to_string(settings.imageHeight));
    }

    const int height = settings.imageHeight;
    const int width = settings.imageWidth;
    const int channels = 3;

    tensor.resize(static_cast<std::size_t>(channels) * height * width);

    /**
     * FORMAT CONVERSION
     *
     * cv::Mat stores BGR, interleaved:  [B0,G0,R0, B1,G1,R1, ...]
     *
     * HWC output (channelsLast):        [R0,G0,B0, R1,G1,B1, ...]
     * CHW output (planar):              [R0,R1,..., G0,G1,..., B0,B1,...]
     *
     * Output channel c (0=R, 1=G, 2=B) comes from source channel 2 - c.
     */
    for (int h = 0; h < height; ++h) {
        // Row pointer: rows may be padded, so never assume h * width * 3
        const uchar* row = image.ptr<uchar>(h);

        for (int w = 0; w < width; ++w) {
            for (int c = 0; c < channels; ++c) {
                float pixel = static_cast<float>(row[w * channels + (channels - 1 - c)]);

                std::size_t dstIdx = settings.channelsLast
                    ? (static_cast<std::size_t>(h) * width + w) * channels + c
                    : static_cast<std::size_t>(c) * height * width + static_cast<std::size_t>(h) * width + w;

                tensor[dstIdx] = (pixel - settings.mean) * settings.scale;
            }
        }
    }
}

std::vector<float> loadAndPreprocessImage(const std::string& imagePath, const ImageSettings& settings) {
    cv::Mat img = loadImage(imagePath);
    cv::Mat resized = resizeImage(img, settings.imageWidth, settings.imageHeight, settings.resizing);

    std::vector<float> tensor;
    extractPixels(resized, settings, tensor);
    return tensor;
}

} // namespace ImageUtils
