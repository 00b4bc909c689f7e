/**
 * @file FeatureExtractor.cpp
 * @author Multi-Language AI System
 * @version 1.0.0
 */

#include "FeatureExtractor.hpp"
#include "ImageUtils.hpp"

std::vector<float> FeatureExtractor::extractFromFile(const std::string& imagePath,
                                                     std::vector<float>& pixelBuffer) const {
    const ImageSettings& settings = imageSettings();

    cv::Mat image = ImageUtils::loadImage(imagePath);
    cv::Mat resized = ImageUtils::resizeImage(image, settings.imageWidth, settings.imageHeight,
                                              settings.resizing);
    ImageUtils::extractPixels(resized, settings, pixelBuffer);

    return extract(pixelBuffer);
}
