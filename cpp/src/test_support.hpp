/**
 * test_support.hpp - Shared fixtures for the unit tests
 *
 * ColorMeanExtractor stands in for the Inception network: its "features"
 * are the mean R, G and B of the preprocessed image, which is enough to
 * separate solid-colored synthetic images.
 */

#pragma once

#include "FeatureExtractor.hpp"
#include "Settings.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

class ColorMeanExtractor : public FeatureExtractor {
public:
    explicit ColorMeanExtractor(int size = 8) {
        settings.imageHeight = size;
        settings.imageWidth = size;
        settings.mean = 0.0f;
        settings.scale = 1.0f / 255.0f;
        settings.channelsLast = true;
    }

    std::vector<float> extract(const std::vector<float>& pixels) const override {
        std::vector<float> features(3, 0.0f);
        for (size_t i = 0; i < pixels.size(); ++i) {
            features[i % 3] += pixels[i];
        }
        const float count = static_cast<float>(pixels.size() / 3);
        for (float& f : features) {
            f /= count;
        }
        return features;
    }

    const ImageSettings& imageSettings() const override { return settings; }

    std::string source() const override { return "color-mean"; }

    int getFeatureLength() const override { return 3; }

private:
    ImageSettings settings;
};

/**
 * A fresh directory under the system temp folder, removed at teardown.
 */
class TempDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = std::filesystem::temp_directory_path()
            / (std::string("transfer_learning_") + info->test_suite_name() + "_" + info->name());
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ignored;
        std::filesystem::remove_all(dir, ignored);
    }

    std::string path(const std::string& name) const {
        return (dir / name).string();
    }

    void writeText(const std::string& name, const std::string& contents) const {
        std::ofstream out(path(name), std::ios::binary);
        out << contents;
    }

    std::string readText(const std::string& name) const {
        std::ifstream in(path(name), std::ios::binary);
        std::ostringstream contents;
        contents << in.rdbuf();
        return contents.str();
    }

    /** Writes a solid BGR image; 16x12 so iso-crop has something to crop */
    void writeImage(const std::string& name, const cv::Scalar& bgr, int width = 16, int height = 12) const {
        cv::Mat image(height, width, CV_8UC3, bgr);
        ASSERT_TRUE(cv::imwrite(path(name), image));
    }

    std::filesystem::path dir;
};

const cv::Scalar kRed(0, 0, 255);
const cv::Scalar kBlue(255, 0, 0);
