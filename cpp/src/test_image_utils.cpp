#include "ImageUtils.hpp"
#include "Errors.hpp"
#include "test_support.hpp"

#include <opencv2/core.hpp>

class ImageUtilsTest : public TempDirTest {};

TEST_F(ImageUtilsTest, LoadMissingImageThrows) {
    EXPECT_THROW(ImageUtils::loadImage(path("missing.jpg")), ImageLoadError);
}

TEST_F(ImageUtilsTest, LoadNonImageThrows) {
    writeText("not-an-image.jpg", "plain text");
    EXPECT_THROW(ImageUtils::loadImage(path("not-an-image.jpg")), ImageLoadError);
}

TEST(ImageResizeTest, AllModesProduceTargetSize) {
    cv::Mat image(12, 16, CV_8UC3, cv::Scalar(10, 20, 30));

    for (ResizingKind kind : {ResizingKind::Fill, ResizingKind::IsoCrop, ResizingKind::IsoPad}) {
        cv::Mat resized = ImageUtils::resizeImage(image, 8, 8, kind);
        EXPECT_EQ(resized.cols, 8);
        EXPECT_EQ(resized.rows, 8);
        EXPECT_EQ(resized.type(), CV_8UC3);
    }
}

TEST(ImageResizeTest, IsoCropKeepsCentre) {
    // Left half black, right half white; the centre column band is split
    cv::Mat image(10, 30, CV_8UC3, cv::Scalar(0, 0, 0));
    image(cv::Rect(0, 0, 10, 10)).setTo(cv::Scalar(255, 255, 255));   // cropped away
    image(cv::Rect(10, 0, 10, 10)).setTo(cv::Scalar(50, 50, 50));     // kept

    cv::Mat resized = ImageUtils::resizeImage(image, 10, 10, ResizingKind::IsoCrop);

    EXPECT_EQ(resized.at<cv::Vec3b>(5, 5)[0], 50);
    EXPECT_EQ(resized.at<cv::Vec3b>(0, 0)[0], 50);
}

TEST(ImageResizeTest, IsoPadFillsBlack) {
    cv::Mat image(10, 20, CV_8UC3, cv::Scalar(200, 200, 200));

    cv::Mat resized = ImageUtils::resizeImage(image, 20, 20, ResizingKind::IsoPad);

    EXPECT_EQ(resized.at<cv::Vec3b>(0, 10)[0], 0);     // padding
    EXPECT_EQ(resized.at<cv::Vec3b>(10, 10)[0], 200);  // image
}

TEST(ExtractPixelsTest, ConvertsBgrToRgbAndNormalizes) {
    cv::Mat image(2, 2, CV_8UC3, cv::Scalar(10, 20, 30));   // B=10 G=20 R=30

    ImageSettings settings;
    settings.imageHeight = 2;
    settings.imageWidth = 2;
    settings.mean = 10.0f;
    settings.scale = 0.5f;

    std::vector<float> tensor;
    ImageUtils::extractPixels(image, settings, tensor);

    ASSERT_EQ(tensor.size(), 12u);
    EXPECT_FLOAT_EQ(tensor[0], (30.0f - 10.0f) * 0.5f);   // R
    EXPECT_FLOAT_EQ(tensor[1], (20.0f - 10.0f) * 0.5f);   // G
    EXPECT_FLOAT_EQ(tensor[2], 0.0f);                      // B
}

TEST(ExtractPixelsTest, PlanarLayout) {
    cv::Mat image(1, 2, CV_8UC3, cv::Scalar(1, 2, 3));
    image.at<cv::Vec3b>(0, 1) = cv::Vec3b(4, 5, 6);

    ImageSettings settings;
    settings.imageHeight = 1;
    settings.imageWidth = 2;
    settings.mean = 0.0f;
    settings.channelsLast = false;

    std::vector<float> tensor;
    ImageUtils::extractPixels(image, settings, tensor);

    std::vector<float> expected{3, 6, 2, 5, 1, 4};   // RR GG BB
    EXPECT_EQ(tensor, expected);
}

TEST(ExtractPixelsTest, WrongSizeThrows) {
    cv::Mat image(3, 3, CV_8UC3, cv::Scalar(0, 0, 0));
    ImageSettings settings;   // 224x224

    std::vector<float> tensor;
    EXPECT_THROW(ImageUtils::extractPixels(image, settings, tensor), std::runtime_error);
}

TEST_F(ImageUtilsTest, LoadAndPreprocessDefaultSettings) {
    writeImage("red.png", kRed);

    std::vector<float> tensor = ImageUtils::loadAndPreprocessImage(path("red.png"), ImageSettings{});

    ASSERT_EQ(tensor.size(), 224u * 224u * 3u);
    EXPECT_FLOAT_EQ(tensor[0], 255.0f - 117.0f);
    EXPECT_FLOAT_EQ(tensor[1], -117.0f);
    EXPECT_FLOAT_EQ(tensor[2], -117.0f);
}
