#include <gtest/gtest.h>
#include <stdexcept>
#include <opencv2/core.hpp>
#include "TensorCodec.hpp"

using namespace faceAI;

TEST(TensorCodecTest, BlackRgbImageEncodesToZeros) {
    cv::Mat black(kRgbInputSize, kRgbInputSize, CV_8UC3, cv::Scalar(0, 0, 0));
    auto tensor = encodeTensor(black, rgbNormalized());

    ASSERT_EQ(tensor.size(), static_cast<size_t>(3 * kRgbInputSize * kRgbInputSize));
    for (float value : tensor) {
        ASSERT_EQ(value, 0.0f);
    }
}

TEST(TensorCodecTest, WhiteRgbImageEncodesToOnes) {
    cv::Mat white(kRgbInputSize, kRgbInputSize, CV_8UC3, cv::Scalar(255, 255, 255));
    auto tensor = encodeTensor(white, rgbNormalized());

    ASSERT_EQ(tensor.size(), static_cast<size_t>(3 * kRgbInputSize * kRgbInputSize));
    for (float value : tensor) {
        ASSERT_FLOAT_EQ(value, 1.0f);
    }
}

TEST(TensorCodecTest, RgbChannelsAreEmittedInRgbOrder) {
    // OpenCV stores BGR: this is pure blue
    cv::Mat blue(4, 4, CV_8UC3, cv::Scalar(255, 0, 0));
    auto tensor = encodeTensor(blue, rgbNormalized(4));

    ASSERT_EQ(tensor.size(), 48u);
    for (size_t i = 0; i < tensor.size(); i += 3) {
        EXPECT_FLOAT_EQ(tensor[i], 0.0f);
        EXPECT_FLOAT_EQ(tensor[i + 1], 0.0f);
        EXPECT_FLOAT_EQ(tensor[i + 2], 1.0f);
    }
}

TEST(TensorCodecTest, RgbValuesAreDividedBy255) {
    cv::Mat pixel(1, 1, CV_8UC3, cv::Scalar(51, 102, 204));  // B, G, R
    auto tensor = encodeTensor(pixel, rgbNormalized(1));

    ASSERT_EQ(tensor.size(), 3u);
    EXPECT_FLOAT_EQ(tensor[0], 204.0f / 255.0f);
    EXPECT_FLOAT_EQ(tensor[1], 102.0f / 255.0f);
    EXPECT_FLOAT_EQ(tensor[2], 51.0f / 255.0f);
}

TEST(TensorCodecTest, RegionIsStretchedToTargetSize) {
    cv::Mat wide(10, 37, CV_8UC3, cv::Scalar(0, 0, 255));
    auto tensor = encodeTensor(wide, rgbNormalized());

    ASSERT_EQ(tensor.size(), rgbNormalized().elementCount());
    // A uniform region stays uniform after a bilinear stretch
    EXPECT_FLOAT_EQ(tensor.front(), 1.0f);
    EXPECT_FLOAT_EQ(tensor[1], 0.0f);
    EXPECT_FLOAT_EQ(tensor[tensor.size() - 3], 1.0f);
}

TEST(TensorCodecTest, LumaOfPureRed) {
    EXPECT_NEAR(normalizedLuma(255, 0, 0), 0.299f, 1e-5f);
}

TEST(TensorCodecTest, LumaOfPureWhite) {
    EXPECT_NEAR(normalizedLuma(255, 255, 255), 1.0f, 1e-5f);
}

TEST(TensorCodecTest, LumaWeightsDifferFromChannelAverage) {
    EXPECT_NEAR(normalizedLuma(0, 255, 0), 0.587f, 1e-5f);
    EXPECT_NEAR(normalizedLuma(0, 0, 255), 0.114f, 1e-5f);
}

TEST(TensorCodecTest, GrayscaleTensorOfRedRegion) {
    cv::Mat red(90, 60, CV_8UC3, cv::Scalar(0, 0, 255));
    auto tensor = encodeTensor(red, grayNormalized());

    ASSERT_EQ(tensor.size(), 2304u);
    for (float value : tensor) {
        ASSERT_NEAR(value, 0.299f, 1e-5f);
    }
}

TEST(TensorCodecTest, GrayscaleTensorOfWhiteRegion) {
    cv::Mat white(48, 48, CV_8UC3, cv::Scalar(255, 255, 255));
    auto tensor = encodeTensor(white, grayNormalized());

    ASSERT_EQ(tensor.size(), 2304u);
    for (float value : tensor) {
        ASSERT_NEAR(value, 1.0f, 1e-5f);
    }
}

TEST(TensorCodecTest, AlphaChannelIsIgnored) {
    cv::Mat bgra(8, 8, CV_8UC4, cv::Scalar(0, 0, 255, 0));
    auto tensor = encodeTensor(bgra, rgbNormalized(8));

    ASSERT_EQ(tensor.size(), 8u * 8u * 3u);
    EXPECT_FLOAT_EQ(tensor[0], 1.0f);
    EXPECT_FLOAT_EQ(tensor[1], 0.0f);
    EXPECT_FLOAT_EQ(tensor[2], 0.0f);
}

TEST(TensorCodecTest, SingleChannelInputIsReplicated) {
    cv::Mat gray(8, 8, CV_8UC1, cv::Scalar(255));
    auto tensor = encodeTensor(gray, grayNormalized(8));

    ASSERT_EQ(tensor.size(), 64u);
    EXPECT_NEAR(tensor[0], 1.0f, 1e-5f);
}

TEST(TensorCodecTest, RejectsEmptyAndNon8BitImages) {
    EXPECT_THROW(encodeTensor(cv::Mat(), rgbNormalized()), std::invalid_argument);

    cv::Mat floats(4, 4, CV_32FC3, cv::Scalar(0.5, 0.5, 0.5));
    EXPECT_THROW(encodeTensor(floats, rgbNormalized()), std::invalid_argument);
}

TEST(TensorCodecTest, ElementCountMatchesLayout) {
    EXPECT_EQ(rgbNormalized().elementCount(), 150528u);
    EXPECT_EQ(grayNormalized().elementCount(), 2304u);
    EXPECT_FALSE(rgbNormalized() == grayNormalized());
}
