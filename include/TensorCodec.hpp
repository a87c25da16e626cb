#pragma once

#include <vector>
#include <opencv2/core.hpp>

namespace faceAI {

enum class TensorLayout {
    RgbNormalized,   // H x W x 3, R,G,B order, value / 255
    GrayNormalized   // H x W x 1, luma / 255
};

struct CodecConfig {
    TensorLayout layout = TensorLayout::RgbNormalized;
    cv::Size size;

    size_t elementCount() const;
};

bool operator==(const CodecConfig& a, const CodecConfig& b);
bool operator<(const CodecConfig& a, const CodecConfig& b);

// Side of the square RGB input used by the gender and age models
constexpr int kRgbInputSize = 224;
// Side of the square grayscale input used by the emotion model
constexpr int kGrayInputSize = 48;

CodecConfig rgbNormalized(int side = kRgbInputSize);
CodecConfig grayNormalized(int side = kGrayInputSize);

// ITU-R BT.601 luma of an 8-bit RGB triple, scaled to [0, 1]
float normalizedLuma(unsigned char r, unsigned char g, unsigned char b);

// Converts an 8-bit BGR/BGRA/gray region into the flat float buffer the
// config describes. The region is stretched to the target size without
// preserving aspect ratio. Throws std::invalid_argument for an empty or
// unsupported image.
std::vector<float> encodeTensor(const cv::Mat& region, const CodecConfig& config);

} // namespace faceAI
