#include "TensorCodec.hpp"
#include <opencv2/imgproc.hpp>
#include <stdexcept>
#include <tuple>

namespace faceAI {

namespace {

// Brings any supported input to 8-bit BGR
cv::Mat toBGR(const cv::Mat& region) {
    if (region.empty()) {
        throw std::invalid_argument("Cannot encode an empty image region");
    }
    if (region.depth() != CV_8U) {
        throw std::invalid_argument("Only 8-bit images can be encoded");
    }

    cv::Mat bgr;
    switch (region.channels()) {
        case 1:
            cv::cvtColor(region, bgr, cv::COLOR_GRAY2BGR);
            break;
        case 3:
            bgr = region;
            break;
        case 4:
            cv::cvtColor(region, bgr, cv::COLOR_BGRA2BGR);
            break;
        default:
            throw std::invalid_argument("Unsupported channel count for tensor encoding");
    }
    return bgr;
}

} // namespace

size_t CodecConfig::elementCount() const {
    size_t channels = layout == TensorLayout::RgbNormalized ? 3 : 1;
    return static_cast<size_t>(size.width) * static_cast<size_t>(size.height) * channels;
}

bool operator==(const CodecConfig& a, const CodecConfig& b) {
    return a.layout == b.layout && a.size == b.size;
}

bool operator<(const CodecConfig& a, const CodecConfig& b) {
    return std::make_tuple(static_cast<int>(a.layout), a.size.width, a.size.height) <
           std::make_tuple(static_cast<int>(b.layout), b.size.width, b.size.height);
}

CodecConfig rgbNormalized(int side) {
    return CodecConfig{TensorLayout::RgbNormalized, cv::Size(side, side)};
}

CodecConfig grayNormalized(int side) {
    return CodecConfig{TensorLayout::GrayNormalized, cv::Size(side, side)};
}

float normalizedLuma(unsigned char r, unsigned char g, unsigned char b) {
    return (0.299f * r + 0.587f * g + 0.114f * b) / 255.0f;
}

std::vector<float> encodeTensor(const cv::Mat& region, const CodecConfig& config) {
    if (config.size.width <= 0 || config.size.height <= 0) {
        throw std::invalid_argument("Tensor target size must be positive");
    }

    cv::Mat bgr = toBGR(region);

    // Stretch to the exact target size
    cv::Mat resized;
    if (bgr.size() == config.size) {
        resized = bgr;
    } else {
        cv::resize(bgr, resized, config.size, 0, 0, cv::INTER_LINEAR);
    }

    std::vector<float> tensor;
    tensor.reserve(config.elementCount());

    for (int y = 0; y < resized.rows; y++) {
        const cv::Vec3b* row = resized.ptr<cv::Vec3b>(y);
        for (int x = 0; x < resized.cols; x++) {
            const cv::Vec3b& px = row[x];
            unsigned char b = px[0];
            unsigned char g = px[1];
            unsigned char r = px[2];

            if (config.layout == TensorLayout::RgbNormalized) {
                tensor.push_back(r / 255.0f);
                tensor.push_back(g / 255.0f);
                tensor.push_back(b / 255.0f);
            } else {
                tensor.push_back(normalizedLuma(r, g, b));
            }
        }
    }

    return tensor;
}

} // namespace faceAI
