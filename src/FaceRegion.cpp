#include "FaceRegion.hpp"
#include <algorithm>
#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace faceAI {

namespace {

int64_t clampToRange(int64_t value, int64_t low, int64_t high) {
    return std::max(low, std::min(value, high));
}

} // namespace

BoundingBox paddedRegion(const cv::Size& imageSize, const BoundingBox& box, float padding) {
    // 64-bit so that caller supplied extremes cannot overflow before clamping
    const int64_t width = static_cast<int64_t>(box.right) - box.left;
    const int64_t pad = static_cast<int64_t>(static_cast<double>(width) * padding);

    BoundingBox region;
    region.left = static_cast<int>(clampToRange(box.left - pad, 0, imageSize.width));
    region.top = static_cast<int>(clampToRange(box.top - pad, 0, imageSize.height));
    region.right = static_cast<int>(clampToRange(box.right + pad, 0, imageSize.width));
    region.bottom = static_cast<int>(clampToRange(box.bottom + pad, 0, imageSize.height));
    return region;
}

void validateBox(const cv::Size& imageSize, const BoundingBox& box) {
    const int64_t width = static_cast<int64_t>(box.right) - box.left;
    const int64_t height = static_cast<int64_t>(box.bottom) - box.top;
    const int64_t maxExtent = std::numeric_limits<int>::max();

    bool empty = width <= 0 || height <= 0;
    bool tooLarge = width > maxExtent || height > maxExtent;
    bool outside = box.right <= 0 || box.bottom <= 0 ||
                   box.left >= imageSize.width || box.top >= imageSize.height;

    if (empty || tooLarge || outside) {
        std::ostringstream message;
        message << "Invalid face box {" << box.left << ", " << box.top << ", "
                << box.right << ", " << box.bottom << "} for image "
                << imageSize.width << "x" << imageSize.height;
        throw std::invalid_argument(message.str());
    }
}

} // namespace faceAI
