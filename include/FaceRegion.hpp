#pragma once

#include "FaceTypes.hpp"
#include <opencv2/core.hpp>

namespace faceAI {

// Padding applied around a face before attribute prediction
constexpr float kAttributePadding = 0.2f;
// Padding applied around a face when drawing annotations
constexpr float kAnnotationPadding = 0.1f;

// Expands the box by padding * box.width on every side and clamps the result
// to [0, width] x [0, height]
BoundingBox paddedRegion(const cv::Size& imageSize, const BoundingBox& box, float padding);

// Rejects boxes that are empty, lie entirely outside the image, or whose
// width or height does not fit in an int.
// Throws std::invalid_argument.
void validateBox(const cv::Size& imageSize, const BoundingBox& box);

} // namespace faceAI
