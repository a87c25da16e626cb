#pragma once

#include <vector>
#include <opencv2/core.hpp>
#include "FaceTypes.hpp"

namespace faceAI {

// max(2, 0.005 * min(width, height)), rounded to whole pixels
int annotationStrokeWidth(const cv::Size& imageSize);

// Draws a padded rectangle and a "#N" label for each face onto a copy of the
// image. With no faces the input is returned as is.
cv::Mat annotateFaces(const cv::Mat& image, const std::vector<BoundingBox>& faces);

} // namespace faceAI
