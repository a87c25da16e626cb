#include "AnnotationRenderer.hpp"
#include "FaceRegion.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <string>

namespace faceAI {

namespace {

const cv::Scalar kBoxColor(0, 255, 0, 255);    // green, BGR(A)
const cv::Scalar kLabelColor(255, 0, 0, 255);  // blue, BGR(A)

} // namespace

int annotationStrokeWidth(const cv::Size& imageSize) {
    double scaled = 0.005 * std::min(imageSize.width, imageSize.height);
    return std::max(2, cvRound(scaled));
}

cv::Mat annotateFaces(const cv::Mat& image, const std::vector<BoundingBox>& faces) {
    if (faces.empty() || image.empty()) {
        return image;
    }

    cv::Mat annotated;
    if (image.channels() == 1) {
        cv::cvtColor(image, annotated, cv::COLOR_GRAY2BGR);
    } else {
        annotated = image.clone();
    }

    const int stroke = annotationStrokeWidth(annotated.size());
    const int fontFace = cv::FONT_HERSHEY_SIMPLEX;
    const int textHeight = stroke * 12;
    const double fontScale = cv::getFontScaleFromHeight(fontFace, textHeight, stroke);

    for (size_t i = 0; i < faces.size(); i++) {
        BoundingBox region = paddedRegion(annotated.size(), faces[i], kAnnotationPadding);
        cv::rectangle(annotated, region.toRect(), kBoxColor, stroke, cv::LINE_8);

        // Label sits above the box, pushed down only if it would leave the image
        std::string label = "#" + std::to_string(i + 1);
        int baselineY = std::max(region.top - stroke * 2, textHeight);
        cv::putText(annotated, label, cv::Point(region.left, baselineY),
                    fontFace, fontScale, kLabelColor, stroke, cv::LINE_AA);
    }

    return annotated;
}

} // namespace faceAI
