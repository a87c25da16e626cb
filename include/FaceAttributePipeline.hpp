#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <vector>
#include <opencv2/core.hpp>
#include "AttributeClassifiers.hpp"
#include "FaceDetector.hpp"
#include "FaceTypes.hpp"
#include "ModelContext.hpp"

namespace faceAI {

struct PipelineOptions {
    // Upper bound on the wait for the external detector
    std::chrono::milliseconds detectionTimeout{5000};
    // Run independent faces concurrently; the models must allow concurrent runs
    bool parallelFaces = false;
    // Log each prediction to stdout
    bool verbose = false;
};

// Predicts gender, age and mood for every face in an image
class FaceAttributePipeline {
public:
    // Throws InferenceError if a model's input size does not match the
    // tensor layout its classifier produces
    explicit FaceAttributePipeline(std::shared_ptr<const ModelContext> models,
                                   PipelineOptions options = PipelineOptions());

    // Attributes of one face. The box must already be valid for the image.
    AttributeResult predictAttributes(const cv::Mat& image, const BoundingBox& face) const;

    // One entry per box, in box order with 1-based indices. An empty list
    // means no face. Throws std::invalid_argument for an empty image or an
    // invalid box, InferenceError for model failures.
    std::vector<FaceAttributes> analyzeFaces(const cv::Mat& image,
                                             const std::vector<BoundingBox>& faces) const;

    // Waits for the detector, then analyzes. std::nullopt when detection is
    // unavailable; an empty list when no face was found.
    std::optional<std::vector<FaceAttributes>> analyze(const cv::Mat& image,
                                                       FaceDetector& detector) const;

    // Waits for the detector, then draws the faces. std::nullopt when
    // detection is unavailable; the input image when no face was found.
    std::optional<cv::Mat> annotate(const cv::Mat& image, FaceDetector& detector) const;

    // Awaits the detector. Throws DetectionUnavailable on failure or timeout.
    std::vector<BoundingBox> detectFaces(const cv::Mat& image, FaceDetector& detector) const;

    const PipelineOptions& options() const { return options_; }

private:
    std::shared_ptr<const ModelContext> models_;
    PipelineOptions options_;

    GenderClassifier gender_;
    AgeClassifier age_;
    EmotionClassifier emotion_;
};

} // namespace faceAI
