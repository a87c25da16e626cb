#pragma once

#include <future>
#include <memory>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "FaceTypes.hpp"

namespace faceAI {

// External face detector. The order of the returned boxes is the canonical
// face order; an empty list is a valid answer. Failures travel through the
// future as exceptions.
class FaceDetector {
public:
    virtual ~FaceDetector() = default;

    virtual std::future<std::vector<BoundingBox>> detectAsync(const cv::Mat& image) = 0;
    virtual std::string name() const = 0;
    virtual bool isLoaded() const = 0;
};

struct FaceDetection {
    BoundingBox box;
    float confidence;
};

constexpr int kDefaultMaxPendingDetections = 8;

// Caffe res10 SSD detector run through OpenCV DNN
class SSDFaceDetector : public FaceDetector {
public:
    SSDFaceDetector();
    ~SSDFaceDetector() override;

    // modelPath points at the .prototxt; the .caffemodel with the same stem
    // must sit beside it
    bool loadModel(const std::string& modelPath, bool useCUDA = true);

    // Synchronous detection. Throws DetectionUnavailable if the network is
    // not loaded or OpenCV fails.
    std::vector<FaceDetection> detect(const cv::Mat& image);

    std::future<std::vector<BoundingBox>> detectAsync(const cv::Mat& image) override;
    std::string name() const override { return "face_detection"; }
    bool isLoaded() const override;

    void setConfidenceThreshold(float threshold);

    // Upper bound on detections queued or running at once. Requests beyond
    // it fail with DetectionUnavailable without starting a thread.
    void setMaxPendingDetections(int limit);

private:
    class Impl;
    std::shared_ptr<Impl> pImpl_;
};

} // namespace faceAI
