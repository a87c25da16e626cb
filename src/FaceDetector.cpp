#include "FaceDetector.hpp"
#include "FaceAIError.hpp"
#include <opencv2/core/cuda.hpp>
#include <opencv2/dnn.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <atomic>
#include <exception>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <thread>

namespace fs = std::filesystem;

namespace faceAI {

class SSDFaceDetector::Impl {
public:
    std::vector<FaceDetection> detect(const cv::Mat& image) {
        std::lock_guard<std::mutex> lock(mutex);

        if (!loaded) {
            throw DetectionUnavailable("face detection model not loaded");
        }
        if (image.empty()) {
            throw DetectionUnavailable("empty image");
        }

        std::vector<FaceDetection> detections;
        try {
            cv::Mat bgr = image;
            if (image.channels() == 4) {
                cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
            } else if (image.channels() == 1) {
                cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
            }

            // Prepare input blob and set input
            cv::Mat inputBlob = cv::dnn::blobFromImage(
                bgr, 1.0,
                cv::Size(inputWidth, inputHeight),
                cv::Scalar(meanValues[0], meanValues[1], meanValues[2]),
                false, false);

            net.setInput(inputBlob);
            cv::Mat detection = net.forward();

            // [1, 1, N, 7]: image id, label, confidence, x1, y1, x2, y2
            cv::Mat detectionMat(detection.size[2], detection.size[3], CV_32F, detection.ptr<float>());

            for (int i = 0; i < detectionMat.rows; i++) {
                float confidence = detectionMat.at<float>(i, 2);
                if (confidence <= confThreshold) {
                    continue;
                }

                int x1 = static_cast<int>(detectionMat.at<float>(i, 3) * bgr.cols);
                int y1 = static_cast<int>(detectionMat.at<float>(i, 4) * bgr.rows);
                int x2 = static_cast<int>(detectionMat.at<float>(i, 5) * bgr.cols);
                int y2 = static_cast<int>(detectionMat.at<float>(i, 6) * bgr.rows);

                // Ensure box is within image boundaries
                x1 = std::max(0, std::min(x1, bgr.cols - 1));
                y1 = std::max(0, std::min(y1, bgr.rows - 1));
                x2 = std::max(0, std::min(x2, bgr.cols));
                y2 = std::max(0, std::min(y2, bgr.rows));

                if (x2 <= x1 || y2 <= y1) {
                    continue;
                }

                FaceDetection face;
                face.box = BoundingBox{x1, y1, x2, y2};
                face.confidence = confidence;
                detections.push_back(face);
            }
        }
        catch (const cv::Exception& e) {
            throw DetectionUnavailable(std::string("OpenCV error during face detection: ") + e.what());
        }

        return detections;
    }

    cv::dnn::Net net;
    bool loaded = false;
    float confThreshold = 0.5f;
    int inputWidth = 300;
    int inputHeight = 300;
    float meanValues[3] = {104.0f, 177.0f, 123.0f};

    // Net::forward mutates the network, so one detection at a time
    std::mutex mutex;

    // Detections queued or running; each holds one detached thread
    std::atomic<int> pending{0};
    std::atomic<int> maxPending{kDefaultMaxPendingDetections};
};

SSDFaceDetector::SSDFaceDetector() : pImpl_(std::make_shared<Impl>()) {}
SSDFaceDetector::~SSDFaceDetector() = default;

bool SSDFaceDetector::loadModel(const std::string& modelPath, bool useCUDA) {
    try {
        fs::path prototxtPath = fs::path(modelPath);
        fs::path caffemodelPath = prototxtPath.parent_path() / (prototxtPath.stem().string() + ".caffemodel");

        if (!fs::exists(prototxtPath) || !fs::exists(caffemodelPath)) {
            std::cerr << "Model files not found: " << prototxtPath << " or " << caffemodelPath << std::endl;
            return false;
        }

        std::lock_guard<std::mutex> lock(pImpl_->mutex);
        pImpl_->net = cv::dnn::readNetFromCaffe(prototxtPath.string(), caffemodelPath.string());
        if (pImpl_->net.empty()) {
            std::cerr << "Failed to load face detection model from: " << prototxtPath << std::endl;
            return false;
        }

        if (useCUDA && cv::cuda::getCudaEnabledDeviceCount() > 0) {
            pImpl_->net.setPreferableBackend(cv::dnn::DNN_BACKEND_CUDA);
            pImpl_->net.setPreferableTarget(cv::dnn::DNN_TARGET_CUDA);
            std::cout << "Using CUDA backend for face detection" << std::endl;
        } else {
            pImpl_->net.setPreferableBackend(cv::dnn::DNN_BACKEND_DEFAULT);
            pImpl_->net.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
            std::cout << "Using CPU backend for face detection" << std::endl;
        }

        pImpl_->loaded = true;
        return true;
    }
    catch (const std::exception& e) {
        std::cerr << "Error loading face detection model: " << e.what() << std::endl;
        return false;
    }
}

std::vector<FaceDetection> SSDFaceDetector::detect(const cv::Mat& image) {
    return pImpl_->detect(image);
}

std::future<std::vector<BoundingBox>> SSDFaceDetector::detectAsync(const cv::Mat& image) {
    auto promise = std::make_shared<std::promise<std::vector<BoundingBox>>>();
    auto result = promise->get_future();

    // A hung forward pass keeps its thread; refuse new work instead of
    // letting abandoned threads pile up behind the mutex
    std::shared_ptr<Impl> impl = pImpl_;
    if (impl->pending.fetch_add(1) >= impl->maxPending.load()) {
        impl->pending.fetch_sub(1);
        std::cerr << "Face detection busy, rejecting request" << std::endl;
        promise->set_exception(std::make_exception_ptr(
            DetectionUnavailable("too many face detections in flight")));
        return result;
    }

    // Detached so an abandoned wait does not block; the thread keeps the
    // implementation and the image alive until it finishes
    std::thread([impl, image, promise]() {
        std::vector<BoundingBox> boxes;
        std::exception_ptr error;
        try {
            for (const auto& face : impl->detect(image)) {
                boxes.push_back(face.box);
            }
        }
        catch (...) {
            error = std::current_exception();
        }

        // Release the slot before waking the waiter
        impl->pending.fetch_sub(1);
        if (error) {
            promise->set_exception(error);
        } else {
            promise->set_value(std::move(boxes));
        }
    }).detach();

    return result;
}

bool SSDFaceDetector::isLoaded() const {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    return pImpl_->loaded;
}

void SSDFaceDetector::setMaxPendingDetections(int limit) {
    pImpl_->maxPending.store(std::max(limit, 0));
}

void SSDFaceDetector::setConfidenceThreshold(float threshold) {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    pImpl_->confThreshold = threshold;
}

} // namespace faceAI
