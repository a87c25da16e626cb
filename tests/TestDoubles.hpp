#pragma once

#include <atomic>
#include <exception>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "FaceAIError.hpp"
#include "FaceDetector.hpp"
#include "ONNXInferenceEngine.hpp"
#include "TensorCodec.hpp"

namespace faceAI {
namespace fakes {

// Returns a fixed score vector and remembers the last tensor it was given
class FakeModel : public InferenceModel {
public:
    FakeModel(std::string name, size_t inputSize, std::vector<float> output)
        : name_(std::move(name)), input_size_(inputSize), output_(std::move(output)) {}

    std::vector<float> run(const std::vector<float>& input) const override {
        if (input.size() != input_size_) {
            throw InferenceError(name_ + " got " + std::to_string(input.size()) + " values");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        calls_++;
        last_input_ = input;
        return output_;
    }

    size_t inputElementCount() const override { return input_size_; }
    std::string name() const override { return name_; }

    int calls() const { return calls_.load(); }

    std::vector<float> lastInput() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_input_;
    }

private:
    std::string name_;
    size_t input_size_;
    std::vector<float> output_;

    mutable std::mutex mutex_;
    mutable std::atomic<int> calls_{0};
    mutable std::vector<float> last_input_;
};

inline std::vector<float> oneHot(size_t size, size_t hot, float value = 1.0f) {
    std::vector<float> scores(size, 0.0f);
    scores.at(hot) = value;
    return scores;
}

inline size_t rgbInputSize() {
    return rgbNormalized().elementCount();
}

inline size_t grayInputSize() {
    return grayNormalized().elementCount();
}

// Answers immediately with a fixed list of boxes
class FixedDetector : public FaceDetector {
public:
    explicit FixedDetector(std::vector<BoundingBox> boxes) : boxes_(std::move(boxes)) {}

    std::future<std::vector<BoundingBox>> detectAsync(const cv::Mat&) override {
        std::promise<std::vector<BoundingBox>> promise;
        promise.set_value(boxes_);
        return promise.get_future();
    }
    std::string name() const override { return "fixed"; }
    bool isLoaded() const override { return true; }

private:
    std::vector<BoundingBox> boxes_;
};

// Fails through the future, as a crashed detector backend would
class FailingDetector : public FaceDetector {
public:
    std::future<std::vector<BoundingBox>> detectAsync(const cv::Mat&) override {
        std::promise<std::vector<BoundingBox>> promise;
        promise.set_exception(std::make_exception_ptr(std::runtime_error("backend crashed")));
        return promise.get_future();
    }
    std::string name() const override { return "failing"; }
    bool isLoaded() const override { return true; }
};

// Never answers
class HangingDetector : public FaceDetector {
public:
    std::future<std::vector<BoundingBox>> detectAsync(const cv::Mat&) override {
        pending_.emplace_back();
        return pending_.back().get_future();
    }
    std::string name() const override { return "hanging"; }
    bool isLoaded() const override { return true; }

private:
    std::vector<std::promise<std::vector<BoundingBox>>> pending_;
};

} // namespace fakes
} // namespace faceAI
