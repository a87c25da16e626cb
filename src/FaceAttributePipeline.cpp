#include "FaceAttributePipeline.hpp"
#include "AnnotationRenderer.hpp"
#include "FaceAIError.hpp"
#include "FaceRegion.hpp"
#include "TensorCodec.hpp"
#include <opencv2/core/utility.hpp>
#include <exception>
#include <future>
#include <iostream>
#include <map>
#include <stdexcept>
#include <utility>

namespace faceAI {

namespace {

template <typename Label>
void checkPairing(const AttributeClassifier<Label>& classifier) {
    size_t expected = classifier.codecConfig().elementCount();
    size_t actual = classifier.model().inputElementCount();
    if (expected != actual) {
        throw InferenceError(classifier.model().name() + " takes " + std::to_string(actual) +
                             " input values but its classifier produces " + std::to_string(expected));
    }
}

std::shared_ptr<const ModelContext> requireContext(std::shared_ptr<const ModelContext> models) {
    if (!models) {
        throw std::invalid_argument("FaceAttributePipeline requires a model context");
    }
    return models;
}

// Encodes the crop once per distinct codec configuration
class TensorCache {
public:
    explicit TensorCache(const cv::Mat& crop) : crop_(crop) {}

    const std::vector<float>& get(const CodecConfig& config) {
        auto it = tensors_.find(config);
        if (it == tensors_.end()) {
            it = tensors_.emplace(config, encodeTensor(crop_, config)).first;
        }
        return it->second;
    }

private:
    const cv::Mat& crop_;
    std::map<CodecConfig, std::vector<float>> tensors_;
};

} // namespace

FaceAttributePipeline::FaceAttributePipeline(std::shared_ptr<const ModelContext> models,
                                             PipelineOptions options)
    : models_(requireContext(std::move(models))),
      options_(options),
      gender_(models_->gender()),
      age_(models_->age()),
      emotion_(models_->emotion()) {
    checkPairing(gender_);
    checkPairing(age_);
    checkPairing(emotion_);
}

AttributeResult FaceAttributePipeline::predictAttributes(const cv::Mat& image,
                                                         const BoundingBox& face) const {
    // Crop with padding
    BoundingBox region = paddedRegion(image.size(), face, kAttributePadding);
    cv::Mat crop = image(region.toRect());
    TensorCache tensors(crop);

    AttributeResult result;
    result.gender = gender_.classify(tensors.get(gender_.codecConfig()));

    AgeEstimate age = age_.classify(tensors.get(age_.codecConfig()));
    result.ageYears = age.years;
    result.ageBucket = age.bucket;

    EmotionEstimate emotion = emotion_.classify(tensors.get(emotion_.codecConfig()));
    result.emotion = emotion.emotion;
    result.mood = emotion.mood;

    if (options_.verbose) {
        std::cout << "Gender=" << toString(result.gender)
                  << " Age=" << result.ageYears << " (" << toString(result.ageBucket) << ")"
                  << " Emotion=" << toString(result.mood) << std::endl;
    }
    return result;
}

std::vector<FaceAttributes> FaceAttributePipeline::analyzeFaces(
    const cv::Mat& image, const std::vector<BoundingBox>& faces) const {
    if (image.empty()) {
        throw std::invalid_argument("Cannot analyze an empty image");
    }

    // Validate every box before any model runs
    for (const auto& face : faces) {
        validateBox(image.size(), face);
    }

    std::vector<FaceAttributes> results(faces.size());
    for (size_t i = 0; i < faces.size(); i++) {
        results[i].index = static_cast<int>(i) + 1;
        results[i].box = faces[i];
    }

    if (options_.parallelFaces && faces.size() > 1) {
        std::vector<std::exception_ptr> errors(faces.size());
        cv::parallel_for_(cv::Range(0, static_cast<int>(faces.size())), [&](const cv::Range& range) {
            for (int i = range.start; i < range.end; i++) {
                try {
                    results[i].attributes = predictAttributes(image, faces[i]);
                }
                catch (...) {
                    errors[i] = std::current_exception();
                }
            }
        });
        for (const auto& error : errors) {
            if (error) {
                std::rethrow_exception(error);
            }
        }
    } else {
        for (auto& face : results) {
            face.attributes = predictAttributes(image, face.box);
        }
    }

    return results;
}

std::vector<BoundingBox> FaceAttributePipeline::detectFaces(const cv::Mat& image,
                                                            FaceDetector& detector) const {
    std::future<std::vector<BoundingBox>> pending;
    try {
        pending = detector.detectAsync(image);
    }
    catch (const std::exception& e) {
        throw DetectionUnavailable(e.what());
    }

    if (!pending.valid()) {
        throw DetectionUnavailable(detector.name() + " returned no pending result");
    }
    if (pending.wait_for(options_.detectionTimeout) != std::future_status::ready) {
        throw DetectionUnavailable(detector.name() + " timed out after " +
                                   std::to_string(options_.detectionTimeout.count()) + " ms");
    }

    try {
        return pending.get();
    }
    catch (const DetectionUnavailable&) {
        throw;
    }
    catch (const std::exception& e) {
        throw DetectionUnavailable(e.what());
    }
}

std::optional<std::vector<FaceAttributes>> FaceAttributePipeline::analyze(
    const cv::Mat& image, FaceDetector& detector) const {
    std::vector<BoundingBox> faces;
    try {
        faces = detectFaces(image, detector);
    }
    catch (const DetectionUnavailable& e) {
        std::cerr << e.what() << std::endl;
        return std::nullopt;
    }
    return analyzeFaces(image, faces);
}

std::optional<cv::Mat> FaceAttributePipeline::annotate(const cv::Mat& image,
                                                       FaceDetector& detector) const {
    std::vector<BoundingBox> faces;
    try {
        faces = detectFaces(image, detector);
    }
    catch (const DetectionUnavailable& e) {
        std::cerr << e.what() << std::endl;
        return std::nullopt;
    }
    for (const auto& face : faces) {
        validateBox(image.size(), face);
    }
    return annotateFaces(image, faces);
}

} // namespace faceAI
