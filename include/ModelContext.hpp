#pragma once

#include <memory>
#include "ONNXInferenceEngine.hpp"

namespace faceAI {

class ModelStore;
struct ServiceConfig;

// The three attribute models, loaded once and shared read-only by every
// inference call for the lifetime of the process
class ModelContext {
public:
    // Throws std::invalid_argument if any model is missing
    ModelContext(std::shared_ptr<const InferenceModel> gender,
                 std::shared_ptr<const InferenceModel> age,
                 std::shared_ptr<const InferenceModel> emotion);

    // Maps and loads the configured ONNX models. Throws ModelLoadError.
    static std::shared_ptr<const ModelContext> load(const ModelStore& store,
                                                    const ServiceConfig& config);

    const std::shared_ptr<const InferenceModel>& gender() const { return gender_; }
    const std::shared_ptr<const InferenceModel>& age() const { return age_; }
    const std::shared_ptr<const InferenceModel>& emotion() const { return emotion_; }

private:
    std::shared_ptr<const InferenceModel> gender_;
    std::shared_ptr<const InferenceModel> age_;
    std::shared_ptr<const InferenceModel> emotion_;
};

} // namespace faceAI
