#include "FaceAIError.hpp"

namespace faceAI {

ModelLoadError::ModelLoadError(const std::string& message)
    : std::runtime_error("Model load error: " + message) {}

InferenceError::InferenceError(const std::string& message)
    : std::runtime_error("Inference error: " + message) {}

DetectionUnavailable::DetectionUnavailable(const std::string& message)
    : std::runtime_error("Face detection unavailable: " + message) {}

ConfigError::ConfigError(const std::string& message)
    : std::runtime_error("Configuration error: " + message) {}

} // namespace faceAI
