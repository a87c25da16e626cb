#pragma once

#include <stdexcept>
#include <string>

namespace faceAI {

// Model blob missing, unmappable, or not a valid model
class ModelLoadError : public std::runtime_error {
public:
    explicit ModelLoadError(const std::string& message);
};

// Tensor shape mismatch or runtime failure during a forward pass
class InferenceError : public std::runtime_error {
public:
    explicit InferenceError(const std::string& message);
};

// External face detector failed or did not answer in time
class DetectionUnavailable : public std::runtime_error {
public:
    explicit DetectionUnavailable(const std::string& message);
};

// Malformed service configuration
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message);
};

} // namespace faceAI
