#include "ServiceConfig.hpp"
#include "FaceAIError.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace faceAI {

namespace {

template <typename T>
void readOptional(const json& doc, const char* key, T& out) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return;
    }
    try {
        out = it->get<T>();
    }
    catch (const json::exception& e) {
        throw ConfigError(std::string("invalid value for \"") + key + "\": " + e.what());
    }
}

// nlohmann converts any number to int, so integers are checked explicitly
void readOptionalInt(const json& doc, const char* key, int& out) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return;
    }
    if (!it->is_number_integer()) {
        throw ConfigError(std::string("\"") + key + "\" must be an integer");
    }
    // Widen first so values outside the int range are rejected, not wrapped
    bool fits = it->is_number_unsigned()
        ? it->get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
        : it->get<int64_t>() >= std::numeric_limits<int>::min() &&
          it->get<int64_t>() <= std::numeric_limits<int>::max();
    if (!fits) {
        throw ConfigError(std::string("\"") + key + "\" is out of range");
    }
    out = static_cast<int>(it->get<int64_t>());
}

} // namespace

ServiceConfig ServiceConfig::fromJsonString(const std::string& text, const std::string& baseDir) {
    json doc;
    try {
        doc = json::parse(text);
    }
    catch (const json::parse_error& e) {
        throw ConfigError(std::string("malformed JSON: ") + e.what());
    }

    if (!doc.is_object()) {
        throw ConfigError("top-level JSON value must be an object");
    }

    ServiceConfig config;
    readOptional(doc, "host", config.host);
    readOptionalInt(doc, "port", config.port);
    readOptional(doc, "models_dir", config.modelsDir);
    readOptional(doc, "gender_model", config.genderModel);
    readOptional(doc, "age_model", config.ageModel);
    readOptional(doc, "emotion_model", config.emotionModel);
    readOptional(doc, "face_detector_prototxt", config.faceDetectorPrototxt);
    readOptionalInt(doc, "detection_timeout_ms", config.detectionTimeoutMs);
    readOptional(doc, "parallel_faces", config.parallelFaces);
    readOptional(doc, "use_cuda", config.useCUDA);
    readOptional(doc, "verbose", config.verbose);

    if (config.port <= 0 || config.port > 65535) {
        throw ConfigError("\"port\" must be between 1 and 65535");
    }
    if (config.detectionTimeoutMs <= 0) {
        throw ConfigError("\"detection_timeout_ms\" must be positive");
    }

    if (!baseDir.empty() && fs::path(config.modelsDir).is_relative()) {
        config.modelsDir = (fs::path(baseDir) / config.modelsDir).lexically_normal().string();
    }

    return config;
}

ServiceConfig ServiceConfig::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open configuration file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    std::string baseDir = fs::path(path).parent_path().string();
    return fromJsonString(buffer.str(), baseDir);
}

} // namespace faceAI
