#pragma once

#include <string>

namespace faceAI {

struct ServiceConfig {
    std::string host = "0.0.0.0";
    int port = 8080;

    // Model file names resolve against modelsDir unless absolute
    std::string modelsDir = "models";
    std::string genderModel = "gender.onnx";
    std::string ageModel = "age.onnx";
    std::string emotionModel = "emotion.onnx";
    std::string faceDetectorPrototxt = "face_detection/deploy.prototxt";

    int detectionTimeoutMs = 5000;
    bool parallelFaces = false;
    bool useCUDA = true;
    bool verbose = false;

    // Parses a JSON document. A relative models_dir is resolved against
    // baseDir when baseDir is not empty. Throws ConfigError.
    static ServiceConfig fromJsonString(const std::string& text, const std::string& baseDir = "");

    // Reads and parses a JSON file. Throws ConfigError.
    static ServiceConfig loadFile(const std::string& path);
};

} // namespace faceAI
