#include "FaceAIError.hpp"
#include "FaceAttributePipeline.hpp"
#include "FaceDetector.hpp"
#include "ModelContext.hpp"
#include "ModelStore.hpp"
#include "RESTServer.hpp"
#include "ServiceConfig.hpp"
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <opencv2/core.hpp>

int main(int argc, char** argv) {
    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [config.json]" << std::endl;
        return 2;
    }

    try {
        std::cout << "OpenCV Version: " << CV_VERSION << std::endl;

        faceAI::ServiceConfig config;
        if (argc == 2) {
            config = faceAI::ServiceConfig::loadFile(argv[1]);
            std::cout << "Loaded configuration from " << argv[1] << std::endl;
        } else {
            std::cout << "No configuration file given, using defaults" << std::endl;
        }

        // Attribute models are required; a bad blob aborts startup
        faceAI::ModelStore store(config.modelsDir);
        std::shared_ptr<const faceAI::ModelContext> models;
        try {
            models = faceAI::ModelContext::load(store, config);
        }
        catch (const faceAI::ModelLoadError& e) {
            std::cerr << e.what() << std::endl;
            return 1;
        }

        auto detector = std::make_shared<faceAI::SSDFaceDetector>();
        std::string detectorPath = store.resolve(config.faceDetectorPrototxt);
        if (!detector->loadModel(detectorPath, config.useCUDA)) {
            std::cerr << "Failed to load face_detection from " << detectorPath << std::endl;
            return 1;
        }
        std::cout << "Successfully loaded face_detection" << std::endl;

        faceAI::PipelineOptions options;
        options.detectionTimeout = std::chrono::milliseconds(config.detectionTimeoutMs);
        options.parallelFaces = config.parallelFaces;
        options.verbose = config.verbose;

        auto pipeline = std::make_shared<const faceAI::FaceAttributePipeline>(models, options);

        faceAI::RESTServer server(config.host, config.port, pipeline, detector, models);
        server.start();
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
