#pragma once

#include <memory>
#include <string>
#include "FaceAttributePipeline.hpp"
#include "FaceDetector.hpp"

namespace faceAI {

// HTTP front end for the attribute pipeline and the annotation renderer
class RESTServer {
public:
    RESTServer(const std::string& host, int port,
               std::shared_ptr<const FaceAttributePipeline> pipeline,
               std::shared_ptr<FaceDetector> detector,
               std::shared_ptr<const ModelContext> models);
    ~RESTServer();

    // Blocks serving requests until stop() is called
    void start();
    void stop();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace faceAI
