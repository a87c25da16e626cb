#include "ModelContext.hpp"
#include "ModelStore.hpp"
#include "ServiceConfig.hpp"
#include <iostream>
#include <stdexcept>
#include <utility>

namespace faceAI {

namespace {

std::shared_ptr<const InferenceModel> loadEngine(const ModelStore& store,
                                                 const std::string& modelName,
                                                 bool useCUDA) {
    // The session keeps its own copy of the graph, so the mapping can go
    MappedModel mapped = store.open(modelName);
    return std::make_shared<const ONNXInferenceEngine>(modelName, mapped.data(), mapped.size(), useCUDA);
}

} // namespace

ModelContext::ModelContext(std::shared_ptr<const InferenceModel> gender,
                           std::shared_ptr<const InferenceModel> age,
                           std::shared_ptr<const InferenceModel> emotion)
    : gender_(std::move(gender)), age_(std::move(age)), emotion_(std::move(emotion)) {
    if (!gender_ || !age_ || !emotion_) {
        throw std::invalid_argument("ModelContext requires gender, age and emotion models");
    }
}

std::shared_ptr<const ModelContext> ModelContext::load(const ModelStore& store,
                                                       const ServiceConfig& config) {
    std::cout << "Looking for attribute models in: " << store.directory() << std::endl;

    auto gender = loadEngine(store, config.genderModel, config.useCUDA);
    auto age = loadEngine(store, config.ageModel, config.useCUDA);
    auto emotion = loadEngine(store, config.emotionModel, config.useCUDA);

    std::cout << "Successfully loaded gender, age and emotion models" << std::endl;
    return std::make_shared<const ModelContext>(std::move(gender), std::move(age), std::move(emotion));
}

} // namespace faceAI
