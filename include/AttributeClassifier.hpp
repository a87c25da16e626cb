#pragma once

#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>
#include "ONNXInferenceEngine.hpp"
#include "TensorCodec.hpp"

namespace faceAI {

// Index of the largest score, first occurrence on ties; -1 when empty
int argMax(const std::vector<float>& scores);

// A face attribute predicted by one model. Subclasses declare the tensor
// layout their model was trained on and how its scores map to a label.
template <typename Label>
class AttributeClassifier {
public:
    explicit AttributeClassifier(std::shared_ptr<const InferenceModel> model)
        : model_(std::move(model)) {
        if (!model_) {
            throw std::invalid_argument("Attribute classifier requires a loaded model");
        }
    }
    virtual ~AttributeClassifier() = default;

    virtual CodecConfig codecConfig() const = 0;
    virtual Label interpret(const std::vector<float>& scores) const = 0;

    // Runs the model on an already encoded tensor and interprets the output
    Label classify(const std::vector<float>& tensor) const {
        return interpret(model_->run(tensor));
    }

    const InferenceModel& model() const { return *model_; }

protected:
    std::shared_ptr<const InferenceModel> model_;
};

} // namespace faceAI
