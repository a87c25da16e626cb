#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <onnxruntime_cxx_api.h>

namespace faceAI {

// A loaded, read-only model: one flat float tensor in, one flat float tensor out
class InferenceModel {
public:
    virtual ~InferenceModel() = default;

    // Runs one forward pass. Throws InferenceError if input.size() differs
    // from inputElementCount() or the runtime fails.
    virtual std::vector<float> run(const std::vector<float>& input) const = 0;

    virtual size_t inputElementCount() const = 0;
    virtual std::string name() const = 0;
};

// ONNX Runtime backed model handle. Instances only exist in the loaded state;
// Session::Run is safe to call concurrently on one session.
class ONNXInferenceEngine : public InferenceModel {
public:
    // Builds a session from an in-memory model blob. Throws ModelLoadError.
    ONNXInferenceEngine(const std::string& name, const void* modelData, size_t modelSize,
                        bool enableCUDA = true);
    ~ONNXInferenceEngine() override;

    ONNXInferenceEngine(const ONNXInferenceEngine&) = delete;
    ONNXInferenceEngine& operator=(const ONNXInferenceEngine&) = delete;

    std::vector<float> run(const std::vector<float>& input) const override;
    size_t inputElementCount() const override { return input_element_count_; }
    std::string name() const override { return name_; }

    const std::vector<int64_t>& inputShape() const { return input_shape_; }
    const std::vector<int64_t>& outputShape() const { return output_shape_; }
    bool usingCUDA() const { return using_cuda_; }

    // Check if the CUDA execution provider is compiled into this runtime
    static bool isGPUAvailable();

private:
    // Get inference session options (CPU/GPU)
    Ort::SessionOptions createSessionOptions(bool enableCUDA);

    // Extract input/output node information
    void getModelInfo();

    std::string name_;

    // ONNX Runtime environment, shared by every engine in the process
    std::shared_ptr<Ort::Env> env_;
    std::unique_ptr<Ort::Session> session_;
    Ort::MemoryInfo memory_info_{nullptr};

    std::string input_name_;
    std::string output_name_;

    // Declared shapes may hold dynamic (negative) dimensions; the run shape
    // substitutes 1 for those
    std::vector<int64_t> input_shape_;
    std::vector<int64_t> run_input_shape_;
    std::vector<int64_t> output_shape_;
    size_t input_element_count_ = 0;

    bool using_cuda_ = false;
};

} // namespace faceAI
