#include "ONNXInferenceEngine.hpp"
#include "FaceAIError.hpp"
#include <iostream>
#include <sstream>

namespace faceAI {

namespace {

std::shared_ptr<Ort::Env> sharedEnv() {
    static std::shared_ptr<Ort::Env> env =
        std::make_shared<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "faceAI");
    return env;
}

std::string shapeToString(const std::vector<int64_t>& shape) {
    std::ostringstream out;
    out << "[";
    for (size_t i = 0; i < shape.size(); i++) {
        if (i > 0) {
            out << ", ";
        }
        out << shape[i];
    }
    out << "]";
    return out.str();
}

} // namespace

ONNXInferenceEngine::ONNXInferenceEngine(const std::string& name, const void* modelData,
                                         size_t modelSize, bool enableCUDA)
    : name_(name),
      env_(sharedEnv()),
      memory_info_(Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault))
{
    if (modelData == nullptr || modelSize == 0) {
        throw ModelLoadError("empty model buffer for " + name_);
    }

    try {
        // Try to use GPU if requested and available, otherwise CPU
        auto sessionOptions = createSessionOptions(enableCUDA);
        session_ = std::make_unique<Ort::Session>(*env_, modelData, modelSize, sessionOptions);

        // Extract input/output node information
        getModelInfo();
    }
    catch (const Ort::Exception& e) {
        throw ModelLoadError("ONNX Runtime rejected " + name_ + ": " + e.what());
    }

    std::cout << "Loaded model " << name_ << " input " << shapeToString(input_shape_)
              << " output " << shapeToString(output_shape_) << std::endl;
}

ONNXInferenceEngine::~ONNXInferenceEngine() = default;

Ort::SessionOptions ONNXInferenceEngine::createSessionOptions(bool enableCUDA) {
    Ort::SessionOptions sessionOptions;
    sessionOptions.SetIntraOpNumThreads(1);
    sessionOptions.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

    if (enableCUDA && isGPUAvailable()) {
        OrtCUDAProviderOptions cuda_options;
        sessionOptions.AppendExecutionProvider_CUDA(cuda_options);
        using_cuda_ = true;
        std::cout << "Using CUDA provider for " << name_ << std::endl;
    } else {
        using_cuda_ = false;
        std::cout << "Using CPU provider for " << name_ << std::endl;
    }

    return sessionOptions;
}

bool ONNXInferenceEngine::isGPUAvailable() {
    try {
        auto providers = Ort::GetAvailableProviders();
        for (const auto& provider : providers) {
            if (provider == "CUDAExecutionProvider") {
                return true;
            }
        }
        return false;
    }
    catch (const Ort::Exception& e) {
        std::cerr << "Error checking CUDA availability: " << e.what() << std::endl;
        return false;
    }
}

void ONNXInferenceEngine::getModelInfo() {
    Ort::AllocatorWithDefaultOptions allocator;

    if (session_->GetInputCount() != 1 || session_->GetOutputCount() < 1) {
        throw ModelLoadError(name_ + " must have exactly one input and at least one output");
    }

    // Input node
    auto inputName = session_->GetInputNameAllocated(0, allocator);
    input_name_ = inputName.get();

    auto inputTypeInfo = session_->GetInputTypeInfo(0);
    auto inputTensorInfo = inputTypeInfo.GetTensorTypeAndShapeInfo();
    if (inputTensorInfo.GetElementType() != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT) {
        throw ModelLoadError(name_ + " input is not a float tensor");
    }
    input_shape_ = inputTensorInfo.GetShape();

    run_input_shape_.clear();
    input_element_count_ = 1;
    for (int64_t dim : input_shape_) {
        int64_t concrete = dim > 0 ? dim : 1;
        run_input_shape_.push_back(concrete);
        input_element_count_ *= static_cast<size_t>(concrete);
    }

    // First output node; any further outputs are ignored
    auto outputName = session_->GetOutputNameAllocated(0, allocator);
    output_name_ = outputName.get();

    auto outputTypeInfo = session_->GetOutputTypeInfo(0);
    if (outputTypeInfo.GetONNXType() != ONNX_TYPE_TENSOR) {
        throw ModelLoadError(name_ + " output is not a tensor");
    }
    auto outputTensorInfo = outputTypeInfo.GetTensorTypeAndShapeInfo();
    if (outputTensorInfo.GetElementType() != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT) {
        throw ModelLoadError(name_ + " output is not a float tensor");
    }
    output_shape_ = outputTensorInfo.GetShape();
}

std::vector<float> ONNXInferenceEngine::run(const std::vector<float>& input) const {
    if (input.size() != input_element_count_) {
        std::ostringstream message;
        message << name_ << " expects " << input_element_count_ << " values for input shape "
                << shapeToString(input_shape_) << ", got " << input.size();
        throw InferenceError(message.str());
    }

    const char* inputNames[] = {input_name_.c_str()};
    const char* outputNames[] = {output_name_.c_str()};

    try {
        // ORT only reads from the input buffer
        Ort::Value inputTensor = Ort::Value::CreateTensor<float>(
            memory_info_,
            const_cast<float*>(input.data()),
            input.size(),
            run_input_shape_.data(),
            run_input_shape_.size()
        );

        auto outputTensors = session_->Run(
            Ort::RunOptions{nullptr},
            inputNames,
            &inputTensor,
            1,
            outputNames,
            1
        );

        if (outputTensors.empty() || !outputTensors[0].IsTensor()) {
            throw InferenceError(name_ + " produced no output tensor");
        }

        auto outputInfo = outputTensors[0].GetTensorTypeAndShapeInfo();
        const float* data = outputTensors[0].GetTensorData<float>();
        return std::vector<float>(data, data + outputInfo.GetElementCount());
    }
    catch (const Ort::Exception& e) {
        throw InferenceError(name_ + " forward pass failed: " + e.what());
    }
}

} // namespace faceAI
