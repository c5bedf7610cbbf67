/**
 * TensorRT Engine Wrapper Implementation
 *
 * Supports:
 * - Loading pre-built .engine files
 * - Building engines from .onnx (cached next to the model)
 * - FP16 inference
 */

#include "inference/TensorRTEngine.hpp"
#include "core/Logger.hpp"

#include <fstream>
#include <filesystem>

#include <NvInfer.h>
#include <NvOnnxParser.h>
#include <cuda_runtime.h>

namespace inference {

namespace {

// Routes TensorRT messages into the application log
class TRTLogger : public nvinfer1::ILogger {
public:
    void log(Severity severity, const char* msg) noexcept override {
        if (severity <= Severity::kERROR) {
            core::Logger::error("[TensorRT] ", msg);
        } else if (severity == Severity::kWARNING) {
            core::Logger::warn("[TensorRT] ", msg);
        } else if (severity == Severity::kINFO) {
            core::Logger::debug("[TensorRT] ", msg);
        }
    }
};

TRTLogger gLogger;

bool checkCuda(cudaError_t err, const char* what) {
    if (err != cudaSuccess) {
        core::Logger::error(what, " failed: ", cudaGetErrorString(err));
        return false;
    }
    return true;
}

} // namespace

TensorRTEngine::TensorRTEngine() = default;

TensorRTEngine::~TensorRTEngine() {
    freeBuffers();

    delete context_;
    context_ = nullptr;
    delete engine_;
    engine_ = nullptr;
    delete runtime_;
    runtime_ = nullptr;
}

bool TensorRTEngine::load(const Config& config) {
    modelPath_ = config.modelPath;

    std::filesystem::path path(config.modelPath);
    std::string ext = path.extension().string();

    if (!std::filesystem::exists(path)) {
        core::Logger::error("Model file not found: ", config.modelPath);
        return false;
    }

    std::string enginePath;

    if (ext == ".engine" || ext == ".trt") {
        enginePath = config.modelPath;
    } else if (ext == ".onnx") {
        enginePath = path.replace_extension(".engine").string();

        // Rebuild when the cached engine is missing or older than the ONNX file
        bool needsBuild = true;
        if (std::filesystem::exists(enginePath)) {
            auto onnxTime = std::filesystem::last_write_time(config.modelPath);
            auto engineTime = std::filesystem::last_write_time(enginePath);
            needsBuild = (onnxTime > engineTime);
        }

        if (needsBuild) {
            core::Logger::info("Building TensorRT engine from ONNX: ", config.modelPath,
                               " (first run can take minutes)");
            if (!buildEngine(config.modelPath, enginePath, config)) {
                core::Logger::error("Failed to build engine from ONNX");
                return false;
            }
        } else {
            core::Logger::info("Using cached TensorRT engine: ", enginePath);
        }
    } else {
        core::Logger::error("Unknown model format: ", ext);
        return false;
    }

    if (!loadEngine(enginePath) || !extractTensorInfo() || !allocateBuffers()) {
        return false;
    }

    loaded_ = true;
    core::Logger::info("TensorRT engine loaded: ", enginePath);
    core::Logger::info("  Input: ", inputInfo_.name, " size=", inputInfo_.size);
    for (const auto& out : outputInfos_) {
        core::Logger::info("  Output: ", out.name, " size=", out.size);
    }

    return true;
}

bool TensorRTEngine::loadEngine(const std::string& enginePath) {
    std::ifstream file(enginePath, std::ios::binary);
    if (!file.good()) {
        core::Logger::error("Cannot open engine file: ", enginePath);
        return false;
    }

    file.seekg(0, std::ios::end);
    size_t size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<char> engineData(size);
    file.read(engineData.data(), size);
    file.close();

    runtime_ = nvinfer1::createInferRuntime(gLogger);
    if (!runtime_) {
        core::Logger::error("Failed to create TensorRT runtime");
        return false;
    }

    engine_ = runtime_->deserializeCudaEngine(engineData.data(), size);
    if (!engine_) {
        core::Logger::error("Failed to deserialize engine");
        return false;
    }

    context_ = engine_->createExecutionContext();
    if (!context_) {
        core::Logger::error("Failed to create execution context");
        return false;
    }

    return true;
}

bool TensorRTEngine::buildEngine(const std::string& onnxPath, const std::string& enginePath,
                                 const Config& config) {
    std::unique_ptr<nvinfer1::IBuilder> builder(nvinfer1::createInferBuilder(gLogger));
    if (!builder) {
        core::Logger::error("Failed to create builder");
        return false;
    }

    // Explicit batch is the default network mode since TensorRT 8.5
    std::unique_ptr<nvinfer1::INetworkDefinition> network(builder->createNetworkV2(0));
    if (!network) {
        core::Logger::error("Failed to create network");
        return false;
    }

    std::unique_ptr<nvonnxparser::IParser> parser(nvonnxparser::createParser(*network, gLogger));
    if (!parser) {
        core::Logger::error("Failed to create ONNX parser");
        return false;
    }

    if (!parser->parseFromFile(onnxPath.c_str(),
            static_cast<int>(nvinfer1::ILogger::Severity::kWARNING))) {
        core::Logger::error("Failed to parse ONNX file: ", onnxPath);
        return false;
    }

    std::unique_ptr<nvinfer1::IBuilderConfig> builderConfig(builder->createBuilderConfig());
    if (!builderConfig) {
        core::Logger::error("Failed to create builder config");
        return false;
    }

    if (config.fp16 && builder->platformHasFastFp16()) {
        builderConfig->setFlag(nvinfer1::BuilderFlag::kFP16);
        core::Logger::info("FP16 enabled for TensorRT");
    }

    builderConfig->setMemoryPoolLimit(nvinfer1::MemoryPoolType::kWORKSPACE, config.workspaceBytes);

    std::unique_ptr<nvinfer1::IHostMemory> serializedEngine(
        builder->buildSerializedNetwork(*network, *builderConfig));
    if (!serializedEngine) {
        core::Logger::error("Failed to build serialized network");
        return false;
    }

    std::ofstream engineFile(enginePath, std::ios::binary);
    engineFile.write(static_cast<const char*>(serializedEngine->data()), serializedEngine->size());
    if (!engineFile.good()) {
        core::Logger::error("Failed to write engine file: ", enginePath);
        return false;
    }

    core::Logger::info("Engine saved to: ", enginePath);
    return true;
}

bool TensorRTEngine::extractTensorInfo() {
    int numTensors = engine_->getNbIOTensors();

    bool haveInput = false;
    outputInfos_.clear();

    for (int i = 0; i < numTensors; ++i) {
        const char* name = engine_->getIOTensorName(i);
        auto dims = engine_->getTensorShape(name);
        bool isInput = (engine_->getTensorIOMode(name) == nvinfer1::TensorIOMode::kINPUT);

        if (engine_->getTensorDataType(name) != nvinfer1::DataType::kFLOAT) {
            core::Logger::error("Tensor '", name, "' is not FP32, unsupported");
            return false;
        }

        TensorInfo info;
        info.name = name;
        info.isInput = isInput;
        info.size = 1;

        for (int d = 0; d < dims.nbDims; ++d) {
            if (dims.d[d] < 0) {
                core::Logger::error("Tensor '", name, "' has a dynamic dimension, unsupported");
                return false;
            }
            info.dims.push_back(static_cast<int>(dims.d[d]));
            info.size *= static_cast<size_t>(dims.d[d]);
        }

        if (isInput) {
            if (haveInput) {
                core::Logger::error("Model has more than one input, unsupported");
                return false;
            }
            inputInfo_ = info;
            haveInput = true;
        } else {
            outputInfos_.push_back(info);
        }
    }

    if (!haveInput || outputInfos_.empty()) {
        core::Logger::error("Model needs one input and at least one output");
        return false;
    }
    return true;
}

bool TensorRTEngine::allocateBuffers() {
    cudaStream_t stream = nullptr;
    if (!checkCuda(cudaStreamCreate(&stream), "cudaStreamCreate")) return false;
    stream_ = stream;

    if (!checkCuda(cudaMalloc(&d_input_, inputInfo_.size * sizeof(float)), "cudaMalloc(input)")) {
        return false;
    }
    if (!context_->setTensorAddress(inputInfo_.name.c_str(), d_input_)) {
        core::Logger::error("setTensorAddress failed for ", inputInfo_.name);
        return false;
    }

    for (const auto& info : outputInfos_) {
        void* d_output = nullptr;
        if (!checkCuda(cudaMalloc(&d_output, info.size * sizeof(float)), "cudaMalloc(output)")) {
            return false;
        }
        d_outputs_.push_back(d_output);
        if (!context_->setTensorAddress(info.name.c_str(), d_output)) {
            core::Logger::error("setTensorAddress failed for ", info.name);
            return false;
        }
    }

    core::Logger::debug("CUDA buffers allocated: 1 input, ", d_outputs_.size(), " outputs");
    return true;
}

void TensorRTEngine::freeBuffers() {
    if (d_input_) {
        cudaFree(d_input_);
        d_input_ = nullptr;
    }
    for (void* ptr : d_outputs_) {
        cudaFree(ptr);
    }
    d_outputs_.clear();
    if (stream_) {
        cudaStreamDestroy(static_cast<cudaStream_t>(stream_));
        stream_ = nullptr;
    }
}

bool TensorRTEngine::infer(const float* inputData, std::vector<std::vector<float>>& outputs) {
    if (!loaded_) {
        core::Logger::error("Engine not loaded");
        return false;
    }

    auto stream = static_cast<cudaStream_t>(stream_);

    if (!checkCuda(cudaMemcpyAsync(d_input_, inputData, inputInfo_.size * sizeof(float),
                                   cudaMemcpyHostToDevice, stream), "cudaMemcpyAsync(input)")) {
        return false;
    }

    if (!context_->enqueueV3(stream)) {
        core::Logger::error("Inference failed");
        return false;
    }

    outputs.resize(outputInfos_.size());
    for (size_t i = 0; i < outputInfos_.size(); ++i) {
        outputs[i].resize(outputInfos_[i].size);
        if (!checkCuda(cudaMemcpyAsync(outputs[i].data(), d_outputs_[i], outputInfos_[i].size * sizeof(float),
                                       cudaMemcpyDeviceToHost, stream), "cudaMemcpyAsync(output)")) {
            return false;
        }
    }

    return checkCuda(cudaStreamSynchronize(stream), "cudaStreamSynchronize");
}

} // namespace inference
