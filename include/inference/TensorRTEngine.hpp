#pragma once

#include <string>
#include <vector>
#include <memory>

// Forward declarations for TensorRT
namespace nvinfer1 {
    class IRuntime;
    class ICudaEngine;
    class IExecutionContext;
}

namespace inference {

/**
 * TensorRT Engine Wrapper
 *
 * Handles:
 * - Loading .engine files (or building and caching them from .onnx)
 * - CUDA memory for one float input and any number of float outputs
 * - Synchronous inference execution
 */
class TensorRTEngine {
public:
    struct Config {
        std::string modelPath;      // Path to .onnx or .engine file
        bool fp16 = true;           // Use FP16 when the GPU supports it
        size_t workspaceBytes = 256 * 1024 * 1024;
    };

    struct TensorInfo {
        std::string name;
        std::vector<int> dims;
        size_t size = 0;            // Total elements
        bool isInput = false;
    };

    TensorRTEngine();
    ~TensorRTEngine();

    // Non-copyable
    TensorRTEngine(const TensorRTEngine&) = delete;
    TensorRTEngine& operator=(const TensorRTEngine&) = delete;

    /**
     * Load engine from file or build from ONNX
     * @return true on success
     */
    bool load(const Config& config);

    /**
     * Run inference
     * @param inputData Host input, getInputInfo().size floats
     * @param outputs Host outputs, resized to match getOutputInfos()
     * @return true on success
     */
    bool infer(const float* inputData, std::vector<std::vector<float>>& outputs);

    [[nodiscard]] const TensorInfo& getInputInfo() const { return inputInfo_; }
    [[nodiscard]] const std::vector<TensorInfo>& getOutputInfos() const { return outputInfos_; }
    [[nodiscard]] size_t getNumOutputs() const { return outputInfos_.size(); }
    [[nodiscard]] bool isLoaded() const { return loaded_; }
    [[nodiscard]] const std::string& getModelPath() const { return modelPath_; }

private:
    std::string modelPath_;
    bool loaded_ = false;

    // TensorRT objects (raw pointers, released in the destructor)
    nvinfer1::IRuntime* runtime_ = nullptr;
    nvinfer1::ICudaEngine* engine_ = nullptr;
    nvinfer1::IExecutionContext* context_ = nullptr;

    TensorInfo inputInfo_;
    std::vector<TensorInfo> outputInfos_;

    // CUDA buffers
    void* d_input_ = nullptr;
    std::vector<void*> d_outputs_;
    void* stream_ = nullptr;  // cudaStream_t

    bool loadEngine(const std::string& enginePath);
    bool buildEngine(const std::string& onnxPath, const std::string& enginePath, const Config& config);
    bool extractTensorInfo();
    bool allocateBuffers();
    void freeBuffers();
};

} // namespace inference
