#pragma once

#include "inference/TensorRTEngine.hpp"
#include "core/PoseDetector.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

namespace inference {

/**
 * BlazePose landmark model (33 keypoints) on TensorRT.
 *
 * The full frame is letterboxed into the model input; there is no separate
 * person detector or ROI tracking, every call is independent.
 * Output: 33 landmarks x (x, y, z, visibility, presence) in input pixels,
 * plus a pose presence score.
 */
class PoseLandmarker : public core::PoseDetector {
public:
    struct Config {
        std::string modelPath = "models/pose_landmark_full.onnx";
        int inputWidth = 256;   // BlazePose full/heavy use 256x256
        int inputHeight = 256;
        float presenceThreshold = 0.5f;
        bool fp16 = true;
    };

    PoseLandmarker();
    ~PoseLandmarker() override;

    /**
     * Loads (or builds) the engine and checks the tensor layout.
     * @return false if the model is missing or does not look like BlazePose
     */
    bool init(const Config& config);

    std::optional<core::Pose> detect(const cv::Mat& bgrImage) override;

    [[nodiscard]] bool isInitialized() const { return initialized_; }

    /**
     * Factory for the stream driver: every call loads an independent engine.
     * Throws core::InferenceError if the model cannot be loaded.
     */
    static core::PoseDetectorFactory factory(const Config& config);

private:
    struct Letterbox {
        float scale = 1.0f;
        float padX = 0.0f;
        float padY = 0.0f;
    };

    Config config_;
    bool initialized_ = false;
    bool channelsFirst_ = false;  // NCHW instead of the usual NHWC export

    int landmarkOutput_ = -1;
    int presenceOutput_ = -1;

    std::unique_ptr<TensorRTEngine> engine_;

    std::vector<float> inputBuffer_;
    std::vector<std::vector<float>> outputBuffers_;

    Letterbox preprocess(const cv::Mat& bgrImage);
    core::Pose parseLandmarks(const std::vector<float>& raw, const Letterbox& box,
                              int frameWidth, int frameHeight) const;
};

} // namespace inference
