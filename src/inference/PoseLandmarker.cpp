/**
 * BlazePose landmark inference via TensorRT.
 * Handles BGR -> RGB letterbox preprocessing and landmark decoding.
 */

#include "inference/PoseLandmarker.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <opencv2/imgproc.hpp>

namespace inference {

namespace {

constexpr size_t VALUES_PER_LANDMARK = 5;  // x, y, z, visibility, presence
constexpr size_t MODEL_LANDMARKS = 39;     // 33 body + 6 auxiliary ROI points

inline float sigmoid(float x) {
    return 1.0f / (1.0f + std::exp(-x));
}

} // namespace

PoseLandmarker::PoseLandmarker() = default;

PoseLandmarker::~PoseLandmarker() = default;

bool PoseLandmarker::init(const Config& config) {
    config_ = config;

    engine_ = std::make_unique<TensorRTEngine>();

    TensorRTEngine::Config trtConfig;
    trtConfig.modelPath = config.modelPath;
    trtConfig.fp16 = config.fp16;

    if (!engine_->load(trtConfig)) {
        core::Logger::error("PoseLandmarker: Failed to load TensorRT engine");
        return false;
    }

    // Input is [1, H, W, 3] (TFLite export) or [1, 3, H, W]
    const auto& in = engine_->getInputInfo();
    size_t expected = static_cast<size_t>(3 * config_.inputWidth * config_.inputHeight);
    if (in.size != expected || in.dims.size() != 4) {
        core::Logger::error("PoseLandmarker: Unexpected input size ", in.size, " (expected ", expected, ")");
        return false;
    }
    channelsFirst_ = (in.dims[1] == 3);

    // Identify outputs by size: landmarks (39 * 5) and presence flag (1)
    const auto& outs = engine_->getOutputInfos();
    for (size_t i = 0; i < outs.size(); ++i) {
        if (outs[i].size == MODEL_LANDMARKS * VALUES_PER_LANDMARK ||
            outs[i].size == core::NUM_POSE_LANDMARKS * VALUES_PER_LANDMARK) {
            landmarkOutput_ = static_cast<int>(i);
        } else if (outs[i].size == 1 && presenceOutput_ < 0) {
            presenceOutput_ = static_cast<int>(i);
        }
    }

    if (landmarkOutput_ < 0) {
        core::Logger::error("PoseLandmarker: No landmark output found (expected ",
                            MODEL_LANDMARKS * VALUES_PER_LANDMARK, " values)");
        return false;
    }
    if (presenceOutput_ < 0) {
        core::Logger::warn("PoseLandmarker: No presence output, using mean landmark presence instead");
    }

    inputBuffer_.resize(expected);

    initialized_ = true;
    core::Logger::info("PoseLandmarker initialized");
    core::Logger::info("  Input: ", config_.inputWidth, "x", config_.inputHeight,
                       channelsFirst_ ? " NCHW" : " NHWC");
    core::Logger::info("  Outputs: landmarks=#", landmarkOutput_, " presence=#", presenceOutput_);

    return true;
}

core::PoseDetectorFactory PoseLandmarker::factory(const Config& config) {
    return [config]() -> std::unique_ptr<core::PoseDetector> {
        auto landmarker = std::make_unique<PoseLandmarker>();
        if (!landmarker->init(config)) {
            throw core::InferenceError("Could not load pose landmark model '" + config.modelPath + "'");
        }
        return landmarker;
    };
}

std::optional<core::Pose> PoseLandmarker::detect(const cv::Mat& bgrImage) {
    if (!initialized_) {
        throw core::InferenceError("PoseLandmarker used before init()");
    }
    if (bgrImage.empty()) {
        return std::nullopt;
    }

    Letterbox box = preprocess(bgrImage);

    if (!engine_->infer(inputBuffer_.data(), outputBuffers_)) {
        throw core::InferenceError("PoseLandmarker: inference failed");
    }

    const auto& raw = outputBuffers_[landmarkOutput_];

    float presence = 0.0f;
    if (presenceOutput_ >= 0) {
        presence = outputBuffers_[presenceOutput_][0];
    } else {
        for (size_t i = 0; i < core::NUM_POSE_LANDMARKS; ++i) {
            presence += sigmoid(raw[i * VALUES_PER_LANDMARK + 4]);
        }
        presence /= static_cast<float>(core::NUM_POSE_LANDMARKS);
    }

    if (presence < config_.presenceThreshold) {
        return std::nullopt;
    }

    return parseLandmarks(raw, box, bgrImage.cols, bgrImage.rows);
}

PoseLandmarker::Letterbox PoseLandmarker::preprocess(const cv::Mat& bgrImage) {
    Letterbox box;
    box.scale = std::min(config_.inputWidth / static_cast<float>(bgrImage.cols),
                         config_.inputHeight / static_cast<float>(bgrImage.rows));

    int newW = std::max(1, static_cast<int>(std::round(bgrImage.cols * box.scale)));
    int newH = std::max(1, static_cast<int>(std::round(bgrImage.rows * box.scale)));
    // Whole-pixel padding, matches the ROI copy below
    box.padX = static_cast<float>((config_.inputWidth - newW) / 2);
    box.padY = static_cast<float>((config_.inputHeight - newH) / 2);

    cv::Mat resized;
    cv::resize(bgrImage, resized, cv::Size(newW, newH), 0, 0, cv::INTER_LINEAR);

    cv::Mat canvas = cv::Mat::zeros(config_.inputHeight, config_.inputWidth, CV_8UC3);
    resized.copyTo(canvas(cv::Rect(static_cast<int>(box.padX), static_cast<int>(box.padY), newW, newH)));

    cv::Mat rgb;
    cv::cvtColor(canvas, rgb, cv::COLOR_BGR2RGB);

    if (!channelsFirst_) {
        // NHWC: write straight into the input buffer
        cv::Mat dst(config_.inputHeight, config_.inputWidth, CV_32FC3, inputBuffer_.data());
        rgb.convertTo(dst, CV_32FC3, 1.0 / 255.0);
    } else {
        const int planeSize = config_.inputWidth * config_.inputHeight;
        std::vector<cv::Mat> planes = {
            cv::Mat(config_.inputHeight, config_.inputWidth, CV_32FC1, inputBuffer_.data()),
            cv::Mat(config_.inputHeight, config_.inputWidth, CV_32FC1, inputBuffer_.data() + planeSize),
            cv::Mat(config_.inputHeight, config_.inputWidth, CV_32FC1, inputBuffer_.data() + 2 * planeSize)
        };
        cv::Mat rgbFloat;
        rgb.convertTo(rgbFloat, CV_32FC3, 1.0 / 255.0);
        cv::split(rgbFloat, planes);
    }

    return box;
}

core::Pose PoseLandmarker::parseLandmarks(const std::vector<float>& raw, const Letterbox& box,
                                          int frameWidth, int frameHeight) const {
    core::Pose::Landmarks landmarks;

    const float contentW = frameWidth * box.scale;
    const float contentH = frameHeight * box.scale;

    for (size_t i = 0; i < core::NUM_POSE_LANDMARKS; ++i) {
        const float* v = &raw[i * VALUES_PER_LANDMARK];

        // Input pixels -> remove letterbox padding -> normalized to the original frame.
        // No clamping: landmarks slightly outside the frame are legitimate.
        landmarks[i].x = (v[0] - box.padX) / contentW;
        landmarks[i].y = (v[1] - box.padY) / contentH;
        landmarks[i].z = v[2] / static_cast<float>(config_.inputWidth);
        landmarks[i].visibility = sigmoid(v[3]);
    }

    return core::Pose(landmarks);
}

} // namespace inference
