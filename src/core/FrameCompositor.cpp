#include "core/FrameCompositor.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <opencv2/core.hpp>

namespace core {

void CompositorConfig::validate() const {
    if (std::abs(offsetX) > MAX_ABS_OFFSET_X) {
        throw InvalidConfiguration("Offset must be in [-" + std::to_string(MAX_ABS_OFFSET_X) + ", " +
                                   std::to_string(MAX_ABS_OFFSET_X) + "], got " + std::to_string(offsetX));
    }
    originalStyle.validate();
    mirroredStyle.validate();
}

FrameCompositor::FrameCompositor(std::unique_ptr<PoseDetector> detector, const CompositorConfig& config)
    : detector_(std::move(detector)), config_(config) {
    if (!detector_) {
        throw std::invalid_argument("FrameCompositor: detector is null");
    }
    config_.validate();
}

Frame FrameCompositor::composite(Frame source) {
    if (source.empty()) {
        return source;
    }

    std::optional<Pose> pose = detector_->detect(source.image);
    if (!pose) {
        // Pass-through: hand the untouched source on
        return source;
    }

    posesDetected_++;
    Logger::debug("Frame ", source.index, ": pose with ", pose->visibleCount(), " visible landmarks");

    source.image = overlay(source.image, *pose);
    return source;
}

cv::Mat FrameCompositor::overlay(const cv::Mat& image, const Pose& pose) const {
    cv::Mat buffer = image.clone();

    render(buffer, pose, POSE_CONNECTIONS, config_.originalStyle);

    MirrorConfig mirrorConfig;
    mirrorConfig.offsetX = config_.offsetX;
    mirrorConfig.frameWidth = buffer.cols;
    mirrorConfig.frameHeight = buffer.rows;
    Pose mirrored = mirror(pose, mirrorConfig);

    if (config_.mirroredBlend == BlendMode::Overwrite) {
        render(buffer, mirrored, POSE_CONNECTIONS, config_.mirroredStyle);
    } else {
        cv::Mat replica = cv::Mat::zeros(buffer.size(), buffer.type());
        render(replica, mirrored, POSE_CONNECTIONS, config_.mirroredStyle);
        cv::add(buffer, replica, buffer);
    }

    return buffer;
}

} // namespace core
