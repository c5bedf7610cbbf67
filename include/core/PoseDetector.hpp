#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <opencv2/core.hpp>

#include "core/Pose.hpp"

namespace core {

/**
 * Source of per-frame landmarks.
 *
 * detect() returns std::nullopt when no body is found; that is an ordinary
 * per-frame outcome. Implementations may keep scratch buffers and are not
 * required to be thread-safe; give every worker thread its own instance.
 */
class PoseDetector {
public:
    virtual ~PoseDetector() = default;

    /**
     * @param bgrImage Decoded frame, CV_8UC3 BGR
     * @return Normalized landmarks of one body, or nullopt
     */
    virtual std::optional<Pose> detect(const cv::Mat& bgrImage) = 0;
};

using PoseDetectorFactory = std::function<std::unique_ptr<PoseDetector>()>;

} // namespace core
