#pragma once

#include <opencv2/core.hpp>

#include "core/Pose.hpp"

namespace core {

/**
 * Drawing parameters for one skeleton. Colors are BGR.
 */
struct RenderStyle {
    int pointRadius = DEFAULT_POINT_RADIUS;
    int lineThickness = DEFAULT_LINE_THICKNESS;
    cv::Scalar pointColor = cv::Scalar(255, 0, 0);  // Blue
    cv::Scalar lineColor = cv::Scalar(0, 0, 255);   // Red

    /**
     * Throws InvalidConfiguration if radius or thickness is out of range.
     */
    void validate() const;
};

/**
 * Draws the pose skeleton onto buffer in place.
 *
 * Connections are drawn first, then landmark circles on top. Only landmarks
 * with visibility above VISIBILITY_THRESHOLD (and finite coordinates) are
 * drawn, and a connection needs both ends drawable. Anything outside the
 * buffer is clipped by OpenCV.
 *
 * @param buffer 8-bit, 3-channel image (std::invalid_argument otherwise)
 */
void render(cv::Mat& buffer, const Pose& pose, const ConnectionList& connections, const RenderStyle& style);

} // namespace core
