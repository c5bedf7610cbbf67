#include "core/SkeletonRenderer.hpp"
#include "core/MirrorTransform.hpp"
#include "core/Errors.hpp"

#include <array>
#include <cmath>
#include <stdexcept>
#include <string>
#include <opencv2/imgproc.hpp>

namespace core {

void RenderStyle::validate() const {
    if (pointRadius <= 0 || pointRadius > MAX_POINT_RADIUS) {
        throw InvalidConfiguration("Point radius must be in [1, " + std::to_string(MAX_POINT_RADIUS) +
                                   "], got " + std::to_string(pointRadius));
    }
    if (lineThickness <= 0 || lineThickness > MAX_LINE_THICKNESS) {
        throw InvalidConfiguration("Line thickness must be in [1, " + std::to_string(MAX_LINE_THICKNESS) +
                                   "], got " + std::to_string(lineThickness));
    }
}

namespace {

bool isDrawable(const Landmark& lm) {
    return lm.isVisible() && std::isfinite(lm.x) && std::isfinite(lm.y);
}

} // namespace

void render(cv::Mat& buffer, const Pose& pose, const ConnectionList& connections, const RenderStyle& style) {
    if (buffer.empty() || buffer.type() != CV_8UC3) {
        throw std::invalid_argument("render: buffer must be a non-empty CV_8UC3 image");
    }

    // Resolve pixel positions once; invisible landmarks stay unresolved
    std::array<bool, NUM_POSE_LANDMARKS> drawable{};
    std::array<cv::Point, NUM_POSE_LANDMARKS> pixels;

    for (size_t i = 0; i < pose.size(); ++i) {
        const Landmark& lm = pose.at(i);
        if (!isDrawable(lm)) continue;
        drawable[i] = true;
        pixels[i] = cv::Point(toPixel(lm.x, buffer.cols), toPixel(lm.y, buffer.rows));
    }

    for (const auto& conn : connections) {
        size_t a = toIndex(conn.first);
        size_t b = toIndex(conn.second);
        if (!drawable[a] || !drawable[b]) continue;
        cv::line(buffer, pixels[a], pixels[b], style.lineColor, style.lineThickness);
    }

    for (size_t i = 0; i < pixels.size(); ++i) {
        if (!drawable[i]) continue;
        cv::circle(buffer, pixels[i], style.pointRadius, style.pointColor, cv::FILLED);
    }
}

} // namespace core
