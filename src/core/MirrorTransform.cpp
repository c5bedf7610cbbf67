#include "core/MirrorTransform.hpp"
#include "core/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace core {

void MirrorConfig::validate() const {
    if (frameWidth <= 0 || frameHeight <= 0) {
        throw InvalidConfiguration("Mirror: invalid frame size " + std::to_string(frameWidth) +
                                   "x" + std::to_string(frameHeight));
    }
}

Pose mirror(const Pose& pose, const MirrorConfig& config) {
    config.validate();

    const double width = static_cast<double>(config.frameWidth);

    Pose::Landmarks out = pose.landmarks();
    for (auto& lm : out) {
        double xPixels = static_cast<double>(lm.x) * width;
        double mirroredPixels = (width - xPixels) + config.offsetX;
        lm.x = static_cast<float>(mirroredPixels / width);
    }
    return Pose(out);
}

int toPixel(double normalized, int extent) {
    double px = std::round(normalized * extent);
    px = std::clamp(px, static_cast<double>(-MAX_PIXEL_COORD), static_cast<double>(MAX_PIXEL_COORD));
    return static_cast<int>(px);
}

} // namespace core
