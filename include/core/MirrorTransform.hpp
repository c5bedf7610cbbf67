#pragma once

#include "core/Pose.hpp"

namespace core {

/**
 * Horizontal reflection parameters for one frame size.
 * Negative offsets place the mirrored skeleton to the left of the reflection.
 */
struct MirrorConfig {
    int offsetX = DEFAULT_OFFSET_X;
    int frameWidth = 0;
    int frameHeight = 0;

    /**
     * Throws InvalidConfiguration for non-positive frame dimensions.
     */
    void validate() const;
};

/**
 * Reflects every landmark about the vertical frame axis and shifts it by offsetX pixels:
 *   mirrored_x_pixels = (frameWidth - x * frameWidth) + offsetX
 *
 * Input and output stay normalized (pixels / frameWidth). y, z and visibility
 * are copied unchanged. Results are not clipped; off-screen landmarks are the
 * renderer's concern.
 *
 * Applying mirror() twice with the same offset restores x; with the inverse
 * offset the result is x - 2 * offsetX / frameWidth.
 * The arithmetic runs in double but x is stored back as float, so a round
 * trip only restores x to about 1e-6 (at |offsetX| <= MAX_ABS_OFFSET_X).
 */
[[nodiscard]] Pose mirror(const Pose& pose, const MirrorConfig& config);

/**
 * Normalized -> pixel conversion shared by the renderer and the mirror transform.
 * Rounds to the nearest pixel and clamps to +/-MAX_PIXEL_COORD. normalized must be finite.
 */
[[nodiscard]] int toPixel(double normalized, int extent);

} // namespace core
