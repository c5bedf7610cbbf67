#pragma once

#include <memory>
#include <optional>
#include <opencv2/core.hpp>

#include "core/Frame.hpp"
#include "core/MirrorTransform.hpp"
#include "core/PoseDetector.hpp"
#include "core/SkeletonRenderer.hpp"

namespace core {

/**
 * How the mirrored skeleton is combined with the buffer that already holds
 * the original skeleton.
 */
enum class BlendMode {
    Overwrite,  // Draw straight into the buffer, last draw wins
    Additive    // Draw onto a black canvas, then saturating-add it to the buffer
};

struct CompositorConfig {
    int offsetX = DEFAULT_OFFSET_X;
    RenderStyle originalStyle;
    RenderStyle mirroredStyle;
    BlendMode mirroredBlend = BlendMode::Additive;

    /**
     * Throws InvalidConfiguration for bad styles or |offsetX| > MAX_ABS_OFFSET_X.
     */
    void validate() const;
};

/**
 * Per-frame pipeline: detect -> render original -> mirror -> render mirrored.
 *
 * Holds no per-frame state. One instance is used by one thread at a time
 * because the detector may not be thread-safe.
 */
class FrameCompositor {
public:
    FrameCompositor(std::unique_ptr<PoseDetector> detector, const CompositorConfig& config);

    /**
     * Composites one frame. Without a pose the source frame is returned
     * untouched; otherwise the result is a new buffer holding both skeletons.
     * Index and timestamp are carried over.
     */
    Frame composite(Frame source);

    /**
     * Render stage only: copy of image with the original and mirrored skeletons.
     */
    [[nodiscard]] cv::Mat overlay(const cv::Mat& image, const Pose& pose) const;

    [[nodiscard]] const CompositorConfig& config() const { return config_; }

    // Number of frames that had a pose since construction
    [[nodiscard]] uint64_t posesDetected() const { return posesDetected_; }

private:
    std::unique_ptr<PoseDetector> detector_;
    CompositorConfig config_;
    uint64_t posesDetected_ = 0;
};

} // namespace core
