#pragma once

#include <optional>
#include <string>
#include <variant>
#include <opencv2/videoio.hpp>

#include "core/Frame.hpp"

namespace core {

/**
 * Lazy sequence of decoded frames.
 *
 * Finite for files, effectively infinite for cameras. Not restartable: once
 * next() returned std::nullopt the source stays exhausted.
 */
class FrameSource {
public:
    virtual ~FrameSource() = default;

    /**
     * Next frame in capture order, std::nullopt at end of stream.
     */
    virtual std::optional<Frame> next() = 0;

    [[nodiscard]] virtual bool isLive() const = 0;
    [[nodiscard]] virtual int width() const = 0;
    [[nodiscard]] virtual int height() const = 0;
    [[nodiscard]] virtual double fps() const = 0;
};

/**
 * Video file path or camera device index.
 */
using SourceSpec = std::variant<std::string, int>;

std::string describe(const SourceSpec& spec);

/**
 * OpenCV capture backed source (file or V4L2 device).
 * The device is opened in the constructor; failure throws SourceUnavailable.
 */
class VideoSource : public FrameSource {
public:
    explicit VideoSource(const SourceSpec& spec);
    ~VideoSource() override;

    VideoSource(const VideoSource&) = delete;
    VideoSource& operator=(const VideoSource&) = delete;

    std::optional<Frame> next() override;

    [[nodiscard]] bool isLive() const override { return live_; }
    [[nodiscard]] int width() const override { return width_; }
    [[nodiscard]] int height() const override { return height_; }
    [[nodiscard]] double fps() const override { return fps_; }

    void release();

private:
    cv::VideoCapture capture_;
    std::string description_;
    bool live_ = false;
    bool exhausted_ = false;

    int width_ = 0;
    int height_ = 0;
    double fps_ = 0.0;

    uint64_t nextIndex_ = 0;
};

} // namespace core
