#pragma once

#include <memory>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include "core/Frame.hpp"
#include "core/Types.hpp"

namespace core {

/**
 * Receives finished frames one at a time, in capture order.
 * push() may block (display refresh, encoder). Returning false asks the
 * stream driver to stop after this frame.
 */
class FrameSink {
public:
    virtual ~FrameSink() = default;
    virtual bool push(const Frame& frame) = 0;
};

/**
 * HighGUI window. Pressing 'q'/ESC or closing the window stops the stream.
 */
class WindowSink : public FrameSink {
public:
    explicit WindowSink(std::string windowName, int waitMs = DISPLAY_WAIT_MS);
    ~WindowSink() override;

    WindowSink(const WindowSink&) = delete;
    WindowSink& operator=(const WindowSink&) = delete;

    bool push(const Frame& frame) override;

private:
    std::string windowName_;
    int waitMs_;
    bool shown_ = false;
};

/**
 * Encodes the composite to a video file (mp4v).
 * Throws OutputUnavailable if the writer cannot be opened.
 */
class VideoFileSink : public FrameSink {
public:
    VideoFileSink(const std::string& path, double fps, cv::Size frameSize);
    ~VideoFileSink() override;

    bool push(const Frame& frame) override;

    [[nodiscard]] uint64_t framesWritten() const { return framesWritten_; }

private:
    cv::VideoWriter writer_;
    std::string path_;
    cv::Size frameSize_;
    uint64_t framesWritten_ = 0;
};

/**
 * Forwards every frame to all children; stops if any child asks to stop.
 */
class FanOutSink : public FrameSink {
public:
    void add(std::unique_ptr<FrameSink> sink);
    bool push(const Frame& frame) override;

    [[nodiscard]] size_t size() const { return sinks_.size(); }

private:
    std::vector<std::unique_ptr<FrameSink>> sinks_;
};

} // namespace core
