#include "core/FrameSink.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"

#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>

namespace core {

// ============================================================
// WindowSink
// ============================================================

WindowSink::WindowSink(std::string windowName, int waitMs)
    : windowName_(std::move(windowName)), waitMs_(waitMs < 1 ? 1 : waitMs) {
    cv::namedWindow(windowName_, cv::WINDOW_NORMAL);
}

WindowSink::~WindowSink() {
    try {
        cv::destroyWindow(windowName_);
    } catch (const cv::Exception& e) {
        Logger::warn("WindowSink: destroyWindow failed: ", e.what());
    }
}

bool WindowSink::push(const Frame& frame) {
    if (shown_ && cv::getWindowProperty(windowName_, cv::WND_PROP_VISIBLE) < 1.0) {
        Logger::info("Display window closed");
        return false;
    }

    if (!frame.empty()) {
        cv::imshow(windowName_, frame.image);
        shown_ = true;
    }

    int key = cv::waitKey(waitMs_);
    if ((key & 0xFF) == 'q' || (key & 0xFF) == 27) {
        Logger::info("Stop requested from display window");
        return false;
    }
    return true;
}

// ============================================================
// VideoFileSink
// ============================================================

VideoFileSink::VideoFileSink(const std::string& path, double fps, cv::Size frameSize)
    : path_(path), frameSize_(frameSize) {
    if (fps <= 0.0) {
        fps = 30.0;  // Cameras often report 0
    }

    int fourcc = cv::VideoWriter::fourcc('m', 'p', '4', 'v');
    if (!writer_.open(path_, fourcc, fps, frameSize_)) {
        throw OutputUnavailable("Could not open video writer for '" + path_ + "'");
    }

    Logger::info("Writing composite to ", path_, " (", frameSize_.width, "x", frameSize_.height,
                 " @ ", fps, " FPS)");
}

VideoFileSink::~VideoFileSink() {
    if (writer_.isOpened()) {
        writer_.release();
        Logger::info("Wrote ", framesWritten_, " frames to ", path_);
    }
}

bool VideoFileSink::push(const Frame& frame) {
    if (frame.empty()) return true;

    if (frame.image.size() == frameSize_) {
        writer_.write(frame.image);
    } else {
        cv::Mat resized;
        cv::resize(frame.image, resized, frameSize_);
        writer_.write(resized);
    }
    framesWritten_++;
    return true;
}

// ============================================================
// FanOutSink
// ============================================================

void FanOutSink::add(std::unique_ptr<FrameSink> sink) {
    if (sink) {
        sinks_.push_back(std::move(sink));
    }
}

bool FanOutSink::push(const Frame& frame) {
    bool keepGoing = true;
    for (auto& sink : sinks_) {
        keepGoing = sink->push(frame) && keepGoing;
    }
    return keepGoing;
}

} // namespace core
