#pragma once

#include <chrono>
#include <cstdint>
#include <opencv2/core.hpp>

namespace core {

/**
 * One decoded video frame (BGR, CV_8UC3).
 *
 * Move-only: exactly one pipeline stage owns a Frame at a time. The source
 * creates it, the compositor turns it into the output frame and the sink
 * receives it at the end of the cycle.
 */
struct Frame {
    cv::Mat image;

    uint64_t index = 0;  // Capture order, starts at 0 for every opened source

    std::chrono::time_point<std::chrono::steady_clock> timestamp;  // Host arrival

    Frame() = default;
    Frame(cv::Mat img, uint64_t idx)
        : image(std::move(img)), index(idx), timestamp(std::chrono::steady_clock::now()) {}

    Frame(Frame&&) = default;
    Frame& operator=(Frame&&) = default;
    Frame(const Frame&) = delete;
    Frame& operator=(const Frame&) = delete;

    [[nodiscard]] int width() const { return image.cols; }
    [[nodiscard]] int height() const { return image.rows; }
    [[nodiscard]] bool empty() const { return image.empty(); }
};

} // namespace core
