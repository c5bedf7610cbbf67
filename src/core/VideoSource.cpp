#include "core/VideoSource.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"

#include <filesystem>
#include <opencv2/imgproc.hpp>

namespace core {

std::string describe(const SourceSpec& spec) {
    if (std::holds_alternative<int>(spec)) {
        return "webcam #" + std::to_string(std::get<int>(spec));
    }
    return "file '" + std::get<std::string>(spec) + "'";
}

VideoSource::VideoSource(const SourceSpec& spec) : description_(describe(spec)) {
    if (std::holds_alternative<int>(spec)) {
        live_ = true;
        capture_.open(std::get<int>(spec));
    } else {
        const auto& path = std::get<std::string>(spec);
        if (!std::filesystem::exists(path)) {
            throw SourceUnavailable("Could not open video source " + description_ + ": no such file");
        }
        capture_.open(path);
    }

    if (!capture_.isOpened()) {
        throw SourceUnavailable("Could not open video source " + description_);
    }

    width_ = static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_WIDTH));
    height_ = static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_HEIGHT));
    fps_ = capture_.get(cv::CAP_PROP_FPS);

    Logger::info("Opened ", description_, ": ", width_, "x", height_, " @ ", fps_, " FPS",
                 live_ ? " (live)" : "");
}

VideoSource::~VideoSource() {
    release();
}

void VideoSource::release() {
    if (capture_.isOpened()) {
        capture_.release();
        Logger::debug("Released ", description_);
    }
    exhausted_ = true;
}

std::optional<Frame> VideoSource::next() {
    if (exhausted_) {
        return std::nullopt;
    }

    cv::Mat image;
    if (!capture_.read(image) || image.empty()) {
        // End of file, or the device went away; either ends the stream
        Logger::info("End of stream on ", description_, " after ", nextIndex_, " frames");
        exhausted_ = true;
        return std::nullopt;
    }

    // Some backends deliver grayscale or BGRA; the pipeline is BGR only
    if (image.type() == CV_8UC1) {
        cv::cvtColor(image, image, cv::COLOR_GRAY2BGR);
    } else if (image.type() == CV_8UC4) {
        cv::cvtColor(image, image, cv::COLOR_BGRA2BGR);
    }

    if (width_ <= 0 || height_ <= 0) {
        width_ = image.cols;
        height_ = image.rows;
    }

    return Frame(std::move(image), nextIndex_++);
}

} // namespace core
