#pragma once

#include <optional>
#include <string>

#include "core/FrameCompositor.hpp"
#include "core/Logger.hpp"
#include "core/StreamDriver.hpp"
#include "core/VideoSource.hpp"

namespace core {

/**
 * Complete run configuration, built once from the command line and then
 * passed down by value. Nothing in here changes while the stream runs.
 */
struct AppConfig {
    std::optional<SourceSpec> source;  // --input PATH or --webcam N

    CompositorConfig compositor;
    StreamDriver::Options driver;

    std::string modelPath = "models/pose_landmark_full.onnx";

    // Sinks
    bool display = true;
    std::string windowName = "Dance Companion - Pose Mirroring";
    std::string outputPath;  // Empty = no video file
    int mjpegPort = 0;       // 0 = no preview server

    LogLevel logLevel = LogLevel::INFO;
    bool showHelp = false;

    /**
     * Throws InvalidConfiguration describing the first problem found.
     */
    void validate() const;
};

/**
 * Parses the command line (getopt_long). Malformed values throw
 * InvalidConfiguration; the result is not validated yet.
 */
AppConfig parseCommandLine(int argc, char** argv);

std::string usage(const std::string& programName);

} // namespace core
