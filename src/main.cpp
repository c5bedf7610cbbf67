#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "core/FrameSink.hpp"
#include "core/Logger.hpp"
#include "core/StreamDriver.hpp"
#include "core/VideoSource.hpp"
#include "inference/PoseLandmarker.hpp"
#include "net/MjpegServer.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>

// Global flag for shutdown, checked by the stream driver between frames
std::atomic<bool> g_running{true};

void signalHandler(int signum) {
    (void)signum;
    g_running = false;
}

int main(int argc, char** argv) {
    core::AppConfig config;
    try {
        config = core::parseCommandLine(argc, argv);
        if (config.showHelp) {
            std::cout << core::usage(argv[0]);
            return 0;
        }
        config.validate();
    } catch (const core::InvalidConfiguration& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << core::usage(argv[0]);
        return 2;
    }

    core::Logger::setLevel(config.logLevel);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    core::Logger::info("Starting Dance Companion...");

    try {
        // 1. Source (fails fast on a missing file or busy device)
        core::VideoSource source(*config.source);

        // 2. Sinks
        core::FanOutSink sinks;
        if (config.display) {
            sinks.add(std::make_unique<core::WindowSink>(config.windowName));
        }
        if (!config.outputPath.empty()) {
            sinks.add(std::make_unique<core::VideoFileSink>(
                config.outputPath, source.fps(), cv::Size(source.width(), source.height())));
        }
        if (config.mjpegPort > 0) {
            auto server = std::make_unique<net::MjpegServer>(config.mjpegPort);
            server->start();
            sinks.add(std::move(server));
        }

        // 3. Detector + driver (one landmark engine per worker)
        inference::PoseLandmarker::Config landmarkerConfig;
        landmarkerConfig.modelPath = config.modelPath;

        core::StreamDriver driver(source, sinks, inference::PoseLandmarker::factory(landmarkerConfig),
                                  config.compositor, config.driver);

        core::Logger::info("Running. Press 'q' in the window or Ctrl+C to exit.");

        // 4. Process until end of stream or cancellation
        auto stats = driver.run(g_running);

        if (stats.cancelled) {
            core::Logger::info("Stopped by user after ", stats.framesEmitted, " frames.");
        }
    } catch (const core::SourceUnavailable& e) {
        core::Logger::error(e.what());
        return 1;
    } catch (const core::InvalidConfiguration& e) {
        core::Logger::error("Invalid configuration: ", e.what());
        return 1;
    } catch (const core::OutputUnavailable& e) {
        core::Logger::error(e.what());
        return 1;
    } catch (const core::InferenceError& e) {
        core::Logger::error(e.what());
        return 1;
    } catch (const std::exception& e) {
        core::Logger::error("Fatal error: ", e.what());
        return 1;
    }

    core::Logger::info("Dance Companion closed.");
    return 0;
}
