#include "core/StreamDriver.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <thread>

namespace core {

void StreamDriver::Options::validate() const {
    if (workers < 1 || workers > MAX_WORKERS) {
        throw InvalidConfiguration("Workers must be in [1, " + std::to_string(MAX_WORKERS) +
                                   "], got " + std::to_string(workers));
    }
    if (maxInFlight != 0 && (maxInFlight < workers || maxInFlight > MAX_IN_FLIGHT)) {
        throw InvalidConfiguration("In-flight window must be in [" + std::to_string(workers) + ", " +
                                   std::to_string(MAX_IN_FLIGHT) + "], got " + std::to_string(maxInFlight));
    }
}

int StreamDriver::Options::effectiveInFlight() const {
    if (maxInFlight > 0) return maxInFlight;
    return std::min(2 * workers, MAX_IN_FLIGHT);
}

StreamDriver::StreamDriver(FrameSource& source,
                           FrameSink& sink,
                           const PoseDetectorFactory& detectorFactory,
                           const CompositorConfig& config,
                           const Options& options)
    : source_(source), sink_(sink), options_(options) {
    options_.validate();
    config.validate();

    if (!detectorFactory) {
        throw std::invalid_argument("StreamDriver: detector factory is empty");
    }

    if (options_.workers == 1) {
        compositor_ = std::make_unique<FrameCompositor>(detectorFactory(), config);
    } else {
        for (int i = 0; i < options_.workers; ++i) {
            auto compositor = std::make_unique<FrameCompositor>(detectorFactory(), config);
            workers_.push_back(std::make_unique<CompositorWorker>(i, std::move(compositor), ordered_));
        }
    }
}

StreamDriver::~StreamDriver() {
    stopWorkers();
}

StreamDriver::Stats StreamDriver::run(const std::atomic<bool>& running) {
    startTime_ = std::chrono::steady_clock::now();
    lastStatsTime_ = startTime_;
    lastStatsFrames_ = 0;

    Logger::info("StreamDriver started (", options_.workers, " worker(s), in-flight window ",
                 options_.workers == 1 ? 1 : options_.effectiveInFlight(), ")");

    Stats stats = (options_.workers == 1) ? runSynchronous(running) : runParallel(running);

    double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime_).count();
    stats.fps = seconds > 0.0 ? static_cast<double>(stats.framesEmitted) / seconds : 0.0;

    logProgress(stats, true);
    return stats;
}

StreamDriver::Stats StreamDriver::runSynchronous(const std::atomic<bool>& running) {
    Stats stats;
    const uint64_t posesBefore = compositor_->posesDetected();

    while (true) {
        if (!running) {
            stats.cancelled = true;
            break;
        }

        std::optional<Frame> frame = source_.next();
        if (!frame) {
            break;
        }
        frame->index = stats.framesRead++;

        Frame out = compositor_->composite(std::move(*frame));
        stats.framesEmitted++;

        if (!sink_.push(out)) {
            stats.cancelled = true;
            break;
        }
        logProgress(stats, false);
    }

    stats.framesWithPose = compositor_->posesDetected() - posesBefore;
    return stats;
}

StreamDriver::Stats StreamDriver::runParallel(const std::atomic<bool>& running) {
    Stats stats;
    const uint64_t window = static_cast<uint64_t>(options_.effectiveInFlight());
    bool endOfStream = false;

    // Every run is a new stream numbered from 0; nothing from a cancelled run survives
    ordered_.reset();

    uint64_t posesBefore = 0;
    for (const auto& worker : workers_) {
        posesBefore += worker->posesDetected();
    }

    for (auto& worker : workers_) {
        worker->start();
    }

    // Returns false if the sink asked to stop
    auto emit = [&](const Frame& frame) {
        stats.framesEmitted++;
        bool keepGoing = sink_.push(frame);
        logProgress(stats, false);
        return keepGoing;
    };

    try {
        while (true) {
            while (running) {
                auto ready = ordered_.tryPopNext();
                if (!ready) break;
                if (!emit(*ready)) {
                    stats.cancelled = true;
                    break;
                }
            }
            if (stats.cancelled) break;

            rethrowWorkerError();

            if (!running) {
                stats.cancelled = true;
                break;
            }

            uint64_t inFlight = stats.framesRead - stats.framesEmitted;
            if (endOfStream && inFlight == 0) {
                break;
            }

            if (!endOfStream && inFlight < window) {
                std::optional<Frame> frame = source_.next();
                if (!frame) {
                    endOfStream = true;
                    continue;
                }
                frame->index = stats.framesRead;

                auto& worker = workers_[stats.framesRead % workers_.size()];
                // Each worker queue holds MAX_IN_FLIGHT frames, more than the window
                while (!worker->submit(*frame)) {
                    rethrowWorkerError();
                    std::this_thread::sleep_for(std::chrono::microseconds(100));
                }
                stats.framesRead++;
                continue;
            }

            // Window full or draining: wait for the next frame in order
            if (auto ready = ordered_.waitPopNext(std::chrono::milliseconds(10))) {
                if (!emit(*ready)) {
                    stats.cancelled = true;
                    break;
                }
            }
        }
    } catch (...) {
        stopWorkers();
        throw;
    }

    stopWorkers();

    if (stats.cancelled && stats.framesRead > stats.framesEmitted) {
        Logger::info("Discarded ", stats.framesRead - stats.framesEmitted, " in-flight frame(s) on stop");
    }

    for (const auto& worker : workers_) {
        stats.framesWithPose += worker->posesDetected();
    }
    stats.framesWithPose -= posesBefore;
    return stats;
}

void StreamDriver::stopWorkers() {
    for (auto& worker : workers_) {
        worker->stop();
    }
}

void StreamDriver::rethrowWorkerError() const {
    for (const auto& worker : workers_) {
        if (worker->hasError()) {
            if (auto err = worker->error()) {
                std::rethrow_exception(err);
            }
        }
    }
}

void StreamDriver::logProgress(const Stats& stats, bool final) {
    auto now = std::chrono::steady_clock::now();

    if (final) {
        Logger::info("StreamDriver ", stats.cancelled ? "cancelled" : "finished", ": ",
                     stats.framesRead, " read, ", stats.framesEmitted, " emitted, ",
                     stats.framesWithPose, " with pose, ", stats.fps, " FPS");
        return;
    }

    auto elapsed = now - lastStatsTime_;
    if (elapsed >= STATS_INTERVAL) {
        double seconds = std::chrono::duration<double>(elapsed).count();
        Logger::debug("Throughput: ", (stats.framesEmitted - lastStatsFrames_) / seconds, " FPS (",
                      stats.framesEmitted, " frames)");
        lastStatsTime_ = now;
        lastStatsFrames_ = stats.framesEmitted;
    }
}

} // namespace core
