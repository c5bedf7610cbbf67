#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <vector>

#include "core/CompositorWorker.hpp"
#include "core/FrameCompositor.hpp"
#include "core/FrameSink.hpp"
#include "core/PoseDetector.hpp"
#include "core/SequenceBuffer.hpp"
#include "core/VideoSource.hpp"

namespace core {

/**
 * Pulls frames from a FrameSource, composites them and pushes the results to
 * a FrameSink in capture order.
 *
 * workers == 1 runs frame-synchronously on the calling thread. With more
 * workers, frames are dispatched round-robin to CompositorWorker threads; at
 * most maxInFlight frames are dispatched but not yet emitted, and a
 * SequenceBuffer restores capture order before the sink.
 *
 * Cancellation (running == false, or the sink returning false) is only
 * honoured between frames, so a partially rendered buffer is never emitted.
 */
class StreamDriver {
public:
    struct Options {
        int workers = 1;
        int maxInFlight = 0;  // 0 = 2 * workers

        /**
         * Throws InvalidConfiguration for out-of-range values.
         */
        void validate() const;
        [[nodiscard]] int effectiveInFlight() const;
    };

    struct Stats {
        uint64_t framesRead = 0;
        uint64_t framesEmitted = 0;
        uint64_t framesWithPose = 0;
        bool cancelled = false;
        double fps = 0.0;
    };

    /**
     * Creates one detector per worker through detectorFactory; detector
     * construction errors propagate from here, before any frame is read.
     */
    StreamDriver(FrameSource& source,
                 FrameSink& sink,
                 const PoseDetectorFactory& detectorFactory,
                 const CompositorConfig& config,
                 const Options& options);
    ~StreamDriver();

    StreamDriver(const StreamDriver&) = delete;
    StreamDriver& operator=(const StreamDriver&) = delete;

    /**
     * Processes the stream until end of stream or cancellation.
     * Rethrows the first exception raised by a compositor.
     */
    Stats run(const std::atomic<bool>& running);

private:
    Stats runSynchronous(const std::atomic<bool>& running);
    Stats runParallel(const std::atomic<bool>& running);

    void stopWorkers();
    void rethrowWorkerError() const;
    void logProgress(const Stats& stats, bool final);

    FrameSource& source_;
    FrameSink& sink_;
    Options options_;

    std::unique_ptr<FrameCompositor> compositor_;             // workers == 1
    std::vector<std::unique_ptr<CompositorWorker>> workers_;  // workers > 1
    SequenceBuffer ordered_;

    std::chrono::steady_clock::time_point startTime_;
    std::chrono::steady_clock::time_point lastStatsTime_;
    uint64_t lastStatsFrames_ = 0;
};

} // namespace core
