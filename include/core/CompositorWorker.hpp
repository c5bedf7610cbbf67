#pragma once

#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <thread>

#include "core/FrameCompositor.hpp"
#include "core/SequenceBuffer.hpp"
#include "core/SpscQueue.hpp"
#include "core/Types.hpp"

namespace core {

/**
 * Dedicated compositing thread.
 *
 * Owns one FrameCompositor (and therefore one detector instance). Frames are
 * submitted through a lock-free SPSC queue by the stream driver and finished
 * frames are handed to the shared SequenceBuffer for in-order emission.
 */
class CompositorWorker {
public:
    CompositorWorker(int id, std::unique_ptr<FrameCompositor> compositor, SequenceBuffer& output);
    ~CompositorWorker();

    CompositorWorker(const CompositorWorker&) = delete;
    CompositorWorker& operator=(const CompositorWorker&) = delete;

    /**
     * Starts (or restarts) the thread and clears a previous error.
     */
    void start();

    /**
     * Stops after the frame currently being composited; queued frames are dropped.
     */
    void stop();

    /**
     * Queues a frame (moved from on success). Driver thread only.
     */
    bool submit(Frame& frame);

    [[nodiscard]] bool hasError() const { return hasError_; }

    /**
     * Exception that terminated the worker, if any.
     */
    [[nodiscard]] std::exception_ptr error() const;

    [[nodiscard]] uint64_t framesProcessed() const { return framesProcessed_; }
    [[nodiscard]] uint64_t posesDetected() const { return posesDetected_; }
    [[nodiscard]] int id() const { return id_; }

private:
    void loop();

    int id_;
    std::unique_ptr<FrameCompositor> compositor_;
    SequenceBuffer& output_;

    SpscQueue<Frame, MAX_IN_FLIGHT + 1> input_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> hasError_{false};
    std::atomic<uint64_t> framesProcessed_{0};
    std::atomic<uint64_t> posesDetected_{0};

    mutable std::mutex errorMutex_;
    std::exception_ptr error_;
};

} // namespace core
