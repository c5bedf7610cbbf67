#include "core/CompositorWorker.hpp"
#include "core/Logger.hpp"

#include <chrono>

namespace core {

CompositorWorker::CompositorWorker(int id, std::unique_ptr<FrameCompositor> compositor, SequenceBuffer& output)
    : id_(id), compositor_(std::move(compositor)), output_(output) {
}

CompositorWorker::~CompositorWorker() {
    stop();
}

void CompositorWorker::start() {
    if (running_) return;
    if (thread_.joinable()) {
        // Loop already ended on its own after an error
        thread_.join();
    }
    {
        std::lock_guard<std::mutex> lock(errorMutex_);
        error_ = nullptr;
    }
    hasError_ = false;
    running_ = true;
    thread_ = std::thread(&CompositorWorker::loop, this);
    Logger::debug("CompositorWorker ", id_, " started.");
}

void CompositorWorker::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
        Logger::debug("CompositorWorker ", id_, " stopped after ", framesProcessed_.load(), " frames.");
    }
    // Drop anything that was queued but never composited
    while (input_.try_pop()) {
    }
}

bool CompositorWorker::submit(Frame& frame) {
    return input_.try_push(frame);
}

std::exception_ptr CompositorWorker::error() const {
    std::lock_guard<std::mutex> lock(errorMutex_);
    return error_;
}

void CompositorWorker::loop() {
    while (running_) {
        auto frame = input_.try_pop();
        if (!frame) {
            // Queue empty; the driver is slower than us (capture-bound)
            std::this_thread::sleep_for(std::chrono::microseconds(100));
            continue;
        }

        try {
            uint64_t before = compositor_->posesDetected();
            Frame out = compositor_->composite(std::move(*frame));
            if (compositor_->posesDetected() != before) {
                posesDetected_++;
            }
            framesProcessed_++;

            if (!output_.insert(std::move(out))) {
                Logger::warn("CompositorWorker ", id_, ": sequence buffer rejected a frame");
            }
        } catch (const std::exception& e) {
            Logger::error("CompositorWorker ", id_, " failed: ", e.what());
            {
                std::lock_guard<std::mutex> lock(errorMutex_);
                error_ = std::current_exception();
            }
            hasError_ = true;
            running_ = false;
            output_.notify();
        }
    }
}

} // namespace core
