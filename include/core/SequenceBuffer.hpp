#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>

#include "core/Frame.hpp"

namespace core {

/**
 * Re-orders frames finished by several workers back into capture order.
 *
 * Workers insert() frames in any order; the driver pops them strictly by
 * increasing index, starting at 0. A frame is only released once every lower
 * index has been released.
 */
class SequenceBuffer {
public:
    explicit SequenceBuffer(uint64_t firstIndex = 0) : next_(firstIndex) {}

    SequenceBuffer(const SequenceBuffer&) = delete;
    SequenceBuffer& operator=(const SequenceBuffer&) = delete;

    /**
     * Stores a finished frame. Frames with an index already released, or a
     * duplicate index, are rejected (returns false).
     */
    bool insert(Frame frame);

    /**
     * Next frame in sequence if it is available, without blocking.
     */
    std::optional<Frame> tryPopNext();

    /**
     * Waits up to timeout for the next frame in sequence.
     */
    std::optional<Frame> waitPopNext(std::chrono::milliseconds timeout);

    /**
     * Drops every pending frame and restarts the sequence at firstIndex.
     * Only call while no worker is inserting.
     */
    void reset(uint64_t firstIndex = 0);

    /**
     * Wakes waitPopNext() callers, e.g. after a worker failed.
     */
    void notify();

    [[nodiscard]] uint64_t nextIndex() const;
    [[nodiscard]] size_t pending() const;

private:
    std::optional<Frame> popLocked();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<uint64_t, Frame> pending_;
    uint64_t next_;
};

} // namespace core
