#include "core/SequenceBuffer.hpp"

namespace core {

bool SequenceBuffer::insert(Frame frame) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (frame.index < next_) {
            return false;
        }
        auto inserted = pending_.emplace(frame.index, std::move(frame));
        if (!inserted.second) {
            return false;
        }
    }
    cv_.notify_all();
    return true;
}

std::optional<Frame> SequenceBuffer::popLocked() {
    auto it = pending_.find(next_);
    if (it == pending_.end()) {
        return std::nullopt;
    }
    std::optional<Frame> frame(std::move(it->second));
    pending_.erase(it);
    next_++;
    return frame;
}

std::optional<Frame> SequenceBuffer::tryPopNext() {
    std::lock_guard<std::mutex> lock(mutex_);
    return popLocked();
}

std::optional<Frame> SequenceBuffer::waitPopNext(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return pending_.count(next_) > 0; });
    return popLocked();
}

void SequenceBuffer::reset(uint64_t firstIndex) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.clear();
    next_ = firstIndex;
}

void SequenceBuffer::notify() {
    cv_.notify_all();
}

uint64_t SequenceBuffer::nextIndex() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_;
}

size_t SequenceBuffer::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

} // namespace core
