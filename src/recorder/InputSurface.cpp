#include "InputSurface.hpp"
#include <algorithm>

namespace evc {

InputSurface::InputSurface(u32 width, u32 height, usize capacity)
    : width_(width), height_(height), capacity_(std::max<usize>(capacity, 1)) {
}

bool InputSurface::pushFrame(VideoFrame frame) {
    if (!open_)
        return false;
    if (frame.width != width_ || frame.height != height_ ||
        frame.data.size() < static_cast<usize>(width_) * height_ * 4) {
        ++framesDropped_;
        return false;
    }

    {
        std::lock_guard lock(mutex_);
        if (!open_)
            return false;
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            ++framesDropped_;
        }
        queue_.push_back(std::move(frame));
        ++framesReceived_;
    }
    cv_.notify_one();
    return true;
}

bool InputSurface::nextFrame(VideoFrame& frame, u32 timeoutMs) {
    std::unique_lock lock(mutex_);
    if (!cv_.wait_for(lock, std::chrono::milliseconds(timeoutMs), [this] {
            return !queue_.empty() || !open_;
        })) {
        return false;
    }
    if (queue_.empty())
        return false;

    frame = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

bool InputSurface::hasFrames() const {
    std::lock_guard lock(mutex_);
    return !queue_.empty();
}

void InputSurface::close() {
    {
        std::lock_guard lock(mutex_);
        open_ = false;
    }
    cv_.notify_all();
}

} // namespace evc
