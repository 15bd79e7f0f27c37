/**
 * @file InputSurface.hpp
 * @brief Frame queue that feeds one encoder instance.
 *
 * The capture side pushes RGBA frames, the encoding thread pops them.
 * A surface belongs to exactly one prepared encoder; once that encoder is
 * stopped or released the surface is closed and further frames are
 * dropped, so a capture source that still holds an old handle cannot
 * write into the next segment.
 *
 * @section Patterns
 * - Producer-Consumer: bounded queue, drop-oldest on overflow.
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <vector>
#include "util/Types.hpp"

namespace evc {

struct VideoFrame {
    std::vector<u8> data; // RGBA, width * height * 4 bytes
    u32 width{0};
    u32 height{0};
    i64 timestamp{0}; // ms
};

class InputSurface {
public:
    InputSurface(u32 width, u32 height, usize capacity = 8);

    InputSurface(const InputSurface&) = delete;
    InputSurface& operator=(const InputSurface&) = delete;

    u32 width() const {
        return width_;
    }
    u32 height() const {
        return height_;
    }

    // Returns false when the frame was rejected (closed or wrong size)
    bool pushFrame(VideoFrame frame);

    // Waits up to timeoutMs for a frame
    bool nextFrame(VideoFrame& frame, u32 timeoutMs);

    bool hasFrames() const;

    void close();
    bool isOpen() const {
        return open_;
    }

    u64 framesReceived() const {
        return framesReceived_;
    }
    u64 framesDropped() const {
        return framesDropped_;
    }

private:
    const u32 width_;
    const u32 height_;
    const usize capacity_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<VideoFrame> queue_;

    std::atomic<bool> open_{true};
    std::atomic<u64> framesReceived_{0};
    std::atomic<u64> framesDropped_{0};
};

} // namespace evc
