/**
 * @file EncoderThread.hpp
 * @brief Encoding loop for one segment.
 *
 * This file defines the EncoderThread class which drains an InputSurface
 * and feeds VideoEncoderFFmpeg from a dedicated thread, so the capture side
 * never blocks on the encoder.
 *
 * @section Patterns
 * - Producer-Consumer: Consumes frames pushed by the capture session.
 * - RAII: Manages the lifecycle of the encoding thread using std::jthread.
 */

#pragma once
#include <atomic>
#include <thread>
#include "EncoderBackend.hpp"
#include "VideoEncoderFFmpeg.hpp"

namespace evc {

class EncoderThread {
public:
    EncoderThread(VideoEncoderFFmpeg& encoder, SurfaceHandle surface);
    ~EncoderThread();

    void start();

    // Closes the surface, drains what is left and joins
    void stop();

    u64 framesEncoded() const {
        return framesEncoded_;
    }
    u64 bytesWritten() const {
        return bytesWritten_;
    }

private:
    void threadLoop(std::stop_token stopToken);

    VideoEncoderFFmpeg& encoder_;
    SurfaceHandle surface_;

    std::jthread thread_;
    std::atomic<u64> framesEncoded_{0};
    std::atomic<u64> bytesWritten_{0};
};

} // namespace evc
