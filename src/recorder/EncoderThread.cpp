#include "EncoderThread.hpp"
#include "core/Logger.hpp"

namespace evc {

EncoderThread::EncoderThread(VideoEncoderFFmpeg& encoder, SurfaceHandle surface)
    : encoder_(encoder), surface_(std::move(surface)) {
}

EncoderThread::~EncoderThread() {
    stop();
}

void EncoderThread::start() {
    if (thread_.joinable())
        return;
    thread_ = std::jthread([this](std::stop_token st) { threadLoop(st); });
}

void EncoderThread::stop() {
    thread_.request_stop();
    if (surface_)
        surface_->close();
    if (thread_.joinable())
        thread_.join();
}

void EncoderThread::threadLoop(std::stop_token stopToken) {
    LOG_DEBUG("Encoding thread started");

    while (true) {
        VideoFrame frame;
        bool hasVideo = surface_->nextFrame(frame, 10);

        if (hasVideo) {
            u64 bytes = 0;
            if (encoder_.encodeVideo(frame, bytes)) {
                ++framesEncoded_;
                bytesWritten_ += bytes;
            }
        }

        // Stop condition: requested stop (or surface gone) AND queue empty
        bool finishing = stopToken.stop_requested() || !surface_->isOpen();
        if (finishing && !hasVideo && !surface_->hasFrames()) {
            break;
        }
    }
    LOG_DEBUG("Encoding thread finishing ({} frames)", framesEncoded_.load());
}

} // namespace evc
