#include "FFmpegEncoderBackend.hpp"
#include "EncoderThread.hpp"
#include "InputSurface.hpp"
#include "VideoEncoderFFmpeg.hpp"
#include "core/Logger.hpp"

namespace evc {

FFmpegEncoderBackend::FFmpegEncoderBackend(EncoderSettings base)
    : base_(std::move(base)) {
}

FFmpegEncoderBackend::~FFmpegEncoderBackend() {
    release();
}

Result<void> FFmpegEncoderBackend::prepare(const fs::path& outputPath,
                                           u32 width,
                                           u32 height) {
    if (encoder_)
        return Result<void>::err("Encoder already prepared for " +
                                 settings_.outputPath.string());

    EncoderSettings settings = base_;
    settings.outputPath = outputPath;
    settings.video.width = width;
    settings.video.height = height;

    if (auto res = settings.validate(); !res)
        return res;

    auto encoder = std::make_unique<VideoEncoderFFmpeg>();
    if (auto res = encoder->open(settings); !res)
        return res;

    settings_ = std::move(settings);
    encoder_ = std::move(encoder);
    surface_ = std::make_shared<InputSurface>(width, height);
    return Result<void>::ok();
}

Result<void> FFmpegEncoderBackend::start() {
    if (!encoder_)
        return Result<void>::err("Encoder not prepared");
    if (thread_)
        return Result<void>::err("Encoder already started");

    if (auto res = encoder_->begin(); !res)
        return res;

    thread_ = std::make_unique<EncoderThread>(*encoder_, surface_);
    thread_->start();
    return Result<void>::ok();
}

Result<void> FFmpegEncoderBackend::stop() {
    if (!thread_)
        return Result<void>::err("Encoder not started");

    thread_->stop();
    auto frames = thread_->framesEncoded();
    u64 bytes = thread_->bytesWritten();
    thread_.reset();

    auto res = encoder_->finish(bytes);
    LOG_INFO("Segment closed: {} ({} frames, {} bytes, {} dropped)",
             settings_.outputPath.string(),
             frames,
             bytes,
             surface_ ? surface_->framesDropped() : 0);
    return res;
}

void FFmpegEncoderBackend::release() {
    if (thread_) {
        thread_->stop();
        thread_.reset();
    }
    if (surface_)
        surface_->close();
    if (encoder_) {
        encoder_->cleanup();
        encoder_.reset();
    }
    surface_.reset();
}

EncoderBackendFactory FFmpegEncoderBackend::factory(EncoderSettings base) {
    return [base = std::move(base)]() -> std::unique_ptr<EncoderBackend> {
        return std::make_unique<FFmpegEncoderBackend>(base);
    };
}

} // namespace evc
