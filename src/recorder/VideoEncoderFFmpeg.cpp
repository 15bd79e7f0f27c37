#include "VideoEncoderFFmpeg.hpp"
#include <libavcodec/version.h>
#include <system_error>
#include "core/Logger.hpp"

#if LIBAVCODEC_VERSION_MAJOR >= 60
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#endif

namespace evc {

VideoEncoderFFmpeg::VideoEncoderFFmpeg() = default;

VideoEncoderFFmpeg::~VideoEncoderFFmpeg() {
    cleanup();
}

Result<void> VideoEncoderFFmpeg::open(const EncoderSettings& settings) {
    std::lock_guard lock(mutex_);
    if (formatCtx_)
        return Result<void>::err("Encoder already open");

    int ret;

    AVFormatContext* ctx = nullptr;
    ret = avformat_alloc_output_context2(&ctx,
                                         nullptr,
                                         settings.container.c_str(),
                                         settings.outputPath.c_str());
    formatCtx_.reset(ctx);

    if (ret < 0 || !formatCtx_) {
        return Result<void>::err("Failed to create output context: " +
                                 ffmpegError(ret));
    }

    if (auto result = initVideoStream(settings); !result) {
        videoCodecCtx_.reset();
        videoFrame_.reset();
        formatCtx_.reset();
        return result;
    }

    outputPath_ = settings.outputPath;

    if (!(formatCtx_->oformat->flags & AVFMT_NOFILE)) {
        ret = avio_open(
                &formatCtx_->pb, settings.outputPath.c_str(), AVIO_FLAG_WRITE);
        if (ret < 0) {
            videoCodecCtx_.reset();
            videoFrame_.reset();
            formatCtx_.reset();
            return Result<void>::err("Failed to open output file " +
                                     settings.outputPath.string() + ": " +
                                     ffmpegError(ret));
        }
    }

    packet_.reset(av_packet_alloc());
    if (!packet_) {
        return Result<void>::err("Failed to allocate packet");
    }

    headerWritten_ = false;
    trailerWritten_ = false;
    videoFrameCount_ = 0;

    LOG_DEBUG("FFmpeg encoder opened: {} ({}x{} @ {} fps, {} kbps)",
              outputPath_.string(),
              settings.video.width,
              settings.video.height,
              settings.video.fps,
              settings.video.bitrateKbps);
    return Result<void>::ok();
}

Result<void> VideoEncoderFFmpeg::begin() {
    std::lock_guard lock(mutex_);
    if (!formatCtx_)
        return Result<void>::err("Encoder not open");
    if (headerWritten_)
        return Result<void>::err("Encoder already started");

    AVDictionary* opts = nullptr;
    int ret = avformat_write_header(formatCtx_.get(), &opts);
    av_dict_free(&opts);

    if (ret < 0) {
        return Result<void>::err("Failed to write header: " + ffmpegError(ret));
    }
    headerWritten_ = true;
    return Result<void>::ok();
}

Result<void> VideoEncoderFFmpeg::finish(u64& bytesWritten) {
    std::lock_guard lock(mutex_);
    if (!formatCtx_ || !headerWritten_)
        return Result<void>::err("Encoder was not started");
    if (trailerWritten_)
        return Result<void>::ok();

    avcodec_send_frame(videoCodecCtx_.get(), nullptr);
    while (true) {
        int ret = avcodec_receive_packet(videoCodecCtx_.get(), packet_.get());
        if (ret < 0)
            break;
        writePacket(packet_.get(), bytesWritten);
    }

    int ret = av_write_trailer(formatCtx_.get());
    trailerWritten_ = true;
    if (ret < 0) {
        return Result<void>::err("Failed to write trailer: " +
                                 ffmpegError(ret));
    }
    return Result<void>::ok();
}

void VideoEncoderFFmpeg::cleanup() {
    std::lock_guard lock(mutex_);

    bool discardFile = formatCtx_ && !headerWritten_;

    packet_.reset();
    videoFrame_.reset();
    swsCtx_.reset();
    videoCodecCtx_.reset();

    if (formatCtx_ && headerWritten_ && !trailerWritten_ && formatCtx_->pb) {
        av_write_trailer(formatCtx_.get());
    }
    formatCtx_.reset();

    if (discardFile && !outputPath_.empty()) {
        std::error_code ec;
        fs::remove(outputPath_, ec);
        if (ec)
            LOG_WARN("Could not remove unused segment file {}: {}",
                     outputPath_.string(),
                     ec.message());
    }

    videoStream_ = nullptr;
    headerWritten_ = false;
    trailerWritten_ = false;
    videoFrameCount_ = 0;
    outputPath_.clear();
}

bool VideoEncoderFFmpeg::encodeVideo(const VideoFrame& frame,
                                     u64& bytesWritten) {
    if (frame.data.empty())
        return false;

    std::lock_guard lock(mutex_);
    if (!videoCodecCtx_ || !videoFrame_ || !headerWritten_ || trailerWritten_)
        return false;

    if (av_frame_make_writable(videoFrame_.get()) < 0)
        return false;

    const u8* srcData[1] = {frame.data.data()};
    int srcLinesize[1] = {static_cast<int>(frame.width * 4)};

    if (!swsCtx_) {
        swsCtx_.reset(sws_getContext(frame.width,
                                     frame.height,
                                     AV_PIX_FMT_RGBA,
                                     videoCodecCtx_->width,
                                     videoCodecCtx_->height,
                                     videoCodecCtx_->pix_fmt,
                                     SWS_BILINEAR,
                                     nullptr,
                                     nullptr,
                                     nullptr));
        if (!swsCtx_) {
            LOG_ERROR("Failed to create scaler for {}x{}",
                      frame.width,
                      frame.height);
            return false;
        }
    }

    sws_scale(swsCtx_.get(),
              srcData,
              srcLinesize,
              0,
              frame.height,
              videoFrame_->data,
              videoFrame_->linesize);

    videoFrame_->pts = videoFrameCount_++;

    return encodeVideoFrame(videoFrame_.get(), bytesWritten);
}

Result<void> VideoEncoderFFmpeg::initVideoStream(
        const EncoderSettings& settings) {
    const AVCodec* codec =
            avcodec_find_encoder_by_name(settings.video.codecName().c_str());
    if (!codec) {
        return Result<void>::err("Video codec not found: " +
                                 settings.video.codecName());
    }

    videoStream_ = avformat_new_stream(formatCtx_.get(), nullptr);
    if (!videoStream_)
        return Result<void>::err("Failed to create video stream");

    videoCodecCtx_.reset(avcodec_alloc_context3(codec));
    if (!videoCodecCtx_)
        return Result<void>::err("Failed to allocate video codec context");

    videoCodecCtx_->width = settings.video.width;
    videoCodecCtx_->height = settings.video.height;
    videoCodecCtx_->time_base =
            AVRational{1, static_cast<int>(settings.video.fps)};
    videoCodecCtx_->framerate =
            AVRational{static_cast<int>(settings.video.fps), 1};
    videoCodecCtx_->pix_fmt = AV_PIX_FMT_YUV420P;
    videoCodecCtx_->bit_rate =
            static_cast<i64>(settings.video.bitrateKbps) * 1000;
    videoCodecCtx_->gop_size = settings.video.gopSize > 0
                                       ? settings.video.gopSize
                                       : settings.video.fps * 2;
    videoCodecCtx_->max_b_frames = 0;

    if (formatCtx_->oformat->flags & AVFMT_GLOBALHEADER) {
        videoCodecCtx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }

    AVDictionary* opts = nullptr;
    if (settings.video.codec == "libx264" || settings.video.codec == "libx265") {
        av_dict_set(&opts, "preset", settings.video.presetName().c_str(), 0);
        av_dict_set(&opts, "tune", "zerolatency", 0);
    }

    int ret = avcodec_open2(videoCodecCtx_.get(), codec, &opts);
    av_dict_free(&opts);

    if (ret < 0) {
        return Result<void>::err("Failed to open video codec: " +
                                 ffmpegError(ret));
    }

    avcodec_parameters_from_context(videoStream_->codecpar,
                                    videoCodecCtx_.get());
    videoStream_->time_base = videoCodecCtx_->time_base;

    videoFrame_.reset(av_frame_alloc());
    if (!videoFrame_)
        return Result<void>::err("Failed to allocate video frame");
    videoFrame_->format = videoCodecCtx_->pix_fmt;
    videoFrame_->width = videoCodecCtx_->width;
    videoFrame_->height = videoCodecCtx_->height;
    ret = av_frame_get_buffer(videoFrame_.get(), 0);
    if (ret < 0) {
        return Result<void>::err("Failed to allocate frame buffer: " +
                                 ffmpegError(ret));
    }

    return Result<void>::ok();
}

bool VideoEncoderFFmpeg::encodeVideoFrame(AVFrame* frame, u64& bytesWritten) {
    int ret = avcodec_send_frame(videoCodecCtx_.get(), frame);
    if (ret < 0)
        return false;

    while (ret >= 0) {
        ret = avcodec_receive_packet(videoCodecCtx_.get(), packet_.get());
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
            break;
        if (ret < 0)
            return false;

        writePacket(packet_.get(), bytesWritten);
    }
    return true;
}

bool VideoEncoderFFmpeg::writePacket(AVPacket* packet, u64& bytesWritten) {
    av_packet_rescale_ts(
            packet, videoCodecCtx_->time_base, videoStream_->time_base);
    packet->stream_index = videoStream_->index;

    auto size = packet->size;
    if (av_interleaved_write_frame(formatCtx_.get(), packet) >= 0) {
        bytesWritten += size;
        return true;
    }
    return false;
}

} // namespace evc

#if LIBAVCODEC_VERSION_MAJOR >= 60
#pragma GCC diagnostic pop
#endif
