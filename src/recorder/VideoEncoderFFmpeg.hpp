/**
 * @file VideoEncoderFFmpeg.hpp
 * @brief Low-level FFmpeg integration for one output file.
 *
 * This file defines the VideoEncoderFFmpeg class which handles the direct
 * interaction with FFmpeg libraries (libavcodec, libavformat, libswscale).
 * open() validates everything up front (codec, muxer, output file) so that
 * failures surface while the encoder is being prepared; the header is only
 * written by begin(). A file that was opened but never begun is removed on
 * cleanup.
 *
 * @section Dependencies
 * - FFmpeg (libavcodec, libavformat, libswscale)
 *
 * @section Patterns
 * - Wrapper/Adapter: Wraps C-style FFmpeg API in a C++ class.
 * - RAII: Manages FFmpeg resources via smart pointers (AVFramePtr, etc.).
 */

#pragma once
#include <mutex>
#include "EncoderSettings.hpp"
#include "FFmpegUtils.hpp"
#include "InputSurface.hpp"
#include "util/Result.hpp"

namespace evc {

class VideoEncoderFFmpeg {
public:
    VideoEncoderFFmpeg();
    ~VideoEncoderFFmpeg();

    VideoEncoderFFmpeg(const VideoEncoderFFmpeg&) = delete;
    VideoEncoderFFmpeg& operator=(const VideoEncoderFFmpeg&) = delete;

    Result<void> open(const EncoderSettings& settings);
    Result<void> begin();
    Result<void> finish(u64& bytesWritten);
    void cleanup();

    bool encodeVideo(const VideoFrame& frame, u64& bytesWritten);

    bool isOpen() const {
        return formatCtx_ != nullptr;
    }
    i64 framesEncoded() const {
        return videoFrameCount_;
    }

private:
    Result<void> initVideoStream(const EncoderSettings& settings);

    bool encodeVideoFrame(AVFrame* frame, u64& bytesWritten);
    bool writePacket(AVPacket* packet, u64& bytesWritten);

    AVFormatContextPtr formatCtx_;
    AVCodecContextPtr videoCodecCtx_;
    AVStream* videoStream_{nullptr};

    SwsContextPtr swsCtx_;
    AVFramePtr videoFrame_;
    AVPacketPtr packet_;

    fs::path outputPath_;
    bool headerWritten_{false};
    bool trailerWritten_{false};
    i64 videoFrameCount_{0};

    std::mutex mutex_;
};

} // namespace evc
