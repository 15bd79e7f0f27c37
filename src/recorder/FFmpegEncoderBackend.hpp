/**
 * @file FFmpegEncoderBackend.hpp
 * @brief EncoderBackend implemented with FFmpeg and an encoding thread.
 *
 * prepare() opens the muxer and codec and creates a fresh InputSurface;
 * start() writes the header and spawns the EncoderThread; stop() drains,
 * flushes and writes the trailer; release() frees everything. A segment
 * that was prepared but never started leaves no file behind.
 *
 * @section Dependencies
 * - VideoEncoderFFmpeg
 * - EncoderThread
 */

#pragma once
#include <memory>
#include "EncoderBackend.hpp"
#include "EncoderSettings.hpp"

namespace evc {

class EncoderThread;
class VideoEncoderFFmpeg;

class FFmpegEncoderBackend : public EncoderBackend {
public:
    // base carries codec parameters; path and size come from prepare()
    explicit FFmpegEncoderBackend(EncoderSettings base);
    ~FFmpegEncoderBackend() override;

    FFmpegEncoderBackend(const FFmpegEncoderBackend&) = delete;
    FFmpegEncoderBackend& operator=(const FFmpegEncoderBackend&) = delete;

    Result<void> prepare(const fs::path& outputPath,
                         u32 width,
                         u32 height) override;
    Result<void> start() override;
    Result<void> stop() override;
    void release() override;

    SurfaceHandle inputSurface() const override {
        return surface_;
    }

    static EncoderBackendFactory factory(EncoderSettings base);

private:
    EncoderSettings base_;
    EncoderSettings settings_;

    std::unique_ptr<VideoEncoderFFmpeg> encoder_;
    std::unique_ptr<EncoderThread> thread_;
    SurfaceHandle surface_;
};

} // namespace evc
