#include "EncoderSettings.hpp"
#include <utility>
#include "core/Config.hpp"

namespace evc {

Result<void> EncoderSettings::validate() const {
    if (outputPath.empty())
        return Result<void>::err("Output path is empty");
    if (!outputPath.has_filename())
        return Result<void>::err("Output path has no file name: " +
                                 outputPath.string());
    if (video.width == 0 || video.height == 0)
        return Result<void>::err("Invalid video size " +
                                 std::to_string(video.width) + "x" +
                                 std::to_string(video.height));
    if (video.width % 2 != 0 || video.height % 2 != 0)
        return Result<void>::err("Video size must be even for yuv420p: " +
                                 std::to_string(video.width) + "x" +
                                 std::to_string(video.height));
    if (video.fps == 0)
        return Result<void>::err("Frame rate must be positive");
    if (video.codec.empty())
        return Result<void>::err("No video codec configured");
    return Result<void>::ok();
}

EncoderSettings EncoderSettings::fromConfig() {
    const auto& rec = std::as_const(CONFIG).recording();
    EncoderSettings settings;
    settings.container = rec.container;
    settings.video = rec.video;
    return settings;
}

} // namespace evc
