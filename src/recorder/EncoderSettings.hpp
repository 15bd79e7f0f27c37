#pragma once
// EncoderSettings.hpp - Everything one encoder instance needs to open a file

#include <string>
#include "core/ConfigData.hpp"
#include "util/Result.hpp"

namespace evc {

struct EncoderSettings {
    fs::path outputPath;
    std::string container{"mp4"};
    VideoEncoderConfig video;

    Result<void> validate() const;

    // Codec parameters from the global config, no output path yet
    static EncoderSettings fromConfig();
};

} // namespace evc
