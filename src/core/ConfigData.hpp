/**
 * @file ConfigData.hpp
 * @brief Configuration data structures.
 *
 * This file defines the POD (Plain Old Data) structs used to hold configuration
 * values. It is separated from the logic classes to keep headers lean and
 * avoid circular dependencies.
 */

#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include "util/Types.hpp"

namespace evc {

// Video encoding settings
struct VideoEncoderConfig {
    std::string codec{"libx264"};
    u32 bitrateKbps{1000};
    std::string preset{"ultrafast"};
    u32 width{1280};
    u32 height{720};
    u32 fps{30};
    u32 gopSize{0}; // 0 = two seconds worth of frames

    std::string codecName() const {
        return codec;
    }
    std::string presetName() const {
        return preset;
    }
};

// Recording configuration
struct RecordingConfig {
    fs::path outputDirectory;
    u32 segmentDurationMs{60000};
    std::string container{"mp4"};
    VideoEncoderConfig video;
};

// One physical camera. position ends up in every segment file name.
struct CameraConfig {
    std::string id;
    std::string position{"front"};
    bool enabled{true};
};

inline std::vector<CameraConfig> defaultCameras() {
    return {{"0", "front", true},
            {"1", "back", true},
            {"2", "left", true},
            {"3", "right", true}};
}

} // namespace evc
