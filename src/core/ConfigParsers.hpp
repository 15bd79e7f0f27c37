/**
 * @file ConfigParsers.hpp
 * @brief TOML parsing and serialization logic.
 *
 * This file defines the ConfigParsers class which handles the conversion
 * between TOML data structures and the application's C++ configuration structs.
 *
 * @section Dependencies
 * - toml++
 * - ConfigData
 */

#pragma once
#include <toml++/toml.h>
#include "ConfigData.hpp"

namespace evc {

class ConfigParsers {
public:
    static void parseRecording(const toml::table& tbl, RecordingConfig& cfg);
    static void parseCameras(const toml::table& tbl,
                             std::vector<CameraConfig>& cameras);

    static toml::table serialize(const RecordingConfig& recording,
                                 const std::vector<CameraConfig>& cameras,
                                 bool debug);
};

} // namespace evc
