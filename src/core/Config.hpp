/**
 * @file Config.hpp
 * @brief Configuration management singleton.
 *
 * This file defines the Config class which provides a thread-safe singleton
 * for accessing and modifying application settings. It delegates parsing
 * to ConfigParsers and file I/O to ConfigLoader.
 *
 * @section Dependencies
 * - ConfigData
 * - ConfigLoader
 * - ConfigParsers
 *
 * @section Patterns
 * - Singleton: Global access point for configuration.
 * - Thread-Safe: Mutex-protected access to settings.
 */

#pragma once
#include <mutex>
#include "ConfigData.hpp"
#include "util/Result.hpp"

namespace evc {

class Config {
public:
    static Config& instance();

    Result<void> load(const fs::path& path);
    Result<void> save(const fs::path& path) const;
    Result<void> loadDefault();

    // Back to built-in defaults, keeps the config path
    void reset();

    fs::path configPath() const {
        return configPath_;
    }
    bool debug() const {
        return debug_;
    }
    void setDebug(bool v) {
        debug_ = v;
        markDirty();
    }

    const RecordingConfig& recording() const {
        return recording_;
    }
    const std::vector<CameraConfig>& cameras() const {
        return cameras_;
    }

    RecordingConfig& recording() {
        markDirty();
        return recording_;
    }
    std::vector<CameraConfig>& cameras() {
        markDirty();
        return cameras_;
    }

    std::vector<CameraConfig> enabledCameras() const;

    bool isDirty() const {
        return dirty_;
    }
    void markClean() {
        dirty_ = false;
    }

private:
    friend class ConfigLoader;

    Config();
    void markDirty() {
        dirty_ = true;
    }

    fs::path configPath_;
    bool dirty_{false};
    bool debug_{false};

    RecordingConfig recording_;
    std::vector<CameraConfig> cameras_;

    mutable std::mutex mutex_;
};

#define CONFIG evc::Config::instance()

} // namespace evc
