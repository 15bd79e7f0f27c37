#include "Config.hpp"
#include "ConfigLoader.hpp"
#include "util/FileUtils.hpp"

namespace evc {

Config::Config() {
    reset();
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

Result<void> Config::load(const fs::path& path) {
    std::lock_guard lock(mutex_);
    configPath_ = path;
    return ConfigLoader::load(*this, path);
}

Result<void> Config::loadDefault() {
    std::lock_guard lock(mutex_);
    return ConfigLoader::loadDefault(*this);
}

Result<void> Config::save(const fs::path& path) const {
    std::lock_guard lock(mutex_);
    return ConfigLoader::save(*this, path);
}

void Config::reset() {
    std::lock_guard lock(mutex_);
    debug_ = false;
    recording_ = RecordingConfig{};
    recording_.outputDirectory = file::videosDir();
    cameras_ = defaultCameras();
    dirty_ = false;
}

std::vector<CameraConfig> Config::enabledCameras() const {
    std::lock_guard lock(mutex_);
    std::vector<CameraConfig> out;
    for (const auto& cam : cameras_) {
        if (cam.enabled)
            out.push_back(cam);
    }
    return out;
}

} // namespace evc
