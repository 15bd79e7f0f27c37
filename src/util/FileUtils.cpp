#include "FileUtils.hpp"
#include <cstdlib>
#include <system_error>
#include <unistd.h>

namespace evc::file {

namespace {

constexpr const char* kAppDir = "evcam-recorder";

fs::path homeDir() {
    if (const char* home = std::getenv("HOME"))
        return fs::path(home);
    return fs::temp_directory_path();
}

fs::path xdgDir(const char* envName, const char* fallback) {
    if (const char* value = std::getenv(envName); value && *value)
        return fs::path(value) / kAppDir;
    return homeDir() / fallback / kAppDir;
}

} // namespace

Result<void> ensureDir(const fs::path& dir) {
    if (dir.empty())
        return Result<void>::ok();

    std::error_code ec;
    if (fs::is_directory(dir, ec))
        return Result<void>::ok();

    fs::create_directories(dir, ec);
    if (ec) {
        return Result<void>::err("Failed to create directory " + dir.string() +
                                 ": " + ec.message());
    }
    return Result<void>::ok();
}

fs::path configDir() {
    return xdgDir("XDG_CONFIG_HOME", ".config");
}

fs::path cacheDir() {
    return xdgDir("XDG_CACHE_HOME", ".cache");
}

fs::path videosDir() {
    return homeDir() / "Videos" / "EVCam";
}

fs::path expandHome(std::string_view path) {
    std::string p(path);
    if (p == "~")
        return homeDir();
    if (p.starts_with("~/"))
        return homeDir() / p.substr(2);
    return fs::path(p);
}

bool isWritableDir(const fs::path& dir) {
    std::error_code ec;
    return fs::is_directory(dir, ec) && ::access(dir.c_str(), W_OK) == 0;
}

} // namespace evc::file
