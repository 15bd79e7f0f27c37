#pragma once
// FileUtils.hpp - Filesystem helpers
// XDG directories and the small bits std::filesystem leaves to us

#include <string>
#include <string_view>
#include "Result.hpp"
#include "Types.hpp"

namespace evc::file {

// Creates the directory (and parents) if missing
Result<void> ensureDir(const fs::path& dir);

fs::path configDir();
fs::path cacheDir();
fs::path videosDir();

// "~/foo" -> "$HOME/foo"; anything else is returned untouched
fs::path expandHome(std::string_view path);

bool isWritableDir(const fs::path& dir);

} // namespace evc::file
