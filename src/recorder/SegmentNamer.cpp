#include "SegmentNamer.hpp"
#include <system_error>

namespace evc {

std::string SegmentNamer::cameraPositionOf(const fs::path& path) {
    const std::string name = path.filename().string();
    const std::string ext = kExtension;

    auto underscore = name.rfind('_');
    if (underscore == std::string::npos || underscore == 0 ||
        !name.ends_with(ext)) {
        return kUnknownPosition;
    }

    auto tagEnd = name.size() - ext.size();
    if (underscore + 1 >= tagEnd)
        return kUnknownPosition;

    return name.substr(underscore + 1, tagEnd - underscore - 1);
}

fs::path SegmentNamer::saveDirectoryOf(const fs::path& path) {
    auto dir = path.parent_path();
    if (!dir.empty())
        return dir;

    std::error_code ec;
    auto cwd = fs::current_path(ec);
    return ec ? fs::path(".") : cwd;
}

std::string SegmentNamer::fileName(const QDateTime& when,
                                   const std::string& cameraPosition) {
    return when.toString(kTimestampFormat).toStdString() + "_" +
           cameraPosition + kExtension;
}

fs::path SegmentNamer::nextSegmentPath(const fs::path& saveDirectory,
                                       const std::string& cameraPosition,
                                       const QDateTime& when) {
    return saveDirectory / fileName(when, cameraPosition);
}

} // namespace evc
