#pragma once
// SegmentNamer.hpp - Output file naming for rolling segments
// {yyyyMMdd_HHmmss}_{cameraPosition}.mp4, relied on by downstream tooling

#include <QDateTime>
#include <string>
#include "util/Types.hpp"

namespace evc {

class SegmentNamer {
public:
    static constexpr const char* kTimestampFormat = "yyyyMMdd_HHmmss";
    static constexpr const char* kExtension = ".mp4";
    static constexpr const char* kUnknownPosition = "unknown";

    // Tag after the last '_' and before ".mp4", or "unknown"
    static std::string cameraPositionOf(const fs::path& path);

    // Directory the next segments go to; cwd for bare file names
    static fs::path saveDirectoryOf(const fs::path& path);

    static std::string fileName(const QDateTime& when,
                                const std::string& cameraPosition);

    // Same-second calls return the same path
    static fs::path nextSegmentPath(
            const fs::path& saveDirectory,
            const std::string& cameraPosition,
            const QDateTime& when = QDateTime::currentDateTime());
};

} // namespace evc
