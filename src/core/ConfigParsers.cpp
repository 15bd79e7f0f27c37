#include "ConfigParsers.hpp"
#include <algorithm>
#include "Logger.hpp"
#include "util/FileUtils.hpp"

namespace evc {

namespace {
template <typename T>
T get(const toml::table& tbl, std::string_view key, T defaultVal) {
    if (auto node = tbl[key]) {
        if constexpr (std::is_same_v<T, std::string>) {
            if (auto val = node.value<std::string>())
                return *val;
        } else if constexpr (std::is_same_v<T, bool>) {
            if (auto val = node.value<bool>())
                return *val;
        }
    }
    return defaultVal;
}

// Clamped as i64 so values beyond u32 cannot wrap; negatives use the default
u32 getClamped(const toml::table& tbl,
               std::string_view key,
               u32 defaultVal,
               u32 lo,
               u32 hi) {
    auto val = tbl[key].value<i64>();
    if (!val || *val < 0)
        return defaultVal;
    return static_cast<u32>(std::clamp<i64>(*val, lo, hi));
}

u32 getEvenClamped(const toml::table& tbl,
                   std::string_view key,
                   u32 defaultVal,
                   u32 lo,
                   u32 hi) {
    return getClamped(tbl, key, defaultVal, lo, hi) & ~1u;
}
} // namespace

void ConfigParsers::parseRecording(const toml::table& tbl,
                                   RecordingConfig& cfg) {
    auto rec = tbl["recording"].as_table();
    if (!rec)
        return;

    auto outDir = get(*rec, "output_directory", std::string("~/Videos/EVCam"));
    cfg.outputDirectory = file::expandHome(outDir);
    cfg.segmentDurationMs =
            getClamped(*rec, "segment_duration_ms", 60000u, 1000u, 3600000u);
    cfg.container = get(*rec, "container", std::string("mp4"));

    if (auto video = (*rec)["video"].as_table()) {
        cfg.video.codec = get(*video, "codec", std::string("libx264"));
        cfg.video.bitrateKbps =
                getClamped(*video, "bitrate_kbps", 1000u, 100u, 50000u);
        cfg.video.preset = get(*video, "preset", std::string("ultrafast"));
        cfg.video.width = getEvenClamped(*video, "width", 1280u, 160u, 7680u);
        cfg.video.height = getEvenClamped(*video, "height", 720u, 120u, 4320u);
        cfg.video.fps = getClamped(*video, "fps", 30u, 1u, 120u);
        cfg.video.gopSize = getClamped(*video, "gop_size", 0u, 0u, 600u);
    }
}

void ConfigParsers::parseCameras(const toml::table& tbl,
                                 std::vector<CameraConfig>& cameras) {
    auto arr = tbl["cameras"].as_array();
    if (!arr)
        return;

    cameras.clear();
    for (const auto& node : *arr) {
        auto camTbl = node.as_table();
        if (!camTbl)
            continue;

        CameraConfig cam;
        cam.id = get(*camTbl, "id", std::string());
        cam.position = get(*camTbl, "position", std::string("unknown"));
        cam.enabled = get(*camTbl, "enabled", true);

        if (cam.id.empty()) {
            LOG_WARN("Config: skipping camera entry without id");
            continue;
        }
        if (std::any_of(cameras.begin(), cameras.end(), [&](const auto& c) {
                return c.id == cam.id;
            })) {
            LOG_WARN("Config: duplicate camera id '{}' ignored", cam.id);
            continue;
        }
        cameras.push_back(std::move(cam));
    }
}

toml::table ConfigParsers::serialize(const RecordingConfig& recording,
                                     const std::vector<CameraConfig>& cameras,
                                     bool debug) {
    toml::table root;
    root.insert("general", toml::table{{"debug", debug}});

    toml::table recVideo{{"codec", recording.video.codec},
                         {"bitrate_kbps", (i64)recording.video.bitrateKbps},
                         {"preset", recording.video.preset},
                         {"width", (i64)recording.video.width},
                         {"height", (i64)recording.video.height},
                         {"fps", (i64)recording.video.fps},
                         {"gop_size", (i64)recording.video.gopSize}};
    root.insert("recording",
                toml::table{{"output_directory",
                             recording.outputDirectory.string()},
                            {"segment_duration_ms",
                             (i64)recording.segmentDurationMs},
                            {"container", recording.container},
                            {"video", recVideo}});

    toml::array camerasArr;
    for (const auto& cam : cameras) {
        camerasArr.push_back(toml::table{{"id", cam.id},
                                         {"position", cam.position},
                                         {"enabled", cam.enabled}});
    }
    root.insert("cameras", camerasArr);

    return root;
}

} // namespace evc
