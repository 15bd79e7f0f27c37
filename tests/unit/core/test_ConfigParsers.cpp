#include <toml++/toml.h>
#include <QtTest>
#include "core/ConfigParsers.hpp"

using namespace evc;

class TestConfigParsers : public QObject {
    Q_OBJECT

private slots:
    void testParseRecording() {
        auto tbl = toml::parse(R"(
            [recording]
            output_directory = "/sd/dvr"
            segment_duration_ms = 30000
            container = "mp4"

            [recording.video]
            codec = "libx265"
            bitrate_kbps = 4000
            fps = 25
            width = 1920
            height = 1080
            preset = "veryfast"
            gop_size = 50
        )");

        RecordingConfig cfg;
        ConfigParsers::parseRecording(tbl, cfg);

        QCOMPARE(cfg.outputDirectory.string(), std::string("/sd/dvr"));
        QCOMPARE(cfg.segmentDurationMs, 30000u);
        QCOMPARE(cfg.container, std::string("mp4"));
        QCOMPARE(cfg.video.codec, std::string("libx265"));
        QCOMPARE(cfg.video.bitrateKbps, 4000u);
        QCOMPARE(cfg.video.fps, 25u);
        QCOMPARE(cfg.video.width, 1920u);
        QCOMPARE(cfg.video.height, 1080u);
        QCOMPARE(cfg.video.preset, std::string("veryfast"));
        QCOMPARE(cfg.video.gopSize, 50u);
    }

    void testParseRecordingClamps() {
        auto tbl = toml::parse(R"(
            [recording]
            segment_duration_ms = 10

            [recording.video]
            width = 1281
            height = 99999
            fps = -5
        )");

        RecordingConfig cfg;
        ConfigParsers::parseRecording(tbl, cfg);

        QCOMPARE(cfg.segmentDurationMs, 1000u);
        QCOMPARE(cfg.video.width, 1280u);
        QCOMPARE(cfg.video.height, 4320u);
        // Negative values fall back to the default
        QCOMPARE(cfg.video.fps, 30u);
    }

    void testParseRecordingOutOfRangeIntegers() {
        auto tbl = toml::parse(R"(
            [recording]
            segment_duration_ms = 4294967796

            [recording.video]
            bitrate_kbps = 9223372036854775807
            width = 4294967456
            gop_size = 4294967297
        )");

        RecordingConfig cfg;
        ConfigParsers::parseRecording(tbl, cfg);

        QCOMPARE(cfg.segmentDurationMs, 3600000u);
        QCOMPARE(cfg.video.bitrateKbps, 50000u);
        QCOMPARE(cfg.video.width, 7680u);
        QCOMPARE(cfg.video.gopSize, 600u);
    }

    void testNegativeGopSizeUsesDefault() {
        auto tbl = toml::parse(R"(
            [recording.video]
            gop_size = -1
        )");

        RecordingConfig cfg;
        ConfigParsers::parseRecording(tbl, cfg);

        QCOMPARE(cfg.video.gopSize, 0u);
    }

    void testMissingSectionKeepsDefaults() {
        auto tbl = toml::parse(R"(
            [general]
            debug = true
        )");

        RecordingConfig cfg;
        cfg.outputDirectory = "/keep/me";
        ConfigParsers::parseRecording(tbl, cfg);

        QCOMPARE(cfg.outputDirectory.string(), std::string("/keep/me"));
        QCOMPARE(cfg.segmentDurationMs, 60000u);
    }

    void testParseCameras() {
        auto tbl = toml::parse(R"(
            [[cameras]]
            id = "0"
            position = "front"

            [[cameras]]
            id = "1"
            position = "back"
            enabled = false

            [[cameras]]
            position = "orphan"

            [[cameras]]
            id = "0"
            position = "duplicate"
        )");

        auto cameras = defaultCameras();
        ConfigParsers::parseCameras(tbl, cameras);

        QCOMPARE(cameras.size(), size_t(2));
        QCOMPARE(cameras[0].id, std::string("0"));
        QCOMPARE(cameras[0].position, std::string("front"));
        QVERIFY(cameras[0].enabled);
        QCOMPARE(cameras[1].id, std::string("1"));
        QCOMPARE(cameras[1].position, std::string("back"));
        QVERIFY(!cameras[1].enabled);
    }

    void testNoCamerasKeepsDefaults() {
        auto tbl = toml::parse("");
        auto cameras = defaultCameras();
        ConfigParsers::parseCameras(tbl, cameras);
        QCOMPARE(cameras.size(), size_t(4));
        QCOMPARE(cameras[3].position, std::string("right"));
    }

    void testSerialize() {
        RecordingConfig recording;
        recording.outputDirectory = "/sd/dvr";
        recording.segmentDurationMs = 45000;
        std::vector<CameraConfig> cameras{{"cam0", "front", true},
                                          {"cam1", "back", false}};

        auto tbl = ConfigParsers::serialize(recording, cameras, true);

        QCOMPARE(tbl["general"]["debug"].value_or(false), true);

        auto recTbl = tbl["recording"].as_table();
        QVERIFY(recTbl != nullptr);
        QCOMPARE((*recTbl)["output_directory"].as_string()->get(),
                 std::string("/sd/dvr"));
        QCOMPARE((*recTbl)["segment_duration_ms"].value_or(i64(0)),
                 i64(45000));

        auto camArr = tbl["cameras"].as_array();
        QVERIFY(camArr != nullptr);
        QCOMPARE(camArr->size(), size_t(2));
        QCOMPARE((*camArr)[1].as_table()->at("enabled").value_or(true),
                 false);

        // What we write must read back the same
        std::vector<CameraConfig> parsed;
        ConfigParsers::parseCameras(tbl, parsed);
        QCOMPARE(parsed.size(), size_t(2));
        QCOMPARE(parsed[1].position, std::string("back"));
    }
};

int runTestConfigParsers(int argc, char** argv) {
    TestConfigParsers tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_ConfigParsers.moc"
