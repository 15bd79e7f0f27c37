#include <QTemporaryDir>
#include <QtTest>
#include <fstream>
#include "core/Config.hpp"

using namespace evc;

class TestConfig : public QObject {
    Q_OBJECT

private slots:
    void init() {
        QVERIFY(dir_.isValid());
        CONFIG.reset();
    }

    void cleanupTestCase() {
        CONFIG.reset();
    }

    void testDefaults() {
        QCOMPARE(CONFIG.recording().segmentDurationMs, 60000u);
        QCOMPARE(CONFIG.recording().video.width, 1280u);
        QCOMPARE(CONFIG.cameras().size(), size_t(4));
        QCOMPARE(CONFIG.enabledCameras().size(), size_t(4));
        QVERIFY(!CONFIG.recording().outputDirectory.empty());
        QVERIFY(!CONFIG.isDirty());
    }

    void testSaveAndLoad() {
        auto path = tempFile("saved.toml");

        CONFIG.recording().outputDirectory = "/sd/dvr";
        CONFIG.recording().segmentDurationMs = 20000;
        CONFIG.cameras()[1].enabled = false;
        CONFIG.setDebug(true);
        QVERIFY(CONFIG.isDirty());

        QVERIFY(CONFIG.save(path));
        QVERIFY(fs::exists(path));
        QVERIFY(!fs::exists(fs::path(path) += ".tmp"));

        CONFIG.reset();
        QCOMPARE(CONFIG.recording().segmentDurationMs, 60000u);

        QVERIFY(CONFIG.load(path));
        QVERIFY(!CONFIG.isDirty());
        QVERIFY(CONFIG.debug());
        QCOMPARE(CONFIG.configPath(), path);
        QCOMPARE(CONFIG.recording().outputDirectory, fs::path("/sd/dvr"));
        QCOMPARE(CONFIG.recording().segmentDurationMs, 20000u);

        auto enabled = CONFIG.enabledCameras();
        QCOMPARE(enabled.size(), size_t(3));
        QCOMPARE(enabled[1].position, std::string("left"));
    }

    void testLoadParseError() {
        auto path = tempFile("broken.toml");
        {
            std::ofstream out(path);
            out << "[recording\nsegment_duration_ms = = 5\n";
        }

        auto res = CONFIG.load(path);
        QVERIFY(res.isErr());
        QVERIFY(res.error().message.starts_with("Config parse error"));
        // Nothing half-applied
        QCOMPARE(CONFIG.recording().segmentDurationMs, 60000u);
    }

    void testLoadMissingFile() {
        QVERIFY(CONFIG.load(tempFile("missing.toml")).isErr());
    }

private:
    fs::path tempFile(const char* name) const {
        return fs::path(dir_.path().toStdString()) / name;
    }

    QTemporaryDir dir_;
};

int runTestConfig(int argc, char** argv) {
    TestConfig tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_Config.moc"
