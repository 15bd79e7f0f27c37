#include <QtTest>
#include "core/Logger.hpp"

class TestLogger : public QObject {
    Q_OBJECT

private slots:
    void initTestCase() {
        // Ensure clean state
        evc::Logger::shutdown();
    }

    void testInitialization() {
        evc::Logger::init("evcam_test", true);
        QVERIFY(evc::Logger::get() != nullptr);
        QCOMPARE(evc::Logger::get()->level(), spdlog::level::debug);

        // Should not crash
        LOG_DEBUG("Camera {}: test debug message", "cam0");
        LOG_INFO("Test info message");
        LOG_WARN("Test warn message");

        evc::Logger::shutdown();
    }

    void testReinitChangesLevel() {
        evc::Logger::init("evcam_test", false);
        QCOMPARE(evc::Logger::get()->level(), spdlog::level::info);

        // Config may switch debug on after the first init
        evc::Logger::init("evcam_test", true);
        QVERIFY(evc::Logger::get() != nullptr);
        QCOMPARE(evc::Logger::get()->level(), spdlog::level::debug);
        evc::Logger::shutdown();
    }

    void testGetInitializesLazily() {
        evc::Logger::shutdown();
        QVERIFY(evc::Logger::get() != nullptr);
        LOG_ERROR("Lazy logger works");
        evc::Logger::shutdown();
    }
};

int runTestLogger(int argc, char** argv) {
    TestLogger tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_Logger.moc"
