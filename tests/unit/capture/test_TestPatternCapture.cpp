#include <QtTest>
#include "capture/TestPatternCapture.hpp"

using namespace evc;

class TestTestPatternCapture : public QObject {
    Q_OBJECT

private slots:
    void testRenderFrame() {
        auto frame = TestPatternCapture::renderFrame(32, 8, 0, 1, 1234);

        QCOMPARE(frame.width, 32u);
        QCOMPARE(frame.height, 8u);
        QCOMPARE(frame.timestamp, i64(1234));
        QCOMPARE(frame.data.size(), size_t(32 * 8 * 4));

        // Bar starts at x = 0 on frame 0 and is white
        QCOMPARE(frame.data[0], u8(255));
        QCOMPARE(frame.data[1], u8(255));
        QCOMPARE(frame.data[2], u8(255));
        // Opaque everywhere
        QCOMPARE(frame.data[frame.data.size() - 1], u8(255));
    }

    void testBarMoves() {
        auto a = TestPatternCapture::renderFrame(64, 4, 0, 0, 0);
        auto b = TestPatternCapture::renderFrame(64, 4, 1, 0, 0);
        QVERIFY(a.data != b.data);
    }

    void testRejectsNullAndClosed() {
        TestPatternCapture capture;
        QVERIFY(!capture.bindSurface("0", nullptr));

        auto closed = std::make_shared<InputSurface>(16, 16);
        closed->close();
        QVERIFY(!capture.bindSurface("0", closed));
        QCOMPARE(capture.boundCount(), usize(0));
    }

    void testFeedsBoundSurface() {
        TestPatternCapture capture(50);
        auto surface = std::make_shared<InputSurface>(16, 16, 64);

        QVERIFY(capture.bindSurface("0", surface));
        QVERIFY(capture.boundSurface("0") == surface);
        QTRY_VERIFY(surface->framesReceived() >= 2);
        QVERIFY(capture.framesPushed() >= 2);

        VideoFrame frame;
        QVERIFY(surface->nextFrame(frame, 10));
        QCOMPARE(frame.width, 16u);
    }

    void testRebindSwitchesTarget() {
        TestPatternCapture capture(50);
        auto first = std::make_shared<InputSurface>(16, 16, 64);
        auto second = std::make_shared<InputSurface>(16, 16, 64);

        QVERIFY(capture.bindSurface("0", first));
        QTRY_VERIFY(first->framesReceived() >= 1);

        QVERIFY(capture.bindSurface("0", second));
        auto frozen = first->framesReceived();
        QTRY_VERIFY(second->framesReceived() >= 2);
        QCOMPARE(first->framesReceived(), frozen);
        QCOMPARE(capture.boundCount(), usize(1));
    }

    void testUnbindStopsFeeding() {
        TestPatternCapture capture(50);
        auto surface = std::make_shared<InputSurface>(16, 16, 64);

        QVERIFY(capture.bindSurface("0", surface));
        QTRY_VERIFY(surface->framesReceived() >= 1);

        capture.unbindSurface("0");
        auto frozen = surface->framesReceived();
        QTest::qWait(80);
        QCOMPARE(surface->framesReceived(), frozen);
        QVERIFY(!capture.boundSurface("0"));
    }
};

int runTestTestPatternCapture(int argc, char** argv) {
    TestTestPatternCapture tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_TestPatternCapture.moc"
