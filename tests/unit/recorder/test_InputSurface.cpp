#include <QtTest>
#include <thread>
#include "recorder/InputSurface.hpp"

using namespace evc;

namespace {
VideoFrame makeFrame(u32 w, u32 h, i64 ts) {
    VideoFrame f;
    f.width = w;
    f.height = h;
    f.timestamp = ts;
    f.data.assign(static_cast<usize>(w) * h * 4, static_cast<u8>(ts));
    return f;
}
} // namespace

class TestInputSurface : public QObject {
    Q_OBJECT

private slots:
    void testFifo() {
        InputSurface surface(4, 2);
        QVERIFY(surface.pushFrame(makeFrame(4, 2, 1)));
        QVERIFY(surface.pushFrame(makeFrame(4, 2, 2)));
        QVERIFY(surface.hasFrames());

        VideoFrame out;
        QVERIFY(surface.nextFrame(out, 10));
        QCOMPARE(out.timestamp, i64(1));
        QVERIFY(surface.nextFrame(out, 10));
        QCOMPARE(out.timestamp, i64(2));
        QVERIFY(!surface.hasFrames());
        QCOMPARE(surface.framesReceived(), u64(2));
    }

    void testRejectsWrongSize() {
        InputSurface surface(4, 2);
        QVERIFY(!surface.pushFrame(makeFrame(8, 2, 1)));

        auto truncated = makeFrame(4, 2, 2);
        truncated.data.resize(3);
        QVERIFY(!surface.pushFrame(std::move(truncated)));

        QCOMPARE(surface.framesDropped(), u64(2));
        QVERIFY(!surface.hasFrames());
    }

    void testOverflowDropsOldest() {
        InputSurface surface(2, 2, 2);
        for (i64 ts = 1; ts <= 3; ++ts)
            QVERIFY(surface.pushFrame(makeFrame(2, 2, ts)));

        QCOMPARE(surface.framesDropped(), u64(1));

        VideoFrame out;
        QVERIFY(surface.nextFrame(out, 10));
        QCOMPARE(out.timestamp, i64(2));
        QVERIFY(surface.nextFrame(out, 10));
        QCOMPARE(out.timestamp, i64(3));
    }

    void testTimeout() {
        InputSurface surface(2, 2);
        VideoFrame out;
        QElapsedTimer t;
        t.start();
        QVERIFY(!surface.nextFrame(out, 30));
        QVERIFY(t.elapsed() >= 25);
    }

    void testCloseRejectsAndDrains() {
        InputSurface surface(2, 2);
        QVERIFY(surface.pushFrame(makeFrame(2, 2, 7)));
        surface.close();

        QVERIFY(!surface.isOpen());
        QVERIFY(!surface.pushFrame(makeFrame(2, 2, 8)));

        VideoFrame out;
        QVERIFY(surface.nextFrame(out, 10));
        QCOMPARE(out.timestamp, i64(7));
        QVERIFY(!surface.nextFrame(out, 10));
    }

    void testCloseWakesWaiter() {
        InputSurface surface(2, 2);
        bool got = true;

        std::thread waiter([&] {
            VideoFrame out;
            got = surface.nextFrame(out, 5000);
        });
        QTest::qWait(20);

        QElapsedTimer t;
        t.start();
        surface.close();
        waiter.join();

        QVERIFY(!got);
        QVERIFY(t.elapsed() < 1000);
    }
};

int runTestInputSurface(int argc, char** argv) {
    TestInputSurface tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_InputSurface.moc"
