#include <QtTest>
#include "recorder/RotationTimer.hpp"

using namespace evc;

class TestRotationTimer : public QObject {
    Q_OBJECT

private slots:
    void testFiresOnce() {
        SerialContext ctx;
        RotationTimer timer(ctx, Duration(30));
        int fired = 0;

        timer.schedule([&] { ++fired; });
        QVERIFY(timer.isPending());
        QTRY_COMPARE(fired, 1);
        QVERIFY(!timer.isPending());

        QTest::qWait(100);
        QCOMPARE(fired, 1);
    }

    void testCancelIsFinal() {
        SerialContext ctx;
        RotationTimer timer(ctx, Duration(30));
        int fired = 0;

        timer.schedule([&] { ++fired; });
        timer.cancel();
        QVERIFY(!timer.isPending());

        QTest::qWait(120);
        QCOMPARE(fired, 0);
    }

    void testRescheduleReplacesCallback() {
        SerialContext ctx;
        RotationTimer timer(ctx, Duration(30));
        int first = 0;
        int second = 0;

        timer.schedule([&] { ++first; });
        timer.schedule([&] { ++second; });

        QTRY_COMPARE(second, 1);
        QTest::qWait(60);
        QCOMPARE(first, 0);
        QCOMPARE(second, 1);
    }

    void testCallbackMayReschedule() {
        SerialContext ctx;
        RotationTimer timer(ctx, Duration(20));
        int fired = 0;

        std::function<void()> tick = [&] {
            if (++fired < 3)
                timer.schedule(tick);
        };
        timer.schedule(tick);

        QTRY_COMPARE(fired, 3);
        QVERIFY(!timer.isPending());
    }

    void testDestroyWhilePending() {
        SerialContext ctx;
        int fired = 0;
        {
            RotationTimer timer(ctx, Duration(20));
            timer.schedule([&] { ++fired; });
        }
        QTest::qWait(80);
        QCOMPARE(fired, 0);
    }

    void testDelay() {
        SerialContext ctx;
        RotationTimer timer(ctx, Duration(60000));
        QCOMPARE(timer.delay(), Duration(60000));
        QVERIFY(!timer.isPending());
    }
};

int runTestRotationTimer(int argc, char** argv) {
    TestRotationTimer tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_RotationTimer.moc"
