#include <QtTest>

#include "services/adaptivechunksizer.h"

class TestAdaptiveChunkSizer : public QObject
{
    Q_OBJECT

private slots:
    void testInitialSize()
    {
        AdaptiveChunkSizer sizer;
        QCOMPARE(sizer.chunkSize(), AdaptiveChunkSizer::InitialChunkSize);
        QCOMPARE(sizer.bytesPerSecond(), 0.0);
    }

    void testFastLinkGrowsByAtMostOneStep()
    {
        AdaptiveChunkSizer sizer;
        const qint64 start = sizer.chunkSize();

        // 256 KiB every 10 ms is far above one second of data per chunk
        bool changed = false;
        for (int i = 0; i < AdaptiveChunkSizer::AdjustEveryChunks; ++i) {
            changed = sizer.recordChunk(i * 10, start);
        }

        QVERIFY(changed);
        QCOMPARE(sizer.chunkSize(), static_cast<qint64>(start * 1.25));
    }

    void testSlowLinkShrinksByAtMostOneStep()
    {
        AdaptiveChunkSizer sizer;
        const qint64 start = sizer.chunkSize();

        // 1 KiB per 500 ms
        for (int i = 0; i < AdaptiveChunkSizer::AdjustEveryChunks; ++i) {
            sizer.recordChunk(i * 500, 1024);
        }

        QCOMPARE(sizer.chunkSize(), static_cast<qint64>(start * 0.75));
    }

    void testNoAdjustBeforeDue()
    {
        AdaptiveChunkSizer sizer;
        sizer.resetWindow(0);
        for (int i = 1; i < AdaptiveChunkSizer::AdjustEveryChunks; ++i) {
            QVERIFY(!sizer.recordChunk(i, 1024 * 1024));
        }
        QCOMPARE(sizer.chunkSize(), AdaptiveChunkSizer::InitialChunkSize);
    }

    void testIntervalTriggersAdjust()
    {
        AdaptiveChunkSizer sizer;
        sizer.resetWindow(0);
        sizer.recordChunk(100, 1024 * 1024);
        QVERIFY(sizer.recordChunk(AdaptiveChunkSizer::AdjustIntervalMs + 100, 1024 * 1024));
    }

    void testStaysWithinBounds()
    {
        AdaptiveChunkSizer fast;
        qint64 now = 0;
        for (int i = 0; i < 500; ++i) {
            now += 1;
            fast.recordChunk(now, 64 * 1024 * 1024);
        }
        QCOMPARE(fast.chunkSize(), AdaptiveChunkSizer::MaxChunkSize);

        AdaptiveChunkSizer slow;
        now = 0;
        for (int i = 0; i < 500; ++i) {
            now += 1000;
            slow.recordChunk(now, 1);
        }
        QCOMPARE(slow.chunkSize(), AdaptiveChunkSizer::MinChunkSize);
    }

    void testTransientErrorHalves()
    {
        AdaptiveChunkSizer sizer;
        sizer.onTransientError();
        QCOMPARE(sizer.chunkSize(), AdaptiveChunkSizer::InitialChunkSize / 2);

        for (int i = 0; i < 10; ++i) {
            sizer.onTransientError();
        }
        QCOMPARE(sizer.chunkSize(), AdaptiveChunkSizer::MinChunkSize);
    }

    void testResetWindowClearsHistory()
    {
        AdaptiveChunkSizer sizer;
        sizer.recordChunk(0, 1000);
        sizer.recordChunk(100, 1000);
        QVERIFY(sizer.bytesPerSecond() > 0.0);

        sizer.resetWindow(10000);
        QCOMPARE(sizer.window().count(), static_cast<size_t>(0));
        QCOMPARE(sizer.bytesPerSecond(), 0.0);
    }
};

QTEST_MAIN(TestAdaptiveChunkSizer)
#include "test_adaptivechunksizer.moc"
