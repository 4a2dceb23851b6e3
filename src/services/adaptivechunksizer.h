/**
 * @file adaptivechunksizer.h
 * @brief Throughput-driven read size control for the download engine.
 */

#ifndef ADAPTIVECHUNKSIZER_H
#define ADAPTIVECHUNKSIZER_H

#include "../utils/throughputwindow.h"

/**
 * @brief Chooses the read size for the next chunk of a transfer.
 *
 * The size moves toward the number of bytes transferable in about one
 * second of observed throughput. It is re-evaluated every
 * AdjustEveryChunks chunks or every AdjustIntervalMs, and each step
 * changes it by at most MaxStepRatio. Timeouts and transient errors halve
 * it immediately.
 */
class AdaptiveChunkSizer
{
public:
    static constexpr qint64 InitialChunkSize = 256 * 1024;
    static constexpr qint64 MinChunkSize = 64 * 1024;
    static constexpr qint64 MaxChunkSize = 4 * 1024 * 1024;
    static constexpr int WindowChunks = 20;
    static constexpr int AdjustEveryChunks = 5;
    static constexpr qint64 AdjustIntervalMs = 2000;
    static constexpr double MaxStepRatio = 0.25;

    AdaptiveChunkSizer();

    /**
     * @brief Records a completed chunk and re-evaluates the size if due.
     * @param nowMs Monotonic time in milliseconds.
     * @param bytes Size of the chunk that was read.
     * @return True if the chunk size changed.
     */
    bool recordChunk(qint64 nowMs, qint64 bytes);

    /**
     * @brief Halves the chunk size after a timeout or transient error.
     */
    void onTransientError();

    /**
     * @brief Clears throughput history, e.g. after a pause.
     * @param nowMs New timing baseline.
     */
    void resetWindow(qint64 nowMs);

    [[nodiscard]] qint64 chunkSize() const { return chunkSize_; }
    [[nodiscard]] double bytesPerSecond() const { return window_.bytesPerSecond(); }
    [[nodiscard]] const ThroughputWindow &window() const { return window_; }

private:
    bool adjust(qint64 nowMs);

    ThroughputWindow window_;
    qint64 chunkSize_ = InitialChunkSize;
    int chunksSinceAdjust_ = 0;
    qint64 lastAdjustMs_ = 0;
};

#endif // ADAPTIVECHUNKSIZER_H
