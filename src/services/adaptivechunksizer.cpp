#include "adaptivechunksizer.h"

#include <algorithm>

AdaptiveChunkSizer::AdaptiveChunkSizer()
    : window_(WindowChunks)
{
}

bool AdaptiveChunkSizer::recordChunk(qint64 nowMs, qint64 bytes)
{
    window_.addChunk(nowMs, bytes);
    ++chunksSinceAdjust_;

    if (chunksSinceAdjust_ >= AdjustEveryChunks || nowMs - lastAdjustMs_ >= AdjustIntervalMs) {
        return adjust(nowMs);
    }
    return false;
}

bool AdaptiveChunkSizer::adjust(qint64 nowMs)
{
    chunksSinceAdjust_ = 0;
    lastAdjustMs_ = nowMs;

    double speed = window_.bytesPerSecond();
    if (speed <= 0.0) {
        return false;
    }

    // Target one second worth of data, but never move more than one step
    auto current = static_cast<double>(chunkSize_);
    double target = std::clamp(speed,
                               current * (1.0 - MaxStepRatio),
                               current * (1.0 + MaxStepRatio));
    qint64 next = std::clamp(static_cast<qint64>(target), MinChunkSize, MaxChunkSize);

    if (next == chunkSize_) {
        return false;
    }
    chunkSize_ = next;
    return true;
}

void AdaptiveChunkSizer::onTransientError()
{
    chunkSize_ = std::max(MinChunkSize, chunkSize_ / 2);
    chunksSinceAdjust_ = 0;
}

void AdaptiveChunkSizer::resetWindow(qint64 nowMs)
{
    window_.clear();
    chunksSinceAdjust_ = 0;
    lastAdjustMs_ = nowMs;
}
