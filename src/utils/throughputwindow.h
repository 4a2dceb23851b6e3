/**
 * @file throughputwindow.h
 * @brief Rolling window of transferred chunks for speed estimation.
 *
 * Keeps the most recent (timestamp, size) pairs of a transfer and derives
 * the observed throughput from them.
 */

#ifndef THROUGHPUTWINDOW_H
#define THROUGHPUTWINDOW_H

#include <QtGlobal>

#include <vector>

/**
 * @brief Calculates throughput over a fixed window of chunk samples.
 *
 * Speed is the total number of bytes held in the window divided by the
 * time span between the oldest and the newest sample. The window size is
 * fixed at construction time.
 *
 * @par Example usage:
 * @code
 * ThroughputWindow window(20);
 * window.addChunk(timer.elapsed(), 262144);
 * window.addChunk(timer.elapsed(), 262144);
 * double bps = window.bytesPerSecond();
 * @endcode
 */
class ThroughputWindow
{
public:
    /**
     * @brief A single chunk sample.
     */
    struct Sample {
        qint64 timestampMs = 0;  ///< Monotonic time the chunk completed
        qint64 bytes = 0;        ///< Size of the chunk
    };

    /**
     * @brief Constructs a window holding at most @p windowSize samples.
     * @param windowSize Maximum number of chunks to keep.
     */
    explicit ThroughputWindow(size_t windowSize = 20)
        : windowSize_(windowSize > 0 ? windowSize : 1)
    {
        samples_.reserve(windowSize_);
    }

    /**
     * @brief Adds a chunk sample, evicting the oldest one when full.
     * @param timestampMs Monotonic timestamp in milliseconds.
     * @param bytes Number of bytes in the chunk.
     */
    void addChunk(qint64 timestampMs, qint64 bytes)
    {
        Sample sample{timestampMs, bytes};
        if (samples_.size() >= windowSize_) {
            totalBytes_ -= samples_[writeIndex_].bytes;
            samples_[writeIndex_] = sample;
        } else {
            samples_.push_back(sample);
        }
        totalBytes_ += bytes;
        writeIndex_ = (writeIndex_ + 1) % windowSize_;
    }

    /**
     * @brief Returns the observed throughput.
     * @return Bytes per second, or 0.0 if fewer than two samples or no
     *         elapsed time between them.
     */
    [[nodiscard]] double bytesPerSecond() const
    {
        qint64 span = spanMs();
        if (span <= 0) {
            return 0.0;
        }
        return static_cast<double>(totalBytes_) * 1000.0 / static_cast<double>(span);
    }

    /**
     * @brief Returns the time between the oldest and newest sample.
     */
    [[nodiscard]] qint64 spanMs() const
    {
        if (samples_.size() < 2) {
            return 0;
        }
        return newest().timestampMs - oldest().timestampMs;
    }

    [[nodiscard]] qint64 totalBytes() const { return totalBytes_; }
    [[nodiscard]] size_t count() const { return samples_.size(); }
    [[nodiscard]] size_t windowSize() const { return windowSize_; }
    [[nodiscard]] bool isFull() const { return samples_.size() >= windowSize_; }

    /**
     * @brief Removes all samples.
     *
     * Used after a pause so the paused interval does not drag the speed down.
     */
    void clear()
    {
        samples_.clear();
        writeIndex_ = 0;
        totalBytes_ = 0;
    }

private:
    [[nodiscard]] const Sample &oldest() const
    {
        // Before the buffer wraps, the oldest sample is at index 0
        return isFull() ? samples_[writeIndex_] : samples_.front();
    }

    [[nodiscard]] const Sample &newest() const
    {
        size_t index = (writeIndex_ + windowSize_ - 1) % windowSize_;
        return isFull() ? samples_[index] : samples_.back();
    }

    size_t windowSize_;
    std::vector<Sample> samples_;
    size_t writeIndex_ = 0;
    qint64 totalBytes_ = 0;
};

#endif // THROUGHPUTWINDOW_H
