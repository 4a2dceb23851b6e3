/**
 * @file splitwriter.h
 * @brief Splits artifacts that exceed the FAT32 file size ceiling.
 */

#ifndef SPLITWRITER_H
#define SPLITWRITER_H

#include <QMutex>
#include <QObject>
#include <QString>
#include <QStringList>

#include "errorhandler.h"
#include "../models/platformprofile.h"

struct SplitResult {
    enum class Status {
        Split,      ///< Parts written
        NotNeeded,  ///< File is below the part size
        Stopped,    ///< stop() took effect; written parts removed
        Failed
    };

    Status status = Status::Failed;
    QStringList parts;
    bool originalRemoved = false;
    ErrorCategory error = ErrorCategory::None;
    QString errorMessage;

    [[nodiscard]] bool isSuccess() const
    {
        return status == Status::Split || status == Status::NotNeeded;
    }
};

/**
 * @brief Writes a large file as a sequence of fixed-size parts.
 *
 * A file is split when its size is at least the part size, which defaults
 * to 4,294,967,295 bytes. Parts are written sequentially next to the
 * source with a fixed 8 MiB copy buffer. Concatenating the parts in index
 * order reproduces the source exactly.
 */
class SplitWriter : public QObject
{
    Q_OBJECT

public:
    static constexpr qint64 Fat32MaxFileSize = 4294967295LL;
    static constexpr qint64 CopyBufferSize = 8 * 1024 * 1024;

    explicit SplitWriter(qint64 partSize = Fat32MaxFileSize, QObject *parent = nullptr);
    ~SplitWriter() override = default;

    /**
     * @brief Splits @p path if it is at least partSize() bytes.
     * @param path File to split.
     * @param naming Part naming convention.
     * @param keepOriginal Keep the unsplit file after a successful split.
     */
    SplitResult split(const QString &path, SplitNaming naming, bool keepOriginal = false);

    /**
     * @brief Requests the split to stop at the next buffer boundary.
     */
    void stop();

    [[nodiscard]] qint64 partSize() const { return partSize_; }

    /**
     * @brief Returns the file name of part @p index of @p path.
     *
     * NumericSuffix appends ".N" ("Game.iso.0"); Ps3Package appends
     * ".666NN" ("Game.pkg.66600").
     */
    [[nodiscard]] static QString partPath(const QString &path, SplitNaming naming, int index);

    /**
     * @brief Number of parts needed for @p size bytes, ceil(size / partSize).
     */
    [[nodiscard]] static int partCount(qint64 size, qint64 partSize);

signals:
    void progressChanged(int percent);
    void partWritten(const QString &path, int index, int count);

private:
    [[nodiscard]] bool isStopRequested() const;
    void removeParts(const QStringList &parts);

    qint64 partSize_;
    mutable QMutex mutex_;
    bool stopRequested_ = false;
};

#endif // SPLITWRITER_H
