#include "splitwriter.h"
#include "../utils/fileutils.h"
#include "../utils/logging.h"

#include <QFile>
#include <QFileInfo>
#include <QMutexLocker>

#include <vector>

SplitWriter::SplitWriter(qint64 partSize, QObject *parent)
    : QObject(parent)
    , partSize_(partSize > 0 ? partSize : Fat32MaxFileSize)
{
}

void SplitWriter::stop()
{
    QMutexLocker locker(&mutex_);
    stopRequested_ = true;
}

bool SplitWriter::isStopRequested() const
{
    QMutexLocker locker(&mutex_);
    return stopRequested_;
}

QString SplitWriter::partPath(const QString &path, SplitNaming naming, int index)
{
    switch (naming) {
    case SplitNaming::Ps3Package:
        return path + QStringLiteral(".666") + QString::number(index).rightJustified(2, QLatin1Char('0'));
    case SplitNaming::NumericSuffix:
        break;
    }
    return path + QLatin1Char('.') + QString::number(index);
}

int SplitWriter::partCount(qint64 size, qint64 partSize)
{
    if (size <= 0 || partSize <= 0) {
        return 0;
    }
    return static_cast<int>((size + partSize - 1) / partSize);
}

void SplitWriter::removeParts(const QStringList &parts)
{
    for (const QString &part : parts) {
        if (QFile::exists(part) && !QFile::remove(part)) {
            qWarning() << "Could not remove split part" << part;
        }
    }
}

SplitResult SplitWriter::split(const QString &path, SplitNaming naming, bool keepOriginal)
{
    SplitResult result;

    QFile source(path);
    if (!source.open(QIODevice::ReadOnly)) {
        result.error = ErrorCategory::Filesystem;
        result.errorMessage = tr("Cannot open %1: %2").arg(path, source.errorString());
        return result;
    }

    const qint64 size = source.size();
    if (size < partSize_) {
        result.status = SplitResult::Status::NotNeeded;
        return result;
    }

    const int count = partCount(size, partSize_);
    qInfo().noquote() << "Splitting" << QFileInfo(path).fileName() << "("
                      << FileUtils::formatFileSize(size) << ") into" << count << "parts";

    std::vector<char> buffer(static_cast<size_t>(qMin(CopyBufferSize, partSize_)));
    qint64 copied = 0;

    for (int index = 0; index < count; ++index) {
        QString target = partPath(path, naming, index);
        QFile part(target);
        if (!part.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            result.error = ErrorCategory::Filesystem;
            result.errorMessage = tr("Cannot create %1: %2").arg(target, part.errorString());
            removeParts(result.parts);
            result.parts.clear();
            return result;
        }
        result.parts.append(target);

        qint64 remaining = qMin(partSize_, size - copied);
        while (remaining > 0) {
            if (isStopRequested()) {
                part.close();
                removeParts(result.parts);
                result.parts.clear();
                result.status = SplitResult::Status::Stopped;
                return result;
            }

            qint64 want = qMin(remaining, static_cast<qint64>(buffer.size()));
            qint64 got = source.read(buffer.data(), want);
            if (got <= 0 || part.write(buffer.data(), got) != got) {
                result.error = ErrorCategory::Filesystem;
                result.errorMessage = got <= 0
                    ? tr("Read failed for %1: %2").arg(path, source.errorString())
                    : tr("Write failed for %1: %2").arg(target, part.errorString());
                part.close();
                removeParts(result.parts);
                result.parts.clear();
                return result;
            }
            remaining -= got;
            copied += got;
            emit progressChanged(static_cast<int>(copied * 100 / size));
        }

        if (!part.flush()) {
            result.error = ErrorCategory::Filesystem;
            result.errorMessage = tr("Write failed for %1: %2").arg(target, part.errorString());
            part.close();
            removeParts(result.parts);
            result.parts.clear();
            return result;
        }
        part.close();
        LOG_VERBOSE() << "Wrote split part" << target;
        emit partWritten(target, index, count);
    }
    source.close();

    result.status = SplitResult::Status::Split;
    if (!keepOriginal) {
        if (QFile::remove(path)) {
            result.originalRemoved = true;
        } else {
            qWarning() << "Could not remove unsplit file" << path;
        }
    }
    return result;
}
