#include "pausestatestore.h"
#include "../utils/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMutexLocker>
#include <QSaveFile>

bool PauseState::isValid(QString *reason) const
{
    auto fail = [reason](const QString &message) {
        if (reason) {
            *reason = message;
        }
        return false;
    };

    if (currentItem.isEmpty()) {
        return fail(QStringLiteral("current item is empty"));
    }
    if (remainingQueue.isEmpty() || remainingQueue.first() != currentItem) {
        return fail(QStringLiteral("remaining queue does not start with the current item"));
    }
    if (operation.isEmpty() || stageToOperation(operationToStage(operation)) != operation) {
        return fail(QStringLiteral("unknown operation \"%1\"").arg(operation));
    }
    if (!filePath.isEmpty()) {
        QString baseName = QueueItem::fromDisplayName(currentItem).baseName();
        if (!QFileInfo(filePath).fileName().startsWith(baseName)) {
            return fail(QStringLiteral("file path does not belong to the current item"));
        }
    }
    if (processedCount < 0 || processedCount > totalCount) {
        return fail(QStringLiteral("processed count exceeds total"));
    }
    return true;
}

PauseStateStore::PauseStateStore(const QString &filePath)
    : filePath_(filePath)
{
}

QString PauseStateStore::lastError() const
{
    QMutexLocker locker(&mutex_);
    return lastError_;
}

bool PauseStateStore::exists() const
{
    return QFile::exists(filePath_);
}

bool PauseStateStore::save(const PauseState &state)
{
    QJsonObject obj;
    obj["timestamp"] = state.timestamp.toString(Qt::ISODate);
    obj["current_item"] = state.currentItem;
    obj["queue_position"] = state.queuePosition;
    obj["operation"] = state.operation;
    obj["file_path"] = state.filePath;
    obj["processed_items"] = state.processedCount;
    obj["total_items"] = state.totalCount;
    obj["remaining_queue"] = QJsonArray::fromStringList(state.remainingQueue);

    QMutexLocker locker(&mutex_);
    QDir().mkpath(QFileInfo(filePath_).absolutePath());

    QSaveFile file(filePath_);
    if (!file.open(QIODevice::WriteOnly)) {
        lastError_ = QStringLiteral("Cannot write %1: %2").arg(filePath_, file.errorString());
        qWarning().noquote() << lastError_;
        return false;
    }
    file.write(QJsonDocument(obj).toJson());
    if (!file.commit()) {
        lastError_ = QStringLiteral("Cannot write %1: %2").arg(filePath_, file.errorString());
        qWarning().noquote() << lastError_;
        return false;
    }

    LOG_VERBOSE() << "Saved pause state:" << state.currentItem << state.operation
                  << state.queuePosition;
    return true;
}

bool PauseStateStore::load(PauseState *state)
{
    QMutexLocker locker(&mutex_);

    QFile file(filePath_);
    if (!file.exists()) {
        return false;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        lastError_ = QStringLiteral("Cannot read %1: %2").arg(filePath_, file.errorString());
        qWarning().noquote() << lastError_;
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    PauseState loaded;
    QString reason;
    bool valid = false;

    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        reason = parseError.errorString();
    } else {
        QJsonObject obj = doc.object();
        loaded.timestamp = QDateTime::fromString(obj["timestamp"].toString(), Qt::ISODate);
        loaded.currentItem = obj["current_item"].toString();
        loaded.queuePosition = obj["queue_position"].toString();
        loaded.operation = obj["operation"].toString();
        loaded.filePath = obj["file_path"].toString();
        loaded.processedCount = obj["processed_items"].toInt();
        loaded.totalCount = obj["total_items"].toInt();

        const QJsonArray remaining = obj["remaining_queue"].toArray();
        for (const QJsonValue &value : remaining) {
            // Older records stored {name, size} objects
            QString name = value.isObject() ? value.toObject()["name"].toString()
                                            : value.toString();
            if (!name.isEmpty()) {
                loaded.remainingQueue.append(name);
            }
        }
        valid = loaded.isValid(&reason);
    }

    if (!valid) {
        lastError_ = QStringLiteral("Discarding pause state %1: %2").arg(filePath_, reason);
        qWarning().noquote() << lastError_;
        QFile::remove(filePath_);
        return false;
    }

    if (state) {
        *state = loaded;
    }
    return true;
}

bool PauseStateStore::clear()
{
    QMutexLocker locker(&mutex_);
    if (!QFile::exists(filePath_)) {
        return true;
    }
    if (!QFile::remove(filePath_)) {
        lastError_ = QStringLiteral("Cannot remove %1").arg(filePath_);
        qWarning().noquote() << lastError_;
        return false;
    }
    return true;
}
