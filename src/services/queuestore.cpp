#include "queuestore.h"
#include "../utils/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMutexLocker>
#include <QSaveFile>
#include <QSet>

QueueStore::QueueStore(const QString &filePath, QObject *parent)
    : QObject(parent)
    , filePath_(filePath)
{
}

QString QueueStore::lastError() const
{
    QMutexLocker locker(&mutex_);
    return lastError_;
}

bool QueueStore::load()
{
    QFile file(filePath_);
    if (!file.exists()) {
        QMutexLocker locker(&mutex_);
        items_.clear();
        return true;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        QMutexLocker locker(&mutex_);
        lastError_ = tr("Cannot read %1: %2").arg(filePath_, file.errorString());
        qWarning().noquote() << lastError_;
        return false;
    }

    QJsonParseError error;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError || !doc.isArray()) {
        QMutexLocker locker(&mutex_);
        lastError_ = tr("Queue record %1 is corrupt: %2").arg(filePath_, error.errorString());
        qWarning().noquote() << lastError_;
        return false;
    }

    QList<QueueItem> loaded;
    QSet<QString> seen;
    const QJsonArray array = doc.array();
    for (const QJsonValue &value : array) {
        QString name;
        QString size;
        if (value.isObject()) {
            QJsonObject obj = value.toObject();
            name = obj["name"].toString();
            size = obj["size"].toString();
        } else {
            name = value.toString();
        }
        if (name.isEmpty() || seen.contains(name)) {
            continue;
        }
        seen.insert(name);
        loaded.append(QueueItem::fromDisplayName(name, size));
    }

    {
        QMutexLocker locker(&mutex_);
        items_ = loaded;
    }
    LOG_VERBOSE() << "Loaded" << loaded.size() << "queued items from" << filePath_;
    emit queueChanged();
    return true;
}

bool QueueStore::persistLocked()
{
    QJsonArray array;
    for (const QueueItem &item : std::as_const(items_)) {
        QJsonObject obj;
        obj["name"] = item.displayName;
        obj["size"] = item.sizeLabel;
        array.append(obj);
    }

    QDir().mkpath(QFileInfo(filePath_).absolutePath());

    // Written to a temporary file and renamed over the record on commit
    QSaveFile file(filePath_);
    if (!file.open(QIODevice::WriteOnly)) {
        lastError_ = tr("Cannot write %1: %2").arg(filePath_, file.errorString());
        qWarning().noquote() << lastError_;
        return false;
    }
    file.write(QJsonDocument(array).toJson());
    if (!file.commit()) {
        lastError_ = tr("Cannot write %1: %2").arg(filePath_, file.errorString());
        qWarning().noquote() << lastError_;
        return false;
    }
    return true;
}

int QueueStore::indexOfLocked(const QString &displayName) const
{
    for (int i = 0; i < items_.size(); ++i) {
        if (items_.at(i).displayName == displayName) {
            return i;
        }
    }
    return -1;
}

bool QueueStore::enqueue(const QueueItem &item)
{
    bool persisted = false;
    {
        QMutexLocker locker(&mutex_);
        if (item.displayName.isEmpty() || indexOfLocked(item.displayName) >= 0) {
            return false;
        }
        QueueItem queued = item;
        queued.stage = ItemStage::Queued;
        items_.append(queued);
        persisted = persistLocked();
    }
    emit queueChanged();
    if (!persisted) {
        emit persistFailed(lastError());
    }
    return persisted;
}

bool QueueStore::remove(const QString &displayName)
{
    bool persisted = false;
    {
        QMutexLocker locker(&mutex_);
        int index = indexOfLocked(displayName);
        if (index < 0) {
            return false;
        }
        items_.removeAt(index);
        persisted = persistLocked();
    }
    emit queueChanged();
    if (!persisted) {
        emit persistFailed(lastError());
    }
    return persisted;
}

bool QueueStore::move(int from, int to)
{
    bool persisted = false;
    {
        QMutexLocker locker(&mutex_);
        if (from < 0 || from >= items_.size() || to < 0 || to >= items_.size()) {
            return false;
        }
        if (from == to) {
            return true;
        }
        items_.move(from, to);
        persisted = persistLocked();
    }
    emit queueChanged();
    if (!persisted) {
        emit persistFailed(lastError());
    }
    return persisted;
}

bool QueueStore::replaceAll(const QList<QueueItem> &items)
{
    bool persisted = false;
    {
        QMutexLocker locker(&mutex_);
        items_.clear();
        QSet<QString> seen;
        for (const QueueItem &item : items) {
            if (item.displayName.isEmpty() || seen.contains(item.displayName)) {
                continue;
            }
            seen.insert(item.displayName);
            items_.append(item);
        }
        persisted = persistLocked();
    }
    emit queueChanged();
    if (!persisted) {
        emit persistFailed(lastError());
    }
    return persisted;
}

bool QueueStore::clear()
{
    return replaceAll({});
}

QList<QueueItem> QueueStore::items() const
{
    QMutexLocker locker(&mutex_);
    QList<QueueItem> result = items_;
    for (int i = 0; i < result.size(); ++i) {
        result[i].position = i;
    }
    return result;
}

QStringList QueueStore::names() const
{
    QMutexLocker locker(&mutex_);
    QStringList result;
    for (const QueueItem &item : items_) {
        result.append(item.displayName);
    }
    return result;
}

int QueueStore::count() const
{
    QMutexLocker locker(&mutex_);
    return items_.size();
}

bool QueueStore::contains(const QString &displayName) const
{
    QMutexLocker locker(&mutex_);
    return indexOfLocked(displayName) >= 0;
}

int QueueStore::indexOf(const QString &displayName) const
{
    QMutexLocker locker(&mutex_);
    return indexOfLocked(displayName);
}

QueueItem QueueStore::item(const QString &displayName) const
{
    QMutexLocker locker(&mutex_);
    int index = indexOfLocked(displayName);
    if (index < 0) {
        return QueueItem();
    }
    QueueItem result = items_.at(index);
    result.position = index;
    return result;
}

void QueueStore::setItemStage(const QString &displayName, ItemStage stage)
{
    {
        QMutexLocker locker(&mutex_);
        int index = indexOfLocked(displayName);
        if (index < 0) {
            return;
        }
        items_[index].stage = stage;
    }
    emit itemStageChanged(displayName, stage);
}

ItemStage QueueStore::itemStage(const QString &displayName) const
{
    QMutexLocker locker(&mutex_);
    int index = indexOfLocked(displayName);
    return index < 0 ? ItemStage::Queued : items_.at(index).stage;
}
