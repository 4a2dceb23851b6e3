/**
 * @file queuestore.h
 * @brief Durable, ordered download queue.
 */

#ifndef QUEUESTORE_H
#define QUEUESTORE_H

#include <QList>
#include <QMutex>
#include <QObject>
#include <QString>
#include <QStringList>

#include "../models/queueitem.h"

/**
 * @brief Ordered queue of pending items, persisted as a JSON array.
 *
 * Insertion order is processing order and display names are unique.
 * Every structural change (enqueue, remove, move, clear, replace)
 * rewrites the whole record through QSaveFile before the call returns,
 * so a crash right after a removal cannot bring the item back.
 *
 * All methods are thread-safe. Stage annotations are kept in memory only.
 *
 * @par Record format:
 * @code
 * [ { "name": "(PS3) Game (USA).zip", "size": "3.2 GiB" }, ... ]
 * @endcode
 */
class QueueStore : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs a store persisting to @p filePath.
     * @param filePath Location of the queue record. Parent directories are
     *        created on first save.
     * @param parent Optional parent QObject for memory management.
     */
    explicit QueueStore(const QString &filePath, QObject *parent = nullptr);
    ~QueueStore() override = default;

    /// @name Persistence
    /// @{

    /**
     * @brief Replaces the in-memory queue with the persisted record.
     * @return True on success or if no record exists yet.
     */
    bool load();

    [[nodiscard]] QString filePath() const { return filePath_; }
    [[nodiscard]] QString lastError() const;
    /// @}

    /// @name Structural Changes
    /// @{

    /**
     * @brief Appends @p item.
     * @return False if an item with the same display name is queued or
     *         the record could not be written.
     */
    bool enqueue(const QueueItem &item);

    /**
     * @brief Removes the item named @p displayName.
     * @return True if it was removed and the record was written.
     */
    bool remove(const QString &displayName);

    /**
     * @brief Moves the item at @p from to index @p to.
     */
    bool move(int from, int to);

    /**
     * @brief Replaces the whole queue, e.g. when restoring a session.
     *
     * Duplicate names after the first occurrence are dropped.
     */
    bool replaceAll(const QList<QueueItem> &items);

    bool clear();
    /// @}

    /// @name Queries
    /// @{
    [[nodiscard]] QList<QueueItem> items() const;
    [[nodiscard]] QStringList names() const;
    [[nodiscard]] int count() const;
    [[nodiscard]] bool isEmpty() const { return count() == 0; }
    [[nodiscard]] bool contains(const QString &displayName) const;
    [[nodiscard]] int indexOf(const QString &displayName) const;

    /**
     * @brief Returns the item named @p displayName, or a default item
     *        with an empty name.
     */
    [[nodiscard]] QueueItem item(const QString &displayName) const;
    /// @}

    /// @name Status Annotation
    /// @{
    void setItemStage(const QString &displayName, ItemStage stage);
    [[nodiscard]] ItemStage itemStage(const QString &displayName) const;
    /// @}

signals:
    /**
     * @brief Emitted after every structural change.
     */
    void queueChanged();

    void itemStageChanged(const QString &displayName, ItemStage stage);

    /**
     * @brief Emitted when the record could not be written.
     */
    void persistFailed(const QString &error);

private:
    bool persistLocked();
    [[nodiscard]] int indexOfLocked(const QString &displayName) const;

    QString filePath_;
    mutable QMutex mutex_;
    QList<QueueItem> items_;
    QString lastError_;
};

#endif // QUEUESTORE_H
