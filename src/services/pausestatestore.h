/**
 * @file pausestatestore.h
 * @brief Durable snapshot of where processing stopped.
 */

#ifndef PAUSESTATESTORE_H
#define PAUSESTATESTORE_H

#include <QDateTime>
#include <QMutex>
#include <QString>
#include <QStringList>

#include "../models/queueitem.h"

/**
 * @brief Where an interrupted run should pick up again.
 */
struct PauseState {
    QDateTime timestamp;
    QString currentItem;       ///< Display name of the active item
    QString queuePosition;     ///< "i/n", 1-based
    QString operation;         ///< download, unzip, decrypt, extract, split or move
    QString filePath;          ///< File the stage was working on, may be empty
    int processedCount = 0;
    int totalCount = 0;
    QStringList remainingQueue;  ///< currentItem first, then the rest in queue order

    [[nodiscard]] ItemStage stage() const { return operationToStage(operation); }

    /**
     * @brief Checks the record's internal consistency.
     * @param reason Receives a description of the first problem found.
     */
    [[nodiscard]] bool isValid(QString *reason = nullptr) const;
};

/**
 * @brief Reads and writes the pause record.
 *
 * The record is created only on pause or interruption and consumed once
 * at startup. An inconsistent record is deleted by load() and reported as
 * absent, so a damaged file never blocks the queue.
 */
class PauseStateStore
{
public:
    explicit PauseStateStore(const QString &filePath);

    /**
     * @brief Writes @p state, replacing any previous record.
     */
    bool save(const PauseState &state);

    /**
     * @brief Loads the record.
     * @param state Receives the record when one is present and valid.
     * @return False when there is no usable record.
     */
    bool load(PauseState *state);

    /**
     * @brief Deletes the record. Succeeds if there was none.
     */
    bool clear();

    [[nodiscard]] bool exists() const;
    [[nodiscard]] QString filePath() const { return filePath_; }
    [[nodiscard]] QString lastError() const;

private:
    QString filePath_;
    mutable QMutex mutex_;
    QString lastError_;
};

#endif // PAUSESTATESTORE_H
