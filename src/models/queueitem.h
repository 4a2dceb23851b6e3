#ifndef QUEUEITEM_H
#define QUEUEITEM_H

#include <QMetaType>
#include <QString>

/**
 * @brief Pipeline stages an item moves through.
 *
 * Decrypting, Extracting and Splitting only occur for platforms and
 * options that enable them.
 */
enum class ItemStage {
    Queued,       ///< Waiting in the queue
    Downloading,  ///< Remote archive transfer in progress
    Unzipping,    ///< Archive contents being written to the processing dir
    Decrypting,   ///< Disc image decryption via external tool
    Extracting,   ///< Disc image extraction via external tool
    Splitting,    ///< Splitting artifacts over the FAT32 ceiling
    Relocating,   ///< Moving artifacts into the output layout
    Completed,    ///< Finished and removed from the queue
    Paused,       ///< Suspended; a pause record describes where
    Failed        ///< Unrecoverable error; item kept in the queue
};

/// @brief Convert ItemStage to string for debugging and display
[[nodiscard]] inline const char* itemStageToString(ItemStage stage) {
    switch (stage) {
        case ItemStage::Queued: return "Queued";
        case ItemStage::Downloading: return "Downloading";
        case ItemStage::Unzipping: return "Unzipping";
        case ItemStage::Decrypting: return "Decrypting";
        case ItemStage::Extracting: return "Extracting";
        case ItemStage::Splitting: return "Splitting";
        case ItemStage::Relocating: return "Relocating";
        case ItemStage::Completed: return "Completed";
        case ItemStage::Paused: return "Paused";
        case ItemStage::Failed: return "Failed";
    }
    return "Unknown";
}

/**
 * @brief Operation name stored in the pause record for an active stage.
 * @return "download", "unzip", "decrypt", "extract", "split", "move",
 *         or an empty string for stages that are not resumable.
 */
[[nodiscard]] inline QString stageToOperation(ItemStage stage) {
    switch (stage) {
        case ItemStage::Downloading: return QStringLiteral("download");
        case ItemStage::Unzipping: return QStringLiteral("unzip");
        case ItemStage::Decrypting: return QStringLiteral("decrypt");
        case ItemStage::Extracting: return QStringLiteral("extract");
        case ItemStage::Splitting: return QStringLiteral("split");
        case ItemStage::Relocating: return QStringLiteral("move");
        default: return QString();
    }
}

/**
 * @brief Inverse of stageToOperation().
 * @return The stage, or ItemStage::Queued if @p operation is unknown.
 */
[[nodiscard]] inline ItemStage operationToStage(const QString &operation) {
    if (operation == QLatin1String("download")) return ItemStage::Downloading;
    if (operation == QLatin1String("unzip")) return ItemStage::Unzipping;
    if (operation == QLatin1String("decrypt")) return ItemStage::Decrypting;
    if (operation == QLatin1String("extract")) return ItemStage::Extracting;
    if (operation == QLatin1String("split")) return ItemStage::Splitting;
    if (operation == QLatin1String("move")) return ItemStage::Relocating;
    return ItemStage::Queued;
}

/**
 * @brief One entry of the download queue.
 *
 * Display names follow the "(PLATFORM) file name" convention, e.g.
 * "(PS3) Game (USA).zip", and are unique within a queue.
 */
struct QueueItem {
    QString displayName;
    QString platformId;   // Lower case, e.g. "ps3"
    QString sizeLabel;    // As shown by the catalog, e.g. "3.2 GiB"
    int position = 0;
    ItemStage stage = ItemStage::Queued;  // In-memory only

    /**
     * @brief Builds the display name for a platform and remote file name.
     */
    [[nodiscard]] static QString makeDisplayName(const QString &platformId, const QString &fileName)
    {
        return QString("(%1) %2").arg(platformId.toUpper(), fileName);
    }

    /**
     * @brief Parses a display name into an item.
     *
     * Names without a "(PLATFORM) " prefix are kept as-is with an empty
     * platform id.
     */
    [[nodiscard]] static QueueItem fromDisplayName(const QString &name, const QString &sizeLabel = QString())
    {
        QueueItem item;
        item.displayName = name;
        item.sizeLabel = sizeLabel;
        if (name.startsWith('(')) {
            int close = name.indexOf(QLatin1String(") "));
            if (close > 1) {
                item.platformId = name.mid(1, close - 1).toLower();
            }
        }
        return item;
    }

    /**
     * @brief Returns the remote file name without the platform prefix.
     */
    [[nodiscard]] QString fileName() const
    {
        if (!platformId.isEmpty()) {
            int close = displayName.indexOf(QLatin1String(") "));
            if (close > 0) {
                return displayName.mid(close + 2);
            }
        }
        return displayName;
    }

    /**
     * @brief Returns the file name without its last extension.
     */
    [[nodiscard]] QString baseName() const
    {
        QString name = fileName();
        int dot = name.lastIndexOf('.');
        return dot > 0 ? name.left(dot) : name;
    }
};

Q_DECLARE_METATYPE(ItemStage)

#endif // QUEUEITEM_H
