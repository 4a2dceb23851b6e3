/**
 * @file errorhandler.h
 * @brief Centralized error reporting for pipeline failures.
 *
 * This service standardizes how stage errors are categorized, logged and
 * turned into a single human-readable status line per incident.
 */

#ifndef ERRORHANDLER_H
#define ERRORHANDLER_H

#include <QObject>
#include <QString>

/**
 * @brief Categories of pipeline errors.
 *
 * The category decides how the orchestrator reacts: transient network
 * errors are retried, a corrupt archive entry only skips that entry, a
 * cancelled conflict aborts the current item only.
 */
enum class ErrorCategory {
    None,                 ///< No error
    TransientNetwork,     ///< Retried with backoff, terminal once retries run out
    Network,              ///< Terminal HTTP status (404, 403, ...)
    RemoteSizeUnknown,    ///< Size query failed; only affects size display
    ArchiveEntryCorrupt,  ///< One archive entry could not be extracted
    ConflictCancelled,    ///< User cancelled a destination conflict
    ExternalToolMissing,  ///< ps3dec/extractps3iso not found
    Filesystem            ///< Local I/O failure; item keeps its queue position
};

/**
 * @brief Severity levels determining how errors are logged.
 */
enum class ErrorSeverity {
    Info,      ///< Informational, short status timeout
    Warning,   ///< Warning, longer status timeout
    Critical   ///< Critical, status stays until replaced
};

/**
 * @brief Centralized error handling service.
 *
 * ErrorHandler provides consistent error reporting across the pipeline:
 * - Categorizes errors using the pipeline error taxonomy
 * - Logs through Qt's message handlers at a level matching the severity
 * - Emits exactly one status line per incident
 *
 * @par Example usage:
 * @code
 * ErrorHandler *handler = new ErrorHandler(this);
 *
 * connect(handler, &ErrorHandler::statusMessage,
 *         this, &Console::printStatus);
 *
 * handler->handleError(ErrorCategory::Filesystem,
 *                      ErrorSeverity::Warning,
 *                      "Relocation failed: Game.iso",
 *                      "Permission denied");
 * @endcode
 */
class ErrorHandler : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs an error handler.
     * @param parent Optional parent QObject for memory management.
     */
    explicit ErrorHandler(QObject *parent = nullptr);

    /**
     * @brief Destructor.
     */
    ~ErrorHandler() override = default;

    /// @name Generic Error Handling
    /// @{

    /**
     * @brief Handles an error with specified category and severity.
     * @param category The error category.
     * @param severity The error severity.
     * @param title Short error title/summary.
     * @param details Detailed error message.
     */
    void handleError(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details = QString());
    /// @}

    /// @name Convenience Methods for Pipeline Stages
    /// @{

    /**
     * @brief Handles the failure of one queue item.
     * @param itemName Display name of the item.
     * @param stage Human-readable stage name (e.g., "Downloading").
     * @param category The error category reported by the stage.
     * @param error The error message.
     *
     * Cancelled conflicts are reported as info, everything else as warning.
     */
    void handleItemFailed(const QString &itemName,
                          const QString &stage,
                          ErrorCategory category,
                          const QString &error);

    /**
     * @brief Handles a missing external tool (warning severity).
     * @param toolName Name of the executable.
     */
    void handleToolMissing(const QString &toolName);

    /**
     * @brief Handles a skipped archive entry (warning severity).
     * @param archive Archive file name.
     * @param entry Entry path inside the archive.
     * @param error The error message.
     */
    void handleEntrySkipped(const QString &archive, const QString &entry, const QString &error);
    /// @}

    /**
     * @brief Converts category to string for logging.
     * @param category The error category.
     * @return String representation.
     */
    [[nodiscard]] static QString categoryToString(ErrorCategory category);

    /**
     * @brief Converts severity to string for logging.
     * @param severity The error severity.
     * @return String representation.
     */
    [[nodiscard]] static QString severityToString(ErrorSeverity severity);

signals:
    /**
     * @brief Emitted with the single status line for an incident.
     * @param message The message text.
     * @param timeout Display timeout in milliseconds (0 for no timeout).
     */
    void statusMessage(const QString &message, int timeout);

    /**
     * @brief Emitted when an error is logged (for monitoring).
     * @param category The error category.
     * @param severity The error severity.
     * @param title The error title.
     * @param details The error details.
     */
    void errorLogged(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details);

private:
    /**
     * @brief Logs an error through Qt's message handlers.
     */
    void logError(ErrorCategory category,
                  ErrorSeverity severity,
                  const QString &title,
                  const QString &details);

    /**
     * @brief Gets the status timeout for a severity level.
     * @param severity The error severity.
     * @return Timeout in milliseconds.
     */
    [[nodiscard]] static int timeoutForSeverity(ErrorSeverity severity);
};

#endif // ERRORHANDLER_H
