#include "errorhandler.h"

#include <QDebug>

ErrorHandler::ErrorHandler(QObject *parent)
    : QObject(parent)
{
}

void ErrorHandler::handleError(ErrorCategory category,
                               ErrorSeverity severity,
                               const QString &title,
                               const QString &details)
{
    logError(category, severity, title, details);

    // One line per incident
    QString message = title;
    if (!details.isEmpty() && details != title) {
        message = QString("%1: %2").arg(title, details);
    }

    emit statusMessage(message, timeoutForSeverity(severity));
}

void ErrorHandler::handleItemFailed(const QString &itemName,
                                    const QString &stage,
                                    ErrorCategory category,
                                    const QString &error)
{
    ErrorSeverity severity = category == ErrorCategory::ConflictCancelled
        ? ErrorSeverity::Info
        : ErrorSeverity::Warning;

    handleError(category,
                severity,
                tr("%1 failed while %2").arg(itemName, stage.toLower()),
                error);
}

void ErrorHandler::handleToolMissing(const QString &toolName)
{
    handleError(ErrorCategory::ExternalToolMissing,
                ErrorSeverity::Warning,
                tr("Required tool not found"),
                toolName);
}

void ErrorHandler::handleEntrySkipped(const QString &archive, const QString &entry, const QString &error)
{
    handleError(ErrorCategory::ArchiveEntryCorrupt,
                ErrorSeverity::Warning,
                tr("Skipped %1 in %2").arg(entry, archive),
                error);
}

void ErrorHandler::logError(ErrorCategory category,
                            ErrorSeverity severity,
                            const QString &title,
                            const QString &details)
{
    QString logMessage = QString("[%1/%2] %3")
        .arg(categoryToString(category),
             severityToString(severity),
             title);

    if (!details.isEmpty() && details != title) {
        logMessage += QString(": %1").arg(details);
    }

    switch (severity) {
    case ErrorSeverity::Info:
        qInfo().noquote() << logMessage;
        break;
    case ErrorSeverity::Warning:
        qWarning().noquote() << logMessage;
        break;
    case ErrorSeverity::Critical:
        qCritical().noquote() << logMessage;
        break;
    }

    emit errorLogged(category, severity, title, details);
}

int ErrorHandler::timeoutForSeverity(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return 3000;
    case ErrorSeverity::Warning:
        return 5000;
    case ErrorSeverity::Critical:
        return 0;     // No timeout - stays until replaced
    }
    return 5000;
}

QString ErrorHandler::categoryToString(ErrorCategory category)
{
    switch (category) {
    case ErrorCategory::None:
        return QStringLiteral("None");
    case ErrorCategory::TransientNetwork:
        return QStringLiteral("Transient");
    case ErrorCategory::Network:
        return QStringLiteral("Network");
    case ErrorCategory::RemoteSizeUnknown:
        return QStringLiteral("SizeUnknown");
    case ErrorCategory::ArchiveEntryCorrupt:
        return QStringLiteral("Archive");
    case ErrorCategory::ConflictCancelled:
        return QStringLiteral("Conflict");
    case ErrorCategory::ExternalToolMissing:
        return QStringLiteral("Tool");
    case ErrorCategory::Filesystem:
        return QStringLiteral("FileOp");
    }
    return QStringLiteral("Unknown");
}

QString ErrorHandler::severityToString(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return QStringLiteral("INFO");
    case ErrorSeverity::Warning:
        return QStringLiteral("WARN");
    case ErrorSeverity::Critical:
        return QStringLiteral("CRIT");
    }
    return QStringLiteral("UNKNOWN");
}
