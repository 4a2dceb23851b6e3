#include "externaltools.h"
#include "appsettings.h"
#include "../utils/logging.h"

#include <QDeadlineTimer>
#include <QFileInfo>
#include <QMutexLocker>
#include <QProcess>
#include <QStandardPaths>

ExternalTools::ExternalTools(std::shared_ptr<AppSettings> settings)
    : settings_(std::move(settings))
{
}

QStringList ExternalTools::candidateNames(const QString &toolName)
{
    if (toolName == QLatin1String(Ps3Dec)) {
        return {"ps3dec", "PS3Dec"};
    }
    if (toolName == QLatin1String(ExtractPs3Iso)) {
        return {"extractps3iso", "extractps3iso-linux"};
    }
    return {toolName};
}

QString ExternalTools::locate(const QString &toolName) const
{
    if (settings_) {
        QString configured = settings_->toolPath(toolName);
        if (!configured.isEmpty()) {
            QFileInfo info(configured);
            if (info.isFile() && info.isExecutable()) {
                return info.absoluteFilePath();
            }
            qWarning() << "Configured" << toolName << "path is not executable:" << configured;
        }
    }

    const QStringList names = candidateNames(toolName);
    for (const QString &name : names) {
        QString found = QStandardPaths::findExecutable(name);
        if (!found.isEmpty()) {
            return found;
        }
    }
    return QString();
}

QString ExternalTools::require(const QString &toolName)
{
    QString path = locate(toolName);
    if (!path.isEmpty()) {
        return path;
    }

    MissingToolHandler handler;
    {
        QMutexLocker locker(&mutex_);
        handler = missingToolHandler_;
    }
    if (handler && handler(toolName)) {
        path = locate(toolName);
    }
    return path;
}

ToolResult ExternalTools::run(const QString &program, const QStringList &arguments,
                              const CancelCheck &isCancelled, int timeoutMs) const
{
    ToolResult result;

    QProcess process;
    process.setProcessChannelMode(QProcess::MergedChannels);
    process.start(program, arguments);
    if (!process.waitForStarted()) {
        result.errorMessage = QString("Failed to start %1: %2").arg(program, process.errorString());
        return result;
    }
    result.started = true;

    LOG_VERBOSE() << "Running" << program << arguments;

    QDeadlineTimer deadline(timeoutMs);
    while (!process.waitForFinished(CancelPollMs)) {
        if (process.state() == QProcess::NotRunning) {
            break;
        }
        bool cancelled = isCancelled && isCancelled();
        if (!cancelled && !deadline.hasExpired()) {
            continue;
        }

        process.kill();
        process.waitForFinished();
        result.crashed = true;
        result.cancelled = cancelled;
        result.errorMessage = cancelled
            ? QString("%1 was cancelled").arg(QFileInfo(program).fileName())
            : QString("%1 did not finish: %2").arg(program, process.errorString());
        qInfo().noquote() << result.errorMessage;
        return result;
    }

    result.output = QString::fromLocal8Bit(process.readAll());
    result.crashed = process.exitStatus() == QProcess::CrashExit;
    result.exitCode = process.exitCode();

    if (!result.output.isEmpty()) {
        LOG_VERBOSE().noquote() << QFileInfo(program).fileName() << "output:" << result.output.trimmed();
    }
    if (!result.isSuccess()) {
        result.errorMessage = QString("%1 exited with code %2")
                                  .arg(QFileInfo(program).fileName())
                                  .arg(result.exitCode);
    }
    return result;
}

void ExternalTools::setMissingToolHandler(MissingToolHandler handler)
{
    QMutexLocker locker(&mutex_);
    missingToolHandler_ = std::move(handler);
}
