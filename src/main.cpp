#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QTextStream>
#include <QTimer>

#include <atomic>
#include <csignal>
#include <memory>
#include <utility>

#include "services/appsettings.h"
#include "services/conflictresolver.h"
#include "services/consoledecisionsource.h"
#include "services/downloadservice.h"
#include "services/errorhandler.h"
#include "services/externaltools.h"
#include "services/networkhttpclient.h"
#include "services/pausestatestore.h"
#include "services/queuestore.h"
#include "utils/fileutils.h"
#include "utils/logging.h"
#include "version.h"

namespace {

std::atomic<bool> interruptRequested(false);

void handleInterrupt(int)
{
    interruptRequested = true;
}

QTextStream &console()
{
    static QTextStream stream(stdout);
    return stream;
}

int listQueue(const DownloadService &service)
{
    const QList<QueueItem> items = service.items();
    if (items.isEmpty()) {
        console() << "Queue is empty" << Qt::endl;
        return 0;
    }
    for (const QueueItem &item : items) {
        console() << QString("%1. %2").arg(item.position + 1).arg(item.displayName);
        if (!item.sizeLabel.isEmpty()) {
            console() << "  [" << item.sizeLabel << "]";
        }
        if (service.hasPendingResume() && service.pendingResume().currentItem == item.displayName) {
            console() << "  (paused at " << service.pendingResume().operation << ")";
        }
        console() << Qt::endl;
    }
    return 0;
}

int runQueue(QCoreApplication &app, DownloadService &service)
{
    StageOrchestrator *orchestrator = service.orchestrator();

    QObject::connect(orchestrator, &StageOrchestrator::itemStarted, &app,
                     [](const QString &name, int position, int total) {
        console() << QString("[%1/%2] %3").arg(position).arg(total).arg(name) << Qt::endl;
    });
    QObject::connect(orchestrator, &StageOrchestrator::stageChanged, &app,
                     [](const QString &, ItemStage stage) {
        console() << "  " << itemStageToString(stage) << Qt::endl;
    });
    QObject::connect(orchestrator, &StageOrchestrator::transferProgress, &app,
                     [](qint64 received, qint64 total) {
        QString line = "\r  " + FileUtils::formatFileSize(received);
        if (total > 0) {
            line += " / " + FileUtils::formatFileSize(total)
                    + QString(" (%1%)").arg(received * 100 / total);
        }
        console() << line << "   " << Qt::flush;
    });
    QObject::connect(orchestrator, &StageOrchestrator::itemCompleted, &app,
                     [](const QString &name, bool skipped) {
        console() << Qt::endl << (skipped ? "  Already present: " : "  Done: ") << name << Qt::endl;
    });
    QObject::connect(orchestrator, &StageOrchestrator::itemFailed, &app,
                     [](const QString &name, ItemStage, const QString &error) {
        console() << Qt::endl << "  Failed: " << name << ": " << error << Qt::endl;
    });
    QObject::connect(orchestrator, &StageOrchestrator::itemPaused, &app,
                     [](const QString &name, ItemStage stage) {
        console() << Qt::endl << "  Paused " << name << " at " << stageToOperation(stage) << Qt::endl;
    });

    int exitCode = 0;
    QObject::connect(&service, &DownloadService::runFinished, &app,
                     [&app, &exitCode](StageOrchestrator::RunStatus status) {
        exitCode = status == StageOrchestrator::RunStatus::Completed ? 0 : 2;
        app.quit();
    });

    std::signal(SIGINT, handleInterrupt);
    std::signal(SIGTERM, handleInterrupt);

    // Signal handlers only set a flag; the stop happens on the event loop
    QTimer interruptPoll;
    QObject::connect(&interruptPoll, &QTimer::timeout, &app, [&app, &service, &exitCode]() {
        if (!interruptRequested) {
            return;
        }
        interruptRequested = false;
        console() << Qt::endl << "Stopping; progress is saved and resumes on the next run" << Qt::endl;
        service.shutdown();
        exitCode = 2;
        app.quit();
    });
    interruptPoll.start(200);

    if (!service.start()) {
        return 0;
    }
    app.exec();
    return exitCode;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("rompipe");
    app.setApplicationVersion(ROMPIPE_VERSION);
    app.setOrganizationName("rompipe");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Downloads game archives and prepares them for console storage.\n\n"
        "Commands:\n"
        "  add <platform> <file>     Queue a remote file (e.g. add ps3 \"Game (USA).zip\")\n"
        "  remove <name>...          Remove queued items by display name\n"
        "  move <from> <to>          Reorder the queue (1-based positions)\n"
        "  list                      Show the queue\n"
        "  clear                     Empty the queue\n"
        "  run                       Process the queue, resuming an interrupted item");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption verboseOption(
        QStringList() << "V" << "verbose",
        "Enable verbose logging output");
    parser.addOption(verboseOption);

    QCommandLineOption configOption(
        QStringList() << "c" << "config",
        "Settings file to use", "file");
    parser.addOption(configOption);

    QCommandLineOption dataRootOption(
        "data-root", "Directory holding the queue, processing and output folders", "dir");
    parser.addOption(dataRootOption);

    QCommandLineOption overwriteOption(
        "overwrite", "Overwrite existing files without asking");
    parser.addOption(overwriteOption);

    QCommandLineOption skipExistingOption(
        "skip-existing", "Keep existing files without asking");
    parser.addOption(skipExistingOption);

    QCommandLineOption sizeOption(
        "size", "Size label shown for an added item", "label");
    parser.addOption(sizeOption);

    QCommandLineOption deletePartialOption(
        "delete-partial", "Also delete the partial download of removed items");
    parser.addOption(deletePartialOption);

    parser.addPositionalArgument("command", "add, remove, move, list, clear or run");
    parser.addPositionalArgument("args", "Command arguments", "[args...]");

    parser.process(app);

    rompipe::verboseLogging = parser.isSet(verboseOption);
    if (rompipe::verboseLogging) {
        qDebug() << "Verbose logging enabled";
    }

    QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(1);
    }
    const QString command = args.takeFirst().toLower();

    if (parser.isSet(overwriteOption) && parser.isSet(skipExistingOption)) {
        qCritical() << "--overwrite and --skip-existing cannot be combined";
        return 1;
    }

    // Build the pipeline context
    QString dataRoot = parser.isSet(dataRootOption) ? parser.value(dataRootOption)
                                                    : AppSettings::defaultDataRoot();
    QString iniPath = parser.isSet(configOption)
        ? parser.value(configOption)
        : QDir(dataRoot).filePath("config/rompipe.ini");
    auto settings = std::make_shared<AppSettings>(iniPath, dataRoot);

    std::shared_ptr<IConflictDecisionSource> decisions;
    if (parser.isSet(overwriteOption)) {
        decisions = std::make_shared<ConsoleDecisionSource>(ConflictDecision::Overwrite);
    } else if (parser.isSet(skipExistingOption)) {
        decisions = std::make_shared<ConsoleDecisionSource>(ConflictDecision::Skip);
    } else {
        decisions = std::make_shared<ConsoleDecisionSource>();
    }

    PipelineContext context;
    context.settings = settings;
    context.http = std::make_shared<NetworkHttpClient>();
    context.queue = std::make_shared<QueueStore>(settings->queueFilePath());
    context.pauseStore = std::make_shared<PauseStateStore>(settings->pauseStateFilePath());
    context.resolver = std::make_shared<ConflictResolver>(decisions);
    context.errorHandler = std::make_shared<ErrorHandler>();
    context.tools = std::make_shared<ExternalTools>(settings);
    context.tools->setMissingToolHandler([settings](const QString &tool) {
        qWarning().noquote() << QString("%1 was not found on PATH. Set tools/%1 in %2 to use it.")
                                    .arg(tool, settings->iniPath());
        return false;
    });

    LOG_VERBOSE() << "Data root:" << settings->dataRoot();
    LOG_VERBOSE() << "Settings:" << settings->iniPath();

    DownloadService service(context);
    service.restoreSession();

    if (command == "add") {
        if (args.size() < 2) {
            qCritical() << "Usage: rompipe add <platform> <file>";
            return 1;
        }
        QString platformId = args.takeFirst();
        QString fileName = args.join(' ');
        if (!service.enqueue(platformId, fileName, parser.value(sizeOption))) {
            qCritical().noquote() << "Could not queue" << QueueItem::makeDisplayName(platformId, fileName);
            return 1;
        }
        console() << "Queued " << QueueItem::makeDisplayName(platformId, fileName) << Qt::endl;
        return 0;
    }

    if (command == "remove") {
        if (args.isEmpty()) {
            qCritical() << "Usage: rompipe remove <name>...";
            return 1;
        }
        int failures = 0;
        for (const QString &name : std::as_const(args)) {
            if (service.removeItem(name, parser.isSet(deletePartialOption))) {
                console() << "Removed " << name << Qt::endl;
            } else {
                qWarning().noquote() << "Not queued:" << name;
                ++failures;
            }
        }
        return failures == 0 ? 0 : 1;
    }

    if (command == "move") {
        bool fromOk = false;
        bool toOk = false;
        int from = args.value(0).toInt(&fromOk);
        int to = args.value(1).toInt(&toOk);
        if (!fromOk || !toOk || !service.moveItem(from - 1, to - 1)) {
            qCritical() << "Usage: rompipe move <from> <to> with positions from 'list'";
            return 1;
        }
        return listQueue(service);
    }

    if (command == "list") {
        return listQueue(service);
    }

    if (command == "clear") {
        if (!service.clearQueue()) {
            return 1;
        }
        console() << "Queue cleared" << Qt::endl;
        return 0;
    }

    if (command == "run") {
        QObject::connect(context.errorHandler.get(), &ErrorHandler::statusMessage, &app,
                         [](const QString &message, int) {
            console() << Qt::endl << message << Qt::endl;
        });
        QObject::connect(&service, &DownloadService::statusMessage, &app,
                         [](const QString &message, int) {
            console() << message << Qt::endl;
        });
        return runQueue(app, service);
    }

    qCritical().noquote() << "Unknown command:" << command;
    parser.showHelp(1);
}
