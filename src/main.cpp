#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QTextStream>
#include <QTimer>

#include <atomic>
#include <csignal>

#include "command_builder.h"
#include "duplicate_policy.h"
#include "log_manager.h"
#include "settings_store.h"
#include "transfer_supervisor.h"

namespace {

enum ExitStatus {
    ExitSucceeded = 0,
    ExitWarnings = 1,
    ExitFailed = 2,
    ExitCancelled = 3,
    ExitRejected = 4
};

std::atomic_bool g_interrupted{false};

void onInterrupt(int)
{
    g_interrupted = true;
}

QTextStream& out()
{
    static QTextStream ts(stdout);
    return ts;
}

QTextStream& err()
{
    static QTextStream ts(stderr);
    return ts;
}

int exitStatusFor(TransferResult::Outcome outcome)
{
    switch (outcome) {
    case TransferResult::Outcome::Succeeded: return ExitSucceeded;
    case TransferResult::Outcome::SucceededWithWarnings: return ExitWarnings;
    case TransferResult::Outcome::Failed: return ExitFailed;
    case TransferResult::Outcome::Cancelled: return ExitCancelled;
    }
    return ExitFailed;
}

void printReport(const PreflightReport& report)
{
    out() << "Sources:     " << report.totalFiles << " file(s), " << TransferTypes::formatBytes(report.totalBytes) << "\n";
    out() << "To transfer: " << report.transferFiles << " file(s), " << TransferTypes::formatBytes(report.transferBytes) << "\n";
    out() << "Free space:  " << (report.destinationFreeBytes >= 0 ? TransferTypes::formatBytes(report.destinationFreeBytes)
                                                                   : QStringLiteral("unknown"))
          << (report.hasEnoughSpace ? "" : "  (not enough)") << "\n";
    if (report.hasCollisions()) out() << "Duplicates:  " << report.collisions.size() << "\n";
    for (const QString& w : report.warnings) out() << "Warning: " << w << "\n";
    out().flush();
}

void printResult(const TransferResult& result)
{
    out() << "\n" << TransferTypes::outcomeName(result.outcome) << (result.dryRun ? " (dry run)" : "") << ": "
          << result.filesCopied << " file(s), " << TransferTypes::formatBytes(result.bytesCopied) << " in "
          << QString::number(result.elapsedMs / 1000.0, 'f', 1) << " s";
    if (result.exitCode >= 0) out() << ", exit code " << result.exitCode;
    if (result.retriesUsed > 0) out() << ", " << result.retriesUsed << " retr" << (result.retriesUsed == 1 ? "y" : "ies");
    out() << "\n";
    for (const QString& w : result.warnings) out() << "Warning: " << w << "\n";
    for (const TransferErrorEntry& e : result.errors) {
        out() << "Error [" << TransferTypes::errorName(e.reason) << "] " << (e.path.isEmpty() ? QString() : e.path + ": ")
              << e.message << "\n";
    }
    out().flush();
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Identify app for QSettings
    QCoreApplication::setOrganizationName("ReelTransfer");
    QCoreApplication::setApplicationName("ReelTransfer");
    QCoreApplication::setApplicationVersion("1.0.0");

    // Console shows warnings and errors; the log file gets everything
    LogManager::instance().setEchoLevel("WARN");
    qInstallMessageHandler(customMessageHandler);

    QCommandLineParser parser;
    parser.setApplicationDescription("Copy or move media folders with Robocopy, with preflight checks and retries.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("source", "Files or folders to transfer.", "<source>...");

    const QCommandLineOption destOpt(QStringList{"d", "dest"}, "Destination folder.", "path");
    const QCommandLineOption moveOpt("move", "Move instead of copy.");
    const QCommandLineOption mirrorOpt("mirror", "Mirror folders (deletes extra files at the destination).");
    const QCommandLineOption noSubOpt("no-subfolders", "Only transfer top-level files of folder sources.");
    const QCommandLineOption dryRunOpt("dry-run", "List what would be transferred without writing anything.");
    const QCommandLineOption retriesOpt("retries", "Relaunches after a transient failure.", "n");
    const QCommandLineOption waitOpt("wait", "Seconds to wait between retries.", "seconds");
    const QCommandLineOption threadsOpt("threads", "Copy threads (1-128).", "n");
    const QCommandLineOption excludeOpt("exclude", "File name pattern to skip (repeatable).", "pattern");
    const QCommandLineOption dupOpt("on-duplicate", "What to do with names already at the destination: skip, overwrite or rename.", "action");
    const QCommandLineOption toolOpt("tool", "Path to the copy tool.", "path");
    const QCommandLineOption previewOpt("preview", "Print the command line(s) and exit.");
    const QCommandLineOption forceOpt("force", "Start even when the destination looks too small.");
    const QCommandLineOption logOpt("log", "Append the full log to this file.", "file");
    const QCommandLineOption noSaveOpt("no-save", "Do not remember these options.");
    parser.addOptions({destOpt, moveOpt, mirrorOpt, noSubOpt, dryRunOpt, retriesOpt, waitOpt, threadsOpt, excludeOpt,
                       dupOpt, toolOpt, previewOpt, forceOpt, logOpt, noSaveOpt});
    parser.process(app);

    if (parser.isSet(logOpt)) {
        QString logError;
        if (!LogManager::instance().setLogFilePath(parser.value(logOpt), &logError)) {
            err() << "Cannot open log file " << parser.value(logOpt) << ": " << logError << "\n";
            return ExitRejected;
        }
    }
    qInfo() << "[Main] Started" << QCoreApplication::arguments().join(' ');

    QSettingsStore settings;
    TransferRequest request = TransferSettings::loadRequest(settings);
    DuplicateAction duplicateAction = TransferSettings::loadDuplicateAction(settings);

    QStringList sources;
    for (const QString& s : parser.positionalArguments()) sources << QFileInfo(s).absoluteFilePath();
    if (!sources.isEmpty()) request.sources = sources;
    if (parser.isSet(destOpt)) request.destination = QFileInfo(parser.value(destOpt)).absoluteFilePath();
    if (parser.isSet(moveOpt)) request.mode = TransferMode::Move;
    if (parser.isSet(mirrorOpt)) request.mirror = true;
    if (parser.isSet(noSubOpt)) request.includeSubfolders = false;
    request.dryRun = parser.isSet(dryRunOpt);
    if (parser.isSet(excludeOpt)) request.excludePatterns = parser.values(excludeOpt);

    auto intOption = [&parser](const QCommandLineOption& opt, int* target) {
        if (!parser.isSet(opt)) return true;
        bool ok = false;
        const int v = parser.value(opt).toInt(&ok);
        if (!ok) {
            err() << "Not a number for --" << opt.names().constLast() << ": " << parser.value(opt) << "\n";
            return false;
        }
        *target = v;
        return true;
    };
    if (!intOption(retriesOpt, &request.retries) || !intOption(waitOpt, &request.waitSecondsBetweenRetries)
        || !intOption(threadsOpt, &request.threadCount)) {
        return ExitRejected;
    }
    if (parser.isSet(dupOpt) && !DuplicatePolicy::parseAction(parser.value(dupOpt), &duplicateAction)) {
        err() << "Unknown duplicate action: " << parser.value(dupOpt) << " (use skip, overwrite or rename)\n";
        return ExitRejected;
    }

    QString tool = parser.value(toolOpt);
    if (tool.isEmpty()) {
        QString toolError;
        tool = TransferSettings::locateCopyTool(settings, &toolError);
        if (tool.isEmpty()) {
            err() << toolError << "\n";
            return ExitRejected;
        }
    }

    TransferSupervisor supervisor;
    supervisor.setCopyToolPath(tool);
    supervisor.setPreflightOptions(TransferSettings::loadPreflightOptions(settings));
    supervisor.setCancelGracePeriodMs(TransferSettings::loadCancelGraceMs(settings));

    const bool previewOnly = parser.isSet(previewOpt);
    const bool force = parser.isSet(forceOpt);

    auto launch = [&]() {
        if (previewOnly) {
            out() << supervisor.invocation().preview << "\n";
            out().flush();
            QCoreApplication::exit(ExitSucceeded);
            return;
        }
        TransferFailure failure;
        if (!supervisor.start(&failure)) {
            err() << failure.message << "\n";
            QCoreApplication::exit(ExitRejected);
        }
    };

    QObject::connect(&supervisor, &TransferSupervisor::preflightFailed, &app, [](const TransferFailure& failure) {
        err() << "Preflight failed [" << TransferTypes::errorName(failure.code) << "]: " << failure.message << "\n";
        QCoreApplication::exit(ExitRejected);
    });

    QObject::connect(&supervisor, &TransferSupervisor::preflightFinished, &app, [&](const PreflightReport& report) {
        printReport(report);
        if (!report.hasEnoughSpace && !force && !request.dryRun && !previewOnly) {
            err() << "Not enough free space at " << request.destination << " (use --force to start anyway)\n";
            QCoreApplication::exit(ExitRejected);
            return;
        }
        if (supervisor.state() == TransferSupervisor::State::AwaitingResolution) {
            const DuplicateResolution resolution =
                DuplicatePolicy::resolve(report.collisionPaths(), duplicateAction);
            out() << "Resolving " << report.collisions.size() << " duplicate(s) with '"
                  << DuplicatePolicy::actionName(duplicateAction) << "'\n";
            TransferFailure failure;
            if (!supervisor.resolve(resolution, &failure)) {
                err() << failure.message << "\n";
                QCoreApplication::exit(ExitRejected);
                return;
            }
        }
        launch();
    });

    QObject::connect(&supervisor, &TransferSupervisor::progress, &app, [](const ProgressEvent& ev) {
        switch (ev.kind) {
        case ProgressEvent::Kind::FileStarted:
            out() << "  " << ev.fileClass << "  " << ev.name
                  << (ev.total >= 0 ? QString("  (%1)").arg(TransferTypes::formatBytes(ev.total)) : QString()) << "\n";
            break;
        case ProgressEvent::Kind::FileError:
            out() << "  ERROR " << ev.reasonCode << "  " << ev.name << "  " << ev.message << "\n";
            break;
        case ProgressEvent::Kind::RetryScheduled:
            out() << "Transient failure, retry " << ev.attempt << " in " << ev.delaySeconds << " s\n";
            break;
        default:
            return;
        }
        out().flush();
    });

    QObject::connect(&supervisor, &TransferSupervisor::finished, &app, [](const TransferResult& result) {
        printResult(result);
        QCoreApplication::exit(exitStatusFor(result.outcome));
    });

    std::signal(SIGINT, onInterrupt);
    QTimer interruptPoll;
    interruptPoll.setInterval(100);
    QObject::connect(&interruptPoll, &QTimer::timeout, &app, [&]() {
        if (!g_interrupted.exchange(false)) return;
        if (supervisor.cancel()) {
            err() << "Cancelling...\n";
            err().flush();
            return;
        }
        // Nothing launched yet; preflight only reads
        QCoreApplication::exit(ExitCancelled);
    });
    interruptPoll.start();

    TransferFailure failure;
    if (!supervisor.prepare(request, &failure)) {
        err() << "Invalid request [" << TransferTypes::errorName(failure.code) << "]: " << failure.message << "\n";
        return ExitRejected;
    }
    if (!parser.isSet(noSaveOpt)) {
        TransferSettings::saveRequest(settings, request);
        TransferSettings::saveDuplicateAction(settings, duplicateAction);
    }

    const int status = app.exec();
    LogManager::instance().flush();
    return status;
}
