#include "transfer_worker.h"
#include "copy_engine.h"
#include "duplicate_policy.h"
#include "progress_parser.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSet>
#include <QTimer>
#include <QDebug>

TransferWorker::TransferWorker(const TransferRequest& request, const PreflightReport& report,
                               const Invocation& invocation, const SupervisorOptions& options, QObject* parent)
    : QObject(parent)
    , m_request(request)
    , m_report(report)
    , m_invocation(invocation)
    , m_options(options)
{
    // Parented so they follow the worker into its thread
    m_retryTimer = new QTimer(this);
    m_retryTimer->setSingleShot(true);
    connect(m_retryTimer, &QTimer::timeout, this, &TransferWorker::launchStep);

    m_graceTimer = new QTimer(this);
    m_graceTimer->setSingleShot(true);
    connect(m_graceTimer, &QTimer::timeout, this, &TransferWorker::onGraceExpired);
}

TransferWorker::~TransferWorker()
{
    if (m_engine && m_engine->isRunning()) m_engine->kill();
}

void TransferWorker::requestCancel()
{
    m_cancelRequested = true;
    QMetaObject::invokeMethod(this, [this]() { handleCancel(); }, Qt::QueuedConnection);
}

void TransferWorker::run()
{
    m_elapsed.start();
    m_result = TransferResult();
    m_result.dryRun = m_invocation.dryRun;

    m_engine = m_options.engineFactory ? m_options.engineFactory(this) : new ProcessCopyEngine(this);
    connect(m_engine, &CopyEngine::lineReceived, this, &TransferWorker::onLine);
    connect(m_engine, &CopyEngine::finished, this, &TransferWorker::onEngineFinished);
    connect(m_engine, &CopyEngine::failedToStart, this, &TransferWorker::onFailedToStart);

    qInfo() << "[Transfer] Starting" << m_invocation.steps.size() << "step(s)," << m_invocation.renames.size()
            << "auto-rename(s)" << (m_invocation.dryRun ? "(dry run)" : "");

    if (m_invocation.steps.isEmpty()) {
        performRenames();
        finish(TransferResult::Outcome::Succeeded);
        return;
    }
    launchStep();
}

void TransferWorker::launchStep()
{
    if (m_done) return;
    if (m_cancelRequested) {
        finish(TransferResult::Outcome::Cancelled);
        return;
    }
    const InvocationStep& step = m_invocation.steps.at(m_stepIndex);
    beginAttempt();
    ++m_result.launchAttempts;
    emit attemptStarted(m_result.launchAttempts, m_stepIndex);
    emit logLine(QString("[Launch %1] %2").arg(m_result.launchAttempts)
                     .arg(m_invocation.steps.size() > 1 ? QString("step %1/%2").arg(m_stepIndex + 1).arg(m_invocation.steps.size())
                                                        : step.sourceRoot));
    m_engine->start(m_invocation.program, step.arguments);
}

void TransferWorker::beginAttempt()
{
    m_currentFile.clear();
    m_currentSize = 0;
    m_attemptFiles = 0;
    m_attemptBytes = 0;
    m_haveFilesSummary = false;
    m_haveBytesSummary = false;
    m_filesSummary = SummaryCounts();
    m_bytesSummary = SummaryCounts();
}

void TransferWorker::closeAttempt()
{
    m_completedBytes += m_currentSize;
    m_currentSize = 0;
    m_currentFile.clear();
    m_result.filesCopied += m_haveFilesSummary ? static_cast<int>(m_filesSummary.copied) : m_attemptFiles;
    m_result.bytesCopied += m_haveBytesSummary ? m_bytesSummary.copied : m_attemptBytes;
}

void TransferWorker::onLine(const QString& line)
{
    if (m_done) return;
    emit logLine(line);

    const std::optional<ProgressEvent> parsed = ProgressParser::parse(line);
    if (!parsed) return;
    const ProgressEvent& ev = *parsed;

    switch (ev.kind) {
    case ProgressEvent::Kind::FileStarted: {
        // A new file line means the previous one is done
        m_completedBytes += m_currentSize;
        m_currentFile = ev.name;
        m_currentSize = qMax<qint64>(0, ev.total);
        ++m_attemptFiles;
        m_attemptBytes += m_currentSize;
        emit progress(ev);
        emit progress(ProgressEvent::bytesCopied(m_completedBytes, m_report.transferBytes));
        break;
    }
    case ProgressEvent::Kind::FileProgress: {
        emit progress(ev);
        const qint64 done = static_cast<qint64>(static_cast<double>(m_currentSize) * ev.percent / 100.0);
        emit progress(ProgressEvent::bytesCopied(m_completedBytes + done, m_report.transferBytes));
        break;
    }
    case ProgressEvent::Kind::FileError: {
        // The tool repeats the error for each of its own retries
        const bool repeat = !m_result.errors.isEmpty() && m_result.errors.last().path == ev.name
                         && m_result.errors.last().nativeCode == ev.reasonCode;
        if (!repeat) addError(ev.name, TransferError::FileCopyFailed, ev.message, ev.reasonCode);
        if (!ev.name.isEmpty() && ev.name == m_currentFile && m_attemptFiles > 0) {
            --m_attemptFiles;
            m_attemptBytes -= m_currentSize;
            m_currentSize = 0;
            m_currentFile.clear();
        }
        emit progress(ev);
        break;
    }
    case ProgressEvent::Kind::Summary:
        if (ev.summaryRow == ProgressEvent::SummaryRow::Files) {
            m_filesSummary = ev.counts;
            m_haveFilesSummary = true;
        } else {
            m_bytesSummary = ev.counts;
            m_haveBytesSummary = true;
        }
        emit progress(ev);
        break;
    default:
        emit progress(ev);
        break;
    }
}

void TransferWorker::onEngineFinished(int exitCode, bool crashed)
{
    if (m_done) return;
    m_graceTimer->stop();
    closeAttempt();
    m_result.exitCode = exitCode;

    if (m_cancelRequested) {
        finish(TransferResult::Outcome::Cancelled);
        return;
    }
    if (crashed) {
        fail(TransferError::ProcessCrashed, QString("Copy tool terminated abnormally (exit code %1)").arg(exitCode), exitCode);
        return;
    }

    const InvocationStep& step = m_invocation.steps.at(m_stepIndex);
    const QString description = m_options.classifier.describe(exitCode);
    switch (m_options.classifier.classify(exitCode)) {
    case ExitCodeClassifier::Category::Warning:
        m_result.warnings << QString("%1: exit code %2 (%3)").arg(step.sourceRoot).arg(exitCode).arg(description);
        qWarning() << "[Transfer] Exit code" << exitCode << description;
        Q_FALLTHROUGH();
    case ExitCodeClassifier::Category::Success:
        ++m_stepIndex;
        if (m_stepIndex < m_invocation.steps.size()) {
            launchStep();
            return;
        }
        performRenames();
        finish(TransferResult::Outcome::Succeeded);
        return;
    case ExitCodeClassifier::Category::Transient:
        // One retry budget for the whole transfer, shared by all steps
        if (m_result.retriesUsed < m_request.retries) {
            const int attempt = ++m_result.retriesUsed;
            const int wait = qMax(0, m_request.waitSecondsBetweenRetries);
            qInfo() << "[Transfer] Exit code" << exitCode << "is transient, retry" << attempt << "of"
                    << m_request.retries << "in" << wait << "s";
            emit progress(ProgressEvent::retryScheduled(attempt, wait));
            emit retrying(attempt, wait);
            m_retryTimer->start(wait * 1000);
            return;
        }
        fail(TransferError::RetriesExhausted,
             QString("Exit code %1 (%2) persisted after %3 retr%4")
                 .arg(exitCode).arg(description).arg(m_result.retriesUsed)
                 .arg(m_result.retriesUsed == 1 ? "y" : "ies"),
             exitCode);
        return;
    case ExitCodeClassifier::Category::Fatal:
        fail(TransferError::FatalExitCode, QString("Exit code %1: %2").arg(exitCode).arg(description), exitCode);
        return;
    case ExitCodeClassifier::Category::Unknown:
        fail(TransferError::UnknownExitCode, QString("Exit code %1: %2").arg(exitCode).arg(description), exitCode);
        return;
    }
}

void TransferWorker::onFailedToStart(const QString& message)
{
    if (m_done) return;
    if (m_cancelRequested) {
        finish(TransferResult::Outcome::Cancelled);
        return;
    }
    fail(TransferError::SpawnError, QString("Could not start %1: %2").arg(m_invocation.program, message));
}

void TransferWorker::handleCancel()
{
    if (m_done) return;
    if (m_retryTimer->isActive()) {
        m_retryTimer->stop();
        finish(TransferResult::Outcome::Cancelled);
        return;
    }
    if (m_engine && m_engine->isRunning()) {
        qInfo() << "[Transfer] Cancel requested, stopping copy tool";
        m_engine->terminate();
        if (!m_graceTimer->isActive()) m_graceTimer->start(qMax(0, m_options.cancelGraceMs));
        return;
    }
    // The launch is still queued; launchStep() sees the flag.
}

void TransferWorker::onGraceExpired()
{
    if (m_done || !m_engine || !m_engine->isRunning()) return;
    qWarning() << "[Transfer] Copy tool ignored terminate for" << m_options.cancelGraceMs << "ms, killing";
    m_engine->kill();
}

void TransferWorker::performRenames()
{
    if (m_invocation.renames.isEmpty()) return;
    const QDir destDir(QDir::fromNativeSeparators(m_request.destination));

    for (const RenameOperation& op : m_invocation.renames) {
        if (m_cancelRequested) return;
        const QString source = QDir::fromNativeSeparators(op.sourcePath);
        QString target = QDir::fromNativeSeparators(op.targetPath);

        if (m_invocation.dryRun) {
            emit logLine(QString("[auto-rename] would %1 %2 -> %3")
                             .arg(m_invocation.mode == TransferMode::Move ? "move" : "copy", op.sourcePath, op.targetPath));
            ++m_result.filesCopied;
            m_result.bytesCopied += op.bytes;
            continue;
        }

        if (QFileInfo::exists(target)) {
            // Something claimed the planned name after preflight; take the next free one
            QSet<QString> taken;
            taken.insert(destDir.relativeFilePath(target));
            QString rel;
            do {
                rel = DuplicatePolicy::autoRenameTarget(op.relativePath, taken, Qt::CaseSensitive);
            } while (QFileInfo::exists(destDir.filePath(rel)));
            qWarning() << "[Transfer]" << op.targetPath << "appeared during the transfer, using" << rel;
            target = destDir.filePath(rel);
        }

        if (!QDir().mkpath(QFileInfo(target).path())) {
            addError(op.sourcePath, TransferError::RenameFailed,
                     QString("Cannot create folder %1").arg(QDir::toNativeSeparators(QFileInfo(target).path())));
            continue;
        }

        QFile file(source);
        const bool ok = m_invocation.mode == TransferMode::Move ? file.rename(target) : file.copy(target);
        if (!ok) {
            addError(op.sourcePath, TransferError::RenameFailed,
                     QString("Cannot write %1: %2").arg(QDir::toNativeSeparators(target), file.errorString()));
            continue;
        }
        emit logLine(QString("[auto-rename] %1 -> %2").arg(op.sourcePath, QDir::toNativeSeparators(target)));
        ++m_result.filesCopied;
        m_result.bytesCopied += op.bytes;
        m_completedBytes += op.bytes;
        emit progress(ProgressEvent::bytesCopied(m_completedBytes, m_report.transferBytes));
    }
}

void TransferWorker::addError(const QString& path, TransferError reason, const QString& message, int nativeCode)
{
    TransferErrorEntry entry;
    entry.path = path;
    entry.reason = reason;
    entry.nativeCode = nativeCode;
    entry.message = message;
    m_result.errors.push_back(entry);
}

void TransferWorker::fail(TransferError reason, const QString& message, int nativeCode)
{
    qWarning() << "[Transfer]" << TransferTypes::errorName(reason) << message;
    const QString path = m_stepIndex < m_invocation.steps.size() ? m_invocation.steps.at(m_stepIndex).sourceRoot
                                                                 : m_request.destination;
    addError(path, reason, message, nativeCode);
    finish(TransferResult::Outcome::Failed);
}

void TransferWorker::finish(TransferResult::Outcome outcome)
{
    if (m_done) return;
    m_done = true;
    m_retryTimer->stop();
    m_graceTimer->stop();

    if (m_cancelRequested) outcome = TransferResult::Outcome::Cancelled;
    if (outcome == TransferResult::Outcome::Succeeded && (!m_result.errors.isEmpty() || !m_result.warnings.isEmpty())) {
        outcome = TransferResult::Outcome::SucceededWithWarnings;
    }
    if (outcome == TransferResult::Outcome::Cancelled) {
        addError(m_request.destination, TransferError::Cancelled,
                 "Transfer cancelled; files already transferred remain at the destination");
    }

    m_result.outcome = outcome;
    m_result.elapsedMs = m_elapsed.isValid() ? m_elapsed.elapsed() : 0;
    qInfo() << "[Transfer] Finished:" << TransferTypes::outcomeName(outcome) << m_result.filesCopied << "file(s),"
            << TransferTypes::formatBytes(m_result.bytesCopied) << "in" << m_result.elapsedMs << "ms";

    emit progress(ProgressEvent::completed());
    emit finished(m_result);
}
