#include "transfer_types.h"

#include <QLocale>

QStringList PreflightReport::collisionPaths() const
{
    QStringList out;
    out.reserve(collisions.size());
    for (const Collision& c : collisions) out << c.relativePath;
    return out;
}

ProgressEvent ProgressEvent::fileStarted(const QString& name, qint64 size, const QString& fileClass)
{
    ProgressEvent e; e.kind = Kind::FileStarted; e.name = name; e.total = size; e.fileClass = fileClass;
    return e;
}

ProgressEvent ProgressEvent::fileProgress(double percent)
{
    ProgressEvent e; e.kind = Kind::FileProgress; e.percent = percent;
    return e;
}

ProgressEvent ProgressEvent::bytesCopied(qint64 current, qint64 total)
{
    ProgressEvent e; e.kind = Kind::BytesCopied; e.current = current; e.total = total;
    if (total > 0) e.percent = double(current) * 100.0 / double(total);
    return e;
}

ProgressEvent ProgressEvent::fileError(const QString& name, int reasonCode, const QString& message)
{
    ProgressEvent e; e.kind = Kind::FileError; e.name = name; e.reasonCode = reasonCode; e.message = message;
    return e;
}

ProgressEvent ProgressEvent::toolRetrying(int delaySeconds)
{
    ProgressEvent e; e.kind = Kind::ToolRetrying; e.delaySeconds = delaySeconds;
    return e;
}

ProgressEvent ProgressEvent::retryScheduled(int attempt, int delaySeconds)
{
    ProgressEvent e; e.kind = Kind::RetryScheduled; e.attempt = attempt; e.delaySeconds = delaySeconds;
    return e;
}

ProgressEvent ProgressEvent::summary(SummaryRow row, const SummaryCounts& counts)
{
    ProgressEvent e; e.kind = Kind::Summary; e.summaryRow = row; e.counts = counts;
    return e;
}

ProgressEvent ProgressEvent::completed()
{
    ProgressEvent e; e.kind = Kind::Completed;
    return e;
}

namespace TransferTypes {

QString errorName(TransferError error)
{
    switch (error) {
        case TransferError::None: return "None";
        case TransferError::InvalidRequest: return "InvalidRequest";
        case TransferError::PathUnreadable: return "PathUnreadable";
        case TransferError::DestinationUnavailable: return "DestinationUnavailable";
        case TransferError::UnresolvedCollision: return "UnresolvedCollision";
        case TransferError::AlreadyRunning: return "AlreadyRunning";
        case TransferError::NotReady: return "NotReady";
        case TransferError::SpawnError: return "SpawnError";
        case TransferError::RetriesExhausted: return "RetriesExhausted";
        case TransferError::FatalExitCode: return "FatalExitCode";
        case TransferError::UnknownExitCode: return "UnknownExitCode";
        case TransferError::ProcessCrashed: return "ProcessCrashed";
        case TransferError::FileCopyFailed: return "FileCopyFailed";
        case TransferError::RenameFailed: return "RenameFailed";
        case TransferError::Cancelled: return "Cancelled";
    }
    return QString();
}

QString outcomeName(TransferResult::Outcome outcome)
{
    switch (outcome) {
        case TransferResult::Outcome::Succeeded: return "Succeeded";
        case TransferResult::Outcome::SucceededWithWarnings: return "SucceededWithWarnings";
        case TransferResult::Outcome::Failed: return "Failed";
        case TransferResult::Outcome::Cancelled: return "Cancelled";
    }
    return QString();
}

QString modeName(TransferMode mode)
{
    return mode == TransferMode::Move ? QStringLiteral("Move") : QStringLiteral("Copy");
}

QString kindName(ProgressEvent::Kind kind)
{
    switch (kind) {
        case ProgressEvent::Kind::FileStarted: return "FileStarted";
        case ProgressEvent::Kind::FileProgress: return "FileProgress";
        case ProgressEvent::Kind::BytesCopied: return "BytesCopied";
        case ProgressEvent::Kind::FileError: return "FileError";
        case ProgressEvent::Kind::ToolRetrying: return "ToolRetrying";
        case ProgressEvent::Kind::RetryScheduled: return "RetryScheduled";
        case ProgressEvent::Kind::Summary: return "Summary";
        case ProgressEvent::Kind::Completed: return "Completed";
    }
    return QString();
}

QString formatBytes(qint64 bytes)
{
    return QLocale::c().formattedDataSize(bytes, 1, QLocale::DataSizeTraditionalFormat);
}

void registerMetaTypes()
{
    static bool registered = false;
    if (registered) return;
    qRegisterMetaType<TransferFailure>("TransferFailure");
    qRegisterMetaType<PreflightReport>("PreflightReport");
    qRegisterMetaType<ProgressEvent>("ProgressEvent");
    qRegisterMetaType<TransferResult>("TransferResult");
    registered = true;
}

} // namespace TransferTypes
