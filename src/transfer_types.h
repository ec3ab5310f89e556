#pragma once

#include <QString>
#include <QStringList>
#include <QVector>
#include <QMap>
#include <QSet>
#include <QMetaType>

// Core data model shared by preflight, command building and supervision.

enum class TransferMode { Copy, Move };

enum class DuplicateAction { Skip, Overwrite, AutoRename };

enum class TransferError {
    None,
    InvalidRequest,         // bad option combination, rejected before any I/O
    PathUnreadable,         // a source cannot be traversed
    DestinationUnavailable, // destination (or its nearest ancestor) not writable
    UnresolvedCollision,    // a collision has no DuplicateAction
    AlreadyRunning,         // single-flight violation
    NotReady,               // operation not valid in the current state
    SpawnError,             // copy tool could not be started
    RetriesExhausted,       // transient exit code persisted past request.retries
    FatalExitCode,
    UnknownExitCode,
    ProcessCrashed,
    FileCopyFailed,         // per-file error reported by the tool
    RenameFailed,           // post-copy auto-rename failed
    Cancelled
};

struct TransferFailure {
    TransferError code = TransferError::None;
    QString message;

    bool isError() const { return code != TransferError::None; }
};

struct TransferRequest {
    QStringList sources;            // files and/or directories, in user order
    QString destination;
    TransferMode mode = TransferMode::Copy;
    bool includeSubfolders = true;
    bool mirror = false;            // destructive sync (/MIR)
    bool dryRun = false;            // list only (/L)
    int retries = 1;
    int waitSecondsBetweenRetries = 1;
    int threadCount = 4;
    QStringList excludePatterns;    // wildcard file names (/XF)
};

struct SourceEntry {
    QString path;                   // absolute, cleaned
    bool isDirectory = false;
    qint64 bytes = 0;
    int files = 0;
};

struct Collision {
    QString relativePath;           // '/' separated, relative to the destination
    QString sourcePath;
    QString destinationPath;
    qint64 bytes = 0;               // size of the source file
    QStringList otherSourcePaths;   // further sources bound for the same relative path
    QVector<qint64> otherBytes;     // parallel to otherSourcePaths

    QStringList sourcePaths() const { return QStringList{sourcePath} + otherSourcePaths; }
    qint64 bytesOf(int sourceIndex) const { return sourceIndex == 0 ? bytes : otherBytes.value(sourceIndex - 1); }
};

struct PreflightReport {
    qint64 totalBytes = 0;          // every file under the sources, recursively
    int totalFiles = 0;
    qint64 transferBytes = 0;       // what will actually be handed to the tool
    int transferFiles = 0;
    qint64 destinationFreeBytes = 0;
    qint64 safetyMarginBytes = 0;
    bool hasEnoughSpace = false;
    bool destinationExists = false;
    Qt::CaseSensitivity caseSensitivity = Qt::CaseSensitive;
    QVector<SourceEntry> sources;   // same order as TransferRequest::sources
    QVector<Collision> collisions;  // sorted by relativePath
    QSet<QString> occupiedNames;    // folded relative paths at or bound for the destination
    QStringList warnings;

    bool hasCollisions() const { return !collisions.isEmpty(); }
    QStringList collisionPaths() const;
};

struct DuplicateResolution {
    QMap<QString, DuplicateAction> actions; // relative path -> action

    bool isEmpty() const { return actions.isEmpty(); }
    bool contains(const QString& relativePath) const { return actions.contains(relativePath); }
    DuplicateAction action(const QString& relativePath, DuplicateAction fallback = DuplicateAction::Skip) const {
        return actions.value(relativePath, fallback);
    }
};

// One launch of the copy tool.
struct InvocationStep {
    QString sourceRoot;
    QStringList arguments;

    bool operator==(const InvocationStep& o) const { return sourceRoot == o.sourceRoot && arguments == o.arguments; }
};

// Copy performed by the core after the tool succeeded, for AutoRename collisions.
struct RenameOperation {
    QString relativePath;
    QString sourcePath;
    QString targetPath;
    qint64 bytes = 0;

    bool operator==(const RenameOperation& o) const {
        return relativePath == o.relativePath && sourcePath == o.sourcePath
            && targetPath == o.targetPath && bytes == o.bytes;
    }
};

struct Invocation {
    QString program;
    QVector<InvocationStep> steps;
    QVector<RenameOperation> renames;
    TransferMode mode = TransferMode::Copy;
    bool dryRun = false;
    QString preview;

    bool isEmpty() const { return steps.isEmpty() && renames.isEmpty(); }
    QStringList arguments() const { return steps.isEmpty() ? QStringList() : steps.first().arguments; }

    bool operator==(const Invocation& o) const {
        return program == o.program && steps == o.steps && renames == o.renames
            && mode == o.mode && dryRun == o.dryRun && preview == o.preview;
    }
    bool operator!=(const Invocation& o) const { return !(*this == o); }
};

// Columns of the tool's job summary ("Files :" / "Bytes :" rows).
struct SummaryCounts {
    qint64 total = 0;
    qint64 copied = 0;
    qint64 skipped = 0;
    qint64 mismatch = 0;
    qint64 failed = 0;
    qint64 extras = 0;
};

struct ProgressEvent {
    enum class Kind {
        FileStarted,    // name, total = file size (-1 if unknown), fileClass
        FileProgress,   // percent of the current file, raw from the tool
        BytesCopied,    // current / total for the whole transfer
        FileError,      // name, reasonCode, message
        ToolRetrying,   // tool-internal per-file retry, delaySeconds
        RetryScheduled, // supervisor relaunch, attempt + delaySeconds
        Summary,        // summaryRow + counts
        Completed
    };
    enum class SummaryRow { Files, Bytes };

    Kind kind = Kind::Completed;
    QString name;
    QString fileClass;
    qint64 current = -1;
    qint64 total = -1;
    double percent = -1.0;
    int reasonCode = 0;
    QString message;
    int attempt = 0;
    int delaySeconds = 0;
    SummaryRow summaryRow = SummaryRow::Files;
    SummaryCounts counts;

    static ProgressEvent fileStarted(const QString& name, qint64 size, const QString& fileClass = QString());
    static ProgressEvent fileProgress(double percent);
    static ProgressEvent bytesCopied(qint64 current, qint64 total);
    static ProgressEvent fileError(const QString& name, int reasonCode, const QString& message);
    static ProgressEvent toolRetrying(int delaySeconds);
    static ProgressEvent retryScheduled(int attempt, int delaySeconds);
    static ProgressEvent summary(SummaryRow row, const SummaryCounts& counts);
    static ProgressEvent completed();
};

struct TransferErrorEntry {
    QString path;
    TransferError reason = TransferError::None;
    int nativeCode = 0;     // tool or OS error code when known
    QString message;
};

struct TransferResult {
    enum class Outcome { Succeeded, SucceededWithWarnings, Failed, Cancelled };

    Outcome outcome = Outcome::Failed;
    int filesCopied = 0;
    qint64 bytesCopied = 0;
    QVector<TransferErrorEntry> errors;
    QStringList warnings;
    qint64 elapsedMs = 0;
    int exitCode = -1;      // of the last launched process, -1 when none ran
    int launchAttempts = 0;
    int retriesUsed = 0;
    bool dryRun = false;

    bool succeeded() const { return outcome == Outcome::Succeeded || outcome == Outcome::SucceededWithWarnings; }
};

namespace TransferTypes {

QString errorName(TransferError error);
QString outcomeName(TransferResult::Outcome outcome);
QString modeName(TransferMode mode);
QString kindName(ProgressEvent::Kind kind);
QString formatBytes(qint64 bytes);

// Folds a '/' separated relative path for set lookups under the given case rule.
inline QString foldPath(const QString& relativePath, Qt::CaseSensitivity cs) {
    return cs == Qt::CaseInsensitive ? relativePath.toCaseFolded() : relativePath;
}

inline TransferFailure failure(TransferError code, const QString& message) {
    TransferFailure f; f.code = code; f.message = message;
    return f;
}

// Registers the types above for queued (cross-thread) signal delivery.
void registerMetaTypes();

} // namespace TransferTypes

Q_DECLARE_METATYPE(TransferFailure)
Q_DECLARE_METATYPE(PreflightReport)
Q_DECLARE_METATYPE(ProgressEvent)
Q_DECLARE_METATYPE(TransferResult)
