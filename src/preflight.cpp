#include "preflight.h"
#include "file_utils.h"

#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QHash>
#include <QStorageInfo>
#include <QDebug>

#include <algorithm>

static bool fail(TransferFailure* failure, TransferError code, const QString& message)
{
    if (failure) *failure = TransferTypes::failure(code, message);
    qWarning() << "[Preflight]" << TransferTypes::errorName(code) << message;
    return false;
}

Qt::CaseSensitivity PreflightOptions::hostCaseSensitivity()
{
#if defined(Q_OS_WIN) || defined(Q_OS_MACOS)
    return Qt::CaseInsensitive;
#else
    return Qt::CaseSensitive;
#endif
}

qint64 Preflight::availableBytes(const QString& path)
{
    QStorageInfo storage(path);
    if (!storage.isValid() || !storage.isReady()) return -1;
    return storage.bytesAvailable();
}

void Preflight::compileExcludes(const QStringList& patterns, Qt::CaseSensitivity cs,
                                QVector<QRegularExpression>& wildcards, QStringList& literalPaths)
{
    wildcards.clear();
    literalPaths.clear();
    for (const QString& raw : patterns) {
        const QString p = raw.trimmed();
        if (p.isEmpty()) continue;
        if (p.contains('/') || p.contains('\\')) {
            literalPaths << FileUtils::cleanAbsolute(p);
            continue;
        }
        QRegularExpression re(QRegularExpression::wildcardToRegularExpression(p));
        if (cs == Qt::CaseInsensitive) re.setPatternOptions(re.patternOptions() | QRegularExpression::CaseInsensitiveOption);
        if (!re.isValid()) {
            qWarning() << "[Preflight] Ignoring invalid exclude pattern" << p;
            continue;
        }
        wildcards << re;
    }
}

bool Preflight::isExcluded(const QString& fileName, const QString& absolutePath,
                           const QVector<QRegularExpression>& patterns, const QStringList& literalPaths,
                           Qt::CaseSensitivity cs)
{
    for (const QRegularExpression& re : patterns) {
        if (re.match(fileName).hasMatch()) return true;
    }
    for (const QString& lit : literalPaths) {
        if (lit.compare(absolutePath, cs) == 0) return true;
    }
    return false;
}

bool Preflight::walkSource(const QString& sourcePath, bool isDirectory, const TransferRequest& request,
                           const QVector<QRegularExpression>& wildcards, const QStringList& literalPaths,
                           Qt::CaseSensitivity cs, SourceEntry& entry, QVector<PlannedFile>& planned,
                           PreflightReport& report, TransferFailure* failure)
{
    if (!isDirectory) {
        const QFileInfo fi(sourcePath);
        if (isExcluded(fi.fileName(), sourcePath, wildcards, literalPaths, cs)) {
            report.warnings << QString("Source file %1 matches an exclude pattern and will not be transferred").arg(sourcePath);
            return true;
        }
        entry.bytes = fi.size();
        entry.files = 1;
        report.totalBytes += entry.bytes;
        report.totalFiles += 1;
        planned.push_back({fi.fileName(), sourcePath, entry.bytes});
        return true;
    }

    const QDir root(sourcePath);
    QDirIterator it(sourcePath, QDir::Files | QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString path = it.next();
        const QFileInfo fi = it.fileInfo();
        if (fi.isDir()) {
            if (fi.isSymLink()) continue; // not descended
            if (!fi.isReadable() || !fi.isExecutable()) {
                return fail(failure, TransferError::PathUnreadable, QString("Cannot traverse directory %1").arg(path));
            }
            continue;
        }
        const QString rel = root.relativeFilePath(path);
        if (isExcluded(fi.fileName(), path, wildcards, literalPaths, cs)) continue;

        const qint64 size = fi.size();
        entry.bytes += size;
        entry.files += 1;
        report.totalBytes += size;
        report.totalFiles += 1;

        const bool topLevel = !rel.contains('/');
        if (request.includeSubfolders || topLevel) planned.push_back({rel, path, size});
    }
    return true;
}

bool Preflight::run(const TransferRequest& request, const PreflightOptions& options,
                    PreflightReport& report, TransferFailure* failure)
{
    report = PreflightReport();
    report.caseSensitivity = options.caseSensitivity;
    report.safetyMarginBytes = qMax<qint64>(0, options.safetyMarginBytes);
    const Qt::CaseSensitivity cs = options.caseSensitivity;

    if (request.sources.isEmpty()) return fail(failure, TransferError::InvalidRequest, "No source paths given");
    if (request.destination.trimmed().isEmpty()) return fail(failure, TransferError::InvalidRequest, "No destination given");
    if (!QDir::isAbsolutePath(request.destination)) {
        return fail(failure, TransferError::InvalidRequest, QString("Destination must be absolute: %1").arg(request.destination));
    }

    // Destination: existing writable directory, or creatable below a writable ancestor.
    const QString dest = FileUtils::cleanAbsolute(request.destination);
    const QString destCanonical = FileUtils::canonicalOrCleaned(dest);
    QString spaceAnchor = dest;
    const QFileInfo destInfo(dest);
    if (destInfo.exists()) {
        if (!FileUtils::isWritableDir(dest)) {
            return fail(failure, TransferError::DestinationUnavailable, QString("Destination is not a writable folder: %1").arg(dest));
        }
        report.destinationExists = true;
    } else {
        spaceAnchor = FileUtils::nearestExistingAncestor(dest);
        if (spaceAnchor.isEmpty() || !FileUtils::isWritableDir(spaceAnchor)) {
            return fail(failure, TransferError::DestinationUnavailable, QString("Destination cannot be created: %1").arg(dest));
        }
    }

    QVector<QRegularExpression> wildcards;
    QStringList literalPaths;
    compileExcludes(request.excludePatterns, cs, wildcards, literalPaths);

    QVector<PlannedFile> planned;
    bool anyFileSource = false;
    for (const QString& raw : request.sources) {
        if (!QDir::isAbsolutePath(raw)) {
            return fail(failure, TransferError::InvalidRequest, QString("Source must be absolute: %1").arg(raw));
        }
        const QString src = FileUtils::cleanAbsolute(raw);
        const QFileInfo fi(src);
        if (!fi.exists()) return fail(failure, TransferError::PathUnreadable, QString("Source not found: %1").arg(src));
        if (!fi.isReadable() || (fi.isDir() && !fi.isExecutable())) {
            return fail(failure, TransferError::PathUnreadable, QString("Source is not readable: %1").arg(src));
        }

        const QString srcCanonical = fi.canonicalFilePath();
        if (fi.isDir()) {
            if (FileUtils::isSameOrInside(srcCanonical, destCanonical, cs)) {
                return fail(failure, TransferError::InvalidRequest,
                            QString("Destination %1 is the same as or inside source %2").arg(dest, src));
            }
        } else {
            anyFileSource = true;
            if (QFileInfo(srcCanonical).absolutePath().compare(destCanonical, cs) == 0) {
                return fail(failure, TransferError::InvalidRequest,
                            QString("Source file %1 already lives in the destination folder").arg(src));
            }
        }

        SourceEntry entry;
        entry.path = src;
        entry.isDirectory = fi.isDir();
        if (!walkSource(src, entry.isDirectory, request, wildcards, literalPaths, cs, entry, planned, report, failure)) {
            return false;
        }
        report.sources.push_back(entry);
    }

    // Everything already at the destination, folded for lookups.
    QHash<QString, QString> existing; // folded relative path -> relative path as on disk
    if (report.destinationExists) {
        const QDir destDir(dest);
        QDirIterator it(dest, QDir::Files | QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System,
                        QDirIterator::Subdirectories);
        while (it.hasNext()) {
            const QString rel = destDir.relativeFilePath(it.next());
            const QString key = TransferTypes::foldPath(rel, cs);
            existing.insert(key, rel);
            report.occupiedNames.insert(key);
        }
    }

    QSet<QString> plannedKeys;
    for (const PlannedFile& pf : planned) {
        const QString key = TransferTypes::foldPath(pf.relativePath, cs);
        if (plannedKeys.contains(key)) {
            report.warnings << QString("Several sources write to %1; the last one copied wins").arg(pf.relativePath);
        }
        plannedKeys.insert(key);
        report.occupiedNames.insert(key);
        report.transferBytes += pf.bytes;
        report.transferFiles += 1;

        auto hit = existing.constFind(key);
        if (hit != existing.constEnd()) {
            Collision c;
            c.relativePath = pf.relativePath;
            c.sourcePath = pf.sourcePath;
            c.destinationPath = dest + '/' + hit.value();
            c.bytes = pf.bytes;
            report.collisions.push_back(c);
        }
    }
    std::stable_sort(report.collisions.begin(), report.collisions.end(), [cs](const Collision& a, const Collision& b) {
        return TransferTypes::foldPath(a.relativePath, cs) < TransferTypes::foldPath(b.relativePath, cs);
    });
    // Several sources can write the same relative path; fold them into one collision, sources in request order.
    QVector<Collision> merged;
    for (const Collision& c : report.collisions) {
        if (!merged.isEmpty()
            && TransferTypes::foldPath(merged.last().relativePath, cs) == TransferTypes::foldPath(c.relativePath, cs)) {
            if (!merged.last().sourcePaths().contains(c.sourcePath)) {
                merged.last().otherSourcePaths << c.sourcePath;
                merged.last().otherBytes << c.bytes;
            }
            continue;
        }
        merged.push_back(c);
    }
    report.collisions = merged;

    const qint64 free = options.freeSpaceQuery ? options.freeSpaceQuery(spaceAnchor) : availableBytes(spaceAnchor);
    report.destinationFreeBytes = qMax<qint64>(0, free);
    report.hasEnoughSpace = free >= 0 && report.destinationFreeBytes >= report.totalBytes + report.safetyMarginBytes;

    if (request.mirror) {
        report.warnings << "Mirror will delete destination files that are not present in the source";
        if (!request.includeSubfolders) {
            report.warnings << "Mirror without subfolders is not supported by the copy tool; enable subfolders to run it";
        }
        if (anyFileSource) report.warnings << "Mirror is not supported for individually selected files";
    }
    if (!request.includeSubfolders && report.transferFiles < report.totalFiles) {
        report.warnings << QString("%1 file(s) in subfolders will be skipped because subfolders are excluded")
                               .arg(report.totalFiles - report.transferFiles);
    }
    if (!report.hasEnoughSpace) {
        report.warnings << QString("Not enough free space at destination: need %1, available %2")
                               .arg(TransferTypes::formatBytes(report.totalBytes + report.safetyMarginBytes),
                                    free < 0 ? QStringLiteral("unknown") : TransferTypes::formatBytes(free));
    }

    qInfo() << "[Preflight]" << report.totalFiles << "file(s)," << report.totalBytes << "bytes;"
            << report.collisions.size() << "collision(s); free" << report.destinationFreeBytes;
    if (failure) *failure = TransferFailure();
    return true;
}
