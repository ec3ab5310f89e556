#pragma once

#include <QString>
#include <QStringList>
#include <QRegularExpression>
#include <QVector>
#include <functional>

#include "transfer_types.h"

struct PreflightOptions {
    // Comparison rule for collisions and exclude patterns. Defaults to the host filesystem's.
    Qt::CaseSensitivity caseSensitivity = hostCaseSensitivity();
    // Extra headroom required on top of totalBytes before hasEnoughSpace holds.
    qint64 safetyMarginBytes = 0;
    // Returns available bytes for an existing path; QStorageInfo when unset.
    std::function<qint64(const QString&)> freeSpaceQuery;

    static Qt::CaseSensitivity hostCaseSensitivity();
};

// One-shot inspection of a request against the filesystem: totals, free space and
// name collisions. The free-space figure is an estimate taken at call time; other
// writers can invalidate it before the transfer runs.
class Preflight {
public:
    static bool run(const TransferRequest& request, const PreflightOptions& options,
                    PreflightReport& report, TransferFailure* failure = nullptr);

    // Bytes available to the current user on the volume holding path, -1 if unknown.
    static qint64 availableBytes(const QString& path);

    // True when fileName matches one of the wildcard exclude patterns.
    static bool isExcluded(const QString& fileName, const QString& absolutePath,
                           const QVector<QRegularExpression>& patterns, const QStringList& literalPaths,
                           Qt::CaseSensitivity cs);
    static void compileExcludes(const QStringList& patterns, Qt::CaseSensitivity cs,
                                QVector<QRegularExpression>& wildcards, QStringList& literalPaths);

private:
    struct PlannedFile {
        QString relativePath;
        QString sourcePath;
        qint64 bytes = 0;
    };

    static bool walkSource(const QString& sourcePath, bool isDirectory, const TransferRequest& request,
                           const QVector<QRegularExpression>& wildcards, const QStringList& literalPaths,
                           Qt::CaseSensitivity cs, SourceEntry& entry, QVector<PlannedFile>& planned,
                           PreflightReport& report, TransferFailure* failure);
};
