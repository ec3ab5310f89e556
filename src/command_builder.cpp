#include "command_builder.h"
#include "duplicate_policy.h"
#include "file_utils.h"
#include "preflight.h"

#include <QDir>
#include <QFileInfo>
#include <QHash>
#include <QSet>
#include <QVector>

#include <algorithm>

namespace {

bool reject(TransferFailure* failure, TransferError code, const QString& message)
{
    if (failure) *failure = TransferTypes::failure(code, message);
    return false;
}

QString native(const QString& path)
{
    return QDir::toNativeSeparators(FileUtils::cleanAbsolute(path));
}

// Source list order decides step order: a directory source is one step, files are
// grouped under the step of their parent directory's first appearance.
struct StepPlan {
    bool directory = false;
    QString root;           // cleaned
    QString destination;    // cleaned; below the transfer destination for overwrite steps
    QStringList fileNames;  // file steps only
    bool overwrite = false;
    QStringList excludedPaths;
};

} // namespace

bool CommandBuilder::validate(const TransferRequest& request, TransferFailure* failure)
{
    if (request.sources.isEmpty()) return reject(failure, TransferError::InvalidRequest, "No source paths given");
    if (request.destination.trimmed().isEmpty()) return reject(failure, TransferError::InvalidRequest, "No destination given");
    if (!QDir::isAbsolutePath(request.destination)) {
        return reject(failure, TransferError::InvalidRequest, QString("Destination must be absolute: %1").arg(request.destination));
    }
    if (request.mirror && !request.includeSubfolders) {
        return reject(failure, TransferError::InvalidRequest, "Mirror requires subfolders to be included");
    }
    if (request.retries < 0) return reject(failure, TransferError::InvalidRequest, "Retry count cannot be negative");
    if (request.waitSecondsBetweenRetries < 0) return reject(failure, TransferError::InvalidRequest, "Retry wait cannot be negative");
    if (request.threadCount < kMinThreads || request.threadCount > kMaxThreads) {
        return reject(failure, TransferError::InvalidRequest,
                      QString("Thread count must be between %1 and %2").arg(kMinThreads).arg(kMaxThreads));
    }

    const Qt::CaseSensitivity cs = PreflightOptions::hostCaseSensitivity();
    for (const QString& src : request.sources) {
        if (src.trimmed().isEmpty() || !QDir::isAbsolutePath(src)) {
            return reject(failure, TransferError::InvalidRequest, QString("Source must be absolute: %1").arg(src));
        }
        if (FileUtils::isSameOrInside(src, request.destination, cs)) {
            return reject(failure, TransferError::InvalidRequest,
                          QString("Destination %1 is the same as or inside source %2").arg(request.destination, src));
        }
    }
    if (failure) *failure = TransferFailure();
    return true;
}

QStringList CommandBuilder::optionFlags(const TransferRequest& request, bool directoryStep, bool overwrite,
                                        const QStringList& excludes)
{
    QStringList args;
    if (directoryStep && request.includeSubfolders) args << "/E";
    if (directoryStep && request.mirror) args << "/MIR";
    if (request.mode == TransferMode::Move) args << (directoryStep ? "/MOVE" : "/MOV");
    if (request.dryRun) args << "/L";
    args << QString("/R:%1").arg(request.retries)
         << QString("/W:%1").arg(request.waitSecondsBetweenRetries)
         << QString("/MT:%1").arg(request.threadCount);
    if (overwrite) args << "/IS" << "/IT";
    if (!excludes.isEmpty()) args << "/XF" << excludes;
    // Byte sizes, full paths and no directory lines keep the output parseable
    args << "/BYTES" << "/FP" << "/NDL";
    return args;
}

bool CommandBuilder::build(const QString& program, const TransferRequest& request, const PreflightReport& report,
                           const DuplicateResolution& resolution, Invocation& out, TransferFailure* failure)
{
    if (!validate(request, failure)) return false;
    if (program.trimmed().isEmpty()) return reject(failure, TransferError::InvalidRequest, "Copy tool path is not set");

    if (report.sources.size() != request.sources.size()) {
        return reject(failure, TransferError::InvalidRequest, "Preflight report does not match the request");
    }
    bool anyFileSource = false;
    for (int i = 0; i < request.sources.size(); ++i) {
        if (report.sources[i].path != FileUtils::cleanAbsolute(request.sources[i])) {
            return reject(failure, TransferError::InvalidRequest, "Preflight report does not match the request");
        }
        if (!report.sources[i].isDirectory) anyFileSource = true;
    }
    if (request.mirror && anyFileSource) {
        return reject(failure, TransferError::InvalidRequest, "Mirror is not supported for individually selected files");
    }

    const QStringList unresolved = DuplicatePolicy::findUnresolved(report.collisionPaths(), resolution);
    if (!unresolved.isEmpty()) {
        QStringList sample = unresolved.mid(0, 10);
        if (unresolved.size() > sample.size()) sample << QString("...and %1 more").arg(unresolved.size() - sample.size());
        return reject(failure, TransferError::UnresolvedCollision,
                      QString("%1 duplicate(s) have no resolution: %2").arg(unresolved.size()).arg(sample.join(", ")));
    }

    const Qt::CaseSensitivity cs = report.caseSensitivity;
    const QString dest = FileUtils::cleanAbsolute(request.destination);

    // Auto-rename targets, in sorted collision order so numbering is stable.
    QSet<QString> taken = report.occupiedNames;
    for (const Collision& c : report.collisions) taken.insert(TransferTypes::foldPath(c.relativePath, cs));

    QSet<QString> excludedSources;
    QHash<QString, QString> overwriteTargets; // source path -> destination folder
    QVector<RenameOperation> renames;
    for (const Collision& c : report.collisions) {
        const DuplicateAction action = resolution.action(c.relativePath);
        // Every source bound for this name gets the same treatment
        const QStringList sources = c.sourcePaths();
        for (int i = 0; i < sources.size(); ++i) {
            const QString& sourcePath = sources.at(i);
            if (action == DuplicateAction::Overwrite) {
                overwriteTargets.insert(sourcePath, QFileInfo(dest + '/' + c.relativePath).path());
                continue;
            }
            excludedSources.insert(sourcePath);
            if (action == DuplicateAction::AutoRename) {
                RenameOperation op;
                op.relativePath = c.relativePath;
                op.sourcePath = native(sourcePath);
                op.targetPath = native(dest + '/' + DuplicatePolicy::autoRenameTarget(c.relativePath, taken, cs));
                op.bytes = c.bytesOf(i);
                renames.push_back(op);
            }
        }
    }

    QVector<StepPlan> plans;
    // Overwrite copies only the colliding files, in a file step of their own
    auto addFileToPlan = [&plans](const QString& sourcePath, const QString& target, bool overwrite) {
        const QFileInfo fi(sourcePath);
        const QString parent = fi.path();
        auto it = std::find_if(plans.begin(), plans.end(), [&](const StepPlan& p) {
            return !p.directory && p.root == parent && p.destination == target && p.overwrite == overwrite;
        });
        if (it == plans.end()) {
            StepPlan plan;
            plan.root = parent;
            plan.destination = target;
            plan.overwrite = overwrite;
            plans.push_back(plan);
            it = plans.end() - 1;
        }
        if (!it->fileNames.contains(fi.fileName())) it->fileNames << fi.fileName();
    };

    for (const SourceEntry& src : report.sources) {
        if (src.isDirectory) {
            StepPlan plan;
            plan.directory = true;
            plan.root = src.path;
            plan.destination = dest;
            QStringList overwritten;
            for (const Collision& c : report.collisions) {
                for (const QString& sourcePath : c.sourcePaths()) {
                    if (!FileUtils::isSameOrInside(src.path, sourcePath, Qt::CaseSensitive)) continue;
                    if (excludedSources.contains(sourcePath)) {
                        plan.excludedPaths << native(sourcePath);
                    } else if (overwriteTargets.contains(sourcePath)) {
                        plan.excludedPaths << native(sourcePath);
                        overwritten << sourcePath;
                    }
                }
            }
            std::sort(plan.excludedPaths.begin(), plan.excludedPaths.end());
            plan.excludedPaths.removeDuplicates();
            plans.push_back(plan);
            for (const QString& sourcePath : overwritten) addFileToPlan(sourcePath, overwriteTargets.value(sourcePath), true);
            continue;
        }

        if (excludedSources.contains(src.path)) continue;
        if (overwriteTargets.contains(src.path)) addFileToPlan(src.path, overwriteTargets.value(src.path), true);
        else addFileToPlan(src.path, dest, false);
    }

    Invocation inv;
    inv.program = program;
    inv.mode = request.mode;
    inv.dryRun = request.dryRun;
    inv.renames = renames;

    QStringList patterns;
    for (const QString& p : request.excludePatterns) {
        if (!p.trimmed().isEmpty()) patterns << p.trimmed();
    }

    for (const StepPlan& plan : plans) {
        if (!plan.directory && plan.fileNames.isEmpty()) continue;
        InvocationStep step;
        step.sourceRoot = native(plan.root);
        step.arguments << step.sourceRoot << native(plan.destination);
        if (!plan.directory) step.arguments << plan.fileNames;
        step.arguments << optionFlags(request, plan.directory, plan.overwrite, patterns + plan.excludedPaths);
        inv.steps.push_back(step);
    }

    inv.preview = renderPreview(inv);
    out = inv;
    if (failure) *failure = TransferFailure();
    return true;
}

QString CommandBuilder::quoteArgument(const QString& arg)
{
    if (arg.isEmpty()) return QStringLiteral("\"\"");
    bool needsQuotes = false;
    for (const QChar ch : arg) {
        if (ch.isSpace() || ch == '"' || ch == '&' || ch == '|' || ch == '^' || ch == '<' || ch == '>' || ch == '(' || ch == ')') {
            needsQuotes = true;
            break;
        }
    }
    if (!needsQuotes) return arg;
    QString s = arg;
    s.replace('"', "\"\"");
    return '"' + s + '"';
}

QString CommandBuilder::renderCommandLine(const QString& program, const QStringList& arguments)
{
    QStringList parts;
    parts << quoteArgument(program);
    for (const QString& a : arguments) parts << quoteArgument(a);
    return parts.join(' ');
}

QString CommandBuilder::renderPreview(const Invocation& invocation)
{
    QStringList lines;
    for (const InvocationStep& step : invocation.steps) {
        lines << renderCommandLine(invocation.program, step.arguments);
    }
    for (const RenameOperation& op : invocation.renames) {
        lines << QString("[auto-rename] %1 -> %2").arg(quoteArgument(op.sourcePath), quoteArgument(op.targetPath));
    }
    if (lines.isEmpty()) lines << QStringLiteral("[nothing to transfer]");
    return lines.join('\n');
}
