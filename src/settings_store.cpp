#include "settings_store.h"
#include "command_builder.h"
#include "duplicate_policy.h"

#include <QSettings>
#include <QStandardPaths>
#include <QFileInfo>
#include <QDebug>

QSettingsStore::QSettingsStore()
    : m_settings(new QSettings("ReelTransfer", "ReelTransfer"))
{
}

QSettingsStore::QSettingsStore(const QString& iniPath)
    : m_settings(new QSettings(iniPath, QSettings::IniFormat))
{
}

QSettingsStore::~QSettingsStore()
{
    m_settings->sync();
}

QVariant QSettingsStore::value(const QString& key, const QVariant& defaultValue) const
{
    return m_settings->value(key, defaultValue);
}

void QSettingsStore::setValue(const QString& key, const QVariant& value)
{
    m_settings->setValue(key, value);
}

bool QSettingsStore::contains(const QString& key) const
{
    return m_settings->contains(key);
}

void QSettingsStore::sync()
{
    m_settings->sync();
    if (m_settings->status() != QSettings::NoError) {
        qWarning() << "[Settings] Failed to write" << m_settings->fileName();
    }
}

namespace TransferSettings {

TransferRequest loadRequest(const SettingsStore& s)
{
    TransferRequest req;
    req.sources = s.value(kLastSources).toStringList();
    req.destination = s.value(kLastDestination).toString();
    req.mode = s.value(kMode, "copy").toString().compare("move", Qt::CaseInsensitive) == 0 ? TransferMode::Move
                                                                                          : TransferMode::Copy;
    req.includeSubfolders = s.value(kIncludeSubfolders, req.includeSubfolders).toBool();
    req.mirror = s.value(kMirror, req.mirror).toBool();
    req.dryRun = s.value(kDryRun, req.dryRun).toBool();
    req.retries = qMax(0, s.value(kRetries, req.retries).toInt());
    req.waitSecondsBetweenRetries = qMax(0, s.value(kWaitSeconds, req.waitSecondsBetweenRetries).toInt());
    req.threadCount = qBound(CommandBuilder::kMinThreads, s.value(kThreads, req.threadCount).toInt(),
                             CommandBuilder::kMaxThreads);
    req.excludePatterns = s.value(kExcludePatterns).toStringList();
    return req;
}

void saveRequest(SettingsStore& s, const TransferRequest& request)
{
    s.setValue(kLastSources, request.sources);
    s.setValue(kLastDestination, request.destination);
    s.setValue(kMode, TransferTypes::modeName(request.mode).toLower());
    s.setValue(kIncludeSubfolders, request.includeSubfolders);
    s.setValue(kMirror, request.mirror);
    s.setValue(kDryRun, request.dryRun);
    s.setValue(kRetries, request.retries);
    s.setValue(kWaitSeconds, request.waitSecondsBetweenRetries);
    s.setValue(kThreads, request.threadCount);
    s.setValue(kExcludePatterns, request.excludePatterns);
    s.sync();
}

DuplicateAction loadDuplicateAction(const SettingsStore& s)
{
    DuplicateAction action = DuplicateAction::Skip;
    const QString name = s.value(kDuplicateAction, "skip").toString();
    if (!DuplicatePolicy::parseAction(name, &action)) {
        qWarning() << "[Settings] Ignoring unknown duplicate action" << name;
        return DuplicateAction::Skip;
    }
    return action;
}

void saveDuplicateAction(SettingsStore& s, DuplicateAction action)
{
    s.setValue(kDuplicateAction, DuplicatePolicy::actionName(action));
    s.sync();
}

PreflightOptions loadPreflightOptions(const SettingsStore& s)
{
    PreflightOptions options;
    options.safetyMarginBytes = qMax<qint64>(0, s.value(kSafetyMarginBytes, 0).toLongLong());
    return options;
}

int loadCancelGraceMs(const SettingsStore& s)
{
    return qMax(0, s.value(kCancelGraceMs, 5000).toInt());
}

QString locateCopyTool(const SettingsStore& s, QString* error)
{
    const QString configured = s.value(kCopyToolPath).toString().trimmed();
    if (!configured.isEmpty()) {
        const QFileInfo fi(configured);
        if (fi.isFile() && fi.isExecutable()) return fi.absoluteFilePath();
        qWarning() << "[Settings] Configured copy tool is not executable:" << configured;
    }

    const QString fromEnv = qEnvironmentVariable(kCopyToolEnv).trimmed();
    if (!fromEnv.isEmpty()) {
        const QFileInfo fi(fromEnv);
        if (fi.isFile() && fi.isExecutable()) return fi.absoluteFilePath();
        const QString found = QStandardPaths::findExecutable(fromEnv);
        if (!found.isEmpty()) return found;
        qWarning() << "[Settings]" << kCopyToolEnv << "does not point to an executable:" << fromEnv;
    }

    const QString robocopy = QStandardPaths::findExecutable("robocopy");
    if (!robocopy.isEmpty()) return robocopy;

    if (error) {
        *error = QString("Copy tool not found: set %1, the %2 environment variable, or put robocopy on PATH")
                     .arg(QString::fromLatin1(kCopyToolPath), QString::fromLatin1(kCopyToolEnv));
    }
    return QString();
}

} // namespace TransferSettings
