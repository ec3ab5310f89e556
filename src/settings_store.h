#pragma once

#include <QString>
#include <QVariant>
#include <QHash>
#include <QScopedPointer>
#include <QStringList>

#include "transfer_types.h"
#include "preflight.h"

class QSettings;

// Key/value collaborator for last-used options. The transfer core never reads
// settings itself; callers load a request from here and hand it over.
class SettingsStore {
public:
    virtual ~SettingsStore() = default;
    virtual QVariant value(const QString& key, const QVariant& defaultValue = QVariant()) const = 0;
    virtual void setValue(const QString& key, const QVariant& value) = 0;
    virtual bool contains(const QString& key) const = 0;
    virtual void sync() {}
};

class QSettingsStore : public SettingsStore {
    Q_DISABLE_COPY(QSettingsStore)
public:
    QSettingsStore();
    // Backed by an INI file, for portable installs and tests.
    explicit QSettingsStore(const QString& iniPath);
    ~QSettingsStore() override;

    QVariant value(const QString& key, const QVariant& defaultValue = QVariant()) const override;
    void setValue(const QString& key, const QVariant& value) override;
    bool contains(const QString& key) const override;
    void sync() override;

private:
    QScopedPointer<QSettings> m_settings;
};

class MemorySettingsStore : public SettingsStore {
public:
    QVariant value(const QString& key, const QVariant& defaultValue = QVariant()) const override {
        return m_values.value(key, defaultValue);
    }
    void setValue(const QString& key, const QVariant& value) override { m_values.insert(key, value); }
    bool contains(const QString& key) const override { return m_values.contains(key); }

private:
    QHash<QString, QVariant> m_values;
};

namespace TransferSettings {

// Keys
inline const char* kLastSources = "Transfer/LastSources";
inline const char* kLastDestination = "Transfer/LastDestination";
inline const char* kMode = "Transfer/Mode";
inline const char* kIncludeSubfolders = "Transfer/IncludeSubfolders";
inline const char* kMirror = "Transfer/Mirror";
inline const char* kDryRun = "Transfer/DryRun";
inline const char* kRetries = "Transfer/Retries";
inline const char* kWaitSeconds = "Transfer/WaitSeconds";
inline const char* kThreads = "Transfer/Threads";
inline const char* kExcludePatterns = "Transfer/ExcludePatterns";
inline const char* kDuplicateAction = "Transfer/DuplicateAction";
inline const char* kCopyToolPath = "Transfer/CopyToolPath";
inline const char* kSafetyMarginBytes = "Preflight/SafetyMarginBytes";
inline const char* kCancelGraceMs = "Supervisor/CancelGraceMs";

inline const char* kCopyToolEnv = "REELTRANSFER_COPY_TOOL";

// Last-used request, with defaults for anything never saved.
TransferRequest loadRequest(const SettingsStore& settings);
void saveRequest(SettingsStore& settings, const TransferRequest& request);

DuplicateAction loadDuplicateAction(const SettingsStore& settings);
void saveDuplicateAction(SettingsStore& settings, DuplicateAction action);

PreflightOptions loadPreflightOptions(const SettingsStore& settings);
int loadCancelGraceMs(const SettingsStore& settings);

// Configured path, then the environment variable, then "robocopy" on PATH.
// Returns an empty string and fills error when nothing usable is found.
QString locateCopyTool(const SettingsStore& settings, QString* error = nullptr);

} // namespace TransferSettings
