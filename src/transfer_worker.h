#pragma once

#include <QObject>
#include <QElapsedTimer>
#include <atomic>
#include <functional>

#include "transfer_types.h"
#include "exit_code_classifier.h"

class CopyEngine;
class QTimer;

using CopyEngineFactory = std::function<CopyEngine*(QObject* parent)>;

struct SupervisorOptions {
    ExitCodeClassifier classifier = ExitCodeClassifier::robocopyDefault();
    int cancelGraceMs = 5000;           // terminate -> kill escalation
    CopyEngineFactory engineFactory;    // ProcessCopyEngine when unset
};

// Drives one transfer on the supervisor's worker thread: launches each invocation
// step, retries transient exit codes, performs auto-renames and emits exactly one
// finished() result.
class TransferWorker : public QObject {
    Q_OBJECT
public:
    TransferWorker(const TransferRequest& request, const PreflightReport& report, const Invocation& invocation,
                   const SupervisorOptions& options, QObject* parent = nullptr);
    ~TransferWorker() override;

    // Thread-safe. The running tool gets terminate(), then kill() after the grace period.
    void requestCancel();

public slots:
    void run();

signals:
    void attemptStarted(int launchNumber, int stepIndex);
    void retrying(int attempt, int delaySeconds);
    void progress(const ProgressEvent& event);
    void logLine(const QString& line);
    void finished(const TransferResult& result);

private slots:
    void launchStep();
    void onLine(const QString& line);
    void onEngineFinished(int exitCode, bool crashed);
    void onFailedToStart(const QString& message);
    void onGraceExpired();

private:
    void handleCancel();
    void beginAttempt();
    void closeAttempt();
    void performRenames();
    void addError(const QString& path, TransferError reason, const QString& message, int nativeCode = 0);
    void fail(TransferError reason, const QString& message, int nativeCode = 0);
    void finish(TransferResult::Outcome outcome);

    TransferRequest m_request;
    PreflightReport m_report;
    Invocation m_invocation;
    SupervisorOptions m_options;

    CopyEngine* m_engine = nullptr;
    QTimer* m_retryTimer = nullptr;
    QTimer* m_graceTimer = nullptr;
    QElapsedTimer m_elapsed;
    std::atomic_bool m_cancelRequested{false};
    bool m_done = false;

    int m_stepIndex = 0;
    TransferResult m_result;

    // Per-attempt accounting; the tool's summary rows win over counted file lines
    QString m_currentFile;
    qint64 m_currentSize = 0;
    qint64 m_completedBytes = 0;    // across the whole transfer, for BytesCopied
    int m_attemptFiles = 0;
    qint64 m_attemptBytes = 0;
    bool m_haveFilesSummary = false;
    bool m_haveBytesSummary = false;
    SummaryCounts m_filesSummary;
    SummaryCounts m_bytesSummary;
};
