#pragma once

#include <QObject>
#include <QThread>
#include <QMutex>
#include <QFutureWatcher>

#include "transfer_types.h"
#include "transfer_worker.h"
#include "preflight.h"

// Owns the lifecycle of one transfer at a time:
//   Idle -> Preflighting -> AwaitingResolution -> Ready -> Running <-> Retrying
//        -> Succeeded | Failed | Cancelled
// Preflight runs on the Qt Concurrent pool, the copy tool is driven from a dedicated
// worker thread. All signals are delivered on the thread that owns the supervisor,
// in the order the worker produced them.
class TransferSupervisor : public QObject {
    Q_OBJECT
public:
    enum class State { Idle, Preflighting, AwaitingResolution, Ready, Running, Retrying, Succeeded, Failed, Cancelled };
    Q_ENUM(State)

    explicit TransferSupervisor(QObject* parent = nullptr);
    ~TransferSupervisor() override;

    // Validates synchronously, then preflights in the background.
    // Ends in preflightFinished() or preflightFailed().
    bool prepare(const TransferRequest& request, TransferFailure* failure = nullptr);
    // Only in AwaitingResolution. Builds the invocation and moves to Ready.
    bool resolve(const DuplicateResolution& resolution, TransferFailure* failure = nullptr);
    // Only in Ready.
    bool start(TransferFailure* failure = nullptr);
    // Thread-safe. Accepted only while Running or Retrying.
    bool cancel();

    State state() const;
    bool isBusy() const;
    TransferRequest request() const { return m_request; }
    PreflightReport report() const { return m_report; }
    Invocation invocation() const { return m_invocation; }
    TransferResult result() const { return m_result; }

    void setCopyToolPath(const QString& path) { m_program = path; }
    QString copyToolPath() const { return m_program; }
    void setEngineFactory(const CopyEngineFactory& factory) { m_options.engineFactory = factory; }
    void setExitCodeClassifier(const ExitCodeClassifier& classifier) { m_options.classifier = classifier; }
    void setPreflightOptions(const PreflightOptions& options) { m_preflightOptions = options; }
    void setCancelGracePeriodMs(int ms) { m_options.cancelGraceMs = ms; }

    static QString stateName(State state);

signals:
    void stateChanged(TransferSupervisor::State state);
    void preflightFinished(const PreflightReport& report);
    void preflightFailed(const TransferFailure& failure);
    void progress(const ProgressEvent& event);
    void logLine(const QString& line);
    void finished(const TransferResult& result);

private:
    struct PreflightOutcome {
        bool ok = false;
        PreflightReport report;
        TransferFailure failure;
    };

    void setState(State state);
    void onPreflightDone();
    void onWorkerFinished(const TransferResult& result);
    bool buildInvocation(const DuplicateResolution& resolution, TransferFailure* failure);

    mutable QMutex m_mutex;     // guards m_state and m_worker
    State m_state = State::Idle;
    TransferWorker* m_worker = nullptr;
    QThread m_thread;

    QString m_program;
    SupervisorOptions m_options;
    PreflightOptions m_preflightOptions;

    TransferRequest m_request;
    PreflightReport m_report;
    Invocation m_invocation;
    TransferResult m_result;

    QFutureWatcher<PreflightOutcome> m_preflightWatcher;
};
