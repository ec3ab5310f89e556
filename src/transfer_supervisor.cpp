#include "transfer_supervisor.h"
#include "command_builder.h"

#include <QtConcurrent>
#include <QMutexLocker>
#include <QDebug>

namespace {

bool reject(TransferFailure* failure, TransferError code, const QString& message)
{
    qWarning() << "[Supervisor]" << TransferTypes::errorName(code) << message;
    if (failure) *failure = TransferTypes::failure(code, message);
    return false;
}

bool isActive(TransferSupervisor::State s)
{
    return s == TransferSupervisor::State::Running || s == TransferSupervisor::State::Retrying;
}

} // namespace

TransferSupervisor::TransferSupervisor(QObject* parent) : QObject(parent)
{
    TransferTypes::registerMetaTypes();
    qRegisterMetaType<TransferSupervisor::State>("TransferSupervisor::State");
    m_thread.setObjectName("TransferWorker");
    connect(&m_preflightWatcher, &QFutureWatcher<PreflightOutcome>::finished, this, &TransferSupervisor::onPreflightDone);
}

TransferSupervisor::~TransferSupervisor()
{
    m_preflightWatcher.waitForFinished();
    {
        QMutexLocker lk(&m_mutex);
        if (m_worker) m_worker->requestCancel();
    }
    m_thread.quit();
    m_thread.wait();
}

TransferSupervisor::State TransferSupervisor::state() const
{
    QMutexLocker lk(&m_mutex);
    return m_state;
}

bool TransferSupervisor::isBusy() const
{
    const State s = state();
    return isActive(s) || s == State::Preflighting;
}

void TransferSupervisor::setState(State state)
{
    {
        QMutexLocker lk(&m_mutex);
        if (m_state == state) return;
        m_state = state;
    }
    qInfo() << "[Supervisor] State" << stateName(state);
    emit stateChanged(state);
}

bool TransferSupervisor::prepare(const TransferRequest& request, TransferFailure* failure)
{
    const State current = state();
    if (isActive(current) || current == State::Preflighting) {
        return reject(failure, TransferError::AlreadyRunning,
                      QString("A transfer is already %1").arg(stateName(current).toLower()));
    }
    if (!CommandBuilder::validate(request, failure)) {
        qWarning() << "[Supervisor] Request rejected:" << (failure ? failure->message : QString());
        return false;
    }

    m_request = request;
    m_report = PreflightReport();
    m_invocation = Invocation();
    m_result = TransferResult();
    setState(State::Preflighting);

    const PreflightOptions options = m_preflightOptions;
    m_preflightWatcher.setFuture(QtConcurrent::run([request, options]() {
        PreflightOutcome out;
        out.ok = Preflight::run(request, options, out.report, &out.failure);
        return out;
    }));
    if (failure) *failure = TransferFailure();
    return true;
}

void TransferSupervisor::onPreflightDone()
{
    const PreflightOutcome out = m_preflightWatcher.result();
    if (!out.ok) {
        setState(State::Idle);
        emit preflightFailed(out.failure);
        return;
    }
    m_report = out.report;

    if (m_report.hasCollisions()) {
        setState(State::AwaitingResolution);
        emit preflightFinished(m_report);
        return;
    }

    TransferFailure buildFailure;
    if (!buildInvocation(DuplicateResolution(), &buildFailure)) {
        setState(State::Idle);
        emit preflightFailed(buildFailure);
        return;
    }
    setState(State::Ready);
    emit preflightFinished(m_report);
}

bool TransferSupervisor::resolve(const DuplicateResolution& resolution, TransferFailure* failure)
{
    const State current = state();
    if (isActive(current)) return reject(failure, TransferError::AlreadyRunning, "A transfer is already running");
    if (current != State::AwaitingResolution) {
        return reject(failure, TransferError::NotReady,
                      QString("Nothing to resolve while %1").arg(stateName(current).toLower()));
    }
    if (!buildInvocation(resolution, failure)) return false;
    setState(State::Ready);
    return true;
}

bool TransferSupervisor::buildInvocation(const DuplicateResolution& resolution, TransferFailure* failure)
{
    Invocation inv;
    if (!CommandBuilder::build(m_program, m_request, m_report, resolution, inv, failure)) {
        qWarning() << "[Supervisor] Build failed:" << (failure ? failure->message : QString());
        return false;
    }
    m_invocation = inv;
    qInfo().noquote() << "[Supervisor] Invocation:\n" + m_invocation.preview;
    return true;
}

bool TransferSupervisor::start(TransferFailure* failure)
{
    QMutexLocker lk(&m_mutex);
    if (isActive(m_state)) {
        lk.unlock();
        return reject(failure, TransferError::AlreadyRunning, "A transfer is already running");
    }
    if (m_state != State::Ready) {
        const State current = m_state;
        lk.unlock();
        return reject(failure, TransferError::NotReady,
                      QString("Cannot start while %1").arg(stateName(current).toLower()));
    }

    m_worker = new TransferWorker(m_request, m_report, m_invocation, m_options);
    m_worker->moveToThread(&m_thread);
    TransferWorker* worker = m_worker;
    lk.unlock();

    connect(&m_thread, &QThread::finished, worker, &QObject::deleteLater);
    connect(worker, &TransferWorker::progress, this, &TransferSupervisor::progress);
    connect(worker, &TransferWorker::logLine, this, &TransferSupervisor::logLine);
    connect(worker, &TransferWorker::retrying, this, [this](int, int) { setState(State::Retrying); });
    connect(worker, &TransferWorker::attemptStarted, this, [this](int, int) { setState(State::Running); });
    connect(worker, &TransferWorker::finished, this, &TransferSupervisor::onWorkerFinished);

    m_result = TransferResult();
    setState(State::Running);
    if (!m_thread.isRunning()) m_thread.start();
    QMetaObject::invokeMethod(worker, &TransferWorker::run, Qt::QueuedConnection);
    if (failure) *failure = TransferFailure();
    return true;
}

bool TransferSupervisor::cancel()
{
    QMutexLocker lk(&m_mutex);
    if (!isActive(m_state) || !m_worker) {
        qInfo() << "[Supervisor] Cancel ignored while" << stateName(m_state);
        return false;
    }
    m_worker->requestCancel();
    return true;
}

void TransferSupervisor::onWorkerFinished(const TransferResult& result)
{
    TransferWorker* worker = nullptr;
    {
        QMutexLocker lk(&m_mutex);
        worker = m_worker;
        m_worker = nullptr;
    }
    if (worker) worker->deleteLater();

    m_result = result;
    switch (result.outcome) {
    case TransferResult::Outcome::Succeeded:
    case TransferResult::Outcome::SucceededWithWarnings:
        setState(State::Succeeded);
        break;
    case TransferResult::Outcome::Cancelled:
        setState(State::Cancelled);
        break;
    case TransferResult::Outcome::Failed:
        setState(State::Failed);
        break;
    }
    emit finished(m_result);
}

QString TransferSupervisor::stateName(State state)
{
    switch (state) {
    case State::Idle: return "Idle";
    case State::Preflighting: return "Preflighting";
    case State::AwaitingResolution: return "AwaitingResolution";
    case State::Ready: return "Ready";
    case State::Running: return "Running";
    case State::Retrying: return "Retrying";
    case State::Succeeded: return "Succeeded";
    case State::Failed: return "Failed";
    case State::Cancelled: return "Cancelled";
    }
    return "Unknown";
}
