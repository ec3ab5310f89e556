#include "copy_engine.h"

#include <QFileInfo>
#include <QDebug>

ProcessCopyEngine::ProcessCopyEngine(QObject* parent) : CopyEngine(parent) {}

ProcessCopyEngine::~ProcessCopyEngine()
{
    if (m_proc && m_proc->state() != QProcess::NotRunning) {
        m_proc->kill();
        m_proc->waitForFinished(2000);
    }
}

void ProcessCopyEngine::start(const QString& program, const QStringList& arguments)
{
    if (m_proc) { m_proc->deleteLater(); m_proc = nullptr; }
    m_buffer.clear();

    m_proc = new QProcess(this);
    // Robocopy writes everything to stdout; merge so errors keep their position in the stream
    m_proc->setProcessChannelMode(QProcess::MergedChannels);
    connect(m_proc, &QProcess::readyReadStandardOutput, this, &ProcessCopyEngine::onReadyRead);
    connect(m_proc, qOverload<int, QProcess::ExitStatus>(&QProcess::finished), this, &ProcessCopyEngine::onFinished);
    connect(m_proc, &QProcess::errorOccurred, this, &ProcessCopyEngine::onError);

    m_proc->setProgram(program);
    m_proc->setArguments(arguments);
    qInfo() << "[CopyEngine] Launching" << QFileInfo(program).fileName() << arguments.join(' ');
    m_proc->start();
}

void ProcessCopyEngine::terminate()
{
    if (isRunning()) m_proc->terminate();
}

void ProcessCopyEngine::kill()
{
    if (isRunning()) m_proc->kill();
}

bool ProcessCopyEngine::isRunning() const
{
    return m_proc && m_proc->state() != QProcess::NotRunning;
}

void ProcessCopyEngine::onReadyRead()
{
    m_buffer += m_proc->readAllStandardOutput();
    emitLines(false);
}

void ProcessCopyEngine::emitLines(bool flushPartial)
{
    // Percentages are rewritten in place with '\r', so both CR and LF end a line
    int start = 0;
    for (int i = 0; i < m_buffer.size(); ++i) {
        const char c = m_buffer.at(i);
        if (c != '\n' && c != '\r') continue;
        if (i > start) emit lineReceived(QString::fromLocal8Bit(m_buffer.constData() + start, i - start));
        start = i + 1;
    }
    m_buffer.remove(0, start);
    if (flushPartial && !m_buffer.isEmpty()) {
        emit lineReceived(QString::fromLocal8Bit(m_buffer));
        m_buffer.clear();
    }
}

void ProcessCopyEngine::onFinished(int exitCode, QProcess::ExitStatus status)
{
    m_buffer += m_proc->readAllStandardOutput();
    emitLines(true);
    emit finished(exitCode, status != QProcess::NormalExit);
}

void ProcessCopyEngine::onError(QProcess::ProcessError error)
{
    // Crashes arrive through finished(); only a failed launch is reported here
    if (error != QProcess::FailedToStart) return;
    const QString msg = m_proc ? m_proc->errorString() : QStringLiteral("failed to start");
    qWarning() << "[CopyEngine] Failed to start:" << msg;
    emit failedToStart(msg);
}
