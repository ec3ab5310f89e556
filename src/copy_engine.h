#pragma once

#include <QObject>
#include <QProcess>
#include <QByteArray>
#include <QStringList>

// Capability the supervisor needs from the external copy tool: take an argument
// list, stream line-oriented output, report an exit code. Tests substitute a
// scripted implementation.
class CopyEngine : public QObject {
    Q_OBJECT
public:
    explicit CopyEngine(QObject* parent = nullptr) : QObject(parent) {}
    ~CopyEngine() override = default;

    virtual void start(const QString& program, const QStringList& arguments) = 0;
    // Ask the tool to stop; it may still finish normally.
    virtual void terminate() = 0;
    virtual void kill() = 0;
    virtual bool isRunning() const = 0;

signals:
    void lineReceived(const QString& line);
    // crashed is true when the process did not exit on its own (signal, kill, crash)
    void finished(int exitCode, bool crashed);
    void failedToStart(const QString& message);
};

class ProcessCopyEngine : public CopyEngine {
    Q_OBJECT
public:
    explicit ProcessCopyEngine(QObject* parent = nullptr);
    ~ProcessCopyEngine() override;

    void start(const QString& program, const QStringList& arguments) override;
    void terminate() override;
    void kill() override;
    bool isRunning() const override;

private slots:
    void onReadyRead();
    void onFinished(int exitCode, QProcess::ExitStatus status);
    void onError(QProcess::ProcessError error);

private:
    void emitLines(bool flushPartial);

    QProcess* m_proc = nullptr;
    QByteArray m_buffer;
};
