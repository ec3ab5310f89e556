#ifndef LOG_MANAGER_H
#define LOG_MANAGER_H

#include <QObject>
#include <QStringList>
#include <QMutex>
#include <QDateTime>
#include <QFile>
#include <QTextStream>
#include <QTimer>

class LogManager : public QObject {
    Q_OBJECT
    Q_PROPERTY(QStringList logs READ logs NOTIFY logsChanged)

public:
    static LogManager& instance() {
        static LogManager inst;
        return inst;
    }

    ~LogManager() override;

    QStringList logs() const;

    Q_INVOKABLE void addLog(const QString& message, const QString& level = "INFO");
    Q_INVOKABLE void clear();

    // Appends entries to path from now on; an empty path closes the current file.
    bool setLogFilePath(const QString& path, QString* error = nullptr);
    QString logFilePath() const { return m_file.fileName(); }

    // Mirror of every handled message on stderr (on by default, the CLI quiets INFO/DEBUG).
    // Both are called from any thread the message handler runs on.
    void setEchoLevel(const QString& minimumLevel);
    bool shouldEcho(const QString& level) const;

    void flush() { flushPending(); }

signals:
    void logsChanged();
    void logAdded(const QString& message);

private:
    explicit LogManager(QObject* parent = nullptr);
    void flushPending();
    void scheduleFlush(const QString& level);
    bool shouldFlushImmediately(const QString& level) const;
    static int levelRank(const QString& level);

    QStringList m_logs;
    mutable QMutex m_mutex;     // guards m_logs and m_echoLevel
    QFile m_file;
    QTextStream m_ts;
    QTimer m_flushTimer;
    bool m_pendingFlush = false;
    QString m_echoLevel = "DEBUG";
    static constexpr int MAX_LOGS = 1000;
    static constexpr int FLUSH_INTERVAL_MS = 250;
};

// Custom message handler for qDebug/qInfo/qWarning/qCritical
void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg);

#endif // LOG_MANAGER_H
