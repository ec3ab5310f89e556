#include "log_manager.h"
#include <QDebug>
#include <QMutexLocker>
#include <QCoreApplication>
#include <QFileInfo>
#include <QDir>

#include <cstdio>
#include <cstdlib>

LogManager::LogManager(QObject* parent) : QObject(parent) {
    m_flushTimer.setSingleShot(true);
    m_flushTimer.setInterval(FLUSH_INTERVAL_MS);
    connect(&m_flushTimer, &QTimer::timeout, this, &LogManager::flushPending);
}

LogManager::~LogManager() {
    flushPending();
    if (m_ts.device()) {
        m_ts.flush();
    }
}

QStringList LogManager::logs() const {
    QMutexLocker locker(&m_mutex);
    return m_logs;
}

bool LogManager::setLogFilePath(const QString& path, QString* error) {
    flushPending();
    m_ts.setDevice(nullptr);
    if (m_file.isOpen()) m_file.close();
    m_file.setFileName(path);
    if (path.isEmpty()) return true;

    QDir().mkpath(QFileInfo(path).absolutePath());
    if (!m_file.open(QIODevice::Append | QIODevice::Text)) {
        if (error) *error = m_file.errorString();
        m_file.setFileName(QString());
        return false;
    }
    m_ts.setDevice(&m_file);
    m_ts << "\n--- session start " << QDateTime::currentDateTime().toString(Qt::ISODate) << " ---\n";
    m_ts.flush();
    return true;
}

void LogManager::addLog(const QString& message, const QString& level) {
    QString logEntry;
    {
        QMutexLocker locker(&m_mutex);
        QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
        logEntry = QString("[%1] [%2] %3").arg(timestamp, level, message);
        m_logs.append(logEntry);
        if (m_logs.size() > MAX_LOGS) {
            m_logs.removeFirst();
        }
    } // unlock before emitting signals

    emit logsChanged();
    emit logAdded(logEntry);

    // Write-through to disk log with buffered flushing
    if (m_ts.device()) {
        m_ts << logEntry << '\n';
        scheduleFlush(level);
    }
}

void LogManager::flushPending() {
    if (!m_ts.device()) {
        m_pendingFlush = false;
        return;
    }
    if (m_pendingFlush) {
        m_ts.flush();
        m_pendingFlush = false;
    }
    if (m_flushTimer.isActive()) {
        m_flushTimer.stop();
    }
}

bool LogManager::shouldFlushImmediately(const QString& level) const {
    const QString upper = level.toUpper();
    return upper == "WARN" || upper == "ERROR" || upper == "FATAL";
}

void LogManager::scheduleFlush(const QString& level) {
    if (!m_ts.device()) {
        return;
    }

    m_pendingFlush = true;

    if (shouldFlushImmediately(level)) {
        m_flushTimer.stop();
        flushPending();
        return;
    }

    m_flushTimer.start(FLUSH_INTERVAL_MS);
}

void LogManager::clear() {
    {
        QMutexLocker locker(&m_mutex);
        m_logs.clear();
    }
    emit logsChanged();
}

int LogManager::levelRank(const QString& level) {
    if (level == "DEBUG") return 0;
    if (level == "INFO") return 1;
    if (level == "WARN") return 2;
    if (level == "ERROR") return 3;
    if (level == "FATAL") return 4;
    return 1;
}

void LogManager::setEchoLevel(const QString& minimumLevel) {
    QMutexLocker locker(&m_mutex);
    m_echoLevel = minimumLevel.toUpper();
}

bool LogManager::shouldEcho(const QString& level) const {
    int threshold = 0;
    {
        QMutexLocker locker(&m_mutex);
        threshold = levelRank(m_echoLevel);
    }
    return levelRank(level.toUpper()) >= threshold;
}

void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    Q_UNUSED(context);
    QString level;
    switch (type) {
        case QtDebugMsg:
            level = "DEBUG";
            break;
        case QtInfoMsg:
            level = "INFO";
            break;
        case QtWarningMsg:
            level = "WARN";
            break;
        case QtCriticalMsg:
            level = "ERROR";
            break;
        case QtFatalMsg:
            level = "FATAL";
            break;
    }

    // Messages arrive from the worker thread and the preflight pool; hand them to the manager's thread
    QString levelCopy = level;
    QString msgCopy = msg;
    QMetaObject::invokeMethod(&LogManager::instance(), [levelCopy, msgCopy]() {
        LogManager::instance().addLog(msgCopy, levelCopy);
    }, Qt::QueuedConnection);

    if (LogManager::instance().shouldEcho(levelCopy) || type == QtFatalMsg) {
        QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
        fprintf(stderr, "[%s] [%s] %s\n",
                timestamp.toLocal8Bit().constData(),
                levelCopy.toLocal8Bit().constData(),
                msgCopy.toLocal8Bit().constData());
        fflush(stderr);
    }

    if (type == QtFatalMsg) {
        LogManager::instance().flush();
        abort();
    }
}
