#pragma once

#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QRegularExpression>
#include <QTimer>
#include <QVector>

#include "../src/copy_engine.h"

// One scripted launch of the copy tool.
struct FakeRun {
    QStringList lines;
    int exitCode = 1;
    bool crash = false;
    bool failToStart = false;
    bool hang = false;              // keeps running until terminate() or kill()
    bool ignoreTerminate = false;   // only kill() stops it
    bool simulateCopy = false;      // copies the step's files the way robocopy would and reports them
};

// Shared between the test and the engines the worker creates on its own thread.
class FakeCopyScript {
public:
    void addRun(const FakeRun& run) { QMutexLocker lk(&m_mutex); m_runs << run; }
    void setFallback(const FakeRun& run) { QMutexLocker lk(&m_mutex); m_fallback = run; }

    FakeRun next(const QStringList& arguments) {
        QMutexLocker lk(&m_mutex);
        m_launches << arguments;
        return m_index < m_runs.size() ? m_runs.at(m_index++) : m_fallback;
    }

    int launchCount() const { QMutexLocker lk(&m_mutex); return m_launches.size(); }
    QList<QStringList> launches() const { QMutexLocker lk(&m_mutex); return m_launches; }

private:
    mutable QMutex m_mutex;
    QVector<FakeRun> m_runs;
    FakeRun m_fallback;
    int m_index = 0;
    QList<QStringList> m_launches;
};

class FakeCopyEngine : public CopyEngine {
    Q_OBJECT
public:
    FakeCopyEngine(FakeCopyScript* script, QObject* parent = nullptr) : CopyEngine(parent), m_script(script) {}

    void start(const QString& program, const QStringList& arguments) override {
        Q_UNUSED(program);
        m_run = m_script->next(arguments);
        const int generation = ++m_generation;
        if (m_run.failToStart) {
            QTimer::singleShot(0, this, [this]() { emit failedToStart("No such file or directory"); });
            return;
        }
        m_running = true;
        QTimer::singleShot(0, this, [this, arguments, generation]() { play(arguments, generation); });
    }

    void terminate() override {
        if (!m_running || m_run.ignoreTerminate) return;
        const int generation = m_generation;
        // Exits cleanly, as if it was about to finish anyway
        QTimer::singleShot(0, this, [this, generation]() { finishWith(generation, 0, false); });
    }

    void kill() override {
        if (!m_running) return;
        const int generation = m_generation;
        QTimer::singleShot(0, this, [this, generation]() { finishWith(generation, 9, true); });
    }

    bool isRunning() const override { return m_running; }

private:
    void play(const QStringList& arguments, int generation) {
        if (!m_running || generation != m_generation) return;
        QStringList lines = m_run.lines;
        int exitCode = m_run.exitCode;
        if (m_run.simulateCopy) simulate(arguments, lines, exitCode);
        for (const QString& line : lines) emit lineReceived(line);
        if (m_run.hang) return;
        finishWith(generation, exitCode, m_run.crash);
    }

    void finishWith(int generation, int exitCode, bool crashed) {
        if (!m_running || generation != m_generation) return;
        m_running = false;
        emit finished(exitCode, crashed);
    }

    static bool isFlag(const QString& arg) {
        static const QRegularExpression re("^/[A-Z]+(:\\d+)?$");
        return re.match(arg).hasMatch();
    }

    // Minimal robocopy: source root, destination, optional file names, then flags.
    static void simulate(const QStringList& args, QStringList& lines, int& exitCode) {
        if (args.size() < 2) { exitCode = 16; return; }
        const QString src = QDir::fromNativeSeparators(args.at(0));
        const QString dst = QDir::fromNativeSeparators(args.at(1));

        QStringList names;
        int i = 2;
        for (; i < args.size() && !isFlag(args.at(i)); ++i) names << args.at(i);
        QStringList flags;
        QStringList excludes;
        for (; i < args.size(); ++i) {
            if (args.at(i) == "/XF") {
                for (++i; i < args.size() && !isFlag(args.at(i)); ++i) excludes << args.at(i);
                --i;
                continue;
            }
            flags << args.at(i);
        }
        const bool recursive = flags.contains("/E");
        const bool listOnly = flags.contains("/L");
        const bool overwrite = flags.contains("/IS");
        const bool move = flags.contains("/MOV") || flags.contains("/MOVE");

        QStringList files;
        if (!names.isEmpty()) {
            for (const QString& n : names) files << src + '/' + n;
        } else {
            QDirIterator it(src, QDir::Files | QDir::Hidden | QDir::System,
                            recursive ? QDirIterator::Subdirectories : QDirIterator::NoIteratorFlags);
            while (it.hasNext()) files << it.next();
            files.sort();
        }

        qint64 total = 0, copied = 0, skipped = 0;
        qint64 totalBytes = 0, copiedBytes = 0, skippedBytes = 0;
        for (const QString& path : files) {
            const QFileInfo fi(path);
            bool excluded = false;
            for (const QString& x : excludes) {
                if (x.contains('/') || x.contains('\\')) {
                    excluded = excluded || QDir::cleanPath(QDir::fromNativeSeparators(x)) == QDir::cleanPath(path);
                } else {
                    excluded = excluded || QRegularExpression(QRegularExpression::wildcardToRegularExpression(x))
                                               .match(fi.fileName()).hasMatch();
                }
            }
            if (excluded) continue;

            ++total;
            totalBytes += fi.size();
            const QString target = dst + '/' + QDir(src).relativeFilePath(path);
            // Like robocopy, only identical files (same size and time) are left alone
            const QFileInfo existing(target);
            if (existing.exists() && !overwrite && existing.size() == fi.size()
                && existing.lastModified() == fi.lastModified()) {
                ++skipped;
                skippedBytes += fi.size();
                continue;
            }
            lines << QString("\t    New File  \t\t%1\t%2").arg(fi.size()).arg(QDir::toNativeSeparators(path));
            if (!listOnly) {
                QDir().mkpath(QFileInfo(target).path());
                QFile::remove(target);
                if (!QFile::copy(path, target)) {
                    lines << QString("2024/05/01 10:00:00 ERROR 5 (0x00000005) Copying File %1").arg(QDir::toNativeSeparators(path));
                    continue;
                }
                QFile copied(target);
                if (copied.open(QIODevice::ReadWrite)) {
                    copied.setFileTime(fi.lastModified(), QFileDevice::FileModificationTime);
                    copied.close();
                }
                if (move) QFile::remove(path);
            }
            lines << "100%";
            ++copied;
            copiedBytes += fi.size();
        }
        lines << QString("   Files : %1 %2 %3 0 0 0").arg(total).arg(copied).arg(skipped);
        lines << QString("   Bytes : %1 %2 %3 0 0 0").arg(totalBytes).arg(copiedBytes).arg(skippedBytes);
        exitCode = copied > 0 ? 1 : 0;
    }

    FakeCopyScript* m_script = nullptr;
    FakeRun m_run;
    bool m_running = false;
    int m_generation = 0;
};
