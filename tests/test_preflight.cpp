#include <QtTest>
#include <QTemporaryDir>
#include <QFile>
#include <QDir>
#include "../src/preflight.h"

namespace {

bool makeFile(const QString& path, qint64 size)
{
    QDir().mkpath(QFileInfo(path).path());
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly)) return false;
    return f.resize(size);
}

PreflightOptions optionsWithFree(qint64 freeBytes, Qt::CaseSensitivity cs = Qt::CaseSensitive)
{
    PreflightOptions o;
    o.caseSensitivity = cs;
    o.freeSpaceQuery = [freeBytes](const QString&) { return freeBytes; };
    return o;
}

}

class TestPreflight : public QObject {
    Q_OBJECT
private slots:
    void testTotalsAndSpace_data();
    void testTotalsAndSpace();
    void testSafetyMargin();
    void testCollisions();
    void testCaseInsensitiveCollisions();
    void testSharedNameKeepsEverySource();
    void testSubfoldersExcluded();
    void testExcludePatterns();
    void testFileSources();
    void testMissingSource();
    void testDestinationNotFolder();
    void testDestinationInsideSource();
    void testDestinationCreatable();
};

void TestPreflight::testTotalsAndSpace_data()
{
    QTest::addColumn<QList<qint64>>("sizes");
    QTest::addColumn<qint64>("freeBytes");
    QTest::addColumn<bool>("enough");

    QTest::newRow("empty tree") << QList<qint64>{} << qint64(0) << true;
    QTest::newRow("exact fit") << QList<qint64>{1000, 24} << qint64(1024) << true;
    QTest::newRow("one byte short") << QList<qint64>{1000, 25} << qint64(1024) << false;
    QTest::newRow("plenty") << QList<qint64>{10 * 1024 * 1024, 5 * 1024 * 1024, 1} << qint64(1LL << 40) << true;
    QTest::newRow("unknown free space") << QList<qint64>{1} << qint64(-1) << false;
}

void TestPreflight::testTotalsAndSpace()
{
    QFETCH(QList<qint64>, sizes);
    QFETCH(qint64, freeBytes);
    QFETCH(bool, enough);

    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString src = tmp.path() + "/card";
    const QString dest = tmp.path() + "/backup";
    QVERIFY(QDir().mkpath(src));
    QVERIFY(QDir().mkpath(dest));

    qint64 total = 0;
    for (int i = 0; i < sizes.size(); ++i) {
        // Spread files over nested folders
        const QString path = QString("%1/%2/clip_%3.mov").arg(src).arg(i % 2 ? "sub/deeper" : "sub").arg(i);
        QVERIFY(makeFile(path, sizes[i]));
        total += sizes[i];
    }

    TransferRequest req;
    req.sources = {src};
    req.destination = dest;

    PreflightReport report;
    TransferFailure failure;
    QVERIFY2(Preflight::run(req, optionsWithFree(freeBytes), report, &failure), qPrintable(failure.message));
    QCOMPARE(report.totalBytes, total);
    QCOMPARE(report.totalFiles, int(sizes.size()));
    QCOMPARE(report.transferBytes, total);
    QCOMPARE(report.hasEnoughSpace, enough);
    QCOMPARE(report.sources.size(), 1);
    QVERIFY(report.sources.first().isDirectory);
    QVERIFY(!report.hasCollisions());
}

void TestPreflight::testSafetyMargin()
{
    QTemporaryDir tmp;
    QVERIFY(makeFile(tmp.path() + "/src/a.wav", 1000));
    QVERIFY(QDir().mkpath(tmp.path() + "/dst"));

    TransferRequest req;
    req.sources = {tmp.path() + "/src"};
    req.destination = tmp.path() + "/dst";

    PreflightOptions options = optionsWithFree(1500);
    options.safetyMarginBytes = 500;
    PreflightReport report;
    QVERIFY(Preflight::run(req, options, report));
    QVERIFY(report.hasEnoughSpace);

    options.safetyMarginBytes = 501;
    QVERIFY(Preflight::run(req, options, report));
    QVERIFY(!report.hasEnoughSpace);
    QVERIFY(!report.warnings.isEmpty());
}

void TestPreflight::testCollisions()
{
    QTemporaryDir tmp;
    const QString src = tmp.path() + "/card";
    const QString dest = tmp.path() + "/backup";
    QVERIFY(makeFile(src + "/A001.mov", 10));
    QVERIFY(makeFile(src + "/day2/B001.mov", 20));
    QVERIFY(makeFile(src + "/day2/B002.mov", 30));
    QVERIFY(makeFile(dest + "/day2/B002.mov", 5));
    QVERIFY(makeFile(dest + "/A001.mov", 5));
    QVERIFY(makeFile(dest + "/unrelated.txt", 1));

    TransferRequest req;
    req.sources = {src};
    req.destination = dest;

    PreflightReport report;
    QVERIFY(Preflight::run(req, optionsWithFree(1 << 20), report));
    QCOMPARE(report.collisionPaths(), QStringList({"A001.mov", "day2/B002.mov"}));
    QCOMPARE(report.collisions.at(1).bytes, qint64(30));
    QCOMPARE(QDir::cleanPath(report.collisions.at(1).sourcePath), QDir::cleanPath(src + "/day2/B002.mov"));
    QVERIFY(report.occupiedNames.contains("unrelated.txt"));
    QVERIFY(report.occupiedNames.contains("day2/B001.mov"));
}

void TestPreflight::testCaseInsensitiveCollisions()
{
    QTemporaryDir tmp;
    const QString src = tmp.path() + "/card";
    const QString dest = tmp.path() + "/backup";
    QVERIFY(makeFile(src + "/Clip.MOV", 10));
    QVERIFY(makeFile(dest + "/clip.mov", 10));

    TransferRequest req;
    req.sources = {src};
    req.destination = dest;

    PreflightReport report;
    QVERIFY(Preflight::run(req, optionsWithFree(1 << 20, Qt::CaseSensitive), report));
    QVERIFY(!report.hasCollisions());

    QVERIFY(Preflight::run(req, optionsWithFree(1 << 20, Qt::CaseInsensitive), report));
    QCOMPARE(report.collisions.size(), 1);
    QCOMPARE(report.collisions.first().relativePath, QString("Clip.MOV"));
    QCOMPARE(report.caseSensitivity, Qt::CaseInsensitive);
}

void TestPreflight::testSharedNameKeepsEverySource()
{
    QTemporaryDir tmp;
    const QString dest = tmp.path() + "/backup";
    QVERIFY(makeFile(tmp.path() + "/cardA/clip.mov", 10));
    QVERIFY(makeFile(tmp.path() + "/cardB/Clip.MOV", 20));
    QVERIFY(makeFile(tmp.path() + "/loose/clip.mov", 30));
    QVERIFY(makeFile(dest + "/clip.mov", 1));

    TransferRequest req;
    req.sources = {tmp.path() + "/cardA", tmp.path() + "/cardB", tmp.path() + "/loose/clip.mov"};
    req.destination = dest;

    PreflightReport report;
    QVERIFY(Preflight::run(req, optionsWithFree(1 << 20, Qt::CaseInsensitive), report));
    QCOMPARE(report.collisions.size(), 1);
    const Collision c = report.collisions.first();
    QCOMPARE(c.sourcePaths().size(), 3);
    QCOMPARE(QDir::cleanPath(c.sourcePath), QDir::cleanPath(tmp.path() + "/cardA/clip.mov"));
    QCOMPARE(QDir::cleanPath(c.otherSourcePaths.at(0)), QDir::cleanPath(tmp.path() + "/cardB/Clip.MOV"));
    QCOMPARE(c.bytesOf(1), qint64(20));
    QCOMPARE(c.bytesOf(2), qint64(30));

    // Case-sensitive destinations treat Clip.MOV as a new name
    QVERIFY(Preflight::run(req, optionsWithFree(1 << 20, Qt::CaseSensitive), report));
    QCOMPARE(report.collisions.size(), 1);
    QCOMPARE(report.collisions.first().sourcePaths().size(), 2);
}

void TestPreflight::testSubfoldersExcluded()
{
    QTemporaryDir tmp;
    const QString src = tmp.path() + "/card";
    const QString dest = tmp.path() + "/backup";
    QVERIFY(makeFile(src + "/top.mov", 100));
    QVERIFY(makeFile(src + "/sub/nested.mov", 200));
    QVERIFY(makeFile(dest + "/sub/nested.mov", 1));

    TransferRequest req;
    req.sources = {src};
    req.destination = dest;
    req.includeSubfolders = false;

    PreflightReport report;
    QVERIFY(Preflight::run(req, optionsWithFree(1 << 20), report));
    // Totals always cover the whole tree
    QCOMPARE(report.totalFiles, 2);
    QCOMPARE(report.totalBytes, qint64(300));
    QCOMPARE(report.transferFiles, 1);
    QCOMPARE(report.transferBytes, qint64(100));
    QVERIFY(!report.hasCollisions());

    bool warned = false;
    for (const QString& w : report.warnings) warned = warned || w.contains("subfolders");
    QVERIFY(warned);
}

void TestPreflight::testExcludePatterns()
{
    QTemporaryDir tmp;
    const QString src = tmp.path() + "/card";
    QVERIFY(makeFile(src + "/A001.mov", 100));
    QVERIFY(makeFile(src + "/Thumbs.db", 7));
    QVERIFY(makeFile(src + "/sub/.DS_Store", 3));
    QVERIFY(QDir().mkpath(tmp.path() + "/backup"));

    TransferRequest req;
    req.sources = {src};
    req.destination = tmp.path() + "/backup";
    req.excludePatterns = {"*.db", ".DS_Store"};

    PreflightReport report;
    QVERIFY(Preflight::run(req, optionsWithFree(1 << 20), report));
    QCOMPARE(report.totalFiles, 1);
    QCOMPARE(report.totalBytes, qint64(100));
}

void TestPreflight::testFileSources()
{
    QTemporaryDir tmp;
    QVERIFY(makeFile(tmp.path() + "/a/one.wav", 11));
    QVERIFY(makeFile(tmp.path() + "/b/two.wav", 22));
    QVERIFY(makeFile(tmp.path() + "/dst/two.wav", 1));

    TransferRequest req;
    req.sources = {tmp.path() + "/a/one.wav", tmp.path() + "/b/two.wav"};
    req.destination = tmp.path() + "/dst";

    PreflightReport report;
    QVERIFY(Preflight::run(req, optionsWithFree(1 << 20), report));
    QCOMPARE(report.totalBytes, qint64(33));
    QCOMPARE(report.sources.size(), 2);
    QVERIFY(!report.sources.at(0).isDirectory);
    QCOMPARE(report.collisionPaths(), QStringList({"two.wav"}));
}

void TestPreflight::testMissingSource()
{
    QTemporaryDir tmp;
    TransferRequest req;
    req.sources = {tmp.path() + "/does-not-exist"};
    req.destination = tmp.path() + "/dst";

    PreflightReport report;
    TransferFailure failure;
    QVERIFY(!Preflight::run(req, optionsWithFree(1 << 20), report, &failure));
    QCOMPARE(failure.code, TransferError::PathUnreadable);
}

void TestPreflight::testDestinationNotFolder()
{
    QTemporaryDir tmp;
    QVERIFY(makeFile(tmp.path() + "/src/a.mov", 1));
    QVERIFY(makeFile(tmp.path() + "/target.txt", 1));

    TransferRequest req;
    req.sources = {tmp.path() + "/src"};
    req.destination = tmp.path() + "/target.txt";

    PreflightReport report;
    TransferFailure failure;
    QVERIFY(!Preflight::run(req, optionsWithFree(1 << 20), report, &failure));
    QCOMPARE(failure.code, TransferError::DestinationUnavailable);

    // A path below a regular file can never be created
    req.destination = tmp.path() + "/target.txt/sub";
    QVERIFY(!Preflight::run(req, optionsWithFree(1 << 20), report, &failure));
    QCOMPARE(failure.code, TransferError::DestinationUnavailable);
}

void TestPreflight::testDestinationInsideSource()
{
    QTemporaryDir tmp;
    QVERIFY(makeFile(tmp.path() + "/src/a.mov", 1));

    TransferRequest req;
    req.sources = {tmp.path() + "/src"};
    req.destination = tmp.path() + "/src/backup";

    PreflightReport report;
    TransferFailure failure;
    QVERIFY(!Preflight::run(req, optionsWithFree(1 << 20), report, &failure));
    QCOMPARE(failure.code, TransferError::InvalidRequest);
}

void TestPreflight::testDestinationCreatable()
{
    QTemporaryDir tmp;
    QVERIFY(makeFile(tmp.path() + "/src/a.mov", 64));

    TransferRequest req;
    req.sources = {tmp.path() + "/src"};
    req.destination = tmp.path() + "/new/nested/dst";

    PreflightReport report;
    QString queried;
    PreflightOptions options;
    options.freeSpaceQuery = [&queried](const QString& path) { queried = path; return qint64(1 << 20); };
    QVERIFY(Preflight::run(req, options, report));
    QVERIFY(!report.destinationExists);
    QVERIFY(report.hasEnoughSpace);
    QCOMPARE(QDir::cleanPath(queried), QDir::cleanPath(tmp.path()));
}

QTEST_APPLESS_MAIN(TestPreflight)
#include "test_preflight.moc"
