#include <QtTest>
#include "../src/progress_parser.h"

class TestProgressParser : public QObject {
    Q_OBJECT
private slots:
    void testFileLines();
    void testFileLineWithUnit();
    void testPercent();
    void testErrors();
    void testToolRetry();
    void testSummary();
    void testIgnoredLines_data();
    void testIgnoredLines();
    void testParseSize();
};

void TestProgressParser::testFileLines()
{
    auto ev = ProgressParser::parse("\t    New File  \t\t10485760\tC:\\Media\\Shoot\\A001.mov");
    QVERIFY(ev.has_value());
    QCOMPARE(ev->kind, ProgressEvent::Kind::FileStarted);
    QCOMPARE(ev->name, QString("C:\\Media\\Shoot\\A001.mov"));
    QCOMPARE(ev->total, qint64(10485760));
    QCOMPARE(ev->fileClass, QString("New File"));

    ev = ProgressParser::parse("\t    Newer     \t\t   512\tD:\\cards\\clip with spaces.mxf  ");
    QVERIFY(ev.has_value());
    QCOMPARE(ev->fileClass, QString("Newer"));
    QCOMPARE(ev->name, QString("D:\\cards\\clip with spaces.mxf"));
    QCOMPARE(ev->total, qint64(512));
}

void TestProgressParser::testFileLineWithUnit()
{
    auto ev = ProgressParser::parse("\t    New File  \t\t 1.5 g\tE:\\raw\\B002.braw");
    QVERIFY(ev.has_value());
    QCOMPARE(ev->kind, ProgressEvent::Kind::FileStarted);
    QCOMPARE(ev->total, qint64(1610612736));
    QCOMPARE(ev->name, QString("E:\\raw\\B002.braw"));

    // Bad size token: the file is still reported, size unknown
    ev = ProgressParser::parse("\t    New File  \t\t 12x4\tE:\\raw\\B003.braw");
    QVERIFY(ev.has_value());
    QCOMPARE(ev->kind, ProgressEvent::Kind::FileStarted);
    QCOMPARE(ev->total, qint64(-1));
}

void TestProgressParser::testPercent()
{
    auto ev = ProgressParser::parse("  42.5%");
    QVERIFY(ev.has_value());
    QCOMPARE(ev->kind, ProgressEvent::Kind::FileProgress);
    QCOMPARE(ev->percent, 42.5);

    ev = ProgressParser::parse("100%");
    QVERIFY(ev.has_value());
    QCOMPARE(ev->percent, 100.0);

    QVERIFY(!ProgressParser::parse("250%").has_value());
}

void TestProgressParser::testErrors()
{
    auto ev = ProgressParser::parse("2024/05/01 10:00:00 ERROR 32 (0x00000020) Copying File C:\\src\\A001.mov");
    QVERIFY(ev.has_value());
    QCOMPARE(ev->kind, ProgressEvent::Kind::FileError);
    QCOMPARE(ev->reasonCode, 32);
    QCOMPARE(ev->name, QString("C:\\src\\A001.mov"));
    QCOMPARE(ev->message, QString("Copying File"));

    ev = ProgressParser::parse("ERROR : Invalid Parameter #3 : \"/BOGUS\"");
    QVERIFY(ev.has_value());
    QCOMPARE(ev->kind, ProgressEvent::Kind::FileError);
    QVERIFY(ev->name.isEmpty());
    QVERIFY(ev->message.contains("Invalid Parameter"));
}

void TestProgressParser::testToolRetry()
{
    auto ev = ProgressParser::parse("Waiting 30 seconds... Retrying...");
    QVERIFY(ev.has_value());
    QCOMPARE(ev->kind, ProgressEvent::Kind::ToolRetrying);
    QCOMPARE(ev->delaySeconds, 30);
}

void TestProgressParser::testSummary()
{
    auto ev = ProgressParser::parse("   Files :         3         2         1         0         0         0");
    QVERIFY(ev.has_value());
    QCOMPARE(ev->kind, ProgressEvent::Kind::Summary);
    QCOMPARE(ev->summaryRow, ProgressEvent::SummaryRow::Files);
    QCOMPARE(ev->counts.total, qint64(3));
    QCOMPARE(ev->counts.copied, qint64(2));
    QCOMPARE(ev->counts.skipped, qint64(1));

    ev = ProgressParser::parse("   Bytes :   15.00 m   10.00 m    5.00 m         0         0         0");
    QVERIFY(ev.has_value());
    QCOMPARE(ev->summaryRow, ProgressEvent::SummaryRow::Bytes);
    QCOMPARE(ev->counts.total, qint64(15728640));
    QCOMPARE(ev->counts.copied, qint64(10485760));
    QCOMPARE(ev->counts.extras, qint64(0));

    // Job header row, not the summary
    QVERIFY(!ProgressParser::parse("    Files : *.*").has_value());
}

void TestProgressParser::testIgnoredLines_data()
{
    QTest::addColumn<QString>("line");
    QTest::newRow("empty") << QString();
    QTest::newRow("blank") << QString("   \t ");
    QTest::newRow("banner") << QString("   ROBOCOPY     ::     Robust File Copy for Windows");
    QTest::newRow("rule") << QString("-------------------------------------------------------------------------------");
    QTest::newRow("options") << QString("  Options : *.* /S /E /DCOPY:DA /COPY:DAT /R:1 /W:1");
    QTest::newRow("garbage percent") << QString("abc%");
    QTest::newRow("summary too short") << QString("   Files :   3   2");
    QTest::newRow("summary garbage") << QString("   Files :   3   x   1   0   0   0");
    QTest::newRow("error no code") << QString("ERROR (0x20) something");
    QTest::newRow("binary") << QString::fromLatin1("\x01\x02\x7f\xff");
    QTest::newRow("file class only") << QString("    New File");
}

void TestProgressParser::testIgnoredLines()
{
    QFETCH(QString, line);
    QVERIFY(!ProgressParser::parse(line).has_value());
}

void TestProgressParser::testParseSize()
{
    QCOMPARE(ProgressParser::parseSize("1024"), qint64(1024));
    QCOMPARE(ProgressParser::parseSize("2", "k"), qint64(2048));
    QCOMPARE(ProgressParser::parseSize("1", "T"), qint64(1099511627776LL));
    QCOMPARE(ProgressParser::parseSize("-5"), qint64(-1));
    QCOMPARE(ProgressParser::parseSize("abc"), qint64(-1));
    QCOMPARE(ProgressParser::parseSize("1", "x"), qint64(-1));
}

QTEST_APPLESS_MAIN(TestProgressParser)
#include "test_progress_parser.moc"
