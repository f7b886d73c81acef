#include <QtTest/QtTest>

#include "common/format_utils.hpp"

class FormatUtilsTests : public QObject
{
    Q_OBJECT
private slots:
    void testBinarySize_data();
    void testBinarySize();
    void testUptime();
    void testCacheSize();
    void testFrequency();
    void testGigabytesAndPercent();
};

void FormatUtilsTests::testBinarySize_data()
{
    QTest::addColumn<qlonglong>("bytes");
    QTest::addColumn<QString>("expected");

    QTest::newRow("zero") << 0LL << QStringLiteral("0 Bytes");
    QTest::newRow("one") << 1LL << QStringLiteral("1 Byte");
    QTest::newRow("bytes") << 512LL << QStringLiteral("512 Bytes");
    QTest::newRow("kib") << 1536LL << QStringLiteral("1.5 KiB");
    QTest::newRow("gib") << 3435973837LL << QStringLiteral("3.2 GiB");
    QTest::newRow("negative") << -2048LL << QStringLiteral("-2.0 KiB");
}

void FormatUtilsTests::testBinarySize()
{
    QFETCH(qlonglong, bytes);
    QFETCH(QString, expected);
    QCOMPARE(QString::fromStdString(pctoolkit::formatBinarySize(bytes)), expected);
}

void FormatUtilsTests::testUptime()
{
    QCOMPARE(QString::fromStdString(pctoolkit::formatUptime(0)), QStringLiteral("00:00:00"));
    QCOMPARE(QString::fromStdString(pctoolkit::formatUptime(3725)), QStringLiteral("01:02:05"));
    QCOMPARE(QString::fromStdString(pctoolkit::formatUptime(3 * 86400 + 4 * 3600 + 5 * 60 + 6)),
             QStringLiteral("3 days, 04:05:06"));
    QCOMPARE(QString::fromStdString(pctoolkit::formatUptime(-1)), QStringLiteral("Unknown"));
}

void FormatUtilsTests::testCacheSize()
{
    QCOMPARE(QString::fromStdString(pctoolkit::formatCacheSize(512)), QStringLiteral("512 KB"));
    QCOMPARE(QString::fromStdString(pctoolkit::formatCacheSize(32768)), QStringLiteral("32.0 MB"));
}

void FormatUtilsTests::testFrequency()
{
    QCOMPARE(QString::fromStdString(pctoolkit::formatFrequency(3800.0, 4700.0)),
             QStringLiteral("3.80 GHz (Max: 4.70 GHz)"));
    QCOMPARE(QString::fromStdString(pctoolkit::formatFrequency(2400.0, 0.0)),
             QStringLiteral("2.40 GHz"));
    QCOMPARE(QString::fromStdString(pctoolkit::formatFrequency(0.0, 5000.0)),
             QStringLiteral("Max: 5.00 GHz"));
    QCOMPARE(QString::fromStdString(pctoolkit::formatFrequency(0.0, 0.0)),
             QStringLiteral("Unknown"));
}

void FormatUtilsTests::testGigabytesAndPercent()
{
    QCOMPARE(QString::fromStdString(pctoolkit::formatGigabytes(512ULL * 1024 * 1024 * 1024)),
             QStringLiteral("512.0 GB"));
    QCOMPARE(QString::fromStdString(pctoolkit::formatPercent(42.25)), QStringLiteral("42.2%"));
    QCOMPARE(QString::fromStdString(pctoolkit::formatPercent(100.0)), QStringLiteral("100.0%"));
}

QTEST_MAIN(FormatUtilsTests)
#include "test_format_utils.moc"
