#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include "probe/motherboard_probe.hpp"

namespace {

void writeFile(const QString &root, const QString &path, const QByteArray &content)
{
    const QString full = root + path;
    QDir().mkpath(QFileInfo(full).absolutePath());
    QFile file(full);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write(content);
}

} // namespace

class MotherboardProbeTests : public QObject
{
    Q_OBJECT
private slots:
    void testParseDmiMemoryArray();
    void testChipsetFromBoardName();
    void testChipsetFromLspci();
    void testEstimateChipsetFromCpu_data();
    void testEstimateChipsetFromCpu();
    void testDetectChipsetOrder();
    void testReadMotherboardInfo();
};

void MotherboardProbeTests::testParseDmiMemoryArray()
{
    const QString output = QStringLiteral(
        "Handle 0x0026, DMI type 16, 23 bytes\n"
        "Physical Memory Array\n"
        "\tLocation: System Board Or Motherboard\n"
        "\tUse: System Memory\n"
        "\tMaximum Capacity: 128 GB\n"
        "\tNumber Of Devices: 4\n"
        "\n"
        "Handle 0x0027, DMI type 16, 23 bytes\n"
        "Physical Memory Array\n"
        "\tUse: Video Memory\n"
        "\tMaximum Capacity: 512 MB\n"
        "\tNumber Of Devices: 1\n");
    const auto array = pctoolkit::parseDmiMemoryArray(output);
    QCOMPARE(array.slots, 4);
    QCOMPARE(array.maxCapacityMib, qulonglong(128 * 1024));

    const auto empty = pctoolkit::parseDmiMemoryArray(QString());
    QCOMPARE(empty.slots, 0);
    QCOMPARE(empty.maxCapacityMib, qulonglong(0));
}

void MotherboardProbeTests::testChipsetFromBoardName()
{
    QCOMPARE(pctoolkit::chipsetFromBoardName(QStringLiteral("ROG STRIX B650E-F GAMING WIFI")),
             QStringLiteral("AMD B650E"));
    QCOMPARE(pctoolkit::chipsetFromBoardName(QStringLiteral("B550 AORUS ELITE")),
             QStringLiteral("AMD B550"));
    QCOMPARE(pctoolkit::chipsetFromBoardName(QStringLiteral("PRIME z790-p")),
             QStringLiteral("Intel Z790"));
    QVERIFY(pctoolkit::chipsetFromBoardName(QStringLiteral("0KWVT8")).isEmpty());
}

void MotherboardProbeTests::testChipsetFromLspci()
{
    const QString lspci = QStringLiteral(
        "00:00.0 Host bridge: Intel Corporation Device a700 (rev 01)\n"
        "00:1f.0 ISA bridge: Intel Corporation Z690 Chipset LPC/eSPI Controller (rev 11)\n");
    QCOMPARE(pctoolkit::chipsetFromLspci(lspci), QStringLiteral("Intel Z690"));
    QVERIFY(pctoolkit::chipsetFromLspci(QStringLiteral(
        "00:00.0 Host bridge: Advanced Micro Devices, Inc. [AMD] Starship/Matisse Root Complex\n"))
                .isEmpty());
}

void MotherboardProbeTests::testEstimateChipsetFromCpu_data()
{
    QTest::addColumn<QString>("cpu");
    QTest::addColumn<QString>("expected");

    QTest::newRow("zen4") << QStringLiteral("AMD Ryzen 9 7950X 16-Core Processor")
                          << QStringLiteral("AMD 600 Series (Estimated)");
    QTest::newRow("zen3") << QStringLiteral("AMD Ryzen 7 5800X 8-Core Processor")
                          << QStringLiteral("AMD 500 Series (Estimated)");
    QTest::newRow("zen2") << QStringLiteral("AMD Ryzen 5 3600 6-Core Processor")
                          << QStringLiteral("AMD (Unknown Series)");
    QTest::newRow("alder-lake") << QStringLiteral("12th Gen Intel(R) Core(TM) i7-12700K")
                                << QStringLiteral("Intel 600 Series (Estimated)");
    QTest::newRow("raptor-lake") << QStringLiteral("Intel(R) Core(TM) i9-13900K")
                                 << QStringLiteral("Intel 700 Series (Estimated)");
    QTest::newRow("coffee-lake") << QStringLiteral("Intel(R) Core(TM) i7-8700K CPU @ 3.70GHz")
                                 << QStringLiteral("Intel (Unknown Series)");
    QTest::newRow("arm") << QStringLiteral("Cortex-A72") << QString();
}

void MotherboardProbeTests::testEstimateChipsetFromCpu()
{
    QFETCH(QString, cpu);
    QFETCH(QString, expected);
    QCOMPARE(pctoolkit::estimateChipsetFromCpu(cpu), expected);
}

void MotherboardProbeTests::testDetectChipsetOrder()
{
    const QString lspci = QStringLiteral(
        "00:14.3 ISA bridge: Advanced Micro Devices, Inc. [AMD] FCH LPC Bridge X570 (rev 51)\n");
    const QString cpu = QStringLiteral("AMD Ryzen 7 5800X 8-Core Processor");

    QCOMPARE(QString::fromStdString(
                 pctoolkit::detectChipset(QStringLiteral("MAG B550 TOMAHAWK"), lspci, cpu)),
             QStringLiteral("AMD B550"));
    QCOMPARE(QString::fromStdString(
                 pctoolkit::detectChipset(QStringLiteral("Custom Board"), lspci, cpu)),
             QStringLiteral("AMD X570"));
    QCOMPARE(QString::fromStdString(pctoolkit::detectChipset(QString(), QString(), cpu)),
             QStringLiteral("AMD 500 Series (Estimated)"));
    QCOMPARE(QString::fromStdString(pctoolkit::detectChipset(QString(), QString(), QString())),
             QStringLiteral("Unknown"));
}

void MotherboardProbeTests::testReadMotherboardInfo()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString dmi = QStringLiteral("/sys/class/dmi/id/");
    writeFile(dir.path(), dmi + "board_name", "MAG B550 TOMAHAWK (MS-7C91)\n");
    writeFile(dir.path(), dmi + "board_vendor", "Micro-Star International Co., Ltd.\n");
    writeFile(dir.path(), dmi + "board_version", "1.0\n");
    writeFile(dir.path(), dmi + "bios_version", "A.G0\n");
    writeFile(dir.path(), dmi + "bios_vendor", "American Megatrends International, LLC.\n");
    writeFile(dir.path(), dmi + "bios_date", "03/22/2024\n");
    writeFile(dir.path(), dmi + "product_name", "To be filled by O.E.M.\n");

    const pctoolkit::MotherboardInfo info =
        pctoolkit::readMotherboardInfo(dir.path(), QStringLiteral("AMD Ryzen 7 5800X"));
    QCOMPARE(QString::fromStdString(info.product), QStringLiteral("MAG B550 TOMAHAWK (MS-7C91)"));
    QCOMPARE(QString::fromStdString(info.manufacturer),
             QStringLiteral("Micro-Star International Co., Ltd."));
    QCOMPARE(QString::fromStdString(info.version), QStringLiteral("1.0"));
    QCOMPARE(QString::fromStdString(info.biosVersion), QStringLiteral("A.G0"));
    QCOMPARE(QString::fromStdString(info.biosDate), QStringLiteral("03/22/2024"));
    QCOMPARE(QString::fromStdString(info.systemModel), QStringLiteral("Unknown"));
    QCOMPARE(QString::fromStdString(info.chipset), QStringLiteral("AMD B550"));
    // dmidecode is not consulted for a copied tree.
    QCOMPARE(QString::fromStdString(info.memorySlots), QStringLiteral("Unknown"));
    QCOMPARE(QString::fromStdString(info.memorySlotsUsed), QStringLiteral("Unknown"));

    QTemporaryDir empty;
    const auto unknown = pctoolkit::readMotherboardInfo(empty.path(), QString());
    QCOMPARE(QString::fromStdString(unknown.product), QStringLiteral("Unknown"));
    QCOMPARE(QString::fromStdString(unknown.chipset), QStringLiteral("Unknown"));
}

QTEST_MAIN(MotherboardProbeTests)
#include "test_motherboard_probe.moc"
