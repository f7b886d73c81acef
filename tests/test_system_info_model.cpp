#include <QtTest/QtTest>

#include <QClipboard>
#include <QGuiApplication>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "ui/backend/SystemInfoModel.hpp"

namespace {

constexpr std::uint64_t kGiB = 1024ULL * 1024ULL * 1024ULL;

void feedStaticSections(pctoolkit::SystemInfoModel &model)
{
    pctoolkit::CpuInfo cpu;
    cpu.name = "Intel(R) Core(TM) i5-12400";
    cpu.frequency = "2.50 GHz";
    model.setCpuInfo(cpu);

    pctoolkit::MonitorInfo monitors;
    monitors.monitors = {"DEL4321 | DELL U2720Q | 3840x2160 @ 60Hz (Primary)"};
    monitors.count = 1;
    model.setMonitorInfo(monitors);

    pctoolkit::MotherboardInfo board;
    board.product = "PRIME B660M-A";
    board.chipset = "Intel B660";
    model.setMotherboardInfo(board);

    pctoolkit::OsInfo os;
    os.edition = "Fedora Linux 40";
    model.setOsInfo(os);
}

} // namespace

class SystemInfoModelTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void testCpuAndMemoryMaps();
    void testStorageAndMonitorRows();
    void testGpuMapWithoutGpu();
    void testCopyEnabledAfterStaticSections();
    void testRefreshCancelsPendingEnable();
    void testCopySystemInfo();

private:
    QTemporaryDir m_home;
};

void SystemInfoModelTests::initTestCase()
{
    QVERIFY(m_home.isValid());
    qputenv("HOME", m_home.path().toUtf8());
}

void SystemInfoModelTests::testCpuAndMemoryMaps()
{
    pctoolkit::SystemInfoModel model(nullptr);
    QSignalSpy cpuSpy(&model, &pctoolkit::SystemInfoModel::cpuChanged);

    pctoolkit::CpuInfo cpu;
    cpu.name = "Intel(R) Core(TM) i5-12400";
    cpu.cores = "6 cores, 12 threads";
    cpu.frequency = "2.50 GHz";
    model.setCpuInfo(cpu);

    pctoolkit::CpuDynamicInfo dynamic;
    dynamic.usagePercent = 37.34;
    dynamic.currentSpeed = "4.40 GHz";
    model.setCpuDynamic(dynamic);
    QCOMPARE(cpuSpy.count(), 2);

    const QVariantMap cpuMap = model.cpu();
    QCOMPARE(cpuMap.value(QStringLiteral("name")).toString(),
             QStringLiteral("Intel(R) Core(TM) i5-12400"));
    QCOMPARE(cpuMap.value(QStringLiteral("frequency")).toString(),
             QStringLiteral("2.50 GHz (Current: 4.40 GHz)"));
    QCOMPARE(cpuMap.value(QStringLiteral("usage")).toDouble(), 37.34);
    QCOMPARE(cpuMap.value(QStringLiteral("usageText")).toString(), QStringLiteral("37.3%"));

    pctoolkit::MemoryInfo memory;
    memory.totalBytes = 32 * kGiB;
    memory.usedBytes = 8 * kGiB;
    memory.availableBytes = 24 * kGiB;
    memory.percent = 25.0;
    memory.details.ramType = "DDR5";
    model.setMemoryInfo(memory);

    const QVariantMap memoryMap = model.memory();
    QCOMPARE(memoryMap.value(QStringLiteral("total")).toString(), QStringLiteral("32.0 GB"));
    QCOMPARE(memoryMap.value(QStringLiteral("used")).toString(), QStringLiteral("8.0 GB"));
    QCOMPARE(memoryMap.value(QStringLiteral("percentText")).toString(), QStringLiteral("25.0%"));
    QCOMPARE(memoryMap.value(QStringLiteral("ramType")).toString(), QStringLiteral("DDR5"));
    QCOMPARE(memoryMap.value(QStringLiteral("ramName")).toString(), QStringLiteral("Unknown"));

    model.setUptime(QStringLiteral("2 days, 03:04:05"));
    QCOMPARE(model.uptime(), QStringLiteral("2 days, 03:04:05"));
}

void SystemInfoModelTests::testStorageAndMonitorRows()
{
    pctoolkit::SystemInfoModel model(nullptr);

    pctoolkit::StorageDevice device;
    device.label = "Storage 1";
    device.name = "WDC WD10EZEX";
    device.sizeBytes = 1000204886016ULL;
    device.type = pctoolkit::StorageType::Hdd;
    pctoolkit::StorageOverview overview;
    overview.drives = {device};
    overview.totalBytes = device.sizeBytes;
    model.setStorageOverview(overview);

    const QVariantMap storage = model.storage();
    QCOMPARE(storage.value(QStringLiteral("count")).toInt(), 1);
    QCOMPARE(storage.value(QStringLiteral("total")).toString(), QStringLiteral("931.5 GB"));
    const QVariantList devices = storage.value(QStringLiteral("devices")).toList();
    QCOMPARE(devices.size(), 1);
    QCOMPARE(devices.first().toMap().value(QStringLiteral("text")).toString(),
             QStringLiteral("WDC WD10EZEX | 931.5 GB | HDD"));

    pctoolkit::MonitorInfo monitors;
    monitors.monitors = {"GSM5B7F | LG ULTRAGEAR | 2560x1440 @ 144Hz (Primary)",
                         "Unknown | Unknown | 1920x1080 @ 60Hz"};
    monitors.count = 2;
    model.setMonitorInfo(monitors);

    const QVariantList rows = model.monitors().value(QStringLiteral("monitors")).toList();
    QCOMPARE(rows.size(), 2);
    QCOMPARE(rows.at(1).toMap().value(QStringLiteral("label")).toString(),
             QStringLiteral("Monitor 2"));
    QCOMPARE(model.monitors().value(QStringLiteral("count")).toInt(), 2);
}

void SystemInfoModelTests::testGpuMapWithoutGpu()
{
    pctoolkit::SystemInfoModel model(nullptr);
    pctoolkit::GpuInfo gpu;
    gpu.usagePercent = 12.0;
    model.setGpuInfo(gpu);

    const QVariantMap map = model.gpu();
    QCOMPARE(map.value(QStringLiteral("available")).toBool(), false);
    QCOMPARE(map.value(QStringLiteral("name")).toString(), QStringLiteral("No GPU detected"));
    QCOMPARE(map.value(QStringLiteral("usage")).toDouble(), 0.0);
    QCOMPARE(map.value(QStringLiteral("usageText")).toString(), QStringLiteral("0%"));
    QCOMPARE(map.value(QStringLiteral("memory")).toString(), QStringLiteral("N/A"));
    QCOMPARE(map.value(QStringLiteral("temperature")).toString(), QStringLiteral("N/A"));
}

void SystemInfoModelTests::testCopyEnabledAfterStaticSections()
{
    pctoolkit::SystemInfoModel model(nullptr);
    QSignalSpy enabledSpy(&model, &pctoolkit::SystemInfoModel::copyEnabledChanged);
    QVERIFY(!model.copyEnabled());

    // Dynamic sections alone never enable copying.
    model.setUptime(QStringLiteral("00:10:00"));
    model.setGpuInfo(pctoolkit::GpuInfo());
    QTest::qWait(100);
    QVERIFY(!model.copyEnabled());

    feedStaticSections(model);
    QVERIFY(!model.copyEnabled());
    QTRY_VERIFY_WITH_TIMEOUT(model.copyEnabled(),
                             pctoolkit::SystemInfoModel::kCopyEnableDelayMs + 2000);
    QCOMPARE(enabledSpy.count(), 1);

    // A second static delivery keeps copying enabled without re-arming.
    model.setOsInfo(pctoolkit::OsInfo());
    QVERIFY(model.copyEnabled());
    QCOMPARE(enabledSpy.count(), 1);
}

void SystemInfoModelTests::testRefreshCancelsPendingEnable()
{
    pctoolkit::SystemInfoModel model(nullptr);
    feedStaticSections(model);
    model.refresh();

    QTest::qWait(pctoolkit::SystemInfoModel::kCopyEnableDelayMs + 500);
    QVERIFY(!model.copyEnabled());

    feedStaticSections(model);
    QTRY_VERIFY_WITH_TIMEOUT(model.copyEnabled(),
                             pctoolkit::SystemInfoModel::kCopyEnableDelayMs + 2000);

    model.refresh();
    QVERIFY(!model.copyEnabled());
}

void SystemInfoModelTests::testCopySystemInfo()
{
    pctoolkit::SystemInfoModel model(nullptr);
    feedStaticSections(model);

    const QString report = model.reportText();
    QVERIFY(report.contains(QStringLiteral("Processor: Intel(R) Core(TM) i5-12400\n")));
    QVERIFY(report.contains(QStringLiteral("Chipset: Intel B660\n")));
    QVERIFY(report.contains(
        QStringLiteral("Monitor 1: DEL4321 | DELL U2720Q | 3840x2160 @ 60Hz (Primary)")));

    QSignalSpy feedbackSpy(&model, &pctoolkit::SystemInfoModel::copyFeedbackChanged);
    QVERIFY(model.copySystemInfo());
    QCOMPARE(model.copyFeedback(), QStringLiteral("Copied!"));
    QCOMPARE(QGuiApplication::clipboard()->text(), report);

    QTRY_VERIFY_WITH_TIMEOUT(model.copyFeedback().isEmpty(),
                             pctoolkit::SystemInfoModel::kCopyFeedbackMs + 2000);
    QCOMPARE(feedbackSpy.count(), 2);
}

QTEST_MAIN(SystemInfoModelTests)
#include "test_system_info_model.moc"
