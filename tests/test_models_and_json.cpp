#include <QtTest/QtTest>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"

class ModelsJsonTests : public QObject
{
    Q_OBJECT
private slots:
    void testStorageTypeStrings();
    void testCleanupKindStrings();
    void testSystemInfoRoundTrip();
    void testCleanupRunRoundTrip();
    void testCleanupTotalsJson();
    void testMissingFieldsDefaults();
    void testIso8601Parsing();

private:
    static qint64 toSeconds(std::chrono::system_clock::time_point t)
    {
        return std::chrono::duration_cast<std::chrono::seconds>(
            t.time_since_epoch()).count();
    }
};

void ModelsJsonTests::testStorageTypeStrings()
{
    QCOMPARE(QString::fromStdString(pctoolkit::toStorageTypeString(pctoolkit::StorageType::NvmeSsd)),
             QStringLiteral("NVMe SSD"));
    QCOMPARE(QString::fromStdString(pctoolkit::toStorageTypeString(pctoolkit::StorageType::Hdd)),
             QStringLiteral("HDD"));
    QCOMPARE(pctoolkit::parseStorageTypeString("SSD"), pctoolkit::StorageType::Ssd);
    QCOMPARE(pctoolkit::parseStorageTypeString("floppy"), pctoolkit::StorageType::Unknown);

    const nlohmann::json notAString = 5;
    QCOMPARE(notAString.get<pctoolkit::StorageType>(), pctoolkit::StorageType::Unknown);
}

void ModelsJsonTests::testCleanupKindStrings()
{
    QCOMPARE(QString::fromStdString(pctoolkit::toCleanupKindString(pctoolkit::CleanupKind::DiskCleanup)),
             QStringLiteral("disk_cleanup"));
    QCOMPARE(pctoolkit::parseCleanupKindString("memory"), pctoolkit::CleanupKind::Memory);
    QCOMPARE(pctoolkit::parseCleanupKindString("trash"), pctoolkit::CleanupKind::Trash);
    QCOMPARE(pctoolkit::parseCleanupKindString("bogus"), pctoolkit::CleanupKind::TempFiles);
}

void ModelsJsonTests::testSystemInfoRoundTrip()
{
    pctoolkit::SystemInfo info;
    info.timestamp = std::chrono::system_clock::now();
    info.uptime = "2 days, 01:02:03";
    info.cpu.name = "AMD Ryzen 7 5800X 8-Core Processor";
    info.cpu.cores = "8 Cores / 16 Threads";
    info.cpu.physicalCores = 8;
    info.cpu.logicalCores = 16;
    info.cpuDynamic.usagePercent = 12.5;
    info.memory.totalBytes = 16ULL * 1024 * 1024 * 1024;
    info.memory.details.ramType = "DDR4";
    info.disk.storageType = pctoolkit::StorageType::NvmeSsd;
    info.storage.drives.push_back({"Storage 1", "Samsung SSD 980", "nvme0n1",
                                   500107862016ULL, pctoolkit::StorageType::NvmeSsd});
    info.storage.totalBytes = 500107862016ULL;
    info.gpu.available = true;
    info.gpu.name = "NVIDIA GeForce RTX 3070";
    info.gpu.source = "nvidia-smi";
    info.monitors.monitors = {"DP-1: Dell U2720Q 3840x2160 @ 60Hz (Primary)"};
    info.monitors.count = 1;
    info.motherboard.product = "B550 AORUS ELITE";
    info.os.edition = "Arch Linux";

    nlohmann::json j = info;
    const auto parsed = j.get<pctoolkit::SystemInfo>();

    QCOMPARE(toSeconds(parsed.timestamp), toSeconds(info.timestamp));
    QCOMPARE(QString::fromStdString(parsed.uptime), QStringLiteral("2 days, 01:02:03"));
    QCOMPARE(parsed.cpu.logicalCores, 16);
    QCOMPARE(parsed.cpuDynamic.usagePercent, 12.5);
    QCOMPARE(parsed.memory.totalBytes, info.memory.totalBytes);
    QCOMPARE(QString::fromStdString(parsed.memory.details.ramType), QStringLiteral("DDR4"));
    QCOMPARE(parsed.disk.storageType, pctoolkit::StorageType::NvmeSsd);
    QCOMPARE(parsed.storage.drives.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(parsed.storage.drives.front().device), QStringLiteral("nvme0n1"));
    QCOMPARE(parsed.storage.drives.front().type, pctoolkit::StorageType::NvmeSsd);
    QVERIFY(parsed.gpu.available);
    QCOMPARE(QString::fromStdString(parsed.gpu.source), QStringLiteral("nvidia-smi"));
    QCOMPARE(parsed.monitors.count, 1);
    QCOMPARE(QString::fromStdString(parsed.motherboard.product), QStringLiteral("B550 AORUS ELITE"));
    QCOMPARE(QString::fromStdString(parsed.os.edition), QStringLiteral("Arch Linux"));
}

void ModelsJsonTests::testCleanupRunRoundTrip()
{
    pctoolkit::CleanupRun run;
    run.id = "run-1";
    run.timestamp = std::chrono::system_clock::now();
    run.kind = pctoolkit::CleanupKind::Memory;
    run.itemsRemoved = 0;
    run.bytesFreed = -4096;
    run.success = false;
    run.summary = "❌ Memory Optimization Failed";
    run.details = nlohmann::json{{"privileged", false}};

    nlohmann::json j = run;
    QCOMPARE(QString::fromStdString(j.value("kind", "")), QStringLiteral("memory"));

    const auto parsed = j.get<pctoolkit::CleanupRun>();
    QCOMPARE(QString::fromStdString(parsed.id), QStringLiteral("run-1"));
    QCOMPARE(parsed.kind, pctoolkit::CleanupKind::Memory);
    QCOMPARE(parsed.bytesFreed, static_cast<std::int64_t>(-4096));
    QVERIFY(!parsed.success);
    QCOMPARE(QString::fromStdString(parsed.summary), QStringLiteral("❌ Memory Optimization Failed"));
    QCOMPARE(parsed.details.value("privileged", true), false);
    QCOMPARE(toSeconds(parsed.timestamp), toSeconds(run.timestamp));
}

void ModelsJsonTests::testCleanupTotalsJson()
{
    pctoolkit::CleanupTotals totals;
    totals.kind = pctoolkit::CleanupKind::Trash;
    totals.runs = 3;
    totals.itemsRemoved = 42;
    totals.bytesFreed = 1024;

    const nlohmann::json j = totals;
    QCOMPARE(QString::fromStdString(j.value("kind", "")), QStringLiteral("trash"));
    QCOMPARE(j.value("runs", 0), 3);
    QCOMPARE(j.value("itemsRemoved", 0), 42);
    QCOMPARE(j.value("bytesFreed", 0), 1024);
}

void ModelsJsonTests::testMissingFieldsDefaults()
{
    const auto info = nlohmann::json::object().get<pctoolkit::SystemInfo>();
    QCOMPARE(QString::fromStdString(info.uptime), QStringLiteral("Unknown"));
    QCOMPARE(QString::fromStdString(info.cpu.name), QStringLiteral("Unknown"));
    QCOMPARE(QString::fromStdString(info.gpu.name), QStringLiteral("No GPU detected"));
    QCOMPARE(QString::fromStdString(info.disk.mountPoint), QStringLiteral("/"));
    QVERIFY(info.storage.drives.empty());
    QCOMPARE(info.monitors.count, 0);

    const auto run = nlohmann::json{{"id", "x"}}.get<pctoolkit::CleanupRun>();
    QCOMPARE(run.kind, pctoolkit::CleanupKind::TempFiles);
    QVERIFY(run.success);
    QVERIFY(run.details.is_object());
}

void ModelsJsonTests::testIso8601Parsing()
{
    const auto parsed = pctoolkit::fromIso8601Utc("2024-03-01T12:30:00Z");
    QCOMPARE(QString::fromStdString(pctoolkit::toIso8601Utc(parsed)),
             QStringLiteral("2024-03-01T12:30:00Z"));
    QCOMPARE(toSeconds(pctoolkit::fromIso8601Utc("not a date")), qint64(0));
}

QTEST_MAIN(ModelsJsonTests)
#include "test_models_and_json.moc"
