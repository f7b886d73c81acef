#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include "probe/gpu_probe.hpp"

namespace {

void writeFile(const QString &root, const QString &path, const QByteArray &content)
{
    const QString full = root + path;
    QDir().mkpath(QFileInfo(full).absolutePath());
    QFile file(full);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write(content);
}

void addAmdCard(const QString &root)
{
    const QString device = QStringLiteral("/sys/class/drm/card0/device");
    writeFile(root, device + "/gpu_busy_percent", "37\n");
    writeFile(root, device + "/mem_info_vram_total", "17163091968\n");
    writeFile(root, device + "/mem_info_vram_used", "1073741824\n");
    writeFile(root, device + "/vendor", "0x1002\n");
    writeFile(root, device + "/device", "0x73bf\n");
    writeFile(root, device + "/hwmon/hwmon3/temp1_input", "52000\n");
    // Connector directories are not cards.
    writeFile(root, "/sys/class/drm/card0-DP-1/status", "connected\n");
}

} // namespace

class GpuProbeTests : public QObject
{
    Q_OBJECT
private slots:
    void testParseNvidiaSmi();
    void testParseNvidiaSmiRejectsBadOutput();
    void testParseLspciDeviceName();
    void testReadDrmGpu();
    void testNoGpu();
    void testCacheExpiry();
};

void GpuProbeTests::testParseNvidiaSmi()
{
    const auto info = pctoolkit::parseNvidiaSmiOutput(
        QStringLiteral("NVIDIA GeForce RTX 3070, 12, 1024, 8192, 45\n"
                       "NVIDIA GeForce GT 710, 0, 10, 2048, 30\n"));
    QVERIFY(info.has_value());
    QVERIFY(info->available);
    QCOMPARE(QString::fromStdString(info->name), QStringLiteral("NVIDIA GeForce RTX 3070"));
    QCOMPARE(info->usagePercent, 12.0);
    QCOMPARE(info->memoryUsedBytes, std::uint64_t{1024ULL * 1024 * 1024});
    QCOMPARE(info->memoryTotalBytes, std::uint64_t{8192ULL * 1024 * 1024});
    QCOMPARE(info->temperatureC, 45.0);
    QCOMPARE(QString::fromStdString(info->source), QStringLiteral("nvidia-smi"));
}

void GpuProbeTests::testParseNvidiaSmiRejectsBadOutput()
{
    QVERIFY(!pctoolkit::parseNvidiaSmiOutput(QString()).has_value());
    QVERIFY(!pctoolkit::parseNvidiaSmiOutput(QStringLiteral("NVIDIA, 1, 2")).has_value());
    QVERIFY(!pctoolkit::parseNvidiaSmiOutput(
                 QStringLiteral("NVIDIA GeForce RTX 3070, [N/A], 1024, 8192, 45")).has_value());
}

void GpuProbeTests::testParseLspciDeviceName()
{
    QCOMPARE(pctoolkit::parseLspciDeviceName(QStringLiteral(
                 "03:00.0 VGA compatible controller: Advanced Micro Devices, Inc. [AMD/ATI] "
                 "Navi 21 [Radeon RX 6800/6800 XT / 6900 XT] (rev c1)\n")),
             QStringLiteral("Advanced Micro Devices, Inc. [AMD/ATI] "
                            "Navi 21 [Radeon RX 6800/6800 XT / 6900 XT]"));
    QVERIFY(pctoolkit::parseLspciDeviceName(QStringLiteral("garbage")).isEmpty());
}

void GpuProbeTests::testReadDrmGpu()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    addAmdCard(dir.path());

    const auto info = pctoolkit::readDrmGpu(dir.path());
    QVERIFY(info.has_value());
    QVERIFY(info->available);
    QCOMPARE(info->usagePercent, 37.0);
    QCOMPARE(info->memoryTotalBytes, std::uint64_t{17163091968ULL});
    QCOMPARE(info->memoryUsedBytes, std::uint64_t{1073741824ULL});
    QCOMPARE(info->temperatureC, 52.0);
    QCOMPARE(QString::fromStdString(info->name), QStringLiteral("GPU 0x1002:0x73bf"));
    QCOMPARE(QString::fromStdString(info->source), QStringLiteral("drm"));
}

void GpuProbeTests::testNoGpu()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    // A card without busy or VRAM counters does not count.
    writeFile(dir.path(), "/sys/class/drm/card0/device/vendor", "0x8086\n");

    QVERIFY(!pctoolkit::readDrmGpu(dir.path()).has_value());

    pctoolkit::GpuProbe probe(dir.path());
    const pctoolkit::GpuInfo info = probe.read();
    QVERIFY(!info.available);
    QCOMPARE(QString::fromStdString(info.name), QStringLiteral("No GPU detected"));
}

void GpuProbeTests::testCacheExpiry()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    auto now = std::chrono::steady_clock::time_point{} + std::chrono::hours(1);
    pctoolkit::GpuProbe probe(dir.path(), [&now] { return now; });

    QVERIFY(!probe.read().available);

    addAmdCard(dir.path());
    now += std::chrono::seconds(5);
    QVERIFY(!probe.read().available);

    now += std::chrono::seconds(6);
    QVERIFY(probe.read().available);

    QDir(dir.path() + "/sys").removeRecursively();
    probe.invalidate();
    QVERIFY(!probe.read().available);
}

QTEST_MAIN(GpuProbeTests)
#include "test_gpu_probe.moc"
