#include "probe/snapshot_builder.hpp"

#include <QThread>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "probe/cpu_probe.hpp"
#include "probe/gpu_probe.hpp"
#include "probe/memory_probe.hpp"
#include "probe/monitor_probe.hpp"
#include "probe/motherboard_probe.hpp"
#include "probe/os_probe.hpp"
#include "probe/storage_probe.hpp"

namespace pctoolkit {

SystemInfo buildSystemSnapshot(const QString &root,
                               const QString &primaryScreenName,
                               int cpuSampleMs)
{
    SystemInfo info;
    info.timestamp = std::chrono::system_clock::now();

    CpuUsageSampler sampler(root);
    sampler.sample();

    info.cpu = readCpuInfo(root);
    info.monitors = readMonitorInfo(root, primaryScreenName);
    info.motherboard = readMotherboardInfo(root, QString::fromStdString(info.cpu.name));
    OsProbe osProbe(root);
    info.os = osProbe.read();

    info.uptime = readUptime(root);
    info.memory = readMemoryUsage(root);
    info.memory.details = readRamDetails(root);
    info.disk = readRootDiskInfo(root);
    info.storage = readStorageOverview(root);
    GpuProbe gpuProbe(root);
    info.gpu = gpuProbe.read();

    if (cpuSampleMs > 0) {
        QThread::msleep(static_cast<unsigned long>(cpuSampleMs));
    }
    info.cpuDynamic.usagePercent = sampler.sample();
    info.cpuDynamic.currentSpeed = readCurrentSpeed(root);

    PTLOG_INFO(QStringLiteral("SnapshotBuilder"),
               QStringLiteral("buildSystemSnapshot"),
               QStringLiteral("snapshot_built"),
               QStringLiteral("report_request"),
               QStringLiteral("synchronous_probes"),
               pctoolkit::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"drives", info.storage.drives.size()},
                               {"monitors", info.monitors.count},
                               {"gpu", info.gpu.source}}));
    return info;
}

nlohmann::json hardwareProfileJson(const CpuInfo &cpu,
                                   const MotherboardInfo &board,
                                   const MonitorInfo &monitors,
                                   const OsInfo &os,
                                   const RamDetails &ram,
                                   const StorageOverview &storage)
{
    nlohmann::json drives = nlohmann::json::array();
    for (const StorageDevice &device : storage.drives) {
        drives.push_back({{"name", device.name},
                          {"sizeBytes", device.sizeBytes},
                          {"type", device.type}});
    }

    return nlohmann::json{
        {"capturedAt", toIso8601Utc(std::chrono::system_clock::now())},
        {"cpu", {{"name", cpu.name}, {"cores", cpu.cores}, {"sockets", cpu.sockets}}},
        {"motherboard", board},
        {"monitors", monitors.monitors},
        {"os", {{"edition", os.edition}, {"version", os.version}, {"build", os.build}}},
        {"ram", ram},
        {"drives", drives}
    };
}

nlohmann::json hardwareProfileJson(const SystemInfo &info)
{
    return hardwareProfileJson(info.cpu, info.motherboard, info.monitors, info.os,
                               info.memory.details, info.storage);
}

} // namespace pctoolkit
