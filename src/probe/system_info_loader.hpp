#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>

#include <QMutex>
#include <QString>
#include <QThread>
#include <QThreadPool>
#include <QWaitCondition>

#include "common/models.hpp"
#include "common/settings.hpp"

namespace pctoolkit {

class CpuUsageSampler;
class GpuProbe;
class OsProbe;
class ToolkitStore;

// Registers the probe result types for queued signal delivery. Safe to call
// more than once.
void registerProbeMetaTypes();

/**
 * SystemInfoLoader keeps the information window current:
 * - static sections (CPU, monitors, motherboard, OS) are loaded once in
 *   parallel and cached until clearCache()
 * - dynamic sections are re-read every refresh interval
 *
 * Results leave the thread only through signals and latestSnapshot().
 */
class SystemInfoLoader : public QThread
{
    Q_OBJECT
public:
    // Readers for the static sections. Empty members use the probes for the
    // loader's root.
    struct StaticProbes {
        std::function<CpuInfo()> cpu;
        std::function<MonitorInfo()> monitors;
        std::function<MotherboardInfo()> motherboard;
        std::function<OsInfo()> os;
    };

    explicit SystemInfoLoader(const QString &root = QString(), QObject *parent = nullptr);
    ~SystemInfoLoader() override;

    void setPrimaryScreenName(const QString &name);
    void setRefreshIntervalMs(int intervalMs);
    void setStaticTaskTimeoutMs(int timeoutMs);
    void setParallelStaticLoad(bool enabled);
    void setStaticProbes(StaticProbes probes);
    // Not owned; must outlive the loader thread.
    void setStore(ToolkitStore *store);

    // Ends the loop and waits for the thread.
    void stop();
    // Wakes the loop for an immediate cycle.
    void requestRefresh();
    // Drops static caches and the GPU cache, then wakes the loop.
    void clearCache();

    SystemInfo latestSnapshot() const;

signals:
    void uptimeUpdated(const QString &uptime);
    void cpuInfoUpdated(const pctoolkit::CpuInfo &info);
    void cpuDynamicUpdated(const pctoolkit::CpuDynamicInfo &info);
    void memoryInfoUpdated(const pctoolkit::MemoryInfo &info);
    void diskInfoUpdated(const pctoolkit::DiskInfo &info);
    void storageOverviewUpdated(const pctoolkit::StorageOverview &overview);
    void gpuInfoUpdated(const pctoolkit::GpuInfo &info);
    void monitorInfoUpdated(const pctoolkit::MonitorInfo &info);
    void motherboardInfoUpdated(const pctoolkit::MotherboardInfo &info);
    void osInfoUpdated(const pctoolkit::OsInfo &info);
    void staticInfoLoaded();

protected:
    void run() override;

private:
    void loadStaticInfo();
    StaticProbes effectiveStaticProbes() const;
    void loadStaticInfoParallel(const StaticProbes &probes);
    void loadStaticInfoSequential(const StaticProbes &probes);
    void publishStaticInfo();
    void runDynamicCycle();
    void saveHardwareProfile();
    bool sleepFor(int intervalMs);

    QString m_root;
    QString m_primaryScreenName;
    int m_refreshIntervalMs = kDefaultRefreshIntervalMs;
    int m_staticTaskTimeoutMs = 10000;
    bool m_parallelStaticLoad = true;
    ToolkitStore *m_store = nullptr;
    StaticProbes m_staticProbes;

    std::atomic<bool> m_stopRequested{false};
    std::atomic<bool> m_staticReloadRequested{true};
    std::atomic<bool> m_profilePending{false};
    QMutex m_sleepMutex;
    QWaitCondition m_wakeCondition;
    bool m_wakeRequested = false;

    QThreadPool m_staticPool;
    std::shared_ptr<OsProbe> m_osProbe;
    std::unique_ptr<GpuProbe> m_gpuProbe;
    std::unique_ptr<CpuUsageSampler> m_cpuSampler;

    std::optional<CpuInfo> m_cpuInfo;
    std::optional<MonitorInfo> m_monitorInfo;
    std::optional<MotherboardInfo> m_motherboardInfo;
    std::optional<OsInfo> m_osInfo;
    std::optional<RamDetails> m_ramDetails;

    mutable QMutex m_snapshotMutex;
    SystemInfo m_snapshot;
};

} // namespace pctoolkit
