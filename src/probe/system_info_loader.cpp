#include "probe/system_info_loader.hpp"

#include <exception>
#include <functional>
#include <utility>

#include <QDeadlineTimer>
#include <QFuture>
#include <QMutexLocker>
#include <QtConcurrent/QtConcurrent>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "probe/cpu_probe.hpp"
#include "probe/gpu_probe.hpp"
#include "probe/memory_probe.hpp"
#include "probe/monitor_probe.hpp"
#include "probe/motherboard_probe.hpp"
#include "probe/os_probe.hpp"
#include "probe/snapshot_builder.hpp"
#include "probe/storage_probe.hpp"
#include "store/toolkit_store.hpp"

namespace pctoolkit {

namespace {

constexpr int kMaxStaticThreads = 4;
constexpr int kFuturePollMs = 20;

CpuInfo cpuErrorInfo()
{
    CpuInfo info;
    info.name = "Error";
    info.cores = "Error";
    return info;
}

MonitorInfo monitorErrorInfo()
{
    MonitorInfo info;
    info.monitors = {"Error detecting monitors"};
    info.count = 0;
    return info;
}

MotherboardInfo motherboardErrorInfo()
{
    MotherboardInfo info;
    info.product = "Error";
    info.manufacturer = "Error";
    info.version = "Error";
    info.chipset = "Error";
    info.biosVersion = "Error";
    info.biosManufacturer = "Error";
    info.biosDate = "Error";
    info.systemModel = "Error";
    info.memorySlots = "Error";
    info.maxMemoryCapacity = "Error";
    info.memorySlotsUsed = "Error";
    return info;
}

OsInfo osErrorInfo()
{
    OsInfo info;
    info.deviceName = "Error";
    info.edition = "Error";
    return info;
}

void logStaticFailure(const QString &section, const QString &reason, const std::string &detail)
{
    PTLOG_WARN(QStringLiteral("SystemInfoLoader"),
               QStringLiteral("loadStaticInfo"),
               QStringLiteral("static_section_failed"),
               reason,
               QStringLiteral("error_payload"),
               pctoolkit::logging::defaultWho(),
               pctoolkit::logging::currentCorrelationId(),
               (nlohmann::json{{"section", section.toStdString()},
                               {"detail", detail}}));
}

// Waits for a static task until the deadline or a stop request. Late or
// failed tasks resolve to the error payload.
template <typename T>
T collectStaticResult(QFuture<T> future,
                      const QDeadlineTimer &deadline,
                      const std::atomic<bool> &stopRequested,
                      const QString &section,
                      T errorPayload)
{
    while (!future.isFinished() && !deadline.hasExpired() && !stopRequested.load()) {
        QThread::msleep(kFuturePollMs);
    }
    if (!future.isFinished()) {
        logStaticFailure(section,
                         stopRequested.load() ? QStringLiteral("stop_requested")
                                              : QStringLiteral("deadline_exceeded"),
                         std::string());
        return errorPayload;
    }
    try {
        return future.result();
    } catch (const std::exception &ex) {
        logStaticFailure(section, QStringLiteral("probe_exception"), ex.what());
        return errorPayload;
    }
}

} // namespace

void registerProbeMetaTypes()
{
    qRegisterMetaType<pctoolkit::CpuInfo>();
    qRegisterMetaType<pctoolkit::CpuDynamicInfo>();
    qRegisterMetaType<pctoolkit::MemoryInfo>();
    qRegisterMetaType<pctoolkit::DiskInfo>();
    qRegisterMetaType<pctoolkit::StorageOverview>();
    qRegisterMetaType<pctoolkit::GpuInfo>();
    qRegisterMetaType<pctoolkit::MonitorInfo>();
    qRegisterMetaType<pctoolkit::MotherboardInfo>();
    qRegisterMetaType<pctoolkit::OsInfo>();
    qRegisterMetaType<pctoolkit::CleanupRun>();
}

SystemInfoLoader::SystemInfoLoader(const QString &root, QObject *parent)
    : QThread(parent)
    , m_root(root)
    , m_osProbe(std::make_shared<OsProbe>(root))
    , m_gpuProbe(std::make_unique<GpuProbe>(root))
    , m_cpuSampler(std::make_unique<CpuUsageSampler>(root))
{
    registerProbeMetaTypes();
    m_staticPool.setMaxThreadCount(kMaxStaticThreads);
}

SystemInfoLoader::~SystemInfoLoader()
{
    stop();
    m_staticPool.waitForDone();
}

void SystemInfoLoader::setPrimaryScreenName(const QString &name)
{
    m_primaryScreenName = name;
}

void SystemInfoLoader::setRefreshIntervalMs(int intervalMs)
{
    m_refreshIntervalMs = qMax(intervalMs, kMinRefreshIntervalMs);
}

void SystemInfoLoader::setStaticTaskTimeoutMs(int timeoutMs)
{
    m_staticTaskTimeoutMs = timeoutMs;
}

void SystemInfoLoader::setParallelStaticLoad(bool enabled)
{
    m_parallelStaticLoad = enabled;
}

void SystemInfoLoader::setStaticProbes(StaticProbes probes)
{
    m_staticProbes = std::move(probes);
}

void SystemInfoLoader::setStore(ToolkitStore *store)
{
    m_store = store;
}

void SystemInfoLoader::stop()
{
    m_stopRequested.store(true);
    {
        QMutexLocker locker(&m_sleepMutex);
        m_wakeRequested = true;
        m_wakeCondition.wakeAll();
    }
    if (isRunning()) {
        wait();
    }
}

void SystemInfoLoader::requestRefresh()
{
    QMutexLocker locker(&m_sleepMutex);
    m_wakeRequested = true;
    m_wakeCondition.wakeAll();
}

void SystemInfoLoader::clearCache()
{
    m_staticReloadRequested.store(true);
    requestRefresh();
}

SystemInfo SystemInfoLoader::latestSnapshot() const
{
    QMutexLocker locker(&m_snapshotMutex);
    return m_snapshot;
}

void SystemInfoLoader::run()
{
    pctoolkit::logging::CorrelationScope scope(pctoolkit::logging::newCorrelationId());
    PTLOG_INFO(QStringLiteral("SystemInfoLoader"),
               QStringLiteral("run"),
               QStringLiteral("loader_started"),
               QStringLiteral("window_opened"),
               QStringLiteral("QThread"),
               pctoolkit::logging::defaultWho(),
               pctoolkit::logging::currentCorrelationId(),
               (nlohmann::json{{"refreshIntervalMs", m_refreshIntervalMs},
                               {"parallel", m_parallelStaticLoad}}));

    // Primes the usage counters so the first dynamic cycle has a baseline.
    m_cpuSampler->sample();

    while (!m_stopRequested.load()) {
        int sleepMs = m_refreshIntervalMs;
        try {
            if (m_staticReloadRequested.exchange(false)) {
                loadStaticInfo();
            }
            if (m_stopRequested.load()) {
                break;
            }
            runDynamicCycle();
            if (m_profilePending.exchange(false)) {
                saveHardwareProfile();
            }
        } catch (const std::exception &ex) {
            PTLOG_WARN(QStringLiteral("SystemInfoLoader"),
                       QStringLiteral("run"),
                       QStringLiteral("cycle_failed"),
                       QStringLiteral("exception"),
                       QStringLiteral("retry_after_delay"),
                       pctoolkit::logging::defaultWho(),
                       pctoolkit::logging::currentCorrelationId(),
                       (nlohmann::json{{"error", ex.what()}}));
            sleepMs = kErrorRetryIntervalMs;
        }
        if (!sleepFor(sleepMs)) {
            break;
        }
    }

    PTLOG_INFO(QStringLiteral("SystemInfoLoader"),
               QStringLiteral("run"),
               QStringLiteral("loader_stopped"),
               QStringLiteral("stop_requested"),
               QStringLiteral("QThread"),
               pctoolkit::logging::defaultWho(),
               pctoolkit::logging::currentCorrelationId(),
               nlohmann::json::object());
}

void SystemInfoLoader::loadStaticInfo()
{
    m_cpuInfo.reset();
    m_monitorInfo.reset();
    m_motherboardInfo.reset();
    m_osInfo.reset();
    m_ramDetails.reset();
    m_osProbe->clearCache();
    m_gpuProbe->invalidate();

    const StaticProbes probes = effectiveStaticProbes();
    if (m_parallelStaticLoad) {
        try {
            loadStaticInfoParallel(probes);
        } catch (const std::exception &ex) {
            PTLOG_WARN(QStringLiteral("SystemInfoLoader"),
                       QStringLiteral("loadStaticInfo"),
                       QStringLiteral("parallel_load_failed"),
                       QStringLiteral("exception"),
                       QStringLiteral("sequential_fallback"),
                       pctoolkit::logging::defaultWho(),
                       pctoolkit::logging::currentCorrelationId(),
                       (nlohmann::json{{"error", ex.what()}}));
            loadStaticInfoSequential(probes);
        }
    } else {
        loadStaticInfoSequential(probes);
    }

    if (m_stopRequested.load()) {
        return;
    }
    publishStaticInfo();
    m_profilePending.store(true);
}

SystemInfoLoader::StaticProbes SystemInfoLoader::effectiveStaticProbes() const
{
    const QString root = m_root;
    const QString primaryScreen = m_primaryScreenName;
    std::shared_ptr<OsProbe> osProbe = m_osProbe;

    StaticProbes probes = m_staticProbes;
    if (!probes.cpu) {
        probes.cpu = [root]() { return readCpuInfo(root); };
    }
    if (!probes.monitors) {
        probes.monitors = [root, primaryScreen]() {
            return readMonitorInfo(root, primaryScreen);
        };
    }
    if (!probes.motherboard) {
        // The chipset estimate needs the CPU name; reading /proc/cpuinfo
        // here keeps the tasks independent.
        probes.motherboard = [root]() {
            const CpuInfo cpu = readCpuInfo(root);
            return readMotherboardInfo(root, QString::fromStdString(cpu.name));
        };
    }
    if (!probes.os) {
        probes.os = [osProbe]() { return osProbe->read(); };
    }
    return probes;
}

void SystemInfoLoader::loadStaticInfoParallel(const StaticProbes &probes)
{
    QFuture<CpuInfo> cpuFuture = QtConcurrent::run(&m_staticPool, probes.cpu);
    QFuture<MonitorInfo> monitorFuture = QtConcurrent::run(&m_staticPool, probes.monitors);
    QFuture<MotherboardInfo> boardFuture = QtConcurrent::run(&m_staticPool, probes.motherboard);
    QFuture<OsInfo> osFuture = QtConcurrent::run(&m_staticPool, probes.os);

    const QDeadlineTimer deadline(m_staticTaskTimeoutMs);
    m_cpuInfo = collectStaticResult(cpuFuture, deadline, m_stopRequested,
                                    QStringLiteral("cpu"), cpuErrorInfo());
    m_monitorInfo = collectStaticResult(monitorFuture, deadline, m_stopRequested,
                                        QStringLiteral("monitors"), monitorErrorInfo());
    m_motherboardInfo = collectStaticResult(boardFuture, deadline, m_stopRequested,
                                            QStringLiteral("motherboard"),
                                            motherboardErrorInfo());
    m_osInfo = collectStaticResult(osFuture, deadline, m_stopRequested,
                                   QStringLiteral("os"), osErrorInfo());
}

void SystemInfoLoader::loadStaticInfoSequential(const StaticProbes &probes)
{
    const auto guarded = [](const QString &section, const auto &load, auto errorPayload) {
        try {
            return load();
        } catch (const std::exception &ex) {
            logStaticFailure(section, QStringLiteral("probe_exception"), ex.what());
            return errorPayload;
        }
    };

    m_cpuInfo = guarded(QStringLiteral("cpu"), probes.cpu, cpuErrorInfo());
    m_monitorInfo = guarded(QStringLiteral("monitors"), probes.monitors, monitorErrorInfo());
    m_motherboardInfo =
        guarded(QStringLiteral("motherboard"), probes.motherboard, motherboardErrorInfo());
    m_osInfo = guarded(QStringLiteral("os"), probes.os, osErrorInfo());
}

void SystemInfoLoader::publishStaticInfo()
{
    {
        QMutexLocker locker(&m_snapshotMutex);
        m_snapshot.cpu = *m_cpuInfo;
        m_snapshot.monitors = *m_monitorInfo;
        m_snapshot.motherboard = *m_motherboardInfo;
        m_snapshot.os = *m_osInfo;
    }

    emit cpuInfoUpdated(*m_cpuInfo);
    emit monitorInfoUpdated(*m_monitorInfo);
    emit motherboardInfoUpdated(*m_motherboardInfo);
    emit osInfoUpdated(*m_osInfo);
    emit staticInfoLoaded();

    PTLOG_DEBUG(QStringLiteral("SystemInfoLoader"),
                QStringLiteral("publishStaticInfo"),
                QStringLiteral("static_info_loaded"),
                QStringLiteral("cache_miss"),
                m_parallelStaticLoad ? QStringLiteral("QtConcurrent")
                                     : QStringLiteral("sequential"),
                pctoolkit::logging::defaultWho(),
                pctoolkit::logging::currentCorrelationId(),
                (nlohmann::json{{"cpu", m_cpuInfo->name},
                                {"monitors", m_monitorInfo->count},
                                {"chipset", m_motherboardInfo->chipset}}));
}

void SystemInfoLoader::runDynamicCycle()
{
    const std::string uptime = readUptime(m_root);
    emit uptimeUpdated(QString::fromStdString(uptime));

    CpuDynamicInfo cpuDynamic;
    cpuDynamic.usagePercent = m_cpuSampler->sample();
    cpuDynamic.currentSpeed = readCurrentSpeed(m_root);
    emit cpuDynamicUpdated(cpuDynamic);

    if (!m_ramDetails) {
        m_ramDetails = readRamDetails(m_root);
    }
    MemoryInfo memory = readMemoryUsage(m_root);
    memory.details = *m_ramDetails;
    emit memoryInfoUpdated(memory);

    const DiskInfo disk = readRootDiskInfo(m_root);
    emit diskInfoUpdated(disk);

    const StorageOverview storage = readStorageOverview(m_root);
    emit storageOverviewUpdated(storage);

    const GpuInfo gpu = m_gpuProbe->read();
    emit gpuInfoUpdated(gpu);

    QMutexLocker locker(&m_snapshotMutex);
    m_snapshot.timestamp = std::chrono::system_clock::now();
    m_snapshot.uptime = uptime;
    m_snapshot.cpuDynamic = cpuDynamic;
    m_snapshot.memory = memory;
    m_snapshot.disk = disk;
    m_snapshot.storage = storage;
    m_snapshot.gpu = gpu;
}

void SystemInfoLoader::saveHardwareProfile()
{
    if (!m_store) {
        return;
    }
    try {
        const bool written = m_store->saveHardwareProfile(hardwareProfileJson(latestSnapshot()));
        if (written) {
            PTLOG_INFO(QStringLiteral("SystemInfoLoader"),
                       QStringLiteral("saveHardwareProfile"),
                       QStringLiteral("hardware_profile_changed"),
                       QStringLiteral("fingerprint_differs"),
                       QStringLiteral("sqlite_insert"),
                       pctoolkit::logging::defaultWho(),
                       pctoolkit::logging::currentCorrelationId(),
                       nlohmann::json::object());
        }
    } catch (const std::exception &ex) {
        PTLOG_WARN(QStringLiteral("SystemInfoLoader"),
                   QStringLiteral("saveHardwareProfile"),
                   QStringLiteral("profile_save_failed"),
                   QStringLiteral("store_error"),
                   QStringLiteral("skip"),
                   pctoolkit::logging::defaultWho(),
                   pctoolkit::logging::currentCorrelationId(),
                   (nlohmann::json{{"error", ex.what()}}));
    }
}

bool SystemInfoLoader::sleepFor(int intervalMs)
{
    QMutexLocker locker(&m_sleepMutex);
    if (!m_wakeRequested && !m_stopRequested.load()) {
        m_wakeCondition.wait(&m_sleepMutex, QDeadlineTimer(intervalMs));
    }
    m_wakeRequested = false;
    return !m_stopRequested.load();
}

} // namespace pctoolkit
