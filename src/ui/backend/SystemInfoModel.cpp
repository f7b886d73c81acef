#include "ui/backend/SystemInfoModel.hpp"

#include <QClipboard>
#include <QGuiApplication>
#include <QTimer>

#include <nlohmann/json.hpp>

#include "common/format_utils.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "probe/system_info_loader.hpp"
#include "report/system_report.hpp"

namespace pctoolkit {

namespace {

QString qs(const std::string &value)
{
    return QString::fromStdString(value);
}

} // namespace

SystemInfoModel::SystemInfoModel(SystemInfoLoader *loader, QObject *parent)
    : QObject(parent)
    , m_loader(loader)
{
    if (!m_loader) {
        return;
    }
    connect(m_loader, &SystemInfoLoader::uptimeUpdated, this, &SystemInfoModel::setUptime);
    connect(m_loader, &SystemInfoLoader::cpuInfoUpdated, this, &SystemInfoModel::setCpuInfo);
    connect(m_loader, &SystemInfoLoader::cpuDynamicUpdated,
            this, &SystemInfoModel::setCpuDynamic);
    connect(m_loader, &SystemInfoLoader::memoryInfoUpdated,
            this, &SystemInfoModel::setMemoryInfo);
    connect(m_loader, &SystemInfoLoader::diskInfoUpdated, this, &SystemInfoModel::setDiskInfo);
    connect(m_loader, &SystemInfoLoader::storageOverviewUpdated,
            this, &SystemInfoModel::setStorageOverview);
    connect(m_loader, &SystemInfoLoader::gpuInfoUpdated, this, &SystemInfoModel::setGpuInfo);
    connect(m_loader, &SystemInfoLoader::monitorInfoUpdated,
            this, &SystemInfoModel::setMonitorInfo);
    connect(m_loader, &SystemInfoLoader::motherboardInfoUpdated,
            this, &SystemInfoModel::setMotherboardInfo);
    connect(m_loader, &SystemInfoLoader::osInfoUpdated, this, &SystemInfoModel::setOsInfo);
}

QString SystemInfoModel::uptime() const
{
    return qs(m_info.uptime);
}

QVariantMap SystemInfoModel::cpu() const
{
    const CpuInfo &cpu = m_info.cpu;
    return {
        {QStringLiteral("name"), qs(cpu.name)},
        {QStringLiteral("cores"), qs(cpu.cores)},
        {QStringLiteral("frequency"), qs(cpuFrequencyText(cpu, m_info.cpuDynamic))},
        {QStringLiteral("cache"), qs(cpu.cacheDisplay)},
        {QStringLiteral("sockets"), qs(cpu.sockets)},
        {QStringLiteral("usage"), m_info.cpuDynamic.usagePercent},
        {QStringLiteral("usageText"), qs(formatPercent(m_info.cpuDynamic.usagePercent))},
    };
}

QVariantMap SystemInfoModel::memory() const
{
    const MemoryInfo &memory = m_info.memory;
    return {
        {QStringLiteral("total"), qs(formatGigabytes(memory.totalBytes))},
        {QStringLiteral("used"), qs(formatGigabytes(memory.usedBytes))},
        {QStringLiteral("available"), qs(formatGigabytes(memory.availableBytes))},
        {QStringLiteral("percent"), memory.percent},
        {QStringLiteral("percentText"), qs(formatPercent(memory.percent))},
        {QStringLiteral("ramName"), qs(memory.details.ramName)},
        {QStringLiteral("ramType"), qs(memory.details.ramType)},
        {QStringLiteral("ramSpeed"), qs(memory.details.ramSpeed)},
        {QStringLiteral("ramSlots"), qs(memory.details.ramSlots)},
    };
}

QVariantMap SystemInfoModel::disk() const
{
    const DiskInfo &disk = m_info.disk;
    return {
        {QStringLiteral("mountPoint"), qs(disk.mountPoint)},
        {QStringLiteral("storageName"), qs(disk.storageName)},
        {QStringLiteral("storageType"), qs(toStorageTypeString(disk.storageType))},
        {QStringLiteral("total"), qs(diskTotalText(disk))},
        {QStringLiteral("free"), qs(formatGigabytes(disk.freeBytes))},
        {QStringLiteral("percent"), disk.usagePercent},
        {QStringLiteral("percentText"), qs(formatPercent(disk.usagePercent))},
    };
}

QVariantMap SystemInfoModel::storage() const
{
    QVariantList devices;
    for (const StorageDevice &device : m_info.storage.drives) {
        devices.push_back(QVariantMap{
            {QStringLiteral("label"), qs(device.label)},
            {QStringLiteral("text"), qs(storageDeviceText(device))},
        });
    }
    return {
        {QStringLiteral("count"), static_cast<int>(m_info.storage.drives.size())},
        {QStringLiteral("total"), qs(formatGigabytes(m_info.storage.totalBytes))},
        {QStringLiteral("devices"), devices},
    };
}

QVariantMap SystemInfoModel::gpu() const
{
    const GpuInfo &gpu = m_info.gpu;
    return {
        {QStringLiteral("available"), gpu.available},
        {QStringLiteral("name"), qs(gpu.name)},
        {QStringLiteral("usage"), gpu.available ? gpu.usagePercent : 0.0},
        {QStringLiteral("usageText"),
         gpu.available ? qs(formatPercent(gpu.usagePercent)) : QStringLiteral("0%")},
        {QStringLiteral("memory"), qs(gpuMemoryText(gpu))},
        {QStringLiteral("temperature"), qs(gpuTemperatureText(gpu))},
        {QStringLiteral("source"), qs(gpu.source)},
    };
}

QVariantMap SystemInfoModel::monitors() const
{
    QVariantList rows;
    int index = 1;
    for (const std::string &monitor : m_info.monitors.monitors) {
        rows.push_back(QVariantMap{
            {QStringLiteral("label"), QStringLiteral("Monitor %1").arg(index++)},
            {QStringLiteral("text"), qs(monitor)},
        });
    }
    return {
        {QStringLiteral("count"), m_info.monitors.count},
        {QStringLiteral("monitors"), rows},
    };
}

QVariantMap SystemInfoModel::motherboard() const
{
    const MotherboardInfo &board = m_info.motherboard;
    return {
        {QStringLiteral("product"), qs(board.product)},
        {QStringLiteral("manufacturer"), qs(board.manufacturer)},
        {QStringLiteral("version"), qs(board.version)},
        {QStringLiteral("chipset"), qs(board.chipset)},
        {QStringLiteral("biosVersion"), qs(board.biosVersion)},
        {QStringLiteral("biosManufacturer"), qs(board.biosManufacturer)},
        {QStringLiteral("biosDate"), qs(board.biosDate)},
        {QStringLiteral("systemModel"), qs(board.systemModel)},
        {QStringLiteral("memorySlots"), qs(board.memorySlots)},
        {QStringLiteral("maxMemoryCapacity"), qs(board.maxMemoryCapacity)},
        {QStringLiteral("memorySlotsUsed"), qs(board.memorySlotsUsed)},
    };
}

QVariantMap SystemInfoModel::os() const
{
    const OsInfo &os = m_info.os;
    return {
        {QStringLiteral("deviceName"), qs(os.deviceName)},
        {QStringLiteral("userName"), qs(os.userName)},
        {QStringLiteral("edition"), qs(os.edition)},
        {QStringLiteral("version"), qs(os.version)},
        {QStringLiteral("build"), qs(os.build)},
        {QStringLiteral("installDate"), qs(os.installDate)},
        {QStringLiteral("experience"), qs(os.experience)},
        {QStringLiteral("arch"), qs(os.arch)},
    };
}

bool SystemInfoModel::copyEnabled() const
{
    return m_copyEnabled;
}

QString SystemInfoModel::copyFeedback() const
{
    return m_copyFeedback;
}

QString SystemInfoModel::reportText() const
{
    return qs(formatSystemReport(m_info));
}

bool SystemInfoModel::copySystemInfo()
{
    QClipboard *clipboard = QGuiApplication::clipboard();
    const bool ok = clipboard != nullptr;
    if (ok) {
        clipboard->setText(reportText());
    }

    PTLOG_INFO(QStringLiteral("SystemInfoModel"),
               QStringLiteral("copySystemInfo"),
               QStringLiteral("copy_system_info"),
               QStringLiteral("user_action"),
               QStringLiteral("clipboard"),
               pctoolkit::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"success", ok}}));

    setCopyFeedback(ok ? QStringLiteral("Copied!") : QStringLiteral("Error"));
    QTimer::singleShot(kCopyFeedbackMs, this, [this]() { setCopyFeedback(QString()); });
    return ok;
}

void SystemInfoModel::refresh()
{
    m_staticSections = 0;
    ++m_staticGeneration;
    setCopyEnabled(false);
    if (m_loader) {
        m_loader->clearCache();
    }
}

void SystemInfoModel::setUptime(const QString &uptime)
{
    m_info.uptime = uptime.toStdString();
    emit uptimeChanged();
}

void SystemInfoModel::setCpuInfo(const CpuInfo &info)
{
    m_info.cpu = info;
    emit cpuChanged();
    markStaticSection(CpuSection);
}

void SystemInfoModel::setCpuDynamic(const CpuDynamicInfo &info)
{
    m_info.cpuDynamic = info;
    emit cpuChanged();
}

void SystemInfoModel::setMemoryInfo(const MemoryInfo &info)
{
    m_info.memory = info;
    emit memoryChanged();
}

void SystemInfoModel::setDiskInfo(const DiskInfo &info)
{
    m_info.disk = info;
    emit diskChanged();
}

void SystemInfoModel::setStorageOverview(const StorageOverview &overview)
{
    m_info.storage = overview;
    emit storageChanged();
}

void SystemInfoModel::setGpuInfo(const GpuInfo &info)
{
    m_info.gpu = info;
    emit gpuChanged();
}

void SystemInfoModel::setMonitorInfo(const MonitorInfo &info)
{
    m_info.monitors = info;
    emit monitorsChanged();
    markStaticSection(MonitorSection);
}

void SystemInfoModel::setMotherboardInfo(const MotherboardInfo &info)
{
    m_info.motherboard = info;
    emit motherboardChanged();
    markStaticSection(MotherboardSection);
}

void SystemInfoModel::setOsInfo(const OsInfo &info)
{
    m_info.os = info;
    emit osChanged();
    markStaticSection(OsSection);
}

void SystemInfoModel::markStaticSection(StaticSection section)
{
    const bool wasComplete = m_staticSections == AllStaticSections;
    m_staticSections |= section;
    if (wasComplete || m_staticSections != AllStaticSections) {
        return;
    }

    const int generation = m_staticGeneration;
    QTimer::singleShot(kCopyEnableDelayMs, this, [this, generation]() {
        if (generation == m_staticGeneration) {
            setCopyEnabled(true);
        }
    });
}

void SystemInfoModel::setCopyEnabled(bool enabled)
{
    if (m_copyEnabled == enabled) {
        return;
    }
    m_copyEnabled = enabled;
    emit copyEnabledChanged();
}

void SystemInfoModel::setCopyFeedback(const QString &feedback)
{
    if (m_copyFeedback == feedback) {
        return;
    }
    m_copyFeedback = feedback;
    emit copyFeedbackChanged();
}

} // namespace pctoolkit
