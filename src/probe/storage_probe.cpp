#include "probe/storage_probe.hpp"

#include <QDir>
#include <QFileInfo>
#include <QStorageInfo>

#include <utility>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/sysfs_utils.hpp"

namespace pctoolkit {

namespace {

constexpr std::uint64_t kSectorBytes = 512;

} // namespace

bool isIgnoredBlockDevice(const QString &name)
{
    static const char *const prefixes[] = {"loop", "ram", "zram", "dm-", "sr", "fd"};
    for (const char *prefix : prefixes) {
        if (name.startsWith(QLatin1String(prefix))) {
            return true;
        }
    }
    return false;
}

StorageType classifyStorage(const QString &model,
                            std::optional<bool> rotational,
                            const QString &interfaceName)
{
    const QString upper = model.toUpper();
    const bool nvme = interfaceName == QStringLiteral("nvme");
    if (upper.contains(QStringLiteral("SSD"))
        || upper.contains(QStringLiteral("NVME"))
        || upper.contains(QStringLiteral("M.2"))
        || upper.contains(QStringLiteral("SOLID STATE"))) {
        return upper.contains(QStringLiteral("NVME")) || nvme ? StorageType::NvmeSsd
                                                              : StorageType::Ssd;
    }
    if (rotational.has_value() && *rotational) {
        return StorageType::Hdd;
    }
    if (nvme) {
        return StorageType::NvmeSsd;
    }
    if (rotational.has_value()) {
        return StorageType::Ssd;
    }
    return StorageType::Unknown;
}

BlockDevice readBlockDevice(const QString &root, const QString &name)
{
    const QString dir = rootedPath(root, QStringLiteral("/sys/block/") + name);

    BlockDevice device;
    device.name = name;
    device.model = readTrimmedFile(dir + QStringLiteral("/device/model")).simplified();
    if (device.model.isEmpty()) {
        device.model = QStringLiteral("Unknown Disk");
    }
    const auto sectors = readUnsignedFile(dir + QStringLiteral("/size"));
    device.sizeBytes = sectors.has_value() ? *sectors * kSectorBytes : 0;
    const auto rotational = readUnsignedFile(dir + QStringLiteral("/queue/rotational"));
    if (rotational.has_value()) {
        device.rotational = *rotational != 0;
    }
    if (name.startsWith(QStringLiteral("nvme"))) {
        device.interfaceName = QStringLiteral("nvme");
    }
    return device;
}

std::vector<BlockDevice> listBlockDevices(const QString &root)
{
    std::vector<BlockDevice> devices;
    for (const QString &name : listEntries(rootedPath(root, QStringLiteral("/sys/block")))) {
        if (isIgnoredBlockDevice(name)) {
            continue;
        }
        BlockDevice device = readBlockDevice(root, name);
        if (device.sizeBytes == 0) {
            continue;
        }
        devices.push_back(std::move(device));
    }
    return devices;
}

StorageOverview storageOverviewFromDevices(const std::vector<BlockDevice> &devices)
{
    StorageOverview overview;
    int index = 0;
    for (const BlockDevice &device : devices) {
        StorageDevice entry;
        entry.label = "Storage " + std::to_string(++index);
        entry.name = device.model.toStdString();
        entry.device = device.name.toStdString();
        entry.sizeBytes = device.sizeBytes;
        entry.type = classifyStorage(device.model, device.rotational, device.interfaceName);
        overview.totalBytes += device.sizeBytes;
        overview.drives.push_back(std::move(entry));
    }
    return overview;
}

StorageOverview readStorageOverview(const QString &root)
{
    return storageOverviewFromDevices(listBlockDevices(root));
}

QString parentDiskName(const QString &root, const QString &blockName)
{
    const QString classDir = rootedPath(root, QStringLiteral("/sys/class/block/") + blockName);

    if (blockName.startsWith(QStringLiteral("dm-"))) {
        const QStringList slaves = listEntries(classDir + QStringLiteral("/slaves"));
        if (!slaves.isEmpty()) {
            return parentDiskName(root, slaves.front());
        }
        return blockName;
    }

    if (!QFileInfo::exists(classDir + QStringLiteral("/partition"))) {
        return blockName;
    }

    // Partitions live below their disk: .../block/nvme0n1/nvme0n1p2
    const QString canonical = QFileInfo(classDir).canonicalFilePath();
    if (canonical.isEmpty()) {
        return blockName;
    }
    const QString parent = QFileInfo(canonical).dir().dirName();
    return parent.isEmpty() ? blockName : parent;
}

DiskInfo readRootDiskInfo(const QString &root)
{
    DiskInfo info;
    info.mountPoint = "/";

    const QStorageInfo storage(isLiveSystem(root) ? QStringLiteral("/") : root);
    if (storage.isValid() && storage.isReady()) {
        const qint64 total = storage.bytesTotal();
        const qint64 free = storage.bytesAvailable();
        info.totalBytes = total > 0 ? static_cast<std::uint64_t>(total) : 0;
        info.freeBytes = free > 0 ? static_cast<std::uint64_t>(free) : 0;
        info.usedBytes = info.totalBytes > info.freeBytes ? info.totalBytes - info.freeBytes : 0;
        info.usagePercent = info.totalBytes > 0
            ? static_cast<double>(info.usedBytes) / static_cast<double>(info.totalBytes) * 100.0
            : 0.0;
    }

    QString device = QString::fromLocal8Bit(storage.device());
    if (device.startsWith(QStringLiteral("/dev/"))) {
        device = QFileInfo(device).canonicalFilePath();
        const QString blockName = QFileInfo(device).fileName();
        if (!blockName.isEmpty()) {
            const QString diskName = parentDiskName(root, blockName);
            const BlockDevice disk = readBlockDevice(root, diskName);
            info.storageName = disk.model.toStdString();
            info.storageType = classifyStorage(disk.model, disk.rotational, disk.interfaceName);
        }
    }

    PTLOG_DEBUG(QStringLiteral("StorageProbe"),
                QStringLiteral("readRootDiskInfo"),
                QStringLiteral("root_disk_read"),
                QStringLiteral("dynamic_probe"),
                QStringLiteral("QStorageInfo"),
                pctoolkit::logging::defaultWho(),
                QString(),
                (nlohmann::json{{"device", device.toStdString()},
                                {"storageType", info.storageType}}));
    return info;
}

} // namespace pctoolkit
