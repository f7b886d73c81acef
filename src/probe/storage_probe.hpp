#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <QString>

#include "common/models.hpp"

namespace pctoolkit {

struct BlockDevice {
    QString name;
    QString model;
    std::uint64_t sizeBytes = 0;
    std::optional<bool> rotational;
    QString interfaceName;
};

// True for virtual or removable-media kernel devices that are not disks
// (loop, ram, zram, dm-, sr, fd).
bool isIgnoredBlockDevice(const QString &name);

StorageType classifyStorage(const QString &model,
                            std::optional<bool> rotational,
                            const QString &interfaceName);

// Physical disks from /sys/block in name order; zero-sized devices skipped.
std::vector<BlockDevice> listBlockDevices(const QString &root = QString());

// Reads one /sys/block/<name> entry, whether or not it would be listed.
BlockDevice readBlockDevice(const QString &root, const QString &name);

StorageOverview storageOverviewFromDevices(const std::vector<BlockDevice> &devices);

StorageOverview readStorageOverview(const QString &root = QString());

// Disk that holds a partition or device-mapper node, e.g. "nvme0n1p2" ->
// "nvme0n1", "dm-0" -> its first slave's disk.
QString parentDiskName(const QString &root, const QString &blockName);

// Usage of "/" and the disk behind it.
DiskInfo readRootDiskInfo(const QString &root = QString());

} // namespace pctoolkit
