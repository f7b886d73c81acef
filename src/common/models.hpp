#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <QMetaType>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace pctoolkit {

struct CpuInfo {
    std::string name = "Unknown";
    std::string cores = "Unknown";
    int physicalCores = 0;
    int logicalCores = 0;
    std::string frequency = "Unknown";
    double baseMhz = 0.0;
    double maxMhz = 0.0;
    std::string cacheDisplay = "Unknown";
    std::string sockets = "Unknown";
};

struct CpuDynamicInfo {
    double usagePercent = 0.0;
    std::string currentSpeed = "Unknown";
};

struct RamDetails {
    std::string ramName = "Unknown";
    std::string ramSpeed = "Unknown";
    std::string ramType = "Unknown";
    std::string ramSlots = "Unknown";
};

struct MemoryInfo {
    std::uint64_t totalBytes = 0;
    std::uint64_t availableBytes = 0;
    std::uint64_t usedBytes = 0;
    double percent = 0.0;
    RamDetails details;
};

// Usage of the file system mounted at "/" and the disk behind it.
struct DiskInfo {
    std::string mountPoint = "/";
    std::uint64_t totalBytes = 0;
    std::uint64_t usedBytes = 0;
    std::uint64_t freeBytes = 0;
    double usagePercent = 0.0;
    std::string storageName = "Unknown";
    StorageType storageType = StorageType::Unknown;
};

struct StorageDevice {
    std::string label;
    std::string name;
    std::string device;
    std::uint64_t sizeBytes = 0;
    StorageType type = StorageType::Unknown;
};

struct StorageOverview {
    std::vector<StorageDevice> drives;
    std::uint64_t totalBytes = 0;
};

struct GpuInfo {
    bool available = false;
    std::string name = "No GPU detected";
    double usagePercent = 0.0;
    std::uint64_t memoryUsedBytes = 0;
    std::uint64_t memoryTotalBytes = 0;
    double temperatureC = 0.0;
    std::string source = "none";
};

struct MonitorInfo {
    std::vector<std::string> monitors;
    int count = 0;
};

struct MotherboardInfo {
    std::string product = "Unknown";
    std::string manufacturer = "Unknown";
    std::string version = "Unknown";
    std::string chipset = "Unknown";
    std::string biosVersion = "Unknown";
    std::string biosManufacturer = "Unknown";
    std::string biosDate = "Unknown";
    std::string systemModel = "Unknown";
    std::string memorySlots = "Unknown";
    std::string maxMemoryCapacity = "Unknown";
    std::string memorySlotsUsed = "Unknown";
};

struct OsInfo {
    std::string deviceName = "Unknown";
    std::string userName = "Unknown";
    std::string edition = "Unknown";
    std::string version = "Unknown";
    std::string build = "Unknown";
    std::string installDate = "Unknown";
    std::string experience = "Unknown";
    std::string arch = "Unknown";
};

struct SystemInfo {
    std::chrono::system_clock::time_point timestamp;
    std::string uptime = "Unknown";
    CpuInfo cpu;
    CpuDynamicInfo cpuDynamic;
    MemoryInfo memory;
    DiskInfo disk;
    StorageOverview storage;
    GpuInfo gpu;
    MonitorInfo monitors;
    MotherboardInfo motherboard;
    OsInfo os;
};

struct CleanupRun {
    std::string id;
    std::chrono::system_clock::time_point timestamp;
    CleanupKind kind = CleanupKind::TempFiles;
    std::uint64_t itemsRemoved = 0;
    std::int64_t bytesFreed = 0;
    bool success = true;
    std::string summary;
    nlohmann::json details = nlohmann::json::object();
};

struct CleanupTotals {
    CleanupKind kind = CleanupKind::TempFiles;
    int runs = 0;
    std::uint64_t itemsRemoved = 0;
    std::int64_t bytesFreed = 0;
};

} // namespace pctoolkit

Q_DECLARE_METATYPE(pctoolkit::CpuInfo)
Q_DECLARE_METATYPE(pctoolkit::CpuDynamicInfo)
Q_DECLARE_METATYPE(pctoolkit::MemoryInfo)
Q_DECLARE_METATYPE(pctoolkit::DiskInfo)
Q_DECLARE_METATYPE(pctoolkit::StorageOverview)
Q_DECLARE_METATYPE(pctoolkit::GpuInfo)
Q_DECLARE_METATYPE(pctoolkit::MonitorInfo)
Q_DECLARE_METATYPE(pctoolkit::MotherboardInfo)
Q_DECLARE_METATYPE(pctoolkit::OsInfo)
Q_DECLARE_METATYPE(pctoolkit::CleanupRun)
