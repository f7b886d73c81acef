#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace pctoolkit {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }
    std::time_t time = timegm(&tm);
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time);
}

inline std::string toStorageTypeString(StorageType type)
{
    switch (type) {
    case StorageType::Hdd:
        return "HDD";
    case StorageType::Ssd:
        return "SSD";
    case StorageType::NvmeSsd:
        return "NVMe SSD";
    case StorageType::Unknown:
        return "Unknown";
    }
    return "Unknown";
}

inline StorageType parseStorageTypeString(const std::string &value)
{
    if (value == "HDD") {
        return StorageType::Hdd;
    }
    if (value == "SSD") {
        return StorageType::Ssd;
    }
    if (value == "NVMe SSD") {
        return StorageType::NvmeSsd;
    }
    return StorageType::Unknown;
}

inline std::string toCleanupKindString(CleanupKind kind)
{
    switch (kind) {
    case CleanupKind::TempFiles:
        return "temp_files";
    case CleanupKind::Trash:
        return "trash";
    case CleanupKind::Memory:
        return "memory";
    case CleanupKind::DiskCleanup:
        return "disk_cleanup";
    }
    return "temp_files";
}

inline CleanupKind parseCleanupKindString(const std::string &value)
{
    if (value == "trash") {
        return CleanupKind::Trash;
    }
    if (value == "memory") {
        return CleanupKind::Memory;
    }
    if (value == "disk_cleanup") {
        return CleanupKind::DiskCleanup;
    }
    return CleanupKind::TempFiles;
}

inline void to_json(nlohmann::json &j, const StorageType &type)
{
    j = toStorageTypeString(type);
}

inline void from_json(const nlohmann::json &j, StorageType &type)
{
    type = j.is_string() ? parseStorageTypeString(j.get<std::string>())
                         : StorageType::Unknown;
}

inline void to_json(nlohmann::json &j, const CleanupKind &kind)
{
    j = toCleanupKindString(kind);
}

inline void from_json(const nlohmann::json &j, CleanupKind &kind)
{
    kind = j.is_string() ? parseCleanupKindString(j.get<std::string>())
                         : CleanupKind::TempFiles;
}

inline void to_json(nlohmann::json &j, const CpuInfo &cpu)
{
    j = nlohmann::json{
        {"name", cpu.name},
        {"cores", cpu.cores},
        {"physicalCores", cpu.physicalCores},
        {"logicalCores", cpu.logicalCores},
        {"frequency", cpu.frequency},
        {"baseMhz", cpu.baseMhz},
        {"maxMhz", cpu.maxMhz},
        {"cacheDisplay", cpu.cacheDisplay},
        {"sockets", cpu.sockets}
    };
}

inline void from_json(const nlohmann::json &j, CpuInfo &cpu)
{
    cpu.name = j.value("name", "Unknown");
    cpu.cores = j.value("cores", "Unknown");
    cpu.physicalCores = j.value("physicalCores", 0);
    cpu.logicalCores = j.value("logicalCores", 0);
    cpu.frequency = j.value("frequency", "Unknown");
    cpu.baseMhz = j.value("baseMhz", 0.0);
    cpu.maxMhz = j.value("maxMhz", 0.0);
    cpu.cacheDisplay = j.value("cacheDisplay", "Unknown");
    cpu.sockets = j.value("sockets", "Unknown");
}

inline void to_json(nlohmann::json &j, const CpuDynamicInfo &cpu)
{
    j = nlohmann::json{
        {"usagePercent", cpu.usagePercent},
        {"currentSpeed", cpu.currentSpeed}
    };
}

inline void from_json(const nlohmann::json &j, CpuDynamicInfo &cpu)
{
    cpu.usagePercent = j.value("usagePercent", 0.0);
    cpu.currentSpeed = j.value("currentSpeed", "Unknown");
}

inline void to_json(nlohmann::json &j, const RamDetails &ram)
{
    j = nlohmann::json{
        {"ramName", ram.ramName},
        {"ramSpeed", ram.ramSpeed},
        {"ramType", ram.ramType},
        {"ramSlots", ram.ramSlots}
    };
}

inline void from_json(const nlohmann::json &j, RamDetails &ram)
{
    ram.ramName = j.value("ramName", "Unknown");
    ram.ramSpeed = j.value("ramSpeed", "Unknown");
    ram.ramType = j.value("ramType", "Unknown");
    ram.ramSlots = j.value("ramSlots", "Unknown");
}

inline void to_json(nlohmann::json &j, const MemoryInfo &memory)
{
    j = nlohmann::json{
        {"totalBytes", memory.totalBytes},
        {"availableBytes", memory.availableBytes},
        {"usedBytes", memory.usedBytes},
        {"percent", memory.percent},
        {"details", memory.details}
    };
}

inline void from_json(const nlohmann::json &j, MemoryInfo &memory)
{
    memory.totalBytes = j.value("totalBytes", std::uint64_t{0});
    memory.availableBytes = j.value("availableBytes", std::uint64_t{0});
    memory.usedBytes = j.value("usedBytes", std::uint64_t{0});
    memory.percent = j.value("percent", 0.0);
    if (j.contains("details") && j.at("details").is_object()) {
        memory.details = j.at("details").get<RamDetails>();
    } else {
        memory.details = RamDetails{};
    }
}

inline void to_json(nlohmann::json &j, const DiskInfo &disk)
{
    j = nlohmann::json{
        {"mountPoint", disk.mountPoint},
        {"totalBytes", disk.totalBytes},
        {"usedBytes", disk.usedBytes},
        {"freeBytes", disk.freeBytes},
        {"usagePercent", disk.usagePercent},
        {"storageName", disk.storageName},
        {"storageType", disk.storageType}
    };
}

inline void from_json(const nlohmann::json &j, DiskInfo &disk)
{
    disk.mountPoint = j.value("mountPoint", "/");
    disk.totalBytes = j.value("totalBytes", std::uint64_t{0});
    disk.usedBytes = j.value("usedBytes", std::uint64_t{0});
    disk.freeBytes = j.value("freeBytes", std::uint64_t{0});
    disk.usagePercent = j.value("usagePercent", 0.0);
    disk.storageName = j.value("storageName", "Unknown");
    if (j.contains("storageType")) {
        disk.storageType = j.at("storageType").get<StorageType>();
    } else {
        disk.storageType = StorageType::Unknown;
    }
}

inline void to_json(nlohmann::json &j, const StorageDevice &device)
{
    j = nlohmann::json{
        {"label", device.label},
        {"name", device.name},
        {"device", device.device},
        {"sizeBytes", device.sizeBytes},
        {"type", device.type}
    };
}

inline void from_json(const nlohmann::json &j, StorageDevice &device)
{
    device.label = j.value("label", "");
    device.name = j.value("name", "");
    device.device = j.value("device", "");
    device.sizeBytes = j.value("sizeBytes", std::uint64_t{0});
    if (j.contains("type")) {
        device.type = j.at("type").get<StorageType>();
    } else {
        device.type = StorageType::Unknown;
    }
}

inline void to_json(nlohmann::json &j, const StorageOverview &overview)
{
    j = nlohmann::json{
        {"drives", overview.drives},
        {"totalBytes", overview.totalBytes}
    };
}

inline void from_json(const nlohmann::json &j, StorageOverview &overview)
{
    if (j.contains("drives") && j.at("drives").is_array()) {
        overview.drives = j.at("drives").get<std::vector<StorageDevice>>();
    } else {
        overview.drives.clear();
    }
    overview.totalBytes = j.value("totalBytes", std::uint64_t{0});
}

inline void to_json(nlohmann::json &j, const GpuInfo &gpu)
{
    j = nlohmann::json{
        {"available", gpu.available},
        {"name", gpu.name},
        {"usagePercent", gpu.usagePercent},
        {"memoryUsedBytes", gpu.memoryUsedBytes},
        {"memoryTotalBytes", gpu.memoryTotalBytes},
        {"temperatureC", gpu.temperatureC},
        {"source", gpu.source}
    };
}

inline void from_json(const nlohmann::json &j, GpuInfo &gpu)
{
    gpu.available = j.value("available", false);
    gpu.name = j.value("name", "No GPU detected");
    gpu.usagePercent = j.value("usagePercent", 0.0);
    gpu.memoryUsedBytes = j.value("memoryUsedBytes", std::uint64_t{0});
    gpu.memoryTotalBytes = j.value("memoryTotalBytes", std::uint64_t{0});
    gpu.temperatureC = j.value("temperatureC", 0.0);
    gpu.source = j.value("source", "none");
}

inline void to_json(nlohmann::json &j, const MonitorInfo &info)
{
    j = nlohmann::json{
        {"monitors", info.monitors},
        {"count", info.count}
    };
}

inline void from_json(const nlohmann::json &j, MonitorInfo &info)
{
    if (j.contains("monitors") && j.at("monitors").is_array()) {
        info.monitors = j.at("monitors").get<std::vector<std::string>>();
    } else {
        info.monitors.clear();
    }
    info.count = j.value("count", 0);
}

inline void to_json(nlohmann::json &j, const MotherboardInfo &board)
{
    j = nlohmann::json{
        {"product", board.product},
        {"manufacturer", board.manufacturer},
        {"version", board.version},
        {"chipset", board.chipset},
        {"biosVersion", board.biosVersion},
        {"biosManufacturer", board.biosManufacturer},
        {"biosDate", board.biosDate},
        {"systemModel", board.systemModel},
        {"memorySlots", board.memorySlots},
        {"maxMemoryCapacity", board.maxMemoryCapacity},
        {"memorySlotsUsed", board.memorySlotsUsed}
    };
}

inline void from_json(const nlohmann::json &j, MotherboardInfo &board)
{
    board.product = j.value("product", "Unknown");
    board.manufacturer = j.value("manufacturer", "Unknown");
    board.version = j.value("version", "Unknown");
    board.chipset = j.value("chipset", "Unknown");
    board.biosVersion = j.value("biosVersion", "Unknown");
    board.biosManufacturer = j.value("biosManufacturer", "Unknown");
    board.biosDate = j.value("biosDate", "Unknown");
    board.systemModel = j.value("systemModel", "Unknown");
    board.memorySlots = j.value("memorySlots", "Unknown");
    board.maxMemoryCapacity = j.value("maxMemoryCapacity", "Unknown");
    board.memorySlotsUsed = j.value("memorySlotsUsed", "Unknown");
}

inline void to_json(nlohmann::json &j, const OsInfo &os)
{
    j = nlohmann::json{
        {"deviceName", os.deviceName},
        {"userName", os.userName},
        {"edition", os.edition},
        {"version", os.version},
        {"build", os.build},
        {"installDate", os.installDate},
        {"experience", os.experience},
        {"arch", os.arch}
    };
}

inline void from_json(const nlohmann::json &j, OsInfo &os)
{
    os.deviceName = j.value("deviceName", "Unknown");
    os.userName = j.value("userName", "Unknown");
    os.edition = j.value("edition", "Unknown");
    os.version = j.value("version", "Unknown");
    os.build = j.value("build", "Unknown");
    os.installDate = j.value("installDate", "Unknown");
    os.experience = j.value("experience", "Unknown");
    os.arch = j.value("arch", "Unknown");
}

inline void to_json(nlohmann::json &j, const SystemInfo &info)
{
    j = nlohmann::json{
        {"timestamp", toIso8601Utc(info.timestamp)},
        {"uptime", info.uptime},
        {"cpu", info.cpu},
        {"cpuDynamic", info.cpuDynamic},
        {"memory", info.memory},
        {"disk", info.disk},
        {"storage", info.storage},
        {"gpu", info.gpu},
        {"monitors", info.monitors},
        {"motherboard", info.motherboard},
        {"os", info.os}
    };
}

inline void from_json(const nlohmann::json &j, SystemInfo &info)
{
    info.timestamp = fromIso8601Utc(j.value("timestamp", ""));
    info.uptime = j.value("uptime", "Unknown");
    info.cpu = j.value("cpu", nlohmann::json::object()).get<CpuInfo>();
    info.cpuDynamic = j.value("cpuDynamic", nlohmann::json::object()).get<CpuDynamicInfo>();
    info.memory = j.value("memory", nlohmann::json::object()).get<MemoryInfo>();
    info.disk = j.value("disk", nlohmann::json::object()).get<DiskInfo>();
    info.storage = j.value("storage", nlohmann::json::object()).get<StorageOverview>();
    info.gpu = j.value("gpu", nlohmann::json::object()).get<GpuInfo>();
    info.monitors = j.value("monitors", nlohmann::json::object()).get<MonitorInfo>();
    info.motherboard = j.value("motherboard", nlohmann::json::object()).get<MotherboardInfo>();
    info.os = j.value("os", nlohmann::json::object()).get<OsInfo>();
}

inline void to_json(nlohmann::json &j, const CleanupRun &run)
{
    j = nlohmann::json{
        {"id", run.id},
        {"timestamp", toIso8601Utc(run.timestamp)},
        {"kind", run.kind},
        {"itemsRemoved", run.itemsRemoved},
        {"bytesFreed", run.bytesFreed},
        {"success", run.success},
        {"summary", run.summary},
        {"details", run.details}
    };
}

inline void from_json(const nlohmann::json &j, CleanupRun &run)
{
    run.id = j.value("id", "");
    run.timestamp = fromIso8601Utc(j.value("timestamp", ""));
    if (j.contains("kind")) {
        run.kind = j.at("kind").get<CleanupKind>();
    } else {
        run.kind = CleanupKind::TempFiles;
    }
    run.itemsRemoved = j.value("itemsRemoved", std::uint64_t{0});
    run.bytesFreed = j.value("bytesFreed", std::int64_t{0});
    run.success = j.value("success", true);
    run.summary = j.value("summary", "");
    if (j.contains("details")) {
        run.details = j.at("details");
    } else {
        run.details = nlohmann::json::object();
    }
}

inline void to_json(nlohmann::json &j, const CleanupTotals &totals)
{
    j = nlohmann::json{
        {"kind", totals.kind},
        {"runs", totals.runs},
        {"itemsRemoved", totals.itemsRemoved},
        {"bytesFreed", totals.bytesFreed}
    };
}

} // namespace pctoolkit
