#include "report/system_report.hpp"

#include <sstream>

#include "common/format_utils.hpp"
#include "common/json_utils.hpp"

namespace pctoolkit {

namespace {

constexpr const char *kUnderline = "----------------------";

void heading(std::ostringstream &out, const char *title)
{
    out << title << "\n" << kUnderline << "\n";
}

} // namespace

std::string cpuFrequencyText(const CpuInfo &cpu, const CpuDynamicInfo &dynamic)
{
    if (dynamic.currentSpeed.empty() || dynamic.currentSpeed == "Unknown") {
        return cpu.frequency;
    }
    return cpu.frequency + " (Current: " + dynamic.currentSpeed + ")";
}

std::string diskTotalText(const DiskInfo &disk)
{
    return formatGigabytes(disk.usedBytes) + " / " + formatGigabytes(disk.totalBytes);
}

std::string storageDeviceText(const StorageDevice &device)
{
    return device.name + " | " + formatGigabytes(device.sizeBytes) + " | "
        + toStorageTypeString(device.type);
}

std::string gpuMemoryText(const GpuInfo &gpu)
{
    if (!gpu.available) {
        return "N/A";
    }
    if (gpu.memoryTotalBytes == 0) {
        return "Unknown";
    }
    return formatGigabytes(gpu.memoryUsedBytes) + " / " + formatGigabytes(gpu.memoryTotalBytes);
}

std::string gpuTemperatureText(const GpuInfo &gpu)
{
    if (!gpu.available) {
        return "N/A";
    }
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out.precision(0);
    out << gpu.temperatureC << "C";
    return out.str();
}

std::string formatSystemReport(const SystemInfo &info)
{
    std::ostringstream out;

    heading(out, "Processor Information:");
    out << "Processor: " << info.cpu.name << "\n";
    out << "Cores/Threads: " << info.cpu.cores << "\n";
    out << "Frequency: " << cpuFrequencyText(info.cpu, info.cpuDynamic) << "\n";
    out << "Cache: " << info.cpu.cacheDisplay << "\n";
    out << "Sockets: " << info.cpu.sockets << "\n\n";

    heading(out, "Local Disk (/) Information:");
    out << "Storage Device: " << info.disk.storageName << "\n";
    out << "Storage Type: " << toStorageTypeString(info.disk.storageType) << "\n";
    out << "Local Disk (/) Total: " << diskTotalText(info.disk) << "\n";
    out << "Local Disk (/) Free: " << formatGigabytes(info.disk.freeBytes) << "\n";
    out << "Local Disk (/) Usage: " << formatPercent(info.disk.usagePercent) << "\n\n";

    const RamDetails &ram = info.memory.details;
    heading(out, "Memory Information:");
    out << "Ram Total: " << formatGigabytes(info.memory.totalBytes) << "\n";
    out << "Ram Used: " << formatGigabytes(info.memory.usedBytes) << "\n";
    out << "Ram Available: " << formatGigabytes(info.memory.availableBytes) << "\n";
    out << "RAM Name: " << ram.ramName << "\n";
    out << "RAM Type: " << ram.ramType << "\n";
    out << "RAM Speed: " << ram.ramSpeed << "\n";
    out << "RAM Slots: " << ram.ramSlots << "\n\n";

    heading(out, "Storage Information:");
    out << "Total Storage Devices: " << info.storage.drives.size();
    for (const StorageDevice &device : info.storage.drives) {
        out << "\n" << device.label << ": " << storageDeviceText(device);
    }
    out << "\n\n";

    heading(out, "Graphics Information:");
    out << "GPU: " << info.gpu.name << "\n";
    out << "GPU Memory: " << gpuMemoryText(info.gpu) << "\n";
    out << "GPU Temperature: " << gpuTemperatureText(info.gpu) << "\n\n";

    heading(out, "Monitor Information:");
    out << "Monitor Count: " << info.monitors.count;
    int index = 1;
    for (const std::string &monitor : info.monitors.monitors) {
        out << "\nMonitor " << index++ << ": " << monitor;
    }
    out << "\n\n";

    const MotherboardInfo &board = info.motherboard;
    heading(out, "Motherboard Information:");
    out << "Product: " << board.product << "\n";
    out << "Manufacturer: " << board.manufacturer << "\n";
    out << "Version: " << board.version << "\n";
    out << "Chipset: " << board.chipset << "\n";
    out << "BIOS Version: " << board.biosVersion << "\n";
    out << "BIOS Manufacturer: " << board.biosManufacturer << "\n";
    out << "BIOS Date: " << board.biosDate << "\n";
    out << "System Model: " << board.systemModel << "\n";
    out << "Total Memory Slots: " << board.memorySlots << "\n";
    out << "Max Memory Capacity: " << board.maxMemoryCapacity << "\n";
    out << "Memory Slots Used: " << board.memorySlotsUsed << "\n\n";

    heading(out, "Operating System Information:");
    out << "Device Name: " << info.os.deviceName << "\n";
    out << "User: " << info.os.userName << "\n";
    out << "Operating System: " << info.os.edition << "\n";
    out << "OS Version: " << info.os.version << "\n";
    out << "OS Build: " << info.os.build << "\n";
    out << "OS Experience: " << info.os.experience;

    return out.str();
}

} // namespace pctoolkit
