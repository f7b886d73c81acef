#pragma once

#include <string>

#include "common/models.hpp"

namespace pctoolkit {

// Row texts shared by the window and the copied report.

// Frequency row with " (Current: X)" appended when the live speed is known.
std::string cpuFrequencyText(const CpuInfo &cpu, const CpuDynamicInfo &dynamic);

// "used GB / total GB" for the root file system.
std::string diskTotalText(const DiskInfo &disk);

// "Samsung SSD 980 PRO 1TB | 931.5 GB | NVMe SSD"
std::string storageDeviceText(const StorageDevice &device);

// "used GB / total GB", "Unknown" without a total, "N/A" without a GPU.
std::string gpuMemoryText(const GpuInfo &gpu);

// "65C" or "N/A".
std::string gpuTemperatureText(const GpuInfo &gpu);

/**
 * Plain-text report placed on the clipboard by "Copy System Info".
 * Sections in order: Processor, Local Disk (/), Memory, Storage, Graphics,
 * Monitor, Motherboard, Operating System. Each heading is underlined and
 * sections are separated by a blank line.
 */
std::string formatSystemReport(const SystemInfo &info);

} // namespace pctoolkit
