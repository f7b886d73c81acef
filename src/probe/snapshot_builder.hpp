#pragma once

#include <QString>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace pctoolkit {

/**
 * Build a complete SystemInfo in one synchronous pass:
 * - static sections (CPU, monitors, motherboard, OS)
 * - dynamic sections (uptime, CPU usage over a short interval, memory,
 *   root disk, storage devices, GPU)
 *
 * Nothing is persisted; the report CLI prints the result directly.
 */
SystemInfo buildSystemSnapshot(const QString &root = QString(),
                               const QString &primaryScreenName = QString(),
                               int cpuSampleMs = 250);

// Hardware identity used for change tracking: CPU, board, monitors, OS
// release, RAM modules and disks. Usage figures are left out.
nlohmann::json hardwareProfileJson(const CpuInfo &cpu,
                                   const MotherboardInfo &board,
                                   const MonitorInfo &monitors,
                                   const OsInfo &os,
                                   const RamDetails &ram,
                                   const StorageOverview &storage);

nlohmann::json hardwareProfileJson(const SystemInfo &info);

} // namespace pctoolkit
