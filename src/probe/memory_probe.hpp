#pragma once

#include <string>
#include <vector>

#include <QString>

#include "common/models.hpp"

namespace pctoolkit {

// One populated "Memory Device" record of `dmidecode --type 17`.
struct DmiMemoryDevice {
    QString size;
    QString locator;
    QString type;
    QString manufacturer;
    QString partNumber;
    int speedMts = 0;
    int configuredSpeedMts = 0;
};

// Totals from /proc/meminfo (kB values). used = total - available.
MemoryInfo parseMeminfo(const QString &text);

MemoryInfo readMemoryUsage(const QString &root = QString());

// Installed modules only; "No Module Installed" slots are dropped.
std::vector<DmiMemoryDevice> parseDmiMemoryDevices(const QString &dmidecodeOutput);

// SMBIOS memory type code (20, 21, 22, 24, 26, 34) to its name, or empty.
std::string ramTypeFromSmbiosCode(int code);

// NUL characters removed, whitespace collapsed; placeholders become empty.
QString cleanDmiString(const QString &value);

/**
 * Summarize the first module the way the RAM rows show it:
 * - name: part number, "Manufacturer PartNumber", or manufacturer alone
 * - speed: "N MHz" from the configured or rated speed
 * - type: DDR generation from dmidecode, part number, then speed
 * - slots: "N slot(s) used"
 */
RamDetails ramDetailsFromDevices(const std::vector<DmiMemoryDevice> &devices);

// Runs `dmidecode --type 17` on the live system. Needs root; otherwise the
// details stay "Unknown".
RamDetails readRamDetails(const QString &root = QString());

} // namespace pctoolkit
