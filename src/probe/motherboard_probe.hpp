#pragma once

#include <string>

#include <QString>

#include "common/models.hpp"

namespace pctoolkit {

struct DmiMemoryArray {
    int slots = 0;
    // Total capacity in MiB across all system memory arrays.
    qulonglong maxCapacityMib = 0;
};

// `dmidecode --type 16` output: "Number Of Devices" and "Maximum Capacity".
DmiMemoryArray parseDmiMemoryArray(const QString &dmidecodeOutput);

// Chipset named by a board product string ("ROG STRIX B650E-F" -> "AMD B650E").
QString chipsetFromBoardName(const QString &boardName);

// Chipset named by an lspci ISA bridge / LPC controller line.
QString chipsetFromLspci(const QString &lspciOutput);

// "AMD 600 Series (Estimated)" style guess from the CPU generation, then
// "AMD (Unknown Series)" / "Intel (Unknown Series)", else empty.
QString estimateChipsetFromCpu(const QString &cpuName);

/**
 * Chipset detection in order of confidence:
 *   1. a chipset token in the board product name
 *   2. the platform controller reported by lspci
 *   3. an estimate from the CPU name
 * Returns "Unknown" when nothing matches.
 */
std::string detectChipset(const QString &boardName,
                          const QString &lspciOutput,
                          const QString &cpuName);

/**
 * Board, BIOS and memory-slot description from /sys/class/dmi/id. dmidecode
 * and lspci are only consulted on the live system.
 */
MotherboardInfo readMotherboardInfo(const QString &root = QString(),
                                    const QString &cpuName = QString());

} // namespace pctoolkit
