#pragma once

#include <cstdint>
#include <optional>

#include <QString>

#include "common/models.hpp"

namespace pctoolkit {

struct CpuTopology {
    QString modelName;
    int logicalCount = 0;
    int physicalCoreCount = 0;
    int socketCount = 0;
    double meanMhz = 0.0;
};

// Parse /proc/cpuinfo text. Physical cores are counted as unique
// (physical id, core id) pairs; zero when the file does not carry them.
CpuTopology parseProcCpuinfo(const QString &text);

// First usable "Socket Designation" from `dmidecode -t processor`.
QString parseSocketDesignation(const QString &dmidecodeOutput);

// "Current Speed: 3400 MHz" from `dmidecode -t processor`, in MHz.
double parseSmbiosCurrentSpeed(const QString &dmidecodeOutput);

// sysfs cache size text ("32K", "1024K", "16M") in KiB.
std::uint64_t parseCacheSizeKib(const QString &text);

// "L1 - 64 KB | L2 - 1.0 MB | L3 - 32.0 MB" from cpu0/cache/index*.
std::string readCacheDisplay(const QString &root);

/**
 * Static processor description: name, cores/threads, base and max clock,
 * cache and socket. Reads /proc/cpuinfo and /sys/devices/system/cpu below
 * root; dmidecode is only consulted on the live system.
 */
CpuInfo readCpuInfo(const QString &root = QString());

// Mean of scaling_cur_freq over all CPUs, "N.NN GHz" or "Unknown".
std::string readCurrentSpeed(const QString &root = QString());

struct CpuTimes {
    std::uint64_t total = 0;
    std::uint64_t idle = 0;
};

// Aggregate "cpu" line of /proc/stat. Idle includes iowait.
std::optional<CpuTimes> parseProcStat(const QString &text);

// Busy percentage between two /proc/stat samples.
class CpuUsageSampler {
public:
    explicit CpuUsageSampler(const QString &root = QString());

    // First call primes the sampler and returns 0.
    double sample();

private:
    QString m_root;
    std::optional<CpuTimes> m_previous;
};

} // namespace pctoolkit
