#pragma once

#include <cstdint>
#include <string>

namespace pctoolkit {

// Binary size text: "1 Byte", "512 Bytes", "1.5 KiB", "3.2 GiB".
std::string formatBinarySize(std::int64_t bytes);

// "3 days, 04:05:06" or "04:05:06". Negative input gives "Unknown".
std::string formatUptime(std::int64_t seconds);

// Cache size given in KiB: "512 KB" or "32.0 MB".
std::string formatCacheSize(std::uint64_t kib);

// Base/max clock text in GHz. Zero means unknown for either argument.
std::string formatFrequency(double baseMhz, double maxMhz);

// "%.1f GB" with 1024^3 bytes per GB.
std::string formatGigabytes(std::uint64_t bytes);

std::string formatPercent(double percent);

} // namespace pctoolkit
