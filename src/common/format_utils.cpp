#include "common/format_utils.hpp"

#include <cstdio>
#include <cstdlib>

namespace pctoolkit {

namespace {

std::string printf1(const char *format, double value, const char *unit)
{
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), format, value, unit);
    return buffer;
}

} // namespace

std::string formatBinarySize(std::int64_t bytes)
{
    if (bytes == 1) {
        return "1 Byte";
    }

    const double base = 1024.0;
    const double magnitude = static_cast<double>(std::llabs(bytes));
    if (magnitude < base) {
        return std::to_string(bytes) + " Bytes";
    }

    static const char *const suffixes[] = {"KiB", "MiB", "GiB", "TiB", "PiB", "EiB"};
    double unit = base;
    for (const char *suffix : suffixes) {
        if (magnitude < unit * base) {
            return printf1("%.1f %s", static_cast<double>(bytes) / unit, suffix);
        }
        unit *= base;
    }
    return printf1("%.1f %s", static_cast<double>(bytes) / (unit / base), "EiB");
}

std::string formatUptime(std::int64_t seconds)
{
    if (seconds < 0) {
        return "Unknown";
    }

    const std::int64_t days = seconds / 86400;
    const std::int64_t rest = seconds % 86400;
    const int hours = static_cast<int>(rest / 3600);
    const int minutes = static_cast<int>((rest % 3600) / 60);
    const int secs = static_cast<int>(rest % 60);

    char clock[16];
    std::snprintf(clock, sizeof(clock), "%02d:%02d:%02d", hours, minutes, secs);
    if (days > 0) {
        return std::to_string(days) + " days, " + clock;
    }
    return clock;
}

std::string formatCacheSize(std::uint64_t kib)
{
    if (kib >= 1024) {
        return printf1("%.1f %s", static_cast<double>(kib) / 1024.0, "MB");
    }
    return std::to_string(kib) + " KB";
}

std::string formatFrequency(double baseMhz, double maxMhz)
{
    char buffer[64];
    if (baseMhz > 0.0 && maxMhz > 0.0) {
        std::snprintf(buffer, sizeof(buffer), "%.2f GHz (Max: %.2f GHz)",
                      baseMhz / 1000.0, maxMhz / 1000.0);
        return buffer;
    }
    if (baseMhz > 0.0) {
        std::snprintf(buffer, sizeof(buffer), "%.2f GHz", baseMhz / 1000.0);
        return buffer;
    }
    if (maxMhz > 0.0) {
        std::snprintf(buffer, sizeof(buffer), "Max: %.2f GHz", maxMhz / 1000.0);
        return buffer;
    }
    return "Unknown";
}

std::string formatGigabytes(std::uint64_t bytes)
{
    const double gib = static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0);
    return printf1("%.1f %s", gib, "GB");
}

std::string formatPercent(double percent)
{
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.1f%%", percent);
    return buffer;
}

} // namespace pctoolkit
