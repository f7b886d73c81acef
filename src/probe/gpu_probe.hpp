#pragma once

#include <chrono>
#include <functional>
#include <optional>

#include <QString>

#include "common/models.hpp"

namespace pctoolkit {

// First line of `nvidia-smi --query-gpu=name,utilization.gpu,memory.used,
// memory.total,temperature.gpu --format=csv,noheader,nounits`.
std::optional<GpuInfo> parseNvidiaSmiOutput(const QString &output);

// Device name from `lspci -s <slot>`, without class prefix and revision.
QString parseLspciDeviceName(const QString &output);

// First DRM card whose driver exposes busy percent or VRAM counters.
std::optional<GpuInfo> readDrmGpu(const QString &root = QString());

/**
 * GPU status with a short-lived cache. nvidia-smi is tried first, then DRM
 * sysfs. Results, including "No GPU detected", are kept for 10 seconds so the
 * refresh loop does not spawn nvidia-smi every cycle.
 */
class GpuProbe {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    static constexpr std::chrono::seconds kCacheTtl{10};

    explicit GpuProbe(const QString &root = QString(), Clock clock = Clock());

    GpuInfo read();
    void invalidate();

private:
    GpuInfo probe() const;

    QString m_root;
    Clock m_clock;
    std::optional<GpuInfo> m_cached;
    std::chrono::steady_clock::time_point m_cachedAt;
};

} // namespace pctoolkit
