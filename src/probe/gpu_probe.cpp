#include "probe/gpu_probe.hpp"

#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>
#include <QStringList>

#include <utility>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "common/process_utils.hpp"
#include "common/sysfs_utils.hpp"

namespace pctoolkit {

namespace {

constexpr std::uint64_t kMiB = 1024ULL * 1024ULL;

std::optional<double> toDouble(const QString &text)
{
    bool ok = false;
    const double value = text.trimmed().toDouble(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return value;
}

GpuInfo noGpu()
{
    GpuInfo info;
    info.available = false;
    info.name = "No GPU detected";
    info.source = "none";
    return info;
}

} // namespace

std::optional<GpuInfo> parseNvidiaSmiOutput(const QString &output)
{
    const QString firstLine = output.trimmed().section(QLatin1Char('\n'), 0, 0).trimmed();
    if (firstLine.isEmpty()) {
        return std::nullopt;
    }

    const QStringList fields = firstLine.split(QStringLiteral(", "));
    if (fields.size() < 5) {
        return std::nullopt;
    }

    const auto usage = toDouble(fields.at(1));
    const auto memUsed = toDouble(fields.at(2));
    const auto memTotal = toDouble(fields.at(3));
    const auto temperature = toDouble(fields.at(4));
    if (!usage || !memUsed || !memTotal || !temperature) {
        return std::nullopt;
    }

    GpuInfo info;
    info.available = true;
    info.name = fields.at(0).trimmed().toStdString();
    info.usagePercent = *usage;
    info.memoryUsedBytes = static_cast<std::uint64_t>(*memUsed * kMiB);
    info.memoryTotalBytes = static_cast<std::uint64_t>(*memTotal * kMiB);
    info.temperatureC = *temperature;
    info.source = "nvidia-smi";
    return info;
}

QString parseLspciDeviceName(const QString &output)
{
    const QString line = output.trimmed().section(QLatin1Char('\n'), 0, 0);
    // "03:00.0 VGA compatible controller: <name> (rev c8)"
    const int colon = line.indexOf(QStringLiteral(": "));
    if (colon < 0) {
        return {};
    }
    QString name = line.mid(colon + 2).trimmed();
    static const QRegularExpression revision(QStringLiteral("\\s*\\(rev [0-9a-fA-F]+\\)$"));
    name.remove(revision);
    return name;
}

std::optional<GpuInfo> readDrmGpu(const QString &root)
{
    const QString drmDir = rootedPath(root, QStringLiteral("/sys/class/drm"));
    for (const QString &card : listEntries(drmDir, {QStringLiteral("card*")})) {
        if (card.contains(QLatin1Char('-'))) {
            continue;
        }
        const QString device = drmDir + QLatin1Char('/') + card + QStringLiteral("/device");
        const auto busy = readUnsignedFile(device + QStringLiteral("/gpu_busy_percent"));
        const auto vramTotal = readUnsignedFile(device + QStringLiteral("/mem_info_vram_total"));
        if (!busy.has_value() && !vramTotal.has_value()) {
            continue;
        }

        GpuInfo info;
        info.available = true;
        info.source = "drm";
        info.usagePercent = busy.value_or(0);
        info.memoryTotalBytes = vramTotal.value_or(0);
        info.memoryUsedBytes =
            readUnsignedFile(device + QStringLiteral("/mem_info_vram_used")).value_or(0);

        const QString hwmonDir = device + QStringLiteral("/hwmon");
        for (const QString &hwmon : listEntries(hwmonDir, {QStringLiteral("hwmon*")})) {
            const auto milli = readUnsignedFile(hwmonDir + QLatin1Char('/') + hwmon
                                                + QStringLiteral("/temp1_input"));
            if (milli.has_value()) {
                info.temperatureC = static_cast<double>(*milli) / 1000.0;
                break;
            }
        }

        QString name;
        if (isLiveSystem(root)) {
            const QString slot = QFileInfo(QFileInfo(device).canonicalFilePath()).fileName();
            if (!slot.isEmpty()) {
                int exitCode = 0;
                const QString lspci = runCommand(QStringLiteral("lspci"),
                                                 {QStringLiteral("-s"), slot},
                                                 &exitCode, 3000);
                if (exitCode == 0) {
                    name = parseLspciDeviceName(lspci);
                }
            }
        }
        if (name.isEmpty()) {
            const QString vendor = readTrimmedFile(device + QStringLiteral("/vendor"));
            const QString model = readTrimmedFile(device + QStringLiteral("/device"));
            name = QStringLiteral("GPU %1:%2")
                       .arg(vendor.isEmpty() ? QStringLiteral("unknown") : vendor,
                            model.isEmpty() ? QStringLiteral("unknown") : model);
        }
        info.name = name.toStdString();
        return info;
    }
    return std::nullopt;
}

GpuProbe::GpuProbe(const QString &root, Clock clock)
    : m_root(root)
    , m_clock(std::move(clock))
{
    if (!m_clock) {
        m_clock = [] { return std::chrono::steady_clock::now(); };
    }
}

GpuInfo GpuProbe::read()
{
    const auto now = m_clock();
    if (m_cached.has_value() && now - m_cachedAt < kCacheTtl) {
        return *m_cached;
    }

    m_cached = probe();
    m_cachedAt = now;
    return *m_cached;
}

void GpuProbe::invalidate()
{
    m_cached.reset();
}

GpuInfo GpuProbe::probe() const
{
    if (isLiveSystem(m_root)) {
        int exitCode = 0;
        const QString output = runCommand(
            QStringLiteral("nvidia-smi"),
            {QStringLiteral("--query-gpu=name,utilization.gpu,memory.used,memory.total,temperature.gpu"),
             QStringLiteral("--format=csv,noheader,nounits")},
            &exitCode, 3000);
        if (exitCode == 0) {
            if (auto info = parseNvidiaSmiOutput(output)) {
                return *info;
            }
        }
    }

    if (auto info = readDrmGpu(m_root)) {
        return *info;
    }

    PTLOG_DEBUG(QStringLiteral("GpuProbe"),
                QStringLiteral("probe"),
                QStringLiteral("no_gpu_detected"),
                QStringLiteral("no_nvidia_smi_or_drm_counters"),
                QStringLiteral("cache_negative_result"),
                pctoolkit::logging::defaultWho(),
                QString(),
                nlohmann::json::object());
    return noGpu();
}

} // namespace pctoolkit
