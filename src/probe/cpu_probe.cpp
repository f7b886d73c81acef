#include "probe/cpu_probe.hpp"

#include <QSet>
#include <QStringList>
#include <QSysInfo>
#include <QThread>

#include <cstdio>
#include <utility>

#include <nlohmann/json.hpp>

#include "common/format_utils.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"
#include "common/sysfs_utils.hpp"

namespace pctoolkit {

namespace {

const QString kCpuSysDir = QStringLiteral("/sys/devices/system/cpu");

QStringList cpuDirectories(const QString &root)
{
    QStringList result;
    const QString base = rootedPath(root, kCpuSysDir);
    for (const QString &entry : listEntries(base, {QStringLiteral("cpu*")})) {
        bool ok = false;
        entry.mid(3).toInt(&ok);
        if (ok) {
            result.push_back(base + QLatin1Char('/') + entry);
        }
    }
    return result;
}

int countTopologySets(const QString &root)
{
    QSet<QString> cores;
    for (const QString &dir : cpuDirectories(root)) {
        QString siblings = readTrimmedFile(dir + QStringLiteral("/topology/core_cpus_list"));
        if (siblings.isEmpty()) {
            siblings = readTrimmedFile(dir + QStringLiteral("/topology/thread_siblings_list"));
        }
        if (!siblings.isEmpty()) {
            cores.insert(siblings);
        }
    }
    return cores.size();
}

int countPackages(const QString &root)
{
    QSet<QString> packages;
    for (const QString &dir : cpuDirectories(root)) {
        const QString id = readTrimmedFile(dir + QStringLiteral("/topology/physical_package_id"));
        if (!id.isEmpty()) {
            packages.insert(id);
        }
    }
    return packages.size();
}

double readKhzAsMhz(const QString &path)
{
    const auto khz = readUnsignedFile(path);
    if (!khz.has_value() || *khz == 0) {
        return 0.0;
    }
    return static_cast<double>(*khz) / 1000.0;
}

bool isPlaceholder(const QString &value)
{
    const QString lower = value.trimmed().toLower();
    return lower.isEmpty()
        || lower == QStringLiteral("not specified")
        || lower == QStringLiteral("unknown")
        || lower == QStringLiteral("to be filled by o.e.m.");
}

} // namespace

CpuTopology parseProcCpuinfo(const QString &text)
{
    CpuTopology topology;
    QSet<QString> corePairs;
    QSet<QString> packages;
    double mhzSum = 0.0;
    int mhzCount = 0;

    QString physicalId;
    QString coreId;
    auto flushBlock = [&]() {
        if (!physicalId.isEmpty() && !coreId.isEmpty()) {
            corePairs.insert(physicalId + QLatin1Char(':') + coreId);
        }
        physicalId.clear();
        coreId.clear();
    };

    QString fallbackName;
    const QStringList lines = text.split(QLatin1Char('\n'));
    for (const QString &line : lines) {
        QString key;
        QString value;
        if (!splitKeyValue(line, QLatin1Char(':'), &key, &value)) {
            continue;
        }

        if (key == QStringLiteral("processor")) {
            flushBlock();
            ++topology.logicalCount;
        } else if (key == QStringLiteral("model name")) {
            if (topology.modelName.isEmpty()) {
                topology.modelName = value.simplified();
            }
        } else if (key == QStringLiteral("Hardware") || key == QStringLiteral("Processor")) {
            if (fallbackName.isEmpty()) {
                fallbackName = value.simplified();
            }
        } else if (key == QStringLiteral("physical id")) {
            physicalId = value;
            packages.insert(value);
        } else if (key == QStringLiteral("core id")) {
            coreId = value;
        } else if (key == QStringLiteral("cpu MHz")) {
            bool ok = false;
            const double mhz = value.toDouble(&ok);
            if (ok && mhz > 0.0) {
                mhzSum += mhz;
                ++mhzCount;
            }
        }
    }
    flushBlock();

    if (topology.modelName.isEmpty()) {
        topology.modelName = fallbackName;
    }
    topology.physicalCoreCount = corePairs.size();
    topology.socketCount = packages.size();
    topology.meanMhz = mhzCount > 0 ? mhzSum / mhzCount : 0.0;
    return topology;
}

QString parseSocketDesignation(const QString &dmidecodeOutput)
{
    for (const QString &line : dmidecodeOutput.split(QLatin1Char('\n'))) {
        QString key;
        QString value;
        if (!splitKeyValue(line, QLatin1Char(':'), &key, &value)) {
            continue;
        }
        if (key == QStringLiteral("Socket Designation") && !isPlaceholder(value)) {
            return value;
        }
    }
    return {};
}

double parseSmbiosCurrentSpeed(const QString &dmidecodeOutput)
{
    for (const QString &line : dmidecodeOutput.split(QLatin1Char('\n'))) {
        QString key;
        QString value;
        if (!splitKeyValue(line, QLatin1Char(':'), &key, &value)
            || key != QStringLiteral("Current Speed")) {
            continue;
        }
        const QStringList parts = value.split(QLatin1Char(' '), Qt::SkipEmptyParts);
        if (parts.size() == 2 && parts.at(1) == QStringLiteral("MHz")) {
            bool ok = false;
            const double mhz = parts.at(0).toDouble(&ok);
            if (ok && mhz > 0.0) {
                return mhz;
            }
        }
    }
    return 0.0;
}

std::uint64_t parseCacheSizeKib(const QString &text)
{
    QString value = text.trimmed().toUpper();
    if (value.endsWith(QStringLiteral("B"))) {
        value.chop(1);
    }
    std::uint64_t multiplier = 1;
    if (value.endsWith(QLatin1Char('K'))) {
        value.chop(1);
    } else if (value.endsWith(QLatin1Char('M'))) {
        value.chop(1);
        multiplier = 1024;
    } else if (value.endsWith(QLatin1Char('G'))) {
        value.chop(1);
        multiplier = 1024 * 1024;
    }
    bool ok = false;
    const qulonglong number = value.trimmed().toULongLong(&ok);
    if (!ok) {
        return 0;
    }
    return static_cast<std::uint64_t>(number) * multiplier;
}

std::string readCacheDisplay(const QString &root)
{
    const QString cacheDir = rootedPath(root, kCpuSysDir + QStringLiteral("/cpu0/cache"));
    std::uint64_t l1 = 0;
    std::uint64_t l2 = 0;
    std::uint64_t l3 = 0;

    for (const QString &index : listEntries(cacheDir, {QStringLiteral("index*")})) {
        const QString dir = cacheDir + QLatin1Char('/') + index;
        const auto level = readUnsignedFile(dir + QStringLiteral("/level"));
        const std::uint64_t kib = parseCacheSizeKib(readTrimmedFile(dir + QStringLiteral("/size")));
        if (!level.has_value() || kib == 0) {
            continue;
        }
        // L1 data and instruction caches are reported together.
        if (*level == 1) {
            l1 += kib;
        } else if (*level == 2) {
            l2 += kib;
        } else if (*level == 3) {
            l3 += kib;
        }
    }

    std::string display;
    const std::pair<const char *, std::uint64_t> levels[] = {
        {"L1", l1}, {"L2", l2}, {"L3", l3}};
    for (const auto &entry : levels) {
        if (entry.second == 0) {
            continue;
        }
        if (!display.empty()) {
            display += " | ";
        }
        display += std::string(entry.first) + " - " + formatCacheSize(entry.second);
    }
    return display.empty() ? std::string("Unknown") : display;
}

CpuInfo readCpuInfo(const QString &root)
{
    CpuInfo info;
    const CpuTopology topology =
        parseProcCpuinfo(readTrimmedFile(rootedPath(root, QStringLiteral("/proc/cpuinfo"))));

    QString name = topology.modelName;
    if (name.isEmpty()) {
        name = QSysInfo::currentCpuArchitecture();
    }
    info.name = name.isEmpty() ? std::string("Unknown Processor") : name.toStdString();

    info.logicalCores = topology.logicalCount > 0 ? topology.logicalCount
                                                  : QThread::idealThreadCount();
    info.physicalCores = topology.physicalCoreCount;
    if (info.physicalCores == 0) {
        info.physicalCores = countTopologySets(root);
    }
    if (info.physicalCores == 0) {
        info.physicalCores = info.logicalCores;
    }
    info.cores = std::to_string(info.physicalCores) + " cores, "
        + std::to_string(info.logicalCores) + " threads";

    const QString cpu0 = rootedPath(root, kCpuSysDir + QStringLiteral("/cpu0/cpufreq"));
    info.baseMhz = readKhzAsMhz(cpu0 + QStringLiteral("/base_frequency"));
    info.maxMhz = readKhzAsMhz(cpu0 + QStringLiteral("/cpuinfo_max_freq"));

    QString smbiosProcessor;
    if (isLiveSystem(root)) {
        int exitCode = 0;
        smbiosProcessor = runCommand(QStringLiteral("dmidecode"),
                                     {QStringLiteral("-t"), QStringLiteral("processor")},
                                     &exitCode, 5000);
        if (exitCode != 0) {
            smbiosProcessor.clear();
        }
    }
    if (info.baseMhz <= 0.0) {
        info.baseMhz = parseSmbiosCurrentSpeed(smbiosProcessor);
    }
    info.frequency = formatFrequency(info.baseMhz, info.maxMhz);
    info.cacheDisplay = readCacheDisplay(root);

    const QString designation = parseSocketDesignation(smbiosProcessor);
    int sockets = topology.socketCount;
    if (sockets == 0) {
        sockets = countPackages(root);
    }
    if (!designation.isEmpty()) {
        info.sockets = designation.toStdString();
    } else if (sockets > 0) {
        info.sockets = std::to_string(sockets) + " socket(s)";
    } else {
        info.sockets = "Unknown";
    }

    PTLOG_DEBUG(QStringLiteral("CpuProbe"),
                QStringLiteral("readCpuInfo"),
                QStringLiteral("cpu_info_read"),
                QStringLiteral("static_probe"),
                QStringLiteral("procfs_sysfs"),
                pctoolkit::logging::defaultWho(),
                QString(),
                (nlohmann::json{{"name", info.name},
                                {"physical", info.physicalCores},
                                {"logical", info.logicalCores}}));
    return info;
}

std::string readCurrentSpeed(const QString &root)
{
    double sum = 0.0;
    int count = 0;
    for (const QString &dir : cpuDirectories(root)) {
        const double mhz = readKhzAsMhz(dir + QStringLiteral("/cpufreq/scaling_cur_freq"));
        if (mhz > 0.0) {
            sum += mhz;
            ++count;
        }
    }

    double mhz = count > 0 ? sum / count : 0.0;
    if (mhz <= 0.0) {
        mhz = parseProcCpuinfo(
                  readTrimmedFile(rootedPath(root, QStringLiteral("/proc/cpuinfo"))))
                  .meanMhz;
    }
    if (mhz <= 0.0) {
        return "Unknown";
    }

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f GHz", mhz / 1000.0);
    return buffer;
}

std::optional<CpuTimes> parseProcStat(const QString &text)
{
    for (const QString &line : text.split(QLatin1Char('\n'))) {
        const QStringList fields = line.split(QLatin1Char(' '), Qt::SkipEmptyParts);
        if (fields.isEmpty() || fields.at(0) != QStringLiteral("cpu")) {
            continue;
        }
        if (fields.size() < 5) {
            return std::nullopt;
        }

        // user nice system idle iowait irq softirq steal; guest time is
        // already part of user.
        CpuTimes times;
        const int last = qMin(fields.size() - 1, 8);
        for (int i = 1; i <= last; ++i) {
            bool ok = false;
            const qulonglong value = fields.at(i).toULongLong(&ok);
            if (!ok) {
                return std::nullopt;
            }
            times.total += value;
            if (i == 4 || i == 5) {
                times.idle += value;
            }
        }
        return times;
    }
    return std::nullopt;
}

CpuUsageSampler::CpuUsageSampler(const QString &root)
    : m_root(root)
{
}

double CpuUsageSampler::sample()
{
    const auto current =
        parseProcStat(readTrimmedFile(rootedPath(m_root, QStringLiteral("/proc/stat"))));
    if (!current.has_value()) {
        return 0.0;
    }

    const std::optional<CpuTimes> previous = m_previous;
    m_previous = current;
    if (!previous.has_value() || current->total <= previous->total) {
        return 0.0;
    }

    const double totalDelta = static_cast<double>(current->total - previous->total);
    const double idleDelta = current->idle >= previous->idle
        ? static_cast<double>(current->idle - previous->idle)
        : 0.0;
    const double busy = (totalDelta - idleDelta) / totalDelta * 100.0;
    return qBound(0.0, busy, 100.0);
}

} // namespace pctoolkit
