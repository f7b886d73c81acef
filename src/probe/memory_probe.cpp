#include "probe/memory_probe.hpp"

#include <QRegularExpression>
#include <QStringList>

#include <map>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "common/process_utils.hpp"
#include "common/sysfs_utils.hpp"

namespace pctoolkit {

namespace {

int parseSpeed(const QString &value)
{
    // "4800 MT/s", "3200 MHz", or "Unknown".
    const QStringList parts = value.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    if (parts.isEmpty()) {
        return 0;
    }
    bool ok = false;
    const int speed = parts.at(0).toInt(&ok);
    return ok && speed > 0 ? speed : 0;
}

bool isMissing(const QString &value)
{
    return value.isEmpty()
        || value == QStringLiteral("Unknown")
        || value == QStringLiteral("N/A");
}

std::string ramTypeFromText(const QString &type)
{
    bool isCode = false;
    const int code = type.toInt(&isCode);
    if (isCode) {
        return ramTypeFromSmbiosCode(code);
    }
    if (type.contains(QStringLiteral("DDR"), Qt::CaseInsensitive)) {
        return type.toStdString();
    }
    return {};
}

} // namespace

MemoryInfo parseMeminfo(const QString &text)
{
    std::map<QString, qulonglong> values;
    for (const QString &line : text.split(QLatin1Char('\n'))) {
        QString key;
        QString value;
        if (!splitKeyValue(line, QLatin1Char(':'), &key, &value)) {
            continue;
        }
        const QStringList parts = value.split(QLatin1Char(' '), Qt::SkipEmptyParts);
        if (parts.isEmpty()) {
            continue;
        }
        bool ok = false;
        const qulonglong kb = parts.at(0).toULongLong(&ok);
        if (ok) {
            values[key] = kb * 1024ULL;
        }
    }

    auto valueOf = [&values](const char *key) -> qulonglong {
        const auto it = values.find(QString::fromLatin1(key));
        return it == values.end() ? 0 : it->second;
    };

    MemoryInfo info;
    info.totalBytes = valueOf("MemTotal");
    if (values.count(QStringLiteral("MemAvailable")) > 0) {
        info.availableBytes = valueOf("MemAvailable");
    } else {
        info.availableBytes = valueOf("MemFree") + valueOf("Buffers") + valueOf("Cached");
    }
    if (info.availableBytes > info.totalBytes) {
        info.availableBytes = info.totalBytes;
    }
    info.usedBytes = info.totalBytes - info.availableBytes;
    info.percent = info.totalBytes > 0
        ? static_cast<double>(info.usedBytes) / static_cast<double>(info.totalBytes) * 100.0
        : 0.0;
    return info;
}

MemoryInfo readMemoryUsage(const QString &root)
{
    return parseMeminfo(readTrimmedFile(rootedPath(root, QStringLiteral("/proc/meminfo"))));
}

QString cleanDmiString(const QString &value)
{
    QString cleaned = value;
    cleaned.remove(QChar(u'\0'));
    cleaned = cleaned.simplified();

    static const QRegularExpression allZero(QStringLiteral("^0+$"));
    if (cleaned.compare(QStringLiteral("Not Specified"), Qt::CaseInsensitive) == 0
        || cleaned.compare(QStringLiteral("Undefined"), Qt::CaseInsensitive) == 0
        || cleaned.compare(QStringLiteral("Unknown"), Qt::CaseInsensitive) == 0
        || cleaned.compare(QStringLiteral("NO DIMM"), Qt::CaseInsensitive) == 0
        || allZero.match(cleaned).hasMatch()) {
        return {};
    }
    return cleaned;
}

std::vector<DmiMemoryDevice> parseDmiMemoryDevices(const QString &dmidecodeOutput)
{
    std::vector<DmiMemoryDevice> devices;
    DmiMemoryDevice current;
    bool inDevice = false;

    auto flush = [&]() {
        if (inDevice && !current.size.isEmpty()
            && !current.size.startsWith(QStringLiteral("No Module"), Qt::CaseInsensitive)
            && current.size != QStringLiteral("0")) {
            devices.push_back(current);
        }
        current = DmiMemoryDevice{};
        inDevice = false;
    };

    for (const QString &rawLine : dmidecodeOutput.split(QLatin1Char('\n'))) {
        const QString line = rawLine.trimmed();
        if (line.startsWith(QStringLiteral("Handle "))) {
            flush();
            continue;
        }
        if (line == QStringLiteral("Memory Device")) {
            inDevice = true;
            continue;
        }
        if (!inDevice) {
            continue;
        }

        QString key;
        QString value;
        if (!splitKeyValue(line, QLatin1Char(':'), &key, &value)) {
            continue;
        }
        if (key == QStringLiteral("Size")) {
            current.size = value;
        } else if (key == QStringLiteral("Locator")) {
            current.locator = value;
        } else if (key == QStringLiteral("Type")) {
            current.type = value;
        } else if (key == QStringLiteral("Manufacturer")) {
            current.manufacturer = value;
        } else if (key == QStringLiteral("Part Number")) {
            current.partNumber = value;
        } else if (key == QStringLiteral("Speed")) {
            current.speedMts = parseSpeed(value);
        } else if (key == QStringLiteral("Configured Memory Speed")
                   || key == QStringLiteral("Configured Clock Speed")) {
            current.configuredSpeedMts = parseSpeed(value);
        }
    }
    flush();
    return devices;
}

std::string ramTypeFromSmbiosCode(int code)
{
    switch (code) {
    case 20:
        return "DDR";
    case 21:
        return "DDR2";
    case 22:
        return "DDR2 FB-DIMM";
    case 24:
        return "DDR3";
    case 26:
        return "DDR4";
    case 34:
        return "DDR5";
    default:
        return {};
    }
}

RamDetails ramDetailsFromDevices(const std::vector<DmiMemoryDevice> &devices)
{
    RamDetails details;
    if (devices.empty()) {
        return details;
    }

    const DmiMemoryDevice &first = devices.front();
    const QString manufacturer = cleanDmiString(first.manufacturer);
    const QString partNumber = cleanDmiString(first.partNumber);

    if (!isMissing(partNumber)) {
        if (isMissing(manufacturer)
            || partNumber.contains(manufacturer, Qt::CaseInsensitive)) {
            details.ramName = partNumber.toStdString();
        } else {
            details.ramName = (manufacturer + QLatin1Char(' ') + partNumber).toStdString();
        }
    } else if (!isMissing(manufacturer)) {
        details.ramName = manufacturer.toStdString();
    }

    const int speed = first.configuredSpeedMts > 0 ? first.configuredSpeedMts
                                                   : first.speedMts;
    if (speed > 0) {
        details.ramSpeed = std::to_string(speed) + " MHz";
    }

    std::string type = ramTypeFromText(first.type.trimmed());
    if (type.empty() && !partNumber.isEmpty()) {
        const QString upper = partNumber.toUpper();
        for (const char *generation : {"DDR5", "DDR4", "DDR3", "DDR2"}) {
            if (upper.contains(QLatin1String(generation))) {
                type = generation;
                break;
            }
        }
    }
    if (type.empty() && speed > 0) {
        if (speed >= 4800) {
            type = "DDR5";
        } else if (speed >= 2133) {
            type = "DDR4";
        } else if (speed >= 800) {
            type = "DDR3";
        } else if (speed >= 400) {
            type = "DDR2";
        }
    }
    if (!type.empty()) {
        details.ramType = type;
    }

    details.ramSlots = std::to_string(devices.size()) + " slot(s) used";
    return details;
}

RamDetails readRamDetails(const QString &root)
{
    if (!isLiveSystem(root)) {
        return RamDetails{};
    }

    int exitCode = 0;
    const QString output = runCommand(QStringLiteral("dmidecode"),
                                      {QStringLiteral("--type"), QStringLiteral("17")},
                                      &exitCode, 10000);
    if (exitCode != 0 || output.isEmpty()) {
        PTLOG_DEBUG(QStringLiteral("MemoryProbe"),
                    QStringLiteral("readRamDetails"),
                    QStringLiteral("dmidecode_unavailable"),
                    QStringLiteral("needs_root_or_missing_tool"),
                    QStringLiteral("keep_unknown"),
                    pctoolkit::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"exitCode", exitCode}}));
        return RamDetails{};
    }
    return ramDetailsFromDevices(parseDmiMemoryDevices(output));
}

} // namespace pctoolkit
