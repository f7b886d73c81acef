#include "probe/monitor_probe.hpp"

#include <QStringList>

#include <cmath>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "common/sysfs_utils.hpp"

namespace pctoolkit {

namespace {

constexpr int kEdidBlockSize = 128;
constexpr int kDescriptorOffsets[] = {54, 72, 90, 108};
constexpr unsigned char kMonitorNameTag = 0xFC;

int byteAt(const QByteArray &data, int index)
{
    return static_cast<unsigned char>(data.at(index));
}

struct Connector {
    QString name;
    EdidInfo edid;
};

} // namespace

std::optional<EdidInfo> parseEdid(const QByteArray &edid)
{
    static const QByteArray header = QByteArray::fromHex("00ffffffffffff00");
    if (edid.size() < kEdidBlockSize || !edid.startsWith(header)) {
        return std::nullopt;
    }

    EdidInfo info;

    // Three 5-bit letters, 'A' == 1.
    const int packed = (byteAt(edid, 8) << 8) | byteAt(edid, 9);
    const int letters[] = {(packed >> 10) & 0x1F, (packed >> 5) & 0x1F, packed & 0x1F};
    for (int letter : letters) {
        if (letter < 1 || letter > 26) {
            info.manufacturerId.clear();
            break;
        }
        info.manufacturerId.append(QLatin1Char(static_cast<char>('A' + letter - 1)));
    }

    const int product = byteAt(edid, 10) | (byteAt(edid, 11) << 8);
    info.productCode = QStringLiteral("%1").arg(product, 4, 16, QLatin1Char('0')).toUpper();

    bool timingSeen = false;
    for (int offset : kDescriptorOffsets) {
        const int pixelClock = byteAt(edid, offset) | (byteAt(edid, offset + 1) << 8);
        if (pixelClock != 0) {
            if (timingSeen) {
                continue;
            }
            timingSeen = true;
            const int hActive = byteAt(edid, offset + 2) | ((byteAt(edid, offset + 4) & 0xF0) << 4);
            const int hBlank = byteAt(edid, offset + 3) | ((byteAt(edid, offset + 4) & 0x0F) << 8);
            const int vActive = byteAt(edid, offset + 5) | ((byteAt(edid, offset + 7) & 0xF0) << 4);
            const int vBlank = byteAt(edid, offset + 6) | ((byteAt(edid, offset + 7) & 0x0F) << 8);
            info.width = hActive;
            info.height = vActive;
            const double total = static_cast<double>(hActive + hBlank) * (vActive + vBlank);
            if (total > 0.0) {
                // Pixel clock is stored in 10 kHz units.
                info.refreshHz = static_cast<int>(std::lround(pixelClock * 10000.0 / total));
            }
            continue;
        }

        if (byteAt(edid, offset + 3) == kMonitorNameTag && info.name.isEmpty()) {
            QByteArray text = edid.mid(offset + 5, 13);
            const int newline = text.indexOf('\n');
            if (newline >= 0) {
                text.truncate(newline);
            }
            info.name = QString::fromLatin1(text).trimmed();
        }
    }
    return info;
}

std::string formatMonitorLine(const EdidInfo &edid, bool primary)
{
    const QString manufacturer = edid.manufacturerId.isEmpty() ? QStringLiteral("Unknown")
                                                               : edid.manufacturerId;
    const QString product = edid.productCode.isEmpty() ? QStringLiteral("Unknown")
                                                       : edid.productCode;
    QString name = edid.name.isEmpty() ? QStringLiteral("Unknown Monitor") : edid.name;
    // Drops a leading "AOC " style vendor word, never part of a longer word
    // such as "DELL".
    const int idLength = edid.manufacturerId.size();
    if (idLength > 0 && name.size() > idLength
        && name.startsWith(edid.manufacturerId, Qt::CaseInsensitive)
        && !name.at(idLength).isLetterOrNumber()) {
        const QString rest = name.mid(idLength).trimmed();
        if (!rest.isEmpty()) {
            name = rest;
        }
    }

    QString resolution = QStringLiteral("Unknown");
    if (edid.width > 0 && edid.height > 0) {
        resolution = QStringLiteral("%1x%2").arg(edid.width).arg(edid.height);
    }
    QString line = manufacturer + product + QStringLiteral(" | ") + name
        + QStringLiteral(" | ") + resolution;
    if (edid.refreshHz > 0) {
        line += QStringLiteral(" @ %1Hz").arg(edid.refreshHz);
    }
    if (primary) {
        line += QStringLiteral(" (Primary)");
    }
    return line.toStdString();
}

bool connectorMatchesScreen(const QString &connector, const QString &screenName)
{
    if (screenName.isEmpty()) {
        return false;
    }
    if (connector.compare(screenName, Qt::CaseInsensitive) == 0) {
        return true;
    }
    // X11 drops the "-A" of HDMI-A-1 and DVI-D-1 style names.
    QString normalized = connector;
    normalized.replace(QStringLiteral("HDMI-A-"), QStringLiteral("HDMI-"));
    normalized.replace(QStringLiteral("DVI-D-"), QStringLiteral("DVI-"));
    normalized.replace(QStringLiteral("DVI-I-"), QStringLiteral("DVI-"));
    return normalized.compare(screenName, Qt::CaseInsensitive) == 0;
}

MonitorInfo readMonitorInfo(const QString &root, const QString &primaryScreenName)
{
    const QString drmDir = rootedPath(root, QStringLiteral("/sys/class/drm"));
    std::vector<Connector> connectors;

    for (const QString &entry : listEntries(drmDir, {QStringLiteral("card*-*")})) {
        const QString dir = drmDir + QLatin1Char('/') + entry;
        if (readTrimmedFile(dir + QStringLiteral("/status")) != QStringLiteral("connected")) {
            continue;
        }
        const auto edid = parseEdid(readBinaryFile(dir + QStringLiteral("/edid")));
        if (!edid.has_value()) {
            continue;
        }
        // "card0-DP-1" -> "DP-1"
        connectors.push_back({entry.section(QLatin1Char('-'), 1), *edid});
    }

    MonitorInfo info;
    if (connectors.empty()) {
        info.monitors = {"No monitors detected"};
        info.count = 0;
        return info;
    }

    std::size_t primary = 0;
    for (std::size_t i = 0; i < connectors.size(); ++i) {
        if (connectorMatchesScreen(connectors[i].name, primaryScreenName)) {
            primary = i;
            break;
        }
    }

    for (std::size_t i = 0; i < connectors.size(); ++i) {
        info.monitors.push_back(formatMonitorLine(connectors[i].edid, i == primary));
    }
    info.count = static_cast<int>(info.monitors.size());

    PTLOG_DEBUG(QStringLiteral("MonitorProbe"),
                QStringLiteral("readMonitorInfo"),
                QStringLiteral("monitors_read"),
                QStringLiteral("static_probe"),
                QStringLiteral("drm_edid"),
                pctoolkit::logging::defaultWho(),
                QString(),
                (nlohmann::json{{"count", info.count},
                                {"primaryHint", primaryScreenName.toStdString()}}));
    return info;
}

} // namespace pctoolkit
