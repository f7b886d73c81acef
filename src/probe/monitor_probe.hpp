#pragma once

#include <optional>
#include <string>

#include <QByteArray>
#include <QString>

#include "common/models.hpp"

namespace pctoolkit {

struct EdidInfo {
    QString manufacturerId;
    QString productCode;
    QString name;
    int width = 0;
    int height = 0;
    int refreshHz = 0;
};

// Base EDID block (128 bytes). Returns nullopt on a short block or bad header.
std::optional<EdidInfo> parseEdid(const QByteArray &edid);

// "<Mfr><Product> | <Name> | <W>x<H> @ <R>Hz", plus " (Primary)".
std::string formatMonitorLine(const EdidInfo &edid, bool primary);

// True when a DRM connector ("HDMI-A-1") names the same output as a screen
// name reported by the windowing system ("HDMI-1").
bool connectorMatchesScreen(const QString &connector, const QString &screenName);

/**
 * Connected monitors from /sys/class/drm/card*-* with an EDID. The connector
 * matching primaryScreenName is marked primary, else the first one.
 */
MonitorInfo readMonitorInfo(const QString &root = QString(),
                            const QString &primaryScreenName = QString());

} // namespace pctoolkit
