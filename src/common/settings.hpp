#pragma once

#include <QString>
#include <QStringList>

namespace pctoolkit {

constexpr int kDefaultRefreshIntervalMs = 8000;
constexpr int kMinRefreshIntervalMs = 1000;
constexpr int kErrorRetryIntervalMs = 5000;
constexpr int kDefaultTempMinAgeHours = 24;

struct ToolkitSettings {
    bool traceEnabled = false;
    int refreshIntervalMs = kDefaultRefreshIntervalMs;
    int tempMinAgeHours = kDefaultTempMinAgeHours;
    QStringList extraTempDirs;
    QString diskCleanupCommand = QStringLiteral("journalctl --vacuum-time=14d");
    // Prefix for /proc, /sys, /etc and the system temp folders. Empty means
    // the live system.
    QString sysRoot;
    bool noTrayOnStart = false;

    // Reads the PCTOOLKIT_* environment variables; invalid values keep defaults.
    static ToolkitSettings fromEnvironment();
};

} // namespace pctoolkit
