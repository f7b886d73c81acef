#include "common/settings.hpp"

#include <QDir>

#include "common/logging.hpp"
#include <nlohmann/json.hpp>

namespace pctoolkit {

ToolkitSettings ToolkitSettings::fromEnvironment()
{
    ToolkitSettings settings;
    settings.traceEnabled = qEnvironmentVariableIntValue("PCTOOLKIT_TRACE") == 1;
    settings.noTrayOnStart = qEnvironmentVariableIntValue("PCTOOLKIT_NO_TRAY_ON_START") == 1;

    bool ok = false;
    const int interval = qEnvironmentVariableIntValue("PCTOOLKIT_REFRESH_INTERVAL_MS", &ok);
    if (ok) {
        settings.refreshIntervalMs = qMax(interval, kMinRefreshIntervalMs);
    }

    ok = false;
    const int minAge = qEnvironmentVariableIntValue("PCTOOLKIT_TEMP_MIN_AGE_HOURS", &ok);
    if (ok && minAge >= 0) {
        settings.tempMinAgeHours = minAge;
    } else if (ok) {
        PTLOG_WARN(QStringLiteral("ToolkitSettings"),
                   QStringLiteral("fromEnvironment"),
                   QStringLiteral("invalid_setting"),
                   QStringLiteral("negative_min_age"),
                   QStringLiteral("keep_default"),
                   pctoolkit::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"value", minAge}}));
    }

    const QString extra = qEnvironmentVariable("PCTOOLKIT_EXTRA_TEMP_DIRS");
    if (!extra.isEmpty()) {
        for (const QString &dir : extra.split(QLatin1Char(':'), Qt::SkipEmptyParts)) {
            settings.extraTempDirs.push_back(QDir::cleanPath(dir));
        }
    }

    const QString cleanupCmd = qEnvironmentVariable("PCTOOLKIT_DISK_CLEANUP_CMD").trimmed();
    if (!cleanupCmd.isEmpty()) {
        settings.diskCleanupCommand = cleanupCmd;
    }

    const QString root = qEnvironmentVariable("PCTOOLKIT_SYS_ROOT");
    if (!root.isEmpty()) {
        settings.sysRoot = QDir::cleanPath(root);
    }

    return settings;
}

} // namespace pctoolkit
