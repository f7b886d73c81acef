#include "probe/os_probe.hpp"

#include <QDateTime>
#include <QFileInfo>
#include <QStringList>
#include <QSysInfo>

#include <pwd.h>
#include <unistd.h>

#include <cmath>

#include "common/format_utils.hpp"
#include "common/sysfs_utils.hpp"

namespace pctoolkit {

QMap<QString, QString> parseOsRelease(const QString &text)
{
    QMap<QString, QString> values;
    for (const QString &rawLine : text.split(QLatin1Char('\n'))) {
        const QString line = rawLine.trimmed();
        if (line.isEmpty() || line.startsWith(QLatin1Char('#'))) {
            continue;
        }
        QString key;
        QString value;
        if (!splitKeyValue(line, QLatin1Char('='), &key, &value)) {
            continue;
        }
        if (value.size() >= 2
            && (value.startsWith(QLatin1Char('"')) || value.startsWith(QLatin1Char('\'')))
            && value.endsWith(value.at(0))) {
            value = value.mid(1, value.size() - 2);
        }
        values.insert(key, value);
    }
    return values;
}

std::int64_t readUptimeSeconds(const QString &root)
{
    const QString text = readTrimmedFile(rootedPath(root, QStringLiteral("/proc/uptime")));
    bool ok = false;
    const double seconds = text.section(QLatin1Char(' '), 0, 0).toDouble(&ok);
    if (!ok || seconds < 0.0) {
        return -1;
    }
    return static_cast<std::int64_t>(std::floor(seconds));
}

std::string readUptime(const QString &root)
{
    return formatUptime(readUptimeSeconds(root));
}

std::string describeSession(const QString &desktop, const QString &sessionType)
{
    if (desktop.isEmpty()) {
        return "Unknown";
    }
    if (sessionType.isEmpty()) {
        return desktop.toStdString();
    }
    return (desktop + QStringLiteral(" (") + sessionType + QLatin1Char(')')).toStdString();
}

OsProbe::OsProbe(const QString &root)
    : m_root(root)
{
}

OsInfo OsProbe::read()
{
    OsInfo info;
    info.deviceName = value("device_name");
    info.userName = value("user_name");
    info.edition = value("edition");
    info.version = value("version");
    info.build = value("build");
    info.installDate = value("install_date");
    info.experience = value("experience");
    info.arch = value("arch");
    return info;
}

std::string OsProbe::value(const std::string &key)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto it = m_cache.find(key);
        if (it != m_cache.end()) {
            return it->second;
        }
    }

    std::string loaded = load(key);
    if (loaded.empty()) {
        loaded = "Unknown";
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_cache[key] = loaded;
    return loaded;
}

void OsProbe::clearCache()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cache.clear();
}

QMap<QString, QString> OsProbe::osRelease() const
{
    QString text = readTrimmedFile(rootedPath(m_root, QStringLiteral("/etc/os-release")));
    if (text.isEmpty()) {
        text = readTrimmedFile(rootedPath(m_root, QStringLiteral("/usr/lib/os-release")));
    }
    return parseOsRelease(text);
}

std::string OsProbe::load(const std::string &key) const
{
    const bool live = isLiveSystem(m_root);

    if (key == "device_name") {
        return QSysInfo::machineHostName().toStdString();
    }

    if (key == "user_name") {
        if (const passwd *pw = getpwuid(geteuid())) {
            if (pw->pw_name && pw->pw_name[0] != '\0') {
                return pw->pw_name;
            }
        }
        return qEnvironmentVariable("USER").toStdString();
    }

    const QString kernel = [&]() {
        const QString release =
            readTrimmedFile(rootedPath(m_root, QStringLiteral("/proc/sys/kernel/osrelease")));
        if (!release.isEmpty() || !live) {
            return release;
        }
        return QSysInfo::kernelVersion();
    }();

    if (key == "edition") {
        const QString pretty = osRelease().value(QStringLiteral("PRETTY_NAME"));
        if (!pretty.isEmpty()) {
            return pretty.toStdString();
        }
        return live ? QSysInfo::prettyProductName().toStdString() : std::string();
    }

    if (key == "version") {
        const QMap<QString, QString> release = osRelease();
        QString version = release.value(QStringLiteral("VERSION_ID"));
        if (version.isEmpty()) {
            version = release.value(QStringLiteral("VERSION"));
        }
        if (version.isEmpty()) {
            version = kernel;
        }
        return version.toStdString();
    }

    if (key == "build") {
        return kernel.toStdString();
    }

    if (key == "install_date") {
        const QFileInfo machineId(rootedPath(m_root, QStringLiteral("/etc/machine-id")));
        if (!machineId.exists()) {
            return {};
        }
        QDateTime stamp = machineId.birthTime();
        if (!stamp.isValid()) {
            stamp = machineId.lastModified();
        }
        return stamp.isValid() ? stamp.toString(QStringLiteral("MM/dd/yyyy")).toStdString()
                               : std::string();
    }

    if (key == "experience") {
        return describeSession(qEnvironmentVariable("XDG_CURRENT_DESKTOP"),
                               qEnvironmentVariable("XDG_SESSION_TYPE"));
    }

    if (key == "arch") {
        return sizeof(void *) == 8 ? "64bit" : "32bit";
    }

    return {};
}

} // namespace pctoolkit
