#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include <QMap>
#include <QString>

#include "common/models.hpp"

namespace pctoolkit {

// KEY=value pairs of an os-release file, quotes removed.
QMap<QString, QString> parseOsRelease(const QString &text);

// First field of /proc/uptime in whole seconds, -1 when unreadable.
std::int64_t readUptimeSeconds(const QString &root = QString());

// Uptime formatted for display ("2 days, 03:04:05").
std::string readUptime(const QString &root = QString());

// "KDE (wayland)" from desktop and session type, "Unknown" without a desktop.
std::string describeSession(const QString &desktop, const QString &sessionType);

// Operating system description. Each value is read once and then cached
// until clearCache().
class OsProbe {
public:
    explicit OsProbe(const QString &root = QString());

    OsInfo read();
    std::string value(const std::string &key);
    void clearCache();

private:
    std::string load(const std::string &key) const;
    QMap<QString, QString> osRelease() const;

    QString m_root;
    std::mutex m_mutex;
    std::map<std::string, std::string> m_cache;
};

} // namespace pctoolkit
