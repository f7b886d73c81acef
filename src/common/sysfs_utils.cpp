#include "common/sysfs_utils.hpp"

#include <QDir>
#include <QFile>

namespace pctoolkit {

QString rootedPath(const QString &root, const QString &absolutePath)
{
    if (root.isEmpty() || root == QStringLiteral("/")) {
        return absolutePath;
    }
    return QDir::cleanPath(root + QLatin1Char('/') + absolutePath);
}

bool isLiveSystem(const QString &root)
{
    return root.isEmpty() || root == QStringLiteral("/");
}

QString readTrimmedFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return {};
    }
    return QString::fromUtf8(file.readAll()).trimmed();
}

QByteArray readBinaryFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return {};
    }
    return file.readAll();
}

std::optional<qulonglong> readUnsignedFile(const QString &path)
{
    const QString text = readTrimmedFile(path);
    if (text.isEmpty()) {
        return std::nullopt;
    }
    bool ok = false;
    const qulonglong value = text.toULongLong(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return value;
}

QStringList listEntries(const QString &dir, const QStringList &nameFilters)
{
    QDir directory(dir);
    if (!directory.exists()) {
        return {};
    }
    return directory.entryList(nameFilters,
                               QDir::AllEntries | QDir::System | QDir::NoDotAndDotDot,
                               QDir::Name);
}

bool splitKeyValue(const QString &line, QChar separator, QString *key, QString *value)
{
    const int pos = line.indexOf(separator);
    if (pos <= 0) {
        return false;
    }
    if (key) {
        *key = line.left(pos).trimmed();
    }
    if (value) {
        *value = line.mid(pos + 1).trimmed();
    }
    return true;
}

} // namespace pctoolkit
