#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>

#include <optional>

namespace pctoolkit {

// Joins an absolute system path ("/proc/meminfo") onto an optional root
// prefix so probes can run against a copied tree.
QString rootedPath(const QString &root, const QString &absolutePath);

// External tools (dmidecode, lspci, nvidia-smi) describe the running machine,
// so probes only consult them when no root prefix is set.
bool isLiveSystem(const QString &root);

// Whole file as trimmed UTF-8 text; empty when the file cannot be read.
QString readTrimmedFile(const QString &path);

QByteArray readBinaryFile(const QString &path);

std::optional<qulonglong> readUnsignedFile(const QString &path);

// Entries of a directory matching a name filter, sorted by name.
QStringList listEntries(const QString &dir, const QStringList &nameFilters = {});

// "key : value" style line split used by /proc/cpuinfo and dmidecode.
bool splitKeyValue(const QString &line, QChar separator, QString *key, QString *value);

} // namespace pctoolkit
