#pragma once

#include <QString>
#include <QStringList>

namespace pctoolkit {

// Runs a program to completion and returns its trimmed stdout. exitCode is
// set to -1 when the program cannot be started, times out or crashes.
QString runCommand(const QString &program,
                   const QStringList &arguments,
                   int *exitCode,
                   int timeoutMs = 30000);

// True when the effective uid is root.
bool isPrivileged();

bool isTrayRunning();
bool startTray();
bool startUi();

QString appIconPath();

} // namespace pctoolkit
