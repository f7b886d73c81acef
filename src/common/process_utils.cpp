#include "common/process_utils.hpp"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>

#include <unistd.h>

#include "common/logging.hpp"
#include <nlohmann/json.hpp>

namespace pctoolkit {

namespace {

QString findSiblingBinary(const QString &name)
{
    const QString appDir = QCoreApplication::applicationDirPath();
    const QStringList relCandidates = {
        QStringLiteral("."),
        QStringLiteral(".."),
        QStringLiteral("../src/tray"),
        QStringLiteral("../src/ui"),
        QStringLiteral("../../src/tray"),
        QStringLiteral("../../src/ui"),
        QStringLiteral("../bin"),
    };

    for (const QString &relPath : relCandidates) {
        const QString candidate =
            QDir(appDir).absoluteFilePath(relPath + QLatin1Char('/') + name);
        const QFileInfo info(candidate);
        if (info.exists() && info.isFile() && info.isExecutable()) {
            return info.absoluteFilePath();
        }
    }
    return QString();
}

bool launchDetached(const QString &binary, const QString &what)
{
    PTLOG_INFO(QStringLiteral("ProcessUtils"),
               QStringLiteral("launchDetached"),
               what,
               QStringLiteral("user_action"),
               QStringLiteral("process_start"),
               pctoolkit::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"binary", binary.toStdString()}}));

    // Sibling binary first so a build tree launches its own executables.
    const QString sibling = findSiblingBinary(binary);
    if (!sibling.isEmpty() && QProcess::startDetached(sibling, {})) {
        return true;
    }
    return QProcess::startDetached(binary, {});
}

} // namespace

QString runCommand(const QString &program, const QStringList &arguments,
                   int *exitCode, int timeoutMs)
{
    QProcess process;
    process.start(program, arguments);
    if (!process.waitForStarted(timeoutMs)) {
        if (exitCode) {
            *exitCode = -1;
        }
        return {};
    }

    process.closeWriteChannel();

    if (!process.waitForFinished(timeoutMs)) {
        process.kill();
        process.waitForFinished(1000);
        PTLOG_WARN(QStringLiteral("ProcessUtils"),
                   QStringLiteral("runCommand"),
                   QStringLiteral("command_timeout"),
                   QStringLiteral("deadline_exceeded"),
                   QStringLiteral("QProcess::kill"),
                   pctoolkit::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"program", program.toStdString()},
                                   {"timeoutMs", timeoutMs}}));
        if (exitCode) {
            *exitCode = -1;
        }
        return {};
    }

    if (process.exitStatus() != QProcess::NormalExit) {
        if (exitCode) {
            *exitCode = -1;
        }
        return {};
    }

    if (exitCode) {
        *exitCode = process.exitCode();
    }
    return QString::fromUtf8(process.readAllStandardOutput()).trimmed();
}

bool isPrivileged()
{
    return geteuid() == 0;
}

bool isTrayRunning()
{
    QProcess proc;
    proc.start(QStringLiteral("pgrep"), {QStringLiteral("-x"),
                                         QStringLiteral("pctoolkit-tray")});
    if (!proc.waitForFinished(500)) {
        return false;
    }
    return proc.exitCode() == 0;
}

bool startTray()
{
    return launchDetached(QStringLiteral("pctoolkit-tray"), QStringLiteral("start_tray"));
}

bool startUi()
{
    return launchDetached(QStringLiteral("pctoolkit"), QStringLiteral("start_ui"));
}

QString appIconPath()
{
    const QString appDir = QCoreApplication::applicationDirPath();
    const QStringList candidates = {
        QDir(appDir).absoluteFilePath(QStringLiteral("../share/pctoolkit/pctoolkit.svg")),
        QDir(appDir).absoluteFilePath(QStringLiteral("../../assets/pctoolkit.svg")),
        QDir(appDir).absoluteFilePath(QStringLiteral("../../../assets/pctoolkit.svg")),
    };
    for (const QString &candidate : candidates) {
        if (QFileInfo::exists(candidate)) {
            return QFileInfo(candidate).absoluteFilePath();
        }
    }
    return QStandardPaths::locate(QStandardPaths::GenericDataLocation,
                                  QStringLiteral("icons/hicolor/scalable/apps/pctoolkit.svg"));
}

} // namespace pctoolkit
