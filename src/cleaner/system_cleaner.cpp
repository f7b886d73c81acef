#include "cleaner/system_cleaner.hpp"

#include <QDateTime>
#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QProcess>

#include <malloc.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

#include "common/format_utils.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"
#include "common/sysfs_utils.hpp"
#include "probe/memory_probe.hpp"
#include "store/toolkit_store.hpp"

namespace pctoolkit {

namespace {

QString sizeText(std::int64_t bytes)
{
    return QString::fromStdString(formatBinarySize(bytes));
}

QString homeRelative(const QString &envName, const QString &fallback)
{
    const QString value = qEnvironmentVariable(envName.toUtf8().constData());
    if (!value.isEmpty()) {
        return value;
    }
    return QDir::homePath() + QLatin1Char('/') + fallback;
}

CleanupRun startRun(CleanupKind kind)
{
    CleanupRun run;
    run.kind = kind;
    run.timestamp = std::chrono::system_clock::now();
    return run;
}

} // namespace

SystemCleaner::SystemCleaner(const ToolkitSettings &settings, QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_privilegeCheck([]() { return pctoolkit::isPrivileged(); })
{
}

void SystemCleaner::setPrivilegeCheck(PrivilegeCheck check)
{
    m_privilegeCheck = std::move(check);
}

void SystemCleaner::setStore(ToolkitStore *store)
{
    m_store = store;
}

bool SystemCleaner::isPrivileged() const
{
    return m_privilegeCheck && m_privilegeCheck();
}

QStringList SystemCleaner::tempFolders() const
{
    QStringList candidates = {
        qEnvironmentVariable("TMPDIR"),
        qEnvironmentVariable("TMP"),
        rootedPath(m_settings.sysRoot, QStringLiteral("/tmp")),
        rootedPath(m_settings.sysRoot, QStringLiteral("/var/tmp")),
        homeRelative(QStringLiteral("XDG_CACHE_HOME"), QStringLiteral(".cache"))
            + QStringLiteral("/thumbnails"),
    };
    candidates.append(m_settings.extraTempDirs);

    QStringList folders;
    for (const QString &candidate : candidates) {
        if (candidate.trimmed().isEmpty()) {
            continue;
        }
        const QString cleaned = QDir::cleanPath(candidate);
        if (!folders.contains(cleaned)) {
            folders.push_back(cleaned);
        }
    }
    return folders;
}

QString SystemCleaner::trashDirectory() const
{
    return homeRelative(QStringLiteral("XDG_DATA_HOME"), QStringLiteral(".local/share"))
        + QStringLiteral("/Trash");
}

std::int64_t SystemCleaner::directorySize(const QString &path)
{
    std::int64_t total = 0;
    QDirIterator it(path,
                    QDir::Files | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        it.next();
        const QFileInfo info = it.fileInfo();
        if (info.isFile() && !info.isSymLink()) {
            total += info.size();
        }
    }
    return total;
}

SystemCleaner::RemoveResult SystemCleaner::removeEntry(const QString &path,
                                                       const QDateTime &cutoff,
                                                       std::int64_t *bytes,
                                                       QString *error) const
{
    const QByteArray nativePath = QFile::encodeName(path);
    struct stat st {};
    if (lstat(nativePath.constData(), &st) != 0) {
        if (error->isEmpty()) {
            *error = QString::fromLocal8Bit(std::strerror(errno));
        }
        return RemoveResult::Failed;
    }

    if (cutoff.isValid() && st.st_mtime > cutoff.toSecsSinceEpoch()) {
        return RemoveResult::Skipped;
    }

    if (S_ISREG(st.st_mode) || S_ISLNK(st.st_mode)) {
        if (::unlink(nativePath.constData()) != 0) {
            if (error->isEmpty()) {
                *error = QString::fromLocal8Bit(std::strerror(errno));
            }
            return RemoveResult::Failed;
        }
        if (S_ISREG(st.st_mode)) {
            *bytes += static_cast<std::int64_t>(st.st_size);
        }
        return RemoveResult::Removed;
    }

    if (S_ISDIR(st.st_mode)) {
        // Children first. The directory goes only when nothing was kept.
        RemoveResult result = RemoveResult::Removed;
        const QDir dir(path);
        const QStringList children =
            dir.entryList(QDir::AllEntries | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot);
        for (const QString &child : children) {
            const RemoveResult childResult = removeEntry(dir.filePath(child), cutoff, bytes, error);
            if (childResult == RemoveResult::Failed) {
                result = RemoveResult::Failed;
            } else if (childResult == RemoveResult::Skipped && result == RemoveResult::Removed) {
                result = RemoveResult::Skipped;
            }
        }
        if (result != RemoveResult::Removed) {
            return result;
        }
        if (::rmdir(nativePath.constData()) != 0) {
            if (error->isEmpty()) {
                *error = QString::fromLocal8Bit(std::strerror(errno));
            }
            return RemoveResult::Failed;
        }
        return RemoveResult::Removed;
    }

    // Sockets, FIFOs and device nodes belong to running programs.
    return RemoveResult::Skipped;
}

CleanupRun SystemCleaner::cleanTempFiles()
{
    CleanupRun run = startRun(CleanupKind::TempFiles);
    status(QStringLiteral("🧹 Cleaning..."));

    const QDateTime cutoff = m_settings.tempMinAgeHours > 0
        ? QDateTime::currentDateTime().addSecs(-3600LL * m_settings.tempMinAgeHours)
        : QDateTime();

    std::uint64_t cleanedCount = 0;
    std::int64_t totalSize = 0;
    int failures = 0;
    nlohmann::json folderDetails = nlohmann::json::array();

    for (const QString &folder : tempFolders()) {
        const QFileInfo folderInfo(folder);
        if (!folderInfo.exists() || !folderInfo.isDir()) {
            log(QStringLiteral("⚠️ Directory not found: %1").arg(folder));
            continue;
        }

        log(QStringLiteral("🧹 Cleaning: %1").arg(folder));
        QDir dir(folder);
        if (!folderInfo.isReadable() || !folderInfo.isExecutable()) {
            log(QStringLiteral("❌ Access denied: %1").arg(folder));
            ++failures;
            continue;
        }

        std::uint64_t folderCount = 0;
        std::int64_t folderSize = 0;
        const QFileInfoList entries =
            dir.entryInfoList(QDir::AllEntries | QDir::Hidden | QDir::System
                              | QDir::NoDotAndDotDot);
        for (const QFileInfo &entry : entries) {
            std::int64_t bytes = 0;
            QString error;
            const RemoveResult result =
                removeEntry(entry.absoluteFilePath(), cutoff, &bytes, &error);
            // A partly cleaned directory still frees what was removed inside it.
            folderSize += bytes;
            if (result == RemoveResult::Removed) {
                ++folderCount;
            } else if (result == RemoveResult::Failed) {
                ++failures;
                log(QStringLiteral("✖ %1: %2...").arg(entry.fileName(), error.left(50)));
            }
        }

        if (folderCount > 0) {
            log(QStringLiteral("✅ %1: %2 items, %3")
                    .arg(folder)
                    .arg(folderCount)
                    .arg(sizeText(folderSize)));
        } else {
            log(QStringLiteral("✅ %1: Already clean").arg(folder));
        }
        cleanedCount += folderCount;
        totalSize += folderSize;
        folderDetails.push_back({{"folder", folder.toStdString()},
                                 {"items", folderCount},
                                 {"bytes", folderSize}});
    }

    const RemovalTally trash = removeTrashContents();
    if (trash.errors.isEmpty()) {
        log(QStringLiteral("🗑️ Trash emptied."));
    } else {
        log(QStringLiteral("❌ Trash: %1").arg(trash.errors.first()));
    }
    cleanedCount += trash.items;
    totalSize += trash.bytes;

    const QString readable = sizeText(totalSize);
    log(QStringLiteral("🎉 Cleanup complete: %1 items removed, %2 freed")
            .arg(cleanedCount)
            .arg(readable));
    const QString finalStatus = QStringLiteral("✅ Cleaned: %1 (%2 items)")
                                    .arg(readable)
                                    .arg(cleanedCount);
    status(finalStatus);

    run.itemsRemoved = cleanedCount;
    run.bytesFreed = totalSize;
    run.success = failures == 0 && trash.errors.isEmpty();
    run.summary = finalStatus.toStdString();
    run.details = {{"folders", folderDetails},
                   {"failures", failures + trash.errors.size()},
                   {"trashItems", trash.items},
                   {"minAgeHours", m_settings.tempMinAgeHours}};
    return finish(std::move(run));
}

SystemCleaner::RemovalTally SystemCleaner::removeTrashContents()
{
    RemovalTally tally;
    const QString trash = trashDirectory();
    for (const QString &sub : {QStringLiteral("files"), QStringLiteral("info"),
                               QStringLiteral("expunged")}) {
        const QDir dir(trash + QLatin1Char('/') + sub);
        if (!dir.exists()) {
            continue;
        }
        const QFileInfoList entries =
            dir.entryInfoList(QDir::AllEntries | QDir::Hidden | QDir::System
                              | QDir::NoDotAndDotDot);
        for (const QFileInfo &entry : entries) {
            std::int64_t bytes = 0;
            QString error;
            const RemoveResult result =
                removeEntry(entry.absoluteFilePath(), QDateTime(), &bytes, &error);
            tally.bytes += bytes;
            if (result == RemoveResult::Removed) {
                // info/ holds one .trashinfo per item in files/.
                if (sub != QLatin1String("info")) {
                    ++tally.items;
                }
            } else if (result == RemoveResult::Failed) {
                tally.errors.push_back(entry.fileName() + QStringLiteral(": ") + error);
            }
        }
    }
    return tally;
}

CleanupRun SystemCleaner::emptyTrash()
{
    CleanupRun run = startRun(CleanupKind::Trash);
    const RemovalTally tally = removeTrashContents();
    run.itemsRemoved = tally.items;
    run.bytesFreed = tally.bytes;
    run.success = tally.errors.isEmpty();
    if (run.success) {
        log(QStringLiteral("🗑️ Trash emptied."));
        run.summary = "Trash emptied";
    } else {
        log(QStringLiteral("❌ Trash: %1").arg(tally.errors.first()));
        run.summary = "Trash: " + tally.errors.first().toStdString();
        run.details = {{"errors", tally.errors.join(QLatin1Char('\n')).toStdString()}};
    }
    return finish(std::move(run));
}

CleanupRun SystemCleaner::emptyTrashOnly()
{
    CleanupRun run = startRun(CleanupKind::Trash);
    status(QStringLiteral("🗑️ Emptying Trash..."));

    const RemovalTally tally = removeTrashContents();
    run.itemsRemoved = tally.items;
    run.bytesFreed = tally.bytes;
    run.success = tally.errors.isEmpty();
    if (run.success) {
        log(QStringLiteral("✅ Trash emptied successfully."));
        status(QStringLiteral("✅ Trash Emptied"));
        run.summary = "✅ Trash Emptied";
    } else {
        log(QStringLiteral("❌ Error emptying Trash: %1").arg(tally.errors.first()));
        status(QStringLiteral("❌ Error emptying Trash"));
        run.summary = "❌ Error emptying Trash";
        run.details = {{"errors", tally.errors.join(QLatin1Char('\n')).toStdString()}};
    }
    return finish(std::move(run));
}

CleanupRun SystemCleaner::runDiskCleanup()
{
    CleanupRun run = startRun(CleanupKind::DiskCleanup);
    if (!isPrivileged()) {
        status(QStringLiteral("❌ Run as root"));
        run.success = false;
        run.summary = "❌ Run as root";
        return finish(std::move(run));
    }

    status(QStringLiteral("🧼 Running full Disk Cleanup..."));
    const QString command = m_settings.diskCleanupCommand;
    log(QStringLiteral("Launching: %1").arg(command));
    run.details = {{"command", command.toStdString()}};

    QStringList parts = QProcess::splitCommand(command);
    if (parts.isEmpty()) {
        log(QStringLiteral("Error running disk cleanup: empty command"));
        run.success = false;
        run.summary = "Error running disk cleanup: empty command";
        return finish(std::move(run));
    }
    const QString program = parts.takeFirst();
    qint64 pid = 0;
    if (!QProcess::startDetached(program, parts, QString(), &pid)) {
        log(QStringLiteral("Error running disk cleanup: failed to start %1").arg(program));
        run.success = false;
        run.summary = "Error running disk cleanup: failed to start " + program.toStdString();
        return finish(std::move(run));
    }

    run.details["pid"] = pid;
    run.summary = "Launched " + command.toStdString();
    return finish(std::move(run));
}

bool SystemCleaner::writeVmKnob(const QString &knob, const QString &value) const
{
    QFile file(rootedPath(m_settings.sysRoot, QStringLiteral("/proc/sys/vm/") + knob));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    const QByteArray data = value.toLatin1();
    return file.write(data) == data.size();
}

CleanupRun SystemCleaner::optimizeMemory()
{
    CleanupRun run = startRun(CleanupKind::Memory);
    status(QStringLiteral("🧠 Optimizing Memory..."));

    try {
        const MemoryInfo before = readMemoryUsage(m_settings.sysRoot);
        if (before.totalBytes == 0) {
            throw std::runtime_error("memory statistics unavailable");
        }
        log(QStringLiteral("💾 Memory: %1 available (%2% used)")
                .arg(sizeText(static_cast<std::int64_t>(before.availableBytes)))
                .arg(before.percent, 0, 'f', 1));

        QStringList steps;
        malloc_trim(0);
        log(QStringLiteral("🔄 Working set optimized"));
        steps << QStringLiteral("heap_trim");

        const bool privileged = isPrivileged();
        if (privileged) {
            ::sync();
            log(QStringLiteral("🔄 Modified pages flushed"));
            steps << QStringLiteral("sync");

            if (writeVmKnob(QStringLiteral("drop_caches"), QStringLiteral("3"))) {
                log(QStringLiteral("🔄 Standby memory cleared (aggressive)"));
                steps << QStringLiteral("drop_caches_3");
            } else if (writeVmKnob(QStringLiteral("drop_caches"), QStringLiteral("1"))) {
                log(QStringLiteral("🔄 Standby memory cleared (low priority)"));
                steps << QStringLiteral("drop_caches_1");
            }

            if (writeVmKnob(QStringLiteral("compact_memory"), QStringLiteral("1"))) {
                log(QStringLiteral("🔄 Memory compacted"));
                steps << QStringLiteral("compact_memory");
            }
        }

        const MemoryInfo after = readMemoryUsage(m_settings.sysRoot);
        const std::int64_t freed =
            std::max<std::int64_t>(0, static_cast<std::int64_t>(after.availableBytes)
                                          - static_cast<std::int64_t>(before.availableBytes));
        const QString freedText = sizeText(freed);
        log(QStringLiteral("✅ Memory freed: %1 %2")
                .arg(freedText,
                     privileged ? QStringLiteral("(Page cache + slab cleared)")
                                : QStringLiteral("(Basic optimization)")));
        const QString finalStatus = QStringLiteral("✅ Memory Optimized: +%1").arg(freedText);
        status(finalStatus);

        run.bytesFreed = freed;
        run.summary = finalStatus.toStdString();
        run.details = {{"availableBefore", before.availableBytes},
                       {"availableAfter", after.availableBytes},
                       {"privileged", privileged},
                       {"steps", steps.join(QLatin1Char(',')).toStdString()}};
    } catch (const std::exception &ex) {
        log(QStringLiteral("❌ Memory optimization error: %1").arg(QString::fromUtf8(ex.what())));
        status(QStringLiteral("❌ Memory Optimization Failed"));
        run.success = false;
        run.summary = std::string("Memory optimization error: ") + ex.what();
    }
    return finish(std::move(run));
}

CleanupRun SystemCleaner::finish(CleanupRun run)
{
    if (m_store) {
        try {
            run.id = m_store->addCleanupRun(run);
        } catch (const std::exception &ex) {
            PTLOG_WARN(QStringLiteral("SystemCleaner"),
                       QStringLiteral("finish"),
                       QStringLiteral("record_failed"),
                       QStringLiteral("store_error"),
                       QStringLiteral("skip_history"),
                       pctoolkit::logging::defaultWho(),
                       pctoolkit::logging::currentCorrelationId(),
                       (nlohmann::json{{"error", ex.what()}}));
        }
    }

    PTLOG_INFO(QStringLiteral("SystemCleaner"),
               QStringLiteral("finish"),
               QStringLiteral("cleanup_finished"),
               QStringLiteral("user_action"),
               QString::fromStdString(toCleanupKindString(run.kind)),
               pctoolkit::logging::defaultWho(),
               pctoolkit::logging::currentCorrelationId(),
               (nlohmann::json{{"items", run.itemsRemoved},
                               {"bytes", run.bytesFreed},
                               {"success", run.success}}));
    return run;
}

void SystemCleaner::log(const QString &message)
{
    PTLOG_DEBUG(QStringLiteral("SystemCleaner"),
                QStringLiteral("log"),
                QStringLiteral("cleaner_message"),
                QStringLiteral("progress"),
                QStringLiteral("signal"),
                pctoolkit::logging::defaultWho(),
                pctoolkit::logging::currentCorrelationId(),
                (nlohmann::json{{"message", message.toStdString()}}));
    emit logMessage(message);
}

void SystemCleaner::status(const QString &text)
{
    emit statusChanged(text);
}

} // namespace pctoolkit
