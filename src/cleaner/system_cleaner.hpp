#pragma once

#include <cstdint>
#include <functional>

#include <QDateTime>
#include <QObject>
#include <QString>
#include <QStringList>

#include "common/models.hpp"
#include "common/settings.hpp"

namespace pctoolkit {

class ToolkitStore;

/**
 * SystemCleaner performs the cleanup actions offered by the window, the tray
 * and the CLI:
 * - temporary files and thumbnail cache, then the trash
 * - trash only
 * - the configured disk cleanup command (root only)
 * - memory optimization (heap trim for everyone, cache drop as root)
 *
 * Progress is reported through logMessage() and statusChanged(). Operations
 * are synchronous; callers move them off the GUI thread.
 */
class SystemCleaner : public QObject
{
    Q_OBJECT
public:
    using PrivilegeCheck = std::function<bool()>;

    explicit SystemCleaner(const ToolkitSettings &settings = ToolkitSettings(),
                           QObject *parent = nullptr);

    void setPrivilegeCheck(PrivilegeCheck check);
    // Not owned. Every finished operation is recorded when set.
    void setStore(ToolkitStore *store);

    bool isPrivileged() const;

    // Temp folders in visiting order, without empty or duplicate entries.
    QStringList tempFolders() const;
    QString trashDirectory() const;

    // Recursive size of regular files; unreadable entries count as zero.
    static std::int64_t directorySize(const QString &path);

    CleanupRun cleanTempFiles();
    CleanupRun emptyTrash();
    CleanupRun emptyTrashOnly();
    CleanupRun runDiskCleanup();
    CleanupRun optimizeMemory();

signals:
    void logMessage(const QString &message);
    void statusChanged(const QString &status);

private:
    struct RemovalTally {
        std::uint64_t items = 0;
        std::int64_t bytes = 0;
        QStringList errors;
    };

    enum class RemoveResult {
        Removed,
        Skipped,
        Failed
    };

    RemovalTally removeTrashContents();
    // Removes path and, for directories, every nested entry not newer than
    // cutoff (an invalid cutoff removes regardless of age). Special files are
    // never removed and keep their parent directories. Freed bytes are added
    // to *bytes even when the entry itself is kept; *error keeps the first
    // failure.
    RemoveResult removeEntry(const QString &path,
                             const QDateTime &cutoff,
                             std::int64_t *bytes,
                             QString *error) const;
    bool writeVmKnob(const QString &knob, const QString &value) const;
    CleanupRun finish(CleanupRun run);

    void log(const QString &message);
    void status(const QString &text);

    ToolkitSettings m_settings;
    PrivilegeCheck m_privilegeCheck;
    ToolkitStore *m_store = nullptr;
};

} // namespace pctoolkit
