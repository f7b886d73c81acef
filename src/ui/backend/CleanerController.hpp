#pragma once

#include <functional>

#include <QFutureWatcher>
#include <QObject>
#include <QString>
#include <QStringList>

#include "common/models.hpp"
#include "common/settings.hpp"

namespace pctoolkit {

class SystemCleaner;
class ToolkitStore;

class CleanerController : public QObject
{
    Q_OBJECT
    Q_PROPERTY(bool busy READ busy NOTIFY busyChanged)
    Q_PROPERTY(QString status READ status NOTIFY statusChanged)
    Q_PROPERTY(QStringList log READ log NOTIFY logChanged)
    Q_PROPERTY(bool privileged READ privileged CONSTANT)

public:
    // store is not owned and may be null.
    explicit CleanerController(const ToolkitSettings &settings,
                               ToolkitStore *store,
                               QObject *parent = nullptr);
    ~CleanerController() override;

    bool busy() const;
    QString status() const;
    QStringList log() const;
    bool privileged() const;

    // Each action runs on a worker thread; calls while busy are ignored.
    Q_INVOKABLE bool cleanTempFiles();
    Q_INVOKABLE bool emptyTrash();
    Q_INVOKABLE bool optimizeMemory();
    Q_INVOKABLE bool runDiskCleanup();
    Q_INVOKABLE void clearLog();

    // Blocks until the running action, if any, has finished.
    void waitForIdle();

signals:
    void busyChanged();
    void statusChanged();
    void logChanged();
    void cleanupFinished(const QString &summary, bool success);

private:
    using Action = std::function<CleanupRun(SystemCleaner &)>;

    bool start(const QString &name, Action action);
    void onFinished();
    void appendLog(const QString &message);
    void setStatus(const QString &status);

    ToolkitSettings m_settings;
    ToolkitStore *m_store = nullptr;
    QFutureWatcher<CleanupRun> m_watcher;
    bool m_busy = false;
    QString m_status;
    QStringList m_log;
};

} // namespace pctoolkit
