#pragma once

#include <functional>
#include <memory>

#include <QFutureWatcher>
#include <QMenu>
#include <QObject>
#include <QSystemTrayIcon>
#include <QTimer>

#include "common/models.hpp"
#include "common/settings.hpp"

namespace pctoolkit {
class CpuUsageSampler;
class SystemCleaner;
class ToolkitStore;
}

// ToolkitTray shows live memory/CPU load in the tooltip and offers the quick
// cleanup actions without opening the window.
class ToolkitTray : public QObject
{
    Q_OBJECT
public:
    explicit ToolkitTray(const pctoolkit::ToolkitSettings &settings, QObject *parent = nullptr);
    ~ToolkitTray() override;

private slots:
    void refreshStatus();
    void freeRam();
    void cleanTempFiles();
    void emptyTrash();
    void openFullApp();
    void showAboutDialog();
    void onTrayActivated(QSystemTrayIcon::ActivationReason reason);
    void onCleanupFinished();

private:
    using CleanupTask = std::function<pctoolkit::CleanupRun(pctoolkit::SystemCleaner &)>;

    QSystemTrayIcon m_trayIcon;
    QMenu m_menu;
    QAction *m_memoryStatusAction = nullptr;
    QAction *m_freeRamAction = nullptr;
    QAction *m_cleanTempAction = nullptr;
    QAction *m_emptyTrashAction = nullptr;
    QAction *m_openAppAction = nullptr;
    QAction *m_aboutAction = nullptr;
    QAction *m_refreshAction = nullptr;
    QAction *m_quitAction = nullptr;
    QTimer m_refreshTimer;
    QFutureWatcher<pctoolkit::CleanupRun> m_cleanupWatcher;
    QString m_cleanupTitle;

    pctoolkit::ToolkitSettings m_settings;
    std::unique_ptr<pctoolkit::ToolkitStore> m_store;
    std::unique_ptr<pctoolkit::CpuUsageSampler> m_cpuSampler;

    void setupTrayIcon();
    void setupMenu();
    void scheduleRefresh();
    void startCleanup(const QString &title, CleanupTask task);
    void setCleanupActionsEnabled(bool enabled);
};
