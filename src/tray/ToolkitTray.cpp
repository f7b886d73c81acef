#include "tray/ToolkitTray.hpp"

#include <QAction>
#include <QCoreApplication>
#include <QIcon>
#include <QMessageBox>
#include <QtConcurrent/QtConcurrent>

#include <cmath>

#include <nlohmann/json.hpp>

#include "cleaner/system_cleaner.hpp"
#include "common/format_utils.hpp"
#include "common/logging.hpp"
#include "common/pctoolkit_version.hpp"
#include "common/process_utils.hpp"
#include "probe/cpu_probe.hpp"
#include "probe/memory_probe.hpp"
#include "store/toolkit_store.hpp"

ToolkitTray::ToolkitTray(const pctoolkit::ToolkitSettings &settings, QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_cpuSampler(std::make_unique<pctoolkit::CpuUsageSampler>(settings.sysRoot))
{
    PTLOG_INFO(QStringLiteral("ToolkitTray"),
               QStringLiteral("ToolkitTray"),
               QStringLiteral("tray_start"),
               QStringLiteral("user_start"),
               QStringLiteral("tray"),
               pctoolkit::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"refreshIntervalMs", m_settings.refreshIntervalMs}}));

    try {
        m_store = std::make_unique<pctoolkit::ToolkitStore>();
    } catch (const std::exception &ex) {
        PTLOG_WARN(QStringLiteral("ToolkitTray"),
                   QStringLiteral("ToolkitTray"),
                   QStringLiteral("store_unavailable"),
                   QStringLiteral("store_error"),
                   QStringLiteral("history_disabled"),
                   pctoolkit::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"error", ex.what()}}));
    }

    connect(&m_cleanupWatcher, &QFutureWatcher<pctoolkit::CleanupRun>::finished,
            this, &ToolkitTray::onCleanupFinished);

    setupTrayIcon();
    setupMenu();
    scheduleRefresh();
}

ToolkitTray::~ToolkitTray()
{
    m_cleanupWatcher.waitForFinished();
}

void ToolkitTray::setupTrayIcon()
{
    const QString iconPath = pctoolkit::appIconPath();
    m_trayIcon.setIcon(iconPath.isEmpty()
                           ? QIcon::fromTheme(QStringLiteral("computer"))
                           : QIcon(iconPath));
    m_trayIcon.setToolTip(QStringLiteral("PC Toolkit"));

    connect(&m_trayIcon, &QSystemTrayIcon::activated,
            this, &ToolkitTray::onTrayActivated);

    m_trayIcon.show();
}

void ToolkitTray::setupMenu()
{
    m_memoryStatusAction = m_menu.addAction(QStringLiteral("Memory: Unknown"));
    m_memoryStatusAction->setEnabled(false);

    m_menu.addSeparator();

    m_freeRamAction = m_menu.addAction(QStringLiteral("Free RAM"));
    connect(m_freeRamAction, &QAction::triggered, this, &ToolkitTray::freeRam);

    m_cleanTempAction = m_menu.addAction(QStringLiteral("Clean Temporary Files"));
    connect(m_cleanTempAction, &QAction::triggered, this, &ToolkitTray::cleanTempFiles);

    m_emptyTrashAction = m_menu.addAction(QStringLiteral("Empty Trash"));
    connect(m_emptyTrashAction, &QAction::triggered, this, &ToolkitTray::emptyTrash);

    m_menu.addSeparator();

    m_openAppAction = m_menu.addAction(QStringLiteral("Open PC Toolkit"));
    connect(m_openAppAction, &QAction::triggered, this, &ToolkitTray::openFullApp);

    m_aboutAction = m_menu.addAction(QStringLiteral("About PC Toolkit"));
    connect(m_aboutAction, &QAction::triggered, this, &ToolkitTray::showAboutDialog);

    m_refreshAction = m_menu.addAction(QStringLiteral("Refresh Now"));
    connect(m_refreshAction, &QAction::triggered, this, &ToolkitTray::refreshStatus);

    m_menu.addSeparator();

    m_quitAction = m_menu.addAction(QStringLiteral("Quit"));
    connect(m_quitAction, &QAction::triggered, qApp, &QCoreApplication::quit);

    m_trayIcon.setContextMenu(&m_menu);
}

void ToolkitTray::scheduleRefresh()
{
    m_refreshTimer.setInterval(m_settings.refreshIntervalMs);
    connect(&m_refreshTimer, &QTimer::timeout, this, &ToolkitTray::refreshStatus);
    m_refreshTimer.start();

    // Primes the CPU counters; the first tooltip shows 0% like the window.
    refreshStatus();
}

void ToolkitTray::refreshStatus()
{
    const pctoolkit::MemoryInfo memory = pctoolkit::readMemoryUsage(m_settings.sysRoot);
    const double cpu = m_cpuSampler->sample();

    const int ramPercent = static_cast<int>(std::lround(memory.percent));
    const int cpuPercent = static_cast<int>(std::lround(cpu));
    m_trayIcon.setToolTip(QStringLiteral("PC Toolkit - RAM %1% | CPU %2%")
                              .arg(ramPercent)
                              .arg(cpuPercent));
    m_memoryStatusAction->setText(
        QStringLiteral("Memory: %1 / %2 (%3%)")
            .arg(QString::fromStdString(pctoolkit::formatGigabytes(memory.usedBytes)),
                 QString::fromStdString(pctoolkit::formatGigabytes(memory.totalBytes)))
            .arg(ramPercent));

    PTLOG_DEBUG(QStringLiteral("ToolkitTray"),
                QStringLiteral("refreshStatus"),
                QStringLiteral("tray_status_refreshed"),
                QStringLiteral("timer_tick"),
                QStringLiteral("procfs"),
                pctoolkit::logging::defaultWho(),
                QString(),
                (nlohmann::json{{"ram", ramPercent}, {"cpu", cpuPercent}}));
}

void ToolkitTray::freeRam()
{
    startCleanup(QStringLiteral("Free RAM"),
                 [](pctoolkit::SystemCleaner &cleaner) { return cleaner.optimizeMemory(); });
}

void ToolkitTray::cleanTempFiles()
{
    startCleanup(QStringLiteral("Clean Temporary Files"),
                 [](pctoolkit::SystemCleaner &cleaner) { return cleaner.cleanTempFiles(); });
}

void ToolkitTray::emptyTrash()
{
    startCleanup(QStringLiteral("Empty Trash"),
                 [](pctoolkit::SystemCleaner &cleaner) { return cleaner.emptyTrashOnly(); });
}

void ToolkitTray::startCleanup(const QString &title, CleanupTask task)
{
    if (m_cleanupWatcher.isRunning()) {
        m_trayIcon.showMessage(QStringLiteral("PC Toolkit"),
                               QStringLiteral("A cleanup is already running."),
                               QSystemTrayIcon::Information);
        return;
    }

    PTLOG_INFO(QStringLiteral("ToolkitTray"),
               QStringLiteral("startCleanup"),
               QStringLiteral("tray_cleanup_started"),
               QStringLiteral("user_action"),
               QStringLiteral("QtConcurrent"),
               pctoolkit::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"action", title.toStdString()}}));

    m_cleanupTitle = title;
    setCleanupActionsEnabled(false);

    const pctoolkit::ToolkitSettings settings = m_settings;
    pctoolkit::ToolkitStore *store = m_store.get();
    // The cleaner lives on the worker thread; its signals are not needed here.
    m_cleanupWatcher.setFuture(QtConcurrent::run([settings, store, task]() {
        pctoolkit::SystemCleaner cleaner(settings);
        cleaner.setStore(store);
        return task(cleaner);
    }));
}

void ToolkitTray::onCleanupFinished()
{
    setCleanupActionsEnabled(true);

    QString message;
    QSystemTrayIcon::MessageIcon icon = QSystemTrayIcon::Information;
    try {
        const pctoolkit::CleanupRun run = m_cleanupWatcher.result();
        message = QString::fromStdString(run.summary);
        if (!run.success) {
            icon = QSystemTrayIcon::Warning;
        }
    } catch (const std::exception &ex) {
        message = QStringLiteral("❌ %1 failed: %2").arg(m_cleanupTitle, QString::fromUtf8(ex.what()));
        icon = QSystemTrayIcon::Critical;
    }

    m_trayIcon.showMessage(QStringLiteral("PC Toolkit - ") + m_cleanupTitle, message, icon);
    refreshStatus();
}

void ToolkitTray::setCleanupActionsEnabled(bool enabled)
{
    m_freeRamAction->setEnabled(enabled);
    m_cleanTempAction->setEnabled(enabled);
    m_emptyTrashAction->setEnabled(enabled);
}

void ToolkitTray::openFullApp()
{
    PTLOG_INFO(QStringLiteral("ToolkitTray"),
               QStringLiteral("openFullApp"),
               QStringLiteral("open_full_app"),
               QStringLiteral("user_action"),
               QStringLiteral("process_start"),
               pctoolkit::logging::defaultWho(),
               QString(),
               nlohmann::json::object());
    if (!pctoolkit::startUi()) {
        m_trayIcon.showMessage(QStringLiteral("PC Toolkit"),
                               QStringLiteral("Could not start the PC Toolkit window."),
                               QSystemTrayIcon::Warning);
    }
}

void ToolkitTray::showAboutDialog()
{
    QMessageBox box;
    box.setWindowTitle(QStringLiteral("About PC Toolkit"));
    box.setTextFormat(Qt::RichText);
    box.setStandardButtons(QMessageBox::Ok);
    box.setText(QStringLiteral("<b>PC Toolkit</b> %1<br/>"
                               "Hardware overview and cleanup tools for Linux PCs.")
                    .arg(QStringLiteral(PCTOOLKIT_VERSION)));
    box.exec();
}

void ToolkitTray::onTrayActivated(QSystemTrayIcon::ActivationReason reason)
{
    if (reason == QSystemTrayIcon::Trigger) {
        openFullApp();
    } else if (reason == QSystemTrayIcon::DoubleClick) {
        refreshStatus();
        m_trayIcon.showMessage(QStringLiteral("PC Toolkit"),
                               m_trayIcon.toolTip(),
                               QSystemTrayIcon::Information);
    }
}
