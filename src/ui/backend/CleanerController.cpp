#include "ui/backend/CleanerController.hpp"

#include <QtConcurrent/QtConcurrent>

#include <nlohmann/json.hpp>

#include "cleaner/system_cleaner.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"

namespace pctoolkit {

namespace {

constexpr int kMaxLogLines = 500;

} // namespace

CleanerController::CleanerController(const ToolkitSettings &settings,
                                     ToolkitStore *store,
                                     QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_store(store)
{
    connect(&m_watcher, &QFutureWatcher<CleanupRun>::finished,
            this, &CleanerController::onFinished);
}

CleanerController::~CleanerController()
{
    m_watcher.waitForFinished();
}

bool CleanerController::busy() const
{
    return m_busy;
}

QString CleanerController::status() const
{
    return m_status;
}

QStringList CleanerController::log() const
{
    return m_log;
}

bool CleanerController::privileged() const
{
    return isPrivileged();
}

bool CleanerController::cleanTempFiles()
{
    return start(QStringLiteral("temp_files"),
                 [](SystemCleaner &cleaner) { return cleaner.cleanTempFiles(); });
}

bool CleanerController::emptyTrash()
{
    return start(QStringLiteral("trash"),
                 [](SystemCleaner &cleaner) { return cleaner.emptyTrashOnly(); });
}

bool CleanerController::optimizeMemory()
{
    return start(QStringLiteral("memory"),
                 [](SystemCleaner &cleaner) { return cleaner.optimizeMemory(); });
}

bool CleanerController::runDiskCleanup()
{
    return start(QStringLiteral("disk_cleanup"),
                 [](SystemCleaner &cleaner) { return cleaner.runDiskCleanup(); });
}

void CleanerController::clearLog()
{
    m_log.clear();
    emit logChanged();
}

void CleanerController::waitForIdle()
{
    m_watcher.waitForFinished();
}

bool CleanerController::start(const QString &name, Action action)
{
    if (m_busy) {
        return false;
    }

    PTLOG_INFO(QStringLiteral("CleanerController"),
               QStringLiteral("start"),
               QStringLiteral("cleanup_requested"),
               QStringLiteral("user_action"),
               QStringLiteral("QtConcurrent"),
               pctoolkit::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"action", name.toStdString()}}));

    m_busy = true;
    emit busyChanged();

    const ToolkitSettings settings = m_settings;
    ToolkitStore *store = m_store;
    // Cleaner signals cross back to this thread as queued calls.
    m_watcher.setFuture(QtConcurrent::run([this, settings, store, action]() {
        SystemCleaner cleaner(settings);
        cleaner.setStore(store);
        connect(&cleaner, &SystemCleaner::logMessage, this, &CleanerController::appendLog);
        connect(&cleaner, &SystemCleaner::statusChanged, this, &CleanerController::setStatus);
        return action(cleaner);
    }));
    return true;
}

void CleanerController::onFinished()
{
    QString summary;
    bool success = false;
    try {
        const CleanupRun run = m_watcher.result();
        summary = QString::fromStdString(run.summary);
        success = run.success;
    } catch (const std::exception &ex) {
        summary = QStringLiteral("❌ Cleanup failed: %1").arg(QString::fromUtf8(ex.what()));
        appendLog(summary);
        setStatus(summary);
    }

    m_busy = false;
    emit busyChanged();
    emit cleanupFinished(summary, success);
}

void CleanerController::appendLog(const QString &message)
{
    m_log.push_back(message);
    while (m_log.size() > kMaxLogLines) {
        m_log.removeFirst();
    }
    emit logChanged();
}

void CleanerController::setStatus(const QString &status)
{
    if (m_status == status) {
        return;
    }
    m_status = status;
    emit statusChanged();
}

} // namespace pctoolkit
