#include <QApplication>
#include <QDebug>
#include <QIcon>
#include <QSystemTrayIcon>

#include "tray/ToolkitTray.hpp"
#include "common/process_utils.hpp"
#include "common/logging.hpp"
#include "common/settings.hpp"
#include "probe/system_info_loader.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);
    QApplication::setApplicationName(QStringLiteral("pctoolkit-tray"));

    if (!QSystemTrayIcon::isSystemTrayAvailable()) {
        qWarning() << "System tray not available. Exiting.";
        return 1;
    }

    app.setQuitOnLastWindowClosed(false);

    pctoolkit::ToolkitSettings settings = pctoolkit::ToolkitSettings::fromEnvironment();
    for (int i = 1; i < argc; ++i) {
        if (QString::fromLocal8Bit(argv[i]) == QStringLiteral("--trace")) {
            settings.traceEnabled = true;
        }
    }
    pctoolkit::logging::initLogging(QStringLiteral("pctoolkit-tray"), settings.traceEnabled);
    PTLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("tray_start"),
               QStringLiteral("user_start"),
               QStringLiteral("qt_app"),
               pctoolkit::logging::defaultWho(),
               QString(),
               nlohmann::json::object());

    pctoolkit::registerProbeMetaTypes();

    const QString iconPath = pctoolkit::appIconPath();
    if (!iconPath.isEmpty()) {
        app.setWindowIcon(QIcon(iconPath));
    }

    ToolkitTray tray(settings);

    return app.exec();
}
