#include <QCoreApplication>
#include <memory>
#include <QGuiApplication>
#include <QIcon>
#include <QQmlApplicationEngine>
#include <QQmlContext>
#include <QQuickStyle>
#include <QCommandLineParser>
#include <QDebug>
#include <QScreen>

#include "ui/backend/CleanerController.hpp"
#include "ui/backend/SystemInfoModel.hpp"
#include "common/logging.hpp"
#include "common/pctoolkit_version.hpp"
#include "common/process_utils.hpp"
#include "common/settings.hpp"
#include "probe/system_info_loader.hpp"
#include "store/toolkit_store.hpp"
#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QGuiApplication app(argc, argv);
    QGuiApplication::setApplicationName(QStringLiteral("pctoolkit"));
    QGuiApplication::setApplicationVersion(QStringLiteral(PCTOOLKIT_VERSION));

    if (qEnvironmentVariableIsEmpty("QT_QUICK_CONTROLS_STYLE")) {
        QQuickStyle::setStyle(QStringLiteral("Fusion"));
    }

    QQmlApplicationEngine engine;
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Hardware overview and cleanup tools."));
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption traceOption(QStringList() << "trace",
                                   "Enable verbose trace logging.");
    QCommandLineOption noTrayOption(QStringList() << "no-tray",
                                    "Do not start the tray icon.");
    parser.addOption(traceOption);
    parser.addOption(noTrayOption);
    parser.process(app);

    pctoolkit::ToolkitSettings settings = pctoolkit::ToolkitSettings::fromEnvironment();
    settings.traceEnabled = settings.traceEnabled || parser.isSet(traceOption);
    settings.noTrayOnStart = settings.noTrayOnStart || parser.isSet(noTrayOption);
    pctoolkit::logging::initLogging(QStringLiteral("pctoolkit"), settings.traceEnabled);

    const QString iconPath = pctoolkit::appIconPath();
    if (!iconPath.isEmpty()) {
        app.setWindowIcon(QIcon(iconPath));
    }

    PTLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("ui_start"),
               QStringLiteral("user_start"),
               QStringLiteral("qt_app"),
               pctoolkit::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"noTray", settings.noTrayOnStart},
                               {"version", PCTOOLKIT_VERSION}}));

    if (!settings.noTrayOnStart && !pctoolkit::isTrayRunning()) {
        PTLOG_INFO(QStringLiteral("main"),
                   QStringLiteral("main"),
                   QStringLiteral("auto_start_tray"),
                   QStringLiteral("ui_start"),
                   QStringLiteral("best_effort"),
                   pctoolkit::logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
        pctoolkit::startTray();
    }

    std::unique_ptr<pctoolkit::ToolkitStore> store;
    try {
        store = std::make_unique<pctoolkit::ToolkitStore>();
        std::string integrityMessage;
        if (!store->integrityCheck(&integrityMessage)) {
            qWarning() << "PC Toolkit: SQLite integrity check failed, history disabled:"
                       << QString::fromStdString(integrityMessage);
            store.reset();
        }
    } catch (const std::exception &ex) {
        qWarning() << "PC Toolkit: cannot open history database:" << ex.what();
        store.reset();
    }

    pctoolkit::SystemInfoLoader loader(settings.sysRoot);
    if (QScreen *screen = QGuiApplication::primaryScreen()) {
        loader.setPrimaryScreenName(screen->name());
    }
    loader.setRefreshIntervalMs(settings.refreshIntervalMs);
    loader.setStore(store.get());

    pctoolkit::SystemInfoModel systemInfo(&loader);
    pctoolkit::CleanerController cleaner(settings, store.get());
    // Memory and disk figures change after a cleanup.
    QObject::connect(&cleaner, &pctoolkit::CleanerController::cleanupFinished,
                     &loader, [&loader]() { loader.requestRefresh(); });

    engine.rootContext()->setContextProperty(QStringLiteral("systemInfo"), &systemInfo);
    engine.rootContext()->setContextProperty(QStringLiteral("cleaner"), &cleaner);
    engine.rootContext()->setContextProperty(QStringLiteral("pctoolkitIconPath"), iconPath);
    engine.rootContext()->setContextProperty(QStringLiteral("pctoolkitVersion"),
                                             QStringLiteral(PCTOOLKIT_VERSION));

    const QUrl url = QUrl::fromLocalFile(QStringLiteral(PCTOOLKIT_QML_DIR "/Main.qml"));
    QObject::connect(
        &engine,
        &QQmlApplicationEngine::objectCreated,
        &app,
        [url](QObject *obj, const QUrl &objUrl) {
            if (!obj && url == objUrl) {
                QCoreApplication::exit(EXIT_FAILURE);
            }
        },
        Qt::QueuedConnection);

    engine.load(url);

    QObject::connect(&app, &QCoreApplication::aboutToQuit, &loader, [&loader]() {
        loader.stop();
    });
    loader.start();

    const int result = app.exec();
    loader.stop();
    cleaner.waitForIdle();
    return result;
}
