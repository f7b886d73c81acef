#include <QCoreApplication>

#include "report/ReportCli.hpp"
#include "common/logging.hpp"
#include "common/pctoolkit_version.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("pctoolkit-report"));
    QCoreApplication::setApplicationVersion(QStringLiteral(PCTOOLKIT_VERSION));

    bool trace = false;
    QStringList filteredArgs;
    filteredArgs.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            trace = true;
            continue;
        }
        filteredArgs.push_back(arg);
    }
    pctoolkit::logging::initLogging(QStringLiteral("pctoolkit-report"), trace);
    PTLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("report_cli_start"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               pctoolkit::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"args", filteredArgs.size()},
                               {"version", PCTOOLKIT_VERSION}}));

    // CLI entry point: delegate to ReportCli for argument parsing and output.
    pctoolkit::ReportCli cli;
    std::vector<QByteArray> utf8Args;
    std::vector<char *> rawArgs;
    for (const QString &arg : filteredArgs) {
        utf8Args.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : utf8Args) {
        rawArgs.push_back(arg.data());
    }
    return cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());
}
