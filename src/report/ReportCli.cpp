#include "report/ReportCli.hpp"

#include <iostream>
#include <memory>
#include <vector>

#include <QDateTime>
#include <QFile>

#include <nlohmann/json.hpp>

#include "cleaner/system_cleaner.hpp"
#include "common/format_utils.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/models.hpp"
#include "probe/snapshot_builder.hpp"
#include "report/system_report.hpp"
#include "store/toolkit_store.hpp"

namespace pctoolkit {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  pctoolkit-report info [--format text|json] [--out PATH]\n"
        "  pctoolkit-report clean temp|trash|memory|disk [--format text|json]\n"
        "  pctoolkit-report history [--limit N] [--format markdown|json]\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

// True when the flag is the last argument and has no value.
bool hasDanglingFlag(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    return idx >= 0 && idx + 1 >= args.size();
}

QString getFormat(const QStringList &args, const QString &fallback)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return fallback;
    }
    return value.toLower();
}

bool writeTextFile(const QString &path, const std::string &text)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    const QByteArray data = QByteArray::fromStdString(text);
    return file.write(data) == data.size();
}

std::string formatLocalTime(std::chrono::system_clock::time_point timestamp)
{
    QDateTime dt = QDateTime::fromMSecsSinceEpoch(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            timestamp.time_since_epoch())
            .count(),
        Qt::UTC);
    dt = dt.toLocalTime();
    return dt.toString("yyyy-MM-dd HH:mm").toStdString();
}

void renderHistoryMarkdown(const std::vector<CleanupRun> &runs,
                           const std::vector<CleanupTotals> &totals)
{
    std::cout << "# PC Toolkit Cleanup History\n\n";
    std::cout << "Total runs: " << runs.size() << "\n\n";
    std::cout << "## Runs\n\n";

    if (runs.empty()) {
        std::cout << "No cleanup runs recorded.\n";
    }
    for (const auto &run : runs) {
        std::cout << "- [" << formatLocalTime(run.timestamp) << "] ("
                  << toCleanupKindString(run.kind) << ") " << run.summary;
        if (!run.success) {
            std::cout << " [failed]";
        }
        std::cout << "\n";
        if (run.itemsRemoved > 0 || run.bytesFreed > 0) {
            std::cout << "  - removed: " << run.itemsRemoved << " items, "
                      << formatBinarySize(run.bytesFreed) << "\n";
        }
    }

    if (totals.empty()) {
        return;
    }
    std::cout << "\n## Totals\n\n";
    for (const auto &total : totals) {
        std::cout << "- " << toCleanupKindString(total.kind) << ": " << total.runs
                  << " runs, " << total.itemsRemoved << " items, "
                  << formatBinarySize(total.bytesFreed) << "\n";
    }
}

} // namespace

ReportCli::ReportCli()
    : m_settings(ToolkitSettings::fromEnvironment())
{
}

ReportCli::ReportCli(const ToolkitSettings &settings)
    : m_settings(settings)
{
}

int ReportCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    PTLOG_INFO(QStringLiteral("ReportCli"),
               QStringLiteral("run"),
               QStringLiteral("report_cli_command"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               pctoolkit::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"command", command.toStdString()}}));
    if (command == QStringLiteral("info")) {
        return runInfo(args);
    }
    if (command == QStringLiteral("clean")) {
        return runClean(args);
    }
    if (command == QStringLiteral("history")) {
        return runHistory(args);
    }

    std::cerr << usageText().toStdString();
    return 1;
}

int ReportCli::runInfo(const QStringList &args)
{
    if (hasDanglingFlag(args, QStringLiteral("--out"))
        || hasDanglingFlag(args, QStringLiteral("--format"))) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString format = getFormat(args, QStringLiteral("text"));
    if (format != QStringLiteral("text") && format != QStringLiteral("json")) {
        std::cerr << "Invalid format. Use text or json." << std::endl;
        return 1;
    }

    const SystemInfo info = buildSystemSnapshot(m_settings.sysRoot);
    const std::string rendered = format == QStringLiteral("json")
        ? nlohmann::json(info).dump(2) + "\n"
        : formatSystemReport(info) + "\n";

    const QString outPath = getArgValue(args, QStringLiteral("--out"));
    if (outPath.isEmpty()) {
        std::cout << rendered;
        return 0;
    }

    if (!writeTextFile(outPath, rendered)) {
        std::cerr << "Failed to write report: " << outPath.toStdString() << std::endl;
        return 1;
    }
    std::cout << "Report written to " << outPath.toStdString() << std::endl;
    return 0;
}

int ReportCli::runClean(const QStringList &args)
{
    if (args.size() < 3 || hasDanglingFlag(args, QStringLiteral("--format"))) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString target = args.at(2);
    const QString format = getFormat(args, QStringLiteral("text"));
    if (format != QStringLiteral("text") && format != QStringLiteral("json")) {
        std::cerr << "Invalid format. Use text or json." << std::endl;
        return 1;
    }

    std::unique_ptr<ToolkitStore> store;
    try {
        store = std::make_unique<ToolkitStore>();
    } catch (const std::exception &ex) {
        // History is optional for a cleanup.
        std::cerr << "Warning: cleanup history unavailable: " << ex.what() << std::endl;
    }

    SystemCleaner cleaner(m_settings);
    cleaner.setStore(store.get());

    const bool jsonOutput = format == QStringLiteral("json");
    nlohmann::json logLines = nlohmann::json::array();
    QObject::connect(&cleaner, &SystemCleaner::logMessage, [&](const QString &message) {
        if (jsonOutput) {
            logLines.push_back(message.toStdString());
        } else {
            std::cout << message.toStdString() << std::endl;
        }
    });
    QObject::connect(&cleaner, &SystemCleaner::statusChanged, [&](const QString &status) {
        if (!jsonOutput) {
            std::cout << "[status] " << status.toStdString() << std::endl;
        }
    });

    CleanupRun run;
    if (target == QStringLiteral("temp")) {
        run = cleaner.cleanTempFiles();
    } else if (target == QStringLiteral("trash")) {
        run = cleaner.emptyTrashOnly();
    } else if (target == QStringLiteral("memory")) {
        run = cleaner.optimizeMemory();
    } else if (target == QStringLiteral("disk")) {
        run = cleaner.runDiskCleanup();
    } else {
        std::cerr << usageText().toStdString();
        return 1;
    }

    if (jsonOutput) {
        nlohmann::json payload;
        payload["run"] = run;
        payload["log"] = logLines;
        std::cout << payload.dump(2) << std::endl;
    }
    return run.success ? 0 : 1;
}

int ReportCli::runHistory(const QStringList &args)
{
    if (hasDanglingFlag(args, QStringLiteral("--limit"))
        || hasDanglingFlag(args, QStringLiteral("--format"))) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    int limit = 0;
    const QString limitValue = getArgValue(args, QStringLiteral("--limit"));
    if (!limitValue.isEmpty()) {
        bool ok = false;
        limit = limitValue.toInt(&ok);
        if (!ok || limit <= 0) {
            std::cerr << "Invalid limit. Use a positive number." << std::endl;
            return 1;
        }
    }

    const QString format = getFormat(args, QStringLiteral("markdown"));
    if (format != QStringLiteral("markdown") && format != QStringLiteral("json")) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }

    std::vector<CleanupRun> runs;
    std::vector<CleanupTotals> totals;
    try {
        ToolkitStore store;
        runs = store.listCleanupRuns(limit);
        totals = store.cleanupTotals();
    } catch (const std::exception &ex) {
        std::cerr << "Failed to read cleanup history: " << ex.what() << std::endl;
        return 1;
    }

    PTLOG_INFO(QStringLiteral("ReportCli"),
               QStringLiteral("runHistory"),
               QStringLiteral("report_history"),
               QStringLiteral("user_invocation"),
               QStringLiteral("sqlite_query"),
               pctoolkit::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"runs", runs.size()},
                               {"format", format.toStdString()}}));

    if (format == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["totalRuns"] = runs.size();
        payload["runs"] = runs;
        payload["totals"] = totals;
        std::cout << payload.dump(2) << std::endl;
    } else {
        renderHistoryMarkdown(runs, totals);
    }
    return 0;
}

} // namespace pctoolkit
