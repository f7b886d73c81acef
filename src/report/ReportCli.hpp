#pragma once

#include <QString>
#include <QStringList>

#include "common/settings.hpp"

namespace pctoolkit {

class ReportCli
{
public:
    ReportCli();
    explicit ReportCli(const ToolkitSettings &settings);

    // CLI dispatcher for system info, cleanups and cleanup history.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    int runInfo(const QStringList &args);
    int runClean(const QStringList &args);
    int runHistory(const QStringList &args);

    ToolkitSettings m_settings;
};

} // namespace pctoolkit
