#include "probe/motherboard_probe.hpp"

#include <QRegularExpression>
#include <QStringList>

#include <cmath>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "common/process_utils.hpp"
#include "common/sysfs_utils.hpp"
#include "probe/memory_probe.hpp"

namespace pctoolkit {

namespace {

// Longer tokens first so "B650E" wins over "B650".
const char *const kAmdChipsets[] = {
    "X870E", "X870", "B850", "B840", "A620", "X670E", "X670", "B650E", "B650",
    "X570", "B550", "A520", "X470", "B450", "X370", "B350", "A320"};

const char *const kIntelChipsets[] = {
    "Z890", "B860", "H810", "Z790", "H770", "B760", "Z690", "H670", "B660",
    "H610", "Z590", "B560", "H510", "Z490", "B460", "H410"};

QString findToken(const QString &text)
{
    const QString upper = text.toUpper();
    for (const char *token : kAmdChipsets) {
        if (upper.contains(QLatin1String(token))) {
            return QStringLiteral("AMD ") + QLatin1String(token);
        }
    }
    for (const char *token : kIntelChipsets) {
        if (upper.contains(QLatin1String(token))) {
            return QStringLiteral("Intel ") + QLatin1String(token);
        }
    }
    return {};
}

QString dmiField(const QString &root, const char *name)
{
    const QString value = cleanDmiString(
        readTrimmedFile(rootedPath(root, QStringLiteral("/sys/class/dmi/id/"))
                        + QLatin1String(name)));
    if (value.isEmpty()
        || value.compare(QStringLiteral("To be filled by O.E.M."), Qt::CaseInsensitive) == 0
        || value.compare(QStringLiteral("Default string"), Qt::CaseInsensitive) == 0) {
        return QStringLiteral("Unknown");
    }
    return value;
}

qulonglong capacityToMib(const QString &value)
{
    const QStringList parts = value.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    if (parts.size() != 2) {
        return 0;
    }
    bool ok = false;
    const double amount = parts.at(0).toDouble(&ok);
    if (!ok || amount <= 0.0) {
        return 0;
    }
    const QString unit = parts.at(1).toUpper();
    if (unit == QStringLiteral("KB")) {
        return static_cast<qulonglong>(amount / 1024.0);
    }
    if (unit == QStringLiteral("MB")) {
        return static_cast<qulonglong>(amount);
    }
    if (unit == QStringLiteral("GB")) {
        return static_cast<qulonglong>(amount * 1024.0);
    }
    if (unit == QStringLiteral("TB")) {
        return static_cast<qulonglong>(amount * 1024.0 * 1024.0);
    }
    return 0;
}

QString runLiveTool(const QString &program, const QStringList &args)
{
    int exitCode = 0;
    const QString output = runCommand(program, args, &exitCode, 10000);
    return exitCode == 0 ? output : QString();
}

} // namespace

DmiMemoryArray parseDmiMemoryArray(const QString &dmidecodeOutput)
{
    DmiMemoryArray array;
    bool systemMemory = true;
    for (const QString &rawLine : dmidecodeOutput.split(QLatin1Char('\n'))) {
        const QString line = rawLine.trimmed();
        if (line.startsWith(QStringLiteral("Handle "))) {
            systemMemory = true;
            continue;
        }
        QString key;
        QString value;
        if (!splitKeyValue(line, QLatin1Char(':'), &key, &value)) {
            continue;
        }
        // Cache and video arrays also appear as type 16.
        if (key == QStringLiteral("Use")) {
            systemMemory = value == QStringLiteral("System Memory");
        } else if (key == QStringLiteral("Number Of Devices") && systemMemory) {
            array.slots += value.toInt();
        } else if (key == QStringLiteral("Maximum Capacity") && systemMemory) {
            array.maxCapacityMib += capacityToMib(value);
        }
    }
    return array;
}

QString chipsetFromBoardName(const QString &boardName)
{
    return findToken(boardName);
}

QString chipsetFromLspci(const QString &lspciOutput)
{
    for (const QString &line : lspciOutput.split(QLatin1Char('\n'))) {
        if (!line.contains(QStringLiteral("ISA bridge"))
            && !line.contains(QStringLiteral("LPC"))) {
            continue;
        }
        const QString chipset = findToken(line.section(QStringLiteral(": "), 1));
        if (!chipset.isEmpty()) {
            return chipset;
        }
    }
    return {};
}

QString estimateChipsetFromCpu(const QString &cpuName)
{
    if (cpuName.contains(QStringLiteral("AMD"), Qt::CaseInsensitive)) {
        static const QRegularExpression ryzen(
            QStringLiteral("Ryzen\\s+(?:\\d+|Threadripper)\\s+(?:PRO\\s+)?(\\d)\\d{3}"),
            QRegularExpression::CaseInsensitiveOption);
        const QRegularExpressionMatch match = ryzen.match(cpuName);
        const QString generation = match.hasMatch() ? match.captured(1) : QString();
        if (cpuName.contains(QStringLiteral("7000"))
            || generation == QStringLiteral("7")
            || generation == QStringLiteral("9")) {
            return QStringLiteral("AMD 600 Series (Estimated)");
        }
        if (cpuName.contains(QStringLiteral("5000")) || generation == QStringLiteral("5")) {
            return QStringLiteral("AMD 500 Series (Estimated)");
        }
        return QStringLiteral("AMD (Unknown Series)");
    }

    if (cpuName.contains(QStringLiteral("Intel"), Qt::CaseInsensitive)) {
        static const QRegularExpression core(QStringLiteral("i[3579]-(1[234])\\d{3}"));
        const QRegularExpressionMatch match = core.match(cpuName);
        const QString generation = match.hasMatch() ? match.captured(1) : QString();
        if (cpuName.contains(QStringLiteral("12th Gen")) || generation == QStringLiteral("12")) {
            return QStringLiteral("Intel 600 Series (Estimated)");
        }
        if (cpuName.contains(QStringLiteral("13th Gen"))
            || cpuName.contains(QStringLiteral("14th Gen"))
            || generation == QStringLiteral("13")
            || generation == QStringLiteral("14")) {
            return QStringLiteral("Intel 700 Series (Estimated)");
        }
        return QStringLiteral("Intel (Unknown Series)");
    }
    return {};
}

std::string detectChipset(const QString &boardName,
                          const QString &lspciOutput,
                          const QString &cpuName)
{
    QString chipset = chipsetFromBoardName(boardName);
    if (chipset.isEmpty()) {
        chipset = chipsetFromLspci(lspciOutput);
    }
    if (chipset.isEmpty()) {
        chipset = estimateChipsetFromCpu(cpuName);
    }
    return chipset.isEmpty() ? std::string("Unknown") : chipset.toStdString();
}

MotherboardInfo readMotherboardInfo(const QString &root, const QString &cpuName)
{
    MotherboardInfo info;
    const QString board = dmiField(root, "board_name");
    info.product = board.toStdString();
    info.manufacturer = dmiField(root, "board_vendor").toStdString();
    info.version = dmiField(root, "board_version").toStdString();
    info.biosVersion = dmiField(root, "bios_version").toStdString();
    info.biosManufacturer = dmiField(root, "bios_vendor").toStdString();
    info.biosDate = dmiField(root, "bios_date").toStdString();
    info.systemModel = dmiField(root, "product_name").toStdString();

    QString lspci;
    if (isLiveSystem(root)) {
        lspci = runLiveTool(QStringLiteral("lspci"), {});

        const DmiMemoryArray array = parseDmiMemoryArray(
            runLiveTool(QStringLiteral("dmidecode"), {QStringLiteral("--type"), QStringLiteral("16")}));
        if (array.slots > 0) {
            info.memorySlots = std::to_string(array.slots);
        }
        if (array.maxCapacityMib > 0) {
            info.maxMemoryCapacity =
                std::to_string(std::llround(static_cast<double>(array.maxCapacityMib) / 1024.0))
                + " GB";
        }

        const QString devices =
            runLiveTool(QStringLiteral("dmidecode"), {QStringLiteral("--type"), QStringLiteral("17")});
        if (!devices.isEmpty()) {
            info.memorySlotsUsed = std::to_string(parseDmiMemoryDevices(devices).size());
        }
    }

    info.chipset = detectChipset(board == QStringLiteral("Unknown") ? QString() : board,
                                 lspci, cpuName);

    PTLOG_DEBUG(QStringLiteral("MotherboardProbe"),
                QStringLiteral("readMotherboardInfo"),
                QStringLiteral("motherboard_read"),
                QStringLiteral("static_probe"),
                QStringLiteral("dmi_sysfs"),
                pctoolkit::logging::defaultWho(),
                QString(),
                (nlohmann::json{{"product", info.product}, {"chipset", info.chipset}}));
    return info;
}

} // namespace pctoolkit
