#include <QtTest/QtTest>

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QSignalSpy>
#include <QTemporaryDir>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "cleaner/system_cleaner.hpp"
#include "store/toolkit_store.hpp"

namespace {

void writeFile(const QString &path, int size)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    QCOMPARE(file.write(QByteArray(size, 'x')), static_cast<qint64>(size));
}

// Works on directories and FIFOs too, which QFile cannot open for this.
void ageFile(const QString &path, int hours)
{
    const time_t when = QDateTime::currentDateTime().addSecs(-3600LL * hours).toSecsSinceEpoch();
    struct timespec times[2] = {{when, 0}, {when, 0}};
    QCOMPARE(::utimensat(AT_FDCWD, QFile::encodeName(path).constData(), times,
                         AT_SYMLINK_NOFOLLOW),
             0);
}

} // namespace

class SystemCleanerTests : public QObject
{
    Q_OBJECT
private slots:
    void init();
    void cleanup();
    void testTempFoldersOrderAndDedup();
    void testDirectorySize();
    void testCleanTempFiles();
    void testMinimumAgeKeepsRecentEntries();
    void testAgedDirectoryKeepsLiveAndRecentEntries();
    void testUnremovableEntryFailsRun();
    void testEmptyTrashOnly();
    void testEmptyTrashWhenMissing();
    void testDiskCleanupRequiresRoot();
    void testDiskCleanupLaunch();
    void testOptimizeMemoryUnprivileged();
    void testOptimizeMemoryPrivileged();
    void testOptimizeMemoryWithoutStatistics();

private:
    pctoolkit::ToolkitSettings settings() const;
    QString trashPath() const;

    std::unique_ptr<QTemporaryDir> m_sandbox;
    QString m_root;
    QString m_home;
};

void SystemCleanerTests::init()
{
    m_sandbox = std::make_unique<QTemporaryDir>();
    QVERIFY(m_sandbox->isValid());
    m_root = m_sandbox->path() + QStringLiteral("/root");
    m_home = m_sandbox->path() + QStringLiteral("/home");
    QVERIFY(QDir().mkpath(m_root + QStringLiteral("/tmp")));
    QVERIFY(QDir().mkpath(m_root + QStringLiteral("/var/tmp")));
    QVERIFY(QDir().mkpath(m_home));

    qputenv("HOME", m_home.toUtf8());
    qputenv("TMPDIR", (m_root + QStringLiteral("/tmp/")).toUtf8());
    qunsetenv("TMP");
    qputenv("XDG_CACHE_HOME", (m_home + QStringLiteral("/.cache")).toUtf8());
    qputenv("XDG_DATA_HOME", (m_home + QStringLiteral("/.local/share")).toUtf8());
}

void SystemCleanerTests::cleanup()
{
    m_sandbox.reset();
}

pctoolkit::ToolkitSettings SystemCleanerTests::settings() const
{
    pctoolkit::ToolkitSettings settings;
    settings.sysRoot = m_root;
    settings.tempMinAgeHours = 0;
    return settings;
}

QString SystemCleanerTests::trashPath() const
{
    return m_home + QStringLiteral("/.local/share/Trash");
}

void SystemCleanerTests::testTempFoldersOrderAndDedup()
{
    pctoolkit::ToolkitSettings config = settings();
    config.extraTempDirs = {m_root + QStringLiteral("/extra"), QStringLiteral("  "),
                            m_root + QStringLiteral("/var/tmp")};
    pctoolkit::SystemCleaner cleaner(config);

    const QStringList expected = {
        m_root + QStringLiteral("/tmp"),
        m_root + QStringLiteral("/var/tmp"),
        m_home + QStringLiteral("/.cache/thumbnails"),
        m_root + QStringLiteral("/extra"),
    };
    QCOMPARE(cleaner.tempFolders(), expected);
    QCOMPARE(cleaner.trashDirectory(), trashPath());
}

void SystemCleanerTests::testDirectorySize()
{
    const QString dir = m_sandbox->path() + QStringLiteral("/sized");
    writeFile(dir + QStringLiteral("/a.bin"), 10);
    writeFile(dir + QStringLiteral("/nested/.hidden"), 20);
    QVERIFY(QFile::link(dir + QStringLiteral("/a.bin"), dir + QStringLiteral("/link")));

    QCOMPARE(pctoolkit::SystemCleaner::directorySize(dir), std::int64_t{30});
    QCOMPARE(pctoolkit::SystemCleaner::directorySize(dir + QStringLiteral("/missing")),
             std::int64_t{0});
}

void SystemCleanerTests::testCleanTempFiles()
{
    writeFile(m_root + QStringLiteral("/tmp/session.log"), 100);
    writeFile(m_root + QStringLiteral("/tmp/build/obj.o"), 50);
    const QString fifo = m_root + QStringLiteral("/tmp/app.fifo");
    QCOMPARE(::mkfifo(QFile::encodeName(fifo).constData(), 0600), 0);
    writeFile(trashPath() + QStringLiteral("/files/old.txt"), 10);
    writeFile(trashPath() + QStringLiteral("/info/old.txt.trashinfo"), 20);

    pctoolkit::ToolkitStore store(
        (m_sandbox->path() + QStringLiteral("/history.db")).toStdString());
    pctoolkit::SystemCleaner cleaner(settings());
    cleaner.setStore(&store);
    QSignalSpy logSpy(&cleaner, &pctoolkit::SystemCleaner::logMessage);
    QSignalSpy statusSpy(&cleaner, &pctoolkit::SystemCleaner::statusChanged);

    const pctoolkit::CleanupRun run = cleaner.cleanTempFiles();

    QVERIFY(run.success);
    QCOMPARE(run.kind, pctoolkit::CleanupKind::TempFiles);
    QCOMPARE(run.itemsRemoved, std::uint64_t{3});
    QCOMPARE(run.bytesFreed, std::int64_t{180});
    QCOMPARE(QString::fromStdString(run.summary), QStringLiteral("✅ Cleaned: 180 Bytes (3 items)"));
    QCOMPARE(run.details.at("failures").get<int>(), 0);
    QCOMPARE(run.details.at("trashItems").get<int>(), 1);

    QVERIFY(!QFile::exists(m_root + QStringLiteral("/tmp/session.log")));
    QVERIFY(!QFile::exists(m_root + QStringLiteral("/tmp/build")));
    QVERIFY(QFileInfo::exists(fifo));
    QVERIFY(!QFile::exists(trashPath() + QStringLiteral("/files/old.txt")));

    QStringList messages;
    for (const QList<QVariant> &args : logSpy) {
        messages << args.at(0).toString();
    }
    QVERIFY(messages.contains(QStringLiteral("✅ %1: 2 items, 150 Bytes")
                                  .arg(m_root + QStringLiteral("/tmp"))));
    QVERIFY(messages.contains(QStringLiteral("✅ %1: Already clean")
                                  .arg(m_root + QStringLiteral("/var/tmp"))));
    QVERIFY(messages.contains(QStringLiteral("⚠️ Directory not found: %1")
                                  .arg(m_home + QStringLiteral("/.cache/thumbnails"))));
    QVERIFY(messages.contains(QStringLiteral("🗑️ Trash emptied.")));
    QCOMPARE(messages.last(), QStringLiteral("🎉 Cleanup complete: 3 items removed, 180 Bytes freed"));

    QCOMPARE(statusSpy.first().at(0).toString(), QStringLiteral("🧹 Cleaning..."));
    QCOMPARE(statusSpy.last().at(0).toString(), QString::fromStdString(run.summary));

    const auto history = store.listCleanupRuns();
    QCOMPARE(static_cast<int>(history.size()), 1);
    QCOMPARE(QString::fromStdString(history[0].id), QString::fromStdString(run.id));
    QCOMPARE(history[0].bytesFreed, std::int64_t{180});
}

void SystemCleanerTests::testMinimumAgeKeepsRecentEntries()
{
    const QString oldFile = m_root + QStringLiteral("/tmp/old.tmp");
    const QString newFile = m_root + QStringLiteral("/tmp/new.tmp");
    writeFile(oldFile, 64);
    writeFile(newFile, 32);
    ageFile(oldFile, 48);

    pctoolkit::ToolkitSettings config = settings();
    config.tempMinAgeHours = 24;
    pctoolkit::SystemCleaner cleaner(config);

    const pctoolkit::CleanupRun run = cleaner.cleanTempFiles();
    QCOMPARE(run.itemsRemoved, std::uint64_t{1});
    QCOMPARE(run.bytesFreed, std::int64_t{64});
    QCOMPARE(run.details.at("minAgeHours").get<int>(), 24);
    QVERIFY(!QFile::exists(oldFile));
    QVERIFY(QFile::exists(newFile));
}

void SystemCleanerTests::testAgedDirectoryKeepsLiveAndRecentEntries()
{
    const QString tmp = m_root + QStringLiteral("/tmp");

    // Display server socket directory, untouched since boot.
    const QString x11 = tmp + QStringLiteral("/.X11-unix");
    QVERIFY(QDir().mkpath(x11));
    const QString socketNode = x11 + QStringLiteral("/X0");
    QCOMPARE(::mkfifo(QFile::encodeName(socketNode).constData(), 0600), 0);
    ageFile(socketNode, 72);
    ageFile(x11, 72);

    // Old service directory with a stale file and a freshly written one.
    const QString service = tmp + QStringLiteral("/service-private");
    writeFile(service + QStringLiteral("/stale.bin"), 40);
    writeFile(service + QStringLiteral("/work/fresh.txt"), 8);
    ageFile(service + QStringLiteral("/stale.bin"), 72);
    ageFile(service + QStringLiteral("/work"), 72);
    ageFile(service, 72);

    // Fully stale tree.
    const QString stale = tmp + QStringLiteral("/old-build");
    writeFile(stale + QStringLiteral("/obj/main.o"), 16);
    ageFile(stale + QStringLiteral("/obj/main.o"), 72);
    ageFile(stale + QStringLiteral("/obj"), 72);
    ageFile(stale, 72);

    pctoolkit::ToolkitSettings config = settings();
    config.tempMinAgeHours = 24;
    pctoolkit::SystemCleaner cleaner(config);

    const pctoolkit::CleanupRun run = cleaner.cleanTempFiles();
    QVERIFY(run.success);
    QCOMPARE(run.details.at("failures").get<int>(), 0);
    QCOMPARE(run.itemsRemoved, std::uint64_t{1});
    QCOMPARE(run.bytesFreed, std::int64_t{56});

    QVERIFY(QFileInfo::exists(socketNode));
    QVERIFY(QFileInfo(x11).isDir());
    QVERIFY(QFile::exists(service + QStringLiteral("/work/fresh.txt")));
    QVERIFY(!QFile::exists(service + QStringLiteral("/stale.bin")));
    QVERIFY(!QFile::exists(stale));
}

void SystemCleanerTests::testUnremovableEntryFailsRun()
{
    if (::geteuid() == 0) {
        QSKIP("root can remove entries from read-only directories");
    }

    const QString locked = m_root + QStringLiteral("/tmp/locked");
    writeFile(locked + QStringLiteral("/held.lock"), 12);
    writeFile(m_root + QStringLiteral("/tmp/loose.tmp"), 30);
    QVERIFY(QFile::setPermissions(locked, QFileDevice::ReadOwner | QFileDevice::ExeOwner));

    pctoolkit::SystemCleaner cleaner(settings());
    QSignalSpy logSpy(&cleaner, &pctoolkit::SystemCleaner::logMessage);
    const pctoolkit::CleanupRun run = cleaner.cleanTempFiles();

    QVERIFY(QFile::setPermissions(locked, QFileDevice::ReadOwner | QFileDevice::WriteOwner
                                              | QFileDevice::ExeOwner));

    QVERIFY(!run.success);
    QCOMPARE(run.details.at("failures").get<int>(), 1);
    QCOMPARE(run.itemsRemoved, std::uint64_t{1});
    QCOMPARE(run.bytesFreed, std::int64_t{30});
    QVERIFY(QFile::exists(locked + QStringLiteral("/held.lock")));

    bool reported = false;
    for (const QList<QVariant> &args : logSpy) {
        reported = reported || args.at(0).toString().startsWith(QStringLiteral("✖ locked: "));
    }
    QVERIFY(reported);
}

void SystemCleanerTests::testEmptyTrashOnly()
{
    writeFile(trashPath() + QStringLiteral("/files/a.txt"), 5);
    writeFile(trashPath() + QStringLiteral("/files/dir/b.txt"), 7);
    writeFile(trashPath() + QStringLiteral("/info/a.txt.trashinfo"), 3);
    writeFile(trashPath() + QStringLiteral("/info/dir.trashinfo"), 3);

    pctoolkit::SystemCleaner cleaner(settings());
    QSignalSpy logSpy(&cleaner, &pctoolkit::SystemCleaner::logMessage);
    QSignalSpy statusSpy(&cleaner, &pctoolkit::SystemCleaner::statusChanged);

    const pctoolkit::CleanupRun run = cleaner.emptyTrashOnly();
    QVERIFY(run.success);
    QCOMPARE(run.kind, pctoolkit::CleanupKind::Trash);
    QCOMPARE(run.itemsRemoved, std::uint64_t{2});
    QCOMPARE(run.bytesFreed, std::int64_t{18});
    QCOMPARE(QString::fromStdString(run.summary), QStringLiteral("✅ Trash Emptied"));
    QCOMPARE(statusSpy.first().at(0).toString(), QStringLiteral("🗑️ Emptying Trash..."));
    QCOMPARE(statusSpy.last().at(0).toString(), QStringLiteral("✅ Trash Emptied"));
    QCOMPARE(logSpy.last().at(0).toString(), QStringLiteral("✅ Trash emptied successfully."));

    QVERIFY(QDir(trashPath() + QStringLiteral("/files")).isEmpty());
    QVERIFY(QDir(trashPath() + QStringLiteral("/info")).isEmpty());
}

void SystemCleanerTests::testEmptyTrashWhenMissing()
{
    pctoolkit::SystemCleaner cleaner(settings());
    const pctoolkit::CleanupRun run = cleaner.emptyTrash();
    QVERIFY(run.success);
    QCOMPARE(run.itemsRemoved, std::uint64_t{0});
    QCOMPARE(run.bytesFreed, std::int64_t{0});
    QCOMPARE(QString::fromStdString(run.summary), QStringLiteral("Trash emptied"));
}

void SystemCleanerTests::testDiskCleanupRequiresRoot()
{
    pctoolkit::SystemCleaner cleaner(settings());
    cleaner.setPrivilegeCheck([]() { return false; });
    QSignalSpy statusSpy(&cleaner, &pctoolkit::SystemCleaner::statusChanged);

    const pctoolkit::CleanupRun run = cleaner.runDiskCleanup();
    QVERIFY(!run.success);
    QCOMPARE(run.kind, pctoolkit::CleanupKind::DiskCleanup);
    QCOMPARE(QString::fromStdString(run.summary), QStringLiteral("❌ Run as root"));
    QCOMPARE(statusSpy.count(), 1);
    QCOMPARE(statusSpy.first().at(0).toString(), QStringLiteral("❌ Run as root"));
}

void SystemCleanerTests::testDiskCleanupLaunch()
{
    pctoolkit::ToolkitSettings config = settings();
    config.diskCleanupCommand = QStringLiteral("   ");
    pctoolkit::SystemCleaner emptyCommand(config);
    emptyCommand.setPrivilegeCheck([]() { return true; });
    const pctoolkit::CleanupRun failed = emptyCommand.runDiskCleanup();
    QVERIFY(!failed.success);
    QCOMPARE(QString::fromStdString(failed.summary),
             QStringLiteral("Error running disk cleanup: empty command"));

    config.diskCleanupCommand = QStringLiteral("true --ignored-argument");
    pctoolkit::SystemCleaner cleaner(config);
    cleaner.setPrivilegeCheck([]() { return true; });
    QSignalSpy logSpy(&cleaner, &pctoolkit::SystemCleaner::logMessage);

    const pctoolkit::CleanupRun run = cleaner.runDiskCleanup();
    QVERIFY(run.success);
    QCOMPARE(QString::fromStdString(run.summary), QStringLiteral("Launched true --ignored-argument"));
    QCOMPARE(QString::fromStdString(run.details.value("command", "")),
             QStringLiteral("true --ignored-argument"));
    QVERIFY(run.details.at("pid").get<qint64>() > 0);
    QCOMPARE(logSpy.first().at(0).toString(),
             QStringLiteral("Launching: true --ignored-argument"));
}

void SystemCleanerTests::testOptimizeMemoryUnprivileged()
{
    QVERIFY(QDir().mkpath(m_root + QStringLiteral("/proc")));
    QFile meminfo(m_root + QStringLiteral("/proc/meminfo"));
    QVERIFY(meminfo.open(QIODevice::WriteOnly | QIODevice::Truncate));
    meminfo.write("MemTotal:       16384000 kB\nMemAvailable:    8192000 kB\n");
    meminfo.close();

    pctoolkit::SystemCleaner cleaner(settings());
    cleaner.setPrivilegeCheck([]() { return false; });
    QSignalSpy logSpy(&cleaner, &pctoolkit::SystemCleaner::logMessage);
    QSignalSpy statusSpy(&cleaner, &pctoolkit::SystemCleaner::statusChanged);

    const pctoolkit::CleanupRun run = cleaner.optimizeMemory();
    QVERIFY(run.success);
    QCOMPARE(run.kind, pctoolkit::CleanupKind::Memory);
    QCOMPARE(run.bytesFreed, std::int64_t{0});
    QCOMPARE(QString::fromStdString(run.summary), QStringLiteral("✅ Memory Optimized: +0 Bytes"));
    QCOMPARE(QString::fromStdString(run.details.value("steps", "")), QStringLiteral("heap_trim"));
    QCOMPARE(run.details.at("privileged").get<bool>(), false);

    QCOMPARE(logSpy.first().at(0).toString(),
             QStringLiteral("💾 Memory: 7.8 GiB available (50.0% used)"));
    QCOMPARE(logSpy.last().at(0).toString(),
             QStringLiteral("✅ Memory freed: 0 Bytes (Basic optimization)"));
    QCOMPARE(statusSpy.first().at(0).toString(), QStringLiteral("🧠 Optimizing Memory..."));
}

void SystemCleanerTests::testOptimizeMemoryPrivileged()
{
    QVERIFY(QDir().mkpath(m_root + QStringLiteral("/proc/sys/vm")));
    QFile meminfo(m_root + QStringLiteral("/proc/meminfo"));
    QVERIFY(meminfo.open(QIODevice::WriteOnly | QIODevice::Truncate));
    meminfo.write("MemTotal:       16384000 kB\nMemAvailable:    8192000 kB\n");
    meminfo.close();

    pctoolkit::SystemCleaner cleaner(settings());
    cleaner.setPrivilegeCheck([]() { return true; });

    const pctoolkit::CleanupRun run = cleaner.optimizeMemory();
    QVERIFY(run.success);
    QCOMPARE(QString::fromStdString(run.details.value("steps", "")),
             QStringLiteral("heap_trim,sync,drop_caches_3,compact_memory"));
    QCOMPARE(run.details.at("privileged").get<bool>(), true);

    QFile dropCaches(m_root + QStringLiteral("/proc/sys/vm/drop_caches"));
    QVERIFY(dropCaches.open(QIODevice::ReadOnly));
    QCOMPARE(dropCaches.readAll(), QByteArray("3"));
}

void SystemCleanerTests::testOptimizeMemoryWithoutStatistics()
{
    pctoolkit::SystemCleaner cleaner(settings());
    cleaner.setPrivilegeCheck([]() { return false; });
    QSignalSpy statusSpy(&cleaner, &pctoolkit::SystemCleaner::statusChanged);

    const pctoolkit::CleanupRun run = cleaner.optimizeMemory();
    QVERIFY(!run.success);
    QCOMPARE(QString::fromStdString(run.summary),
             QStringLiteral("Memory optimization error: memory statistics unavailable"));
    QCOMPARE(statusSpy.last().at(0).toString(), QStringLiteral("❌ Memory Optimization Failed"));
}

QTEST_MAIN(SystemCleanerTests)
#include "test_system_cleaner.moc"
