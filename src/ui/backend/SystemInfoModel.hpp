#pragma once

#include <QObject>
#include <QString>
#include <QVariantList>
#include <QVariantMap>

#include "common/models.hpp"

namespace pctoolkit {

class SystemInfoLoader;

/**
 * SystemInfoModel turns SystemInfoLoader results into QML-friendly maps.
 * Every value in the maps is display-ready text except the numeric
 * "usage"/"percent" entries that drive progress bars.
 */
class SystemInfoModel : public QObject
{
    Q_OBJECT
    Q_PROPERTY(QString uptime READ uptime NOTIFY uptimeChanged)
    Q_PROPERTY(QVariantMap cpu READ cpu NOTIFY cpuChanged)
    Q_PROPERTY(QVariantMap memory READ memory NOTIFY memoryChanged)
    Q_PROPERTY(QVariantMap disk READ disk NOTIFY diskChanged)
    Q_PROPERTY(QVariantMap storage READ storage NOTIFY storageChanged)
    Q_PROPERTY(QVariantMap gpu READ gpu NOTIFY gpuChanged)
    Q_PROPERTY(QVariantMap monitors READ monitors NOTIFY monitorsChanged)
    Q_PROPERTY(QVariantMap motherboard READ motherboard NOTIFY motherboardChanged)
    Q_PROPERTY(QVariantMap os READ os NOTIFY osChanged)
    Q_PROPERTY(bool copyEnabled READ copyEnabled NOTIFY copyEnabledChanged)
    Q_PROPERTY(QString copyFeedback READ copyFeedback NOTIFY copyFeedbackChanged)

public:
    static constexpr int kCopyEnableDelayMs = 2000;
    static constexpr int kCopyFeedbackMs = 2000;

    // loader is not owned; null is allowed for tests that feed the slots directly.
    explicit SystemInfoModel(SystemInfoLoader *loader, QObject *parent = nullptr);

    QString uptime() const;
    QVariantMap cpu() const;
    QVariantMap memory() const;
    QVariantMap disk() const;
    QVariantMap storage() const;
    QVariantMap gpu() const;
    QVariantMap monitors() const;
    QVariantMap motherboard() const;
    QVariantMap os() const;
    bool copyEnabled() const;
    QString copyFeedback() const;

    // Report text of everything received so far.
    Q_INVOKABLE QString reportText() const;
    Q_INVOKABLE bool copySystemInfo();
    // Reloads static sections; copying is disabled until they arrive again.
    Q_INVOKABLE void refresh();

public slots:
    void setUptime(const QString &uptime);
    void setCpuInfo(const pctoolkit::CpuInfo &info);
    void setCpuDynamic(const pctoolkit::CpuDynamicInfo &info);
    void setMemoryInfo(const pctoolkit::MemoryInfo &info);
    void setDiskInfo(const pctoolkit::DiskInfo &info);
    void setStorageOverview(const pctoolkit::StorageOverview &overview);
    void setGpuInfo(const pctoolkit::GpuInfo &info);
    void setMonitorInfo(const pctoolkit::MonitorInfo &info);
    void setMotherboardInfo(const pctoolkit::MotherboardInfo &info);
    void setOsInfo(const pctoolkit::OsInfo &info);

signals:
    void uptimeChanged();
    void cpuChanged();
    void memoryChanged();
    void diskChanged();
    void storageChanged();
    void gpuChanged();
    void monitorsChanged();
    void motherboardChanged();
    void osChanged();
    void copyEnabledChanged();
    void copyFeedbackChanged();

private:
    enum StaticSection {
        CpuSection = 0x1,
        MonitorSection = 0x2,
        MotherboardSection = 0x4,
        OsSection = 0x8,
        AllStaticSections = 0xF
    };

    void markStaticSection(StaticSection section);
    void setCopyEnabled(bool enabled);
    void setCopyFeedback(const QString &feedback);

    SystemInfoLoader *m_loader = nullptr;
    SystemInfo m_info;
    int m_staticSections = 0;
    int m_staticGeneration = 0;
    bool m_copyEnabled = false;
    QString m_copyFeedback;
};

} // namespace pctoolkit
