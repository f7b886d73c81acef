#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace pctoolkit {

struct HardwareProfile {
    std::string id;
    std::chrono::system_clock::time_point timestamp;
    std::string fingerprint;
    nlohmann::json payload;
};

// ToolkitStore is the SQLite access layer for persistent data: cleanup
// history, hardware profiles and meta values.
class ToolkitStore {
public:
    // Opens $HOME/.local/share/pctoolkit/pctoolkit.db.
    ToolkitStore();
    explicit ToolkitStore(const std::string &databasePath);
    ~ToolkitStore();

    ToolkitStore(const ToolkitStore &) = delete;
    ToolkitStore &operator=(const ToolkitStore &) = delete;

    static std::string defaultDatabasePath();

    // Assigns an id when run.id is empty and returns the stored id.
    std::string addCleanupRun(const CleanupRun &run);
    // Newest first; limit <= 0 returns every run.
    std::vector<CleanupRun> listCleanupRuns(int limit = 0) const;
    std::vector<CleanupTotals> cleanupTotals() const;

    // Stores the profile only when its fingerprint differs from the latest
    // one. Returns whether a row was written.
    bool saveHardwareProfile(const nlohmann::json &payload);
    std::optional<HardwareProfile> latestHardwareProfile() const;

    // FNV-1a hash of the payload dump without volatile keys ("capturedAt").
    static std::string fingerprintFor(const nlohmann::json &payload);

    std::optional<std::string> getMeta(const std::string &key) const;
    void setMeta(const std::string &key, const std::string &value);

    bool integrityCheck(std::string *message = nullptr) const;

private:
    void open(const std::string &databasePath);

    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace pctoolkit
