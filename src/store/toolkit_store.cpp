#include "store/toolkit_store.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <random>
#include <sstream>
#include <stdexcept>

#include <sqlite3.h>

#include "common/json_utils.hpp"

namespace pctoolkit {

namespace {

constexpr const char *kCreateCleanupRunsTable =
    "CREATE TABLE IF NOT EXISTS cleanup_runs ("
    "    id TEXT PRIMARY KEY,"
    "    timestamp INTEGER NOT NULL,"
    "    kind TEXT NOT NULL,"
    "    items_removed INTEGER NOT NULL,"
    "    bytes_freed INTEGER NOT NULL,"
    "    summary TEXT NOT NULL,"
    "    details TEXT,"
    "    success INTEGER NOT NULL DEFAULT 1"
    ");";

constexpr const char *kCreateHardwareProfilesTable =
    "CREATE TABLE IF NOT EXISTS hardware_profiles ("
    "    id TEXT PRIMARY KEY,"
    "    timestamp INTEGER NOT NULL,"
    "    fingerprint TEXT NOT NULL,"
    "    payload TEXT NOT NULL"
    ");";

constexpr const char *kCreateMetaTable =
    "CREATE TABLE IF NOT EXISTS meta ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

constexpr const char *kVolatileProfileKeys[] = {"capturedAt"};

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("sqlite prepare failed: ")
                                     + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

int64_t toEpochSeconds(std::chrono::system_clock::time_point timestamp)
{
    return std::chrono::duration_cast<std::chrono::seconds>(
               timestamp.time_since_epoch())
        .count();
}

std::chrono::system_clock::time_point fromEpochSeconds(int64_t value)
{
    return std::chrono::system_clock::time_point{
        std::chrono::seconds{value}};
}

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw std::runtime_error(message);
    }
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bindJson(sqlite3_stmt *stmt, int index, const nlohmann::json &value)
{
    if (value.is_null()) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    bindText(stmt, index, value.dump());
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

nlohmann::json columnJson(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return nlohmann::json::object();
    }
    try {
        return nlohmann::json::parse(reinterpret_cast<const char *>(text));
    } catch (const nlohmann::json::parse_error &) {
        return nlohmann::json::object();
    }
}

std::string generateUuid()
{
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dist;

    const uint64_t part1 = dist(gen);
    const uint64_t part2 = dist(gen);

    char buffer[40];
    std::snprintf(buffer, sizeof(buffer), "%08llx-%04llx-%04llx-%04llx-%012llx",
                  static_cast<unsigned long long>(part1 >> 32),
                  static_cast<unsigned long long>((part1 >> 16) & 0xFFFF),
                  static_cast<unsigned long long>(part1 & 0xFFFF),
                  static_cast<unsigned long long>(part2 >> 48),
                  static_cast<unsigned long long>(part2 & 0xFFFFFFFFFFFFULL));
    return buffer;
}

CleanupRun readCleanupRun(sqlite3_stmt *stmt)
{
    CleanupRun run;
    run.id = columnText(stmt, 0);
    run.timestamp = fromEpochSeconds(sqlite3_column_int64(stmt, 1));
    run.kind = parseCleanupKindString(columnText(stmt, 2));
    const int64_t items = sqlite3_column_int64(stmt, 3);
    run.itemsRemoved = items > 0 ? static_cast<uint64_t>(items) : 0;
    run.bytesFreed = sqlite3_column_int64(stmt, 4);
    run.summary = columnText(stmt, 5);
    run.details = columnJson(stmt, 6);
    run.success = sqlite3_column_int(stmt, 7) != 0;
    return run;
}

} // namespace

struct ToolkitStore::Impl {
    sqlite3 *db = nullptr;
};

ToolkitStore::ToolkitStore()
    : impl(std::make_unique<Impl>())
{
    open(defaultDatabasePath());
}

ToolkitStore::ToolkitStore(const std::string &databasePath)
    : impl(std::make_unique<Impl>())
{
    open(databasePath);
}

ToolkitStore::~ToolkitStore()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
    }
}

std::string ToolkitStore::defaultDatabasePath()
{
    const char *home = std::getenv("HOME");
    std::filesystem::path basePath = home ? home : ".";
    basePath /= ".local/share/pctoolkit";
    return (basePath / "pctoolkit.db").string();
}

void ToolkitStore::open(const std::string &databasePath)
{
    const std::filesystem::path dbPath(databasePath);
    if (dbPath.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(dbPath.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("failed to create database directory: " + ec.message());
        }
    }

    if (sqlite3_open(dbPath.string().c_str(), &impl->db) != SQLITE_OK) {
        std::string message = "failed to open pctoolkit database";
        if (impl->db) {
            message += std::string(": ") + sqlite3_errmsg(impl->db);
            sqlite3_close(impl->db);
            impl->db = nullptr;
        }
        throw std::runtime_error(message);
    }
    sqlite3_busy_timeout(impl->db, 2000);

    execOrThrow(impl->db, kCreateCleanupRunsTable);
    execOrThrow(impl->db, kCreateHardwareProfilesTable);
    execOrThrow(impl->db, kCreateMetaTable);
}

std::string ToolkitStore::addCleanupRun(const CleanupRun &run)
{
    const std::string id = run.id.empty() ? generateUuid() : run.id;

    Statement stmt(impl->db,
                   "INSERT OR REPLACE INTO cleanup_runs (id, timestamp, kind, items_removed, "
                   "bytes_freed, summary, details, success) VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
    bindText(stmt.get(), 1, id);
    sqlite3_bind_int64(stmt.get(), 2, toEpochSeconds(run.timestamp));
    bindText(stmt.get(), 3, toCleanupKindString(run.kind));
    sqlite3_bind_int64(stmt.get(), 4, static_cast<sqlite3_int64>(run.itemsRemoved));
    sqlite3_bind_int64(stmt.get(), 5, run.bytesFreed);
    bindText(stmt.get(), 6, run.summary);
    bindJson(stmt.get(), 7, run.details);
    sqlite3_bind_int(stmt.get(), 8, run.success ? 1 : 0);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error("failed to insert cleanup run");
    }
    return id;
}

std::vector<CleanupRun> ToolkitStore::listCleanupRuns(int limit) const
{
    std::string sql = "SELECT id, timestamp, kind, items_removed, bytes_freed, summary, "
                      "details, success FROM cleanup_runs ORDER BY timestamp DESC, rowid DESC";
    if (limit > 0) {
        sql += " LIMIT ?";
    }
    sql += ";";

    Statement stmt(impl->db, sql.c_str());
    if (limit > 0) {
        sqlite3_bind_int(stmt.get(), 1, limit);
    }

    std::vector<CleanupRun> runs;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        runs.push_back(readCleanupRun(stmt.get()));
    }
    return runs;
}

std::vector<CleanupTotals> ToolkitStore::cleanupTotals() const
{
    Statement stmt(impl->db,
                   "SELECT kind, COUNT(*), SUM(items_removed), SUM(bytes_freed) "
                   "FROM cleanup_runs GROUP BY kind ORDER BY kind;");

    std::vector<CleanupTotals> totals;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        CleanupTotals entry;
        entry.kind = parseCleanupKindString(columnText(stmt.get(), 0));
        entry.runs = sqlite3_column_int(stmt.get(), 1);
        const int64_t items = sqlite3_column_int64(stmt.get(), 2);
        entry.itemsRemoved = items > 0 ? static_cast<uint64_t>(items) : 0;
        entry.bytesFreed = sqlite3_column_int64(stmt.get(), 3);
        totals.push_back(entry);
    }
    return totals;
}

std::string ToolkitStore::fingerprintFor(const nlohmann::json &payload)
{
    nlohmann::json stable = payload;
    if (stable.is_object()) {
        for (const char *key : kVolatileProfileKeys) {
            stable.erase(key);
        }
    }

    // nlohmann::json objects dump with sorted keys, so equal payloads hash equal.
    const std::string dump = stable.dump();
    uint64_t hash = 1469598103934665603ULL;
    for (unsigned char c : dump) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }

    char buffer[17];
    std::snprintf(buffer, sizeof(buffer), "%016llx", static_cast<unsigned long long>(hash));
    return buffer;
}

bool ToolkitStore::saveHardwareProfile(const nlohmann::json &payload)
{
    const std::string fingerprint = fingerprintFor(payload);
    const auto latest = latestHardwareProfile();
    if (latest.has_value() && latest->fingerprint == fingerprint) {
        return false;
    }

    Statement stmt(impl->db,
                   "INSERT INTO hardware_profiles (id, timestamp, fingerprint, payload) "
                   "VALUES (?, ?, ?, ?);");
    bindText(stmt.get(), 1, generateUuid());
    sqlite3_bind_int64(stmt.get(), 2, toEpochSeconds(std::chrono::system_clock::now()));
    bindText(stmt.get(), 3, fingerprint);
    bindText(stmt.get(), 4, payload.dump());

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error("failed to insert hardware profile");
    }
    return true;
}

std::optional<HardwareProfile> ToolkitStore::latestHardwareProfile() const
{
    Statement stmt(impl->db,
                   "SELECT id, timestamp, fingerprint, payload FROM hardware_profiles "
                   "ORDER BY timestamp DESC, rowid DESC LIMIT 1;");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }

    HardwareProfile profile;
    profile.id = columnText(stmt.get(), 0);
    profile.timestamp = fromEpochSeconds(sqlite3_column_int64(stmt.get(), 1));
    profile.fingerprint = columnText(stmt.get(), 2);
    profile.payload = columnJson(stmt.get(), 3);
    return profile;
}

std::optional<std::string> ToolkitStore::getMeta(const std::string &key) const
{
    Statement stmt(impl->db,
                   "SELECT value FROM meta WHERE key = ? LIMIT 1;");
    bindText(stmt.get(), 1, key);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }

    return columnText(stmt.get(), 0);
}

void ToolkitStore::setMeta(const std::string &key, const std::string &value)
{
    Statement stmt(impl->db,
                   "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?);");
    bindText(stmt.get(), 1, key);
    bindText(stmt.get(), 2, value);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error("failed to set meta value");
    }
}

bool ToolkitStore::integrityCheck(std::string *message) const
{
    Statement stmt(impl->db, "PRAGMA integrity_check;");

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        if (message) {
            *message = "integrity_check failed to return a result";
        }
        return false;
    }

    const std::string result = columnText(stmt.get(), 0);
    if (message) {
        *message = result;
    }
    return result == "ok";
}

} // namespace pctoolkit
