#pragma once

#include "hib/types.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace hib {

/// Totals from the append-only operations log.
struct ManifestStats {
    struct Counts {
        uint64_t success = 0;
        uint64_t failed = 0;
        uint64_t skipped = 0;
        uint64_t bytes = 0;  // successful transfers only
    };
    uint64_t records = 0;
    uint64_t providers = 0;
    uint64_t operations = 0;
    Counts backups;
    Counts uploads;
    int64_t last_operation = 0;  // epoch seconds, 0 if none
};

/// SQLite ledger of transfer outcomes keyed by (provider, remote key).
///
/// All access goes through one mutex, so workers may share an instance.
/// An unreadable or corrupt database raises ManifestError from any call.
class ManifestStore {
public:
    /// Opens (creating if needed) and integrity-checks the database.
    /// Throws ManifestError.
    explicit ManifestStore(const std::filesystem::path& db_path);
    ~ManifestStore();

    ManifestStore(const ManifestStore&) = delete;
    ManifestStore& operator=(const ManifestStore&) = delete;

    std::optional<LocalRecord> lookup(const std::string& provider, const std::string& key);

    /// Upsert (last write wins) and append an operations entry, in one
    /// transaction. Returns an error message or empty string; non-corruption
    /// SQL failures (disk full, read-only) are reported this way.
    std::string record(const LocalRecord& rec);

    /// Log a skipped candidate without touching its record.
    std::string record_skip(const std::string& provider, const std::string& key,
                            Direction direction, uint64_t size);

    /// Most recently updated first. `limit` 0 means no limit.
    std::vector<LocalRecord> history(const std::optional<std::string>& provider, size_t limit);

    /// Groups of two or more records with identical fingerprints. Each
    /// record appears in at most one group.
    std::vector<std::vector<LocalRecord>> find_duplicates();

    /// Remove records whose local file no longer exists and for which
    /// `predicate` returns true. Records with an existing file are never
    /// removed. Returns the affected records (not removed when dry_run).
    std::vector<LocalRecord> cleanup(const std::function<bool(const LocalRecord&)>& predicate,
                                     bool dry_run = false);

    std::vector<LocalRecord> all_records();

    ManifestStats stats();

    const std::filesystem::path& path() const { return db_path_; }

private:
    void open();
    void prepare(const char* sql, sqlite3_stmt** stmt);
    [[noreturn]] void corrupt(int rc, const std::string& context) const;
    int check(int rc, const std::string& context) const;
    std::vector<LocalRecord> query_records(const std::string& sql,
                                           const std::function<void(sqlite3_stmt*)>& bind);
    std::string append_operation(const std::string& provider, const std::string& key,
                                 Direction direction, Outcome outcome, uint64_t size,
                                 ErrorKind kind, int64_t at);

    std::filesystem::path db_path_;
    sqlite3* db_ = nullptr;
    std::mutex db_mutex_;

    sqlite3_stmt* stmt_upsert_ = nullptr;
    sqlite3_stmt* stmt_lookup_ = nullptr;
    sqlite3_stmt* stmt_append_op_ = nullptr;
    sqlite3_stmt* stmt_delete_ = nullptr;
};

}  // namespace hib
