#include "hib/manifest_store.hpp"
#include "hib/log.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <sqlite3.h>
#include <thread>

namespace hib {

namespace {

constexpr const char* MANIFEST_SCHEMA = R"(
CREATE TABLE IF NOT EXISTS records (
    provider TEXT NOT NULL,
    remote_key TEXT NOT NULL,
    local_path TEXT NOT NULL,
    fingerprint TEXT NOT NULL DEFAULT '',
    size INTEGER NOT NULL DEFAULT 0,
    last_success INTEGER NOT NULL DEFAULT 0,
    updated_at INTEGER NOT NULL,
    seq INTEGER NOT NULL,
    outcome TEXT NOT NULL,
    retry_count INTEGER NOT NULL DEFAULT 0,
    error_kind TEXT NOT NULL DEFAULT 'none',
    message TEXT NOT NULL DEFAULT '',
    direction TEXT NOT NULL DEFAULT 'backup',
    PRIMARY KEY (provider, remote_key)
) WITHOUT ROWID;

CREATE INDEX IF NOT EXISTS idx_fingerprint
    ON records(fingerprint) WHERE fingerprint != '';

CREATE INDEX IF NOT EXISTS idx_updated
    ON records(updated_at, seq);

CREATE INDEX IF NOT EXISTS idx_seq
    ON records(seq);

CREATE TABLE IF NOT EXISTS operations (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    provider TEXT NOT NULL,
    remote_key TEXT NOT NULL,
    direction TEXT NOT NULL,
    outcome TEXT NOT NULL,
    size INTEGER NOT NULL DEFAULT 0,
    error_kind TEXT NOT NULL DEFAULT 'none',
    at INTEGER NOT NULL
);
)";

constexpr const char* RECORD_COLUMNS =
    "provider, remote_key, local_path, fingerprint, size, last_success, updated_at, "
    "outcome, retry_count, error_kind, message, direction";

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

bool is_corruption(int rc) {
    int primary = rc & 0xff;
    return primary == SQLITE_CORRUPT || primary == SQLITE_NOTADB;
}

// Execute a SQL statement with retry on SQLITE_BUSY. Returns the final rc.
int sql_exec(sqlite3* db, const char* sql, std::string* error = nullptr) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        if (rc == SQLITE_OK) return rc;
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            if (err) sqlite3_free(err);
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
            continue;
        }
        if (error) *error = err ? err : sqlite3_errstr(rc);
        if (err) sqlite3_free(err);
        return rc;
    }
    if (error) *error = "database busy";
    return SQLITE_BUSY;
}

// Step a prepared statement with SQLITE_BUSY retry
int sql_step_retry(sqlite3_stmt* stmt) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED) return rc;
        sqlite3_reset(stmt);
        std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
    }
    return SQLITE_BUSY;
}

std::string column_string(sqlite3_stmt* stmt, int col) {
    auto text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

void bind_text(sqlite3_stmt* stmt, int idx, const std::string& value) {
    sqlite3_bind_text(stmt, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

LocalRecord row_to_record(sqlite3_stmt* stmt) {
    LocalRecord rec;
    rec.provider = column_string(stmt, 0);
    rec.remote_key = column_string(stmt, 1);
    rec.local_path = column_string(stmt, 2);
    rec.fingerprint = column_string(stmt, 3);
    rec.size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 4));
    rec.last_success = sqlite3_column_int64(stmt, 5);
    rec.updated_at = sqlite3_column_int64(stmt, 6);

    auto outcome = outcome_from_name(column_string(stmt, 7));
    auto kind = error_kind_from_name(column_string(stmt, 9));
    auto direction = direction_from_name(column_string(stmt, 11));
    if (!outcome || !kind || !direction) {
        throw ManifestError("Unrecognized values in record " + rec.provider + "/" + rec.remote_key);
    }
    rec.outcome = *outcome;
    rec.retry_count = static_cast<uint32_t>(sqlite3_column_int64(stmt, 8));
    rec.error_kind = *kind;
    rec.message = column_string(stmt, 10);
    rec.direction = *direction;
    return rec;
}

}  // namespace

ManifestStore::ManifestStore(const std::filesystem::path& db_path) : db_path_(db_path) {
    try {
        open();
    } catch (...) {
        // Destructor does not run for a partially constructed object
        if (stmt_upsert_) sqlite3_finalize(stmt_upsert_);
        if (stmt_lookup_) sqlite3_finalize(stmt_lookup_);
        if (stmt_append_op_) sqlite3_finalize(stmt_append_op_);
        if (stmt_delete_) sqlite3_finalize(stmt_delete_);
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

ManifestStore::~ManifestStore() {
    if (stmt_upsert_) sqlite3_finalize(stmt_upsert_);
    if (stmt_lookup_) sqlite3_finalize(stmt_lookup_);
    if (stmt_append_op_) sqlite3_finalize(stmt_append_op_);
    if (stmt_delete_) sqlite3_finalize(stmt_delete_);

    if (db_) {
        sqlite3_exec(db_, "PRAGMA wal_checkpoint(TRUNCATE)", nullptr, nullptr, nullptr);
        sqlite3_close(db_);
    }
}

void ManifestStore::open() {
    std::error_code ec;
    if (db_path_.has_parent_path()) {
        std::filesystem::create_directories(db_path_.parent_path(), ec);
        if (ec) throw ManifestError("Cannot create manifest directory: " + ec.message());
    }

    int rc = sqlite3_open_v2(db_path_.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        throw ManifestError("Cannot open manifest " + db_path_.string() + ": " + msg);
    }
    sqlite3_busy_timeout(db_, 5000);

    // Integrity check before trusting anything in the file
    {
        sqlite3_stmt* raw = nullptr;
        check(sqlite3_prepare_v2(db_, "PRAGMA quick_check", -1, &raw, nullptr), "quick_check");
        StmtPtr stmt(raw, &sqlite3_finalize);
        rc = check(sql_step_retry(stmt.get()), "quick_check");
        std::string result = rc == SQLITE_ROW ? column_string(stmt.get(), 0) : "";
        if (result != "ok") {
            throw ManifestError("Manifest integrity check failed: " +
                                (result.empty() ? std::string(sqlite3_errmsg(db_)) : result));
        }
    }

    std::string err;
    for (const char* pragma : {"PRAGMA journal_mode=WAL", "PRAGMA synchronous=NORMAL",
                               "PRAGMA wal_autocheckpoint=1000"}) {
        rc = sql_exec(db_, pragma, &err);
        check(rc, pragma);
        if (rc != SQLITE_OK) log_warn("Manifest %s failed: %s", pragma, err.c_str());
    }

    rc = sql_exec(db_, MANIFEST_SCHEMA, &err);
    check(rc, "schema");
    if (rc != SQLITE_OK) throw ManifestError("Cannot create manifest schema: " + err);

    prepare("INSERT OR REPLACE INTO records (provider, remote_key, local_path, fingerprint, size, "
            "last_success, updated_at, seq, outcome, retry_count, error_kind, message, direction) "
            "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, "
            "(SELECT COALESCE(MAX(seq), 0) + 1 FROM records), ?8, ?9, ?10, ?11, ?12)",
            &stmt_upsert_);

    prepare((std::string("SELECT ") + RECORD_COLUMNS +
             " FROM records WHERE provider = ?1 AND remote_key = ?2").c_str(),
            &stmt_lookup_);

    prepare("INSERT INTO operations (provider, remote_key, direction, outcome, size, error_kind, at) "
            "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)",
            &stmt_append_op_);

    prepare("DELETE FROM records WHERE provider = ?1 AND remote_key = ?2", &stmt_delete_);
}

void ManifestStore::prepare(const char* sql, sqlite3_stmt** stmt) {
    int rc = check(sqlite3_prepare_v2(db_, sql, -1, stmt, nullptr), "prepare");
    if (rc != SQLITE_OK) {
        throw ManifestError(std::string("Cannot prepare manifest statement: ") + sqlite3_errmsg(db_));
    }
}

void ManifestStore::corrupt(int rc, const std::string& context) const {
    throw ManifestError("Manifest " + db_path_.string() + " is corrupt (" + context + "): " +
                        sqlite3_errstr(rc));
}

int ManifestStore::check(int rc, const std::string& context) const {
    if (is_corruption(rc)) corrupt(rc, context);
    return rc;
}

std::optional<LocalRecord> ManifestStore::lookup(const std::string& provider, const std::string& key) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    sqlite3_reset(stmt_lookup_);
    bind_text(stmt_lookup_, 1, provider);
    bind_text(stmt_lookup_, 2, key);

    int rc = check(sql_step_retry(stmt_lookup_), "lookup");
    std::optional<LocalRecord> result;
    if (rc == SQLITE_ROW) {
        result = row_to_record(stmt_lookup_);
    } else if (rc != SQLITE_DONE) {
        // A store that cannot answer a lookup cannot back skip decisions
        sqlite3_reset(stmt_lookup_);
        throw ManifestError(std::string("Manifest lookup failed: ") + sqlite3_errmsg(db_));
    }
    sqlite3_reset(stmt_lookup_);
    return result;
}

std::string ManifestStore::append_operation(const std::string& provider, const std::string& key,
                                            Direction direction, Outcome outcome, uint64_t size,
                                            ErrorKind kind, int64_t at) {
    sqlite3_reset(stmt_append_op_);
    bind_text(stmt_append_op_, 1, provider);
    bind_text(stmt_append_op_, 2, key);
    sqlite3_bind_text(stmt_append_op_, 3, direction_name(direction), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt_append_op_, 4, outcome_name(outcome), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt_append_op_, 5, static_cast<sqlite3_int64>(size));
    sqlite3_bind_text(stmt_append_op_, 6, error_kind_name(kind), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt_append_op_, 7, at);
    int rc = check(sql_step_retry(stmt_append_op_), "append operation");
    sqlite3_reset(stmt_append_op_);
    if (rc != SQLITE_DONE) return std::string("Cannot append operation: ") + sqlite3_errstr(rc);
    return {};
}

std::string ManifestStore::record(const LocalRecord& rec) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    std::string err;
    int rc = check(sql_exec(db_, "BEGIN IMMEDIATE", &err), "begin");
    if (rc != SQLITE_OK) return "Cannot begin manifest transaction: " + err;

    sqlite3_reset(stmt_upsert_);
    bind_text(stmt_upsert_, 1, rec.provider);
    bind_text(stmt_upsert_, 2, rec.remote_key);
    bind_text(stmt_upsert_, 3, rec.local_path.string());
    bind_text(stmt_upsert_, 4, rec.fingerprint);
    sqlite3_bind_int64(stmt_upsert_, 5, static_cast<sqlite3_int64>(rec.size));
    sqlite3_bind_int64(stmt_upsert_, 6, rec.last_success);
    sqlite3_bind_int64(stmt_upsert_, 7, rec.updated_at);
    sqlite3_bind_text(stmt_upsert_, 8, outcome_name(rec.outcome), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt_upsert_, 9, rec.retry_count);
    sqlite3_bind_text(stmt_upsert_, 10, error_kind_name(rec.error_kind), -1, SQLITE_STATIC);
    bind_text(stmt_upsert_, 11, rec.message);
    sqlite3_bind_text(stmt_upsert_, 12, direction_name(rec.direction), -1, SQLITE_STATIC);

    rc = sql_step_retry(stmt_upsert_);
    sqlite3_reset(stmt_upsert_);
    if (is_corruption(rc)) {
        sql_exec(db_, "ROLLBACK");
        corrupt(rc, "record");
    }
    if (rc != SQLITE_DONE) {
        sql_exec(db_, "ROLLBACK");
        return std::string("Cannot write record: ") + sqlite3_errstr(rc);
    }

    err = append_operation(rec.provider, rec.remote_key, rec.direction, rec.outcome,
                           rec.size, rec.error_kind, rec.updated_at);
    if (!err.empty()) {
        sql_exec(db_, "ROLLBACK");
        return err;
    }

    rc = check(sql_exec(db_, "COMMIT", &err), "commit");
    if (rc != SQLITE_OK) {
        sql_exec(db_, "ROLLBACK");
        return "Cannot commit record: " + err;
    }
    return {};
}

std::string ManifestStore::record_skip(const std::string& provider, const std::string& key,
                                       Direction direction, uint64_t size) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    return append_operation(provider, key, direction, Outcome::Skipped, size,
                            ErrorKind::None, now_epoch());
}

std::vector<LocalRecord> ManifestStore::query_records(
        const std::string& sql, const std::function<void(sqlite3_stmt*)>& bind) {
    sqlite3_stmt* raw = nullptr;
    int rc = check(sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr), "query");
    if (rc != SQLITE_OK) {
        throw ManifestError(std::string("Manifest query failed: ") + sqlite3_errmsg(db_));
    }
    StmtPtr stmt(raw, &sqlite3_finalize);
    if (bind) bind(stmt.get());

    std::vector<LocalRecord> records;
    while ((rc = check(sql_step_retry(stmt.get()), "query")) == SQLITE_ROW) {
        records.push_back(row_to_record(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        throw ManifestError(std::string("Manifest query failed: ") + sqlite3_errstr(rc));
    }
    return records;
}

std::vector<LocalRecord> ManifestStore::history(const std::optional<std::string>& provider,
                                                size_t limit) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    std::string sql = std::string("SELECT ") + RECORD_COLUMNS + " FROM records";
    if (provider) sql += " WHERE provider = ?1";
    sql += " ORDER BY updated_at DESC, seq DESC";
    if (limit > 0) sql += " LIMIT " + std::to_string(limit);

    return query_records(sql, [&](sqlite3_stmt* stmt) {
        if (provider) bind_text(stmt, 1, *provider);
    });
}

std::vector<std::vector<LocalRecord>> ManifestStore::find_duplicates() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    auto records = query_records(
        std::string("SELECT ") + RECORD_COLUMNS + " FROM records WHERE fingerprint IN ("
        "SELECT fingerprint FROM records WHERE fingerprint != '' "
        "GROUP BY fingerprint HAVING COUNT(*) > 1) "
        "ORDER BY fingerprint, provider, remote_key",
        nullptr);

    std::vector<std::vector<LocalRecord>> groups;
    for (auto& rec : records) {
        if (groups.empty() || groups.back().front().fingerprint != rec.fingerprint) {
            groups.emplace_back();
        }
        groups.back().push_back(std::move(rec));
    }
    return groups;
}

std::vector<LocalRecord> ManifestStore::cleanup(
        const std::function<bool(const LocalRecord&)>& predicate, bool dry_run) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    auto records = query_records(std::string("SELECT ") + RECORD_COLUMNS + " FROM records", nullptr);

    std::vector<LocalRecord> orphans;
    for (auto& rec : records) {
        std::error_code ec;
        bool exists = !rec.local_path.empty() && std::filesystem::exists(rec.local_path, ec);
        if (ec) {
            // Cannot prove the file is gone; keep the record
            log_warn("Cleanup: cannot stat %s: %s", rec.local_path.c_str(), ec.message().c_str());
            continue;
        }
        if (exists) continue;
        if (predicate && !predicate(rec)) continue;
        orphans.push_back(std::move(rec));
    }
    if (dry_run || orphans.empty()) return orphans;

    std::string err;
    int rc = check(sql_exec(db_, "BEGIN IMMEDIATE", &err), "begin");
    if (rc != SQLITE_OK) throw ManifestError("Cannot begin cleanup: " + err);
    for (const auto& rec : orphans) {
        sqlite3_reset(stmt_delete_);
        bind_text(stmt_delete_, 1, rec.provider);
        bind_text(stmt_delete_, 2, rec.remote_key);
        rc = sql_step_retry(stmt_delete_);
        sqlite3_reset(stmt_delete_);
        if (rc != SQLITE_DONE) {
            sql_exec(db_, "ROLLBACK");
            check(rc, "cleanup");
            throw ManifestError(std::string("Cleanup failed: ") + sqlite3_errstr(rc));
        }
    }
    rc = check(sql_exec(db_, "COMMIT", &err), "commit");
    if (rc != SQLITE_OK) {
        sql_exec(db_, "ROLLBACK");
        throw ManifestError("Cannot commit cleanup: " + err);
    }
    return orphans;
}

std::vector<LocalRecord> ManifestStore::all_records() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    return query_records(std::string("SELECT ") + RECORD_COLUMNS +
                         " FROM records ORDER BY provider, remote_key", nullptr);
}

ManifestStats ManifestStore::stats() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    ManifestStats out;

    auto run = [&](const char* sql, const std::function<void(sqlite3_stmt*)>& row) {
        sqlite3_stmt* raw = nullptr;
        int rc = check(sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr), "stats");
        if (rc != SQLITE_OK) {
            throw ManifestError(std::string("Manifest stats failed: ") + sqlite3_errmsg(db_));
        }
        StmtPtr stmt(raw, &sqlite3_finalize);
        while ((rc = check(sql_step_retry(stmt.get()), "stats")) == SQLITE_ROW) {
            row(stmt.get());
        }
        if (rc != SQLITE_DONE) {
            throw ManifestError(std::string("Manifest stats failed: ") + sqlite3_errstr(rc));
        }
    };

    run("SELECT COUNT(*), COUNT(DISTINCT provider) FROM records", [&](sqlite3_stmt* s) {
        out.records = static_cast<uint64_t>(sqlite3_column_int64(s, 0));
        out.providers = static_cast<uint64_t>(sqlite3_column_int64(s, 1));
    });

    run("SELECT direction, outcome, COUNT(*), COALESCE(SUM(size), 0), MAX(at) "
        "FROM operations GROUP BY direction, outcome",
        [&](sqlite3_stmt* s) {
            auto direction = direction_from_name(column_string(s, 0));
            auto outcome = outcome_from_name(column_string(s, 1));
            if (!direction || !outcome) {
                throw ManifestError("Unrecognized values in operations log");
            }
            auto count = static_cast<uint64_t>(sqlite3_column_int64(s, 2));
            auto bytes = static_cast<uint64_t>(sqlite3_column_int64(s, 3));
            auto& counts = *direction == Direction::Backup ? out.backups : out.uploads;
            switch (*outcome) {
                case Outcome::Success:
                    counts.success += count;
                    counts.bytes += bytes;
                    break;
                case Outcome::Failed: counts.failed += count; break;
                case Outcome::Skipped: counts.skipped += count; break;
            }
            out.operations += count;
            out.last_operation = std::max<int64_t>(out.last_operation, sqlite3_column_int64(s, 4));
        });

    return out;
}

}  // namespace hib
