#include "sqlite_store.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace lyricache {

// RAII wrapper for a per-operation connection
struct SqliteTextStore::DbHandle {
    sqlite3* db = nullptr;
    ~DbHandle() { if (db) sqlite3_close(db); }
};

namespace {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

// Rolls back unless commit() succeeded
struct TxnGuard {
    sqlite3* db;
    bool committed = false;
    ~TxnGuard() {
        if (!committed) sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
    }
};

constexpr int kBusyTimeoutMs = 5000;

[[noreturn]] void fail(sqlite3* db, const std::string& what) {
    std::string err = db ? sqlite3_errmsg(db) : "unknown error";
    throw StoreError("sqlite store: " + what + ": " + err);
}

void exec_or_throw(sqlite3* db, const std::string& sql, const std::string& what) {
    char* errmsg = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &errmsg) != SQLITE_OK) {
        std::string err = errmsg ? errmsg : "unknown error";
        sqlite3_free(errmsg);
        throw StoreError("sqlite store: " + what + ": " + err);
    }
}

void prepare_or_throw(sqlite3* db, const std::string& sql, StmtGuard& g) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        fail(db, "prepare failed");
    }
}

void step_done_or_throw(sqlite3* db, StmtGuard& g, const std::string& what) {
    if (sqlite3_step(g.stmt) != SQLITE_DONE) fail(db, what);
}

void bind_key(sqlite3_stmt* stmt, int first_col, const CacheKey& key) {
    sqlite3_bind_text(stmt, first_col, key.primary.c_str(), -1, SQLITE_TRANSIENT);
    if (key.secondary) {
        sqlite3_bind_text(stmt, first_col + 1, key.secondary->c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, first_col + 1);
    }
}

std::string column_string(sqlite3_stmt* stmt, int col) {
    if (auto* v = sqlite3_column_text(stmt, col)) return reinterpret_cast<const char*>(v);
    return {};
}

nlohmann::json parse_column_json(sqlite3_stmt* stmt, int col, const char* name) {
    std::string text = column_string(stmt, col);
    if (text.empty()) return nlohmann::json::object();
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        throw StoreError(std::string("sqlite store: malformed ") + name + " column");
    }
    return j;
}

bool valid_identifier(const std::string& s) {
    if (s.empty() || std::isdigit(static_cast<unsigned char>(s[0]))) return false;
    for (char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
    }
    return true;
}

} // namespace

SqliteTextStore::SqliteTextStore(const std::string& path, const std::string& table)
    : path_(path), table_(table) {
    if (!valid_identifier(table_)) {
        throw std::invalid_argument("SqliteTextStore: invalid table name: " + table_);
    }
}

bool SqliteTextStore::exists() const {
    std::error_code ec;
    return std::filesystem::is_regular_file(path_, ec);
}

void SqliteTextStore::open(DbHandle& handle, bool create) const {
    if (create) {
        auto parent = std::filesystem::path(path_).parent_path();
        std::error_code ec;
        if (!parent.empty()) std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw StoreError("sqlite store: cannot create directory " + parent.string() +
                             ": " + ec.message());
        }
    }

    int flags = SQLITE_OPEN_READWRITE | (create ? SQLITE_OPEN_CREATE : 0);
    if (sqlite3_open_v2(path_.c_str(), &handle.db, flags, nullptr) != SQLITE_OK) {
        fail(handle.db, "failed to open " + path_);
    }
    sqlite3_busy_timeout(handle.db, kBusyTimeoutMs);

    if (create) init_schema(handle.db);
}

void SqliteTextStore::init_schema(sqlite3* db) const {
    // Performance pragmas
    sqlite3_exec(db, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    exec_or_throw(db,
        "CREATE TABLE IF NOT EXISTS " + table_ + " ("
        "  id           INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  primary_id   TEXT NOT NULL,"
        "  secondary_id TEXT,"
        "  payload      TEXT NOT NULL,"
        "  compression  TEXT NOT NULL,"
        "  metadata     TEXT,"
        "  language     TEXT,"
        "  source       TEXT,"
        "  created_at   INTEGER NOT NULL,"
        "  accessed_at  INTEGER NOT NULL"
        ");",
        "create table");

    // One live row per normalized pair; NULL secondary is its own class
    exec_or_throw(db,
        "CREATE UNIQUE INDEX IF NOT EXISTS " + table_ + "_key ON " + table_ +
        "(primary_id, COALESCE(secondary_id, ''));",
        "create key index");
    exec_or_throw(db,
        "CREATE INDEX IF NOT EXISTS " + table_ + "_accessed ON " + table_ +
        "(accessed_at, id);",
        "create access index");
}

std::optional<SqliteTextStore::Record> SqliteTextStore::get(const CacheKey& raw_key) {
    if (!exists()) return std::nullopt;
    CacheKey key = normalize_key(raw_key);

    DbHandle h;
    open(h, false);

    Record record;
    int64_t id = 0;
    {
        StmtGuard g;
        prepare_or_throw(h.db,
            "SELECT id, payload, compression, metadata, language, source,"
            " created_at, accessed_at FROM " + table_ +
            " WHERE primary_id = ? AND secondary_id IS ?;", g);
        bind_key(g.stmt, 1, key);

        int rc = sqlite3_step(g.stmt);
        if (rc == SQLITE_DONE) return std::nullopt;
        if (rc != SQLITE_ROW) fail(h.db, "lookup failed");

        id = sqlite3_column_int64(g.stmt, 0);
        record.key = key;
        record.payload = column_string(g.stmt, 1);
        record.compression = compression_from_json(parse_column_json(g.stmt, 2, "compression"));
        record.metadata = parse_column_json(g.stmt, 3, "metadata");
        record.language = column_string(g.stmt, 4);
        record.source = column_string(g.stmt, 5);
        record.created_at = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 6));
        record.accessed_at = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 7));
        record.location = path_;
    }

    // Touch access time; a failure here does not invalidate the hit
    auto now = static_cast<int64_t>(epoch_seconds());
    StmtGuard ug;
    const std::string sql = "UPDATE " + table_ + " SET accessed_at = ? WHERE id = ?;";
    if (sqlite3_prepare_v2(h.db, sql.c_str(), -1, &ug.stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_int64(ug.stmt, 1, now);
        sqlite3_bind_int64(ug.stmt, 2, id);
        if (sqlite3_step(ug.stmt) == SQLITE_DONE) {
            record.accessed_at = static_cast<uint64_t>(now);
        } else {
            std::cerr << "[sqlite-store] Warning: failed to touch " << key.describe()
                      << ": " << sqlite3_errmsg(h.db) << "\n";
        }
    }
    return record;
}

std::string SqliteTextStore::put(const Record& record) {
    CacheKey key = normalize_key(record.key);
    std::string compression = compression_to_json(
        record.compression.value_or(CompressionStats{})).dump();
    std::string metadata = (record.metadata.is_null() ? nlohmann::json::object()
                                                      : record.metadata).dump();
    auto now = static_cast<int64_t>(epoch_seconds());

    DbHandle h;
    open(h, true);

    // IMMEDIATE takes the write lock up front so check-then-write is atomic
    exec_or_throw(h.db, "BEGIN IMMEDIATE;", "begin");
    TxnGuard txn{h.db};

    int64_t existing_id = 0;
    {
        StmtGuard g;
        prepare_or_throw(h.db,
            "SELECT id FROM " + table_ + " WHERE primary_id = ? AND secondary_id IS ?;", g);
        bind_key(g.stmt, 1, key);
        int rc = sqlite3_step(g.stmt);
        if (rc == SQLITE_ROW) {
            existing_id = sqlite3_column_int64(g.stmt, 0);
        } else if (rc != SQLITE_DONE) {
            fail(h.db, "lookup failed");
        }
    }

    StmtGuard g;
    if (existing_id != 0) {
        prepare_or_throw(h.db,
            "UPDATE " + table_ + " SET payload = ?, compression = ?, metadata = ?,"
            " language = ?, source = ?, accessed_at = ? WHERE id = ?;", g);
        sqlite3_bind_text(g.stmt, 1, record.payload.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(g.stmt, 2, compression.c_str(),    -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(g.stmt, 3, metadata.c_str(),       -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(g.stmt, 4, record.language.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(g.stmt, 5, record.source.c_str(),  -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(g.stmt, 6, now);
        sqlite3_bind_int64(g.stmt, 7, existing_id);
        step_done_or_throw(h.db, g, "update failed");
    } else {
        prepare_or_throw(h.db,
            "INSERT INTO " + table_ + " (primary_id, secondary_id, payload, compression,"
            " metadata, language, source, created_at, accessed_at)"
            " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);", g);
        bind_key(g.stmt, 1, key);
        sqlite3_bind_text(g.stmt, 3, record.payload.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(g.stmt, 4, compression.c_str(),    -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(g.stmt, 5, metadata.c_str(),       -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(g.stmt, 6, record.language.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(g.stmt, 7, record.source.c_str(),  -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(g.stmt, 8, now);
        sqlite3_bind_int64(g.stmt, 9, now);
        step_done_or_throw(h.db, g, "insert failed");
    }

    exec_or_throw(h.db, "COMMIT;", "commit");
    txn.committed = true;
    return path_;
}

std::vector<CacheListing> SqliteTextStore::list() {
    if (!exists()) return {};

    DbHandle h;
    open(h, false);

    StmtGuard g;
    prepare_or_throw(h.db,
        "SELECT primary_id, secondary_id, created_at, accessed_at, length(payload)"
        " FROM " + table_ + " ORDER BY accessed_at DESC, id DESC;", g);

    std::vector<CacheListing> results;
    int rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        CacheListing item;
        item.primary = column_string(g.stmt, 0);
        if (sqlite3_column_type(g.stmt, 1) != SQLITE_NULL) {
            item.secondary = column_string(g.stmt, 1);
        }
        item.created_at = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 2));
        item.accessed_at = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 3));
        item.size_bytes = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 4));
        results.push_back(std::move(item));
        rc = sqlite3_step(g.stmt);
    }
    if (rc != SQLITE_DONE) fail(h.db, "listing failed");
    return results;
}

bool SqliteTextStore::remove(const CacheKey& raw_key) {
    if (!exists()) return false;
    CacheKey key = normalize_key(raw_key);

    DbHandle h;
    open(h, false);

    StmtGuard g;
    prepare_or_throw(h.db,
        "DELETE FROM " + table_ + " WHERE primary_id = ? AND secondary_id IS ?;", g);
    bind_key(g.stmt, 1, key);
    step_done_or_throw(h.db, g, "delete failed");
    return sqlite3_changes(h.db) > 0;
}

uint32_t SqliteTextStore::count() {
    if (!exists()) return 0;

    DbHandle h;
    open(h, false);

    StmtGuard g;
    prepare_or_throw(h.db, "SELECT COUNT(*) FROM " + table_ + ";", g);
    if (sqlite3_step(g.stmt) != SQLITE_ROW) fail(h.db, "count failed");
    return static_cast<uint32_t>(sqlite3_column_int64(g.stmt, 0));
}

uint64_t SqliteTextStore::total_bytes() {
    if (!exists()) return 0;

    DbHandle h;
    open(h, false);

    StmtGuard g;
    prepare_or_throw(h.db,
        "SELECT COALESCE(SUM(length(payload)), 0) FROM " + table_ + ";", g);
    if (sqlite3_step(g.stmt) != SQLITE_ROW) fail(h.db, "size query failed");
    return static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 0));
}

uint32_t SqliteTextStore::delete_older_than(uint32_t max_age_days) {
    if (!exists()) return 0;

    auto now = static_cast<int64_t>(epoch_seconds());
    int64_t cutoff = now - static_cast<int64_t>(max_age_days) * 86400;

    DbHandle h;
    open(h, false);

    StmtGuard g;
    prepare_or_throw(h.db, "DELETE FROM " + table_ + " WHERE created_at < ?;", g);
    sqlite3_bind_int64(g.stmt, 1, cutoff);
    step_done_or_throw(h.db, g, "age eviction failed");
    return static_cast<uint32_t>(sqlite3_changes(h.db));
}

uint32_t SqliteTextStore::delete_least_recently_accessed_excess(uint32_t keep_count) {
    if (!exists()) return 0;

    DbHandle h;
    open(h, false);

    exec_or_throw(h.db, "BEGIN IMMEDIATE;", "begin");
    TxnGuard txn{h.db};

    int64_t total = 0;
    {
        StmtGuard g;
        prepare_or_throw(h.db, "SELECT COUNT(*) FROM " + table_ + ";", g);
        if (sqlite3_step(g.stmt) != SQLITE_ROW) fail(h.db, "count failed");
        total = sqlite3_column_int64(g.stmt, 0);
    }
    if (total <= static_cast<int64_t>(keep_count)) return 0;

    StmtGuard g;
    prepare_or_throw(h.db,
        "DELETE FROM " + table_ + " WHERE id IN ("
        " SELECT id FROM " + table_ + " ORDER BY accessed_at ASC, id ASC LIMIT ?);", g);
    sqlite3_bind_int64(g.stmt, 1, total - static_cast<int64_t>(keep_count));
    step_done_or_throw(h.db, g, "LRU eviction failed");
    auto deleted = static_cast<uint32_t>(sqlite3_changes(h.db));

    exec_or_throw(h.db, "COMMIT;", "commit");
    txn.committed = true;
    return deleted;
}

} // namespace lyricache
