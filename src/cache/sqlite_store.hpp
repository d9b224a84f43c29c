#pragma once
#include "../content_cache.hpp"
#include <string>

struct sqlite3; // forward declare

namespace lyricache {

// Raw-text backend: one SQLite table, one row per normalized
// (primary, secondary) pair. A connection is opened per operation and
// closed on every exit path.
class SqliteTextStore : public TextCache {
public:
    explicit SqliteTextStore(const std::string& path,
                             const std::string& table = "lyrics_cache");

    // Non-copyable
    SqliteTextStore(const SqliteTextStore&) = delete;
    SqliteTextStore& operator=(const SqliteTextStore&) = delete;

    std::string backend_name() const override { return "sqlite"; }
    bool exists() const override;

    std::optional<Record> get(const CacheKey& key) override;
    std::string put(const Record& record) override;
    std::vector<CacheListing> list() override;
    bool remove(const CacheKey& key) override;
    uint32_t count() override;
    uint64_t total_bytes() override;
    uint32_t delete_older_than(uint32_t max_age_days) override;
    uint32_t delete_least_recently_accessed_excess(uint32_t keep_count) override;

    const std::string& path() const { return path_; }
    const std::string& table() const { return table_; }

private:
    struct DbHandle;

    // Opens the database; with `create` the file and schema are created.
    // Throws StoreError.
    void open(DbHandle& handle, bool create) const;
    void init_schema(sqlite3* db) const;

    std::string path_;
    std::string table_;
};

} // namespace lyricache
