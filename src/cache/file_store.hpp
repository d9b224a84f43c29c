#pragma once
#include "../content_cache.hpp"
#include <string>
#include <vector>

namespace lyricache {

// Derived-record backend: one JSON file per key, named
// "<storage_id>.json", holding the payload object plus an embedded
// "_cache_metadata" block. Last access is the file's modification time,
// bumped on every hit without rewriting the payload.
class FileRecordStore : public RecordCache {
public:
    explicit FileRecordStore(const std::string& dir);

    std::string backend_name() const override { return "file"; }
    bool exists() const override;

    std::optional<Record> get(const CacheKey& key) override;
    std::string put(const Record& record) override;
    std::vector<CacheListing> list() override;
    bool remove(const CacheKey& key) override;
    uint32_t count() override;
    uint64_t total_bytes() override;
    uint32_t delete_older_than(uint32_t max_age_days) override;
    uint32_t delete_least_recently_accessed_excess(uint32_t keep_count) override;

    // Full path of the unit for `key` (whether or not it exists)
    std::string path_for(const CacheKey& key) const;

    const std::string& dir() const { return dir_; }

    static constexpr const char* kExtension = ".json";

private:
    // Best-effort scan of every unit in the directory; never fails on a
    // single unreadable file.
    std::vector<CacheListing> scan() const;

    std::string dir_;
};

// Guess (primary, secondary) from a unit's file name when its content is
// unreadable. The hash suffix is dropped; the remaining slug is reported as
// the primary id.
CacheListing listing_from_filename(const std::string& filename);

} // namespace lyricache
