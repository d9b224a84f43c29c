#pragma once
#include "cache_key.hpp"
#include "codec.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace lyricache {

// Backend unavailable or on-disk state malformed
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

// How a listing row was obtained: from the unit's own metadata, or guessed
// from its storage name because the unit could not be read.
enum class ListingOrigin { Parsed, FallbackFromName };

std::string origin_to_string(ListingOrigin origin);

struct CacheListing {
    std::string primary;
    std::optional<std::string> secondary;
    uint64_t created_at = 0;
    uint64_t created_at_us = 0;  // finer creation stamp, 0 where unknown
    uint64_t accessed_at = 0;
    uint64_t size_bytes = 0;
    ListingOrigin origin = ListingOrigin::Parsed;
    std::string location;  // backend-specific (file path, row id)
};

template <typename V>
struct CacheRecord {
    // Lookups normalize this; the derived-record backend keeps the given
    // spelling in its metadata block.
    CacheKey key;
    V payload{};
    nlohmann::json metadata = nlohmann::json::object();
    std::optional<CompressionStats> compression;
    std::string language;
    std::string source;
    uint64_t created_at = 0;
    uint64_t accessed_at = 0;
    std::string location;
};

// Abstract persistent key -> payload store. Backends are selected at
// construction time; the read-through and eviction logic only sees this.
//
// Every operation opens and releases its own handle. No operation leaves a
// partially written entry behind: a failed put keeps the previous payload.
template <typename V>
class ContentCache {
public:
    using Record = CacheRecord<V>;

    virtual ~ContentCache() = default;

    virtual std::string backend_name() const = 0;

    // True once the backing file/directory exists.
    virtual bool exists() const = 0;

    // Probe by normalized key; a hit bumps the entry's access time.
    // Returns nullopt on a miss or when the store does not exist yet.
    // Throws StoreError if the store exists but cannot be read.
    virtual std::optional<Record> get(const CacheKey& key) = 0;

    // Insert, or replace payload/metadata of the existing entry for the same
    // key in place. Creation time of an existing entry is kept; access time
    // is refreshed. Returns the entry's location. Throws StoreError on failure.
    virtual std::string put(const Record& record) = 0;

    // Snapshot of all entries, most recently accessed first.
    virtual std::vector<CacheListing> list() = 0;

    // Administrative deletion. Returns true if an entry was removed.
    virtual bool remove(const CacheKey& key) = 0;

    virtual uint32_t count() = 0;

    // Bytes occupied by stored payloads
    virtual uint64_t total_bytes() = 0;

    // Delete entries created more than `max_age_days` ago. Returns count deleted.
    virtual uint32_t delete_older_than(uint32_t max_age_days) = 0;

    // Delete least recently accessed entries (ties: oldest insertion first)
    // until at most `keep_count` remain. Returns count deleted.
    virtual uint32_t delete_least_recently_accessed_excess(uint32_t keep_count) = 0;
};

// Raw text: payload is the codec's encoded form
using TextCache = ContentCache<std::string>;

// Derived records: payload is a JSON object stored verbatim
using RecordCache = ContentCache<nlohmann::json>;

} // namespace lyricache
