#pragma once
#include "content_cache.hpp"
#include <cstdint>
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>

namespace lyricache {

struct EvictionPolicy {
    uint32_t max_entries = 1000;
    uint32_t max_age_days = 90;
};

struct EvictionStats {
    bool store_exists = false;
    uint32_t initial_count = 0;
    uint32_t deleted_old = 0;
    uint32_t deleted_excess = 0;
    uint32_t final_count = 0;
    uint64_t total_bytes = 0;
};

nlohmann::json eviction_to_json(const EvictionStats& stats);

// Two-phase bound on store size:
//   1. drop every entry created more than max_age_days ago;
//   2. if still above max_entries, drop least recently accessed entries
//      until exactly max_entries remain.
// A store that does not exist yet yields zeroed stats. Backend failures
// propagate as StoreError; entries already deleted stay deleted.
template <typename V>
EvictionStats evict(ContentCache<V>& cache, const EvictionPolicy& policy) {
    EvictionStats stats;
    if (!cache.exists()) return stats;

    stats.store_exists = true;
    stats.initial_count = cache.count();
    stats.deleted_old = cache.delete_older_than(policy.max_age_days);
    stats.deleted_excess = cache.delete_least_recently_accessed_excess(policy.max_entries);
    stats.final_count = cache.count();
    stats.total_bytes = cache.total_bytes();

    std::cerr << "[eviction] " << cache.backend_name() << ": " << stats.initial_count
              << " -> " << stats.final_count << " entries (" << stats.deleted_old
              << " expired, " << stats.deleted_excess << " over capacity)\n";
    return stats;
}

} // namespace lyricache
