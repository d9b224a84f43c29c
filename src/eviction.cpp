#include "eviction.hpp"

namespace lyricache {

nlohmann::json eviction_to_json(const EvictionStats& stats) {
    return {
        {"status", stats.store_exists ? "success" : "no_cache_exists"},
        {"initial_count", stats.initial_count},
        {"deleted_old", stats.deleted_old},
        {"deleted_excess", stats.deleted_excess},
        {"final_count", stats.final_count},
        {"total_size_bytes", stats.total_bytes},
        {"approximate_size_kb", static_cast<double>(stats.total_bytes) / 1024.0}
    };
}

} // namespace lyricache
