#pragma once
#include "../content_cache.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>

namespace lyricache {

// Shared CacheListing / metadata-block conversions used by both backends and
// by the service layer.

constexpr const char* kMetadataBlockKey = "_cache_metadata";
constexpr const char* kRecordFormatVersion = "1.0";

inline nlohmann::json optional_to_json(const std::optional<std::string>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

inline std::optional<std::string> optional_from_json(const nlohmann::json& obj,
                                                     const char* field) {
    if (!obj.is_object()) return std::nullopt;
    auto it = obj.find(field);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    std::string s = it->get<std::string>();
    if (s.empty()) return std::nullopt;
    return s;
}

inline nlohmann::json listing_to_json(const CacheListing& listing) {
    nlohmann::json item = {
        {"song", listing.primary},
        {"artist", optional_to_json(listing.secondary)},
        {"cached_at", format_timestamp(listing.created_at)},
        {"last_accessed", format_timestamp(listing.accessed_at)},
        {"size_bytes", listing.size_bytes},
        {"origin", origin_to_string(listing.origin)}
    };
    if (!listing.location.empty()) {
        item["location"] = listing.location;
    }
    return item;
}

// Metadata block embedded in each derived record. `key` carries the caller's
// ids as given (trimmed, original case).
inline nlohmann::json make_metadata_block(const CacheKey& key, uint64_t created_at,
                                          uint64_t created_at_us,
                                          const nlohmann::json& extra) {
    nlohmann::json block = extra.is_object() ? extra : nlohmann::json::object();
    block["song"] = key.primary;
    block["artist"] = optional_to_json(key.secondary);
    block["cached_at"] = format_timestamp(created_at);
    block["created_at"] = created_at;
    block["created_at_us"] = created_at_us;
    block["version"] = kRecordFormatVersion;
    return block;
}

} // namespace lyricache
