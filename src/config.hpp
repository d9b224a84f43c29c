#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace lyricache {

// Everything the cache layer needs, passed in explicitly.
struct CacheConfig {
    std::string lyrics_db_path;   // empty = ~/.lyricache/lyrics_cache.db
    std::string vocab_dir;        // empty = ~/.lyricache/vocab_cache
    int compression_level = 6;    // zlib 0-9
    uint32_t max_entries = 1000;
    uint32_t max_age_days = 90;
    bool single_flight = true;    // serialize concurrent misses per key

    std::string resolved_lyrics_db_path() const;
    std::string resolved_vocab_dir() const;
};

struct Config {
    CacheConfig cache;

    // Load from ~/.lyricache/config.json + env vars
    static Config load();

    // Load from an explicit file (created with defaults if missing),
    // then apply env vars
    static Config load_from(const std::string& config_path);

    // Parse a config JSON document (no env vars, no file I/O)
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // LYRICACHE_* environment variables override file values
    void apply_env_overrides();
};

} // namespace lyricache
