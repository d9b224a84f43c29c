#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace lyricache {

std::string CacheConfig::resolved_lyrics_db_path() const {
    if (!lyrics_db_path.empty()) return expand_home(lyrics_db_path);
    return expand_home("~/.lyricache/lyrics_cache.db");
}

std::string CacheConfig::resolved_vocab_dir() const {
    if (!vocab_dir.empty()) return expand_home(vocab_dir);
    return expand_home("~/.lyricache/vocab_cache");
}

nlohmann::json Config::defaults_json() {
    return {
        {"cache", {
            {"lyrics_db_path", ""},
            {"vocab_dir", ""},
            {"compression_level", 6},
            {"max_entries", 1000},
            {"max_age_days", 90},
            {"single_flight", true}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object() || !j.contains("cache") || !j["cache"].is_object()) return cfg;

    auto& c = j["cache"];
    if (c.contains("lyrics_db_path") && c["lyrics_db_path"].is_string())
        cfg.cache.lyrics_db_path = c["lyrics_db_path"].get<std::string>();
    if (c.contains("vocab_dir") && c["vocab_dir"].is_string())
        cfg.cache.vocab_dir = c["vocab_dir"].get<std::string>();
    if (c.contains("compression_level") && c["compression_level"].is_number_integer()) {
        int level = c["compression_level"].get<int>();
        if (level >= 0 && level <= 9) cfg.cache.compression_level = level;
    }
    if (c.contains("max_entries") && c["max_entries"].is_number_unsigned())
        cfg.cache.max_entries = c["max_entries"].get<uint32_t>();
    if (c.contains("max_age_days") && c["max_age_days"].is_number_unsigned())
        cfg.cache.max_age_days = c["max_age_days"].get<uint32_t>();
    if (c.contains("single_flight") && c["single_flight"].is_boolean())
        cfg.cache.single_flight = c["single_flight"].get<bool>();
    return cfg;
}

// Parses an unsigned env value; returns false (and warns) if malformed
static bool parse_env_uint(const char* name, const char* value, unsigned long max,
                           unsigned long& out) {
    try {
        size_t pos = 0;
        unsigned long v = std::stoul(value, &pos);
        if (pos == std::string(value).size() && v <= max) {
            out = v;
            return true;
        }
    } catch (const std::exception&) { // NOLINT(bugprone-empty-catch)
        // reported below
    }
    std::cerr << "[config] Ignoring invalid " << name << "=" << value << "\n";
    return false;
}

void Config::apply_env_overrides() {
    if (const char* v = std::getenv("LYRICACHE_LYRICS_DB"))
        cache.lyrics_db_path = v;
    if (const char* v = std::getenv("LYRICACHE_VOCAB_DIR"))
        cache.vocab_dir = v;

    unsigned long n = 0;
    if (const char* v = std::getenv("LYRICACHE_COMPRESSION_LEVEL")) {
        if (parse_env_uint("LYRICACHE_COMPRESSION_LEVEL", v, 9, n))
            cache.compression_level = static_cast<int>(n);
    }
    if (const char* v = std::getenv("LYRICACHE_MAX_ENTRIES")) {
        if (parse_env_uint("LYRICACHE_MAX_ENTRIES", v, UINT32_MAX, n))
            cache.max_entries = static_cast<uint32_t>(n);
    }
    if (const char* v = std::getenv("LYRICACHE_MAX_AGE_DAYS")) {
        if (parse_env_uint("LYRICACHE_MAX_AGE_DAYS", v, UINT32_MAX, n))
            cache.max_age_days = static_cast<uint32_t>(n);
    }
}

Config Config::load_from(const std::string& config_path) {
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            // Malformed config: fall back to defaults
            std::cerr << "[config] Ignoring malformed " << config_path << ": "
                      << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);
    cfg.apply_env_overrides();
    return cfg;
}

Config Config::load() {
    return load_from(expand_home("~/.lyricache/config.json"));
}

} // namespace lyricache
