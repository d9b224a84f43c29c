#pragma once
#include <optional>
#include <string>

namespace lyricache {

// Normalized lookup identity: (primary, optional secondary), both trimmed and
// case-folded. An absent secondary is its own equivalence class.
struct CacheKey {
    std::string primary;
    std::optional<std::string> secondary;

    bool operator==(const CacheKey& other) const {
        return primary == other.primary && secondary == other.secondary;
    }
    bool operator!=(const CacheKey& other) const { return !(*this == other); }

    // "primary" or "primary by secondary", for log lines
    std::string describe() const;
};

// Trim + ASCII case-fold both fields. A secondary that is empty after
// trimming counts as absent. Throws std::invalid_argument on an empty primary.
CacheKey normalize_key(const std::string& primary,
                       const std::optional<std::string>& secondary = std::nullopt);

// Idempotent: normalize_key(normalize_key(k)) == normalize_key(k)
CacheKey normalize_key(const CacheKey& key);

// Filename-safe slug: ASCII alphanumerics and well-formed UTF-8 multibyte
// sequences are kept, every other byte becomes '_'. Capped at `max_bytes` on a code-point
// boundary.
std::string sanitize_slug(const std::string& s, size_t max_bytes = 64);

// First `hex_len` hex chars of SHA-256 over the normalized key
std::string key_hash(const CacheKey& key, size_t hex_len = 8);

// "<slug(primary)>[_<slug(secondary)>]_<key_hash>"
std::string storage_id(const CacheKey& key);
std::string storage_id(const std::string& primary,
                       const std::optional<std::string>& secondary = std::nullopt);

} // namespace lyricache
