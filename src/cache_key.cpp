#include "cache_key.hpp"
#include "util.hpp"

#ifdef LYRICACHE_USE_COMMONCRYPTO
#include <CommonCrypto/CommonDigest.h>
#else
#include <openssl/sha.h>
#endif
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace lyricache {

std::string CacheKey::describe() const {
    if (secondary) return "'" + primary + "' by '" + *secondary + "'";
    return "'" + primary + "'";
}

CacheKey normalize_key(const std::string& primary,
                       const std::optional<std::string>& secondary) {
    CacheKey key;
    key.primary = to_lower(trim(primary));
    if (key.primary.empty()) {
        throw std::invalid_argument("cache key: primary identifier must not be empty");
    }
    if (secondary) {
        std::string s = to_lower(trim(*secondary));
        if (!s.empty()) key.secondary = std::move(s);
    }
    return key;
}

CacheKey normalize_key(const CacheKey& key) {
    return normalize_key(key.primary, key.secondary);
}

std::string sanitize_slug(const std::string& s, size_t max_bytes) {
    std::string out;
    out.reserve(std::min(s.size(), max_bytes));

    size_t i = 0;
    while (i < s.size()) {
        auto c = static_cast<unsigned char>(s[i]);
        if (c < 0x80) {
            if (out.size() + 1 > max_bytes) break;
            out.push_back(std::isalnum(c) ? static_cast<char>(c) : '_');
            ++i;
            continue;
        }

        // Copy a whole well-formed multibyte sequence; any other byte is '_'
        size_t len = 0;
        if ((c & 0xE0) == 0xC0)      len = 2;
        else if ((c & 0xF0) == 0xE0) len = 3;
        else if ((c & 0xF8) == 0xF0) len = 4;
        bool whole = len > 0 && i + len <= s.size();
        for (size_t k = 1; whole && k < len; ++k) {
            whole = (static_cast<unsigned char>(s[i + k]) & 0xC0) == 0x80;
        }
        if (!whole) {
            if (out.size() + 1 > max_bytes) break;
            out.push_back('_');
            ++i;
            continue;
        }
        if (out.size() + len > max_bytes) break;
        out.append(s, i, len);
        i += len;
    }
    return out;
}

std::string key_hash(const CacheKey& key, size_t hex_len) {
    // Unit separator + presence flag keep "absent" apart from any named
    // secondary and keep field boundaries unambiguous.
    std::string material = key.primary;
    material += '\x1f';
    material += key.secondary ? '1' : '0';
    if (key.secondary) {
        material += '\x1f';
        material += *key.secondary;
    }

#ifdef LYRICACHE_USE_COMMONCRYPTO
    unsigned char hash[CC_SHA256_DIGEST_LENGTH];
    CC_SHA256(material.data(), static_cast<CC_LONG>(material.size()), hash);
    std::string hex = hex_encode(hash, CC_SHA256_DIGEST_LENGTH);
#else
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(material.data()), material.size(), hash);
    std::string hex = hex_encode(hash, SHA256_DIGEST_LENGTH);
#endif
    return hex.substr(0, std::min(hex_len, hex.size()));
}

std::string storage_id(const CacheKey& key) {
    std::string id = sanitize_slug(key.primary);
    if (key.secondary) {
        id += '_';
        id += sanitize_slug(*key.secondary);
    }
    id += '_';
    id += key_hash(key);
    return id;
}

std::string storage_id(const std::string& primary,
                       const std::optional<std::string>& secondary) {
    return storage_id(normalize_key(primary, secondary));
}

} // namespace lyricache
