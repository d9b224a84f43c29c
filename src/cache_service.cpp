#include "cache_service.hpp"
#include "cache/file_store.hpp"
#include "cache/record_json.hpp"
#include "cache/sqlite_store.hpp"
#include "config.hpp"
#include "util.hpp"
#include <iostream>
#include <stdexcept>

namespace lyricache {

std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:            return "none";
        case ErrorKind::InvalidArgument: return "invalid_argument";
        case ErrorKind::NotFound:        return "not_found";
        case ErrorKind::ProviderError:   return "provider_error";
        case ErrorKind::DecodeError:     return "decode_error";
        case ErrorKind::StoreError:      return "store_error";
    }
    return "none";
}

nlohmann::json VocabularyResult::vocabulary() const {
    auto it = record.find("vocabulary");
    if (it != record.end()) return *it;
    return nlohmann::json::array();
}

// ── JSON views ──────────────────────────────────────────────────

namespace {

nlohmann::json cache_info_to_json(const CacheInfo& info) {
    nlohmann::json j = {{"from_cache", info.from_cache}};
    if (info.cached_at != 0) j["cached_at"] = format_timestamp(info.cached_at);
    if (info.compression) j["compression"] = compression_to_json(*info.compression);
    if (!info.language.empty()) j["language"] = info.language;
    if (!info.location.empty()) j["location"] = info.location;
    return j;
}

nlohmann::json failure_json(ErrorKind kind, const std::string& error) {
    return {
        {"success", false},
        {"error_kind", error_kind_to_string(kind)},
        {"error", error}
    };
}

// Display form of the caller's ids: trimmed, original case
std::string display_song(const std::string& song) { return trim(song); }

std::optional<std::string> display_artist(const std::optional<std::string>& artist) {
    if (!artist) return std::nullopt;
    std::string t = trim(*artist);
    if (t.empty()) return std::nullopt;
    return t;
}

} // namespace

nlohmann::json result_to_json(const LyricsResult& r) {
    if (!r.success) {
        auto j = failure_json(r.error_kind, r.error);
        j["lyrics"] = nullptr;
        j["metadata"] = nullptr;
        return j;
    }
    nlohmann::json j = {
        {"success", true},
        {"lyrics", r.lyrics},
        {"metadata", r.metadata},
        {"cache_info", cache_info_to_json(r.cache_info)}
    };
    if (r.is_mock) j["is_mock"] = true;
    return j;
}

nlohmann::json result_to_json(const VocabularyResult& r) {
    if (!r.success) return failure_json(r.error_kind, r.error);
    return {
        {"success", true},
        {"vocabulary", r.vocabulary()},
        {"cache_info", cache_info_to_json(r.cache_info)}
    };
}

nlohmann::json result_to_json(const StoreResult& r) {
    if (!r.success) return failure_json(r.error_kind, r.error);
    return {
        {"success", true},
        {"location", r.location},
        {"cached_at", format_timestamp(r.cached_at)}
    };
}

nlohmann::json result_to_json(const ListingResult& r) {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& e : r.entries) entries.push_back(listing_to_json(e));

    nlohmann::json j = r.success ? nlohmann::json{{"success", true}}
                                 : failure_json(r.error_kind, r.error);
    j["entries"] = entries;
    j["count"] = r.entries.size();
    return j;
}

nlohmann::json result_to_json(const EvictionResult& r) {
    if (!r.success) {
        return {{"success", false}, {"status", "error"}, {"error", r.error}};
    }
    auto j = eviction_to_json(r.stats);
    j["success"] = true;
    return j;
}

nlohmann::json result_to_json(const ForgetResult& r) {
    if (!r.success) return failure_json(r.error_kind, r.error);
    return {{"success", true}, {"removed", r.removed}};
}

// ── CacheService ────────────────────────────────────────────────

CacheService::CacheService(std::unique_ptr<TextCache> lyrics,
                           std::unique_ptr<RecordCache> vocab,
                           LyricsProvider* provider,
                           int compression_level,
                           bool single_flight)
    : lyrics_(std::move(lyrics)),
      vocab_(std::move(vocab)),
      provider_(provider),
      compression_level_(compression_level),
      single_flight_(single_flight) {
    if (!lyrics_ || !vocab_) {
        throw std::invalid_argument("CacheService: both caches are required");
    }
    if (compression_level_ < 0 || compression_level_ > 9) {
        throw std::invalid_argument("CacheService: compression level must be 0-9");
    }
}

KeyedMutex::Lock CacheService::lock_key(KeyedMutex& locks, const CacheKey& key) {
    if (!single_flight_) return {};
    return locks.acquire(storage_id(key));
}

std::optional<LyricsResult> CacheService::lookup_lyrics(const CacheKey& key,
                                                        std::string& decode_error) {
    std::optional<TextCache::Record> hit;
    try {
        hit = lyrics_->get(key);
    } catch (const std::exception& e) {
        std::cerr << "[lyrics-cache] Lookup failed for " << key.describe()
                  << ", treating as miss: " << e.what() << "\n";
        return std::nullopt;
    }
    if (!hit) return std::nullopt;

    LyricsResult result;
    try {
        result.lyrics = decompress_text(hit->payload);
    } catch (const DecodeError& e) {
        decode_error = e.what();
        std::cerr << "[lyrics-cache] Corrupt entry for " << key.describe()
                  << ", refetching: " << e.what() << "\n";
        return std::nullopt;
    }

    result.success = true;
    result.metadata = hit->metadata;
    result.is_mock = hit->metadata.is_object() && hit->metadata.value("is_mock", false);
    result.cache_info.from_cache = true;
    result.cache_info.cached_at = hit->created_at;
    result.cache_info.compression = hit->compression;
    result.cache_info.language = hit->language;
    result.cache_info.location = hit->location;
    std::cerr << "[lyrics-cache] Hit for " << key.describe() << "\n";
    return result;
}

LyricsResult CacheService::fetch_lyrics(const std::string& song,
                                        const std::optional<std::string>& artist,
                                        bool allow_mock) {
    LyricsResult result;
    CacheKey key;
    try {
        key = normalize_key(song, artist);
    } catch (const std::invalid_argument& e) {
        result.error_kind = ErrorKind::InvalidArgument;
        result.error = e.what();
        return result;
    }

    auto lock = lock_key(lyrics_locks_, key);

    std::string decode_error;
    if (auto cached = lookup_lyrics(key, decode_error)) return *cached;

    const std::string title = display_song(song);
    const auto by = display_artist(artist);

    // Miss: obtain fresh text
    std::string text;
    if (allow_mock) {
        text = mock_lyrics(title, by);
        result.is_mock = true;
        result.metadata = {
            {"title", title},
            {"artist", by.value_or("Unknown")},
            {"source", "mock_data"},
            {"fetched_at", timestamp_now()},
            {"is_mock", true}
        };
    } else {
        std::optional<FetchedLyrics> fetched;
        if (provider_) {
            try {
                fetched = provider_->fetch(title, by);
            } catch (const std::exception& e) {
                std::cerr << "[lyrics-cache] Provider " << provider_->provider_name()
                          << " failed for " << key.describe() << ": " << e.what() << "\n";
                result.error_kind = ErrorKind::ProviderError;
                result.error = std::string("Error fetching lyrics: ") + e.what();
                return result;
            } catch (...) {
                std::cerr << "[lyrics-cache] Provider " << provider_->provider_name()
                          << " failed for " << key.describe() << ": unknown error\n";
                result.error_kind = ErrorKind::ProviderError;
                result.error = "Error fetching lyrics: unknown error";
                return result;
            }
        }
        if (!fetched || fetched->text.empty()) {
            if (!decode_error.empty()) {
                result.error_kind = ErrorKind::DecodeError;
                result.error = "Cached lyrics are corrupt and no fresh copy is available: " +
                               decode_error;
            } else {
                result.error_kind = ErrorKind::NotFound;
                result.error = "No lyrics found for the given song and artist";
            }
            return result;
        }
        if (!is_valid_utf8(fetched->text)) {
            std::cerr << "[lyrics-cache] Provider " << provider_->provider_name()
                      << " returned text that is not UTF-8 for " << key.describe() << "\n";
            result.error_kind = ErrorKind::ProviderError;
            result.error = "Lyrics from " + fetched->source + " are not valid UTF-8";
            return result;
        }
        text = std::move(fetched->text);
        result.metadata = {
            {"title", title},
            {"artist", by.value_or("Unknown")},
            {"source", fetched->source},
            {"fetched_at", timestamp_now()}
        };
    }

    result.success = true;
    result.lyrics = text;
    result.cache_info.from_cache = false;
    result.cache_info.language = guess_language(text);

    // Store; a failed write does not fail the request
    try {
        EncodedText enc = compress_text(text, compression_level_);
        result.cache_info.compression = enc.stats;

        TextCache::Record record;
        record.key = key;
        record.payload = std::move(enc.encoded);
        record.compression = enc.stats;
        record.metadata = result.metadata;
        record.language = result.cache_info.language;
        record.source = result.metadata.value("source", std::string{});
        result.cache_info.location = lyrics_->put(record);
        result.cache_info.cached_at = epoch_seconds();
        std::cerr << "[lyrics-cache] Stored " << key.describe() << ": "
                  << describe(enc.stats) << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[lyrics-cache] Warning: failed to store " << key.describe()
                  << ": " << e.what() << "\n";
    }
    return result;
}

std::optional<VocabularyResult> CacheService::lookup_vocabulary(const CacheKey& key) {
    std::optional<RecordCache::Record> hit;
    try {
        hit = vocab_->get(key);
    } catch (const std::exception& e) {
        std::cerr << "[vocab-cache] Lookup failed for " << key.describe()
                  << ", treating as miss: " << e.what() << "\n";
        return std::nullopt;
    }
    if (!hit) return std::nullopt;

    VocabularyResult result;
    result.success = true;
    result.record = std::move(hit->payload);
    result.cache_info.from_cache = true;
    result.cache_info.cached_at = hit->created_at;
    result.cache_info.language = hit->language;
    result.cache_info.location = hit->location;
    std::cerr << "[vocab-cache] Hit for " << key.describe() << "\n";
    return result;
}

VocabularyResult CacheService::fetch_vocabulary(const std::string& song,
                                                const std::optional<std::string>& artist) {
    VocabularyResult result;
    CacheKey key;
    try {
        key = normalize_key(song, artist);
    } catch (const std::invalid_argument& e) {
        result.error_kind = ErrorKind::InvalidArgument;
        result.error = e.what();
        return result;
    }

    if (auto cached = lookup_vocabulary(key)) return *cached;

    result.error_kind = ErrorKind::NotFound;
    result.error = "No cached vocabulary for " + key.describe();
    return result;
}

VocabularyResult CacheService::derive_vocabulary(const std::string& song,
                                                 const std::optional<std::string>& artist,
                                                 VocabExtractor& extractor,
                                                 bool allow_mock) {
    VocabularyResult result;
    CacheKey key;
    try {
        key = normalize_key(song, artist);
    } catch (const std::invalid_argument& e) {
        result.error_kind = ErrorKind::InvalidArgument;
        result.error = e.what();
        return result;
    }

    auto lock = lock_key(vocab_locks_, key);

    if (auto cached = lookup_vocabulary(key)) return *cached;

    LyricsResult lyrics = fetch_lyrics(song, artist, allow_mock);
    if (!lyrics.success) {
        result.error_kind = lyrics.error_kind;
        result.error = lyrics.error;
        return result;
    }

    nlohmann::json derived;
    try {
        derived = extractor.extract(lyrics.lyrics);
    } catch (const std::exception& e) {
        std::cerr << "[vocab-cache] Extractor " << extractor.extractor_name()
                  << " failed for " << key.describe() << ": " << e.what() << "\n";
        result.error_kind = ErrorKind::ProviderError;
        result.error = std::string("Error extracting vocabulary: ") + e.what();
        return result;
    } catch (...) {
        std::cerr << "[vocab-cache] Extractor " << extractor.extractor_name()
                  << " failed for " << key.describe() << ": unknown error\n";
        result.error_kind = ErrorKind::ProviderError;
        result.error = "Error extracting vocabulary: unknown error";
        return result;
    }
    if (!derived.is_object()) {
        derived = nlohmann::json{{"vocabulary", derived}};
    }

    result.success = true;
    result.record = derived;
    result.cache_info.from_cache = false;
    result.cache_info.language = lyrics.cache_info.language;

    try {
        RecordCache::Record record;
        record.key = CacheKey{display_song(song), display_artist(artist)};
        record.payload = derived;
        record.language = lyrics.cache_info.language;
        record.source = extractor.extractor_name();
        result.cache_info.location = vocab_->put(record);
        result.cache_info.cached_at = epoch_seconds();
        std::cerr << "[vocab-cache] Stored " << key.describe() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[vocab-cache] Warning: failed to store " << key.describe()
                  << ": " << e.what() << "\n";
    }
    return result;
}

StoreResult CacheService::store_vocabulary(const std::string& song,
                                           const std::optional<std::string>& artist,
                                           const nlohmann::json& vocabulary) {
    StoreResult result;
    CacheKey key;
    try {
        key = normalize_key(song, artist);
    } catch (const std::invalid_argument& e) {
        result.error_kind = ErrorKind::InvalidArgument;
        result.error = e.what();
        return result;
    }

    RecordCache::Record record;
    record.key = CacheKey{display_song(song), display_artist(artist)};
    if (vocabulary.is_object()) {
        record.payload = vocabulary;
    } else if (vocabulary.is_array()) {
        record.payload = {{"vocabulary", vocabulary}};
    } else {
        result.error_kind = ErrorKind::InvalidArgument;
        result.error = "vocabulary must be a JSON object or array";
        return result;
    }

    auto lock = lock_key(vocab_locks_, key);
    try {
        result.location = vocab_->put(record);
    } catch (const std::exception& e) {
        std::cerr << "[vocab-cache] Error saving " << key.describe() << ": "
                  << e.what() << "\n";
        result.error_kind = ErrorKind::StoreError;
        result.error = e.what();
        return result;
    }
    result.success = true;
    result.cached_at = epoch_seconds();
    std::cerr << "[vocab-cache] Saved " << key.describe() << " to "
              << result.location << "\n";
    return result;
}

namespace {

template <typename V>
ListingResult list_entries(ContentCache<V>& cache, const char* tag) {
    ListingResult result;
    try {
        result.entries = cache.list();
        result.success = true;
    } catch (const std::exception& e) {
        std::cerr << tag << " Error listing entries: " << e.what() << "\n";
        result.error_kind = ErrorKind::StoreError;
        result.error = e.what();
    }
    return result;
}

template <typename V>
EvictionResult evict_entries(ContentCache<V>& cache, uint32_t max_entries,
                             uint32_t max_age_days, const char* tag) {
    EvictionResult result;
    try {
        result.stats = evict(cache, EvictionPolicy{max_entries, max_age_days});
        result.success = true;
    } catch (const std::exception& e) {
        std::cerr << tag << " Eviction failed: " << e.what() << "\n";
        result.error = e.what();
    }
    return result;
}

template <typename V>
ForgetResult forget_entry(ContentCache<V>& cache, const std::string& song,
                          const std::optional<std::string>& artist, const char* tag) {
    ForgetResult result;
    try {
        CacheKey key = normalize_key(song, artist);
        result.removed = cache.remove(key);
        result.success = true;
        if (result.removed) std::cerr << tag << " Removed " << key.describe() << "\n";
    } catch (const std::invalid_argument& e) {
        result.error_kind = ErrorKind::InvalidArgument;
        result.error = e.what();
    } catch (const std::exception& e) {
        result.error_kind = ErrorKind::StoreError;
        result.error = e.what();
    }
    return result;
}

} // namespace

ListingResult CacheService::list_cached_lyrics() {
    return list_entries(*lyrics_, "[lyrics-cache]");
}

ListingResult CacheService::list_cached_vocabulary() {
    return list_entries(*vocab_, "[vocab-cache]");
}

EvictionResult CacheService::evict_lyrics_cache(uint32_t max_entries, uint32_t max_age_days) {
    return evict_entries(*lyrics_, max_entries, max_age_days, "[lyrics-cache]");
}

EvictionResult CacheService::evict_vocabulary_cache(uint32_t max_entries,
                                                    uint32_t max_age_days) {
    return evict_entries(*vocab_, max_entries, max_age_days, "[vocab-cache]");
}

ForgetResult CacheService::forget_lyrics(const std::string& song,
                                         const std::optional<std::string>& artist) {
    return forget_entry(*lyrics_, song, artist, "[lyrics-cache]");
}

ForgetResult CacheService::forget_vocabulary(const std::string& song,
                                             const std::optional<std::string>& artist) {
    return forget_entry(*vocab_, song, artist, "[vocab-cache]");
}

std::unique_ptr<CacheService> create_cache_service(const CacheConfig& config,
                                                   LyricsProvider* provider) {
    return std::make_unique<CacheService>(
        std::make_unique<SqliteTextStore>(config.resolved_lyrics_db_path()),
        std::make_unique<FileRecordStore>(config.resolved_vocab_dir()),
        provider,
        config.compression_level,
        config.single_flight);
}

} // namespace lyricache
