#pragma once
#include "content_cache.hpp"
#include "eviction.hpp"
#include "keyed_mutex.hpp"
#include "lyrics_provider.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace lyricache {

struct CacheConfig;

enum class ErrorKind { None, InvalidArgument, NotFound, ProviderError, DecodeError, StoreError };

std::string error_kind_to_string(ErrorKind kind);

// Provenance of a returned value
struct CacheInfo {
    bool from_cache = false;
    uint64_t cached_at = 0;  // 0 when nothing was stored
    std::optional<CompressionStats> compression;
    std::string language;
    std::string location;
};

struct LyricsResult {
    bool success = false;
    std::string lyrics;
    nlohmann::json metadata = nlohmann::json::object();
    CacheInfo cache_info;
    bool is_mock = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
};

struct VocabularyResult {
    bool success = false;
    nlohmann::json record = nlohmann::json::object();  // cached payload object
    CacheInfo cache_info;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;

    // record["vocabulary"], or an empty array
    nlohmann::json vocabulary() const;
};

struct StoreResult {
    bool success = false;
    std::string location;
    uint64_t cached_at = 0;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
};

struct ListingResult {
    bool success = false;
    std::vector<CacheListing> entries;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
};

struct EvictionResult {
    bool success = false;
    EvictionStats stats;
    std::string error;
};

struct ForgetResult {
    bool success = false;
    bool removed = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
};

nlohmann::json result_to_json(const LyricsResult& r);
nlohmann::json result_to_json(const VocabularyResult& r);
nlohmann::json result_to_json(const StoreResult& r);
nlohmann::json result_to_json(const ListingResult& r);
nlohmann::json result_to_json(const EvictionResult& r);
nlohmann::json result_to_json(const ForgetResult& r);

// Read-through front door for both caches. Every public operation returns a
// result struct and never throws: store failures on lookup degrade to a
// miss, collaborator failures become ProviderError results.
class CacheService {
public:
    // `provider` may be null (every miss is then NotFound unless mocking)
    // and must outlive the service.
    CacheService(std::unique_ptr<TextCache> lyrics,
                 std::unique_ptr<RecordCache> vocab,
                 LyricsProvider* provider,
                 int compression_level = kDefaultCompressionLevel,
                 bool single_flight = true);

    LyricsResult fetch_lyrics(const std::string& song,
                              const std::optional<std::string>& artist = std::nullopt,
                              bool allow_mock = false);

    // Cache probe only; a miss is NotFound
    VocabularyResult fetch_vocabulary(const std::string& song,
                                      const std::optional<std::string>& artist = std::nullopt);

    // Read-through: probe, else fetch lyrics, run `extractor`, store
    VocabularyResult derive_vocabulary(const std::string& song,
                                       const std::optional<std::string>& artist,
                                       VocabExtractor& extractor,
                                       bool allow_mock = false);

    // `vocabulary` is an object, or an array stored as {"vocabulary": [...]}
    StoreResult store_vocabulary(const std::string& song,
                                 const std::optional<std::string>& artist,
                                 const nlohmann::json& vocabulary);

    ListingResult list_cached_lyrics();
    ListingResult list_cached_vocabulary();

    EvictionResult evict_lyrics_cache(uint32_t max_entries = 1000, uint32_t max_age_days = 90);
    EvictionResult evict_vocabulary_cache(uint32_t max_entries = 1000, uint32_t max_age_days = 90);

    ForgetResult forget_lyrics(const std::string& song,
                               const std::optional<std::string>& artist = std::nullopt);
    ForgetResult forget_vocabulary(const std::string& song,
                                   const std::optional<std::string>& artist = std::nullopt);

    TextCache& lyrics_cache() { return *lyrics_; }
    RecordCache& vocab_cache() { return *vocab_; }

private:
    std::optional<LyricsResult> lookup_lyrics(const CacheKey& key, std::string& decode_error);
    std::optional<VocabularyResult> lookup_vocabulary(const CacheKey& key);
    KeyedMutex::Lock lock_key(KeyedMutex& locks, const CacheKey& key);

    std::unique_ptr<TextCache> lyrics_;
    std::unique_ptr<RecordCache> vocab_;
    LyricsProvider* provider_;
    int compression_level_;
    bool single_flight_;
    KeyedMutex lyrics_locks_;
    KeyedMutex vocab_locks_;
};

// SQLite lyrics store + JSON-file vocabulary store at the configured paths
std::unique_ptr<CacheService> create_cache_service(const CacheConfig& config,
                                                   LyricsProvider* provider);

} // namespace lyricache
