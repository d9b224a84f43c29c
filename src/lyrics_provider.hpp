#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace lyricache {

struct FetchedLyrics {
    std::string text;
    std::string source;  // locator of where the text came from
};

// Upstream source of raw lyrics, consulted only on a cache miss.
// Returns nullopt when nothing was found; throws on transport or upstream
// failure (the caller turns that into a ProviderError result).
class LyricsProvider {
public:
    virtual ~LyricsProvider() = default;

    virtual std::string provider_name() const = 0;

    virtual std::optional<FetchedLyrics> fetch(const std::string& song,
                                               const std::optional<std::string>& artist) = 0;
};

// Derives a vocabulary record from lyrics. The returned JSON object is
// cached verbatim, normally {"vocabulary": [...]}. Throws on failure.
class VocabExtractor {
public:
    virtual ~VocabExtractor() = default;

    virtual std::string extractor_name() const = 0;

    virtual nlohmann::json extract(const std::string& lyrics) = 0;
};

// Offline provider: serves the contents of one local text file
class FileLyricsProvider : public LyricsProvider {
public:
    explicit FileLyricsProvider(const std::string& path) : path_(path) {}

    std::string provider_name() const override { return "file"; }

    std::optional<FetchedLyrics> fetch(const std::string& song,
                                       const std::optional<std::string>& artist) override;

private:
    std::string path_;
};

// Deterministic placeholder lyrics used for tests and offline runs
std::string mock_lyrics(const std::string& song, const std::optional<std::string>& artist);

} // namespace lyricache
