#include "config.hpp"
#include "cache_service.hpp"
#include "lyrics_provider.hpp"
#include "util.hpp"
#include <cstdint>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

static void print_usage() {
    std::cout << "Usage: lyricache <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  lyrics SONG              Fetch lyrics (cache first)\n"
              << "  vocab SONG               Look up cached vocabulary\n"
              << "  save-vocab SONG          Store a vocabulary record (--file)\n"
              << "  list lyrics|vocab        List cached entries\n"
              << "  evict lyrics|vocab|all   Apply age and size bounds\n"
              << "  forget lyrics|vocab SONG Remove one entry\n"
              << "\n"
              << "Options:\n"
              << "  --artist NAME            Artist of the song\n"
              << "  --mock                   Use placeholder lyrics on a miss\n"
              << "  --from FILE              Read lyrics from a local text file on a miss\n"
              << "  --file FILE              JSON vocabulary to store (save-vocab)\n"
              << "  --max-entries N          Entry bound for evict (default from config)\n"
              << "  --max-age-days N         Age bound for evict (default from config)\n"
              << "  --config FILE            Config file (default ~/.lyricache/config.json)\n"
              << "  -h, --help               Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  LYRICACHE_LYRICS_DB          Lyrics database path\n"
              << "  LYRICACHE_VOCAB_DIR          Vocabulary cache directory\n"
              << "  LYRICACHE_COMPRESSION_LEVEL  zlib level 0-9\n"
              << "  LYRICACHE_MAX_ENTRIES        Default entry bound for evict\n"
              << "  LYRICACHE_MAX_AGE_DAYS       Default age bound for evict\n";
}

static uint32_t parse_count(const char* flag, const char* value) {
    try {
        size_t pos = 0;
        unsigned long v = std::stoul(value, &pos);
        if (pos == std::strlen(value) && v <= UINT32_MAX) return static_cast<uint32_t>(v);
    } catch (const std::exception&) { // NOLINT(bugprone-empty-catch)
        // reported below
    }
    throw std::invalid_argument(std::string("invalid value for ") + flag + ": " + value);
}

static int emit(const nlohmann::json& j) {
    std::cout << j.dump(2) << "\n";
    return j.value("success", false) ? 0 : 1;
}

int main(int argc, char* argv[]) try {
    // Parse arguments
    std::vector<std::string> positional;
    std::optional<std::string> artist;
    std::string from_file;
    std::string vocab_file;
    std::string config_path;
    std::optional<uint32_t> max_entries;
    std::optional<uint32_t> max_age_days;
    bool use_mock = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--artist") == 0 && i + 1 < argc) {
            artist = argv[++i];
        } else if (std::strcmp(argv[i], "--mock") == 0) {
            use_mock = true;
        } else if (std::strcmp(argv[i], "--from") == 0 && i + 1 < argc) {
            from_file = argv[++i];
        } else if (std::strcmp(argv[i], "--file") == 0 && i + 1 < argc) {
            vocab_file = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--max-entries") == 0 && i + 1 < argc) {
            max_entries = parse_count(argv[i], argv[i + 1]);
            ++i;
        } else if (std::strcmp(argv[i], "--max-age-days") == 0 && i + 1 < argc) {
            max_age_days = parse_count(argv[i], argv[i + 1]);
            ++i;
        } else if (argv[i][0] == '-') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        } else {
            positional.emplace_back(argv[i]);
        }
    }

    if (positional.empty()) {
        print_usage();
        return 1;
    }

    auto config = config_path.empty() ? lyricache::Config::load()
                                      : lyricache::Config::load_from(config_path);

    std::unique_ptr<lyricache::LyricsProvider> provider;
    if (!from_file.empty()) {
        provider = std::make_unique<lyricache::FileLyricsProvider>(from_file);
    }
    auto service = lyricache::create_cache_service(config.cache, provider.get());

    const std::string& command = positional[0];
    auto arg = [&](size_t n) -> const std::string* {
        return n < positional.size() ? &positional[n] : nullptr;
    };

    if (command == "lyrics" && arg(1)) {
        return emit(lyricache::result_to_json(
            service->fetch_lyrics(*arg(1), artist, use_mock)));
    }
    if (command == "vocab" && arg(1)) {
        return emit(lyricache::result_to_json(service->fetch_vocabulary(*arg(1), artist)));
    }
    if (command == "save-vocab" && arg(1)) {
        if (vocab_file.empty()) {
            std::cerr << "save-vocab requires --file\n";
            return 1;
        }
        std::string text;
        if (!lyricache::read_file(vocab_file, text)) {
            std::cerr << "Cannot read " << vocab_file << "\n";
            return 1;
        }
        auto vocabulary = nlohmann::json::parse(text, nullptr, false);
        if (vocabulary.is_discarded()) {
            std::cerr << "Invalid JSON in " << vocab_file << "\n";
            return 1;
        }
        return emit(lyricache::result_to_json(
            service->store_vocabulary(*arg(1), artist, vocabulary)));
    }
    if (command == "list" && arg(1)) {
        if (*arg(1) == "lyrics") return emit(lyricache::result_to_json(service->list_cached_lyrics()));
        if (*arg(1) == "vocab") return emit(lyricache::result_to_json(service->list_cached_vocabulary()));
    }
    if (command == "evict" && arg(1)) {
        uint32_t entries = max_entries.value_or(config.cache.max_entries);
        uint32_t days = max_age_days.value_or(config.cache.max_age_days);
        const std::string& which = *arg(1);
        if (which == "lyrics") {
            return emit(lyricache::result_to_json(service->evict_lyrics_cache(entries, days)));
        }
        if (which == "vocab") {
            return emit(lyricache::result_to_json(service->evict_vocabulary_cache(entries, days)));
        }
        if (which == "all") {
            auto lyrics = lyricache::result_to_json(service->evict_lyrics_cache(entries, days));
            auto vocab = lyricache::result_to_json(service->evict_vocabulary_cache(entries, days));
            bool ok = lyrics.value("success", false) && vocab.value("success", false);
            return emit({{"success", ok}, {"lyrics", lyrics}, {"vocabulary", vocab}});
        }
    }
    if (command == "forget" && arg(1) && arg(2)) {
        if (*arg(1) == "lyrics") {
            return emit(lyricache::result_to_json(service->forget_lyrics(*arg(2), artist)));
        }
        if (*arg(1) == "vocab") {
            return emit(lyricache::result_to_json(service->forget_vocabulary(*arg(2), artist)));
        }
    }

    std::cerr << "Unknown or incomplete command: " << command << "\n";
    print_usage();
    return 1;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
