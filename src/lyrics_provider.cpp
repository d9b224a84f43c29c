#include "lyrics_provider.hpp"
#include "util.hpp"
#include <filesystem>
#include <stdexcept>

namespace lyricache {

std::optional<FetchedLyrics> FileLyricsProvider::fetch(const std::string& /*song*/,
                                                       const std::optional<std::string>& /*artist*/) {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) return std::nullopt;

    std::string text;
    if (!read_file(path_, text)) {
        throw std::runtime_error("cannot read lyrics file " + path_);
    }
    if (trim(text).empty()) return std::nullopt;

    return FetchedLyrics{text, "file://" + std::filesystem::absolute(path_, ec).string()};
}

std::string mock_lyrics(const std::string& song, const std::optional<std::string>& artist) {
    const std::string by = artist ? *artist : "Unknown";
    const std::string chorus =
        "Sing along to " + song + " tonight\n"
        "Every echo coming back again\n"
        "Sing along to " + song + " tonight\n";

    return "Placeholder lyrics for " + song + " by " + by + "\n"
           "\n"
           "[Verse 1]\n"
           "Streetlights humming on an empty road\n"
           "Counting every word that no one spoke\n"
           "Paper lanterns drifting out of sight\n"
           "Holding on until the morning light\n"
           "\n"
           "[Chorus]\n" + chorus +
           "\n"
           "[Verse 2]\n"
           "Rain is writing letters on the glass\n"
           "Little stories that will never last\n"
           "Turn the record over one more time\n"
           "Every second line begins to rhyme\n"
           "\n"
           "[Chorus]\n" + chorus +
           "\n"
           "[Bridge]\n"
           "Quiet now, the city falls asleep\n"
           "Some refrains are only ours to keep\n"
           "\n"
           "[Chorus]\n" + chorus +
           "\n"
           "(End)\n";
}

} // namespace lyricache
