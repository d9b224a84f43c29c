#include "file_store.hpp"
#include "record_json.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <sys/stat.h>
#include <utime.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace lyricache {

namespace fs = std::filesystem;

namespace {

struct UnitStat {
    uint64_t mtime = 0;
    uint64_t size = 0;
};

bool stat_unit(const std::string& path, UnitStat& out) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) return false;
    out.mtime = static_cast<uint64_t>(st.st_mtime);
    out.size = static_cast<uint64_t>(st.st_size);
    return true;
}

bool touch_unit(const std::string& path, uint64_t when) {
    struct utimbuf times;
    times.actime = static_cast<time_t>(when);
    times.modtime = static_cast<time_t>(when);
    return ::utime(path.c_str(), &times) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// True if the ids recorded in a unit normalize to `key`
bool block_matches(const nlohmann::json& block, const CacheKey& key) {
    std::string song = trim(block.at("song").get<std::string>());
    if (song.empty()) return false;
    return normalize_key(song, optional_from_json(block, "artist")) == key;
}

// The caller's ids as they should be recorded: trimmed, original case
CacheKey shown_key(const CacheKey& key) {
    CacheKey shown{trim(key.primary), std::nullopt};
    if (key.secondary) {
        std::string s = trim(*key.secondary);
        if (!s.empty()) shown.secondary = s;
    }
    return shown;
}

bool is_hex(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](char c) {
        return std::isxdigit(static_cast<unsigned char>(c)) != 0;
    });
}

// Parse a unit; returns a discarded value if the content is not a JSON object
nlohmann::json load_unit(const std::string& path) {
    std::string text;
    if (!read_file(path, text)) return nlohmann::json(nlohmann::json::value_t::discarded);
    auto doc = nlohmann::json::parse(text, nullptr, false);
    if (!doc.is_discarded() && !doc.is_object()) {
        return nlohmann::json(nlohmann::json::value_t::discarded);
    }
    return doc;
}

} // namespace

CacheListing listing_from_filename(const std::string& filename) {
    std::string stem = filename;
    if (ends_with(stem, FileRecordStore::kExtension)) {
        stem.resize(stem.size() - std::string(FileRecordStore::kExtension).size());
    }

    auto pos = stem.rfind('_');
    if (pos != std::string::npos) {
        std::string suffix = stem.substr(pos + 1);
        if (suffix.size() == 8 && is_hex(suffix)) stem.resize(pos);
    }

    CacheListing item;
    item.primary = stem.empty() ? "unknown" : stem;
    item.origin = ListingOrigin::FallbackFromName;
    return item;
}

FileRecordStore::FileRecordStore(const std::string& dir) : dir_(dir) {}

bool FileRecordStore::exists() const {
    std::error_code ec;
    return fs::is_directory(dir_, ec);
}

std::string FileRecordStore::path_for(const CacheKey& key) const {
    return (fs::path(dir_) / (storage_id(normalize_key(key)) + kExtension)).string();
}

std::optional<FileRecordStore::Record> FileRecordStore::get(const CacheKey& raw_key) {
    CacheKey key = normalize_key(raw_key);
    std::string path = path_for(key);

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return std::nullopt;

    UnitStat st;
    if (!stat_unit(path, st)) {
        throw StoreError("file store: cannot stat " + path);
    }
    auto doc = load_unit(path);
    if (doc.is_discarded()) {
        throw StoreError("file store: corrupt record " + path);
    }

    nlohmann::json block = nlohmann::json::object();
    auto it = doc.find(kMetadataBlockKey);
    if (it != doc.end()) {
        if (it->is_object()) block = *it;
        doc.erase(it);
    }

    // The file name is a truncated hash; make sure the unit really is ours
    if (block.contains("song") && block["song"].is_string()) {
        if (!block_matches(block, key)) {
            std::cerr << "[file-store] Warning: " << path << " belongs to a different key than "
                      << key.describe() << "\n";
            return std::nullopt;
        }
    }

    Record record;
    record.key = key;
    record.payload = std::move(doc);
    record.metadata = block;
    record.language = block.value("language", std::string{});
    record.source = block.value("source", std::string{});
    record.created_at = block.value("created_at", st.mtime);
    record.location = path;

    uint64_t now = epoch_seconds();
    if (touch_unit(path, now)) {
        record.accessed_at = now;
    } else {
        record.accessed_at = st.mtime;
        std::cerr << "[file-store] Warning: failed to touch " << path << "\n";
    }
    return record;
}

std::string FileRecordStore::put(const Record& record) {
    if (!record.payload.is_object()) {
        throw std::invalid_argument("FileRecordStore: payload must be a JSON object");
    }
    CacheKey key = normalize_key(record.key);
    std::string path = path_for(key);

    // Keep the creation time of an entry being replaced
    uint64_t created_at_us = epoch_micros();
    uint64_t created_at = created_at_us / 1000000;
    std::error_code ec;
    if (fs::is_regular_file(path, ec)) {
        auto existing = load_unit(path);
        if (!existing.is_discarded()) {
            auto it = existing.find(kMetadataBlockKey);
            if (it != existing.end() && it->is_object()) {
                created_at = it->value("created_at", created_at);
                created_at_us = it->value("created_at_us", created_at * 1000000);
            }
        }
    }

    nlohmann::json extra = record.metadata.is_object() ? record.metadata
                                                       : nlohmann::json::object();
    if (!record.language.empty()) extra["language"] = record.language;
    if (!record.source.empty()) extra["source"] = record.source;

    nlohmann::json doc = record.payload;
    doc[kMetadataBlockKey] =
        make_metadata_block(shown_key(record.key), created_at, created_at_us, extra);

    std::string text;
    try {
        text = doc.dump(2);
    } catch (const nlohmann::json::exception& e) {
        throw StoreError("file store: cannot serialize record for " + key.describe() +
                         ": " + e.what());
    }

    if (!atomic_write_file(path, text + "\n")) {
        throw StoreError("file store: failed to write " + path);
    }
    return path;
}

std::vector<CacheListing> FileRecordStore::scan() const {
    std::vector<CacheListing> units;
    if (!exists()) return units;

    std::error_code ec;
    fs::directory_iterator it(dir_, ec);
    if (ec) {
        throw StoreError("file store: cannot read directory " + dir_ + ": " + ec.message());
    }

    for (const auto& dirent : it) {
        std::string name = dirent.path().filename().string();
        if (!ends_with(name, kExtension)) continue;
        std::string path = dirent.path().string();

        UnitStat st;
        if (!stat_unit(path, st)) continue;  // vanished mid-scan

        CacheListing item;
        auto doc = load_unit(path);
        const nlohmann::json* block = nullptr;
        if (!doc.is_discarded()) {
            auto bit = doc.find(kMetadataBlockKey);
            if (bit != doc.end() && bit->is_object() && bit->contains("song") &&
                (*bit)["song"].is_string()) {
                block = &(*bit);
            }
        }

        if (block) {
            item.primary = (*block)["song"].get<std::string>();
            item.secondary = optional_from_json(*block, "artist");
            item.created_at = block->value("created_at", st.mtime);
            item.created_at_us = block->value("created_at_us", uint64_t{0});
            item.origin = ListingOrigin::Parsed;
        } else {
            item = listing_from_filename(name);
            item.created_at = st.mtime;
        }
        item.accessed_at = st.mtime;
        item.size_bytes = st.size;
        item.location = path;
        units.push_back(std::move(item));
    }
    return units;
}

std::vector<CacheListing> FileRecordStore::list() {
    auto units = scan();
    std::sort(units.begin(), units.end(), [](const CacheListing& a, const CacheListing& b) {
        if (a.accessed_at != b.accessed_at) return a.accessed_at > b.accessed_at;
        if (a.created_at != b.created_at) return a.created_at > b.created_at;
        if (a.created_at_us != b.created_at_us) return a.created_at_us > b.created_at_us;
        return a.location > b.location;
    });
    return units;
}

bool FileRecordStore::remove(const CacheKey& key) {
    std::string path = path_for(key);
    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec) {
        throw StoreError("file store: failed to delete " + path + ": " + ec.message());
    }
    return removed;
}

uint32_t FileRecordStore::count() {
    if (!exists()) return 0;

    std::error_code ec;
    fs::directory_iterator it(dir_, ec);
    if (ec) {
        throw StoreError("file store: cannot read directory " + dir_ + ": " + ec.message());
    }
    uint32_t n = 0;
    for (const auto& dirent : it) {
        if (ends_with(dirent.path().filename().string(), kExtension)) n++;
    }
    return n;
}

uint64_t FileRecordStore::total_bytes() {
    uint64_t total = 0;
    for (const auto& unit : scan()) total += unit.size_bytes;
    return total;
}

uint32_t FileRecordStore::delete_older_than(uint32_t max_age_days) {
    uint64_t now = epoch_seconds();
    uint64_t max_age = static_cast<uint64_t>(max_age_days) * 86400;
    uint64_t cutoff = now > max_age ? now - max_age : 0;

    uint32_t deleted = 0;
    for (const auto& unit : scan()) {
        if (unit.created_at >= cutoff) continue;
        std::error_code ec;
        if (fs::remove(unit.location, ec)) {
            deleted++;
        } else if (ec) {
            std::cerr << "[file-store] Warning: failed to delete " << unit.location
                      << ": " << ec.message() << "\n";
        }
    }
    return deleted;
}

uint32_t FileRecordStore::delete_least_recently_accessed_excess(uint32_t keep_count) {
    auto units = scan();
    if (units.size() <= keep_count) return 0;

    // Oldest access first; ties go to the oldest insertion
    std::sort(units.begin(), units.end(), [](const CacheListing& a, const CacheListing& b) {
        if (a.accessed_at != b.accessed_at) return a.accessed_at < b.accessed_at;
        if (a.created_at != b.created_at) return a.created_at < b.created_at;
        if (a.created_at_us != b.created_at_us) return a.created_at_us < b.created_at_us;
        return a.location < b.location;
    });

    size_t excess = units.size() - keep_count;
    uint32_t deleted = 0;
    for (size_t i = 0; i < excess; ++i) {
        std::error_code ec;
        if (fs::remove(units[i].location, ec)) {
            deleted++;
        } else if (ec) {
            std::cerr << "[file-store] Warning: failed to delete " << units[i].location
                      << ": " << ec.message() << "\n";
        }
    }
    return deleted;
}

} // namespace lyricache
