#include <catch2/catch_test_macros.hpp>
#include "cache_key.hpp"
#include <set>
#include <stdexcept>

using namespace lyricache;

// ── normalize_key ────────────────────────────────────────────────

TEST_CASE("normalize_key: trims and folds case", "[cache_key]") {
    auto key = normalize_key("  Lemon ", std::string("Kenshi YONEZU\t"));
    REQUIRE(key.primary == "lemon");
    REQUIRE(key.secondary.has_value());
    REQUIRE(key.secondary.value_or("") == "kenshi yonezu");
}

TEST_CASE("normalize_key: blank secondary counts as absent", "[cache_key]") {
    REQUIRE_FALSE(normalize_key("Lemon", std::string("   ")).secondary.has_value());
    REQUIRE_FALSE(normalize_key("Lemon", std::string("")).secondary.has_value());
    REQUIRE(normalize_key("Lemon", std::string(" ")) == normalize_key("Lemon"));
}

TEST_CASE("normalize_key: empty primary throws", "[cache_key]") {
    REQUIRE_THROWS_AS(normalize_key(""), std::invalid_argument);
    REQUIRE_THROWS_AS(normalize_key(" \t "), std::invalid_argument);
}

TEST_CASE("normalize_key: idempotent", "[cache_key]") {
    const std::pair<std::string, std::optional<std::string>> inputs[] = {
        {"Lemon", std::string("Kenshi Yonezu")},
        {"  MIXED case  ", std::nullopt},
        {"\xe3\x83\xac\xe3\x83\xa2\xe3\x83\xb3", std::string(" \xe7\xb1\xb3\xe6\xb4\xa5 ")},
        {"Song", std::string("  ")},
    };
    for (const auto& [p, s] : inputs) {
        auto once = normalize_key(p, s);
        REQUIRE(normalize_key(once) == once);
        REQUIRE(normalize_key(once.primary, once.secondary) == once);
    }
}

TEST_CASE("normalize_key: non-ASCII bytes are kept verbatim", "[cache_key]") {
    std::string title = "\xc3\x89t\xc3\xa9";  // Été
    REQUIRE(normalize_key(title).primary == "\xc3\x89t\xc3\xa9");
}

TEST_CASE("CacheKey::describe: with and without secondary", "[cache_key]") {
    REQUIRE(normalize_key("Lemon").describe() == "'lemon'");
    REQUIRE(normalize_key("Lemon", std::string("Kenshi Yonezu")).describe() ==
            "'lemon' by 'kenshi yonezu'");
}

// ── sanitize_slug ────────────────────────────────────────────────

TEST_CASE("sanitize_slug: replaces punctuation and spaces", "[cache_key]") {
    REQUIRE(sanitize_slug("don't stop/me now") == "don_t_stop_me_now");
}

TEST_CASE("sanitize_slug: keeps UTF-8 sequences whole", "[cache_key]") {
    std::string jp = "\xe3\x83\xac\xe3\x83\xa2\xe3\x83\xb3";  // 9 bytes
    REQUIRE(sanitize_slug(jp) == jp);
    // A cap in the middle of a code point drops the whole code point
    REQUIRE(sanitize_slug(jp, 7) == "\xe3\x83\xac\xe3\x83\xa2");
}

TEST_CASE("sanitize_slug: malformed sequences become underscores", "[cache_key]") {
    // Lead byte followed by ASCII
    REQUIRE(sanitize_slug("\xc3/evil") == "__evil");
    // Stray continuation byte and truncated sequence at the end
    REQUIRE(sanitize_slug("a\x80" "b") == "a_b");
    REQUIRE(sanitize_slug("ab\xe3\x83") == "ab__");
    REQUIRE(sanitize_slug("\xff") == "_");
}

TEST_CASE("sanitize_slug: capped at max bytes", "[cache_key]") {
    std::string long_title(200, 'a');
    REQUIRE(sanitize_slug(long_title).size() == 64);
    REQUIRE(sanitize_slug(long_title, 10) == std::string(10, 'a'));
}

// ── storage_id ───────────────────────────────────────────────────

TEST_CASE("storage_id: slug plus eight hex chars", "[cache_key]") {
    REQUIRE(storage_id("Lemon", std::string("Kenshi Yonezu")) ==
            "lemon_kenshi_yonezu_9a5cbc41");
    REQUIRE(storage_id("Lemon") == "lemon_149cd6a6");
}

TEST_CASE("storage_id: never contains a path separator", "[cache_key]") {
    auto id = storage_id("\xc3/evil", std::string("\xe3/../x"));
    REQUIRE(id.find('/') == std::string::npos);
    REQUIRE(id.find('.') == std::string::npos);
}

TEST_CASE("storage_id: same for equivalent spellings", "[cache_key]") {
    REQUIRE(storage_id(" LEMON", std::string("kenshi yonezu ")) ==
            storage_id("lemon", std::string("Kenshi Yonezu")));
}

TEST_CASE("storage_id: distinct secondaries never collide", "[cache_key]") {
    std::set<std::string> ids;
    ids.insert(storage_id("Same Song"));
    ids.insert(storage_id("Same Song", std::string("Artist 1")));
    ids.insert(storage_id("Same Song", std::string("Artist 2")));
    ids.insert(storage_id("Same Song", std::string("artist_1")));
    REQUIRE(ids.size() == 4);
}

TEST_CASE("storage_id: slug collisions are split by the hash", "[cache_key]") {
    // Both slug to "a_b"
    auto a = storage_id("a b");
    auto b = storage_id("a/b");
    REQUIRE(a.substr(0, 4) == "a_b_");
    REQUIRE(b.substr(0, 4) == "a_b_");
    REQUIRE(a != b);
}

TEST_CASE("storage_id: field boundary is unambiguous", "[cache_key]") {
    REQUIRE(storage_id("a", std::string("b c")) != storage_id("a b", std::string("c")));
    REQUIRE(key_hash(normalize_key("a", std::string("b c"))) !=
            key_hash(normalize_key("a b", std::string("c"))));
}

TEST_CASE("key_hash: length is configurable", "[cache_key]") {
    auto key = normalize_key("Lemon");
    REQUIRE(key_hash(key).size() == 8);
    REQUIRE(key_hash(key, 64).size() == 64);
    REQUIRE(key_hash(key, 100).size() == 64);
}
