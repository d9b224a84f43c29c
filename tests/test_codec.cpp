#include <catch2/catch_test_macros.hpp>
#include "codec.hpp"
#include "util.hpp"
#include <stdexcept>

using namespace lyricache;

static const std::string kJapanese =
    "\xe5\xa4\xa2\xe3\x81\xaa\xe3\x82\x89\xe3\x81\xb0\xe3\x81\xa9\xe3\x82\x8c\xe3\x81\xbb"
    "\xe3\x81\xa9\xe3\x82\x88\xe3\x81\x8b\xe3\x81\xa3\xe3\x81\x9f\xe3\x81\xa7\xe3\x81\x97"
    "\xe3\x82\x87\xe3\x81\x86\n"  // 夢ならばどれほどよかったでしょう
    "\xe6\x9c\xaa\xe3\x81\xa0\xe3\x81\xab\xe3\x81\x82\xe3\x81\xaa\xe3\x81\x9f\xe3\x81\xae"
    "\xe3\x81\x93\xe3\x81\xa8\xe3\x82\x92\xe5\xa4\xa2\xe3\x81\xab\xe3\x81\xbf\xe3\x82\x8b\n";

// ── Round trip ───────────────────────────────────────────────────

TEST_CASE("codec: round trip ASCII", "[codec]") {
    std::string text = "Hello darkness, my old friend\nI've come to talk with you again\n";
    REQUIRE(decompress_text(compress_text(text).encoded) == text);
}

TEST_CASE("codec: round trip multibyte script", "[codec]") {
    auto enc = compress_text(kJapanese);
    REQUIRE(decompress_text(enc.encoded) == kJapanese);
    REQUIRE(enc.stats.original_size == kJapanese.size());
}

TEST_CASE("codec: round trip empty string", "[codec]") {
    auto enc = compress_text("");
    REQUIRE_FALSE(enc.encoded.empty());
    REQUIRE(decompress_text(enc.encoded).empty());
}

TEST_CASE("codec: every level decodes without knowing the level", "[codec]") {
    std::string text = kJapanese + "mixed script line\n" + kJapanese;
    for (int level = 0; level <= 9; level++) {
        auto enc = compress_text(text, level);
        REQUIRE(enc.stats.level == level);
        REQUIRE(decompress_text(enc.encoded) == text);
    }
}

TEST_CASE("codec: output larger than one inflate chunk", "[codec]") {
    std::string text;
    for (int i = 0; i < 5000; i++) text += "line " + std::to_string(i) + "\n";
    REQUIRE(text.size() > 16384);
    REQUIRE(decompress_text(compress_text(text).encoded) == text);
}

// ── Statistics ───────────────────────────────────────────────────

TEST_CASE("codec: stats describe the stored form", "[codec]") {
    auto enc = compress_text("abcabcabcabcabcabcabcabcabcabc", 9);
    REQUIRE(enc.stats.encoded_size == enc.encoded.size());
    REQUIRE(enc.stats.encoded_size == (enc.stats.compressed_size + 2) / 3 * 4);
    REQUIRE(enc.stats.algorithm == "zlib+base64");
    REQUIRE(enc.stats.ratio ==
            static_cast<double>(enc.stats.original_size) / enc.stats.encoded_size);
}

TEST_CASE("codec: repetitive 100KB input compresses well", "[codec]") {
    std::string verse = "Sing along tonight, every echo coming back again\n";
    std::string text;
    while (text.size() < 100 * 1024) text += verse;

    auto enc = compress_text(text);
    REQUIRE(enc.stats.encoded_size < enc.stats.original_size);
    REQUIRE(enc.stats.ratio > 3.0);
}

TEST_CASE("codec: invalid level throws", "[codec]") {
    REQUIRE_THROWS_AS(compress_text("x", -1), std::invalid_argument);
    REQUIRE_THROWS_AS(compress_text("x", 10), std::invalid_argument);
}

TEST_CASE("codec: text that is not UTF-8 is rejected before encoding", "[codec]") {
    std::string latin1 = "Caf\xe9 del Mar";
    REQUIRE_THROWS_AS(compress_text(latin1), std::invalid_argument);
    REQUIRE_THROWS_AS(compress_text("ok\xc3"), std::invalid_argument);
}

TEST_CASE("codec: anything compress_text accepts decodes back", "[codec]") {
    std::string accented = "Caf\xc3\xa9 del Mar";
    REQUIRE(decompress_text(compress_text(accented).encoded) == accented);
}

// ── Decode failures ──────────────────────────────────────────────

TEST_CASE("codec: non-base64 payload is a DecodeError", "[codec]") {
    REQUIRE_THROWS_AS(decompress_text("not base64!!"), DecodeError);
}

TEST_CASE("codec: empty payload is a DecodeError", "[codec]") {
    REQUIRE_THROWS_AS(decompress_text(""), DecodeError);
}

TEST_CASE("codec: base64 of non-zlib bytes is a DecodeError", "[codec]") {
    REQUIRE_THROWS_AS(decompress_text(base64_encode("plain text, not deflate")), DecodeError);
}

TEST_CASE("codec: truncated stream is a DecodeError", "[codec]") {
    auto enc = compress_text(kJapanese);
    std::string raw;
    REQUIRE(base64_decode(enc.encoded, raw));
    raw.resize(raw.size() - 6);
    REQUIRE_THROWS_AS(decompress_text(base64_encode(raw)), DecodeError);
}

TEST_CASE("codec: trailing garbage is a DecodeError", "[codec]") {
    auto enc = compress_text("short text");
    std::string raw;
    REQUIRE(base64_decode(enc.encoded, raw));
    raw += "junk";
    REQUIRE_THROWS_AS(decompress_text(base64_encode(raw)), DecodeError);
}

TEST_CASE("codec: DecodeError is a runtime_error", "[codec]") {
    REQUIRE_THROWS_AS(decompress_text("@@@@"), std::runtime_error);
}

// ── Formatting ───────────────────────────────────────────────────

TEST_CASE("format_bytes: unit thresholds", "[codec]") {
    REQUIRE(format_bytes(0) == "0 B");
    REQUIRE(format_bytes(1023) == "1023 B");
    REQUIRE(format_bytes(1536) == "1.5 KB");
    REQUIRE(format_bytes(5 * 1024 * 1024) == "5.0 MB");
}

TEST_CASE("describe: sizes, ratio and method", "[codec]") {
    CompressionStats stats;
    stats.original_size = 2048;
    stats.compressed_size = 380;
    stats.encoded_size = 512;
    stats.ratio = 4.0;
    stats.level = 6;
    REQUIRE(describe(stats) == "2.0 KB -> 512 B encoded (4.00x, zlib+base64 level 6)");
}

TEST_CASE("compression_to_json: wire names", "[codec]") {
    auto enc = compress_text(kJapanese, 6);
    auto j = compression_to_json(enc.stats);
    REQUIRE(j["original_size_bytes"] == enc.stats.original_size);
    REQUIRE(j["compressed_size_bytes"] == enc.stats.compressed_size);
    REQUIRE(j["encoded_size_bytes"] == enc.stats.encoded_size);
    REQUIRE(j["compression_method"] == "zlib+base64");
    REQUIRE(j["compression_level"] == 6);
    REQUIRE(j.contains("compression_ratio"));

    auto back = compression_from_json(j);
    REQUIRE(back.original_size == enc.stats.original_size);
    REQUIRE(back.encoded_size == enc.stats.encoded_size);
    REQUIRE(back.ratio == enc.stats.ratio);
}
