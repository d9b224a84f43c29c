#include <catch2/catch_test_macros.hpp>
#include "util.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace lyricache;

// ── trim ─────────────────────────────────────────────────────────

TEST_CASE("trim: removes leading and trailing spaces", "[util]") {
    REQUIRE(trim("  hello  ") == "hello");
}

TEST_CASE("trim: removes tabs and mixed whitespace", "[util]") {
    REQUIRE(trim("\t hello \n") == "hello");
}

TEST_CASE("trim: all whitespace returns empty", "[util]") {
    REQUIRE(trim("   \t\n  ").empty());
}

TEST_CASE("trim: inner whitespace kept", "[util]") {
    REQUIRE(trim(" Kenshi  Yonezu ") == "Kenshi  Yonezu");
}

// ── to_lower ─────────────────────────────────────────────────────

TEST_CASE("to_lower: folds ASCII letters", "[util]") {
    REQUIRE(to_lower("LeMoN 123") == "lemon 123");
}

TEST_CASE("to_lower: leaves multibyte UTF-8 untouched", "[util]") {
    std::string jp = "\xe7\xb1\xb3\xe6\xb4\xa5\xe7\x8e\x84\xe5\xb8\xab";  // 米津玄師
    REQUIRE(to_lower(jp) == jp);
    REQUIRE(to_lower("\xc3\x89t\xc3\xa9") == "\xc3\x89t\xc3\xa9");  // Été
}

// ── format_timestamp ─────────────────────────────────────────────

TEST_CASE("format_timestamp: epoch zero", "[util]") {
    REQUIRE(format_timestamp(0) == "1970-01-01 00:00:00");
}

TEST_CASE("format_timestamp: known instant in UTC", "[util]") {
    REQUIRE(format_timestamp(1700000000) == "2023-11-14 22:13:20");
}

TEST_CASE("timestamp_now: has fixed width", "[util]") {
    REQUIRE(timestamp_now().size() == 19);
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: path without tilde unchanged", "[util]") {
    REQUIRE(expand_home("/usr/local") == "/usr/local");
}

TEST_CASE("expand_home: tilde is expanded", "[util]") {
    std::string result = expand_home("~/Documents");
    REQUIRE(result.front() == '/');
    REQUIRE(result.find('~') == std::string::npos);
    REQUIRE(result.size() > std::string("/Documents").size());
}

TEST_CASE("expand_home: empty string unchanged", "[util]") {
    REQUIRE(expand_home("").empty());
}

// ── generate_id ──────────────────────────────────────────────────

TEST_CASE("generate_id: 16 hex chars and unique", "[util]") {
    auto a = generate_id();
    auto b = generate_id();
    REQUIRE(a.size() == 16);
    REQUIRE(a != b);
}

// ── atomic_write_file / read_file ────────────────────────────────

TEST_CASE("atomic_write_file: creates parent dirs and replaces content", "[util]") {
    std::string dir = "/tmp/lyricache_test_util_" + std::to_string(getpid());
    std::string path = dir + "/nested/out.txt";

    REQUIRE(atomic_write_file(path, "first"));
    REQUIRE(atomic_write_file(path, "second"));

    std::string content;
    REQUIRE(read_file(path, content));
    REQUIRE(content == "second");

    // No temp files left behind
    size_t files = 0;
    for (const auto& e : std::filesystem::directory_iterator(dir + "/nested")) {
        (void)e;
        files++;
    }
    REQUIRE(files == 1);

    std::filesystem::remove_all(dir);
}

TEST_CASE("read_file: missing file returns false", "[util]") {
    std::string out = "untouched";
    REQUIRE_FALSE(read_file("/tmp/lyricache_no_such_file_" + std::to_string(getpid()), out));
}

// ── base64 ───────────────────────────────────────────────────────

TEST_CASE("base64_encode: RFC 4648 vectors", "[util]") {
    REQUIRE(base64_encode("").empty());
    REQUIRE(base64_encode("f") == "Zg==");
    REQUIRE(base64_encode("fo") == "Zm8=");
    REQUIRE(base64_encode("foo") == "Zm9v");
    REQUIRE(base64_encode("foobar") == "Zm9vYmFy");
}

TEST_CASE("base64_decode: decodes padded input", "[util]") {
    std::string out;
    REQUIRE(base64_decode("Zm9vYg==", out));
    REQUIRE(out == "foob");
}

TEST_CASE("base64_decode: rejects malformed input", "[util]") {
    std::string out;
    REQUIRE_FALSE(base64_decode("Zm9", out));        // bad length
    REQUIRE_FALSE(base64_decode("Zm9v!A==", out));   // outside alphabet
    REQUIRE_FALSE(base64_decode("Z===", out));       // too much padding
    REQUIRE_FALSE(base64_decode("Zg==Zm8=", out));   // padding mid-stream
}

TEST_CASE("base64: binary bytes survive", "[util]") {
    std::string bin;
    for (int i = 0; i < 256; i++) bin.push_back(static_cast<char>(i));
    std::string out;
    REQUIRE(base64_decode(base64_encode(bin), out));
    REQUIRE(out == bin);
}

// ── hex_encode ───────────────────────────────────────────────────

TEST_CASE("hex_encode: lower-case pairs", "[util]") {
    const unsigned char bytes[] = {0x00, 0x0f, 0xab, 0xff};
    REQUIRE(hex_encode(bytes, sizeof(bytes)) == "000fabff");
}

// ── is_valid_utf8 ────────────────────────────────────────────────

TEST_CASE("is_valid_utf8: accepts ASCII and multibyte text", "[util]") {
    REQUIRE(is_valid_utf8("plain"));
    REQUIRE(is_valid_utf8("\xe3\x83\xac\xe3\x83\xa2\xe3\x83\xb3"));  // レモン
    REQUIRE(is_valid_utf8("\xf0\x9f\x8e\xb5"));                      // 🎵
}

TEST_CASE("is_valid_utf8: rejects malformed sequences", "[util]") {
    REQUIRE_FALSE(is_valid_utf8("\xff"));
    REQUIRE_FALSE(is_valid_utf8("\xe3\x83"));      // truncated
    REQUIRE_FALSE(is_valid_utf8("\xc0\xaf"));      // overlong
    REQUIRE_FALSE(is_valid_utf8("\xed\xa0\x80"));  // surrogate
}

// ── guess_language ───────────────────────────────────────────────

TEST_CASE("guess_language: ASCII letters mean english", "[util]") {
    REQUIRE(guess_language("Dreams of you") == "english");
}

TEST_CASE("guess_language: no ASCII letters means japanese", "[util]") {
    REQUIRE(guess_language("\xe5\xa4\xa2\xe3\x81\xaa\xe3\x82\x89\xe3\x81\xb0 123") == "japanese");
}
