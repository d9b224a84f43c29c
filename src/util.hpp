#pragma once
#include <string>
#include <cstdint>

namespace lyricache {

// Unix epoch seconds
uint64_t epoch_seconds();

// Unix epoch microseconds
uint64_t epoch_micros();

// "YYYY-MM-DD HH:MM:SS" (UTC) for an epoch timestamp
std::string format_timestamp(uint64_t epoch);

// format_timestamp(epoch_seconds())
std::string timestamp_now();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lower-case; bytes >= 0x80 are left untouched
std::string to_lower(const std::string& s);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write to a sibling temp file, then rename over `path`.
// Creates missing parent directories. Returns false on any I/O failure,
// leaving the previous content of `path` in place.
bool atomic_write_file(const std::string& path, const std::string& content);

// Read a whole file. Returns false if it cannot be opened.
bool read_file(const std::string& path, std::string& out);

// Standard base64 with '=' padding
std::string base64_encode(const unsigned char* data, size_t len);
std::string base64_encode(const std::string& data);

// Strict base64 decode. Returns false on characters outside the alphabet,
// bad padding or a length that is not a multiple of 4.
bool base64_decode(const std::string& in, std::string& out);

// Lower-case hex of a byte buffer
std::string hex_encode(const unsigned char* data, size_t len);

// True if `s` is well-formed UTF-8
bool is_valid_utf8(const std::string& s);

// Coarse script hint: "english" if any ASCII letter occurs, else "japanese".
// Only ever used as metadata.
std::string guess_language(const std::string& text);

} // namespace lyricache
