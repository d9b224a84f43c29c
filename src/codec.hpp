#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace lyricache {

constexpr int kDefaultCompressionLevel = 6;

// Thrown when an encoded payload is not valid output of compress_text()
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

struct CompressionStats {
    uint64_t original_size = 0;    // UTF-8 bytes in
    uint64_t compressed_size = 0;  // raw zlib stream
    uint64_t encoded_size = 0;     // base64 text actually stored
    double ratio = 0.0;            // original_size / encoded_size
    std::string algorithm = "zlib+base64";
    int level = kDefaultCompressionLevel;
};

struct EncodedText {
    std::string encoded;
    CompressionStats stats;
};

// zlib-compress then base64-encode. `level` is 0-9; anything else throws
// std::invalid_argument, as does text that is not valid UTF-8. The level is
// not needed to decode.
EncodedText compress_text(const std::string& text, int level = kDefaultCompressionLevel);

// Reverse of compress_text(). Throws DecodeError on bad base64, a corrupt or
// truncated zlib stream, or output that is not valid UTF-8.
std::string decompress_text(const std::string& encoded);

// "512 B", "1.5 KB", "2.3 MB"
std::string format_bytes(uint64_t bytes);

// "2048 B -> 512 B encoded (4.00x, zlib+base64 level 6)"
std::string describe(const CompressionStats& stats);

nlohmann::json compression_to_json(const CompressionStats& stats);
CompressionStats compression_from_json(const nlohmann::json& j);

} // namespace lyricache
