#include "codec.hpp"
#include "util.hpp"
#include <zlib.h>
#include <cstdio>
#include <vector>

namespace lyricache {

EncodedText compress_text(const std::string& text, int level) {
    if (level < 0 || level > 9) {
        throw std::invalid_argument("compression level must be 0-9, got " +
                                    std::to_string(level));
    }
    if (!is_valid_utf8(text)) {
        throw std::invalid_argument("text to compress is not valid UTF-8");
    }

    uLongf bound = compressBound(static_cast<uLong>(text.size()));
    std::vector<unsigned char> buf(bound);
    uLongf out_len = bound;
    int rc = compress2(buf.data(), &out_len,
                       reinterpret_cast<const Bytef*>(text.data()),
                       static_cast<uLong>(text.size()), level);
    if (rc != Z_OK) {
        throw std::runtime_error("zlib compress2 failed with code " + std::to_string(rc));
    }

    EncodedText result;
    result.encoded = base64_encode(buf.data(), out_len);
    result.stats.original_size = text.size();
    result.stats.compressed_size = out_len;
    result.stats.encoded_size = result.encoded.size();
    result.stats.ratio = result.stats.encoded_size > 0
        ? static_cast<double>(result.stats.original_size) /
          static_cast<double>(result.stats.encoded_size)
        : 0.0;
    result.stats.level = level;
    return result;
}

std::string decompress_text(const std::string& encoded) {
    std::string raw;
    if (!base64_decode(encoded, raw)) {
        throw DecodeError("payload is not valid base64");
    }
    if (raw.empty()) {
        throw DecodeError("payload is empty");
    }

    z_stream zs{};
    if (inflateInit(&zs) != Z_OK) {
        throw DecodeError("zlib inflateInit failed");
    }
    zs.next_in = reinterpret_cast<Bytef*>(raw.data());
    zs.avail_in = static_cast<uInt>(raw.size());

    std::string out;
    unsigned char chunk[16384];
    int rc = Z_OK;
    while (rc == Z_OK) {
        zs.next_out = chunk;
        zs.avail_out = sizeof(chunk);
        rc = inflate(&zs, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) break;
        out.append(reinterpret_cast<const char*>(chunk), sizeof(chunk) - zs.avail_out);
        // Input exhausted without reaching the end of the stream
        if (rc == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
            rc = Z_DATA_ERROR;
            break;
        }
    }
    bool trailing = zs.avail_in != 0;
    inflateEnd(&zs);

    if (rc != Z_STREAM_END) {
        throw DecodeError("corrupt zlib stream (code " + std::to_string(rc) + ")");
    }
    if (trailing) {
        throw DecodeError("trailing bytes after zlib stream");
    }
    if (!is_valid_utf8(out)) {
        throw DecodeError("decoded payload is not valid UTF-8");
    }
    return out;
}

std::string format_bytes(uint64_t bytes) {
    char buf[32];
    if (bytes < 1024) {
        std::snprintf(buf, sizeof(buf), "%llu B", static_cast<unsigned long long>(bytes));
    } else if (bytes < 1024ULL * 1024) {
        std::snprintf(buf, sizeof(buf), "%.1f KB", static_cast<double>(bytes) / 1024.0);
    } else {
        std::snprintf(buf, sizeof(buf), "%.1f MB",
                      static_cast<double>(bytes) / (1024.0 * 1024.0));
    }
    return buf;
}

std::string describe(const CompressionStats& stats) {
    char ratio[32];
    std::snprintf(ratio, sizeof(ratio), "%.2fx", stats.ratio);
    return format_bytes(stats.original_size) + " -> " + format_bytes(stats.encoded_size) +
           " encoded (" + ratio + ", " + stats.algorithm + " level " +
           std::to_string(stats.level) + ")";
}

nlohmann::json compression_to_json(const CompressionStats& stats) {
    return {
        {"original_size_bytes", stats.original_size},
        {"compressed_size_bytes", stats.compressed_size},
        {"encoded_size_bytes", stats.encoded_size},
        {"compression_ratio", stats.ratio},
        {"compression_method", stats.algorithm},
        {"compression_level", stats.level}
    };
}

CompressionStats compression_from_json(const nlohmann::json& j) {
    CompressionStats stats;
    if (!j.is_object()) return stats;
    stats.original_size = j.value("original_size_bytes", uint64_t{0});
    stats.compressed_size = j.value("compressed_size_bytes", uint64_t{0});
    stats.encoded_size = j.value("encoded_size_bytes", uint64_t{0});
    stats.ratio = j.value("compression_ratio", 0.0);
    stats.algorithm = j.value("compression_method", std::string("zlib+base64"));
    stats.level = j.value("compression_level", kDefaultCompressionLevel);
    return stats;
}

} // namespace lyricache
