#pragma once

// ============================================================
// compress.hpp -- zlib gzip stream wrapper
// ============================================================

#include "platform.hpp"
#include "byte_buffer.hpp"
#include <vector>

#include <zlib.h>

namespace gzip {

// Accepted effort levels (same numbering as zlib / Go's compress/gzip)
static constexpr int NO_COMPRESSION      = Z_NO_COMPRESSION;       //  0
static constexpr int BEST_SPEED          = Z_BEST_SPEED;           //  1
static constexpr int BEST_COMPRESSION    = Z_BEST_COMPRESSION;     //  9
static constexpr int DEFAULT_COMPRESSION = Z_DEFAULT_COMPRESSION;  // -1

inline bool valid_level(int level) {
    return level == NO_COMPRESSION ||
           level == DEFAULT_COMPRESSION ||
           (level >= BEST_SPEED && level <= BEST_COMPRESSION);
}

// Streaming gzip compressor appending to a ByteBuffer.
//
//   GzipWriter zw(buf, level);
//   zw.write(p, n);
//   zw.close();        // gzip trailer is now in buf
//   buf.clear();
//   zw.reset(buf);     // ready for the next member
//
// Throws CompressionError on any zlib failure.
class GzipWriter {
public:
    GzipWriter(ByteBuffer& sink, int level);
    ~GzipWriter();

    GzipWriter(const GzipWriter&) = delete;
    GzipWriter& operator=(const GzipWriter&) = delete;

    // Feed input. Returns the number of bytes consumed (always len).
    size_t write(const void* data, size_t len);

    // Flush and write the gzip trailer. Further writes fail until reset().
    void close();

    // Discard stream state and start a new gzip member into `sink`.
    void reset(ByteBuffer& sink);

    int level() const { return level_; }
    bool closed() const { return closed_; }

private:
    // Output space requested from the sink per deflate() round
    static constexpr size_t OUT_STEP = 16 * 1024;

    void pump(int flush);

    z_stream    zs_;
    ByteBuffer* sink_;
    int         level_;
    bool        closed_ = false;
};

// Decompress a complete gzip member. Throws CompressionError on corrupt input.
std::vector<u8> gunzip(const void* src, size_t src_len);

} // namespace gzip
