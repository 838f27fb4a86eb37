// ============================================================
// compress.cpp -- GzipWriter / gunzip implementation
// ============================================================

#include "compress.hpp"
#include "errors.hpp"
#include <climits>
#include <algorithm>
#include <string>

namespace gzip {

// windowBits + 16 selects the gzip wrapper
static constexpr int GZIP_WINDOW_BITS = MAX_WBITS + 16;
static constexpr int MEM_LEVEL = 8;

static std::string zlib_error(const char* op, int rc, const z_stream& zs) {
    std::string s = std::string(op) + " failed: rc=" + std::to_string(rc);
    if (zs.msg) s += std::string(" (") + zs.msg + ")";
    return s;
}

GzipWriter::GzipWriter(ByteBuffer& sink, int level)
    : sink_(&sink), level_(level)
{
    zs_ = z_stream{};
    int rc = deflateInit2(&zs_, level, Z_DEFLATED, GZIP_WINDOW_BITS,
                          MEM_LEVEL, Z_DEFAULT_STRATEGY);
    if (rc != Z_OK) {
        throw CompressionError(zlib_error("deflateInit2", rc, zs_));
    }
}

GzipWriter::~GzipWriter() {
    deflateEnd(&zs_);
}

size_t GzipWriter::write(const void* data, size_t len) {
    if (closed_) {
        throw CompressionError("gzip: write after close");
    }
    const u8* p = static_cast<const u8*>(data);
    size_t remaining = len;
    while (remaining > 0) {
        // avail_in is a uInt; feed oversized inputs in slices
        uInt step = (uInt)std::min(remaining, (size_t)UINT_MAX);
        zs_.next_in  = const_cast<Bytef*>(p);
        zs_.avail_in = step;
        pump(Z_NO_FLUSH);
        p += step;
        remaining -= step;
    }
    return len;
}

void GzipWriter::close() {
    if (closed_) return;
    zs_.next_in  = nullptr;
    zs_.avail_in = 0;
    pump(Z_FINISH);
    closed_ = true;
}

void GzipWriter::reset(ByteBuffer& sink) {
    int rc = deflateReset(&zs_);
    if (rc != Z_OK) {
        throw CompressionError(zlib_error("deflateReset", rc, zs_));
    }
    sink_   = &sink;
    closed_ = false;
}

void GzipWriter::pump(int flush) {
    for (;;) {
        u8* out = sink_->prepare(OUT_STEP);
        zs_.next_out  = out;
        zs_.avail_out = (uInt)OUT_STEP;

        int rc = deflate(&zs_, flush);
        sink_->commit(OUT_STEP - zs_.avail_out);

        // Z_BUF_ERROR only means "no progress possible"; not fatal
        if (rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR) {
            throw CompressionError(zlib_error("deflate", rc, zs_));
        }
        if (flush == Z_FINISH) {
            if (rc == Z_STREAM_END) return;
            continue;
        }
        if (zs_.avail_in == 0 && zs_.avail_out != 0) return;
    }
}

std::vector<u8> gunzip(const void* src, size_t src_len) {
    z_stream zs{};
    int rc = inflateInit2(&zs, GZIP_WINDOW_BITS);
    if (rc != Z_OK) {
        throw CompressionError(zlib_error("inflateInit2", rc, zs));
    }

    std::vector<u8> out;
    zs.next_in  = const_cast<Bytef*>(static_cast<const Bytef*>(src));
    zs.avail_in = (uInt)src_len;

    for (;;) {
        size_t old = out.size();
        out.resize(old + 16 * 1024);
        zs.next_out  = out.data() + old;
        zs.avail_out = (uInt)(out.size() - old);

        rc = inflate(&zs, Z_NO_FLUSH);
        out.resize(out.size() - zs.avail_out);

        if (rc == Z_STREAM_END) break;
        if (rc != Z_OK) {
            std::string msg = zlib_error("inflate", rc, zs);
            inflateEnd(&zs);
            throw CompressionError(msg);
        }
        if (zs.avail_in == 0 && zs.avail_out != 0) {
            inflateEnd(&zs);
            throw CompressionError("inflate: truncated gzip stream");
        }
    }
    inflateEnd(&zs);
    return out;
}

} // namespace gzip
