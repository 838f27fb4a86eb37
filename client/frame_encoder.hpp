#pragma once

// ============================================================
// frame_encoder.hpp -- Compression and GELF chunk framing
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/byte_buffer.hpp"
#include "encoder_pool.hpp"
#include <vector>

namespace frame {

struct EncodeResult {
    size_t consumed;     // trimmed payload bytes fed to the compressor
    size_t compressed;   // gzip bytes waiting in the accumulator
    u32    chunk_count;  // datagrams needed, 1..GELF_MAX_CHUNK_COUNT
};

// ceil(compressed_len / GELF_MAX_CHUNK_SIZE)
inline u32 chunk_count(size_t compressed_len) {
    size_t count = compressed_len / GELF_MAX_CHUNK_SIZE;
    if (compressed_len % GELF_MAX_CHUNK_SIZE > 0) ++count;
    return count > 0xFFFFFFFFu ? 0xFFFFFFFFu : (u32)count;
}

// Trim white space off `p`, gzip it into res.buffer() and close the
// stream. Throws CompressionError, or SizeExceededError when the result
// needs more than GELF_MAX_CHUNK_COUNT chunks (nothing has been sent).
// `res` must be freshly reset.
EncodeResult encode(const void* p, size_t len, EncodingResource& res);

// Lazy chunk emitter over a compressed accumulator. Each next() drains up
// to GELF_MAX_CHUNK_SIZE bytes from the front of the buffer; a sequence
// cannot be rewound.
class ChunkSequence {
public:
    ChunkSequence(ByteBuffer& src, const MessageId& id, u32 count)
        : src_(&src), id_(id), count_(count) {}

    // Build the next datagram (header + slice) into `packet`. Returns false
    // once all `count` chunks have been produced.
    bool next(std::vector<u8>& packet);

    u32 count() const { return count_; }
    bool done() const { return index_ >= count_; }

private:
    ByteBuffer* src_;
    MessageId   id_;
    u32         count_;
    u32         index_ = 0;
};

inline ChunkSequence chunks(EncodingResource& res, const MessageId& id, u32 count) {
    return ChunkSequence(res.buffer(), id, count);
}

} // namespace frame
