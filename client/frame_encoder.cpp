// ============================================================
// frame_encoder.cpp
// ============================================================

#include "frame_encoder.hpp"
#include "../common/protocol_io.hpp"
#include "../common/errors.hpp"
#include "../common/utils.hpp"
#include <string_view>

namespace frame {

EncodeResult encode(const void* p, size_t len, EncodingResource& res) {
    std::string_view line = utils::trim_space(
        std::string_view(static_cast<const char*>(p), len));

    EncodeResult r{};
    r.consumed = res.zip().write(line.data(), line.size());
    // Close even on an empty line: the gzip trailer must be in the buffer
    res.zip().close();

    r.compressed  = res.buffer().size();
    r.chunk_count = chunk_count(r.compressed);
    if (r.chunk_count > GELF_MAX_CHUNK_COUNT) {
        throw SizeExceededError(r.compressed, GELF_MAX_MESSAGE_SIZE);
    }
    return r;
}

bool ChunkSequence::next(std::vector<u8>& packet) {
    if (index_ >= count_) return false;

    packet.resize(GELF_CHUNK_HEADER_SIZE + GELF_MAX_CHUNK_SIZE);
    proto::encode_chunk_header(id_, (u8)index_, (u8)count_, packet.data());
    size_t n = src_->read(packet.data() + GELF_CHUNK_HEADER_SIZE, GELF_MAX_CHUNK_SIZE);
    packet.resize(GELF_CHUNK_HEADER_SIZE + n);

    ++index_;
    return true;
}

} // namespace frame
