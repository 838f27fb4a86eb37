#pragma once

// ============================================================
// protocol_io.hpp -- Chunk header and message id byte layout
// ============================================================

#include "protocol.hpp"
#include <cstring>

namespace proto {

// ---- Byte-order helpers ----

inline void put_le32(u32 v, u8 out[4]) {
    out[0] = (u8)(v      );
    out[1] = (u8)(v >>  8);
    out[2] = (u8)(v >> 16);
    out[3] = (u8)(v >> 24);
}

inline u32 get_le32(const u8 in[4]) {
    return  (u32)in[0]        |
           ((u32)in[1] <<  8) |
           ((u32)in[2] << 16) |
           ((u32)in[3] << 24);
}

// ---- Message id ----

inline MessageId make_message_id(const InstanceTag& tag, u32 counter) {
    MessageId id;
    std::memcpy(id.data(), tag.data(), GELF_INSTANCE_TAG_SIZE);
    put_le32(counter, id.data() + GELF_INSTANCE_TAG_SIZE);
    return id;
}

inline u32 message_counter(const MessageId& id) {
    return get_le32(id.data() + GELF_INSTANCE_TAG_SIZE);
}

// ---- Serialise / deserialise ChunkHeader ----

inline void encode_chunk_header(const MessageId& id, u8 seq_index, u8 seq_count,
                                u8 buf[GELF_CHUNK_HEADER_SIZE]) {
    buf[0] = GELF_MAGIC_A;
    buf[1] = GELF_MAGIC_B;
    std::memcpy(buf + 2, id.data(), GELF_MESSAGE_ID_SIZE);
    buf[10] = seq_index;
    buf[11] = seq_count;
}

// Returns false when the datagram is too short or the magic does not match.
inline bool decode_chunk_header(const u8* buf, size_t len, ChunkHeader& h) {
    if (len < GELF_CHUNK_HEADER_SIZE) return false;
    if (buf[0] != GELF_MAGIC_A || buf[1] != GELF_MAGIC_B) return false;
    std::memcpy(&h, buf, GELF_CHUNK_HEADER_SIZE);
    return true;
}

inline MessageId chunk_message_id(const ChunkHeader& h) {
    MessageId id;
    std::memcpy(id.data(), h.message_id, GELF_MESSAGE_ID_SIZE);
    return id;
}

} // namespace proto
