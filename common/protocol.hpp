#pragma once

// protocol.hpp -- GELF chunked-UDP wire definitions

#include "platform.hpp"
#include <array>

// Chunk magic: every datagram of a chunked message starts with 0x1e 0x0f
static constexpr u8 GELF_MAGIC_A = 0x1e;
static constexpr u8 GELF_MAGIC_B = 0x0f;

// Datagram budget. 1420 bytes of payload per chunk keeps
// header + payload + IP/UDP overhead under a 1500 byte MTU.
static constexpr size_t GELF_MTU_SIZE        = 1500;
static constexpr size_t GELF_MAX_CHUNK_SIZE  = 1420;
// The sequence fields are single bytes; Graylog drops messages with more than 128 chunks.
static constexpr u32    GELF_MAX_CHUNK_COUNT = 128;
static constexpr size_t GELF_MAX_MESSAGE_SIZE = GELF_MAX_CHUNK_COUNT * GELF_MAX_CHUNK_SIZE;

static constexpr size_t GELF_INSTANCE_TAG_SIZE = 4;
static constexpr size_t GELF_MESSAGE_ID_SIZE   = 8;

// instance tag (4) || little-endian message counter (4)
using InstanceTag = std::array<u8, GELF_INSTANCE_TAG_SIZE>;
using MessageId   = std::array<u8, GELF_MESSAGE_ID_SIZE>;

// ============================================================
// Chunk header (12 bytes on wire)
// ============================================================
#pragma pack(push, 1)

struct ChunkHeader {
    u8 magic[2];
    u8 message_id[GELF_MESSAGE_ID_SIZE];
    u8 seq_index;
    u8 seq_count;
};
static_assert(sizeof(ChunkHeader) == 12, "ChunkHeader must be 12 bytes");

#pragma pack(pop)

static constexpr size_t GELF_CHUNK_HEADER_SIZE = sizeof(ChunkHeader);
static_assert(GELF_CHUNK_HEADER_SIZE + GELF_MAX_CHUNK_SIZE <= GELF_MTU_SIZE,
              "chunk does not fit the MTU");
