#pragma once

// ============================================================
// gelf_client.hpp -- GELF chunked-UDP log writer
//
// Each write() takes one newline-terminated line, gzips the
// white-space-trimmed text and sends it as 1..128 GELF chunks to the
// configured endpoint. All work happens on the calling thread; any
// number of threads may call write() on one client.
//
//   ClientConfig cfg;
//   cfg.server_addr = SockAddr::resolve("graylog.local", 12201);
//   cfg.conn        = std::make_shared<UdpSocket>(cfg.server_addr.family());
//   GelfClient gelf(cfg);
//   gelf.write("{\"short_message\":\"hello\"}\n");
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/socket.hpp"
#include "../common/random.hpp"
#include "../common/writer.hpp"
#include "../common/compress.hpp"
#include "message_id.hpp"
#include "encoder_pool.hpp"
#include "transmitter.hpp"
#include <atomic>
#include <memory>

struct ClientConfig {
    SockAddr                    server_addr;                          // required
    std::shared_ptr<PacketConn> conn;                                 // required
    int                         compression_level = gzip::DEFAULT_COMPRESSION;
    PoolStrategy                strategy = PoolStrategy::POOLED;
    rnd::RandomSource           random;   // empty = rnd::system_random_bytes
};

class GelfClient : public Writer {
public:
    // Throws ConfigError: no transport, no destination, compression level
    // outside {-1, 0, 1..9}, or the random source failed.
    explicit GelfClient(const ClientConfig& cfg);

    GelfClient(const GelfClient&) = delete;
    GelfClient& operator=(const GelfClient&) = delete;

    using Writer::write;

    // Returns the number of trimmed payload bytes compressed.
    //   len == 0              -> 0, nothing sent
    //   no trailing '\n'      -> MissingNewlineError, nothing sent
    //   > 128 chunks          -> SizeExceededError, nothing sent
    //   zlib failure          -> CompressionError, nothing sent
    //   send failure          -> TransportError, earlier chunks already sent
    size_t write(const void* data, size_t len) override;

    const InstanceTag& instance_tag() const { return ids_.instance_tag(); }
    const SockAddr& destination() const { return tx_.destination(); }
    int compression_level() const { return level_; }
    PoolStrategy strategy() const { return strategy_; }

    u64 messages_sent() const { return messages_sent_.load(std::memory_order_relaxed); }
    u64 chunks_sent() const { return tx_.chunks_sent(); }
    u64 bytes_sent() const { return tx_.bytes_sent(); }

    const ResourcePool& pool() const { return *pool_; }

private:
    static const ClientConfig& validate(const ClientConfig& cfg);
    static InstanceTag draw_instance_tag(const rnd::RandomSource& random);

    const int                     level_;
    const PoolStrategy            strategy_;
    Transmitter                   tx_;
    MessageIdCounter              ids_;
    std::unique_ptr<ResourcePool> pool_;
    std::atomic<u64>              messages_sent_{0};
};
