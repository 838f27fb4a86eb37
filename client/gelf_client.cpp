// ============================================================
// gelf_client.cpp
// ============================================================

#include "gelf_client.hpp"
#include "frame_encoder.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <exception>
#include <string>
#include <vector>

GelfClient::GelfClient(const ClientConfig& cfg)
    : level_(validate(cfg).compression_level)
    , strategy_(cfg.strategy)
    , tx_(cfg.conn, cfg.server_addr)
    , ids_(draw_instance_tag(cfg.random))
    , pool_(make_resource_pool(cfg.strategy, cfg.compression_level))
{
    LOG_DEBUG("GelfClient: dest=" + tx_.destination().to_string() +
              " level=" + std::to_string(level_) +
              " strategy=" + pool_strategy_str(strategy_) +
              " instance=" + utils::to_hex(instance_tag().data(), instance_tag().size()));
}

const ClientConfig& GelfClient::validate(const ClientConfig& cfg) {
    if (!cfg.conn) {
        throw ConfigError("cannot create new Client without a connection");
    }
    if (!cfg.server_addr.valid()) {
        throw ConfigError("cannot create new Client without a server address");
    }
    if (!gzip::valid_level(cfg.compression_level)) {
        throw ConfigError("compression level of " + std::to_string(cfg.compression_level) +
                          " is not a valid compression level");
    }
    return cfg;
}

InstanceTag GelfClient::draw_instance_tag(const rnd::RandomSource& random) {
    InstanceTag tag{};
    try {
        if (random) {
            random(tag.data(), tag.size());
        } else {
            rnd::system_random_bytes(tag.data(), tag.size());
        }
    } catch (const std::exception& e) {
        throw ConfigError(std::string("creating unique ID for logging client: ") + e.what());
    }
    return tag;
}

size_t GelfClient::write(const void* data, size_t len) {
    if (len == 0) return 0;
    if (!utils::ends_with_newline(data, len)) {
        throw MissingNewlineError();
    }

    // Released (reset + returned) on every exit path
    ResourcePool::Lease lease = pool_->acquire();
    EncodingResource& res = lease.resource();

    frame::EncodeResult enc = frame::encode(data, len, res);

    // Id is minted only once the message is known to fit
    MessageId id = ids_.next_id();

    frame::ChunkSequence seq = frame::chunks(res, id, enc.chunk_count);
    std::vector<u8>& packet = res.packet();
    while (seq.next(packet)) {
        tx_.send(packet.data(), packet.size());
    }

    messages_sent_.fetch_add(1, std::memory_order_relaxed);
    return enc.consumed;
}
