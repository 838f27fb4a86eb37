// ============================================================
// transmitter.cpp
// ============================================================

#include "transmitter.hpp"
#include "../common/errors.hpp"
#include <exception>
#include <string>

void Transmitter::send(const u8* packet, size_t len) {
    try {
        conn_->write_to(packet, len, dest_);
    } catch (const std::exception& e) {
        throw TransportError(std::string("writing to udp connection: ") + e.what());
    }
    chunks_sent_.fetch_add(1, std::memory_order_relaxed);
    bytes_sent_.fetch_add(len, std::memory_order_relaxed);
}
