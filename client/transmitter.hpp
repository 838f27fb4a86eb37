#pragma once

// ============================================================
// transmitter.hpp -- Sends framed chunks to the GELF endpoint
// ============================================================

#include "../common/platform.hpp"
#include "../common/socket.hpp"
#include <atomic>
#include <memory>
#include <utility>

class Transmitter {
public:
    Transmitter(std::shared_ptr<PacketConn> conn, const SockAddr& dest)
        : conn_(std::move(conn)), dest_(dest) {}

    Transmitter(const Transmitter&) = delete;
    Transmitter& operator=(const Transmitter&) = delete;

    // One datagram, no retry. Any transport failure is rethrown as
    // TransportError; the caller abandons the rest of the message.
    void send(const u8* packet, size_t len);

    const SockAddr& destination() const { return dest_; }

    u64 chunks_sent() const { return chunks_sent_.load(std::memory_order_relaxed); }
    u64 bytes_sent() const { return bytes_sent_.load(std::memory_order_relaxed); }

private:
    std::shared_ptr<PacketConn> conn_;
    const SockAddr              dest_;

    std::atomic<u64> chunks_sent_{0};
    std::atomic<u64> bytes_sent_{0};
};
