#pragma once

// ============================================================
// socket.hpp -- Datagram addressing, transport interface and
//   RAII UDP socket wrapper
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>

// ---- Address value type (IPv4 or IPv6 + port) ----
class SockAddr {
public:
    SockAddr() = default;
    SockAddr(const sockaddr* sa, socklen_type len);

    // Numeric address only ("127.0.0.1", "::1"); throws on parse failure
    static SockAddr from_ip(const std::string& ip, u16 port);

    // Numeric address or host name (getaddrinfo, first UDP result); throws
    static SockAddr resolve(const std::string& host, u16 port);

    bool valid() const { return len_ > 0; }
    int family() const { return valid() ? storage_.ss_family : AF_UNSPEC; }
    u16 port() const;

    const sockaddr* raw() const { return reinterpret_cast<const sockaddr*>(&storage_); }
    socklen_type raw_len() const { return len_; }

    // "ip:port", "[ip6]:port", or "unset"
    std::string to_string() const;

    bool operator==(const SockAddr& o) const;
    bool operator!=(const SockAddr& o) const { return !(*this == o); }

private:
    sockaddr_storage storage_{};
    socklen_type     len_ = 0;
};

// ---- Packet-oriented transport ----
// Implementations must tolerate concurrent write_to() calls and throw
// on failure.
class PacketConn {
public:
    virtual ~PacketConn() = default;

    // Send one datagram to `addr`.
    virtual void write_to(const void* buf, size_t len, const SockAddr& addr) = 0;
};

class UdpSocket : public PacketConn {
public:
    // family: AF_INET or AF_INET6
    explicit UdpSocket(int family = AF_INET);
    ~UdpSocket() override;

    // Non-copyable
    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    // Movable
    UdpSocket(UdpSocket&& o) noexcept;
    UdpSocket& operator=(UdpSocket&& o) noexcept;

    // Bind to a local address; port 0 picks an ephemeral port
    void bind(const std::string& ip, u16 port);

    // One sendto() per call; a short send is an error for datagrams
    void write_to(const void* buf, size_t len, const SockAddr& addr) override;

    // Receive one datagram into buf (resized to the datagram length).
    // Returns false on timeout (see set_recv_timeout_ms).
    bool recv_from(std::vector<u8>& buf, SockAddr* from = nullptr);

    // Enlarge SO_SNDBUF for bursts of chunks
    void tune();

    bool is_valid() const { return fd_ != INVALID_SOCKET_VAL; }
    socket_t native() const { return fd_; }

    void close();

    SockAddr local_addr() const;

    // Set receive timeout in milliseconds (0 = infinite)
    void set_recv_timeout_ms(int ms);

private:
    socket_t fd_{INVALID_SOCKET_VAL};
};
