// ============================================================
// socket.cpp -- SockAddr / UdpSocket implementation
// ============================================================

#include "socket.hpp"
#include "logger.hpp"
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>
#include <algorithm>

// SO_SNDBUF for chunk bursts = 1 MB (128 chunks of ~1.4 KB fit many times over)
static constexpr int SOCKET_SNDBUF_SIZE = 1024 * 1024;
// Largest possible UDP payload
static constexpr size_t MAX_DATAGRAM = 65535;

// ---------------------------------------------------------------
// SockAddr
// ---------------------------------------------------------------

SockAddr::SockAddr(const sockaddr* sa, socklen_type len) {
    if (!sa || len <= 0 || (size_t)len > sizeof(storage_)) {
        throw std::runtime_error("SockAddr: invalid sockaddr length");
    }
    std::memcpy(&storage_, sa, (size_t)len);
    len_ = len;
}

SockAddr SockAddr::from_ip(const std::string& ip, u16 port) {
    sockaddr_in v4{};
    if (inet_pton(AF_INET, ip.c_str(), &v4.sin_addr) == 1) {
        v4.sin_family = AF_INET;
        v4.sin_port   = htons(port);
        return SockAddr(reinterpret_cast<const sockaddr*>(&v4), sizeof(v4));
    }
    sockaddr_in6 v6{};
    if (inet_pton(AF_INET6, ip.c_str(), &v6.sin6_addr) == 1) {
        v6.sin6_family = AF_INET6;
        v6.sin6_port   = htons(port);
        return SockAddr(reinterpret_cast<const sockaddr*>(&v6), sizeof(v6));
    }
    throw std::runtime_error("Invalid IP address: " + ip);
}

SockAddr SockAddr::resolve(const std::string& host, u16 port) {
    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_DGRAM;
    hints.ai_protocol = IPPROTO_UDP;

    addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (rc != 0 || !res) {
#ifdef _WIN32
        throw std::runtime_error("getaddrinfo(" + host + ") failed: " + socket_error_str(rc));
#else
        throw std::runtime_error("getaddrinfo(" + host + ") failed: " + gai_strerror(rc));
#endif
    }
    SockAddr addr(res->ai_addr, (socklen_type)res->ai_addrlen);
    freeaddrinfo(res);
    return addr;
}

u16 SockAddr::port() const {
    if (family() == AF_INET) {
        return ntohs(reinterpret_cast<const sockaddr_in*>(&storage_)->sin_port);
    }
    if (family() == AF_INET6) {
        return ntohs(reinterpret_cast<const sockaddr_in6*>(&storage_)->sin6_port);
    }
    return 0;
}

std::string SockAddr::to_string() const {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (family() == AF_INET) {
        auto* v4 = reinterpret_cast<const sockaddr_in*>(&storage_);
        if (inet_ntop(AF_INET, &v4->sin_addr, buf, sizeof(buf))) {
            return std::string(buf) + ":" + std::to_string(port());
        }
    } else if (family() == AF_INET6) {
        auto* v6 = reinterpret_cast<const sockaddr_in6*>(&storage_);
        if (inet_ntop(AF_INET6, &v6->sin6_addr, buf, sizeof(buf))) {
            return "[" + std::string(buf) + "]:" + std::to_string(port());
        }
    }
    return "unset";
}

bool SockAddr::operator==(const SockAddr& o) const {
    return len_ == o.len_ &&
           std::memcmp(&storage_, &o.storage_, (size_t)len_) == 0;
}

// ---------------------------------------------------------------
// UdpSocket
// ---------------------------------------------------------------

UdpSocket::UdpSocket(int family) {
    fd_ = ::socket(family, SOCK_DGRAM, IPPROTO_UDP);
    if (fd_ == INVALID_SOCKET_VAL) {
        throw std::runtime_error("socket() failed: " + socket_error_str(last_socket_error()));
    }
}

UdpSocket::~UdpSocket() {
    close();
}

UdpSocket::UdpSocket(UdpSocket&& o) noexcept : fd_(o.fd_) {
    o.fd_ = INVALID_SOCKET_VAL;
}

UdpSocket& UdpSocket::operator=(UdpSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        o.fd_ = INVALID_SOCKET_VAL;
    }
    return *this;
}

void UdpSocket::tune() {
    if (!platform::set_send_buffer(fd_, SOCKET_SNDBUF_SIZE)) {
        LOG_DEBUG("UdpSocket: SO_SNDBUF not raised: " + socket_error_str(last_socket_error()));
    }
}

void UdpSocket::bind(const std::string& ip, u16 port) {
    SockAddr addr = SockAddr::from_ip(ip.empty() ? "0.0.0.0" : ip, port);
    if (::bind(fd_, addr.raw(), addr.raw_len()) != 0) {
        throw std::runtime_error("bind() failed: " + socket_error_str(last_socket_error()));
    }
}

void UdpSocket::write_to(const void* buf, size_t len, const SockAddr& addr) {
    if (!addr.valid()) {
        throw std::runtime_error("sendto(): destination address not set");
    }
    for (;;) {
        long sent = platform::send_datagram(fd_, buf, len, addr.raw(), addr.raw_len());
        if (sent < 0) {
            int err = last_socket_error();
            if (interrupted(err)) continue;
            throw std::runtime_error("sendto() failed: " + socket_error_str(err));
        }
        if ((size_t)sent != len) {
            throw std::runtime_error("sendto() short datagram: " + std::to_string(sent) +
                                     " of " + std::to_string(len) + " bytes");
        }
        return;
    }
}

bool UdpSocket::recv_from(std::vector<u8>& buf, SockAddr* from) {
    buf.resize(MAX_DATAGRAM);
    sockaddr_storage peer{};
    socklen_type peer_len = sizeof(peer);
    for (;;) {
        long n = platform::recv_datagram(fd_, buf.data(), buf.size(),
                                         reinterpret_cast<sockaddr*>(&peer), &peer_len);
        if (n < 0) {
            int err = last_socket_error();
            if (interrupted(err)) continue;
            if (would_block(err)) {
                // Timeout (SO_RCVTIMEO)
                buf.clear();
                return false;
            }
            throw std::runtime_error("recvfrom() failed: " + socket_error_str(err));
        }
        buf.resize((size_t)n);
        if (from) *from = SockAddr(reinterpret_cast<sockaddr*>(&peer), peer_len);
        return true;
    }
}

void UdpSocket::close() {
    if (fd_ != INVALID_SOCKET_VAL) {
        CLOSE_SOCKET(fd_);
        fd_ = INVALID_SOCKET_VAL;
    }
}

SockAddr UdpSocket::local_addr() const {
    sockaddr_storage local{};
    socklen_type len = sizeof(local);
    if (getsockname(fd_, reinterpret_cast<sockaddr*>(&local), &len) != 0) {
        throw std::runtime_error("getsockname() failed: " + socket_error_str(last_socket_error()));
    }
    return SockAddr(reinterpret_cast<sockaddr*>(&local), len);
}

void UdpSocket::set_recv_timeout_ms(int ms) {
    if (!platform::set_recv_timeout(fd_, ms)) {
        throw std::runtime_error("setsockopt(SO_RCVTIMEO) failed: " +
                                 socket_error_str(last_socket_error()));
    }
}
