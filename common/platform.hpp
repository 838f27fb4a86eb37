#pragma once

// ============================================================
// platform.hpp -- OS layer for datagram sockets
//
// Everything that differs between Winsock and BSD sockets lives
// here: handle type, error codes, and the few calls whose
// signatures disagree (sendto/recvfrom/setsockopt).
// ============================================================

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

// ---- Portable types ----
using u8  = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#  ifndef _WIN32_WINNT
#    define _WIN32_WINNT 0x0601
#  endif
#  include <winsock2.h>
#  include <ws2tcpip.h>
#  include <windows.h>
#  pragma comment(lib, "ws2_32.lib")

   using socket_t     = SOCKET;
   using socklen_type = int;
#  define INVALID_SOCKET_VAL INVALID_SOCKET
#  define CLOSE_SOCKET(s)    closesocket(s)

#else // POSIX
#  include <sys/types.h>
#  include <sys/socket.h>
#  include <sys/time.h>
#  include <netinet/in.h>
#  include <arpa/inet.h>
#  include <netdb.h>
#  include <unistd.h>
#  include <errno.h>
#  include <cstring>

   using socket_t     = int;
   using socklen_type = socklen_t;
#  define INVALID_SOCKET_VAL (-1)
#  define CLOSE_SOCKET(s)    ::close(s)
#endif

// ---- Error codes ----

inline int last_socket_error() {
#ifdef _WIN32
    return WSAGetLastError();
#else
    return errno;
#endif
}

inline bool interrupted(int err) {
#ifdef _WIN32
    return err == WSAEINTR;
#else
    return err == EINTR;
#endif
}

// True for "nothing yet": non-blocking EAGAIN or an SO_RCVTIMEO expiry
inline bool would_block(int err) {
#ifdef _WIN32
    return err == WSAEWOULDBLOCK || err == WSAETIMEDOUT;
#else
    return err == EAGAIN || err == EWOULDBLOCK;
#endif
}

inline std::string socket_error_str(int err) {
#ifdef _WIN32
    char buf[256] = {0};
    FormatMessageA(FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
                   nullptr, err, 0, buf, sizeof(buf), nullptr);
    std::string s = buf;
    while (!s.empty() && (s.back() == '\r' || s.back() == '\n')) s.pop_back();
    return s + " (err=" + std::to_string(err) + ")";
#else
    return std::string(strerror(err)) + " (errno=" + std::to_string(err) + ")";
#endif
}

namespace platform {

// ---- Datagram I/O; both return -1 on error (see last_socket_error) ----

inline long send_datagram(socket_t fd, const void* buf, size_t len,
                          const sockaddr* to, socklen_type to_len) {
#ifdef _WIN32
    return ::sendto(fd, static_cast<const char*>(buf), (int)len, 0, to, to_len);
#else
    // No SIGPIPE on a connected-then-reset socket
    return (long)::sendto(fd, buf, len, MSG_NOSIGNAL, to, to_len);
#endif
}

inline long recv_datagram(socket_t fd, void* buf, size_t len,
                          sockaddr* from, socklen_type* from_len) {
#ifdef _WIN32
    return ::recvfrom(fd, static_cast<char*>(buf), (int)len, 0, from, from_len);
#else
    return (long)::recvfrom(fd, buf, len, 0, from, from_len);
#endif
}

// ---- Socket options; false when the kernel refused ----

inline bool set_send_buffer(socket_t fd, int bytes) {
    return setsockopt(fd, SOL_SOCKET, SO_SNDBUF,
                      reinterpret_cast<const char*>(&bytes), sizeof(bytes)) == 0;
}

inline bool set_recv_timeout(socket_t fd, int ms) {
#ifdef _WIN32
    DWORD timeout = (DWORD)ms;
    return setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO,
                      reinterpret_cast<const char*>(&timeout), sizeof(timeout)) == 0;
#else
    struct timeval tv;
    tv.tv_sec  = ms / 1000;
    tv.tv_usec = (ms % 1000) * 1000;
    return setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
#endif
}

// ---- Process-wide init ----

// RAII Winsock startup for main() and tests; a no-op on POSIX
struct Guard {
    Guard() {
#ifdef _WIN32
        WSADATA wsa;
        int rc = WSAStartup(MAKEWORD(2, 2), &wsa);
        if (rc != 0) {
            throw std::runtime_error("WSAStartup failed: " + std::to_string(rc));
        }
#endif
    }
    ~Guard() {
#ifdef _WIN32
        WSACleanup();
#endif
    }
    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;
};

} // namespace platform
