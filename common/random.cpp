// ============================================================
// random.cpp -- system_random_bytes implementation
// ============================================================

#include "random.hpp"
#include <fstream>
#include <stdexcept>
#include <string>
#include <cerrno>
#include <cstring>

#if defined(_WIN32)
#  include <bcrypt.h>
#  pragma comment(lib, "bcrypt.lib")
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
#  include <stdlib.h>
#elif defined(__linux__)
#  include <sys/random.h>
#endif

namespace rnd {

#if !defined(_WIN32)
static void read_urandom(u8* out, size_t len) {
    std::ifstream urandom("/dev/urandom", std::ios::in | std::ios::binary);
    if (!urandom) {
        throw std::runtime_error("open /dev/urandom failed: " + std::string(strerror(errno)));
    }
    urandom.read(reinterpret_cast<char*>(out), (std::streamsize)len);
    if (urandom.gcount() != (std::streamsize)len) {
        throw std::runtime_error("short read from /dev/urandom");
    }
}
#endif

void system_random_bytes(u8* out, size_t len) {
    if (len == 0) return;
#if defined(_WIN32)
    NTSTATUS status = BCryptGenRandom(nullptr, out, (ULONG)len,
                                      BCRYPT_USE_SYSTEM_PREFERRED_RNG);
    if (status < 0) {
        throw std::runtime_error("BCryptGenRandom failed: " + std::to_string((long)status));
    }
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
    arc4random_buf(out, len);
#elif defined(__linux__)
    size_t offset = 0;
    while (offset < len) {
        ssize_t n = ::getrandom(out + offset, len - offset, 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == ENOSYS) break; // pre-3.17 kernel
            throw std::runtime_error("getrandom failed: " + std::string(strerror(errno)));
        }
        offset += (size_t)n;
    }
    if (offset < len) {
        read_urandom(out + offset, len - offset);
    }
#else
    read_urandom(out, len);
#endif
}

} // namespace rnd
