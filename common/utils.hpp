#pragma once

// ============================================================
// utils.hpp -- Utility functions
// ============================================================

#include "platform.hpp"
#include <string>
#include <string_view>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <sstream>
#include <iomanip>

namespace utils {

// Current time in milliseconds (monotonic)
inline u64 now_ms() {
    using namespace std::chrono;
    return (u64)duration_cast<milliseconds>(
        steady_clock::now().time_since_epoch()
    ).count();
}

// Format bytes as human-readable (e.g., "1.23 MB")
inline std::string format_bytes(u64 bytes) {
    if (bytes < 1024ULL) {
        return std::to_string(bytes) + " B";
    }
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);
    if (bytes < 1024ULL * 1024) {
        ss << (double)bytes / 1024.0 << " KB";
    } else if (bytes < 1024ULL * 1024 * 1024) {
        ss << (double)bytes / (1024.0 * 1024) << " MB";
    } else {
        ss << (double)bytes / (1024.0 * 1024 * 1024) << " GB";
    }
    return ss.str();
}

// Lower-case hex dump, e.g. "1e0f"
inline std::string to_hex(const u8* p, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string s;
    s.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        s += digits[p[i] >> 4];
        s += digits[p[i] & 0x0F];
    }
    return s;
}

// Validate port number (1-65535)
inline bool validate_port(int port) {
    return port >= 1 && port <= 65535;
}

// Host name or numeric address: non-empty, no spaces or null bytes
inline bool validate_host(const std::string& host) {
    if (host.empty() || host.size() > 253) return false;
    for (char c : host) {
        if (c == '\0' || c == ' ' || c == '\t') return false;
    }
    return true;
}

// Parse a whole base-10 int; false on trailing garbage or overflow
inline bool parse_int(const char* s, int& out) {
    if (!s || !*s) return false;
    char* end = nullptr;
    long v = std::strtol(s, &end, 10);
    if (*end != '\0' || v < INT32_MIN || v > INT32_MAX) return false;
    out = (int)v;
    return true;
}

// ---- Unicode white space trimming (UTF-8) ----

// Byte length of the UTF-8 encoded white-space code point starting at p,
// or 0 when p does not start with one. Covers every code point with the
// Unicode White_Space property: \t \n \v \f \r, space, U+0085, U+00A0,
// U+1680, U+2000..U+200A, U+2028, U+2029, U+202F, U+205F, U+3000.
inline size_t space_rune_len(const u8* p, size_t n) {
    if (n >= 1) {
        switch (p[0]) {
            case '\t': case '\n': case '\v': case '\f': case '\r': case ' ':
                return 1;
            default:
                break;
        }
    }
    if (n >= 2 && p[0] == 0xC2 && (p[1] == 0x85 || p[1] == 0xA0)) return 2;
    if (n >= 3) {
        if (p[0] == 0xE1 && p[1] == 0x9A && p[2] == 0x80) return 3;
        if (p[0] == 0xE2 && p[1] == 0x80 &&
            ((p[2] >= 0x80 && p[2] <= 0x8A) ||
             p[2] == 0xA8 || p[2] == 0xA9 || p[2] == 0xAF)) return 3;
        if (p[0] == 0xE2 && p[1] == 0x81 && p[2] == 0x9F) return 3;
        if (p[0] == 0xE3 && p[1] == 0x80 && p[2] == 0x80) return 3;
    }
    return 0;
}

// Length of a white-space code point ending exactly at p + n, or 0.
// A match is always the complete last code point: every candidate
// starts on a lead byte and the bytes after it are continuation bytes.
inline size_t space_rune_len_back(const u8* p, size_t n) {
    if (n >= 1 && space_rune_len(p + n - 1, 1) == 1) return 1;
    if (n >= 2 && space_rune_len(p + n - 2, 2) == 2) return 2;
    if (n >= 3 && space_rune_len(p + n - 3, 3) == 3) return 3;
    return 0;
}

// Strip leading and trailing Unicode white space. Invalid UTF-8 is kept.
inline std::string_view trim_space(std::string_view s) {
    const u8* p = reinterpret_cast<const u8*>(s.data());
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end) {
        size_t k = space_rune_len(p + begin, end - begin);
        if (k == 0) break;
        begin += k;
    }
    while (end > begin) {
        size_t k = space_rune_len_back(p + begin, end - begin);
        if (k == 0) break;
        end -= k;
    }
    return s.substr(begin, end - begin);
}

inline bool ends_with_newline(const void* data, size_t len) {
    return len > 0 && static_cast<const u8*>(data)[len - 1] == '\n';
}

} // namespace utils
