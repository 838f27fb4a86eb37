#pragma once

// ============================================================
// byte_buffer.hpp -- Growable byte accumulator with a read cursor
//
// The compressor appends at the tail, the chunker drains from the
// front. Drained bytes cannot be read again; clear() rewinds both
// ends but keeps the allocation, so a reused buffer stops touching
// the heap once it has grown to its working size.
//
// Thread safety: NOT thread-safe; one owner at a time.
// ============================================================

#include "platform.hpp"
#include <vector>
#include <cstring>
#include <algorithm>

class ByteBuffer {
public:
    static constexpr size_t DEFAULT_CAPACITY = 4096;

    explicit ByteBuffer(size_t capacity = DEFAULT_CAPACITY) {
        buf_.reserve(capacity);
    }

    ByteBuffer(const ByteBuffer&) = delete;
    ByteBuffer& operator=(const ByteBuffer&) = delete;

    // Unread bytes
    size_t size() const { return buf_.size() - rpos_; }
    bool empty() const { return size() == 0; }
    size_t capacity() const { return buf_.capacity(); }

    const u8* data() const { return buf_.data() + rpos_; }

    void append(const void* data, size_t len) {
        if (len == 0) return;
        const u8* p = static_cast<const u8*>(data);
        buf_.insert(buf_.end(), p, p + len);
    }

    // Expose `len` writable bytes at the tail. Follow with commit(n)
    // where n <= len; the rest is dropped again.
    u8* prepare(size_t len) {
        wpos_ = buf_.size();
        buf_.resize(wpos_ + len);
        return buf_.data() + wpos_;
    }

    void commit(size_t n) {
        buf_.resize(wpos_ + std::min(n, buf_.size() - wpos_));
    }

    // Copy up to `len` bytes from the front into `out` and consume them.
    size_t read(void* out, size_t len) {
        size_t n = std::min(len, size());
        if (n > 0) {
            std::memcpy(out, buf_.data() + rpos_, n);
            rpos_ += n;
        }
        return n;
    }

    void clear() {
        buf_.clear();
        rpos_ = 0;
        wpos_ = 0;
    }

private:
    std::vector<u8> buf_;
    size_t          rpos_ = 0;
    size_t          wpos_ = 0;
};
