#pragma once

// ============================================================
// writer.hpp -- Byte-stream sink interface
//
// Anything that accepts whole lines of bytes. GelfClient implements
// it, so a client can stand in for any other sink (Logger backend,
// WriterPool target, GelfStreamBuf target).
//
// write() returns the number of bytes it consumed and throws on
// failure.
// ============================================================

#include "platform.hpp"
#include <string_view>

class Writer {
public:
    virtual ~Writer() = default;

    virtual size_t write(const void* data, size_t len) = 0;

    size_t write(std::string_view s) {
        return write(s.data(), s.size());
    }
};
