#pragma once

// ============================================================
// errors.hpp -- Exception types raised by the GELF client
// ============================================================

#include <cstddef>
#include <stdexcept>
#include <string>

enum class ErrorKind {
    CONFIG,            // bad ClientConfig, random source failure
    MISSING_NEWLINE,   // write() payload not terminated by '\n'
    SIZE_EXCEEDED,     // compressed payload needs > GELF_MAX_CHUNK_COUNT chunks
    COMPRESSION,       // zlib reported an unexpected error
    TRANSPORT,         // PacketConn::write_to failed
};

inline const char* error_kind_str(ErrorKind k) {
    switch (k) {
        case ErrorKind::CONFIG:          return "config";
        case ErrorKind::MISSING_NEWLINE: return "missing_newline";
        case ErrorKind::SIZE_EXCEEDED:   return "size_exceeded";
        case ErrorKind::COMPRESSION:     return "compression";
        case ErrorKind::TRANSPORT:       return "transport";
    }
    return "unknown";
}

class GelfError : public std::runtime_error {
public:
    GelfError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Fatal, constructor only.
class ConfigError : public GelfError {
public:
    explicit ConfigError(const std::string& what)
        : GelfError(ErrorKind::CONFIG, what) {}
};

class MissingNewlineError : public GelfError {
public:
    MissingNewlineError()
        : GelfError(ErrorKind::MISSING_NEWLINE, "missing newline terminating write") {}
};

class SizeExceededError : public GelfError {
public:
    SizeExceededError(size_t length, size_t limit)
        : GelfError(ErrorKind::SIZE_EXCEEDED,
                    "message exceeds maximum size, " + std::to_string(length) +
                    " > " + std::to_string(limit))
        , length_(length), limit_(limit) {}

    size_t length() const { return length_; }
    size_t limit() const { return limit_; }

private:
    size_t length_;
    size_t limit_;
};

class CompressionError : public GelfError {
public:
    explicit CompressionError(const std::string& what)
        : GelfError(ErrorKind::COMPRESSION, what) {}
};

// Chunks sent before the failing one are already on the wire.
class TransportError : public GelfError {
public:
    explicit TransportError(const std::string& what)
        : GelfError(ErrorKind::TRANSPORT, what) {}
};
