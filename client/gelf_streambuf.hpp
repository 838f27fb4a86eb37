#pragma once

// ============================================================
// gelf_streambuf.hpp -- std::streambuf that emits one Writer call
//   per complete line
//
//   GelfStreamBuf sb(gelf_client);
//   std::ostream log(&sb);
//   log << "{\"short_message\":\"disk full\"}" << std::endl;
//
// A failed write puts the stream in badbit; the exception is kept in
// last_error(). Text after the last '\n' stays buffered until close(),
// which terminates it with a newline.
// ============================================================

#include "../common/platform.hpp"
#include "../common/writer.hpp"
#include "../common/logger.hpp"
#include <streambuf>
#include <string>
#include <exception>

class GelfStreamBuf : public std::streambuf {
public:
    explicit GelfStreamBuf(Writer& target) : target_(target) {}

    ~GelfStreamBuf() override {
        if (line_.empty()) return;
        try {
            close();
        } catch (const std::exception& e) {
            LOG_WARN(std::string("GelfStreamBuf: unsent tail dropped: ") + e.what());
        }
    }

    GelfStreamBuf(const GelfStreamBuf&) = delete;
    GelfStreamBuf& operator=(const GelfStreamBuf&) = delete;

    // Send a pending partial line (newline appended). Throws on failure.
    void close() {
        if (line_.empty()) return;
        line_ += '\n';
        std::string out;
        out.swap(line_);
        target_.write(out);
    }

    std::exception_ptr last_error() const { return last_error_; }

    // Bytes waiting for their newline
    size_t pending() const { return line_.size(); }

protected:
    int_type overflow(int_type ch) override {
        if (traits_type::eq_int_type(ch, traits_type::eof())) {
            return traits_type::not_eof(ch);
        }
        char c = traits_type::to_char_type(ch);
        line_ += c;
        if (c == '\n' && !emit_line()) return traits_type::eof();
        return ch;
    }

    std::streamsize xsputn(const char* s, std::streamsize n) override {
        std::streamsize done = 0;
        while (done < n) {
            const char* start = s + done;
            const void* nl = std::char_traits<char>::find(start, (size_t)(n - done), '\n');
            if (!nl) {
                line_.append(start, (size_t)(n - done));
                return n;
            }
            size_t k = (size_t)(static_cast<const char*>(nl) - start) + 1;
            line_.append(start, k);
            done += (std::streamsize)k;
            if (!emit_line()) return done - (std::streamsize)k;
        }
        return done;
    }

private:
    bool emit_line() {
        try {
            target_.write(line_);
            line_.clear();
            return true;
        } catch (...) {
            last_error_ = std::current_exception();
            line_.clear();
            return false;
        }
    }

    Writer&            target_;
    std::string        line_;
    std::exception_ptr last_error_;
};
