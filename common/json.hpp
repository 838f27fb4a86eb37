#pragma once

// ============================================================
// json.hpp -- Minimal JSON text builders for GELF records
// ============================================================

#include "platform.hpp"
#include <string>
#include <string_view>

namespace json {

// Append `s` as a JSON string body (no surrounding quotes).
// UTF-8 passes through; control characters become \uXXXX.
inline void append_escaped(std::string& out, std::string_view s) {
    static const char hex[] = "0123456789abcdef";
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            default:
                if ((u8)c < 0x20) {
                    out += "\\u00";
                    out += hex[(u8)c >> 4];
                    out += hex[(u8)c & 0x0F];
                } else {
                    out += c;
                }
        }
    }
}

inline std::string escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 8);
    append_escaped(out, s);
    return out;
}

// "key":"value",
inline void field(std::string& out, const char* key, std::string_view value) {
    out += '"';
    out += key;
    out += "\":\"";
    append_escaped(out, value);
    out += "\",";
}

// "key":<raw>,  (numbers, pre-formatted)
inline void raw_field(std::string& out, const char* key, const std::string& raw) {
    out += '"';
    out += key;
    out += "\":";
    out += raw;
    out += ',';
}

} // namespace json
