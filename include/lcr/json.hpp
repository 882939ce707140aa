#pragma once

#include <string>
#include <string_view>


namespace lcr {
namespace json {

// Appends `s` to `out` as the body of a JSON string literal (no quotes).
// Escapes quotes, backslashes and control characters; UTF-8 passes through.
inline void append_escaped(std::string& out, std::string_view s) {
    static constexpr char hex[] = "0123456789abcdef";
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out += hex[(c >> 4) & 0x0F];
                    out += hex[c & 0x0F];
                } else {
                    out += c;
                }
        }
    }
}

// Appends `"key":"value"` (value escaped)
inline void append_string_field(std::string& out, std::string_view key, std::string_view value) {
    out += '"';
    out += key;
    out += "\":\"";
    append_escaped(out, value);
    out += '"';
}

} // namespace json
} // namespace lcr
