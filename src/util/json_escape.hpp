// src/util/json_escape.hpp
#pragma once
#include <fmt/format.h>
#include <cmath>
#include <optional>
#include <string>
#include <string_view>

namespace bprof {

// Quoted JSON string literal.
// Escapes: backslash, quote, control chars (< 0x20), and common whitespace.
inline std::string json_string(std::string_view in) {
    std::string out;
    out.reserve(in.size() + 2);
    out.push_back('"');
    for (unsigned char c : in) {
        switch (c) {
            case '\"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (c < 0x20) out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                else          out.push_back(static_cast<char>(c));
        }
    }
    out.push_back('"');
    return out;
}

// Shortest round-trip text for a real, always marked as a real ("1.0", "2.5", "1e+300").
// JSON has no NaN/Infinity, so non-finite values become null.
inline std::string json_real(double v) {
    if (!std::isfinite(v)) return "null";
    std::string s = fmt::format("{}", v);
    if (s.find_first_of(".eE") == std::string::npos) s += ".0";
    return s;
}

inline std::string json_real(const std::optional<double>& v) {
    return v ? json_real(*v) : std::string("null");
}

}
