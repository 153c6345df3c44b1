#pragma once
#include <cstddef>
#include <optional>
#include <string_view>

namespace bprof {

// Offset of the first byte that does not start a well-formed UTF-8 sequence,
// or nullopt when the whole buffer is valid. Overlong forms, surrogates and
// code points above U+10FFFF are rejected.
inline std::optional<std::size_t> find_invalid_utf8(std::string_view s) {
    const auto byte = [&](std::size_t i) { return static_cast<unsigned char>(s[i]); };
    const auto cont = [&](std::size_t i) { return i < s.size() && (byte(i) & 0xC0) == 0x80; };

    std::size_t i = 0;
    while (i < s.size()) {
        const unsigned char c = byte(i);
        if (c < 0x80) { ++i; continue; }

        std::size_t len = 0;
        unsigned char lo = 0x80, hi = 0xBF;   // allowed range of the second byte
        if (c >= 0xC2 && c <= 0xDF)      len = 2;
        else if (c == 0xE0)              { len = 3; lo = 0xA0; }
        else if (c == 0xED)              { len = 3; hi = 0x9F; }
        else if (c >= 0xE1 && c <= 0xEF) len = 3;
        else if (c == 0xF0)              { len = 4; lo = 0x90; }
        else if (c == 0xF4)              { len = 4; hi = 0x8F; }
        else if (c >= 0xF1 && c <= 0xF3) len = 4;
        else return i;

        if (i + 1 >= s.size() || byte(i + 1) < lo || byte(i + 1) > hi) return i;
        for (std::size_t k = 2; k < len; ++k)
            if (!cont(i + k)) return i;
        i += len;
    }
    return std::nullopt;
}

inline bool is_valid_utf8(std::string_view s) { return !find_invalid_utf8(s); }

}
