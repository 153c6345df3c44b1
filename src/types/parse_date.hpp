#pragma once
#include <cctype>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace bprof {

inline const std::vector<std::string>& default_date_formats() {
    static const std::vector<std::string> k{
        "%Y-%m-%d %H:%M:%S", "%Y-%m-%dT%H:%M:%S", "%Y-%m-%d", "%m/%d/%Y"};
    return k;
}

// First format that consumes the whole cell wins (a trailing 'Z' is allowed).
inline std::optional<std::tm> parse_date_any(std::string_view s,
                                             const std::vector<std::string>& fmts) {
    if (s.size() < 8 || !std::isdigit(static_cast<unsigned char>(s.front()))) return std::nullopt;
    if (s.back() == 'Z') s.remove_suffix(1);
    for (const auto& fmt : fmts) {
        std::tm tm{};
        std::istringstream iss(std::string{s});
        iss >> std::get_time(&tm, fmt.c_str());
        if (iss.fail()) continue;
        if (iss.peek() == std::char_traits<char>::eof()) return tm;
    }
    return std::nullopt;
}

inline bool is_date(std::string_view s) {
    return parse_date_any(s, default_date_formats()).has_value();
}

}
