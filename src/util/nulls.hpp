#pragma once
#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace bprof {

inline const std::vector<std::string>& default_null_tokens() {
    static const std::vector<std::string> k{"", "NA", "N/A", "#N/A", "<NA>", "null", "NaN", "-NaN", "None"};
    return k;
}

inline std::string_view trim_view(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))  s.remove_suffix(1);
    return s;
}

inline bool ieq(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) return false;
    }
    return true;
}

// Caller passes the already trimmed cell.
inline bool is_null_like(std::string_view s, const std::vector<std::string>& nulls) {
    return std::any_of(nulls.begin(), nulls.end(),
                       [&](const std::string& n) { return ieq(s, n); });
}

}
