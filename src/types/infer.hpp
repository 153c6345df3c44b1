#pragma once
#include "types/parse_date.hpp"
#include "util/nulls.hpp"
#include <cctype>
#include <charconv>
#include <cstdint>
#include <string_view>

namespace bprof {

enum class logical_type { int64_, float64_, boolean_, date_, string_ };

inline bool is_int64(std::string_view s) {
    if (s.empty()) return false;
    std::size_t i = (s[0] == '+' || s[0] == '-') ? 1 : 0;
    if (i >= s.size()) return false;
    for (std::size_t j = i; j < s.size(); ++j)
        if (!std::isdigit(static_cast<unsigned char>(s[j]))) return false;
    // from_chars rejects a leading '+'; out-of-range digit runs fall through to float64
    std::int64_t v = 0;
    const char* first = s.data() + (s[0] == '+' ? 1 : 0);
    auto res = std::from_chars(first, s.data() + s.size(), v);
    return res.ec == std::errc{};
}
inline bool is_float64(std::string_view s) {
    if (s.empty()) return false;
    bool dot = false, exp = false, digit = false, exp_digit = false;
    std::size_t i = (s[0] == '+' || s[0] == '-') ? 1 : 0;
    for (; i < s.size(); ++i) {
        char c = s[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            if (exp) exp_digit = true; else digit = true;
            continue;
        }
        if (c == '.' && !dot && !exp) { dot = true; continue; }
        if ((c == 'e' || c == 'E') && !exp && digit) {
            exp = true;
            if (i + 1 < s.size() && (s[i + 1] == '+' || s[i + 1] == '-')) ++i;
            continue;
        }
        return false;
    }
    return digit && (!exp || exp_digit);
}
inline bool is_bool(std::string_view s) {
    return ieq(s, "true") || ieq(s, "false");
}

// Narrowest type of a single non-null, trimmed cell.
inline logical_type infer_type(std::string_view s) {
    if (is_int64(s))   return logical_type::int64_;
    if (is_float64(s)) return logical_type::float64_;
    if (is_bool(s))    return logical_type::boolean_;
    if (is_date(s))    return logical_type::date_;
    return logical_type::string_;
}

// Folds cell observations into one column type, decided once at load.
struct type_tracker {
    bool all_int   = true;
    bool all_float = true;
    bool all_bool  = true;
    bool all_date  = true;
    std::size_t seen = 0;
    std::size_t missing = 0;

    void observe_missing() { ++missing; }

    void observe(std::string_view cell) {
        ++seen;
        if (all_int && !is_int64(cell)) all_int = false;
        if (all_float && !is_int64(cell) && !is_float64(cell)) all_float = false;
        if (all_bool && !is_bool(cell)) all_bool = false;
        if (all_date && !is_date(cell)) all_date = false;
    }

    logical_type resolve() const {
        // all cells missing: float64 with null statistics; no rows at all: string
        if (seen == 0)  return missing > 0 ? logical_type::float64_ : logical_type::string_;
        if (all_int)    return logical_type::int64_;
        if (all_float)  return logical_type::float64_;
        if (all_bool)   return logical_type::boolean_;
        if (all_date)   return logical_type::date_;
        return logical_type::string_;
    }
};

inline bool is_numeric(logical_type t) {
    return t == logical_type::int64_ || t == logical_type::float64_;
}

inline const char* to_string(logical_type t) {
    switch (t) {
        case logical_type::int64_:   return "int64";
        case logical_type::float64_: return "float64";
        case logical_type::boolean_: return "bool";
        case logical_type::date_:    return "date";
        default:                     return "string";
    }
}

}
