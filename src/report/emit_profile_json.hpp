#pragma once
#include "io/input_file.hpp"
#include "profile/profile.hpp"
#include "util/json_escape.hpp"
#include <fmt/format.h>
#include <filesystem>
#include <iterator>
#include <string>

namespace bprof {

namespace detail {

inline void append_numeric(fmt::memory_buffer& b, const numeric_summary& n) {
    auto out = std::back_inserter(b);
    fmt::format_to(out, ",\n      \"min\": {}",     json_real(n.min));
    fmt::format_to(out, ",\n      \"max\": {}",     json_real(n.max));
    fmt::format_to(out, ",\n      \"mean\": {}",    json_real(n.mean));
    fmt::format_to(out, ",\n      \"median\": {}",  json_real(n.median));
    fmt::format_to(out, ",\n      \"std_dev\": {}", json_real(n.std_dev));
    if (n.quantiles) {
        const quantile_set& q = *n.quantiles;
        fmt::format_to(out, ",\n      \"p25\": {}", json_real(q.p25));
        fmt::format_to(out, ",\n      \"p50\": {}", json_real(q.p50));
        fmt::format_to(out, ",\n      \"p75\": {}", json_real(q.p75));
        fmt::format_to(out, ",\n      \"p90\": {}", json_real(q.p90));
        fmt::format_to(out, ",\n      \"p99\": {}", json_real(q.p99));
    }
}

inline void append_categorical(fmt::memory_buffer& b, const categorical_summary& c) {
    auto out = std::back_inserter(b);
    if (c.top_values.empty()) {
        fmt::format_to(out, ",\n      \"top_values\": []");
        return;
    }
    fmt::format_to(out, ",\n      \"top_values\": [");
    for (std::size_t i = 0; i < c.top_values.size(); ++i) {
        const auto& tv = c.top_values[i];
        fmt::format_to(out, "{}\n        {{\n          \"value\": {},\n          \"count\": {}\n        }}",
                       i ? "," : "", json_string(tv.value), tv.count);
    }
    fmt::format_to(out, "\n      ]");
}

}

/**
 * Serializes a profile as pretty JSON (2-space indent, schema: total_rows, columns{...}).
 *
 * Field order is fixed and doubles use the shortest round-trip form, so the
 * same profile always produces the same bytes.
 */
inline std::string profile_to_json(const dataset_profile& p) {
    fmt::memory_buffer b;
    auto out = std::back_inserter(b);
    fmt::format_to(out, "{{\n  \"total_rows\": {},\n  \"columns\": ", p.total_rows);
    if (p.columns.empty()) {
        fmt::format_to(out, "{{}}\n}}\n");
        return fmt::to_string(b);
    }
    fmt::format_to(out, "{{");
    for (std::size_t i = 0; i < p.columns.size(); ++i) {
        const column_profile& c = p.columns[i];
        fmt::format_to(out,
R"({}
    {}: {{
      "count": {},
      "missing": {},
      "distinct": {},
      "type": "{}")",
            i ? "," : "", json_string(c.name), c.count, c.missing, c.distinct, c.type_name());
        if (const auto* n = c.numeric()) detail::append_numeric(b, *n);
        else                             detail::append_categorical(b, *c.categorical());
        fmt::format_to(out, "\n    }}");
    }
    fmt::format_to(out, "\n  }}\n}}\n");
    return fmt::to_string(b);
}

// Writes profile.json; the text is complete before the file is opened.
inline void emit_profile_json(const std::filesystem::path& out_path, const dataset_profile& p) {
    write_file_text(out_path, profile_to_json(p));
}

}
