#pragma once
#include "csv/record_reader.hpp"
#include "util/nulls.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bprof {

struct csv_dialect {
    std::optional<char>      delimiter;              // nullopt = detect
    char                     quote      = '"';
    bool                     has_header = true;
    std::vector<std::string> null_tokens = default_null_tokens();
};

/**
 * Picks the delimiter among , \t ; | that splits the first 10 records into the
 * most cells at a constant width greater than one. Falls back to ','.
 */
inline char detect_delimiter(std::string_view sample, char quote = '"') {
    static constexpr char candidates[] = {',', '\t', ';', '|'};
    constexpr std::size_t max_records = 10;

    char best = ',';
    std::size_t best_score = 0;
    for (char delim : candidates) {
        record_reader rr(sample, delim, quote);
        std::vector<std::string> fields;
        std::vector<std::size_t> widths;
        try {
            while (widths.size() < max_records && rr.next(fields)) widths.push_back(fields.size());
        } catch (const dataset_error&) {
            // unbalanced quotes under this delimiter; score what was read so far
        }
        if (widths.size() < 2) continue;
        const std::size_t w = widths.front();
        if (w < 2) continue;
        bool uniform = true;
        for (std::size_t x : widths) if (x != w) { uniform = false; break; }
        if (!uniform) continue;
        const std::size_t score = widths.size() * w;
        if (score > best_score) { best_score = score; best = delim; }
    }
    return best;
}

}
