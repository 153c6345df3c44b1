#pragma once
#include "csv/dialect.hpp"
#include "csv/record_reader.hpp"
#include "io/input_file.hpp"
#include "table/table.hpp"
#include "types/infer.hpp"
#include "util/errors.hpp"
#include "util/nulls.hpp"
#include "util/utf8.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace bprof {

namespace detail {

// Empty names become colN; repeats get .1, .2 suffixes.
inline std::vector<std::string> normalize_header(std::vector<std::string> names) {
    std::unordered_set<std::string> used;
    for (std::size_t i = 0; i < names.size(); ++i) {
        std::string base = std::string(trim_view(names[i]));
        if (base.empty()) base = "col" + std::to_string(i + 1);
        std::string name = base;
        for (std::size_t k = 1; used.count(name); ++k) name = base + "." + std::to_string(k);
        used.insert(name);
        names[i] = std::move(name);
    }
    return names;
}

inline double parse_number(std::string_view cell, const std::string& column, std::size_t line) {
    const std::string t(cell);
    char* end = nullptr;
    const double v = std::strtod(t.c_str(), &end);
    if (end == t.c_str() || *end != '\0' || !std::isfinite(v)) {
        throw dataset_error("column '" + column + "' line " + std::to_string(line) +
                            ": numeric value out of range: " + t);
    }
    return v;
}

}

/**
 * Parses delimited text into a typed, rectangular table.
 *
 * Column types are inferred once here, over the trimmed non-null cells.
 * Text columns keep the raw cell; numeric columns hold the parsed double.
 *
 * @throws unrectangular_input_error when a record is wider/narrower than the header.
 * @throws dataset_error on text that is not UTF-8, unterminated quotes or numeric overflow.
 */
inline table parse_csv(std::string_view data, const csv_dialect& d) {
    if (data.size() >= 3 && data.substr(0, 3) == "\xEF\xBB\xBF") data.remove_prefix(3);
    if (const auto bad = find_invalid_utf8(data)) {
        const auto line = 1 + std::count(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(*bad), '\n');
        throw dataset_error("line " + std::to_string(line) + ": invalid UTF-8 byte at offset " +
                            std::to_string(*bad));
    }

    const char delim = d.delimiter ? *d.delimiter : detect_delimiter(data, d.quote);
    record_reader rr(data, delim, d.quote);

    std::vector<std::string> fields;
    if (!rr.next(fields)) return table{0};

    std::vector<std::string> names;
    std::vector<std::vector<std::string>> cells;   // column-major
    std::vector<std::size_t> lines;                // source line per data row

    const std::size_t width = fields.size();
    cells.resize(width);
    if (d.has_header) {
        names = detail::normalize_header(fields);
    } else {
        names.resize(width);
        for (std::size_t i = 0; i < width; ++i) names[i] = "col" + std::to_string(i + 1);
        for (std::size_t c = 0; c < width; ++c) cells[c].push_back(std::move(fields[c]));
        lines.push_back(rr.line());
    }

    while (rr.next(fields)) {
        if (fields.size() != width) {
            throw unrectangular_input_error("record " + std::to_string(lines.size() + 1) +
                                            " (line " + std::to_string(rr.line()) + ")",
                                            width, fields.size());
        }
        for (std::size_t c = 0; c < width; ++c) cells[c].push_back(std::move(fields[c]));
        lines.push_back(rr.line());
    }

    table out{lines.size()};
    for (std::size_t c = 0; c < width; ++c) {
        auto& raw = cells[c];
        missing_mask missing(raw.size(), 0);
        type_tracker tt;
        for (std::size_t r = 0; r < raw.size(); ++r) {
            const std::string_view t = trim_view(raw[r]);
            if (is_null_like(t, d.null_tokens)) { missing[r] = 1; tt.observe_missing(); continue; }
            tt.observe(t);
        }

        column col;
        col.name = names[c];
        col.type = tt.resolve();
        if (is_numeric(col.type)) {
            std::vector<double> nums(raw.size(), 0.0);
            for (std::size_t r = 0; r < raw.size(); ++r) {
                if (!missing[r]) nums[r] = detail::parse_number(trim_view(raw[r]), col.name, lines[r]);
            }
            col.values = std::move(nums);
        } else {
            for (std::size_t r = 0; r < raw.size(); ++r) if (missing[r]) raw[r].clear();
            col.values = std::move(raw);
        }
        col.missing = std::move(missing);
        out.add_column(std::move(col));
    }
    return out;
}

/**
 * Loads a delimited-text file. `.tsv`/`.tab` default to a tab delimiter unless
 * one is given explicitly.
 * @throws unsupported_format_error / io_error for anything that is not readable text.
 */
inline table read_csv(const std::filesystem::path& path, csv_dialect d = {}) {
    const input_format format = format_from_path(path);
    if (format == input_format::tsv && !d.delimiter) d.delimiter = '\t';
    const std::string text = read_file_text(path);
    return parse_csv(text, d);
}

}
