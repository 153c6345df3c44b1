#pragma once
#include "util/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace bprof {

enum class input_format { csv, tsv };

inline std::uintmax_t file_size_bytes(const std::filesystem::path& p) {
    std::error_code ec;
    auto sz = std::filesystem::file_size(p, ec);
    return ec ? 0u : static_cast<std::uintmax_t>(sz);
}

// Delimited text only; columnar formats (.parquet) have no reader here.
inline input_format format_from_path(const std::filesystem::path& p) {
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".csv" || ext == ".txt") return input_format::csv;
    if (ext == ".tsv" || ext == ".tab") return input_format::tsv;
    throw unsupported_format_error(p.string());
}

inline std::string read_file_text(const std::filesystem::path& p) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(p, ec))
        throw io_error("input not found: " + p.string());
    std::ifstream f(p, std::ios::binary);
    if (!f) throw io_error("failed to open: " + p.string());
    std::ostringstream oss;
    oss << f.rdbuf();
    if (f.bad()) throw io_error("failed to read: " + p.string());
    return oss.str();
}

// Writes the whole payload or throws; callers build the text before opening the file.
inline void write_file_text(const std::filesystem::path& p, const std::string& text) {
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    if (!f) throw io_error("failed to open for write: " + p.string());
    f << text;
    f.flush();
    if (!f) throw io_error("failed to write: " + p.string());
}

}
