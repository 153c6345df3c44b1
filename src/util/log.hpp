#pragma once
#include <fmt/format.h>
#include <atomic>
#include <string_view>
#include <utility>

namespace bprof::log {

// Progress lines go to stdout and can be silenced with --quiet;
// warnings and errors always reach stderr.
inline std::atomic<bool>& quiet_flag() {
    static std::atomic<bool> q{false};
    return q;
}

inline void set_quiet(bool q) { quiet_flag().store(q); }

template <typename... Args>
void info(std::string_view fmt_str, Args&&... args) {
    if (quiet_flag().load()) return;
    fmt::print("{}\n", fmt::format(fmt::runtime(fmt_str), std::forward<Args>(args)...));
}

template <typename... Args>
void warn(std::string_view fmt_str, Args&&... args) {
    fmt::print(stderr, "WARN: {}\n", fmt::format(fmt::runtime(fmt_str), std::forward<Args>(args)...));
}

template <typename... Args>
void error(std::string_view fmt_str, Args&&... args) {
    fmt::print(stderr, "ERROR: {}\n", fmt::format(fmt::runtime(fmt_str), std::forward<Args>(args)...));
}

}
