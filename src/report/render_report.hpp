#pragma once
#include "io/input_file.hpp"
#include "profile/profile.hpp"
#include "types/infer.hpp"
#include "util/errors.hpp"
#include <fmt/format.h>
#include <mustache.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#if defined(_WIN32)
  #include <windows.h>
#elif defined(__APPLE__)
  #include <mach-o/dyld.h>
#endif

namespace bprof {

// Used when no --template is given. Mustache escapes {{...}}; only numbers are pre-formatted.
inline const char* default_report_template() {
    return R"(<!doctype html>
<html lang="en">
<head>
<meta charset="utf-8">
<title>Baseline profile: {{source}}</title>
<style>
body{font-family:sans-serif;margin:2em}
table{border-collapse:collapse}
td,th{border:1px solid #ccc;padding:4px 8px;text-align:left;vertical-align:top}
.num{text-align:right}
</style>
</head>
<body>
<h1>Baseline profile</h1>
<p>Source: <code>{{source}}</code></p>
<p>{{total_rows}} rows, {{column_count}} columns</p>
<table>
<tr><th>column</th><th>type</th><th>loaded as</th><th>count</th><th>missing</th><th>distinct</th><th>summary</th></tr>
{{#columns}}
<tr>
<td>{{name}}</td><td>{{type}}</td><td>{{source_type}}</td>
<td class="num">{{count}}</td><td class="num">{{missing}}</td><td class="num">{{distinct}}</td>
<td>
{{#numeric}}
{{#has_values}}min {{min}} / p25 {{p25}} / median {{median}} / p75 {{p75}} / max {{max}}<br>mean {{mean}}, std dev {{std_dev}}, p90 {{p90}}, p99 {{p99}}{{/has_values}}
{{^has_values}}no values{{/has_values}}
{{/numeric}}
{{#categorical}}
<ol>{{#top_values}}<li>{{value}} ({{count}})</li>{{/top_values}}</ol>
{{/categorical}}
</td>
</tr>
{{/columns}}
</table>
</body>
</html>
)";
}

// ---------- utils ----------
inline std::filesystem::path exe_dir() {
#if defined(_WIN32)
    wchar_t buf[MAX_PATH]{};
    const DWORD len = GetModuleFileNameW(nullptr, buf, MAX_PATH);
    if (len == 0 || len == MAX_PATH) return std::filesystem::current_path();
    return std::filesystem::path(buf).parent_path();
#elif defined(__APPLE__)
    uint32_t size = 0;
    _NSGetExecutablePath(nullptr, &size);
    std::string tmp(size, '\0');
    if (_NSGetExecutablePath(tmp.data(), &size) != 0) return std::filesystem::current_path();
    std::error_code ec;
    auto p = std::filesystem::weakly_canonical(std::filesystem::path(tmp), ec);
    if (ec) p = std::filesystem::path(tmp);
    return p.parent_path();
#else
    std::error_code ec;
    auto p = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) return std::filesystem::current_path();
    return p.parent_path();
#endif
}

/**
 * Resolves a template path: as given, then <exe_dir>/templates/<name>,
 * then <cwd>/templates/<name>.
 * @throws io_error listing every location tried.
 */
inline std::filesystem::path resolve_template(const std::filesystem::path& requested) {
    namespace fs = std::filesystem;
    const fs::path name = requested.filename();
    const std::vector<fs::path> candidates = {
        requested,
        exe_dir() / "templates" / name,
        fs::current_path() / "templates" / name
    };
    std::string tried;
    for (const auto& c : candidates) {
        std::error_code ec;
        if (fs::exists(c, ec) && fs::is_regular_file(c, ec)) return c;
        tried += "  - " + c.string() + "\n";
    }
    throw io_error("template not found. Looked at:\n" + tried);
}

inline std::string format_stat(const std::optional<double>& v) {
    return v ? fmt::format("{:.6g}", *v) : std::string("n/a");
}

inline kainjow::mustache::data report_context(const dataset_profile& p, const std::string& source) {
    using kainjow::mustache::data;

    data columns{data::type::list};
    for (const auto& c : p.columns) {
        data col;
        col.set("name", c.name);
        col.set("type", std::string(c.type_name()));
        col.set("source_type", std::string(to_string(c.source_type)));
        col.set("count", std::to_string(c.count));
        col.set("missing", std::to_string(c.missing));
        col.set("distinct", std::to_string(c.distinct));

        if (const auto* n = c.numeric()) {
            data num;
            num.set("has_values", data(n->quantiles.has_value()));
            num.set("min", format_stat(n->min));
            num.set("max", format_stat(n->max));
            num.set("mean", format_stat(n->mean));
            num.set("median", format_stat(n->median));
            num.set("std_dev", format_stat(n->std_dev));
            if (n->quantiles) {
                num.set("p25", format_stat(n->quantiles->p25));
                num.set("p75", format_stat(n->quantiles->p75));
                num.set("p90", format_stat(n->quantiles->p90));
                num.set("p99", format_stat(n->quantiles->p99));
            }
            col.set("numeric", num);
        } else {
            data tops{data::type::list};
            for (const auto& tv : c.categorical()->top_values) {
                data item;
                item.set("value", tv.value);
                item.set("count", std::to_string(tv.count));
                tops.push_back(item);
            }
            data cat;
            cat.set("top_values", tops);
            col.set("categorical", cat);
        }
        columns.push_back(col);
    }

    data ctx;
    ctx.set("source", source);
    ctx.set("total_rows", std::to_string(p.total_rows));
    ctx.set("column_count", std::to_string(p.columns.size()));
    ctx.set("columns", columns);
    return ctx;
}

// ---------- main ----------
/**
 * Renders an HTML summary of the profile.
 *
 * @param template_path  Optional mustache template; the built-in one is used when empty.
 * @throws io_error when the template cannot be found or read.
 * @throws error when the template does not parse.
 */
inline std::string render_report(const dataset_profile& p,
                                 const std::string& source,
                                 const std::filesystem::path& template_path = {}) {
    std::string tmpl = default_report_template();
    if (!template_path.empty()) tmpl = read_file_text(resolve_template(template_path));

    kainjow::mustache::mustache m{tmpl};
    if (!m.is_valid()) throw error("Mustache template parse error: " + m.error_message());

    return m.render(report_context(p, source));
}

}
