#pragma once
#include "util/nulls.hpp"
#include <CLI/CLI.hpp>
#include <optional>
#include <string>
#include <vector>

namespace bprof {

struct AppOptions {
    // Required/paths
    std::string input;
    std::string output;
    std::string report;          // optional HTML summary
    std::string report_template; // optional mustache template for --report

    // CSV parsing
    std::string delimiter = "auto";   // single char or "auto"
    std::string quote     = "\"";
    bool        has_header = true;
    std::vector<std::string> null_values = default_null_tokens();

    // Runtime
    unsigned threads = 1;
    bool     quiet   = false;

    std::optional<char> delimiter_char() const {
        if (delimiter == "auto") return std::nullopt;
        if (delimiter == "\\t")  return '\t';
        return delimiter[0];
    }
};

/**
 * Parses argv. Any option can also come from a TOML/INI file given with --config
 * (keys are the long option names, e.g. `delimiter = ";"`).
 * @throws CLI::ParseError (including --help/--version) for the caller to hand to app.exit().
 */
inline AppOptions parse_cli(CLI::App& app, int argc, char** argv) {
    AppOptions opt;
    app.description("Baseline profiler: per-column statistics of a delimited-text dataset");
    app.set_version_flag("--version", "0.2.0");
    app.set_config("--config", "", "TOML/INI file with option defaults");

    // Required/basic
    app.add_option("input",  opt.input,  "Path to input .csv/.tsv")->required();
    app.add_option("output", opt.output, "Path of the profile JSON to write")->required();
    app.add_option("--report",   opt.report,          "Also render an HTML summary to this path");
    app.add_option("--template", opt.report_template, "Mustache template for --report")
        ->check(CLI::ExistingFile);

    // CSV parsing
    app.add_option("-d,--delimiter", opt.delimiter,
                   "Delimiter (single character, \\t, or 'auto')")->capture_default_str();
    app.add_option("--quote", opt.quote,
                   "Quote character (single character)")->capture_default_str();
    app.add_option("--has-header", opt.has_header,
                   "Input has a header row (true/false)")->capture_default_str();
    app.add_option("--null-values", opt.null_values,
                   "Cell values treated as missing (case-insensitive)")->capture_default_str();

    // Runtime
    app.add_option("-j,--threads", opt.threads, "Worker threads for column profiling")
        ->check(CLI::Range(1u, 256u))->capture_default_str();
    app.add_flag("-q,--quiet", opt.quiet, "Only print warnings and errors");

    app.parse(argc, argv);

    // --- Validation ---
    if (opt.delimiter != "auto" && opt.delimiter != "\\t" && opt.delimiter.size() != 1)
        throw CLI::ValidationError{"delimiter", "must be a single character, \\t, or auto"};
    if (opt.quote.size() != 1)
        throw CLI::ValidationError{"quote", "must be a single character"};
    if (!opt.report_template.empty() && opt.report.empty())
        throw CLI::ValidationError{"template", "requires --report"};

    return opt;
}

}
