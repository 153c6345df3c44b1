#include <fmt/format.h>
#include <filesystem>
#include <string>
#include <vector>

#include "../cli/cli_options.hpp"
#include "../csv/csv_reader.hpp"
#include "../io/input_file.hpp"
#include "../metrics/timers.hpp"
#include "../profile/profiler.hpp"
#include "../report/emit_profile_json.hpp"
#include "../report/render_report.hpp"
#include "../util/errors.hpp"
#include "../util/log.hpp"

namespace fs = std::filesystem;

// Exit codes
//   0 ok, 1 bad arguments, 2 input/output/template failure, 3 malformed dataset, 4 internal error
namespace {
constexpr int k_exit_usage    = 1;
constexpr int k_exit_io       = 2;
constexpr int k_exit_dataset  = 3;
constexpr int k_exit_internal = 4;
}

int main(int argc, char** argv) {
    CLI::App app;
    bprof::AppOptions opt;
    try {
        opt = bprof::parse_cli(app, argc, argv);
    } catch (const CLI::ParseError& e) {
        const int rc = app.exit(e);   // prints help/version or the parse error
        return rc == 0 ? 0 : k_exit_usage;
    }
    bprof::log::set_quiet(opt.quiet);

    try {
        const fs::path input_path  = opt.input;
        const fs::path output_path = opt.output;

        bprof::csv_dialect dialect;
        dialect.delimiter   = opt.delimiter_char();
        dialect.quote       = opt.quote[0];
        dialect.has_header  = opt.has_header;
        dialect.null_tokens = opt.null_values;

        std::vector<bprof::RunStage> stages;

        // --- stage: load
        bprof::log::info("Reading {}...", input_path.string());
        bprof::StageTimer st_load("load");
        st_load.start();
        const bprof::table data = bprof::read_csv(input_path, dialect);
        stages.push_back(st_load.stop());
        bprof::log::info("Loaded {} rows x {} columns ({} bytes)",
                         data.row_count(), data.column_count(), bprof::file_size_bytes(input_path));

        // --- stage: profile
        bprof::log::info("Generating statistics...");
        bprof::StageTimer st_profile("profile");
        st_profile.start();
        bprof::profile_options popt;
        popt.threads = opt.threads;
        const bprof::dataset_profile prof = bprof::profile(data, popt);
        stages.push_back(st_profile.stop());

        std::size_t numeric_cols = 0;
        for (const auto& c : prof.columns) if (c.is_numeric()) ++numeric_cols;
        bprof::log::info("Profiled {} columns ({} numeric, {} string)",
                         prof.columns.size(), numeric_cols, prof.columns.size() - numeric_cols);
        for (const auto& c : prof.columns) {
            if (c.is_numeric() && c.count == 0)
                bprof::log::warn("column '{}' has no non-missing values; numeric statistics are null", c.name);
        }

        // --- stage: write
        bprof::log::info("Writing to {}...", output_path.string());
        bprof::StageTimer st_write("write");
        st_write.start();
        // both payloads are built before either file is touched
        const std::string json = bprof::profile_to_json(prof);
        std::string html;
        if (!opt.report.empty())
            html = bprof::render_report(prof, input_path.string(), opt.report_template);
        bprof::write_file_text(output_path, json);
        if (!opt.report.empty()) {
            bprof::log::info("Writing report to {}...", opt.report);
            bprof::write_file_text(opt.report, html);
        }
        stages.push_back(st_write.stop());

        for (const auto& s : stages) bprof::log::info("  {:<8} {:.2f} ms", s.name, s.ms);
        bprof::log::info("Done in {:.2f} ms.", bprof::total_ms(stages));
        return 0;
    }
    catch (const bprof::io_error& e) {
        bprof::log::error("{}", e.what());
        return k_exit_io;
    }
    catch (const bprof::dataset_error& e) {
        bprof::log::error("{}", e.what());
        return k_exit_dataset;
    }
    catch (const bprof::error& e) {
        // unusable report template
        bprof::log::error("{}", e.what());
        return k_exit_io;
    }
    catch (const std::exception& e) {
        bprof::log::error("{}", e.what());
        return k_exit_internal;
    }
}
