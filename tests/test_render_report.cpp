#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "profile/profiler.hpp"
#include "report/render_report.hpp"
#include "table/table.hpp"
#include "util/errors.hpp"

#include <filesystem>
#include <fstream>

using namespace bprof;
using Catch::Matchers::ContainsSubstring;

namespace {

dataset_profile sample_profile() {
    table t;
    t.add_column(make_numeric_column("price", {1.0, 2.0, 3.0}, logical_type::int64_));
    t.add_column(make_text_column("tag", {"<b>", "x", "<b>"}));
    t.add_column(make_numeric_column("empty", {std::nullopt, std::nullopt, std::nullopt}));
    return profile(t);
}

}

TEST_CASE("Built-in HTML report", "[report]") {
    const std::string html = render_report(sample_profile(), "data.csv");

    REQUIRE_THAT(html, ContainsSubstring("<code>data.csv</code>"));
    REQUIRE_THAT(html, ContainsSubstring("3 rows, 3 columns"));
    REQUIRE_THAT(html, ContainsSubstring("<td>price</td><td>numeric</td><td>int64</td>"));
    REQUIRE_THAT(html, ContainsSubstring("median 2 "));
    REQUIRE_THAT(html, ContainsSubstring("no values"));
    // cell text is HTML-escaped
    REQUIRE_THAT(html, ContainsSubstring("<li>&lt;b&gt; (2)</li>"));
}

TEST_CASE("Custom report template", "[report]") {
    const auto dir = std::filesystem::temp_directory_path();

    SECTION("renders from a file") {
        const auto path = dir / "bprof_test_custom.mustache";
        {
            std::ofstream f(path, std::ios::binary);
            f << "{{#columns}}{{name}}={{type}};{{/columns}}";
        }
        REQUIRE(render_report(sample_profile(), "in.csv", path) == "price=numeric;tag=string;empty=numeric;");
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    SECTION("unbalanced section fails to parse") {
        const auto path = dir / "bprof_test_broken.mustache";
        {
            std::ofstream f(path, std::ios::binary);
            f << "{{#columns}}{{name}}";
        }
        REQUIRE_THROWS_AS(render_report(sample_profile(), "in.csv", path), bprof::error);
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    SECTION("missing template") {
        REQUIRE_THROWS_AS(render_report(sample_profile(), "in.csv", dir / "bprof_missing_template.mustache"),
                          io_error);
    }
}
