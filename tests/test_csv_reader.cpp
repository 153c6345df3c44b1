#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "csv/csv_reader.hpp"
#include "csv/dialect.hpp"
#include "io/input_file.hpp"
#include "profile/profiler.hpp"
#include "report/emit_profile_json.hpp"
#include "util/errors.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace bprof;
using Catch::Matchers::ContainsSubstring;

namespace {

csv_dialect comma() {
    csv_dialect d;
    d.delimiter = ',';
    return d;
}

const std::vector<std::string>& text_of(const table& t, std::size_t col) {
    return std::get<std::vector<std::string>>(t[col].values);
}

const std::vector<double>& numbers_of(const table& t, std::size_t col) {
    return std::get<std::vector<double>>(t[col].values);
}

// Temp file removed at scope exit.
struct temp_file {
    std::filesystem::path path;
    temp_file(const std::string& name, const std::string& body)
        : path(std::filesystem::temp_directory_path() / ("bprof_test_" + name)) {
        std::ofstream f(path, std::ios::binary);
        f << body;
    }
    ~temp_file() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
};

}

TEST_CASE("CSV parsing builds a typed table", "[csv]") {
    const table t = parse_csv("id,score,label,flag\n1,2.5,a,true\n2,,b,false\n3,4,a,NA\n", comma());

    REQUIRE(t.row_count() == 3);
    REQUIRE(t.column_count() == 4);

    REQUIRE(t[0].name == "id");
    REQUIRE(t[0].type == logical_type::int64_);
    REQUIRE(numbers_of(t, 0)[2] == Catch::Approx(3.0));

    REQUIRE(t[1].type == logical_type::float64_);
    REQUIRE(t[1].is_missing(1));
    REQUIRE(numbers_of(t, 1)[0] == Catch::Approx(2.5));

    REQUIRE(t[2].type == logical_type::string_);
    REQUIRE(text_of(t, 2)[1] == "b");

    REQUIRE(t[3].type == logical_type::boolean_);
    REQUIRE(t[3].is_missing(2));
}

TEST_CASE("CSV quoting follows RFC4180", "[csv]") {
    const table t = parse_csv(
        "name,note\r\n"
        "\"Smith, J\",\"said \"\"hi\"\"\"\r\n"
        "plain,\"two\nlines\"\r\n", comma());

    REQUIRE(t.row_count() == 2);
    REQUIRE(text_of(t, 0)[0] == "Smith, J");
    REQUIRE(text_of(t, 1)[0] == "said \"hi\"");
    REQUIRE(text_of(t, 1)[1] == "two\nlines");
}

TEST_CASE("CSV header handling", "[csv]") {
    SECTION("no header row synthesizes names") {
        csv_dialect d = comma();
        d.has_header = false;
        const table t = parse_csv("1,x\n2,y\n", d);
        REQUIRE(t.row_count() == 2);
        REQUIRE(t[0].name == "col1");
        REQUIRE(t[1].name == "col2");
    }

    SECTION("empty and repeated names are made unique") {
        const table t = parse_csv("a,,a,a\n1,2,3,4\n", comma());
        REQUIRE(t[0].name == "a");
        REQUIRE(t[1].name == "col2");
        REQUIRE(t[2].name == "a.1");
        REQUIRE(t[3].name == "a.2");
    }

    SECTION("header only gives zero rows") {
        const table t = parse_csv("a,b\n", comma());
        REQUIRE(t.row_count() == 0);
        REQUIRE(t.column_count() == 2);
        REQUIRE(t[0].type == logical_type::string_);
    }

    SECTION("empty input gives an empty table") {
        const table t = parse_csv("", comma());
        REQUIRE(t.row_count() == 0);
        REQUIRE(t.column_count() == 0);
    }

    SECTION("byte order mark is stripped") {
        const table t = parse_csv("\xEF\xBB\xBFid\n1\n", comma());
        REQUIRE(t[0].name == "id");
    }
}

TEST_CASE("CSV null tokens and whitespace", "[csv][nulls]") {
    SECTION("default tokens are case-insensitive and trimmed") {
        const table t = parse_csv("v\nna\n null \nNone\n\"\"\n5\n", comma());
        REQUIRE(t.row_count() == 5);
        REQUIRE(t[0].type == logical_type::int64_);
        for (std::size_t r = 0; r < 4; ++r) REQUIRE(t[0].is_missing(r));
        REQUIRE_FALSE(t[0].is_missing(4));
    }

    SECTION("spreadsheet and dataframe spellings are missing") {
        const table t = parse_csv("v\n#N/A\n<NA>\n-NaN\n2.5\n", comma());
        REQUIRE(t[0].type == logical_type::float64_);
        for (std::size_t r = 0; r < 3; ++r) REQUIRE(t[0].is_missing(r));
    }

    SECTION("custom tokens replace the defaults") {
        csv_dialect d = comma();
        d.null_tokens = {"?"};
        const table t = parse_csv("v\n?\nNA\n", d);
        REQUIRE(t[0].is_missing(0));
        REQUIRE_FALSE(t[0].is_missing(1));
        REQUIRE(text_of(t, 0)[1] == "NA");
    }

    SECTION("text cells keep surrounding spaces") {
        const table t = parse_csv("v\n a \nb\n", comma());
        REQUIRE(text_of(t, 0)[0] == " a ");
    }

    SECTION("numeric cells tolerate surrounding spaces") {
        const table t = parse_csv("v\n 7 \n8\n", comma());
        REQUIRE(t[0].type == logical_type::int64_);
        REQUIRE(numbers_of(t, 0)[0] == Catch::Approx(7.0));
    }

    SECTION("blank lines are skipped") {
        const table t = parse_csv("v\n1\n\n\n2\n\n", comma());
        REQUIRE(t.row_count() == 2);
    }
}

TEST_CASE("CSV rejects malformed input", "[csv][errors]") {
    SECTION("ragged record") {
        try {
            parse_csv("a,b\n1,2\n3\n", comma());
            FAIL("expected unrectangular_input_error");
        } catch (const unrectangular_input_error& e) {
            REQUIRE_THAT(e.what(), ContainsSubstring("record 2"));
            REQUIRE_THAT(e.what(), ContainsSubstring("line 3"));
        }
    }

    SECTION("unterminated quote") {
        REQUIRE_THROWS_AS(parse_csv("a\n\"open\n", comma()), dataset_error);
    }

    SECTION("numeric overflow") {
        REQUIRE_THROWS_AS(parse_csv("a\n1e999\n", comma()), dataset_error);
    }

    SECTION("bytes that are not UTF-8") {
        try {
            parse_csv("id,empty,s\n1,,caf\xE9\n2,,\xFF\xFE\n", comma());
            FAIL("expected dataset_error");
        } catch (const dataset_error& e) {
            REQUIRE_THAT(e.what(), ContainsSubstring("UTF-8"));
            REQUIRE_THAT(e.what(), ContainsSubstring("line 2"));
        }
        REQUIRE_THROWS_AS(parse_csv("s\n\xED\xA0\x80\n", comma()), dataset_error);   // surrogate
        REQUIRE_THROWS_AS(parse_csv("s\n\xC0\xAF\n", comma()), dataset_error);       // overlong
    }

    SECTION("multi-byte UTF-8 is accepted") {
        const table t = parse_csv("s\ncaf\xC3\xA9\n\xE2\x82\xAC\n\xF0\x9F\x98\x80\n", comma());
        REQUIRE(t.row_count() == 3);
        REQUIRE(text_of(t, 0)[0] == "caf\xC3\xA9");
    }
}

TEST_CASE("All-missing column loads as numeric", "[csv][types]") {
    const table t = parse_csv("a,b\n1,\n2,\n", comma());
    REQUIRE(t[1].type == logical_type::float64_);
    REQUIRE(t[1].is_missing(0));
    REQUIRE(t[1].is_missing(1));

    const dataset_profile p = profile(t);
    const column_profile& b = p.columns.at(1);
    REQUIRE(b.is_numeric());
    REQUIRE(b.count == 0);
    REQUIRE(b.missing == 2);
    REQUIRE_FALSE(b.numeric()->min.has_value());
    REQUIRE_THAT(profile_to_json(p), ContainsSubstring("\"min\": null"));
}

TEST_CASE("Delimiter auto-detection", "[csv][dialect]") {
    REQUIRE(detect_delimiter("a;b;c\n1;2;3\n4;5;6\n") == ';');
    REQUIRE(detect_delimiter("a\tb\n1\t2\n") == '\t');
    REQUIRE(detect_delimiter("a|b|c\n1|2|3\n") == '|');
    REQUIRE(detect_delimiter("a,b\n1,2\n") == ',');
    // single column: nothing qualifies
    REQUIRE(detect_delimiter("a\n1\n2\n") == ',');
    // commas inside quotes do not count
    REQUIRE(detect_delimiter("name;note\n\"x, y\";1\n\"p, q\";2\n") == ';');

    const table t = parse_csv("a;b\n1;x\n2;y\n", csv_dialect{});
    REQUIRE(t.column_count() == 2);
    REQUIRE(t[1].name == "b");
}

TEST_CASE("Reading CSV files from disk", "[csv][io]") {
    SECTION("tsv defaults to tab") {
        temp_file f("tab.tsv", "a\tb\n1\tx\n");
        const table t = read_csv(f.path);
        REQUIRE(t.column_count() == 2);
        REQUIRE(t[0].type == logical_type::int64_);
    }

    SECTION("unsupported extension") {
        temp_file f("data.parquet", "PAR1");
        REQUIRE_THROWS_AS(read_csv(f.path), unsupported_format_error);
    }

    SECTION("missing file") {
        const auto p = std::filesystem::temp_directory_path() / "bprof_test_does_not_exist.csv";
        REQUIRE_THROWS_AS(read_csv(p), io_error);
    }

    SECTION("extension match is case-insensitive") {
        REQUIRE(format_from_path("DATA.CSV") == input_format::csv);
        REQUIRE(format_from_path("x.TSV") == input_format::tsv);
    }
}
