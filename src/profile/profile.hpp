// src/profile/profile.hpp
#pragma once
#include "types/infer.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace bprof {

// ---------- data model ----------
struct quantile_set {
    double p25 = 0.0;
    double p50 = 0.0;
    double p75 = 0.0;
    double p90 = 0.0;
    double p99 = 0.0;
};

// All fields are empty when the column has no non-missing value.
struct numeric_summary {
    std::optional<double>       min, max;
    std::optional<double>       mean, median, std_dev;
    std::optional<quantile_set> quantiles;
};

struct top_value {
    std::string   value;
    std::uint64_t count = 0;
};

struct categorical_summary {
    std::vector<top_value> top_values;   // descending count, ties by first appearance
};

struct column_profile {
    std::string   name;
    logical_type  source_type = logical_type::string_;   // as loaded; not serialized
    std::uint64_t count    = 0;
    std::uint64_t missing  = 0;
    std::uint64_t distinct = 0;
    std::variant<numeric_summary, categorical_summary> detail;

    bool is_numeric() const noexcept { return std::holds_alternative<numeric_summary>(detail); }
    const char* type_name() const noexcept { return is_numeric() ? "numeric" : "string"; }

    const numeric_summary*     numeric() const noexcept     { return std::get_if<numeric_summary>(&detail); }
    const categorical_summary* categorical() const noexcept { return std::get_if<categorical_summary>(&detail); }
};

struct dataset_profile {
    std::uint64_t               total_rows = 0;
    std::vector<column_profile> columns;   // input column order

    const column_profile* find(const std::string& name) const {
        for (const auto& c : columns) if (c.name == name) return &c;
        return nullptr;
    }
};

}
