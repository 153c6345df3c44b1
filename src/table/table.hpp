#pragma once
#include "types/infer.hpp"
#include "util/errors.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace bprof {

// Numeric columns hold doubles, everything else keeps the cell text.
using column_storage = std::variant<std::vector<double>, std::vector<std::string>>;
using missing_mask   = std::vector<std::uint8_t>;   // 1 = missing

struct column {
    std::string    name;
    logical_type   type = logical_type::string_;
    column_storage values = std::vector<std::string>{};
    missing_mask   missing;

    std::size_t size() const noexcept { return missing.size(); }
    bool is_missing(std::size_t row) const noexcept { return missing[row] != 0; }

    std::size_t storage_size() const noexcept {
        return std::visit([](const auto& v) { return v.size(); }, values);
    }
};

inline column make_numeric_column(std::string name,
                                  const std::vector<std::optional<double>>& cells,
                                  logical_type type = logical_type::float64_) {
    column c;
    c.name = std::move(name);
    c.type = type;
    std::vector<double> nums(cells.size(), 0.0);
    c.missing.assign(cells.size(), 0);
    for (std::size_t i = 0; i < cells.size(); ++i) {
        if (cells[i]) nums[i] = *cells[i];
        else          c.missing[i] = 1;
    }
    c.values = std::move(nums);
    return c;
}

inline column make_text_column(std::string name,
                               const std::vector<std::optional<std::string>>& cells,
                               logical_type type = logical_type::string_) {
    column c;
    c.name = std::move(name);
    c.type = type;
    std::vector<std::string> text(cells.size());
    c.missing.assign(cells.size(), 0);
    for (std::size_t i = 0; i < cells.size(); ++i) {
        if (cells[i]) text[i] = *cells[i];
        else          c.missing[i] = 1;
    }
    c.values = std::move(text);
    return c;
}

/**
 * Column-oriented, rectangular dataset.
 *
 * The row count is either declared up front or fixed by the first column;
 * every later column must match it. The profiler only ever reads a table.
 */
class table {
public:
    table() = default;
    explicit table(std::size_t rows) : rows_(rows), rows_fixed_(true) {}

    /**
     * Appends a column.
     * @throws unrectangular_input_error when its length differs from row_count()
     *         or its value storage is shorter/longer than its missing mask.
     * @throws type_mismatch_error when numeric types are not stored as doubles.
     * @throws dataset_error on a duplicate column name.
     */
    void add_column(column c) {
        if (c.storage_size() != c.size())
            throw unrectangular_input_error("column '" + c.name + "' values", c.size(), c.storage_size());
        if (is_numeric(c.type) != std::holds_alternative<std::vector<double>>(c.values))
            throw type_mismatch_error(c.name);
        if (find(c.name))
            throw dataset_error("duplicate column name '" + c.name + "'");
        if (!rows_fixed_) {
            rows_ = c.size();
            rows_fixed_ = true;
        } else if (c.size() != rows_) {
            throw unrectangular_input_error("column '" + c.name + "'", rows_, c.size());
        }
        columns_.push_back(std::move(c));
    }

    std::size_t row_count() const noexcept { return rows_; }
    std::size_t column_count() const noexcept { return columns_.size(); }

    const std::vector<column>& columns() const noexcept { return columns_; }
    const column& operator[](std::size_t i) const { return columns_.at(i); }

    std::optional<std::size_t> find(const std::string& name) const {
        for (std::size_t i = 0; i < columns_.size(); ++i)
            if (columns_[i].name == name) return i;
        return std::nullopt;
    }

private:
    std::size_t rows_ = 0;
    bool rows_fixed_ = false;
    std::vector<column> columns_;
};

}
