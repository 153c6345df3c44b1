#pragma once
#include "profile/profile.hpp"
#include "profile/stats.hpp"
#include "table/table.hpp"
#include "util/errors.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace bprof {

inline constexpr std::size_t k_max_top_values = 5;

struct profile_options {
    unsigned threads = 1;   // >1 profiles columns on worker threads
};

inline column_profile profile_numeric(const column& col, const std::vector<double>& values) {
    numeric_stats ns;
    for (std::size_t r = 0; r < col.size(); ++r)
        if (!col.is_missing(r)) ns.add(values[r]);
    ns.finish();

    column_profile cp;
    cp.count    = ns.count;
    cp.distinct = ns.distinct();

    numeric_summary sum;
    if (ns.count > 0) {
        const double median = ns.quantile(0.50);
        sum.min     = ns.min;
        sum.max     = ns.max;
        sum.mean    = ns.mean;
        sum.median  = median;
        sum.std_dev = ns.stddev();
        sum.quantiles = quantile_set{ns.quantile(0.25), median, ns.quantile(0.75),
                                     ns.quantile(0.90), ns.quantile(0.99)};
    }
    cp.detail = std::move(sum);
    return cp;
}

inline column_profile profile_categorical(const column& col, const std::vector<std::string>& values) {
    categorical_stats cs;
    for (std::size_t r = 0; r < col.size(); ++r)
        if (!col.is_missing(r)) cs.add(values[r]);

    column_profile cp;
    cp.count    = cs.count;
    cp.distinct = cs.distinct();

    categorical_summary sum;
    for (auto& e : cs.top(k_max_top_values))
        sum.top_values.push_back(top_value{std::move(e.value), e.count});
    cp.detail = std::move(sum);
    return cp;
}

/**
 * Profiles one column. Numeric logical types (int64, float64) get a
 * distribution summary; every other type is summarised by frequency.
 *
 * @throws type_mismatch_error when a numeric column is not stored as doubles.
 * @throws unrectangular_input_error when values and missing mask disagree in length.
 */
inline column_profile profile_column(const column& col) {
    if (col.storage_size() != col.size())
        throw unrectangular_input_error("column '" + col.name + "' values", col.size(), col.storage_size());

    column_profile cp;
    if (is_numeric(col.type)) {
        const auto* nums = std::get_if<std::vector<double>>(&col.values);
        if (!nums) throw type_mismatch_error(col.name);
        cp = profile_numeric(col, *nums);
    } else if (const auto* text = std::get_if<std::vector<std::string>>(&col.values)) {
        cp = profile_categorical(col, *text);
    } else {
        // bool/date/string columns stored as numbers: stringify rather than fail
        const auto& nums = std::get<std::vector<double>>(col.values);
        std::vector<std::string> text_values(nums.size());
        for (std::size_t r = 0; r < nums.size(); ++r)
            if (!col.is_missing(r)) text_values[r] = fmt::format("{}", nums[r]);
        cp = profile_categorical(col, text_values);
    }
    cp.name        = col.name;
    cp.source_type = col.type;
    cp.missing     = col.size() - cp.count;
    return cp;
}

/**
 * Builds the baseline profile of a table. Pure: reads the table, no I/O.
 *
 * Columns are independent. With opt.threads > 1 they are claimed by workers
 * from a shared counter and written to their own slot, so the result is the
 * same as the sequential pass. The first failing column (in column order)
 * aborts the whole call.
 */
inline dataset_profile profile(const table& t, const profile_options& opt = {}) {
    dataset_profile out;
    out.total_rows = t.row_count();
    out.columns.resize(t.column_count());

    const std::size_t ncols = t.column_count();
    const std::size_t workers = std::min<std::size_t>(std::max(1u, opt.threads), ncols);

    if (workers <= 1) {
        for (std::size_t i = 0; i < ncols; ++i) out.columns[i] = profile_column(t[i]);
        return out;
    }

    std::vector<std::exception_ptr> failures(ncols);
    std::atomic<std::size_t> next{0};
    auto work = [&]() {
        for (std::size_t i = next++; i < ncols; i = next++) {
            try {
                out.columns[i] = profile_column(t[i]);
            } catch (...) {
                failures[i] = std::current_exception();
            }
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (std::size_t w = 0; w < workers; ++w) pool.emplace_back(work);
    for (auto& th : pool) th.join();

    for (auto& f : failures)
        if (f) std::rethrow_exception(f);
    return out;
}

}
