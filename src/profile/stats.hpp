#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace bprof {

struct numeric_stats {
    std::size_t count{0};
    double min{0.0}, max{0.0};
    double mean{0.0}, m2{0.0}; // Welford
    std::vector<double> sample; // sorted by finish()

    void add(double x) {
        ++count;
        if (count == 1) { min = max = x; mean = x; m2 = 0.0; }
        else {
            if (x < min) min = x;
            if (x > max) max = x;
            double delta = x - mean;
            mean += delta / static_cast<double>(count);
            m2 += delta * (x - mean);
        }
        sample.push_back(x);
    }
    void finish() { std::sort(sample.begin(), sample.end()); }

    // Sample (n-1) variance; a single value has zero spread.
    double variance() const { return count > 1 ? m2 / static_cast<double>(count - 1) : 0.0; }
    double stddev() const { return std::sqrt(variance()); }

    // Linear interpolation between closest ranks, pos = q * (n - 1). Needs finish().
    double quantile(double q) const {
        if (sample.empty()) return 0.0;
        double pos = q * static_cast<double>(sample.size() - 1);
        std::size_t i = static_cast<std::size_t>(pos);
        double frac = pos - static_cast<double>(i);
        if (i + 1 < sample.size()) return sample[i] + (sample[i + 1] - sample[i]) * frac;
        return sample[i];
    }

    std::size_t distinct() const {
        std::size_t n = 0;
        for (std::size_t i = 0; i < sample.size(); ++i)
            if (i == 0 || sample[i] != sample[i - 1]) ++n;
        return n;
    }
};

// Frequency table that remembers first-appearance order.
struct categorical_stats {
    struct entry {
        std::string   value;
        std::uint64_t count = 0;
    };

    std::size_t count{0};
    std::unordered_map<std::string, std::size_t> index;
    std::vector<entry> entries; // first-appearance order

    void add(const std::string& s) {
        ++count;
        auto it = index.find(s);
        if (it == index.end()) {
            index.emplace(s, entries.size());
            entries.push_back(entry{s, 1});
        } else {
            ++entries[it->second].count;
        }
    }

    std::size_t distinct() const { return entries.size(); }

    std::vector<entry> top(std::size_t n) const {
        std::vector<entry> ranked = entries;
        std::stable_sort(ranked.begin(), ranked.end(),
                         [](const entry& a, const entry& b) { return a.count > b.count; });
        if (ranked.size() > n) ranked.resize(n);
        return ranked;
    }
};

}
