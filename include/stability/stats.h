#pragma once

#include <algorithm>
#include <cmath>
#include <numeric>
#include <vector>

namespace stability {

// Population statistics over a sample of scores
struct Stats {
    double mean = 0.0;
    double variance = 0.0;
    double stddev = 0.0;
    double min = 0.0;
    double max = 0.0;
    size_t count = 0;

    static Stats compute(std::vector<double> const& values) {
        Stats s;
        if (values.empty()) return s;

        s.count = values.size();
        auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());
        s.min = *min_it;
        s.max = *max_it;

        double sum = std::accumulate(values.begin(), values.end(), 0.0);
        s.mean = sum / values.size();

        double sq_sum = 0.0;
        for (double v : values) {
            sq_sum += (v - s.mean) * (v - s.mean);
        }
        s.variance = sq_sum / values.size();
        s.stddev = std::sqrt(s.variance);

        // Rounding in the sum can push the mean a hair outside [min, max]
        s.mean = std::clamp(s.mean, s.min, s.max);

        return s;
    }
};

inline double mean(std::vector<double> const& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

} // namespace stability
