#pragma once

#include <vector>
#include <numeric>
#include <algorithm>

namespace merchant {

class Statistics {
public:
    static double clamp(double value, double lo, double hi) {
        return std::max(lo, std::min(hi, value));
    }

    static double mean(const std::vector<double>& data, double fallback = 0.0) {
        if (data.empty()) return fallback;
        return std::accumulate(data.begin(), data.end(), 0.0) / data.size();
    }

    // Return between the last two points; 0 when the previous point is 0
    static double lastReturn(const std::vector<double>& prices) {
        if (prices.size() < 2) return 0.0;

        double previous = prices[prices.size() - 2];
        if (previous == 0.0) return 0.0;

        return (prices.back() - previous) / previous;
    }

    // Fold with diminishing returns: acc += x * (1 - acc * damping)
    static double diminishingSum(const std::vector<double>& values, double damping = 0.5) {
        double acc = 0.0;
        for (double v : values) {
            acc += v * (1.0 - acc * damping);
        }
        return acc;
    }
};

} // namespace merchant
