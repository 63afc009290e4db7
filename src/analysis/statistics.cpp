// File: src/analysis/statistics.cpp
#include "analysis/statistics.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace recur {
namespace stats {

double Mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double StdDev(const std::vector<double>& values) {
    if (values.size() < 2) {
        return 0.0;
    }
    double mean = Mean(values);
    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += (v - mean) * (v - mean);
    }
    return std::sqrt(sum_sq / values.size());
}

double Median(std::vector<double> values) {
    if (values.empty()) {
        return 0.0;
    }
    std::sort(values.begin(), values.end());
    size_t mid = values.size() / 2;
    if (values.size() % 2 == 0) {
        return (values[mid - 1] + values[mid]) / 2.0;
    }
    return values[mid];
}

double Regularity(const std::vector<double>& values) {
    if (values.size() < 2) {
        return 0.5;
    }
    return 1.0 / (1.0 + StdDev(values) / (Mean(values) + 1.0));
}

int Mode(const std::vector<int>& values, size_t* count) {
    if (values.empty()) {
        throw std::invalid_argument("Mode of an empty sample");
    }

    int best = values.front();
    size_t best_count = 0;
    std::vector<int> seen;
    for (int candidate : values) {
        if (std::find(seen.begin(), seen.end(), candidate) != seen.end()) {
            continue;
        }
        seen.push_back(candidate);
        size_t n = static_cast<size_t>(std::count(values.begin(), values.end(), candidate));
        if (n > best_count) {
            best = candidate;
            best_count = n;
        }
    }

    if (count) {
        *count = best_count;
    }
    return best;
}

}  // namespace stats
}  // namespace recur
