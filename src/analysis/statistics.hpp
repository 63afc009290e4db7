// File: src/analysis/statistics.hpp
#pragma once

#include <cstddef>
#include <vector>

namespace recur {
namespace stats {

/// Arithmetic mean, 0 for an empty sample
double Mean(const std::vector<double>& values);

/// Population standard deviation, 0 for fewer than two values
double StdDev(const std::vector<double>& values);

/// Median, 0 for an empty sample
double Median(std::vector<double> values);

/// Inverse-dispersion score 1 / (1 + std / (mean + 1)), in (0, 1].
/// Returns 0.5 when fewer than two values are given.
double Regularity(const std::vector<double>& values);

/// Most frequent value; ties go to the value seen first
int Mode(const std::vector<int>& values, size_t* count = nullptr);

}  // namespace stats
}  // namespace recur
