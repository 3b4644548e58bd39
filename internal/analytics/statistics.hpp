#pragma once

#include <vector>

namespace netorch::analytics {

// 0 for an empty set.
double Mean(const std::vector<double>& values);

// Sample standard deviation (n - 1). 0 for fewer than two values, and for
// a spread within rounding of the mean.
double SampleStdDev(const std::vector<double>& values);

// (value - mean) / stdev, or 0 when stdev is 0.
double ZScore(double value, double mean, double stdev);

} // namespace netorch::analytics
