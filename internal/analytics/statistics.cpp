#include "statistics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace netorch::analytics {

namespace {

// Summation residue on a constant series stays far below this.
constexpr double kRelativeTolerance = 1e-9;

} // namespace

double Mean(const std::vector<double>& values) {
  if (values.empty()) return 0.0;
  return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double SampleStdDev(const std::vector<double>& values) {
  if (values.size() < 2) return 0.0;

  const double mean = Mean(values);
  double       sum  = 0.0;
  for (double v : values) sum += (v - mean) * (v - mean);
  const double sd = std::sqrt(sum / static_cast<double>(values.size() - 1));
  if (sd <= kRelativeTolerance * std::max(1.0, std::abs(mean))) return 0.0;
  return sd;
}

double ZScore(double value, double mean, double stdev) {
  if (stdev == 0.0) return 0.0;
  return (value - mean) / stdev;
}

} // namespace netorch::analytics
