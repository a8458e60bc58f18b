#include "estimap/Reduce.hpp"

#include <cmath>

namespace estimap {

namespace {

constexpr std::size_t kPairwiseBlock = 128;

} // namespace

double PairwiseSum(const double* values, std::size_t n)
{
  if (!values || n == 0) return 0.0;
  if (n <= kPairwiseBlock) {
    double s = 0.0;
    for (std::size_t i = 0; i < n; ++i) s += values[i];
    return s;
  }
  const std::size_t half = n / 2;
  return PairwiseSum(values, half) + PairwiseSum(values + half, n - half);
}

std::vector<double> CollectValid(const std::vector<double>& values)
{
  std::vector<double> out;
  out.reserve(values.size());
  for (double v : values) {
    if (!std::isnan(v)) out.push_back(v);
  }
  return out;
}

double SumValid(const std::vector<double>& values)
{
  return PairwiseSum(CollectValid(values));
}

} // namespace estimap
