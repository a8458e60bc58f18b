#pragma once

#include <cstddef>
#include <vector>

namespace estimap {

// Deterministic reductions.
//
// Summation is pairwise over the values in the order given: results depend
// only on the input sequence, never on threading.

double PairwiseSum(const double* values, std::size_t n);

inline double PairwiseSum(const std::vector<double>& values)
{
  return PairwiseSum(values.data(), values.size());
}

// Valid (non-NaN) values of `values`, in order.
std::vector<double> CollectValid(const std::vector<double>& values);

// Pairwise sum of the valid cells of a row-major buffer.
double SumValid(const std::vector<double>& values);

} // namespace estimap
