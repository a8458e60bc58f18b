#pragma once

#include "estimap/Grid.hpp"
#include "estimap/RunContext.hpp"
#include "estimap/Status.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace estimap {

// How no-data behaves when several grids are summed.
enum class NoDataPolicy : std::uint8_t {
  // Any no-data input makes the sum no-data.
  Propagate = 0,
  // No-data inputs contribute 0; the sum is no-data only if every input is.
  ZeroContribution = 1,
};

const char* NoDataPolicyName(NoDataPolicy p);
bool ParseNoDataPolicy(const std::string& s, NoDataPolicy* out);

struct NormalizeConfig {
  NoDataPolicy noData = NoDataPolicy::Propagate;

  // When > 0, normalized values with |v| < zeroFloor become exactly 0.
  double zeroFloor = 0.0;

  // Used in warnings and errors ("potential", "water", ...).
  std::string label;
};

struct NormalizeResult {
  Grid grid;

  // Range of the summed grid over valid cells.
  double min = 0.0;
  double max = 0.0;
  std::size_t validCount = 0;

  // max == min: every valid output cell is 0.
  bool degenerate = false;

  std::vector<std::string> warnings;
};

// Elementwise sum of aligned grids under `policy`. The run mask is applied.
// An infinite input value is a ConfigError.
bool SumGrids(const RunContext& ctx, const std::vector<const Grid*>& inputs, NoDataPolicy policy, Grid& out,
              Error& outError, const std::string& label = {});

// Sum, then min-max scale into [0,1]:
//   (sum - min) / (max - min)
// followed by the optional zero floor. A degenerate range is a warning, not
// an error. An empty input list or a sum that overflows is a ConfigError.
bool NormalizeComponent(const RunContext& ctx, const std::vector<const Grid*>& inputs, const NormalizeConfig& cfg,
                        NormalizeResult& out, Error& outError);

} // namespace estimap
