#include "estimap/Normalize.hpp"

#include "estimap/Parallel.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <utility>

namespace estimap {

const char* NoDataPolicyName(NoDataPolicy p)
{
  switch (p) {
  case NoDataPolicy::Propagate: return "propagate";
  case NoDataPolicy::ZeroContribution: return "zero";
  default: return "unknown";
  }
}

bool ParseNoDataPolicy(const std::string& s, NoDataPolicy* out)
{
  if (!out) return false;
  if (s == "propagate") {
    *out = NoDataPolicy::Propagate;
    return true;
  }
  if (s == "zero" || s == "zero_contribution") {
    *out = NoDataPolicy::ZeroContribution;
    return true;
  }
  return false;
}

bool SumGrids(const RunContext& ctx, const std::vector<const Grid*>& inputs, NoDataPolicy policy, Grid& out,
              Error& outError, const std::string& label)
{
  const std::string name = label.empty() ? std::string("component") : label;
  if (inputs.empty()) {
    return Fail(outError, ErrorCode::Config, "no input grids for '" + name + "'");
  }
  for (std::size_t k = 0; k < inputs.size(); ++k) {
    if (!inputs[k]) {
      return Fail(outError, ErrorCode::Config, "null input grid for '" + name + "'");
    }
    if (!ctx.checkAligned(*inputs[k], name + "[" + std::to_string(k) + "]", outError)) return false;
  }
  for (std::size_t k = 0; k < inputs.size(); ++k) {
    const Grid& g = *inputs[k];
    for (std::size_t i = 0; i < g.size(); ++i) {
      if (std::isinf(g[i])) {
        return Fail(outError, ErrorCode::Config,
                    "non-finite value in '" + name + "[" + std::to_string(k) + "]' at cell " + std::to_string(i));
      }
    }
  }

  const GridGeometry& geom = ctx.geometry();
  Grid sum(geom);
  const int w = geom.cols;

  ForEachRow(geom.rows, ctx.threads(), [&](int y) {
    for (int x = 0; x < w; ++x) {
      const std::size_t i = sum.index(x, y);
      if (ctx.excluded(i)) continue;

      double s = 0.0;
      bool any = false;
      bool missing = false;
      for (const Grid* g : inputs) {
        const double v = (*g)[i];
        if (Grid::IsNoData(v)) {
          missing = true;
          continue;
        }
        s += v;
        any = true;
      }

      if (!any) continue;
      if (missing && policy == NoDataPolicy::Propagate) continue;
      sum[i] = s;
    }
  });

  out = std::move(sum);
  return true;
}

bool NormalizeComponent(const RunContext& ctx, const std::vector<const Grid*>& inputs, const NormalizeConfig& cfg,
                        NormalizeResult& out, Error& outError)
{
  const std::string name = cfg.label.empty() ? std::string("component") : cfg.label;

  NormalizeResult res;
  Grid sum;
  if (!SumGrids(ctx, inputs, cfg.noData, sum, outError, name)) return false;

  // Sequential min/max scan.
  double lo = std::numeric_limits<double>::infinity();
  double hi = -std::numeric_limits<double>::infinity();
  std::size_t valid = 0;
  for (std::size_t i = 0; i < sum.size(); ++i) {
    const double v = sum[i];
    if (Grid::IsNoData(v)) continue;
    if (std::isinf(v)) {
      return Fail(outError, ErrorCode::Config, "sum of '" + name + "' overflows at cell " + std::to_string(i));
    }
    lo = std::min(lo, v);
    hi = std::max(hi, v);
    ++valid;
  }

  res.validCount = valid;
  if (valid == 0) {
    res.min = 0.0;
    res.max = 0.0;
    res.degenerate = true;
    res.warnings.push_back("'" + name + "' has no valid cells");
    res.grid = std::move(sum);
    out = std::move(res);
    return true;
  }

  res.min = lo;
  res.max = hi;

  const double range = hi - lo;
  if (!(range > 0.0)) {
    res.degenerate = true;
    std::ostringstream oss;
    oss.precision(17);
    oss << "'" << name << "' has a degenerate range (min == max == " << lo << "); output set to 0";
    res.warnings.push_back(oss.str());
  }

  const double floor = cfg.zeroFloor;
  const int w = sum.cols();
  ForEachRow(sum.rows(), ctx.threads(), [&](int y) {
    for (int x = 0; x < w; ++x) {
      const std::size_t i = sum.index(x, y);
      const double v = sum[i];
      if (Grid::IsNoData(v)) continue;
      double n = res.degenerate ? 0.0 : (v - lo) / range;
      if (floor > 0.0 && std::fabs(n) < floor) n = 0.0;
      sum[i] = n;
    }
  });

  res.grid = std::move(sum);
  out = std::move(res);
  return true;
}

} // namespace estimap
