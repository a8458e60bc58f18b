#include "estimap/Scorer.hpp"

#include "estimap/Parallel.hpp"

#include <sstream>
#include <utility>

namespace estimap {

const char* UnscoredPolicyName(UnscoredPolicy p)
{
  switch (p) {
  case UnscoredPolicy::Error: return "error";
  case UnscoredPolicy::NoData: return "nodata";
  default: return "unknown";
  }
}

bool ParseUnscoredPolicy(const std::string& s, UnscoredPolicy* out)
{
  if (!out) return false;
  if (s == "error") {
    *out = UnscoredPolicy::Error;
    return true;
  }
  if (s == "nodata" || s == "null") {
    *out = UnscoredPolicy::NoData;
    return true;
  }
  return false;
}

bool ScoreGrid(const RunContext& ctx, const Grid& input, const RuleTable& table, const ScoreConfig& cfg,
               ScoreResult& out, Error& outError)
{
  const std::string label = cfg.label.empty() ? std::string("input") : cfg.label;
  if (!ctx.checkAligned(input, label, outError)) return false;
  if (table.empty()) {
    return Fail(outError, ErrorCode::Config, "empty rule table for '" + label + "'");
  }

  const int w = input.cols();
  const int h = input.rows();
  Grid result(input.geometry());

  // Per-row bookkeeping so the first unscored value is reported in row-major order.
  std::vector<std::size_t> rowUnscored(static_cast<std::size_t>(h), 0);
  std::vector<double> rowFirstValue(static_cast<std::size_t>(h), 0.0);

  ForEachRow(h, ctx.threads(), [&](int y) {
    std::size_t missing = 0;
    for (int x = 0; x < w; ++x) {
      const std::size_t i = input.index(x, y);
      const double v = input[i];
      if (Grid::IsNoData(v) || ctx.excluded(i)) continue;

      const Rule* r = table.match(v);
      if (!r) {
        if (missing == 0) rowFirstValue[static_cast<std::size_t>(y)] = v;
        ++missing;
        continue;
      }
      result[i] = r->scoreAt(v);
    }
    rowUnscored[static_cast<std::size_t>(y)] = missing;
  });

  std::size_t total = 0;
  double first = 0.0;
  for (int y = 0; y < h; ++y) {
    const std::size_t n = rowUnscored[static_cast<std::size_t>(y)];
    if (n > 0 && total == 0) first = rowFirstValue[static_cast<std::size_t>(y)];
    total += n;
  }

  ScoreResult res;
  if (total > 0) {
    std::ostringstream oss;
    oss.precision(17);
    oss << total << " cell(s) of '" << label << "' match no rule (first value: " << first << ")";
    if (cfg.unscored == UnscoredPolicy::Error) {
      return Fail(outError, ErrorCode::UnscoredValue, oss.str());
    }
    res.warnings.push_back(oss.str() + "; set to no-data");
  }

  res.unscoredCount = total;
  res.grid = std::move(result);
  ctx.applyMask(res.grid);
  out = std::move(res);
  return true;
}

bool ResolveScoreTable(const RuleSource& explicitSource, Nomenclature fallback, RuleTable& out, Error& outError)
{
  if (!explicitSource.empty()) return LoadRuleTable(explicitSource, out, outError);
  return BuiltinRuleTable(fallback, out, outError);
}

} // namespace estimap
