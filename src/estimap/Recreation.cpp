#include "estimap/Recreation.hpp"

#include "estimap/Parallel.hpp"

#include <cmath>
#include <sstream>
#include <utility>

namespace estimap {

const char* ProximityClassName(ProximityClass c)
{
  switch (c) {
  case ProximityClass::Near: return "near";
  case ProximityClass::Midrange: return "midrange";
  case ProximityClass::Far: return "far";
  default: return "unknown";
  }
}

bool ValidateCutPoints(const ClassCutPoints& cuts, Error& outError)
{
  if (std::isfinite(cuts.low) && std::isfinite(cuts.high) && cuts.low >= 0.0 && cuts.low < cuts.high &&
      cuts.high <= 1.0) {
    return true;
  }
  std::ostringstream oss;
  oss << "invalid class cut points (" << cuts.low << ", " << cuts.high << "); expected 0 <= low < high <= 1";
  return Fail(outError, ErrorCode::Config, oss.str());
}

int ClassifyValue(double v, const ClassCutPoints& cuts)
{
  if (v <= cuts.low) return 1;
  if (v <= cuts.high) return 2;
  return 3;
}

bool ClassifyIndex(const RunContext& ctx, const Grid& index, const ClassCutPoints& cuts, Grid& out,
                   Error& outError, const std::string& label)
{
  const std::string name = label.empty() ? std::string("index") : label;
  if (!ValidateCutPoints(cuts, outError)) return false;
  if (!ctx.checkAligned(index, name, outError)) return false;

  Grid result(index.geometry());
  const int w = index.cols();
  ForEachRow(index.rows(), ctx.threads(), [&](int y) {
    for (int x = 0; x < w; ++x) {
      const std::size_t i = index.index(x, y);
      const double v = index[i];
      if (Grid::IsNoData(v) || ctx.excluded(i)) continue;
      result[i] = static_cast<double>(ClassifyValue(v, cuts));
    }
  });

  out = std::move(result);
  return true;
}

int SpectrumClass(int potentialClass, int opportunityClass)
{
  if (potentialClass < 1 || potentialClass > 3) return 0;
  if (opportunityClass < 1 || opportunityClass > 3) return 0;
  return (potentialClass - 1) * 3 + opportunityClass;
}

bool ComputeSpectrum(const RunContext& ctx, const Grid& potentialClasses, const Grid& opportunityClasses, Grid& out,
                     Error& outError)
{
  if (!ctx.checkAligned(potentialClasses, "potential", outError)) return false;
  if (!ctx.checkAligned(opportunityClasses, "opportunity", outError)) return false;

  Grid result(ctx.geometry());
  for (std::size_t i = 0; i < result.size(); ++i) {
    const double p = potentialClasses[i];
    const double o = opportunityClasses[i];
    if (Grid::IsNoData(p) || Grid::IsNoData(o) || ctx.excluded(i)) continue;
    const int s = SpectrumClass(static_cast<int>(p), static_cast<int>(o));
    if (s == 0) {
      std::ostringstream oss;
      oss << "invalid class pair (" << p << ", " << o << ") at cell " << i;
      return Fail(outError, ErrorCode::Config, oss.str());
    }
    result[i] = static_cast<double>(s);
  }

  out = std::move(result);
  return true;
}

namespace {

// One grid enters as is (masked); several are normalized into one index.
bool BuildComponentIndex(const RunContext& ctx, const std::vector<const Grid*>& grids, const PotentialConfig& cfg,
                         const std::string& label, Grid& out, std::vector<std::string>& warnings, Error& outError)
{
  if (grids.size() == 1) {
    if (!grids[0]) return Fail(outError, ErrorCode::Config, "null input grid for '" + label + "'");
    if (!ctx.checkAligned(*grids[0], label, outError)) return false;
    out = *grids[0];
    ctx.applyMask(out);
    return true;
  }

  NormalizeConfig nc;
  nc.noData = cfg.noData;
  nc.zeroFloor = cfg.componentZeroFloor;
  nc.label = label;
  NormalizeResult r;
  if (!NormalizeComponent(ctx, grids, nc, r, outError)) return false;
  warnings.insert(warnings.end(), r.warnings.begin(), r.warnings.end());
  out = std::move(r.grid);
  return true;
}

bool SmoothComponent(const RunContext& ctx, const PotentialConfig& cfg, const std::string& label, Grid& io,
                     Error& outError)
{
  Grid smoothed;
  if (!NeighborhoodAverage(ctx, io, cfg.averageWindow, smoothed, outError, label)) return false;
  io = std::move(smoothed);
  return true;
}

} // namespace

bool ComputePotential(const RunContext& ctx, const PotentialInputs& in, const PotentialConfig& cfg,
                      PotentialResult& out, Error& outError)
{
  if (!in.land) {
    return Fail(outError, ErrorCode::Config, "recreation potential requires exactly one land grid");
  }
  if (!ctx.checkAligned(*in.land, "land", outError)) return false;

  PotentialResult res;

  res.land = *in.land;
  if (cfg.landNoDataAsZero) {
    for (std::size_t i = 0; i < res.land.size(); ++i) {
      if (Grid::IsNoData(res.land[i]) && !ctx.excluded(i)) res.land[i] = 0.0;
    }
  }
  ctx.applyMask(res.land);

  if (!in.water.empty() &&
      !BuildComponentIndex(ctx, in.water, cfg, "water", res.water, res.warnings, outError)) {
    return false;
  }
  if (!in.natural.empty() &&
      !BuildComponentIndex(ctx, in.natural, cfg, "natural", res.natural, res.warnings, outError)) {
    return false;
  }
  if (!in.urban.empty() &&
      !BuildComponentIndex(ctx, in.urban, cfg, "urban", res.urban, res.warnings, outError)) {
    return false;
  }

  if (cfg.averageFilter) {
    if (!SmoothComponent(ctx, cfg, "land", res.land, outError)) return false;
    if (!res.natural.empty() && !SmoothComponent(ctx, cfg, "natural", res.natural, outError)) return false;
  }

  std::vector<const Grid*> components;
  components.push_back(&res.land);
  if (!res.water.empty()) components.push_back(&res.water);
  if (!res.natural.empty()) components.push_back(&res.natural);
  if (!res.urban.empty()) components.push_back(&res.urban);

  NormalizeConfig nc;
  nc.noData = cfg.noData;
  nc.label = "potential";
  if (!NormalizeComponent(ctx, components, nc, res.potential, outError)) return false;
  res.warnings.insert(res.warnings.end(), res.potential.warnings.begin(), res.potential.warnings.end());

  out = std::move(res);
  return true;
}

bool ComputeInfrastructure(const RunContext& ctx, const InfrastructureInputs& in, const InfrastructureConfig& cfg,
                           InfrastructureResult& out, Error& outError)
{
  if (!in.any()) {
    return Fail(outError, ErrorCode::Config, "no infrastructure input (distance, or artificial and roads)");
  }
  if ((in.artificial != nullptr) != (in.roads != nullptr)) {
    return Fail(outError, ErrorCode::Config, "'artificial' and 'roads' must be given together");
  }

  InfrastructureResult res;
  std::vector<const Grid*> parts;

  if (in.distance) {
    if (!ComputeAttractiveness(ctx, *in.distance, cfg.schedule, cfg.decay, res.distanceAttractiveness, outError,
                               "infrastructure")) {
      return false;
    }
    parts.push_back(&res.distanceAttractiveness);
  }

  if (in.artificial && in.roads) {
    if (!ComputeArtificialAccessibility(ctx, *in.artificial, *in.roads, cfg.artificialCategories,
                                        cfg.roadsCategories, res.artificial, outError)) {
      return false;
    }
    res.warnings.insert(res.warnings.end(), res.artificial.warnings.begin(), res.artificial.warnings.end());
    parts.push_back(&res.artificial.accessibility);
  }

  if (parts.size() == 1) {
    res.index = *parts[0];
  } else {
    NormalizeConfig nc;
    nc.noData = cfg.noData;
    nc.label = "infrastructure";
    NormalizeResult r;
    if (!NormalizeComponent(ctx, parts, nc, r, outError)) return false;
    res.warnings.insert(res.warnings.end(), r.warnings.begin(), r.warnings.end());
    res.index = std::move(r.grid);
  }
  ctx.applyMask(res.index);

  out = std::move(res);
  return true;
}

bool ComputeOpportunity(const RunContext& ctx, const Grid& potential, const Grid& infrastructure,
                        const OpportunityConfig& cfg, NormalizeResult& out, Error& outError)
{
  NormalizeConfig nc;
  nc.noData = cfg.noData;
  nc.zeroFloor = cfg.zeroFloor;
  nc.label = "opportunity";
  return NormalizeComponent(ctx, {&potential, &infrastructure}, nc, out, outError);
}

} // namespace estimap
