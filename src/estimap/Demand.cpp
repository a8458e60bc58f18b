#include "estimap/Demand.hpp"

#include "estimap/Parallel.hpp"
#include "estimap/Reduce.hpp"

#include <sstream>
#include <utility>

namespace estimap {

const char* AppealSourceName(AppealSource a)
{
  switch (a) {
  case AppealSource::Potential: return "potential";
  case AppealSource::Spectrum: return "spectrum";
  default: return "unknown";
  }
}

bool ParseAppealSource(const std::string& s, AppealSource* out)
{
  if (!out) return false;
  if (s == "potential") {
    *out = AppealSource::Potential;
    return true;
  }
  if (s == "spectrum") {
    *out = AppealSource::Spectrum;
    return true;
  }
  return false;
}

bool ComputeDemand(const RunContext& ctx, const Grid& population, const Grid& appeal, AppealSource source,
                   Grid& out, Error& outError)
{
  if (!ctx.checkAligned(population, "population", outError)) return false;
  if (!ctx.checkAligned(appeal, AppealSourceName(source), outError)) return false;

  Grid result(ctx.geometry());
  const int w = result.cols();
  ForEachRow(result.rows(), ctx.threads(), [&](int y) {
    for (int x = 0; x < w; ++x) {
      const std::size_t i = result.index(x, y);
      const double p = population[i];
      const double a = appeal[i];
      if (Grid::IsNoData(p) || Grid::IsNoData(a) || ctx.excluded(i)) continue;
      const double weight = (source == AppealSource::Spectrum) ? (a - 1.0) / 8.0 : a;
      result[i] = p * weight;
    }
  });

  out = std::move(result);
  return true;
}

bool ComputeSupply(const RunContext& ctx, const Grid& potential, const Grid& demand, double capacityPerCell,
                   SupplyResult& out, Error& outError)
{
  if (!ctx.checkAligned(potential, "potential", outError)) return false;
  if (!ctx.checkAligned(demand, "demand", outError)) return false;

  SupplyResult res;
  if (capacityPerCell > 0.0) {
    res.capacity = capacityPerCell;
  } else {
    std::vector<double> d;
    std::vector<double> p;
    for (std::size_t i = 0; i < potential.size(); ++i) {
      if (ctx.excluded(i) || !potential.isValid(i) || !demand.isValid(i)) continue;
      d.push_back(demand[i]);
      p.push_back(potential[i]);
    }
    const double totalDemand = PairwiseSum(d);
    const double totalPotential = PairwiseSum(p);
    if (totalPotential > 0.0) {
      res.capacity = totalDemand / totalPotential;
    } else {
      res.capacity = 0.0;
      res.warnings.push_back("total potential is 0; supply capacity set to 0");
    }
  }

  res.supply = Grid(ctx.geometry());
  for (std::size_t i = 0; i < potential.size(); ++i) {
    if (ctx.excluded(i) || !potential.isValid(i)) continue;
    res.supply[i] = potential[i] * res.capacity;
  }

  out = std::move(res);
  return true;
}

bool ComputeUnmetDemand(const RunContext& ctx, const Grid& demand, const Grid& supply, Grid& out, Error& outError)
{
  if (!ctx.checkAligned(demand, "demand", outError)) return false;
  if (!ctx.checkAligned(supply, "supply", outError)) return false;

  Grid result(ctx.geometry());
  for (std::size_t i = 0; i < result.size(); ++i) {
    if (ctx.excluded(i) || !demand.isValid(i) || !supply.isValid(i)) continue;
    result[i] = demand[i] - supply[i];
  }
  out = std::move(result);
  return true;
}

bool ComputeMobility(const RunContext& ctx, const Grid& demand, const Grid& distance, const DecaySchedule& schedule,
                     const DecayConfig& decay, MobilityResult& out, Error& outError)
{
  if (!ctx.checkAligned(demand, "demand", outError)) return false;
  if (!ctx.checkAligned(distance, "mobility_distance", outError)) return false;
  if (schedule.empty()) {
    return Fail(outError, ErrorCode::Config, "empty mobility decay schedule");
  }

  // With an open-ended last band, uncovered distances are no-data.
  const bool openEnded = schedule.lastOpenEnded();
  const int bandCount = static_cast<int>(schedule.bands.size());
  const int included = openEnded ? bandCount - 1 : bandCount;

  const int w = demand.cols();
  const int h = demand.rows();
  Grid result(ctx.geometry());
  std::vector<std::size_t> rowUncovered(static_cast<std::size_t>(h), 0);
  std::vector<double> rowFirstValue(static_cast<std::size_t>(h), 0.0);

  ForEachRow(h, ctx.threads(), [&](int y) {
    std::size_t missing = 0;
    for (int x = 0; x < w; ++x) {
      const std::size_t i = result.index(x, y);
      const double d = demand[i];
      const double v = distance[i];
      if (Grid::IsNoData(d) || Grid::IsNoData(v) || ctx.excluded(i)) continue;

      const int b = schedule.bandIndex(v);
      if (b < 0) {
        if (openEnded) continue;
        if (missing == 0) rowFirstValue[static_cast<std::size_t>(y)] = v;
        ++missing;
        continue;
      }

      // Visits only accrue in the band containing v; the excluded band adds nothing.
      double visits = 0.0;
      if (b < included) {
        const DistanceCategory& c = schedule.bands[static_cast<std::size_t>(b)];
        visits = d * Attractiveness(v, c.kappa, c.alpha, decay);
      }
      result[i] = visits;
    }
    rowUncovered[static_cast<std::size_t>(y)] = missing;
  });

  std::size_t total = 0;
  double first = 0.0;
  for (int y = 0; y < h; ++y) {
    const std::size_t n = rowUncovered[static_cast<std::size_t>(y)];
    if (n > 0 && total == 0) first = rowFirstValue[static_cast<std::size_t>(y)];
    total += n;
  }
  if (total > 0) {
    std::ostringstream oss;
    oss.precision(17);
    oss << total << " cell(s) of 'mobility_distance' fall outside every decay band (first value: " << first << ")";
    return Fail(outError, ErrorCode::UncoveredDistance, oss.str());
  }

  MobilityResult res;
  res.mobility = std::move(result);
  res.includedBands = included;
  out = std::move(res);
  return true;
}

bool ComputeFlow(const RunContext& ctx, const Grid& mobility, const Grid& aggregationZones, FlowResult& out,
                 Error& outError)
{
  FlowResult res;
  if (!ComputeZonalSummary(ctx, mobility, aggregationZones, res.rows, outError, "mobility")) return false;
  res.flow = PaintZoneTotals(ctx, aggregationZones, res.rows);
  out = std::move(res);
  return true;
}

} // namespace estimap
