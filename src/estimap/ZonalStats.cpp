#include "estimap/ZonalStats.hpp"

#include "estimap/Reduce.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <map>
#include <sstream>
#include <utility>

namespace estimap {

namespace {

// Ids beyond 2^53 are not exact in a double.
constexpr double kMaxZoneId = 9007199254740992.0;

inline bool ZoneInRange(double z) { return std::fabs(std::trunc(z)) <= kMaxZoneId; }

inline bool ZoneId(double z, std::int64_t* out)
{
  if (Grid::IsNoData(z) || !std::isfinite(z) || !ZoneInRange(z)) return false;
  *out = static_cast<std::int64_t>(std::trunc(z));
  return true;
}

bool CheckZoneRange(const Grid& zones, std::size_t i, const std::string& name, Error& outError)
{
  const double z = zones[i];
  if (Grid::IsNoData(z) || ZoneInRange(z)) return true;
  std::ostringstream oss;
  oss << "id out of range in '" << name << "' at cell " << i << ": " << z;
  return Fail(outError, ErrorCode::Config, oss.str());
}

SummaryRow Summarize(std::int64_t id, const std::vector<double>& v)
{
  SummaryRow r;
  r.zoneId = id;
  r.count = v.size();
  if (v.empty()) return r;

  r.sum = PairwiseSum(v);
  r.mean = r.sum / static_cast<double>(v.size());
  r.min = *std::min_element(v.begin(), v.end());
  r.max = *std::max_element(v.begin(), v.end());

  std::vector<double> sq(v.size());
  for (std::size_t i = 0; i < v.size(); ++i) {
    const double d = v[i] - r.mean;
    sq[i] = d * d;
  }
  r.stddev = std::sqrt(PairwiseSum(sq) / static_cast<double>(v.size()));
  return r;
}

} // namespace

bool ComputeZonalSummary(const RunContext& ctx, const Grid& values, const Grid& zones, std::vector<SummaryRow>& out,
                         Error& outError, const std::string& label)
{
  const std::string name = label.empty() ? std::string("values") : label;
  if (!ctx.checkAligned(values, name, outError)) return false;
  if (!ctx.checkAligned(zones, name + " zones", outError)) return false;

  std::map<std::int64_t, std::vector<double>> groups;
  for (std::size_t i = 0; i < values.size(); ++i) {
    const double v = values[i];
    std::int64_t id = 0;
    if (Grid::IsNoData(v) || ctx.excluded(i)) continue;
    if (!CheckZoneRange(zones, i, name + " zones", outError)) return false;
    if (!ZoneId(zones[i], &id)) continue;
    groups[id].push_back(v);
  }

  std::vector<SummaryRow> rows;
  rows.reserve(groups.size());
  for (const auto& kv : groups) {
    rows.push_back(Summarize(kv.first, kv.second));
  }

  out = std::move(rows);
  return true;
}

double SummaryTotal(const std::vector<SummaryRow>& rows)
{
  std::vector<double> sums;
  sums.reserve(rows.size());
  for (const SummaryRow& r : rows) sums.push_back(r.sum);
  return PairwiseSum(sums);
}

Grid PaintZoneTotals(const RunContext& ctx, const Grid& zones, const std::vector<SummaryRow>& rows)
{
  std::map<std::int64_t, double> totals;
  for (const SummaryRow& r : rows) totals[r.zoneId] = r.sum;

  Grid out(zones.geometry());
  for (std::size_t i = 0; i < zones.size(); ++i) {
    std::int64_t id = 0;
    if (ctx.excluded(i) || !ZoneId(zones[i], &id)) continue;
    const auto it = totals.find(id);
    if (it != totals.end()) out[i] = it->second;
  }
  return out;
}

bool ComputeZonalCrossTab(const RunContext& ctx, const Grid& values, const Grid& zones, const Grid& classes,
                          std::vector<CrossTabRow>& out, Error& outError)
{
  if (!ctx.checkAligned(values, "values", outError)) return false;
  if (!ctx.checkAligned(zones, "zones", outError)) return false;
  if (!ctx.checkAligned(classes, "classes", outError)) return false;

  std::map<std::pair<std::int64_t, std::int64_t>, std::vector<double>> groups;
  for (std::size_t i = 0; i < values.size(); ++i) {
    const double v = values[i];
    std::int64_t zone = 0;
    std::int64_t cls = 0;
    if (Grid::IsNoData(v) || ctx.excluded(i)) continue;
    if (!CheckZoneRange(zones, i, "zones", outError)) return false;
    if (!CheckZoneRange(classes, i, "classes", outError)) return false;
    if (!ZoneId(zones[i], &zone) || !ZoneId(classes[i], &cls)) continue;
    groups[{zone, cls}].push_back(v);
  }

  std::vector<CrossTabRow> rows;
  rows.reserve(groups.size());
  for (const auto& kv : groups) {
    CrossTabRow r;
    r.zoneId = kv.first.first;
    r.classId = kv.first.second;
    r.count = kv.second.size();
    r.sum = PairwiseSum(kv.second);
    rows.push_back(r);
  }

  out = std::move(rows);
  return true;
}

UnivariateStats ComputeUnivariateStats(const Grid& g)
{
  UnivariateStats s;
  s.cells = g.size();

  const std::vector<double> v = CollectValid(g.values());
  s.n = v.size();
  s.nullCells = s.cells - s.n;
  if (v.empty()) return s;

  s.min = *std::min_element(v.begin(), v.end());
  s.max = *std::max_element(v.begin(), v.end());
  s.range = s.max - s.min;
  s.sum = PairwiseSum(v);
  s.mean = s.sum / static_cast<double>(s.n);

  std::vector<double> absV(v.size());
  std::vector<double> sq(v.size());
  for (std::size_t i = 0; i < v.size(); ++i) {
    absV[i] = std::fabs(v[i]);
    const double d = v[i] - s.mean;
    sq[i] = d * d;
  }
  s.meanOfAbs = PairwiseSum(absV) / static_cast<double>(s.n);
  s.variance = PairwiseSum(sq) / static_cast<double>(s.n);
  s.stddev = std::sqrt(s.variance);
  s.coeffVar = (s.mean != 0.0) ? 100.0 * s.stddev / s.mean : 0.0;
  return s;
}

std::string FormatStatNumber(double v)
{
  if (Grid::IsNoData(v)) return "nan";
  std::ostringstream oss;
  oss << std::setprecision(17) << v;
  return oss.str();
}

std::string FormatUnivariateStats(const UnivariateStats& s)
{
  std::ostringstream oss;
  oss << "n=" << s.n << "\n";
  oss << "null_cells=" << s.nullCells << "\n";
  oss << "cells=" << s.cells << "\n";
  oss << "min=" << FormatStatNumber(s.min) << "\n";
  oss << "max=" << FormatStatNumber(s.max) << "\n";
  oss << "range=" << FormatStatNumber(s.range) << "\n";
  oss << "mean=" << FormatStatNumber(s.mean) << "\n";
  oss << "mean_of_abs=" << FormatStatNumber(s.meanOfAbs) << "\n";
  oss << "stddev=" << FormatStatNumber(s.stddev) << "\n";
  oss << "variance=" << FormatStatNumber(s.variance) << "\n";
  oss << "coeff_var=" << FormatStatNumber(s.coeffVar) << "\n";
  oss << "sum=" << FormatStatNumber(s.sum) << "\n";
  return oss.str();
}

namespace {

std::vector<std::string> NonEmptyLines(const std::string& text)
{
  std::vector<std::string> out;
  std::istringstream iss(text);
  std::string line;
  while (std::getline(iss, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (!line.empty()) out.push_back(line);
  }
  return out;
}

} // namespace

bool CompareUnivariateText(const std::string& expected, const std::string& actual, std::string& outDiff)
{
  const std::vector<std::string> a = NonEmptyLines(expected);
  const std::vector<std::string> b = NonEmptyLines(actual);

  const std::size_t n = std::max(a.size(), b.size());
  for (std::size_t i = 0; i < n; ++i) {
    const std::string ea = (i < a.size()) ? a[i] : std::string("<missing>");
    const std::string eb = (i < b.size()) ? b[i] : std::string("<missing>");
    if (ea != eb) {
      outDiff = "line " + std::to_string(i + 1) + ": expected '" + ea + "', got '" + eb + "'";
      return false;
    }
  }
  outDiff.clear();
  return true;
}

bool WriteSummaryCsv(std::ostream& os, const std::vector<SummaryRow>& rows)
{
  os << kSummaryCsvHeader << '\n';
  for (const SummaryRow& r : rows) {
    os << r.zoneId << ','
       << FormatStatNumber(r.sum) << ','
       << FormatStatNumber(r.mean) << ','
       << r.count << ','
       << FormatStatNumber(r.min) << ','
       << FormatStatNumber(r.max)
       << '\n';
  }
  return static_cast<bool>(os);
}

bool WriteCrossTabCsv(std::ostream& os, const std::vector<CrossTabRow>& rows)
{
  os << kCrossTabCsvHeader << '\n';
  for (const CrossTabRow& r : rows) {
    os << r.zoneId << ',' << r.classId << ',' << r.count << ',' << FormatStatNumber(r.sum) << '\n';
  }
  return static_cast<bool>(os);
}

} // namespace estimap
