#include "estimap/Proximity.hpp"

#include "estimap/Parallel.hpp"
#include "estimap/Scorer.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <utility>

namespace estimap {

namespace {

constexpr double kDtInf = 1.0e20;

inline std::size_t FlatIdx(int x, int y, int w)
{
  return static_cast<std::size_t>(y) * static_cast<std::size_t>(w) + static_cast<std::size_t>(x);
}

// 1D squared Euclidean distance transform (Felzenszwalb & Huttenlocher).
// f[i] is 0 at feature cells and kDtInf elsewhere.
void DistanceTransform1DSq(const double* f, int n, double* outD, int* v, double* z)
{
  int k = 0;
  v[0] = 0;
  z[0] = -kDtInf;
  z[1] = +kDtInf;

  for (int q = 1; q < n; ++q) {
    double s = 0.0;
    while (k > 0) {
      const int vk = v[k];
      const double num = (f[q] + static_cast<double>(q) * q) - (f[vk] + static_cast<double>(vk) * vk);
      s = num / (2.0 * static_cast<double>(q - vk));
      if (s <= z[k]) {
        --k;
      } else {
        break;
      }
    }

    {
      const int vk = v[k];
      const double num = (f[q] + static_cast<double>(q) * q) - (f[vk] + static_cast<double>(vk) * vk);
      s = num / (2.0 * static_cast<double>(q - vk));
    }

    ++k;
    v[k] = q;
    z[k] = s;
    z[k + 1] = +kDtInf;
  }

  k = 0;
  for (int q = 0; q < n; ++q) {
    while (z[k + 1] < static_cast<double>(q)) ++k;
    const int vk = v[k];
    const double dx = static_cast<double>(q - vk);
    outD[q] = dx * dx + f[vk];
  }
}

// Squared distance in cell units to the nearest feature cell.
void DistanceTransform2DSq(const std::vector<std::uint8_t>& features, int w, int h, std::vector<double>& outSq)
{
  const std::size_t npx = static_cast<std::size_t>(w) * static_cast<std::size_t>(h);
  outSq.assign(npx, kDtInf);

  std::vector<double> g(npx, kDtInf);
  const int n = std::max(w, h);
  std::vector<double> f(static_cast<std::size_t>(n), kDtInf);
  std::vector<double> d(static_cast<std::size_t>(n), kDtInf);
  std::vector<int> v(static_cast<std::size_t>(n), 0);
  std::vector<double> z(static_cast<std::size_t>(n) + 1u, 0.0);

  // Row pass.
  for (int y = 0; y < h; ++y) {
    for (int x = 0; x < w; ++x) {
      f[static_cast<std::size_t>(x)] = (features[FlatIdx(x, y, w)] != 0u) ? 0.0 : kDtInf;
    }
    DistanceTransform1DSq(f.data(), w, d.data(), v.data(), z.data());
    for (int x = 0; x < w; ++x) g[FlatIdx(x, y, w)] = d[static_cast<std::size_t>(x)];
  }

  // Column pass.
  for (int x = 0; x < w; ++x) {
    for (int y = 0; y < h; ++y) f[static_cast<std::size_t>(y)] = g[FlatIdx(x, y, w)];
    DistanceTransform1DSq(f.data(), h, d.data(), v.data(), z.data());
    for (int y = 0; y < h; ++y) outSq[FlatIdx(x, y, w)] = d[static_cast<std::size_t>(y)];
  }
}

// City-block distance in cells: two separable passes of forward/backward sweeps.
void DistanceTransform2DManhattan(const std::vector<std::uint8_t>& features, int w, int h, std::vector<double>& out)
{
  const std::size_t npx = static_cast<std::size_t>(w) * static_cast<std::size_t>(h);
  out.assign(npx, kDtInf);
  for (std::size_t i = 0; i < npx; ++i) {
    if (features[i] != 0u) out[i] = 0.0;
  }

  for (int y = 0; y < h; ++y) {
    for (int x = 1; x < w; ++x) {
      out[FlatIdx(x, y, w)] = std::min(out[FlatIdx(x, y, w)], out[FlatIdx(x - 1, y, w)] + 1.0);
    }
    for (int x = w - 2; x >= 0; --x) {
      out[FlatIdx(x, y, w)] = std::min(out[FlatIdx(x, y, w)], out[FlatIdx(x + 1, y, w)] + 1.0);
    }
  }
  for (int x = 0; x < w; ++x) {
    for (int y = 1; y < h; ++y) {
      out[FlatIdx(x, y, w)] = std::min(out[FlatIdx(x, y, w)], out[FlatIdx(x, y - 1, w)] + 1.0);
    }
    for (int y = h - 2; y >= 0; --y) {
      out[FlatIdx(x, y, w)] = std::min(out[FlatIdx(x, y, w)], out[FlatIdx(x, y + 1, w)] + 1.0);
    }
  }
}

// Chessboard distance in cells: 8-neighbor chamfer with unit weights.
void DistanceTransform2DMaximum(const std::vector<std::uint8_t>& features, int w, int h, std::vector<double>& out)
{
  const std::size_t npx = static_cast<std::size_t>(w) * static_cast<std::size_t>(h);
  out.assign(npx, kDtInf);
  for (std::size_t i = 0; i < npx; ++i) {
    if (features[i] != 0u) out[i] = 0.0;
  }

  auto relax = [&](int x, int y, int nx, int ny) {
    if (nx < 0 || ny < 0 || nx >= w || ny >= h) return;
    double& d = out[FlatIdx(x, y, w)];
    d = std::min(d, out[FlatIdx(nx, ny, w)] + 1.0);
  };

  for (int y = 0; y < h; ++y) {
    for (int x = 0; x < w; ++x) {
      relax(x, y, x - 1, y);
      relax(x, y, x - 1, y - 1);
      relax(x, y, x, y - 1);
      relax(x, y, x + 1, y - 1);
    }
  }
  for (int y = h - 1; y >= 0; --y) {
    for (int x = w - 1; x >= 0; --x) {
      relax(x, y, x + 1, y);
      relax(x, y, x + 1, y + 1);
      relax(x, y, x, y + 1);
      relax(x, y, x - 1, y + 1);
    }
  }
}

} // namespace

bool ComputeGrowDistance(const RunContext& ctx, const Grid& features, DistanceMetric metric, Grid& out,
                         Error& outError, const std::string& label)
{
  const std::string name = label.empty() ? std::string("features") : label;
  if (!ctx.checkAligned(features, name, outError)) return false;

  const int w = features.cols();
  const int h = features.rows();
  const std::size_t npx = features.size();

  std::vector<std::uint8_t> isFeature(npx, 0u);
  bool any = false;
  for (std::size_t i = 0; i < npx; ++i) {
    const double v = features[i];
    if (Grid::IsNoData(v) || v == 0.0 || ctx.excluded(i)) continue;
    isFeature[i] = 1u;
    any = true;
  }

  Grid result(features.geometry());
  if (!any) {
    out = std::move(result);
    return true;
  }

  const double cs = features.geometry().cellSize;
  std::vector<double> d;
  switch (metric) {
  case DistanceMetric::Euclidean:
  case DistanceMetric::Squared:
    DistanceTransform2DSq(isFeature, w, h, d);
    break;
  case DistanceMetric::Manhattan:
    DistanceTransform2DManhattan(isFeature, w, h, d);
    break;
  case DistanceMetric::Maximum:
    DistanceTransform2DMaximum(isFeature, w, h, d);
    break;
  default:
    return Fail(outError, ErrorCode::Config, "unsupported distance metric for '" + name + "'");
  }

  for (std::size_t i = 0; i < npx; ++i) {
    if (ctx.excluded(i)) continue;
    switch (metric) {
    case DistanceMetric::Euclidean: result[i] = std::sqrt(d[i]) * cs; break;
    case DistanceMetric::Squared: result[i] = d[i] * cs * cs; break;
    default: result[i] = d[i] * cs; break;
    }
  }

  out = std::move(result);
  return true;
}

Grid SelectEqual(const Grid& g, double target)
{
  Grid out(g.geometry(), 0.0);
  for (std::size_t i = 0; i < g.size(); ++i) {
    const double v = g[i];
    if (Grid::IsNoData(v)) {
      out[i] = Grid::NoData();
    } else if (v == target) {
      out[i] = 1.0;
    }
  }
  return out;
}

bool ComputeProximityAttractiveness(const RunContext& ctx, const Grid& features, const DecayCoefficients& coeffs,
                                    Grid& out, std::vector<std::string>& warnings, Error& outError,
                                    const std::string& label)
{
  const std::string name = label.empty() ? std::string("features") : label;

  Grid distance;
  if (!ComputeGrowDistance(ctx, features, coeffs.metric, distance, outError, name)) return false;

  DecaySchedule single;
  DistanceCategory band;
  band.unboundedMin = true;
  band.unboundedMax = true;
  band.kappa = coeffs.kappa;
  band.alpha = coeffs.alpha;
  single.bands.push_back(band);

  Grid attractiveness;
  if (!ComputeAttractiveness(ctx, distance, single, coeffs.decayConfig(), attractiveness, outError, name)) {
    return false;
  }

  std::size_t filled = 0;
  for (std::size_t i = 0; i < attractiveness.size(); ++i) {
    if (ctx.excluded(i)) continue;
    if (Grid::IsNoData(attractiveness[i])) {
      attractiveness[i] = 0.0;
      ++filled;
    }
  }
  if (filled == attractiveness.size() && filled > 0) {
    warnings.push_back("'" + name + "' has no feature cells; its attractiveness is 0 everywhere");
  }

  out = std::move(attractiveness);
  return true;
}

bool ComputeArtificialAccessibility(const RunContext& ctx, const Grid& artificial, const Grid& roads,
                                    const RuleTable& artificialCategories, const RuleTable& roadsCategories,
                                    ArtificialAccessibilityResult& out, Error& outError)
{
  ArtificialAccessibilityResult res;

  double maxScore = 0.0;
  for (const RuleTable* t : {&artificialCategories, &roadsCategories}) {
    for (const Rule& r : t->rules) {
      maxScore = std::max({maxScore, r.score, r.hasAltScore ? r.altScore : r.score});
    }
  }
  res.maxClass = static_cast<int>(std::lround(maxScore));
  if (res.maxClass < 1) {
    return Fail(outError, ErrorCode::Config, "distance categories must contain a class >= 1");
  }

  struct Source {
    const Grid* features;
    const RuleTable* table;
    const char* label;
    Grid* outClass;
  };
  const Source sources[] = {
      {&artificial, &artificialCategories, "artificial", &res.artificialClass},
      {&roads, &roadsCategories, "roads", &res.roadsClass},
  };

  for (const Source& s : sources) {
    Grid distance;
    if (!ComputeGrowDistance(ctx, *s.features, DistanceMetric::Euclidean, distance, outError, s.label)) return false;
    if (distance.validCount() == 0) {
      res.warnings.push_back(std::string("'") + s.label + "' has no feature cells");
    }

    ScoreConfig sc;
    sc.label = std::string(s.label) + "_distance";
    ScoreResult scored;
    if (!ScoreGrid(ctx, distance, *s.table, sc, scored, outError)) return false;
    *s.outClass = std::move(scored.grid);
  }

  const GridGeometry& geom = ctx.geometry();
  res.combinedClass = Grid(geom);
  res.accessibility = Grid(geom);
  const double maxClass = static_cast<double>(res.maxClass);
  for (std::size_t i = 0; i < res.combinedClass.size(); ++i) {
    const double a = res.artificialClass[i];
    const double r = res.roadsClass[i];
    double c = Grid::NoData();
    if (!Grid::IsNoData(a) && !Grid::IsNoData(r)) {
      c = std::min(a, r);
    } else if (!Grid::IsNoData(a)) {
      c = a;
    } else if (!Grid::IsNoData(r)) {
      c = r;
    }
    if (Grid::IsNoData(c)) continue;
    res.combinedClass[i] = c;
    res.accessibility[i] = (maxClass + 1.0 - c) / maxClass;
  }

  out = std::move(res);
  return true;
}

bool NeighborhoodAverage(const RunContext& ctx, const Grid& in, int window, Grid& out, Error& outError,
                         const std::string& label)
{
  const std::string name = label.empty() ? std::string("input") : label;
  if (!ctx.checkAligned(in, name, outError)) return false;

  if (window < 1) window = 1;
  if ((window % 2) == 0) ++window;
  const int r = window / 2;

  const int w = in.cols();
  const int h = in.rows();
  const int pw = w + 1;
  const std::size_t pn = static_cast<std::size_t>(pw) * static_cast<std::size_t>(h + 1);

  // Summed-area tables of values and valid counts, shape (h+1) x (w+1).
  std::vector<double> sum(pn, 0.0);
  std::vector<int> count(pn, 0);
  for (int y = 0; y < h; ++y) {
    double rowSum = 0.0;
    int rowCount = 0;
    for (int x = 0; x < w; ++x) {
      const std::size_t i = in.index(x, y);
      const double v = in[i];
      if (!Grid::IsNoData(v) && !ctx.excluded(i)) {
        rowSum += v;
        rowCount += 1;
      }
      const std::size_t p = FlatIdx(x + 1, y + 1, pw);
      const std::size_t above = FlatIdx(x + 1, y, pw);
      sum[p] = sum[above] + rowSum;
      count[p] = count[above] + rowCount;
    }
  }

  Grid result(in.geometry());
  ForEachRow(h, ctx.threads(), [&](int y) {
    const int y0 = std::max(0, y - r);
    const int y1 = std::min(h - 1, y + r);
    for (int x = 0; x < w; ++x) {
      const int x0 = std::max(0, x - r);
      const int x1 = std::min(w - 1, x + r);

      const std::size_t a = FlatIdx(x0, y0, pw);
      const std::size_t b = FlatIdx(x1 + 1, y0, pw);
      const std::size_t c = FlatIdx(x0, y1 + 1, pw);
      const std::size_t d = FlatIdx(x1 + 1, y1 + 1, pw);

      const int n = count[d] - count[b] - count[c] + count[a];
      if (n <= 0) continue;
      const double s = sum[d] - sum[b] - sum[c] + sum[a];
      result.at(x, y) = s / static_cast<double>(n);
    }
  });

  ctx.applyMask(result);
  out = std::move(result);
  return true;
}

} // namespace estimap
