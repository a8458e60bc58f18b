#include "estimap/AsciiGrid.hpp"
#include "estimap/ConfigIO.hpp"
#include "estimap/DefaultRules.hpp"
#include "estimap/Demand.hpp"
#include "estimap/DistanceDecay.hpp"
#include "estimap/Normalize.hpp"
#include "estimap/Pipeline.hpp"
#include "estimap/Proximity.hpp"
#include "estimap/RasterStore.hpp"
#include "estimap/Reduce.hpp"
#include "estimap/Recreation.hpp"
#include "estimap/RunContext.hpp"
#include "estimap/Scorer.hpp"
#include "estimap/ZonalStats.hpp"

#include <cmath>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                          \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";              \
    }                                                                                                                \
  } while (0)

#define EXPECT_NEAR(a, b, eps)                                                                                       \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    const auto _e = (eps);                                                                                           \
    if (!(std::fabs((_a) - (_b)) <= (_e))) {                                                                         \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NEAR failed: " << #a << " ~= " << #b << " (eps=" << _e   \
                << ")\n";                                                                                            \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                          \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

namespace {

using namespace estimap;

const double kNaN = Grid::NoData();

GridGeometry Geom(int cols, int rows, double cellSize = 1.0)
{
  GridGeometry g;
  g.cols = cols;
  g.rows = rows;
  g.west = 1000.0;
  g.south = 2000.0;
  g.cellSize = cellSize;
  return g;
}

bool SameBits(const Grid& a, const Grid& b)
{
  if (!SameGeometry(a.geometry(), b.geometry()) || a.size() != b.size()) return false;
  return std::memcmp(a.values().data(), b.values().data(), a.size() * sizeof(double)) == 0;
}

bool HasWarningContaining(const std::vector<std::string>& warnings, const std::string& needle)
{
  for (const std::string& w : warnings) {
    if (w.find(needle) != std::string::npos) return true;
  }
  return false;
}

// 6x6 scene whose north-west cell has the highest potential and the best
// infrastructure access, so it is the only guaranteed spectrum 9 cell.
void BuildScene(MemoryRasterStore& store, RecreationConfig& cfg)
{
  const GridGeometry geom = Geom(6, 6, 100.0);
  const double landuseCodes[6] = {1, 12, 23, 33, 41, 2};

  Grid landuse(geom);
  Grid water(geom);
  Grid lakes(geom, 0.0);
  Grid protectedAreas(geom);
  Grid infrastructure(geom);
  Grid population(geom, 10.0);
  Grid aggregation(geom);
  Grid base(geom);

  for (int y = 0; y < geom.rows; ++y) {
    for (int x = 0; x < geom.cols; ++x) {
      landuse.at(x, y) = landuseCodes[(x + y) % 6];
      water.at(x, y) = 0.1 * static_cast<double>((x + 2 * y) % 7);
      if (x == y && x > 0) protectedAreas.at(x, y) = 2.0;
      infrastructure.at(x, y) = 100.0 * static_cast<double>(x + y);
      aggregation.at(x, y) = (x < 3) ? 1.0 : 2.0;
      base.at(x, y) = (y < 3) ? 7.0 : 3.0;
    }
  }
  landuse.at(0, 0) = 10.0;
  water.at(0, 0) = 1.0;
  lakes.at(0, 0) = 1.0;
  protectedAreas.at(0, 0) = 5.0;

  store.putGrid("landuse", landuse);
  store.putGrid("water", water);
  store.putGrid("lakes", lakes);
  store.putGrid("protected", protectedAreas);
  store.putGrid("infrastructure", infrastructure);
  store.putGrid("population", population);
  store.putGrid("aggregation", aggregation);
  store.putGrid("base", base);
  store.putGrid("landcover", landuse);

  cfg = RecreationConfig{};
  cfg.inputs.landuse = "landuse";
  cfg.inputs.water = {"water"};
  cfg.inputs.lakes = "lakes";
  cfg.inputs.protectedAreas = "protected";
  cfg.inputs.infrastructure = "infrastructure";
  cfg.inputs.population = "population";
  cfg.inputs.aggregation = "aggregation";
  cfg.inputs.base = "base";
  cfg.inputs.landcover = "landcover";
  for (const std::string& name : AllRecreationOutputNames()) {
    EnableRecreationOutput(name, cfg.outputs);
  }
}

} // namespace

static void TestNormalizeLandAndWater()
{
  const GridGeometry geom = Geom(2, 1);
  RunContext ctx(geom);
  const Grid land = MakeGrid(geom, {0.2, 0.8});
  const Grid water = MakeGrid(geom, {0.4, 0.6});

  Grid sum;
  Error err;
  ASSERT_TRUE(SumGrids(ctx, {&land, &water}, NoDataPolicy::Propagate, sum, err));
  EXPECT_NEAR(sum[0], 0.6, 1e-12);
  EXPECT_NEAR(sum[1], 1.4, 1e-12);

  NormalizeResult r;
  ASSERT_TRUE(NormalizeComponent(ctx, {&land, &water}, NormalizeConfig{}, r, err));
  EXPECT_EQ(r.grid[0], 0.0);
  EXPECT_EQ(r.grid[1], 1.0);
  EXPECT_FALSE(r.degenerate);
  EXPECT_EQ(r.validCount, static_cast<std::size_t>(2));
}

static void TestNormalizeRangeProperties()
{
  const GridGeometry geom = Geom(7, 5);
  RunContext ctx(geom);
  Grid a(geom);
  Grid b(geom);
  for (std::size_t i = 0; i < a.size(); ++i) {
    a[i] = std::sin(static_cast<double>(i) * 0.7) * 3.0;
    b[i] = static_cast<double>((i * 37) % 11) - 4.0;
  }

  NormalizeResult r;
  Error err;
  ASSERT_TRUE(NormalizeComponent(ctx, {&a, &b}, NormalizeConfig{}, r, err));

  double lo = 1.0;
  double hi = 0.0;
  for (std::size_t i = 0; i < r.grid.size(); ++i) {
    const double v = r.grid[i];
    EXPECT_TRUE(v >= 0.0 && v <= 1.0);
    lo = std::min(lo, v);
    hi = std::max(hi, v);
  }
  EXPECT_EQ(lo, 0.0);
  EXPECT_EQ(hi, 1.0);
  EXPECT_TRUE(r.min < r.max);

  // Empty input list is a configuration error.
  EXPECT_FALSE(NormalizeComponent(ctx, {}, NormalizeConfig{}, r, err));
  EXPECT_EQ(err.code, ErrorCode::Config);
}

static void TestNormalizeDegenerateRange()
{
  const GridGeometry geom = Geom(3, 1);
  RunContext ctx(geom);
  const Grid flat = MakeGrid(geom, {3.0, 3.0, kNaN});

  NormalizeConfig cfg;
  cfg.label = "water";
  NormalizeResult r;
  Error err;
  ASSERT_TRUE(NormalizeComponent(ctx, {&flat}, cfg, r, err));
  EXPECT_TRUE(r.degenerate);
  EXPECT_EQ(r.grid[0], 0.0);
  EXPECT_EQ(r.grid[1], 0.0);
  EXPECT_TRUE(Grid::IsNoData(r.grid[2]));
  EXPECT_TRUE(HasWarningContaining(r.warnings, "water"));
}

static void TestNormalizeRejectsInfinity()
{
  const GridGeometry geom = Geom(3, 1);
  RunContext ctx(geom);
  const double inf = std::numeric_limits<double>::infinity();
  const Grid withInf = MakeGrid(geom, {1.0, 2.0, inf});

  NormalizeConfig cfg;
  cfg.label = "land";
  NormalizeResult r;
  Error err;
  EXPECT_FALSE(NormalizeComponent(ctx, {&withInf}, cfg, r, err));
  EXPECT_EQ(err.code, ErrorCode::Config);
  EXPECT_TRUE(err.message.find("land") != std::string::npos);

  // Finite inputs whose sum overflows.
  const double big = std::numeric_limits<double>::max();
  const Grid a = MakeGrid(geom, {1.0, big, 0.0});
  const Grid b = MakeGrid(geom, {1.0, big, 0.0});
  EXPECT_FALSE(NormalizeComponent(ctx, {&a, &b}, cfg, r, err));
  EXPECT_EQ(err.code, ErrorCode::Config);
  EXPECT_TRUE(err.message.find("overflows") != std::string::npos);
}

static void TestNoDataPolicies()
{
  const GridGeometry geom = Geom(3, 1);
  RunContext ctx(geom);
  const Grid a = MakeGrid(geom, {1.0, kNaN, kNaN});
  const Grid b = MakeGrid(geom, {2.0, 3.0, kNaN});

  Grid propagate;
  Grid zero;
  Error err;
  ASSERT_TRUE(SumGrids(ctx, {&a, &b}, NoDataPolicy::Propagate, propagate, err));
  ASSERT_TRUE(SumGrids(ctx, {&a, &b}, NoDataPolicy::ZeroContribution, zero, err));

  EXPECT_EQ(propagate[0], 3.0);
  EXPECT_TRUE(Grid::IsNoData(propagate[1]));
  EXPECT_TRUE(Grid::IsNoData(propagate[2]));

  EXPECT_EQ(zero[0], 3.0);
  EXPECT_EQ(zero[1], 3.0);
  // A cell with no valid input at all stays no-data.
  EXPECT_TRUE(Grid::IsNoData(zero[2]));

  NoDataPolicy p = NoDataPolicy::Propagate;
  EXPECT_TRUE(ParseNoDataPolicy("zero", &p));
  EXPECT_EQ(p, NoDataPolicy::ZeroContribution);
  EXPECT_TRUE(ParseNoDataPolicy("propagate", &p));
  EXPECT_EQ(p, NoDataPolicy::Propagate);
  EXPECT_FALSE(ParseNoDataPolicy("skip", &p));
}

static void TestZeroFloor()
{
  const GridGeometry geom = Geom(3, 1);
  RunContext ctx(geom);
  const Grid g = MakeGrid(geom, {0.0, 0.00005, 1.0});

  NormalizeConfig cfg;
  NormalizeResult plain;
  Error err;
  ASSERT_TRUE(NormalizeComponent(ctx, {&g}, cfg, plain, err));
  EXPECT_NEAR(plain.grid[1], 0.00005, 1e-15);

  cfg.zeroFloor = 0.0001;
  NormalizeResult floored;
  ASSERT_TRUE(NormalizeComponent(ctx, {&g}, cfg, floored, err));
  EXPECT_EQ(floored.grid[1], 0.0);
  EXPECT_EQ(floored.grid[2], 1.0);
}

static void TestMaskAndAlignment()
{
  const GridGeometry geom = Geom(2, 2);
  const Grid mask = MakeGrid(geom, {1.0, 0.0, kNaN, 1.0});

  RunContext ctx;
  Error err;
  ASSERT_TRUE(RunContext::Create(geom, &mask, 1, ctx, err));
  EXPECT_TRUE(ctx.hasMask());
  EXPECT_FALSE(RunContext(geom).hasMask());
  EXPECT_FALSE(ctx.excluded(0));
  EXPECT_TRUE(ctx.excluded(1));
  EXPECT_TRUE(ctx.excluded(2));
  EXPECT_FALSE(ctx.excluded(3));

  const Grid ones(geom, 1.0);
  Grid sum;
  ASSERT_TRUE(SumGrids(ctx, {&ones}, NoDataPolicy::Propagate, sum, err));
  EXPECT_EQ(sum[0], 1.0);
  EXPECT_TRUE(Grid::IsNoData(sum[1]));
  EXPECT_TRUE(Grid::IsNoData(sum[2]));

  // Same shape, shifted origin.
  GridGeometry shifted = geom;
  shifted.west += 0.5;
  const Grid misplaced(shifted, 1.0);
  EXPECT_FALSE(SumGrids(ctx, {&ones, &misplaced}, NoDataPolicy::Propagate, sum, err));
  EXPECT_EQ(err.code, ErrorCode::Alignment);

  const Grid wrongShape(Geom(3, 2), 1.0);
  RunContext other;
  EXPECT_FALSE(RunContext::Create(geom, &wrongShape, 1, other, err));
  EXPECT_EQ(err.code, ErrorCode::Alignment);

  GridGeometry empty = geom;
  empty.cols = 0;
  EXPECT_FALSE(RunContext::Create(empty, nullptr, 1, other, err));
  EXPECT_EQ(err.code, ErrorCode::Config);
}

static void TestRuleTableScoring()
{
  RuleTable table;
  Error err;
  ASSERT_TRUE(ParseRuleTable("1:1:0:0,2:2:0.1:0.1,3:3:0.2:0.2,4:4:0.3:0.3,5:5:0.4:0.4,"
                             "6:6:0.5:0.5,7:7:0.6:0.6,8:8:0.7:0.7,9:9:0.8:0.8,10:10:1:1",
                             table, err));

  const GridGeometry geom = Geom(10, 1);
  RunContext ctx(geom);
  Grid classes(geom);
  for (int x = 0; x < 10; ++x) classes.at(x, 0) = static_cast<double>(x + 1);

  ScoreResult scored;
  ASSERT_TRUE(ScoreGrid(ctx, classes, table, ScoreConfig{}, scored, err));
  EXPECT_EQ(scored.grid.at(0, 0), 0.0);
  EXPECT_EQ(scored.grid.at(9, 0), 1.0);
  EXPECT_EQ(scored.grid.at(4, 0), 0.4);

  // Built-in land use scores agree on the same classes.
  RuleTable corine;
  ASSERT_TRUE(ResolveScoreTable(RuleSource{}, Nomenclature::Corine, corine, err));
  ScoreResult builtin;
  const Grid two = MakeGrid(Geom(2, 1), {1.0, 10.0});
  RunContext ctx2(two.geometry());
  ASSERT_TRUE(ScoreGrid(ctx2, two, corine, ScoreConfig{}, builtin, err));
  EXPECT_EQ(builtin.grid[0], 0.0);
  EXPECT_EQ(builtin.grid[1], 1.0);
}

static void TestUnscoredPolicy()
{
  RuleTable table;
  Error err;
  ASSERT_TRUE(ParseRuleTable("1:1:0.5", table, err));

  const GridGeometry geom = Geom(3, 1);
  RunContext ctx(geom);
  const Grid input = MakeGrid(geom, {1.0, 7.0, kNaN});

  ScoreConfig cfg;
  cfg.label = "landuse";
  ScoreResult r;
  EXPECT_FALSE(ScoreGrid(ctx, input, table, cfg, r, err));
  EXPECT_EQ(err.code, ErrorCode::UnscoredValue);
  EXPECT_TRUE(err.message.find("7") != std::string::npos);

  cfg.unscored = UnscoredPolicy::NoData;
  ASSERT_TRUE(ScoreGrid(ctx, input, table, cfg, r, err));
  EXPECT_EQ(r.grid[0], 0.5);
  EXPECT_TRUE(Grid::IsNoData(r.grid[1]));
  EXPECT_TRUE(Grid::IsNoData(r.grid[2]));
  EXPECT_EQ(r.unscoredCount, static_cast<std::size_t>(1));
}

static void TestClassificationAndSpectrum()
{
  const ClassCutPoints cuts{};
  EXPECT_EQ(ClassifyValue(0.0, cuts), 1);
  EXPECT_EQ(ClassifyValue(1.0 / 3.0, cuts), 1);
  EXPECT_EQ(ClassifyValue(0.5, cuts), 2);
  EXPECT_EQ(ClassifyValue(1.0, cuts), 3);
  EXPECT_EQ(std::string(ProximityClassName(static_cast<ProximityClass>(ClassifyValue(0.9, cuts)))),
            std::string("far"));

  Error err;
  EXPECT_FALSE(ValidateCutPoints(ClassCutPoints{0.7, 0.3}, err));
  EXPECT_EQ(err.code, ErrorCode::Config);

  const int expected[3][3] = {{1, 2, 3}, {4, 5, 6}, {7, 8, 9}};
  for (int p = 1; p <= 3; ++p) {
    for (int o = 1; o <= 3; ++o) {
      EXPECT_EQ(SpectrumClass(p, o), expected[p - 1][o - 1]);
    }
  }
  EXPECT_EQ(SpectrumClass(0, 2), 0);
  EXPECT_EQ(SpectrumClass(2, 4), 0);

  const GridGeometry geom = Geom(3, 1);
  RunContext ctx(geom);
  const Grid potential = MakeGrid(geom, {1.0, 3.0, kNaN});
  const Grid opportunity = MakeGrid(geom, {2.0, 3.0, 1.0});
  Grid spectrum;
  ASSERT_TRUE(ComputeSpectrum(ctx, potential, opportunity, spectrum, err));
  EXPECT_EQ(spectrum[0], 2.0);
  EXPECT_EQ(spectrum[1], 9.0);
  EXPECT_TRUE(Grid::IsNoData(spectrum[2]));
}

static void TestAttractivenessDecreases()
{
  const double params[][2] = {{30.0, 0.008}, {0.0235, 0.00102}, {5.0, 0.01101}, {0.06836, 0.00104}};
  for (const auto& p : params) {
    double prev = Attractiveness(0.0, p[0], p[1]);
    EXPECT_NEAR(prev, 1.0, 1e-12);
    for (int k = 1; k <= 40; ++k) {
      const double v = Attractiveness(static_cast<double>(k) * 50.0, p[0], p[1]);
      EXPECT_TRUE(v < prev);
      EXPECT_TRUE(v > 0.0);
      prev = v;
    }
  }

  DecayConfig scaled;
  scaled.score = 2.5;
  EXPECT_NEAR(Attractiveness(100.0, 30.0, 0.008, scaled), 2.5 * Attractiveness(100.0, 30.0, 0.008), 1e-12);
}

static void TestUncoveredDistance()
{
  DecaySchedule schedule;
  Error err;
  ASSERT_TRUE(ParseDecaySchedule("0:10:1:0.1", schedule, err));

  const GridGeometry geom = Geom(3, 1);
  RunContext ctx(geom);
  const Grid distance = MakeGrid(geom, {5.0, 20.0, kNaN});
  Grid out;
  EXPECT_FALSE(ComputeAttractiveness(ctx, distance, schedule, DecayConfig{}, out, err, "infrastructure"));
  EXPECT_EQ(err.code, ErrorCode::UncoveredDistance);
  EXPECT_TRUE(err.message.find("20") != std::string::npos);

  // Open-ended schedules turn uncovered distances into no-data.
  DecaySchedule open;
  ASSERT_TRUE(ParseDecaySchedule("0:100:1:0.01,200:*:1:0.01", open, err));
  const Grid gapDistance = MakeGrid(geom, {50.0, 150.0, 250.0});
  ASSERT_TRUE(ComputeAttractiveness(ctx, gapDistance, open, DecayConfig{}, out, err, "infrastructure"));
  EXPECT_NEAR(out[0], Attractiveness(50.0, 1.0, 0.01), 1e-15);
  EXPECT_TRUE(Grid::IsNoData(out[1]));
  EXPECT_NEAR(out[2], Attractiveness(250.0, 1.0, 0.01), 1e-15);

  DecaySchedule infra;
  ASSERT_TRUE(ParseDecaySchedule(std::string(kDefaultInfrastructureSchedule), infra, err));
  const Grid negative = MakeGrid(geom, {-1.0, 0.0, 10.0});
  ASSERT_TRUE(ComputeAttractiveness(ctx, negative, infra, DecayConfig{}, out, err));
  EXPECT_TRUE(Grid::IsNoData(out[0]));
  EXPECT_TRUE(out.isValid(1));
}

static void TestMobilityExcludesOpenBand()
{
  const GridGeometry geom = Geom(5, 1);
  RunContext ctx(geom);
  const Grid demand(geom, 1.0);
  const Grid distance = MakeGrid(geom, {500.0, 1500.0, 2500.0, 3500.0, 9000.0});

  DecaySchedule schedule;
  Error err;
  ASSERT_TRUE(ParseDecaySchedule(std::string(kDefaultMobilitySchedule), schedule, err));
  ASSERT_TRUE(schedule.bands.size() == 5);
  EXPECT_TRUE(schedule.lastOpenEnded());

  MobilityResult r;
  ASSERT_TRUE(ComputeMobility(ctx, demand, distance, schedule, DecayConfig{}, r, err));
  EXPECT_EQ(r.includedBands, 4);

  double expectedTotal = 0.0;
  for (int b = 0; b < 4; ++b) {
    const DistanceCategory& c = schedule.bands[static_cast<std::size_t>(b)];
    const double a = Attractiveness(distance[static_cast<std::size_t>(b)], c.kappa, c.alpha);
    EXPECT_NEAR(r.mobility[static_cast<std::size_t>(b)], a, 1e-15);
    expectedTotal += a;
  }
  EXPECT_EQ(r.mobility[4], 0.0);
  EXPECT_NEAR(SumValid(r.mobility.values()), expectedTotal, 1e-12);

  // The open-ended band's own coefficients never matter.
  DecaySchedule altered = schedule;
  altered.bands[4].kappa = 5.0;
  altered.bands[4].alpha = 0.5;
  MobilityResult r2;
  ASSERT_TRUE(ComputeMobility(ctx, demand, distance, altered, DecayConfig{}, r2, err));
  EXPECT_TRUE(SameBits(r.mobility, r2.mobility));

  // A gap before an open-ended last band leaves the gap cells without data.
  DecaySchedule gapped;
  ASSERT_TRUE(ParseDecaySchedule("0:100:1:0.01,200:*:1:0.01", gapped, err));
  const Grid inGap = MakeGrid(geom, {50.0, 150.0, 250.0, 0.0, kNaN});
  MobilityResult r3;
  ASSERT_TRUE(ComputeMobility(ctx, demand, inGap, gapped, DecayConfig{}, r3, err));
  EXPECT_NEAR(r3.mobility[0], Attractiveness(50.0, 1.0, 0.01), 1e-15);
  EXPECT_TRUE(Grid::IsNoData(r3.mobility[1]));
  EXPECT_EQ(r3.mobility[2], 0.0);
  EXPECT_TRUE(Grid::IsNoData(r3.mobility[4]));

  // Closed schedules still reject uncovered distances.
  DecaySchedule closed;
  ASSERT_TRUE(ParseDecaySchedule("0:100:1:0.01,200:300:1:0.01", closed, err));
  EXPECT_FALSE(closed.lastOpenEnded());
  EXPECT_FALSE(ComputeMobility(ctx, demand, inGap, closed, DecayConfig{}, r3, err));
  EXPECT_EQ(err.code, ErrorCode::UncoveredDistance);
}

static void TestDistanceTransforms()
{
  const GridGeometry geom = Geom(5, 5, 10.0);
  RunContext ctx(geom);
  Grid features(geom, 0.0);
  features.at(2, 2) = 1.0;

  Grid euclid;
  Grid squared;
  Grid manhattan;
  Grid maximum;
  Error err;
  ASSERT_TRUE(ComputeGrowDistance(ctx, features, DistanceMetric::Euclidean, euclid, err));
  ASSERT_TRUE(ComputeGrowDistance(ctx, features, DistanceMetric::Squared, squared, err));
  ASSERT_TRUE(ComputeGrowDistance(ctx, features, DistanceMetric::Manhattan, manhattan, err));
  ASSERT_TRUE(ComputeGrowDistance(ctx, features, DistanceMetric::Maximum, maximum, err));

  EXPECT_EQ(euclid.at(2, 2), 0.0);
  EXPECT_NEAR(euclid.at(0, 0), std::sqrt(8.0) * 10.0, 1e-9);
  EXPECT_NEAR(euclid.at(4, 2), 20.0, 1e-9);
  EXPECT_NEAR(squared.at(0, 0), 800.0, 1e-9);
  EXPECT_NEAR(squared.at(3, 4), 500.0, 1e-9);
  EXPECT_NEAR(manhattan.at(0, 0), 40.0, 1e-9);
  EXPECT_NEAR(manhattan.at(3, 4), 30.0, 1e-9);
  EXPECT_NEAR(maximum.at(0, 0), 20.0, 1e-9);
  EXPECT_NEAR(maximum.at(3, 4), 20.0, 1e-9);

  // Nearest of two features.
  features.at(0, 4) = 1.0;
  ASSERT_TRUE(ComputeGrowDistance(ctx, features, DistanceMetric::Euclidean, euclid, err));
  EXPECT_NEAR(euclid.at(0, 3), 10.0, 1e-9);
  EXPECT_NEAR(euclid.at(4, 0), std::sqrt(8.0) * 10.0, 1e-9);

  // No feature at all: every cell is no-data.
  const Grid none(geom, 0.0);
  ASSERT_TRUE(ComputeGrowDistance(ctx, none, DistanceMetric::Euclidean, euclid, err));
  EXPECT_EQ(euclid.validCount(), static_cast<std::size_t>(0));

  DistanceMetric m = DistanceMetric::Euclidean;
  EXPECT_TRUE(ParseDistanceMetric("manhattan", &m));
  EXPECT_EQ(m, DistanceMetric::Manhattan);
  EXPECT_FALSE(ParseDistanceMetric("chebyshev2", &m));
}

static void TestProximityAndAverage()
{
  const GridGeometry geom = Geom(4, 1, 100.0);
  RunContext ctx(geom);
  const Grid features = MakeGrid(geom, {1.0, 0.0, 0.0, 0.0});

  DecayCoefficients coeffs;
  Error err;
  ASSERT_TRUE(ParseDecayCoefficients(std::string(kDefaultLakeCoefficients), coeffs, err));

  Grid attractiveness;
  std::vector<std::string> warnings;
  ASSERT_TRUE(ComputeProximityAttractiveness(ctx, features, coeffs, attractiveness, warnings, err, "lakes"));
  EXPECT_NEAR(attractiveness[0], 1.0, 1e-12);
  EXPECT_NEAR(attractiveness[3], Attractiveness(300.0, coeffs.kappa, coeffs.alpha), 1e-12);
  EXPECT_TRUE(warnings.empty());

  const Grid none(geom, 0.0);
  ASSERT_TRUE(ComputeProximityAttractiveness(ctx, none, coeffs, attractiveness, warnings, err, "lakes"));
  EXPECT_EQ(attractiveness[2], 0.0);
  EXPECT_TRUE(HasWarningContaining(warnings, "lakes"));

  const GridGeometry g3 = Geom(3, 3);
  RunContext ctx3(g3);
  const Grid holes = MakeGrid(g3, {1.0, 1.0, 1.0, 1.0, kNaN, 1.0, 1.0, 1.0, 4.0});
  Grid avg;
  ASSERT_TRUE(NeighborhoodAverage(ctx3, holes, 2, avg, err));
  EXPECT_NEAR(avg.at(1, 1), 11.0 / 8.0, 1e-12);
  EXPECT_NEAR(avg.at(0, 0), 1.0, 1e-12);
  EXPECT_NEAR(avg.at(2, 2), 6.0 / 3.0, 1e-12);
}

static void TestArtificialAccessibility()
{
  const GridGeometry geom = Geom(10, 1, 100.0);
  RunContext ctx(geom);
  Grid artificial(geom, 0.0);
  artificial[0] = 1.0;
  const Grid roads(geom, 0.0);

  RuleTable categories;
  Error err;
  ASSERT_TRUE(ParseRuleTable(std::string(kDefaultDistanceCategories), categories, err));

  ArtificialAccessibilityResult r;
  ASSERT_TRUE(ComputeArtificialAccessibility(ctx, artificial, roads, categories, categories, r, err));
  EXPECT_EQ(r.maxClass, 5);
  EXPECT_EQ(r.combinedClass[0], 1.0);
  EXPECT_EQ(r.combinedClass[5], 1.0);
  EXPECT_EQ(r.combinedClass[9], 2.0);
  EXPECT_NEAR(r.accessibility[0], 1.0, 1e-12);
  EXPECT_NEAR(r.accessibility[9], 0.8, 1e-12);
  EXPECT_TRUE(HasWarningContaining(r.warnings, "roads"));
}

static void TestZonalConservation()
{
  const GridGeometry geom = Geom(4, 4);
  RunContext ctx(geom);
  Grid values(geom);
  Grid zones(geom);
  for (int y = 0; y < 4; ++y) {
    for (int x = 0; x < 4; ++x) {
      values.at(x, y) = 0.1 * static_cast<double>(x + 4 * y) + 0.05;
      zones.at(x, y) = (x < 2) ? 2.0 : (y < 2 ? 9.0 : 5.0);
    }
  }

  std::vector<SummaryRow> rows;
  Error err;
  ASSERT_TRUE(ComputeZonalSummary(ctx, values, zones, rows, err, "values"));
  ASSERT_TRUE(rows.size() == 3);
  EXPECT_EQ(rows[0].zoneId, static_cast<std::int64_t>(2));
  EXPECT_EQ(rows[1].zoneId, static_cast<std::int64_t>(5));
  EXPECT_EQ(rows[2].zoneId, static_cast<std::int64_t>(9));
  EXPECT_EQ(rows[0].count, static_cast<std::size_t>(8));
  EXPECT_NEAR(SummaryTotal(rows), SumValid(values.values()), 1e-12);

  // Zone 9 covers (2,0),(3,0),(2,1),(3,1).
  EXPECT_NEAR(rows[2].sum, 0.25 + 0.35 + 0.65 + 0.75, 1e-12);
  EXPECT_NEAR(rows[2].mean, 0.5, 1e-12);
  EXPECT_NEAR(rows[2].min, 0.25, 1e-12);
  EXPECT_NEAR(rows[2].max, 0.75, 1e-12);

  // A zone without valid values has no row; null zone cells are skipped.
  values.at(2, 0) = kNaN;
  values.at(3, 0) = kNaN;
  values.at(2, 1) = kNaN;
  values.at(3, 1) = kNaN;
  zones.at(0, 0) = kNaN;
  ASSERT_TRUE(ComputeZonalSummary(ctx, values, zones, rows, err, "values"));
  ASSERT_TRUE(rows.size() == 2);
  EXPECT_EQ(rows[0].count, static_cast<std::size_t>(7));

  const Grid painted = PaintZoneTotals(ctx, zones, rows);
  EXPECT_NEAR(painted.at(0, 1), rows[0].sum, 1e-12);
  EXPECT_TRUE(Grid::IsNoData(painted.at(0, 0)));
  EXPECT_TRUE(Grid::IsNoData(painted.at(3, 0)));
}

static void TestZonalCrossTab()
{
  const GridGeometry geom = Geom(3, 1);
  RunContext ctx(geom);
  const Grid values = MakeGrid(geom, {1.0, 2.0, 4.0});
  const Grid zones = MakeGrid(geom, {1.0, 1.0, 1.0});
  const Grid classes = MakeGrid(geom, {3.0, 2.0, 3.0});

  std::vector<CrossTabRow> rows;
  Error err;
  ASSERT_TRUE(ComputeZonalCrossTab(ctx, values, zones, classes, rows, err));
  ASSERT_TRUE(rows.size() == 2);
  EXPECT_EQ(rows[0].classId, static_cast<std::int64_t>(2));
  EXPECT_EQ(rows[1].classId, static_cast<std::int64_t>(3));
  EXPECT_EQ(rows[1].count, static_cast<std::size_t>(2));
  EXPECT_NEAR(rows[1].sum, 5.0, 1e-12);
}

static void TestZoneIdRange()
{
  const GridGeometry geom = Geom(3, 1);
  RunContext ctx(geom);
  const Grid values = MakeGrid(geom, {1.0, 2.0, kNaN});
  Grid zones = MakeGrid(geom, {1.0, 1e30, 1.0});

  std::vector<SummaryRow> rows;
  Error err;
  EXPECT_FALSE(ComputeZonalSummary(ctx, values, zones, rows, err, "supply"));
  EXPECT_EQ(err.code, ErrorCode::Config);
  EXPECT_TRUE(err.message.find("supply zones") != std::string::npos);

  const Grid classes = MakeGrid(geom, {1.0, 1.0, 1.0});
  std::vector<CrossTabRow> cross;
  EXPECT_FALSE(ComputeZonalCrossTab(ctx, values, zones, classes, cross, err));
  EXPECT_EQ(err.code, ErrorCode::Config);
  EXPECT_FALSE(ComputeZonalCrossTab(ctx, values, classes, zones, cross, err));
  EXPECT_TRUE(err.message.find("classes") != std::string::npos);

  // Painting skips the id instead of wrapping it.
  SummaryRow r;
  r.zoneId = 1;
  r.sum = 3.0;
  const Grid painted = PaintZoneTotals(ctx, zones, {r});
  EXPECT_EQ(painted[0], 3.0);
  EXPECT_TRUE(Grid::IsNoData(painted[1]));

  // Only ids that meet a valid value count; 2^53 itself is exact.
  zones = MakeGrid(geom, {1.0, 9007199254740992.0, -1e300});
  ASSERT_TRUE(ComputeZonalSummary(ctx, values, zones, rows, err, "supply"));
  ASSERT_TRUE(rows.size() == 2);
  EXPECT_EQ(rows[1].zoneId, static_cast<std::int64_t>(9007199254740992LL));
}

static void TestDemandSupply()
{
  const GridGeometry geom = Geom(2, 1);
  RunContext ctx(geom);
  const Grid population = MakeGrid(geom, {10.0, 10.0});
  const Grid spectrum = MakeGrid(geom, {1.0, 9.0});

  Grid demand;
  Error err;
  ASSERT_TRUE(ComputeDemand(ctx, population, spectrum, AppealSource::Spectrum, demand, err));
  EXPECT_EQ(demand[0], 0.0);
  EXPECT_EQ(demand[1], 10.0);

  const Grid potential = MakeGrid(geom, {0.5, 1.0});
  const Grid d2 = MakeGrid(geom, {1.0, 2.0});
  SupplyResult balanced;
  ASSERT_TRUE(ComputeSupply(ctx, potential, d2, 0.0, balanced, err));
  EXPECT_NEAR(balanced.capacity, 2.0, 1e-12);
  EXPECT_NEAR(balanced.supply[0], 1.0, 1e-12);
  EXPECT_NEAR(balanced.supply[1], 2.0, 1e-12);

  Grid unmet;
  ASSERT_TRUE(ComputeUnmetDemand(ctx, d2, balanced.supply, unmet, err));
  EXPECT_NEAR(unmet[0], 0.0, 1e-12);

  SupplyResult fixed;
  ASSERT_TRUE(ComputeSupply(ctx, potential, d2, 3.0, fixed, err));
  ASSERT_TRUE(ComputeUnmetDemand(ctx, d2, fixed.supply, unmet, err));
  EXPECT_NEAR(unmet[0], -0.5, 1e-12);
  EXPECT_NEAR(unmet[1], -1.0, 1e-12);

  const Grid zeroPotential(geom, 0.0);
  SupplyResult none;
  ASSERT_TRUE(ComputeSupply(ctx, zeroPotential, d2, 0.0, none, err));
  EXPECT_EQ(none.capacity, 0.0);
  EXPECT_FALSE(none.warnings.empty());
}

static void TestOpportunityWithoutInfrastructureFailsBeforeReads()
{
  MemoryRasterStore store;
  store.putGrid("land", Grid(Geom(2, 2), 0.5));

  RecreationConfig cfg;
  cfg.inputs.land = "land";
  cfg.outputs.opportunity = true;

  PipelineResult res;
  Error err;
  EXPECT_FALSE(RunRecreationPipeline(cfg, store, res, err));
  EXPECT_EQ(err.code, ErrorCode::Config);
  EXPECT_EQ(store.readCount(), static_cast<std::size_t>(0));

  // Spectrum needs opportunity too.
  cfg.outputs = RecreationOutputs{};
  cfg.outputs.spectrum = true;
  EXPECT_FALSE(RunRecreationPipeline(cfg, store, res, err));
  EXPECT_EQ(err.code, ErrorCode::Config);

  // Nothing requested at all.
  cfg.outputs = RecreationOutputs{};
  EXPECT_FALSE(RunRecreationPipeline(cfg, store, res, err));
  EXPECT_EQ(err.code, ErrorCode::Config);

  // A missing grid is reported before anything is read.
  cfg.outputs.potential = true;
  cfg.inputs.water = {"no_such_grid"};
  EXPECT_FALSE(RunRecreationPipeline(cfg, store, res, err));
  EXPECT_EQ(err.code, ErrorCode::Io);
  EXPECT_TRUE(err.message.find("no_such_grid") != std::string::npos);
  EXPECT_EQ(store.readCount(), static_cast<std::size_t>(0));

  // Unused inputs are only a warning.
  cfg.inputs.water.clear();
  cfg.inputs.population = "land";
  ASSERT_TRUE(RunRecreationPipeline(cfg, store, res, err));
  EXPECT_TRUE(HasWarningContaining(res.warnings, "population"));
  EXPECT_TRUE(store.grid("potential") != nullptr);

  // A stage failure keeps the warnings raised before it.
  store.putGrid("small", Grid(Geom(1, 1), 0.5));
  cfg.inputs.water = {"small"};
  res = PipelineResult{};
  EXPECT_FALSE(RunRecreationPipeline(cfg, store, res, err));
  EXPECT_EQ(err.code, ErrorCode::Alignment);
  EXPECT_TRUE(HasWarningContaining(res.warnings, "population"));
}

static void TestUnusedRuleSourcesAreNotLoaded()
{
  MemoryRasterStore store;
  store.putGrid("land", Grid(Geom(2, 2), 0.5));
  store.putGrid("protected", Grid(Geom(2, 2), 1.0));

  RecreationConfig cfg;
  cfg.inputs.land = "land";
  cfg.outputs.potential = true;
  cfg.landClasses = "1:x:1";
  cfg.protectedScores = "1:x:1";
  cfg.mobilitySchedule = "no_such_schedule.txt";
  cfg.infrastructureSchedule = "no_such_schedule.txt";
  cfg.artificialDistances = "no_such_table.txt";

  PipelineResult res;
  Error err;
  const bool ok = RunRecreationPipeline(cfg, store, res, err);
  if (!ok) std::cerr << FormatError(err) << "\n";
  EXPECT_TRUE(ok);

  // The protected scores are consumed once a protected grid is given.
  cfg.inputs.protectedAreas = "protected";
  EXPECT_FALSE(RunRecreationPipeline(cfg, store, res, err));
  EXPECT_EQ(err.code, ErrorCode::RuleParse);
}

static void TestFullPipeline()
{
  MemoryRasterStore store;
  RecreationConfig cfg;
  BuildScene(store, cfg);

  PipelineResult res;
  Error err;
  const bool ok = RunRecreationPipeline(cfg, store, res, err);
  if (!ok) std::cerr << FormatError(err) << "\n";
  ASSERT_TRUE(ok);

  EXPECT_EQ(res.written.size(), AllRecreationOutputNames().size());
  EXPECT_TRUE(res.written == RecreationOutputNames(cfg.outputs));
  for (const char* name : {"potential", "potential_index", "opportunity", "opportunity_index", "spectrum", "demand",
                           "unmet_demand", "mobility", "flow"}) {
    EXPECT_TRUE(store.grid(name) != nullptr);
  }
  ASSERT_TRUE(store.table("supply") != nullptr);
  ASSERT_TRUE(store.table("use") != nullptr);
  ASSERT_TRUE(store.table("demand_zones") != nullptr);
  ASSERT_TRUE(store.crossTable("supply_landcover") != nullptr);
  ASSERT_TRUE(store.grid("spectrum") != nullptr);

  const Grid& potentialIndex = *store.grid("potential_index");
  EXPECT_EQ(potentialIndex.at(0, 0), 1.0);
  for (std::size_t i = 0; i < potentialIndex.size(); ++i) {
    EXPECT_TRUE(potentialIndex[i] >= 0.0 && potentialIndex[i] <= 1.0);
  }
  EXPECT_EQ(store.grid("potential")->at(0, 0), 3.0);
  EXPECT_EQ(store.grid("opportunity")->at(0, 0), 3.0);
  EXPECT_EQ(store.grid("spectrum")->at(0, 0), 9.0);

  // Tables are sorted by zone id.
  const std::vector<SummaryRow>& supply = *store.table("supply");
  const std::vector<SummaryRow>& use = *store.table("use");
  const std::vector<SummaryRow>& demandZones = *store.table("demand_zones");
  ASSERT_TRUE(supply.size() == 2 && use.size() == 2 && demandZones.size() == 2);
  EXPECT_EQ(supply[0].zoneId, static_cast<std::int64_t>(1));
  EXPECT_EQ(supply[1].zoneId, static_cast<std::int64_t>(2));
  EXPECT_EQ(use[0].zoneId, static_cast<std::int64_t>(1));
  EXPECT_EQ(demandZones[0].zoneId, static_cast<std::int64_t>(3));
  EXPECT_EQ(demandZones[1].zoneId, static_cast<std::int64_t>(7));

  // Balanced capacity: total supply equals total demand.
  const double totalDemand = SumValid(store.grid("demand")->values());
  EXPECT_NEAR(SummaryTotal(supply), totalDemand, 1e-9 * totalDemand);
  EXPECT_NEAR(SummaryTotal(demandZones), totalDemand, 1e-9 * totalDemand);
  EXPECT_NEAR(SumValid(store.grid("unmet_demand")->values()), 0.0, 1e-9 * totalDemand);
  EXPECT_TRUE(res.supplyCapacity > 0.0);

  // Flow paints each zone with its mobility total.
  EXPECT_NEAR(store.grid("flow")->at(0, 0), use[0].sum, 1e-12);
  EXPECT_NEAR(store.grid("flow")->at(5, 5), use[1].sum, 1e-12);

  // The highest-spectrum cell lies in aggregation zone 1 on CORINE class 10 (MAES 1).
  const std::vector<CrossTabRow>& landcover = *store.crossTable("supply_landcover");
  bool found = false;
  for (const CrossTabRow& r : landcover) {
    if (r.zoneId == 1 && r.classId == 1) found = true;
  }
  EXPECT_TRUE(found);

  EXPECT_EQ(res.gridStats.size(), static_cast<std::size_t>(9));
  EXPECT_EQ(res.geometry.cols, 6);
}

static void TestPipelineMaskAndUnscored()
{
  MemoryRasterStore store;
  RecreationConfig cfg;
  BuildScene(store, cfg);

  Grid mask(Geom(6, 6, 100.0), 1.0);
  mask.at(5, 5) = 0.0;
  store.putGrid("mask", mask);
  cfg.inputs.mask = "mask";

  PipelineResult res;
  Error err;
  ASSERT_TRUE(RunRecreationPipeline(cfg, store, res, err));
  for (const char* name : {"potential_index", "opportunity_index", "spectrum", "demand", "mobility", "flow"}) {
    const Grid* g = store.grid(name);
    ASSERT_TRUE(g != nullptr);
    EXPECT_TRUE(Grid::IsNoData(g->at(5, 5)));
    EXPECT_FALSE(Grid::IsNoData(g->at(4, 5)));
  }

  Grid landuse = *store.grid("landuse");
  landuse.at(3, 3) = 99.0;
  store.putGrid("landuse", landuse);
  EXPECT_FALSE(RunRecreationPipeline(cfg, store, res, err));
  EXPECT_EQ(err.code, ErrorCode::UnscoredValue);

  cfg.unscored = UnscoredPolicy::NoData;
  EXPECT_TRUE(RunRecreationPipeline(cfg, store, res, err));
}

static void TestThreadCountDoesNotChangeOutputs()
{
  MemoryRasterStore one;
  MemoryRasterStore many;
  RecreationConfig cfg;
  BuildScene(one, cfg);
  BuildScene(many, cfg);

  PipelineResult r1;
  PipelineResult r4;
  Error err;
  cfg.threads = 1;
  ASSERT_TRUE(RunRecreationPipeline(cfg, one, r1, err));
  cfg.threads = 4;
  ASSERT_TRUE(RunRecreationPipeline(cfg, many, r4, err));

  for (const auto& kv : one.grids()) {
    const Grid* other = many.grid(kv.first);
    ASSERT_TRUE(other != nullptr);
    EXPECT_TRUE(SameBits(kv.second, *other));
  }
  const std::vector<SummaryRow>& a = *one.table("use");
  const std::vector<SummaryRow>& b = *many.table("use");
  ASSERT_TRUE(a.size() == b.size());
  for (std::size_t i = 0; i < a.size(); ++i) {
    EXPECT_TRUE(std::memcmp(&a[i].sum, &b[i].sum, sizeof(double)) == 0);
  }
  EXPECT_TRUE(std::memcmp(&r1.supplyCapacity, &r4.supplyCapacity, sizeof(double)) == 0);
}

static void TestUnivariateText()
{
  const Grid g = MakeGrid(Geom(2, 2), {1.0, 2.0, 3.0, kNaN});
  const UnivariateStats s = ComputeUnivariateStats(g);
  EXPECT_EQ(s.n, static_cast<std::size_t>(3));
  EXPECT_EQ(s.nullCells, static_cast<std::size_t>(1));
  EXPECT_EQ(s.cells, static_cast<std::size_t>(4));
  EXPECT_EQ(s.mean, 2.0);
  EXPECT_EQ(s.range, 2.0);
  EXPECT_EQ(s.sum, 6.0);
  EXPECT_NEAR(s.variance, 2.0 / 3.0, 1e-15);

  const std::string text = FormatUnivariateStats(s);
  EXPECT_TRUE(text.rfind("n=3\nnull_cells=1\ncells=4\nmin=1\nmax=3\n", 0) == 0);

  std::string diff;
  EXPECT_TRUE(CompareUnivariateText(text, text, diff));

  const Grid changed = MakeGrid(Geom(2, 2), {1.0, 2.0, 3.5, kNaN});
  EXPECT_FALSE(CompareUnivariateText(text, FormatUnivariateStats(ComputeUnivariateStats(changed)), diff));
  EXPECT_TRUE(diff.find("max=") != std::string::npos);
}

static void TestAsciiGridHeader()
{
  const std::string text = "NCOLS 3\n"
                           "nrows 2\n"
                           "xllcenter 5\n"
                           "yllcenter 15\n"
                           "cellsize 10\n"
                           "nodata_value -9999\n"
                           "1 2 -9999\n"
                           "4 nan 6\n";
  Grid g;
  Error err;
  ASSERT_TRUE(ParseAsciiGrid(text, g, err));
  EXPECT_EQ(g.cols(), 3);
  EXPECT_EQ(g.rows(), 2);
  EXPECT_NEAR(g.geometry().west, 0.0, 1e-12);
  EXPECT_NEAR(g.geometry().south, 10.0, 1e-12);
  EXPECT_EQ(g.at(1, 0), 2.0);
  EXPECT_TRUE(Grid::IsNoData(g.at(2, 0)));
  EXPECT_TRUE(Grid::IsNoData(g.at(1, 1)));
  EXPECT_EQ(g.validCount(), static_cast<std::size_t>(4));

  EXPECT_FALSE(ParseAsciiGrid("ncols 2\nnrows 1\nxllcorner 0\nyllcorner 0\ncellsize 1\n1\n", g, err));
  EXPECT_EQ(err.code, ErrorCode::Io);

  // Non-finite cells are rejected; "nan" alone spells no-data.
  const std::string header = "ncols 2\nnrows 1\nxllcorner 0\nyllcorner 0\ncellsize 1\n";
  for (const char* cell : {"inf", "-Infinity", "1e999"}) {
    EXPECT_FALSE(ParseAsciiGrid(header + "1 " + cell + "\n", g, err));
    EXPECT_EQ(err.code, ErrorCode::Io);
    EXPECT_TRUE(err.message.find(cell) != std::string::npos);
  }

  // Dimensions must be positive integers that fit an int.
  for (const char* cols : {"2.7", "0", "-3", "3e9"}) {
    const std::string bad = std::string("ncols ") + cols + "\nnrows 1\nxllcorner 0\nyllcorner 0\ncellsize 1\n1 2\n";
    EXPECT_FALSE(ParseAsciiGrid(bad, g, err));
    EXPECT_EQ(err.code, ErrorCode::Io);
    EXPECT_TRUE(err.message.find("ncols") != std::string::npos);
  }
  EXPECT_TRUE(ParseAsciiGrid("ncols 2.0\nnrows 1\nxllcorner 0\nyllcorner 0\ncellsize 1\n1 2\n", g, err));
  EXPECT_EQ(g.cols(), 2);
}

static void TestConfigJson()
{
  RecreationConfig cfg;
  cfg.inputs.land = "suitability";
  cfg.inputs.water = {"rivers", "sea"};
  cfg.inputs.infrastructure = "dist";
  cfg.outputs.spectrum = true;
  cfg.outputs.useTable = true;
  cfg.potentialCuts = ClassCutPoints{0.25, 0.75};
  cfg.noData = NoDataPolicy::ZeroContribution;
  cfg.mobilityDecay.score = 0.3;
  cfg.appeal = AppealSource::Spectrum;
  cfg.threads = 3;
  cfg.opportunityZeroFloor = 1.0 / 3.0;

  const std::string json = RecreationConfigToJson(cfg);
  RecreationConfig loaded;
  Error err;
  ASSERT_TRUE(ApplyRecreationConfigText(json, loaded, err));
  EXPECT_EQ(RecreationConfigToJson(loaded), json);
  EXPECT_EQ(loaded.opportunityZeroFloor, 1.0 / 3.0);
  EXPECT_TRUE(loaded.inputs.water.size() == 2);

  // Merge semantics: only the given keys change.
  ASSERT_TRUE(ApplyRecreationConfigText("{\"threads\": 8, \"policy\": {\"unscored\": \"nodata\"}}", loaded, err));
  EXPECT_EQ(loaded.threads, 8);
  EXPECT_EQ(loaded.unscored, UnscoredPolicy::NoData);
  EXPECT_EQ(loaded.inputs.land, std::string("suitability"));
  EXPECT_EQ(loaded.appeal, AppealSource::Spectrum);

  // Errors name the key and leave the config untouched.
  EXPECT_FALSE(ApplyRecreationConfigText("{\"filters\": {\"average_window\": \"7\"}}", loaded, err));
  EXPECT_EQ(err.code, ErrorCode::Config);
  EXPECT_TRUE(err.message.find("average_window") != std::string::npos);
  EXPECT_TRUE(err.message.find("got string") != std::string::npos);
  EXPECT_EQ(loaded.threads, 8);

  EXPECT_FALSE(ApplyRecreationConfigText("{\"outputs\": [\"potential\", \"happiness\"]}", loaded, err));
  EXPECT_TRUE(err.message.find("happiness") != std::string::npos);

  EXPECT_FALSE(ApplyRecreationConfigText("{\"threads\": 1,}", loaded, err));
  EXPECT_EQ(err.code, ErrorCode::Config);
  EXPECT_TRUE(err.message.find("line 1") != std::string::npos);

  EXPECT_FALSE(LoadRecreationConfigJsonFile("/nonexistent/estimap.json", loaded, err));
  EXPECT_EQ(err.code, ErrorCode::Io);
}

int main()
{
  TestNormalizeLandAndWater();
  TestNormalizeRangeProperties();
  TestNormalizeDegenerateRange();
  TestNormalizeRejectsInfinity();
  TestNoDataPolicies();
  TestZeroFloor();
  TestMaskAndAlignment();
  TestRuleTableScoring();
  TestUnscoredPolicy();
  TestClassificationAndSpectrum();
  TestAttractivenessDecreases();
  TestUncoveredDistance();
  TestMobilityExcludesOpenBand();
  TestDistanceTransforms();
  TestProximityAndAverage();
  TestArtificialAccessibility();
  TestZonalConservation();
  TestZonalCrossTab();
  TestZoneIdRange();
  TestDemandSupply();
  TestOpportunityWithoutInfrastructureFailsBeforeReads();
  TestUnusedRuleSourcesAreNotLoaded();
  TestFullPipeline();
  TestPipelineMaskAndUnscored();
  TestThreadCountDoesNotChangeOutputs();
  TestUnivariateText();
  TestAsciiGridHeader();
  TestConfigJson();

  if (g_failures == 0) {
    std::cout << "estimap_tests: OK\n";
    return 0;
  }

  std::cerr << "estimap_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
