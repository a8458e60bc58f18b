#include "estimap/Pipeline.hpp"

#include "estimap/DefaultRules.hpp"
#include "estimap/Demand.hpp"
#include "estimap/Proximity.hpp"
#include "estimap/Recreation.hpp"
#include "estimap/RunContext.hpp"
#include "estimap/Scorer.hpp"

#include <utility>

namespace estimap {

namespace {

// Only the tables and schedules a planned stage consumes are loaded.
bool ResolveRules(const RecreationConfig& cfg, const PipelinePlan& plan, ResolvedRules& out, Error& outError)
{
  const RecreationInputs& in = cfg.inputs;
  ResolvedRules r;

  auto table = [&](const std::string& configured, Nomenclature fallback, RuleTable& dst) -> bool {
    return ResolveScoreTable(configured.empty() ? RuleSource() : RuleSource::FromConfigString(configured), fallback,
                             dst, outError);
  };
  auto tableOrText = [&](const std::string& configured, std::string_view fallback, RuleTable& dst) -> bool {
    if (configured.empty()) return ParseRuleTable(std::string(fallback), dst, outError);
    return LoadRuleTable(RuleSource::FromConfigString(configured), dst, outError);
  };
  auto schedule = [&](const std::string& configured, std::string_view fallback, DecaySchedule& dst) -> bool {
    if (configured.empty()) return ParseDecaySchedule(std::string(fallback), dst, outError);
    return LoadDecaySchedule(RuleSource::FromConfigString(configured), dst, outError);
  };

  if (!in.landuse.empty() && !table(cfg.suitabilityScores, cfg.landuseNomenclature, r.suitability)) return false;
  if (!in.protectedAreas.empty() && !table(cfg.protectedScores, Nomenclature::Iucn, r.protectedScores)) return false;
  if (plan.opportunity && !in.artificial.empty()) {
    if (!tableOrText(cfg.artificialDistances, kDefaultDistanceCategories, r.artificialDistances)) return false;
    if (!tableOrText(cfg.roadsDistances, kDefaultDistanceCategories, r.roadsDistances)) return false;
  }
  if (plan.opportunity && !in.infrastructure.empty()) {
    if (!schedule(cfg.infrastructureSchedule, kDefaultInfrastructureSchedule, r.infrastructureSchedule)) return false;
  }
  if (cfg.outputs.supplyLandcover && !table(cfg.landClasses, Nomenclature::Maes, r.landClasses)) return false;
  if (plan.mobility && !schedule(cfg.mobilitySchedule, kDefaultMobilitySchedule, r.mobilitySchedule)) return false;

  if (!in.lakes.empty() && !ParseDecayCoefficients(cfg.lakeCoefficients, r.lakes, outError)) return false;
  if (!in.coastline.empty() && !ParseDecayCoefficients(cfg.coastlineCoefficients, r.coastline, outError)) {
    return false;
  }
  if (!in.bathingWater.empty() && !ParseDecayCoefficients(cfg.bathingCoefficients, r.bathing, outError)) {
    return false;
  }

  out = std::move(r);
  return true;
}

void AddRead(PipelinePlan& plan, const char* role, const std::string& name)
{
  if (!name.empty()) plan.reads.emplace_back(role, name);
}

void AddReads(PipelinePlan& plan, const char* role, const std::vector<std::string>& names)
{
  for (const std::string& n : names) AddRead(plan, role, n);
}

void WarnUnused(std::vector<std::string>& warnings, const char* role, const std::string& name, bool used)
{
  if (!name.empty() && !used) {
    warnings.push_back(std::string("input '") + role + "' (" + name + ") is not needed by the requested outputs");
  }
}

// Set no-data cells inside the mask to 0.
void FillNoDataWithZero(const RunContext& ctx, Grid& g)
{
  for (std::size_t i = 0; i < g.size(); ++i) {
    if (!ctx.excluded(i) && Grid::IsNoData(g[i])) g[i] = 0.0;
  }
}

void AppendWarnings(std::vector<std::string>& dst, const std::vector<std::string>& src)
{
  dst.insert(dst.end(), src.begin(), src.end());
}

} // namespace

bool PlanRecreationRun(const RecreationConfig& cfg, const IRasterStore& store, PipelinePlan& outPlan,
                       ResolvedRules& outRules, std::vector<std::string>& warnings, Error& outError)
{
  const RecreationOutputs& o = cfg.outputs;
  const RecreationInputs& in = cfg.inputs;

  if (!o.any()) {
    return Fail(outError, ErrorCode::Config, "no outputs requested");
  }

  PipelinePlan plan;
  plan.mobility = o.mobility || o.flow || o.useTable || o.supplyLandcover;
  plan.flow = o.flow || o.useTable;
  plan.supply = o.supplyTable || o.unmetDemand;
  plan.unmetDemand = o.unmetDemand;
  plan.demand = o.demand || plan.supply || plan.mobility || o.demandTable;
  plan.spectrum = o.spectrum || o.supplyLandcover || (plan.demand && cfg.appeal == AppealSource::Spectrum) ||
                  (plan.mobility && in.mobilityDistance.empty());
  plan.opportunity = o.opportunity || o.opportunityIndex || plan.spectrum;
  plan.potential = true;

  // Consistency of the request, checked before anything is read.
  if (!in.land.empty() && !in.landuse.empty()) {
    return Fail(outError, ErrorCode::Config, "'land' and 'landuse' are mutually exclusive");
  }
  if (in.land.empty() && in.landuse.empty()) {
    return Fail(outError, ErrorCode::Config, "recreation potential requires a 'land' or 'landuse' grid");
  }
  if (in.artificial.empty() != in.roads.empty()) {
    return Fail(outError, ErrorCode::Config, "'artificial' and 'roads' must be given together");
  }
  const bool haveInfrastructure = !in.infrastructure.empty() || (!in.artificial.empty() && !in.roads.empty());
  if (plan.opportunity && !haveInfrastructure) {
    return Fail(outError, ErrorCode::Config,
                "recreation opportunity requires an infrastructure input ('infrastructure', or 'artificial' and "
                "'roads')");
  }
  if (!in.coastGeomorphology.empty() && in.coastline.empty()) {
    return Fail(outError, ErrorCode::Config, "'coast_geomorphology' requires 'coastline'");
  }
  if (plan.demand && in.population.empty()) {
    return Fail(outError, ErrorCode::Config, "demand requires a 'population' grid");
  }
  if ((plan.flow || o.supplyTable || o.supplyLandcover) && in.aggregation.empty()) {
    return Fail(outError, ErrorCode::Config, "flow, supply and use outputs require an 'aggregation' zone grid");
  }
  if (o.demandTable && in.base.empty()) {
    return Fail(outError, ErrorCode::Config, "'demand_zones' requires a 'base' zone grid");
  }
  if (o.supplyLandcover && in.landcover.empty()) {
    return Fail(outError, ErrorCode::Config, "'supply_landcover' requires a 'landcover' grid");
  }
  if (!ValidateCutPoints(cfg.potentialCuts, outError)) return false;
  if (!ValidateCutPoints(cfg.opportunityCuts, outError)) return false;

  ResolvedRules rules;
  if (!ResolveRules(cfg, plan, rules, outError)) return false;

  // Read order: land first (it defines the computational region), then mask.
  AddRead(plan, "land", in.land);
  AddRead(plan, "landuse", in.landuse);
  AddRead(plan, "mask", in.mask);
  AddReads(plan, "water", in.water);
  AddRead(plan, "lakes", in.lakes);
  AddRead(plan, "coastline", in.coastline);
  AddRead(plan, "coast_geomorphology", in.coastGeomorphology);
  AddRead(plan, "bathing_water", in.bathingWater);
  AddReads(plan, "natural", in.natural);
  AddRead(plan, "protected", in.protectedAreas);
  AddReads(plan, "urban", in.urban);
  if (plan.opportunity) {
    AddRead(plan, "infrastructure", in.infrastructure);
    AddRead(plan, "artificial", in.artificial);
    AddRead(plan, "roads", in.roads);
  }
  if (plan.demand) AddRead(plan, "population", in.population);
  if (plan.mobility) AddRead(plan, "mobility_distance", in.mobilityDistance);
  if (plan.flow || o.supplyTable || o.supplyLandcover) AddRead(plan, "aggregation", in.aggregation);
  if (o.demandTable) AddRead(plan, "base", in.base);
  if (o.supplyLandcover) AddRead(plan, "landcover", in.landcover);

  for (const auto& r : plan.reads) {
    if (!store.hasGrid(r.second)) {
      return Fail(outError, ErrorCode::Io, "input grid '" + r.second + "' (" + r.first + ") not found");
    }
  }

  WarnUnused(warnings, "infrastructure", in.infrastructure, plan.opportunity);
  WarnUnused(warnings, "artificial", in.artificial, plan.opportunity);
  WarnUnused(warnings, "roads", in.roads, plan.opportunity);
  WarnUnused(warnings, "population", in.population, plan.demand);
  WarnUnused(warnings, "mobility_distance", in.mobilityDistance, plan.mobility);
  WarnUnused(warnings, "aggregation", in.aggregation, plan.flow || o.supplyTable || o.supplyLandcover);
  WarnUnused(warnings, "base", in.base, o.demandTable);
  WarnUnused(warnings, "landcover", in.landcover, o.supplyLandcover);

  outPlan = std::move(plan);
  outRules = std::move(rules);
  return true;
}

namespace {

// Fills `res` stage by stage; on failure it keeps what was gathered so far.
bool RunStages(const RecreationConfig& cfg, IRasterStore& store, PipelineResult& res, Error& outError)
{
  ResolvedRules rules;
  if (!PlanRecreationRun(cfg, store, res.plan, rules, res.warnings, outError)) return false;

  const RecreationInputs& in = cfg.inputs;
  const RecreationOutputs& o = cfg.outputs;
  const PipelinePlan& plan = res.plan;

  // --- Region and mask ---
  Grid landRaw;
  const std::string& landName = in.land.empty() ? in.landuse : in.land;
  if (!store.readGrid(landName, landRaw, outError)) return false;

  Grid maskGrid;
  if (!in.mask.empty() && !store.readGrid(in.mask, maskGrid, outError)) return false;

  RunContext ctx;
  if (!RunContext::Create(landRaw.geometry(), in.mask.empty() ? nullptr : &maskGrid, cfg.threads, ctx, outError)) {
    return false;
  }
  res.geometry = ctx.geometry();

  auto read = [&](const std::string& name, const char* role, Grid& dst) -> bool {
    if (!store.readGrid(name, dst, outError)) return false;
    return ctx.checkAligned(dst, role, outError);
  };

  ScoreConfig scoreCfg;
  scoreCfg.unscored = cfg.unscored;

  // --- Land ---
  Grid land;
  if (!in.landuse.empty()) {
    scoreCfg.label = "landuse";
    ScoreResult scored;
    if (!ScoreGrid(ctx, landRaw, rules.suitability, scoreCfg, scored, outError)) return false;
    AppendWarnings(res.warnings, scored.warnings);
    land = std::move(scored.grid);
  } else {
    land = std::move(landRaw);
  }

  // --- Water ---
  std::vector<Grid> water;
  for (const std::string& name : in.water) {
    Grid g;
    if (!read(name, "water", g)) return false;
    water.push_back(std::move(g));
  }

  auto proximity = [&](const std::string& name, const char* role, const DecayCoefficients& coeffs,
                       Grid& dst) -> bool {
    Grid features;
    if (!read(name, role, features)) return false;
    return ComputeProximityAttractiveness(ctx, features, coeffs, dst, res.warnings, outError, role);
  };

  if (!in.lakes.empty()) {
    Grid g;
    if (!proximity(in.lakes, "lakes", rules.lakes, g)) return false;
    water.push_back(std::move(g));
  }
  if (!in.coastline.empty()) {
    Grid coast;
    if (!proximity(in.coastline, "coastline", rules.coastline, coast)) return false;

    if (!in.coastGeomorphology.empty()) {
      Grid geomorphology;
      if (!read(in.coastGeomorphology, "coast_geomorphology", geomorphology)) return false;
      Grid averaged;
      if (!NeighborhoodAverage(ctx, geomorphology, cfg.coastWindow, averaged, outError, "coast_geomorphology")) {
        return false;
      }
      Grid scored(ctx.geometry());
      for (std::size_t i = 0; i < scored.size(); ++i) {
        if (ctx.excluded(i)) continue;
        const double a = Grid::IsNoData(averaged[i]) ? 0.0 : averaged[i];
        scored[i] = a * coast[i];
      }
      water.push_back(std::move(scored));
    }
    water.push_back(std::move(coast));
  }
  if (!in.bathingWater.empty()) {
    Grid g;
    if (!proximity(in.bathingWater, "bathing_water", rules.bathing, g)) return false;
    water.push_back(std::move(g));
  }

  // --- Natural ---
  std::vector<Grid> natural;
  for (const std::string& name : in.natural) {
    Grid g;
    if (!read(name, "natural", g)) return false;
    natural.push_back(std::move(g));
  }
  if (!in.protectedAreas.empty()) {
    Grid raw;
    if (!read(in.protectedAreas, "protected", raw)) return false;
    scoreCfg.label = "protected";
    ScoreResult scored;
    if (!ScoreGrid(ctx, raw, rules.protectedScores, scoreCfg, scored, outError)) return false;
    AppendWarnings(res.warnings, scored.warnings);
    FillNoDataWithZero(ctx, scored.grid);
    natural.push_back(std::move(scored.grid));
  }

  // --- Urban ---
  std::vector<Grid> urban;
  for (const std::string& name : in.urban) {
    Grid g;
    if (!read(name, "urban", g)) return false;
    urban.push_back(std::move(g));
  }

  // --- Potential ---
  PotentialInputs pin;
  pin.land = &land;
  for (const Grid& g : water) pin.water.push_back(&g);
  for (const Grid& g : natural) pin.natural.push_back(&g);
  for (const Grid& g : urban) pin.urban.push_back(&g);

  PotentialConfig pcfg;
  pcfg.noData = cfg.noData;
  pcfg.averageFilter = cfg.averageFilter;
  pcfg.averageWindow = cfg.averageWindow;

  PotentialResult potential;
  if (!ComputePotential(ctx, pin, pcfg, potential, outError)) return false;
  AppendWarnings(res.warnings, potential.warnings);
  const Grid& potentialIndex = potential.potential.grid;

  Grid potentialClasses;
  if (!ClassifyIndex(ctx, potentialIndex, cfg.potentialCuts, potentialClasses, outError, "potential")) return false;

  // --- Opportunity and spectrum ---
  NormalizeResult opportunity;
  Grid opportunityClasses;
  Grid spectrum;
  if (plan.opportunity) {
    InfrastructureInputs iin;
    Grid infraDistance;
    Grid artificial;
    Grid roads;
    if (!in.infrastructure.empty()) {
      if (!read(in.infrastructure, "infrastructure", infraDistance)) return false;
      iin.distance = &infraDistance;
    }
    if (!in.artificial.empty()) {
      if (!read(in.artificial, "artificial", artificial)) return false;
      if (!read(in.roads, "roads", roads)) return false;
      iin.artificial = &artificial;
      iin.roads = &roads;
    }

    InfrastructureConfig icfg;
    icfg.schedule = rules.infrastructureSchedule;
    icfg.decay = cfg.infrastructureDecay;
    icfg.artificialCategories = rules.artificialDistances;
    icfg.roadsCategories = rules.roadsDistances;
    icfg.noData = cfg.noData;

    InfrastructureResult infra;
    if (!ComputeInfrastructure(ctx, iin, icfg, infra, outError)) return false;
    AppendWarnings(res.warnings, infra.warnings);

    OpportunityConfig ocfg;
    ocfg.noData = cfg.noData;
    ocfg.zeroFloor = cfg.opportunityZeroFloor;
    if (!ComputeOpportunity(ctx, potentialIndex, infra.index, ocfg, opportunity, outError)) return false;
    AppendWarnings(res.warnings, opportunity.warnings);

    if (!ClassifyIndex(ctx, opportunity.grid, cfg.opportunityCuts, opportunityClasses, outError, "opportunity")) {
      return false;
    }
  }
  if (plan.spectrum) {
    if (!ComputeSpectrum(ctx, potentialClasses, opportunityClasses, spectrum, outError)) return false;
  }

  // --- Demand, supply, unmet demand ---
  Grid demand;
  if (plan.demand) {
    Grid population;
    if (!read(in.population, "population", population)) return false;
    const Grid& appeal = (cfg.appeal == AppealSource::Spectrum) ? spectrum : potentialIndex;
    if (!ComputeDemand(ctx, population, appeal, cfg.appeal, demand, outError)) return false;
  }

  SupplyResult supply;
  if (plan.supply) {
    if (!ComputeSupply(ctx, potentialIndex, demand, cfg.capacityPerCell, supply, outError)) return false;
    AppendWarnings(res.warnings, supply.warnings);
    res.supplyCapacity = supply.capacity;
  }

  Grid unmet;
  if (plan.unmetDemand) {
    if (!ComputeUnmetDemand(ctx, demand, supply.supply, unmet, outError)) return false;
  }

  // --- Mobility and flow ---
  MobilityResult mobility;
  if (plan.mobility) {
    Grid distance;
    if (!in.mobilityDistance.empty()) {
      if (!read(in.mobilityDistance, "mobility_distance", distance)) return false;
    } else {
      const Grid highest = SelectEqual(spectrum, static_cast<double>(kHighestSpectrum));
      if (!ComputeGrowDistance(ctx, highest, DistanceMetric::Euclidean, distance, outError, "highest_spectrum")) {
        return false;
      }
      if (distance.validCount() == 0) {
        res.warnings.push_back("no cell reaches the highest recreation spectrum; mobility is no-data");
      }
    }
    if (!ComputeMobility(ctx, demand, distance, rules.mobilitySchedule, cfg.mobilityDecay, mobility, outError)) {
      return false;
    }
  }

  Grid aggregation;
  if (plan.flow || o.supplyTable || o.supplyLandcover) {
    if (!read(in.aggregation, "aggregation", aggregation)) return false;
  }

  FlowResult flow;
  if (plan.flow) {
    if (!ComputeFlow(ctx, mobility.mobility, aggregation, flow, outError)) return false;
  }

  std::vector<SummaryRow> supplyRows;
  if (o.supplyTable) {
    if (!ComputeZonalSummary(ctx, supply.supply, aggregation, supplyRows, outError, "supply")) return false;
  }

  std::vector<SummaryRow> demandRows;
  if (o.demandTable) {
    Grid base;
    if (!read(in.base, "base", base)) return false;
    if (!ComputeZonalSummary(ctx, demand, base, demandRows, outError, "demand")) return false;
  }

  std::vector<CrossTabRow> landcoverRows;
  if (o.supplyLandcover) {
    Grid landcover;
    if (!read(in.landcover, "landcover", landcover)) return false;

    ScoreConfig lc;
    lc.label = "landcover";
    lc.unscored = UnscoredPolicy::NoData;
    ScoreResult classes;
    if (!ScoreGrid(ctx, landcover, rules.landClasses, lc, classes, outError)) return false;
    AppendWarnings(res.warnings, classes.warnings);

    Grid highestMobility(ctx.geometry());
    for (std::size_t i = 0; i < highestMobility.size(); ++i) {
      if (spectrum.isValid(i) && spectrum[i] == static_cast<double>(kHighestSpectrum)) {
        highestMobility[i] = mobility.mobility[i];
      }
    }
    if (!ComputeZonalCrossTab(ctx, highestMobility, aggregation, classes.grid, landcoverRows, outError)) return false;
  }

  // --- Outputs ---
  auto writeGrid = [&](const char* name, const Grid& g) -> bool {
    if (!store.writeGrid(name, g, outError)) return false;
    res.written.emplace_back(name);
    res.gridStats.emplace_back(name, ComputeUnivariateStats(g));
    return true;
  };
  auto writeTable = [&](const char* name, const std::vector<SummaryRow>& rows) -> bool {
    if (!store.writeTable(name, rows, outError)) return false;
    res.written.emplace_back(name);
    return true;
  };

  if (o.potential && !writeGrid("potential", potentialClasses)) return false;
  if (o.potentialIndex && !writeGrid("potential_index", potentialIndex)) return false;
  if (o.opportunity && !writeGrid("opportunity", opportunityClasses)) return false;
  if (o.opportunityIndex && !writeGrid("opportunity_index", opportunity.grid)) return false;
  if (o.spectrum && !writeGrid("spectrum", spectrum)) return false;
  if (o.demand && !writeGrid("demand", demand)) return false;
  if (o.unmetDemand && !writeGrid("unmet_demand", unmet)) return false;
  if (o.mobility && !writeGrid("mobility", mobility.mobility)) return false;
  if (o.flow && !writeGrid("flow", flow.flow)) return false;
  if (o.supplyTable && !writeTable("supply", supplyRows)) return false;
  if (o.useTable && !writeTable("use", flow.rows)) return false;
  if (o.demandTable && !writeTable("demand_zones", demandRows)) return false;
  if (o.supplyLandcover) {
    if (!store.writeCrossTable("supply_landcover", landcoverRows, outError)) return false;
    res.written.emplace_back("supply_landcover");
  }
  return true;
}

} // namespace

bool RunRecreationPipeline(const RecreationConfig& cfg, IRasterStore& store, PipelineResult& out, Error& outError)
{
  PipelineResult res;
  const bool ok = RunStages(cfg, store, res, outError);
  out = std::move(res);
  return ok;
}

} // namespace estimap
