#pragma once

#include "estimap/Config.hpp"
#include "estimap/DistanceDecay.hpp"
#include "estimap/Grid.hpp"
#include "estimap/RasterStore.hpp"
#include "estimap/RuleTable.hpp"
#include "estimap/Status.hpp"
#include "estimap/ZonalStats.hpp"

#include <string>
#include <utility>
#include <vector>

namespace estimap {

// Stages a run has to execute for the requested outputs.
struct PipelinePlan {
  bool potential = false;
  bool opportunity = false;
  bool spectrum = false;
  bool demand = false;
  bool supply = false;
  bool unmetDemand = false;
  bool mobility = false;
  bool flow = false;

  // (role, grid name) pairs that will be read, in read order.
  std::vector<std::pair<std::string, std::string>> reads;
};

// Rule tables and coefficients parsed once, before any grid is read.
// Entries that no planned stage consumes are left empty.
struct ResolvedRules {
  RuleTable suitability;
  RuleTable protectedScores;
  RuleTable artificialDistances;
  RuleTable roadsDistances;
  RuleTable landClasses;

  DecaySchedule infrastructureSchedule;
  DecaySchedule mobilitySchedule;

  DecayCoefficients lakes;
  DecayCoefficients coastline;
  DecayCoefficients bathing;
};

// Validate a configuration against the store without reading any grid.
//
// Fails with ConfigError for inconsistent requests (e.g. opportunity without
// any infrastructure input), RuleParseError/IoError for rule sources, and
// IoError for grids missing from the store.
bool PlanRecreationRun(const RecreationConfig& cfg, const IRasterStore& store, PipelinePlan& outPlan,
                       ResolvedRules& outRules, std::vector<std::string>& warnings, Error& outError);

struct PipelineResult {
  PipelinePlan plan;
  GridGeometry geometry{};

  double supplyCapacity = 0.0;

  // Outputs written to the store, in write order.
  std::vector<std::string> written;

  // Statistics of every written grid.
  std::vector<std::pair<std::string, UnivariateStats>> gridStats;

  std::vector<std::string> warnings;
};

// One-shot run: plan, read inputs, compute, write the requested outputs.
// A failing stage aborts the run; `out` then holds the warnings and writes
// made before it.
bool RunRecreationPipeline(const RecreationConfig& cfg, IRasterStore& store, PipelineResult& out, Error& outError);

} // namespace estimap
