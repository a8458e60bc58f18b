#pragma once

#include "estimap/DefaultRules.hpp"
#include "estimap/Demand.hpp"
#include "estimap/DistanceDecay.hpp"
#include "estimap/Normalize.hpp"
#include "estimap/Recreation.hpp"
#include "estimap/Scorer.hpp"

#include <string>
#include <vector>

namespace estimap {

// Names of the grids in the raster store, by role. Empty means "not given".
struct RecreationInputs {
  // Land: exactly one of a pre-scored suitability grid or a categorical
  // land use grid (scored with suitabilityScores).
  std::string land;
  std::string landuse;

  // Water: pre-scored grids plus feature maps scored by proximity.
  std::vector<std::string> water;
  std::string lakes;
  std::string coastline;
  std::string coastGeomorphology;
  std::string bathingWater;

  // Natural: pre-scored grids plus protected area categories.
  std::vector<std::string> natural;
  std::string protectedAreas;

  std::vector<std::string> urban;

  // Infrastructure: a distance grid, and/or artificial surfaces + roads.
  std::string infrastructure;
  std::string artificial;
  std::string roads;

  std::string mask;

  std::string population;
  std::string base;
  std::string aggregation;
  std::string landcover;

  // Distance used by mobility; when empty the distance to the highest
  // recreation spectrum is computed.
  std::string mobilityDistance;
};

// Which products a run writes back to the store.
struct RecreationOutputs {
  bool potential = false;        // 3-class potential
  bool potentialIndex = false;   // continuous potential
  bool opportunity = false;      // 3-class opportunity
  bool opportunityIndex = false; // continuous opportunity
  bool spectrum = false;
  bool demand = false;
  bool unmetDemand = false;
  bool mobility = false;
  bool flow = false;

  // Tables.
  bool supplyTable = false;
  bool useTable = false;
  bool demandTable = false;
  bool supplyLandcover = false;

  bool any() const;
};

// Stable output names, in write order.
std::vector<std::string> RecreationOutputNames(const RecreationOutputs& o);

// Enable an output by name; false for an unknown name.
bool EnableRecreationOutput(const std::string& name, RecreationOutputs& io);

// Every name accepted by EnableRecreationOutput.
const std::vector<std::string>& AllRecreationOutputNames();

struct RecreationConfig {
  RecreationInputs inputs;
  RecreationOutputs outputs;

  // Rule sources in configuration form: text containing ':' is inline rule
  // text, anything else is a file path. Empty selects the built-in default.
  std::string suitabilityScores;
  Nomenclature landuseNomenclature = Nomenclature::Corine;
  std::string protectedScores;
  std::string artificialDistances;
  std::string roadsDistances;
  std::string landClasses;
  std::string infrastructureSchedule;
  std::string mobilitySchedule;

  // Proximity coefficients, "metric,constant,kappa,alpha[,score]".
  std::string lakeCoefficients = std::string(kDefaultLakeCoefficients);
  std::string coastlineCoefficients = std::string(kDefaultCoastlineCoefficients);
  std::string bathingCoefficients = std::string(kDefaultBathingCoefficients);

  DecayConfig infrastructureDecay{};
  DecayConfig mobilityDecay{};

  ClassCutPoints potentialCuts{};
  ClassCutPoints opportunityCuts{};

  NoDataPolicy noData = NoDataPolicy::Propagate;
  UnscoredPolicy unscored = UnscoredPolicy::Error;

  // 7x7 average of the land and natural components.
  bool averageFilter = false;
  int averageWindow = 7;

  // Window of the coast geomorphology neighborhood average.
  int coastWindow = 11;

  double opportunityZeroFloor = 0.0001;

  AppealSource appeal = AppealSource::Potential;

  // <= 0: balance total supply with total demand.
  double capacityPerCell = 0.0;

  // <= 0: all hardware threads.
  int threads = 1;
};

} // namespace estimap
