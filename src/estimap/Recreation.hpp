#pragma once

#include "estimap/DistanceDecay.hpp"
#include "estimap/Grid.hpp"
#include "estimap/Normalize.hpp"
#include "estimap/Proximity.hpp"
#include "estimap/RuleTable.hpp"
#include "estimap/RunContext.hpp"
#include "estimap/Status.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace estimap {

// Potential, opportunity and the recreation spectrum.

// Ordinal classes of a [0,1] index.
enum class ProximityClass : std::uint8_t {
  Near = 1,
  Midrange = 2,
  Far = 3,
};

const char* ProximityClassName(ProximityClass c);

// Cut points over [0,1]: class 1 for v <= low, class 2 for low < v <= high,
// class 3 above.
struct ClassCutPoints {
  double low = 1.0 / 3.0;
  double high = 2.0 / 3.0;
};

// ConfigError unless 0 <= low < high <= 1.
bool ValidateCutPoints(const ClassCutPoints& cuts, Error& outError);

// 1..3 for a finite value.
int ClassifyValue(double v, const ClassCutPoints& cuts);

// Classify every valid cell of an index grid into 1..3.
bool ClassifyIndex(const RunContext& ctx, const Grid& index, const ClassCutPoints& cuts, Grid& out,
                   Error& outError, const std::string& label = {});

// Fixed 3x3 lookup: (potentialClass - 1) * 3 + opportunityClass.
// Returns 0 if either class is outside 1..3.
int SpectrumClass(int potentialClass, int opportunityClass);

bool ComputeSpectrum(const RunContext& ctx, const Grid& potentialClasses, const Grid& opportunityClasses, Grid& out,
                     Error& outError);

// Grids contributing to recreation potential. Pointers are not owned.
struct PotentialInputs {
  // Exactly one land grid is required.
  const Grid* land = nullptr;
  std::vector<const Grid*> water;
  std::vector<const Grid*> natural;
  std::vector<const Grid*> urban;
};

struct PotentialConfig {
  NoDataPolicy noData = NoDataPolicy::Propagate;

  // Land no-data inside the mask counts as 0.
  bool landNoDataAsZero = true;

  // Smooth the land and natural component indices before combining.
  bool averageFilter = false;
  int averageWindow = 7;

  // Zero floor applied when a multi-grid component is normalized.
  double componentZeroFloor = 0.0;
};

struct PotentialResult {
  // Per-component indices (empty grid when the component has no input).
  Grid land;
  Grid water;
  Grid natural;
  Grid urban;

  // Normalized potential in [0,1].
  NormalizeResult potential;

  std::vector<std::string> warnings;
};

// Components with several grids are first normalized into one index; the
// potential is then the normalized sum of all component indices.
bool ComputePotential(const RunContext& ctx, const PotentialInputs& in, const PotentialConfig& cfg,
                      PotentialResult& out, Error& outError);

// Infrastructure accessibility inputs. Pointers are not owned.
struct InfrastructureInputs {
  // Pre-computed distance to infrastructure (map units).
  const Grid* distance = nullptr;

  // Feature grids; both or neither must be given.
  const Grid* artificial = nullptr;
  const Grid* roads = nullptr;

  bool any() const { return distance || artificial || roads; }
};

struct InfrastructureConfig {
  DecaySchedule schedule;
  DecayConfig decay;

  RuleTable artificialCategories;
  RuleTable roadsCategories;

  NoDataPolicy noData = NoDataPolicy::Propagate;
};

struct InfrastructureResult {
  // Decay of the infrastructure distance (empty when not given).
  Grid distanceAttractiveness;

  ArtificialAccessibilityResult artificial;

  // Combined infrastructure index.
  Grid index;

  std::vector<std::string> warnings;
};

bool ComputeInfrastructure(const RunContext& ctx, const InfrastructureInputs& in, const InfrastructureConfig& cfg,
                           InfrastructureResult& out, Error& outError);

struct OpportunityConfig {
  NoDataPolicy noData = NoDataPolicy::Propagate;
  double zeroFloor = 0.0001;
};

// Normalized sum of potential and the infrastructure index.
bool ComputeOpportunity(const RunContext& ctx, const Grid& potential, const Grid& infrastructure,
                        const OpportunityConfig& cfg, NormalizeResult& out, Error& outError);

} // namespace estimap
