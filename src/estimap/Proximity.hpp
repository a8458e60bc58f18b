#pragma once

#include "estimap/DistanceDecay.hpp"
#include "estimap/Grid.hpp"
#include "estimap/RuleTable.hpp"
#include "estimap/RunContext.hpp"
#include "estimap/Status.hpp"

#include <string>
#include <vector>

namespace estimap {

// Proximity to features.
//
// A feature cell is a valid, non-zero cell of the feature grid that is not
// excluded by the run mask. Distances are in map units (cell centers,
// scaled by the cell size); the squared metric reports squared map units.

// Distance from every cell to the nearest feature cell.
//
//  - euclidean/squared: exact (Felzenszwalb-Huttenlocher separable transform)
//  - manhattan: exact, separable L1 passes
//  - maximum: exact, two-pass 8-neighbor chamfer
//
// With no feature cells at all, every output cell is no-data.
bool ComputeGrowDistance(const RunContext& ctx, const Grid& features, DistanceMetric metric, Grid& out,
                         Error& outError, const std::string& label = {});

// Cells with value == target (used for the highest recreation spectrum).
Grid SelectEqual(const Grid& g, double target);

// Attractiveness of proximity to a feature map:
// decay(distance) with the coefficients' single band. No-data cells inside
// the mask are set to 0.
bool ComputeProximityAttractiveness(const RunContext& ctx, const Grid& features, const DecayCoefficients& coeffs,
                                    Grid& out, std::vector<std::string>& warnings, Error& outError,
                                    const std::string& label = {});

struct ArtificialAccessibilityResult {
  Grid artificialClass;
  Grid roadsClass;

  // min(artificialClass, roadsClass)
  Grid combinedClass;

  // (maxClass + 1 - combinedClass) / maxClass, in (0, 1].
  Grid accessibility;
  int maxClass = 0;

  std::vector<std::string> warnings;
};

// Classify Euclidean distances to artificial surfaces and to roads with the
// given category tables and combine them into one accessibility score.
bool ComputeArtificialAccessibility(const RunContext& ctx, const Grid& artificial, const Grid& roads,
                                    const RuleTable& artificialCategories, const RuleTable& roadsCategories,
                                    ArtificialAccessibilityResult& out, Error& outError);

// Mean of the valid cells in a window x window square around each cell
// (window is forced odd, >= 1). No-data where the window has no valid cell.
// The run mask is applied to the output.
bool NeighborhoodAverage(const RunContext& ctx, const Grid& in, int window, Grid& out, Error& outError,
                         const std::string& label = {});

} // namespace estimap
