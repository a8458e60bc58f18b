#pragma once

#include "estimap/Grid.hpp"
#include "estimap/RuleTable.hpp"
#include "estimap/RunContext.hpp"
#include "estimap/Status.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace estimap {

// Distance metric used when growing distances from feature cells.
enum class DistanceMetric : std::uint8_t {
  Euclidean = 0,
  Squared,
  Maximum,
  Manhattan,
};

const char* DistanceMetricName(DistanceMetric m);
bool ParseDistanceMetric(const std::string& s, DistanceMetric* out);

// One band of a decay schedule: distances in [min, max] use (kappa, alpha).
struct DistanceCategory {
  double min = 0.0;
  double max = 0.0;
  bool unboundedMin = false;
  bool unboundedMax = false;

  double kappa = 0.0;
  double alpha = 0.0;

  bool contains(double v) const;
};

// Ordered list of bands. The first band containing a distance is used.
struct DecaySchedule {
  std::vector<DistanceCategory> bands;

  bool empty() const { return bands.empty(); }

  // -1 when no band contains v.
  int bandIndex(double v) const;

  // True when the last band has no upper bound. Such a band is excluded from
  // visitation (see ComputeMobility).
  bool lastOpenEnded() const;
};

// Parse "min:max:kappa:alpha" records (rule table grammar, exactly 4 fields).
bool ParseDecaySchedule(const std::string& text, DecaySchedule& out, Error& outError);
bool LoadDecaySchedule(const RuleSource& src, DecaySchedule& out, Error& outError);
std::string DecayScheduleToString(const DecaySchedule& s);

struct DecayConfig {
  // C in (C + K) / (K + exp(alpha * v)).
  double constant = 1.0;

  // Multiplicative score applied to the result.
  double score = 1.0;
};

// (C + K) / (K + exp(alpha * v)) * score
double Attractiveness(double v, double kappa, double alpha, const DecayConfig& cfg = {});

// Evaluate the schedule on every valid cell of a distance grid.
// A valid cell covered by no band is an UncoveredDistanceError, unless the
// last band is open-ended; then the cell is no-data.
bool ComputeAttractiveness(const RunContext& ctx, const Grid& distance, const DecaySchedule& schedule,
                           const DecayConfig& cfg, Grid& out, Error& outError,
                           const std::string& label = {});

// Coefficients of a single-band proximity function, in text form
// "metric,constant,kappa,alpha[,score]" (e.g. "euclidean,1,30,0.008,1").
struct DecayCoefficients {
  DistanceMetric metric = DistanceMetric::Euclidean;
  double constant = 1.0;
  double kappa = 30.0;
  double alpha = 0.008;
  double score = 1.0;

  DecayConfig decayConfig() const;
};

bool ParseDecayCoefficients(const std::string& text, DecayCoefficients& out, Error& outError);
std::string DecayCoefficientsToString(const DecayCoefficients& c);

} // namespace estimap
