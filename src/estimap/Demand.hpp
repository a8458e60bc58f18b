#pragma once

#include "estimap/DistanceDecay.hpp"
#include "estimap/Grid.hpp"
#include "estimap/RunContext.hpp"
#include "estimap/Status.hpp"
#include "estimap/ZonalStats.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace estimap {

// Demand, supply, unmet demand, mobility and flow.

// What multiplies population into demand.
enum class AppealSource : std::uint8_t {
  // Continuous recreation potential in [0,1].
  Potential = 0,
  // Recreation spectrum 1..9 mapped to (spectrum - 1) / 8.
  Spectrum = 1,
};

const char* AppealSourceName(AppealSource a);
bool ParseAppealSource(const std::string& s, AppealSource* out);

// Demand = population * appeal, masked.
bool ComputeDemand(const RunContext& ctx, const Grid& population, const Grid& appeal, AppealSource source,
                   Grid& out, Error& outError);

struct SupplyResult {
  Grid supply;

  // Supply units per unit of potential.
  double capacity = 0.0;

  std::vector<std::string> warnings;
};

// Supply = potential * capacity.
//
// capacityPerCell > 0 is used as is. Otherwise capacity balances the totals:
// sum(demand) / sum(potential) over cells valid in both grids.
bool ComputeSupply(const RunContext& ctx, const Grid& potential, const Grid& demand, double capacityPerCell,
                   SupplyResult& out, Error& outError);

// Demand - supply, signed.
bool ComputeUnmetDemand(const RunContext& ctx, const Grid& demand, const Grid& supply, Grid& out, Error& outError);

struct MobilityResult {
  Grid mobility;

  // Number of bands that contribute (the open-ended last band does not).
  int includedBands = 0;
};

// Mobility(cell) = sum over included bands b of demand(cell) * attractiveness(cell, b),
// where attractiveness(cell, b) is band b's decay at the cell's distance when
// the distance falls inside band b and 0 otherwise. The uppermost band is
// excluded when it is open-ended. A distance covered by no band at all is
// no-data with an open-ended last band and an UncoveredDistanceError otherwise.
bool ComputeMobility(const RunContext& ctx, const Grid& demand, const Grid& distance, const DecaySchedule& schedule,
                     const DecayConfig& decay, MobilityResult& out, Error& outError);

struct FlowResult {
  // Every cell of an aggregation zone carries the zone's mobility total.
  Grid flow;
  std::vector<SummaryRow> rows;
};

bool ComputeFlow(const RunContext& ctx, const Grid& mobility, const Grid& aggregationZones, FlowResult& out,
                 Error& outError);

} // namespace estimap
