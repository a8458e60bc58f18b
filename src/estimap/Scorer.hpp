#pragma once

#include "estimap/DefaultRules.hpp"
#include "estimap/Grid.hpp"
#include "estimap/RuleTable.hpp"
#include "estimap/RunContext.hpp"
#include "estimap/Status.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace estimap {

// What to do with a valid cell that no rule matches.
enum class UnscoredPolicy : std::uint8_t {
  // UnscoredValueError.
  Error = 0,
  // The cell becomes no-data.
  NoData = 1,
};

const char* UnscoredPolicyName(UnscoredPolicy p);
bool ParseUnscoredPolicy(const std::string& s, UnscoredPolicy* out);

struct ScoreConfig {
  UnscoredPolicy unscored = UnscoredPolicy::Error;

  // Used in error messages ("landuse", "protected", ...).
  std::string label;
};

struct ScoreResult {
  Grid grid;

  // Valid input cells that matched no rule (only non-zero with the NoData policy).
  std::size_t unscoredCount = 0;

  std::vector<std::string> warnings;
};

// Reclassify every valid cell of `input` through `table` (first match wins).
// No-data passes through; the run mask is applied to the result.
bool ScoreGrid(const RunContext& ctx, const Grid& input, const RuleTable& table, const ScoreConfig& cfg,
               ScoreResult& out, Error& outError);

// Pick the table for an input: an explicit source always wins; otherwise the
// built-in table of `fallback` is used. ConfigError when neither exists.
bool ResolveScoreTable(const RuleSource& explicitSource, Nomenclature fallback, RuleTable& out, Error& outError);

} // namespace estimap
