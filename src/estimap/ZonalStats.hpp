#pragma once

#include "estimap/Grid.hpp"
#include "estimap/RunContext.hpp"
#include "estimap/Status.hpp"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace estimap {

// Per-zone statistics of a value grid.
//
// Zone grids hold integral ids; fractional ids are truncated toward zero and
// no-data zone cells belong to no zone. An infinite id, or one whose magnitude
// exceeds 2^53, is a ConfigError wherever it meets a valid value cell. All sums
// are pairwise over the values in row-major order, so results do not depend on
// threading.

struct SummaryRow {
  std::int64_t zoneId = 0;
  std::size_t count = 0;
  double sum = 0.0;
  double mean = 0.0;
  double min = 0.0;
  double max = 0.0;
  // Population standard deviation.
  double stddev = 0.0;
};

// One row per zone that has at least one valid value cell, ascending by id.
bool ComputeZonalSummary(const RunContext& ctx, const Grid& values, const Grid& zones, std::vector<SummaryRow>& out,
                         Error& outError, const std::string& label = {});

// Sum of the `sum` column.
double SummaryTotal(const std::vector<SummaryRow>& rows);

// Grid where every cell of a zone carries that zone's `sum`; cells outside
// every listed zone are no-data.
Grid PaintZoneTotals(const RunContext& ctx, const Grid& zones, const std::vector<SummaryRow>& rows);

// Zone x class breakdown of a value grid.
struct CrossTabRow {
  std::int64_t zoneId = 0;
  std::int64_t classId = 0;
  std::size_t count = 0;
  double sum = 0.0;
};

// Rows sorted by (zoneId, classId). Cells need a valid value, zone and class.
bool ComputeZonalCrossTab(const RunContext& ctx, const Grid& values, const Grid& zones, const Grid& classes,
                          std::vector<CrossTabRow>& out, Error& outError);

// Whole-grid statistics, in the spirit of `r.univar -g`.
struct UnivariateStats {
  std::size_t n = 0;
  std::size_t nullCells = 0;
  std::size_t cells = 0;
  double min = 0.0;
  double max = 0.0;
  double range = 0.0;
  double mean = 0.0;
  double meanOfAbs = 0.0;
  double stddev = 0.0;
  double variance = 0.0;
  double coeffVar = 0.0;
  double sum = 0.0;
};

UnivariateStats ComputeUnivariateStats(const Grid& g);

// Stable "key=value" lines (17 significant digits).
std::string FormatUnivariateStats(const UnivariateStats& s);

// Line-by-line comparison of two FormatUnivariateStats() texts. On mismatch
// returns false and describes the first differing line in outDiff.
bool CompareUnivariateText(const std::string& expected, const std::string& actual, std::string& outDiff);

inline constexpr std::string_view kSummaryCsvHeader = "zone_id,sum,mean,count,min,max";
inline constexpr std::string_view kCrossTabCsvHeader = "zone_id,class_id,count,sum";

bool WriteSummaryCsv(std::ostream& os, const std::vector<SummaryRow>& rows);
bool WriteCrossTabCsv(std::ostream& os, const std::vector<CrossTabRow>& rows);

// 17 significant digits, the format used by every table and stats writer.
std::string FormatStatNumber(double v);

} // namespace estimap
