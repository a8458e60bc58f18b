#pragma once

#include "estimap/RuleTable.hpp"
#include "estimap/Status.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace estimap {

// Well-known input domains that have a built-in reclassification table.
enum class Nomenclature : std::uint8_t {
  None = 0,
  // CORINE Land Cover classes (1..45) -> land suitability for recreation.
  Corine,
  // IUCN protected area categories -> natural component score.
  Iucn,
  // CORINE Land Cover classes -> MAES ecosystem type (1..12).
  Maes,
};

const char* NomenclatureName(Nomenclature n);
bool ParseNomenclature(const std::string& s, Nomenclature* out);

// Rule text of the built-in table (empty for None).
std::string_view BuiltinRuleText(Nomenclature n);

// ConfigError when n has no built-in table.
bool BuiltinRuleTable(Nomenclature n, RuleTable& out, Error& outError);

// Distance (map units) -> accessibility class 1 (near) .. 5 (far), used for
// artificial surfaces and roads.
inline constexpr std::string_view kDefaultDistanceCategories =
    "0:500:1,500.000001:1000:2,1000.000001:5000:3,5000.000001:10000:4,10000.00001:*:5";

// Distance-decay schedules (min:max:kappa:alpha).
inline constexpr std::string_view kDefaultInfrastructureSchedule = "0:*:30:0.008";
inline constexpr std::string_view kDefaultMobilitySchedule =
    "0:1000:0.02350:0.00102,"
    "1000:2000:0.02651:0.00109,"
    "2000:3000:0.05761:0.00100,"
    "3000:4000:0.06634:0.00105,"
    "4000:*:0.06836:0.00104";

// Proximity coefficients (metric,constant,kappa,alpha[,score]).
inline constexpr std::string_view kDefaultLakeCoefficients = "euclidean,1,30,0.008,1";
inline constexpr std::string_view kDefaultCoastlineCoefficients = "euclidean,1,30,0.008,1";
inline constexpr std::string_view kDefaultBathingCoefficients = "euclidean,1,5,0.01101";

// Spectrum value of the most accessible, most attractive class.
inline constexpr int kHighestSpectrum = 9;

} // namespace estimap
