#include "estimap/DefaultRules.hpp"

#include <algorithm>
#include <cctype>

namespace estimap {

namespace {

// Scores for the 45 CORINE Land Cover level-3 class indices.
constexpr std::string_view kCorineSuitability =
    "1:1:0:0,"
    "2:2:0.1:0.1,"
    "3:9:0:0,"
    "10:10:1:1,"
    "11:11:0.1:0.1,"
    "12:13:0.3:0.3,"
    "14:14:0.4:0.4,"
    "15:17:0.5:0.5,"
    "18:18:0.6:0.6,"
    "19:20:0.3:0.3,"
    "21:22:0.6:0.6,"
    "23:23:1:1,"
    "24:24:0.8:0.8,"
    "25:25:1:1,"
    "26:29:0.8:0.8,"
    "30:30:1:1,"
    "31:31:0.8:0.8,"
    "32:32:0.7:0.7,"
    "33:33:0:0,"
    "34:34:0.8:0.8,"
    "35:35:1:1,"
    "36:36:0.8:0.8,"
    "37:37:1:1,"
    "38:38:0.8:0.8,"
    "39:42:1:1,"
    "43:43:0.8:0.8,"
    "44:44:1:1,"
    "45:45:0.3:0.3";

constexpr std::string_view kIucnScores =
    "11:11:0,12:12:0.6,2:2:0.8,3:3:0.6,4:4:0.6,5:5:1,6:6:0.8,7:7:0,8:8:0,9:9:0";

// MAES ecosystem types:
//  1 urban, 2 cropland, 3 grassland, 4 woodland and forest, 5 heathland and
//  shrub, 6 sparsely vegetated, 7 wetlands, 8 rivers and lakes, 9 marine
//  inlets and transitional waters, 10 coastal, 11 shelf, 12 open ocean.
constexpr std::string_view kCorineToMaes =
    "1:11:1,"
    "12:17:2,"
    "18:18:3,"
    "19:22:2,"
    "23:25:4,"
    "26:26:3,"
    "27:28:5,"
    "29:29:4,"
    "30:30:10,"
    "31:34:6,"
    "35:36:7,"
    "37:39:10,"
    "40:41:8,"
    "42:43:9,"
    "44:44:11";

} // namespace

const char* NomenclatureName(Nomenclature n)
{
  switch (n) {
  case Nomenclature::None: return "none";
  case Nomenclature::Corine: return "corine";
  case Nomenclature::Iucn: return "iucn";
  case Nomenclature::Maes: return "maes";
  default: return "unknown";
  }
}

bool ParseNomenclature(const std::string& s, Nomenclature* out)
{
  if (!out) return false;
  std::string t = s;
  std::transform(t.begin(), t.end(), t.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (t == "none" || t.empty()) {
    *out = Nomenclature::None;
  } else if (t == "corine" || t == "clc") {
    *out = Nomenclature::Corine;
  } else if (t == "iucn") {
    *out = Nomenclature::Iucn;
  } else if (t == "maes") {
    *out = Nomenclature::Maes;
  } else {
    return false;
  }
  return true;
}

std::string_view BuiltinRuleText(Nomenclature n)
{
  switch (n) {
  case Nomenclature::Corine: return kCorineSuitability;
  case Nomenclature::Iucn: return kIucnScores;
  case Nomenclature::Maes: return kCorineToMaes;
  default: return {};
  }
}

bool BuiltinRuleTable(Nomenclature n, RuleTable& out, Error& outError)
{
  const std::string_view text = BuiltinRuleText(n);
  if (text.empty()) {
    return Fail(outError, ErrorCode::Config,
                std::string("no built-in rule table for nomenclature '") + NomenclatureName(n) + "'");
  }
  return ParseRuleTable(std::string(text), out, outError);
}

} // namespace estimap
