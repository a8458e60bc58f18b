#include "estimap/Config.hpp"

namespace estimap {

namespace {

struct OutputEntry {
  const char* name;
  bool RecreationOutputs::*flag;
};

// Write order.
constexpr OutputEntry kOutputs[] = {
    {"potential", &RecreationOutputs::potential},
    {"potential_index", &RecreationOutputs::potentialIndex},
    {"opportunity", &RecreationOutputs::opportunity},
    {"opportunity_index", &RecreationOutputs::opportunityIndex},
    {"spectrum", &RecreationOutputs::spectrum},
    {"demand", &RecreationOutputs::demand},
    {"unmet_demand", &RecreationOutputs::unmetDemand},
    {"mobility", &RecreationOutputs::mobility},
    {"flow", &RecreationOutputs::flow},
    {"supply", &RecreationOutputs::supplyTable},
    {"use", &RecreationOutputs::useTable},
    {"demand_zones", &RecreationOutputs::demandTable},
    {"supply_landcover", &RecreationOutputs::supplyLandcover},
};

} // namespace

bool RecreationOutputs::any() const
{
  for (const OutputEntry& e : kOutputs) {
    if (this->*e.flag) return true;
  }
  return false;
}

std::vector<std::string> RecreationOutputNames(const RecreationOutputs& o)
{
  std::vector<std::string> names;
  for (const OutputEntry& e : kOutputs) {
    if (o.*e.flag) names.emplace_back(e.name);
  }
  return names;
}

bool EnableRecreationOutput(const std::string& name, RecreationOutputs& io)
{
  for (const OutputEntry& e : kOutputs) {
    if (name == e.name) {
      io.*e.flag = true;
      return true;
    }
  }
  return false;
}

const std::vector<std::string>& AllRecreationOutputNames()
{
  static const std::vector<std::string> names = [] {
    std::vector<std::string> v;
    for (const OutputEntry& e : kOutputs) v.emplace_back(e.name);
    return v;
  }();
  return names;
}

} // namespace estimap
