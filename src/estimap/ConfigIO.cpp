#include "estimap/ConfigIO.hpp"

#include <cmath>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace estimap {

namespace {

static bool ReadFileText(const std::string& path, std::string& out)
{
  std::ifstream f(path, std::ios::binary);
  if (!f) return false;
  std::ostringstream oss;
  oss << f.rdbuf();
  out = oss.str();
  return true;
}

static bool WriteFileText(const std::string& path, const std::string& text)
{
  std::ofstream f(path, std::ios::binary);
  if (!f) return false;
  f << text;
  return static_cast<bool>(f);
}

static bool GetObj(const JsonValue& obj, const char* key, const JsonValue** out, std::string& err)
{
  *out = nullptr;
  const JsonValue* v = FindJsonMember(obj, key);
  if (!v) return true; // missing => keep
  if (!v->isObject()) {
    err = std::string("expected object for key '") + key + "', got " + JsonTypeName(v->type);
    return false;
  }
  *out = v;
  return true;
}

static bool ApplyBool(const JsonValue& root, const char* key, bool& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isBool()) {
    err = std::string("expected boolean for key '") + key + "', got " + JsonTypeName(v->type);
    return false;
  }
  io = v->boolValue;
  return true;
}

static bool ApplyF64(const JsonValue& root, const char* key, double& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isNumber()) {
    err = std::string("expected number for key '") + key + "', got " + JsonTypeName(v->type);
    return false;
  }
  if (!std::isfinite(v->numberValue)) {
    err = std::string("non-finite number for key '") + key + "'";
    return false;
  }
  io = v->numberValue;
  return true;
}

static bool ApplyI32(const JsonValue& root, const char* key, int& io, std::string& err)
{
  double d = static_cast<double>(io);
  if (!ApplyF64(root, key, d, err)) return false;
  if (d < -2147483648.0 || d > 2147483647.0) {
    err = std::string("out-of-range integer for key '") + key + "'";
    return false;
  }
  io = static_cast<int>(std::lround(d));
  return true;
}

static bool ApplyString(const JsonValue& root, const char* key, std::string& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (v->isNull()) {
    io.clear();
    return true;
  }
  if (!v->isString()) {
    err = std::string("expected string for key '") + key + "', got " + JsonTypeName(v->type);
    return false;
  }
  io = v->stringValue;
  return true;
}

// Accepts a single string as a one-element list.
static bool ApplyStringList(const JsonValue& root, const char* key, std::vector<std::string>& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (v->isString()) {
    io.assign(1, v->stringValue);
    return true;
  }
  if (!v->isArray()) {
    err = std::string("expected string or array of strings for key '") + key + "', got " +
          JsonTypeName(v->type);
    return false;
  }
  std::vector<std::string> list;
  for (const JsonValue& e : v->arrayValue) {
    if (!e.isString()) {
      err = std::string("expected array of strings for key '") + key + "'";
      return false;
    }
    list.push_back(e.stringValue);
  }
  io = std::move(list);
  return true;
}

static bool ApplyCuts(const JsonValue& root, const char* key, ClassCutPoints& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isArray() || v->arrayValue.size() != 2 || !v->arrayValue[0].isNumber() || !v->arrayValue[1].isNumber()) {
    err = std::string("expected [low, high] for key '") + key + "'";
    return false;
  }
  io.low = v->arrayValue[0].numberValue;
  io.high = v->arrayValue[1].numberValue;
  return true;
}

static bool ApplyDecay(const JsonValue& root, const char* key, DecayConfig& io, std::string& err)
{
  const JsonValue* obj = nullptr;
  if (!GetObj(root, key, &obj, err)) return false;
  if (!obj) return true;
  return ApplyF64(*obj, "constant", io.constant, err) && ApplyF64(*obj, "score", io.score, err);
}

template <typename E, typename ParseFn>
static bool ApplyEnum(const JsonValue& root, const char* key, E& io, ParseFn parse, std::string& err)
{
  std::string s;
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!ApplyString(root, key, s, err)) return false;
  E parsed{};
  if (!parse(s, &parsed)) {
    err = std::string("unknown value '") + s + "' for key '" + key + "'";
    return false;
  }
  io = parsed;
  return true;
}

static bool ApplyInputs(const JsonValue& obj, RecreationInputs& in, std::string& err)
{
  return ApplyString(obj, "land", in.land, err) && ApplyString(obj, "landuse", in.landuse, err) &&
         ApplyStringList(obj, "water", in.water, err) && ApplyString(obj, "lakes", in.lakes, err) &&
         ApplyString(obj, "coastline", in.coastline, err) &&
         ApplyString(obj, "coast_geomorphology", in.coastGeomorphology, err) &&
         ApplyString(obj, "bathing_water", in.bathingWater, err) &&
         ApplyStringList(obj, "natural", in.natural, err) && ApplyString(obj, "protected", in.protectedAreas, err) &&
         ApplyStringList(obj, "urban", in.urban, err) &&
         ApplyString(obj, "infrastructure", in.infrastructure, err) &&
         ApplyString(obj, "artificial", in.artificial, err) && ApplyString(obj, "roads", in.roads, err) &&
         ApplyString(obj, "mask", in.mask, err) && ApplyString(obj, "population", in.population, err) &&
         ApplyString(obj, "base", in.base, err) && ApplyString(obj, "aggregation", in.aggregation, err) &&
         ApplyString(obj, "landcover", in.landcover, err) &&
         ApplyString(obj, "mobility_distance", in.mobilityDistance, err);
}

static bool ApplyOutputs(const JsonValue& root, RecreationOutputs& io, std::string& err)
{
  std::vector<std::string> names;
  const JsonValue* v = FindJsonMember(root, "outputs");
  if (!v) return true;
  if (!ApplyStringList(root, "outputs", names, err)) return false;

  RecreationOutputs o;
  for (const std::string& n : names) {
    if (!EnableRecreationOutput(n, o)) {
      err = "unknown output '" + n + "'";
      return false;
    }
  }
  io = o;
  return true;
}

static JsonValue StringArray(const std::vector<std::string>& v)
{
  JsonValue a = JsonValue::MakeArray();
  for (const std::string& s : v) a.arrayValue.push_back(JsonValue::MakeString(s));
  return a;
}

static JsonValue CutsToJson(const ClassCutPoints& c)
{
  JsonValue a = JsonValue::MakeArray();
  a.arrayValue.push_back(JsonValue::MakeNumber(c.low));
  a.arrayValue.push_back(JsonValue::MakeNumber(c.high));
  return a;
}

static JsonValue DecayToJson(const DecayConfig& d)
{
  JsonValue o = JsonValue::MakeObject();
  o.add("constant", JsonValue::MakeNumber(d.constant));
  o.add("score", JsonValue::MakeNumber(d.score));
  return o;
}

} // namespace

std::string RecreationConfigToJson(const RecreationConfig& cfg, int indentSpaces)
{
  const RecreationInputs& in = cfg.inputs;

  JsonValue inputs = JsonValue::MakeObject();
  inputs.add("land", JsonValue::MakeString(in.land));
  inputs.add("landuse", JsonValue::MakeString(in.landuse));
  inputs.add("water", StringArray(in.water));
  inputs.add("lakes", JsonValue::MakeString(in.lakes));
  inputs.add("coastline", JsonValue::MakeString(in.coastline));
  inputs.add("coast_geomorphology", JsonValue::MakeString(in.coastGeomorphology));
  inputs.add("bathing_water", JsonValue::MakeString(in.bathingWater));
  inputs.add("natural", StringArray(in.natural));
  inputs.add("protected", JsonValue::MakeString(in.protectedAreas));
  inputs.add("urban", StringArray(in.urban));
  inputs.add("infrastructure", JsonValue::MakeString(in.infrastructure));
  inputs.add("artificial", JsonValue::MakeString(in.artificial));
  inputs.add("roads", JsonValue::MakeString(in.roads));
  inputs.add("mask", JsonValue::MakeString(in.mask));
  inputs.add("population", JsonValue::MakeString(in.population));
  inputs.add("base", JsonValue::MakeString(in.base));
  inputs.add("aggregation", JsonValue::MakeString(in.aggregation));
  inputs.add("landcover", JsonValue::MakeString(in.landcover));
  inputs.add("mobility_distance", JsonValue::MakeString(in.mobilityDistance));

  JsonValue rules = JsonValue::MakeObject();
  rules.add("suitability_scores", JsonValue::MakeString(cfg.suitabilityScores));
  rules.add("landuse_nomenclature", JsonValue::MakeString(NomenclatureName(cfg.landuseNomenclature)));
  rules.add("protected_scores", JsonValue::MakeString(cfg.protectedScores));
  rules.add("artificial_distances", JsonValue::MakeString(cfg.artificialDistances));
  rules.add("roads_distances", JsonValue::MakeString(cfg.roadsDistances));
  rules.add("land_classes", JsonValue::MakeString(cfg.landClasses));
  rules.add("infrastructure_schedule", JsonValue::MakeString(cfg.infrastructureSchedule));
  rules.add("mobility_schedule", JsonValue::MakeString(cfg.mobilitySchedule));

  JsonValue coeffs = JsonValue::MakeObject();
  coeffs.add("lakes", JsonValue::MakeString(cfg.lakeCoefficients));
  coeffs.add("coastline", JsonValue::MakeString(cfg.coastlineCoefficients));
  coeffs.add("bathing_water", JsonValue::MakeString(cfg.bathingCoefficients));
  coeffs.add("infrastructure_decay", DecayToJson(cfg.infrastructureDecay));
  coeffs.add("mobility_decay", DecayToJson(cfg.mobilityDecay));

  JsonValue classification = JsonValue::MakeObject();
  classification.add("potential_cuts", CutsToJson(cfg.potentialCuts));
  classification.add("opportunity_cuts", CutsToJson(cfg.opportunityCuts));

  JsonValue policy = JsonValue::MakeObject();
  policy.add("nodata", JsonValue::MakeString(NoDataPolicyName(cfg.noData)));
  policy.add("unscored", JsonValue::MakeString(UnscoredPolicyName(cfg.unscored)));

  JsonValue filters = JsonValue::MakeObject();
  filters.add("average_filter", JsonValue::MakeBool(cfg.averageFilter));
  filters.add("average_window", JsonValue::MakeNumber(cfg.averageWindow));
  filters.add("coast_window", JsonValue::MakeNumber(cfg.coastWindow));

  JsonValue demand = JsonValue::MakeObject();
  demand.add("appeal", JsonValue::MakeString(AppealSourceName(cfg.appeal)));
  demand.add("capacity_per_cell", JsonValue::MakeNumber(cfg.capacityPerCell));

  JsonValue root = JsonValue::MakeObject();
  root.add("inputs", std::move(inputs));
  root.add("outputs", StringArray(RecreationOutputNames(cfg.outputs)));
  root.add("rules", std::move(rules));
  root.add("coefficients", std::move(coeffs));
  root.add("classification", std::move(classification));
  root.add("policy", std::move(policy));
  root.add("filters", std::move(filters));
  root.add("opportunity_zero_floor", JsonValue::MakeNumber(cfg.opportunityZeroFloor));
  root.add("demand", std::move(demand));
  root.add("threads", JsonValue::MakeNumber(cfg.threads));

  return JsonStringify(root, indentSpaces) + "\n";
}

bool ApplyRecreationConfigJson(const JsonValue& root, RecreationConfig& ioCfg, Error& outError)
{
  if (!root.isObject()) {
    return Fail(outError, ErrorCode::Config, "recreation config JSON must be an object");
  }

  // Work on a copy so a failed apply leaves the input untouched.
  RecreationConfig cfg = ioCfg;
  std::string err;
  const JsonValue* section = nullptr;

  auto fail = [&]() { return Fail(outError, ErrorCode::Config, err); };

  if (!GetObj(root, "inputs", &section, err)) return fail();
  if (section && !ApplyInputs(*section, cfg.inputs, err)) return fail();

  if (!ApplyOutputs(root, cfg.outputs, err)) return fail();

  if (!GetObj(root, "rules", &section, err)) return fail();
  if (section) {
    if (!ApplyString(*section, "suitability_scores", cfg.suitabilityScores, err) ||
        !ApplyEnum(*section, "landuse_nomenclature", cfg.landuseNomenclature, ParseNomenclature, err) ||
        !ApplyString(*section, "protected_scores", cfg.protectedScores, err) ||
        !ApplyString(*section, "artificial_distances", cfg.artificialDistances, err) ||
        !ApplyString(*section, "roads_distances", cfg.roadsDistances, err) ||
        !ApplyString(*section, "land_classes", cfg.landClasses, err) ||
        !ApplyString(*section, "infrastructure_schedule", cfg.infrastructureSchedule, err) ||
        !ApplyString(*section, "mobility_schedule", cfg.mobilitySchedule, err)) {
      return fail();
    }
  }

  if (!GetObj(root, "coefficients", &section, err)) return fail();
  if (section) {
    if (!ApplyString(*section, "lakes", cfg.lakeCoefficients, err) ||
        !ApplyString(*section, "coastline", cfg.coastlineCoefficients, err) ||
        !ApplyString(*section, "bathing_water", cfg.bathingCoefficients, err) ||
        !ApplyDecay(*section, "infrastructure_decay", cfg.infrastructureDecay, err) ||
        !ApplyDecay(*section, "mobility_decay", cfg.mobilityDecay, err)) {
      return fail();
    }
  }

  if (!GetObj(root, "classification", &section, err)) return fail();
  if (section) {
    if (!ApplyCuts(*section, "potential_cuts", cfg.potentialCuts, err) ||
        !ApplyCuts(*section, "opportunity_cuts", cfg.opportunityCuts, err)) {
      return fail();
    }
  }

  if (!GetObj(root, "policy", &section, err)) return fail();
  if (section) {
    if (!ApplyEnum(*section, "nodata", cfg.noData, ParseNoDataPolicy, err) ||
        !ApplyEnum(*section, "unscored", cfg.unscored, ParseUnscoredPolicy, err)) {
      return fail();
    }
  }

  if (!GetObj(root, "filters", &section, err)) return fail();
  if (section) {
    if (!ApplyBool(*section, "average_filter", cfg.averageFilter, err) ||
        !ApplyI32(*section, "average_window", cfg.averageWindow, err) ||
        !ApplyI32(*section, "coast_window", cfg.coastWindow, err)) {
      return fail();
    }
  }

  if (!ApplyF64(root, "opportunity_zero_floor", cfg.opportunityZeroFloor, err)) return fail();

  if (!GetObj(root, "demand", &section, err)) return fail();
  if (section) {
    if (!ApplyEnum(*section, "appeal", cfg.appeal, ParseAppealSource, err) ||
        !ApplyF64(*section, "capacity_per_cell", cfg.capacityPerCell, err)) {
      return fail();
    }
  }

  if (!ApplyI32(root, "threads", cfg.threads, err)) return fail();

  ioCfg = std::move(cfg);
  outError.clear();
  return true;
}

bool ApplyRecreationConfigText(const std::string& text, RecreationConfig& ioCfg, Error& outError)
{
  JsonValue root;
  std::string err;
  if (!ParseJson(text, root, err)) {
    return Fail(outError, ErrorCode::Config, err);
  }
  return ApplyRecreationConfigJson(root, ioCfg, outError);
}

bool LoadRecreationConfigJsonFile(const std::string& path, RecreationConfig& ioCfg, Error& outError)
{
  std::string text;
  if (!ReadFileText(path, text)) {
    return Fail(outError, ErrorCode::Io, "failed to read config file '" + path + "'");
  }
  if (!ApplyRecreationConfigText(text, ioCfg, outError)) {
    outError.message = path + ": " + outError.message;
    return false;
  }
  return true;
}

bool WriteRecreationConfigJsonFile(const std::string& path, const RecreationConfig& cfg, Error& outError,
                                   int indentSpaces)
{
  if (!WriteFileText(path, RecreationConfigToJson(cfg, indentSpaces))) {
    return Fail(outError, ErrorCode::Io, "failed to write config file '" + path + "'");
  }
  outError.clear();
  return true;
}

} // namespace estimap
