#include "estimap/DistanceDecay.hpp"

#include "estimap/Parallel.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <utility>

namespace estimap {

const char* DistanceMetricName(DistanceMetric m)
{
  switch (m) {
  case DistanceMetric::Euclidean: return "euclidean";
  case DistanceMetric::Squared: return "squared";
  case DistanceMetric::Maximum: return "maximum";
  case DistanceMetric::Manhattan: return "manhattan";
  default: return "unknown";
  }
}

bool ParseDistanceMetric(const std::string& s, DistanceMetric* out)
{
  if (!out) return false;
  if (s == "euclidean") {
    *out = DistanceMetric::Euclidean;
  } else if (s == "squared") {
    *out = DistanceMetric::Squared;
  } else if (s == "maximum") {
    *out = DistanceMetric::Maximum;
  } else if (s == "manhattan") {
    *out = DistanceMetric::Manhattan;
  } else {
    return false;
  }
  return true;
}

bool DistanceCategory::contains(double v) const
{
  if (!unboundedMin && v < min) return false;
  if (!unboundedMax && v > max) return false;
  return true;
}

int DecaySchedule::bandIndex(double v) const
{
  for (std::size_t i = 0; i < bands.size(); ++i) {
    if (bands[i].contains(v)) return static_cast<int>(i);
  }
  return -1;
}

bool DecaySchedule::lastOpenEnded() const
{
  return !bands.empty() && bands.back().unboundedMax;
}

bool ParseDecaySchedule(const std::string& text, DecaySchedule& out, Error& outError)
{
  RuleTable table;
  if (!ParseRuleTable(text, table, outError)) return false;

  DecaySchedule s;
  for (std::size_t i = 0; i < table.rules.size(); ++i) {
    const Rule& r = table.rules[i];
    if (!r.hasAltScore) {
      return Fail(outError, ErrorCode::RuleParse,
                  "record " + std::to_string(i) + ": expected min:max:kappa:alpha");
    }
    DistanceCategory c;
    c.min = r.min;
    c.max = r.max;
    c.unboundedMin = r.unboundedMin;
    c.unboundedMax = r.unboundedMax;
    c.kappa = r.score;
    c.alpha = r.altScore;
    s.bands.push_back(c);
  }

  out = std::move(s);
  return true;
}

bool LoadDecaySchedule(const RuleSource& src, DecaySchedule& out, Error& outError)
{
  if (src.kind == RuleSource::Kind::InlineText) return ParseDecaySchedule(src.value, out, outError);

  // Reuse the rule file reader, then convert.
  RuleTable table;
  if (!LoadRuleTable(src, table, outError)) return false;
  return ParseDecaySchedule(RuleTableToString(table), out, outError);
}

std::string DecayScheduleToString(const DecaySchedule& s)
{
  RuleTable t;
  for (const DistanceCategory& c : s.bands) {
    Rule r;
    r.min = c.min;
    r.max = c.max;
    r.unboundedMin = c.unboundedMin;
    r.unboundedMax = c.unboundedMax;
    r.score = c.kappa;
    r.hasAltScore = true;
    r.altScore = c.alpha;
    t.rules.push_back(r);
  }
  return RuleTableToString(t);
}

double Attractiveness(double v, double kappa, double alpha, const DecayConfig& cfg)
{
  return (cfg.constant + kappa) / (kappa + std::exp(alpha * v)) * cfg.score;
}

bool ComputeAttractiveness(const RunContext& ctx, const Grid& distance, const DecaySchedule& schedule,
                           const DecayConfig& cfg, Grid& out, Error& outError, const std::string& label)
{
  const std::string name = label.empty() ? std::string("distance") : label;
  if (!ctx.checkAligned(distance, name, outError)) return false;
  if (schedule.empty()) {
    return Fail(outError, ErrorCode::Config, "empty decay schedule for '" + name + "'");
  }

  // With an open-ended last band, uncovered distances are no-data.
  const bool openEnded = schedule.lastOpenEnded();
  const int w = distance.cols();
  const int h = distance.rows();
  Grid result(distance.geometry());

  std::vector<std::size_t> rowUncovered(static_cast<std::size_t>(h), 0);
  std::vector<double> rowFirstValue(static_cast<std::size_t>(h), 0.0);

  ForEachRow(h, ctx.threads(), [&](int y) {
    std::size_t missing = 0;
    for (int x = 0; x < w; ++x) {
      const std::size_t i = distance.index(x, y);
      const double v = distance[i];
      if (Grid::IsNoData(v) || ctx.excluded(i)) continue;

      const int b = schedule.bandIndex(v);
      if (b < 0) {
        if (openEnded) continue;
        if (missing == 0) rowFirstValue[static_cast<std::size_t>(y)] = v;
        ++missing;
        continue;
      }
      const DistanceCategory& c = schedule.bands[static_cast<std::size_t>(b)];
      result[i] = Attractiveness(v, c.kappa, c.alpha, cfg);
    }
    rowUncovered[static_cast<std::size_t>(y)] = missing;
  });

  std::size_t total = 0;
  double first = 0.0;
  for (int y = 0; y < h; ++y) {
    const std::size_t n = rowUncovered[static_cast<std::size_t>(y)];
    if (n > 0 && total == 0) first = rowFirstValue[static_cast<std::size_t>(y)];
    total += n;
  }
  if (total > 0) {
    std::ostringstream oss;
    oss.precision(17);
    oss << total << " cell(s) of '" << name << "' fall outside every decay band (first value: " << first << ")";
    return Fail(outError, ErrorCode::UncoveredDistance, oss.str());
  }

  out = std::move(result);
  return true;
}

DecayConfig DecayCoefficients::decayConfig() const
{
  DecayConfig c;
  c.constant = constant;
  c.score = score;
  return c;
}

namespace {

bool ParseCoefficient(const std::string& tok, double* out)
{
  std::string t;
  for (char ch : tok) {
    if (std::isspace(static_cast<unsigned char>(ch)) == 0) t.push_back(ch);
  }
  if (t.empty()) return false;
  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(t.c_str(), &end);
  if (errno != 0 || !end || *end != '\0' || !std::isfinite(v)) return false;
  *out = v;
  return true;
}

} // namespace

bool ParseDecayCoefficients(const std::string& text, DecayCoefficients& out, Error& outError)
{
  std::vector<std::string> parts;
  {
    std::string cur;
    for (char c : text) {
      if (c == ',') {
        parts.push_back(cur);
        cur.clear();
        continue;
      }
      if (std::isspace(static_cast<unsigned char>(c)) == 0) cur.push_back(c);
    }
    parts.push_back(cur);
  }

  if (parts.size() < 4 || parts.size() > 5) {
    return Fail(outError, ErrorCode::Config,
                "expected 'metric,constant,kappa,alpha[,score]', got '" + text + "'");
  }

  DecayCoefficients c;
  if (!ParseDistanceMetric(parts[0], &c.metric)) {
    return Fail(outError, ErrorCode::Config, "unknown distance metric '" + parts[0] + "'");
  }

  const char* names[] = {"constant", "kappa", "alpha", "score"};
  double* slots[] = {&c.constant, &c.kappa, &c.alpha, &c.score};
  for (std::size_t k = 1; k < parts.size(); ++k) {
    if (!ParseCoefficient(parts[k], slots[k - 1])) {
      return Fail(outError, ErrorCode::Config,
                  std::string("invalid ") + names[k - 1] + " '" + parts[k] + "' in '" + text + "'");
    }
  }

  out = c;
  return true;
}

std::string DecayCoefficientsToString(const DecayCoefficients& c)
{
  std::string s = DistanceMetricName(c.metric);
  s += "," + FormatRuleNumber(c.constant);
  s += "," + FormatRuleNumber(c.kappa);
  s += "," + FormatRuleNumber(c.alpha);
  s += "," + FormatRuleNumber(c.score);
  return s;
}

} // namespace estimap
