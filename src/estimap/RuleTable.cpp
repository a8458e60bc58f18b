#include "estimap/RuleTable.hpp"

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

namespace estimap {

bool Rule::contains(double v) const
{
  if (!unboundedMin && v < min) return false;
  if (!unboundedMax && v > max) return false;
  return true;
}

double Rule::scoreAt(double v) const
{
  if (!hasAltScore || unboundedMin || unboundedMax || !(max > min)) return score;
  const double t = (v - min) / (max - min);
  return score + t * (altScore - score);
}

const Rule* RuleTable::match(double v) const
{
  for (const Rule& r : rules) {
    if (r.contains(v)) return &r;
  }
  return nullptr;
}

RuleSource RuleSource::Inline(std::string text)
{
  RuleSource s;
  s.kind = Kind::InlineText;
  s.value = std::move(text);
  return s;
}

RuleSource RuleSource::File(std::string path)
{
  RuleSource s;
  s.kind = Kind::FilePath;
  s.value = std::move(path);
  return s;
}

RuleSource RuleSource::FromConfigString(std::string s)
{
  if (s.find(':') != std::string::npos) return Inline(std::move(s));
  return File(std::move(s));
}

namespace {

std::string Trim(const std::string& s)
{
  std::size_t a = 0;
  std::size_t b = s.size();
  while (a < b && std::isspace(static_cast<unsigned char>(s[a])) != 0) ++a;
  while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1])) != 0) --b;
  return s.substr(a, b - a);
}

bool ParseNumberToken(const std::string& tok, double* out)
{
  if (tok.empty()) return false;
  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(tok.c_str(), &end);
  if (errno != 0 || !end || *end != '\0') return false;
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

std::vector<std::string> SplitFields(const std::string& record)
{
  std::vector<std::string> fields;
  std::string cur;
  for (char c : record) {
    if (c == ':') {
      fields.push_back(Trim(cur));
      cur.clear();
      continue;
    }
    cur.push_back(c);
  }
  fields.push_back(Trim(cur));
  return fields;
}

bool RecordError(Error& outError, std::size_t index, const std::string& token, const std::string& what)
{
  std::ostringstream oss;
  oss << "record " << index << ": " << what << " '" << token << "'";
  return Fail(outError, ErrorCode::RuleParse, oss.str());
}

} // namespace

bool ParseRuleTable(const std::string& text, RuleTable& out, Error& outError)
{
  // Split into records, dropping comment lines.
  std::vector<std::string> records;
  {
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
      const std::string t = Trim(line);
      if (!t.empty() && t[0] == '#') continue;
      std::string cur;
      for (char c : line) {
        if (c == ',') {
          records.push_back(Trim(cur));
          cur.clear();
          continue;
        }
        cur.push_back(c);
      }
      records.push_back(Trim(cur));
    }
  }

  RuleTable table;
  std::size_t index = 0;
  for (const std::string& rec : records) {
    if (rec.empty()) continue;

    const std::vector<std::string> f = SplitFields(rec);
    if (f.size() < 3 || f.size() > 4) {
      return RecordError(outError, index, rec, "expected min:max:score[:altscore], got");
    }

    Rule r;
    if (f[0] == "*") {
      r.unboundedMin = true;
    } else if (!ParseNumberToken(f[0], &r.min)) {
      return RecordError(outError, index, f[0], "invalid lower bound");
    }

    if (f[1] == "*") {
      r.unboundedMax = true;
    } else if (!ParseNumberToken(f[1], &r.max)) {
      return RecordError(outError, index, f[1], "invalid upper bound");
    }

    if (!r.unboundedMin && !r.unboundedMax && r.min > r.max) {
      return RecordError(outError, index, rec, "lower bound exceeds upper bound in");
    }

    if (!ParseNumberToken(f[2], &r.score)) {
      return RecordError(outError, index, f[2], "invalid score");
    }

    if (f.size() == 4) {
      if (!ParseNumberToken(f[3], &r.altScore)) {
        return RecordError(outError, index, f[3], "invalid alternate score");
      }
      r.hasAltScore = true;
    }

    table.rules.push_back(r);
    ++index;
  }

  if (table.rules.empty()) {
    return Fail(outError, ErrorCode::RuleParse, "rule table has no records");
  }

  out = std::move(table);
  return true;
}

bool LoadRuleTable(const RuleSource& src, RuleTable& out, Error& outError)
{
  if (src.kind == RuleSource::Kind::InlineText) {
    return ParseRuleTable(src.value, out, outError);
  }

  std::ifstream f(src.value, std::ios::binary);
  if (!f) {
    return Fail(outError, ErrorCode::Io, "unable to open rules file: " + src.value);
  }
  std::ostringstream oss;
  oss << f.rdbuf();
  if (!ParseRuleTable(oss.str(), out, outError)) {
    outError.message = src.value + ": " + outError.message;
    return false;
  }
  return true;
}

std::string FormatRuleNumber(double v)
{
  char buf[64];
  const auto res = std::to_chars(buf, buf + sizeof(buf), v);
  if (res.ec != std::errc()) return "nan";
  return std::string(buf, res.ptr);
}

std::string RuleTableToString(const RuleTable& table)
{
  std::string s;
  for (std::size_t i = 0; i < table.rules.size(); ++i) {
    const Rule& r = table.rules[i];
    if (i > 0) s += ",";
    s += r.unboundedMin ? std::string("*") : FormatRuleNumber(r.min);
    s += ":";
    s += r.unboundedMax ? std::string("*") : FormatRuleNumber(r.max);
    s += ":";
    s += FormatRuleNumber(r.score);
    if (r.hasAltScore) {
      s += ":";
      s += FormatRuleNumber(r.altScore);
    }
  }
  return s;
}

} // namespace estimap
