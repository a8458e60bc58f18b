#pragma once

#include "estimap/Status.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace estimap {

// One reclassification record: [min, max] -> score.
//
// Either side may be unbounded ('*' in text form). When altScore is present
// and the range is finite, the score is interpolated linearly from `score`
// at min to `altScore` at max.
struct Rule {
  double min = 0.0;
  double max = 0.0;
  bool unboundedMin = false;
  bool unboundedMax = false;

  double score = 0.0;
  bool hasAltScore = false;
  double altScore = 0.0;

  // Inclusive on both finite bounds.
  bool contains(double v) const;

  // Score of v (v must be contained).
  double scoreAt(double v) const;
};

// Ordered list of rules. The first rule whose range contains a value wins.
struct RuleTable {
  std::vector<Rule> rules;

  bool empty() const { return rules.empty(); }
  std::size_t size() const { return rules.size(); }

  // nullptr when no rule matches.
  const Rule* match(double v) const;
};

// Where rule text comes from. Resolved once into a RuleTable by LoadRuleTable().
struct RuleSource {
  enum class Kind : std::uint8_t {
    InlineText,
    FilePath,
  };

  Kind kind = Kind::InlineText;
  std::string value;

  static RuleSource Inline(std::string text);
  static RuleSource File(std::string path);

  // Configuration values: a string containing ':' is rule text, anything
  // else is a path.
  static RuleSource FromConfigString(std::string s);

  bool empty() const { return value.empty(); }
};

// Parse rule text.
//
// Grammar: records separated by ',' or newlines, fields by ':'.
//   record = min:max:score[:altscore]
// '*' marks an unbounded side. Blank records are skipped and lines starting
// with '#' are comments. Errors are RuleParseError and name the record index
// (0-based, counting non-blank records) and the offending token.
bool ParseRuleTable(const std::string& text, RuleTable& out, Error& outError);

// Read (FilePath) or take (InlineText) the source text and parse it.
bool LoadRuleTable(const RuleSource& src, RuleTable& out, Error& outError);

// Canonical single-line text form: "min:max:score[:alt],..."
std::string RuleTableToString(const RuleTable& table);

// Shortest round-trippable decimal representation, used for rule text.
std::string FormatRuleNumber(double v);

} // namespace estimap
