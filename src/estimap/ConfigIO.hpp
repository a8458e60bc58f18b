#pragma once

#include "estimap/Config.hpp"
#include "estimap/Json.hpp"
#include "estimap/Status.hpp"

#include <string>

namespace estimap {

// JSON helpers for RecreationConfig.
//
// Field names are snake_case and grouped in sections:
//   inputs, outputs, rules, coefficients, classification, policy, filters,
//   demand, plus top-level "opportunity_zero_floor" and "threads".
//
// Apply uses merge semantics: missing keys leave the existing config
// unchanged. A present "outputs" array replaces the output selection.
// Type mismatches and unknown enum/output names are ConfigError.

std::string RecreationConfigToJson(const RecreationConfig& cfg, int indentSpaces = 2);

bool ApplyRecreationConfigJson(const JsonValue& root, RecreationConfig& ioCfg, Error& outError);

// Parse a JSON document and apply it. Parse failures are ConfigError,
// an unreadable file is IoError.
bool ApplyRecreationConfigText(const std::string& text, RecreationConfig& ioCfg, Error& outError);
bool LoadRecreationConfigJsonFile(const std::string& path, RecreationConfig& ioCfg, Error& outError);
bool WriteRecreationConfigJsonFile(const std::string& path, const RecreationConfig& cfg, Error& outError,
                                   int indentSpaces = 2);

} // namespace estimap
