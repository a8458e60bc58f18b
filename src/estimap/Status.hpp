#pragma once

#include <cstdint>
#include <string>

namespace estimap {

// Error taxonomy shared by every stage.
//
// Stages return bool and fill an Error on failure. Every error is fatal for
// the run; warnings are carried separately in the stage results.
enum class ErrorCode : std::uint8_t {
  None = 0,
  Config,
  Alignment,
  RuleParse,
  UnscoredValue,
  UncoveredDistance,
  Io,
};

// Stable name used in CLI output and reports (e.g. "ConfigError").
const char* ErrorCodeName(ErrorCode c);

struct Error {
  ErrorCode code = ErrorCode::None;
  std::string message;

  bool ok() const { return code == ErrorCode::None; }
  void clear()
  {
    code = ErrorCode::None;
    message.clear();
  }
};

// Fill outError and return false so callers can write `return Fail(...)`.
bool Fail(Error& outError, ErrorCode code, std::string message);

// "ConfigError: message"
std::string FormatError(const Error& e);

} // namespace estimap
