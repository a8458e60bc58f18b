#include "estimap/Status.hpp"

#include <utility>

namespace estimap {

const char* ErrorCodeName(ErrorCode c)
{
  switch (c) {
  case ErrorCode::None: return "None";
  case ErrorCode::Config: return "ConfigError";
  case ErrorCode::Alignment: return "AlignmentError";
  case ErrorCode::RuleParse: return "RuleParseError";
  case ErrorCode::UnscoredValue: return "UnscoredValueError";
  case ErrorCode::UncoveredDistance: return "UncoveredDistanceError";
  case ErrorCode::Io: return "IoError";
  default: return "UnknownError";
  }
}

bool Fail(Error& outError, ErrorCode code, std::string message)
{
  outError.code = code;
  outError.message = std::move(message);
  return false;
}

std::string FormatError(const Error& e)
{
  std::string s = ErrorCodeName(e.code);
  if (!e.message.empty()) {
    s += ": ";
    s += e.message;
  }
  return s;
}

} // namespace estimap
