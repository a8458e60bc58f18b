#pragma once

#include <string>

// Build/version metadata for estimap.
//
// CMake defines these macros through estimap_core's PUBLIC compile
// definitions. The fallbacks keep the header usable outside CMake builds.

#ifndef ESTIMAP_VERSION_MAJOR
#define ESTIMAP_VERSION_MAJOR 0
#endif

#ifndef ESTIMAP_VERSION_MINOR
#define ESTIMAP_VERSION_MINOR 0
#endif

#ifndef ESTIMAP_VERSION_PATCH
#define ESTIMAP_VERSION_PATCH 0
#endif

#ifndef ESTIMAP_VERSION_STRING
#define ESTIMAP_VERSION_STRING "0.0.0"
#endif

#ifndef ESTIMAP_GIT_SHA
#define ESTIMAP_GIT_SHA "unknown"
#endif

namespace estimap {

inline constexpr const char* EstimapVersionString()
{
  return ESTIMAP_VERSION_STRING;
}

inline constexpr const char* EstimapGitSha()
{
  return ESTIMAP_GIT_SHA;
}

inline std::string EstimapFullVersionString()
{
  std::string s = std::string(EstimapVersionString());
  const std::string sha = std::string(EstimapGitSha());
  if (!sha.empty() && sha != "unknown") {
    s += " (";
    s += sha;
    s += ")";
  }
  return s;
}

} // namespace estimap
