#pragma once

// Shared CLI parsing plus a couple of small filesystem helpers.
//
// Kept header-only so the parsing rules can be unit tested without linking
// the CLI itself: strict integers, finite floats, 0/1 style booleans and
// comma separated name lists.

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace estimap::cli {

inline bool EnsureDir(const std::filesystem::path& p)
{
  if (p.empty()) return false;
  std::error_code ec;
  std::filesystem::create_directories(p, ec);
  if (ec) return false;
  return std::filesystem::is_directory(p, ec);
}

inline bool EnsureParentDir(const std::filesystem::path& file)
{
  if (file.empty()) return false;
  const std::filesystem::path parent = file.parent_path();
  if (parent.empty()) return true;
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  return !ec;
}

inline bool ParseI32(std::string_view s, int* out)
{
  if (!out) return false;
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return false;

  int v = 0;
  const char* end = s.data() + s.size();
  const auto res = std::from_chars(s.data(), end, v, 10);
  if (res.ec != std::errc() || res.ptr != end) return false;
  *out = v;
  return true;
}

// Entire string must parse; inf and nan are rejected.
inline bool ParseF64(std::string_view s, double* out)
{
  if (!out) return false;
  if (s.empty()) return false;
  if (std::isspace(static_cast<unsigned char>(s.front()))) return false;

  const std::string tmp(s);
  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(tmp.c_str(), &end);
  if (errno != 0) return false;
  if (!end || *end != '\0') return false;
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

inline bool ParseBool01(std::string_view s, bool* out)
{
  if (!out) return false;
  if (s == "0" || s == "false" || s == "off" || s == "no") {
    *out = false;
    return true;
  }
  if (s == "1" || s == "true" || s == "on" || s == "yes") {
    *out = true;
    return true;
  }
  return false;
}

// "a, b,,c" -> {"a", "b", "c"}
inline std::vector<std::string> SplitCommaList(std::string_view s)
{
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      if (!cur.empty()) out.push_back(cur);
      cur.clear();
      continue;
    }
    if (std::isspace(static_cast<unsigned char>(c))) continue;
    cur.push_back(c);
  }
  if (!cur.empty()) out.push_back(cur);
  return out;
}

} // namespace estimap::cli
