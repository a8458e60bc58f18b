#pragma once

#include "estimap/Status.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace estimap {

enum class LogLevel : int {
  Debug = 0,
  Info,
  Warn,
  Error,
  None,
};

const char* LogLevelName(LogLevel l);
bool ParseLogLevel(const std::string& s, LogLevel* out);

// Process-wide threshold for Log(). Default: Info.
void SetLogLevel(LogLevel l);
LogLevel GetLogLevel();

// Writes "[level] message" to std::cerr when level passes the threshold.
void Log(LogLevel level, const std::string& message);

struct RunLogOptions {
  std::filesystem::path path;

  // Rotated copies kept as <log>.1 ... <log>.N. 0 truncates the existing file.
  int keepFiles = 3;

  // Prefix every log file line with a UTC timestamp and [OUT]/[ERR].
  // The console is unaffected.
  bool tagLines = true;
};

// RAII duplication of std::cout and std::cerr into a run log file.
class RunLog {
public:
  RunLog();
  ~RunLog();

  RunLog(const RunLog&) = delete;
  RunLog& operator=(const RunLog&) = delete;

  bool open(const RunLogOptions& opt, Error& outError);
  void close();

  bool isOpen() const { return m_state != nullptr; }
  const std::filesystem::path& path() const;

  // base -> base.1 -> base.2 ... up to keepFiles.
  static bool Rotate(const std::filesystem::path& base, int keepFiles, Error& outError);

private:
  struct State;
  std::unique_ptr<State> m_state;
};

} // namespace estimap
