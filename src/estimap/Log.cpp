#include "estimap/Log.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <streambuf>
#include <system_error>
#include <utility>

namespace estimap {

namespace {

std::atomic<int> g_logLevel{static_cast<int>(LogLevel::Info)};

std::filesystem::path BackupPath(const std::filesystem::path& base, int n)
{
  if (n <= 0) return base;
  std::filesystem::path p = base;
  p += "." + std::to_string(n);
  return p;
}

std::string UtcStamp()
{
  using namespace std::chrono;
  const auto now = system_clock::now().time_since_epoch();
  const auto secs = duration_cast<seconds>(now);
  const auto ms = duration_cast<milliseconds>(now - secs);

  const std::time_t tt = static_cast<std::time_t>(secs.count());
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif

  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900, tm.tm_mon + 1,
                tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms.count()));
  return buf;
}

// Forwards to the console buffer unchanged and to the shared log file with
// optional line tags. Both streams share one mutex and one line-start flag.
class SplitBuf final : public std::streambuf {
public:
  SplitBuf(std::streambuf* console, std::streambuf* file, std::mutex& mutex, bool& atLineStart, const char* tag,
           bool tagLines)
      : m_console(console), m_file(file), m_mutex(mutex), m_atLineStart(atLineStart), m_tag(tag),
        m_tagLines(tagLines)
  {
  }

protected:
  int overflow(int ch) override
  {
    if (ch == traits_type::eof()) return traits_type::not_eof(ch);
    const char c = static_cast<char>(ch);
    return xsputn(&c, 1) == 1 ? ch : traits_type::eof();
  }

  std::streamsize xsputn(const char* s, std::streamsize n) override
  {
    if (n <= 0) return 0;
    std::lock_guard<std::mutex> lock(m_mutex);
    const std::streamsize shown = m_console->sputn(s, n);
    const std::streamsize logged = m_tagLines ? writeTagged(s, n) : m_file->sputn(s, n);
    return shown < logged ? shown : logged;
  }

  int sync() override
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    const int a = m_console->pubsync();
    const int b = m_file->pubsync();
    return (a == 0 && b == 0) ? 0 : -1;
  }

private:
  std::streamsize writeTagged(const char* s, std::streamsize n)
  {
    std::streamsize done = 0;
    while (done < n) {
      if (m_atLineStart) {
        const std::string prefix = UtcStamp() + " [" + m_tag + "] ";
        const auto len = static_cast<std::streamsize>(prefix.size());
        if (m_file->sputn(prefix.data(), len) != len) return done;
        m_atLineStart = false;
      }

      const char* p = s + done;
      const void* nl = std::memchr(p, '\n', static_cast<std::size_t>(n - done));
      const std::streamsize chunk = nl ? (static_cast<const char*>(nl) - p) + 1 : n - done;
      const std::streamsize wr = m_file->sputn(p, chunk);
      done += wr;
      if (wr != chunk) return done;

      if (nl) {
        m_atLineStart = true;
        m_file->pubsync();
      }
    }
    return done;
  }

  std::streambuf* m_console;
  std::streambuf* m_file;
  std::mutex& m_mutex;
  bool& m_atLineStart;
  std::string m_tag;
  bool m_tagLines;
};

} // namespace

const char* LogLevelName(LogLevel l)
{
  switch (l) {
  case LogLevel::Debug: return "debug";
  case LogLevel::Info: return "info";
  case LogLevel::Warn: return "warn";
  case LogLevel::Error: return "error";
  case LogLevel::None: return "none";
  }
  return "info";
}

bool ParseLogLevel(const std::string& s, LogLevel* out)
{
  if (!out) return false;
  if (s == "debug") *out = LogLevel::Debug;
  else if (s == "info") *out = LogLevel::Info;
  else if (s == "warn" || s == "warning") *out = LogLevel::Warn;
  else if (s == "error") *out = LogLevel::Error;
  else if (s == "none" || s == "off") *out = LogLevel::None;
  else return false;
  return true;
}

void SetLogLevel(LogLevel l)
{
  g_logLevel.store(static_cast<int>(l));
}

LogLevel GetLogLevel()
{
  return static_cast<LogLevel>(g_logLevel.load());
}

void Log(LogLevel level, const std::string& message)
{
  if (level == LogLevel::None) return;
  if (static_cast<int>(level) < static_cast<int>(GetLogLevel())) return;
  std::cerr << "[" << LogLevelName(level) << "] " << message << "\n";
}

struct RunLog::State {
  std::ofstream file;
  std::filesystem::path path;
  std::mutex mutex;
  bool atLineStart = true;

  std::streambuf* prevOut = nullptr;
  std::streambuf* prevErr = nullptr;
  std::unique_ptr<SplitBuf> outBuf;
  std::unique_ptr<SplitBuf> errBuf;
};

RunLog::RunLog() = default;

RunLog::~RunLog()
{
  close();
}

const std::filesystem::path& RunLog::path() const
{
  static const std::filesystem::path kNone;
  return m_state ? m_state->path : kNone;
}

bool RunLog::Rotate(const std::filesystem::path& base, int keepFiles, Error& outError)
{
  for (int i = keepFiles; i >= 1; --i) {
    const std::filesystem::path from = BackupPath(base, i - 1);
    const std::filesystem::path to = BackupPath(base, i);

    std::error_code ec;
    if (!std::filesystem::exists(from, ec)) continue;
    std::filesystem::remove(to, ec);
    std::filesystem::rename(from, to, ec);
    if (ec) {
      return Fail(outError, ErrorCode::Io,
                  "cannot rotate log '" + from.string() + "' to '" + to.string() + "': " + ec.message());
    }
  }
  return true;
}

bool RunLog::open(const RunLogOptions& opt, Error& outError)
{
  close();

  if (opt.path.empty()) {
    return Fail(outError, ErrorCode::Io, "log path is empty");
  }

  const std::filesystem::path dir = opt.path.parent_path();
  if (!dir.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
      return Fail(outError, ErrorCode::Io, "cannot create log directory '" + dir.string() + "': " + ec.message());
    }
  }

  if (!Rotate(opt.path, opt.keepFiles, outError)) return false;

  auto state = std::make_unique<State>();
  state->path = opt.path;
  state->file.open(opt.path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!state->file) {
    return Fail(outError, ErrorCode::Io, "cannot open log file '" + opt.path.string() + "'");
  }

  std::streambuf* fileBuf = state->file.rdbuf();
  state->prevOut = std::cout.rdbuf();
  state->prevErr = std::cerr.rdbuf();
  state->outBuf = std::make_unique<SplitBuf>(state->prevOut, fileBuf, state->mutex, state->atLineStart, "OUT",
                                             opt.tagLines);
  state->errBuf = std::make_unique<SplitBuf>(state->prevErr, fileBuf, state->mutex, state->atLineStart, "ERR",
                                             opt.tagLines);
  std::cout.rdbuf(state->outBuf.get());
  std::cerr.rdbuf(state->errBuf.get());

  m_state = std::move(state);
  return true;
}

void RunLog::close()
{
  if (!m_state) return;

  std::cout.flush();
  std::cerr.flush();
  if (std::cout.rdbuf() == m_state->outBuf.get()) std::cout.rdbuf(m_state->prevOut);
  if (std::cerr.rdbuf() == m_state->errBuf.get()) std::cerr.rdbuf(m_state->prevErr);
  m_state->file.flush();

  m_state.reset();
}

} // namespace estimap
