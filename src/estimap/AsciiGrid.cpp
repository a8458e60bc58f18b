#include "estimap/AsciiGrid.hpp"

#include "estimap/ZonalStats.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>
#include <utility>

namespace estimap {

namespace {

constexpr double kAsciiNoData = -9999.0;

std::string Lower(std::string s)
{
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool ParseDoubleToken(const std::string& tok, double* out)
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

// Whole number in [1, INT_MAX].
bool ToDimension(double v, int* out)
{
  if (v < 1.0 || v > static_cast<double>(std::numeric_limits<int>::max())) return false;
  if (std::floor(v) != v) return false;
  *out = static_cast<int>(v);
  return true;
}

bool IsHeaderKey(const std::string& tok)
{
  return !tok.empty() && std::isalpha(static_cast<unsigned char>(tok[0])) != 0 && Lower(tok) != "nan";
}

} // namespace

bool ParseAsciiGrid(const std::string& text, Grid& out, Error& outError)
{
  std::istringstream iss(text);

  GridGeometry geom;
  bool haveCols = false;
  bool haveRows = false;
  bool haveX = false;
  bool haveY = false;
  bool haveCell = false;
  bool xCenter = false;
  bool yCenter = false;
  bool haveNoData = false;
  double noData = kAsciiNoData;

  std::string tok;
  std::string pending;
  while (iss >> tok) {
    if (!IsHeaderKey(tok)) {
      pending = tok;
      break;
    }
    std::string valueTok;
    if (!(iss >> valueTok)) {
      return Fail(outError, ErrorCode::Io, "missing value for header key '" + tok + "'");
    }
    double v = 0.0;
    if (!ParseDoubleToken(valueTok, &v)) {
      return Fail(outError, ErrorCode::Io, "invalid value '" + valueTok + "' for header key '" + tok + "'");
    }

    const std::string key = Lower(tok);
    if (key == "ncols" || key == "nrows") {
      int dim = 0;
      if (!ToDimension(v, &dim)) {
        return Fail(outError, ErrorCode::Io, "'" + tok + "' must be a positive integer, got '" + valueTok + "'");
      }
      if (key == "ncols") {
        geom.cols = dim;
        haveCols = true;
      } else {
        geom.rows = dim;
        haveRows = true;
      }
    } else if (key == "xllcorner" || key == "xllcenter") {
      geom.west = v;
      xCenter = (key == "xllcenter");
      haveX = true;
    } else if (key == "yllcorner" || key == "yllcenter") {
      geom.south = v;
      yCenter = (key == "yllcenter");
      haveY = true;
    } else if (key == "cellsize") {
      geom.cellSize = v;
      haveCell = true;
    } else if (key == "nodata_value") {
      noData = v;
      haveNoData = true;
    } else {
      return Fail(outError, ErrorCode::Io, "unknown header key '" + tok + "'");
    }
  }

  if (!haveCols || !haveRows || !haveX || !haveY || !haveCell) {
    return Fail(outError, ErrorCode::Io, "incomplete ASCII grid header");
  }
  if (geom.cols <= 0 || geom.rows <= 0 || !(geom.cellSize > 0.0)) {
    return Fail(outError, ErrorCode::Io, "invalid ASCII grid dimensions: " + DescribeGeometry(geom));
  }
  if (xCenter) geom.west -= 0.5 * geom.cellSize;
  if (yCenter) geom.south -= 0.5 * geom.cellSize;

  Grid g(geom);
  const std::size_t n = g.size();
  std::size_t i = 0;
  auto take = [&](const std::string& t) -> bool {
    double v = 0.0;
    if (Lower(t) == "nan") {
      v = Grid::NoData();
    } else if (!ParseDoubleToken(t, &v)) {
      return Fail(outError, ErrorCode::Io, "invalid cell value '" + t + "' at cell " + std::to_string(i));
    } else if (haveNoData && v == noData) {
      v = Grid::NoData();
    }
    if (i >= n) return Fail(outError, ErrorCode::Io, "too many cell values (expected " + std::to_string(n) + ")");
    g[i++] = v;
    return true;
  };

  if (!pending.empty() && !take(pending)) return false;
  while (iss >> tok) {
    if (!take(tok)) return false;
  }
  if (i != n) {
    return Fail(outError, ErrorCode::Io,
                "expected " + std::to_string(n) + " cell values, found " + std::to_string(i));
  }

  out = std::move(g);
  return true;
}

bool ReadAsciiGrid(const std::filesystem::path& path, Grid& out, Error& outError)
{
  std::ifstream f(path, std::ios::binary);
  if (!f) return Fail(outError, ErrorCode::Io, "unable to open grid: " + path.string());
  std::ostringstream oss;
  oss << f.rdbuf();
  if (!ParseAsciiGrid(oss.str(), out, outError)) {
    outError.message = path.string() + ": " + outError.message;
    return false;
  }
  return true;
}

std::string AsciiGridToString(const Grid& g)
{
  const GridGeometry& geom = g.geometry();
  std::ostringstream oss;
  oss << "ncols " << geom.cols << "\n";
  oss << "nrows " << geom.rows << "\n";
  oss << "xllcorner " << FormatStatNumber(geom.west) << "\n";
  oss << "yllcorner " << FormatStatNumber(geom.south) << "\n";
  oss << "cellsize " << FormatStatNumber(geom.cellSize) << "\n";
  oss << "NODATA_value " << kAsciiNoData << "\n";
  for (int y = 0; y < geom.rows; ++y) {
    for (int x = 0; x < geom.cols; ++x) {
      if (x > 0) oss << ' ';
      const double v = g.at(x, y);
      if (Grid::IsNoData(v)) {
        oss << kAsciiNoData;
      } else {
        oss << FormatStatNumber(v);
      }
    }
    oss << "\n";
  }
  return oss.str();
}

bool WriteAsciiGrid(const std::filesystem::path& path, const Grid& g, Error& outError)
{
  std::ofstream f(path, std::ios::binary);
  if (!f) return Fail(outError, ErrorCode::Io, "unable to open for writing: " + path.string());
  f << AsciiGridToString(g);
  if (!f) return Fail(outError, ErrorCode::Io, "write failed: " + path.string());
  return true;
}

AsciiGridStore::AsciiGridStore(std::filesystem::path inputDir, std::filesystem::path outputDir)
    : m_inputDir(std::move(inputDir))
    , m_outputDir(std::move(outputDir))
{
}

std::filesystem::path AsciiGridStore::inputPath(const std::string& name) const
{
  return m_inputDir / (name + ".asc");
}

std::filesystem::path AsciiGridStore::outputPath(const std::string& name, const char* ext) const
{
  return m_outputDir / (name + ext);
}

bool AsciiGridStore::hasGrid(const std::string& name) const
{
  std::error_code ec;
  return std::filesystem::is_regular_file(inputPath(name), ec);
}

bool AsciiGridStore::readGrid(const std::string& name, Grid& out, Error& outError)
{
  return ReadAsciiGrid(inputPath(name), out, outError);
}

bool AsciiGridStore::ensureOutputDir(Error& outError) const
{
  if (m_outputDir.empty()) return true;
  std::error_code ec;
  std::filesystem::create_directories(m_outputDir, ec);
  if (ec) {
    return Fail(outError, ErrorCode::Io,
                "failed to create output directory '" + m_outputDir.string() + "': " + ec.message());
  }
  return true;
}

bool AsciiGridStore::writeGrid(const std::string& name, const Grid& grid, Error& outError)
{
  if (!ensureOutputDir(outError)) return false;
  return WriteAsciiGrid(outputPath(name, ".asc"), grid, outError);
}

bool AsciiGridStore::writeTable(const std::string& name, const std::vector<SummaryRow>& rows, Error& outError)
{
  if (!ensureOutputDir(outError)) return false;
  const std::filesystem::path p = outputPath(name, ".csv");
  std::ofstream f(p, std::ios::binary);
  if (!f || !WriteSummaryCsv(f, rows)) {
    return Fail(outError, ErrorCode::Io, "failed to write table: " + p.string());
  }
  return true;
}

bool AsciiGridStore::writeCrossTable(const std::string& name, const std::vector<CrossTabRow>& rows, Error& outError)
{
  if (!ensureOutputDir(outError)) return false;
  const std::filesystem::path p = outputPath(name, ".csv");
  std::ofstream f(p, std::ios::binary);
  if (!f || !WriteCrossTabCsv(f, rows)) {
    return Fail(outError, ErrorCode::Io, "failed to write table: " + p.string());
  }
  return true;
}

} // namespace estimap
