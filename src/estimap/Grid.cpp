#include "estimap/Grid.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <utility>

namespace estimap {

namespace {

inline bool NearlyEqual(double a, double b)
{
  const double scale = std::max({1.0, std::fabs(a), std::fabs(b)});
  return std::fabs(a - b) <= 1e-9 * scale;
}

} // namespace

bool SameGeometry(const GridGeometry& a, const GridGeometry& b)
{
  return a.cols == b.cols && a.rows == b.rows && NearlyEqual(a.west, b.west) && NearlyEqual(a.south, b.south) &&
         NearlyEqual(a.cellSize, b.cellSize);
}

std::string DescribeGeometry(const GridGeometry& g)
{
  std::ostringstream oss;
  oss.precision(12);
  oss << g.cols << "x" << g.rows << " @ (" << g.west << "," << g.south << ") cell=" << g.cellSize;
  return oss.str();
}

Grid::Grid(const GridGeometry& geom, double fill)
    : m_geom(geom)
    , m_values(geom.cellCount(), fill)
{
}

double Grid::NoData()
{
  return std::numeric_limits<double>::quiet_NaN();
}

bool Grid::IsNoData(double v)
{
  return std::isnan(v);
}

std::size_t Grid::validCount() const
{
  std::size_t n = 0;
  for (double v : m_values) {
    if (!IsNoData(v)) ++n;
  }
  return n;
}

Grid MakeGrid(const GridGeometry& geom, std::vector<double> values)
{
  Grid g(geom);
  if (values.size() == g.size()) g.values() = std::move(values);
  return g;
}

bool CheckAligned(const Grid& g, const GridGeometry& expected, const std::string& role, Error& outError)
{
  if (g.size() == expected.cellCount() && SameGeometry(g.geometry(), expected)) return true;
  return Fail(outError, ErrorCode::Alignment,
              "grid '" + role + "' is " + DescribeGeometry(g.geometry()) + ", expected " +
                  DescribeGeometry(expected));
}

} // namespace estimap
