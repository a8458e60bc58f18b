#pragma once

#include "estimap/Status.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace estimap {

// Extent and resolution of a raster.
//
// Row 0 is the northern-most row; (west, south) is the lower-left corner of
// the extent in map units. Cells are square.
struct GridGeometry {
  int cols = 0;
  int rows = 0;
  double west = 0.0;
  double south = 0.0;
  double cellSize = 1.0;

  std::size_t cellCount() const
  {
    if (cols <= 0 || rows <= 0) return 0;
    return static_cast<std::size_t>(cols) * static_cast<std::size_t>(rows);
  }
};

// True when both geometries describe the same extent and resolution.
bool SameGeometry(const GridGeometry& a, const GridGeometry& b);

// "COLSxROWS @ (west,south) cell=SIZE", used in alignment diagnostics.
std::string DescribeGeometry(const GridGeometry& g);

// A 2D array of doubles over a fixed geometry.
//
// No-data is a quiet NaN. Grids are plain values: stages take const
// references and return new grids.
class Grid {
public:
  Grid() = default;
  explicit Grid(const GridGeometry& geom, double fill = NoData());

  static double NoData();
  static bool IsNoData(double v);

  const GridGeometry& geometry() const { return m_geom; }
  int cols() const { return m_geom.cols; }
  int rows() const { return m_geom.rows; }
  std::size_t size() const { return m_values.size(); }
  bool empty() const { return m_values.empty(); }

  std::size_t index(int x, int y) const
  {
    return static_cast<std::size_t>(y) * static_cast<std::size_t>(m_geom.cols) + static_cast<std::size_t>(x);
  }

  double at(int x, int y) const { return m_values[index(x, y)]; }
  double& at(int x, int y) { return m_values[index(x, y)]; }

  double operator[](std::size_t i) const { return m_values[i]; }
  double& operator[](std::size_t i) { return m_values[i]; }

  const std::vector<double>& values() const { return m_values; }
  std::vector<double>& values() { return m_values; }

  bool isValid(std::size_t i) const { return !IsNoData(m_values[i]); }

  // Number of cells that are not no-data.
  std::size_t validCount() const;

private:
  GridGeometry m_geom{};
  std::vector<double> m_values;
};

// Build a grid from row-major values. values.size() must equal cols*rows.
Grid MakeGrid(const GridGeometry& geom, std::vector<double> values);

// AlignmentError naming `role` when g does not match `expected`.
bool CheckAligned(const Grid& g, const GridGeometry& expected, const std::string& role, Error& outError);

} // namespace estimap
