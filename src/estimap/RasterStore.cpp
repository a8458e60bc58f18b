#include "estimap/RasterStore.hpp"

#include <utility>

namespace estimap {

void MemoryRasterStore::putGrid(const std::string& name, Grid grid)
{
  m_grids[name] = std::move(grid);
}

bool MemoryRasterStore::hasGrid(const std::string& name) const
{
  return m_grids.find(name) != m_grids.end();
}

bool MemoryRasterStore::readGrid(const std::string& name, Grid& out, Error& outError)
{
  const auto it = m_grids.find(name);
  if (it == m_grids.end()) {
    return Fail(outError, ErrorCode::Io, "no grid named '" + name + "'");
  }
  out = it->second;
  ++m_reads;
  return true;
}

bool MemoryRasterStore::writeGrid(const std::string& name, const Grid& grid, Error& outError)
{
  (void)outError;
  m_grids[name] = grid;
  return true;
}

bool MemoryRasterStore::writeTable(const std::string& name, const std::vector<SummaryRow>& rows, Error& outError)
{
  (void)outError;
  m_tables[name] = rows;
  return true;
}

bool MemoryRasterStore::writeCrossTable(const std::string& name, const std::vector<CrossTabRow>& rows,
                                        Error& outError)
{
  (void)outError;
  m_crossTables[name] = rows;
  return true;
}

const Grid* MemoryRasterStore::grid(const std::string& name) const
{
  const auto it = m_grids.find(name);
  return (it == m_grids.end()) ? nullptr : &it->second;
}

const std::vector<SummaryRow>* MemoryRasterStore::table(const std::string& name) const
{
  const auto it = m_tables.find(name);
  return (it == m_tables.end()) ? nullptr : &it->second;
}

const std::vector<CrossTabRow>* MemoryRasterStore::crossTable(const std::string& name) const
{
  const auto it = m_crossTables.find(name);
  return (it == m_crossTables.end()) ? nullptr : &it->second;
}

} // namespace estimap
