#pragma once

#include "estimap/Grid.hpp"
#include "estimap/Status.hpp"
#include "estimap/ZonalStats.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace estimap {

// Boundary between the engine and wherever rasters live.
//
// Grids are addressed by role name ("land", "water_1", "population", ...).
// The store is only touched before and after the computation.
class IRasterStore {
public:
  virtual ~IRasterStore() = default;

  virtual bool hasGrid(const std::string& name) const = 0;
  virtual bool readGrid(const std::string& name, Grid& out, Error& outError) = 0;

  virtual bool writeGrid(const std::string& name, const Grid& grid, Error& outError) = 0;
  virtual bool writeTable(const std::string& name, const std::vector<SummaryRow>& rows, Error& outError) = 0;
  virtual bool writeCrossTable(const std::string& name, const std::vector<CrossTabRow>& rows, Error& outError) = 0;
};

// In-memory store, used by tests and when embedding the engine.
class MemoryRasterStore final : public IRasterStore {
public:
  void putGrid(const std::string& name, Grid grid);

  bool hasGrid(const std::string& name) const override;
  bool readGrid(const std::string& name, Grid& out, Error& outError) override;

  bool writeGrid(const std::string& name, const Grid& grid, Error& outError) override;
  bool writeTable(const std::string& name, const std::vector<SummaryRow>& rows, Error& outError) override;
  bool writeCrossTable(const std::string& name, const std::vector<CrossTabRow>& rows, Error& outError) override;

  // Number of successful readGrid() calls.
  std::size_t readCount() const { return m_reads; }

  const Grid* grid(const std::string& name) const;
  const std::vector<SummaryRow>* table(const std::string& name) const;
  const std::vector<CrossTabRow>* crossTable(const std::string& name) const;

  const std::map<std::string, Grid>& grids() const { return m_grids; }

private:
  std::map<std::string, Grid> m_grids;
  std::map<std::string, std::vector<SummaryRow>> m_tables;
  std::map<std::string, std::vector<CrossTabRow>> m_crossTables;
  std::size_t m_reads = 0;
};

} // namespace estimap
