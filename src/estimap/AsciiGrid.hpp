#pragma once

#include "estimap/Grid.hpp"
#include "estimap/RasterStore.hpp"
#include "estimap/Status.hpp"

#include <filesystem>
#include <string>

namespace estimap {

// ESRI ASCII grid (".asc") reader/writer.
//
// Header keys (case-insensitive): ncols, nrows, xllcorner|xllcenter,
// yllcorner|yllcenter, cellsize, NODATA_value (optional). Values follow in
// row-major order, north row first.

bool ParseAsciiGrid(const std::string& text, Grid& out, Error& outError);
bool ReadAsciiGrid(const std::filesystem::path& path, Grid& out, Error& outError);

// Write with NODATA_value -9999 and 17 significant digits.
std::string AsciiGridToString(const Grid& g);
bool WriteAsciiGrid(const std::filesystem::path& path, const Grid& g, Error& outError);

// Directory-backed store: "<inputDir>/<name>.asc" for reading,
// "<outputDir>/<name>.asc" and "<outputDir>/<name>.csv" for writing.
class AsciiGridStore final : public IRasterStore {
public:
  AsciiGridStore(std::filesystem::path inputDir, std::filesystem::path outputDir);

  bool hasGrid(const std::string& name) const override;
  bool readGrid(const std::string& name, Grid& out, Error& outError) override;

  bool writeGrid(const std::string& name, const Grid& grid, Error& outError) override;
  bool writeTable(const std::string& name, const std::vector<SummaryRow>& rows, Error& outError) override;
  bool writeCrossTable(const std::string& name, const std::vector<CrossTabRow>& rows, Error& outError) override;

  std::filesystem::path inputPath(const std::string& name) const;
  std::filesystem::path outputPath(const std::string& name, const char* ext) const;

private:
  bool ensureOutputDir(Error& outError) const;

  std::filesystem::path m_inputDir;
  std::filesystem::path m_outputDir;
};

} // namespace estimap
