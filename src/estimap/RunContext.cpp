#include "estimap/RunContext.hpp"

#include "estimap/Parallel.hpp"

#include <utility>

namespace estimap {

RunContext::RunContext(const GridGeometry& geom, int threads)
    : m_geom(geom)
    , m_threads(ResolveThreadCount(threads))
{
}

bool RunContext::Create(const GridGeometry& geom, const Grid* mask, int threads, RunContext& out, Error& outError)
{
  if (geom.cols <= 0 || geom.rows <= 0) {
    return Fail(outError, ErrorCode::Config, "computational region is empty: " + DescribeGeometry(geom));
  }
  if (!(geom.cellSize > 0.0)) {
    return Fail(outError, ErrorCode::Config, "cell size must be positive: " + DescribeGeometry(geom));
  }

  RunContext ctx(geom, threads);
  if (mask) {
    if (!CheckAligned(*mask, geom, "mask", outError)) return false;
    ctx.m_mask = std::make_shared<const Grid>(*mask);
  }
  out = std::move(ctx);
  return true;
}

bool RunContext::excluded(std::size_t i) const
{
  if (!m_mask) return false;
  const double v = (*m_mask)[i];
  return Grid::IsNoData(v) || v == 0.0;
}

void RunContext::applyMask(Grid& g) const
{
  if (!m_mask || g.size() != m_mask->size()) return;
  for (std::size_t i = 0; i < g.size(); ++i) {
    if (excluded(i)) g[i] = Grid::NoData();
  }
}

bool RunContext::checkAligned(const Grid& g, const std::string& role, Error& outError) const
{
  return CheckAligned(g, m_geom, role, outError);
}

} // namespace estimap
