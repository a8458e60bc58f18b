#pragma once

#include "estimap/Grid.hpp"
#include "estimap/Status.hpp"

#include <memory>
#include <string>

namespace estimap {

// Per-run immutable state handed to every stage: the computational region,
// the optional validity mask and the worker count.
//
// A RunContext is built once through Create() and never changes afterwards.
// Copies share the mask.
class RunContext {
public:
  RunContext() = default;

  // Unmasked context.
  explicit RunContext(const GridGeometry& geom, int threads = 1);

  // Validates the mask against geom (AlignmentError on mismatch).
  static bool Create(const GridGeometry& geom, const Grid* mask, int threads, RunContext& out, Error& outError);

  const GridGeometry& geometry() const { return m_geom; }
  int threads() const { return m_threads; }

  bool hasMask() const { return m_mask != nullptr; }
  const Grid* mask() const { return m_mask.get(); }

  // True when the mask excludes cell i (mask no-data or zero).
  bool excluded(std::size_t i) const;

  // Set every excluded cell of g to no-data.
  void applyMask(Grid& g) const;

  // AlignmentError naming `role` when g does not match the run geometry.
  bool checkAligned(const Grid& g, const std::string& role, Error& outError) const;

private:
  GridGeometry m_geom{};
  std::shared_ptr<const Grid> m_mask;
  int m_threads = 1;
};

} // namespace estimap
