#pragma once

#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

namespace estimap {

// Resolve a configured worker count: <=0 means "all hardware threads".
inline int ResolveThreadCount(int threads)
{
  if (threads <= 0) threads = static_cast<int>(std::thread::hardware_concurrency());
  if (threads <= 0) threads = 1;
  return threads;
}

// Run fn(y) for every row in [0, rows).
//
// Rows are handed out through a shared counter, so fn must only write to
// cells of row y. Results are identical for any thread count.
template <typename Fn>
void ForEachRow(int rows, int threads, Fn&& fn)
{
  if (rows <= 0) return;
  threads = std::min(ResolveThreadCount(threads), rows);

  if (threads <= 1) {
    for (int y = 0; y < rows; ++y) fn(y);
    return;
  }

  std::atomic<int> nextRow{0};
  auto worker = [&]() {
    for (;;) {
      const int y = nextRow.fetch_add(1);
      if (y >= rows) break;
      fn(y);
    }
  };

  std::vector<std::thread> pool;
  pool.reserve(static_cast<std::size_t>(threads));
  for (int t = 0; t < threads; ++t) {
    pool.emplace_back(worker);
  }
  for (std::thread& th : pool) {
    if (th.joinable()) th.join();
  }
}

} // namespace estimap
