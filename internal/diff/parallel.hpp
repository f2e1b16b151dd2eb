#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace assetdiff::diff {

/*
  Runs fn(i) for i in [0, count) on at most `workers` threads.

  Tasks write to their own index, so results keep input order regardless of
  completion order. The first exception escaping a task is rethrown once all
  threads have joined; remaining indexes are still processed.
*/
template <typename Fn>
void ParallelFor(std::size_t count, std::size_t workers, Fn&& fn) {
  if (count == 0) return;

  workers = std::clamp<std::size_t>(workers, 1, count);
  if (workers == 1) {
    for (std::size_t i = 0; i < count; ++i) fn(i);
    return;
  }

  std::atomic<std::size_t> next{0};
  std::mutex               error_mutex;
  std::exception_ptr       error;

  auto worker = [&]() {
    for (;;) {
      const std::size_t i = next.fetch_add(1);
      if (i >= count) break;
      try {
        fn(i);
      } catch (...) {
        std::lock_guard lock(error_mutex);
        if (!error) error = std::current_exception();
      }
    }
  };

  std::vector<std::thread> pool;
  pool.reserve(workers);
  for (std::size_t t = 0; t < workers; ++t) {
    pool.emplace_back(worker);
  }
  for (auto& th : pool) {
    if (th.joinable()) th.join();
  }

  if (error) std::rethrow_exception(error);
}

} // namespace assetdiff::diff
