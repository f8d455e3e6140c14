#pragma once

#include <cstddef>
#include <functional>

namespace platform {

// Worker count for parallel_for. 0 means hardware concurrency.
void set_worker_threads(int count);
unsigned worker_threads();

// Run fn(i) for every i in [0, n) across the worker threads.
// Each worker pulls the next index from a shared counter, so uneven work
// (a huge source tree next to a tiny one) balances out.
// The first exception thrown by fn is rethrown once all workers have joined.
void parallel_for(size_t n, const std::function<void(size_t)>& fn);

} // namespace platform
