#include "parallel.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace platform {

static std::atomic<int> g_worker_threads{0};

void set_worker_threads(int count) {
    g_worker_threads = count < 0 ? 0 : count;
}

unsigned worker_threads() {
    int configured = g_worker_threads;
    if (configured > 0) return static_cast<unsigned>(configured);
    unsigned hw = std::thread::hardware_concurrency();
    return hw == 0 ? 1 : hw;
}

void parallel_for(size_t n, const std::function<void(size_t)>& fn) {
    if (n == 0) return;

    unsigned count = static_cast<unsigned>(std::min<size_t>(worker_threads(), n));
    if (count <= 1) {
        for (size_t i = 0; i < n; i++) fn(i);
        return;
    }

    std::atomic<size_t> next{0};
    std::exception_ptr first_error;
    std::mutex error_mutex;

    auto worker = [&]() {
        while (true) {
            size_t i = next.fetch_add(1);
            if (i >= n) return;
            try {
                fn(i);
            } catch (...) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) first_error = std::current_exception();
            }
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(count);
    for (unsigned t = 0; t < count; t++) {
        threads.emplace_back(worker);
    }
    for (auto& t : threads) t.join();

    if (first_error) std::rethrow_exception(first_error);
}

} // namespace platform
