#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace outlier_detect::core {

// Worker count capped by configured workers, CPU cores and task count.
inline int compute_worker_count(int configured, size_t task_count) {
    int workers = std::max(1, configured);
    const int cpu_cores = static_cast<int>(std::thread::hardware_concurrency());
    if (cpu_cores > 0) {
        workers = std::min(workers, cpu_cores);
    }
    if (task_count > 0) {
        workers = std::min(workers, static_cast<int>(task_count));
    }
    return std::max(1, workers);
}

// Runs fn(i) for i in [0, count) on up to `workers` threads pulling indices
// from a shared counter. The first exception thrown by a task stops further
// scheduling and is rethrown after all threads joined.
template <typename Fn>
void parallel_for(size_t count, int workers, Fn&& fn) {
    if (count == 0) return;
    workers = compute_worker_count(workers, count);

    std::atomic<size_t> next{0};
    std::atomic<bool> failed{false};
    std::exception_ptr first_error;
    std::mutex error_mutex;

    auto worker = [&]() {
        while (!failed.load(std::memory_order_relaxed)) {
            const size_t i = next.fetch_add(1, std::memory_order_relaxed);
            if (i >= count) break;
            try {
                fn(i);
            } catch (...) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) first_error = std::current_exception();
                failed.store(true, std::memory_order_relaxed);
            }
        }
    };

    if (workers > 1) {
        std::vector<std::thread> threads;
        threads.reserve(static_cast<size_t>(workers));
        for (int w = 0; w < workers; ++w) {
            threads.emplace_back(worker);
        }
        for (auto& t : threads) {
            if (t.joinable()) t.join();
        }
    } else {
        worker();
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

} // namespace outlier_detect::core
