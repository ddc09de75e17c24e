#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <thread>
#include <vector>

namespace gt {

// Worker count for `items` independent jobs: `requested` when positive,
// otherwise min(hardware_concurrency, items, cap). Never less than 1.
inline size_t boundedWorkerCount(size_t items, int requested, size_t cap = 8)
{
    if (items == 0) {
        return 1;
    }
    if (requested > 0) {
        return std::min(items, static_cast<size_t>(requested));
    }
    const unsigned hw = std::thread::hardware_concurrency();
    const size_t hwCount = hw == 0 ? 2 : static_cast<size_t>(hw);
    return std::max<size_t>(1, std::min({hwCount, items, cap}));
}

// Runs job(i) for every i in [0, count) on `workers` threads. Each index is
// claimed exactly once; job must only touch state owned by its index.
template <typename Job>
void runParallel(size_t count, size_t workers, const Job& job)
{
    if (count == 0) {
        return;
    }
    workers = std::max<size_t>(1, std::min(workers, count));
    if (workers == 1) {
        for (size_t i = 0; i < count; ++i) {
            job(i);
        }
        return;
    }

    std::atomic<size_t> next{0};
    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (size_t w = 0; w < workers; ++w) {
        threads.emplace_back([&next, count, &job] {
            for (size_t i = next.fetch_add(1); i < count; i = next.fetch_add(1)) {
                job(i);
            }
        });
    }
    for (std::thread& thread : threads) {
        thread.join();
    }
}

} // namespace gt
