/**
 * @file parallel.h
 * @brief Bounded fan-out / fan-in helper for batch operations
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <future>
#include <vector>

namespace flashare::transfer {

/**
 * @brief Run fn(i) for every i in [0, count) on up to maxWorkers threads
 *
 * Workers pull indexes from a shared atomic counter. Returns only after every
 * index has been processed. fn must not throw; per-item failures belong in
 * the item's own result slot.
 *
 * @param count Number of items
 * @param maxWorkers Upper bound on concurrently running workers (>= 1)
 * @param fn Callable taking the item index
 */
template <typename Fn>
void parallelFor(std::size_t count, int maxWorkers, Fn&& fn) {
    if (count == 0) return;

    std::size_t workers = std::min<std::size_t>(count, static_cast<std::size_t>(std::max(1, maxWorkers)));
    if (workers == 1) {
        for (std::size_t i = 0; i < count; ++i) fn(i);
        return;
    }

    std::atomic<std::size_t> nextIndex{0};
    auto worker = [&]() {
        for (std::size_t i = nextIndex.fetch_add(1); i < count; i = nextIndex.fetch_add(1)) {
            fn(i);
        }
    };

    std::vector<std::future<void>> futures;
    futures.reserve(workers - 1);
    for (std::size_t w = 1; w < workers; ++w) {
        futures.push_back(std::async(std::launch::async, worker));
    }
    worker();  // calling thread takes part

    for (auto& f : futures) {
        f.get();
    }
}

} // namespace flashare::transfer
