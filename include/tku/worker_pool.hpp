#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace tku {

// Fixed-size fan-out over an index range. Each call spawns at most
// `workers` threads that claim indices from a shared counter and joins them
// before returning, so no thread outlives the call.
class WorkerPool {
public:
    explicit WorkerPool(unsigned workers) : workers_(workers == 0 ? 1 : workers) {}

    unsigned size() const { return workers_; }

    // results[i] = fn(i) for i in [0, count). Output order always matches
    // input order regardless of scheduling. Runs with fewer threads when
    // the system refuses to create more. If any fn throws, the first
    // exception is rethrown after every worker has stopped.
    template<typename T, typename Fn>
    std::vector<T> parallel_map(size_t count, Fn&& fn) const {
        std::vector<T> results(count);
        if (count == 0) return results;

        size_t n = std::min<size_t>(workers_, count);
        if (n == 1) {
            for (size_t i = 0; i < count; ++i) results[i] = fn(i);
            return results;
        }

        std::atomic<size_t> next{0};
        std::exception_ptr failure;
        std::mutex failure_mutex;

        auto run = [&]() {
            for (;;) {
                size_t i = next.fetch_add(1);
                if (i >= count) return;
                try {
                    results[i] = fn(i);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(failure_mutex);
                    if (!failure) failure = std::current_exception();
                    next.store(count);
                    return;
                }
            }
        };

        // Thread creation can fail under resource limits. Keep the threads
        // that did start; the calling thread always takes part.
        std::vector<std::thread> threads;
        threads.reserve(n - 1);
        for (size_t t = 1; t < n; ++t) {
            try {
                threads.emplace_back(run);
            } catch (const std::exception&) {
                break;
            }
        }
        run();
        for (auto& t : threads) t.join();

        if (failure) std::rethrow_exception(failure);
        return results;
    }

private:
    unsigned workers_;
};

} // namespace tku
