///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "worker_pool.hpp"
#include <algorithm>
#include <exception>
#include <future>
#include <thread>
#include <vector>


///////////////////////////
///     WORKER POOL     ///
///////////////////////////
void parallelFor(int count, int numThreads, const std::function<void(int)>& body) {
    if (count <= 0) return;
    if (numThreads <= 1 || count == 1) {
        for (int i = 0; i < count; ++i) body(i);
        return;
    }

    int tasks = std::min(numThreads, count);
    int chunk = (count + tasks - 1) / tasks;
    std::vector<std::future<void>> futures;

    // Distribute contiguous blocks to tasks.
    for (int t = 0; t < tasks; ++t) {
        int begin = t * chunk;
        int end = std::min(begin + chunk, count);
        if (begin >= end) break;
        futures.push_back(std::async(std::launch::async, [&body, begin, end]() {
            for (int i = begin; i < end; ++i) body(i);
        }));
    }

    // Join everything before reporting a failure.
    std::exception_ptr firstError;
    for (auto& f : futures) {
        try {
            f.get();
        } catch (...) {
            if (!firstError) firstError = std::current_exception();
        }
    }
    if (firstError) std::rethrow_exception(firstError);
}

int resolveThreadCount(int requested) {
    if (requested > 0) return requested;
    unsigned hw = std::thread::hardware_concurrency();
    return hw == 0 ? 4 : (int)hw;
}
