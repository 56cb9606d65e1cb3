#ifndef ATOMVEC_UTIL_PARALLEL_H
#define ATOMVEC_UTIL_PARALLEL_H

#include <atomvec/util/options.h>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace atomvec {

    /**
     * for_each - Invoke func(i) for every i in [0, n).
     *
     * With ExecPolicy::threads the range is split into contiguous chunks, one per
     * worker. func must only touch state owned by index i (the elementwise kernels
     * write disjoint slots of a pre-sized result). The first exception thrown by a
     * worker is rethrown on the calling thread once every worker has joined.
     */
    template<typename F>
    void for_each(size_t n, F&& func, ExecPolicy policy, size_t workers) {
        switch (policy) {
            case ExecPolicy::serial: {
                for (size_t i = 0; i < n; ++i) {
                    func(i);
                }
                break;
            }
            case ExecPolicy::threads: {
                workers = std::max<size_t>(1, std::min(workers, n));
                if (workers == 1) {
                    for (size_t i = 0; i < n; ++i) {
                        func(i);
                    }
                    break;
                }

                std::exception_ptr failure;
                std::mutex failure_mutex;
                size_t chunk = (n + workers - 1) / workers;

                std::vector<std::thread> threads;
                threads.reserve(workers);
                for (size_t w = 0; w < workers; ++w) {
                    size_t begin = w * chunk;
                    size_t end = std::min(n, begin + chunk);
                    if (begin >= end) break;
                    threads.emplace_back([&func, &failure, &failure_mutex, begin, end] {
                        try {
                            for (size_t i = begin; i < end; ++i) {
                                func(i);
                            }
                        } catch (...) {
                            std::lock_guard lock(failure_mutex);
                            if (!failure) failure = std::current_exception();
                        }
                    });
                }
                for (auto& t : threads) {
                    t.join();
                }
                if (failure) std::rethrow_exception(failure);
                break;
            }
        }
    }

    // Uses the configured policy, falling back to serial below options().parallel_threshold
    template<typename F>
    void for_each(size_t n, F&& func) {
        const auto& opts = options();
        if (opts.exec_policy == ExecPolicy::threads && n >= opts.parallel_threshold) {
            for_each(n, std::forward<F>(func), ExecPolicy::threads, opts.worker_count());
        } else {
            for_each(n, std::forward<F>(func), ExecPolicy::serial, 1);
        }
    }

} // namespace atomvec

#endif // ATOMVEC_UTIL_PARALLEL_H
