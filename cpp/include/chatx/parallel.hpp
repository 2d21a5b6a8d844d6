// ==============================================================================
// chatx/parallel.hpp - Ограниченный параллелизм по независимым элементам
// ==============================================================================
//
// parallel_for(count, workers, fn): fn(i) для i в [0, count) на не более
// чем workers потоках. Элементы раздаются через атомарный счётчик.
// Первое исключение из fn пробрасывается после join всех потоков.
//
// ==============================================================================

#ifndef CHATX_PARALLEL_HPP
#define CHATX_PARALLEL_HPP

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace chatx {

template <typename Fn>
void parallel_for(std::size_t count, int workers, Fn fn,
                  const std::atomic<bool>* cancel = nullptr) {
    std::size_t threads = static_cast<std::size_t>(std::max(workers, 1));
    threads = std::min(threads, count);

    auto cancelled = [cancel]() { return cancel != nullptr && cancel->load(); };

    if (threads <= 1) {
        for (std::size_t i = 0; i < count && !cancelled(); ++i) {
            fn(i);
        }
        return;
    }

    std::atomic<std::size_t> next{0};
    std::atomic<bool> failed{false};
    std::exception_ptr first_error;
    std::mutex error_mutex;

    std::vector<std::thread> pool;
    pool.reserve(threads);
    for (std::size_t t = 0; t < threads; ++t) {
        pool.emplace_back([&]() {
            while (!failed.load() && !cancelled()) {
                std::size_t i = next.fetch_add(1);
                if (i >= count) {
                    return;
                }
                try {
                    fn(i);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(error_mutex);
                    if (!first_error) {
                        first_error = std::current_exception();
                    }
                    failed.store(true);
                }
            }
        });
    }
    for (auto& th : pool) {
        th.join();
    }
    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

}  // namespace chatx

#endif  // CHATX_PARALLEL_HPP
