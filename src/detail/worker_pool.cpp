#include "fetchkit/detail/worker_pool.hpp"

#include <algorithm>
#include <atomic>
#include <system_error>
#include <thread>

#include <spdlog/spdlog.h>

namespace fetchkit::detail {

std::vector<std::exception_ptr> runBounded(std::size_t count,
                                           std::size_t limit,
                                           const std::function<void(std::size_t)>& job) {
    std::vector<std::exception_ptr> errors(count);
    if (count == 0) {
        return errors;
    }

    std::atomic<std::size_t> cursor{0};
    auto worker = [&]() {
        for (std::size_t index = cursor.fetch_add(1); index < count; index = cursor.fetch_add(1)) {
            try {
                job(index);
            } catch (...) {
                errors[index] = std::current_exception();
            }
        }
    };

    const std::size_t thread_count = std::min(count, std::max<std::size_t>(1, limit));
    std::vector<std::thread> threads;
    threads.reserve(thread_count);
    for (std::size_t i = 0; i < thread_count; ++i) {
        try {
            threads.emplace_back(worker);
        } catch (const std::system_error& ex) {
            // The threads already running drain the remaining jobs.
            if (threads.empty()) {
                throw;
            }
            spdlog::warn("Started {} of {} workers: {}", threads.size(), thread_count, ex.what());
            break;
        }
    }
    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    return errors;
}

} // namespace fetchkit::detail
