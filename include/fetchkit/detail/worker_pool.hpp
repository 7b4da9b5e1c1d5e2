#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <vector>

namespace fetchkit::detail {

// Runs job(0) .. job(count - 1) on at most `limit` threads and joins them.
// The returned vector holds, per job, the exception it threw or null.
std::vector<std::exception_ptr> runBounded(std::size_t count,
                                           std::size_t limit,
                                           const std::function<void(std::size_t)>& job);

} // namespace fetchkit::detail
