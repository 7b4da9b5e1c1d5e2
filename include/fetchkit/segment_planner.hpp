#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace fetchkit {

struct Segment {
    std::uint64_t start{0};
    std::uint64_t end{0}; // inclusive
    std::uint64_t downloaded{0};
    bool completed{false};

    [[nodiscard]] std::uint64_t length() const noexcept { return end - start + 1; }
};

constexpr std::uint64_t kMiB = 1024ull * 1024ull;
constexpr std::size_t kMaxSegmentWorkers = 8;

[[nodiscard]] std::size_t planSegmentCount(std::uint64_t total_size) noexcept;

// Splits [0, total_size) into planSegmentCount(total_size) contiguous ranges,
// the last one taking the remainder. An empty file has no segments.
[[nodiscard]] std::vector<Segment> planSegments(std::uint64_t total_size);

[[nodiscard]] bool isValidPartition(const std::vector<Segment>& segments,
                                    std::uint64_t total_size) noexcept;

} // namespace fetchkit
