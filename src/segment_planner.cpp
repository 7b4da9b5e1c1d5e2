#include "fetchkit/segment_planner.hpp"

namespace fetchkit {

std::size_t planSegmentCount(std::uint64_t total_size) noexcept {
    if (total_size < 20 * kMiB) {
        return 1;
    }
    if (total_size < 100 * kMiB) {
        return 4;
    }
    return 8;
}

std::vector<Segment> planSegments(std::uint64_t total_size) {
    std::vector<Segment> segments;
    if (total_size == 0) {
        return segments;
    }

    const std::size_t count = planSegmentCount(total_size);
    const std::uint64_t segment_size = total_size / count;
    segments.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        Segment segment;
        segment.start = static_cast<std::uint64_t>(i) * segment_size;
        segment.end = (i + 1 == count) ? total_size - 1
                                       : static_cast<std::uint64_t>(i + 1) * segment_size - 1;
        segments.push_back(segment);
    }
    return segments;
}

bool isValidPartition(const std::vector<Segment>& segments, std::uint64_t total_size) noexcept {
    if (segments.empty()) {
        return total_size == 0;
    }

    std::uint64_t expected_start = 0;
    for (const auto& segment : segments) {
        if (segment.start != expected_start || segment.end < segment.start) {
            return false;
        }
        if (segment.downloaded > segment.length()) {
            return false;
        }
        expected_start = segment.end + 1;
    }
    return expected_start == total_size;
}

} // namespace fetchkit
