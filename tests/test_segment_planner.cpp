#include "fetchkit/segment_planner.hpp"

#include <cstdint>
#include <vector>

#include <gtest/gtest.h>

namespace fetchkit::test {

TEST(SegmentPlannerTest, CountFollowsSizeThresholds) {
    EXPECT_EQ(planSegmentCount(0), 1u);
    EXPECT_EQ(planSegmentCount(1), 1u);
    EXPECT_EQ(planSegmentCount(20 * kMiB - 1), 1u);
    EXPECT_EQ(planSegmentCount(20 * kMiB), 4u);
    EXPECT_EQ(planSegmentCount(100 * kMiB - 1), 4u);
    EXPECT_EQ(planSegmentCount(100 * kMiB), 8u);
    EXPECT_EQ(planSegmentCount(150 * kMiB), 8u);
    EXPECT_EQ(planSegmentCount(10ull * 1024 * kMiB), 8u);
}

TEST(SegmentPlannerTest, SegmentsPartitionTheFile) {
    const std::vector<std::uint64_t> sizes{1, 7, 20 * kMiB, 20 * kMiB + 3, 100 * kMiB + 7,
                                           150 * kMiB};
    for (const auto size : sizes) {
        SCOPED_TRACE(size);
        const auto segments = planSegments(size);
        ASSERT_EQ(segments.size(), planSegmentCount(size));

        std::uint64_t expected_start = 0;
        for (const auto& segment : segments) {
            EXPECT_EQ(segment.start, expected_start);
            EXPECT_GE(segment.end, segment.start);
            EXPECT_EQ(segment.downloaded, 0u);
            EXPECT_FALSE(segment.completed);
            expected_start = segment.end + 1;
        }
        EXPECT_EQ(segments.back().end, size - 1);
        EXPECT_TRUE(isValidPartition(segments, size));
    }
}

TEST(SegmentPlannerTest, LastSegmentAbsorbsRemainder) {
    const auto segments = planSegments(20 * kMiB + 3);
    ASSERT_EQ(segments.size(), 4u);
    EXPECT_EQ(segments[0].length(), 5 * kMiB);
    EXPECT_EQ(segments[3].length(), 5 * kMiB + 3);
}

TEST(SegmentPlannerTest, EmptyFileHasNoSegments) {
    EXPECT_TRUE(planSegments(0).empty());
    EXPECT_TRUE(isValidPartition({}, 0));
    EXPECT_FALSE(isValidPartition({}, 10));
}

TEST(SegmentPlannerTest, RejectsBrokenPartitions) {
    const std::vector<Segment> gap{{0, 9, 0, false}, {11, 19, 0, false}};
    const std::vector<Segment> overlap{{0, 10, 0, false}, {10, 19, 0, false}};
    const std::vector<Segment> short_plan{{0, 9, 0, false}, {10, 18, 0, false}};
    const std::vector<Segment> overfull{{0, 9, 11, false}, {10, 19, 0, false}};

    EXPECT_FALSE(isValidPartition(gap, 20));
    EXPECT_FALSE(isValidPartition(overlap, 20));
    EXPECT_FALSE(isValidPartition(short_plan, 20));
    EXPECT_FALSE(isValidPartition(overfull, 20));
    EXPECT_TRUE(isValidPartition({{0, 9, 10, true}, {10, 19, 3, false}}, 20));
}

} // namespace fetchkit::test
