/*
Streamweave — Overlap Tests
Role: Verify the overlap-percentage metric the matcher thresholds on
Testing Strategy: Hand-computed ranges; symmetry and boundary checks
Coverage: Containment, partial overlap, disjoint/touching, zero-length ranges, symmetry
*/
#include <gtest/gtest.h>
#include "matcher/Overlap.hpp"
#include "fixtures/test_clock.hpp"

using fixtures::at;

namespace {
DateRange range(const char* start, const char* end) { return DateRange{at(start), at(end)}; }
}

TEST(Overlap, ContainedRangeScoresOne) {
    const auto obs = range("2025-03-01T14:00:00Z", "2025-03-01T16:00:00Z");
    const auto twitch = range("2025-03-01T14:06:00Z", "2025-03-01T15:54:00Z");
    EXPECT_NEAR(calculateOverlapPercent(obs, twitch), 1.0, 1e-9);
}

TEST(Overlap, PartialOverlapUsesShorterDuration) {
    const auto a = range("2025-03-01T14:00:00Z", "2025-03-01T16:00:00Z");
    const auto b = range("2025-03-01T15:30:00Z", "2025-03-01T18:00:00Z");
    EXPECT_NEAR(calculateOverlapPercent(a, b), 0.25, 1e-9);
}

TEST(Overlap, IsSymmetric) {
    const auto a = range("2025-03-01T14:00:00Z", "2025-03-01T16:00:00Z");
    const auto b = range("2025-03-01T14:30:00Z", "2025-03-01T17:00:00Z");
    EXPECT_DOUBLE_EQ(calculateOverlapPercent(a, b), calculateOverlapPercent(b, a));
}

TEST(Overlap, DisjointAndTouchingScoreZero) {
    const auto a = range("2025-03-01T14:00:00Z", "2025-03-01T15:00:00Z");
    EXPECT_EQ(calculateOverlapPercent(a, range("2025-03-01T16:00:00Z", "2025-03-01T17:00:00Z")), 0.0);
    EXPECT_EQ(calculateOverlapPercent(a, range("2025-03-01T15:00:00Z", "2025-03-01T17:00:00Z")), 0.0);
}

TEST(Overlap, ZeroLengthScoresZero) {
    const auto a = range("2025-03-01T14:00:00Z", "2025-03-01T15:00:00Z");
    const auto point = range("2025-03-01T14:30:00Z", "2025-03-01T14:30:00Z");
    EXPECT_EQ(calculateOverlapPercent(a, point), 0.0);
    EXPECT_EQ(calculateOverlapPercent(point, point), 0.0);
}

TEST(Overlap, StaysWithinUnitInterval) {
    const auto a = range("2025-03-01T14:00:00Z", "2025-03-01T16:00:00Z");
    for (int offset = -180; offset <= 180; offset += 15) {
        const auto start = at("2025-03-01T14:00:00Z") + std::chrono::minutes(offset);
        const double pct = calculateOverlapPercent(a, DateRange{start, start + std::chrono::minutes(90)});
        EXPECT_GE(pct, 0.0);
        EXPECT_LE(pct, 1.0);
    }
}
